#pragma once

/// @file ayanamsa.hpp
/// @brief Precession offset between the tropical and sidereal zodiacs.

#include "core/types.hpp"

#include <array>
#include <optional>
#include <string_view>

namespace jyotish::astro
{
    /// @brief Supported ayanamsa conventions.
    enum class AyanamsaSystem : u8
    {
        Lahiri,
        Raman,
        Krishnamurti,
        FaganBradley,
    };

    inline constexpr std::size_t kAyanamsaSystemCount = 4;

    /// @brief Linear ayanamsa model: base value at J2000 plus uniform precession.
    ///
    /// The defaults are the built-in table; a ChartConfig may override
    /// individual base values.
    struct AyanamsaModel
    {
        std::array<f64, kAyanamsaSystemCount> base_at_j2000{23.85, 22.50, 23.77, 24.04};
        f64 precession_arcsec_per_year{50.29};

        /// @brief Base value for a system, in degrees.
        [[nodiscard]] f64 base(AyanamsaSystem system) const
        {
            return base_at_j2000[static_cast<std::size_t>(system)];
        }
    };

    /// @brief Static utility class for ayanamsa lookup and zodiac conversion.
    class Ayanamsa
    {
    public:
        Ayanamsa() = delete;

        /// @brief Ayanamsa in degrees at a given instant.
        ///
        /// value = base + precession × years since J2000. No periodic terms.
        ///
        /// @param jd Julian Day (UTC).
        /// @param system Ayanamsa convention.
        /// @param model Base table and precession rate.
        [[nodiscard]] static f64 value(f64 jd, AyanamsaSystem system, const AyanamsaModel& model = {});

        /// @brief Tropical longitude -> sidereal longitude, normalized to [0, 360).
        [[nodiscard]] static f64 tropical_to_sidereal(f64 tropical_lon, f64 jd, AyanamsaSystem system,
                                                      const AyanamsaModel& model = {});

        /// @brief Sidereal longitude -> tropical longitude, normalized to [0, 360).
        [[nodiscard]] static f64 sidereal_to_tropical(f64 sidereal_lon, f64 jd, AyanamsaSystem system,
                                                      const AyanamsaModel& model = {});

        /// @brief Strict name lookup ("Lahiri", "fagan_bradley", "Fagan-Bradley", ...).
        /// @return The system, or std::nullopt if the name is not recognized.
        [[nodiscard]] static std::optional<AyanamsaSystem> from_name(std::string_view name);

        /// @brief Lenient name lookup: unknown names fall back to Lahiri with a warning.
        [[nodiscard]] static AyanamsaSystem parse(std::string_view name);

        /// @brief Display name of a system.
        [[nodiscard]] static std::string_view name(AyanamsaSystem system);
    };

} // namespace jyotish::astro
