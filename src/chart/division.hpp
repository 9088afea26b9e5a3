#pragma once

/// @file division.hpp
/// @brief Divisional charts (vargas): pure longitude -> sign remappings.

#include "core/types.hpp"
#include "zodiac/identifiers.hpp"

#include <array>
#include <string_view>
#include <utility>

namespace jyotish::chart
{
    enum class Division : u8
    {
        D1,   ///< Rasi
        D2,   ///< Hora
        D3,   ///< Drekkana
        D9,   ///< Navamsa
        D10,  ///< Dasamsa
        D12,  ///< Dwadasamsa
    };

    inline constexpr std::array<Division, 6> kAllDivisions{
        Division::D1, Division::D2, Division::D3, Division::D9, Division::D10, Division::D12,
    };

    /// @brief Static utility class computing divisional signs.
    class Divisions
    {
    public:
        Divisions() = delete;

        /// @brief Sign occupied in the given division by a sidereal longitude.
        [[nodiscard]] static zodiac::Sign sign(f64 longitude, Division division);

        /// @brief Every supported division for one longitude, in kAllDivisions order.
        [[nodiscard]] static std::array<std::pair<Division, zodiac::Sign>, kAllDivisions.size()>
            all(f64 longitude);

        /// @brief Parse "D9", "d10", ...
        /// @throws std::invalid_argument for unsupported names.
        [[nodiscard]] static Division from_name(std::string_view name);

        [[nodiscard]] static std::string_view name(Division division);

        /// @brief Number of parts each sign is cut into (D9 -> 9).
        [[nodiscard]] static i32 parts(Division division);
    };

} // namespace jyotish::chart
