#pragma once

/// @file position.hpp
/// @brief Per-body derived state: sign, degrees-in-sign, nakshatra, pada.

#include "core/types.hpp"
#include "zodiac/identifiers.hpp"

#include <optional>

namespace jyotish::chart
{
    using zodiac::Body;
    using zodiac::Sign;

    /// @brief Raw ephemeris state for one body, as handed over by the provider.
    struct RawPosition
    {
        f64 longitude{0.0};  ///< Ecliptic longitude (degrees)
        f64 latitude{0.0};   ///< Ecliptic latitude (degrees)
        f64 speed{0.0};      ///< Daily motion in longitude (degrees/day, negative = retrograde)
    };

    /// @brief A body's immutable state at the chart instant.
    ///
    /// Invariants: sign == floor(longitude / 30), degrees_in_sign == longitude mod 30,
    /// is_retrograde() <=> speed < 0.
    struct BodyPosition
    {
        Body               body;
        f64                longitude;           ///< Sidereal, [0, 360)
        f64                latitude;
        f64                speed;
        std::optional<f64> tropical_longitude;  ///< Set when derived from tropical input
        Sign               sign;
        f64                degrees_in_sign;     ///< [0, 30)
        i32                nakshatra;           ///< 0..26
        i32                pada;                ///< 1..4
        f64                degrees_in_nakshatra;
        f64                degrees_in_pada;     ///< [0, 3°20')
        Body               nakshatra_lord;

        [[nodiscard]] bool is_retrograde() const { return speed < 0.0; }
    };

    /// @brief Static utility class turning a sidereal longitude into a BodyPosition.
    class PositionDeriver
    {
    public:
        PositionDeriver() = delete;

        /// @brief Derive the full position record.
        /// @param body Body identifier.
        /// @param sidereal_longitude Any finite value; normalized to [0, 360).
        /// @param latitude Ecliptic latitude, stored as given.
        /// @param speed Daily motion; its sign decides retrograde status.
        /// @param tropical_longitude Optional tropical source longitude, kept for reference.
        [[nodiscard]] static BodyPosition derive(Body body, f64 sidereal_longitude, f64 latitude, f64 speed,
                                                 std::optional<f64> tropical_longitude = std::nullopt);
    };

} // namespace jyotish::chart
