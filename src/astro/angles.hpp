#pragma once

/// @file angles.hpp
/// @brief Degree arithmetic on the ecliptic circle: normalization, separation, DMS.

#include "core/types.hpp"

#include <string>

namespace jyotish::astro
{
    /// @brief An angle split into degrees, arc-minutes and arc-seconds.
    struct Dms
    {
        i32  degrees;
        i32  minutes;
        f64  seconds;
        bool negative;
    };

    /// @brief Static utility class for angles expressed in degrees.
    ///
    /// Numeric input is never rejected: every result is brought back onto
    /// the circle with modulo arithmetic.
    class Angles
    {
    public:
        Angles() = delete;

        /// @brief Normalize an angle to [0, 360).
        [[nodiscard]] static f64 normalize_degrees(f64 degrees);

        /// @brief Separation between two longitudes.
        /// @param a Source longitude (degrees).
        /// @param b Target longitude (degrees).
        /// @param forward_only If true, the arc measured forward from a to b, in [0, 360).
        /// @return Shortest arc in [0, 180] or the forward arc.
        [[nodiscard]] static f64 angular_distance(f64 a, f64 b, bool forward_only = false);

        /// @brief Shorthand for angular_distance(a, b, true).
        [[nodiscard]] static f64 forward_distance(f64 a, f64 b);

        /// @brief Zero-based sign index (Aries = 0) of a longitude.
        [[nodiscard]] static i32 sign_index(f64 longitude);

        /// @brief Degrees elapsed inside the sign, in [0, 30).
        [[nodiscard]] static f64 degrees_in_sign(f64 longitude);

        /// @brief Split a signed angle into degrees, minutes and seconds.
        [[nodiscard]] static Dms to_dms(f64 degrees);

        /// @brief Join a DMS triple back into decimal degrees.
        [[nodiscard]] static f64 from_dms(i32 degrees, i32 minutes, f64 seconds, bool negative = false);

        /// @brief Format as 12°34'56" (seconds rounded to whole units).
        [[nodiscard]] static std::string format_dms(f64 degrees);
    };

} // namespace jyotish::astro
