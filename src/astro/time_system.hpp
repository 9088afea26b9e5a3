#pragma once

/// @file time_system.hpp
/// @brief Julian Day conversion and sidereal time for chart instants.

#include "core/types.hpp"

namespace jyotish::astro
{
    /// @brief Civil date/time representation. Always UTC; timezone
    /// resolution happens before a DateTime reaches the pipeline.
    struct DateTime
    {
        i32 year;
        i32 month;
        i32 day;
        i32 hour;
        i32 minute;
        f64 second;
    };

    /// @brief Static utility class for astronomical time computations.
    ///
    /// Provides Julian Day conversion (Meeus, Astronomical Algorithms Ch. 7)
    /// and Greenwich/Local Mean Sidereal Time (IAU 1982).
    /// Sidereal times are returned in degrees, ready for ecliptic arithmetic.
    class TimeSystem
    {
    public:
        TimeSystem() = delete;

        /// @brief Convert civil date/time (UTC) to Julian Day.
        /// @param dt Civil date/time on the Gregorian calendar.
        /// @return Julian Day as a double-precision floating-point number.
        [[nodiscard]] static f64 to_julian_date(const DateTime& dt);

        /// @brief Convert Julian Day back to civil date/time (UTC).
        /// @param jd Julian Day (must be positive).
        /// @return Corresponding civil date/time.
        [[nodiscard]] static DateTime from_julian_date(f64 jd);

        /// @brief Julian centuries elapsed since J2000.0.
        /// @return T = (JD - 2451545.0) / 36525.0
        [[nodiscard]] static f64 julian_centuries(f64 jd);

        /// @brief Julian years elapsed since J2000.0 (365.25-day years).
        [[nodiscard]] static f64 julian_years_since_j2000(f64 jd);

        /// @brief Greenwich Mean Sidereal Time.
        /// @param jd Julian Day (UTC).
        /// @return GMST in degrees, normalized to [0, 360).
        [[nodiscard]] static f64 gmst_degrees(f64 jd);

        /// @brief Local Mean Sidereal Time.
        /// @param jd Julian Day (UTC).
        /// @param east_longitude_deg Observer longitude in degrees (east positive).
        /// @return LMST in degrees, normalized to [0, 360).
        [[nodiscard]] static f64 lmst_degrees(f64 jd, f64 east_longitude_deg);
    };

} // namespace jyotish::astro
