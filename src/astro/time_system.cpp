/// @file time_system.cpp
/// @brief Implementation of Julian Day and sidereal time utilities.

#include "astro/time_system.hpp"

#include "astro/angles.hpp"

#include <algorithm>
#include <cmath>

namespace jyotish::astro
{

// -----------------------------------------------------------------
// Julian Day (Meeus, Astronomical Algorithms, Ch. 7)
//
//   Jan/Feb count as months 13/14 of the previous year
//   A  = floor(Y / 100)
//   B  = 2 - A + floor(A / 4)            Gregorian correction
//   JD = floor(365.25 (Y + 4716)) + floor(30.6001 (M + 1))
//      + D + B - 1524.5
// -----------------------------------------------------------------

f64 TimeSystem::to_julian_date(const DateTime& dt)
{
    i32 year = dt.year;
    i32 month = dt.month;

    if (month <= 2)
    {
        year -= 1;
        month += 12;
    }

    const i32 century = year / 100;
    const i32 gregorian = 2 - century + (century / 4);

    const f64 day_fraction = (static_cast<f64>(dt.hour)
                            + static_cast<f64>(dt.minute) / 60.0
                            + dt.second / 3600.0) / 24.0;

    return std::floor(astro_constants::kDaysPerYear * static_cast<f64>(year + 4716))
         + std::floor(30.6001 * static_cast<f64>(month + 1))
         + static_cast<f64>(dt.day)
         + day_fraction
         + static_cast<f64>(gregorian)
         - 1524.5;
}

// -----------------------------------------------------------------
// Julian Day -> civil date/time (Meeus, Ch. 7)
// -----------------------------------------------------------------

DateTime TimeSystem::from_julian_date(f64 jd)
{
    // Shift from the noon-based day to a midnight-based one
    const f64 shifted = jd + 0.5;
    const i32 z = static_cast<i32>(std::floor(shifted));
    const f64 fraction = shifted - static_cast<f64>(z);

    i32 a = z;
    if (z >= 2299161)
    {
        const i32 alpha = static_cast<i32>(std::floor((static_cast<f64>(z) - 1867216.25) / 36524.25));
        a = z + 1 + alpha - (alpha / 4);
    }

    const i32 b = a + 1524;
    const i32 c = static_cast<i32>(std::floor((static_cast<f64>(b) - 122.1) / astro_constants::kDaysPerYear));
    const i32 d = static_cast<i32>(std::floor(astro_constants::kDaysPerYear * static_cast<f64>(c)));
    const i32 e = static_cast<i32>(std::floor(static_cast<f64>(b - d) / 30.6001));

    const f64 day_with_fraction = static_cast<f64>(b - d)
                                - std::floor(30.6001 * static_cast<f64>(e))
                                + fraction;

    const i32 day = static_cast<i32>(std::floor(day_with_fraction));
    const i32 month = (e < 14) ? (e - 1) : (e - 13);
    const i32 year = (month > 2) ? (c - 4716) : (c - 4715);

    // Work in whole milliseconds so 23:59:59.9999 does not surface as second 60
    const i64 millis = std::llround((day_with_fraction - static_cast<f64>(day)) * 86400000.0);
    const i64 clamped = std::min<i64>(millis, 86399999);

    return DateTime{
        .year   = year,
        .month  = month,
        .day    = day,
        .hour   = static_cast<i32>(clamped / 3600000),
        .minute = static_cast<i32>((clamped / 60000) % 60),
        .second = static_cast<f64>(clamped % 60000) / 1000.0,
    };
}

f64 TimeSystem::julian_centuries(f64 jd)
{
    return (jd - astro_constants::kJ2000) / astro_constants::kDaysPerCentury;
}

f64 TimeSystem::julian_years_since_j2000(f64 jd)
{
    return (jd - astro_constants::kJ2000) / astro_constants::kDaysPerYear;
}

// -----------------------------------------------------------------
// GMST (IAU 1982)
//
// GMST = 280.46061837
//      + 360.98564736629 × (JD − 2451545.0)
//      + 0.000387933 × T²
//      − T³ / 38710000
// -----------------------------------------------------------------

f64 TimeSystem::gmst_degrees(f64 jd)
{
    const f64 t = julian_centuries(jd);
    const f64 d = jd - astro_constants::kJ2000;

    const f64 gmst = 280.46061837
                   + 360.98564736629 * d
                   + 0.000387933 * t * t
                   - (t * t * t) / 38710000.0;

    return Angles::normalize_degrees(gmst);
}

f64 TimeSystem::lmst_degrees(f64 jd, f64 east_longitude_deg)
{
    return Angles::normalize_degrees(gmst_degrees(jd) + east_longitude_deg);
}

} // namespace jyotish::astro
