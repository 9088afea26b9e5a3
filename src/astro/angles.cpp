/// @file angles.cpp
/// @brief Implementation of degree arithmetic.

#include "astro/angles.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>

namespace jyotish::astro
{

using zodiac_constants::kFullCircle;
using zodiac_constants::kSignSpan;

// -----------------------------------------------------------------
// Normalize to [0, 360)
//
// fmod keeps the sign of the dividend, so negative input needs one
// extra turn. A value that rounds up to exactly 360 after the
// correction is folded back to 0.
// -----------------------------------------------------------------

f64 Angles::normalize_degrees(f64 degrees)
{
    f64 result = std::fmod(degrees, kFullCircle);
    if (result < 0.0)
    {
        result += kFullCircle;
    }
    if (result >= kFullCircle)
    {
        result = 0.0;
    }
    return result;
}

// -----------------------------------------------------------------
// Angular distance
//
//   forward:  (b - a) mod 360
//   shortest: min(|b - a|, 360 - |b - a|), always in [0, 180]
// -----------------------------------------------------------------

f64 Angles::angular_distance(f64 a, f64 b, bool forward_only)
{
    if (forward_only)
    {
        return normalize_degrees(b - a);
    }

    const f64 diff = std::abs(normalize_degrees(a) - normalize_degrees(b));
    return std::min(diff, kFullCircle - diff);
}

f64 Angles::forward_distance(f64 a, f64 b)
{
    return angular_distance(a, b, true);
}

i32 Angles::sign_index(f64 longitude)
{
    const i32 index = static_cast<i32>(std::floor(normalize_degrees(longitude) / kSignSpan));
    return std::clamp(index, 0, zodiac_constants::kSignCount - 1);
}

f64 Angles::degrees_in_sign(f64 longitude)
{
    return std::fmod(normalize_degrees(longitude), kSignSpan);
}

// -----------------------------------------------------------------
// Degrees / minutes / seconds
// -----------------------------------------------------------------

Dms Angles::to_dms(f64 degrees)
{
    const bool negative = degrees < 0.0;
    const f64 abs_deg = std::abs(degrees);

    const i32 whole = static_cast<i32>(std::floor(abs_deg));
    const f64 minutes_total = (abs_deg - static_cast<f64>(whole)) * 60.0;
    const i32 minutes = static_cast<i32>(std::floor(minutes_total));
    const f64 seconds = (minutes_total - static_cast<f64>(minutes)) * 60.0;

    return Dms{
        .degrees  = whole,
        .minutes  = minutes,
        .seconds  = seconds,
        .negative = negative,
    };
}

f64 Angles::from_dms(i32 degrees, i32 minutes, f64 seconds, bool negative)
{
    const f64 value = std::abs(static_cast<f64>(degrees))
                    + std::abs(static_cast<f64>(minutes)) / 60.0
                    + std::abs(seconds) / 3600.0;
    return negative ? -value : value;
}

std::string Angles::format_dms(f64 degrees)
{
    // Round to whole seconds first so 59.9996" carries into the minutes.
    const f64 total_seconds = std::round(std::abs(degrees) * 3600.0);
    const i64 secs = static_cast<i64>(total_seconds);

    const i64 d = secs / 3600;
    const i64 m = (secs % 3600) / 60;
    const i64 s = secs % 60;

    return fmt::format("{}{}°{:02}'{:02}\"", degrees < 0.0 ? "-" : "", d, m, s);
}

} // namespace jyotish::astro
