#pragma once

#include <glm/glm.hpp>
#include <glm/gtc/constants.hpp>

#include <cstdint>

namespace jyotish
{
    // Precision aliases
    using f32 = float;
    using f64 = double;
    using u8  = uint8_t;
    using u16 = uint16_t;
    using u32 = uint32_t;
    using u64 = uint64_t;
    using i32 = int32_t;
    using i64 = int64_t;

    // Astronomical constants
    namespace astro_constants
    {
        constexpr f64 kPi          = glm::pi<f64>();
        constexpr f64 kDegToRad    = kPi / 180.0;
        constexpr f64 kRadToDeg    = 180.0 / kPi;
        constexpr f64 kJ2000       = 2451545.0;  // Julian Date of J2000.0 epoch
        constexpr f64 kDaysPerYear = 365.25;     // Julian year
        constexpr f64 kDaysPerCentury = 36525.0;
    }

    // Zodiac geometry
    namespace zodiac_constants
    {
        constexpr f64 kFullCircle     = 360.0;
        constexpr f64 kSignSpan       = 30.0;
        constexpr i32 kSignCount      = 12;
        constexpr i32 kHouseCount     = 12;
        constexpr i32 kBodyCount      = 9;
        constexpr i32 kNakshatraCount = 27;
        constexpr f64 kNakshatraSpan  = kFullCircle / static_cast<f64>(kNakshatraCount);  // 13°20'
        constexpr f64 kPadaSpan       = kNakshatraSpan / 4.0;                             // 3°20'
    }
}
