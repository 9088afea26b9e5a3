/// @file position.cpp
/// @brief Implementation of the position deriver.

#include "chart/position.hpp"

#include "astro/angles.hpp"
#include "zodiac/nakshatra.hpp"
#include "zodiac/sign.hpp"

#include <cmath>

namespace jyotish::chart
{

BodyPosition PositionDeriver::derive(Body body, f64 sidereal_longitude, f64 latitude, f64 speed,
                                     std::optional<f64> tropical_longitude)
{
    const f64 lon = astro::Angles::normalize_degrees(sidereal_longitude);
    const i32 nakshatra = zodiac::nakshatra_index(lon);
    const f64 in_nakshatra = zodiac::degrees_in_nakshatra(lon);

    return BodyPosition{
        .body                 = body,
        .longitude            = lon,
        .latitude             = latitude,
        .speed                = speed,
        .tropical_longitude   = tropical_longitude,
        .sign                 = zodiac::sign_of(lon),
        .degrees_in_sign      = astro::Angles::degrees_in_sign(lon),
        .nakshatra            = nakshatra,
        .pada                 = zodiac::pada_of(lon),
        .degrees_in_nakshatra = in_nakshatra,
        .degrees_in_pada      = std::fmod(in_nakshatra, zodiac_constants::kPadaSpan),
        .nakshatra_lord       = zodiac::nakshatra_info(nakshatra).lord,
    };
}

} // namespace jyotish::chart
