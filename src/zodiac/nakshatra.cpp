/// @file nakshatra.cpp
/// @brief Nakshatra catalog and longitude lookups.

#include "zodiac/nakshatra.hpp"

#include "astro/angles.hpp"
#include "core/text.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace jyotish::zodiac
{

using zodiac_constants::kNakshatraCount;
using zodiac_constants::kNakshatraSpan;
using zodiac_constants::kPadaSpan;

namespace
{
    using enum Body;

    // Vimshottari lords repeat every nine mansions starting from Ashwini
    const std::array<NakshatraInfo, kNakshatraCount> kNakshatras{{
        { 0, "Ashwini",           Ketu},
        { 1, "Bharani",           Venus},
        { 2, "Krittika",          Sun},
        { 3, "Rohini",            Moon},
        { 4, "Mrigashira",        Mars},
        { 5, "Ardra",             Rahu},
        { 6, "Punarvasu",         Jupiter},
        { 7, "Pushya",            Saturn},
        { 8, "Ashlesha",          Mercury},
        { 9, "Magha",             Ketu},
        {10, "Purva Phalguni",    Venus},
        {11, "Uttara Phalguni",   Sun},
        {12, "Hasta",             Moon},
        {13, "Chitra",            Mars},
        {14, "Swati",             Rahu},
        {15, "Vishakha",          Jupiter},
        {16, "Anuradha",          Saturn},
        {17, "Jyeshtha",          Mercury},
        {18, "Mula",              Ketu},
        {19, "Purva Ashadha",     Venus},
        {20, "Uttara Ashadha",    Sun},
        {21, "Shravana",          Moon},
        {22, "Dhanishta",         Mars},
        {23, "Shatabhisha",       Rahu},
        {24, "Purva Bhadrapada",  Jupiter},
        {25, "Uttara Bhadrapada", Saturn},
        {26, "Revati",            Mercury},
    }};
}

const NakshatraInfo& nakshatra_info(i32 index)
{
    if (index < 0 || index >= kNakshatraCount)
    {
        throw std::out_of_range(fmt::format("nakshatra index {} outside 0..26", index));
    }
    return kNakshatras[static_cast<std::size_t>(index)];
}

const NakshatraInfo& nakshatra_from_name(std::string_view name)
{
    for (const auto& info : kNakshatras)
    {
        if (core::iequals(core::trim(name), info.name))
        {
            return info;
        }
    }
    throw std::invalid_argument(fmt::format("unknown nakshatra name: '{}'", name));
}

i32 nakshatra_index(f64 longitude)
{
    const f64 lon = astro::Angles::normalize_degrees(longitude);
    const i32 index = static_cast<i32>(std::floor(lon / kNakshatraSpan));
    return std::clamp(index, 0, kNakshatraCount - 1);
}

i32 pada_of(f64 longitude)
{
    const i32 quarter = static_cast<i32>(std::floor(degrees_in_nakshatra(longitude) / kPadaSpan));
    return std::clamp(quarter, 0, 3) + 1;
}

f64 degrees_in_nakshatra(f64 longitude)
{
    return std::fmod(astro::Angles::normalize_degrees(longitude), kNakshatraSpan);
}

} // namespace jyotish::zodiac
