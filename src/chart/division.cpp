/// @file division.cpp
/// @brief Divisional chart remapping rules.

#include "chart/division.hpp"

#include "astro/angles.hpp"
#include "core/text.hpp"
#include "zodiac/sign.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace jyotish::chart
{

using zodiac::Element;
using zodiac::Sign;

namespace
{
    // Index of the part (0-based) a degree-in-sign falls into
    [[nodiscard]] i32 part_index(f64 degrees_in_sign, i32 parts)
    {
        const f64 size = zodiac_constants::kSignSpan / static_cast<f64>(parts);
        const i32 index = static_cast<i32>(std::floor(degrees_in_sign / size));
        return std::clamp(index, 0, parts - 1);
    }

    // First sign of each element's triplicity
    [[nodiscard]] Sign element_start(Element element)
    {
        switch (element)
        {
            case Element::Fire:  return Sign::Aries;
            case Element::Earth: return Sign::Taurus;
            case Element::Air:   return Sign::Gemini;
            case Element::Water: return Sign::Cancer;
        }
        return Sign::Aries;
    }

    // Navamsa count starts: movable-of-element sign
    [[nodiscard]] Sign navamsa_start(Element element)
    {
        switch (element)
        {
            case Element::Fire:  return Sign::Aries;
            case Element::Earth: return Sign::Capricorn;
            case Element::Air:   return Sign::Libra;
            case Element::Water: return Sign::Cancer;
        }
        return Sign::Aries;
    }
}

// -----------------------------------------------------------------
// Division rules
//
// D2  : 15° halves. Even-index signs: Cancer then Leo; odd-index
//       signs: Leo then Cancer.
// D3  : 10° thirds mapped onto the element's triplicity
//       (Fire -> Aries, Leo, Sagittarius, ...).
// D9  : 3°20' ninths counted from Aries / Capricorn / Libra / Cancer
//       for Fire / Earth / Air / Water signs.
// D10 : 3° tenths counted from the sign itself (even index) or from
//       its 9th (odd index).
// D12 : 2°30' twelfths counted from the sign itself.
// -----------------------------------------------------------------

Sign Divisions::sign(f64 longitude, Division division)
{
    const f64 lon = astro::Angles::normalize_degrees(longitude);
    const Sign rasi = zodiac::sign_of(lon);
    const f64 deg = astro::Angles::degrees_in_sign(lon);
    const bool even_index = zodiac::index_of(rasi) % 2 == 0;
    const Element element = zodiac::sign_info(rasi).element;

    switch (division)
    {
        case Division::D1:
            return rasi;

        case Division::D2:
        {
            const bool first_half = part_index(deg, 2) == 0;
            return (first_half == even_index) ? Sign::Cancer : Sign::Leo;
        }

        case Division::D3:
            return zodiac::advance(element_start(element), 4 * part_index(deg, 3));

        case Division::D9:
            return zodiac::advance(navamsa_start(element), part_index(deg, 9));

        case Division::D10:
        {
            const Sign start = even_index ? rasi : zodiac::advance(rasi, 8);
            return zodiac::advance(start, part_index(deg, 10));
        }

        case Division::D12:
            return zodiac::advance(rasi, part_index(deg, 12));
    }
    return rasi;
}

std::array<std::pair<Division, Sign>, kAllDivisions.size()> Divisions::all(f64 longitude)
{
    std::array<std::pair<Division, Sign>, kAllDivisions.size()> result{};
    for (std::size_t i = 0; i < kAllDivisions.size(); ++i)
    {
        result[i] = {kAllDivisions[i], sign(longitude, kAllDivisions[i])};
    }
    return result;
}

Division Divisions::from_name(std::string_view name)
{
    for (const Division division : kAllDivisions)
    {
        if (core::iequals(core::trim(name), Divisions::name(division)))
        {
            return division;
        }
    }
    throw std::invalid_argument(fmt::format("unsupported division: '{}'", name));
}

std::string_view Divisions::name(Division division)
{
    switch (division)
    {
        case Division::D1:  return "D1";
        case Division::D2:  return "D2";
        case Division::D3:  return "D3";
        case Division::D9:  return "D9";
        case Division::D10: return "D10";
        case Division::D12: return "D12";
    }
    return "D1";
}

i32 Divisions::parts(Division division)
{
    switch (division)
    {
        case Division::D1:  return 1;
        case Division::D2:  return 2;
        case Division::D3:  return 3;
        case Division::D9:  return 9;
        case Division::D10: return 10;
        case Division::D12: return 12;
    }
    return 1;
}

} // namespace jyotish::chart
