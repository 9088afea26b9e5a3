/// @file houses.cpp
/// @brief Implementation of equal-house construction.

#include "chart/houses.hpp"

#include "astro/angles.hpp"
#include "core/text.hpp"
#include "zodiac/sign.hpp"

#include <spdlog/fmt/fmt.h>

#include <stdexcept>

namespace jyotish::chart
{

using astro::Angles;
using zodiac_constants::kHouseCount;
using zodiac_constants::kSignSpan;

namespace
{
    constexpr std::array<std::string_view, kHouseCount> kHouseNames{
        "Lagna", "Dhana", "Sahaja", "Sukha", "Putra", "Ari",
        "Kalatra", "Ayu", "Bhagya", "Karma", "Labha", "Vyaya",
    };

    // 1-based house number `steps` houses after `number`
    [[nodiscard]] i32 step_house(i32 number, i32 steps)
    {
        return ((number - 1 + steps) % kHouseCount + kHouseCount) % kHouseCount + 1;
    }
}

// -----------------------------------------------------------------
// House members
// -----------------------------------------------------------------

bool House::contains(f64 longitude) const
{
    return Angles::forward_distance(cusp, longitude) < span;
}

bool House::in_sandhi(f64 longitude) const
{
    const f64 width = Angles::forward_distance(sandhi_start, cusp);
    return Angles::forward_distance(sandhi_start, longitude) <= 2.0 * width;
}

// -----------------------------------------------------------------
// Equal houses
// -----------------------------------------------------------------

HouseSet HouseBuilder::build(f64 ascendant, f64 sandhi_width)
{
    std::array<f64, kHouseCount> cusps{};
    for (i32 i = 0; i < kHouseCount; ++i)
    {
        cusps[static_cast<std::size_t>(i)] = Angles::normalize_degrees(ascendant + static_cast<f64>(i) * kSignSpan);
    }

    HouseSet houses{};

    for (i32 i = 0; i < kHouseCount; ++i)
    {
        const i32 number = i + 1;
        const f64 cusp = cusps[static_cast<std::size_t>(i)];
        // The next house's own cusp, so adjacent spans share one boundary value
        const f64 next = cusps[static_cast<std::size_t>((i + 1) % kHouseCount)];
        const f64 span = Angles::forward_distance(cusp, next);

        houses[static_cast<std::size_t>(i)] = House{
            .number       = number,
            .cusp         = cusp,
            .next_cusp    = next,
            .sign         = zodiac::sign_of(cusp),
            .cusp_degrees = Angles::degrees_in_sign(cusp),
            .span         = span,
            .midpoint     = Angles::normalize_degrees(cusp + span / 2.0),
            .sandhi_start = Angles::normalize_degrees(cusp - sandhi_width),
            .sandhi_end   = Angles::normalize_degrees(cusp + sandhi_width),
            .flags        = house_flags(number),
        };
    }

    return houses;
}

i32 HouseBuilder::house_of(const HouseSet& houses, f64 longitude)
{
    // Cusp offsets from the first cusp rise monotonically; the last cusp not
    // beyond the longitude owns it, so a longitude on a cusp opens that house.
    const f64 first = houses.front().cusp;
    const f64 offset = Angles::forward_distance(first, longitude);

    i32 number = 1;
    for (const House& house : houses)
    {
        if (Angles::forward_distance(first, house.cusp) <= offset)
        {
            number = house.number;
        }
    }
    return number;
}

bool HouseBuilder::in_any_sandhi(const HouseSet& houses, f64 longitude)
{
    for (const House& house : houses)
    {
        if (house.in_sandhi(longitude))
        {
            return true;
        }
    }
    return false;
}

HouseSystem HouseBuilder::system_from_name(std::string_view name)
{
    const std::string key = core::fold_identifier(name);
    if (key == "equal" || key == "equalhouse")
    {
        return HouseSystem::Equal;
    }
    throw std::invalid_argument(fmt::format("unsupported house system: '{}'", name));
}

// -----------------------------------------------------------------
// House-number rules
// -----------------------------------------------------------------

void require_house_number(i32 number)
{
    if (number < 1 || number > kHouseCount)
    {
        throw std::out_of_range(fmt::format("house number {} outside 1..12", number));
    }
}

HouseFlags house_flags(i32 number)
{
    require_house_number(number);

    return HouseFlags{
        .kendra   = number == 1 || number == 4 || number == 7 || number == 10,
        .trikona  = number == 1 || number == 5 || number == 9,
        .upachaya = number == 3 || number == 6 || number == 10 || number == 11,
        .dusthana = number == 6 || number == 8 || number == 12,
        .maraka   = number == 2 || number == 7,
    };
}

bool is_kendra(i32 number)   { return house_flags(number).kendra; }
bool is_trikona(i32 number)  { return house_flags(number).trikona; }
bool is_upachaya(i32 number) { return house_flags(number).upachaya; }
bool is_dusthana(i32 number) { return house_flags(number).dusthana; }
bool is_maraka(i32 number)   { return house_flags(number).maraka; }

i32 opposite_house(i32 number)
{
    require_house_number(number);
    return step_house(number, 6);
}

std::vector<i32> trikona_houses(i32 number)
{
    require_house_number(number);
    return {number, step_house(number, 4), step_house(number, 8)};
}

std::vector<i32> kendra_houses(i32 number)
{
    require_house_number(number);
    return {number, step_house(number, 3), step_house(number, 6), step_house(number, 9)};
}

i32 house_distance(i32 from, i32 to)
{
    require_house_number(from);
    require_house_number(to);
    return ((to - from) % kHouseCount + kHouseCount) % kHouseCount + 1;
}

std::string_view house_name(i32 number)
{
    require_house_number(number);
    return kHouseNames[static_cast<std::size_t>(number - 1)];
}

} // namespace jyotish::chart
