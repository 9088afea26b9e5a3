/// @file sign.cpp
/// @brief Sign catalog data and sign-to-sign relations.

#include "zodiac/sign.hpp"

#include "astro/angles.hpp"
#include "core/text.hpp"

#include <spdlog/fmt/fmt.h>

#include <stdexcept>

namespace jyotish::zodiac
{

namespace
{
    using enum Body;

    constexpr BodyMask kSolarFriends = mask_of(Sun, Moon, Mars, Jupiter);
    constexpr BodyMask kSolarEnemies = mask_of(Mercury, Venus, Saturn);
    constexpr BodyMask kSaturnineFriends = mask_of(Mercury, Venus, Saturn);
    constexpr BodyMask kSaturnineEnemies = mask_of(Sun, Moon, Mars);
    constexpr BodyMask kMercurialFriends = mask_of(Sun, Mercury, Venus);
    constexpr BodyMask kMercurialEnemies = mask_of(Moon, Mars, Jupiter);

    const std::array<SignInfo, zodiac_constants::kSignCount> kSigns{{
        {Sign::Aries,       "Aries",       "Mesha",     Element::Fire,  Quality::Cardinal, Gender::Male,   Mars,    Sun,          Saturn,       kSolarFriends,     kSolarEnemies},
        {Sign::Taurus,      "Taurus",      "Vrishabha", Element::Earth, Quality::Fixed,    Gender::Female, Venus,   Moon,         std::nullopt, kSaturnineFriends, kSaturnineEnemies},
        {Sign::Gemini,      "Gemini",      "Mithuna",   Element::Air,   Quality::Mutable,  Gender::Male,   Mercury, Rahu,         Ketu,         kMercurialFriends, kMercurialEnemies},
        {Sign::Cancer,      "Cancer",      "Karka",     Element::Water, Quality::Cardinal, Gender::Female, Moon,    Jupiter,      Mars,         kSolarFriends,     kSolarEnemies},
        {Sign::Leo,         "Leo",         "Simha",     Element::Fire,  Quality::Fixed,    Gender::Male,   Sun,     std::nullopt, std::nullopt, kSolarFriends,     kSolarEnemies},
        {Sign::Virgo,       "Virgo",       "Kanya",     Element::Earth, Quality::Mutable,  Gender::Female, Mercury, Mercury,      Venus,        kMercurialFriends, kMercurialEnemies},
        {Sign::Libra,       "Libra",       "Tula",      Element::Air,   Quality::Cardinal, Gender::Male,   Venus,   Saturn,       Sun,          kSaturnineFriends, kSaturnineEnemies},
        {Sign::Scorpio,     "Scorpio",     "Vrischika", Element::Water, Quality::Fixed,    Gender::Female, Mars,    Ketu,         Moon,         kSolarFriends,     kSolarEnemies},
        {Sign::Sagittarius, "Sagittarius", "Dhanu",     Element::Fire,  Quality::Mutable,  Gender::Male,   Jupiter, Ketu,         Rahu,         kSolarFriends,     kSolarEnemies},
        {Sign::Capricorn,   "Capricorn",   "Makara",    Element::Earth, Quality::Cardinal, Gender::Female, Saturn,  Mars,         Jupiter,      kSaturnineFriends, kSaturnineEnemies},
        {Sign::Aquarius,    "Aquarius",    "Kumbha",    Element::Air,   Quality::Fixed,    Gender::Male,   Saturn,  std::nullopt, std::nullopt, kSaturnineFriends, kSaturnineEnemies},
        {Sign::Pisces,      "Pisces",      "Meena",     Element::Water, Quality::Mutable,  Gender::Female, Jupiter, Venus,        Mercury,      kSolarFriends,     kSolarEnemies},
    }};

    // Quality aspected under rasi drishti, besides the 7th sign
    [[nodiscard]] Quality rasi_drishti_target(Quality quality)
    {
        switch (quality)
        {
            case Quality::Cardinal: return Quality::Fixed;
            case Quality::Fixed:    return Quality::Mutable;
            case Quality::Mutable:  return Quality::Cardinal;
        }
        return Quality::Fixed;
    }

    template <typename Pred>
    [[nodiscard]] std::vector<Sign> signs_where(Pred pred)
    {
        std::vector<Sign> result;
        for (const Sign sign : kAllSigns)
        {
            if (pred(sign))
            {
                result.push_back(sign);
            }
        }
        return result;
    }
}

const SignInfo& sign_info(Sign sign)
{
    return kSigns[static_cast<std::size_t>(index_of(sign))];
}

std::string_view sign_name(Sign sign)
{
    return sign_info(sign).name;
}

Sign sign_from_name(std::string_view name)
{
    const std::string_view key = core::trim(name);

    for (const auto& info : kSigns)
    {
        if (core::iequals(key, info.name) || core::iequals(key, info.sanskrit))
        {
            return info.sign;
        }
    }
    throw std::invalid_argument(fmt::format("unknown sign name: '{}'", name));
}

Sign sign_from_index(i32 index)
{
    if (index < 0 || index >= zodiac_constants::kSignCount)
    {
        throw std::out_of_range(fmt::format("sign index {} outside 0..11", index));
    }
    return kAllSigns[static_cast<std::size_t>(index)];
}

Sign sign_of(f64 longitude)
{
    return kAllSigns[static_cast<std::size_t>(astro::Angles::sign_index(longitude))];
}

Sign advance(Sign sign, i32 steps)
{
    constexpr i32 kCount = zodiac_constants::kSignCount;
    const i32 index = ((index_of(sign) + steps) % kCount + kCount) % kCount;
    return kAllSigns[static_cast<std::size_t>(index)];
}

Sign opposite(Sign sign)
{
    return advance(sign, 6);
}

i32 sign_distance(Sign from, Sign to)
{
    constexpr i32 kCount = zodiac_constants::kSignCount;
    return ((index_of(to) - index_of(from)) % kCount + kCount) % kCount + 1;
}

std::vector<Sign> trikona_signs(Sign sign)
{
    return {sign, advance(sign, 4), advance(sign, 8)};
}

std::vector<Sign> kendra_signs(Sign sign)
{
    return {sign, advance(sign, 3), advance(sign, 6), advance(sign, 9)};
}

std::vector<Sign> same_element_signs(Sign sign)
{
    const Element element = sign_info(sign).element;
    return signs_where([element](Sign s) { return sign_info(s).element == element; });
}

std::vector<Sign> same_quality_signs(Sign sign)
{
    const Quality quality = sign_info(sign).quality;
    return signs_where([quality](Sign s) { return sign_info(s).quality == quality; });
}

bool is_odd_sign(Sign sign)
{
    return index_of(sign) % 2 == 0;
}

// -----------------------------------------------------------------
// Rasi drishti
// -----------------------------------------------------------------

std::vector<Sign> rasi_aspects(Sign sign)
{
    const Sign seventh = opposite(sign);
    const Quality target = rasi_drishti_target(sign_info(sign).quality);

    return signs_where([&](Sign other) {
        if (other == sign)
        {
            return false;
        }
        if (other == seventh)
        {
            return true;
        }
        const i32 distance = sign_distance(sign, other);
        return sign_info(other).quality == target && distance != 2 && distance != 12;
    });
}

bool rasi_aspects_sign(Sign from, Sign to)
{
    for (const Sign sign : rasi_aspects(from))
    {
        if (sign == to)
        {
            return true;
        }
    }
    return false;
}

bool sign_befriends(Sign sign, Body body)
{
    return (sign_info(sign).friends & bit(body)) != 0;
}

bool sign_opposes(Sign sign, Body body)
{
    return (sign_info(sign).enemies & bit(body)) != 0;
}

std::string_view element_name(Element element)
{
    switch (element)
    {
        case Element::Fire:  return "Fire";
        case Element::Earth: return "Earth";
        case Element::Air:   return "Air";
        case Element::Water: return "Water";
    }
    return "Fire";
}

std::string_view quality_name(Quality quality)
{
    switch (quality)
    {
        case Quality::Cardinal: return "Cardinal";
        case Quality::Fixed:    return "Fixed";
        case Quality::Mutable:  return "Mutable";
    }
    return "Cardinal";
}

std::string_view quality_nature_name(Quality quality)
{
    switch (quality)
    {
        case Quality::Cardinal: return "Movable";
        case Quality::Fixed:    return "Fixed";
        case Quality::Mutable:  return "Dual";
    }
    return "Movable";
}

} // namespace jyotish::zodiac
