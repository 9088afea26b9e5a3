/// @file body.cpp
/// @brief Body catalog data: natural friendships, dignity points, special aspects.

#include "zodiac/body.hpp"

#include "core/text.hpp"

#include <spdlog/fmt/fmt.h>

#include <stdexcept>

namespace jyotish::zodiac
{

namespace
{
    using R = Relationship;
    using enum Sign;

    // ---- Natural relationship rows, indexed in catalog order ----
    //                                    Sun         Moon        Mars        Mercury     Jupiter     Venus       Saturn      Rahu        Ketu
    constexpr std::array<R, 9> kSunRel     {R::Unknown, R::Friend,  R::Friend,  R::Neutral, R::Friend,  R::Enemy,   R::Enemy,   R::Enemy,   R::Enemy};
    constexpr std::array<R, 9> kMoonRel    {R::Friend,  R::Unknown, R::Neutral, R::Friend,  R::Neutral, R::Neutral, R::Neutral, R::Enemy,   R::Enemy};
    constexpr std::array<R, 9> kMarsRel    {R::Friend,  R::Friend,  R::Unknown, R::Enemy,   R::Friend,  R::Neutral, R::Neutral, R::Enemy,   R::Enemy};
    constexpr std::array<R, 9> kMercuryRel {R::Friend,  R::Enemy,   R::Neutral, R::Unknown, R::Neutral, R::Friend,  R::Neutral, R::Enemy,   R::Enemy};
    constexpr std::array<R, 9> kJupiterRel {R::Friend,  R::Friend,  R::Friend,  R::Enemy,   R::Unknown, R::Enemy,   R::Neutral, R::Enemy,   R::Enemy};
    constexpr std::array<R, 9> kVenusRel   {R::Enemy,   R::Enemy,   R::Neutral, R::Friend,  R::Neutral, R::Unknown, R::Friend,  R::Enemy,   R::Enemy};
    constexpr std::array<R, 9> kSaturnRel  {R::Enemy,   R::Enemy,   R::Enemy,   R::Friend,  R::Neutral, R::Friend,  R::Unknown, R::Enemy,   R::Enemy};
    constexpr std::array<R, 9> kRahuRel    {R::Enemy,   R::Enemy,   R::Enemy,   R::Friend,  R::Enemy,   R::Friend,  R::Friend,  R::Unknown, R::Unknown};
    constexpr std::array<R, 9> kKetuRel    {R::Enemy,   R::Enemy,   R::Friend,  R::Enemy,   R::Enemy,   R::Friend,  R::Friend,  R::Unknown, R::Unknown};

    const std::array<BodyInfo, zodiac_constants::kBodyCount> kBodies{{
        {
            .body = Body::Sun, .name = "Sun", .sanskrit = "Surya",
            .nature = Nature::Malefic, .scoring_benefic = false,
            .relations = kSunRel,
            .owned_signs = mask_of(Leo),
            .moolatrikona = {Leo, 0.0, 20.0},
            .exaltation = {Aries, 10.0}, .debilitation = {Libra, 10.0},
            .aspect_angles = {180.0}, .aspect_angle_count = 1,
        },
        {
            .body = Body::Moon, .name = "Moon", .sanskrit = "Chandra",
            .nature = Nature::Benefic, .scoring_benefic = true,
            .relations = kMoonRel,
            .owned_signs = mask_of(Cancer),
            .moolatrikona = {Taurus, 4.0, 30.0},
            .exaltation = {Taurus, 3.0}, .debilitation = {Scorpio, 3.0},
            .aspect_angles = {180.0}, .aspect_angle_count = 1,
        },
        {
            .body = Body::Mars, .name = "Mars", .sanskrit = "Mangala",
            .nature = Nature::Malefic, .scoring_benefic = false,
            .relations = kMarsRel,
            .owned_signs = mask_of(Aries, Scorpio),
            .moolatrikona = {Aries, 0.0, 12.0},
            .exaltation = {Capricorn, 28.0}, .debilitation = {Cancer, 28.0},
            .aspect_angles = {90.0, 180.0, 210.0}, .aspect_angle_count = 3,
        },
        {
            .body = Body::Mercury, .name = "Mercury", .sanskrit = "Budha",
            .nature = Nature::Neutral, .scoring_benefic = true,
            .relations = kMercuryRel,
            .owned_signs = mask_of(Gemini, Virgo),
            .moolatrikona = {Virgo, 16.0, 20.0},
            .exaltation = {Virgo, 15.0}, .debilitation = {Pisces, 15.0},
            .aspect_angles = {180.0}, .aspect_angle_count = 1,
        },
        {
            .body = Body::Jupiter, .name = "Jupiter", .sanskrit = "Guru",
            .nature = Nature::Benefic, .scoring_benefic = true,
            .relations = kJupiterRel,
            .owned_signs = mask_of(Sagittarius, Pisces),
            .moolatrikona = {Sagittarius, 0.0, 10.0},
            .exaltation = {Cancer, 5.0}, .debilitation = {Capricorn, 5.0},
            .aspect_angles = {120.0, 180.0, 240.0}, .aspect_angle_count = 3,
        },
        {
            .body = Body::Venus, .name = "Venus", .sanskrit = "Shukra",
            .nature = Nature::Benefic, .scoring_benefic = true,
            .relations = kVenusRel,
            .owned_signs = mask_of(Taurus, Libra),
            .moolatrikona = {Libra, 0.0, 15.0},
            .exaltation = {Pisces, 27.0}, .debilitation = {Virgo, 27.0},
            .aspect_angles = {180.0}, .aspect_angle_count = 1,
        },
        {
            .body = Body::Saturn, .name = "Saturn", .sanskrit = "Shani",
            .nature = Nature::Malefic, .scoring_benefic = false,
            .relations = kSaturnRel,
            .owned_signs = mask_of(Capricorn, Aquarius),
            .moolatrikona = {Aquarius, 0.0, 20.0},
            .exaltation = {Libra, 20.0}, .debilitation = {Aries, 20.0},
            .aspect_angles = {60.0, 180.0, 270.0}, .aspect_angle_count = 3,
        },
        {
            .body = Body::Rahu, .name = "Rahu", .sanskrit = "Rahu",
            .nature = Nature::Malefic, .scoring_benefic = false,
            .relations = kRahuRel,
            .owned_signs = 0,
            .moolatrikona = {Gemini, 0.0, 30.0},
            .exaltation = {Gemini, 15.0}, .debilitation = {Sagittarius, 15.0},
            .aspect_angles = {120.0, 240.0}, .aspect_angle_count = 2,
        },
        {
            .body = Body::Ketu, .name = "Ketu", .sanskrit = "Ketu",
            .nature = Nature::Malefic, .scoring_benefic = false,
            .relations = kKetuRel,
            .owned_signs = 0,
            .moolatrikona = {Sagittarius, 0.0, 30.0},
            .exaltation = {Sagittarius, 15.0}, .debilitation = {Gemini, 15.0},
            .aspect_angles = {120.0, 240.0}, .aspect_angle_count = 2,
        },
    }};

    // Alternate spellings accepted by body_from_name
    struct Alias
    {
        std::string_view alias;
        Body body;
    };

    constexpr std::array<Alias, 5> kAliases{{
        {"Kuja", Body::Mars},
        {"Brihaspati", Body::Jupiter},
        {"Sukra", Body::Venus},
        {"Sani", Body::Saturn},
        {"Soma", Body::Moon},
    }};
}

const BodyInfo& body_info(Body body)
{
    return kBodies[index_of(body)];
}

std::string_view body_name(Body body)
{
    return body_info(body).name;
}

Body body_from_name(std::string_view name)
{
    const std::string_view key = core::trim(name);

    for (const auto& info : kBodies)
    {
        if (core::iequals(key, info.name) || core::iequals(key, info.sanskrit))
        {
            return info.body;
        }
    }
    for (const auto& alias : kAliases)
    {
        if (core::iequals(key, alias.alias))
        {
            return alias.body;
        }
    }

    throw std::invalid_argument(fmt::format("unknown body name: '{}'", name));
}

Body body_from_index(i32 index)
{
    if (index < 0 || index >= zodiac_constants::kBodyCount)
    {
        throw std::out_of_range(fmt::format("body index {} outside 0..8", index));
    }
    return kAllBodies[static_cast<std::size_t>(index)];
}

std::vector<Sign> owned_signs(Body body)
{
    const BodyInfo& info = body_info(body);

    std::vector<Sign> result;
    for (const Sign sign : kAllSigns)
    {
        if (info.owns(sign))
        {
            result.push_back(sign);
        }
    }
    return result;
}

std::string_view nature_name(Nature nature)
{
    switch (nature)
    {
        case Nature::Benefic: return "Benefic";
        case Nature::Malefic: return "Malefic";
        case Nature::Neutral: return "Neutral";
    }
    return "Neutral";
}

} // namespace jyotish::zodiac
