/// @file dignity.cpp
/// @brief Implementation of the dignity priority chain.

#include "chart/dignity.hpp"

#include "astro/angles.hpp"
#include "zodiac/body.hpp"
#include "zodiac/sign.hpp"

#include <cmath>

namespace jyotish::chart
{

using zodiac::Body;
using zodiac::Relationship;

namespace
{
    constexpr f64 kExactOrb = 1.0;

    [[nodiscard]] bool within_exact_orb(f64 degrees_in_sign, f64 catalog_degree)
    {
        return std::abs(degrees_in_sign - catalog_degree) <= kExactOrb;
    }
}

// -----------------------------------------------------------------
// Dignity priority chain
// -----------------------------------------------------------------

Dignity DignityEngine::dignity(Body body, f64 longitude)
{
    const zodiac::BodyInfo& info = zodiac::body_info(body);
    const zodiac::Sign sign = zodiac::sign_of(longitude);
    const f64 deg = astro::Angles::degrees_in_sign(longitude);

    if (sign == info.exaltation.sign)
    {
        return within_exact_orb(deg, info.exaltation.degree) ? Dignity::ExaltedExact : Dignity::Exalted;
    }

    if (sign == info.debilitation.sign)
    {
        return within_exact_orb(deg, info.debilitation.degree) ? Dignity::DebilitatedExact : Dignity::Debilitated;
    }

    if (info.owns(sign))
    {
        const auto& mt = info.moolatrikona;
        if (sign == mt.sign && deg >= mt.from_deg && deg <= mt.to_deg)
        {
            return Dignity::Moolatrikona;
        }
        return Dignity::OwnSign;
    }

    return Dignity::Neutral;
}

Relationship DignityEngine::relationship(Body subject, Body other)
{
    return zodiac::body_info(subject).relations[zodiac::index_of(other)];
}

DignityTier DignityEngine::drishti_tier(Body body, f64 longitude)
{
    return tier_of(dignity(body, longitude));
}

DignityTier DignityEngine::tier_of(Dignity dignity)
{
    switch (dignity)
    {
        case Dignity::ExaltedExact:
        case Dignity::Exalted:
        case Dignity::Moolatrikona:
        case Dignity::OwnSign:
            return DignityTier::Dignified;
        case Dignity::DebilitatedExact:
        case Dignity::Debilitated:
            return DignityTier::Debilitated;
        case Dignity::Neutral:
            return DignityTier::Neutral;
    }
    return DignityTier::Neutral;
}

bool DignityEngine::is_exalted(Dignity dignity)
{
    return dignity == Dignity::Exalted || dignity == Dignity::ExaltedExact;
}

bool DignityEngine::is_debilitated(Dignity dignity)
{
    return dignity == Dignity::Debilitated || dignity == Dignity::DebilitatedExact;
}

bool DignityEngine::is_own(Dignity dignity)
{
    return dignity == Dignity::OwnSign || dignity == Dignity::Moolatrikona;
}

bool DignityEngine::is_dignified(Dignity dignity)
{
    return is_exalted(dignity) || is_own(dignity);
}

std::string_view dignity_name(Dignity dignity)
{
    switch (dignity)
    {
        case Dignity::ExaltedExact:     return "Exalted (exact)";
        case Dignity::Exalted:          return "Exalted";
        case Dignity::DebilitatedExact: return "Debilitated (exact)";
        case Dignity::Debilitated:      return "Debilitated";
        case Dignity::Moolatrikona:     return "Moolatrikona";
        case Dignity::OwnSign:          return "Own Sign";
        case Dignity::Neutral:          return "Neutral";
    }
    return "Neutral";
}

std::string_view dignity_tier_name(DignityTier tier)
{
    switch (tier)
    {
        case DignityTier::Dignified:   return "Dignified";
        case DignityTier::Friend:      return "Friend";
        case DignityTier::Neutral:     return "Neutral";
        case DignityTier::Enemy:       return "Enemy";
        case DignityTier::Debilitated: return "Debilitated";
    }
    return "Neutral";
}

std::string_view relationship_name(Relationship relationship)
{
    switch (relationship)
    {
        case Relationship::Friend:  return "Friend";
        case Relationship::Neutral: return "Neutral";
        case Relationship::Enemy:   return "Enemy";
        case Relationship::Unknown: return "Unknown";
    }
    return "Unknown";
}

} // namespace jyotish::chart
