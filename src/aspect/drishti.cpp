/// @file drishti.cpp
/// @brief Drishti effect table and house aspect reports.

#include "aspect/drishti.hpp"

#include "astro/angles.hpp"
#include "zodiac/body.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <array>
#include <cmath>

namespace jyotish::aspect
{

using chart::DignityEngine;
using chart::DignityTier;
using zodiac::Nature;

namespace
{
    // -----------------------------------------------------------------
    // Effect table: rows are dignity tiers, columns benefic / malefic
    // -----------------------------------------------------------------
    using E = DrishtiEffect;

    constexpr std::array<std::array<DrishtiEffect, 2>, chart::kDignityTierCount> kEffectTable{{
        //  Benefic               Malefic
        {{E::VeryAuspicious,   E::Neutral}},                // Dignified
        {{E::Auspicious,       E::MildlyInauspicious}},     // Friend
        {{E::MildlyAuspicious, E::Inauspicious}},           // Neutral
        {{E::Neutral,          E::VeryInauspicious}},       // Enemy
        {{E::Neutral,          E::ExtremelyInauspicious}},  // Debilitated
    }};

    constexpr std::array<std::string_view, 12> kOrdinalNames{
        "1st Aspect", "2nd Aspect", "3rd Aspect", "4th Aspect", "5th Aspect", "6th Aspect",
        "7th Aspect", "8th Aspect", "9th Aspect", "10th Aspect", "11th Aspect", "12th Aspect",
    };

    constexpr f64 kSignMiddle = 15.0;
}

DrishtiEffect Drishti::effect(DignityTier tier, Nature nature)
{
    if (nature == Nature::Neutral)
    {
        return DrishtiEffect::Neutral;
    }
    const std::size_t column = nature == Nature::Benefic ? 0 : 1;
    return kEffectTable[static_cast<std::size_t>(tier)][column];
}

StrengthQualifier Drishti::qualifier(f64 strength)
{
    if (strength >= 0.75)
    {
        return StrengthQualifier::Strong;
    }
    if (strength >= 0.5)
    {
        return StrengthQualifier::Moderate;
    }
    return StrengthQualifier::Weak;
}

std::string Drishti::label(DrishtiEffect effect, std::optional<StrengthQualifier> qualifier)
{
    if (!qualifier)
    {
        return std::string(effect_name(effect));
    }
    return fmt::format("{} {}", qualifier_name(*qualifier), effect_name(effect));
}

std::string_view Drishti::aspect_name(f64 angle)
{
    // 30° -> 2nd, 180° -> 7th, 330° -> 12th
    const i32 houses = static_cast<i32>(std::lround(astro::Angles::normalize_degrees(angle) / 30.0)) % 12;
    return kOrdinalNames[static_cast<std::size_t>(houses)];
}

std::string_view Drishti::effect_name(DrishtiEffect effect)
{
    switch (effect)
    {
        case E::VeryAuspicious:        return "Very Auspicious";
        case E::Auspicious:            return "Auspicious";
        case E::MildlyAuspicious:      return "Mildly Auspicious";
        case E::Neutral:               return "Neutral";
        case E::MildlyInauspicious:    return "Mildly Inauspicious";
        case E::Inauspicious:          return "Inauspicious";
        case E::VeryInauspicious:      return "Very Inauspicious";
        case E::ExtremelyInauspicious: return "Extremely Inauspicious";
    }
    return "Neutral";
}

std::string_view Drishti::qualifier_name(StrengthQualifier qualifier)
{
    switch (qualifier)
    {
        case StrengthQualifier::Strong:   return "Strong";
        case StrengthQualifier::Moderate: return "Moderate";
        case StrengthQualifier::Weak:     return "Weak";
    }
    return "Weak";
}

bool Drishti::is_auspicious(DrishtiEffect effect)
{
    return effect == E::VeryAuspicious || effect == E::Auspicious || effect == E::MildlyAuspicious;
}

bool Drishti::is_inauspicious(DrishtiEffect effect)
{
    return effect == E::MildlyInauspicious || effect == E::Inauspicious
        || effect == E::VeryInauspicious || effect == E::ExtremelyInauspicious;
}

// -----------------------------------------------------------------
// House report
// -----------------------------------------------------------------

std::optional<HouseAspectReport> Drishti::house_report(const chart::ChartContext& chart, i32 house)
{
    const auto target = chart.house(house);
    if (!target)
    {
        return std::nullopt;
    }

    const AspectEngine engine(chart);
    HouseAspectReport report{
        .house = house,
        .mode  = engine.mode(),
    };

    for (const AspectResult& result : engine.aspects_to_house(house))
    {
        const auto& source = chart.position(result.source);
        const Nature nature = zodiac::body_info(result.source).nature;

        for (const AspectHit& hit : result.hits)
        {
            const bool rasi = engine.mode() == AspectMode::Rasi;

            // Position the aspecting body "occupies" for the dignity check
            const f64 aspected_lon = rasi
                ? static_cast<f64>(zodiac::index_of(target->sign)) * zodiac_constants::kSignSpan + kSignMiddle
                : astro::Angles::normalize_degrees(source->longitude + hit.angle);

            const DignityTier tier = DignityEngine::drishti_tier(result.source, aspected_lon);
            const DrishtiEffect effect = Drishti::effect(tier, nature);
            const auto qual = rasi ? std::nullopt : std::optional<StrengthQualifier>{qualifier(hit.strength)};

            report.aspects.push_back(HouseAspect{
                .body        = result.source,
                .angle       = hit.angle,
                .aspect_name = aspect_name(hit.angle),
                .dignity     = DignityEngine::dignity(result.source, aspected_lon),
                .tier        = tier,
                .nature      = nature,
                .category    = hit.category,
                .strength    = hit.strength,
                .effect      = effect,
                .qualifier   = qual,
                .label       = label(effect, qual),
            });

            if (is_auspicious(effect))
            {
                ++report.auspicious;
            }
            else if (is_inauspicious(effect))
            {
                ++report.inauspicious;
            }
            else
            {
                ++report.neutral;
            }
        }
    }

    std::stable_sort(report.aspects.begin(), report.aspects.end(),
                     [](const HouseAspect& a, const HouseAspect& b) { return a.strength > b.strength; });

    if (report.aspects.empty())
    {
        report.overall = "No major aspects";
    }
    else if (report.auspicious > report.inauspicious)
    {
        report.overall = "Predominantly Auspicious";
    }
    else if (report.inauspicious > report.auspicious)
    {
        report.overall = "Predominantly Inauspicious";
    }
    else
    {
        report.overall = "Mixed Influences";
    }

    return report;
}

} // namespace jyotish::aspect
