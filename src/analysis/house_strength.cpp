/// @file house_strength.cpp
/// @brief Implementation of the house strength model.

#include "analysis/house_strength.hpp"

#include "aspect/aspect_engine.hpp"
#include "chart/dignity.hpp"
#include "zodiac/body.hpp"
#include "zodiac/sign.hpp"

#include <spdlog/fmt/fmt.h>

#include <algorithm>

namespace jyotish::analysis
{

using chart::DignityEngine;
using zodiac::Body;

namespace
{
    constexpr f64 kNeutralScore  = 0.5;
    constexpr f64 kEmptyScore    = 0.3;   // empty house / unaspected house
    constexpr f64 kStrongFactor  = 0.7;
    constexpr f64 kWeakFactor    = 0.3;

    // Dignity adjustment shared by the lord and occupant factors
    [[nodiscard]] f64 dignity_delta(chart::Dignity dignity)
    {
        if (DignityEngine::is_exalted(dignity))
        {
            return 0.4;
        }
        if (DignityEngine::is_own(dignity))
        {
            return 0.3;
        }
        if (DignityEngine::is_debilitated(dignity))
        {
            return -0.3;
        }
        return 0.0;
    }
}

HouseStrengthScorer::HouseStrengthScorer(const chart::ChartContext& chart)
    : m_chart(chart)
{
}

// -----------------------------------------------------------------
// Base: 1.0 kendra+trikona, 0.8 kendra or trikona, 0.6 upachaya,
//       0.2 dusthana, 0.5 otherwise
// -----------------------------------------------------------------

f64 HouseStrengthScorer::base_score(i32 house)
{
    const chart::HouseFlags flags = chart::house_flags(house);

    if (flags.kendra && flags.trikona) { return 1.0; }
    if (flags.kendra || flags.trikona) { return 0.8; }
    if (flags.upachaya)                { return 0.6; }
    if (flags.dusthana)                { return 0.2; }
    return kNeutralScore;
}

// -----------------------------------------------------------------
// Sign: mean of element (Fire .7, Earth .6, Air .5, Water .6) and
//       quality (Cardinal .7, Fixed .8, Mutable .5)
// -----------------------------------------------------------------

f64 HouseStrengthScorer::sign_score(zodiac::Sign sign)
{
    const zodiac::SignInfo& info = zodiac::sign_info(sign);

    f64 element = kNeutralScore;
    switch (info.element)
    {
        case zodiac::Element::Fire:  element = 0.7; break;
        case zodiac::Element::Earth: element = 0.6; break;
        case zodiac::Element::Air:   element = 0.5; break;
        case zodiac::Element::Water: element = 0.6; break;
    }

    f64 quality = kNeutralScore;
    switch (info.quality)
    {
        case zodiac::Quality::Cardinal: quality = 0.7; break;
        case zodiac::Quality::Fixed:    quality = 0.8; break;
        case zodiac::Quality::Mutable:  quality = 0.5; break;
    }

    return (element + quality) / 2.0;
}

// -----------------------------------------------------------------
// Lord: 0.5 + dignity delta, +0.2 placed in kendra/trikona,
//       -0.2 placed in dusthana, -0.1 retrograde; clamped to [0, 1].
//       A lord missing from an incomplete chart scores 0.
// -----------------------------------------------------------------

f64 HouseStrengthScorer::lord_score(i32 house) const
{
    const auto lord = m_chart.lord_of(house);
    if (!lord)
    {
        return 0.0;
    }
    const auto& pos = m_chart.position(*lord);
    if (!pos)
    {
        return 0.0;
    }

    f64 score = kNeutralScore + dignity_delta(DignityEngine::dignity(*lord, pos->longitude));

    if (const auto placed = m_chart.house_of(*lord))
    {
        const chart::HouseFlags flags = chart::house_flags(*placed);
        if (flags.kendra || flags.trikona)
        {
            score += 0.2;
        }
        else if (flags.dusthana)
        {
            score -= 0.2;
        }
    }

    if (pos->is_retrograde())
    {
        score -= 0.1;
    }

    return std::clamp(score, 0.0, 1.0);
}

// -----------------------------------------------------------------
// Occupant: mean over occupants of
//           0.5 + dignity delta + (0.1 benefic | -0.05 otherwise)
//           - 0.1 retrograde, each clamped; empty house 0.3
// -----------------------------------------------------------------

f64 HouseStrengthScorer::occupant_score(i32 house) const
{
    const std::vector<Body> occupants = m_chart.occupants(house);
    if (occupants.empty())
    {
        return kEmptyScore;
    }

    f64 sum = 0.0;
    for (const Body body : occupants)
    {
        const auto& pos = m_chart.position(body);

        f64 score = kNeutralScore + dignity_delta(DignityEngine::dignity(body, pos->longitude));
        score += zodiac::body_info(body).scoring_benefic ? 0.1 : -0.05;
        if (pos->is_retrograde())
        {
            score -= 0.1;
        }
        sum += std::clamp(score, 0.0, 1.0);
    }

    return sum / static_cast<f64>(occupants.size());
}

// -----------------------------------------------------------------
// Aspect: degree-based aspects to the cusp, each body's total
//         strength × 1.2 (benefic) or × 0.8; mean capped at 1.
//         No aspects: 0.3
// -----------------------------------------------------------------

f64 HouseStrengthScorer::aspect_score(i32 house) const
{
    const aspect::AspectEngine engine(m_chart, aspect::AspectMode::Degree);
    const auto aspects = engine.aspects_to_house(house);
    if (aspects.empty())
    {
        return kEmptyScore;
    }

    f64 sum = 0.0;
    for (const auto& result : aspects)
    {
        const f64 weight = zodiac::body_info(result.source).scoring_benefic ? 1.2 : 0.8;
        sum += result.total_strength * weight;
    }

    return std::min(1.0, sum / static_cast<f64>(aspects.size()));
}

std::optional<HouseStrength> HouseStrengthScorer::strength(i32 house) const
{
    const auto h = m_chart.house(house);
    if (!h)
    {
        return std::nullopt;
    }

    const StrengthFactors factors{
        .base     = base_score(house),
        .lord     = lord_score(house),
        .occupant = occupant_score(house),
        .aspect   = aspect_score(house),
        .sign     = sign_score(h->sign),
    };

    const f64 total = kBaseWeight * factors.base
                    + kLordWeight * factors.lord
                    + kOccupantWeight * factors.occupant
                    + kAspectWeight * factors.aspect
                    + kSignWeight * factors.sign;

    std::vector<std::string> contributors;
    const auto note = [&contributors](std::string_view name, f64 score) {
        if (score >= kStrongFactor)
        {
            contributors.push_back(fmt::format("Strong {}", name));
        }
        else if (score <= kWeakFactor)
        {
            contributors.push_back(fmt::format("Weak {}", name));
        }
    };
    note("base", factors.base);
    note("lord", factors.lord);
    note("occupant", factors.occupant);
    note("aspect", factors.aspect);
    note("sign", factors.sign);

    return HouseStrength{
        .house        = house,
        .lord         = m_chart.lord_of(house),
        .factors      = factors,
        .total        = total,
        .category     = category_of(total),
        .contributors = std::move(contributors),
    };
}

std::vector<HouseStrength> HouseStrengthScorer::all() const
{
    std::vector<HouseStrength> result;
    for (i32 house = 1; house <= zodiac_constants::kHouseCount; ++house)
    {
        if (auto s = strength(house))
        {
            result.push_back(std::move(*s));
        }
    }
    return result;
}

std::vector<HouseStrength> HouseStrengthScorer::strongest(std::size_t count) const
{
    std::vector<HouseStrength> ranked = all();
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const HouseStrength& a, const HouseStrength& b) { return a.total > b.total; });
    ranked.resize(std::min(count, ranked.size()));
    return ranked;
}

std::vector<HouseStrength> HouseStrengthScorer::weakest(std::size_t count) const
{
    std::vector<HouseStrength> ranked = all();
    std::stable_sort(ranked.begin(), ranked.end(),
                     [](const HouseStrength& a, const HouseStrength& b) { return a.total < b.total; });
    ranked.resize(std::min(count, ranked.size()));
    return ranked;
}

StrengthCategory HouseStrengthScorer::category_of(f64 total)
{
    if (total >= 0.8) { return StrengthCategory::VeryStrong; }
    if (total >= 0.6) { return StrengthCategory::Strong; }
    if (total >= 0.4) { return StrengthCategory::Moderate; }
    if (total >= 0.2) { return StrengthCategory::Weak; }
    return StrengthCategory::VeryWeak;
}

std::string_view HouseStrengthScorer::category_name(StrengthCategory category)
{
    switch (category)
    {
        case StrengthCategory::VeryStrong: return "Very Strong";
        case StrengthCategory::Strong:     return "Strong";
        case StrengthCategory::Moderate:   return "Moderate";
        case StrengthCategory::Weak:       return "Weak";
        case StrengthCategory::VeryWeak:   return "Very Weak";
    }
    return "Very Weak";
}

} // namespace jyotish::analysis
