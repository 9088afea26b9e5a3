/// @file chart_summary.cpp
/// @brief Implementation of the chart digest.

#include "analysis/chart_summary.hpp"

#include "aspect/aspect_engine.hpp"
#include "astro/angles.hpp"
#include "chart/dignity.hpp"
#include "core/logger.hpp"
#include "zodiac/nakshatra.hpp"
#include "zodiac/sign.hpp"

#include <algorithm>

namespace jyotish::analysis
{

using astro::Angles;
using chart::DignityEngine;

namespace
{
    constexpr f64 kMidheavenOffset   = 270.0;
    constexpr i32 kMaxBodyPoints     = 3;
    constexpr i32 kStrongHousesBonus = 2;
    constexpr std::size_t kStrongHousesNeeded = 3;
}

// -----------------------------------------------------------------
// MC  = Asc + 270 (equal houses)
// PoF = Asc + Moon - Sun
// -----------------------------------------------------------------

std::optional<SpecialPoints> ChartSummarizer::special_points(const chart::ChartContext& chart)
{
    const auto& asc = chart.ascendant();
    if (!asc)
    {
        return std::nullopt;
    }

    std::optional<f64> fortune;
    const auto& sun  = chart.position(Body::Sun);
    const auto& moon = chart.position(Body::Moon);
    if (sun && moon)
    {
        fortune = Angles::normalize_degrees(*asc + moon->longitude - sun->longitude);
    }

    return SpecialPoints{
        .ascendant       = *asc,
        .midheaven       = Angles::normalize_degrees(*asc + kMidheavenOffset),
        .part_of_fortune = fortune,
    };
}

// -----------------------------------------------------------------
// Points per body: exalted 3, own/moolatrikona 2, debilitated -2,
// anything else 1; max 3 per body. +2 if three houses rank strongest.
// -----------------------------------------------------------------

f64 ChartSummarizer::overall_strength_percent(const chart::ChartContext& chart)
{
    i32 points = 0;
    i32 total  = 0;

    for (const Body body : chart.present_bodies())
    {
        const chart::Dignity dignity = *chart.dignity_of(body);
        if (DignityEngine::is_exalted(dignity))
        {
            points += 3;
        }
        else if (DignityEngine::is_own(dignity))
        {
            points += 2;
        }
        else if (DignityEngine::is_debilitated(dignity))
        {
            points -= 2;
        }
        else
        {
            points += 1;
        }
        total += kMaxBodyPoints;
    }

    if (HouseStrengthScorer(chart).strongest(kStrongHousesNeeded).size() >= kStrongHousesNeeded)
    {
        points += kStrongHousesBonus;
    }

    return static_cast<f64>(points) / static_cast<f64>(std::max(total, 1)) * 100.0;
}

ChartSummary ChartSummarizer::summarize(const chart::ChartContext& chart)
{
    ChartSummary summary;

    if (const auto& asc = chart.ascendant())
    {
        summary.ascendant = AscendantPlacement{
            .sign            = zodiac::sign_of(*asc),
            .degrees_in_sign = Angles::degrees_in_sign(*asc),
            .nakshatra       = zodiac::nakshatra_index(*asc),
            .pada            = zodiac::pada_of(*asc),
        };
    }
    summary.points = special_points(chart);

    for (const Body body : chart.present_bodies())
    {
        const chart::Dignity dignity = *chart.dignity_of(body);
        if (DignityEngine::is_dignified(dignity))
        {
            summary.strongest_bodies.push_back({.body = body, .dignity = dignity});
        }
    }

    const HouseStrengthScorer scorer(chart);
    summary.strongest_houses = scorer.strongest();

    const YogaDetector yogas(chart);
    summary.raj_yogas  = yogas.raj_yogas();
    summary.dhana_yoga = yogas.dhana_yoga();

    const aspect::AspectEngine engine(chart);
    const aspect::AspectPatterns patterns = engine.patterns();
    summary.total_aspects      = patterns.total_aspects;
    summary.total_conjunctions = static_cast<i32>(patterns.conjunctions.size());

    summary.overall_percent = overall_strength_percent(chart);
    summary.overall         = HouseStrengthScorer::category_of(summary.overall_percent / 100.0);

    JYO_CORE_DEBUG("Chart summary: {} dignified bodies, {} raj yogas, overall {:.1f}%",
                   summary.strongest_bodies.size(), summary.raj_yogas.size(), summary.overall_percent);

    return summary;
}

} // namespace jyotish::analysis
