#pragma once

/// @file chart_summary.hpp
/// @brief Chart-level digest: special points, strongest bodies and overall strength.

#include "analysis/house_strength.hpp"
#include "analysis/yoga.hpp"
#include "chart/chart.hpp"
#include "core/types.hpp"

#include <optional>
#include <vector>

namespace jyotish::analysis
{
    /// @brief Sensitive points derived from the ascendant.
    struct SpecialPoints
    {
        f64                ascendant;
        f64                midheaven;        ///< Equal-house 10th cusp
        std::optional<f64> part_of_fortune;  ///< Needs both Sun and Moon
    };

    /// @brief Ascendant placement, same derivation as a body position.
    struct AscendantPlacement
    {
        zodiac::Sign sign;
        f64          degrees_in_sign;
        i32          nakshatra;
        i32          pada;
    };

    struct BodyDignity
    {
        Body           body;
        chart::Dignity dignity;
    };

    struct ChartSummary
    {
        std::optional<AscendantPlacement> ascendant;
        std::optional<SpecialPoints>      points;
        std::vector<BodyDignity>          strongest_bodies;   ///< Exalted, moolatrikona or own sign
        std::vector<HouseStrength>        strongest_houses;
        std::vector<KendraTrikonaYoga>    raj_yogas;
        std::optional<DhanaYoga>          dhana_yoga;
        i32                               total_aspects{0};
        i32                               total_conjunctions{0};
        StrengthCategory                  overall{StrengthCategory::VeryWeak};
        f64                               overall_percent{0.0};
    };

    class ChartSummarizer
    {
    public:
        ChartSummarizer() = delete;

        [[nodiscard]] static ChartSummary summarize(const chart::ChartContext& chart);

        /// @brief Midheaven and Part of Fortune; empty without an ascendant.
        [[nodiscard]] static std::optional<SpecialPoints> special_points(const chart::ChartContext& chart);

        /// @brief Dignity points as a percentage of the maximum (3 per body).
        [[nodiscard]] static f64 overall_strength_percent(const chart::ChartContext& chart);
    };

} // namespace jyotish::analysis
