/// @file test_chart_summary.cpp
/// @brief Unit tests for special points and the chart summary.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "analysis/chart_summary.hpp"
#include "chart_fixtures.hpp"
#include "core/logger.hpp"

using namespace jyotish;
using namespace jyotish::analysis;
using fixtures::make_chart;
using zodiac::Sign;

static constexpr f64 kTol = 1e-9;

// =================================================================
// Special points
// =================================================================

TEST_CASE("Midheaven and part of fortune from the ascendant")
{
    const auto chart = make_chart({{Body::Sun, 10.0}, {Body::Moon, 105.0}}, 101.0);
    const auto points = ChartSummarizer::special_points(chart);

    REQUIRE(points.has_value());
    CHECK(points->ascendant == doctest::Approx(101.0).epsilon(kTol));
    CHECK(points->midheaven == doctest::Approx(11.0).epsilon(kTol));
    REQUIRE(points->part_of_fortune.has_value());
    CHECK(*points->part_of_fortune == doctest::Approx(196.0).epsilon(kTol));
}

TEST_CASE("Part of fortune needs both luminaries")
{
    const auto chart = make_chart({{Body::Sun, 10.0}}, 101.0);
    const auto points = ChartSummarizer::special_points(chart);
    REQUIRE(points.has_value());
    CHECK_FALSE(points->part_of_fortune.has_value());
}

TEST_CASE("Part of fortune wraps into [0, 360)")
{
    const auto chart = make_chart({{Body::Sun, 300.0}, {Body::Moon, 10.0}}, 20.0);
    CHECK(*ChartSummarizer::special_points(chart)->part_of_fortune == doctest::Approx(90.0).epsilon(kTol));
}

TEST_CASE("No special points without an ascendant")
{
    const auto chart = make_chart({{Body::Sun, 10.0}}, std::nullopt);
    CHECK_FALSE(ChartSummarizer::special_points(chart).has_value());
}

// =================================================================
// Overall strength
// =================================================================

TEST_CASE("Dignity points plus the strong-house bonus")
{
    // Sun exalted (3), Moon own sign (2), Saturn debilitated (-2), bonus 2, out of 9
    const auto chart = make_chart({{Body::Sun, 10.0}, {Body::Moon, 105.0}, {Body::Saturn, 5.0}}, 101.0);
    CHECK(ChartSummarizer::overall_strength_percent(chart) == doctest::Approx(500.0 / 9.0).epsilon(kTol));
}

TEST_CASE("Without houses there is no bonus")
{
    const auto chart = make_chart({{Body::Sun, 10.0}}, std::nullopt);
    CHECK(ChartSummarizer::overall_strength_percent(chart) == doctest::Approx(100.0).epsilon(kTol));

    const auto empty = make_chart({}, std::nullopt);
    CHECK(ChartSummarizer::overall_strength_percent(empty) == doctest::Approx(0.0).epsilon(kTol));
}

// =================================================================
// Summary
// =================================================================

TEST_CASE("Summary of a small chart")
{
    const auto chart = make_chart({{Body::Sun, 10.0}, {Body::Moon, 105.0}, {Body::Saturn, 5.0}}, 101.0);
    const ChartSummary summary = ChartSummarizer::summarize(chart);

    REQUIRE(summary.ascendant.has_value());
    CHECK(summary.ascendant->sign == Sign::Cancer);
    CHECK(summary.ascendant->degrees_in_sign == doctest::Approx(11.0).epsilon(kTol));
    CHECK(summary.ascendant->nakshatra == 7);
    CHECK(summary.ascendant->pada == 3);

    REQUIRE(summary.strongest_bodies.size() == 2);
    CHECK(summary.strongest_bodies[0].body == Body::Sun);
    CHECK(summary.strongest_bodies[0].dignity == chart::Dignity::ExaltedExact);
    CHECK(summary.strongest_bodies[1].body == Body::Moon);
    CHECK(summary.strongest_bodies[1].dignity == chart::Dignity::OwnSign);

    CHECK(summary.strongest_houses.size() == 3);
    REQUIRE(summary.dhana_yoga.has_value());
    CHECK(summary.dhana_yoga->second_lord == Body::Sun);
    CHECK(summary.total_conjunctions == 1);

    CHECK(summary.overall_percent == doctest::Approx(500.0 / 9.0).epsilon(kTol));
    CHECK(summary.overall == StrengthCategory::Moderate);
}

TEST_CASE("Summary without an ascendant keeps body-level results")
{
    const auto chart = make_chart({{Body::Sun, 10.0}}, std::nullopt);
    const ChartSummary summary = ChartSummarizer::summarize(chart);

    CHECK_FALSE(summary.ascendant.has_value());
    CHECK_FALSE(summary.points.has_value());
    CHECK(summary.strongest_houses.empty());
    CHECK(summary.raj_yogas.empty());
    CHECK_FALSE(summary.dhana_yoga.has_value());
    CHECK(summary.strongest_bodies.size() == 1);
    CHECK(summary.overall == StrengthCategory::VeryStrong);
}

int main(int argc, char** argv)
{
    jyotish::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    jyotish::core::Logger::shutdown();
    return result;
}
