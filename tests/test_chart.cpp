/// @file test_chart.cpp
/// @brief Unit tests for the chart pipeline and ChartContext queries.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "chart/chart.hpp"
#include "chart_fixtures.hpp"
#include "core/logger.hpp"

#include <limits>
#include <stdexcept>
#include <vector>

using namespace jyotish;
using namespace jyotish::chart;
using fixtures::make_chart;
using zodiac::Sign;

static constexpr f64 kTol = 1e-9;
static constexpr f64 kLahiriJ2000 = 23.85;

// =================================================================
// Positions
// =================================================================

TEST_CASE("Tropical input is shifted by the ayanamsa at the instant")
{
    ChartRequest request;  // J2000.0 noon, Lahiri 23.85°
    request.set_position(Body::Sun, RawPosition{.longitude = 280.0, .latitude = 0.0, .speed = 1.02});
    request.ascendant = 30.0;

    const ChartContext chart = ChartBuilder::build(request);

    CHECK(chart.julian_day() == doctest::Approx(astro_constants::kJ2000).epsilon(kTol));
    CHECK(chart.ayanamsa() == doctest::Approx(kLahiriJ2000).epsilon(kTol));

    const auto& sun = chart.position(Body::Sun);
    REQUIRE(sun.has_value());
    CHECK(sun->longitude == doctest::Approx(280.0 - kLahiriJ2000).epsilon(kTol));
    CHECK(sun->sign == Sign::Sagittarius);
    REQUIRE(sun->tropical_longitude.has_value());
    CHECK(*sun->tropical_longitude == doctest::Approx(280.0).epsilon(kTol));

    REQUIRE(chart.ascendant().has_value());
    CHECK(*chart.ascendant() == doctest::Approx(30.0 - kLahiriJ2000).epsilon(kTol));
    CHECK_FALSE(chart.ascendant_from_fallback());
}

TEST_CASE("Ketu is mirrored from Rahu when absent")
{
    const ChartContext chart = make_chart({{Body::Rahu, 75.0, -0.053}}, 0.0);

    const auto& ketu = chart.position(Body::Ketu);
    REQUIRE(ketu.has_value());
    CHECK(ketu->longitude == doctest::Approx(255.0).epsilon(kTol));
    CHECK(ketu->sign == Sign::Sagittarius);
    CHECK(ketu->is_retrograde());
}

TEST_CASE("A supplied Ketu is kept as given")
{
    const ChartContext chart = make_chart({{Body::Rahu, 75.0, -0.053}, {Body::Ketu, 250.0, -0.053}}, 0.0);
    CHECK(chart.position(Body::Ketu)->longitude == doctest::Approx(250.0).epsilon(kTol));
}

TEST_CASE("Missing bodies leave the chart incomplete but usable")
{
    const ChartContext chart = make_chart({{Body::Sun, 10.0}, {Body::Moon, 40.0}}, 100.0);

    CHECK_FALSE(chart.is_complete());
    CHECK(chart.present_bodies() == std::vector<Body>{Body::Sun, Body::Moon});
    CHECK(chart.missing_bodies().size() == 7);
    CHECK_FALSE(chart.position(Body::Mars).has_value());
    CHECK_FALSE(chart.house_of(Body::Mars).has_value());
    CHECK_FALSE(chart.dignity_of(Body::Mars).has_value());
    CHECK(chart.dignity_of(Body::Sun) == Dignity::ExaltedExact);
}

TEST_CASE("Non-finite longitudes are discarded")
{
    const ChartContext chart = make_chart({{Body::Sun, std::numeric_limits<f64>::quiet_NaN()}}, 100.0);
    CHECK_FALSE(chart.position(Body::Sun).has_value());
}

// =================================================================
// Ascendant and houses
// =================================================================

TEST_CASE("No ascendant and no fallback means no houses")
{
    const ChartContext chart = make_chart({{Body::Sun, 10.0}}, std::nullopt);

    CHECK_FALSE(chart.ascendant().has_value());
    CHECK_FALSE(chart.houses().has_value());
    CHECK_FALSE(chart.house(1).has_value());
    CHECK_FALSE(chart.house_of(Body::Sun).has_value());
    CHECK_FALSE(chart.lord_of(1).has_value());
    CHECK(chart.occupants(1).empty());
    CHECK_FALSE(chart.in_sandhi(Body::Sun).has_value());
}

TEST_CASE("Fallback ascendant is computed and flagged")
{
    ChartRequest request;
    request.latitude = 51.4769;
    request.longitude = 0.0;
    request.set_position(Body::Sun, RawPosition{.longitude = 280.0, .latitude = 0.0, .speed = 1.0});

    const ChartContext chart = ChartBuilder::build(request);

    REQUIRE(chart.ascendant().has_value());
    CHECK(chart.ascendant_from_fallback());
    CHECK(*chart.ascendant() >= 0.0);
    CHECK(*chart.ascendant() < 360.0);
    CHECK(chart.houses().has_value());
}

TEST_CASE("House queries for ascendant 100°")
{
    const ChartContext chart = make_chart({{Body::Sun, 285.0}, {Body::Saturn, 290.0}, {Body::Moon, 101.0}}, 100.0);

    const auto seventh = chart.house(7);
    REQUIRE(seventh.has_value());
    CHECK(seventh->cusp == doctest::Approx(280.0).epsilon(kTol));
    CHECK(chart.house_of(Body::Sun) == 7);
    CHECK(chart.occupants(7) == std::vector<Body>{Body::Sun, Body::Saturn});
    CHECK(chart.lord_of(7) == Body::Saturn);
    CHECK(chart.lord_of(1) == Body::Moon);
    CHECK(chart.in_sandhi(Body::Moon) == true);
    CHECK(chart.in_sandhi(Body::Saturn) == false);
}

TEST_CASE("House numbers outside 1..12 throw")
{
    const ChartContext chart = make_chart({{Body::Sun, 10.0}}, 100.0);
    CHECK_THROWS_AS((void)chart.house(13), std::out_of_range);
    CHECK_THROWS_AS((void)chart.occupants(0), std::out_of_range);
    CHECK_THROWS_AS((void)chart.lord_of(-2), std::out_of_range);
}

TEST_CASE("Sandhi width comes from the config")
{
    config::ChartConfig config{};
    config.sandhi_width_deg = 0.5;
    const ChartContext chart = make_chart({{Body::Moon, 101.0}}, 100.0, config);
    CHECK(chart.in_sandhi(Body::Moon) == false);
}

int main(int argc, char** argv)
{
    jyotish::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    jyotish::core::Logger::shutdown();
    return result;
}
