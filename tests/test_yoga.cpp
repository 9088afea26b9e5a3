/// @file test_yoga.cpp
/// @brief Unit tests for house yoga detection.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "analysis/yoga.hpp"
#include "chart_fixtures.hpp"
#include "core/logger.hpp"

using namespace jyotish;
using namespace jyotish::analysis;
using fixtures::make_chart;

static constexpr f64 kTol = 1e-9;

// Ascendant 100° throughout: 1st Cancer, 2nd Leo, 5th Scorpio,
// 9th Pisces, 10th Aries, 11th Taurus.
static constexpr f64 kAscendant = 100.0;

// =================================================================
// Kendra-trikona
// =================================================================

TEST_CASE("Lords linking kendras and trikonas form raj yogas")
{
    // Moon (1st lord) in Scorpio, the 5th; Mars (10th lord) in Pisces, the 9th
    const auto chart = make_chart({{Body::Moon, 225.0}, {Body::Mars, 345.0}}, kAscendant);
    const YogaDetector yogas(chart);

    const auto first = yogas.kendra_trikona(1);
    REQUIRE(first.has_value());
    CHECK(first->lord == Body::Moon);
    CHECK(first->from_house == 1);
    CHECK(first->to_house == 5);

    // Mars also rules the 5th, but the 9th is no kendra
    CHECK_FALSE(yogas.kendra_trikona(5).has_value());

    const auto raj = yogas.raj_yogas();
    REQUIRE(raj.size() == 2);
    CHECK(raj[0].from_house == 1);
    CHECK(raj[1].lord == Body::Mars);
    CHECK(raj[1].from_house == 10);
    CHECK(raj[1].to_house == 9);
}

TEST_CASE("Absent lords produce no kendra-trikona yoga")
{
    const auto chart = make_chart({{Body::Sun, 10.0}}, kAscendant);
    CHECK_FALSE(YogaDetector(chart).kendra_trikona(9).has_value());
}

// =================================================================
// Parivartana
// =================================================================

TEST_CASE("Sun and Moon exchanging Leo and Cancer")
{
    const auto chart = make_chart({{Body::Sun, 110.0}, {Body::Moon, 140.0}}, kAscendant);
    const YogaDetector yogas(chart);

    const auto first = yogas.parivartana(1);
    REQUIRE(first.has_value());
    CHECK(first->second_house == 2);
    CHECK(first->first_lord == Body::Moon);
    CHECK(first->second_lord == Body::Sun);

    const auto second = yogas.parivartana(2);
    REQUIRE(second.has_value());
    CHECK(second->second_house == 1);
}

TEST_CASE("A lord in its own house is not an exchange")
{
    const auto chart = make_chart({{Body::Moon, 110.0}}, kAscendant);
    CHECK_FALSE(YogaDetector(chart).parivartana(1).has_value());
}

TEST_CASE("A lord ruling both houses never exchanges with itself")
{
    // Mars rules the 5th and 10th and sits in the 5th
    const auto chart = make_chart({{Body::Mars, 225.0}}, kAscendant);
    const YogaDetector yogas(chart);
    CHECK_FALSE(yogas.parivartana(5).has_value());
    CHECK_FALSE(yogas.parivartana(10).has_value());
}

// =================================================================
// Conjunctions
// =================================================================

TEST_CASE("Only conjunctions inside the house count")
{
    // Sun and Mercury 3° apart in the 1st; Venus in the 1st but far;
    // Mars in the 2nd, close to Venus across the cusp
    const auto chart = make_chart(
        {{Body::Sun, 110.0}, {Body::Mercury, 113.0}, {Body::Venus, 128.0}, {Body::Mars, 131.0}}, kAscendant);
    const YogaDetector yogas(chart);

    const auto first = yogas.conjunctions(1);
    REQUIRE(first.size() == 1);
    CHECK(first[0].house == 1);
    CHECK(first[0].first == Body::Sun);
    CHECK(first[0].second == Body::Mercury);
    CHECK(first[0].separation == doctest::Approx(3.0).epsilon(kTol));
    CHECK(first[0].closeness == aspect::Closeness::Close);

    CHECK(yogas.conjunctions(2).empty());
}

// =================================================================
// Aggregates
// =================================================================

TEST_CASE("House yogas bundle the three rules")
{
    const auto chart = make_chart({{Body::Sun, 110.0}, {Body::Moon, 140.0}, {Body::Mercury, 113.0}}, kAscendant);
    const YogaDetector yogas(chart);

    const HouseYogas first = yogas.house_yogas(1);
    CHECK_FALSE(first.empty());
    CHECK(first.parivartana.has_value());
    CHECK(first.conjunctions.size() == 1);

    CHECK(yogas.house_yogas(3).empty());
}

TEST_CASE("Dhana yoga pairs the 2nd and 11th lords")
{
    const auto chart = make_chart({{Body::Sun, 110.0}}, kAscendant);
    const auto dhana = YogaDetector(chart).dhana_yoga();
    REQUIRE(dhana.has_value());
    CHECK(dhana->second_lord == Body::Sun);
    CHECK(dhana->eleventh_lord == Body::Venus);

    const auto unhoused = make_chart({{Body::Sun, 110.0}}, std::nullopt);
    CHECK_FALSE(YogaDetector(unhoused).dhana_yoga().has_value());
}

int main(int argc, char** argv)
{
    jyotish::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    jyotish::core::Logger::shutdown();
    return result;
}
