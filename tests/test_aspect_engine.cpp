/// @file test_aspect_engine.cpp
/// @brief Unit tests for effective angles, orb classification and chart aspects.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "aspect/aspect_engine.hpp"
#include "chart_fixtures.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <stdexcept>
#include <vector>

using namespace jyotish;
using namespace jyotish::aspect;
using fixtures::degree_config;
using fixtures::make_chart;

static constexpr f64 kTol = 1e-9;

namespace
{
    bool contains(const std::vector<f64>& angles, f64 angle)
    {
        return std::find(angles.begin(), angles.end(), angle) != angles.end();
    }
}

// =================================================================
// Effective angles
// =================================================================

TEST_CASE("Mars swaps its special aspects when retrograde")
{
    CHECK(AspectEngine::effective_angles(Body::Mars, Sign::Aries, false) == std::vector<f64>{90.0, 180.0, 210.0});
    CHECK(AspectEngine::effective_angles(Body::Mars, Sign::Aries, true) == std::vector<f64>{270.0, 180.0, 150.0});
}

TEST_CASE("Saturn swaps its special aspects when retrograde")
{
    CHECK(AspectEngine::effective_angles(Body::Saturn, Sign::Libra, false) == std::vector<f64>{60.0, 180.0, 270.0});
    CHECK(AspectEngine::effective_angles(Body::Saturn, Sign::Libra, true) == std::vector<f64>{300.0, 180.0, 90.0});
}

TEST_CASE("The 7th-house aspect survives retrogression for every body")
{
    for (const Body body : zodiac::kAllBodies)
    {
        if (body == Body::Rahu || body == Body::Ketu)
        {
            continue;
        }
        CHECK(contains(AspectEngine::effective_angles(body, Sign::Cancer, true), 180.0));
        CHECK(contains(AspectEngine::effective_angles(body, Sign::Cancer, false), 180.0));
    }
}

TEST_CASE("Node extra aspect depends on sign parity")
{
    CHECK(AspectEngine::effective_angles(Body::Rahu, Sign::Taurus, true) == std::vector<f64>{120.0, 240.0, 30.0});
    CHECK(AspectEngine::effective_angles(Body::Rahu, Sign::Aries, true) == std::vector<f64>{120.0, 240.0, 330.0});
    CHECK(AspectEngine::effective_angles(Body::Ketu, Sign::Scorpio, false) == std::vector<f64>{120.0, 240.0, 30.0});
}

TEST_CASE("Luminaries and benefics cast only the 7th")
{
    CHECK(AspectEngine::effective_angles(Body::Sun, Sign::Leo, false) == std::vector<f64>{180.0});
    CHECK(AspectEngine::effective_angles(Body::Venus, Sign::Leo, true) == std::vector<f64>{180.0});
    CHECK(AspectEngine::effective_angles(Body::Jupiter, Sign::Leo, false) == std::vector<f64>{120.0, 180.0, 240.0});
}

// =================================================================
// Orb classification
// =================================================================

TEST_CASE("Orb boundaries are inclusive on the tighter category")
{
    CHECK(AspectEngine::classify_orb(1.0) == OrbCategory::Exact);
    CHECK(AspectEngine::classify_orb(3.0) == OrbCategory::Close);
    CHECK(orb_strength(AspectEngine::classify_orb(3.0)) == doctest::Approx(0.75).epsilon(kTol));
    CHECK(AspectEngine::classify_orb(3.01) == OrbCategory::Wide);
    CHECK(orb_strength(AspectEngine::classify_orb(3.01)) == doctest::Approx(0.5).epsilon(kTol));
    CHECK(AspectEngine::classify_orb(8.0) == OrbCategory::VeryWide);
    CHECK(AspectEngine::classify_orb(8.01) == OrbCategory::None);
    CHECK(orb_strength(OrbCategory::None) == doctest::Approx(0.0).epsilon(kTol));
}

TEST_CASE("Strength never increases as the orb widens")
{
    f64 previous = 1.0;
    for (f64 orb = 0.0; orb <= 12.0; orb += 0.25)
    {
        const f64 strength = orb_strength(AspectEngine::classify_orb(orb));
        CHECK(strength <= previous);
        previous = strength;
    }
}

TEST_CASE("Custom thresholds are honoured")
{
    const OrbThresholds tight{.exact = 0.5, .close = 1.0, .wide = 2.0, .very_wide = 3.0};
    CHECK(AspectEngine::classify_orb(1.5, tight) == OrbCategory::Wide);
    CHECK(AspectEngine::classify_orb(3.5, tight) == OrbCategory::None);
}

TEST_CASE("Closeness bands for conjunctions")
{
    CHECK(AspectEngine::closeness_of(1.0) == Closeness::VeryClose);
    CHECK(AspectEngine::closeness_of(3.0) == Closeness::Close);
    CHECK(AspectEngine::closeness_of(5.0) == Closeness::Moderate);
    CHECK(AspectEngine::closeness_of(7.0) == Closeness::Wide);
    CHECK(AspectEngine::closeness_name(Closeness::VeryClose) == "Very Close");
}

// =================================================================
// Degree mode
// =================================================================

TEST_CASE("Mars' 4th-house aspect lands exactly on Jupiter")
{
    const auto chart = make_chart({{Body::Mars, 10.0}, {Body::Jupiter, 100.0}}, std::nullopt, degree_config());
    const AspectEngine engine(chart);

    const auto forward = engine.to_body(Body::Mars, Body::Jupiter);
    REQUIRE(forward.has_value());
    REQUIRE(forward->has_aspect());
    CHECK(*forward->angle == doctest::Approx(90.0).epsilon(kTol));
    CHECK(forward->category == OrbCategory::Exact);
    CHECK(forward->strength == doctest::Approx(1.0).epsilon(kTol));
    CHECK(forward->distance == doctest::Approx(90.0).epsilon(kTol));
    CHECK(forward->hits.size() == 1);

    const auto backward = engine.to_body(Body::Jupiter, Body::Mars);
    REQUIRE(backward.has_value());
    CHECK_FALSE(backward->has_aspect());
}

TEST_CASE("Orbs of 3.0 and 3.01 degrees through the engine")
{
    const auto close = make_chart({{Body::Sun, 10.0}, {Body::Moon, 193.0}}, std::nullopt, degree_config());
    const auto close_result = AspectEngine(close).to_body(Body::Sun, Body::Moon);
    REQUIRE(close_result.has_value());
    CHECK(close_result->category == OrbCategory::Close);
    CHECK(close_result->strength == doctest::Approx(0.75).epsilon(kTol));

    const auto wide = make_chart({{Body::Sun, 10.0}, {Body::Moon, 193.01}}, std::nullopt, degree_config());
    const auto wide_result = AspectEngine(wide).to_body(Body::Sun, Body::Moon);
    REQUIRE(wide_result.has_value());
    CHECK(wide_result->category == OrbCategory::Wide);
    CHECK(wide_result->strength == doctest::Approx(0.5).epsilon(kTol));
}

TEST_CASE("A body never aspects itself and missing bodies yield nothing")
{
    const auto chart = make_chart({{Body::Sun, 10.0}}, std::nullopt, degree_config());
    const AspectEngine engine(chart);

    const auto self = engine.to_body(Body::Sun, Body::Sun);
    REQUIRE(self.has_value());
    CHECK_FALSE(self->has_aspect());
    CHECK_FALSE(engine.to_body(Body::Sun, Body::Mars).has_value());
    CHECK_FALSE(engine.to_body(Body::Mars, Body::Sun).has_value());
}

TEST_CASE("House and point targets")
{
    const auto chart = make_chart({{Body::Sun, 100.0}}, 100.0, degree_config());
    const AspectEngine engine(chart);

    const auto house = engine.to_house(Body::Sun, 7);
    REQUIRE(house.has_value());
    CHECK(house->target.kind == TargetKind::House);
    CHECK(house->target.house == 7);
    CHECK(house->category == OrbCategory::Exact);

    const auto point = engine.to_point(Body::Sun, 641.0);  // 281°
    REQUIRE(point.has_value());
    CHECK(point->target.longitude == doctest::Approx(281.0).epsilon(kTol));
    CHECK(point->category == OrbCategory::Exact);

    CHECK(engine.aspects_to_house(7).size() == 1);
    CHECK(engine.aspects_to_house(4).empty());
    CHECK_THROWS_AS((void)engine.aspects_to_house(13), std::out_of_range);
}

TEST_CASE("Houses are unavailable without an ascendant")
{
    const auto chart = make_chart({{Body::Sun, 100.0}}, std::nullopt, degree_config());
    CHECK_FALSE(AspectEngine(chart).to_house(Body::Sun, 7).has_value());
}

// =================================================================
// Rasi mode
// =================================================================

TEST_CASE("Rasi mode aspects the whole sign at full strength")
{
    const auto chart = make_chart({{Body::Sun, 10.0}, {Body::Moon, 200.0}, {Body::Venus, 125.0}, {Body::Jupiter, 5.0}},
                                  std::nullopt);
    const AspectEngine engine(chart);
    REQUIRE(engine.mode() == AspectMode::Rasi);

    const auto sun_moon = engine.to_body(Body::Sun, Body::Moon);
    REQUIRE(sun_moon.has_value());
    CHECK(sun_moon->has_aspect());
    CHECK(sun_moon->category == OrbCategory::Exact);
    CHECK(sun_moon->strength == doctest::Approx(1.0).epsilon(kTol));

    const auto jupiter_venus = engine.to_body(Body::Jupiter, Body::Venus);
    REQUIRE(jupiter_venus.has_value());
    REQUIRE(jupiter_venus->has_aspect());
    CHECK(*jupiter_venus->angle == doctest::Approx(120.0).epsilon(kTol));

    // Same placement in degree mode is 10° off
    const AspectEngine degree(chart, AspectMode::Degree);
    CHECK_FALSE(degree.to_body(Body::Sun, Body::Moon)->has_aspect());
}

TEST_CASE("Aspected signs follow the effective angles")
{
    const auto chart = make_chart({{Body::Mars, 5.0, -0.2}}, std::nullopt);
    const auto& mars = chart.position(Body::Mars);
    REQUIRE(mars.has_value());
    CHECK(AspectEngine::aspected_signs(*mars) == std::vector<Sign>{Sign::Capricorn, Sign::Libra, Sign::Virgo});
}

// =================================================================
// Conjunctions, mutual aspects, patterns
// =================================================================

TEST_CASE("Conjunctions within the configured orb")
{
    const auto chart = make_chart({{Body::Sun, 10.0}, {Body::Mercury, 12.0}, {Body::Venus, 25.0}}, std::nullopt);
    const auto conjunctions = AspectEngine(chart).conjunctions();

    REQUIRE(conjunctions.size() == 1);
    CHECK(conjunctions[0].first == Body::Sun);
    CHECK(conjunctions[0].second == Body::Mercury);
    CHECK(conjunctions[0].separation == doctest::Approx(2.0).epsilon(kTol));
    CHECK(conjunctions[0].closeness == Closeness::Close);
}

TEST_CASE("Conjunctions wrap across 0° Aries")
{
    const auto chart = make_chart({{Body::Moon, 358.0}, {Body::Mars, 3.0}}, std::nullopt);
    const auto conjunctions = AspectEngine(chart).conjunctions();
    REQUIRE(conjunctions.size() == 1);
    CHECK(conjunctions[0].separation == doctest::Approx(5.0).epsilon(kTol));
}

TEST_CASE("Opposed luminaries aspect each other")
{
    const auto chart = make_chart({{Body::Sun, 10.0}, {Body::Moon, 190.0}}, std::nullopt, degree_config());
    const AspectEngine engine(chart);

    const auto mutual = engine.mutual_aspects();
    REQUIRE(mutual.size() == 1);
    CHECK(mutual[0].first == Body::Sun);
    CHECK(mutual[0].second == Body::Moon);
    CHECK(mutual[0].combined_strength == doctest::Approx(2.0).epsilon(kTol));

    const AspectPatterns patterns = engine.patterns();
    CHECK(patterns.total_aspects == 2);
    CHECK(patterns.average_strength == doctest::Approx(1.0).epsilon(kTol));
    CHECK(patterns.exact.size() == 2);
    CHECK(patterns.strong.size() == 2);
    CHECK(patterns.weak.empty());
    CHECK(patterns.by_angle.at(180) == 2);
    CHECK(patterns.most_aspecting == Body::Sun);
    CHECK(patterns.most_aspected == Body::Sun);
    CHECK(patterns.conjunctions.empty());

    CHECK(engine.aspects_from(Body::Sun).size() == 1);
    CHECK(engine.aspects_to(Body::Sun).size() == 1);
}

TEST_CASE("Matrix leaves missing bodies empty")
{
    const auto chart = make_chart({{Body::Sun, 10.0}, {Body::Moon, 190.0}}, 0.0, degree_config());
    const AspectMatrix matrix = AspectEngine(chart).matrix();

    CHECK(matrix.mode == AspectMode::Degree);
    CHECK(matrix.bodies[zodiac::index_of(Body::Sun)][zodiac::index_of(Body::Moon)].has_value());
    CHECK_FALSE(matrix.bodies[zodiac::index_of(Body::Sun)][zodiac::index_of(Body::Mars)].has_value());
    CHECK(matrix.houses[zodiac::index_of(Body::Sun)][6].has_value());
}

TEST_CASE("Empty chart has no patterns")
{
    const auto chart = make_chart({}, std::nullopt);
    const AspectPatterns patterns = AspectEngine(chart).patterns();
    CHECK(patterns.total_aspects == 0);
    CHECK_FALSE(patterns.most_aspecting.has_value());
}

int main(int argc, char** argv)
{
    jyotish::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    jyotish::core::Logger::shutdown();
    return result;
}
