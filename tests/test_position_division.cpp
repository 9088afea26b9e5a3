/// @file test_position_division.cpp
/// @brief Unit tests for position derivation and divisional charts.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "chart/division.hpp"
#include "chart/position.hpp"
#include "core/types.hpp"

#include <stdexcept>

using namespace jyotish;
using namespace jyotish::chart;
using zodiac::Body;
using zodiac::Sign;

static constexpr f64 kTol = 1e-9;

// =================================================================
// PositionDeriver
// =================================================================

TEST_CASE("Derived fields for a body at 95°")
{
    const BodyPosition pos = PositionDeriver::derive(Body::Moon, 95.0, 1.5, 13.2);

    CHECK(pos.longitude == doctest::Approx(95.0).epsilon(kTol));
    CHECK(pos.sign == Sign::Cancer);
    CHECK(pos.degrees_in_sign == doctest::Approx(5.0).epsilon(kTol));
    CHECK(pos.nakshatra == 7);  // Pushya, 93°20' .. 106°40'
    CHECK(pos.pada == 1);
    CHECK(pos.nakshatra_lord == Body::Saturn);
    CHECK(pos.degrees_in_nakshatra == doctest::Approx(95.0 - 7.0 * 40.0 / 3.0).epsilon(kTol));
    CHECK(pos.degrees_in_pada == doctest::Approx(95.0 - 7.0 * 40.0 / 3.0).epsilon(kTol));
    CHECK_FALSE(pos.is_retrograde());
    CHECK_FALSE(pos.tropical_longitude.has_value());
}

TEST_CASE("Longitudes outside [0, 360) are normalized, never rejected")
{
    const BodyPosition neg = PositionDeriver::derive(Body::Sun, -10.0, 0.0, 1.0);
    CHECK(neg.longitude == doctest::Approx(350.0).epsilon(kTol));
    CHECK(neg.sign == Sign::Pisces);

    const BodyPosition wrapped = PositionDeriver::derive(Body::Sun, 725.0, 0.0, 1.0);
    CHECK(wrapped.longitude == doctest::Approx(5.0).epsilon(kTol));
    CHECK(wrapped.sign == Sign::Aries);
}

TEST_CASE("Negative speed marks retrograde motion")
{
    CHECK(PositionDeriver::derive(Body::Saturn, 200.0, 0.0, -0.05).is_retrograde());
    CHECK_FALSE(PositionDeriver::derive(Body::Saturn, 200.0, 0.0, 0.0).is_retrograde());
}

TEST_CASE("Tropical longitude is kept when supplied")
{
    const BodyPosition pos = PositionDeriver::derive(Body::Sun, 256.5, 0.0, 1.0, 280.35);
    REQUIRE(pos.tropical_longitude.has_value());
    CHECK(*pos.tropical_longitude == doctest::Approx(280.35).epsilon(kTol));
}

// =================================================================
// Divisions
// =================================================================

TEST_CASE("D1 is the rasi itself")
{
    CHECK(Divisions::sign(95.0, Division::D1) == Sign::Cancer);
}

TEST_CASE("D2 hora halves alternate between Cancer and Leo")
{
    // Aries (even index): Cancer then Leo
    CHECK(Divisions::sign(5.0, Division::D2) == Sign::Cancer);
    CHECK(Divisions::sign(20.0, Division::D2) == Sign::Leo);
    // Taurus (odd index): Leo then Cancer
    CHECK(Divisions::sign(35.0, Division::D2) == Sign::Leo);
    CHECK(Divisions::sign(50.0, Division::D2) == Sign::Cancer);
}

TEST_CASE("D3 drekkana walks the element's triplicity")
{
    // Aries: Aries, Leo, Sagittarius
    CHECK(Divisions::sign(5.0, Division::D3) == Sign::Aries);
    CHECK(Divisions::sign(15.0, Division::D3) == Sign::Leo);
    CHECK(Divisions::sign(25.0, Division::D3) == Sign::Sagittarius);
    // Virgo (earth): Taurus, Virgo, Capricorn
    CHECK(Divisions::sign(155.0, Division::D3) == Sign::Capricorn);
}

TEST_CASE("D9 navamsa starts from the movable sign of the element")
{
    CHECK(Divisions::sign(0.0, Division::D9) == Sign::Aries);
    CHECK(Divisions::sign(29.9, Division::D9) == Sign::Sagittarius);
    // Taurus starts at Capricorn
    CHECK(Divisions::sign(30.5, Division::D9) == Sign::Capricorn);
    // Gemini starts at Libra
    CHECK(Divisions::sign(60.5, Division::D9) == Sign::Libra);
    // Cancer starts at Cancer
    CHECK(Divisions::sign(90.5, Division::D9) == Sign::Cancer);
}

TEST_CASE("D10 dasamsa counts from the sign or its ninth")
{
    CHECK(Divisions::sign(1.0, Division::D10) == Sign::Aries);
    CHECK(Divisions::sign(29.0, Division::D10) == Sign::Capricorn);
    // Taurus (odd index) starts from its 9th: Capricorn
    CHECK(Divisions::sign(31.0, Division::D10) == Sign::Capricorn);
}

TEST_CASE("D12 dwadasamsa counts from the sign itself")
{
    CHECK(Divisions::sign(1.0, Division::D12) == Sign::Aries);
    CHECK(Divisions::sign(29.0, Division::D12) == Sign::Pisces);
    CHECK(Divisions::sign(33.0, Division::D12) == Sign::Gemini);
}

TEST_CASE("all() lists every division in order")
{
    const auto all = Divisions::all(95.0);
    REQUIRE(all.size() == kAllDivisions.size());
    for (std::size_t i = 0; i < all.size(); ++i)
    {
        CHECK(all[i].first == kAllDivisions[i]);
        CHECK(all[i].second == Divisions::sign(95.0, kAllDivisions[i]));
    }
}

TEST_CASE("Division names round-trip and reject unknown charts")
{
    CHECK(Divisions::from_name("d9") == Division::D9);
    CHECK(Divisions::name(Division::D10) == "D10");
    CHECK(Divisions::parts(Division::D12) == 12);
    CHECK_THROWS_AS((void)Divisions::from_name("D60"), std::invalid_argument);
}
