/// @file test_angles.cpp
/// @brief Unit tests for jyotish::astro::Angles.
///
/// Verifies normalization, shortest-arc distance, sign split and
/// degree-minute-second conversion.

#define DOCTEST_CONFIG_IMPLEMENT_WITH_MAIN
#include <doctest/doctest.h>

#include "astro/angles.hpp"
#include "core/types.hpp"

#include <array>
#include <cmath>

using namespace jyotish;
using namespace jyotish::astro;

static constexpr f64 kTol = 1e-9;

// =================================================================
// Normalization
// =================================================================

TEST_CASE("normalize_degrees maps every value into [0, 360)")
{
    constexpr std::array<f64, 9> inputs{-720.5, -360.0, -0.25, 0.0, 45.0, 359.999, 360.0, 725.0, 1e6};

    for (const f64 input : inputs)
    {
        const f64 n = Angles::normalize_degrees(input);
        CHECK(n >= 0.0);
        CHECK(n < 360.0);
    }

    CHECK(Angles::normalize_degrees(-30.0) == doctest::Approx(330.0).epsilon(kTol));
    CHECK(Angles::normalize_degrees(360.0) == doctest::Approx(0.0).epsilon(kTol));
    CHECK(Angles::normalize_degrees(725.0) == doctest::Approx(5.0).epsilon(kTol));
}

TEST_CASE("Sign index and degrees in sign recompose the longitude")
{
    for (f64 lon = -400.0; lon < 800.0; lon += 7.3)
    {
        const f64 recomposed = Angles::sign_index(lon) * 30.0 + Angles::degrees_in_sign(lon);
        CHECK(recomposed == doctest::Approx(Angles::normalize_degrees(lon)).epsilon(1e-9));
    }
}

TEST_CASE("95 degrees lies 5 degrees into Cancer")
{
    CHECK(Angles::sign_index(95.0) == 3);
    CHECK(Angles::degrees_in_sign(95.0) == doctest::Approx(5.0).epsilon(kTol));
}

// =================================================================
// Angular distance
// =================================================================

TEST_CASE("angular_distance is symmetric and bounded by 180")
{
    for (f64 a = 0.0; a < 360.0; a += 23.7)
    {
        for (f64 b = -180.0; b < 540.0; b += 41.3)
        {
            const f64 ab = Angles::angular_distance(a, b);
            CHECK(ab == doctest::Approx(Angles::angular_distance(b, a)).epsilon(kTol));
            CHECK(ab >= 0.0);
            CHECK(ab <= 180.0);
        }
    }
}

TEST_CASE("Distance across the 0/360 seam takes the short way")
{
    CHECK(Angles::angular_distance(355.0, 5.0) == doctest::Approx(10.0).epsilon(kTol));
    CHECK(Angles::angular_distance(0.0, 180.0) == doctest::Approx(180.0).epsilon(kTol));
}

TEST_CASE("Forward-only distance counts in the zodiacal direction")
{
    CHECK(Angles::forward_distance(350.0, 10.0) == doctest::Approx(20.0).epsilon(kTol));
    CHECK(Angles::forward_distance(10.0, 350.0) == doctest::Approx(340.0).epsilon(kTol));
    CHECK(Angles::angular_distance(10.0, 350.0, true) == doctest::Approx(340.0).epsilon(kTol));
}

// =================================================================
// Degrees-minutes-seconds
// =================================================================

TEST_CASE("to_dms splits a positive angle")
{
    const Dms dms = Angles::to_dms(12.5825);

    CHECK(dms.degrees == 12);
    CHECK(dms.minutes == 34);
    CHECK(dms.seconds == doctest::Approx(57.0).epsilon(1e-6));
    CHECK_FALSE(dms.negative);
}

TEST_CASE("from_dms inverts to_dms, including negative angles")
{
    CHECK(Angles::from_dms(12, 34, 57.0) == doctest::Approx(12.5825).epsilon(1e-9));
    CHECK(Angles::from_dms(0, 30, 0.0, true) == doctest::Approx(-0.5).epsilon(1e-9));

    const Dms neg = Angles::to_dms(-0.5);
    CHECK(neg.negative);
    CHECK(neg.degrees == 0);
    CHECK(neg.minutes == 30);
}

TEST_CASE("format_dms renders degrees, minutes and seconds")
{
    CHECK(Angles::format_dms(12.5825) == "12°34'57\"");
}
