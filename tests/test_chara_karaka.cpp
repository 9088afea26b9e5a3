/// @file test_chara_karaka.cpp
/// @brief Unit tests for chara karaka ranking.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "analysis/chara_karaka.hpp"
#include "chart_fixtures.hpp"
#include "core/logger.hpp"

#include <vector>

using namespace jyotish;
using namespace jyotish::analysis;
using fixtures::make_chart;

static constexpr f64 kTol = 1e-9;

namespace
{
    // Degrees in sign: Sun 25, Moon 10, Mars 7, Mercury 28, Jupiter 2,
    // Venus 15, Saturn 13, Rahu 5 (counted as 25)
    chart::ChartContext sample_chart()
    {
        return make_chart({
            {Body::Sun, 25.0},
            {Body::Moon, 40.0},
            {Body::Mars, 67.0},
            {Body::Mercury, 118.0},
            {Body::Jupiter, 152.0},
            {Body::Venus, 195.0},
            {Body::Saturn, 283.0},
            {Body::Rahu, 305.0, -0.053},
        }, std::nullopt);
    }

    std::vector<Body> bodies_of(const std::vector<KarakaAssignment>& assignments)
    {
        std::vector<Body> result;
        for (const auto& a : assignments)
        {
            result.push_back(a.body);
        }
        return result;
    }
}

// =================================================================
// Standard method
// =================================================================

TEST_CASE("Standard ranking by degrees in sign")
{
    const auto chart = sample_chart();
    const auto karakas = CharaKaraka::standard(chart);

    REQUIRE(karakas.size() == kKarakaCount);
    CHECK(bodies_of(karakas) == std::vector<Body>{
        Body::Mercury, Body::Sun, Body::Rahu, Body::Venus,
        Body::Saturn, Body::Moon, Body::Mars, Body::Jupiter,
    });
    CHECK(karakas[0].karaka == Karaka::Atma);
    CHECK(karakas[0].degrees == doctest::Approx(28.0).epsilon(kTol));
    CHECK(karakas[7].karaka == Karaka::Dara);
    CHECK(karakas[0].method == KarakaMethod::Standard);
}

TEST_CASE("Rahu counts its degrees backwards")
{
    const auto karakas = CharaKaraka::standard(sample_chart());
    CHECK(karakas[2].body == Body::Rahu);
    CHECK(karakas[2].degrees == doctest::Approx(25.0).epsilon(kTol));
}

TEST_CASE("Ketu never takes a karaka")
{
    const auto chart = sample_chart();
    REQUIRE(chart.position(Body::Ketu).has_value());
    for (const auto& k : CharaKaraka::standard(chart))
    {
        CHECK(k.body != Body::Ketu);
    }
}

TEST_CASE("Incomplete charts assign fewer karakas")
{
    const auto chart = make_chart({{Body::Sun, 5.0}, {Body::Moon, 50.0}}, std::nullopt);
    const auto karakas = CharaKaraka::standard(chart);
    REQUIRE(karakas.size() == 2);
    CHECK(karakas[0].body == Body::Moon);
    CHECK(karakas[1].karaka == Karaka::Amatya);
}

// =================================================================
// Advanced method
// =================================================================

TEST_CASE("Travel within the sign")
{
    // Direct: current - entry
    CHECK(CharaKaraka::travelled(13.0, SignTravel{.entry_point = 0.0, .max_forward = 10.0})
          == doctest::Approx(13.0).epsilon(kTol));
    // Retrograded: out to the maximum and back
    CHECK(CharaKaraka::travelled(7.0, SignTravel{.entry_point = 2.0, .max_forward = 12.0})
          == doctest::Approx(15.0).epsilon(kTol));
}

TEST_CASE("Advanced ranking uses travel for the tracked bodies only")
{
    TravelTable travel{};
    travel[zodiac::index_of(Body::Mars)]   = SignTravel{.entry_point = 2.0, .max_forward = 12.0};
    travel[zodiac::index_of(Body::Saturn)] = SignTravel{.entry_point = 0.0, .max_forward = 10.0};
    // Ignored: luminaries and nodes keep the standard measure
    travel[zodiac::index_of(Body::Sun)]    = SignTravel{.entry_point = 0.0, .max_forward = 29.0};

    const auto karakas = CharaKaraka::advanced(sample_chart(), travel);

    REQUIRE(karakas.size() == kKarakaCount);
    CHECK(bodies_of(karakas) == std::vector<Body>{
        Body::Mercury, Body::Sun, Body::Rahu, Body::Mars,
        Body::Venus, Body::Saturn, Body::Moon, Body::Jupiter,
    });
    CHECK(karakas[1].degrees == doctest::Approx(25.0).epsilon(kTol));
    CHECK(karakas[3].degrees == doctest::Approx(15.0).epsilon(kTol));
    CHECK(karakas[0].method == KarakaMethod::Advanced);
}

TEST_CASE("Karaka names")
{
    CHECK(CharaKaraka::abbreviation(Karaka::Atma) == "AK");
    CHECK(CharaKaraka::abbreviation(Karaka::Dara) == "DK");
    CHECK(CharaKaraka::name(Karaka::Putra) == "Putra Karaka");
    CHECK(CharaKaraka::method_name(KarakaMethod::Advanced) == "advanced");
}

int main(int argc, char** argv)
{
    jyotish::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    jyotish::core::Logger::shutdown();
    return result;
}
