/// @file main.cpp
/// @brief jyotish demo entry point.
///
/// Usage: jyotish_demo [positions.csv] [config.yaml]
/// Builds one chart from a fixed position table and logs the body table,
/// houses, house strengths, yogas, chart summary and any pipeline warnings.

#include "analysis/chara_karaka.hpp"
#include "analysis/chart_summary.hpp"
#include "analysis/house_strength.hpp"
#include "analysis/yoga.hpp"
#include "aspect/drishti.hpp"
#include "astro/angles.hpp"
#include "astro/ayanamsa.hpp"
#include "chart/chart.hpp"
#include "config/chart_config.hpp"
#include "core/logger.hpp"
#include "ephemeris/ephemeris_provider.hpp"
#include "ephemeris/ephemeris_table.hpp"
#include "zodiac/body.hpp"
#include "zodiac/nakshatra.hpp"
#include "zodiac/sign.hpp"

#include <cstdlib>
#include <filesystem>

using namespace jyotish;

namespace
{

void log_bodies(const chart::ChartContext& chart)
{
    JYO_INFO("{:<8} {:<12} {:>12} {:<18} {:>4} {:<14} {}",
             "Body", "Sign", "Degrees", "Nakshatra", "Pada", "Dignity", "House");
    for (const zodiac::Body body : chart.present_bodies())
    {
        const auto& pos = *chart.position(body);
        const auto house = chart.house_of(body);
        JYO_INFO("{:<8} {:<12} {:>12} {:<18} {:>4} {:<14} {}{}",
                 zodiac::body_name(body),
                 zodiac::sign_name(pos.sign),
                 astro::Angles::format_dms(pos.degrees_in_sign),
                 zodiac::nakshatra_info(pos.nakshatra).name,
                 pos.pada,
                 chart::dignity_name(*chart.dignity_of(body)),
                 house ? *house : 0,
                 pos.is_retrograde() ? " (R)" : "");
    }
}

void log_houses(const chart::ChartContext& chart)
{
    const analysis::HouseStrengthScorer scorer(chart);
    const analysis::YogaDetector yogas(chart);

    for (const auto& strength : scorer.all())
    {
        const auto house = *chart.house(strength.house);
        JYO_INFO("House {:>2} {:<12} cusp {:>7.2f}  lord {:<8} strength {:.3f} ({})",
                 strength.house,
                 zodiac::sign_name(house.sign),
                 house.cusp,
                 strength.lord ? zodiac::body_name(*strength.lord) : "-",
                 strength.total,
                 analysis::HouseStrengthScorer::category_name(strength.category));

        const auto found = yogas.house_yogas(strength.house);
        if (found.kendra_trikona)
        {
            JYO_INFO("    Kendra-trikona yoga: {} rules {} and sits in {}",
                     zodiac::body_name(found.kendra_trikona->lord),
                     found.kendra_trikona->from_house, found.kendra_trikona->to_house);
        }
        if (found.parivartana)
        {
            JYO_INFO("    Parivartana yoga: houses {} and {}",
                     found.parivartana->first_house, found.parivartana->second_house);
        }
        for (const auto& conj : found.conjunctions)
        {
            JYO_INFO("    Conjunction yoga: {}-{} ({:.2f} deg)",
                     zodiac::body_name(conj.first), zodiac::body_name(conj.second), conj.separation);
        }

        const auto report = aspect::Drishti::house_report(chart, strength.house);
        if (report && !report->aspects.empty())
        {
            JYO_INFO("    Aspects received: {} ({})", report->aspects.size(), report->overall);
        }
    }
}

void log_summary(const chart::ChartContext& chart)
{
    const analysis::ChartSummary summary = analysis::ChartSummarizer::summarize(chart);

    if (summary.points)
    {
        JYO_INFO("Midheaven {:.2f}", summary.points->midheaven);
        if (summary.points->part_of_fortune)
        {
            JYO_INFO("Part of Fortune {:.2f}", *summary.points->part_of_fortune);
        }
    }
    for (const auto& entry : summary.strongest_bodies)
    {
        JYO_INFO("Dignified: {} ({})", zodiac::body_name(entry.body), chart::dignity_name(entry.dignity));
    }
    JYO_INFO("Raj yogas: {}, dhana yoga: {}", summary.raj_yogas.size(),
             summary.dhana_yoga ? "potential" : "none");
    JYO_INFO("Aspects: {}, conjunctions: {}", summary.total_aspects, summary.total_conjunctions);
    JYO_INFO("Overall chart strength: {} ({:.1f}%)",
             analysis::HouseStrengthScorer::category_name(summary.overall), summary.overall_percent);

    for (const auto& karaka : analysis::CharaKaraka::standard(chart))
    {
        JYO_INFO("{:<4} {}", analysis::CharaKaraka::abbreviation(karaka.karaka), zodiac::body_name(karaka.body));
    }
}

} // anonymous namespace

int main(int argc, char** argv)
{
    core::Logger::init();
    JYO_INFO("jyotish demo starting...");

    const std::filesystem::path data_dir{JYO_DATA_DIR};
    const std::filesystem::path table_path = argc > 1 ? std::filesystem::path{argv[1]}
                                                      : data_dir / "ephemeris" / "j2000_greenwich.csv";

    config::ChartConfig config{};
    if (argc > 2)
    {
        const auto loaded = config::ConfigLoader::load_file(argv[2]);
        if (!loaded)
        {
            JYO_ERROR("Could not load config {}", argv[2]);
            core::Logger::shutdown();
            return EXIT_FAILURE;
        }
        config = *loaded;
        core::Logger::configure(config.logging);
    }

    const auto table = ephemeris::EphemerisTableLoader::load_csv(table_path);
    if (!table)
    {
        JYO_ERROR("Could not load position table {}", table_path.string());
        core::Logger::shutdown();
        return EXIT_FAILURE;
    }

    // Greenwich, J2000.0
    const astro::DateTime utc{2000, 1, 1, 12, 0, 0.0};
    const auto request = ephemeris::make_request(*table, utc, 51.4769, 0.0);
    const chart::ChartContext chart = chart::ChartBuilder::build(request, config);

    JYO_INFO("Ayanamsa ({}): {}", astro::Ayanamsa::name(config.ayanamsa),
             astro::Angles::format_dms(chart.ayanamsa()));
    if (chart.ascendant())
    {
        JYO_INFO("Ascendant: {} {}{}", zodiac::sign_name(zodiac::sign_of(*chart.ascendant())),
                 astro::Angles::format_dms(astro::Angles::degrees_in_sign(*chart.ascendant())),
                 chart.ascendant_from_fallback() ? " (computed)" : "");
    }

    log_bodies(chart);
    log_houses(chart);
    log_summary(chart);

    const auto diagnostics = core::Logger::diagnostics();
    JYO_INFO("Pipeline diagnostics: {}", diagnostics.size());
    for (const auto& message : diagnostics)
    {
        JYO_INFO("  {}", message);
    }

    JYO_INFO("jyotish demo finished");
    core::Logger::shutdown();
    return EXIT_SUCCESS;
}
