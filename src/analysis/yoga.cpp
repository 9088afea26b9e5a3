/// @file yoga.cpp
/// @brief Implementation of yoga detection.

#include "analysis/yoga.hpp"

#include "chart/houses.hpp"

#include <algorithm>

namespace jyotish::analysis
{

YogaDetector::YogaDetector(const chart::ChartContext& chart)
    : m_chart(chart)
{
}

std::optional<KendraTrikonaYoga> YogaDetector::kendra_trikona(i32 house) const
{
    const auto lord = m_chart.lord_of(house);
    if (!lord)
    {
        return std::nullopt;
    }
    const auto placed = m_chart.house_of(*lord);
    if (!placed)
    {
        return std::nullopt;
    }

    const bool matches = (chart::is_kendra(house) && chart::is_trikona(*placed))
                      || (chart::is_trikona(house) && chart::is_kendra(*placed));
    if (!matches)
    {
        return std::nullopt;
    }

    return KendraTrikonaYoga{.lord = *lord, .from_house = house, .to_house = *placed};
}

std::optional<ParivartanaYoga> YogaDetector::parivartana(i32 house) const
{
    const auto lord = m_chart.lord_of(house);
    if (!lord)
    {
        return std::nullopt;
    }
    const auto lord_house = m_chart.house_of(*lord);
    // A lord sitting in its own house is not an exchange
    if (!lord_house || *lord_house == house)
    {
        return std::nullopt;
    }

    const auto other_lord = m_chart.lord_of(*lord_house);
    if (!other_lord || m_chart.house_of(*other_lord) != house)
    {
        return std::nullopt;
    }

    return ParivartanaYoga{
        .first_house  = house,
        .second_house = *lord_house,
        .first_lord   = *lord,
        .second_lord  = *other_lord,
    };
}

std::vector<ConjunctionYoga> YogaDetector::conjunctions(i32 house) const
{
    const std::vector<Body> occupants = m_chart.occupants(house);
    std::vector<ConjunctionYoga> result;
    if (occupants.size() < 2)
    {
        return result;
    }

    const auto occupies = [&occupants](Body body) {
        return std::find(occupants.begin(), occupants.end(), body) != occupants.end();
    };

    const aspect::AspectEngine engine(m_chart);
    for (const auto& conj : engine.conjunctions())
    {
        if (occupies(conj.first) && occupies(conj.second))
        {
            result.push_back(ConjunctionYoga{
                .house      = house,
                .first      = conj.first,
                .second     = conj.second,
                .separation = conj.separation,
                .closeness  = conj.closeness,
            });
        }
    }
    return result;
}

HouseYogas YogaDetector::house_yogas(i32 house) const
{
    return HouseYogas{
        .house          = house,
        .kendra_trikona = kendra_trikona(house),
        .parivartana    = parivartana(house),
        .conjunctions   = conjunctions(house),
    };
}

std::vector<KendraTrikonaYoga> YogaDetector::raj_yogas() const
{
    std::vector<KendraTrikonaYoga> result;
    for (i32 house = 1; house <= zodiac_constants::kHouseCount; ++house)
    {
        if (const auto yoga = kendra_trikona(house))
        {
            result.push_back(*yoga);
        }
    }
    return result;
}

std::optional<DhanaYoga> YogaDetector::dhana_yoga() const
{
    const auto second   = m_chart.lord_of(2);
    const auto eleventh = m_chart.lord_of(11);
    if (!second || !eleventh)
    {
        return std::nullopt;
    }
    return DhanaYoga{.second_lord = *second, .eleventh_lord = *eleventh};
}

} // namespace jyotish::analysis
