/// @file chara_karaka.cpp
/// @brief Implementation of the chara karaka ranking.

#include "analysis/chara_karaka.hpp"

#include <algorithm>
#include <utility>

namespace jyotish::analysis
{

namespace
{
    [[nodiscard]] f64 standard_measure(Body body, f64 degrees_in_sign)
    {
        // Rahu moves backwards through the sign
        return body == Body::Rahu ? zodiac_constants::kSignSpan - degrees_in_sign : degrees_in_sign;
    }

    [[nodiscard]] std::vector<KarakaAssignment> rank(std::vector<std::pair<Body, f64>> measures,
                                                     KarakaMethod method)
    {
        std::stable_sort(measures.begin(), measures.end(),
                         [](const auto& a, const auto& b) { return a.second > b.second; });

        std::vector<KarakaAssignment> result;
        const std::size_t count = std::min(measures.size(), kKarakaCount);
        result.reserve(count);
        for (std::size_t i = 0; i < count; ++i)
        {
            result.push_back(KarakaAssignment{
                .body    = measures[i].first,
                .karaka  = static_cast<Karaka>(i),
                .degrees = measures[i].second,
                .method  = method,
            });
        }
        return result;
    }
}

std::vector<KarakaAssignment> CharaKaraka::standard(const chart::ChartContext& chart)
{
    std::vector<std::pair<Body, f64>> measures;
    for (const Body body : chart.present_bodies())
    {
        if (body == Body::Ketu)
        {
            continue;
        }
        measures.emplace_back(body, standard_measure(body, chart.position(body)->degrees_in_sign));
    }
    return rank(std::move(measures), KarakaMethod::Standard);
}

std::vector<KarakaAssignment> CharaKaraka::advanced(const chart::ChartContext& chart,
                                                    const TravelTable& travel)
{
    std::vector<std::pair<Body, f64>> measures;
    for (const Body body : chart.present_bodies())
    {
        if (body == Body::Ketu)
        {
            continue;
        }

        const f64 degrees = chart.position(body)->degrees_in_sign;
        const auto& data  = travel[zodiac::index_of(body)];
        const bool tracked = data && body != Body::Sun && body != Body::Moon && body != Body::Rahu;

        measures.emplace_back(body, tracked ? travelled(degrees, *data) : standard_measure(body, degrees));
    }
    return rank(std::move(measures), KarakaMethod::Advanced);
}

// -----------------------------------------------------------------
// Retrograded (max_forward > current): went entry -> max -> current
//   travel = (max - entry) + (max - current)
// Otherwise: travel = current - entry
// -----------------------------------------------------------------

f64 CharaKaraka::travelled(f64 degrees_in_sign, const SignTravel& travel)
{
    if (travel.max_forward > degrees_in_sign)
    {
        return (travel.max_forward - travel.entry_point) + (travel.max_forward - degrees_in_sign);
    }
    return degrees_in_sign - travel.entry_point;
}

std::string_view CharaKaraka::abbreviation(Karaka karaka)
{
    switch (karaka)
    {
        case Karaka::Atma:    return "AK";
        case Karaka::Amatya:  return "AmK";
        case Karaka::Bhratri: return "BK";
        case Karaka::Matri:   return "MK";
        case Karaka::Pitru:   return "PiK";
        case Karaka::Putra:   return "PK";
        case Karaka::Gnati:   return "GK";
        case Karaka::Dara:    return "DK";
    }
    return "?";
}

std::string_view CharaKaraka::name(Karaka karaka)
{
    switch (karaka)
    {
        case Karaka::Atma:    return "Atma Karaka";
        case Karaka::Amatya:  return "Amatya Karaka";
        case Karaka::Bhratri: return "Bhratri Karaka";
        case Karaka::Matri:   return "Matri Karaka";
        case Karaka::Pitru:   return "Pitru Karaka";
        case Karaka::Putra:   return "Putra Karaka";
        case Karaka::Gnati:   return "Gnati Karaka";
        case Karaka::Dara:    return "Dara Karaka";
    }
    return "Unknown";
}

std::string_view CharaKaraka::method_name(KarakaMethod method)
{
    return method == KarakaMethod::Standard ? "standard" : "advanced";
}

} // namespace jyotish::analysis
