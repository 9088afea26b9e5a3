/// @file chart.cpp
/// @brief ChartContext queries and the chart-building pipeline.

#include "chart/chart.hpp"

#include "astro/angles.hpp"
#include "astro/ayanamsa.hpp"
#include "astro/coordinates.hpp"
#include "core/logger.hpp"
#include "zodiac/body.hpp"
#include "zodiac/sign.hpp"

#include <cmath>

namespace jyotish::chart
{

// -----------------------------------------------------------------
// ChartContext queries
// -----------------------------------------------------------------

const std::optional<BodyPosition>& ChartContext::position(Body body) const
{
    return m_positions[zodiac::index_of(body)];
}

std::vector<Body> ChartContext::present_bodies() const
{
    std::vector<Body> result;
    for (const Body body : zodiac::kAllBodies)
    {
        if (position(body))
        {
            result.push_back(body);
        }
    }
    return result;
}

std::vector<Body> ChartContext::missing_bodies() const
{
    std::vector<Body> result;
    for (const Body body : zodiac::kAllBodies)
    {
        if (!position(body))
        {
            result.push_back(body);
        }
    }
    return result;
}

bool ChartContext::is_complete() const
{
    return m_ascendant.has_value() && m_houses.has_value() && missing_bodies().empty();
}

std::optional<House> ChartContext::house(i32 number) const
{
    require_house_number(number);
    if (!m_houses)
    {
        return std::nullopt;
    }
    return (*m_houses)[static_cast<std::size_t>(number - 1)];
}

std::optional<i32> ChartContext::house_of(Body body) const
{
    const auto& pos = position(body);
    if (!pos || !m_houses)
    {
        return std::nullopt;
    }
    return HouseBuilder::house_of(*m_houses, pos->longitude);
}

std::vector<Body> ChartContext::occupants(i32 number) const
{
    require_house_number(number);

    std::vector<Body> result;
    for (const Body body : zodiac::kAllBodies)
    {
        if (house_of(body) == number)
        {
            result.push_back(body);
        }
    }
    return result;
}

std::optional<Body> ChartContext::lord_of(i32 number) const
{
    const auto h = house(number);
    if (!h)
    {
        return std::nullopt;
    }
    return zodiac::sign_info(h->sign).ruler;
}

std::optional<Dignity> ChartContext::dignity_of(Body body) const
{
    const auto& pos = position(body);
    if (!pos)
    {
        return std::nullopt;
    }
    return DignityEngine::dignity(body, pos->longitude);
}

std::optional<bool> ChartContext::in_sandhi(Body body) const
{
    const auto& pos = position(body);
    if (!pos || !m_houses)
    {
        return std::nullopt;
    }
    return HouseBuilder::in_any_sandhi(*m_houses, pos->longitude);
}

// -----------------------------------------------------------------
// Pipeline
//
// 1. Julian Day and ayanamsa for the instant
// 2. Per-body sidereal positions (Ketu mirrored from Rahu if absent)
// 3. Ascendant: collaborator value, else LST fallback
// 4. Equal houses from the ascendant
// -----------------------------------------------------------------

ChartContext ChartBuilder::build(const ChartRequest& request, const config::ChartConfig& config)
{
    using astro::Angles;
    using astro::Ayanamsa;

    ChartContext ctx;
    ctx.m_config = config;
    ctx.m_julian_day = astro::TimeSystem::to_julian_date(request.utc);
    ctx.m_ayanamsa = Ayanamsa::value(ctx.m_julian_day, config.ayanamsa, config.ayanamsa_model);

    JYO_CORE_DEBUG("ChartBuilder: JD {:.5f}, {} ayanamsa {:.4f}°, {} aspects",
                   ctx.m_julian_day, Ayanamsa::name(config.ayanamsa), ctx.m_ayanamsa,
                   aspect::aspect_mode_name(config.aspect_mode));

    const auto to_sidereal = [&](f64 lon) {
        return request.sidereal_input ? Angles::normalize_degrees(lon)
                                      : Angles::normalize_degrees(lon - ctx.m_ayanamsa);
    };

    // ---- Body positions ----
    for (const Body body : zodiac::kAllBodies)
    {
        const auto& raw = request.raw_positions[zodiac::index_of(body)];
        if (!raw)
        {
            continue;
        }
        if (!std::isfinite(raw->longitude) || !std::isfinite(raw->speed))
        {
            JYO_CORE_WARN("ChartBuilder: discarding non-finite position for {}", zodiac::body_name(body));
            continue;
        }

        const std::optional<f64> tropical = request.sidereal_input
            ? std::nullopt
            : std::optional<f64>{Angles::normalize_degrees(raw->longitude)};

        ctx.m_positions[zodiac::index_of(body)] =
            PositionDeriver::derive(body, to_sidereal(raw->longitude), raw->latitude, raw->speed, tropical);
    }

    // The south node is always opposite the north node
    const auto& rahu = ctx.m_positions[zodiac::index_of(Body::Rahu)];
    auto& ketu = ctx.m_positions[zodiac::index_of(Body::Ketu)];
    if (rahu && !ketu)
    {
        const std::optional<f64> tropical = rahu->tropical_longitude
            ? std::optional<f64>{Angles::normalize_degrees(*rahu->tropical_longitude + 180.0)}
            : std::nullopt;
        ketu = PositionDeriver::derive(Body::Ketu, rahu->longitude + 180.0, -rahu->latitude, rahu->speed, tropical);
        JYO_CORE_DEBUG("ChartBuilder: Ketu mirrored from Rahu at {:.4f}°", ketu->longitude);
    }

    for (const Body body : ctx.missing_bodies())
    {
        JYO_CORE_WARN("ChartBuilder: no ephemeris data for {}, chart is incomplete", zodiac::body_name(body));
    }

    // ---- Ascendant ----
    if (request.ascendant && std::isfinite(*request.ascendant))
    {
        ctx.m_ascendant = to_sidereal(*request.ascendant);
    }
    else if (request.allow_ascendant_fallback && std::isfinite(request.latitude) && std::isfinite(request.longitude))
    {
        const f64 tropical = astro::Coordinates::ascendant_at(
            ctx.m_julian_day, astro::ObserverLocation{request.latitude, request.longitude});
        ctx.m_ascendant = Angles::normalize_degrees(tropical - ctx.m_ayanamsa);
        ctx.m_ascendant_fallback = true;
        JYO_CORE_WARN("ChartBuilder: ascendant not supplied, using sidereal-time formula ({:.4f}°)",
                      *ctx.m_ascendant);
    }
    else
    {
        JYO_CORE_WARN("ChartBuilder: ascendant unavailable, houses omitted");
    }

    // ---- Houses ----
    if (ctx.m_ascendant)
    {
        ctx.m_houses = HouseBuilder::build(*ctx.m_ascendant, config.sandhi_width_deg);
    }

    JYO_CORE_INFO("ChartBuilder: built chart with {} bodies{}",
                  ctx.present_bodies().size(), ctx.is_complete() ? "" : " (incomplete)");

    return ctx;
}

} // namespace jyotish::chart
