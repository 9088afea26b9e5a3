/// @file ephemeris_provider.cpp
/// @brief StaticEphemeris and request assembly.

#include "ephemeris/ephemeris_provider.hpp"

#include "core/logger.hpp"
#include "zodiac/body.hpp"

namespace jyotish::ephemeris
{

StaticEphemeris::StaticEphemeris(bool sidereal_frame)
    : m_sidereal(sidereal_frame)
{
}

void StaticEphemeris::set_position(Body body, const chart::RawPosition& raw)
{
    m_positions[zodiac::index_of(body)] = raw;
}

void StaticEphemeris::set_ascendant(f64 longitude)
{
    m_ascendant = longitude;
}

void StaticEphemeris::clear_position(Body body)
{
    m_positions[zodiac::index_of(body)].reset();
}

std::optional<chart::RawPosition> StaticEphemeris::position(Body body, f64 /*jd*/) const
{
    return m_positions[zodiac::index_of(body)];
}

std::optional<f64> StaticEphemeris::ascendant(f64 /*jd*/, f64 /*latitude*/, f64 /*longitude*/) const
{
    return m_ascendant;
}

i32 StaticEphemeris::body_count() const
{
    i32 count = 0;
    for (const auto& slot : m_positions)
    {
        if (slot)
        {
            ++count;
        }
    }
    return count;
}

chart::ChartRequest make_request(const EphemerisProvider& provider,
                                 const astro::DateTime& utc,
                                 f64 latitude, f64 longitude)
{
    const f64 jd = astro::TimeSystem::to_julian_date(utc);

    chart::ChartRequest request{
        .utc            = utc,
        .latitude       = latitude,
        .longitude      = longitude,
        .ascendant      = provider.ascendant(jd, latitude, longitude),
        .sidereal_input = provider.sidereal(),
    };

    for (const Body body : zodiac::kAllBodies)
    {
        if (const auto raw = provider.position(body, jd))
        {
            request.set_position(body, *raw);
        }
        else
        {
            JYO_CORE_DEBUG("Ephemeris: no position for {} at JD {:.5f}", zodiac::body_name(body), jd);
        }
    }

    return request;
}

} // namespace jyotish::ephemeris
