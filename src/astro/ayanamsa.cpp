/// @file ayanamsa.cpp
/// @brief Implementation of the linear ayanamsa model.

#include "astro/ayanamsa.hpp"

#include "astro/angles.hpp"
#include "astro/time_system.hpp"
#include "core/logger.hpp"
#include "core/text.hpp"

namespace jyotish::astro
{

namespace
{
    constexpr f64 kArcsecPerDegree = 3600.0;
}

f64 Ayanamsa::value(f64 jd, AyanamsaSystem system, const AyanamsaModel& model)
{
    const f64 years = TimeSystem::julian_years_since_j2000(jd);
    const f64 rate_deg = model.precession_arcsec_per_year / kArcsecPerDegree;
    return model.base(system) + rate_deg * years;
}

f64 Ayanamsa::tropical_to_sidereal(f64 tropical_lon, f64 jd, AyanamsaSystem system,
                                   const AyanamsaModel& model)
{
    return Angles::normalize_degrees(tropical_lon - value(jd, system, model));
}

f64 Ayanamsa::sidereal_to_tropical(f64 sidereal_lon, f64 jd, AyanamsaSystem system,
                                   const AyanamsaModel& model)
{
    return Angles::normalize_degrees(sidereal_lon + value(jd, system, model));
}

std::optional<AyanamsaSystem> Ayanamsa::from_name(std::string_view name)
{
    const std::string key = core::fold_identifier(name);

    if (key == "lahiri" || key == "chitrapaksha")
    {
        return AyanamsaSystem::Lahiri;
    }
    if (key == "raman")
    {
        return AyanamsaSystem::Raman;
    }
    if (key == "krishnamurti" || key == "kp")
    {
        return AyanamsaSystem::Krishnamurti;
    }
    if (key == "faganbradley")
    {
        return AyanamsaSystem::FaganBradley;
    }
    return std::nullopt;
}

AyanamsaSystem Ayanamsa::parse(std::string_view name)
{
    if (const auto system = from_name(name))
    {
        return *system;
    }

    JYO_CORE_WARN("Ayanamsa: unknown system '{}', using Lahiri", name);
    return AyanamsaSystem::Lahiri;
}

std::string_view Ayanamsa::name(AyanamsaSystem system)
{
    switch (system)
    {
        case AyanamsaSystem::Lahiri:       return "Lahiri";
        case AyanamsaSystem::Raman:        return "Raman";
        case AyanamsaSystem::Krishnamurti: return "Krishnamurti";
        case AyanamsaSystem::FaganBradley: return "Fagan-Bradley";
    }
    return "Lahiri";
}

} // namespace jyotish::astro
