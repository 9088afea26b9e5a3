/// @file coordinates.cpp
/// @brief Implementation of the ascendant fallback formulas.

#include "astro/coordinates.hpp"

#include "astro/angles.hpp"
#include "astro/time_system.hpp"

#include <glm/trigonometric.hpp>

#include <algorithm>
#include <cmath>

namespace jyotish::astro
{

// -----------------------------------------------------------------
// Mean obliquity (IAU 1980, Meeus 22.2)
//
// ε = 23°26'21.448" − 46.8150" T − 0.00059" T² + 0.001813" T³
// -----------------------------------------------------------------

f64 Coordinates::mean_obliquity(f64 jd)
{
    const f64 t = TimeSystem::julian_centuries(jd);
    const f64 arcsec = 21.448 - 46.8150 * t - 0.00059 * t * t + 0.001813 * t * t * t;
    return 23.0 + 26.0 / 60.0 + arcsec / 3600.0;
}

// -----------------------------------------------------------------
// Ascendant
//
// With θ = RAMC (local sidereal time), φ = latitude, ε = obliquity:
//
//   λ_asc = atan2(cos θ, −(sin θ cos ε + tan φ sin ε))
//
// The sign convention picks the eastern intersection of horizon
// and ecliptic (θ = 0, φ = 0 gives 90°, not the descendant at 270°).
// -----------------------------------------------------------------

f64 Coordinates::ascendant(f64 lst_deg, f64 latitude_deg, f64 obliquity_deg)
{
    const f64 theta = glm::radians(Angles::normalize_degrees(lst_deg));
    const f64 phi   = glm::radians(std::clamp(latitude_deg, -kMaxLatitude, kMaxLatitude));
    const f64 eps   = glm::radians(obliquity_deg);

    const f64 y = std::cos(theta);
    const f64 x = -(std::sin(theta) * std::cos(eps) + std::tan(phi) * std::sin(eps));

    return Angles::normalize_degrees(glm::degrees(std::atan2(y, x)));
}

// -----------------------------------------------------------------
// Midheaven: tan λ_mc = tan θ / cos ε, same quadrant as θ
// -----------------------------------------------------------------

f64 Coordinates::midheaven(f64 lst_deg, f64 obliquity_deg)
{
    const f64 theta = glm::radians(Angles::normalize_degrees(lst_deg));
    const f64 eps   = glm::radians(obliquity_deg);

    return Angles::normalize_degrees(glm::degrees(std::atan2(std::sin(theta), std::cos(theta) * std::cos(eps))));
}

f64 Coordinates::ascendant_at(f64 jd, const ObserverLocation& observer)
{
    const f64 lst = TimeSystem::lmst_degrees(jd, observer.longitude_deg);
    return ascendant(lst, observer.latitude_deg, mean_obliquity(jd));
}

} // namespace jyotish::astro
