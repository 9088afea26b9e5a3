/// @file aspect_engine.cpp
/// @brief Implementation of the sign-based and orb-based aspect rules.

#include "aspect/aspect_engine.hpp"

#include "astro/angles.hpp"
#include "zodiac/body.hpp"
#include "zodiac/sign.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>

namespace jyotish::aspect
{

using astro::Angles;
using chart::BodyPosition;

namespace
{
    constexpr f64 kStrongTotal = 0.75;
    constexpr f64 kWeakTotal   = 0.25;

    // Retrograde replacement for one special angle; 180 and unlisted angles pass through
    [[nodiscard]] f64 retrograde_swap(Body body, f64 angle)
    {
        if (body == Body::Mars)
        {
            if (angle == 90.0)  { return 270.0; }
            if (angle == 210.0) { return 150.0; }
        }
        else if (body == Body::Saturn)
        {
            if (angle == 60.0)  { return 300.0; }
            if (angle == 270.0) { return 90.0; }
        }
        return angle;
    }

    [[nodiscard]] bool is_node(Body body)
    {
        return body == Body::Rahu || body == Body::Ketu;
    }

    // Sign counted by whole houses from the source sign
    [[nodiscard]] Sign sign_at_angle(Sign source, f64 angle)
    {
        const i32 houses_away = static_cast<i32>(std::floor(angle / zodiac_constants::kSignSpan));
        return zodiac::advance(source, houses_away);
    }

    // Tighter category first, then smaller orb
    [[nodiscard]] bool stronger(const AspectHit& a, const AspectHit& b)
    {
        if (a.category != b.category)
        {
            return a.category < b.category;
        }
        return a.orb < b.orb;
    }
}

AspectEngine::AspectEngine(const chart::ChartContext& chart)
    : m_chart(chart)
    , m_mode(chart.aspect_mode())
{
}

AspectEngine::AspectEngine(const chart::ChartContext& chart, AspectMode mode)
    : m_chart(chart)
    , m_mode(mode)
{
}

// -----------------------------------------------------------------
// Effective angle set
//
//   Sun/Moon/Mercury/Venus : 180
//   Mars                   : 90, 180, 210   (retrograde: 270, 180, 150)
//   Jupiter                : 120, 180, 240
//   Saturn                 : 60, 180, 270   (retrograde: 300, 180, 90)
//   Rahu/Ketu              : 120, 240 + (30 in odd-index sign, else 330)
//
// The swap maps the catalog set once; it is never applied to its own output.
// -----------------------------------------------------------------

std::vector<f64> AspectEngine::effective_angles(Body body, Sign sign, bool retrograde)
{
    const auto base = zodiac::body_info(body).base_aspect_angles();

    std::vector<f64> angles;
    angles.reserve(base.size() + 1);

    for (const f64 angle : base)
    {
        angles.push_back((retrograde && !is_node(body)) ? retrograde_swap(body, angle) : angle);
    }

    if (is_node(body))
    {
        const bool odd_index = zodiac::index_of(sign) % 2 == 1;
        angles.push_back(odd_index ? 30.0 : 330.0);
    }

    return angles;
}

std::vector<f64> AspectEngine::effective_angles(const BodyPosition& position)
{
    return effective_angles(position.body, position.sign, position.is_retrograde());
}

OrbCategory AspectEngine::classify_orb(f64 orb, const OrbThresholds& thresholds)
{
    const f64 value = std::abs(orb);
    if (value <= thresholds.exact)     { return OrbCategory::Exact; }
    if (value <= thresholds.close)     { return OrbCategory::Close; }
    if (value <= thresholds.wide)      { return OrbCategory::Wide; }
    if (value <= thresholds.very_wide) { return OrbCategory::VeryWide; }
    return OrbCategory::None;
}

std::vector<Sign> AspectEngine::aspected_signs(const BodyPosition& position)
{
    std::vector<Sign> signs;
    for (const f64 angle : effective_angles(position))
    {
        signs.push_back(sign_at_angle(position.sign, angle));
    }
    return signs;
}

Closeness AspectEngine::closeness_of(f64 separation)
{
    if (separation <= 1.0) { return Closeness::VeryClose; }
    if (separation <= 3.0) { return Closeness::Close; }
    if (separation <= 5.0) { return Closeness::Moderate; }
    return Closeness::Wide;
}

std::string_view AspectEngine::closeness_name(Closeness closeness)
{
    switch (closeness)
    {
        case Closeness::VeryClose: return "Very Close";
        case Closeness::Close:     return "Close";
        case Closeness::Moderate:  return "Moderate";
        case Closeness::Wide:      return "Wide";
    }
    return "Wide";
}

// -----------------------------------------------------------------
// Core evaluation
//
// Rasi:   the target sign is aspected when sign + floor(angle / 30)
//         lands on it; the whole sign counts, strength 1.0.
// Degree: orb = shortest arc between (source + angle) and the target,
//         classified against the thresholds; the tightest hit is primary.
// -----------------------------------------------------------------

AspectResult AspectEngine::evaluate(const BodyPosition& source, const AspectTarget& target) const
{
    AspectResult result{
        .source   = source.body,
        .target   = target,
        .mode     = m_mode,
        .distance = Angles::angular_distance(source.longitude, target.longitude),
    };

    if (target.kind == TargetKind::Body && target.body == source.body)
    {
        return result;
    }

    for (const f64 angle : effective_angles(source))
    {
        const f64 orb = Angles::angular_distance(source.longitude + angle, target.longitude);

        if (m_mode == AspectMode::Rasi)
        {
            if (sign_at_angle(source.sign, angle) == target.sign)
            {
                result.hits.push_back(AspectHit{
                    .angle    = angle,
                    .orb      = orb,
                    .category = OrbCategory::Exact,
                    .strength = 1.0,
                });
            }
            continue;
        }

        const OrbCategory category = classify_orb(orb, m_chart.config().orbs);
        if (category != OrbCategory::None)
        {
            result.hits.push_back(AspectHit{
                .angle    = angle,
                .orb      = orb,
                .category = category,
                .strength = orb_strength(category),
            });
        }
    }

    if (result.hits.empty())
    {
        return result;
    }

    const auto primary = std::min_element(result.hits.begin(), result.hits.end(), stronger);
    result.angle = primary->angle;
    result.category = primary->category;
    result.strength = primary->strength;
    for (const auto& hit : result.hits)
    {
        result.total_strength += hit.strength;
    }

    return result;
}

// -----------------------------------------------------------------
// Chart queries
// -----------------------------------------------------------------

std::optional<AspectResult> AspectEngine::to_body(Body source, Body target) const
{
    const auto& src = m_chart.position(source);
    const auto& tgt = m_chart.position(target);
    if (!src || !tgt)
    {
        return std::nullopt;
    }

    return evaluate(*src, AspectTarget{
        .kind      = TargetKind::Body,
        .body      = target,
        .longitude = tgt->longitude,
        .sign      = tgt->sign,
    });
}

std::optional<AspectResult> AspectEngine::to_house(Body source, i32 house) const
{
    const auto h = m_chart.house(house);
    const auto& src = m_chart.position(source);
    if (!h || !src)
    {
        return std::nullopt;
    }

    return evaluate(*src, AspectTarget{
        .kind      = TargetKind::House,
        .house     = house,
        .longitude = h->cusp,
        .sign      = h->sign,
    });
}

std::optional<AspectResult> AspectEngine::to_point(Body source, f64 longitude) const
{
    const auto& src = m_chart.position(source);
    if (!src)
    {
        return std::nullopt;
    }

    const f64 lon = Angles::normalize_degrees(longitude);
    return evaluate(*src, AspectTarget{
        .kind      = TargetKind::Point,
        .longitude = lon,
        .sign      = zodiac::sign_of(lon),
    });
}

std::vector<AspectResult> AspectEngine::aspects_from(Body source) const
{
    std::vector<AspectResult> result;
    for (const Body target : zodiac::kAllBodies)
    {
        if (auto aspect = to_body(source, target); aspect && aspect->has_aspect())
        {
            result.push_back(std::move(*aspect));
        }
    }
    return result;
}

std::vector<AspectResult> AspectEngine::aspects_to(Body target) const
{
    std::vector<AspectResult> result;
    for (const Body source : zodiac::kAllBodies)
    {
        if (auto aspect = to_body(source, target); aspect && aspect->has_aspect())
        {
            result.push_back(std::move(*aspect));
        }
    }
    return result;
}

std::vector<AspectResult> AspectEngine::aspects_to_house(i32 house) const
{
    chart::require_house_number(house);

    std::vector<AspectResult> result;
    for (const Body source : zodiac::kAllBodies)
    {
        if (auto aspect = to_house(source, house); aspect && aspect->has_aspect())
        {
            result.push_back(std::move(*aspect));
        }
    }
    return result;
}

AspectMatrix AspectEngine::matrix() const
{
    AspectMatrix matrix{.mode = m_mode};

    for (const Body source : zodiac::kAllBodies)
    {
        const std::size_t row = zodiac::index_of(source);
        for (const Body target : zodiac::kAllBodies)
        {
            matrix.bodies[row][zodiac::index_of(target)] = to_body(source, target);
        }
        for (i32 house = 1; house <= zodiac_constants::kHouseCount; ++house)
        {
            matrix.houses[row][static_cast<std::size_t>(house - 1)] = to_house(source, house);
        }
    }

    return matrix;
}

// -----------------------------------------------------------------
// Conjunctions and mutual aspects (unordered pairs, catalog order)
// -----------------------------------------------------------------

std::vector<Conjunction> AspectEngine::conjunctions() const
{
    const f64 orb = m_chart.config().conjunction_orb_deg;
    std::vector<Conjunction> result;

    for (std::size_t i = 0; i < zodiac::kAllBodies.size(); ++i)
    {
        const auto& a = m_chart.position(zodiac::kAllBodies[i]);
        if (!a)
        {
            continue;
        }
        for (std::size_t j = i + 1; j < zodiac::kAllBodies.size(); ++j)
        {
            const auto& b = m_chart.position(zodiac::kAllBodies[j]);
            if (!b)
            {
                continue;
            }

            const f64 separation = Angles::angular_distance(a->longitude, b->longitude);
            if (separation <= orb)
            {
                result.push_back(Conjunction{
                    .first      = a->body,
                    .second     = b->body,
                    .separation = separation,
                    .closeness  = closeness_of(separation),
                });
            }
        }
    }

    return result;
}

std::vector<MutualAspect> AspectEngine::mutual_aspects() const
{
    std::vector<MutualAspect> result;

    for (std::size_t i = 0; i < zodiac::kAllBodies.size(); ++i)
    {
        for (std::size_t j = i + 1; j < zodiac::kAllBodies.size(); ++j)
        {
            const Body a = zodiac::kAllBodies[i];
            const Body b = zodiac::kAllBodies[j];

            const auto forward = to_body(a, b);
            const auto backward = to_body(b, a);
            if (!forward || !backward || !forward->has_aspect() || !backward->has_aspect())
            {
                continue;
            }

            result.push_back(MutualAspect{
                .first             = a,
                .second            = b,
                .first_angle       = *forward->angle,
                .second_angle      = *backward->angle,
                .combined_strength = forward->total_strength + backward->total_strength,
            });
        }
    }

    return result;
}

// -----------------------------------------------------------------
// Pattern summary. Ties for most aspecting/aspected resolve to the
// earlier body in catalog order.
// -----------------------------------------------------------------

AspectPatterns AspectEngine::patterns() const
{
    AspectPatterns patterns;

    std::array<i32, zodiac_constants::kBodyCount> cast{};
    std::array<i32, zodiac_constants::kBodyCount> received{};
    f64 strength_sum = 0.0;

    for (const Body source : zodiac::kAllBodies)
    {
        for (AspectResult& aspect : aspects_from(source))
        {
            ++patterns.total_aspects;
            strength_sum += aspect.total_strength;
            ++cast[zodiac::index_of(source)];
            ++received[zodiac::index_of(*aspect.target.body)];
            ++patterns.by_angle[static_cast<i32>(std::lround(*aspect.angle))];

            if (aspect.category == OrbCategory::Exact)
            {
                patterns.exact.push_back(aspect);
            }
            if (aspect.total_strength >= kStrongTotal)
            {
                patterns.strong.push_back(aspect);
            }
            else if (aspect.total_strength <= kWeakTotal)
            {
                patterns.weak.push_back(std::move(aspect));
            }
        }
    }

    if (patterns.total_aspects > 0)
    {
        patterns.average_strength = strength_sum / static_cast<f64>(patterns.total_aspects);

        const auto top = [](const std::array<i32, zodiac_constants::kBodyCount>& counts) -> std::optional<Body> {
            const auto it = std::max_element(counts.begin(), counts.end());
            if (*it == 0)
            {
                return std::nullopt;
            }
            return zodiac::kAllBodies[static_cast<std::size_t>(std::distance(counts.begin(), it))];
        };
        patterns.most_aspecting = top(cast);
        patterns.most_aspected = top(received);
    }

    patterns.conjunctions = conjunctions();
    patterns.mutual_aspects = mutual_aspects();

    return patterns;
}

} // namespace jyotish::aspect
