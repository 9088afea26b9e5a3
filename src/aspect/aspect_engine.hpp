#pragma once

/// @file aspect_engine.hpp
/// @brief Directed aspects (drishti) between bodies, houses and points.

#include "aspect/aspect_types.hpp"
#include "chart/chart.hpp"
#include "core/types.hpp"

#include <array>
#include <map>
#include <optional>
#include <vector>

namespace jyotish::aspect
{
    using zodiac::Body;
    using zodiac::Sign;

    /// @brief One candidate angle that reached the target.
    struct AspectHit
    {
        f64         angle;     ///< Effective aspect angle (degrees forward from the source)
        f64         orb;       ///< |source + angle - target|, shortest arc
        OrbCategory category;
        f64         strength;
    };

    enum class TargetKind : u8
    {
        Body,
        House,
        Point,
    };

    /// @brief What an aspect is directed at.
    struct AspectTarget
    {
        TargetKind          kind;
        std::optional<Body> body;       ///< Set for TargetKind::Body
        i32                 house{0};   ///< Set for TargetKind::House
        f64                 longitude;  ///< Body longitude, house cusp or the point itself
        Sign                sign;       ///< Sign evaluated in rasi mode
    };

    /// @brief Directed relation source -> target in one mode.
    struct AspectResult
    {
        Body                   source;
        AspectTarget           target;
        AspectMode             mode;
        f64                    distance;                     ///< Shortest arc source -> target, [0, 180]
        std::optional<f64>     angle;                        ///< Primary matched angle
        OrbCategory            category{OrbCategory::None};
        f64                    strength{0.0};                ///< Strength of the primary hit
        std::vector<AspectHit> hits;                         ///< Every qualifying angle
        f64                    total_strength{0.0};          ///< Sum over hits

        [[nodiscard]] bool has_aspect() const { return angle.has_value(); }
    };

    /// @brief Full directed matrix: 9 × 9 bodies plus 9 × 12 houses.
    ///
    /// Cells are empty when the source or target is missing from the chart.
    /// Diagonal body cells hold a result without hits (no self-aspect).
    struct AspectMatrix
    {
        AspectMode mode;
        std::array<std::array<std::optional<AspectResult>, zodiac_constants::kBodyCount>,
                   zodiac_constants::kBodyCount> bodies{};
        std::array<std::array<std::optional<AspectResult>, zodiac_constants::kHouseCount>,
                   zodiac_constants::kBodyCount> houses{};
    };

    enum class Closeness : u8
    {
        VeryClose,  ///< <= 1°
        Close,      ///< <= 3°
        Moderate,   ///< <= 5°
        Wide,       ///< up to the conjunction orb
    };

    /// @brief Two bodies within the conjunction orb.
    struct Conjunction
    {
        Body      first;
        Body      second;
        f64       separation;
        Closeness closeness;
    };

    /// @brief Two bodies aspecting each other.
    struct MutualAspect
    {
        Body first;
        Body second;
        f64  first_angle;
        f64  second_angle;
        f64  combined_strength;
    };

    /// @brief Chart-wide summary of body-to-body aspects.
    struct AspectPatterns
    {
        i32                              total_aspects{0};
        f64                              average_strength{0.0};
        std::vector<AspectResult>        strong;   ///< total_strength >= 0.75
        std::vector<AspectResult>        weak;     ///< total_strength <= 0.25
        std::vector<AspectResult>        exact;    ///< primary category Exact
        std::map<i32, i32>               by_angle; ///< Primary angle -> count
        std::optional<Body>              most_aspecting;
        std::optional<Body>              most_aspected;
        std::vector<Conjunction>         conjunctions;
        std::vector<MutualAspect>        mutual_aspects;
    };

    /// @brief Aspect computations over one chart, in the chart's aspect mode.
    ///
    /// The engine borrows the chart; the chart must outlive it.
    class AspectEngine
    {
    public:
        explicit AspectEngine(const chart::ChartContext& chart);

        /// @brief Same chart, explicit mode (the house-strength scorer always uses Degree).
        AspectEngine(const chart::ChartContext& chart, AspectMode mode);

        // ---- Pure rules ----

        /// @brief Effective special-aspect angles for a body.
        ///
        /// Starts from the catalog set; retrograde Mars/Saturn swap their
        /// special angles (180 stays fixed); nodes add +30 in odd-index signs
        /// and +330 in even-index signs.
        [[nodiscard]] static std::vector<f64> effective_angles(Body body, Sign sign, bool retrograde);
        [[nodiscard]] static std::vector<f64> effective_angles(const chart::BodyPosition& position);

        /// @brief Orb category for an orb (boundaries inclusive on the tighter category).
        [[nodiscard]] static OrbCategory classify_orb(f64 orb, const OrbThresholds& thresholds = {});

        /// @brief Signs aspected in rasi mode, one per effective angle (sign + floor(angle / 30)).
        [[nodiscard]] static std::vector<Sign> aspected_signs(const chart::BodyPosition& position);

        [[nodiscard]] static Closeness closeness_of(f64 separation);
        [[nodiscard]] static std::string_view closeness_name(Closeness closeness);

        // ---- Chart queries ----

        [[nodiscard]] AspectMode mode() const { return m_mode; }

        /// @brief Aspect from one body to another; empty if either is missing.
        [[nodiscard]] std::optional<AspectResult> to_body(Body source, Body target) const;

        /// @brief Aspect from a body to a house (its sign in rasi mode, its cusp in degree mode).
        /// @throws std::out_of_range if @p house is outside 1..12.
        [[nodiscard]] std::optional<AspectResult> to_house(Body source, i32 house) const;

        /// @brief Aspect from a body to an arbitrary longitude.
        [[nodiscard]] std::optional<AspectResult> to_point(Body source, f64 longitude) const;

        /// @brief Every aspect a body casts on other bodies (only those with hits).
        [[nodiscard]] std::vector<AspectResult> aspects_from(Body source) const;

        /// @brief Every aspect received by a body (only those with hits).
        [[nodiscard]] std::vector<AspectResult> aspects_to(Body target) const;

        /// @brief Aspects received by a house, in catalog order of the source.
        [[nodiscard]] std::vector<AspectResult> aspects_to_house(i32 house) const;

        [[nodiscard]] AspectMatrix matrix() const;

        /// @brief Unordered body pairs within the configured conjunction orb.
        [[nodiscard]] std::vector<Conjunction> conjunctions() const;

        /// @brief Unordered pairs aspecting each other.
        [[nodiscard]] std::vector<MutualAspect> mutual_aspects() const;

        [[nodiscard]] AspectPatterns patterns() const;

    private:
        [[nodiscard]] AspectResult evaluate(const chart::BodyPosition& source, const AspectTarget& target) const;

        const chart::ChartContext& m_chart;
        AspectMode                 m_mode;
    };

} // namespace jyotish::aspect
