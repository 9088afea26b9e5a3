#pragma once

/// @file drishti.hpp
/// @brief Qualitative drishti effects and per-house aspect reports.

#include "aspect/aspect_engine.hpp"
#include "chart/dignity.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jyotish::aspect
{
    /// @brief Outcome of the (dignity tier × nature) table.
    enum class DrishtiEffect : u8
    {
        VeryAuspicious,
        Auspicious,
        MildlyAuspicious,
        Neutral,
        MildlyInauspicious,
        Inauspicious,
        VeryInauspicious,
        ExtremelyInauspicious,
    };

    /// @brief Degree-mode prefix derived from orb strength.
    enum class StrengthQualifier : u8
    {
        Strong,    ///< strength >= 0.75
        Moderate,  ///< strength >= 0.5
        Weak,
    };

    /// @brief One aspect received by a house, with its interpretation.
    struct HouseAspect
    {
        Body                             body;
        f64                              angle;
        std::string_view                 aspect_name;  ///< Ordinal label for display ("7th Aspect")
        chart::Dignity                   dignity;      ///< Aspecting body's dignity at the aspected position
        chart::DignityTier               tier;
        zodiac::Nature                   nature;
        OrbCategory                      category;
        f64                              strength;
        DrishtiEffect                    effect;
        std::optional<StrengthQualifier> qualifier;    ///< Degree mode only
        std::string                      label;        ///< "Strong Very Auspicious", "Inauspicious", ...
    };

    /// @brief All aspects received by one house plus their tally.
    struct HouseAspectReport
    {
        i32                      house;
        AspectMode               mode;
        std::vector<HouseAspect> aspects;   ///< Sorted by strength, strongest first (stable)
        i32                      auspicious{0};
        i32                      inauspicious{0};
        i32                      neutral{0};
        std::string_view         overall;   ///< "Predominantly Auspicious", ..., "No major aspects"
    };

    /// @brief Static utility class holding the drishti rule table.
    class Drishti
    {
    public:
        Drishti() = delete;

        /// @brief Lookup in the 5 × 2 effect table; a Neutral nature always yields Neutral.
        [[nodiscard]] static DrishtiEffect effect(chart::DignityTier tier, zodiac::Nature nature);

        [[nodiscard]] static StrengthQualifier qualifier(f64 strength);

        /// @brief Effect label with an optional strength prefix.
        [[nodiscard]] static std::string label(DrishtiEffect effect, std::optional<StrengthQualifier> qualifier);

        /// @brief Ordinal aspect name from an angle (30 -> "2nd Aspect", 180 -> "7th Aspect").
        /// Display only; computations always use the angle.
        [[nodiscard]] static std::string_view aspect_name(f64 angle);

        [[nodiscard]] static std::string_view effect_name(DrishtiEffect effect);
        [[nodiscard]] static std::string_view qualifier_name(StrengthQualifier qualifier);

        [[nodiscard]] static bool is_auspicious(DrishtiEffect effect);
        [[nodiscard]] static bool is_inauspicious(DrishtiEffect effect);

        /// @brief Aspects received by a house in the chart's aspect mode.
        ///
        /// Rasi mode: the aspecting body's dignity is taken at the middle of
        /// the aspected sign. Degree mode: at source longitude + angle, with
        /// the orb measured to the house cusp.
        /// @return Empty when the chart has no houses.
        /// @throws std::out_of_range if @p house is outside 1..12.
        [[nodiscard]] static std::optional<HouseAspectReport> house_report(const chart::ChartContext& chart, i32 house);
    };

} // namespace jyotish::aspect
