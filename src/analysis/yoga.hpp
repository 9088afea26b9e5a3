#pragma once

/// @file yoga.hpp
/// @brief House-scoped yoga detection and chart-level yoga collection.

#include "aspect/aspect_engine.hpp"
#include "chart/chart.hpp"
#include "core/types.hpp"

#include <optional>
#include <vector>

namespace jyotish::analysis
{
    using zodiac::Body;

    /// @brief Lord of a kendra placed in a trikona, or the reverse.
    struct KendraTrikonaYoga
    {
        Body lord;
        i32  from_house;  ///< House ruled
        i32  to_house;    ///< House occupied by the lord
    };

    /// @brief Lords of two houses occupying each other's house.
    struct ParivartanaYoga
    {
        i32  first_house;
        i32  second_house;
        Body first_lord;
        Body second_lord;
    };

    /// @brief Two occupants of one house within the conjunction orb.
    struct ConjunctionYoga
    {
        i32               house;
        Body              first;
        Body              second;
        f64               separation;
        aspect::Closeness closeness;
    };

    struct HouseYogas
    {
        i32                               house;
        std::optional<KendraTrikonaYoga>  kendra_trikona;
        std::optional<ParivartanaYoga>    parivartana;
        std::vector<ConjunctionYoga>      conjunctions;

        [[nodiscard]] bool empty() const
        {
            return !kendra_trikona && !parivartana && conjunctions.empty();
        }
    };

    /// @brief Wealth indication from the 2nd and 11th lords.
    struct DhanaYoga
    {
        Body second_lord;
        Body eleventh_lord;
    };

    /// @brief Yoga rules evaluated independently per house. Borrows the chart.
    class YogaDetector
    {
    public:
        explicit YogaDetector(const chart::ChartContext& chart);

        /// @throws std::out_of_range for houses outside 1..12 (applies to every query below).
        [[nodiscard]] std::optional<KendraTrikonaYoga> kendra_trikona(i32 house) const;
        [[nodiscard]] std::optional<ParivartanaYoga> parivartana(i32 house) const;
        [[nodiscard]] std::vector<ConjunctionYoga> conjunctions(i32 house) const;
        [[nodiscard]] HouseYogas house_yogas(i32 house) const;

        /// @brief Kendra-trikona yogas of every house, in house order.
        [[nodiscard]] std::vector<KendraTrikonaYoga> raj_yogas() const;

        /// @brief Present when both the 2nd and 11th lords are known.
        [[nodiscard]] std::optional<DhanaYoga> dhana_yoga() const;

    private:
        const chart::ChartContext& m_chart;
    };

} // namespace jyotish::analysis
