#pragma once

/// @file house_strength.hpp
/// @brief Weighted five-factor house strength.

#include "chart/chart.hpp"
#include "core/types.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace jyotish::analysis
{
    enum class StrengthCategory : u8
    {
        VeryStrong,  ///< >= 0.8
        Strong,      ///< >= 0.6
        Moderate,    ///< >= 0.4
        Weak,        ///< >= 0.2
        VeryWeak,
    };

    /// @brief Factor scores, each in [0, 1].
    struct StrengthFactors
    {
        f64 base{0.0};      ///< House nature
        f64 lord{0.0};      ///< Lord's dignity and placement
        f64 occupant{0.0};  ///< Mean of occupant scores
        f64 aspect{0.0};    ///< Mean of weighted incoming aspect strengths
        f64 sign{0.0};      ///< Element and quality of the cusp sign
    };

    struct HouseStrength
    {
        i32                      house;
        std::optional<zodiac::Body> lord;
        StrengthFactors          factors;
        f64                      total;
        StrengthCategory         category;
        std::vector<std::string> contributors;  ///< "Strong lord", "Weak occupant", ...
    };

    /// @brief Scores houses of one chart. Borrows the chart.
    class HouseStrengthScorer
    {
    public:
        explicit HouseStrengthScorer(const chart::ChartContext& chart);

        /// @brief Strength breakdown for one house; empty if the chart has no houses.
        /// @throws std::out_of_range if @p house is outside 1..12.
        [[nodiscard]] std::optional<HouseStrength> strength(i32 house) const;

        /// @brief All twelve houses in order (empty if the chart has no houses).
        [[nodiscard]] std::vector<HouseStrength> all() const;

        /// @brief Top @p count houses by total, ties broken by house number.
        [[nodiscard]] std::vector<HouseStrength> strongest(std::size_t count = 3) const;

        /// @brief Bottom @p count houses by total, ties broken by house number.
        [[nodiscard]] std::vector<HouseStrength> weakest(std::size_t count = 3) const;

        // ---- Factors, exposed for inspection and tests ----

        [[nodiscard]] static f64 base_score(i32 house);
        [[nodiscard]] static f64 sign_score(zodiac::Sign sign);

        /// @brief Score of a body for the lord and occupant factors.
        [[nodiscard]] f64 lord_score(i32 house) const;
        [[nodiscard]] f64 occupant_score(i32 house) const;
        [[nodiscard]] f64 aspect_score(i32 house) const;

        [[nodiscard]] static StrengthCategory category_of(f64 total);
        [[nodiscard]] static std::string_view category_name(StrengthCategory category);

        static constexpr f64 kBaseWeight     = 0.2;
        static constexpr f64 kLordWeight     = 0.3;
        static constexpr f64 kOccupantWeight = 0.25;
        static constexpr f64 kAspectWeight   = 0.15;
        static constexpr f64 kSignWeight     = 0.1;

    private:
        const chart::ChartContext& m_chart;
    };

} // namespace jyotish::analysis
