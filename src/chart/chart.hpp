#pragma once

/// @file chart.hpp
/// @brief Chart request, the immutable ChartContext aggregate, and its builder.

#include "astro/time_system.hpp"
#include "chart/dignity.hpp"
#include "chart/houses.hpp"
#include "chart/position.hpp"
#include "config/chart_config.hpp"
#include "core/types.hpp"

#include <array>
#include <optional>
#include <vector>

namespace jyotish::chart
{
    using PositionSlots = std::array<std::optional<BodyPosition>, zodiac_constants::kBodyCount>;

    /// @brief Everything the pipeline needs for one chart, gathered up front.
    ///
    /// Positions are tropical unless `sidereal_input` is set. A missing body
    /// slot means the ephemeris had nothing for that body.
    struct ChartRequest
    {
        astro::DateTime utc{2000, 1, 1, 12, 0, 0.0};
        f64  latitude{0.0};    ///< Degrees, north positive
        f64  longitude{0.0};   ///< Degrees, east positive
        std::array<std::optional<RawPosition>, zodiac_constants::kBodyCount> raw_positions{};
        std::optional<f64> ascendant;          ///< From the ephemeris collaborator, same frame as positions
        bool sidereal_input{false};
        bool allow_ascendant_fallback{true};   ///< Use the LST formula when `ascendant` is empty

        void set_position(Body body, const RawPosition& raw)
        {
            raw_positions[zodiac::index_of(body)] = raw;
        }
    };

    /// @brief Read-only result of one chart computation.
    ///
    /// Per-body and per-house results are individually optional: an incomplete
    /// chart omits what could not be derived instead of failing as a whole.
    class ChartContext
    {
    public:
        [[nodiscard]] f64 julian_day() const { return m_julian_day; }

        /// @brief Ayanamsa applied to tropical input, in degrees.
        [[nodiscard]] f64 ayanamsa() const { return m_ayanamsa; }

        [[nodiscard]] const config::ChartConfig& config() const { return m_config; }
        [[nodiscard]] aspect::AspectMode aspect_mode() const { return m_config.aspect_mode; }

        /// @brief Sidereal ascendant, if one could be determined.
        [[nodiscard]] const std::optional<f64>& ascendant() const { return m_ascendant; }

        /// @brief True when the ascendant came from the LST fallback formula.
        [[nodiscard]] bool ascendant_from_fallback() const { return m_ascendant_fallback; }

        [[nodiscard]] const std::optional<BodyPosition>& position(Body body) const;
        [[nodiscard]] const PositionSlots& positions() const { return m_positions; }

        /// @brief Bodies with a derived position, in catalog order.
        [[nodiscard]] std::vector<Body> present_bodies() const;

        /// @brief Bodies the ephemeris could not supply, in catalog order.
        [[nodiscard]] std::vector<Body> missing_bodies() const;

        /// @brief True when the ascendant and all nine bodies are present.
        [[nodiscard]] bool is_complete() const;

        [[nodiscard]] const std::optional<HouseSet>& houses() const { return m_houses; }

        /// @brief House by number.
        /// @throws std::out_of_range if @p number is outside 1..12.
        [[nodiscard]] std::optional<House> house(i32 number) const;

        /// @brief House a body occupies, if both are known.
        [[nodiscard]] std::optional<i32> house_of(Body body) const;

        /// @brief Bodies occupying a house, in catalog order (empty if unknown).
        /// @throws std::out_of_range if @p number is outside 1..12.
        [[nodiscard]] std::vector<Body> occupants(i32 number) const;

        /// @brief Ruler of the sign on the house cusp.
        /// @throws std::out_of_range if @p number is outside 1..12.
        [[nodiscard]] std::optional<Body> lord_of(i32 number) const;

        /// @brief Dignity of a body at its own position.
        [[nodiscard]] std::optional<Dignity> dignity_of(Body body) const;

        /// @brief True if the body sits within a house-junction zone.
        [[nodiscard]] std::optional<bool> in_sandhi(Body body) const;

    private:
        friend class ChartBuilder;

        config::ChartConfig     m_config{};
        f64                     m_julian_day{astro_constants::kJ2000};
        f64                     m_ayanamsa{0.0};
        std::optional<f64>      m_ascendant;
        bool                    m_ascendant_fallback{false};
        PositionSlots           m_positions{};
        std::optional<HouseSet> m_houses;
    };

    /// @brief Static utility class running the pipeline for one request.
    class ChartBuilder
    {
    public:
        ChartBuilder() = delete;

        /// @brief Derive positions, ascendant and houses.
        ///
        /// Never fails for missing data: absent bodies are logged and left
        /// empty, and without an ascendant the chart simply has no houses.
        [[nodiscard]] static ChartContext build(const ChartRequest& request,
                                                const config::ChartConfig& config = {});
    };

} // namespace jyotish::chart
