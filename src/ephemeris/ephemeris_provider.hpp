#pragma once

/// @file ephemeris_provider.hpp
/// @brief Source of raw body positions and the ascendant for a chart instant.

#include "astro/time_system.hpp"
#include "chart/chart.hpp"
#include "core/types.hpp"

#include <array>
#include <optional>

namespace jyotish::ephemeris
{
    using zodiac::Body;

    /// @brief Ephemeris collaborator queried once per body before a chart is built.
    ///
    /// Longitudes are tropical unless sidereal() says otherwise. An empty
    /// result means the provider has nothing for that body or instant.
    class EphemerisProvider
    {
    public:
        virtual ~EphemerisProvider() = default;

        [[nodiscard]] virtual std::optional<chart::RawPosition> position(Body body, f64 jd) const = 0;

        [[nodiscard]] virtual std::optional<f64> ascendant(f64 jd, f64 latitude, f64 longitude) const = 0;

        /// @brief True if the provider already applies the ayanamsa.
        [[nodiscard]] virtual bool sidereal() const { return false; }
    };

    /// @brief Fixed table of positions, independent of the instant.
    class StaticEphemeris final : public EphemerisProvider
    {
    public:
        StaticEphemeris() = default;
        explicit StaticEphemeris(bool sidereal_frame);

        void set_position(Body body, const chart::RawPosition& raw);
        void set_ascendant(f64 longitude);
        void clear_position(Body body);

        [[nodiscard]] std::optional<chart::RawPosition> position(Body body, f64 jd) const override;
        [[nodiscard]] std::optional<f64> ascendant(f64 jd, f64 latitude, f64 longitude) const override;
        [[nodiscard]] bool sidereal() const override { return m_sidereal; }

        /// @brief Number of bodies with a position.
        [[nodiscard]] i32 body_count() const;

    private:
        std::array<std::optional<chart::RawPosition>, zodiac_constants::kBodyCount> m_positions{};
        std::optional<f64> m_ascendant;
        bool               m_sidereal{false};
    };

    /// @brief Gather everything the pipeline needs from a provider into a request.
    ///
    /// Each body is queried exactly once. Missing bodies stay empty in the
    /// request; the chart builder decides what to do with them.
    [[nodiscard]] chart::ChartRequest make_request(const EphemerisProvider& provider,
                                                   const astro::DateTime& utc,
                                                   f64 latitude, f64 longitude);

} // namespace jyotish::ephemeris
