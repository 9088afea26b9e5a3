#pragma once

/// @file coordinates.hpp
/// @brief Ecliptic geometry needed to place the ascendant without an ephemeris.

#include "core/types.hpp"

namespace jyotish::astro
{
    /// @brief Observer geographic location, in degrees.
    struct ObserverLocation
    {
        f64 latitude_deg;   ///< Geographic latitude (north positive)
        f64 longitude_deg;  ///< Geographic longitude (east positive)
    };

    /// @brief Static utility class for ecliptic/horizon relations.
    ///
    /// All angular inputs and outputs are in degrees; conversion to radians
    /// happens only around the trigonometric calls.
    class Coordinates
    {
    public:
        Coordinates() = delete;

        /// @brief Mean obliquity of the ecliptic (IAU 1980 polynomial).
        /// @param jd Julian Day.
        /// @return Obliquity in degrees (about 23.44 near J2000).
        [[nodiscard]] static f64 mean_obliquity(f64 jd);

        /// @brief Tropical ecliptic longitude rising on the eastern horizon.
        ///
        /// Used as the fallback when the ephemeris collaborator cannot
        /// supply the ascendant. Latitudes beyond ±kMaxLatitude are clamped
        /// since the horizon/ecliptic intersection degenerates at the poles.
        ///
        /// @param lst_deg Local sidereal time expressed in degrees (RAMC).
        /// @param latitude_deg Geographic latitude.
        /// @param obliquity_deg Obliquity of the ecliptic.
        /// @return Tropical ascendant in [0, 360).
        [[nodiscard]] static f64 ascendant(f64 lst_deg, f64 latitude_deg, f64 obliquity_deg);

        /// @brief Tropical midheaven (ecliptic longitude culminating on the meridian).
        [[nodiscard]] static f64 midheaven(f64 lst_deg, f64 obliquity_deg);

        /// @brief Convenience: tropical ascendant for an instant and location.
        [[nodiscard]] static f64 ascendant_at(f64 jd, const ObserverLocation& observer);

        static constexpr f64 kMaxLatitude = 89.9;
    };

} // namespace jyotish::astro
