#pragma once

/// @file nakshatra.hpp
/// @brief The 27 lunar mansions and their Vimshottari lords.

#include "zodiac/identifiers.hpp"

#include <string_view>

namespace jyotish::zodiac
{
    struct NakshatraInfo
    {
        i32              index;  ///< 0..26, Ashwini = 0
        std::string_view name;
        Body             lord;
    };

    /// @brief Catalog row by index.
    /// @throws std::out_of_range if index is outside 0..26.
    [[nodiscard]] const NakshatraInfo& nakshatra_info(i32 index);

    /// @brief Look up a nakshatra by name (case-insensitive).
    /// @throws std::invalid_argument if the name is unknown.
    [[nodiscard]] const NakshatraInfo& nakshatra_from_name(std::string_view name);

    /// @brief Mansion index of a sidereal longitude, 27 equal 13°20' segments.
    [[nodiscard]] i32 nakshatra_index(f64 longitude);

    /// @brief Quarter (pada) 1..4 within the mansion.
    [[nodiscard]] i32 pada_of(f64 longitude);

    /// @brief Degrees elapsed inside the mansion, in [0, 13.333...).
    [[nodiscard]] f64 degrees_in_nakshatra(f64 longitude);

} // namespace jyotish::zodiac
