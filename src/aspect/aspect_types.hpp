#pragma once

/// @file aspect_types.hpp
/// @brief Aspect mode and orb thresholds shared by configuration and the aspect engine.

#include "core/types.hpp"

#include <string_view>

namespace jyotish::aspect
{
    /// @brief Sign-based (rasi) or orb-based (degree) aspect evaluation.
    enum class AspectMode : u8
    {
        Rasi,
        Degree,
    };

    /// @brief Orb categories in order of decreasing strength.
    enum class OrbCategory : u8
    {
        Exact,
        Close,
        Wide,
        VeryWide,
        None,
    };

    /// @brief Upper bounds (inclusive) of each orb category, in degrees.
    struct OrbThresholds
    {
        f64 exact{1.0};
        f64 close{3.0};
        f64 wide{5.0};
        f64 very_wide{8.0};

        /// @brief True if the bounds are positive and strictly increasing.
        [[nodiscard]] bool is_valid() const
        {
            return exact > 0.0 && exact < close && close < wide && wide < very_wide;
        }
    };

    /// @brief Parse "rasi" / "sign" / "degree" / "orb".
    /// @throws std::invalid_argument for anything else.
    [[nodiscard]] AspectMode aspect_mode_from_name(std::string_view name);

    [[nodiscard]] std::string_view aspect_mode_name(AspectMode mode);
    [[nodiscard]] std::string_view orb_category_name(OrbCategory category);

    /// @brief Strength attached to an orb category: 1.0, 0.75, 0.5, 0.25, 0.
    [[nodiscard]] f64 orb_strength(OrbCategory category);

} // namespace jyotish::aspect
