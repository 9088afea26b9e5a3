#pragma once

/// @file body.hpp
/// @brief Immutable catalog of the nine bodies and their rule data.

#include "zodiac/identifiers.hpp"

#include <span>
#include <string_view>
#include <vector>

namespace jyotish::zodiac
{
    /// @brief A sign plus an exact degree inside it (exaltation/debilitation point).
    struct DegreePoint
    {
        Sign sign;
        f64  degree;
    };

    /// @brief Moolatrikona sub-range, inclusive at both ends.
    struct MoolatrikonaRange
    {
        Sign sign;
        f64  from_deg;
        f64  to_deg;
    };

    /// @brief One row of the body catalog.
    struct BodyInfo
    {
        Body             body;
        std::string_view name;
        std::string_view sanskrit;
        Nature           nature;           ///< Drishti-effect classification (Mercury is Neutral)
        bool             scoring_benefic;  ///< Benefic for house-strength scoring (Mercury included)
        std::array<Relationship, zodiac_constants::kBodyCount> relations;
        SignMask          owned_signs;
        MoolatrikonaRange moolatrikona;
        DegreePoint       exaltation;
        DegreePoint       debilitation;
        std::array<f64, 3> aspect_angles;  ///< Special-aspect angles, forward from own longitude
        u8                 aspect_angle_count;

        /// @brief Base (non-retrograde) special-aspect angle set.
        [[nodiscard]] std::span<const f64> base_aspect_angles() const
        {
            return {aspect_angles.data(), aspect_angle_count};
        }

        [[nodiscard]] bool owns(Sign sign) const { return (owned_signs & bit(sign)) != 0; }
    };

    /// @brief Catalog row for a body.
    [[nodiscard]] const BodyInfo& body_info(Body body);

    /// @brief English display name ("Jupiter").
    [[nodiscard]] std::string_view body_name(Body body);

    /// @brief Look up a body by English or Sanskrit name (case-insensitive).
    /// @throws std::invalid_argument if the name is unknown.
    [[nodiscard]] Body body_from_name(std::string_view name);

    /// @brief Look up a body by catalog index 0..8.
    /// @throws std::out_of_range for any other index.
    [[nodiscard]] Body body_from_index(i32 index);

    /// @brief Signs owned by a body, in zodiac order (empty for the nodes).
    [[nodiscard]] std::vector<Sign> owned_signs(Body body);

    /// @brief Natural nature name: "Benefic", "Malefic" or "Neutral".
    [[nodiscard]] std::string_view nature_name(Nature nature);

} // namespace jyotish::zodiac
