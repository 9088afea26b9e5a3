#pragma once

/// @file sign.hpp
/// @brief Immutable catalog of the twelve signs and sign-to-sign relations.

#include "zodiac/identifiers.hpp"

#include <optional>
#include <string_view>
#include <vector>

namespace jyotish::zodiac
{
    /// @brief One row of the sign catalog.
    struct SignInfo
    {
        Sign                sign;
        std::string_view    name;
        std::string_view    sanskrit;
        Element             element;
        Quality             quality;
        Gender              gender;
        Body                ruler;
        std::optional<Body> exaltation_body;
        std::optional<Body> debilitation_body;
        BodyMask            friends;
        BodyMask            enemies;

        /// @brief 1-based position in the zodiac (Aries = 1).
        [[nodiscard]] i32 number() const { return index_of(sign) + 1; }
    };

    /// @brief Catalog row for a sign.
    [[nodiscard]] const SignInfo& sign_info(Sign sign);

    /// @brief English display name ("Cancer").
    [[nodiscard]] std::string_view sign_name(Sign sign);

    /// @brief Look up a sign by English or Sanskrit name (case-insensitive).
    /// @throws std::invalid_argument if the name is unknown.
    [[nodiscard]] Sign sign_from_name(std::string_view name);

    /// @brief Look up a sign by zero-based index 0..11.
    /// @throws std::out_of_range for any other index.
    [[nodiscard]] Sign sign_from_index(i32 index);

    /// @brief Sign containing a longitude. Any finite longitude is accepted.
    [[nodiscard]] Sign sign_of(f64 longitude);

    /// @brief Sign a given number of steps forward (negative steps go backward).
    [[nodiscard]] Sign advance(Sign sign, i32 steps);

    /// @brief The 7th sign (index + 6 mod 12).
    [[nodiscard]] Sign opposite(Sign sign);

    /// @brief Inclusive forward count from one sign to another: same sign 1, next sign 2, previous 12.
    [[nodiscard]] i32 sign_distance(Sign from, Sign to);

    /// @brief 1st, 5th and 9th signs from the given one.
    [[nodiscard]] std::vector<Sign> trikona_signs(Sign sign);

    /// @brief 1st, 4th, 7th and 10th signs from the given one.
    [[nodiscard]] std::vector<Sign> kendra_signs(Sign sign);

    /// @brief All signs sharing the element, the given sign included.
    [[nodiscard]] std::vector<Sign> same_element_signs(Sign sign);

    /// @brief All signs sharing the quality, the given sign included.
    [[nodiscard]] std::vector<Sign> same_quality_signs(Sign sign);

    /// @brief Odd by 1-based count (Aries, Gemini, Leo, ...).
    [[nodiscard]] bool is_odd_sign(Sign sign);

    /// @brief Signs aspected by a sign under rasi drishti, in zodiac order.
    ///
    /// Every sign aspects its 7th. Cardinal (movable) signs also aspect the
    /// fixed signs, fixed signs the mutable (dual) signs and mutable signs
    /// the cardinal signs, skipping the 2nd and 12th from the source.
    [[nodiscard]] std::vector<Sign> rasi_aspects(Sign sign);

    /// @brief True if @p from aspects @p to under rasi drishti.
    [[nodiscard]] bool rasi_aspects_sign(Sign from, Sign to);

    /// @brief True if the body is listed as friendly to the sign.
    [[nodiscard]] bool sign_befriends(Sign sign, Body body);

    /// @brief True if the body is listed as hostile to the sign.
    [[nodiscard]] bool sign_opposes(Sign sign, Body body);

    [[nodiscard]] std::string_view element_name(Element element);
    [[nodiscard]] std::string_view quality_name(Quality quality);

    /// @brief Traditional name of a quality: "Movable", "Fixed" or "Dual".
    [[nodiscard]] std::string_view quality_nature_name(Quality quality);

} // namespace jyotish::zodiac
