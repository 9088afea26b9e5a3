#pragma once

/// @file dignity.hpp
/// @brief Dignity of a body at a longitude and natural relationships between bodies.

#include "core/types.hpp"
#include "zodiac/identifiers.hpp"

#include <string_view>

namespace jyotish::chart
{
    /// @brief Dignity outcomes, exactly one per (body, longitude).
    enum class Dignity : u8
    {
        ExaltedExact,
        Exalted,
        DebilitatedExact,
        Debilitated,
        Moolatrikona,
        OwnSign,
        Neutral,
    };

    /// @brief Dignity collapsed to the five rows of the drishti-effect table.
    enum class DignityTier : u8
    {
        Dignified,    ///< Exalted (exact or not), Own Sign, Moolatrikona
        Friend,
        Neutral,
        Enemy,
        Debilitated,  ///< Debilitated (exact or not)
    };

    inline constexpr std::size_t kDignityTierCount = 5;

    /// @brief Static utility class resolving dignity and relationships.
    class DignityEngine
    {
    public:
        DignityEngine() = delete;

        /// @brief Dignity of a body placed at a sidereal longitude.
        ///
        /// Priority: exaltation sign, debilitation sign, owned sign
        /// (refined to Moolatrikona inside the span), otherwise Neutral.
        /// "Exact" variants apply within ±1° of the catalog degree.
        [[nodiscard]] static Dignity dignity(zodiac::Body body, f64 longitude);

        /// @brief Natural relationship of @p subject towards @p other.
        ///
        /// Looked up on the subject's own row, never mirrored; pairs the table
        /// leaves undefined return Relationship::Unknown.
        [[nodiscard]] static zodiac::Relationship relationship(zodiac::Body subject, zodiac::Body other);

        /// @brief Tier used by the drishti-effect table.
        ///
        /// The dignity chain never yields Friend or Enemy, so a Neutral
        /// placement reads the Neutral row.
        [[nodiscard]] static DignityTier drishti_tier(zodiac::Body body, f64 longitude);

        /// @brief Collapse a dignity into its tier.
        [[nodiscard]] static DignityTier tier_of(Dignity dignity);

        [[nodiscard]] static bool is_exalted(Dignity dignity);
        [[nodiscard]] static bool is_debilitated(Dignity dignity);

        /// @brief Own Sign or Moolatrikona.
        [[nodiscard]] static bool is_own(Dignity dignity);

        /// @brief Exalted, Own Sign or Moolatrikona.
        [[nodiscard]] static bool is_dignified(Dignity dignity);
    };

    [[nodiscard]] std::string_view dignity_name(Dignity dignity);
    [[nodiscard]] std::string_view dignity_tier_name(DignityTier tier);
    [[nodiscard]] std::string_view relationship_name(zodiac::Relationship relationship);

} // namespace jyotish::chart
