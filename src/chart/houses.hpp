#pragma once

/// @file houses.hpp
/// @brief Equal-house construction from the ascendant and house-number rules.

#include "core/types.hpp"
#include "zodiac/identifiers.hpp"

#include <array>
#include <string_view>
#include <vector>

namespace jyotish::chart
{
    /// @brief House systems. Only equal houses are implemented; others are
    /// an extension point and are rejected when parsed.
    enum class HouseSystem : u8
    {
        Equal,
    };

    /// @brief Classification flags, a pure function of the house number.
    struct HouseFlags
    {
        bool kendra{false};    ///< 1, 4, 7, 10
        bool trikona{false};   ///< 1, 5, 9
        bool upachaya{false};  ///< 3, 6, 10, 11
        bool dusthana{false};  ///< 6, 8, 12
        bool maraka{false};    ///< 2, 7
    };

    /// @brief One bhava.
    struct House
    {
        i32          number;           ///< 1..12
        f64          cusp;             ///< Start longitude, [0, 360)
        f64          next_cusp;        ///< Cusp of the following house
        zodiac::Sign sign;             ///< Sign on the cusp
        f64          cusp_degrees;     ///< Degrees of the cusp within its sign
        f64          span;             ///< Arc from cusp to next cusp
        f64          midpoint;         ///< Bhava madhya
        f64          sandhi_start;     ///< cusp - sandhi width
        f64          sandhi_end;       ///< cusp + sandhi width
        HouseFlags   flags;

        /// @brief Cyclic containment in [cusp, next_cusp).
        [[nodiscard]] bool contains(f64 longitude) const;

        /// @brief True within the junction zone around this house's cusp (inclusive).
        [[nodiscard]] bool in_sandhi(f64 longitude) const;
    };

    using HouseSet = std::array<House, zodiac_constants::kHouseCount>;

    /// @brief Static utility class building and querying the 12 houses.
    class HouseBuilder
    {
    public:
        HouseBuilder() = delete;

        /// @brief Equal houses: cusp(i) = normalize(ascendant + (i - 1) × 30).
        /// @param ascendant Sidereal ascendant longitude.
        /// @param sandhi_width Half-width of the junction zone around each cusp.
        [[nodiscard]] static HouseSet build(f64 ascendant, f64 sandhi_width = kDefaultSandhiWidth);

        /// @brief House number (1..12) containing a longitude.
        [[nodiscard]] static i32 house_of(const HouseSet& houses, f64 longitude);

        /// @brief True if the longitude sits in any house's junction zone.
        [[nodiscard]] static bool in_any_sandhi(const HouseSet& houses, f64 longitude);

        /// @brief Parse a house system name ("equal").
        /// @throws std::invalid_argument for anything else.
        [[nodiscard]] static HouseSystem system_from_name(std::string_view name);

        static constexpr f64 kDefaultSandhiWidth = 2.0;
    };

    // ---- House-number rules (all throw std::out_of_range outside 1..12) ----

    /// @brief Validate a house number.
    /// @throws std::out_of_range if @p number is outside 1..12.
    void require_house_number(i32 number);

    [[nodiscard]] HouseFlags house_flags(i32 number);
    [[nodiscard]] bool is_kendra(i32 number);
    [[nodiscard]] bool is_trikona(i32 number);
    [[nodiscard]] bool is_upachaya(i32 number);
    [[nodiscard]] bool is_dusthana(i32 number);
    [[nodiscard]] bool is_maraka(i32 number);

    /// @brief The 7th house from @p number.
    [[nodiscard]] i32 opposite_house(i32 number);

    /// @brief 1st, 5th and 9th houses counted from @p number.
    [[nodiscard]] std::vector<i32> trikona_houses(i32 number);

    /// @brief 1st, 4th, 7th and 10th houses counted from @p number.
    [[nodiscard]] std::vector<i32> kendra_houses(i32 number);

    /// @brief Inclusive forward count between houses: same house 1, next house 2.
    [[nodiscard]] i32 house_distance(i32 from, i32 to);

    /// @brief Traditional name ("Lagna", "Dhana", ...).
    [[nodiscard]] std::string_view house_name(i32 number);

} // namespace jyotish::chart
