#pragma once

/// @file identifiers.hpp
/// @brief Enum keys shared by the sign, body and nakshatra catalogs.

#include "core/types.hpp"

#include <array>

namespace jyotish::zodiac
{
    /// @brief The nine computational bodies (grahas), in catalog order.
    enum class Body : u8
    {
        Sun,
        Moon,
        Mars,
        Mercury,
        Jupiter,
        Venus,
        Saturn,
        Rahu,
        Ketu,
    };

    /// @brief The twelve sidereal signs (rasis), Aries = 0.
    enum class Sign : u8
    {
        Aries,
        Taurus,
        Gemini,
        Cancer,
        Leo,
        Virgo,
        Libra,
        Scorpio,
        Sagittarius,
        Capricorn,
        Aquarius,
        Pisces,
    };

    enum class Element : u8 { Fire, Earth, Air, Water };
    enum class Quality : u8 { Cardinal, Fixed, Mutable };
    enum class Gender  : u8 { Male, Female };

    /// @brief Natural benefic/malefic classification used by drishti effects.
    enum class Nature : u8 { Benefic, Malefic, Neutral };

    /// @brief Natural relationship of one body towards another.
    /// Unknown marks pairs the rule table leaves undefined (node vs. node, self).
    enum class Relationship : u8 { Friend, Neutral, Enemy, Unknown };

    inline constexpr std::array<Body, zodiac_constants::kBodyCount> kAllBodies{
        Body::Sun, Body::Moon, Body::Mars, Body::Mercury, Body::Jupiter,
        Body::Venus, Body::Saturn, Body::Rahu, Body::Ketu,
    };

    inline constexpr std::array<Sign, zodiac_constants::kSignCount> kAllSigns{
        Sign::Aries, Sign::Taurus, Sign::Gemini, Sign::Cancer, Sign::Leo, Sign::Virgo,
        Sign::Libra, Sign::Scorpio, Sign::Sagittarius, Sign::Capricorn, Sign::Aquarius, Sign::Pisces,
    };

    /// @brief Array slot of a body.
    [[nodiscard]] constexpr std::size_t index_of(Body body) { return static_cast<std::size_t>(body); }

    /// @brief Zero-based index of a sign.
    [[nodiscard]] constexpr i32 index_of(Sign sign) { return static_cast<i32>(sign); }

    // ---- Bit sets of bodies / signs for catalog membership tests ----

    using BodyMask = u16;
    using SignMask = u16;

    [[nodiscard]] constexpr BodyMask bit(Body body) { return static_cast<BodyMask>(1u << index_of(body)); }
    [[nodiscard]] constexpr SignMask bit(Sign sign) { return static_cast<SignMask>(1u << index_of(sign)); }

    template <typename... Ts>
    [[nodiscard]] constexpr u16 mask_of(Ts... items)
    {
        return static_cast<u16>((0u | ... | bit(items)));
    }

} // namespace jyotish::zodiac
