#pragma once

/// @file chara_karaka.hpp
/// @brief Variable significators (chara karakas) ranked from sign degrees.

#include "chart/chart.hpp"
#include "core/types.hpp"

#include <array>
#include <optional>
#include <string_view>
#include <vector>

namespace jyotish::analysis
{
    using zodiac::Body;

    enum class Karaka : u8
    {
        Atma,      ///< AK
        Amatya,    ///< AmK
        Bhratri,   ///< BK
        Matri,     ///< MK
        Pitru,     ///< PiK
        Putra,     ///< PK
        Gnati,     ///< GK
        Dara,      ///< DK
    };

    inline constexpr std::size_t kKarakaCount = 8;

    enum class KarakaMethod : u8
    {
        Standard,  ///< Degrees in sign
        Advanced,  ///< Total degrees travelled in the sign
    };

    /// @brief Travel of a body through its current sign, in degrees within the sign.
    struct SignTravel
    {
        f64 entry_point{0.0};
        f64 max_forward{0.0};  ///< Furthest point reached before any retrograde turn
    };

    using TravelTable = std::array<std::optional<SignTravel>, zodiac_constants::kBodyCount>;

    struct KarakaAssignment
    {
        Body         body;
        Karaka       karaka;
        f64          degrees;  ///< Ranking measure
        KarakaMethod method;
    };

    /// @brief Static utility class assigning chara karakas. Ketu never takes part.
    class CharaKaraka
    {
    public:
        CharaKaraka() = delete;

        /// @brief Rank by degrees in sign (Rahu counts 30 - degrees).
        [[nodiscard]] static std::vector<KarakaAssignment> standard(const chart::ChartContext& chart);

        /// @brief Rank by degrees travelled; bodies without travel data, Sun, Moon and Rahu
        /// fall back to the standard measure.
        [[nodiscard]] static std::vector<KarakaAssignment> advanced(const chart::ChartContext& chart,
                                                                    const TravelTable& travel);

        /// @brief Total travel within the sign for one body.
        [[nodiscard]] static f64 travelled(f64 degrees_in_sign, const SignTravel& travel);

        [[nodiscard]] static std::string_view abbreviation(Karaka karaka);
        [[nodiscard]] static std::string_view name(Karaka karaka);
        [[nodiscard]] static std::string_view method_name(KarakaMethod method);
    };

} // namespace jyotish::analysis
