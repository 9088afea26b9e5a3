#pragma once

/// @file text.hpp
/// @brief Small string helpers shared by the catalog name lookups and the config parser.

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace jyotish::core
{
    /// @brief Trim leading and trailing whitespace from a string_view.
    [[nodiscard]] inline std::string_view trim(std::string_view sv)
    {
        const auto is_space = [](unsigned char c) { return std::isspace(c) != 0; };

        while (!sv.empty() && is_space(static_cast<unsigned char>(sv.front())))
        {
            sv.remove_prefix(1);
        }
        while (!sv.empty() && is_space(static_cast<unsigned char>(sv.back())))
        {
            sv.remove_suffix(1);
        }
        return sv;
    }

    /// @brief ASCII case-insensitive equality.
    [[nodiscard]] inline bool iequals(std::string_view a, std::string_view b)
    {
        return a.size() == b.size()
            && std::equal(a.begin(), a.end(), b.begin(), [](char x, char y) {
                   return std::tolower(static_cast<unsigned char>(x))
                       == std::tolower(static_cast<unsigned char>(y));
               });
    }

    /// @brief Lowercase copy with spaces, dashes and underscores removed ("Fagan-Bradley" -> "faganbradley").
    [[nodiscard]] inline std::string fold_identifier(std::string_view sv)
    {
        std::string out;
        out.reserve(sv.size());
        for (const char c : trim(sv))
        {
            if (c == ' ' || c == '-' || c == '_')
            {
                continue;
            }
            out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
        return out;
    }

} // namespace jyotish::core
