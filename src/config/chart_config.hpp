#pragma once

/// @file chart_config.hpp
/// @brief Per-chart settings and their YAML loader.

#include "aspect/aspect_types.hpp"
#include "astro/ayanamsa.hpp"
#include "chart/houses.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace jyotish::config
{
    /// @brief Settings threaded explicitly through one chart computation.
    ///
    /// Every field has a usable default, so `ChartConfig{}` is the standard
    /// Lahiri / rasi-aspect / equal-house setup.
    struct ChartConfig
    {
        astro::AyanamsaSystem ayanamsa{astro::AyanamsaSystem::Lahiri};
        astro::AyanamsaModel  ayanamsa_model{};
        aspect::AspectMode    aspect_mode{aspect::AspectMode::Rasi};
        aspect::OrbThresholds orbs{};
        chart::HouseSystem    house_system{chart::HouseSystem::Equal};
        f64                   sandhi_width_deg{2.0};
        f64                   conjunction_orb_deg{8.0};
        core::LogSettings     logging{};  ///< Applied by the executable through Logger::configure
    };

    /// @brief Static utility class reading ChartConfig from YAML.
    ///
    /// Recognized keys (all optional):
    ///   ayanamsa, aspect_mode, house_system, sandhi_width, conjunction_orb,
    ///   precession_arcsec_per_year, ayanamsa_values (map name -> degrees),
    ///   orbs (map with exact, close, wide, very_wide),
    ///   logging (map with level, app_level, file, console).
    /// Unknown keys are ignored with a warning.
    class ConfigLoader
    {
    public:
        ConfigLoader() = delete;

        /// @brief Load settings from a YAML file.
        /// @return The settings, or std::nullopt if the file is unreadable or invalid.
        [[nodiscard]] static std::optional<ChartConfig> load_file(const std::filesystem::path& path);

        /// @brief Parse settings from an in-memory YAML document.
        /// @return The settings, or std::nullopt if the document is invalid.
        [[nodiscard]] static std::optional<ChartConfig> parse(std::string_view yaml_text);
    };

} // namespace jyotish::config
