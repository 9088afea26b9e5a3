/// @file chart_config.cpp
/// @brief YAML loading for ChartConfig.

#include "config/chart_config.hpp"

#include "core/logger.hpp"

#include <spdlog/fmt/fmt.h>
#include <yaml-cpp/yaml.h>

#include <array>
#include <stdexcept>
#include <string>

namespace jyotish::config
{

namespace
{
    constexpr std::array<std::string_view, 9> kKnownKeys{
        "ayanamsa", "aspect_mode", "house_system", "sandhi_width",
        "conjunction_orb", "precession_arcsec_per_year", "ayanamsa_values", "orbs",
        "logging",
    };

    [[nodiscard]] bool is_known_key(const std::string& key)
    {
        for (const auto known : kKnownKeys)
        {
            if (key == known)
            {
                return true;
            }
        }
        return false;
    }

    // Overwrite `target` when `node[key]` is present
    void read_f64(const YAML::Node& node, const char* key, f64& target)
    {
        if (const YAML::Node value = node[key])
        {
            target = value.as<f64>();
        }
    }

    [[nodiscard]] spdlog::level::level_enum parse_level(const YAML::Node& node)
    {
        const auto name = node.as<std::string>();
        const auto level = core::Logger::level_from_name(name);
        if (!level)
        {
            throw std::invalid_argument(fmt::format("unknown log level: '{}'", name));
        }
        return *level;
    }

    void read_logging(const YAML::Node& node, core::LogSettings& logging)
    {
        if (const YAML::Node level = node["level"])
        {
            logging.core_level = parse_level(level);
        }
        if (const YAML::Node level = node["app_level"])
        {
            logging.app_level = parse_level(level);
        }
        if (const YAML::Node file = node["file"])
        {
            logging.file = file.IsNull() ? std::string{} : file.as<std::string>();
        }
        if (const YAML::Node console = node["console"])
        {
            logging.console = console.as<bool>();
        }
    }

    // -----------------------------------------------------------------
    // Build a ChartConfig from a parsed document.
    // Throws YAML::Exception for type errors and std::invalid_argument
    // for unknown identifiers; the callers translate both into nullopt.
    // -----------------------------------------------------------------
    [[nodiscard]] std::optional<ChartConfig> from_node(const YAML::Node& root)
    {
        ChartConfig config{};

        if (!root || root.IsNull())
        {
            return config;
        }
        if (!root.IsMap())
        {
            JYO_CORE_ERROR("ConfigLoader: top-level YAML node must be a map");
            return std::nullopt;
        }

        for (const auto& entry : root)
        {
            const auto key = entry.first.as<std::string>();
            if (!is_known_key(key))
            {
                JYO_CORE_WARN("ConfigLoader: ignoring unknown key '{}'", key);
            }
        }

        if (const YAML::Node ayanamsa = root["ayanamsa"])
        {
            config.ayanamsa = astro::Ayanamsa::parse(ayanamsa.as<std::string>());
        }
        if (const YAML::Node mode = root["aspect_mode"])
        {
            config.aspect_mode = aspect::aspect_mode_from_name(mode.as<std::string>());
        }
        if (const YAML::Node system = root["house_system"])
        {
            config.house_system = chart::HouseBuilder::system_from_name(system.as<std::string>());
        }

        read_f64(root, "sandhi_width", config.sandhi_width_deg);
        read_f64(root, "conjunction_orb", config.conjunction_orb_deg);
        read_f64(root, "precession_arcsec_per_year", config.ayanamsa_model.precession_arcsec_per_year);

        if (const YAML::Node values = root["ayanamsa_values"])
        {
            for (const auto& entry : values)
            {
                const auto name = entry.first.as<std::string>();
                const auto system = astro::Ayanamsa::from_name(name);
                if (!system)
                {
                    JYO_CORE_WARN("ConfigLoader: ignoring ayanamsa value for unknown system '{}'", name);
                    continue;
                }
                config.ayanamsa_model.base_at_j2000[static_cast<std::size_t>(*system)] = entry.second.as<f64>();
            }
        }

        if (const YAML::Node orbs = root["orbs"])
        {
            read_f64(orbs, "exact", config.orbs.exact);
            read_f64(orbs, "close", config.orbs.close);
            read_f64(orbs, "wide", config.orbs.wide);
            read_f64(orbs, "very_wide", config.orbs.very_wide);
        }

        if (const YAML::Node logging = root["logging"])
        {
            if (!logging.IsMap())
            {
                JYO_CORE_ERROR("ConfigLoader: 'logging' must be a map");
                return std::nullopt;
            }
            read_logging(logging, config.logging);
        }

        if (!config.orbs.is_valid())
        {
            JYO_CORE_ERROR("ConfigLoader: orb thresholds must be positive and increasing ({}, {}, {}, {})",
                           config.orbs.exact, config.orbs.close, config.orbs.wide, config.orbs.very_wide);
            return std::nullopt;
        }
        if (config.sandhi_width_deg < 0.0 || config.conjunction_orb_deg < 0.0)
        {
            JYO_CORE_ERROR("ConfigLoader: sandhi_width and conjunction_orb must not be negative");
            return std::nullopt;
        }

        return config;
    }
}

std::optional<ChartConfig> ConfigLoader::load_file(const std::filesystem::path& path)
{
    try
    {
        const YAML::Node root = YAML::LoadFile(path.string());
        auto config = from_node(root);
        if (config)
        {
            JYO_CORE_INFO("ConfigLoader: Loaded chart config from {}", path.string());
        }
        return config;
    }
    catch (const YAML::Exception& e)
    {
        JYO_CORE_ERROR("ConfigLoader: Failed to read {}: {}", path.string(), e.what());
    }
    catch (const std::invalid_argument& e)
    {
        JYO_CORE_ERROR("ConfigLoader: Invalid value in {}: {}", path.string(), e.what());
    }
    return std::nullopt;
}

std::optional<ChartConfig> ConfigLoader::parse(std::string_view yaml_text)
{
    try
    {
        return from_node(YAML::Load(std::string(yaml_text)));
    }
    catch (const YAML::Exception& e)
    {
        JYO_CORE_ERROR("ConfigLoader: Failed to parse YAML: {}", e.what());
    }
    catch (const std::invalid_argument& e)
    {
        JYO_CORE_ERROR("ConfigLoader: Invalid value: {}", e.what());
    }
    return std::nullopt;
}

} // namespace jyotish::config
