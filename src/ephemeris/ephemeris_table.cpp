/// @file ephemeris_table.cpp
/// @brief Implementation of the CSV position table loader.

#include "ephemeris/ephemeris_table.hpp"

#include "core/logger.hpp"
#include "core/text.hpp"
#include "zodiac/body.hpp"

#include <charconv>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>

namespace jyotish::ephemeris
{

// -----------------------------------------------------------------
// Load position CSV: Body,Longitude_deg,Latitude_deg,Speed_deg_per_day
// -----------------------------------------------------------------

std::optional<StaticEphemeris>
EphemerisTableLoader::load_csv(const std::filesystem::path& path, bool sidereal_frame)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        JYO_CORE_ERROR("EphemerisTableLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    std::string line;

    // Skip header line
    if (!std::getline(file, line))
    {
        JYO_CORE_ERROR("EphemerisTableLoader: File is empty: {}", path.string());
        return std::nullopt;
    }

    StaticEphemeris table(sidereal_frame);
    u32 line_number = 1;
    u32 skipped = 0;
    u32 loaded = 0;

    while (std::getline(file, line))
    {
        ++line_number;

        if (core::trim(line).empty())
        {
            continue;
        }

        std::istringstream stream(line);
        std::string name_str;
        std::string lon_str;
        std::string lat_str;
        std::string speed_str;

        if (!std::getline(stream, name_str, ',') ||
            !std::getline(stream, lon_str, ',') ||
            !std::getline(stream, lat_str, ',') ||
            !std::getline(stream, speed_str))
        {
            JYO_CORE_WARN("EphemerisTableLoader: Malformed line {}: {}", line_number, line);
            ++skipped;
            continue;
        }

        const std::string_view name = core::trim(name_str);
        const auto longitude = parse_f64(core::trim(lon_str));
        const auto latitude  = parse_f64(core::trim(lat_str));
        const auto speed     = parse_f64(core::trim(speed_str));

        if (!longitude || !latitude || !speed)
        {
            JYO_CORE_WARN("EphemerisTableLoader: Failed to parse values on line {}: {}",
                          line_number, line);
            ++skipped;
            continue;
        }

        if (core::iequals(name, "Ascendant") || core::iequals(name, "Lagna"))
        {
            table.set_ascendant(*longitude);
            ++loaded;
            continue;
        }

        try
        {
            const zodiac::Body body = zodiac::body_from_name(name);
            table.set_position(body, chart::RawPosition{
                .longitude = *longitude,
                .latitude  = *latitude,
                .speed     = *speed,
            });
            ++loaded;
        }
        catch (const std::invalid_argument& e)
        {
            JYO_CORE_WARN("EphemerisTableLoader: Line {}: {}", line_number, e.what());
            ++skipped;
        }
    }

    if (loaded == 0)
    {
        JYO_CORE_ERROR("EphemerisTableLoader: No valid rows found in: {}", path.string());
        return std::nullopt;
    }

    if (skipped > 0)
    {
        JYO_CORE_WARN("EphemerisTableLoader: Skipped {} malformed lines", skipped);
    }

    JYO_CORE_INFO("EphemerisTableLoader: Loaded {} bodies from {}", table.body_count(), path.string());

    return table;
}

// -----------------------------------------------------------------
// Utility: parse f64 from string_view
// -----------------------------------------------------------------

std::optional<f64> EphemerisTableLoader::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    // A leading '+' is not accepted by from_chars
    if (sv.front() == '+')
    {
        sv.remove_prefix(1);
    }

    f64 value = 0.0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

} // namespace jyotish::ephemeris
