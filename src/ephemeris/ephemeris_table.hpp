#pragma once

/// @file ephemeris_table.hpp
/// @brief Loads a fixed position table from CSV into a StaticEphemeris.

#include "core/types.hpp"
#include "ephemeris/ephemeris_provider.hpp"

#include <filesystem>
#include <optional>
#include <string_view>

namespace jyotish::ephemeris
{
    /// @brief Static utility class for loading position tables.
    class EphemerisTableLoader
    {
    public:
        EphemerisTableLoader() = delete;

        /// @brief Load a position table from a CSV file.
        ///
        /// Expected CSV columns (header row required):
        ///   Body, Longitude_deg, Latitude_deg, Speed_deg_per_day
        ///
        /// Body accepts English or Sanskrit names. A row named "Ascendant"
        /// sets the ascendant (latitude and speed are ignored). Malformed
        /// rows and unknown bodies are skipped with a warning.
        ///
        /// @param path Path to the CSV file.
        /// @param sidereal_frame True if the longitudes are already sidereal.
        /// @return The table on success, std::nullopt if the file cannot be read
        ///         or holds no usable rows.
        [[nodiscard]] static std::optional<StaticEphemeris>
            load_csv(const std::filesystem::path& path, bool sidereal_frame = false);

    private:
        /// @brief Parse a single f64 value from a trimmed string_view.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);
    };

} // namespace jyotish::ephemeris
