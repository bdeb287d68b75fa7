#pragma once

/// @file catalog_loader.hpp
/// @brief Loads the HYG star database (CSV) into parsed star records.

#include "catalog/star.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skydome::catalog
{
    /// @brief Static utility class for loading star catalog files.
    class CatalogLoader
    {
    public:
        CatalogLoader() = delete;

        /// @brief Default faint limit for naked-eye rendering.
        static constexpr f64 kDefaultMaxMagnitude = 6.0;

        /// @brief Load stars from an HYG database CSV file.
        ///
        /// Columns are located by name from the header row
        /// (`id, ra, dec, mag, ci, proper, bayer, con`; order and extra
        /// columns don't matter, header names may be quoted). `ra`, `dec`
        /// and `mag` are required. RA is in hours and Dec in degrees.
        ///
        /// Row policy:
        /// - unparseable RA/Dec/mag → row dropped
        /// - mag > max_magnitude → row dropped
        /// - blank or unparseable ci → 0
        /// - unparseable id → 1-based data line index
        /// - empty name fields → absent
        ///
        /// @param path Path to the CSV file.
        /// @param max_magnitude Faintest magnitude kept.
        /// @return Records in file order, or std::nullopt if the file cannot
        ///         be read, lacks required columns, or yields no stars.
        [[nodiscard]] static std::optional<std::vector<StarRecord>>
            load_hyg_csv(const std::filesystem::path& path, f64 max_magnitude = kDefaultMaxMagnitude);

        /// @brief Parse HYG CSV content from a stream.
        /// @param source Name used in log messages.
        [[nodiscard]] static std::optional<std::vector<StarRecord>>
            parse_hyg_csv(std::istream& input, f64 max_magnitude, std::string_view source);

        /// @brief Split one CSV line into fields. Quotes toggle quoting and are
        ///        removed; commas inside quotes don't split.
        [[nodiscard]] static std::vector<std::string> split_csv_line(std::string_view line);

    private:
        /// @brief Trim leading and trailing whitespace from a string_view.
        [[nodiscard]] static std::string_view trim(std::string_view sv);

        /// @brief Parse a single f64 value from a trimmed string_view.
        [[nodiscard]] static std::optional<f64> parse_f64(std::string_view sv);

        /// @brief Parse a single u32 value from a trimmed string_view.
        [[nodiscard]] static std::optional<u32> parse_u32(std::string_view sv);
    };

} // namespace skydome::catalog
