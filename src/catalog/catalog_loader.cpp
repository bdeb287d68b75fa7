/// @file catalog_loader.cpp
/// @brief Implementation of the HYG CSV star catalog loader.

#include "catalog/catalog_loader.hpp"

#include "core/logger.hpp"

#include <charconv>
#include <cmath>
#include <fstream>
#include <optional>

namespace skydome::catalog
{

namespace
{
    /// Column positions resolved from the header row.
    struct HygColumns
    {
        std::optional<std::size_t> id;
        std::optional<std::size_t> ra;
        std::optional<std::size_t> dec;
        std::optional<std::size_t> mag;
        std::optional<std::size_t> ci;
        std::optional<std::size_t> proper;
        std::optional<std::size_t> bayer;
        std::optional<std::size_t> con;
    };

    std::string_view field_at(const std::vector<std::string>& fields, const std::optional<std::size_t>& column)
    {
        if (!column || *column >= fields.size())
        {
            return {};
        }
        return fields[*column];
    }
}

// -----------------------------------------------------------------
// File entry point
// -----------------------------------------------------------------

std::optional<std::vector<StarRecord>>
CatalogLoader::load_hyg_csv(const std::filesystem::path& path, f64 max_magnitude)
{
    std::ifstream file(path);
    if (!file.is_open())
    {
        SKY_CORE_ERROR("CatalogLoader: Failed to open file: {}", path.string());
        return std::nullopt;
    }

    return parse_hyg_csv(file, max_magnitude, path.string());
}

// -----------------------------------------------------------------
// HYG CSV: header-driven columns, quoted fields
// -----------------------------------------------------------------

std::optional<std::vector<StarRecord>>
CatalogLoader::parse_hyg_csv(std::istream& input, f64 max_magnitude, std::string_view source)
{
    std::string line;
    if (!std::getline(input, line))
    {
        SKY_CORE_ERROR("CatalogLoader: File is empty: {}", source);
        return std::nullopt;
    }

    HygColumns cols;
    const auto header = split_csv_line(line);
    for (std::size_t i = 0; i < header.size(); ++i)
    {
        const std::string_view name = trim(header[i]);
        if (name == "id") { cols.id = i; }
        else if (name == "ra") { cols.ra = i; }
        else if (name == "dec") { cols.dec = i; }
        else if (name == "mag") { cols.mag = i; }
        else if (name == "ci") { cols.ci = i; }
        else if (name == "proper") { cols.proper = i; }
        else if (name == "bayer") { cols.bayer = i; }
        else if (name == "con") { cols.con = i; }
    }

    if (!cols.ra || !cols.dec || !cols.mag)
    {
        SKY_CORE_ERROR("CatalogLoader: Missing ra/dec/mag columns in header of {}", source);
        return std::nullopt;
    }

    const auto optional_text = [](std::string_view sv) -> std::optional<std::string> {
        if (sv.empty())
        {
            return std::nullopt;
        }
        return std::string(sv);
    };

    std::vector<StarRecord> records;
    u32 line_index = 0;
    u32 malformed = 0;
    u32 too_faint = 0;

    while (std::getline(input, line))
    {
        ++line_index;

        const std::string_view trimmed = trim(line);
        if (trimmed.empty())
        {
            continue;
        }

        const auto fields = split_csv_line(trimmed);

        const auto ra  = parse_f64(trim(field_at(fields, cols.ra)));
        const auto dec = parse_f64(trim(field_at(fields, cols.dec)));
        const auto mag = parse_f64(trim(field_at(fields, cols.mag)));

        if (!ra || !dec || !mag || !std::isfinite(*ra) || !std::isfinite(*dec) || !std::isfinite(*mag))
        {
            SKY_CORE_TRACE("CatalogLoader: Dropping malformed line {} of {}", line_index + 1, source);
            ++malformed;
            continue;
        }

        if (*mag > max_magnitude)
        {
            ++too_faint;
            continue;
        }

        records.push_back(StarRecord{
            .id            = parse_u32(trim(field_at(fields, cols.id))).value_or(line_index),
            .ra            = *ra,
            .dec           = *dec,
            .mag           = *mag,
            .color_index   = parse_f64(trim(field_at(fields, cols.ci))).value_or(0.0),
            .proper_name   = optional_text(trim(field_at(fields, cols.proper))),
            .designation   = optional_text(trim(field_at(fields, cols.bayer))),
            .constellation = optional_text(trim(field_at(fields, cols.con))),
        });
    }

    if (records.empty())
    {
        SKY_CORE_ERROR("CatalogLoader: No valid stars found in: {}", source);
        return std::nullopt;
    }

    if (malformed > 0)
    {
        SKY_CORE_WARN("CatalogLoader: Skipped {} malformed lines", malformed);
    }

    SKY_CORE_INFO("CatalogLoader: Loaded {} stars (mag <= {}, {} fainter skipped) from {}",
                  records.size(), max_magnitude, too_faint, source);

    return records;
}

// -----------------------------------------------------------------
// Utility: split a CSV line, honoring double quotes
// -----------------------------------------------------------------

std::vector<std::string> CatalogLoader::split_csv_line(std::string_view line)
{
    std::vector<std::string> fields;
    std::string current;
    bool in_quotes = false;

    for (const char c : line)
    {
        if (c == '"')
        {
            in_quotes = !in_quotes;
        }
        else if (c == ',' && !in_quotes)
        {
            fields.push_back(std::move(current));
            current.clear();
        }
        else
        {
            current += c;
        }
    }
    fields.push_back(std::move(current));

    return fields;
}

// -----------------------------------------------------------------
// Utility: trim whitespace
// -----------------------------------------------------------------

std::string_view CatalogLoader::trim(std::string_view sv)
{
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t' || sv.front() == '\r'))
    {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t' || sv.back() == '\r'))
    {
        sv.remove_suffix(1);
    }
    return sv;
}

// -----------------------------------------------------------------
// Utility: parse numbers from string_view
// -----------------------------------------------------------------

std::optional<f64> CatalogLoader::parse_f64(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    // from_chars rejects a leading '+', which some exports emit
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

std::optional<u32> CatalogLoader::parse_u32(std::string_view sv)
{
    if (sv.empty())
    {
        return std::nullopt;
    }

    u32 value = 0;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);

    if (ec != std::errc{} || ptr != sv.data() + sv.size())
    {
        return std::nullopt;
    }

    return value;
}

} // namespace skydome::catalog
