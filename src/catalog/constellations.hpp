#pragma once

/// @file constellations.hpp
/// @brief Constellation figures (GeoJSON line art), centers and IAU names.

#include "astro/coordinates.hpp"
#include "core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skydome::catalog
{
    /// @brief One connected stroke of a constellation figure.
    struct ConstellationLine
    {
        std::string id;             ///< IAU abbreviation, e.g. "Ori"
        std::vector<Vec3d> points;  ///< Catalog-frame unit vectors
    };

    /// @brief Label anchor for a constellation.
    struct ConstellationCenter
    {
        std::string id;
        std::string name;           ///< Full name, or the id if unknown
        astro::EquatorialCoord equatorial;
        Vec3d position;             ///< Catalog-frame unit vector
    };

    /// @brief All loaded constellation figures and their centers.
    struct ConstellationSet
    {
        std::vector<ConstellationLine> lines;
        std::vector<ConstellationCenter> centers;

        /// @brief Case-insensitive lookup by full name or abbreviation.
        [[nodiscard]] const ConstellationCenter* find(std::string_view name_or_id) const;
    };

    /// @brief Full IAU name for a constellation abbreviation, nullopt if unknown.
    [[nodiscard]] std::optional<std::string_view> constellation_name(std::string_view abbreviation);

    /// @brief Number of entries in the abbreviation table (88 IAU constellations).
    [[nodiscard]] std::size_t constellation_name_count();

    /// @brief Loader for d3-celestial style constellation line GeoJSON.
    ///
    /// Expected shape: a FeatureCollection whose features carry an `id`
    /// (abbreviation) and a `MultiLineString` geometry with coordinates
    /// `[ra_deg, dec_deg]`, RA in [-180, 180]. Other geometry types are skipped.
    class ConstellationLoader
    {
    public:
        ConstellationLoader() = delete;

        /// @return The parsed set, or std::nullopt if the text is not valid
        ///         JSON or lacks a `features` array.
        [[nodiscard]] static std::optional<ConstellationSet> parse_geojson(std::string_view text);

        [[nodiscard]] static std::optional<ConstellationSet> load_geojson(const std::filesystem::path& path);
    };

} // namespace skydome::catalog
