/// @file test_constellations.cpp
/// @brief Unit tests for constellation names and GeoJSON figure loading.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "astro/coordinates.hpp"
#include "catalog/constellations.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <glm/geometric.hpp>

#include <algorithm>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <set>
#include <string>

using namespace skydome;
using namespace skydome::catalog;

// =================================================================
// Custom main: the loader logs what it read and skipped
// =================================================================

int main(int argc, char** argv)
{
    skydome::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    skydome::core::Logger::shutdown();
    return result;
}

static constexpr f64 kVecTol = 1e-9;

static bool approx_equal(const Vec3d& a, const Vec3d& b, f64 tol = kVecTol)
{
    return std::abs(a.x - b.x) < tol && std::abs(a.y - b.y) < tol && std::abs(a.z - b.z) < tol;
}

/// Two figures (one with a degenerate single-point stroke), one figure that
/// straddles RA 0h, one unknown id and one non-line feature.
static constexpr const char* kFigures = R"({
  "type": "FeatureCollection",
  "features": [
    {"type": "Feature", "id": "Ori", "properties": {"rank": "1"},
     "geometry": {"type": "MultiLineString",
                  "coordinates": [[[88.79, 7.41], [81.28, 6.35], [78.63, -8.20]], [[83.0, -0.3]]]}},
    {"type": "Feature", "id": "Psc",
     "geometry": {"type": "MultiLineString", "coordinates": [[[-5.0, 0.0], [5.0, 0.0]]]}},
    {"type": "Feature", "id": "Xyz",
     "geometry": {"type": "MultiLineString", "coordinates": [[[120.0, 40.0], [121.0, 41.0]]]}},
    {"type": "Feature", "id": "Lbl",
     "geometry": {"type": "Point", "coordinates": [10.0, 10.0]}}
  ]
})";

// =================================================================
// Name table
// =================================================================

TEST_CASE("Name table covers the 88 IAU constellations")
{
    CHECK(constellation_name_count() == 88);
    CHECK(constellation_name("Ori").value_or("") == "Orion");
    CHECK(constellation_name("UMa").value_or("") == "Ursa Major");
    CHECK(constellation_name("PsA").value_or("") == "Piscis Austrinus");
    CHECK_FALSE(constellation_name("ori").has_value());
    CHECK_FALSE(constellation_name("Foo").has_value());
    CHECK_FALSE(constellation_name("").has_value());
}

// =================================================================
// GeoJSON parsing
// =================================================================

TEST_CASE("Parse figure lines")
{
    const auto set = ConstellationLoader::parse_geojson(kFigures);
    REQUIRE(set.has_value());

    // Single-point stroke and Point feature are dropped
    REQUIRE(set->lines.size() == 3);
    CHECK(set->lines[0].id == "Ori");
    CHECK(set->lines[0].points.size() == 3);
    CHECK(set->lines[1].id == "Psc");
    CHECK(set->lines[2].id == "Xyz");

    SUBCASE("Vertices are catalog-frame unit vectors with RA converted to hours")
    {
        const Vec3d expected = astro::Coordinates::equatorial_to_cartesian(88.79 / 15.0, 7.41);
        CHECK(approx_equal(set->lines[0].points[0], expected));

        for (const auto& line : set->lines)
        {
            for (const auto& point : line.points)
            {
                CHECK(glm::length(point) == doctest::Approx(1.0).epsilon(1e-12));
            }
        }
    }

    SUBCASE("Negative GeoJSON RA maps into the same sky position")
    {
        const Vec3d west = astro::Coordinates::equatorial_to_cartesian(24.0 - 5.0 / 15.0, 0.0);
        CHECK(approx_equal(set->lines[1].points[0], west));
    }
}

TEST_CASE("Centers: one per figure, sorted by id, named from the table")
{
    const auto set = ConstellationLoader::parse_geojson(kFigures);
    REQUIRE(set.has_value());
    REQUIRE(set->centers.size() == 3);

    CHECK(set->centers[0].id == "Ori");
    CHECK(set->centers[0].name == "Orion");
    CHECK(set->centers[1].id == "Psc");
    CHECK(set->centers[1].name == "Pisces");

    // Unknown abbreviation: name falls back to the id
    CHECK(set->centers[2].id == "Xyz");
    CHECK(set->centers[2].name == "Xyz");

    for (const auto& center : set->centers)
    {
        CHECK(glm::length(center.position) == doctest::Approx(1.0).epsilon(1e-12));
        CHECK(center.equatorial.ra >= 0.0);
        CHECK(center.equatorial.ra < 24.0);
    }
}

TEST_CASE("Center of a figure straddling RA 0h is at RA 0h")
{
    const auto set = ConstellationLoader::parse_geojson(kFigures);
    REQUIRE(set.has_value());

    const auto* pisces = set->find("Psc");
    REQUIRE(pisces != nullptr);

    const f64 ra = pisces->equatorial.ra;
    CHECK(std::min(ra, 24.0 - ra) < 1e-9);
    CHECK(std::abs(pisces->equatorial.dec) < 1e-9);
}

TEST_CASE("Orion center lies inside the figure")
{
    const auto set = ConstellationLoader::parse_geojson(kFigures);
    REQUIRE(set.has_value());

    const auto* orion = set->find("Ori");
    REQUIRE(orion != nullptr);
    CHECK(orion->equatorial.ra > 78.0 / 15.0);
    CHECK(orion->equatorial.ra < 89.0 / 15.0);
    CHECK(orion->equatorial.dec > -9.0);
    CHECK(orion->equatorial.dec < 8.0);
}

TEST_CASE("find matches id or full name, ignoring case")
{
    const auto set = ConstellationLoader::parse_geojson(kFigures);
    REQUIRE(set.has_value());

    CHECK(set->find("orion") == set->find("ORI"));
    CHECK(set->find("Pisces") != nullptr);
    CHECK(set->find("Draco") == nullptr);
    CHECK(set->find("") == nullptr);
}

// =================================================================
// Invalid input
// =================================================================

TEST_CASE("Invalid documents are rejected")
{
    CHECK_FALSE(ConstellationLoader::parse_geojson("").has_value());
    CHECK_FALSE(ConstellationLoader::parse_geojson("{not json").has_value());
    CHECK_FALSE(ConstellationLoader::parse_geojson("[]").has_value());
    CHECK_FALSE(ConstellationLoader::parse_geojson(R"({"type": "FeatureCollection"})").has_value());
    CHECK_FALSE(ConstellationLoader::parse_geojson(R"({"features": {}})").has_value());
}

TEST_CASE("Malformed features and coordinates are skipped")
{
    const auto set = ConstellationLoader::parse_geojson(R"({
      "features": [
        42,
        {"id": "Cyg"},
        {"id": "Lyr", "geometry": {"type": "MultiLineString", "coordinates": [[["a", "b"], [280.0, 38.8], [281.0]]]}},
        {"id": "Aql", "geometry": {"type": "MultiLineString", "coordinates": [[[297.7, 8.9], [296.6, 10.6]]]}}
      ]
    })");

    REQUIRE(set.has_value());
    REQUIRE(set->lines.size() == 1);
    CHECK(set->lines[0].id == "Aql");

    // Lyr still has one valid vertex, so it gets a center
    CHECK(set->find("Lyr") != nullptr);
    CHECK(set->find("Cyg") == nullptr);
}

TEST_CASE("Empty feature list parses to an empty set")
{
    const auto set = ConstellationLoader::parse_geojson(R"({"type": "FeatureCollection", "features": []})");
    REQUIRE(set.has_value());
    CHECK(set->lines.empty());
    CHECK(set->centers.empty());
}

// =================================================================
// File loading
// =================================================================

TEST_CASE("load_geojson reads a file")
{
    const auto path = std::filesystem::temp_directory_path() / "test_constellations.json";
    {
        std::ofstream file(path);
        file << kFigures;
    }

    const auto set = ConstellationLoader::load_geojson(path);
    std::filesystem::remove(path);

    REQUIRE(set.has_value());
    CHECK(set->lines.size() == 3);
}

TEST_CASE("Missing file returns nullopt")
{
    CHECK_FALSE(ConstellationLoader::load_geojson("no_such_constellations.json").has_value());
}
