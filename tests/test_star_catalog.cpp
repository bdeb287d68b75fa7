/// @file test_star_catalog.cpp
/// @brief Unit tests for skydome::catalog::StarCatalog and star colors.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "astro/coordinates.hpp"
#include "catalog/star.hpp"
#include "catalog/star_catalog.hpp"
#include "catalog/star_color.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <glm/geometric.hpp>

#include <cmath>
#include <limits>
#include <optional>
#include <string>
#include <vector>

using namespace skydome;
using namespace skydome::catalog;

// =================================================================
// Custom main: StarCatalog::build logs its summary
// =================================================================

int main(int argc, char** argv)
{
    skydome::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    skydome::core::Logger::shutdown();
    return result;
}

static StarRecord make_record(u32 id, f64 ra, f64 dec, f64 mag, f64 ci = 0.5,
                              std::optional<std::string> name = std::nullopt,
                              std::optional<std::string> bayer = std::nullopt,
                              std::optional<std::string> con = std::nullopt)
{
    return StarRecord{
        .id = id,
        .ra = ra,
        .dec = dec,
        .mag = mag,
        .color_index = ci,
        .proper_name = std::move(name),
        .designation = std::move(bayer),
        .constellation = std::move(con),
    };
}

/// A handful of real bright stars, deliberately out of magnitude order.
static StarCatalog make_bright_catalog()
{
    return StarCatalog::build({
        make_record(91262, 18.615649, 38.783692, 0.03, -0.001, "Vega", "Alp", "Lyr"),
        make_record(32263, 6.752481, -16.716116, -1.44, 0.009, "Sirius", "Alp", "CMa"),
        make_record(11734, 2.529750, 89.264109, 1.97, 0.636, "Polaris", "Alp", "UMi"),
        make_record(27919, 5.919529, 7.407063, 0.45, 1.500, "Betelgeuse", "Alp", "Ori"),
        make_record(24378, 5.242298, -8.201640, 0.18, -0.030, "Rigel", "Bet", "Ori"),
        make_record(69451, 14.261030, 19.182410, -0.05, 1.239, "Arcturus", "Alp", "Boo"),
        make_record(100001, 14.0, 19.5, 5.80, 0.2, std::nullopt, "Eta", "Boo"),
        make_record(100002, 14.1, 19.0, 6.00, 0.2),
    });
}

// =================================================================
// Build
// =================================================================

TEST_CASE("Build sorts stars by magnitude, brightest first")
{
    const auto catalog = make_bright_catalog();
    REQUIRE(catalog.size() == 8);

    for (std::size_t i = 1; i < catalog.size(); ++i)
    {
        CHECK(catalog[i - 1].magnitude <= catalog[i].magnitude);
    }
    CHECK(catalog[0].proper_name.value_or("") == "Sirius");
    CHECK(catalog[1].proper_name.value_or("") == "Arcturus");
}

TEST_CASE("Equal magnitudes keep input order")
{
    const auto catalog = StarCatalog::build({
        make_record(5, 1.0, 0.0, 2.0),
        make_record(3, 2.0, 0.0, 2.0),
        make_record(9, 3.0, 0.0, 2.0),
        make_record(1, 4.0, 0.0, 1.0),
    });

    REQUIRE(catalog.size() == 4);
    CHECK(catalog[0].id == 1u);
    CHECK(catalog[1].id == 5u);
    CHECK(catalog[2].id == 3u);
    CHECK(catalog[3].id == 9u);
}

TEST_CASE("Positions are unit vectors matching RA/Dec")
{
    const auto catalog = make_bright_catalog();

    for (const auto& star : catalog.stars())
    {
        CHECK(glm::length(star.position) == doctest::Approx(1.0).epsilon(1e-12));

        const auto expected = astro::Coordinates::equatorial_to_cartesian(star.equatorial.ra, star.equatorial.dec);
        CHECK(std::abs(star.position.x - expected.x) < 1e-12);
        CHECK(std::abs(star.position.y - expected.y) < 1e-12);
        CHECK(std::abs(star.position.z - expected.z) < 1e-12);
    }
}

TEST_CASE("Flattened arrays follow catalog order")
{
    const auto catalog = make_bright_catalog();
    const auto positions = catalog.positions();
    const auto magnitudes = catalog.magnitudes();
    const auto colors = catalog.colors();

    REQUIRE(positions.size() == catalog.size() * 3);
    REQUIRE(magnitudes.size() == catalog.size());
    REQUIRE(colors.size() == catalog.size() * 3);

    for (std::size_t i = 0; i < catalog.size(); ++i)
    {
        const auto& star = catalog[i];
        CHECK(positions[i * 3 + 0] == doctest::Approx(star.position.x).epsilon(1e-6));
        CHECK(positions[i * 3 + 1] == doctest::Approx(star.position.y).epsilon(1e-6));
        CHECK(positions[i * 3 + 2] == doctest::Approx(star.position.z).epsilon(1e-6));
        CHECK(magnitudes[i] == doctest::Approx(star.magnitude).epsilon(1e-6));
        CHECK(colors[i * 3 + 0] == star.color.r);
        CHECK(colors[i * 3 + 1] == star.color.g);
        CHECK(colors[i * 3 + 2] == star.color.b);
    }
}

TEST_CASE("Records with non-finite values are dropped")
{
    constexpr f64 kNaN = std::numeric_limits<f64>::quiet_NaN();
    constexpr f64 kInf = std::numeric_limits<f64>::infinity();

    const auto catalog = StarCatalog::build({
        make_record(1, kNaN, 0.0, 1.0),
        make_record(2, 1.0, kInf, 1.0),
        make_record(3, 1.0, 0.0, kNaN),
        make_record(4, 1.0, 0.0, 1.0, kNaN),
        make_record(5, 2.0, 10.0, 2.0),
    });

    REQUIRE(catalog.size() == 2);
    CHECK(catalog[0].id == 4u);
    CHECK(catalog[0].color_index == doctest::Approx(0.0));
    CHECK(catalog[1].id == 5u);
}

TEST_CASE("Empty catalog")
{
    const auto catalog = StarCatalog::build({});
    CHECK(catalog.empty());
    CHECK(catalog.size() == 0);
    CHECK(catalog.positions().empty());
    CHECK(catalog.count_brighter_than(6.0) == 0);
    CHECK(catalog.find_by_id(1) == nullptr);
    CHECK(catalog.find_near(Vec3d(1.0, 0.0, 0.0)).empty());
    CHECK(catalog.search("a").empty());
}

// =================================================================
// Queries
// =================================================================

TEST_CASE("count_brighter_than is an inclusive prefix")
{
    const auto catalog = make_bright_catalog();

    CHECK(catalog.count_brighter_than(-2.0) == 0);
    CHECK(catalog.count_brighter_than(-1.44) == 1);
    CHECK(catalog.count_brighter_than(0.5) == 5);
    CHECK(catalog.count_brighter_than(6.0) == 8);
    CHECK(catalog.count_brighter_than(std::numeric_limits<f64>::infinity()) == 8);
}

TEST_CASE("find_by_id and find_by_name")
{
    const auto catalog = make_bright_catalog();

    const Star* sirius = catalog.find_by_id(32263);
    REQUIRE(sirius != nullptr);
    CHECK(sirius->magnitude == doctest::Approx(-1.44));

    const Star* vega = catalog.find_by_name("vEgA");
    REQUIRE(vega != nullptr);
    CHECK(vega->id == 91262u);

    CHECK(catalog.find_by_id(999999) == nullptr);
    CHECK(catalog.find_by_name("Zaphod") == nullptr);
    CHECK(catalog.find_by_name("Eta") == nullptr);
}

TEST_CASE("find_near returns stars within the chord radius")
{
    const auto catalog = make_bright_catalog();

    // The two faint Bootes stars sit 2-4 degrees from Arcturus
    const Vec3d arcturus = astro::Coordinates::equatorial_to_cartesian(14.261030, 19.182410);

    const auto close = catalog.find_near(arcturus, 0.03);
    REQUIRE(close.size() == 1);
    CHECK(close.front()->proper_name.value_or("") == "Arcturus");

    const auto wider = catalog.find_near(arcturus);
    CHECK(wider.size() == 3);
    for (std::size_t i = 1; i < wider.size(); ++i)
    {
        CHECK(wider[i - 1]->magnitude <= wider[i]->magnitude);
    }
}

TEST_CASE("search matches names and designations")
{
    const auto catalog = make_bright_catalog();

    SUBCASE("Prefix matches come first")
    {
        const auto results = catalog.search("ri");
        REQUIRE(results.size() == 3);
        CHECK(results[0]->proper_name.value_or("") == "Rigel");
        CHECK(results[1]->proper_name.value_or("") == "Polaris");
        CHECK(results[2]->proper_name.value_or("") == "Sirius");
    }

    SUBCASE("Substring matches are alphabetical")
    {
        const auto results = catalog.search("e");
        REQUIRE(results.size() == 3);
        CHECK(results[0]->proper_name.value_or("") == "Betelgeuse");
        CHECK(results[1]->proper_name.value_or("") == "Rigel");
        CHECK(results[2]->proper_name.value_or("") == "Vega");
    }

    SUBCASE("Designation match on a named star")
    {
        const auto results = catalog.search("bet");
        REQUIRE(results.size() == 2);
        CHECK(results[0]->proper_name.value_or("") == "Betelgeuse");
        CHECK(results[1]->proper_name.value_or("") == "Rigel");
    }

    SUBCASE("Unnamed stars are never returned")
    {
        CHECK(catalog.search("eta").empty());
    }

    SUBCASE("Limit and empty query")
    {
        CHECK(catalog.search("a", 2).size() == 2);
        CHECK(catalog.search("").empty());
        CHECK(catalog.search("a", 0).empty());
    }
}

TEST_CASE("display_name falls back to designation, then id")
{
    const auto catalog = make_bright_catalog();

    CHECK(catalog.find_by_id(27919)->display_name() == "Betelgeuse");
    CHECK(catalog.find_by_id(100001)->display_name() == "Eta Boo");
    CHECK(catalog.find_by_id(100002)->display_name() == "HYG 100002");
}

TEST_CASE("resolve tries id, exact name, then search")
{
    const auto catalog = make_bright_catalog();

    const Star* by_id = catalog.resolve("27919");
    REQUIRE(by_id != nullptr);
    CHECK(by_id->proper_name.value_or("") == "Betelgeuse");

    const Star* by_name = catalog.resolve("vEGA");
    REQUIRE(by_name != nullptr);
    CHECK(by_name->id == 91262u);

    const Star* by_search = catalog.resolve("arct");
    REQUIRE(by_search != nullptr);
    CHECK(by_search->id == 69451u);

    // Digits are never treated as a name
    CHECK(catalog.resolve("424242") == nullptr);
    CHECK(catalog.resolve("99999999999") == nullptr);

    // Unnamed stars are reachable by id only
    CHECK(catalog.resolve("eta") == nullptr);
    CHECK(catalog.resolve("100001") != nullptr);

    CHECK(catalog.resolve("") == nullptr);
    CHECK(catalog.resolve("Andromeda") == nullptr);
}

// =================================================================
// Color index → RGB
// =================================================================

TEST_CASE("Hot stars are blue-white")
{
    const Color c = color_index_to_rgb(-0.3);
    CHECK(c.b >= c.r);
    CHECK(c.r >= c.g);
    CHECK(c.r == doctest::Approx(0.68f).epsilon(1e-5));
    CHECK(c.b == doctest::Approx(1.0f));
}

TEST_CASE("Cool stars are orange")
{
    const Color c = color_index_to_rgb(1.5);
    CHECK(c.r > c.g);
    CHECK(c.g > c.b);
    CHECK(c.r == doctest::Approx(1.0f));
    CHECK(c.g == doctest::Approx(0.7f));
    CHECK(c.b == doctest::Approx(0.4f));
}

TEST_CASE("Temperature bands")
{
    CHECK(color_index_to_temperature(0.0) == doctest::Approx(10000.0));
    CHECK(color_index_to_temperature(-0.4) == doctest::Approx(26000.0));
    CHECK(color_index_to_temperature(1.0) == doctest::Approx(5000.0));

    const Color white = color_index_to_rgb(0.3);
    CHECK(white.r == doctest::Approx(1.0f));
    CHECK(white.g == doctest::Approx(1.0f));
    CHECK(white.b == doctest::Approx(1.0f));

    const Color yellow_white = color_index_to_rgb(0.6);
    CHECK(yellow_white.b == doctest::Approx(0.85f));

    const Color yellow = color_index_to_rgb(0.9);
    CHECK(yellow.b == doctest::Approx(0.7f));

    const Color red = color_index_to_rgb(2.0);
    CHECK(red.g == doctest::Approx(0.5f));
    CHECK(red.b == doctest::Approx(0.3f));
}

TEST_CASE("Out-of-range and non-finite indices are clamped")
{
    CHECK(color_index_to_temperature(5.0) == doctest::Approx(color_index_to_temperature(2.0)));
    CHECK(color_index_to_temperature(-3.0) == doctest::Approx(color_index_to_temperature(-0.4)));
    CHECK(color_index_to_temperature(std::numeric_limits<f64>::quiet_NaN()) == doctest::Approx(10000.0));
}

TEST_CASE("Temperature falls as the color index rises")
{
    f64 previous = color_index_to_temperature(-0.4);
    for (f64 bv = -0.35; bv <= 2.0; bv += 0.05)
    {
        const f64 t = color_index_to_temperature(bv);
        CHECK(t < previous);
        previous = t;
    }
}
