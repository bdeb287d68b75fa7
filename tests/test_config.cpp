/// @file test_config.cpp
/// @brief Unit tests for command-line configuration and city presets.

#define DOCTEST_CONFIG_IMPLEMENT
#include <doctest/doctest.h>

#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/types.hpp"

#include <string>
#include <vector>

using namespace skydome;
using namespace skydome::core;

// =================================================================
// Custom main: rejected arguments are logged
// =================================================================

int main(int argc, char** argv)
{
    skydome::core::Logger::init();
    const int result = doctest::Context(argc, argv).run();
    skydome::core::Logger::shutdown();
    return result;
}

static std::optional<AppConfig> parse(std::vector<std::string> args)
{
    return parse_command_line(args);
}

// =================================================================
// Defaults
// =================================================================

TEST_CASE("No arguments yields the defaults")
{
    const auto config = parse({});
    REQUIRE(config.has_value());

    CHECK(config->location.lat == doctest::Approx(44.0582));
    CHECK(config->location.lon == doctest::Approx(-121.3153));
    CHECK_FALSE(config->start_time.has_value());
    CHECK_FALSE(config->look_at.has_value());
    CHECK(config->fov_deg == doctest::Approx(60.0));
    CHECK(config->max_magnitude == doctest::Approx(6.0));
    CHECK(config->pick_threshold == doctest::Approx(0.02));
    CHECK(config->catalog_path == std::filesystem::path("data/hyg.csv"));
    CHECK(config->constellations_path == std::filesystem::path("data/constellations.json"));
    CHECK(config->window.width == 1280u);
    CHECK(config->window.height == 720u);
    CHECK(config->overlays.horizon);
    CHECK(config->overlays.cardinals);
    CHECK_FALSE(config->overlays.alt_az_grid);
    CHECK_FALSE(config->overlays.equatorial_grid);
    CHECK_FALSE(config->overlays.constellation_lines);
    CHECK_FALSE(config->overlays.light_mode);
    CHECK_FALSE(config->overlays.pixel_stars);
    CHECK_FALSE(config->look_at_star.has_value());
    CHECK(config->log_level == spdlog::level::info);
    CHECK_FALSE(config->show_help);
}

// =================================================================
// Location
// =================================================================

TEST_CASE("Latitude and longitude flags")
{
    const auto config = parse({"--lat", "-33.5", "--lon", "+18.25"});
    REQUIRE(config.has_value());
    CHECK(config->location.lat == doctest::Approx(-33.5));
    CHECK(config->location.lon == doctest::Approx(18.25));
}

TEST_CASE("Latitude outside [-90, 90] is rejected")
{
    CHECK_FALSE(parse({"--lat", "91"}).has_value());
    CHECK_FALSE(parse({"--lat", "-90.5"}).has_value());
    CHECK_FALSE(parse({"--lon", "181"}).has_value());
}

TEST_CASE("Non-numeric values are rejected")
{
    CHECK_FALSE(parse({"--lat", "north"}).has_value());
    CHECK_FALSE(parse({"--lon", "12.5deg"}).has_value());
    CHECK_FALSE(parse({"--fov", ""}).has_value());
    CHECK_FALSE(parse({"--max-mag", "nan"}).has_value());
}

TEST_CASE("City presets")
{
    const auto london = parse({"--city", "London"});
    REQUIRE(london.has_value());
    CHECK(london->location.lat == doctest::Approx(51.5074));
    CHECK(london->location.lon == doctest::Approx(-0.1278));

    const auto rio = parse({"--city", "rio-de-janeiro"});
    REQUIRE(rio.has_value());
    CHECK(rio->location.lat == doctest::Approx(-22.9068));

    CHECK(find_city("NEW YORK").has_value());
    CHECK(find_city("cape_town").has_value());
    CHECK_FALSE(find_city("Atlantis").has_value());
    CHECK_FALSE(parse({"--city", "Atlantis"}).has_value());
}

TEST_CASE("Every preset resolves to a valid location")
{
    for (const auto& preset : kCityPresets)
    {
        const auto location = find_city(preset.name);
        REQUIRE(location.has_value());
        CHECK(location->lat >= -90.0);
        CHECK(location->lat <= 90.0);
        CHECK(location->lon >= -180.0);
        CHECK(location->lon <= 180.0);
    }
}

TEST_CASE("Later flags override earlier ones")
{
    const auto config = parse({"--city", "Tokyo", "--lat", "10"});
    REQUIRE(config.has_value());
    CHECK(config->location.lat == doctest::Approx(10.0));
    CHECK(config->location.lon == doctest::Approx(139.6503));
}

// =================================================================
// Time
// =================================================================

TEST_CASE("ISO-8601 start time")
{
    const auto config = parse({"--time", "2024-06-15T22:30:15Z"});
    REQUIRE(config.has_value());
    REQUIRE(config->start_time.has_value());
    CHECK(config->start_time->year == 2024);
    CHECK(config->start_time->month == 6);
    CHECK(config->start_time->day == 15);
    CHECK(config->start_time->hour == 22);
    CHECK(config->start_time->minute == 30);
    CHECK(config->start_time->second == doctest::Approx(15.0));

    const auto live = parse({"--time", "2024-06-15T22:30Z", "--time", "now"});
    REQUIRE(live.has_value());
    CHECK_FALSE(live->start_time.has_value());
}

TEST_CASE("parse_iso_datetime accepts the documented forms")
{
    const auto date_only = parse_iso_datetime("2000-01-01");
    REQUIRE(date_only.has_value());
    CHECK(date_only->hour == 0);
    CHECK(date_only->minute == 0);

    const auto spaced = parse_iso_datetime("1999-12-31 23:59");
    REQUIRE(spaced.has_value());
    CHECK(spaced->hour == 23);
    CHECK(spaced->minute == 59);

    const auto fractional = parse_iso_datetime("2024-02-29T12:00:30.5");
    REQUIRE(fractional.has_value());
    CHECK(fractional->day == 29);
    CHECK(fractional->second == doctest::Approx(30.5));
}

TEST_CASE("parse_iso_datetime rejects impossible instants")
{
    CHECK_FALSE(parse_iso_datetime("").has_value());
    CHECK_FALSE(parse_iso_datetime("2023-02-29").has_value());
    CHECK_FALSE(parse_iso_datetime("2024-13-01").has_value());
    CHECK_FALSE(parse_iso_datetime("2024-04-31").has_value());
    CHECK_FALSE(parse_iso_datetime("2024-06-15T24:00").has_value());
    CHECK_FALSE(parse_iso_datetime("2024-06-15T12:60").has_value());
    CHECK_FALSE(parse_iso_datetime("2024-06-15T12:00:60").has_value());
    CHECK_FALSE(parse_iso_datetime("2024-06-15T12").has_value());
    CHECK_FALSE(parse_iso_datetime("24-06-15").has_value());
    CHECK_FALSE(parse_iso_datetime("yesterday").has_value());

    CHECK_FALSE(parse({"--time", "2024-06-31T00:00Z"}).has_value());
}

// =================================================================
// View and overlays
// =================================================================

TEST_CASE("View flags")
{
    const auto config = parse({"--fov", "30", "--max-mag", "4.5", "--look-at", "30,450",
                               "--pick-threshold", "0.05", "--width", "1920", "--height", "1080"});
    REQUIRE(config.has_value());
    CHECK(config->fov_deg == doctest::Approx(30.0));
    CHECK(config->max_magnitude == doctest::Approx(4.5));
    CHECK(config->pick_threshold == doctest::Approx(0.05));
    CHECK(config->window.width == 1920u);
    CHECK(config->window.height == 1080u);
    REQUIRE(config->look_at.has_value());
    CHECK(config->look_at->alt == doctest::Approx(30.0));
    CHECK(config->look_at->az == doctest::Approx(90.0));
}

TEST_CASE("Invalid view values are rejected")
{
    CHECK_FALSE(parse({"--fov", "0"}).has_value());
    CHECK_FALSE(parse({"--fov", "180"}).has_value());
    CHECK_FALSE(parse({"--width", "0"}).has_value());
    CHECK_FALSE(parse({"--height", "-720"}).has_value());
    CHECK_FALSE(parse({"--width", "12.5"}).has_value());
    CHECK_FALSE(parse({"--look-at", "95,0"}).has_value());
    CHECK_FALSE(parse({"--look-at", "45"}).has_value());
    CHECK_FALSE(parse({"--pick-threshold", "0"}).has_value());
}

TEST_CASE("Overlay switches")
{
    const auto config = parse({"--grid", "--equatorial", "--constellation-lines", "--no-horizon", "--no-cardinals"});
    REQUIRE(config.has_value());
    CHECK(config->overlays.alt_az_grid);
    CHECK(config->overlays.equatorial_grid);
    CHECK(config->overlays.constellation_lines);
    CHECK_FALSE(config->overlays.horizon);
    CHECK_FALSE(config->overlays.cardinals);
}

TEST_CASE("Display mode switches")
{
    const auto config = parse({"--light-mode", "--pixel-stars"});
    REQUIRE(config.has_value());
    CHECK(config->overlays.light_mode);
    CHECK(config->overlays.pixel_stars);

    // Independent of each other and of the overlays
    const auto pixels = parse({"--pixel-stars"});
    REQUIRE(pixels.has_value());
    CHECK_FALSE(pixels->overlays.light_mode);
    CHECK(pixels->overlays.pixel_stars);
    CHECK(pixels->overlays.horizon);
}

TEST_CASE("Star to center at start-up")
{
    const auto config = parse({"--look-at", "20,90", "--look-at-star", "Betelgeuse"});
    REQUIRE(config.has_value());
    REQUIRE(config->look_at_star.has_value());
    CHECK(*config->look_at_star == "Betelgeuse");
    CHECK(config->look_at.has_value());

    CHECK_FALSE(parse({"--look-at-star"}).has_value());
    CHECK_FALSE(parse({"--look-at-star", ""}).has_value());
}

// =================================================================
// Data paths, logging, errors
// =================================================================

TEST_CASE("Paths and logging")
{
    const auto config = parse({"--catalog", "stars/hyg_v41.csv", "--constellations", "figures.json",
                               "--log-level", "debug", "--log-file", "run.log"});
    REQUIRE(config.has_value());
    CHECK(config->catalog_path == std::filesystem::path("stars/hyg_v41.csv"));
    CHECK(config->constellations_path == std::filesystem::path("figures.json"));
    CHECK(config->log_file == std::filesystem::path("run.log"));
    CHECK(config->log_level == spdlog::level::debug);

    const auto off = parse({"--log-level", "off"});
    REQUIRE(off.has_value());
    CHECK(off->log_level == spdlog::level::off);

    CHECK_FALSE(parse({"--log-level", "loud"}).has_value());
    CHECK_FALSE(parse({"--catalog", ""}).has_value());
}

TEST_CASE("Unknown flags and missing values are rejected")
{
    CHECK_FALSE(parse({"--telescope"}).has_value());
    CHECK_FALSE(parse({"london"}).has_value());
    CHECK_FALSE(parse({"--lat"}).has_value());
    CHECK_FALSE(parse({"--grid", "--city"}).has_value());
}

TEST_CASE("Help flag and usage text")
{
    const auto config = parse({"--help"});
    REQUIRE(config.has_value());
    CHECK(config->show_help);

    const std::string text = usage();
    CHECK(text.find("--city") != std::string::npos);
    CHECK(text.find("--look-at") != std::string::npos);
    CHECK(text.find("Reykjavik") != std::string::npos);
    CHECK(text.find("--light-mode") != std::string::npos);
    CHECK(text.find("--pixel-stars") != std::string::npos);
    CHECK(text.find("--look-at-star") != std::string::npos);
}
