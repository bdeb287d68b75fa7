#pragma once

/// @file config.hpp
/// @brief Start-up configuration: defaults, city presets and command-line parsing.

#include "astro/coordinates.hpp"
#include "astro/time_system.hpp"
#include "core/types.hpp"

#include <spdlog/common.h>

#include <array>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace skydome::core
{
    /// @brief Configuration for window creation.
    /// Use designated initializers: Window w({.title = "Skydome", .width = 1920});
    struct WindowConfig
    {
        std::string title = "Skydome";
        u32 width = 1280;
        u32 height = 720;
        bool fullscreen = false;
        bool resizable = true;
    };

    /// @brief Which overlays are drawn on top of the stars, and how.
    struct OverlayConfig
    {
        bool alt_az_grid = false;
        bool equatorial_grid = false;
        bool constellation_lines = false;
        bool horizon = true;
        bool cardinals = true;

        /// Off-white sky with darkened stars and overlays.
        bool light_mode = false;

        /// Hard-edged square stars without glow.
        bool pixel_stars = false;
    };

    /// @brief A named observing site.
    struct CityPreset
    {
        std::string_view name;
        astro::GeoLocation location;
    };

    inline constexpr std::array<CityPreset, 9> kCityPresets = {{
        {"New York",       {.lat = 40.7128,  .lon = -74.0060}},
        {"London",         {.lat = 51.5074,  .lon = -0.1278}},
        {"Tokyo",          {.lat = 35.6762,  .lon = 139.6503}},
        {"Sydney",         {.lat = -33.8688, .lon = 151.2093}},
        {"Cairo",          {.lat = 30.0444,  .lon = 31.2357}},
        {"Rio de Janeiro", {.lat = -22.9068, .lon = -43.1729}},
        {"Reykjavik",      {.lat = 64.1466,  .lon = -21.9426}},
        {"Cape Town",      {.lat = -33.9249, .lon = 18.4241}},
        {"Bend",           {.lat = 44.0582,  .lon = -121.3153}},
    }};

    /// Bend, Oregon.
    inline constexpr astro::GeoLocation kDefaultLocation{.lat = 44.0582, .lon = -121.3153};

    /// @brief Everything the application needs at start-up.
    struct AppConfig
    {
        WindowConfig window;

        astro::GeoLocation location = kDefaultLocation;

        /// Fixed start instant (UTC). nullopt = follow the wall clock.
        std::optional<astro::DateTime> start_time;

        f64 fov_deg = 60.0;

        /// Faintest magnitude kept when loading the catalog.
        f64 max_magnitude = 6.0;

        /// Initial pointing; nullopt keeps the camera default.
        std::optional<astro::HorizontalCoord> look_at;

        /// Star to center at start-up (name, catalog id or search text).
        /// Applied after look_at.
        std::optional<std::string> look_at_star;

        std::filesystem::path catalog_path = "data/hyg.csv";
        std::filesystem::path constellations_path = "data/constellations.json";

        OverlayConfig overlays;

        /// Upper bound on the chord distance for inverse-ray picking.
        f64 pick_threshold = 0.02;

        std::filesystem::path log_file = "skydome.log";
        spdlog::level::level_enum log_level = spdlog::level::info;

        bool show_help = false;
    };

    /// @brief Look up a city preset, ignoring case; '-' and '_' match spaces.
    [[nodiscard]] std::optional<astro::GeoLocation> find_city(std::string_view name);

    /// @brief Parse "YYYY-MM-DD[THH:MM[:SS[.fff]]][Z]" (a space may replace 'T').
    ///
    /// The instant is taken as UTC. Out-of-range fields are rejected.
    [[nodiscard]] std::optional<astro::DateTime> parse_iso_datetime(std::string_view text);

    /// @brief Build a configuration from command-line arguments.
    ///
    /// @param args Arguments after the program name, processed in order, so
    ///        a later --lat overrides an earlier --city.
    /// @return nullopt on an unknown flag, a missing value or an invalid value;
    ///         the reason is logged.
    [[nodiscard]] std::optional<AppConfig> parse_command_line(const std::vector<std::string>& args);

    /// @brief Help text listing every flag.
    [[nodiscard]] std::string usage();

} // namespace skydome::core
