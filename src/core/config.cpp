/// @file config.cpp
/// @brief Command-line parsing and city presets.

#include "core/config.hpp"

#include "core/logger.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>

namespace skydome::core
{

namespace
{
    std::vector<std::string_view> split(std::string_view text, char delimiter)
    {
        std::vector<std::string_view> parts;
        std::size_t start = 0;
        while (true)
        {
            const std::size_t pos = text.find(delimiter, start);
            if (pos == std::string_view::npos)
            {
                parts.push_back(text.substr(start));
                return parts;
            }
            parts.push_back(text.substr(start, pos - start));
            start = pos + 1;
        }
    }

    std::optional<f64> parse_number(std::string_view sv)
    {
        if (!sv.empty() && sv.front() == '+')
        {
            sv.remove_prefix(1);
        }
        if (sv.empty())
        {
            return std::nullopt;
        }

        f64 value = 0.0;
        const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
        if (ec != std::errc{} || ptr != sv.data() + sv.size() || !std::isfinite(value))
        {
            return std::nullopt;
        }
        return value;
    }

    std::optional<i32> parse_int(std::string_view sv)
    {
        if (sv.empty())
        {
            return std::nullopt;
        }

        i32 value = 0;
        const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), value);
        if (ec != std::errc{} || ptr != sv.data() + sv.size())
        {
            return std::nullopt;
        }
        return value;
    }

    bool is_leap_year(i32 year)
    {
        return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    }

    i32 days_in_month(i32 year, i32 month)
    {
        constexpr std::array<i32, 12> kDays = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
        if (month == 2 && is_leap_year(year))
        {
            return 29;
        }
        return kDays[static_cast<std::size_t>(month - 1)];
    }

    std::string normalize_city_name(std::string_view name)
    {
        std::string out;
        out.reserve(name.size());
        for (const char c : name)
        {
            if (c == '-' || c == '_')
            {
                out.push_back(' ');
            }
            else
            {
                out.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
            }
        }
        return out;
    }

    /// Numeric flag value within [lo, hi], logging why it was rejected.
    std::optional<f64> number_in_range(std::string_view flag, std::string_view text, f64 lo, f64 hi)
    {
        const auto value = parse_number(text);
        if (!value || *value < lo || *value > hi)
        {
            SKY_CORE_ERROR("Config: Invalid value '{}' for {} (expected a number in [{}, {}])", text, flag, lo, hi);
            return std::nullopt;
        }
        return value;
    }

    std::optional<u32> dimension(std::string_view flag, std::string_view text)
    {
        const auto value = parse_int(text);
        if (!value || *value < 1 || *value > 16384)
        {
            SKY_CORE_ERROR("Config: Invalid value '{}' for {} (expected 1 to 16384 pixels)", text, flag);
            return std::nullopt;
        }
        return static_cast<u32>(*value);
    }

    std::optional<astro::HorizontalCoord> parse_look_at(std::string_view text)
    {
        const auto parts = split(text, ',');
        if (parts.size() != 2)
        {
            return std::nullopt;
        }

        const auto alt = parse_number(parts[0]);
        const auto az = parse_number(parts[1]);
        if (!alt || !az || *alt < -90.0 || *alt > 90.0)
        {
            return std::nullopt;
        }

        return astro::HorizontalCoord{.alt = *alt, .az = astro::Coordinates::normalize_degrees(*az)};
    }
}

// =================================================================
// City presets
// =================================================================

std::optional<astro::GeoLocation> find_city(std::string_view name)
{
    const std::string wanted = normalize_city_name(name);
    const auto it = std::find_if(kCityPresets.begin(), kCityPresets.end(), [&](const CityPreset& preset) {
        return normalize_city_name(preset.name) == wanted;
    });

    if (it == kCityPresets.end())
    {
        return std::nullopt;
    }
    return it->location;
}

// =================================================================
// ISO-8601 date/time
// =================================================================

std::optional<astro::DateTime> parse_iso_datetime(std::string_view text)
{
    if (!text.empty() && (text.back() == 'Z' || text.back() == 'z'))
    {
        text.remove_suffix(1);
    }

    const std::size_t sep = text.find_first_of("T ");
    const std::string_view date_part = text.substr(0, sep);
    const std::string_view time_part = sep == std::string_view::npos ? std::string_view{} : text.substr(sep + 1);

    // -----------------------------------------------------------------
    // Date: YYYY-MM-DD
    // -----------------------------------------------------------------
    const auto date_fields = split(date_part, '-');
    if (date_fields.size() != 3 || date_fields[0].size() != 4)
    {
        return std::nullopt;
    }

    const auto year = parse_int(date_fields[0]);
    const auto month = parse_int(date_fields[1]);
    const auto day = parse_int(date_fields[2]);
    if (!year || !month || !day || *month < 1 || *month > 12 || *day < 1 || *day > days_in_month(*year, *month))
    {
        return std::nullopt;
    }

    astro::DateTime result{.year = *year, .month = *month, .day = *day, .hour = 0, .minute = 0, .second = 0.0};

    if (sep == std::string_view::npos)
    {
        return result;
    }

    // -----------------------------------------------------------------
    // Time: HH:MM[:SS[.fff]]
    // -----------------------------------------------------------------
    const auto time_fields = split(time_part, ':');
    if (time_fields.size() < 2 || time_fields.size() > 3)
    {
        return std::nullopt;
    }

    const auto hour = parse_int(time_fields[0]);
    const auto minute = parse_int(time_fields[1]);
    if (!hour || !minute || *hour < 0 || *hour > 23 || *minute < 0 || *minute > 59)
    {
        return std::nullopt;
    }
    result.hour = *hour;
    result.minute = *minute;

    if (time_fields.size() == 3)
    {
        const auto second = parse_number(time_fields[2]);
        if (!second || *second < 0.0 || *second >= 60.0)
        {
            return std::nullopt;
        }
        result.second = *second;
    }

    return result;
}

// =================================================================
// Command line
// =================================================================

std::optional<AppConfig> parse_command_line(const std::vector<std::string>& args)
{
    AppConfig config;

    for (std::size_t i = 0; i < args.size(); ++i)
    {
        const std::string_view flag = args[i];

        // Every flag below that takes a value reads it through this
        auto next_value = [&]() -> std::optional<std::string_view> {
            if (i + 1 >= args.size())
            {
                SKY_CORE_ERROR("Config: {} expects a value", flag);
                return std::nullopt;
            }
            return std::string_view(args[++i]);
        };

        // -----------------------------------------------------------------
        // Switches
        // -----------------------------------------------------------------
        if (flag == "--help" || flag == "-h")
        {
            config.show_help = true;
            continue;
        }
        if (flag == "--grid")
        {
            config.overlays.alt_az_grid = true;
            continue;
        }
        if (flag == "--equatorial")
        {
            config.overlays.equatorial_grid = true;
            continue;
        }
        if (flag == "--constellation-lines")
        {
            config.overlays.constellation_lines = true;
            continue;
        }
        if (flag == "--no-horizon")
        {
            config.overlays.horizon = false;
            continue;
        }
        if (flag == "--no-cardinals")
        {
            config.overlays.cardinals = false;
            continue;
        }
        if (flag == "--fullscreen")
        {
            config.window.fullscreen = true;
            continue;
        }
        if (flag == "--light-mode")
        {
            config.overlays.light_mode = true;
            continue;
        }
        if (flag == "--pixel-stars")
        {
            config.overlays.pixel_stars = true;
            continue;
        }

        // -----------------------------------------------------------------
        // Flags with a value
        // -----------------------------------------------------------------
        if (flag == "--lat" || flag == "--lon" || flag == "--fov" || flag == "--max-mag"
            || flag == "--pick-threshold")
        {
            const auto text = next_value();
            if (!text)
            {
                return std::nullopt;
            }

            f64* target = &config.pick_threshold;
            f64 lo = 1e-6;
            f64 hi = 2.0;
            if (flag == "--lat")
            {
                target = &config.location.lat;
                lo = -90.0;
                hi = 90.0;
            }
            else if (flag == "--lon")
            {
                target = &config.location.lon;
                lo = -180.0;
                hi = 180.0;
            }
            else if (flag == "--fov")
            {
                target = &config.fov_deg;
                lo = 1.0;
                hi = 179.0;
            }
            else if (flag == "--max-mag")
            {
                target = &config.max_magnitude;
                lo = -30.0;
                hi = 30.0;
            }

            const auto value = number_in_range(flag, *text, lo, hi);
            if (!value)
            {
                return std::nullopt;
            }
            *target = *value;
            continue;
        }

        if (flag == "--width" || flag == "--height")
        {
            const auto text = next_value();
            if (!text)
            {
                return std::nullopt;
            }
            const auto value = dimension(flag, *text);
            if (!value)
            {
                return std::nullopt;
            }
            if (flag == "--width")
            {
                config.window.width = *value;
            }
            else
            {
                config.window.height = *value;
            }
            continue;
        }

        if (flag == "--city")
        {
            const auto text = next_value();
            if (!text)
            {
                return std::nullopt;
            }
            const auto location = find_city(*text);
            if (!location)
            {
                SKY_CORE_ERROR("Config: Unknown city '{}'", *text);
                return std::nullopt;
            }
            config.location = *location;
            continue;
        }

        if (flag == "--time")
        {
            const auto text = next_value();
            if (!text)
            {
                return std::nullopt;
            }
            if (*text == "now")
            {
                config.start_time.reset();
                continue;
            }
            const auto instant = parse_iso_datetime(*text);
            if (!instant)
            {
                SKY_CORE_ERROR("Config: Invalid time '{}' (expected YYYY-MM-DDTHH:MM[:SS]Z)", *text);
                return std::nullopt;
            }
            config.start_time = instant;
            continue;
        }

        if (flag == "--look-at")
        {
            const auto text = next_value();
            if (!text)
            {
                return std::nullopt;
            }
            const auto target = parse_look_at(*text);
            if (!target)
            {
                SKY_CORE_ERROR("Config: Invalid value '{}' for --look-at (expected <alt>,<az> in degrees)", *text);
                return std::nullopt;
            }
            config.look_at = target;
            continue;
        }

        if (flag == "--look-at-star")
        {
            const auto text = next_value();
            if (!text)
            {
                return std::nullopt;
            }
            if (text->empty())
            {
                SKY_CORE_ERROR("Config: --look-at-star expects a star name or id");
                return std::nullopt;
            }
            config.look_at_star = std::string(*text);
            continue;
        }

        if (flag == "--catalog" || flag == "--constellations" || flag == "--log-file")
        {
            const auto text = next_value();
            if (!text || text->empty())
            {
                if (text)
                {
                    SKY_CORE_ERROR("Config: {} expects a non-empty path", flag);
                }
                return std::nullopt;
            }
            if (flag == "--catalog")
            {
                config.catalog_path = std::filesystem::path(*text);
            }
            else if (flag == "--constellations")
            {
                config.constellations_path = std::filesystem::path(*text);
            }
            else
            {
                config.log_file = std::filesystem::path(*text);
            }
            continue;
        }

        if (flag == "--log-level")
        {
            const auto text = next_value();
            if (!text)
            {
                return std::nullopt;
            }
            // from_str falls back to "off" for unknown names
            const auto level = spdlog::level::from_str(std::string(*text));
            if (level == spdlog::level::off && *text != "off")
            {
                SKY_CORE_ERROR("Config: Unknown log level '{}'", *text);
                return std::nullopt;
            }
            config.log_level = level;
            continue;
        }

        SKY_CORE_ERROR("Config: Unknown argument '{}' (see --help)", flag);
        return std::nullopt;
    }

    return config;
}

std::string usage()
{
    std::string text =
        "Usage: skydome [options]\n"
        "\n"
        "Observer:\n"
        "  --lat <deg>               Latitude, north positive (default 44.0582)\n"
        "  --lon <deg>               Longitude, east positive (default -121.3153)\n"
        "  --city <name>             Use a preset location\n"
        "  --time <iso|now>          Start instant in UTC, e.g. 2024-06-15T22:30Z\n"
        "\n"
        "View:\n"
        "  --fov <deg>               Initial vertical field of view (default 60)\n"
        "  --look-at <alt>,<az>      Initial pointing in degrees\n"
        "  --look-at-star <star>     Center a star by name, id or search text\n"
        "  --max-mag <mag>           Faintest catalog magnitude to load (default 6)\n"
        "  --pick-threshold <chord>  Max hover pick distance on the unit sphere (default 0.02)\n"
        "  --width <px> --height <px> --fullscreen\n"
        "\n"
        "Overlays:\n"
        "  --grid                    Alt/Az grid\n"
        "  --equatorial              RA/Dec grid\n"
        "  --constellation-lines     Constellation figures and labels\n"
        "  --no-horizon              Hide the horizon line\n"
        "  --no-cardinals            Hide compass markers\n"
        "\n"
        "Display:\n"
        "  --light-mode              Off-white sky with dark stars\n"
        "  --pixel-stars             Square stars without glow\n"
        "\n"
        "Data and logging:\n"
        "  --catalog <path>          HYG CSV (default data/hyg.csv)\n"
        "  --constellations <path>   GeoJSON figures (default data/constellations.json)\n"
        "  --log-level <level>       trace, debug, info, warn, error, critical, off\n"
        "  --log-file <path>         Rotating log file (default skydome.log)\n"
        "  -h, --help                Show this help\n"
        "\n"
        "Cities:";

    for (const auto& preset : kCityPresets)
    {
        text += " \"";
        text += preset.name;
        text += '"';
    }
    text += '\n';
    return text;
}

} // namespace skydome::core
