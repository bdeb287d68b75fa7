/// @file main.cpp
/// @brief Skydome entry point: configuration, data loading, application run.

#include "catalog/catalog_loader.hpp"
#include "catalog/constellations.hpp"
#include "catalog/star_catalog.hpp"
#include "core/application.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"

#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace
{

/// Re-point the logger at the configured file. A file that cannot be
/// opened leaves logging on the default file.
void configure_logging(const skydome::core::AppConfig& config)
{
    if (config.log_file != skydome::core::AppConfig{}.log_file)
    {
        try
        {
            skydome::core::Logger::init(config.log_file);
        }
        catch (const spdlog::spdlog_ex& ex)
        {
            skydome::core::Logger::init();
            SKY_CORE_ERROR("Cannot open log file {}: {}", config.log_file.string(), ex.what());
        }
    }
    skydome::core::Logger::set_level(config.log_level);
}

} // anonymous namespace

int main(int argc, char* argv[])
{
    using namespace skydome;

    core::Logger::init();

    const std::vector<std::string> args(argv + 1, argv + argc);
    auto config = core::parse_command_line(args);
    if (!config)
    {
        std::fputs(core::usage().c_str(), stderr);
        core::Logger::shutdown();
        return EXIT_FAILURE;
    }

    if (config->show_help)
    {
        std::fputs(core::usage().c_str(), stdout);
        core::Logger::shutdown();
        return EXIT_SUCCESS;
    }

    configure_logging(*config);
    SKY_CORE_INFO("Skydome starting");

    // -----------------------------------------------------------------
    // Star catalog: the one hard requirement
    // -----------------------------------------------------------------
    auto records = catalog::CatalogLoader::load_hyg_csv(config->catalog_path, config->max_magnitude);
    if (!records)
    {
        SKY_CRITICAL("Star catalog unavailable: {}", config->catalog_path.string());
        core::Logger::shutdown();
        return EXIT_FAILURE;
    }

    auto stars = catalog::StarCatalog::build(std::move(*records));
    if (stars.empty())
    {
        SKY_CRITICAL("Star catalog {} has no usable stars", config->catalog_path.string());
        core::Logger::shutdown();
        return EXIT_FAILURE;
    }
    SKY_CORE_INFO("Star catalog loaded: {} stars from {}", stars.size(), config->catalog_path.string());

    // -----------------------------------------------------------------
    // Constellation figures are optional
    // -----------------------------------------------------------------
    auto constellations = catalog::ConstellationLoader::load_geojson(config->constellations_path);
    if (!constellations)
    {
        SKY_CORE_WARN("Constellation figures unavailable ({}); line overlay disabled",
                      config->constellations_path.string());
        config->overlays.constellation_lines = false;
    }

    {
        core::Application app(std::move(*config), std::move(stars), std::move(constellations));
        app.run();
    }

    SKY_CORE_INFO("Skydome shut down cleanly");
    core::Logger::shutdown();
    return EXIT_SUCCESS;
}
