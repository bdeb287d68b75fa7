#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (core + application loggers).

#include <spdlog/spdlog.h>

#include <filesystem>
#include <memory>

namespace skydome::core
{
    /// @brief Centralized logging facility for Skydome.
    ///
    /// Provides two separate loggers:
    /// - **SKYDOME** (core): catalog loading, window, renderer
    /// - **APP**: hovered stars, playback, camera actions
    ///
    /// Both write to colored console output and a rotating log file.
    /// Call init() once from main() before any logging.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        /// Must be called once at startup before any SKY_ macros are used.
        /// @param log_file Path of the rotating log file.
        static void init(const std::filesystem::path& log_file = "skydome.log");

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Change the level of both loggers.
        static void set_level(spdlog::level::level_enum level);

        /// @brief Access the core logger ("SKYDOME").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace skydome::core

// -----------------------------------------------------------------
// Core log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define SKY_CORE_TRACE(...)    ::skydome::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define SKY_CORE_DEBUG(...)    ::skydome::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define SKY_CORE_INFO(...)     ::skydome::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define SKY_CORE_WARN(...)     ::skydome::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define SKY_CORE_ERROR(...)    ::skydome::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define SKY_CORE_CRITICAL(...) ::skydome::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define SKY_TRACE(...)         ::skydome::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define SKY_DEBUG(...)         ::skydome::core::Logger::get_app_logger()->debug(__VA_ARGS__)
#define SKY_INFO(...)          ::skydome::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define SKY_WARN(...)          ::skydome::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define SKY_ERROR(...)         ::skydome::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define SKY_CRITICAL(...)      ::skydome::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
