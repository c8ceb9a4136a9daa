#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (engine + game loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace waymark::core
{
    /// @brief Centralized logging facility for Waymark.
    ///
    /// Provides two separate loggers:
    /// - **WAYMARK** (core): engine internals, reading guard, config, history store
    /// - **GAME**: discoveries, spoofing signals, player-facing rejections
    ///
    /// Both write to colored console output and a rotating log file.
    /// Call init() once from main() before any logging.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        /// Must be called once at startup before any WMK_ macros are used.
        /// @param log_file Path of the rotating log file.
        static void init(const std::string& log_file = "waymark.log");

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the engine-internal logger ("WAYMARK").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the game-level logger ("GAME").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace waymark::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define WMK_CORE_TRACE(...)    ::waymark::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define WMK_CORE_DEBUG(...)    ::waymark::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define WMK_CORE_INFO(...)     ::waymark::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define WMK_CORE_WARN(...)     ::waymark::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define WMK_CORE_ERROR(...)    ::waymark::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define WMK_CORE_CRITICAL(...) ::waymark::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Game log macros
// -----------------------------------------------------------------
#define WMK_TRACE(...)         ::waymark::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define WMK_DEBUG(...)         ::waymark::core::Logger::get_app_logger()->debug(__VA_ARGS__)
#define WMK_INFO(...)          ::waymark::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define WMK_WARN(...)          ::waymark::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define WMK_ERROR(...)         ::waymark::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define WMK_CRITICAL(...)      ::waymark::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
