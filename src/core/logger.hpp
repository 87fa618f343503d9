#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (library + application loggers).

#include <spdlog/spdlog.h>

#include <memory>

namespace helios::core
{
    /// @brief Centralized logging facility for Helios.
    ///
    /// Provides two separate loggers:
    /// - **HELIOS** (core): the solar position library internals
    /// - **APP**: the command line tool
    ///
    /// Both write to colored console output and a rotating log file.
    /// Executables call init() once from main() before any logging. Until then
    /// both accessors hand out a silent logger, so the library can be linked
    /// into programs that never configure logging.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        static void init();

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the library logger ("HELIOS").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& silent_logger();

        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace helios::core

// -----------------------------------------------------------------
// Library log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define HLS_CORE_TRACE(...)    ::helios::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define HLS_CORE_DEBUG(...)    ::helios::core::Logger::get_core_logger()->debug(__VA_ARGS__)
#define HLS_CORE_INFO(...)     ::helios::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define HLS_CORE_WARN(...)     ::helios::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define HLS_CORE_ERROR(...)    ::helios::core::Logger::get_core_logger()->error(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define HLS_INFO(...)          ::helios::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define HLS_WARN(...)          ::helios::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define HLS_ERROR(...)         ::helios::core::Logger::get_app_logger()->error(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
