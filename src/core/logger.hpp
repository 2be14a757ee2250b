#pragma once

/// @file logger.hpp
/// @brief Dual-logger system wrapping spdlog (engine + application loggers).

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace orrery::core
{
    /// @brief Logger setup; the defaults suit the demo and the test runners.
    struct LoggerConfig
    {
        std::string core_name = "ORRERY";
        std::string app_name  = "APP";
        std::string file_path = "orrery.log";   ///< Empty disables the file sink
        spdlog::level::level_enum console_level = spdlog::level::trace;
        spdlog::level::level_enum file_level    = spdlog::level::trace;
    };
    /// @brief Centralized logging facility for Orrery.
    ///
    /// Provides two separate loggers:
    /// - **ORRERY** (core): registry, scaling, pipeline, camera, selection
    /// - **APP**: viewer sessions and user-facing messages
    ///
    /// Both write to colored console output and, unless LoggerConfig::file_path
    /// is empty, a rotating log file. Call init() once from main() before any logging.
    class Logger
    {
    public:
        /// @brief Initialize both loggers with console + file sinks.
        /// Must be called once at startup before any ORR_ macros are used;
        /// later calls are ignored until shutdown().
        static void init(const LoggerConfig& config = {});

        /// @brief Route both loggers to an extra sink as well (e.g. a capture sink).
        static void attach_sink(const spdlog::sink_ptr& sink);

        /// @brief Remove a sink added with attach_sink().
        static void detach_sink(const spdlog::sink_ptr& sink);

        /// @brief Flush and tear down all loggers.
        /// Call once at shutdown after all logging is complete.
        static void shutdown();

        /// @brief Access the engine-internal logger ("ORRERY").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_core_logger();

        /// @brief Access the application-level logger ("APP").
        [[nodiscard]] static std::shared_ptr<spdlog::logger>& get_app_logger();

    private:
        static std::shared_ptr<spdlog::logger> s_core_logger;
        static std::shared_ptr<spdlog::logger> s_app_logger;
    };

} // namespace orrery::core

// -----------------------------------------------------------------
// Core engine log macros
// -----------------------------------------------------------------
// NOLINTBEGIN(cppcoreguidelines-macro-usage)
#define ORR_CORE_TRACE(...)    ::orrery::core::Logger::get_core_logger()->trace(__VA_ARGS__)
#define ORR_CORE_INFO(...)     ::orrery::core::Logger::get_core_logger()->info(__VA_ARGS__)
#define ORR_CORE_WARN(...)     ::orrery::core::Logger::get_core_logger()->warn(__VA_ARGS__)
#define ORR_CORE_ERROR(...)    ::orrery::core::Logger::get_core_logger()->error(__VA_ARGS__)
#define ORR_CORE_CRITICAL(...) ::orrery::core::Logger::get_core_logger()->critical(__VA_ARGS__)

// -----------------------------------------------------------------
// Application log macros
// -----------------------------------------------------------------
#define ORR_TRACE(...)         ::orrery::core::Logger::get_app_logger()->trace(__VA_ARGS__)
#define ORR_INFO(...)          ::orrery::core::Logger::get_app_logger()->info(__VA_ARGS__)
#define ORR_WARN(...)          ::orrery::core::Logger::get_app_logger()->warn(__VA_ARGS__)
#define ORR_ERROR(...)         ::orrery::core::Logger::get_app_logger()->error(__VA_ARGS__)
#define ORR_CRITICAL(...)      ::orrery::core::Logger::get_app_logger()->critical(__VA_ARGS__)
// NOLINTEND(cppcoreguidelines-macro-usage)
