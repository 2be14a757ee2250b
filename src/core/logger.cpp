/// @file logger.cpp
/// @brief Logger implementation: dual spdlog loggers sharing console + rotating file sinks.

#include "core/logger.hpp"

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <vector>

namespace orrery::core
{

// ---- Static member definitions ----
std::shared_ptr<spdlog::logger> Logger::s_core_logger;
std::shared_ptr<spdlog::logger> Logger::s_app_logger;

namespace
{

constexpr const char* kPattern = "[%T.%e] [%n] [%^%l%$] %v";

std::shared_ptr<spdlog::logger> make_logger(const std::string& name, const std::vector<spdlog::sink_ptr>& sinks)
{
    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::warn);
    spdlog::register_logger(logger);
    return logger;
}

void remove_sink(spdlog::logger& logger, const spdlog::sink_ptr& sink)
{
    auto& sinks = logger.sinks();
    sinks.erase(std::remove(sinks.begin(), sinks.end(), sink), sinks.end());
}

} // anonymous namespace

void Logger::init(const LoggerConfig& config)
{
    if (s_core_logger && s_app_logger)
    {
        return;
    }

    // -----------------------------------------------------------------
    // Shared sinks: both loggers write to the same console and file
    // -----------------------------------------------------------------
    std::vector<spdlog::sink_ptr> sinks;

    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern(kPattern);
    console_sink->set_level(config.console_level);
    sinks.push_back(console_sink);

    if (!config.file_path.empty())
    {
        // Rotating file sink: 5 MB max size, 3 rotated files
        constexpr std::size_t kMaxFileSize = 5 * 1024 * 1024;
        constexpr std::size_t kMaxFiles = 3;
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            config.file_path, kMaxFileSize, kMaxFiles);
        file_sink->set_pattern(kPattern);
        file_sink->set_level(config.file_level);
        sinks.push_back(file_sink);
    }

    // Core: registry, scaling, pipeline, camera, selection
    s_core_logger = make_logger(config.core_name, sinks);
    // App: viewer sessions, user-facing
    s_app_logger = make_logger(config.app_name, sinks);
}

void Logger::attach_sink(const spdlog::sink_ptr& sink)
{
    if (!s_core_logger || !s_app_logger)
    {
        return;
    }
    sink->set_pattern(kPattern);
    s_core_logger->sinks().push_back(sink);
    s_app_logger->sinks().push_back(sink);
}

void Logger::detach_sink(const spdlog::sink_ptr& sink)
{
    if (s_core_logger)
    {
        remove_sink(*s_core_logger, sink);
    }
    if (s_app_logger)
    {
        remove_sink(*s_app_logger, sink);
    }
}

void Logger::shutdown()
{
    s_core_logger.reset();
    s_app_logger.reset();
    spdlog::drop_all();
    spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& Logger::get_core_logger()
{
    return s_core_logger;
}

std::shared_ptr<spdlog::logger>& Logger::get_app_logger()
{
    return s_app_logger;
}

} // namespace orrery::core
