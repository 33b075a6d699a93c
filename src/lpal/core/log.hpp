#pragma once

// Logging for lpal using spdlog
//
// Log levels (compile-time filtered via SPDLOG_ACTIVE_LEVEL):
//   - TRACE: Per-step detail (e.g., every accessibility element visited)
//   - DEBUG: State transitions and property read-backs
//   - INFO:  Normal operational messages (e.g., startup, config loaded)
//   - WARN:  Non-fatal inconsistencies (e.g., configuration mismatch)
//   - ERROR: Errors surfaced to a caller
//
// Usage:
//   LOG_DEBUG("Presenting widget {} ({:#x})", name, window);
//   LOG_WARN("Stacking level mismatch: desired={} observed={}", desired, observed);

#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <string>

namespace lpal::log {

// Initialize logging - call once at startup
inline void init(std::string const& file_path = "/tmp/lpal.log")
{
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::trace);
    console_sink->set_pattern("[%H:%M:%S.%e] [%^%l%$] [t%t] %v");

    std::vector<spdlog::sink_ptr> sinks{ console_sink };
    if (!file_path.empty())
    {
        auto file_sink = std::make_shared<spdlog::sinks::basic_file_sink_mt>(file_path, true);
        file_sink->set_level(spdlog::level::trace);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] [%s:%#] %v");
        sinks.push_back(file_sink);
    }

    auto logger = std::make_shared<spdlog::logger>("lpal", sinks.begin(), sinks.end());
    logger->set_level(spdlog::level::trace);
    logger->flush_on(spdlog::level::debug);

    spdlog::set_default_logger(logger);
}

// Runtime level from config ("trace", "debug", "info", "warn", "error")
inline void set_level(std::string const& level)
{
    spdlog::set_level(spdlog::level::from_str(level));
}

inline void shutdown()
{
    spdlog::shutdown();
}

} // namespace lpal::log

#define LOG_TRACE(...) SPDLOG_TRACE(__VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_DEBUG(__VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_INFO(__VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_WARN(__VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_ERROR(__VA_ARGS__)
#define LOG_CRITICAL(...) SPDLOG_CRITICAL(__VA_ARGS__)
