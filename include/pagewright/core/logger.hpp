#pragma once

#include <memory>
#include <string>
#include <string_view>

#include <spdlog/spdlog.h>

#include "pagewright/core/error.hpp"

namespace pagewright {

/// Process-wide spdlog logger. Safe to use from the worker threads; the
/// first LOG_* call creates it with defaults if init() has not run yet.
class Logger {
public:
    static void init(std::string_view name = "pagewright", std::string_view level = "info");
    static auto get() -> std::shared_ptr<spdlog::logger>;

    /// Maps "trace" .. "critical" or "off" (case-insensitive) to a level.
    static auto parse_level(std::string_view level) -> Result<spdlog::level::level_enum>;
    static auto set_level(std::string_view level) -> VoidResult;
    static void flush();
};

} // namespace pagewright

#define LOG_TRACE(...) SPDLOG_LOGGER_TRACE(::pagewright::Logger::get(), __VA_ARGS__)
#define LOG_DEBUG(...) SPDLOG_LOGGER_DEBUG(::pagewright::Logger::get(), __VA_ARGS__)
#define LOG_INFO(...)  SPDLOG_LOGGER_INFO(::pagewright::Logger::get(), __VA_ARGS__)
#define LOG_WARN(...)  SPDLOG_LOGGER_WARN(::pagewright::Logger::get(), __VA_ARGS__)
#define LOG_ERROR(...) SPDLOG_LOGGER_ERROR(::pagewright::Logger::get(), __VA_ARGS__)
#define LOG_FATAL(...) SPDLOG_LOGGER_CRITICAL(::pagewright::Logger::get(), __VA_ARGS__)
