#include "pagewright/core/logger.hpp"
#include "pagewright/core/utils.hpp"

#include <array>
#include <mutex>
#include <utility>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace pagewright {

namespace {

std::mutex g_mutex;
std::shared_ptr<spdlog::logger> g_logger;

constexpr std::array<std::pair<std::string_view, spdlog::level::level_enum>, 8> kLevels{{
    {"trace", spdlog::level::trace},
    {"debug", spdlog::level::debug},
    {"info", spdlog::level::info},
    {"warn", spdlog::level::warn},
    {"warning", spdlog::level::warn},
    {"error", spdlog::level::err},
    {"critical", spdlog::level::critical},
    {"off", spdlog::level::off},
}};

auto make_logger(std::string_view name) -> std::shared_ptr<spdlog::logger> {
    spdlog::drop(std::string(name));
    auto logger = spdlog::stdout_color_mt(std::string(name));
    logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] [%s:%#] %v");
    return logger;
}

} // anonymous namespace

auto Logger::parse_level(std::string_view level) -> Result<spdlog::level::level_enum> {
    auto wanted = utils::to_lower(utils::trim(level));
    for (const auto& [name, value] : kLevels) {
        if (name == wanted) {
            return value;
        }
    }
    return std::unexpected(make_error(ErrorCode::InvalidConfig, "Unknown log level",
                                      std::string(level)));
}

void Logger::init(std::string_view name, std::string_view level) {
    auto parsed = parse_level(level).value_or(spdlog::level::info);
    std::lock_guard lock(g_mutex);
    g_logger = make_logger(name);
    g_logger->set_level(parsed);
}

auto Logger::get() -> std::shared_ptr<spdlog::logger> {
    std::lock_guard lock(g_mutex);
    if (!g_logger) {
        g_logger = make_logger("pagewright");
        g_logger->set_level(spdlog::level::info);
    }
    return g_logger;
}

auto Logger::set_level(std::string_view level) -> VoidResult {
    auto parsed = parse_level(level);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    get()->set_level(*parsed);
    return {};
}

void Logger::flush() {
    std::lock_guard lock(g_mutex);
    if (g_logger) g_logger->flush();
}

} // namespace pagewright
