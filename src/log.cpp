// =============================================================================
// log.cpp - spdlog setup for the library
// =============================================================================

#include "liquid/log.hpp"

#include <mutex>

#include <spdlog/sinks/stdout_color_sinks.h>

namespace liquid::log {

namespace {

constexpr const char* LOGGER_NAME = "liquid";
constexpr const char* PATTERN = "[%Y-%m-%d %H:%M:%S.%e] [%n] [%^%l%$] %v";

std::once_flag g_create_once;

std::shared_ptr<spdlog::logger> create() {
    auto logger = spdlog::get(LOGGER_NAME);
    if (!logger) {
        logger = spdlog::stdout_color_mt(LOGGER_NAME);
        logger->set_pattern(PATTERN);
        logger->set_level(spdlog::level::info);
    }
    return logger;
}

} // anonymous namespace

std::shared_ptr<spdlog::logger> get() {
    static std::shared_ptr<spdlog::logger> logger;
    std::call_once(g_create_once, [] { logger = create(); });
    return logger;
}

void init(const std::string& level) {
    auto logger = get();
    logger->set_pattern(PATTERN);
    set_level(level);
}

void set_level(const std::string& level) {
    get()->set_level(spdlog::level::from_str(level));
}

} // namespace liquid::log
