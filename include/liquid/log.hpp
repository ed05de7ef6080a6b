#ifndef LIQUID_LOG_HPP
#define LIQUID_LOG_HPP

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace liquid::log {

// Shared "liquid" logger; created on first use with the default pattern
std::shared_ptr<spdlog::logger> get();

// (Re)configure the logger: level is one of trace/debug/info/warn/error/off
void init(const std::string& level = "info");

void set_level(const std::string& level);

} // namespace liquid::log

#endif // LIQUID_LOG_HPP
