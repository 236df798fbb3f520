/**
 * @file Logging.cpp
 * @brief Logger setup
 */

#include "jpatch/Logging.hpp"
#include "jpatch/Errors.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

namespace jpatch {

std::shared_ptr<spdlog::logger> init_logging(spdlog::level::level_enum level) {
    auto log = spdlog::get(kLoggerName);
    if (!log) {
        log = spdlog::stderr_color_mt(kLoggerName);
        log->set_pattern("[%H:%M:%S.%e] [%^%l%$] %v");
    }
    log->set_level(level);
    return log;
}

std::shared_ptr<spdlog::logger> logger() {
    auto log = spdlog::get(kLoggerName);
    if (!log) {
        log = init_logging(spdlog::level::warn);
    }
    return log;
}

spdlog::level::level_enum parse_log_level(const std::string& name) {
    const auto level = spdlog::level::from_str(name);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && name != "off") {
        throw ConfigError("Unknown log level: '" + name + "'");
    }
    return level;
}

} // namespace jpatch
