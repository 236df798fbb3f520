/**
 * @file Logging.hpp
 * @brief spdlog logger shared by the jpatch library and CLI
 */

#ifndef JPATCH_LOGGING_HPP
#define JPATCH_LOGGING_HPP

#include <spdlog/spdlog.h>

#include <memory>
#include <string>

namespace jpatch {

/// Name under which the logger is registered with spdlog
inline const std::string kLoggerName = "jpatch";

/**
 * @brief Create (or reconfigure) the "jpatch" logger
 *
 * Logs go to stderr so stdout stays reserved for patches and documents.
 */
std::shared_ptr<spdlog::logger> init_logging(spdlog::level::level_enum level);

/**
 * @brief The "jpatch" logger, created at warn level on first use
 */
std::shared_ptr<spdlog::logger> logger();

/**
 * @brief Parse a level name ("trace", "debug", "info", "warn", "error",
 *        "critical", "off")
 * @throws ConfigError for unknown names
 */
spdlog::level::level_enum parse_log_level(const std::string& name);

} // namespace jpatch

#endif // JPATCH_LOGGING_HPP
