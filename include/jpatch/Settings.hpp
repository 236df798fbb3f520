/**
 * @file Settings.hpp
 * @brief Layered tool settings
 *
 * Settings are merged from, lowest to highest precedence:
 * 1. built-in defaults
 * 2. a settings file (JSON or TOML, chosen by extension)
 * 3. environment variables with the JPATCH_ prefix
 * 4. command-line overrides
 *
 * Settings tree and defaults:
 *
 * ```json
 * {
 *   "editor": "",
 *   "apply_failure": "edit",
 *   "indent": 2,
 *   "log": {"level": "warn"},
 *   "watch": {"debounce_ms": 100, "poll_ms": 200}
 * }
 * ```
 *
 * Environment names map onto existing keys, underscores separating either
 * nesting levels or words of a key: JPATCH_WATCH_DEBOUNCE_MS sets
 * watch.debounce_ms, JPATCH_APPLY_FAILURE sets apply_failure.
 */

#ifndef JPATCH_SETTINGS_HPP
#define JPATCH_SETTINGS_HPP

#include "jpatch/Value.hpp"
#include "jpatch/EditSession.hpp"

#include <spdlog/common.h>

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace jpatch {

struct Settings {
    /// Editor command; empty means $VISUAL, then $EDITOR, then "vim"
    std::string editor;
    ApplyFailurePolicy apply_failure = ApplyFailurePolicy::EditBase;
    int indent = 2;
    spdlog::level::level_enum log_level = spdlog::level::warn;
    std::chrono::milliseconds debounce{100};
    std::chrono::milliseconds poll{200};
};

/**
 * @brief Sources for load_settings()
 */
struct LoadOptions {
    std::optional<std::string> file_path;
    /// Environment variable prefix; nullopt disables environment lookup
    std::optional<std::string> prefix = std::string("JPATCH");
    /// Dot-path overrides, highest precedence
    std::map<std::string, Value> overrides;
};

/**
 * @brief Built-in defaults as a settings tree
 */
Value default_settings();

/**
 * @brief Merge override_val into base
 *
 * Objects merge key by key, recursively; any other override replaces the
 * base value. A null override leaves base unchanged.
 */
Value deep_merge(const Value& base, const Value& override_val);

/**
 * @brief Set a value by dot-path ("watch.debounce_ms"), creating
 *        intermediate objects
 */
void set_by_dot(Value& data, const std::string& path, const Value& value);

/**
 * @brief Load a settings file
 * @throws IoError if missing, ParseError for syntax errors,
 *         ConfigError for an unsupported extension
 */
Value load_settings_file(const std::string& path);

/**
 * @brief Map an environment variable name onto a key path of base
 *
 * @param name Variable name without the prefix ("WATCH_DEBOUNCE_MS")
 * @param base Settings tree whose keys are the valid targets
 * @return Dot-path ("watch.debounce_ms") or nullopt if nothing matches
 */
std::optional<std::string> remap_env_key(const std::string& name, const Value& base);

/**
 * @brief Collect settings from environment variables
 *
 * @param prefix Variable prefix without trailing underscore
 * @param base Settings tree used to resolve key paths
 * @param env (NAME, VALUE) pairs, usually enumerate_environment()
 * @return Settings tree containing only the variables that matched
 */
Value env_settings(const std::string& prefix, const Value& base,
                   const std::vector<std::pair<std::string, std::string>>& env);

/**
 * @brief Current process environment as (NAME, VALUE) pairs
 */
std::vector<std::pair<std::string, std::string>> enumerate_environment();

/**
 * @brief Parse a textual setting value: JSON if it parses, string otherwise
 */
Value parse_json_or_string(const std::string& raw);

/**
 * @brief Validate a merged settings tree and convert it
 * @throws ConfigError naming the offending key
 */
Settings settings_from_value(const Value& tree);

/**
 * @brief Load and merge all layers
 */
Settings load_settings(const LoadOptions& opts);

/**
 * @brief Editor command to use: the setting, then $VISUAL, $EDITOR, "vim"
 */
std::string resolve_editor(const Settings& settings);

} // namespace jpatch

#endif // JPATCH_SETTINGS_HPP
