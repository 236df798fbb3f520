/**
 * @file Settings.cpp
 * @brief Implementation of layered settings
 */

#include "jpatch/Settings.hpp"
#include "jpatch/Document.hpp"
#include "jpatch/Errors.hpp"
#include "jpatch/Logging.hpp"

#include <toml++/toml.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <filesystem>

#include <unistd.h>

extern char** environ;

namespace fs = std::filesystem;

namespace jpatch {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return s;
}

/**
 * @brief Split on delim, dropping empty pieces
 */
std::vector<std::string> split(const std::string& s, char delim) {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (start <= s.size()) {
        std::size_t end = s.find(delim, start);
        if (end == std::string::npos) {
            end = s.size();
        }
        if (end > start) {
            parts.push_back(s.substr(start, end - start));
        }
        start = end + 1;
    }
    return parts;
}

/**
 * @brief Convert a parsed TOML node into a settings tree
 * @param key Dotted key of node, for error messages
 * @throws ConfigError for dates and times, which no setting accepts
 */
Value from_toml(const toml::node& node, const std::string& key) {
    if (const auto* table = node.as_table()) {
        Value obj = Value::object();
        for (auto&& [k, v] : *table) {
            const std::string name(k.str());
            obj[name] = from_toml(v, key.empty() ? name : key + "." + name);
        }
        return obj;
    }
    if (const auto* items = node.as_array()) {
        Value arr = Value::array();
        for (const auto& item : *items) {
            arr.push_back(from_toml(item, key));
        }
        return arr;
    }
    if (const auto* str = node.as_string()) {
        return Value(str->get());
    }
    if (const auto* num = node.as_integer()) {
        return Value(num->get());
    }
    if (const auto* num = node.as_floating_point()) {
        return Value(num->get());
    }
    if (const auto* flag = node.as_boolean()) {
        return Value(flag->get());
    }
    throw ConfigError("Setting '" + key + "': TOML dates and times are not supported");
}

/**
 * @brief Look up a dot-path that the defaults guarantee to exist
 * @throws ConfigError if a layer replaced part of the tree
 */
const Value& setting(const Value& tree, const std::string& path) {
    const Value* current = &tree;
    for (const auto& seg : split(path, '.')) {
        if (!current->is_object()) {
            throw ConfigError("Setting '" + path + "': expected object, found " +
                              type_name(*current));
        }
        auto it = current->find(seg);
        if (it == current->end()) {
            throw ConfigError("Missing setting '" + path + "'");
        }
        current = &*it;
    }
    return *current;
}

std::int64_t integer_setting(const Value& tree, const std::string& path,
                             std::int64_t minimum) {
    const Value& v = setting(tree, path);
    if (!v.is_number_integer()) {
        throw ConfigError("Setting '" + path + "' must be an integer, got " +
                          (v.is_number() ? v.dump() : type_name(v)));
    }
    const auto n = v.get<std::int64_t>();
    if (n < minimum) {
        throw ConfigError("Setting '" + path + "' must be at least " +
                          std::to_string(minimum) + ", got " + std::to_string(n));
    }
    return n;
}

const std::string& string_setting(const Value& tree, const std::string& path) {
    const Value& v = setting(tree, path);
    if (!v.is_string()) {
        throw ConfigError("Setting '" + path + "' must be a string, got " +
                          type_name(v));
    }
    return v.get_ref<const std::string&>();
}

} // anonymous namespace

Value default_settings() {
    return Value{
        {"editor", ""},
        {"apply_failure", "edit"},
        {"indent", 2},
        {"log", {{"level", "warn"}}},
        {"watch", {{"debounce_ms", 100}, {"poll_ms", 200}}},
    };
}

Value deep_merge(const Value& base, const Value& override_val) {
    if (!base.is_object() || !override_val.is_object()) {
        return override_val.is_null() ? base : override_val;
    }

    Value merged = base;
    for (const auto& item : override_val.items()) {
        const auto existing = merged.find(item.key());
        merged[item.key()] = existing == merged.end()
                                 ? item.value()
                                 : deep_merge(*existing, item.value());
    }
    return merged;
}

void set_by_dot(Value& data, const std::string& path, const Value& value) {
    Value* node = &data;
    for (const auto& seg : split(path, '.')) {
        if (!node->is_object()) {
            *node = Value::object();
        }
        node = &(*node)[seg];
    }
    *node = value;
}

Value load_settings_file(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw IoError(path, "no such file");
    }

    const std::string ext = to_lower(fs::path(path).extension().string());

    if (ext == ".json") {
        return load_document(path);
    }

    if (ext == ".toml") {
        try {
            const toml::table table = toml::parse_file(path);
            return from_toml(table, "");
        } catch (const toml::parse_error& e) {
            throw ParseError(path, 0,
                             static_cast<std::size_t>(e.source().begin.line),
                             static_cast<std::size_t>(e.source().begin.column),
                             std::string(e.description()));
        }
    }

    throw ConfigError("Unsupported settings file type '" + ext + "' for " + path +
                      " (expected .json or .toml)");
}

std::optional<std::string> remap_env_key(const std::string& name, const Value& base) {
    const auto words = split(to_lower(name), '_');
    if (words.empty()) {
        return std::nullopt;
    }

    const Value* node = &base;
    std::vector<std::string> segments;
    std::size_t i = 0;

    while (i < words.size()) {
        if (!node->is_object()) {
            return std::nullopt;
        }

        // Longest run of words that names a key at this level
        bool matched = false;
        for (std::size_t j = words.size(); j > i; --j) {
            std::string key = words[i];
            for (std::size_t k = i + 1; k < j; ++k) {
                key += '_';
                key += words[k];
            }
            auto it = node->find(key);
            if (it != node->end()) {
                segments.push_back(key);
                node = &*it;
                i = j;
                matched = true;
                break;
            }
        }
        if (!matched) {
            return std::nullopt;
        }
    }

    std::string path = segments[0];
    for (std::size_t k = 1; k < segments.size(); ++k) {
        path += '.';
        path += segments[k];
    }
    return path;
}

Value env_settings(const std::string& prefix, const Value& base,
                   const std::vector<std::pair<std::string, std::string>>& env) {
    Value result = Value::object();
    const std::string wanted = to_lower(prefix) + "_";

    for (const auto& [name, raw] : env) {
        if (name.size() <= wanted.size() ||
            to_lower(name.substr(0, wanted.size())) != wanted) {
            continue;
        }

        const auto key = remap_env_key(name.substr(wanted.size()), base);
        if (!key) {
            logger()->debug("ignoring environment variable {}: no such setting", name);
            continue;
        }
        set_by_dot(result, *key, parse_json_or_string(raw));
    }
    return result;
}

std::vector<std::pair<std::string, std::string>> enumerate_environment() {
    std::vector<std::pair<std::string, std::string>> env;
    for (char** entry = environ; entry != nullptr && *entry != nullptr; ++entry) {
        const char* eq = std::strchr(*entry, '=');
        if (eq == nullptr) {
            continue;
        }
        env.emplace_back(std::string(*entry, eq), std::string(eq + 1));
    }
    return env;
}

Value parse_json_or_string(const std::string& raw) {
    // accept=false: report failure instead of throwing
    Value parsed = Value::parse(raw, nullptr, false);
    if (parsed.is_discarded()) {
        return Value(raw);
    }
    return parsed;
}

Settings settings_from_value(const Value& tree) {
    Settings s;

    s.editor = string_setting(tree, "editor");

    const std::string& policy = string_setting(tree, "apply_failure");
    if (policy == "edit") {
        s.apply_failure = ApplyFailurePolicy::EditBase;
    } else if (policy == "fail") {
        s.apply_failure = ApplyFailurePolicy::FailFast;
    } else {
        throw ConfigError("Setting 'apply_failure' must be \"edit\" or \"fail\", got \"" +
                          policy + "\"");
    }

    s.indent = static_cast<int>(integer_setting(tree, "indent", 0));
    s.log_level = parse_log_level(string_setting(tree, "log.level"));
    s.debounce = std::chrono::milliseconds(integer_setting(tree, "watch.debounce_ms", 0));
    s.poll = std::chrono::milliseconds(integer_setting(tree, "watch.poll_ms", 1));

    return s;
}

Settings load_settings(const LoadOptions& opts) {
    Value merged = default_settings();

    if (opts.file_path.has_value()) {
        merged = deep_merge(merged, load_settings_file(*opts.file_path));
    }

    if (opts.prefix.has_value() && !opts.prefix->empty()) {
        merged = deep_merge(merged, env_settings(*opts.prefix, merged,
                                                 enumerate_environment()));
    }

    // Command line last
    for (const auto& [path, value] : opts.overrides) {
        set_by_dot(merged, path, value);
    }

    return settings_from_value(merged);
}

std::string resolve_editor(const Settings& settings) {
    if (!settings.editor.empty()) {
        return settings.editor;
    }
    for (const char* var : {"VISUAL", "EDITOR"}) {
        const char* value = std::getenv(var);
        if (value != nullptr && *value != '\0') {
            return value;
        }
    }
    return "vim";
}

} // namespace jpatch
