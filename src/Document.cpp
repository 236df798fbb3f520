/**
 * @file Document.cpp
 * @brief Implementation of document parsing and equality
 */

#include "jpatch/Document.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace fs = std::filesystem;

namespace jpatch {

namespace {

/**
 * @brief Translate a byte offset into 1-based line and column
 */
void locate(const std::string& text, std::size_t offset,
            std::size_t& line, std::size_t& column) {
    line = 1;
    column = 1;
    const std::size_t end = std::min(offset, text.size());
    for (std::size_t i = 0; i < end; ++i) {
        if (text[i] == '\n') {
            ++line;
            column = 1;
        } else {
            ++column;
        }
    }
}

} // anonymous namespace

Value parse_document(const std::string& text, const std::string& source) {
    try {
        return Value::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        // e.byte is 1-based and points at the offending character
        const std::size_t offset = e.byte > 0 ? e.byte - 1 : 0;
        std::size_t line = 0;
        std::size_t column = 0;
        locate(text, offset, line, column);
        throw ParseError(source, offset, line, column, e.what());
    }
}

Value load_document(const std::string& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw IoError(path, "no such file");
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw IoError(path, std::strerror(errno));
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return parse_document(ss.str(), path);
}

std::string serialize(const Value& val, int indent) {
    return val.dump(indent);
}

bool deep_equal(const Value& a, const Value& b) {
    // Numbers compare by value across integer/unsigned/float storage
    if (a.is_number() && b.is_number()) {
        return a == b;
    }

    if (a.type() != b.type()) {
        return false;
    }

    if (a.is_object()) {
        if (a.size() != b.size()) {
            return false;
        }
        for (auto it = a.begin(); it != a.end(); ++it) {
            auto other = b.find(it.key());
            if (other == b.end() || !deep_equal(it.value(), *other)) {
                return false;
            }
        }
        return true;
    }

    if (a.is_array()) {
        if (a.size() != b.size()) {
            return false;
        }
        for (std::size_t i = 0; i < a.size(); ++i) {
            if (!deep_equal(a[i], b[i])) {
                return false;
            }
        }
        return true;
    }

    return a == b;
}

} // namespace jpatch
