/**
 * @file Pointer.cpp
 * @brief Implementation of JSON Pointer parsing and resolution
 */

#include "jpatch/Pointer.hpp"

#include <algorithm>
#include <cctype>
#include <limits>

namespace jpatch {

namespace {

/**
 * @brief Unescape one token of the wire form
 * @param raw Escaped token
 * @param text Whole pointer text, for error messages
 */
std::string unescape_token(const std::string& raw, const std::string& text) {
    std::string result;
    result.reserve(raw.size());

    for (std::size_t i = 0; i < raw.size(); ++i) {
        if (raw[i] != '~') {
            result += raw[i];
            continue;
        }
        if (i + 1 >= raw.size()) {
            throw InvalidPointer(text, "'~' at end of token");
        }
        switch (raw[i + 1]) {
            case '0': result += '~'; break;
            case '1': result += '/'; break;
            default:
                throw InvalidPointer(text, std::string("invalid escape '~") +
                                           raw[i + 1] + "'");
        }
        ++i;
    }
    return result;
}

/**
 * @brief Step from a container into the child named by token
 * @return Child, or nullptr if it does not exist
 */
template <typename V>
V* child(V* current, const std::string& token) {
    if (current->is_object()) {
        auto it = current->find(token);
        if (it == current->end()) {
            return nullptr;
        }
        return &*it;
    }

    if (current->is_array()) {
        if (!is_array_index(token)) {
            return nullptr;
        }
        const std::size_t idx = parse_array_index(token);
        if (idx >= current->size()) {
            return nullptr;
        }
        return &(*current)[idx];
    }

    return nullptr;
}

template <typename V>
V* find_impl(V& data, const Pointer& ptr) {
    V* current = &data;
    for (const auto& token : ptr) {
        current = child(current, token);
        if (current == nullptr) {
            return nullptr;
        }
    }
    return current;
}

} // anonymous namespace

Pointer Pointer::parse(const std::string& text) {
    if (text.empty()) {
        return Pointer{}; // Root
    }
    if (text[0] != '/') {
        throw InvalidPointer(text, "must be empty or start with '/'");
    }

    std::vector<std::string> tokens;
    std::size_t start = 1;
    while (true) {
        const std::size_t slash = text.find('/', start);
        const std::string raw = text.substr(start, slash == std::string::npos
                                                       ? std::string::npos
                                                       : slash - start);
        tokens.push_back(unescape_token(raw, text));
        if (slash == std::string::npos) {
            break;
        }
        start = slash + 1;
    }

    return Pointer(std::move(tokens));
}

std::string Pointer::to_string() const {
    std::string result;
    for (const auto& token : tokens_) {
        result += '/';
        result += escape_token(token);
    }
    return result;
}

const std::string& Pointer::back() const {
    if (tokens_.empty()) {
        throw InvalidPointer("", "the root pointer has no last token");
    }
    return tokens_.back();
}

Pointer Pointer::parent() const {
    if (tokens_.empty()) {
        throw InvalidPointer("", "the root pointer has no parent");
    }
    return Pointer(std::vector<std::string>(tokens_.begin(), tokens_.end() - 1));
}

Pointer Pointer::operator/(const std::string& token) const {
    Pointer result = *this;
    result.push_back(token);
    return result;
}

Pointer Pointer::operator/(std::size_t index) const {
    return *this / std::to_string(index);
}

bool Pointer::is_prefix_of(const Pointer& other) const noexcept {
    if (tokens_.size() > other.tokens_.size()) {
        return false;
    }
    return std::equal(tokens_.begin(), tokens_.end(), other.tokens_.begin());
}

std::ostream& operator<<(std::ostream& os, const Pointer& ptr) {
    return os << '"' << ptr.to_string() << '"';
}

std::string escape_token(const std::string& token) {
    std::string result;
    result.reserve(token.size());
    for (char c : token) {
        if (c == '~') {
            result += "~0";
        } else if (c == '/') {
            result += "~1";
        } else {
            result += c;
        }
    }
    return result;
}

bool is_array_index(const std::string& token) {
    if (token.empty()) return false;
    // Decimal digits; "0" is the only index allowed to start with 0
    if (token[0] == '0' && token.size() > 1) return false;
    return std::all_of(token.begin(), token.end(),
                       [](unsigned char c) { return std::isdigit(c); });
}

std::size_t parse_array_index(const std::string& token) {
    constexpr std::size_t max = std::numeric_limits<std::size_t>::max();
    std::size_t value = 0;
    for (char c : token) {
        const auto digit = static_cast<std::size_t>(c - '0');
        if (value > (max - digit) / 10) {
            return max;
        }
        value = value * 10 + digit;
    }
    return value;
}

const Value* find(const Value& data, const Pointer& ptr) {
    return find_impl(data, ptr);
}

Value* find(Value& data, const Pointer& ptr) {
    return find_impl(data, ptr);
}

const Value& resolve(const Value& data, const Pointer& ptr) {
    const Value* found = find(data, ptr);
    if (found == nullptr) {
        throw PathNotFound(ptr.to_string());
    }
    return *found;
}

Value& resolve(Value& data, const Pointer& ptr) {
    Value* found = find(data, ptr);
    if (found == nullptr) {
        throw PathNotFound(ptr.to_string());
    }
    return *found;
}

bool contains(const Value& data, const Pointer& ptr) {
    return find(data, ptr) != nullptr;
}

} // namespace jpatch
