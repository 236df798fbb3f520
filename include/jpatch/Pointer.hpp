/**
 * @file Pointer.hpp
 * @brief JSON Pointer (RFC 6901) addressing into documents
 *
 * A Pointer is a sequence of unescaped reference tokens. Whether a token
 * names an object key or an array index is decided when it is resolved
 * against a container, so "/0" addresses key "0" of an object and
 * element 0 of an array.
 *
 * Wire form:
 * - "" is the document root
 * - "/a/b" is key "b" inside key "a"
 * - "~0" encodes '~' and "~1" encodes '/' inside a token
 * - "-" as a token addresses one past the last element of an array
 */

#ifndef JPATCH_POINTER_HPP
#define JPATCH_POINTER_HPP

#include "jpatch/Value.hpp"
#include "jpatch/Errors.hpp"

#include <cstddef>
#include <ostream>
#include <string>
#include <vector>

namespace jpatch {

/// Token addressing the position after the last array element
inline const std::string kAppendToken = "-";

class Pointer {
public:
    using const_iterator = std::vector<std::string>::const_iterator;

    Pointer() = default;
    explicit Pointer(std::vector<std::string> tokens) : tokens_(std::move(tokens)) {}

    /**
     * @brief Parse the escaped wire form
     *
     * @throws InvalidPointer if text is non-empty and does not start with
     *         '/', or contains '~' not followed by '0' or '1'
     *
     * Examples:
     * - "" -> []
     * - "/a~1b/0" -> ["a/b", "0"]
     * - "/" -> [""]
     */
    static Pointer parse(const std::string& text);

    /**
     * @brief Escaped wire form; parse(p.to_string()) == p
     */
    std::string to_string() const;

    bool is_root() const noexcept { return tokens_.empty(); }
    std::size_t size() const noexcept { return tokens_.size(); }
    const std::vector<std::string>& tokens() const noexcept { return tokens_; }

    const_iterator begin() const noexcept { return tokens_.begin(); }
    const_iterator end() const noexcept { return tokens_.end(); }

    /**
     * @brief Last token
     * @throws InvalidPointer for the root pointer
     */
    const std::string& back() const;

    /**
     * @brief Pointer without its last token
     * @throws InvalidPointer for the root pointer
     */
    Pointer parent() const;

    void push_back(std::string token) { tokens_.push_back(std::move(token)); }
    void pop_back() { tokens_.pop_back(); }

    /// Child pointer with an extra key token
    Pointer operator/(const std::string& token) const;
    /// Child pointer with an extra index token
    Pointer operator/(std::size_t index) const;

    /**
     * @brief True if every token of this pointer starts other
     *
     * The root is a prefix of every pointer; a pointer is a prefix of itself.
     */
    bool is_prefix_of(const Pointer& other) const noexcept;

    /**
     * @brief True if other is a proper descendant of this pointer
     */
    bool is_strict_prefix_of(const Pointer& other) const noexcept {
        return tokens_.size() < other.tokens_.size() && is_prefix_of(other);
    }

    friend bool operator==(const Pointer& a, const Pointer& b) {
        return a.tokens_ == b.tokens_;
    }
    friend bool operator!=(const Pointer& a, const Pointer& b) {
        return !(a == b);
    }

private:
    std::vector<std::string> tokens_;
};

std::ostream& operator<<(std::ostream& os, const Pointer& ptr);

/**
 * @brief Escape a token for the wire form ('~' -> "~0", '/' -> "~1")
 */
std::string escape_token(const std::string& token);

/**
 * @brief Check if token is a valid array index
 *
 * Valid indices are "0" or a run of digits without a leading zero.
 */
bool is_array_index(const std::string& token);

/**
 * @brief Parse an array index, saturating at the largest std::size_t
 * @pre is_array_index(token)
 */
std::size_t parse_array_index(const std::string& token);

/**
 * @brief Locate the value at ptr
 * @return Pointer to the value, or nullptr if any token does not resolve
 */
const Value* find(const Value& data, const Pointer& ptr);
Value* find(Value& data, const Pointer& ptr);

/**
 * @brief Locate the value at ptr (strict)
 * @throws PathNotFound if any token does not resolve
 */
const Value& resolve(const Value& data, const Pointer& ptr);
Value& resolve(Value& data, const Pointer& ptr);

/**
 * @brief Check if ptr resolves in data
 */
bool contains(const Value& data, const Pointer& ptr);

} // namespace jpatch

#endif // JPATCH_POINTER_HPP
