/**
 * @file Errors.hpp
 * @brief Exception types for jpatch
 *
 * Error taxonomy:
 * - PatchError: Base class
 * - ParseError: Malformed document or patch text
 *   - PatchFormatError: Valid JSON that is not a valid patch
 * - InvalidPointer: Malformed JSON Pointer text
 * - ApplyError: An operation could not be applied
 *   - PathNotFound, IndexOutOfBounds, InvalidMove, TestFailed
 * - IoError: File could not be read, written or watched
 * - EditorError: External editor failed to spawn or exited abnormally
 * - ConfigError: Invalid settings
 */

#ifndef JPATCH_ERRORS_HPP
#define JPATCH_ERRORS_HPP

#include "jpatch/Value.hpp"

#include <cstddef>
#include <optional>
#include <stdexcept>
#include <string>

namespace jpatch {

/**
 * @brief Base class for all jpatch exceptions
 */
class PatchError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Document or patch text could not be parsed
 *
 * Line and column are 1-based; 0 means unknown.
 */
class ParseError : public PatchError {
public:
    /**
     * @brief Construct with source name, location and parser message
     * @param source File path or other name of the parsed text
     * @param offset Byte offset of the error
     * @param line Line of the error (0 if unknown)
     * @param column Column of the error (0 if unknown)
     * @param details Parser message
     */
    ParseError(std::string source, std::size_t offset, std::size_t line,
               std::size_t column, std::string details)
        : PatchError(format_message(source, offset, line, column, details))
        , source_(std::move(source))
        , offset_(offset)
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& source() const noexcept { return source_; }
    std::size_t offset() const noexcept { return offset_; }
    std::size_t line() const noexcept { return line_; }
    std::size_t column() const noexcept { return column_; }
    const std::string& details() const noexcept { return details_; }

private:
    std::string source_;
    std::size_t offset_;
    std::size_t line_;
    std::size_t column_;
    std::string details_;

    static std::string format_message(const std::string& source,
                                      std::size_t offset, std::size_t line,
                                      std::size_t column,
                                      const std::string& details) {
        std::string msg = "Parse error in '" + source + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line) +
                   ", column " + std::to_string(column);
        } else if (offset > 0) {
            msg += " at byte " + std::to_string(offset);
        }
        return msg + ": " + details;
    }
};

/**
 * @brief Well-formed JSON that does not describe a valid patch
 *
 * Raised for a non-array patch document, an unknown "op", or a missing
 * "path", "from" or "value" member.
 */
class PatchFormatError : public ParseError {
public:
    /**
     * @param source Name of the patch source
     * @param index Index of the offending operation, if any
     * @param details What is wrong with it
     */
    PatchFormatError(std::string source, std::optional<std::size_t> index,
                     const std::string& details)
        : ParseError(std::move(source), 0, 0, 0,
                     index ? "operation #" + std::to_string(*index) + ": " + details
                           : details)
        , index_(index)
    {}

    /**
     * @brief Index of the malformed operation within the patch array
     */
    std::optional<std::size_t> index() const noexcept { return index_; }

private:
    std::optional<std::size_t> index_;
};

/**
 * @brief JSON Pointer text is malformed or cannot be used here
 */
class InvalidPointer : public PatchError {
public:
    InvalidPointer(std::string pointer, const std::string& reason)
        : PatchError("Invalid pointer '" + pointer + "': " + reason)
        , pointer_(std::move(pointer))
    {}

    const std::string& pointer() const noexcept { return pointer_; }

private:
    std::string pointer_;
};

/**
 * @brief Base class for errors raised while applying an operation
 *
 * The apply engine annotates the error with the index and name of the
 * failing operation before propagating it, so what() reads e.g.
 * "operation #2 (remove): Path not found: '/a/b'".
 */
class ApplyError : public PatchError {
public:
    ApplyError(std::string path, const std::string& message)
        : PatchError(message)
        , path_(std::move(path))
        , message_(message)
    {}

    const char* what() const noexcept override { return message_.c_str(); }

    /**
     * @brief Pointer (wire form) of the location that triggered the error
     */
    const std::string& path() const noexcept { return path_; }

    /**
     * @brief Index of the failing operation, once annotated
     */
    std::optional<std::size_t> operation_index() const noexcept {
        return operation_index_;
    }

    /**
     * @brief Name of the failing operation ("add", "move", ...), once annotated
     */
    const std::string& operation() const noexcept { return operation_; }

    /**
     * @brief Record which operation failed and prefix the message with it
     */
    void annotate(std::size_t index, const std::string& op) {
        if (operation_index_) return;
        operation_index_ = index;
        operation_ = op;
        message_ = "operation #" + std::to_string(index) + " (" + op + "): " +
                   message_;
    }

private:
    std::string path_;
    std::string message_;
    std::optional<std::size_t> operation_index_;
    std::string operation_;
};

/**
 * @brief Path does not resolve in the current document
 */
class PathNotFound : public ApplyError {
public:
    explicit PathNotFound(std::string path)
        : ApplyError(path, "Path not found: '" + path + "'")
    {}
};

/**
 * @brief Array index past the end of the array
 */
class IndexOutOfBounds : public ApplyError {
public:
    IndexOutOfBounds(std::string path, std::size_t index, std::size_t size)
        : ApplyError(path, "Index " + std::to_string(index) +
                           " out of bounds for array of size " +
                           std::to_string(size) + " at '" + path + "'")
        , index_(index)
        , size_(size)
    {}

    std::size_t index() const noexcept { return index_; }
    std::size_t size() const noexcept { return size_; }

private:
    std::size_t index_;
    std::size_t size_;
};

/**
 * @brief Move of a value into one of its own descendants
 */
class InvalidMove : public ApplyError {
public:
    InvalidMove(std::string from, std::string path)
        : ApplyError(path, "Cannot move '" + from + "' into its own descendant '" +
                           path + "'")
        , from_(std::move(from))
    {}

    const std::string& from() const noexcept { return from_; }

private:
    std::string from_;
};

/**
 * @brief A "test" operation found a different value than expected
 */
class TestFailed : public ApplyError {
public:
    TestFailed(std::string path, Value expected, Value actual)
        : ApplyError(path, "Test failed at '" + path + "': expected " +
                           expected.dump() + ", found " + actual.dump())
        , expected_(std::move(expected))
        , actual_(std::move(actual))
    {}

    const Value& expected() const noexcept { return expected_; }
    const Value& actual() const noexcept { return actual_; }

private:
    Value expected_;
    Value actual_;
};

/**
 * @brief File could not be read, written or watched
 */
class IoError : public PatchError {
public:
    IoError(std::string path, const std::string& details)
        : PatchError("I/O error on '" + path + "': " + details)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept { return path_; }

private:
    std::string path_;
};

/**
 * @brief External editor could not be started or exited abnormally
 */
class EditorError : public PatchError {
public:
    EditorError(std::string command, const std::string& details)
        : PatchError("Editor '" + command + "' failed: " + details)
        , command_(std::move(command))
    {}

    const std::string& command() const noexcept { return command_; }

private:
    std::string command_;
};

/**
 * @brief Invalid or unreadable settings
 */
class ConfigError : public PatchError {
public:
    using PatchError::PatchError;
};

} // namespace jpatch

#endif // JPATCH_ERRORS_HPP
