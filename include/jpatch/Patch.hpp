/**
 * @file Patch.hpp
 * @brief JSON Patch (RFC 6902) operations and patch (de)serialization
 *
 * A Patch is an ordered list of operations applied left to right, each
 * seeing the result of the previous one. On disk a patch is a JSON array:
 *
 * ```json
 * [
 *   {"op": "test",    "path": "/x", "value": 1},
 *   {"op": "replace", "path": "/x", "value": 2},
 *   {"op": "move",    "from": "/a", "path": "/b"}
 * ]
 * ```
 */

#ifndef JPATCH_PATCH_HPP
#define JPATCH_PATCH_HPP

#include "jpatch/Value.hpp"
#include "jpatch/Pointer.hpp"
#include "jpatch/Errors.hpp"

#include <optional>
#include <string>
#include <vector>

namespace jpatch {

enum class OpType {
    Add,
    Remove,
    Replace,
    Move,
    Copy,
    Test
};

/**
 * @brief Wire name of an operation type ("add", "remove", ...)
 */
const std::string& op_name(OpType type);

/**
 * @brief Operation type for a wire name, or nullopt if unknown
 */
std::optional<OpType> op_from_name(const std::string& name);

/**
 * @brief One patch operation
 *
 * `from` is used by Move and Copy; `value` by Add, Replace and Test.
 */
struct Operation {
    OpType type = OpType::Test;
    Pointer path;
    Pointer from;
    Value value;

    static Operation add(Pointer path, Value value);
    static Operation remove(Pointer path);
    static Operation replace(Pointer path, Value value);
    static Operation move(Pointer from, Pointer path);
    static Operation copy(Pointer from, Pointer path);
    static Operation test(Pointer path, Value value);

    /// Whether this operation type carries a "value" member
    bool has_value() const noexcept {
        return type == OpType::Add || type == OpType::Replace || type == OpType::Test;
    }

    /// Whether this operation type carries a "from" member
    bool has_from() const noexcept {
        return type == OpType::Move || type == OpType::Copy;
    }
};

/**
 * @brief Structural equality (values compared with deep_equal)
 */
bool operator==(const Operation& a, const Operation& b);
inline bool operator!=(const Operation& a, const Operation& b) { return !(a == b); }

std::ostream& operator<<(std::ostream& os, const Operation& op);

using Patch = std::vector<Operation>;

/**
 * @brief Convert a patch into its JSON array form
 *
 * Members are emitted in the order "op", "from", "path", "value".
 */
Value patch_to_json(const Patch& patch);

/**
 * @brief Convert a JSON array into a patch
 *
 * @param json Patch document
 * @param source Name used in error messages
 * @throws PatchFormatError if the document does not describe a patch
 * @throws InvalidPointer if a "path" or "from" is not a valid pointer
 */
Patch patch_from_json(const Value& json, const std::string& source = "<patch>");

/**
 * @brief Parse patch text
 * @throws ParseError, PatchFormatError, InvalidPointer
 */
Patch parse_patch(const std::string& text, const std::string& source = "<patch>");

/**
 * @brief Read and parse a patch file
 * @throws IoError if the file cannot be read
 */
Patch load_patch(const std::string& path);

/**
 * @brief Serialize a patch as a JSON array
 * @param indent Spaces per level; negative for compact output
 */
std::string serialize_patch(const Patch& patch, int indent = 2);

} // namespace jpatch

#endif // JPATCH_PATCH_HPP
