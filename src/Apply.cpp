/**
 * @file Apply.cpp
 * @brief Implementation of patch application
 */

#include "jpatch/Apply.hpp"
#include "jpatch/Document.hpp"
#include "jpatch/Pointer.hpp"

#include <cstddef>
#include <utility>

namespace jpatch {

namespace {

/**
 * @brief Insert value at path
 *
 * Object parent: insert or overwrite the key.
 * Array parent: "-" appends, an index <= size inserts before that index.
 */
void add_value(Value& doc, const Pointer& path, Value value) {
    if (path.is_root()) {
        doc = std::move(value);
        return;
    }

    Value* parent = find(doc, path.parent());
    if (parent == nullptr || !is_container(*parent)) {
        throw PathNotFound(path.to_string());
    }

    const std::string& token = path.back();

    if (parent->is_object()) {
        (*parent)[token] = std::move(value);
        return;
    }

    if (token == kAppendToken) {
        parent->push_back(std::move(value));
        return;
    }
    if (!is_array_index(token)) {
        throw PathNotFound(path.to_string());
    }

    const std::size_t idx = parse_array_index(token);
    if (idx > parent->size()) {
        throw IndexOutOfBounds(path.to_string(), idx, parent->size());
    }
    parent->insert(parent->begin() + static_cast<std::ptrdiff_t>(idx), std::move(value));
}

/**
 * @brief Detach and return the value at path
 */
Value remove_value(Value& doc, const Pointer& path) {
    if (path.is_root()) {
        throw InvalidPointer(path.to_string(), "cannot remove the document root");
    }

    Value* parent = find(doc, path.parent());
    if (parent == nullptr) {
        throw PathNotFound(path.to_string());
    }

    const std::string& token = path.back();

    if (parent->is_object()) {
        auto it = parent->find(token);
        if (it == parent->end()) {
            throw PathNotFound(path.to_string());
        }
        Value removed = std::move(*it);
        parent->erase(it);
        return removed;
    }

    if (parent->is_array()) {
        if (!is_array_index(token)) {
            throw PathNotFound(path.to_string());
        }
        const std::size_t idx = parse_array_index(token);
        if (idx >= parent->size()) {
            throw PathNotFound(path.to_string());
        }
        Value removed = std::move((*parent)[idx]);
        parent->erase(idx);
        return removed;
    }

    throw PathNotFound(path.to_string());
}

void move_value(Value& doc, const Pointer& from, const Pointer& path) {
    if (!contains(doc, from)) {
        throw PathNotFound(from.to_string());
    }
    if (from == path) {
        return;
    }
    if (from.is_strict_prefix_of(path)) {
        throw InvalidMove(from.to_string(), path.to_string());
    }

    Value moved = remove_value(doc, from);
    add_value(doc, path, std::move(moved));
}

void test_value(const Value& doc, const Pointer& path, const Value& expected) {
    const Value& actual = resolve(doc, path);
    if (!deep_equal(actual, expected)) {
        throw TestFailed(path.to_string(), expected, actual);
    }
}

} // anonymous namespace

void apply_operation(Value& doc, const Operation& op) {
    switch (op.type) {
        case OpType::Add:
            add_value(doc, op.path, op.value);
            break;

        case OpType::Remove:
            remove_value(doc, op.path);
            break;

        case OpType::Replace:
            resolve(doc, op.path) = op.value;
            break;

        case OpType::Move:
            move_value(doc, op.from, op.path);
            break;

        case OpType::Copy: {
            Value copied = resolve(doc, op.from);
            add_value(doc, op.path, std::move(copied));
            break;
        }

        case OpType::Test:
            test_value(doc, op.path, op.value);
            break;
    }
}

Value apply_patch(const Value& doc, const Patch& patch) {
    // Work on a copy so a failing operation leaves the caller's document intact
    Value result = doc;

    for (std::size_t i = 0; i < patch.size(); ++i) {
        try {
            apply_operation(result, patch[i]);
        } catch (ApplyError& e) {
            e.annotate(i, op_name(patch[i].type));
            throw;
        }
    }

    return result;
}

} // namespace jpatch
