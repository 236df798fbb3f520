/**
 * @file Patch.cpp
 * @brief Implementation of patch operations and serialization
 */

#include "jpatch/Patch.hpp"
#include "jpatch/Document.hpp"

#include <array>
#include <utility>

namespace jpatch {

namespace {

const std::array<std::pair<OpType, std::string>, 6> kOpNames = {{
    {OpType::Add, "add"},
    {OpType::Remove, "remove"},
    {OpType::Replace, "replace"},
    {OpType::Move, "move"},
    {OpType::Copy, "copy"},
    {OpType::Test, "test"},
}};

/**
 * @brief Fetch a required string member of an operation object
 */
const std::string& required_string(const Value& op, const char* member,
                                   const std::string& source, std::size_t index) {
    auto it = op.find(member);
    if (it == op.end()) {
        throw PatchFormatError(source, index,
                               std::string("missing \"") + member + "\"");
    }
    if (!it->is_string()) {
        throw PatchFormatError(source, index,
                               std::string("\"") + member + "\" must be a string, got " +
                               type_name(*it));
    }
    return it->get_ref<const std::string&>();
}

} // anonymous namespace

const std::string& op_name(OpType type) {
    for (const auto& entry : kOpNames) {
        if (entry.first == type) {
            return entry.second;
        }
    }
    return kOpNames[0].second; // unreachable for valid enumerators
}

std::optional<OpType> op_from_name(const std::string& name) {
    for (const auto& entry : kOpNames) {
        if (entry.second == name) {
            return entry.first;
        }
    }
    return std::nullopt;
}

Operation Operation::add(Pointer path, Value value) {
    return Operation{OpType::Add, std::move(path), Pointer{}, std::move(value)};
}

Operation Operation::remove(Pointer path) {
    return Operation{OpType::Remove, std::move(path), Pointer{}, Value{}};
}

Operation Operation::replace(Pointer path, Value value) {
    return Operation{OpType::Replace, std::move(path), Pointer{}, std::move(value)};
}

Operation Operation::move(Pointer from, Pointer path) {
    return Operation{OpType::Move, std::move(path), std::move(from), Value{}};
}

Operation Operation::copy(Pointer from, Pointer path) {
    return Operation{OpType::Copy, std::move(path), std::move(from), Value{}};
}

Operation Operation::test(Pointer path, Value value) {
    return Operation{OpType::Test, std::move(path), Pointer{}, std::move(value)};
}

bool operator==(const Operation& a, const Operation& b) {
    if (a.type != b.type || a.path != b.path) {
        return false;
    }
    if (a.has_from() && a.from != b.from) {
        return false;
    }
    if (a.has_value() && !deep_equal(a.value, b.value)) {
        return false;
    }
    return true;
}

std::ostream& operator<<(std::ostream& os, const Operation& op) {
    os << op_name(op.type);
    if (op.has_from()) {
        os << ' ' << op.from << " ->";
    }
    os << ' ' << op.path;
    if (op.has_value()) {
        os << ' ' << op.value.dump();
    }
    return os;
}

Value patch_to_json(const Patch& patch) {
    Value result = Value::array();
    for (const auto& op : patch) {
        Value entry = Value::object();
        entry["op"] = op_name(op.type);
        if (op.has_from()) {
            entry["from"] = op.from.to_string();
        }
        entry["path"] = op.path.to_string();
        if (op.has_value()) {
            entry["value"] = op.value;
        }
        result.push_back(std::move(entry));
    }
    return result;
}

Patch patch_from_json(const Value& json, const std::string& source) {
    if (!json.is_array()) {
        throw PatchFormatError(source, std::nullopt,
                               "patch must be an array, got " + type_name(json));
    }

    Patch patch;
    patch.reserve(json.size());

    for (std::size_t i = 0; i < json.size(); ++i) {
        const Value& entry = json[i];
        if (!entry.is_object()) {
            throw PatchFormatError(source, i,
                                   "operation must be an object, got " + type_name(entry));
        }

        const std::string& name = required_string(entry, "op", source, i);
        const auto type = op_from_name(name);
        if (!type) {
            throw PatchFormatError(source, i, "unknown op \"" + name + "\"");
        }

        Operation op;
        op.type = *type;
        op.path = Pointer::parse(required_string(entry, "path", source, i));

        if (op.has_from()) {
            op.from = Pointer::parse(required_string(entry, "from", source, i));
        }

        if (op.has_value()) {
            auto it = entry.find("value");
            if (it == entry.end()) {
                throw PatchFormatError(source, i, "missing \"value\"");
            }
            op.value = *it;
        }

        patch.push_back(std::move(op));
    }

    return patch;
}

Patch parse_patch(const std::string& text, const std::string& source) {
    return patch_from_json(parse_document(text, source), source);
}

Patch load_patch(const std::string& path) {
    return patch_from_json(load_document(path), path);
}

std::string serialize_patch(const Patch& patch, int indent) {
    return serialize(patch_to_json(patch), indent);
}

} // namespace jpatch
