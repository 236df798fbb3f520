/**
 * @file Value.hpp
 * @brief Value type for JSON documents and patch payloads
 *
 * Uses nlohmann::ordered_json as the underlying value model:
 * - Null
 * - Bool (true | false)
 * - Number (int64_t, uint64_t, double)
 * - String (std::string, UTF-8)
 * - Array ([Value, ...])
 * - Object ({String: Value, ...}, insertion ordered)
 *
 * The ordered variant keeps object keys in document order so that
 * serialized documents and patches look like their inputs.
 */

#ifndef JPATCH_VALUE_HPP
#define JPATCH_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>

namespace jpatch {

/**
 * @brief JSON value type for documents
 *
 * Note that operator== on ordered objects is sensitive to key order;
 * use deep_equal() from Document.hpp for document equality.
 */
using Value = nlohmann::ordered_json;

/**
 * @brief JSON type name of a value, for error messages
 *
 * Integers and floats are both reported as "number".
 */
inline std::string type_name(const Value& val) {
    switch (val.type()) {
        case Value::value_t::null: return "null";
        case Value::value_t::boolean: return "boolean";
        case Value::value_t::number_integer:
        case Value::value_t::number_unsigned:
        case Value::value_t::number_float: return "number";
        case Value::value_t::string: return "string";
        case Value::value_t::array: return "array";
        case Value::value_t::object: return "object";
        default: return "unknown";
    }
}

inline bool is_container(const Value& val) {
    return val.is_structured();
}

} // namespace jpatch

#endif // JPATCH_VALUE_HPP
