/**
 * @file Document.hpp
 * @brief Parsing, serialization and structural equality of documents
 */

#ifndef JPATCH_DOCUMENT_HPP
#define JPATCH_DOCUMENT_HPP

#include "jpatch/Value.hpp"
#include "jpatch/Errors.hpp"

#include <string>

namespace jpatch {

/**
 * @brief Parse JSON text into a Value
 *
 * @param text JSON text
 * @param source Name used in error messages (usually the file path)
 * @return Parsed document
 * @throws ParseError with byte offset, line and column of the error
 */
Value parse_document(const std::string& text, const std::string& source = "<input>");

/**
 * @brief Read and parse a JSON file
 *
 * @param path Path to the file
 * @throws IoError if the file cannot be read
 * @throws ParseError if the content is not valid JSON
 */
Value load_document(const std::string& path);

/**
 * @brief Serialize a Value, preserving object key order
 *
 * @param val Value to serialize
 * @param indent Spaces per level; negative for compact single-line output
 */
std::string serialize(const Value& val, int indent = 2);

/**
 * @brief Deep structural equality
 *
 * Same variant, same scalar content, same array length with pairwise equal
 * elements, same key set with equal values per key. Object key order is
 * ignored. Integers and floats compare numerically (1 == 1.0).
 */
bool deep_equal(const Value& a, const Value& b);

} // namespace jpatch

#endif // JPATCH_DOCUMENT_HPP
