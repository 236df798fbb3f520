/**
 * @file Apply.hpp
 * @brief Application of JSON patches to documents
 *
 * Operation semantics:
 * - add: insert or overwrite an object key; insert into an array at an
 *   index (shifting later elements right) or append with "-"
 * - remove: delete an existing key or element
 * - replace: overwrite an existing location
 * - move: remove at "from", add the removed value at "path"; rejected when
 *   "path" lies inside "from"
 * - copy: add a deep copy of the value at "from"
 * - test: require the value at "path" to equal "value"
 */

#ifndef JPATCH_APPLY_HPP
#define JPATCH_APPLY_HPP

#include "jpatch/Value.hpp"
#include "jpatch/Patch.hpp"
#include "jpatch/Errors.hpp"

namespace jpatch {

/**
 * @brief Apply a patch, returning the patched document
 *
 * Operations are applied in order to a private copy of doc; doc itself is
 * never modified. The first failing operation aborts the whole patch.
 *
 * @param doc Document to patch
 * @param patch Operations to apply
 * @return Patched copy of doc
 * @throws ApplyError subclass (PathNotFound, IndexOutOfBounds, InvalidMove,
 *         TestFailed) annotated with the failing operation's index
 * @throws InvalidPointer when removing the document root
 *
 * Example:
 * ```cpp
 * Value doc = Value::parse(R"({"x": 1})");
 * Patch patch = parse_patch(R"([{"op":"test","path":"/x","value":1},
 *                              {"op":"replace","path":"/x","value":2}])");
 * Value out = apply_patch(doc, patch); // {"x": 2}
 * ```
 */
Value apply_patch(const Value& doc, const Patch& patch);

/**
 * @brief Apply a single operation in place
 *
 * Not transactional: on failure doc may be left partially modified (only
 * possible for move, whose remove step precedes its add step). Use
 * apply_patch() for all-or-nothing application.
 */
void apply_operation(Value& doc, const Operation& op);

} // namespace jpatch

#endif // JPATCH_APPLY_HPP
