/**
 * @file Diff.hpp
 * @brief Structural diff between two documents
 */

#ifndef JPATCH_DIFF_HPP
#define JPATCH_DIFF_HPP

#include "jpatch/Value.hpp"
#include "jpatch/Patch.hpp"

namespace jpatch {

/**
 * @brief Compute a patch transforming from into to
 *
 * apply_patch(from, diff(from, to)) deep-equals to. Equal subtrees produce
 * no operations, so diff(a, a) is empty.
 *
 * Rules:
 * - Equal values: nothing.
 * - Two objects: "remove" for keys only in from (in from's order), then
 *   for each key of to in to's order either recurse or "add".
 * - Two arrays: the common prefix and suffix are skipped; the differing
 *   middle is compared position by position up to the shorter length,
 *   surplus elements of from are removed highest index first, surplus
 *   elements of to are added lowest index first.
 * - Anything else: one "replace" with the new value.
 *
 * The result depends only on the inputs, so repeated diffs serialize
 * byte-identically.
 *
 * Example:
 * ```cpp
 * Value a = Value::parse(R"({"a": 1, "b": [1, 2, 3]})");
 * Value b = Value::parse(R"({"a": 2, "b": [1, 3]})");
 * Patch p = diff(a, b);
 * // [{"op":"replace","path":"/a","value":2},
 * //  {"op":"remove","path":"/b/1"}]
 * ```
 */
Patch diff(const Value& from, const Value& to);

} // namespace jpatch

#endif // JPATCH_DIFF_HPP
