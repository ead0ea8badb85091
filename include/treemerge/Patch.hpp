/**
 * @file Patch.hpp
 * @brief Apply a diff to one document node
 */

#ifndef TREEMERGE_PATCH_HPP
#define TREEMERGE_PATCH_HPP

#include "treemerge/Value.hpp"
#include "treemerge/Diff.hpp"

namespace treemerge {

/**
 * @brief Apply an ordered diff to a node, returning the patched copy
 *
 * Dispatch by node kind:
 * - Mapping: Add/Remove/Replace/Patch addressed by name. Range ops are
 *   rejected.
 * - Sequence: ops addressed by index relative to the input, applied in
 *   ascending index order. At equal index, insertions (Add, AddRange)
 *   come before the other ops; otherwise input order is kept.
 * - Text: patched as a sequence of lines (see split_lines()). A Patch op
 *   on a line patches that line as a sequence of single characters.
 * - Scalar: only the empty diff is accepted.
 *
 * @param node Node to patch (not modified)
 * @param diff Ops relative to node
 * @return Patched node
 * @throws PatchError if an op addresses a missing key, an out-of-range
 *         index, overlaps a previous op, or does not fit the node kind
 *
 * Example:
 * ```cpp
 * Value base = {{"a", {1, 2, 3}}};
 * auto out = patch(base, {op_patch("a", {op_replace(2, 9)})});
 * // out == {"a": [1, 2, 9]}
 * ```
 */
Value patch(const Value& node, const Diff& diff);

} // namespace treemerge

#endif // TREEMERGE_PATCH_HPP
