/**
 * @file Normalize.hpp
 * @brief Moving shared Patch layers between a decision path and its diffs
 *
 * When every diff of a decision is a single Patch op on the same key, the
 * decision really concerns the child at that key. deepen() pushes such
 * layers into the path; shallow() pulls path keys back into the diffs.
 */

#ifndef TREEMERGE_NORMALIZE_HPP
#define TREEMERGE_NORMALIZE_HPP

#include "treemerge/Decision.hpp"

#include <optional>
#include <utility>
#include <vector>

namespace treemerge {

/**
 * @brief Pop all shared single-Patch layers off a set of diffs
 *
 * Empty diffs are absent and are skipped by the check; they stay empty at
 * the same position of the result. Nothing is popped if all diffs are
 * absent.
 *
 * Example:
 * ```cpp
 * auto [path, diffs] = deepen({}, {{op_patch("a", {op_remove("x")})},
 *                                  {op_patch("a", {op_remove("y")})}});
 * // path == ("a"), diffs == {[Remove("x")], [Remove("y")]}
 * ```
 */
std::pair<Path, std::vector<Diff>> deepen(Path path, std::vector<Diff> diffs);

/**
 * @brief Move a decision one level deeper, if its diffs allow it
 *
 * Considers local_diff, remote_diff and, for Custom decisions, custom_diff.
 *
 * @return The deeper decision, or std::nullopt if no layer can be popped
 */
std::optional<MergeDecision> pop_patch_decision(const MergeDecision& decision);

/**
 * @brief Move a decision as deep as its diffs allow
 * @return The deepest equivalent decision (a copy of the input if it is
 *         already at the deepest level)
 */
MergeDecision resolve_prefix(const MergeDecision& decision);

/**
 * @brief Move trailing path keys of a decision back into its diffs
 *
 * `prefix` must match the end of `common_path`. Keys are stripped
 * innermost first, wrapping each non-empty diff (custom_diff included for
 * Custom decisions) in a Patch op per key.
 *
 * @return New decision, the input is left untouched
 * @throws PathUnderflow if prefix is longer than the path or does not
 *         match its trailing keys
 */
MergeDecision shallow(const MergeDecision& decision, const Path& prefix);

} // namespace treemerge

#endif // TREEMERGE_NORMALIZE_HPP
