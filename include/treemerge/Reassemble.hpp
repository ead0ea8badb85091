/**
 * @file Reassemble.hpp
 * @brief Projecting a decision list back onto one flat diff
 */

#ifndef TREEMERGE_REASSEMBLE_HPP
#define TREEMERGE_REASSEMBLE_HPP

#include "treemerge/Decision.hpp"

#include <optional>
#include <string>
#include <vector>

namespace treemerge {

/**
 * @brief Which edits a reassembled diff describes
 */
enum class Side {
    Local,   ///< The raw local diffs
    Remote,  ///< The raw remote diffs
    Merged   ///< The diffs each decision's action resolves to
};

/**
 * @brief Parse "local", "remote" or "merged"
 * @throws std::invalid_argument for any other name
 */
Side parse_side(const std::string& name);

const char* side_name(Side side);

/**
 * @brief Build one diff, rooted at the document root, for one side
 *
 * Every decision contributes a fragment at its container path (paths into
 * a text node are split as by MergeApplicator and the line offset is kept
 * as Patch layers). Fragments are then joined from the deepest paths up:
 * each is wrapped in Patch ops for its path suffix and folded into its
 * nearest ancestor, and fragments on sibling branches meet in a shared
 * Patch op at their common prefix.
 *
 * For Side::Merged, applying the result to base with patch() gives the
 * same document as apply_decisions(base, decisions).
 *
 * @param base Document the decisions refer to
 * @param decisions Decisions in merge order
 * @param side Which edits to collect
 * @return The joined diff, or std::nullopt if no decision contributed
 * @throws PathResolutionError if a decision path is missing from base
 */
std::optional<Diff> build_diffs(const Value& base,
                                const std::vector<MergeDecision>& decisions,
                                Side side);

} // namespace treemerge

#endif // TREEMERGE_REASSEMBLE_HPP
