/**
 * @file Ordering.hpp
 * @brief Deterministic processing order of merge decisions
 *
 * Decisions are applied in an order where edits never invalidate each
 * other's paths:
 * - a path sorts before every strict prefix of it (children are resolved
 *   before their ancestors);
 * - sibling indices sort larger first, so edits at higher positions of a
 *   sequence happen before edits at lower ones;
 * - sibling names sort lexicographically ascending;
 * - identical paths keep their input order.
 *
 * A name and an index at the same depth cannot address the same container.
 * Such pairs still get an order (names first) so the ordering stays total.
 */

#ifndef TREEMERGE_ORDERING_HPP
#define TREEMERGE_ORDERING_HPP

#include "treemerge/Decision.hpp"

#include <vector>

namespace treemerge {

/**
 * @brief Strict weak order of paths in processing order
 * @return true if a path `a` must be processed before `b`
 */
bool path_precedes(const Path& a, const Path& b);

/**
 * @brief path_precedes() on the decisions' common paths
 */
bool decision_precedes(const MergeDecision& a, const MergeDecision& b);

/**
 * @brief Comparator object for ordered containers keyed by Path
 */
struct PathOrder {
    bool operator()(const Path& a, const Path& b) const {
        return path_precedes(a, b);
    }
};

/**
 * @brief Stable sort of decisions into processing order
 */
std::vector<MergeDecision> sort_decisions(std::vector<MergeDecision> decisions);

/**
 * @brief Check whether decisions are already in processing order
 */
bool is_merge_ordered(const std::vector<MergeDecision>& decisions);

} // namespace treemerge

#endif // TREEMERGE_ORDERING_HPP
