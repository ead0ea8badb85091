/**
 * @file Ordering.cpp
 * @brief Implementation of decision ordering
 */

#include "treemerge/Ordering.hpp"

#include <algorithm>

namespace treemerge {

namespace {

/**
 * @brief Compare two keys at the same depth
 * @return negative if a goes first, positive if b goes first, 0 if equal
 */
int compare_keys(const PathKey& a, const PathKey& b) {
    if (a.is_index() && b.is_index()) {
        if (a.index() == b.index()) return 0;
        return a.index() > b.index() ? -1 : 1;
    }
    if (a.is_name() && b.is_name()) {
        return a.name().compare(b.name());
    }
    return a.is_name() ? -1 : 1;
}

} // anonymous namespace

bool path_precedes(const Path& a, const Path& b) {
    const auto n = std::min(a.size(), b.size());
    for (std::size_t i = 0; i < n; ++i) {
        const int c = compare_keys(a[i], b[i]);
        if (c != 0) {
            return c < 0;
        }
    }
    // One is a prefix of the other: deeper first
    return a.size() > b.size();
}

bool decision_precedes(const MergeDecision& a, const MergeDecision& b) {
    return path_precedes(a.common_path, b.common_path);
}

std::vector<MergeDecision> sort_decisions(std::vector<MergeDecision> decisions) {
    std::stable_sort(decisions.begin(), decisions.end(), decision_precedes);
    return decisions;
}

bool is_merge_ordered(const std::vector<MergeDecision>& decisions) {
    return std::is_sorted(decisions.begin(), decisions.end(), decision_precedes);
}

} // namespace treemerge
