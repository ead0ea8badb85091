/**
 * @file Filter.cpp
 * @brief Implementation of decision filtering
 */

#include "treemerge/Filter.hpp"
#include "treemerge/Normalize.hpp"

namespace treemerge {

std::vector<std::size_t> filter_decisions(const Path& pattern,
                                          const std::vector<MergeDecision>& decisions,
                                          bool exact) {
    std::vector<std::size_t> matches;

    for (std::size_t i = 0; i < decisions.size(); ++i) {
        Path path = decisions[i].common_path;
        if (auto popped = pop_patch_decision(decisions[i])) {
            path = std::move(popped->common_path);
        }

        const Path starred = star_path(path);
        const bool hit = exact ? starred == pattern : is_prefix(pattern, starred);
        if (hit) {
            matches.push_back(i);
        }
    }

    return matches;
}

} // namespace treemerge
