/**
 * @file Filter.hpp
 * @brief Selecting decisions by path pattern
 */

#ifndef TREEMERGE_FILTER_HPP
#define TREEMERGE_FILTER_HPP

#include "treemerge/Decision.hpp"

#include <cstddef>
#include <vector>

namespace treemerge {

/**
 * @brief Find decisions whose starred path matches a pattern
 *
 * A decision's path is taken one level further when its diffs share a
 * single Patch key, and every index in it is replaced by "*" (see
 * star_path()). Pattern keys are names, with "*" standing for any index.
 *
 * @param pattern Starred path such as ("cells", "*", "outputs")
 * @param decisions Decisions to search
 * @param exact If true the starred path must equal the pattern, otherwise
 *              the pattern must be a prefix of it
 * @return Indices into decisions, ascending
 *
 * Example:
 * ```cpp
 * // Every decision touching some cell's outputs
 * auto hits = filter_decisions({"cells", "*", "outputs"}, decisions, false);
 * ```
 */
std::vector<std::size_t> filter_decisions(const Path& pattern,
                                          const std::vector<MergeDecision>& decisions,
                                          bool exact);

} // namespace treemerge

#endif // TREEMERGE_FILTER_HPP
