/**
 * @file Builder.hpp
 * @brief Validated construction of merge decisions
 */

#ifndef TREEMERGE_BUILDER_HPP
#define TREEMERGE_BUILDER_HPP

#include "treemerge/Decision.hpp"

#include <optional>
#include <vector>

namespace treemerge {

/**
 * @brief Order in which sequential decisions apply both sides
 */
enum class SideOrder {
    LocalFirst,
    RemoteFirst
};

/**
 * @brief Collects the decisions describing one merge
 *
 * Each constructor checks that the diffs fit its action family and then
 * calls add(), which pushes the path as deep as the diffs allow.
 *
 * Example:
 * ```cpp
 * MergeDecisionBuilder builder;
 * builder.one_sided({"metadata"}, {op_add("tags", Value::array())}, {});
 * builder.agree({"cells", 0}, {op_remove("id")}, {op_remove("id")});
 * auto decisions = builder.finalize();
 * ```
 */
class MergeDecisionBuilder {
public:
    /**
     * @brief Add a decision with the given properties
     *
     * @param custom_diff Required for Action::Custom, rejected otherwise
     * @throws InvalidDecisionShape if custom_diff does not fit the action
     */
    void add(Path path, Action action, Diff local_diff, Diff remote_diff,
             bool conflict = false, std::optional<Diff> custom_diff = std::nullopt);

    /// Keep the base value. Diffs are recorded as given, possibly empty.
    void keep(Path path, Diff local_diff, Diff remote_diff);

    /**
     * @brief Exactly one side has edits; take that side
     * @throws InvalidDecisionShape unless exactly one diff is non-empty
     */
    void one_sided(Path path, Diff local_diff, Diff remote_diff);

    /**
     * @brief Both sides edit differently; apply both in the given order
     * @throws InvalidDecisionShape unless both diffs are non-empty and unequal
     */
    void sequential(Path path, Diff local_diff, Diff remote_diff,
                    SideOrder order, bool conflict = false);

    void local_then_remote(Path path, Diff local_diff, Diff remote_diff,
                           bool conflict = false);
    void remote_then_local(Path path, Diff local_diff, Diff remote_diff,
                           bool conflict = false);

    /**
     * @brief Both sides made the same edits
     * @throws InvalidDecisionShape unless both diffs are non-empty and equal
     */
    void agree(Path path, Diff local_diff, Diff remote_diff);

    /**
     * @brief Record an unresolved conflict; the base value is kept
     * @throws InvalidDecisionShape unless both diffs are non-empty and unequal
     */
    void conflict(Path path, Diff local_diff, Diff remote_diff);

    /// Decisions in the order they were added
    const std::vector<MergeDecision>& decisions() const noexcept {
        return decisions_;
    }

    /// Decisions sorted into merge order, ready for application
    std::vector<MergeDecision> finalize() const;

private:
    std::vector<MergeDecision> decisions_;
};

} // namespace treemerge

#endif // TREEMERGE_BUILDER_HPP
