/**
 * @file Apply.hpp
 * @brief Folding a sorted decision list into one merged document
 */

#ifndef TREEMERGE_APPLY_HPP
#define TREEMERGE_APPLY_HPP

#include "treemerge/Decision.hpp"
#include "treemerge/Resolve.hpp"

#include <optional>
#include <vector>

namespace treemerge {

/**
 * @brief Lifecycle of a MergeApplicator
 */
enum class ApplyState {
    Ready,  ///< Holds a copy of the base, nothing applied yet
    Done,   ///< All decisions applied, merged() is usable
    Failed  ///< An error interrupted application; the working copy is inconsistent
};

/**
 * @brief Applies merge decisions to a working copy of a base document
 *
 * Decisions must be in merge order (see sort_decisions()). Decisions whose
 * paths resolve to the same container form a group: their ops are
 * collected and patched onto the container in one step when the next
 * group starts. Paths reaching into a text node are split at the text, and
 * the remaining line offset wraps the decision's ops in Patch layers.
 *
 * A ClearParent decision discards the ops collected so far in its group,
 * and every later non-clearing decision of that group is dropped.
 *
 * Example:
 * ```cpp
 * MergeApplicator applicator(base);
 * applicator.apply(builder.finalize());
 * Value merged = applicator.merged();
 * ```
 */
class MergeApplicator {
public:
    explicit MergeApplicator(Value base);

    /**
     * @brief Apply all decisions; may be called once
     *
     * @throws PathResolutionError if a decision path is missing from the
     *         working copy
     * @throws PatchError if a group's ops do not apply
     * @throws MergeError if called more than once
     *
     * Any other error from action resolution propagates as well. After an
     * error the state is Failed.
     */
    void apply(const std::vector<MergeDecision>& decisions);

    ApplyState state() const noexcept {
        return state_;
    }

    /**
     * @brief The merged document
     * @throws MergeError unless state() is Done
     */
    const Value& merged() const;

private:
    struct Group {
        Path path;
        Value* node = nullptr;
        OpCollector collected;
    };

    void open_group(const Path& path);
    void collect(const MergeDecision& decision, const Path& text_offset);
    void flush();

    Value merged_;
    std::optional<Group> group_;
    ApplyState state_ = ApplyState::Ready;
};

/**
 * @brief Apply sorted decisions to a copy of base
 *
 * @return The merged document
 * @throws Everything MergeApplicator::apply() throws
 */
Value apply_decisions(const Value& base, const std::vector<MergeDecision>& decisions);

} // namespace treemerge

#endif // TREEMERGE_APPLY_HPP
