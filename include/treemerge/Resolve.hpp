/**
 * @file Resolve.hpp
 * @brief Turning one decision into concrete diff ops
 */

#ifndef TREEMERGE_RESOLVE_HPP
#define TREEMERGE_RESOLVE_HPP

#include "treemerge/Decision.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace treemerge {

/**
 * @brief Diff ops a decision applies to the node at its path
 *
 * | action            | result                                  |
 * |-------------------|-----------------------------------------|
 * | Base              | no ops                                  |
 * | Local, Either     | local_diff                              |
 * | Remote            | remote_diff                             |
 * | Custom            | custom_diff                             |
 * | LocalThenRemote   | local_diff followed by remote_diff      |
 * | RemoteThenLocal   | remote_diff followed by local_diff      |
 * | Clear             | Replace(key, cleared_value(node[key]))  |
 * | ClearParent       | Remove per key, or RemoveRange(0, size) |
 *
 * For Clear, `key` is the key every local and remote op targets. For
 * ClearParent on a text node, the size counts lines.
 *
 * @param node Current value of the node at the decision's path
 * @param decision The decision to resolve
 * @throws InconsistentClearKey if a Clear decision targets several keys
 * @throws InvalidDecisionShape for Clear without ops, or ClearParent on a
 *         scalar
 * @throws PathResolutionError if the key to clear is missing from node
 * @throws UnknownAction for an action outside the defined set
 */
Diff resolve_action(const Value& node, const MergeDecision& decision);

/**
 * @brief Diff ops a decision applies to one line of a text node
 *
 * A line is addressed by character, so Clear replaces the targeted
 * character with "" and ClearParent removes every character of the line.
 * Other actions resolve as in resolve_action().
 *
 * @throws PathResolutionError if the character to clear is out of range
 */
Diff resolve_line_action(const std::string& line, const MergeDecision& decision);

/**
 * @brief Resolved ops for one container, with the ClearParent override
 *
 * A ClearParent on the container discards the ops collected before it and
 * drops every later decision. A ClearParent on one line of a text container
 * does the same for the ops of that line only.
 */
class OpCollector {
public:
    /**
     * @brief Add the resolved ops of one decision
     * @param decision The decision the ops were resolved from
     * @param text_offset Line offset of the decision inside a text container,
     *        empty for decisions on the container itself
     * @param ops Ops relative to the container
     */
    void add(const MergeDecision& decision, const Path& text_offset, Diff ops);

    bool clearing() const noexcept {
        return clearing_;
    }

    Diff& ops() noexcept {
        return ops_;
    }

private:
    bool line_cleared(std::int64_t line) const;

    Diff ops_;
    bool clearing_ = false;
    std::vector<std::int64_t> cleared_lines_;
};

} // namespace treemerge

#endif // TREEMERGE_RESOLVE_HPP
