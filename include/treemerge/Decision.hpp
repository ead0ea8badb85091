/**
 * @file Decision.hpp
 * @brief Merge decision record and its JSON encoding
 *
 * A merge decision states how to reconcile the local and remote edits made
 * to the node at `common_path`. Decisions are produced by a generator that
 * compares two diffs of the same base and are consumed read-only by the
 * applicator and the reassembler.
 *
 * JSON encoding:
 * ```json
 * {
 *   "common_path": ["cells", 3, "source"],
 *   "action": "local_then_remote",
 *   "conflict": false,
 *   "local_diff": [...],
 *   "remote_diff": [...]
 * }
 * ```
 * `custom_diff` is present only for action "custom".
 */

#ifndef TREEMERGE_DECISION_HPP
#define TREEMERGE_DECISION_HPP

#include "treemerge/Value.hpp"
#include "treemerge/Path.hpp"
#include "treemerge/Diff.hpp"

#include <optional>
#include <string>
#include <vector>

namespace treemerge {

/**
 * @brief Which edits a decision applies
 */
enum class Action {
    Base,            ///< Keep the base value (no-op, or unresolved conflict)
    Local,           ///< Apply local_diff
    Remote,          ///< Apply remote_diff
    Either,          ///< Both sides agree; apply local_diff
    LocalThenRemote, ///< Apply local_diff, then remote_diff
    RemoteThenLocal, ///< Apply remote_diff, then local_diff
    Custom,          ///< Apply custom_diff
    Clear,           ///< Replace the targeted child with its empty value
    ClearParent      ///< Remove all children of the node at common_path
};

/**
 * @brief Name of an action in the JSON encoding ("local_then_remote", ...)
 */
const char* action_name(Action action);

/**
 * @brief Parse an action name
 * @throws UnknownAction if name is not one of the defined actions
 */
Action parse_action(const std::string& name);

/**
 * @brief A single merge decision
 *
 * Build through MergeDecisionBuilder so that `common_path` is pushed as
 * deep as the diffs allow. Empty `local_diff` / `remote_diff` mean the side
 * has no edits.
 */
struct MergeDecision {
    Path common_path;
    Action action = Action::Base;
    Diff local_diff;
    Diff remote_diff;
    std::optional<Diff> custom_diff;
    bool conflict = false;
};

bool operator==(const MergeDecision& a, const MergeDecision& b);
bool operator!=(const MergeDecision& a, const MergeDecision& b);

Value decision_to_json(const MergeDecision& decision);
Value decisions_to_json(const std::vector<MergeDecision>& decisions);

/**
 * @brief Decode a list of decisions
 *
 * Every entry goes through MergeDecisionBuilder::add(), so paths are
 * normalized and `custom_diff` is checked against the action. Decisions
 * keep their input order; sort them with sort_decisions() before
 * applying.
 *
 * @throws DiffFormatError for malformed entries
 * @throws InvalidDecisionShape for unknown fields or a misplaced custom_diff
 * @throws UnknownAction for undefined action names
 */
std::vector<MergeDecision> decisions_from_json(const Value& json);

} // namespace treemerge

#endif // TREEMERGE_DECISION_HPP
