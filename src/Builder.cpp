/**
 * @file Builder.cpp
 * @brief Implementation of MergeDecisionBuilder
 */

#include "treemerge/Builder.hpp"
#include "treemerge/Normalize.hpp"
#include "treemerge/Ordering.hpp"
#include "treemerge/Errors.hpp"

namespace treemerge {

namespace {

void require_both_sides(const Path& path, const Diff& local_diff, const Diff& remote_diff) {
    if (local_diff.empty() || remote_diff.empty()) {
        throw InvalidDecisionShape(join_path(path), "both local and remote diffs must be non-empty");
    }
}

void require_unequal(const Path& path, const Diff& local_diff, const Diff& remote_diff) {
    if (local_diff == remote_diff) {
        throw InvalidDecisionShape(join_path(path), "local and remote diffs are equal");
    }
}

} // anonymous namespace

void MergeDecisionBuilder::add(Path path, Action action, Diff local_diff, Diff remote_diff,
                               bool conflict, std::optional<Diff> custom_diff) {
    if (action == Action::Custom && !custom_diff) {
        throw InvalidDecisionShape(join_path(path), "custom action without custom_diff");
    }
    if (action != Action::Custom && custom_diff) {
        throw InvalidDecisionShape(join_path(path),
                                   std::string("custom_diff given for action ") +
                                   action_name(action));
    }

    std::vector<Diff> diffs{std::move(local_diff), std::move(remote_diff)};
    if (custom_diff) {
        diffs.push_back(std::move(*custom_diff));
    }

    auto [deep_path, deep_diffs] = deepen(std::move(path), std::move(diffs));

    MergeDecision decision;
    decision.common_path = std::move(deep_path);
    decision.action = action;
    decision.conflict = conflict;
    decision.local_diff = std::move(deep_diffs[0]);
    decision.remote_diff = std::move(deep_diffs[1]);
    if (action == Action::Custom) {
        decision.custom_diff = std::move(deep_diffs[2]);
    }

    decisions_.push_back(std::move(decision));
}

void MergeDecisionBuilder::keep(Path path, Diff local_diff, Diff remote_diff) {
    add(std::move(path), Action::Base, std::move(local_diff), std::move(remote_diff));
}

void MergeDecisionBuilder::one_sided(Path path, Diff local_diff, Diff remote_diff) {
    if (local_diff.empty() == remote_diff.empty()) {
        throw InvalidDecisionShape(join_path(path),
                                   "exactly one of local and remote diffs must be non-empty");
    }
    const Action action = local_diff.empty() ? Action::Remote : Action::Local;
    add(std::move(path), action, std::move(local_diff), std::move(remote_diff));
}

void MergeDecisionBuilder::sequential(Path path, Diff local_diff, Diff remote_diff,
                                      SideOrder order, bool conflict) {
    require_both_sides(path, local_diff, remote_diff);
    require_unequal(path, local_diff, remote_diff);
    const Action action = order == SideOrder::LocalFirst
        ? Action::LocalThenRemote
        : Action::RemoteThenLocal;
    add(std::move(path), action, std::move(local_diff), std::move(remote_diff), conflict);
}

void MergeDecisionBuilder::local_then_remote(Path path, Diff local_diff, Diff remote_diff,
                                             bool conflict) {
    sequential(std::move(path), std::move(local_diff), std::move(remote_diff),
               SideOrder::LocalFirst, conflict);
}

void MergeDecisionBuilder::remote_then_local(Path path, Diff local_diff, Diff remote_diff,
                                             bool conflict) {
    sequential(std::move(path), std::move(local_diff), std::move(remote_diff),
               SideOrder::RemoteFirst, conflict);
}

void MergeDecisionBuilder::agree(Path path, Diff local_diff, Diff remote_diff) {
    require_both_sides(path, local_diff, remote_diff);
    if (local_diff != remote_diff) {
        throw InvalidDecisionShape(join_path(path), "agreement with unequal diffs");
    }
    add(std::move(path), Action::Either, std::move(local_diff), std::move(remote_diff));
}

void MergeDecisionBuilder::conflict(Path path, Diff local_diff, Diff remote_diff) {
    require_both_sides(path, local_diff, remote_diff);
    require_unequal(path, local_diff, remote_diff);
    add(std::move(path), Action::Base, std::move(local_diff), std::move(remote_diff), true);
}

std::vector<MergeDecision> MergeDecisionBuilder::finalize() const {
    return sort_decisions(decisions_);
}

} // namespace treemerge
