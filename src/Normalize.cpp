/**
 * @file Normalize.cpp
 * @brief Implementation of path/diff normalization
 */

#include "treemerge/Normalize.hpp"
#include "treemerge/Errors.hpp"

namespace treemerge {

namespace {

struct Popped {
    PathKey key;
    std::vector<Diff> diffs;
};

/**
 * Succeeds only if every present diff is one Patch op and all of them share
 * the key. Absent diffs keep their slot as an empty diff.
 */
std::optional<Popped> pop_path(const std::vector<Diff>& diffs) {
    const PathKey* key = nullptr;
    Popped popped;
    popped.diffs.reserve(diffs.size());

    for (const auto& d : diffs) {
        if (d.empty()) {
            popped.diffs.emplace_back();
            continue;
        }
        if (d.size() != 1 || d.front().kind != DiffOpKind::Patch) {
            return std::nullopt;
        }
        if (key == nullptr) {
            key = &d.front().key;
        } else if (*key != d.front().key) {
            return std::nullopt;
        }
        popped.diffs.push_back(d.front().diff);
    }

    if (key == nullptr) {
        return std::nullopt;
    }
    popped.key = *key;
    return popped;
}

void wrap_in_patch(Diff& diff, const PathKey& key) {
    if (diff.empty()) return;
    Diff wrapped;
    wrapped.push_back(op_patch(key, std::move(diff)));
    diff = std::move(wrapped);
}

} // anonymous namespace

std::pair<Path, std::vector<Diff>> deepen(Path path, std::vector<Diff> diffs) {
    auto popped = pop_path(diffs);
    while (popped) {
        path.push_back(std::move(popped->key));
        diffs = std::move(popped->diffs);
        popped = pop_path(diffs);
    }
    return {std::move(path), std::move(diffs)};
}

std::optional<MergeDecision> pop_patch_decision(const MergeDecision& decision) {
    const bool custom = decision.action == Action::Custom;

    std::vector<Diff> diffs{decision.local_diff, decision.remote_diff};
    if (custom) {
        diffs.push_back(decision.custom_diff.value_or(Diff{}));
    }

    auto popped = pop_path(diffs);
    if (!popped) {
        return std::nullopt;
    }

    MergeDecision ret;
    ret.common_path = decision.common_path;
    ret.common_path.push_back(std::move(popped->key));
    ret.action = decision.action;
    ret.conflict = decision.conflict;
    ret.local_diff = std::move(popped->diffs[0]);
    ret.remote_diff = std::move(popped->diffs[1]);
    if (custom) {
        ret.custom_diff = std::move(popped->diffs[2]);
    }
    return ret;
}

MergeDecision resolve_prefix(const MergeDecision& decision) {
    MergeDecision current = decision;
    auto popped = pop_patch_decision(current);
    while (popped) {
        current = std::move(*popped);
        popped = pop_patch_decision(current);
    }
    return current;
}

MergeDecision shallow(const MergeDecision& decision, const Path& prefix) {
    MergeDecision dec = decision;

    // Innermost key first so the Patch layers nest in path order
    for (auto it = prefix.rbegin(); it != prefix.rend(); ++it) {
        if (dec.common_path.empty() || dec.common_path.back() != *it) {
            throw PathUnderflow(join_path(dec.common_path), it->to_string());
        }
        dec.common_path.pop_back();

        wrap_in_patch(dec.local_diff, *it);
        wrap_in_patch(dec.remote_diff, *it);
        if (dec.action == Action::Custom && dec.custom_diff) {
            wrap_in_patch(*dec.custom_diff, *it);
        }
    }

    return dec;
}

} // namespace treemerge
