/**
 * @file Apply.cpp
 * @brief Implementation of the merge applicator
 */

#include "treemerge/Apply.hpp"
#include "treemerge/Patch.hpp"
#include "treemerge/Resolve.hpp"
#include "treemerge/Errors.hpp"

#include <spdlog/spdlog.h>

namespace treemerge {

MergeApplicator::MergeApplicator(Value base)
    : merged_(std::move(base))
{}

void MergeApplicator::apply(const std::vector<MergeDecision>& decisions) {
    if (state_ != ApplyState::Ready) {
        throw MergeError("Merge decisions were already applied");
    }

    try {
        for (const auto& decision : decisions) {
            auto [container, text_offset] = split_text_path(merged_, decision.common_path);

            if (!group_ || group_->path != container) {
                if (group_) {
                    flush();
                }
                open_group(container);
            }
            collect(decision, text_offset);
        }

        if (group_) {
            flush();
        }
    } catch (const std::exception&) {
        state_ = ApplyState::Failed;
        group_.reset();
        throw;
    }

    state_ = ApplyState::Done;
}

const Value& MergeApplicator::merged() const {
    if (state_ != ApplyState::Done) {
        throw MergeError(state_ == ApplyState::Failed
            ? "Merge failed; the working copy is inconsistent"
            : "Merge decisions have not been applied");
    }
    return merged_;
}

void MergeApplicator::open_group(const Path& path) {
    Group group;
    group.path = path;
    group.node = get_by_path(merged_, path);
    group_ = std::move(group);
    spdlog::debug("merge group opened at {}", join_path(path));
}

void MergeApplicator::collect(const MergeDecision& decision, const Path& text_offset) {
    Diff ops;
    if (text_offset.empty()) {
        ops = resolve_action(*group_->node, decision);
    } else {
        const Value line = child_at(*group_->node, text_offset.front(), decision.common_path);
        ops = push_path(text_offset, resolve_line_action(line.get<std::string>(), decision));
    }

    group_->collected.add(decision, text_offset, std::move(ops));
}

void MergeApplicator::flush() {
    const Diff& ops = group_->collected.ops();
    spdlog::debug("merge group at {}: applying {} ops", join_path(group_->path), ops.size());
    *group_->node = patch(*group_->node, ops);
    group_.reset();
}

Value apply_decisions(const Value& base, const std::vector<MergeDecision>& decisions) {
    MergeApplicator applicator(base);
    applicator.apply(decisions);
    return applicator.merged();
}

} // namespace treemerge
