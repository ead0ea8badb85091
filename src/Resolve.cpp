/**
 * @file Resolve.cpp
 * @brief Implementation of action resolution
 */

#include "treemerge/Resolve.hpp"
#include "treemerge/Errors.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <string>

namespace treemerge {

namespace {

Diff concat(const Diff& first, const Diff& second) {
    Diff out = first;
    out.insert(out.end(), second.begin(), second.end());
    return out;
}

const PathKey& clear_key(const MergeDecision& decision) {
    const PathKey* key = nullptr;
    for (const Diff* side : {&decision.local_diff, &decision.remote_diff}) {
        for (const auto& op : *side) {
            if (key == nullptr) {
                key = &op.key;
            } else if (*key != op.key) {
                throw InconsistentClearKey(join_path(decision.common_path),
                                           key->to_string(), op.key.to_string());
            }
        }
    }
    if (key == nullptr) {
        throw InvalidDecisionShape(join_path(decision.common_path),
                                   "clear decision without diffs");
    }
    return *key;
}

Diff resolve_clear(const Value& node, const MergeDecision& decision) {
    const PathKey& key = clear_key(decision);

    Path full_path = decision.common_path;
    full_path.push_back(key);
    const Value child = child_at(node, key, full_path);

    return {op_replace(key, cleared_value(child))};
}

Diff resolve_clear_parent(const Value& node, const MergeDecision& decision) {
    switch (node_kind(node)) {
        case NodeKind::Mapping: {
            // A Replace on the parent would not combine with other ops on
            // the same group, so every key is removed instead
            Diff out;
            for (auto it = node.begin(); it != node.end(); ++it) {
                out.push_back(op_remove(it.key()));
            }
            return out;
        }
        case NodeKind::Sequence:
            return {op_removerange(0, static_cast<std::int64_t>(node.size()))};
        case NodeKind::Text: {
            const auto lines = split_lines(node.get<std::string>());
            return {op_removerange(0, static_cast<std::int64_t>(lines.size()))};
        }
        case NodeKind::Scalar:
            break;
    }
    throw InvalidDecisionShape(join_path(decision.common_path),
                               "clear_parent on a scalar value");
}

} // anonymous namespace

Diff resolve_action(const Value& node, const MergeDecision& decision) {
    switch (decision.action) {
        case Action::Base:
            return {};
        case Action::Local:
        case Action::Either:
            return decision.local_diff;
        case Action::Remote:
            return decision.remote_diff;
        case Action::Custom:
            return decision.custom_diff.value_or(Diff{});
        case Action::LocalThenRemote:
            return concat(decision.local_diff, decision.remote_diff);
        case Action::RemoteThenLocal:
            return concat(decision.remote_diff, decision.local_diff);
        case Action::Clear:
            return resolve_clear(node, decision);
        case Action::ClearParent:
            return resolve_clear_parent(node, decision);
    }
    throw UnknownAction(join_path(decision.common_path),
                        std::to_string(static_cast<int>(decision.action)));
}

Diff resolve_line_action(const std::string& line, const MergeDecision& decision) {
    if (decision.action == Action::Clear) {
        const PathKey& key = clear_key(decision);
        if (!key.is_index() || key.index() < 0 ||
            static_cast<std::size_t>(key.index()) >= line.size()) {
            Path full_path = decision.common_path;
            full_path.push_back(key);
            throw PathResolutionError(join_path(full_path),
                                      key.to_string() + " (character out of range)");
        }
        return {op_replace(key, std::string())};
    }
    if (decision.action == Action::ClearParent) {
        return {op_removerange(0, static_cast<std::int64_t>(line.size()))};
    }
    return resolve_action(Value(line), decision);
}

// ============================================================================
// OpCollector
// ============================================================================

bool OpCollector::line_cleared(std::int64_t line) const {
    return std::find(cleared_lines_.begin(), cleared_lines_.end(), line) !=
           cleared_lines_.end();
}

void OpCollector::add(const MergeDecision& decision, const Path& text_offset, Diff ops) {
    const auto where = join_path(decision.common_path);

    if (text_offset.empty() && decision.action == Action::ClearParent) {
        if (clearing_) {
            spdlog::warn("clear_parent at {} discards an earlier clear_parent in the same group",
                         where);
        } else if (!ops_.empty()) {
            spdlog::debug("clear_parent at {} discards {} collected ops", where, ops_.size());
        }
        ops_ = std::move(ops);
        clearing_ = true;
        return;
    }

    if (clearing_) {
        spdlog::debug("{} decision at {} dropped: parent is cleared",
                      action_name(decision.action), where);
        return;
    }

    if (text_offset.empty()) {
        append_ops(ops_, std::move(ops));
        return;
    }

    const auto line = text_offset.front().index();
    if (decision.action == Action::ClearParent) {
        if (line_cleared(line)) {
            spdlog::warn("clear_parent at {} discards an earlier clear_parent of the same line",
                         where);
        }
        ops_.erase(std::remove_if(ops_.begin(), ops_.end(), [&](const DiffOp& op) {
            return op.kind == DiffOpKind::Patch && op.key == PathKey(line);
        }), ops_.end());
        cleared_lines_.push_back(line);
    } else if (line_cleared(line)) {
        spdlog::debug("{} decision at {} dropped: line is cleared",
                      action_name(decision.action), where);
        return;
    }

    append_ops(ops_, std::move(ops));
}

} // namespace treemerge
