/**
 * @file Reassemble.cpp
 * @brief Implementation of diff reassembly
 */

#include "treemerge/Reassemble.hpp"
#include "treemerge/Ordering.hpp"
#include "treemerge/Resolve.hpp"
#include "treemerge/Errors.hpp"

#include <spdlog/spdlog.h>

#include <map>
#include <stdexcept>

namespace treemerge {

Side parse_side(const std::string& name) {
    if (name == "local") return Side::Local;
    if (name == "remote") return Side::Remote;
    if (name == "merged") return Side::Merged;
    throw std::invalid_argument("Unknown side '" + name + "' (expected local, remote or merged)");
}

const char* side_name(Side side) {
    switch (side) {
        case Side::Local: return "local";
        case Side::Remote: return "remote";
        case Side::Merged: return "merged";
    }
    return "unknown";
}

namespace {

/**
 * Ops filed at one container path. Ops folded up from descendants are
 * kept apart from the path's own ops so that they apply first, matching
 * the applicator, which flushes deeper groups before their ancestors.
 */
struct Fragment {
    Diff folded;
    OpCollector own;

    Diff combined() && {
        Diff out = std::move(folded);
        append_ops(out, std::move(own.ops()));
        return out;
    }
};

using FragmentTree = std::map<Path, Fragment, PathOrder>;

void file_fragment(FragmentTree& tree, const Value& base, const MergeDecision& decision,
                   Side side) {
    auto [path, text_offset] = split_text_path(base, decision.common_path);

    Diff ops;
    if (side == Side::Merged) {
        const Value* node = get_by_path(base, path);
        if (text_offset.empty()) {
            ops = resolve_action(*node, decision);
        } else {
            const Value line = child_at(*node, text_offset.front(), decision.common_path);
            ops = resolve_line_action(line.get<std::string>(), decision);
        }
    } else {
        ops = side == Side::Local ? decision.local_diff : decision.remote_diff;
        if (ops.empty()) {
            return;
        }
    }
    ops = push_path(text_offset, std::move(ops));

    Fragment& fragment = tree[path];
    if (side == Side::Merged) {
        // Same override rule as the applicator
        fragment.own.add(decision, text_offset, std::move(ops));
    } else {
        append_ops(fragment.own.ops(), std::move(ops));
    }
}

} // anonymous namespace

std::optional<Diff> build_diffs(const Value& base,
                                const std::vector<MergeDecision>& decisions,
                                Side side) {
    FragmentTree tree;
    for (const auto& decision : decisions) {
        file_fragment(tree, base, decision, side);
    }

    if (tree.empty()) {
        return std::nullopt;
    }

    // The root entry terminates every join
    tree[Path{}];

    // Every path sorts before its prefixes, so descendants are folded into
    // an entry before the entry itself is visited. The root comes last.
    for (auto it = tree.begin(); it != tree.end(); ++it) {
        const Path& path = it->first;
        if (path.empty()) {
            continue;
        }

        Path ancestor = path;
        do {
            ancestor.pop_back();
        } while (!ancestor.empty() && tree.find(ancestor) == tree.end());

        Fragment& target = tree[ancestor];
        if (target.own.clearing()) {
            spdlog::debug("{} diff at {} dropped: {} is cleared",
                          side_name(side), join_path(path), join_path(ancestor));
            continue;
        }

        const Path suffix(path.begin() + static_cast<std::ptrdiff_t>(ancestor.size()), path.end());
        spdlog::debug("joining {} diff at {} into {}", side_name(side), join_path(path),
                      join_path(ancestor));
        append_ops(target.folded, push_path(suffix, std::move(it->second).combined()));
    }

    return std::move(tree[Path{}]).combined();
}

} // namespace treemerge
