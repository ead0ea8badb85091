/**
 * @file Patch.cpp
 * @brief Implementation of the patch primitive
 */

#include "treemerge/Patch.hpp"
#include "treemerge/Errors.hpp"

#include <algorithm>

namespace treemerge {

namespace {

using ChildPatcher = Value (*)(const Value&, const Diff&);

bool is_insertion(DiffOpKind kind) {
    return kind == DiffOpKind::Add || kind == DiffOpKind::AddRange;
}

Value patch_mapping(const Value& node, const Diff& diff) {
    Value result = node;

    for (const auto& op : diff) {
        if (!op.key.is_name()) {
            throw PatchError(op.key.to_string(), "mapping ops need a string key");
        }
        const auto& key = op.key.name();
        const bool exists = result.contains(key);

        switch (op.kind) {
            case DiffOpKind::Add:
                if (exists) {
                    throw PatchError(key, "add on existing key");
                }
                result[key] = op.value;
                break;
            case DiffOpKind::Remove:
                if (!exists) {
                    throw PatchError(key, "remove of missing key");
                }
                result.erase(key);
                break;
            case DiffOpKind::Replace:
                if (!exists) {
                    throw PatchError(key, "replace of missing key");
                }
                result[key] = op.value;
                break;
            case DiffOpKind::Patch:
                if (!exists) {
                    throw PatchError(key, "patch of missing key");
                }
                result[key] = patch(result[key], op.diff);
                break;
            case DiffOpKind::AddRange:
            case DiffOpKind::RemoveRange:
                throw PatchError(key, std::string(op_name(op.kind)) +
                                      " is not valid on a mapping");
        }
    }

    return result;
}

/**
 * Ops address positions in `items` before any edit. They are visited in
 * ascending index order while copying untouched items across.
 */
std::vector<Value> patch_sequence(const std::vector<Value>& items, const Diff& diff,
                                  ChildPatcher patch_child) {
    std::vector<const DiffOp*> ordered;
    ordered.reserve(diff.size());
    for (const auto& op : diff) {
        if (!op.key.is_index()) {
            throw PatchError(op.key.to_string(), "sequence ops need an integer key");
        }
        ordered.push_back(&op);
    }

    std::stable_sort(ordered.begin(), ordered.end(), [](const DiffOp* a, const DiffOp* b) {
        if (a->key.index() != b->key.index()) {
            return a->key.index() < b->key.index();
        }
        return is_insertion(a->kind) && !is_insertion(b->kind);
    });

    const auto n = static_cast<std::int64_t>(items.size());
    std::vector<Value> out;
    out.reserve(items.size());
    std::int64_t take = 0;

    for (const DiffOp* op : ordered) {
        const auto idx = op->key.index();
        const auto key = op->key.to_string();

        if (idx < 0 || idx > n) {
            throw PatchError(key, "index out of range");
        }
        if (idx < take) {
            throw PatchError(key, "op overlaps a previous op");
        }
        if (!is_insertion(op->kind) && idx >= n) {
            throw PatchError(key, "index out of range");
        }

        out.insert(out.end(), items.begin() + take, items.begin() + idx);

        std::int64_t skip = 0;
        switch (op->kind) {
            case DiffOpKind::Add:
                out.push_back(op->value);
                break;
            case DiffOpKind::AddRange:
                out.insert(out.end(), op->valuelist.begin(), op->valuelist.end());
                break;
            case DiffOpKind::Remove:
                skip = 1;
                break;
            case DiffOpKind::Replace:
                out.push_back(op->value);
                skip = 1;
                break;
            case DiffOpKind::Patch:
                out.push_back(patch_child(items[static_cast<std::size_t>(idx)], op->diff));
                skip = 1;
                break;
            case DiffOpKind::RemoveRange:
                if (op->length < 0 || idx + op->length > n) {
                    throw PatchError(key, "removerange past the end");
                }
                skip = op->length;
                break;
        }

        take = idx + skip;
    }

    out.insert(out.end(), items.begin() + take, items.end());
    return out;
}

std::string join_strings(const std::vector<Value>& parts) {
    std::string text;
    for (const auto& part : parts) {
        if (!part.is_string()) {
            throw PatchError("", "text content must be strings, got " + part.dump());
        }
        text += part.get<std::string>();
    }
    return text;
}

Value patch_char(const Value& /*ch*/, const Diff& diff) {
    throw PatchError(diff.empty() ? std::string() : diff.front().key.to_string(),
                     "cannot patch inside a single character");
}

Value patch_line(const Value& line, const Diff& diff) {
    const auto& text = line.get_ref<const std::string&>();
    std::vector<Value> chars;
    chars.reserve(text.size());
    for (char c : text) {
        chars.emplace_back(std::string(1, c));
    }
    return Value(join_strings(patch_sequence(chars, diff, &patch_char)));
}

Value patch_text(const Value& node, const Diff& diff) {
    std::vector<Value> lines;
    for (auto& line : split_lines(node.get<std::string>())) {
        lines.emplace_back(std::move(line));
    }
    return Value(join_strings(patch_sequence(lines, diff, &patch_line)));
}

} // anonymous namespace

Value patch(const Value& node, const Diff& diff) {
    if (diff.empty()) {
        return node;
    }

    switch (node_kind(node)) {
        case NodeKind::Mapping:
            return patch_mapping(node, diff);
        case NodeKind::Sequence: {
            std::vector<Value> items(node.begin(), node.end());
            return Value(patch_sequence(items, diff, &patch));
        }
        case NodeKind::Text:
            return patch_text(node, diff);
        case NodeKind::Scalar:
            break;
    }

    throw PatchError(diff.front().key.to_string(),
                     "cannot patch a " + std::string(kind_name(node_kind(node))) +
                     " value");
}

} // namespace treemerge
