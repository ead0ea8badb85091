/**
 * @file Diff.cpp
 * @brief Diff op construction, nesting and JSON encoding
 */

#include "treemerge/Diff.hpp"
#include "treemerge/Errors.hpp"

#include <algorithm>

namespace treemerge {

bool operator==(const DiffOp& a, const DiffOp& b) {
    return a.kind == b.kind &&
           a.key == b.key &&
           a.value == b.value &&
           a.diff == b.diff &&
           a.valuelist == b.valuelist &&
           a.length == b.length;
}

bool operator!=(const DiffOp& a, const DiffOp& b) {
    return !(a == b);
}

DiffOp op_add(PathKey key, Value value) {
    DiffOp op;
    op.kind = DiffOpKind::Add;
    op.key = std::move(key);
    op.value = std::move(value);
    return op;
}

DiffOp op_remove(PathKey key) {
    DiffOp op;
    op.kind = DiffOpKind::Remove;
    op.key = std::move(key);
    return op;
}

DiffOp op_replace(PathKey key, Value value) {
    DiffOp op;
    op.kind = DiffOpKind::Replace;
    op.key = std::move(key);
    op.value = std::move(value);
    return op;
}

DiffOp op_patch(PathKey key, Diff diff) {
    DiffOp op;
    op.kind = DiffOpKind::Patch;
    op.key = std::move(key);
    op.diff = std::move(diff);
    return op;
}

DiffOp op_addrange(std::int64_t index, std::vector<Value> valuelist) {
    DiffOp op;
    op.kind = DiffOpKind::AddRange;
    op.key = PathKey(index);
    op.valuelist = std::move(valuelist);
    return op;
}

DiffOp op_removerange(std::int64_t index, std::int64_t length) {
    DiffOp op;
    op.kind = DiffOpKind::RemoveRange;
    op.key = PathKey(index);
    op.length = length;
    return op;
}

const char* op_name(DiffOpKind kind) {
    switch (kind) {
        case DiffOpKind::Add: return "add";
        case DiffOpKind::Remove: return "remove";
        case DiffOpKind::Replace: return "replace";
        case DiffOpKind::Patch: return "patch";
        case DiffOpKind::AddRange: return "addrange";
        case DiffOpKind::RemoveRange: return "removerange";
    }
    return "unknown";
}

Diff push_path(const Path& path, Diff diff) {
    for (auto it = path.rbegin(); it != path.rend(); ++it) {
        Diff wrapped;
        wrapped.push_back(op_patch(*it, std::move(diff)));
        diff = std::move(wrapped);
    }
    return diff;
}

void append_op(Diff& target, DiffOp op) {
    if (op.kind == DiffOpKind::Patch) {
        auto existing = std::find_if(target.begin(), target.end(), [&](const DiffOp& d) {
            return d.kind == DiffOpKind::Patch && d.key == op.key;
        });
        if (existing != target.end()) {
            append_ops(existing->diff, std::move(op.diff));
            return;
        }
    }
    target.push_back(std::move(op));
}

void append_ops(Diff& target, Diff ops) {
    for (auto& op : ops) {
        append_op(target, std::move(op));
    }
}

// ============================================================================
// JSON encoding
// ============================================================================

Value diff_to_json(const Diff& diff) {
    Value out = Value::array();

    for (const auto& op : diff) {
        Value entry = {
            {"op", op_name(op.kind)},
            {"key", key_to_json(op.key)}
        };

        switch (op.kind) {
            case DiffOpKind::Add:
            case DiffOpKind::Replace:
                entry["value"] = op.value;
                break;
            case DiffOpKind::Patch:
                entry["diff"] = diff_to_json(op.diff);
                break;
            case DiffOpKind::AddRange:
                entry["valuelist"] = Value(op.valuelist);
                break;
            case DiffOpKind::RemoveRange:
                entry["length"] = op.length;
                break;
            case DiffOpKind::Remove:
                break;
        }

        out.push_back(std::move(entry));
    }

    return out;
}

namespace {

const Value& require_field(const Value& entry, const char* field) {
    auto it = entry.find(field);
    if (it == entry.end()) {
        throw DiffFormatError(std::string("missing field '") + field + "' in " +
                              entry.dump());
    }
    return *it;
}

std::int64_t require_index(const DiffOp& op, const Value& entry) {
    if (!op.key.is_index()) {
        throw DiffFormatError(std::string(op_name(op.kind)) +
                              " requires an integer key in " + entry.dump());
    }
    return op.key.index();
}

} // anonymous namespace

Diff diff_from_json(const Value& json) {
    if (!json.is_array()) {
        throw DiffFormatError("diff must be an array, got " + json.dump());
    }

    Diff diff;
    diff.reserve(json.size());

    for (const auto& entry : json) {
        if (!entry.is_object()) {
            throw DiffFormatError("diff op must be an object, got " + entry.dump());
        }

        const auto& op_field = require_field(entry, "op");
        if (!op_field.is_string()) {
            throw DiffFormatError("'op' must be a string in " + entry.dump());
        }
        const auto name = op_field.get<std::string>();

        DiffOp op;
        op.key = key_from_json(require_field(entry, "key"));

        if (name == "add") {
            op.kind = DiffOpKind::Add;
            op.value = require_field(entry, "value");
        } else if (name == "remove") {
            op.kind = DiffOpKind::Remove;
        } else if (name == "replace") {
            op.kind = DiffOpKind::Replace;
            op.value = require_field(entry, "value");
        } else if (name == "patch") {
            op.kind = DiffOpKind::Patch;
            op.diff = diff_from_json(require_field(entry, "diff"));
        } else if (name == "addrange") {
            op.kind = DiffOpKind::AddRange;
            require_index(op, entry);
            const auto& values = require_field(entry, "valuelist");
            if (values.is_string()) {
                // Character ranges may be encoded as one string
                for (char c : values.get<std::string>()) {
                    op.valuelist.emplace_back(std::string(1, c));
                }
            } else if (values.is_array()) {
                op.valuelist.assign(values.begin(), values.end());
            } else {
                throw DiffFormatError("'valuelist' must be an array in " + entry.dump());
            }
        } else if (name == "removerange") {
            op.kind = DiffOpKind::RemoveRange;
            require_index(op, entry);
            const auto& length = require_field(entry, "length");
            if (!length.is_number_integer() || length.get<std::int64_t>() < 0) {
                throw DiffFormatError("'length' must be a non-negative integer in " +
                                      entry.dump());
            }
            op.length = length.get<std::int64_t>();
        } else {
            throw DiffFormatError("unknown op '" + name + "'");
        }

        diff.push_back(std::move(op));
    }

    return diff;
}

} // namespace treemerge
