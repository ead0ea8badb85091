/**
 * @file Diff.hpp
 * @brief Diff operations addressing mapping keys and sequence indices
 *
 * A diff is an ordered list of operations, each relative to one node:
 * - Add(key, value), Remove(key), Replace(key, value) on a mapping key or
 *   a sequence index
 * - Patch(key, diff) applying a nested diff to the child at key
 * - AddRange(index, values), RemoveRange(index, length) on sequences
 *   and on the lines of a text
 *
 * JSON encoding follows the nbdime diff format:
 * ```json
 * [{"op": "patch", "key": "cells", "diff": [
 *     {"op": "addrange", "key": 2, "valuelist": [{"cell_type": "code"}]},
 *     {"op": "removerange", "key": 0, "length": 1}]}]
 * ```
 */

#ifndef TREEMERGE_DIFF_HPP
#define TREEMERGE_DIFF_HPP

#include "treemerge/Value.hpp"
#include "treemerge/Path.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace treemerge {

enum class DiffOpKind {
    Add,
    Remove,
    Replace,
    Patch,
    AddRange,
    RemoveRange
};

struct DiffOp;

using Diff = std::vector<DiffOp>;

/**
 * @brief One atomic edit instruction
 *
 * Only the fields relevant to `kind` are meaningful: `value` for Add and
 * Replace, `diff` for Patch, `valuelist` for AddRange and `length` for
 * RemoveRange.
 */
struct DiffOp {
    DiffOpKind kind = DiffOpKind::Add;
    PathKey key;
    Value value;
    Diff diff;
    std::vector<Value> valuelist;
    std::int64_t length = 0;
};

bool operator==(const DiffOp& a, const DiffOp& b);
bool operator!=(const DiffOp& a, const DiffOp& b);

DiffOp op_add(PathKey key, Value value);
DiffOp op_remove(PathKey key);
DiffOp op_replace(PathKey key, Value value);
DiffOp op_patch(PathKey key, Diff diff);
DiffOp op_addrange(std::int64_t index, std::vector<Value> valuelist);
DiffOp op_removerange(std::int64_t index, std::int64_t length);

/**
 * @brief Name of an op kind as used in the JSON encoding ("addrange", ...)
 */
const char* op_name(DiffOpKind kind);

/**
 * @brief Wrap a diff in one Patch op per path key
 *
 * The last key of path becomes the innermost Patch:
 * push_path(("a", 1), d) == [Patch("a", [Patch(1, d)])]
 */
Diff push_path(const Path& path, Diff diff);

/**
 * @brief Append an op, joining it with an existing Patch on the same key
 *
 * If `op` is a Patch and `target` already holds a Patch on the same key,
 * the nested ops of `op` are appended (recursively, by the same rule) to
 * the existing Patch instead of adding a second Patch for that key.
 */
void append_op(Diff& target, DiffOp op);

/**
 * @brief Append every op of `ops` with append_op()
 */
void append_ops(Diff& target, Diff ops);

Value diff_to_json(const Diff& diff);

/**
 * @brief Decode a diff from its JSON encoding
 * @throws DiffFormatError on unknown ops, missing fields or wrong key types
 */
Diff diff_from_json(const Value& json);

} // namespace treemerge

#endif // TREEMERGE_DIFF_HPP
