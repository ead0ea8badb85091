/**
 * @file Value.hpp
 * @brief Document node type for merged documents
 *
 * Uses nlohmann::json as the underlying value model. For merging, every
 * value falls into one of four node kinds:
 * - Mapping (JSON object)
 * - Sequence (JSON array)
 * - Text (JSON string, diffed as a sequence of lines)
 * - Scalar (null, boolean, numbers)
 */

#ifndef TREEMERGE_VALUE_HPP
#define TREEMERGE_VALUE_HPP

#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace treemerge {

/**
 * @brief JSON-like value type for document nodes
 *
 * This is an alias for nlohmann::json. Documents handed to the merge
 * engine are plain trees of objects, arrays, strings and scalars.
 */
using Value = nlohmann::json;

/**
 * @brief Classification of a document node for merge purposes
 */
enum class NodeKind {
    Mapping,
    Sequence,
    Text,
    Scalar
};

/**
 * @brief Classify a value
 * @param val The value to inspect
 * @return Mapping for objects, Sequence for arrays, Text for strings,
 *         Scalar for everything else
 */
inline NodeKind node_kind(const Value& val) {
    if (val.is_object()) return NodeKind::Mapping;
    if (val.is_array()) return NodeKind::Sequence;
    if (val.is_string()) return NodeKind::Text;
    return NodeKind::Scalar;
}

/**
 * @brief Get human-readable name of a node kind
 */
inline const char* kind_name(NodeKind kind) {
    switch (kind) {
        case NodeKind::Mapping: return "mapping";
        case NodeKind::Sequence: return "sequence";
        case NodeKind::Text: return "text";
        case NodeKind::Scalar: return "scalar";
    }
    return "unknown";
}

/**
 * @brief Make an empty value of the same node kind
 *
 * Mapping -> {}, Sequence -> [], Text -> "", Scalar -> null.
 *
 * @param val The value being cleared
 * @return The cleared replacement
 */
inline Value cleared_value(const Value& val) {
    switch (node_kind(val)) {
        case NodeKind::Mapping: return Value::object();
        case NodeKind::Sequence: return Value::array();
        case NodeKind::Text: return Value(std::string());
        case NodeKind::Scalar: return Value(nullptr);
    }
    return Value(nullptr);
}

/**
 * @brief Split text into lines, keeping line terminators
 *
 * Every line except possibly the last ends with '\n'. A trailing '\n'
 * does not produce an empty final line, and "" yields no lines.
 *
 * Examples:
 * - "x\ny\nz" -> ["x\n", "y\n", "z"]
 * - "a\n" -> ["a\n"]
 */
std::vector<std::string> split_lines(const std::string& text);

/**
 * @brief Concatenate lines produced by split_lines()
 */
std::string join_lines(const std::vector<std::string>& lines);

} // namespace treemerge

#endif // TREEMERGE_VALUE_HPP
