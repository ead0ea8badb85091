/**
 * @file Path.hpp
 * @brief Path keys and path utilities for locating document nodes
 *
 * A path is a sequence of keys from the document root. Each key is either
 * an index into a sequence (or a line of a text) or a name in a mapping.
 *
 * Paths render as slash-separated strings: ("cells", 0, "source") is
 * "/cells/0/source", and the empty path is "/".
 */

#ifndef TREEMERGE_PATH_HPP
#define TREEMERGE_PATH_HPP

#include "treemerge/Value.hpp"
#include "treemerge/Errors.hpp"

#include <cstdint>
#include <string>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace treemerge {

/**
 * @brief One component of a path: Index(i64) or Name(string)
 *
 * Integral values construct an index, strings construct a name, so paths
 * can be written as `Path{"a", 1, "b"}`.
 */
class PathKey {
public:
    PathKey() : key_(std::int64_t{0}) {}

    template <typename T,
              typename = std::enable_if_t<std::is_integral_v<T>>>
    PathKey(T index) : key_(static_cast<std::int64_t>(index)) {}

    PathKey(std::string name) : key_(std::move(name)) {}
    PathKey(const char* name) : key_(std::string(name)) {}

    bool is_index() const noexcept {
        return std::holds_alternative<std::int64_t>(key_);
    }

    bool is_name() const noexcept {
        return std::holds_alternative<std::string>(key_);
    }

    /**
     * @brief Get the index value
     * @throws std::bad_variant_access if the key is a name
     */
    std::int64_t index() const {
        return std::get<std::int64_t>(key_);
    }

    /**
     * @brief Get the name value
     * @throws std::bad_variant_access if the key is an index
     */
    const std::string& name() const {
        return std::get<std::string>(key_);
    }

    /// Key as written in a rendered path
    std::string to_string() const;

    friend bool operator==(const PathKey& a, const PathKey& b) {
        return a.key_ == b.key_;
    }

    friend bool operator!=(const PathKey& a, const PathKey& b) {
        return !(a == b);
    }

private:
    std::variant<std::int64_t, std::string> key_;
};

using Path = std::vector<PathKey>;

/**
 * @brief Render a path as "/a/0/b" ("/" for the root)
 */
std::string join_path(const Path& path);

/**
 * @brief Parse a rendered path
 *
 * Segments made only of digits become indices, everything else names.
 * Empty segments are skipped, so "", "/" and "//" all parse to the root.
 *
 * Examples:
 * - "/cells/0/source" -> ("cells", 0, "source")
 * - "metadata/kernelspec" -> ("metadata", "kernelspec")
 */
Path split_path(const std::string& path);

/**
 * @brief Encode a key as JSON (integer for indices, string for names)
 */
Value key_to_json(const PathKey& key);

/**
 * @brief Decode a key from JSON
 * @throws DiffFormatError if the value is neither an integer nor a string
 */
PathKey key_from_json(const Value& value);

/**
 * @brief Get the child of a node addressed by one key
 *
 * Mappings are addressed by name, sequences by index and text by line
 * index (the returned child is the line string, terminator included).
 *
 * @param node Container node
 * @param key Child key
 * @param full_path Path being resolved, used for error messages
 * @return Copy of the child value
 * @throws PathResolutionError if the child does not exist
 */
Value child_at(const Value& node, const PathKey& key, const Path& full_path);

/**
 * @brief Resolve a path against a document (strict)
 *
 * Only mappings and sequences are traversed; a path that continues into
 * a text or a scalar fails.
 *
 * @return Pointer to the node at path
 * @throws PathResolutionError if any key is missing
 */
const Value* get_by_path(const Value& data, const Path& path);
Value* get_by_path(Value& data, const Path& path);

/**
 * @brief Split a path at the first text node
 *
 * Text is diffed as lines without being split in the document, so a path
 * continuing into a text cannot be resolved as real positions. Walks the
 * document and returns the longest prefix that ends at or before the first
 * text node, together with the remaining line offset.
 *
 * Example: for {"a": "x\ny"} the path ("a", 1) splits into (("a"), (1)).
 *
 * @throws PathResolutionError if a key before the first text is missing
 */
std::pair<Path, Path> split_text_path(const Value& data, const Path& path);

/**
 * @brief Check whether prefix is a (not necessarily strict) prefix of path
 */
bool is_prefix(const Path& prefix, const Path& path);

/**
 * @brief Longest common prefix of two paths
 */
Path shared_prefix(const Path& a, const Path& b);

/**
 * @brief Replace every index in a path by "*"
 *
 * ("cells", 3, "outputs") -> ("cells", "*", "outputs")
 */
Path star_path(const Path& path);

} // namespace treemerge

#endif // TREEMERGE_PATH_HPP
