/**
 * @file Path.cpp
 * @brief Implementation of path keys and path traversal
 */

#include "treemerge/Path.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace treemerge {

std::string PathKey::to_string() const {
    if (is_index()) {
        return std::to_string(index());
    }
    return name();
}

std::string join_path(const Path& path) {
    if (path.empty()) {
        return "/";
    }

    std::ostringstream oss;
    for (const auto& key : path) {
        oss << '/' << key.to_string();
    }
    return oss.str();
}

namespace {
    /**
     * @brief Check if segment represents a sequence index
     * @param segment The segment to check
     * @return true if segment is a non-empty run of digits
     */
    bool is_index_segment(const std::string& segment) {
        if (segment.empty()) return false;
        return std::all_of(segment.begin(), segment.end(),
                           [](unsigned char c) { return std::isdigit(c) != 0; });
    }

    /**
     * @brief Child of a mapping or sequence; Node is Value or const Value
     */
    template <typename Node>
    Node* child_ptr(Node& node, const PathKey& key, const Path& full_path) {
        if (node.is_object()) {
            if (!key.is_name()) {
                throw PathResolutionError(join_path(full_path),
                                          key.to_string() + " (index into mapping)");
            }
            auto it = node.find(key.name());
            if (it == node.end()) {
                throw PathResolutionError(join_path(full_path), key.name());
            }
            return &(*it);
        }

        if (node.is_array()) {
            if (!key.is_index()) {
                throw PathResolutionError(join_path(full_path),
                                          key.name() + " (name into sequence)");
            }
            auto idx = key.index();
            if (idx < 0 || static_cast<std::size_t>(idx) >= node.size()) {
                throw PathResolutionError(join_path(full_path),
                                          key.to_string() + " (index out of range)");
            }
            return &node[static_cast<std::size_t>(idx)];
        }

        throw PathResolutionError(join_path(full_path),
                                  key.to_string() + " (cannot traverse into " +
                                  kind_name(node_kind(node)) + ")");
    }

    template <typename Node>
    Node* walk(Node& data, const Path& path) {
        Node* current = &data;
        for (const auto& key : path) {
            current = child_ptr(*current, key, path);
        }
        return current;
    }
}

Path split_path(const std::string& path) {
    Path keys;
    std::string current;

    auto flush = [&]() {
        if (current.empty()) return;
        if (is_index_segment(current)) {
            keys.emplace_back(static_cast<std::int64_t>(std::stoll(current)));
        } else {
            keys.emplace_back(current);
        }
        current.clear();
    };

    for (char c : path) {
        if (c == '/') {
            flush();
        } else {
            current += c;
        }
    }
    flush();

    return keys;
}

Value key_to_json(const PathKey& key) {
    if (key.is_index()) {
        return Value(key.index());
    }
    return Value(key.name());
}

PathKey key_from_json(const Value& value) {
    if (value.is_number_integer()) {
        return PathKey(value.get<std::int64_t>());
    }
    if (value.is_string()) {
        return PathKey(value.get<std::string>());
    }
    throw DiffFormatError("path key must be an integer or a string, got " +
                          value.dump());
}

Value child_at(const Value& node, const PathKey& key, const Path& full_path) {
    if (node.is_string()) {
        if (!key.is_index()) {
            throw PathResolutionError(join_path(full_path),
                                      key.name() + " (name into text)");
        }
        auto lines = split_lines(node.get<std::string>());
        auto idx = key.index();
        if (idx < 0 || static_cast<std::size_t>(idx) >= lines.size()) {
            throw PathResolutionError(join_path(full_path),
                                      key.to_string() + " (line out of range)");
        }
        return Value(lines[static_cast<std::size_t>(idx)]);
    }
    return *child_ptr(node, key, full_path);
}

const Value* get_by_path(const Value& data, const Path& path) {
    return walk(data, path);
}

Value* get_by_path(Value& data, const Path& path) {
    return walk(data, path);
}

std::pair<Path, Path> split_text_path(const Value& data, const Path& path) {
    const Value* current = &data;

    for (std::size_t i = 0; i < path.size(); ++i) {
        if (current->is_string()) {
            return {Path(path.begin(), path.begin() + i),
                    Path(path.begin() + i, path.end())};
        }
        current = child_ptr(*current, path[i], path);
    }

    return {path, Path{}};
}

bool is_prefix(const Path& prefix, const Path& path) {
    if (prefix.size() > path.size()) {
        return false;
    }
    return std::equal(prefix.begin(), prefix.end(), path.begin());
}

Path shared_prefix(const Path& a, const Path& b) {
    auto n = std::min(a.size(), b.size());
    std::size_t i = 0;
    while (i < n && a[i] == b[i]) {
        ++i;
    }
    return Path(a.begin(), a.begin() + i);
}

Path star_path(const Path& path) {
    Path starred;
    starred.reserve(path.size());
    for (const auto& key : path) {
        if (key.is_index()) {
            starred.emplace_back("*");
        } else {
            starred.push_back(key);
        }
    }
    return starred;
}

} // namespace treemerge
