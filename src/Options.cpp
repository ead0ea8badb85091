/**
 * @file Options.cpp
 * @brief File loading and merge options
 *
 * JSON files are read with nlohmann::json, TOML files with toml++ and
 * converted to the same Value model before the options are read.
 */

#include "treemerge/Options.hpp"
#include "treemerge/Errors.hpp"

#include <nlohmann/json.hpp>
#include <toml++/toml.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace fs = std::filesystem;

namespace treemerge {

// ============================================================================
// Utility functions
// ============================================================================

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return std::tolower(c); });
    return result;
}

bool file_exists(const std::string& path) {
    std::error_code ec;
    return fs::exists(path, ec) && fs::is_regular_file(path, ec);
}

std::string read_file(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw FileNotFoundError(path);
    }

    std::ostringstream ss;
    ss << file.rdbuf();
    return ss.str();
}

std::string get_file_extension(const std::string& path) {
    return to_lower(fs::path(path).extension().string());
}

/**
 * @brief Convert a parsed TOML node to a Value
 *
 * Options only use tables, arrays, strings, numbers and booleans. Date and
 * time values are rejected at their source position.
 */
Value toml_to_value(const toml::node& node, const std::string& source) {
    if (const auto* table = node.as_table()) {
        Value obj = Value::object();
        for (const auto& [key, val] : *table) {
            obj[std::string(key.str())] = toml_to_value(val, source);
        }
        return obj;
    }
    if (const auto* array = node.as_array()) {
        Value arr = Value::array();
        for (const auto& elem : *array) {
            arr.push_back(toml_to_value(elem, source));
        }
        return arr;
    }
    if (const auto* str = node.as_string()) return Value(str->get());
    if (const auto* num = node.as_integer()) return Value(num->get());
    if (const auto* num = node.as_floating_point()) return Value(num->get());
    if (const auto* flag = node.as_boolean()) return Value(flag->get());

    throw ConfigParseError(source,
                           static_cast<int>(node.source().begin.line),
                           static_cast<int>(node.source().begin.column),
                           "date and time values are not supported");
}

const Value& require_table(const Value& section, const std::string& name,
                           const std::string& source) {
    if (!section.is_object()) {
        throw ConfigParseError(source, 0, 0, "[" + name + "] must be a table");
    }
    return section;
}

} // anonymous namespace

// ============================================================================
// File loading
// ============================================================================

Value load_json_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    std::string content = read_file(path);

    try {
        return nlohmann::json::parse(content);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigParseError(path, 0, 0, e.what());
    }
}

Value load_toml_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    toml::table table;
    try {
        table = toml::parse_file(path);
    } catch (const toml::parse_error& e) {
        throw ConfigParseError(
            path,
            static_cast<int>(e.source().begin.line),
            static_cast<int>(e.source().begin.column),
            std::string(e.description())
        );
    }

    return toml_to_value(table, path);
}

// ============================================================================
// Options
// ============================================================================

spdlog::level::level_enum parse_log_level(const std::string& name) {
    const auto lowered = to_lower(name);
    if (lowered == "error") {
        return spdlog::level::err;
    }
    const auto level = spdlog::level::from_str(lowered);
    // from_str() maps unknown names to "off"
    if (level == spdlog::level::off && lowered != "off") {
        throw std::invalid_argument("Unknown log level '" + name + "'");
    }
    return level;
}

MergeOptions options_from_value(const Value& data, const std::string& source) {
    if (!data.is_object()) {
        throw ConfigParseError(source, 0, 0, "options must be a table");
    }

    MergeOptions options;

    for (auto section = data.begin(); section != data.end(); ++section) {
        const auto& name = section.key();
        if (name != "logging" && name != "merge" && name != "output") {
            throw ConfigParseError(source, 0, 0, "unknown section [" + name + "]");
        }
        const Value& table = require_table(section.value(), name, source);

        for (auto it = table.begin(); it != table.end(); ++it) {
            const std::string key = name + "." + it.key();
            const Value& val = it.value();

            if (key == "logging.level") {
                if (!val.is_string()) {
                    throw ConfigParseError(source, 0, 0, key + " must be a string");
                }
                try {
                    options.log_level = parse_log_level(val.get<std::string>());
                } catch (const std::invalid_argument& e) {
                    throw ConfigParseError(source, 0, 0, e.what());
                }
            } else if (key == "merge.sort_input") {
                if (!val.is_boolean()) {
                    throw ConfigParseError(source, 0, 0, key + " must be a boolean");
                }
                options.sort_input = val.get<bool>();
            } else if (key == "output.indent") {
                if (!val.is_number_integer()) {
                    throw ConfigParseError(source, 0, 0, key + " must be an integer");
                }
                options.indent = val.get<int>();
            } else {
                throw ConfigParseError(source, 0, 0, "unknown option '" + key + "'");
            }
        }
    }

    return options;
}

MergeOptions load_options_file(const std::string& path) {
    if (!file_exists(path)) {
        throw FileNotFoundError(path);
    }

    const std::string ext = get_file_extension(path);
    if (ext == ".toml") {
        return options_from_value(load_toml_file(path), path);
    }
    if (ext == ".json") {
        return options_from_value(load_json_file(path), path);
    }
    throw ConfigParseError(path, 0, 0,
                           "unsupported options file type '" + ext +
                           "' (expected .json or .toml)");
}

void apply_logging(const MergeOptions& options) {
    spdlog::set_level(options.log_level);
}

} // namespace treemerge
