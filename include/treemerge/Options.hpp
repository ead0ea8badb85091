/**
 * @file Options.hpp
 * @brief Input file loading and merge options
 *
 * Options can be read from a TOML or a JSON file:
 * ```toml
 * [logging]
 * level = "debug"     # trace, debug, info, warn, error, critical, off
 *
 * [merge]
 * sort_input = false  # reject decision lists not in merge order
 *
 * [output]
 * indent = 2          # JSON indentation, -1 for compact output
 * ```
 * Every key is optional; unknown keys are rejected.
 */

#ifndef TREEMERGE_OPTIONS_HPP
#define TREEMERGE_OPTIONS_HPP

#include "treemerge/Value.hpp"

#include <spdlog/common.h>

#include <string>

namespace treemerge {

struct MergeOptions {
    spdlog::level::level_enum log_level = spdlog::level::warn;
    bool sort_input = true;
    int indent = 1;
};

/**
 * @brief Load a JSON document
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError if the JSON syntax is invalid
 */
Value load_json_file(const std::string& path);

/**
 * @brief Load a TOML document as a JSON value
 *
 * Tables become objects; dates and times become their string form.
 *
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError if the TOML syntax is invalid
 */
Value load_toml_file(const std::string& path);

/**
 * @brief Parse a log level name
 * @throws std::invalid_argument for unknown names
 */
spdlog::level::level_enum parse_log_level(const std::string& name);

/**
 * @brief Read options from a parsed options document
 *
 * @param data Options document (object with optional sections)
 * @param source File name used in error messages
 * @throws ConfigParseError for unknown keys or values of the wrong type
 */
MergeOptions options_from_value(const Value& data, const std::string& source);

/**
 * @brief Load options from a .toml or .json file
 * @throws FileNotFoundError if the file doesn't exist
 * @throws ConfigParseError for syntax errors, invalid options or an
 *         unsupported extension
 */
MergeOptions load_options_file(const std::string& path);

/**
 * @brief Apply logging options to the default spdlog logger
 */
void apply_logging(const MergeOptions& options);

} // namespace treemerge

#endif // TREEMERGE_OPTIONS_HPP
