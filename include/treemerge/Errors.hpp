/**
 * @file Errors.hpp
 * @brief Exception types for merge errors
 *
 * All errors are fatal. A failure means a malformed decision or a base
 * document that is out of sync with its decisions, never a transient
 * condition.
 * - MergeError: Base class
 * - InvalidDecisionShape: Diffs contradict the decision's action family
 * - PathUnderflow: shallow() stripped past the root or a mismatched key
 * - UnknownAction: Action tag outside the defined set
 * - InconsistentClearKey: Clear decision targeting different keys
 * - PathResolutionError: Decision path missing from the document
 * - PatchError: Diff op cannot be applied to a node
 * - DiffFormatError: Malformed JSON encoding of a diff or decision
 * - FileNotFoundError / ConfigParseError: Input and options files
 */

#ifndef TREEMERGE_ERRORS_HPP
#define TREEMERGE_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <utility>

namespace treemerge {

/**
 * @brief Base class for all treemerge exceptions
 */
class MergeError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Builder constructor invoked with diffs that contradict its action
 */
class InvalidDecisionShape : public MergeError {
public:
    /**
     * @param path Rendered common path of the offending decision
     * @param reason What is wrong with the decision
     */
    InvalidDecisionShape(std::string path, std::string reason)
        : MergeError("Invalid decision at '" + path + "': " + reason)
        , path_(std::move(path))
        , reason_(std::move(reason))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& reason() const noexcept {
        return reason_;
    }

private:
    std::string path_;
    std::string reason_;
};

/**
 * @brief Path prefix could not be moved from a decision into its diffs
 *
 * Raised when more keys are requested than the common path holds, or
 * when a requested key does not match the trailing key.
 */
class PathUnderflow : public MergeError {
public:
    /**
     * @param path Rendered common path at the point of failure
     * @param key Rendered key that could not be stripped
     */
    PathUnderflow(std::string path, std::string key)
        : MergeError("Cannot strip key '" + key + "' from decision path '" +
                     path + "'")
        , path_(std::move(path))
        , key_(std::move(key))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& key() const noexcept {
        return key_;
    }

private:
    std::string path_;
    std::string key_;
};

/**
 * @brief Action tag outside the defined set
 */
class UnknownAction : public MergeError {
public:
    UnknownAction(std::string path, std::string action)
        : MergeError("The action \"" + action + "\" is not defined (at '" +
                     path + "')")
        , path_(std::move(path))
        , action_(std::move(action))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& action() const noexcept {
        return action_;
    }

private:
    std::string path_;
    std::string action_;
};

/**
 * @brief Clear decision whose local and remote diffs target different keys
 */
class InconsistentClearKey : public MergeError {
public:
    InconsistentClearKey(std::string path, std::string first, std::string second)
        : MergeError("Clear decision at '" + path + "' targets both '" +
                     first + "' and '" + second + "'")
        , path_(std::move(path))
        , first_(std::move(first))
        , second_(std::move(second))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& first() const noexcept {
        return first_;
    }

    const std::string& second() const noexcept {
        return second_;
    }

private:
    std::string path_;
    std::string first_;
    std::string second_;
};

/**
 * @brief Key or index along a decision path is missing from the document
 */
class PathResolutionError : public MergeError {
public:
    /**
     * @param path Full rendered path being resolved
     * @param segment The specific key that does not exist
     */
    PathResolutionError(std::string path, std::string segment)
        : MergeError("Key not found: '" + segment + "' in path '" + path + "'")
        , path_(std::move(path))
        , segment_(std::move(segment))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

    const std::string& segment() const noexcept {
        return segment_;
    }

private:
    std::string path_;
    std::string segment_;
};

/**
 * @brief Diff op cannot be applied to the node it addresses
 */
class PatchError : public MergeError {
public:
    PatchError(std::string key, std::string details)
        : MergeError("Cannot patch key '" + key + "': " + details)
        , key_(std::move(key))
        , details_(std::move(details))
    {}

    const std::string& key() const noexcept {
        return key_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string key_;
    std::string details_;
};

/**
 * @brief Malformed JSON encoding of a diff or a decision
 */
class DiffFormatError : public MergeError {
public:
    explicit DiffFormatError(const std::string& details)
        : MergeError("Malformed diff: " + details)
    {}
};

/**
 * @brief Input or options file not found
 */
class FileNotFoundError : public MergeError {
public:
    explicit FileNotFoundError(std::string path)
        : MergeError("File not found: " + path)
        , path_(std::move(path))
    {}

    const std::string& path() const noexcept {
        return path_;
    }

private:
    std::string path_;
};

/**
 * @brief Input or options file could not be parsed
 */
class ConfigParseError : public MergeError {
public:
    /**
     * @param file Path to the file with parse error
     * @param line Line number (1-based, 0 if unknown)
     * @param column Column number (1-based, 0 if unknown)
     * @param details Detailed error message from parser
     */
    ConfigParseError(std::string file, int line, int column, std::string details)
        : MergeError(format_message(file, line, column, details))
        , file_(std::move(file))
        , line_(line)
        , column_(column)
        , details_(std::move(details))
    {}

    const std::string& file() const noexcept {
        return file_;
    }

    int line() const noexcept {
        return line_;
    }

    int column() const noexcept {
        return column_;
    }

    const std::string& details() const noexcept {
        return details_;
    }

private:
    std::string file_;
    int line_;
    int column_;
    std::string details_;

    static std::string format_message(const std::string& file, int line,
                                      int column, const std::string& details) {
        std::string msg = "Parse error in '" + file + "'";
        if (line > 0) {
            msg += " at line " + std::to_string(line);
            if (column > 0) {
                msg += ", column " + std::to_string(column);
            }
        }
        return msg + ": " + details;
    }
};

} // namespace treemerge

#endif // TREEMERGE_ERRORS_HPP
