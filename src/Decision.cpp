/**
 * @file Decision.cpp
 * @brief Action names, decision equality and JSON encoding
 */

#include "treemerge/Decision.hpp"
#include "treemerge/Builder.hpp"
#include "treemerge/Errors.hpp"

#include <array>
#include <utility>

namespace treemerge {

namespace {

constexpr std::array<std::pair<Action, const char*>, 9> kActionNames{{
    {Action::Base, "base"},
    {Action::Local, "local"},
    {Action::Remote, "remote"},
    {Action::Either, "either"},
    {Action::LocalThenRemote, "local_then_remote"},
    {Action::RemoteThenLocal, "remote_then_local"},
    {Action::Custom, "custom"},
    {Action::Clear, "clear"},
    {Action::ClearParent, "clear_parent"},
}};

constexpr std::array<const char*, 6> kDecisionFields{
    "common_path", "action", "conflict", "local_diff", "remote_diff", "custom_diff"
};

Diff optional_diff(const Value& entry, const char* field) {
    auto it = entry.find(field);
    if (it == entry.end() || it->is_null()) {
        return {};
    }
    return diff_from_json(*it);
}

} // anonymous namespace

const char* action_name(Action action) {
    for (const auto& [value, name] : kActionNames) {
        if (value == action) return name;
    }
    return "unknown";
}

Action parse_action(const std::string& name) {
    for (const auto& [value, action_str] : kActionNames) {
        if (name == action_str) return value;
    }
    throw UnknownAction("", name);
}

bool operator==(const MergeDecision& a, const MergeDecision& b) {
    return a.common_path == b.common_path &&
           a.action == b.action &&
           a.local_diff == b.local_diff &&
           a.remote_diff == b.remote_diff &&
           a.custom_diff == b.custom_diff &&
           a.conflict == b.conflict;
}

bool operator!=(const MergeDecision& a, const MergeDecision& b) {
    return !(a == b);
}

Value decision_to_json(const MergeDecision& decision) {
    Value path = Value::array();
    for (const auto& key : decision.common_path) {
        path.push_back(key_to_json(key));
    }

    Value out = {
        {"common_path", std::move(path)},
        {"action", action_name(decision.action)},
        {"conflict", decision.conflict},
        {"local_diff", decision.local_diff.empty() ? Value(nullptr) : diff_to_json(decision.local_diff)},
        {"remote_diff", decision.remote_diff.empty() ? Value(nullptr) : diff_to_json(decision.remote_diff)}
    };
    if (decision.custom_diff) {
        out["custom_diff"] = diff_to_json(*decision.custom_diff);
    }
    return out;
}

Value decisions_to_json(const std::vector<MergeDecision>& decisions) {
    Value out = Value::array();
    for (const auto& decision : decisions) {
        out.push_back(decision_to_json(decision));
    }
    return out;
}

std::vector<MergeDecision> decisions_from_json(const Value& json) {
    if (!json.is_array()) {
        throw DiffFormatError("decision list must be an array, got " + json.dump());
    }

    MergeDecisionBuilder builder;

    for (const auto& entry : json) {
        if (!entry.is_object()) {
            throw DiffFormatError("decision must be an object, got " + entry.dump());
        }

        Path path;
        auto path_it = entry.find("common_path");
        if (path_it != entry.end() && !path_it->is_null()) {
            if (!path_it->is_array()) {
                throw DiffFormatError("'common_path' must be an array in " + entry.dump());
            }
            for (const auto& key : *path_it) {
                path.push_back(key_from_json(key));
            }
        }

        for (auto it = entry.begin(); it != entry.end(); ++it) {
            bool known = false;
            for (const char* field : kDecisionFields) {
                if (it.key() == field) known = true;
            }
            if (!known) {
                throw InvalidDecisionShape(join_path(path), "unknown field '" + it.key() + "'");
            }
        }

        auto action_it = entry.find("action");
        if (action_it == entry.end() || !action_it->is_string()) {
            throw DiffFormatError("decision needs a string 'action' in " + entry.dump());
        }
        Action action = Action::Base;
        try {
            action = parse_action(action_it->get<std::string>());
        } catch (const UnknownAction& e) {
            throw UnknownAction(join_path(path), e.action());
        }

        bool conflict = false;
        auto conflict_it = entry.find("conflict");
        if (conflict_it != entry.end()) {
            if (!conflict_it->is_boolean()) {
                throw DiffFormatError("'conflict' must be a boolean in " + entry.dump());
            }
            conflict = conflict_it->get<bool>();
        }

        std::optional<Diff> custom_diff;
        auto custom_it = entry.find("custom_diff");
        if (custom_it != entry.end() && !custom_it->is_null()) {
            custom_diff = diff_from_json(*custom_it);
        }

        builder.add(std::move(path), action,
                    optional_diff(entry, "local_diff"),
                    optional_diff(entry, "remote_diff"),
                    conflict, std::move(custom_diff));
    }

    return builder.decisions();
}

} // namespace treemerge
