#include <cxxopts.hpp>
#include <spdlog/spdlog.h>
#include <fstream>
#include <iostream>
#include <nlohmann/json.hpp>
#include "treemerge/Apply.hpp"
#include "treemerge/Decision.hpp"
#include "treemerge/Errors.hpp"
#include "treemerge/Filter.hpp"
#include "treemerge/Options.hpp"
#include "treemerge/Ordering.hpp"
#include "treemerge/Reassemble.hpp"

using nlohmann::json;
using namespace treemerge;

namespace {

std::vector<MergeDecision> load_decisions(const std::string& path, const MergeOptions& opts) {
    auto decisions = decisions_from_json(load_json_file(path));
    if (opts.sort_input) {
        return sort_decisions(std::move(decisions));
    }
    if (!is_merge_ordered(decisions)) {
        throw InvalidDecisionShape("/", "decision list in '" + path + "' is not in merge order");
    }
    return decisions;
}

int write_output(const json& result, const MergeOptions& opts, const std::string& out) {
    const std::string text = result.dump(opts.indent);
    if (out.empty()) {
        std::cout << text << "\n";
        return 0;
    }
    std::ofstream ofs(out);
    if (!ofs) {
        std::cerr << "Error: cannot write to " << out << "\n";
        return 1;
    }
    ofs << text << "\n";
    spdlog::info("wrote {}", out);
    return 0;
}

} // namespace

int main(int argc, char** argv) {
    try {
        cxxopts::Options options("treemerge", "Apply merge decisions to JSON documents");
        options.positional_help("COMMAND [ARGS]");

        // Global options
        options.add_options()
            ("c,config", "Path to TOML/JSON options file", cxxopts::value<std::string>())
            ("log-level", "trace, debug, info, warn, error, critical or off", cxxopts::value<std::string>())
            ("indent", "JSON output indentation (-1 for compact)", cxxopts::value<int>())
            ("no-sort", "Reject decision lists that are not in merge order")
            ("o,out", "Write result to FILE instead of stdout", cxxopts::value<std::string>())
            ("s,side", "Side for `diff`: local, remote or merged", cxxopts::value<std::string>()->default_value("merged"))
            ("exact", "Match the full path in `filter`")
            ("h,help", "Show help");

        // Command + arguments captured as positional strings
        options.add_options()
            ("command", "Subcommand", cxxopts::value<std::vector<std::string>>());

        options.parse_positional({"command"});

        auto result = options.parse(argc, argv);
        if (result.count("help") || !result.count("command")) {
            std::cout << options.help() << "\n";
            std::cout << "Commands: apply BASE DECISIONS | diff BASE DECISIONS [--side S] | sort DECISIONS | filter DECISIONS PATTERN [--exact]\n";
            return 0;
        }

        // Options: defaults -> config file -> command line
        MergeOptions opts;
        if (result.count("config")) {
            opts = load_options_file(result["config"].as<std::string>());
        }
        if (result.count("log-level")) {
            opts.log_level = parse_log_level(result["log-level"].as<std::string>());
        }
        if (result.count("indent")) {
            opts.indent = result["indent"].as<int>();
        }
        if (result.count("no-sort")) {
            opts.sort_input = false;
        }
        apply_logging(opts);

        const std::string out = result.count("out") ? result["out"].as<std::string>() : "";

        auto cmdv = result["command"].as<std::vector<std::string>>();
        const std::string cmd = cmdv[0];

        auto expect_args = [&](size_t want) {
            if (cmdv.size() < want) {
                std::cerr << "Error: insufficient arguments for command '" << cmd << "'\n";
                return false;
            }
            return true;
        };

        // APPLY
        if (cmd == "apply") {
            if (!expect_args(3)) return 1;
            const json base = load_json_file(cmdv[1]);
            const auto decisions = load_decisions(cmdv[2], opts);
            spdlog::info("applying {} decisions", decisions.size());
            return write_output(apply_decisions(base, decisions), opts, out);
        }

        // DIFF
        if (cmd == "diff") {
            if (!expect_args(3)) return 1;
            const Side side = parse_side(result["side"].as<std::string>());
            const json base = load_json_file(cmdv[1]);
            const auto decisions = load_decisions(cmdv[2], opts);
            auto diff = build_diffs(base, decisions, side);
            return write_output(diff ? diff_to_json(*diff) : json(nullptr), opts, out);
        }

        // SORT
        if (cmd == "sort") {
            if (!expect_args(2)) return 1;
            const auto decisions = load_decisions(cmdv[1], opts);
            return write_output(decisions_to_json(decisions), opts, out);
        }

        // FILTER
        if (cmd == "filter") {
            if (!expect_args(3)) return 1;
            const auto decisions = load_decisions(cmdv[1], opts);
            const auto matches = filter_decisions(split_path(cmdv[2]), decisions,
                                                  result.count("exact") > 0);
            json found = json::array();
            for (auto i : matches) {
                found.push_back(decision_to_json(decisions[i]));
            }
            if (found.empty()) {
                std::cout << "No matches\n";
                return 1;
            }
            return write_output(found, opts, out);
        }

        std::cerr << "Unknown command: " << cmd << "\n";
        return 1;

    } catch (const MergeError& err) {
        std::cerr << "Error: " << err.what() << "\n";
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }
}
