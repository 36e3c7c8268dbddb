/**
 * @file merge_folders_example.cpp
 * @brief Command-line front end for MergeEngine
 *
 * USAGE:
 * merge_folders_example <target> <to-merge> [--config options.json] [--verbose]
 *
 * options.json (every key optional):
 * {
 *   "worker_threads": 2,
 *   "concurrent_walks": true,
 *   "concurrent_digests": true,
 *   "read_buffer_size": 65536,
 *   "prune_policy": "fail_fast"      // or "best_effort"
 * }
 *
 * Prints the merge report as JSON on stdout.
 * Exit code: 0 = merged without conflicts, 1 = conflicts left, 2 = error.
 */

#include "fm/events/components.hpp"
#include "fm/events/event_bus.hpp"
#include "fm/merge/engine.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>

using fm::events::EventBus;
using fm::events::LoggerComponent;
using fm::events::MetricsComponent;
using fm::merge::MergeEngine;
using fm::merge::MergeOptions;
using fm::merge::MergeReport;
using fm::merge::PruneErrorPolicy;

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace {

void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <target> <to-merge> [--config options.json] [--verbose]\n";
}

fm::Result<MergeOptions> load_options(const fs::path& config_path) {
    std::ifstream input(config_path);
    if (!input) {
        return fm::Err<MergeOptions>(fm::ErrorCode::NotFound, "Cannot open config file", config_path);
    }

    MergeOptions options;
    try {
        const json config = json::parse(input);
        options.worker_threads = config.value("worker_threads", options.worker_threads);
        options.concurrent_walks = config.value("concurrent_walks", options.concurrent_walks);
        options.concurrent_digests = config.value("concurrent_digests", options.concurrent_digests);
        options.read_buffer_size = config.value("read_buffer_size", options.read_buffer_size);

        const auto policy = config.value("prune_policy", std::string("fail_fast"));
        if (policy == "fail_fast") {
            options.prune_policy = PruneErrorPolicy::FailFast;
        } else if (policy == "best_effort") {
            options.prune_policy = PruneErrorPolicy::BestEffort;
        } else {
            return fm::Err<MergeOptions>(fm::ErrorCode::InvalidArgument,
                                         "Unknown prune_policy '" + policy + "'", config_path);
        }
    } catch (const json::exception& e) {
        return fm::Err<MergeOptions>(fm::ErrorCode::InvalidArgument,
                                     std::string("Malformed config: ") + e.what(), config_path);
    }

    if (options.read_buffer_size == 0) {
        return fm::Err<MergeOptions>(fm::ErrorCode::InvalidArgument, "read_buffer_size must be > 0", config_path);
    }
    return fm::Ok(options);
}

json report_to_json(const MergeReport& report) {
    json conflicts = json::array();
    for (const auto& conflict : report.conflicts) {
        conflicts.push_back({
            {"relative_path", conflict.relative_path()},
            {"target_path", conflict.target.path.string()},
            {"to_merge_path", conflict.to_merge.path.string()},
            {"kind_mismatch", conflict.kind_mismatch()}
        });
    }

    json j;
    j["conflicts"] = conflicts;
    j["relocated"] = report.relocated;
    j["deduplicated"] = report.deduplicated;
    j["pruned_directories"] = report.pruned_directories;
    j["prune_failures"] = report.prune_failures;
    j["to_merge_root_removed"] = report.to_merge_root_removed;
    return j;
}

} // namespace

int main(int argc, char* argv[]) {
    spdlog::set_level(spdlog::level::info);
    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    std::optional<fs::path> target;
    std::optional<fs::path> to_merge;
    std::optional<fs::path> config_path;

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        } else if (arg == "--verbose" || arg == "-v") {
            spdlog::set_level(spdlog::level::debug);
        } else if (arg == "--config") {
            if (i + 1 >= argc) {
                spdlog::error("--config requires a file argument");
                return 2;
            }
            config_path = fs::path(argv[++i]);
        } else if (!target) {
            target = fs::path(arg);
        } else if (!to_merge) {
            to_merge = fs::path(arg);
        } else {
            spdlog::error("Unexpected argument: {}", arg);
            print_usage(argv[0]);
            return 2;
        }
    }

    if (!target || !to_merge) {
        print_usage(argv[0]);
        return 2;
    }

    MergeOptions options;
    if (config_path) {
        auto loaded = load_options(*config_path);
        if (loaded.is_error()) {
            spdlog::error("{}", loaded.error().describe());
            return 2;
        }
        options = loaded.value();
    }

    EventBus bus;
    LoggerComponent logger(bus);
    MetricsComponent metrics(bus);

    MergeEngine engine(options, &bus);
    auto result = engine.merge(*target, *to_merge);
    if (result.is_error()) {
        return 2;
    }

    metrics.print_stats();
    std::cout << report_to_json(result.value()).dump(2) << std::endl;
    return result.value().conflicts.empty() ? 0 : 1;
}
