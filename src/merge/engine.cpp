#include "fm/merge/engine.hpp"

#include "fm/core/task.hpp"
#include "fm/events/events.hpp"
#include "fm/merge/digest.hpp"
#include "fm/merge/pruner.hpp"
#include "fm/merge/relocate.hpp"
#include "fm/merge/tree_walker.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <chrono>
#include <string>
#include <system_error>
#include <unordered_map>
#include <utility>

namespace fm::merge {
namespace fs = std::filesystem;

namespace {

struct TreeListings {
    std::vector<Entry> target;
    std::vector<Entry> to_merge;
};

fs::path strip_trailing_separator(fs::path path) {
    if (!path.has_filename() && path.has_relative_path()) {
        return path.parent_path();
    }
    return path;
}

fm::Result<fs::path> resolve_root(const fs::path& root) {
    if (root.empty()) {
        return fm::Err<fs::path>(ErrorCode::InvalidArgument, "empty path");
    }

    std::error_code ec;
    auto absolute = fs::absolute(root, ec);
    if (ec) {
        return fm::Err<fs::path>(ErrorCode::IOError, "Failed to resolve path: " + ec.message(), root);
    }
    auto canonical = fs::weakly_canonical(absolute, ec);
    if (ec) {
        return fm::Err<fs::path>(ErrorCode::IOError, "Failed to resolve path: " + ec.message(), root);
    }
    return fm::Ok(strip_trailing_separator(canonical.lexically_normal()));
}

fm::Result<TreeListings> walk_both(const MergeRoots& roots, asio::thread_pool* pool) {
    std::future<fm::Result<std::vector<Entry>>> pending;
    if (pool != nullptr) {
        pending = fm::post_task(*pool, [root = roots.to_merge] { return walk_tree(root); });
    }

    auto target_walk = walk_tree(roots.target);
    auto to_merge_walk = pool != nullptr ? pending.get() : walk_tree(roots.to_merge);

    if (target_walk.is_error()) {
        return fm::Err<TreeListings>(target_walk.error());
    }
    if (to_merge_walk.is_error()) {
        return fm::Err<TreeListings>(to_merge_walk.error());
    }
    return fm::Ok(TreeListings{std::move(target_walk.value()), std::move(to_merge_walk.value())});
}

/// Index of the last entry that belongs to the subtree rooted at entries[index].
std::size_t last_descendant(const std::vector<Entry>& entries, std::size_t index) {
    const std::string prefix = entries[index].relative_path + '/';
    std::size_t last = index;
    while (last + 1 < entries.size() &&
           entries[last + 1].relative_path.compare(0, prefix.size(), prefix) == 0) {
        ++last;
    }
    return last;
}

} // namespace

bool is_ancestor(const fs::path& ancestor, const fs::path& descendant) {
    const auto lhs = strip_trailing_separator(ancestor.lexically_normal());
    const auto rhs = strip_trailing_separator(descendant.lexically_normal());

    auto [lhs_it, rhs_it] = std::mismatch(lhs.begin(), lhs.end(), rhs.begin(), rhs.end());
    return lhs_it == lhs.end() && rhs_it != rhs.end();
}

fm::Result<MergeRoots> validate_roots(const fs::path& target, const fs::path& to_merge) {
    auto resolved_target = resolve_root(target);
    if (resolved_target.is_error()) {
        return fm::Err<MergeRoots>(resolved_target.error());
    }
    auto resolved_to_merge = resolve_root(to_merge);
    if (resolved_to_merge.is_error()) {
        return fm::Err<MergeRoots>(resolved_to_merge.error());
    }

    MergeRoots roots{std::move(resolved_target.value()), std::move(resolved_to_merge.value())};
    if (roots.target == roots.to_merge) {
        return fm::Err<MergeRoots>(ErrorCode::InvalidArgument, "same path", roots.target);
    }
    if (is_ancestor(roots.target, roots.to_merge) || is_ancestor(roots.to_merge, roots.target)) {
        return fm::Err<MergeRoots>(ErrorCode::InvalidArgument, "nested paths", roots.to_merge);
    }
    return fm::Ok(std::move(roots));
}

MergeEngine::MergeEngine(MergeOptions options, events::EventBus* bus)
    : options_(options), bus_(bus) {
    if (options_.worker_threads > 0 && (options_.concurrent_walks || options_.concurrent_digests)) {
        pool_ = std::make_unique<asio::thread_pool>(options_.worker_threads);
    }
}

MergeEngine::~MergeEngine() {
    if (pool_) {
        pool_->join();
    }
}

fm::Result<MergeReport> MergeEngine::merge(const fs::path& target, const fs::path& to_merge) {
    auto result = run(target, to_merge);
    if (result.is_error()) {
        spdlog::error("Merge of {} into {} failed: {}",
                      to_merge.string(), target.string(), result.error().describe());
        events::emit_if(bus_, events::MergeFailedEvent{result.error()});
    }
    return result;
}

fm::Result<MergeReport> MergeEngine::run(const fs::path& target, const fs::path& to_merge) {
    const auto started_at = std::chrono::steady_clock::now();

    if (options_.read_buffer_size == 0) {
        return fm::Err<MergeReport>(ErrorCode::InvalidArgument, "read_buffer_size must be > 0");
    }

    auto validated = validate_roots(target, to_merge);
    if (validated.is_error()) {
        return fm::Err<MergeReport>(validated.error());
    }
    const MergeRoots roots = std::move(validated.value());

    spdlog::info("Merging {} into {}", roots.to_merge.string(), roots.target.string());
    events::emit_if(bus_, events::MergeStartedEvent{roots.target, roots.to_merge});

    auto listings = walk_both(roots, options_.concurrent_walks ? pool_.get() : nullptr);
    if (listings.is_error()) {
        return fm::Err<MergeReport>(listings.error());
    }
    const auto& target_entries = listings.value().target;
    const auto& entries = listings.value().to_merge;

    std::unordered_map<std::string, const Entry*> target_index;
    target_index.reserve(target_entries.size());
    for (const auto& entry : target_entries) {
        target_index.emplace(entry.relative_path, &entry);
    }

    const ContentComparator comparator(options_.read_buffer_size,
                                       options_.concurrent_digests ? pool_.get() : nullptr);
    MergeReport report;

    for (std::size_t i = 0; i < entries.size(); ++i) {
        const Entry& entry = entries[i];
        const auto found = target_index.find(entry.relative_path);

        if (found == target_index.end()) {
            // Net new: the whole subtree moves with its root
            if (entry.is_directory()) {
                i = last_descendant(entries, i);
            }
            const fs::path destination = roots.target / fs::path(entry.relative_path);
            auto moved = relocate_entry(entry.path, destination);
            if (moved.is_error()) {
                return fm::Err<MergeReport>(moved.error());
            }
            ++report.relocated;
            spdlog::debug("Moved {} {}", to_string(entry.kind), entry.relative_path);
            events::emit_if(bus_, events::EntryRelocatedEvent{entry.relative_path, entry.kind, destination});
            continue;
        }

        const Entry& counterpart = *found->second;
        if (entry.is_directory() && counterpart.is_directory()) {
            continue;
        }

        if (entry.is_file() && counterpart.is_file()) {
            auto same = comparator.same_content(entry.path, counterpart.path);
            if (same.is_error()) {
                return fm::Err<MergeReport>(same.error());
            }
            if (same.value()) {
                auto removed = remove_file(entry.path);
                if (removed.is_error()) {
                    return fm::Err<MergeReport>(removed.error());
                }
                ++report.deduplicated;
                spdlog::debug("Removed duplicate {}", entry.relative_path);
                events::emit_if(bus_, events::DuplicateRemovedEvent{entry.relative_path, entry.path});
                continue;
            }
        } else if (entry.is_directory()) {
            // Directory over a target file: keep the whole subtree where it is
            i = last_descendant(entries, i);
        }

        Conflict conflict{counterpart, entry};
        spdlog::debug("Conflict at {}{}", entry.relative_path, conflict.kind_mismatch() ? " (kind mismatch)" : "");
        events::emit_if(bus_, events::MergeConflictDetectedEvent{conflict});
        report.conflicts.push_back(std::move(conflict));
    }

    EmptyDirectoryPruner pruner(options_.prune_policy, [this](const fs::path& path) {
        events::emit_if(bus_, events::DirectoryPrunedEvent{path});
    });
    auto pruned = pruner.prune(roots.to_merge);
    if (pruned.is_error()) {
        return fm::Err<MergeReport>(pruned.error());
    }
    report.pruned_directories = pruner.removed_count();
    report.prune_failures = pruner.failure_count();
    report.to_merge_root_removed = pruned.value();

    const auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started_at);
    spdlog::info("Merge finished: {} moved, {} duplicates removed, {} conflicts, {} directories pruned",
                 report.relocated, report.deduplicated, report.conflicts.size(), report.pruned_directories);
    events::emit_if(bus_, events::MergeCompletedEvent{report.relocated,
                                                      report.deduplicated,
                                                      report.conflicts.size(),
                                                      report.pruned_directories,
                                                      duration});
    return fm::Ok(std::move(report));
}

fm::Result<std::vector<Conflict>> merge_folders(const fs::path& target,
                                                const fs::path& to_merge,
                                                const MergeOptions& options) {
    MergeEngine engine(options);
    auto result = engine.merge(target, to_merge);
    if (result.is_error()) {
        return fm::Err<std::vector<Conflict>>(result.error());
    }
    return fm::Ok(std::move(result.value().conflicts));
}

std::future<fm::Result<std::vector<Conflict>>> merge_folders_async(fs::path target,
                                                                   fs::path to_merge,
                                                                   MergeOptions options) {
    return std::async(std::launch::async,
                      [target = std::move(target), to_merge = std::move(to_merge), options] {
                          return merge_folders(target, to_merge, options);
                      });
}

} // namespace fm::merge
