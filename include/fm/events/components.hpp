/**
 * @file components.hpp
 * @brief Ready-made subscribers for merge events
 *
 * EXAMPLE:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MetricsComponent metrics(bus);
 * MergeEngine engine(MergeOptions{}, &bus);
 * engine.merge(target, to_merge);
 * metrics.print_stats();
 */

#pragma once

#include "fm/events/event_bus.hpp"
#include "fm/events/events.hpp"

#include <spdlog/spdlog.h>

#include <atomic>
#include <cstdint>

namespace fm::events {

/**
 * @brief Logs every merge event through spdlog
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<MergeStartedEvent>([this](const MergeStartedEvent& e) {
            on_merge_started(e);
        });

        bus_.subscribe<EntryRelocatedEvent>([this](const EntryRelocatedEvent& e) {
            on_entry_relocated(e);
        });

        bus_.subscribe<DuplicateRemovedEvent>([this](const DuplicateRemovedEvent& e) {
            on_duplicate_removed(e);
        });

        bus_.subscribe<MergeConflictDetectedEvent>([this](const MergeConflictDetectedEvent& e) {
            on_conflict_detected(e);
        });

        bus_.subscribe<DirectoryPrunedEvent>([this](const DirectoryPrunedEvent& e) {
            on_directory_pruned(e);
        });

        bus_.subscribe<MergeCompletedEvent>([this](const MergeCompletedEvent& e) {
            on_merge_completed(e);
        });

        bus_.subscribe<MergeFailedEvent>([this](const MergeFailedEvent& e) {
            on_merge_failed(e);
        });
    }

private:
    void on_merge_started(const MergeStartedEvent& e) {
        spdlog::info("[MergeStarted] target={} to_merge={}",
                     e.target_root.string(), e.to_merge_root.string());
    }

    void on_entry_relocated(const EntryRelocatedEvent& e) {
        spdlog::info("[EntryRelocated] path={} kind={} destination={}",
                     e.relative_path, merge::to_string(e.kind), e.destination.string());
    }

    void on_duplicate_removed(const DuplicateRemovedEvent& e) {
        spdlog::info("[DuplicateRemoved] path={}", e.relative_path);
    }

    void on_conflict_detected(const MergeConflictDetectedEvent& e) {
        spdlog::warn("[ConflictDetected] path={} target_kind={} to_merge_kind={}",
                     e.conflict.relative_path(),
                     merge::to_string(e.conflict.target.kind),
                     merge::to_string(e.conflict.to_merge.kind));
    }

    void on_directory_pruned(const DirectoryPrunedEvent& e) {
        spdlog::debug("[DirectoryPruned] path={}", e.path.string());
    }

    void on_merge_completed(const MergeCompletedEvent& e) {
        spdlog::info("[MergeCompleted] relocated={} deduplicated={} conflicts={} pruned={} duration={}ms",
                     e.relocated, e.deduplicated, e.conflicts, e.pruned_directories, e.duration.count());
    }

    void on_merge_failed(const MergeFailedEvent& e) {
        spdlog::error("[MergeFailed] {}", e.error.describe());
    }

    EventBus& bus_;
};

/**
 * @brief Counts merge outcomes across one or more runs
 */
class MetricsComponent {
public:
    struct Stats {
        std::atomic<uint64_t> entries_relocated{0};
        std::atomic<uint64_t> directories_relocated{0};
        std::atomic<uint64_t> duplicates_removed{0};
        std::atomic<uint64_t> conflicts_detected{0};
        std::atomic<uint64_t> kind_mismatches{0};
        std::atomic<uint64_t> directories_pruned{0};
        std::atomic<uint64_t> merges_completed{0};
        std::atomic<uint64_t> merges_failed{0};
    };

    explicit MetricsComponent(EventBus& bus) : bus_(bus) {
        bus_.subscribe<EntryRelocatedEvent>([this](const EntryRelocatedEvent& e) {
            stats_.entries_relocated++;
            if (e.kind == merge::EntryKind::Directory) {
                stats_.directories_relocated++;
            }
        });

        bus_.subscribe<DuplicateRemovedEvent>([this](const DuplicateRemovedEvent&) {
            stats_.duplicates_removed++;
        });

        bus_.subscribe<MergeConflictDetectedEvent>([this](const MergeConflictDetectedEvent& e) {
            stats_.conflicts_detected++;
            if (e.conflict.kind_mismatch()) {
                stats_.kind_mismatches++;
            }
        });

        bus_.subscribe<DirectoryPrunedEvent>([this](const DirectoryPrunedEvent&) {
            stats_.directories_pruned++;
        });

        bus_.subscribe<MergeCompletedEvent>([this](const MergeCompletedEvent&) {
            stats_.merges_completed++;
        });

        bus_.subscribe<MergeFailedEvent>([this](const MergeFailedEvent&) {
            stats_.merges_failed++;
        });
    }

    const Stats& get_stats() const {
        return stats_;
    }

    void print_stats() const {
        spdlog::info("═══════════════════════════════════════");
        spdlog::info("Merge Statistics:");
        spdlog::info("  Entries moved:     {}", stats_.entries_relocated.load());
        spdlog::info("  Dirs moved:        {}", stats_.directories_relocated.load());
        spdlog::info("  Duplicates:        {}", stats_.duplicates_removed.load());
        spdlog::info("  Conflicts:         {}", stats_.conflicts_detected.load());
        spdlog::info("  Kind mismatches:   {}", stats_.kind_mismatches.load());
        spdlog::info("  Dirs pruned:       {}", stats_.directories_pruned.load());
        spdlog::info("  Merges completed:  {}", stats_.merges_completed.load());
        spdlog::info("  Merges failed:     {}", stats_.merges_failed.load());
        spdlog::info("═══════════════════════════════════════");
    }

private:
    EventBus& bus_;
    Stats stats_;
};

} // namespace fm::events
