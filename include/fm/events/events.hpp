/**
 * @file events.hpp
 * @brief Events emitted by a merge run
 *
 * NAMING CONVENTION:
 * - Events are past-tense: EntryRelocatedEvent, DirectoryPrunedEvent
 *
 * ORDER WITHIN ONE RUN:
 * MergeStartedEvent, then per-entry events in to-merge visit order,
 * then DirectoryPrunedEvent (post-order), then exactly one of
 * MergeCompletedEvent / MergeFailedEvent.
 */

#pragma once

#include "fm/core/result.hpp"
#include "fm/merge/types.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace fm::events {

/**
 * @brief Roots validated, walks about to start
 *
 * WHO SUBSCRIBES: Logger
 */
struct MergeStartedEvent {
    std::filesystem::path target_root;
    std::filesystem::path to_merge_root;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A to-merge entry had no target counterpart and was moved over
 *
 * For directories the whole subtree moved with it.
 *
 * WHO SUBSCRIBES: Logger, Metrics
 */
struct EntryRelocatedEvent {
    std::string relative_path;
    merge::EntryKind kind = merge::EntryKind::File;
    std::filesystem::path destination;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief A to-merge file matched its target counterpart and was removed
 */
struct DuplicateRemovedEvent {
    std::string relative_path;
    std::filesystem::path removed_path;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct MergeConflictDetectedEvent {
    merge::Conflict conflict;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct DirectoryPrunedEvent {
    std::filesystem::path path;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

struct MergeCompletedEvent {
    std::size_t relocated = 0;
    std::size_t deduplicated = 0;
    std::size_t conflicts = 0;
    std::size_t pruned_directories = 0;
    std::chrono::milliseconds duration{0};
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief The run stopped on an error; earlier moves are not rolled back
 */
struct MergeFailedEvent {
    Error error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

} // namespace fm::events
