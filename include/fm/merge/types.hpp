/**
 * @file types.hpp
 * @brief Value types shared by the merge components
 *
 * Entry / Conflict describe what a walk found, MergeOptions tunes a run and
 * MergeReport summarizes it.
 */

#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace fm::merge {

enum class EntryKind {
    File,
    Directory
};

inline const char* to_string(EntryKind kind) {
    return kind == EntryKind::Directory ? "directory" : "file";
}

/**
 * @brief A filesystem object discovered while walking a tree
 */
struct Entry {
    std::string relative_path;  ///< Path relative to the walked root (POSIX style)
    EntryKind kind = EntryKind::File;
    std::filesystem::path path; ///< Absolute path used for I/O

    bool is_directory() const noexcept { return kind == EntryKind::Directory; }
    bool is_file() const noexcept { return kind == EntryKind::File; }
};

/**
 * @brief Same relative path present in both trees that could not be merged
 *
 * Either the two files differ in content, or one side is a file and the
 * other a directory. Both sides are left untouched on disk.
 */
struct Conflict {
    Entry target;   ///< Entry in the target tree
    Entry to_merge; ///< Counterpart left behind in the to-merge tree

    const std::string& relative_path() const noexcept { return target.relative_path; }
    bool kind_mismatch() const noexcept { return target.kind != to_merge.kind; }
};

enum class PruneErrorPolicy {
    FailFast,   ///< Abort on the first stat/list/remove failure
    BestEffort  ///< Log, keep the failed branch, continue with siblings
};

struct MergeOptions {
    static constexpr std::size_t kDefaultReadBufferSize = 64 * 1024;

    std::size_t worker_threads = 2;
    bool concurrent_walks = true;
    bool concurrent_digests = true;
    std::size_t read_buffer_size = kDefaultReadBufferSize;
    PruneErrorPolicy prune_policy = PruneErrorPolicy::FailFast;
};

/**
 * @brief Outcome of a completed merge run
 */
struct MergeReport {
    std::vector<Conflict> conflicts;     ///< In to-merge visit order
    std::size_t relocated = 0;           ///< Files or whole directories moved into target
    std::size_t deduplicated = 0;        ///< Identical files removed from to-merge
    std::size_t pruned_directories = 0;
    std::size_t prune_failures = 0;      ///< Only non-zero with PruneErrorPolicy::BestEffort
    bool to_merge_root_removed = false;
};

} // namespace fm::merge
