/**
 * @file engine.hpp
 * @brief Merge of a to-merge tree into a target tree
 *
 * USAGE:
 * auto conflicts = merge_folders("/data/photos", "/mnt/usb/photos");
 * if (conflicts.is_ok()) {
 *     for (const auto& c : conflicts.value()) { ... }
 * }
 *
 * Or, to observe the run:
 * EventBus bus;
 * LoggerComponent logger(bus);
 * MergeEngine engine(MergeOptions{}, &bus);
 * auto report = engine.merge(target, to_merge);
 */

#pragma once

#include "fm/core/result.hpp"
#include "fm/events/event_bus.hpp"
#include "fm/merge/types.hpp"

#include <boost/asio/thread_pool.hpp>

#include <filesystem>
#include <future>
#include <memory>
#include <vector>

namespace fm::merge {

struct MergeRoots {
    std::filesystem::path target;
    std::filesystem::path to_merge;
};

/**
 * @brief Resolve both roots and reject same or nested directories
 *
 * Works on paths that do not exist yet; nothing is read besides what is
 * needed to resolve symbolic links in the existing part of each path.
 *
 * ERRORS:
 * - InvalidArgument "same path" when both resolve to one directory
 * - InvalidArgument "nested paths" when one is an ancestor of the other
 */
fm::Result<MergeRoots> validate_roots(const std::filesystem::path& target,
                                      const std::filesystem::path& to_merge);

/**
 * @brief Component-wise ancestor test; "/a/b" is not an ancestor of "/a/bc"
 */
bool is_ancestor(const std::filesystem::path& ancestor, const std::filesystem::path& descendant);

/**
 * @brief Moves the content of a to-merge tree into a target tree
 *
 * For every entry of the to-merge tree, in walk order:
 * - no counterpart in target: moved over (a directory moves with its subtree)
 * - both directories: nothing, their children are handled individually
 * - both files, same content: the to-merge copy is removed
 * - both files, different content: reported as a conflict, left in place
 * - file vs directory: reported as a conflict, both sides left in place
 *
 * Afterwards every directory of the to-merge tree that no longer contains a
 * file is removed, the root included.
 *
 * The trees must not be modified by anyone else during a run. A failed run
 * keeps whatever was already moved or removed.
 */
class MergeEngine {
public:
    explicit MergeEngine(MergeOptions options = {}, events::EventBus* bus = nullptr);
    ~MergeEngine();

    MergeEngine(const MergeEngine&) = delete;
    MergeEngine& operator=(const MergeEngine&) = delete;

    fm::Result<MergeReport> merge(const std::filesystem::path& target,
                                  const std::filesystem::path& to_merge);

    [[nodiscard]] const MergeOptions& options() const noexcept { return options_; }

private:
    fm::Result<MergeReport> run(const std::filesystem::path& target,
                                const std::filesystem::path& to_merge);

    MergeOptions options_;
    events::EventBus* bus_;
    std::unique_ptr<boost::asio::thread_pool> pool_;
};

/**
 * @brief Merge to_merge into target and return the conflicts in visit order
 */
fm::Result<std::vector<Conflict>> merge_folders(const std::filesystem::path& target,
                                                const std::filesystem::path& to_merge,
                                                const MergeOptions& options = {});

/**
 * @brief merge_folders() on a background thread
 */
std::future<fm::Result<std::vector<Conflict>>> merge_folders_async(std::filesystem::path target,
                                                                   std::filesystem::path to_merge,
                                                                   MergeOptions options = {});

} // namespace fm::merge
