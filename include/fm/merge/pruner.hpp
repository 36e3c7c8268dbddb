/**
 * @file pruner.hpp
 * @brief Post-order removal of directories left without files
 */

#pragma once

#include "fm/core/result.hpp"
#include "fm/merge/types.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>

namespace fm::merge {

/**
 * @brief Removes directories that no longer contain any file below them
 *
 * Children are resolved before their parent, so a directory holding only
 * directories that turned out empty is removed as well. The directory
 * passed to prune() is itself removed when it ends up empty.
 *
 * ERRORS:
 * - FailFast: the first stat/list/remove failure is returned as is.
 * - BestEffort: the failure is logged and counted, the failed branch is
 *   kept (treated as non-empty) and sibling branches are still pruned.
 */
class EmptyDirectoryPruner {
public:
    using RemovedCallback = std::function<void(const std::filesystem::path&)>;

    explicit EmptyDirectoryPruner(PruneErrorPolicy policy = PruneErrorPolicy::FailFast,
                                  RemovedCallback on_removed = {});

    /**
     * @brief Prune below (and including) directory
     *
     * RETURNS:
     * true when directory was empty and has been removed
     */
    fm::Result<bool> prune(const std::filesystem::path& directory);

    [[nodiscard]] std::size_t removed_count() const noexcept { return removed_; }
    [[nodiscard]] std::size_t failure_count() const noexcept { return failures_; }

private:
    fm::Result<bool> prune_directory(const std::filesystem::path& directory);
    fm::Result<bool> on_failure(Error error);

    PruneErrorPolicy policy_;
    RemovedCallback on_removed_;
    std::size_t removed_ = 0;
    std::size_t failures_ = 0;
};

} // namespace fm::merge
