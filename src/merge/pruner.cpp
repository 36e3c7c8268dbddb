#include "fm/merge/pruner.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace fm::merge {
namespace fs = std::filesystem;

EmptyDirectoryPruner::EmptyDirectoryPruner(PruneErrorPolicy policy, RemovedCallback on_removed)
    : policy_(policy), on_removed_(std::move(on_removed)) {}

fm::Result<bool> EmptyDirectoryPruner::prune(const fs::path& directory) {
    removed_ = 0;
    failures_ = 0;

    std::error_code ec;
    const auto status = fs::status(directory, ec);
    if (status.type() == fs::file_type::not_found) {
        return fm::Err<bool>(ErrorCode::NotFound, "Directory does not exist", directory);
    }
    if (ec) {
        return fm::Err<bool>(ErrorCode::IOError, "Failed to stat directory: " + ec.message(), directory);
    }
    if (!fs::is_directory(status)) {
        return fm::Err<bool>(ErrorCode::IOError, "Provided path is not a directory", directory);
    }

    return prune_directory(directory);
}

fm::Result<bool> EmptyDirectoryPruner::prune_directory(const fs::path& directory) {
    bool is_empty = true;

    std::error_code ec;
    fs::directory_iterator it(directory, ec);
    if (ec) {
        return on_failure(Error(ErrorCode::IOError, "Failed to list directory: " + ec.message(), directory));
    }

    const fs::directory_iterator end;
    while (it != end) {
        const fs::path child = it->path();
        const auto status = it->symlink_status(ec);
        if (ec) {
            // The unreadable child stays, its siblings are still visited
            auto failed = on_failure(Error(ErrorCode::IOError, "Failed to stat entry: " + ec.message(), child));
            if (failed.is_error()) {
                return failed;
            }
            is_empty = false;
        } else if (!fs::is_directory(status)) {
            is_empty = false;
        } else {
            auto child_result = prune_directory(child);
            if (child_result.is_error()) {
                return child_result;
            }
            if (!child_result.value()) {
                is_empty = false;
            }
        }

        it.increment(ec);
        if (ec) {
            auto failed = on_failure(Error(ErrorCode::IOError, "Failed to list directory: " + ec.message(), directory));
            if (failed.is_error()) {
                return failed;
            }
            // Listing cannot continue; what was not seen may hold files
            is_empty = false;
            break;
        }
    }

    if (!is_empty) {
        return fm::Ok(false);
    }

    fs::remove(directory, ec);
    if (ec) {
        return on_failure(Error(ErrorCode::IOError, "Failed to remove directory: " + ec.message(), directory));
    }

    ++removed_;
    spdlog::debug("Pruned empty directory {}", directory.string());
    if (on_removed_) {
        on_removed_(directory);
    }
    return fm::Ok(true);
}

fm::Result<bool> EmptyDirectoryPruner::on_failure(Error error) {
    if (policy_ == PruneErrorPolicy::FailFast) {
        return fm::Err<bool>(std::move(error));
    }

    ++failures_;
    spdlog::warn("Keeping {} after prune failure: {}", error.path.string(), error.describe());
    return fm::Ok(false);
}

} // namespace fm::merge
