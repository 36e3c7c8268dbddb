/**
 * @file relocate.hpp
 * @brief Moving and deleting entries of the to-merge tree
 */

#pragma once

#include "fm/core/result.hpp"

#include <filesystem>

namespace fm::merge {

/**
 * @brief Move a file or a whole directory to destination
 *
 * Uses a single rename. When source and destination live on different
 * devices the move falls back to a recursive copy followed by removal of
 * the source; a failed copy leaves the source intact and removes the
 * partial destination. An existing destination is never overwritten.
 */
fm::Result<void> relocate_entry(const std::filesystem::path& source,
                                const std::filesystem::path& destination);

fm::Result<void> remove_file(const std::filesystem::path& path);

} // namespace fm::merge
