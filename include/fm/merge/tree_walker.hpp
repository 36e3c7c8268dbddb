/**
 * @file tree_walker.hpp
 * @brief Flat pre-order listing of a directory tree
 */

#pragma once

#include "fm/core/result.hpp"
#include "fm/merge/types.hpp"

#include <filesystem>
#include <vector>

namespace fm::merge {

/**
 * @brief Lists every entry below root in pre-order
 *
 * A directory always precedes its descendants and every descendant's
 * relative path starts with the directory's relative path followed by '/'.
 * Sibling order is unspecified. The root itself is resolved to its
 * canonical path and is not part of the output. Symbolic links are not
 * followed and are reported as files.
 */
fm::Result<std::vector<Entry>> walk_tree(const std::filesystem::path& root);

} // namespace fm::merge
