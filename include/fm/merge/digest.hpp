/**
 * @file digest.hpp
 * @brief SHA-256 content fingerprints and byte-equality checks between files
 */

#pragma once

#include "fm/core/result.hpp"
#include "fm/merge/types.hpp"

#include <boost/asio/thread_pool.hpp>

#include <array>
#include <cstdint>
#include <filesystem>
#include <string>

namespace fm::merge {

using Digest = std::array<std::uint8_t, 32>;

/**
 * @brief SHA-256 of a file's content, read in chunks of buffer_size bytes
 */
fm::Result<Digest> compute_digest(const std::filesystem::path& path,
                                  std::size_t buffer_size = MergeOptions::kDefaultReadBufferSize);

std::string to_hex(const Digest& digest);

/**
 * @brief Decides whether two files hold the same bytes by comparing digests
 *
 * When a pool is supplied the first digest is computed on it while the
 * second runs on the calling thread. Without a pool both run sequentially.
 */
class ContentComparator {
public:
    explicit ContentComparator(std::size_t buffer_size = MergeOptions::kDefaultReadBufferSize,
                               boost::asio::thread_pool* pool = nullptr);

    [[nodiscard]] fm::Result<bool> same_content(const std::filesystem::path& lhs,
                                                const std::filesystem::path& rhs) const;

    [[nodiscard]] std::size_t buffer_size() const noexcept { return buffer_size_; }

private:
    std::size_t buffer_size_;
    boost::asio::thread_pool* pool_;
};

} // namespace fm::merge
