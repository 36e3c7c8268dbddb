#include "fm/merge/digest.hpp"

#include "fm/core/task.hpp"

#include <openssl/evp.h>

#include <fstream>
#include <future>
#include <iomanip>
#include <memory>
#include <sstream>
#include <vector>

namespace fm::merge {
namespace fs = std::filesystem;

namespace {

using DigestContext = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

fm::Result<Digest> digest_failure(const fs::path& path, const char* step) {
    return fm::Err<Digest>(ErrorCode::IOError, std::string("SHA-256 ") + step + " failed", path);
}

} // namespace

fm::Result<Digest> compute_digest(const fs::path& path, std::size_t buffer_size) {
    if (buffer_size == 0) {
        return fm::Err<Digest>(ErrorCode::InvalidArgument, "buffer_size must be > 0", path);
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return fm::Err<Digest>(ErrorCode::IOError, "Failed to open file for hashing", path);
    }

    DigestContext context(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!context) {
        return digest_failure(path, "context allocation");
    }
    if (EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr) != 1) {
        return digest_failure(path, "init");
    }

    std::vector<char> buffer(buffer_size);
    while (input.read(buffer.data(), static_cast<std::streamsize>(buffer.size())) || input.gcount() > 0) {
        const auto count = static_cast<std::size_t>(input.gcount());
        if (EVP_DigestUpdate(context.get(), buffer.data(), count) != 1) {
            return digest_failure(path, "update");
        }
    }
    if (input.bad()) {
        return fm::Err<Digest>(ErrorCode::IOError, "Failed to read file for hashing", path);
    }

    Digest digest{};
    unsigned int length = 0;
    if (EVP_DigestFinal_ex(context.get(), digest.data(), &length) != 1 || length != digest.size()) {
        return digest_failure(path, "final");
    }
    return fm::Ok(digest);
}

std::string to_hex(const Digest& digest) {
    std::ostringstream oss;
    for (auto byte : digest) {
        oss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
    }
    return oss.str();
}

ContentComparator::ContentComparator(std::size_t buffer_size, boost::asio::thread_pool* pool)
    : buffer_size_(buffer_size), pool_(pool) {}

fm::Result<bool> ContentComparator::same_content(const fs::path& lhs, const fs::path& rhs) const {
    std::future<fm::Result<Digest>> pending;
    if (pool_ != nullptr) {
        pending = fm::post_task(*pool_, [lhs, size = buffer_size_] { return compute_digest(lhs, size); });
    }

    auto rhs_digest = compute_digest(rhs, buffer_size_);
    auto lhs_digest = pool_ != nullptr ? pending.get() : compute_digest(lhs, buffer_size_);

    if (lhs_digest.is_error()) {
        return fm::Err<bool>(lhs_digest.error());
    }
    if (rhs_digest.is_error()) {
        return fm::Err<bool>(rhs_digest.error());
    }
    return fm::Ok(lhs_digest.value() == rhs_digest.value());
}

} // namespace fm::merge
