#include "fm/merge/relocate.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace fm::merge {
namespace fs = std::filesystem;

namespace {

fm::Result<void> copy_then_remove(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    fs::copy(source, destination, fs::copy_options::recursive | fs::copy_options::copy_symlinks, ec);
    if (ec) {
        const auto copy_error = ec.message();
        fs::remove_all(destination, ec);
        if (ec) {
            spdlog::error("Failed to clean up partial copy {}: {}", destination.string(), ec.message());
        }
        return fm::Err<void>(ErrorCode::IOError, "Cross-device copy failed: " + copy_error, source);
    }

    fs::remove_all(source, ec);
    if (ec) {
        return fm::Err<void>(ErrorCode::IOError, "Failed to remove source after copy: " + ec.message(), source);
    }
    return fm::Ok();
}

} // namespace

fm::Result<void> relocate_entry(const fs::path& source, const fs::path& destination) {
    std::error_code ec;
    const auto existing = fs::symlink_status(destination, ec);
    if (fs::exists(existing)) {
        return fm::Err<void>(ErrorCode::IOError, "Destination already exists", destination);
    }

    fs::rename(source, destination, ec);
    if (!ec) {
        return fm::Ok();
    }
    if (ec == std::errc::cross_device_link) {
        spdlog::debug("Rename across devices, copying {} -> {}", source.string(), destination.string());
        return copy_then_remove(source, destination);
    }
    return fm::Err<void>(ErrorCode::IOError,
                         "Failed to move to " + destination.string() + ": " + ec.message(),
                         source);
}

fm::Result<void> remove_file(const fs::path& path) {
    std::error_code ec;
    if (!fs::remove(path, ec) || ec) {
        const auto reason = ec ? ec.message() : std::string("file not found");
        return fm::Err<void>(ErrorCode::IOError, "Failed to remove file: " + reason, path);
    }
    return fm::Ok();
}

} // namespace fm::merge
