#include "fm/merge/tree_walker.hpp"

#include <spdlog/spdlog.h>

#include <system_error>

namespace fm::merge {
namespace fs = std::filesystem;

namespace {

fm::Result<fs::path> resolve_root(const fs::path& root) {
    std::error_code ec;
    const auto status = fs::status(root, ec);
    if (status.type() == fs::file_type::not_found) {
        return fm::Err<fs::path>(ErrorCode::NotFound, "Root does not exist", root);
    }
    if (ec) {
        return fm::Err<fs::path>(ErrorCode::IOError, "Failed to stat root: " + ec.message(), root);
    }
    if (!fs::is_directory(status)) {
        return fm::Err<fs::path>(ErrorCode::IOError, "Root is not a directory", root);
    }

    auto canonical = fs::canonical(root, ec);
    if (ec) {
        return fm::Err<fs::path>(ErrorCode::IOError, "Failed to resolve root: " + ec.message(), root);
    }
    return fm::Ok(canonical);
}

} // namespace

fm::Result<std::vector<Entry>> walk_tree(const fs::path& root) {
    auto resolved = resolve_root(root);
    if (resolved.is_error()) {
        return fm::Err<std::vector<Entry>>(resolved.error());
    }
    const fs::path& base = resolved.value();

    std::vector<Entry> entries;
    std::error_code ec;
    fs::recursive_directory_iterator it(base, fs::directory_options::none, ec);
    if (ec) {
        return fm::Err<std::vector<Entry>>(ErrorCode::IOError, "Failed to list directory: " + ec.message(), base);
    }

    const fs::recursive_directory_iterator end;
    while (it != end) {
        const auto& current = *it;

        const auto link_status = current.symlink_status(ec);
        if (ec) {
            return fm::Err<std::vector<Entry>>(ErrorCode::IOError, "Failed to stat entry: " + ec.message(), current.path());
        }

        Entry entry;
        entry.path = current.path();
        entry.relative_path = current.path().lexically_relative(base).generic_string();
        entry.kind = fs::is_directory(link_status) ? EntryKind::Directory : EntryKind::File;
        entries.push_back(std::move(entry));

        it.increment(ec);
        if (ec) {
            return fm::Err<std::vector<Entry>>(ErrorCode::IOError, "Failed to list directory: " + ec.message(), base);
        }
    }

    spdlog::debug("Walked {}: {} entries", base.string(), entries.size());
    return fm::Ok(std::move(entries));
}

} // namespace fm::merge
