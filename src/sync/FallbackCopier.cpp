#include "sync/FallbackCopier.hpp"
#include "types/SyncError.hpp"
#include "util/files.hpp"

#include <fmt/core.h>
#include <ranges>
#include <system_error>
#include <utility>
#include <vector>

using namespace ds::sync;
using namespace ds::types;
namespace fs = std::filesystem;

// symlink_status() reports a missing path through ec as well; absence is not an error here
static fs::file_status targetStatus(const fs::path& p, std::error_code& ec) {
    const auto st = fs::symlink_status(p, ec);
    if (st.type() == fs::file_type::not_found) ec.clear();
    return st;
}

FallbackCopier::FallbackCopier(fs::path source, fs::path destination)
    : source_(std::move(source)), destination_(std::move(destination)) {}

size_t FallbackCopier::copy(const EntryHandler& onEntry) const {
    std::error_code ec;
    fs::path current = source_;
    size_t files = 0;

    // Directory modes are applied after the walk so read-only sources can still be filled
    std::vector<std::pair<fs::path, fs::perms>> dirModes;

    try {
        for (auto it = fs::recursive_directory_iterator(source_, ec);
             !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            const auto& entry = *it;
            current = entry.path();

            const auto rel = entry.path().lexically_relative(source_);
            const auto target = destination_ / rel;

            const auto st = entry.symlink_status(ec);
            if (ec) break;

            if (fs::is_directory(st)) {
                onEntry("Creating directory: " + rel.string());
                const auto existing = targetStatus(target, ec);
                if (ec) break;
                if (!fs::is_directory(existing)) {
                    fs::create_directory(target, ec);
                    if (ec) break;
                    fs::permissions(target, st.permissions() | fs::perms::owner_all, fs::perm_options::replace, ec);
                    if (ec) break;
                }
                dirModes.emplace_back(target, st.permissions());
            } else if (fs::is_regular_file(st)) {
                onEntry("Copying file: " + rel.string());
                copyFile(entry.path(), target, st.permissions());
                ++files;
            } else if (fs::is_symlink(st)) {
                onEntry("Copying symlink: " + rel.string());
                copySymlink(entry.path(), target);
            } else {
                onEntry("Skipping special file: " + rel.string());
            }
        }

        if (ec)
            throw SyncException(SyncError::ExecutionFailed,
                                fmt::format("Error accessing path {}: {}", current.string(), ec.message()));
    } catch (const SyncException&) {
        // directories created before the failure still get their source modes
        for (const auto& [dir, mode] : std::views::reverse(dirModes)) {
            std::error_code ignored;
            fs::permissions(dir, mode, fs::perm_options::replace, ignored);
        }
        throw;
    }

    for (const auto& [dir, mode] : std::views::reverse(dirModes)) {
        fs::permissions(dir, mode, fs::perm_options::replace, ec);
        if (ec)
            throw SyncException(SyncError::ExecutionFailed,
                                fmt::format("Failed to set permissions on {}: {}", dir.string(), ec.message()));
    }

    return files;
}

void FallbackCopier::copyFile(const fs::path& from, const fs::path& to, const fs::perms perms) {
    // copy next to the target, then rename over it, so a read-only target is replaceable
    const auto tmp = to.parent_path() / ("." + to.filename().string() + ".dirsync-" + util::generate_random_suffix());

    std::error_code ec;
    fs::copy_file(from, tmp, fs::copy_options::overwrite_existing, ec);
    if (!ec) fs::permissions(tmp, perms, fs::perm_options::replace, ec);
    if (!ec) fs::rename(tmp, to, ec);

    if (ec) {
        std::error_code ignored;
        fs::remove(tmp, ignored);
        throw SyncException(SyncError::ExecutionFailed,
                            fmt::format("Failed to copy {} to {}: {}", from.string(), to.string(), ec.message()));
    }
}

void FallbackCopier::copySymlink(const fs::path& from, const fs::path& to) {
    std::error_code ec;
    if (const auto existing = targetStatus(to, ec); !ec && fs::is_symlink(existing)) fs::remove(to, ec);
    if (!ec) fs::copy_symlink(from, to, ec);

    if (ec)
        throw SyncException(SyncError::ExecutionFailed,
                            fmt::format("Failed to copy symlink {} to {}: {}", from.string(), to.string(), ec.message()));
}
