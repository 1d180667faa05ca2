#pragma once

#include <filesystem>
#include <functional>
#include <string>

namespace ds::sync {

/**
 * In-process mirror of a source tree onto a destination tree, used when no
 * external mirroring tool is available.
 *
 * The walk is depth-first and synchronous. Directories are recreated and files
 * copied byte for byte, both carrying the source entry's permission bits.
 * Destination entries without a source counterpart are never touched.
 *
 * The first I/O error aborts the walk and is thrown as a SyncException with
 * SyncError::ExecutionFailed. Entries copied before the failure stay in place.
 */
class FallbackCopier {
public:
    using EntryHandler = std::function<void(const std::string& line)>;

    FallbackCopier(std::filesystem::path source, std::filesystem::path destination);

    // Returns the number of regular files copied
    size_t copy(const EntryHandler& onEntry) const;

private:
    std::filesystem::path source_;
    std::filesystem::path destination_;

    static void copyFile(const std::filesystem::path& from, const std::filesystem::path& to,
                         std::filesystem::perms perms);

    static void copySymlink(const std::filesystem::path& from, const std::filesystem::path& to);
};

}
