#pragma once

#include "util/files.hpp"

#include <chrono>
#include <filesystem>
#include <functional>
#include <string>
#include <thread>

namespace ds::test {

namespace fs = std::filesystem;

// Scratch directory removed on destruction, read-only subdirectories included
class TempDir {
public:
    TempDir() : path_(fs::temp_directory_path() / ("dirsync-test-" + util::generate_random_suffix(12))) {
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        for (auto it = fs::recursive_directory_iterator(path_, ec); !ec && it != fs::recursive_directory_iterator();
             it.increment(ec))
            if (it->is_directory(ec) && !it->is_symlink(ec))
                fs::permissions(it->path(), fs::perms::owner_all, fs::perm_options::add, ec);
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    [[nodiscard]] const fs::path& path() const { return path_; }
    [[nodiscard]] fs::path operator/(const fs::path& rel) const { return path_ / rel; }

    fs::path write(const fs::path& rel, const std::string& contents) const {
        const auto p = path_ / rel;
        fs::create_directories(p.parent_path());
        util::writeFile(p, contents);
        return p;
    }

private:
    fs::path path_;
};

inline bool waitFor(const std::function<bool()>& pred,
                    const std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

}
