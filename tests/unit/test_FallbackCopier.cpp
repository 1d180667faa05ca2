#include <gtest/gtest.h>
#include "sync/FallbackCopier.hpp"
#include "types/SyncError.hpp"
#include "util/files.hpp"
#include "TempDir.hpp"

#include <algorithm>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace ds::sync;
using namespace ds::types;
using namespace ds::util;
using ds::test::TempDir;

class FallbackCopierTest : public ::testing::Test {
protected:
    TempDir tmp;
    fs::path src, dst;
    std::vector<std::string> lines;

    void SetUp() override {
        src = tmp / "src";
        dst = tmp / "dst";
        fs::create_directories(src);
        fs::create_directories(dst);
    }

    size_t copy() {
        return FallbackCopier(src, dst).copy([this](const std::string& line) { lines.push_back(line); });
    }

    bool sawLine(const std::string& line) const { return std::ranges::find(lines, line) != lines.end(); }
};

TEST_F(FallbackCopierTest, CopiesNestedTreeByteForByte) {
    tmp.write("src/a.txt", "alpha");
    tmp.write("src/sub/b.txt", std::string("bin\0ary", 7));
    tmp.write("src/sub/deeper/c.txt", "");

    EXPECT_EQ(copy(), 3u);

    EXPECT_EQ(readFileToString(dst / "a.txt"), "alpha");
    EXPECT_EQ(readFileToString(dst / "sub/b.txt"), std::string("bin\0ary", 7));
    EXPECT_TRUE(fs::is_regular_file(dst / "sub/deeper/c.txt"));

    EXPECT_TRUE(sawLine("Creating directory: sub"));
    EXPECT_TRUE(sawLine("Copying file: sub/deeper/c.txt"));
}

TEST_F(FallbackCopierTest, NeverDeletesDestinationOnlyEntries) {
    tmp.write("src/a.txt", "new");
    tmp.write("dst/a.txt", "old");
    tmp.write("dst/extra.txt", "keep me");
    fs::create_directories(dst / "extra-dir");

    copy();

    EXPECT_EQ(readFileToString(dst / "a.txt"), "new");
    EXPECT_EQ(readFileToString(dst / "extra.txt"), "keep me");
    EXPECT_TRUE(fs::is_directory(dst / "extra-dir"));
}

TEST_F(FallbackCopierTest, PreservesPermissionBits) {
    const auto file = tmp.write("src/script.sh", "#!/bin/sh\n");
    fs::permissions(file, fs::perms::owner_read | fs::perms::owner_exec | fs::perms::group_read,
                    fs::perm_options::replace);
    fs::create_directories(src / "locked");
    tmp.write("src/locked/inner.txt", "x");
    fs::permissions(src / "locked", fs::perms::owner_read | fs::perms::owner_exec, fs::perm_options::replace);

    copy();

    EXPECT_EQ(fs::status(dst / "script.sh").permissions(),
              fs::perms::owner_read | fs::perms::owner_exec | fs::perms::group_read);
    EXPECT_EQ(fs::status(dst / "locked").permissions(), fs::perms::owner_read | fs::perms::owner_exec);
    EXPECT_EQ(readFileToString(dst / "locked/inner.txt"), "x");
}

TEST_F(FallbackCopierTest, AbortedWalkStillAppliesDirectoryModes) {
    fs::create_directories(src / "locked/sub");
    fs::permissions(src / "locked", fs::perms::owner_read | fs::perms::owner_exec, fs::perm_options::replace);
    // a file where the source has a directory makes the walk fail inside "locked"
    tmp.write("dst/locked/sub", "in the way");

    EXPECT_THROW(copy(), SyncException);

    EXPECT_EQ(fs::status(dst / "locked").permissions(), fs::perms::owner_read | fs::perms::owner_exec);
    EXPECT_EQ(readFileToString(dst / "locked/sub"), "in the way");
}

TEST_F(FallbackCopierTest, OverwritesReadOnlyDestinationFile) {
    tmp.write("src/a.txt", "fresh");
    const auto existing = tmp.write("dst/a.txt", "stale");
    fs::permissions(existing, fs::perms::owner_read, fs::perm_options::replace);

    copy();

    EXPECT_EQ(readFileToString(dst / "a.txt"), "fresh");
}

TEST_F(FallbackCopierTest, CopiesSymlinksAsLinks) {
    tmp.write("src/target.txt", "t");
    fs::create_symlink("target.txt", src / "link");

    EXPECT_EQ(copy(), 1u);

    ASSERT_TRUE(fs::is_symlink(fs::symlink_status(dst / "link")));
    EXPECT_EQ(fs::read_symlink(dst / "link"), "target.txt");
    EXPECT_TRUE(sawLine("Copying symlink: link"));
}

TEST_F(FallbackCopierTest, MissingSourceThrowsExecutionFailed) {
    fs::remove_all(src);
    try {
        copy();
        FAIL() << "expected SyncException";
    } catch (const SyncException& e) {
        EXPECT_EQ(e.code(), SyncError::ExecutionFailed);
        EXPECT_NE(std::string(e.what()).find("Error accessing path"), std::string::npos);
    }
}

TEST_F(FallbackCopierTest, LeavesNoTemporaryFilesBehind) {
    tmp.write("src/a.txt", "a");
    tmp.write("src/b.txt", "b");

    copy();

    size_t entries = 0;
    for (const auto& e : fs::directory_iterator(dst)) {
        EXPECT_NE(e.path().filename().string().front(), '.');
        ++entries;
    }
    EXPECT_EQ(entries, 2u);
}
