#include <gtest/gtest.h>
#include "util/files.hpp"
#include "TempDir.hpp"

#include <cstdlib>
#include <filesystem>

namespace fs = std::filesystem;
using namespace ds::util;
using ds::test::TempDir;

TEST(FilesTest, FindsShellOnPath) {
    const auto sh = findExecutable("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_EQ(sh->filename(), "sh");
}

TEST(FilesTest, MissingExecutableIsNullopt) {
    EXPECT_FALSE(findExecutable("dirsync-definitely-not-installed").has_value());
    EXPECT_FALSE(findExecutable("").has_value());
}

TEST(FilesTest, SlashNamesAreCheckedDirectly) {
    EXPECT_TRUE(findExecutable("/bin/sh").has_value());
    EXPECT_FALSE(findExecutable("/nonexistent/bin/sh").has_value());
}

TEST(FilesTest, NonExecutableFileIsSkipped) {
    const TempDir tmp;
    const auto script = tmp.write("tool", "#!/bin/sh\n");
    fs::permissions(script, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace);
    EXPECT_FALSE(findExecutable(script.string()).has_value());

    fs::permissions(script, fs::perms::owner_exec, fs::perm_options::add);
    EXPECT_TRUE(findExecutable(script.string()).has_value());
}

TEST(FilesTest, IsWithinRejectsEscapes) {
    const TempDir tmp;
    EXPECT_TRUE(isWithin(tmp.path(), tmp / "a/b.txt"));
    EXPECT_TRUE(isWithin(tmp.path(), tmp / "a/../b.txt"));
    EXPECT_FALSE(isWithin(tmp.path(), tmp / "../elsewhere"));
    EXPECT_FALSE(isWithin(tmp / "a", tmp / "ab/file"));
}

TEST(FilesTest, RandomSuffixHasRequestedLength) {
    EXPECT_EQ(generate_random_suffix().size(), 8u);
    EXPECT_EQ(generate_random_suffix(16).size(), 16u);
    EXPECT_NE(generate_random_suffix(16), generate_random_suffix(16));
}
