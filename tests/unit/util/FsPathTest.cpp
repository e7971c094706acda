#include <gtest/gtest.h>
#include "util/fsPath.hpp"

using namespace ts::util;

TEST(FsPathTest, NormalizeStripsSlashesAndDots) {
    EXPECT_EQ(normalizeRelPath("/notes//daily/./today.md/"), "notes/daily/today.md");
    EXPECT_EQ(normalizeRelPath(""), "");
    EXPECT_EQ(normalizeRelPath("./"), "");
}

TEST(FsPathTest, ParentAndLastSegment) {
    EXPECT_EQ(parentOf("a/b/c.md"), "a/b");
    EXPECT_EQ(parentOf("c.md"), "");
    EXPECT_EQ(lastSegment("a/b/c.md"), "c.md");
    EXPECT_EQ(joinRelPath("", "x"), "x");
    EXPECT_EQ(joinRelPath("a/b", "x"), "a/b/x");
}

TEST(FsPathTest, ExtensionIgnoresDotfilesAndLowercases) {
    EXPECT_EQ(extensionOf("docs/Report.PDF"), ".pdf");
    EXPECT_EQ(extensionOf("archive.tar.gz"), ".gz");
    EXPECT_EQ(extensionOf(".env"), "");
    EXPECT_EQ(extensionOf("Makefile"), "");
}

TEST(FsPathTest, DepthAndDescendants) {
    EXPECT_EQ(depthOf(""), 0u);
    EXPECT_EQ(depthOf("a"), 1u);
    EXPECT_EQ(depthOf("a/b/c"), 3u);

    EXPECT_TRUE(isSameOrDescendant("a/b", "a"));
    EXPECT_TRUE(isSameOrDescendant("a", "a"));
    EXPECT_FALSE(isSameOrDescendant("ab/c", "a"));
    EXPECT_TRUE(isSameOrDescendant("anything", ""));
}
