#include <gtest/gtest.h>
#include "sync/Filter.hpp"
#include "config/Config.hpp"

using namespace ts::sync;

namespace {

Filter makeFilter(std::vector<std::string> folders, std::vector<std::string> exts, const bool hidden = false) {
    return Filter({.excludedFolders = std::move(folders), .excludedExtensions = std::move(exts), .includeHidden = hidden});
}

}

TEST(FilterTest, FolderPrefixMatchesSegmentWise) {
    const auto f = makeFilter({"drafts", "/archive/old/"}, {});

    EXPECT_TRUE(f.shouldExclude("drafts"));
    EXPECT_TRUE(f.shouldExclude("drafts/idea.md"));
    EXPECT_TRUE(f.shouldExclude("archive/old/2019.md"));

    EXPECT_FALSE(f.shouldExclude("drafts-final/idea.md"));
    EXPECT_FALSE(f.shouldExclude("my/drafts/idea.md"));
    EXPECT_FALSE(f.shouldExclude("archive/older.md"));
}

TEST(FilterTest, ExtensionsMatchCaseInsensitivelyWithOrWithoutDot) {
    const auto f = makeFilter({}, {"tmp", ".LOG"});

    EXPECT_TRUE(f.shouldExclude("scratch.tmp"));
    EXPECT_TRUE(f.shouldExclude("a/b/SCRATCH.TMP"));
    EXPECT_TRUE(f.shouldExclude("server.log"));
    EXPECT_FALSE(f.shouldExclude("server.logs"));
    EXPECT_FALSE(f.shouldExclude("tmp/notes.md"));
}

TEST(FilterTest, HiddenSegmentsExcludedUnlessEnabled) {
    const auto strict = makeFilter({}, {});
    EXPECT_TRUE(strict.shouldExclude(".env"));
    EXPECT_TRUE(strict.shouldExclude("notes/.cache/x.md"));
    EXPECT_FALSE(strict.shouldExclude("./notes/x.md"));

    const auto relaxed = makeFilter({}, {}, true);
    EXPECT_FALSE(relaxed.shouldExclude(".env"));
    EXPECT_FALSE(relaxed.shouldExclude("notes/.cache/x.md"));
}

TEST(FilterTest, DefaultConfigExcludesToolingFolders) {
    const ts::config::SyncConfig cfg;
    const auto f = Filter::fromConfig(cfg);

    EXPECT_TRUE(f.shouldExclude(".obsidian/workspace.json"));
    EXPECT_TRUE(f.shouldExclude(".git/HEAD"));
    EXPECT_FALSE(f.shouldExclude("notes/today.md"));
}

TEST(FilterTest, HiddenFoldersStillExcludedByPrefixWhenHiddenAllowed) {
    const auto f = makeFilter({".obsidian"}, {}, true);
    EXPECT_TRUE(f.shouldExclude(".obsidian/plugins/x.js"));
    EXPECT_FALSE(f.shouldExclude(".github/workflows/ci.yml"));
}

TEST(FilterTest, RootIsNeverExcluded) {
    const auto f = makeFilter({"a"}, {"md"});
    EXPECT_FALSE(f.shouldExclude(""));
}
