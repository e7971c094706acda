#include <gtest/gtest.h>
#include "sync/Indexer.hpp"
#include "sync/Filter.hpp"
#include "sync/model/errors.hpp"
#include "MemoryStores.hpp"

using namespace ts::sync;
using namespace ts::sync::model;
using namespace ts::test;

class IndexerTest : public ::testing::Test {
protected:
    Filter filter{Filter::Rules{.excludedFolders = {".obsidian", "private"}, .excludedExtensions = {"tmp"}}};
};

TEST_F(IndexerTest, LocalIndexCarriesStatsAndSkipsExcluded) {
    MemoryLocalStore local;
    local.putFile("notes/a.md", "hello", 100);
    local.putFile("notes/b.tmp", "junk", 100);
    local.putFile(".obsidian/workspace.json", "{}", 100);
    local.putFile("private/diary.md", "x", 100);

    const auto idx = Indexer::buildLocal(local, filter);

    ASSERT_EQ(idx.size(), 2u);
    ASSERT_TRUE(idx.contains("notes"));
    EXPECT_TRUE(idx.at("notes").isContainer);
    EXPECT_EQ(idx.at("notes/a.md").localStamp(), 100);
    EXPECT_EQ(idx.at("notes/a.md").size, 5u);
    EXPECT_EQ(idx.at("notes/a.md").name, "a.md");
}

TEST_F(IndexerTest, LocalEntriesBeneathExcludedContainerAreDropped) {
    MemoryLocalStore local;
    local.putFile("build.tmp/out.md", "x", 100);

    const auto idx = Indexer::buildLocal(local, filter);
    EXPECT_TRUE(idx.empty());
}

TEST_F(IndexerTest, EmptyTreesGiveEmptyIndices) {
    MemoryLocalStore local;
    MemoryRemoteStore remote;

    EXPECT_TRUE(Indexer::buildLocal(local, filter).empty());
    EXPECT_TRUE(Indexer::buildRemote(remote, remote.rootId(), filter, 100).empty());
}

TEST_F(IndexerTest, RemoteWalkJoinsPathsAndSkipsExcludedContainers) {
    MemoryRemoteStore remote;
    remote.putFile("notes/daily/today.md", "t", 700);
    remote.putFile("private/secret.md", "s", 700);
    remote.putFile("top.md", "x", 300);

    const auto idx = Indexer::buildRemote(remote, remote.rootId(), filter, 100);

    EXPECT_TRUE(idx.contains("notes"));
    EXPECT_TRUE(idx.contains("notes/daily"));
    ASSERT_TRUE(idx.contains("notes/daily/today.md"));
    EXPECT_EQ(idx.at("notes/daily/today.md").remoteStamp(), 700);
    EXPECT_TRUE(idx.at("notes/daily/today.md").remoteId.has_value());
    EXPECT_TRUE(idx.contains("top.md"));
    EXPECT_FALSE(idx.contains("private"));
    EXPECT_FALSE(idx.contains("private/secret.md"));
}

TEST_F(IndexerTest, RemoteListingDrainsEveryPage) {
    MemoryRemoteStore remote("TreeSync", 2);
    for (int i = 0; i < 7; ++i) remote.putFile("f" + std::to_string(i) + ".md", "x", 100);

    const auto idx = Indexer::buildRemote(remote, remote.rootId(), filter, 100);
    EXPECT_EQ(idx.size(), 7u);
}

TEST_F(IndexerTest, RepeatedPageTokenIsStructuralFailure) {
    MemoryRemoteStore remote("TreeSync", 2);
    for (int i = 0; i < 7; ++i) remote.putFile("f" + std::to_string(i) + ".md", "x", 100);
    remote.repeatPageToken = true;

    EXPECT_THROW(Indexer::buildRemote(remote, remote.rootId(), filter, 100), StructuralFailure);
}

TEST_F(IndexerTest, PageCeilingIsStructuralFailure) {
    MemoryRemoteStore remote("TreeSync", 1);
    for (int i = 0; i < 5; ++i) remote.putFile("f" + std::to_string(i) + ".md", "x", 100);

    EXPECT_THROW(Indexer::buildRemote(remote, remote.rootId(), filter, 3), StructuralFailure);
}

TEST_F(IndexerTest, ListingErrorsBecomeStructuralFailure) {
    MemoryRemoteStore remote;
    const auto root = remote.rootId();
    remote.failListing = true;

    EXPECT_THROW(Indexer::buildRemote(remote, root, filter, 100), StructuralFailure);
}

TEST_F(IndexerTest, AuthFailurePassesThrough) {
    MemoryRemoteStore remote;
    const auto root = remote.rootId();
    remote.authBroken = true;

    EXPECT_THROW(Indexer::buildRemote(remote, root, filter, 100), AuthFailure);
}

TEST_F(IndexerTest, DuplicateRemoteNamesKeepFirst) {
    MemoryRemoteStore remote;
    const auto first = remote.putFile("dup.md", "first", 100);
    remote.putDuplicate("dup.md", "second", 200);

    const auto idx = Indexer::buildRemote(remote, remote.rootId(), filter, 100);

    ASSERT_EQ(idx.size(), 1u);
    EXPECT_EQ(idx.at("dup.md").remoteId, std::optional<std::string>(first));
}

TEST_F(IndexerTest, CancellationStopsTheWalk) {
    MemoryRemoteStore remote;
    remote.putFile("a/b/c.md", "x", 100);

    EXPECT_THROW(Indexer::buildRemote(remote, remote.rootId(), filter, 100, [] { return true; }), Cancelled);
    EXPECT_EQ(remote.listCalls(), 0u);
}
