#include <gtest/gtest.h>
#include "sync/Resolver.hpp"
#include "sync/model/errors.hpp"

using namespace ts::sync;
using namespace ts::sync::model;

namespace {

ConflictCase conflict(const std::string& path, const Timestamp local, const Timestamp remote) {
    ConflictCase c;
    c.path = path;
    c.local.path = c.remote.path = path;
    c.local.localModifiedAt = local;
    c.local.remoteId = "rid";
    c.remote.remoteModifiedAt = remote;
    c.remote.localModifiedAt = local;
    c.remote.remoteId = "rid";
    return c;
}

}

TEST(ResolverTest, PreferLocalUploads) {
    const Resolver r(ConflictPolicy::PreferLocal);
    const auto a = r.resolve(conflict("c.md", 600, 700));
    EXPECT_EQ(a.type, ActionType::Upload);
    EXPECT_EQ(a.local->remoteId, std::optional<std::string>("rid"));
}

TEST(ResolverTest, PreferRemoteDownloads) {
    const Resolver r(ConflictPolicy::PreferRemote);
    EXPECT_EQ(r.resolve(conflict("c.md", 900, 700)).type, ActionType::Download);
}

TEST(ResolverTest, PreferNewerPicksStrictlyNewerSide) {
    const Resolver r(ConflictPolicy::PreferNewer);
    EXPECT_EQ(r.resolve(conflict("c.md", 600, 700)).type, ActionType::Download);
    EXPECT_EQ(r.resolve(conflict("c.md", 800, 700)).type, ActionType::Upload);
}

TEST(ResolverTest, PreferNewerTieGoesToRemote) {
    const Resolver r(ConflictPolicy::PreferNewer);
    EXPECT_EQ(r.resolve(conflict("c.md", 700, 700)).type, ActionType::Download);
}

TEST(ResolverTest, KeepBothComputesDuplicatePathFromClock) {
    const Resolver r(ConflictPolicy::KeepBoth, [] { return Timestamp{1700000000123}; });
    const auto a = r.resolve(conflict("notes/c.md", 600, 700));

    EXPECT_EQ(a.type, ActionType::KeepBoth);
    ASSERT_TRUE(a.duplicatePath.has_value());
    EXPECT_EQ(*a.duplicatePath, "notes/c_conflict_1700000000123.md");
}

TEST(ResolverTest, ResolveAllReadsClockOnce) {
    int calls = 0;
    const Resolver r(ConflictPolicy::KeepBoth, [&calls] { return Timestamp{42 + calls++}; });
    const auto actions = r.resolveAll({conflict("a.md", 600, 700), conflict("b.txt", 600, 700)});

    ASSERT_EQ(actions.size(), 2u);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(*actions[0].duplicatePath, "a_conflict_42.md");
    EXPECT_EQ(*actions[1].duplicatePath, "b_conflict_42.txt");
}

TEST(ResolverTest, ConflictCopyPathEdgeCases) {
    EXPECT_EQ(Resolver::conflictCopyPath("Makefile", 7), "Makefile_conflict_7");
    EXPECT_EQ(Resolver::conflictCopyPath(".env", 7), ".env_conflict_7");
    EXPECT_EQ(Resolver::conflictCopyPath("a.b/c", 7), "a.b/c_conflict_7");
    EXPECT_EQ(Resolver::conflictCopyPath("x/archive.tar.gz", 7), "x/archive.tar_conflict_7.gz");
}

TEST(ResolverTest, UnknownPolicyValueThrows) {
    const Resolver r(static_cast<ConflictPolicy>(99));
    EXPECT_THROW((void)r.resolve(conflict("c.md", 600, 700)), ConflictPolicyExhausted);
}

TEST(ResolverTest, PolicyNamesAndAliases) {
    EXPECT_EQ(conflictPolicyFromString("prefer-local"), ConflictPolicy::PreferLocal);
    EXPECT_EQ(conflictPolicyFromString("remote"), ConflictPolicy::PreferRemote);
    EXPECT_EQ(conflictPolicyFromString("newer"), ConflictPolicy::PreferNewer);
    EXPECT_EQ(conflictPolicyFromString("ask"), ConflictPolicy::KeepBoth);
    EXPECT_EQ(conflictPolicyFromString("keep_both"), ConflictPolicy::KeepBoth);
    EXPECT_THROW(conflictPolicyFromString("coin-flip"), std::invalid_argument);
}
