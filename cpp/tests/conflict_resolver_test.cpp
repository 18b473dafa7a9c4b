#include <gtest/gtest.h>
#include "selsync/selection/conflict_resolver.h"
#include "tests/engine_test_common.h"

#include <algorithm>
#include <string>
#include <vector>

using selsync::ConflictResolver;
using selsync::ResolutionMode;
using selsync::ResolveContext;
using selsync::SelectionRecord;
using selsync_test::makeRecord;

TEST(ConflictResolverTest, HigherPriorityRanksFirst) {
    ConflictResolver resolver;
    const std::vector<SelectionRecord> active{
        makeRecord("userB", {"e1"}, 100, 90),
        makeRecord("userA", {"e1"}, 200, 100),
    };

    const auto conflicts = resolver.recompute(active);
    ASSERT_EQ(conflicts.size(), 1u);
    EXPECT_EQ(conflicts[0].elementId, "e1");
    EXPECT_EQ(conflicts[0].conflictId, "conflict:e1");
    ASSERT_EQ(conflicts[0].contenders.size(), 2u);
    EXPECT_EQ(conflicts[0].contenders[0].userId, "userA");
    EXPECT_EQ(conflicts[0].contenders[1].userId, "userB");
    EXPECT_EQ(conflicts[0].resolutionMode, ResolutionMode::Timeout);
}

TEST(ConflictResolverTest, EqualPriorityEarlierTimestampWins) {
    ConflictResolver resolver;
    for (std::int32_t priority : {-5, 0, 7, 100}) {
        for (selsync::TimeMs early : {0, 10, 5000}) {
            for (selsync::TimeMs gap : {1, 250}) {
                std::vector<SelectionRecord> active{
                    makeRecord("late", {"e1"}, early + gap, priority),
                    makeRecord("early", {"e1"}, early, priority),
                };
                auto conflicts = resolver.recompute(active);
                ASSERT_EQ(conflicts.size(), 1u);
                EXPECT_EQ(conflicts[0].contenders.front().userId, "early");

                std::reverse(active.begin(), active.end());
                conflicts = resolver.recompute(active);
                EXPECT_EQ(conflicts[0].contenders.front().userId, "early");
            }
        }
    }
}

TEST(ConflictResolverTest, FullTiesFallBackToUserId) {
    ConflictResolver resolver;
    const std::vector<SelectionRecord> active{
        makeRecord("zed", {"e1"}, 10, 1),
        makeRecord("amy", {"e1"}, 10, 1),
    };
    EXPECT_EQ(resolver.recompute(active)[0].contenders.front().userId, "amy");
}

TEST(ConflictResolverTest, SingleSelectorIsNotAConflict) {
    ConflictResolver resolver;
    const std::vector<SelectionRecord> active{
        makeRecord("alice", {"e1", "e2"}, 10),
        makeRecord("bob", {"e3"}, 10),
    };
    EXPECT_TRUE(resolver.recompute(active).empty());
}

TEST(ConflictResolverTest, OutputIsSortedByElement) {
    ConflictResolver resolver;
    const std::vector<SelectionRecord> active{
        makeRecord("alice", {"e9", "e2", "e5"}, 10),
        makeRecord("bob", {"e5", "e9"}, 11),
        makeRecord("carol", {"e2"}, 12),
    };
    const auto conflicts = resolver.recompute(active);
    ASSERT_EQ(conflicts.size(), 3u);
    EXPECT_EQ(conflicts[0].elementId, "e2");
    EXPECT_EQ(conflicts[1].elementId, "e5");
    EXPECT_EQ(conflicts[2].elementId, "e9");
}

TEST(ConflictResolverTest, InactiveRecordsDoNotContend) {
    ConflictResolver resolver;
    auto idle = makeRecord("bob", {"e1"}, 10);
    idle.isActive = false;
    const std::vector<SelectionRecord> active{makeRecord("alice", {"e1"}, 10), idle};
    EXPECT_TRUE(resolver.recompute(active).empty());
}

TEST(ConflictResolverTest, ModeFollowsOwnershipAndSharedState) {
    ConflictResolver resolver;
    const std::vector<SelectionRecord> active{
        makeRecord("alice", {"e1", "e2", "e3"}, 10),
        makeRecord("bob", {"e1", "e2", "e3"}, 11),
    };

    ResolveContext context;
    context.owners["e1"] = "alice";
    context.owners["e3"] = "outsider";
    context.sharedElements.insert("e2");
    context.sharedElements.insert("e1");
    context.defaultMode = ResolutionMode::Manual;

    const auto conflicts = resolver.recompute(active, context);
    ASSERT_EQ(conflicts.size(), 3u);
    EXPECT_EQ(conflicts[0].resolutionMode, ResolutionMode::Ownership);
    EXPECT_EQ(conflicts[1].resolutionMode, ResolutionMode::Shared);
    // Owner outside the contender set does not change the mode.
    EXPECT_EQ(conflicts[2].resolutionMode, ResolutionMode::Manual);
}

TEST(ConflictResolverTest, ConflictIdRoundTrip) {
    EXPECT_EQ(ConflictResolver::conflictIdFor("shape:7"), "conflict:shape:7");
    EXPECT_EQ(ConflictResolver::elementIdFor("conflict:shape:7"), std::optional<std::string>("shape:7"));
    EXPECT_FALSE(ConflictResolver::elementIdFor("conflict:").has_value());
    EXPECT_FALSE(ConflictResolver::elementIdFor("other:e1").has_value());
}
