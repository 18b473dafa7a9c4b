#include <gtest/gtest.h>
#include "selsync/render/viewport_culler.h"
#include "tests/engine_test_common.h"

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

using selsync::BoundsCache;
using selsync::Box;
using selsync::CanvasTransform;
using selsync::SelectionRecord;
using selsync::Viewport;
using selsync::ViewportCuller;
using selsync_test::FakeScene;
using selsync_test::makeRecord;

namespace {

std::vector<std::string> userIds(const std::vector<SelectionRecord>& records) {
    std::vector<std::string> out;
    for (const auto& r : records) out.push_back(r.userId);
    return out;
}

} // namespace

class ViewportCullerTest : public ::testing::Test {
protected:
    FakeScene scene;
    BoundsCache cache{64};

    std::unique_ptr<ViewportCuller> makeCuller(float padding) {
        auto culler = std::make_unique<ViewportCuller>(cache, 256.0f, padding);
        culler->setBoundsResolver(scene.resolver());
        return culler;
    }
};

TEST_F(ViewportCullerTest, ExcludesSelectionOutsideViewport) {
    scene.set("e2", Box{300.0f, 300.0f, 50.0f, 50.0f});
    const Viewport view{0.0f, 0.0f, 200.0f, 200.0f, CanvasTransform{}};
    const std::vector<SelectionRecord> selections{makeRecord("alice", {"e2"}, 10)};

    EXPECT_TRUE(makeCuller(0.0f)->visibleSelections(selections, view, 10).empty());
    // Gap of 100 exceeds a 50px margin
    EXPECT_TRUE(makeCuller(50.0f)->visibleSelections(selections, view, 10).empty());
    // A margin larger than the gap brings it in
    EXPECT_EQ(makeCuller(150.0f)->visibleSelections(selections, view, 10).size(), 1u);
}

TEST_F(ViewportCullerTest, ExplicitBoundsTakePrecedence) {
    scene.set("e1", Box{5000.0f, 5000.0f, 10.0f, 10.0f});
    auto record = makeRecord("alice", {"e1"}, 10);
    record.explicitBounds = Box{10.0f, 10.0f, 20.0f, 20.0f};

    auto culler = makeCuller(0.0f);
    const auto visible = culler->visibleSelections({record}, Viewport{0.0f, 0.0f, 100.0f, 100.0f, {}}, 10);
    EXPECT_EQ(userIds(visible), std::vector<std::string>{"alice"});
    EXPECT_EQ(scene.resolverCalls(), 0);
}

TEST_F(ViewportCullerTest, TruncatesInInputOrder) {
    std::vector<SelectionRecord> selections;
    for (int i = 0; i < 6; ++i) {
        const std::string element = "e" + std::to_string(i);
        scene.set(element, Box{10.0f * i, 10.0f, 5.0f, 5.0f});
        auto record = makeRecord("user" + std::to_string(i), {}, 10);
        record.elementIds.push_back(element);
        selections.push_back(record);
    }

    auto culler = makeCuller(0.0f);
    const auto visible = culler->visibleSelections(selections, Viewport{0.0f, 0.0f, 500.0f, 500.0f, {}}, 4);
    EXPECT_EQ(userIds(visible), (std::vector<std::string>{"user0", "user1", "user2", "user3"}));
    EXPECT_EQ(culler->lastStats().truncated, 2u);
    EXPECT_EQ(culler->lastStats().visible, 4u);
}

TEST_F(ViewportCullerTest, UnresolvedSelectionsAreExcluded) {
    scene.set("e1", Box{10.0f, 10.0f, 5.0f, 5.0f});
    const std::vector<SelectionRecord> selections{
        makeRecord("alice", {"deleted"}, 10),
        makeRecord("bob", {"e1", "deleted"}, 10),
    };

    auto culler = makeCuller(0.0f);
    const auto visible = culler->visibleSelections(selections, Viewport{0.0f, 0.0f, 100.0f, 100.0f, {}}, 10);
    EXPECT_EQ(userIds(visible), std::vector<std::string>{"bob"});
    EXPECT_EQ(culler->lastStats().unresolved, 1u);
}

TEST_F(ViewportCullerTest, ZoomAndPanMapScreenToWorld) {
    // screen = (world + t) * zoom, so screen (0..200) at zoom 2, t=(-1000,-1000) is world 1000..1100
    scene.set("near", Box{1050.0f, 1050.0f, 10.0f, 10.0f});
    scene.set("far", Box{1150.0f, 1050.0f, 10.0f, 10.0f});
    const Viewport view{0.0f, 0.0f, 200.0f, 200.0f, CanvasTransform{-1000.0f, -1000.0f, 2.0f}};

    const auto region = ViewportCuller::worldRegion(view, 0.0f);
    ASSERT_TRUE(region.has_value());
    EXPECT_FLOAT_EQ(region->minX, 1000.0f);
    EXPECT_FLOAT_EQ(region->maxX, 1100.0f);

    auto culler = makeCuller(0.0f);
    const std::vector<SelectionRecord> selections{
        makeRecord("a", {"near"}, 10),
        makeRecord("b", {"far"}, 10),
    };
    EXPECT_EQ(userIds(culler->visibleSelections(selections, view, 10)), std::vector<std::string>{"a"});
}

TEST_F(ViewportCullerTest, DegenerateViewportShowsNothing) {
    EXPECT_FALSE(ViewportCuller::worldRegion(Viewport{0.0f, 0.0f, 10.0f, 10.0f, CanvasTransform{0.0f, 0.0f, 0.0f}}, 0.0f).has_value());
    EXPECT_FALSE(ViewportCuller::worldRegion(Viewport{0.0f, 0.0f, -1.0f, 10.0f, {}}, 0.0f).has_value());

    scene.set("e1", Box{0.0f, 0.0f, 5.0f, 5.0f});
    auto culler = makeCuller(0.0f);
    const Viewport broken{0.0f, 0.0f, 10.0f, 10.0f, CanvasTransform{0.0f, 0.0f, -1.0f}};
    EXPECT_TRUE(culler->visibleSelections({makeRecord("a", {"e1"}, 1)}, broken, 10).empty());
}

TEST_F(ViewportCullerTest, SyncDropsDepartedSelections) {
    scene.set("e1", Box{0.0f, 0.0f, 5.0f, 5.0f});
    auto culler = makeCuller(0.0f);
    culler->syncSelections({makeRecord("a", {"e1"}, 1), makeRecord("b", {"e1"}, 1)});
    EXPECT_EQ(culler->selectionIndexStats().entryCount, 2u);
    culler->syncSelections({makeRecord("b", {"e1"}, 1)});
    EXPECT_EQ(culler->selectionIndexStats().entryCount, 1u);
}

TEST_F(ViewportCullerTest, MovedElementIsReindexedAfterInvalidation) {
    scene.set("e1", Box{0.0f, 0.0f, 5.0f, 5.0f});
    auto culler = makeCuller(0.0f);
    const Viewport view{0.0f, 0.0f, 100.0f, 100.0f, {}};
    const std::vector<SelectionRecord> selections{makeRecord("a", {"e1"}, 1)};
    ASSERT_EQ(culler->visibleSelections(selections, view, 10).size(), 1u);

    scene.set("e1", Box{900.0f, 900.0f, 5.0f, 5.0f});
    cache.invalidate("e1");
    EXPECT_TRUE(culler->visibleSelections(selections, view, 10).empty());
}

TEST_F(ViewportCullerTest, ConflictsAndOwnershipsUseElementBounds) {
    scene.set("in", Box{10.0f, 10.0f, 5.0f, 5.0f});
    scene.set("out", Box{900.0f, 10.0f, 5.0f, 5.0f});
    auto culler = makeCuller(0.0f);
    const Viewport view{0.0f, 0.0f, 100.0f, 100.0f, {}};

    std::vector<selsync::ConflictRecord> conflicts(3);
    conflicts[0].elementId = "out";
    conflicts[1].elementId = "in";
    conflicts[2].elementId = "gone";
    const auto visibleConflicts = culler->visibleConflicts(conflicts, view, 10);
    ASSERT_EQ(visibleConflicts.size(), 1u);
    EXPECT_EQ(visibleConflicts[0].elementId, "in");
    EXPECT_EQ(culler->lastStats().unresolved, 1u);

    std::vector<selsync::OwnershipRecord> owned(2);
    owned[0].elementId = "in";
    owned[1].elementId = "out";
    const auto visibleOwned = culler->visibleOwnerships(owned, view, 10);
    ASSERT_EQ(visibleOwned.size(), 1u);
    EXPECT_EQ(visibleOwned[0].elementId, "in");
}

TEST_F(ViewportCullerTest, MissingResolverIsAContractViolation) {
    ViewportCuller culler(cache);
    EXPECT_THROW(culler.selectionBounds(makeRecord("a", {"e1"}, 1)), std::invalid_argument);
    EXPECT_THROW(culler.setPadding(-1.0f), std::invalid_argument);
}

TEST_F(ViewportCullerTest, ElementGridsFollowTheirInput) {
    for (const char* id : {"a", "b", "c"}) scene.set(id, Box{10.0f, 10.0f, 5.0f, 5.0f});
    auto culler = makeCuller(0.0f);
    const Viewport view{0.0f, 0.0f, 100.0f, 100.0f, {}};

    std::vector<selsync::ConflictRecord> conflicts(3);
    conflicts[0].elementId = "a";
    conflicts[1].elementId = "b";
    conflicts[2].elementId = "c";
    ASSERT_EQ(culler->visibleConflicts(conflicts, view, 10).size(), 3u);

    std::vector<selsync::OwnershipRecord> owned(2);
    owned[0].elementId = "a";
    owned[1].elementId = "b";
    ASSERT_EQ(culler->visibleOwnerships(owned, view, 10).size(), 2u);
    EXPECT_EQ(culler->elementIndexStats().entryCount, 5u);

    // Resolved conflicts leave the grid; owned elements stay.
    conflicts.resize(1);
    ASSERT_EQ(culler->visibleConflicts(conflicts, view, 10).size(), 1u);
    EXPECT_EQ(culler->elementIndexStats().entryCount, 3u);

    EXPECT_TRUE(culler->visibleOwnerships({}, view, 10).empty());
    EXPECT_TRUE(culler->visibleConflicts({}, view, 10).empty());
    EXPECT_EQ(culler->elementIndexStats().entryCount, 0u);
}
