#include "test_harness/TestHarness.h"
#include "fixtures/WallFixtures.h"
#include "space/CycleDetector.h"
#include "space/PolygonMath.h"
#include "space/WallGraph.h"

#include <algorithm>
#include <set>

using namespace roomtrace::core::space;
using roomtrace::test::containsId;
using roomtrace::test::isSubset;
using roomtrace::test::sortedIds;
using roomtrace::test::wall;

namespace {

std::vector<Cycle> findCycles(const std::vector<WallSegment>& walls, bool prune = true) {
    WallGraphBuilder builder;
    const WallGraph graph = builder.build(walls, prune);
    MinimalCycleDetector detector;
    return detector.findCycles(graph);
}

std::set<std::string> cycleKeys(const std::vector<Cycle>& cycles) {
    std::set<std::string> keys;
    for (const auto& cycle : cycles) {
        keys.insert(MinimalCycleDetector::cycleKey(cycle));
    }
    return keys;
}

} // namespace

TEST_CASE(Rectangle_Yields_One_Cycle) {
    const auto cycles = findCycles(roomtrace::test::rectangleRoom());
    EXPECT_EQ(cycles.size(), size_t{1});
    if (cycles.empty()) {
        return;
    }
    const Cycle& room = cycles.front();
    EXPECT_EQ(room.points.size(), room.wallIds.size());
    EXPECT_NEAR(polygonArea(room.points), 12.0, 1e-3);
    EXPECT_NEAR(polygonPerimeter(room.points), 14.0, 1e-3);
    EXPECT_TRUE(signedArea(room.points) > 0.0);
    EXPECT_TRUE(sortedIds(room.wallIds) == (std::vector<WallID>{"w1", "w2", "w3", "w4"}));
}

TEST_CASE(Diagonal_Divider_Yields_Two_Rooms) {
    const auto cycles = findCycles(roomtrace::test::squareWithDiagonal());
    EXPECT_EQ(cycles.size(), size_t{2});
    if (cycles.size() != 2) {
        return;
    }
    for (const auto& cycle : cycles) {
        EXPECT_TRUE(containsId(cycle.wallIds, "d"));
        EXPECT_EQ(cycle.wallIds.size(), size_t{3});
        EXPECT_NEAR(polygonArea(cycle.points), 8.0, 1e-9);
    }
    EXPECT_FALSE(isSubset(cycles[0].wallIds, cycles[1].wallIds));
    EXPECT_FALSE(isSubset(cycles[1].wallIds, cycles[0].wallIds));
}

TEST_CASE(Shared_Wall_Bounds_Both_Rooms) {
    const auto cycles = findCycles(roomtrace::test::twoRoomsSideBySide());
    EXPECT_EQ(cycles.size(), size_t{2});
    const std::set<std::string> expected{"mid|n1|s1|w|", "e|mid|n2|s2|"};
    EXPECT_TRUE(cycleKeys(cycles) == expected);
}

TEST_CASE(Result_Is_Independent_Of_Wall_Order) {
    std::vector<WallSegment> walls = roomtrace::test::twoRoomsSideBySide();
    const std::set<std::string> reference = cycleKeys(findCycles(walls));

    std::sort(walls.begin(), walls.end(),
              [](const WallSegment& a, const WallSegment& b) { return a.id < b.id; });
    int permutations = 0;
    do {
        EXPECT_TRUE(cycleKeys(findCycles(walls)) == reference);
        ++permutations;
    } while (std::next_permutation(walls.begin(), walls.end(),
                                   [](const WallSegment& a, const WallSegment& b) { return a.id < b.id; }) &&
             permutations < 200);

    // Reversed wall directions describe the same plan.
    std::vector<WallSegment> flipped = roomtrace::test::twoRoomsSideBySide();
    for (auto& w : flipped) {
        std::swap(w.start, w.end);
    }
    EXPECT_TRUE(cycleKeys(findCycles(flipped)) == reference);
}

TEST_CASE(Nested_Rooms_Are_Separate_Cycles) {
    std::vector<WallSegment> walls{
        wall("o1", 0.0, 0.0, 10.0, 0.0),
        wall("o2", 10.0, 0.0, 10.0, 10.0),
        wall("o3", 10.0, 10.0, 0.0, 10.0),
        wall("o4", 0.0, 10.0, 0.0, 0.0),
        wall("i1", 3.0, 3.0, 6.0, 3.0),
        wall("i2", 6.0, 3.0, 6.0, 6.0),
        wall("i3", 6.0, 6.0, 3.0, 6.0),
        wall("i4", 3.0, 6.0, 3.0, 3.0),
    };
    const auto cycles = findCycles(walls);
    EXPECT_EQ(cycles.size(), size_t{2});
    if (cycles.size() == 2) {
        // Largest first.
        EXPECT_NEAR(polygonArea(cycles[0].points), 100.0, 1e-9);
        EXPECT_NEAR(polygonArea(cycles[1].points), 9.0, 1e-9);
        EXPECT_TRUE(containsId(cycles[1].wallIds, "i1"));
    }
}

TEST_CASE(Small_And_Open_Outlines_Are_Dropped) {
    std::vector<WallSegment> tiny{
        wall("t1", 0.0, 0.0, 0.5, 0.0),
        wall("t2", 0.5, 0.0, 0.5, 0.5),
        wall("t3", 0.5, 0.5, 0.0, 0.5),
        wall("t4", 0.0, 0.5, 0.0, 0.0),
    };
    WallGraphBuilder builder;
    MinimalCycleDetector detector;
    EXPECT_TRUE(detector.findCycles(builder.build(tiny)).empty());
    EXPECT_EQ(detector.stats().belowMinArea, 1);

    CycleDetectorConfig config;
    config.minArea = 0.1;
    detector.setConfig(config);
    EXPECT_EQ(detector.findCycles(builder.build(tiny)).size(), size_t{1});

    std::vector<WallSegment> open = roomtrace::test::rectangleRoom();
    open.pop_back();
    EXPECT_TRUE(findCycles(open).empty());
    EXPECT_TRUE(findCycles(open, false).empty());
}

TEST_CASE(Duplicate_Wall_Resolves_To_Smaller_Id) {
    std::vector<WallSegment> walls = roomtrace::test::rectangleRoom();
    walls.push_back(wall("w2b", 4.0, 0.0, 4.0, 3.0));

    const auto forward = findCycles(walls);
    EXPECT_EQ(forward.size(), size_t{1});
    if (!forward.empty()) {
        EXPECT_TRUE(sortedIds(forward[0].wallIds) == (std::vector<WallID>{"w1", "w2", "w3", "w4"}));
    }

    std::reverse(walls.begin(), walls.end());
    const auto backward = findCycles(walls);
    EXPECT_EQ(backward.size(), size_t{1});
    if (!backward.empty()) {
        EXPECT_TRUE(sortedIds(backward[0].wallIds) == (std::vector<WallID>{"w1", "w2", "w3", "w4"}));
    }
}

TEST_CASE(Collinear_Tie_Prefers_Nearer_Node) {
    // Bottom edge drawn both as one 4 m wall and as two 2 m halves.
    std::vector<WallSegment> walls = roomtrace::test::rectangleRoom();
    walls.push_back(wall("h1", 0.0, 0.0, 2.0, 0.0));
    walls.push_back(wall("h2", 2.0, 0.0, 4.0, 0.0));

    const auto cycles = findCycles(walls);
    EXPECT_EQ(cycles.size(), size_t{1});
    if (!cycles.empty()) {
        EXPECT_TRUE(sortedIds(cycles[0].wallIds) == (std::vector<WallID>{"h1", "h2", "w2", "w3", "w4"}));
        EXPECT_NEAR(polygonArea(cycles[0].points), 12.0, 1e-9);
    }
}

TEST_CASE(Dangling_Stub_Does_Not_Hide_Room) {
    std::vector<WallSegment> walls = roomtrace::test::rectangleRoom();
    walls.push_back(wall("stub", 4.0, 0.0, 2.5, 1.5));

    const auto cycles = findCycles(walls);
    EXPECT_EQ(cycles.size(), size_t{1});
    if (!cycles.empty()) {
        EXPECT_FALSE(containsId(cycles[0].wallIds, "stub"));
        EXPECT_NEAR(polygonArea(cycles[0].points), 12.0, 1e-9);
    }
}

TEST_CASE(Cycle_Key_Ignores_Order) {
    Cycle a;
    a.wallIds = {"w3", "w1", "w2"};
    Cycle b;
    b.wallIds = {"w1", "w2", "w3"};
    EXPECT_EQ(MinimalCycleDetector::cycleKey(a), MinimalCycleDetector::cycleKey(b));
    EXPECT_EQ(MinimalCycleDetector::cycleKey(a), std::string("w1|w2|w3|"));
}

TEST_CASE(Step_Cap_Abandons_Long_Traces) {
    CycleDetectorConfig config;
    config.maxTraceSteps = 3;
    WallGraphBuilder builder;
    MinimalCycleDetector detector(config);
    EXPECT_TRUE(detector.findCycles(builder.build(roomtrace::test::rectangleRoom())).empty());
    EXPECT_TRUE(detector.stats().tracesAbandoned > 0);
}

int main() {
    return roomtrace::test::runAllTests();
}
