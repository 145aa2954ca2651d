#include <gtest/gtest.h>
#include <graphlens/analysis/CoverageNet.h>

using namespace graphlens;

class CoverageNetTest : public ::testing::Test {
protected:
    // 0 -> 1 -> 2 -> 3, plus 4 -> 0 and a fusion edge 0 -> 5
    GraphData graph{
        {{"A", {0, 0}}, {"B", {1, 0}}, {"C", {2, 0}}, {"D", {3, 0}}, {"E", {-1, 0}}, {"F", {0, 1}}},
        {{0, 1, EdgeType::Derivative},
         {1, 2, EdgeType::Derivative},
         {2, 3, EdgeType::Subgenre},
         {4, 0, EdgeType::Derivative},
         {0, 5, EdgeType::FusionGenre}}};
};

TEST_F(CoverageNetTest, StartNodeAtDistanceZero) {
    CoverageNet net = computeCoverageNet(graph, 0, ALL_EDGE_TYPES, 3);

    EXPECT_EQ(net.start, 0u);
    EXPECT_EQ(net.nodeDistance(0), 0);
}

TEST_F(CoverageNetTest, FollowsOutgoingEdgesOnly) {
    CoverageNet net = computeCoverageNet(graph, 0, ALL_EDGE_TYPES, 3);

    EXPECT_EQ(net.nodeDistance(1), 1);
    EXPECT_EQ(net.nodeDistance(2), 2);
    EXPECT_EQ(net.nodeDistance(3), 3);
    EXPECT_EQ(net.nodeDistance(5), 1);
    EXPECT_FALSE(net.containsNode(4));
}

TEST_F(CoverageNetTest, EdgeDistancesMatchDiscoveredNode) {
    CoverageNet net = computeCoverageNet(graph, 0, ALL_EDGE_TYPES, 3);

    EXPECT_EQ(net.edgeDistance(0), 1);
    EXPECT_EQ(net.edgeDistance(1), 2);
    EXPECT_EQ(net.edgeDistance(2), 3);
    EXPECT_FALSE(net.containsEdge(3));
}

TEST_F(CoverageNetTest, HopBudgetLimitsDepth) {
    CoverageNet net = computeCoverageNet(graph, 0, ALL_EDGE_TYPES, 1);

    EXPECT_TRUE(net.containsNode(1));
    EXPECT_FALSE(net.containsNode(2));
    EXPECT_EQ(net.nodeDistances.size(), 3);
}

TEST_F(CoverageNetTest, ImmediateNeighboursIgnoreDirection) {
    CoverageNet net = computeCoverageNet(graph, 0, ALL_EDGE_TYPES, 1);

    EXPECT_TRUE(net.isImmediateNeighbour(0));
    EXPECT_TRUE(net.isImmediateNeighbour(1));
    EXPECT_TRUE(net.isImmediateNeighbour(4));
    EXPECT_TRUE(net.isImmediateNeighbour(5));
    EXPECT_FALSE(net.isImmediateNeighbour(2));
}

TEST_F(CoverageNetTest, HiddenTypesAreNotTraversed) {
    EdgeTypeMask mask = ALL_EDGE_TYPES;
    mask[edgeTypeIndex(EdgeType::Subgenre)] = false;
    mask[edgeTypeIndex(EdgeType::FusionGenre)] = false;

    CoverageNet net = computeCoverageNet(graph, 0, mask, 5);

    EXPECT_TRUE(net.containsNode(2));
    EXPECT_FALSE(net.containsNode(3));
    EXPECT_FALSE(net.containsNode(5));
    EXPECT_FALSE(net.isImmediateNeighbour(5));
}

TEST_F(CoverageNetTest, ZeroBudgetKeepsOnlyStart) {
    CoverageNet net = computeCoverageNet(graph, 1, ALL_EDGE_TYPES, 0);

    EXPECT_EQ(net.nodeDistances.size(), 1);
    EXPECT_TRUE(net.edgeDistances.empty());
    EXPECT_TRUE(net.isImmediateNeighbour(2));
}

TEST_F(CoverageNetTest, UnknownStartYieldsEmptyNet) {
    CoverageNet net = computeCoverageNet(graph, 42, ALL_EDGE_TYPES, 3);

    EXPECT_TRUE(net.empty());
}

TEST(CoverageNetCycleTest, CycleVisitsEachNodeOnce) {
    GraphData cycle({{"A", {0, 0}}, {"B", {1, 0}}, {"C", {2, 0}}},
                    {{0, 1, EdgeType::Derivative}, {1, 2, EdgeType::Derivative}, {2, 0, EdgeType::Derivative}});

    CoverageNet net = computeCoverageNet(cycle, 0, ALL_EDGE_TYPES, 10);

    EXPECT_EQ(net.nodeDistance(0), 0);
    EXPECT_EQ(net.nodeDistance(2), 2);
    EXPECT_FALSE(net.containsEdge(2));
}

TEST(CoverageNetCycleTest, DanglingEdgeIsIgnored) {
    GraphData graph({{"A", {0, 0}}}, {{0, 9, EdgeType::Derivative}});

    CoverageNet net = computeCoverageNet(graph, 0, ALL_EDGE_TYPES, 2);

    EXPECT_EQ(net.nodeDistances.size(), 1);
    EXPECT_EQ(net.immediateNeighbours.size(), 1);
}
