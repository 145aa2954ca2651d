#include <gtest/gtest.h>
#include <graphlens/core/GraphData.h>

using namespace graphlens;

namespace {

GraphData makeTriangle() {
    return GraphData(
        {{"Rock", {0, 0}}, {"Punk", {10, 0}}, {"Jazz", {0, 10}}},
        {{0, 1, EdgeType::Derivative}, {1, 2, EdgeType::Subgenre}, {2, 0, EdgeType::FusionGenre}});
}

}  // namespace

TEST(GraphDataTest, AssignsIdsFromRecordOrder) {
    GraphData graph = makeTriangle();

    ASSERT_EQ(graph.nodeCount(), 3);
    EXPECT_EQ(graph.getNode(0).label, "Rock");
    EXPECT_EQ(graph.getNode(2).id, 2u);
    EXPECT_FLOAT_EQ(graph.getNode(1).position.x, 10.0f);
}

TEST(GraphDataTest, DerivesIncidentEdges) {
    GraphData graph = makeTriangle();

    EXPECT_EQ(graph.getNode(0).degree(), 2);
    EXPECT_EQ(graph.getNode(1).edges, (std::vector<EdgeId>{0, 1}));
    EXPECT_EQ(graph.maxDegree(), 2);
    EXPECT_FLOAT_EQ(graph.normalizedDegree(0), 1.0f);
}

TEST(GraphDataTest, SelfLoopCountsTwice) {
    GraphData graph({{"Loop", {0, 0}}}, {{0, 0, EdgeType::Derivative}});

    EXPECT_EQ(graph.getNode(0).degree(), 2);
}

TEST(GraphDataTest, UnresolvableEdgeStaysOutOfAdjacency) {
    GraphData graph({{"A", {0, 0}}, {"B", {1, 1}}},
                    {{0, 1, EdgeType::Derivative}, {0, 7, EdgeType::Subgenre}});

    EXPECT_EQ(graph.edgeCount(), 2);
    EXPECT_EQ(graph.getNode(0).degree(), 1);
    EXPECT_FALSE(graph.isEdgeResolvable(graph.getEdge(1)));
}

TEST(GraphDataTest, SuppliedMaxDegreeWins) {
    GraphData graph({{"A", {0, 0}}, {"B", {1, 1}}}, {{0, 1, EdgeType::Derivative}}, 4);

    EXPECT_EQ(graph.maxDegree(), 4);
    EXPECT_FLOAT_EQ(graph.normalizedDegree(0), 0.25f);
}

TEST(GraphDataTest, EmptyGraphHasUnitMaxDegree) {
    GraphData graph;

    EXPECT_EQ(graph.maxDegree(), 1);
    EXPECT_TRUE(graph.positionBuffer().empty());
}

TEST(GraphDataTest, GetNodeThrowsForUnknownId) {
    GraphData graph = makeTriangle();

    EXPECT_THROW(graph.getNode(3), std::out_of_range);
    EXPECT_THROW(graph.getEdge(99), std::out_of_range);
    EXPECT_FALSE(graph.tryGetNode(3).has_value());
    EXPECT_TRUE(graph.tryGetNode(1).has_value());
}

TEST(GraphDataTest, FromNodesRejectsIdMismatch) {
    Node a;
    a.id = 1;
    EXPECT_THROW(GraphData::fromNodes({a}, {}), std::invalid_argument);
}

TEST(GraphDataTest, FromNodesKeepsSuppliedAdjacency) {
    Node a;
    a.id = 0;
    a.edges = {0};
    Node b;
    b.id = 1;
    b.edges = {0};

    GraphData graph = GraphData::fromNodes({a, b}, {{0, 1, EdgeType::Subgenre}});

    EXPECT_EQ(graph.getNode(1).degree(), 1);
    EXPECT_EQ(graph.maxDegree(), 1);
}

TEST(GraphDataTest, PositionBuffersInterleaveCoordinates) {
    GraphData graph({{"A", {1, 2}}, {"B", {3, 4}}},
                    {{0, 1, EdgeType::Derivative}, {1, 5, EdgeType::Derivative}});

    EXPECT_EQ(graph.positionBuffer(), (std::vector<float>{1, 2, 3, 4}));
    EXPECT_EQ(graph.edgePositionBuffer(), (std::vector<float>{1, 2, 3, 4, 0, 0, 0, 0}));
}

TEST(GraphDataTest, EdgeTypeHelpers) {
    EXPECT_EQ(edgeTypeName(EdgeType::FusionGenre), "FusionGenre");
    EXPECT_EQ(edgeTypeFromIndex(1), EdgeType::Subgenre);
    EXPECT_FALSE(edgeTypeFromIndex(3).has_value());
    EXPECT_FALSE(edgeTypeFromIndex(-1).has_value());
}
