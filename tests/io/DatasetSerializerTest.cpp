#include <gtest/gtest.h>
#include <graphlens/io/DatasetSerializer.h>

#include <filesystem>
#include <fstream>

using namespace graphlens;

TEST(DatasetSerializerTest, ParsesNodesAndEdges) {
    GraphData graph = DatasetSerializer::fromJson(R"({
        "nodes": [
            {"label": "Rock", "x": 1.5, "y": -2},
            {"label": "Punk", "x": 10, "y": 0}
        ],
        "edges": [[0, 1, 0], [1, 0, 2]]
    })");

    ASSERT_EQ(graph.nodeCount(), 2u);
    EXPECT_EQ(graph.getNode(0).label, "Rock");
    EXPECT_FLOAT_EQ(graph.getNode(0).position.x, 1.5f);
    EXPECT_FLOAT_EQ(graph.getNode(0).position.y, -2.0f);
    ASSERT_EQ(graph.edgeCount(), 2u);
    EXPECT_EQ(graph.getEdge(1).type, EdgeType::FusionGenre);
    EXPECT_EQ(graph.getNode(1).degree(), 2u);
}

TEST(DatasetSerializerTest, EdgesAndMaxDegreeAreOptional) {
    GraphData plain = DatasetSerializer::fromJson(R"({"nodes": [{"label": "A", "x": 0, "y": 0}]})");
    EXPECT_EQ(plain.edgeCount(), 0u);
    EXPECT_EQ(plain.maxDegree(), 1u);

    GraphData withMax = DatasetSerializer::fromJson(
        R"({"nodes": [{"label": "A", "x": 0, "y": 0}], "max_degree": 12})");
    EXPECT_EQ(withMax.maxDegree(), 12u);
}

TEST(DatasetSerializerTest, DanglingEdgeIsKept) {
    GraphData graph = DatasetSerializer::fromJson(
        R"({"nodes": [{"label": "A", "x": 0, "y": 0}], "edges": [[0, 5, 1]]})");

    EXPECT_EQ(graph.edgeCount(), 1u);
    EXPECT_FALSE(graph.isEdgeResolvable(graph.getEdge(0)));
}

TEST(DatasetSerializerTest, RejectsMalformedInput) {
    EXPECT_THROW(DatasetSerializer::fromJson("not json"), std::runtime_error);
    EXPECT_THROW(DatasetSerializer::fromJson(R"({"edges": []})"), std::runtime_error);
    EXPECT_THROW(DatasetSerializer::fromJson(R"({"nodes": [{"label": "A"}]})"), std::runtime_error);
    EXPECT_THROW(DatasetSerializer::fromJson(
                     R"({"nodes": [{"label": "A", "x": 0, "y": 0}], "edges": [[0, 0]]})"),
                 std::runtime_error);
    EXPECT_THROW(DatasetSerializer::fromJson(
                     R"({"nodes": [{"label": "A", "x": 0, "y": 0}], "edges": [[0, 0, 3]]})"),
                 std::runtime_error);
    EXPECT_THROW(DatasetSerializer::fromJson(
                     R"({"nodes": [{"label": "A", "x": 0, "y": 0}], "edges": [[-1, 0, 0]]})"),
                 std::runtime_error);
}

TEST(DatasetSerializerTest, RejectsEndpointsBeyondNodeIdRange) {
    // 2^32 would wrap onto node 0
    EXPECT_THROW(DatasetSerializer::fromJson(
                     R"({"nodes": [{"label": "A", "x": 0, "y": 0}], "edges": [[4294967296, 0, 0]]})"),
                 std::runtime_error);
    EXPECT_THROW(DatasetSerializer::fromJson(
                     R"({"nodes": [{"label": "A", "x": 0, "y": 0}], "edges": [[0, 4294967295, 0]]})"),
                 std::runtime_error);
}

TEST(DatasetSerializerTest, ToJsonPreservesGraph) {
    GraphData original({{"A", {1, 2}}, {"B", {3, 4}}}, {{0, 1, EdgeType::Subgenre}});

    GraphData restored = DatasetSerializer::fromJson(DatasetSerializer::toJson(original));

    EXPECT_EQ(restored.getNode(1).label, "B");
    EXPECT_EQ(restored.getEdge(0).type, EdgeType::Subgenre);
    EXPECT_EQ(restored.maxDegree(), original.maxDegree());
}

TEST(DatasetSerializerTest, LoadFromFile) {
    auto path = std::filesystem::temp_directory_path() / "graphlens_dataset_test.json";
    {
        std::ofstream out(path);
        out << R"({"nodes": [{"label": "Solo", "x": 5, "y": 6}]})";
    }

    GraphData graph = DatasetSerializer::loadFromFile(path.string());
    std::filesystem::remove(path);

    EXPECT_EQ(graph.getNode(0).label, "Solo");
    EXPECT_THROW(DatasetSerializer::loadFromFile(path.string()), std::runtime_error);
}
