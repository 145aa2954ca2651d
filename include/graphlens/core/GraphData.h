#pragma once

#include "Types.h"

#include <array>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace graphlens {

/// Relationship kind carried by every edge
enum class EdgeType : uint8_t {
    Derivative = 0,
    Subgenre = 1,
    FusionGenre = 2
};

constexpr size_t EDGE_TYPE_COUNT = 3;

/// Per-type flag set indexed by EdgeType
using EdgeTypeMask = std::array<bool, EDGE_TYPE_COUNT>;

constexpr EdgeTypeMask ALL_EDGE_TYPES = {true, true, true};

constexpr size_t edgeTypeIndex(EdgeType type) { return static_cast<size_t>(type); }

std::string_view edgeTypeName(EdgeType type);
std::optional<EdgeType> edgeTypeFromIndex(int index);

struct Node {
    NodeId id = INVALID_NODE;
    std::string label;
    Point position;
    std::vector<EdgeId> edges;  ///< Incident edges, either direction

    size_t degree() const { return edges.size(); }
};

struct Edge {
    NodeId source = INVALID_NODE;
    NodeId target = INVALID_NODE;
    EdgeType type = EdgeType::Derivative;
};

/// Record used when building a graph from raw dataset entries
struct NodeRecord {
    std::string label;
    Point position;
};

/**
 * @brief Immutable node/edge dataset shared by every view component
 *
 * Node ids are dense indices into nodes(). Edges may reference ids that do
 * not exist; consumers skip such edges.
 */
class GraphData {
public:
    GraphData() = default;

    /// Build from node records; incident edge lists are derived from @p edges.
    /// @param maxDegree Dataset maximum degree, computed when 0
    GraphData(std::vector<NodeRecord> records, std::vector<Edge> edges, size_t maxDegree = 0);

    /// Build from complete nodes whose ids must equal their index.
    /// @throws std::invalid_argument on an id/index mismatch
    static GraphData fromNodes(std::vector<Node> nodes, std::vector<Edge> edges, size_t maxDegree = 0);

    size_t nodeCount() const { return nodes_.size(); }
    size_t edgeCount() const { return edges_.size(); }

    bool hasNode(NodeId id) const { return id < nodes_.size(); }
    bool hasEdge(EdgeId id) const { return id < edges_.size(); }

    // getNode()/getEdge() throw std::out_of_range for unknown ids.
    // tryGetNode() returns a pointer-free optional copy for uncertain ids.
    const Node& getNode(NodeId id) const;
    const Edge& getEdge(EdgeId id) const;
    std::optional<Node> tryGetNode(NodeId id) const;

    const std::vector<Node>& nodes() const { return nodes_; }
    const std::vector<Edge>& edges() const { return edges_; }

    /// Largest incident-edge count, never below 1
    size_t maxDegree() const { return maxDegree_; }

    /// Degree normalised by maxDegree(), in [0, 1] for well-formed data
    float normalizedDegree(NodeId id) const;

    /// Both endpoints exist
    bool isEdgeResolvable(const Edge& edge) const {
        return hasNode(edge.source) && hasNode(edge.target);
    }

    /// Interleaved x,y world positions, one pair per node
    std::vector<float> positionBuffer() const;

    /// Interleaved x0,y0,x1,y1 per edge; unresolvable edges collapse to the origin
    std::vector<float> edgePositionBuffer() const;

private:
    void computeMaxDegree(size_t suppliedMaxDegree);

    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
    size_t maxDegree_ = 1;
};

}  // namespace graphlens
