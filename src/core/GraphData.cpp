#include "graphlens/core/GraphData.h"
#include "graphlens/common/Logger.h"

#include <algorithm>

namespace graphlens {

std::string_view edgeTypeName(EdgeType type) {
    switch (type) {
        case EdgeType::Derivative: return "Derivative";
        case EdgeType::Subgenre: return "Subgenre";
        case EdgeType::FusionGenre: return "FusionGenre";
    }
    return "Unknown";
}

std::optional<EdgeType> edgeTypeFromIndex(int index) {
    if (index < 0 || index >= static_cast<int>(EDGE_TYPE_COUNT)) {
        return std::nullopt;
    }
    return static_cast<EdgeType>(index);
}

GraphData::GraphData(std::vector<NodeRecord> records, std::vector<Edge> edges, size_t maxDegree)
    : edges_(std::move(edges)) {
    nodes_.reserve(records.size());
    for (size_t i = 0; i < records.size(); ++i) {
        Node node;
        node.id = static_cast<NodeId>(i);
        node.label = std::move(records[i].label);
        node.position = records[i].position;
        nodes_.push_back(std::move(node));
    }

    size_t skipped = 0;
    for (EdgeId e = 0; e < edges_.size(); ++e) {
        const Edge& edge = edges_[e];
        if (!isEdgeResolvable(edge)) {
            ++skipped;
            continue;
        }
        // A self-loop counts twice toward its node's degree
        nodes_[edge.source].edges.push_back(e);
        nodes_[edge.target].edges.push_back(e);
    }
    if (skipped > 0) {
        LOG_WARN("{} edges reference missing nodes and were left out of adjacency", skipped);
    }

    computeMaxDegree(maxDegree);
}

GraphData GraphData::fromNodes(std::vector<Node> nodes, std::vector<Edge> edges, size_t maxDegree) {
    for (size_t i = 0; i < nodes.size(); ++i) {
        if (nodes[i].id != i) {
            throw std::invalid_argument("node id " + std::to_string(nodes[i].id) +
                                        " does not match its index " + std::to_string(i));
        }
    }

    GraphData graph;
    graph.nodes_ = std::move(nodes);
    graph.edges_ = std::move(edges);
    graph.computeMaxDegree(maxDegree);
    return graph;
}

const Node& GraphData::getNode(NodeId id) const {
    if (!hasNode(id)) {
        throw std::out_of_range("Node not found: " + std::to_string(id));
    }
    return nodes_[id];
}

const Edge& GraphData::getEdge(EdgeId id) const {
    if (!hasEdge(id)) {
        throw std::out_of_range("Edge not found: " + std::to_string(id));
    }
    return edges_[id];
}

std::optional<Node> GraphData::tryGetNode(NodeId id) const {
    if (!hasNode(id)) {
        return std::nullopt;
    }
    return nodes_[id];
}

float GraphData::normalizedDegree(NodeId id) const {
    if (!hasNode(id)) {
        return 0.0f;
    }
    return static_cast<float>(nodes_[id].degree()) / static_cast<float>(maxDegree_);
}

std::vector<float> GraphData::positionBuffer() const {
    std::vector<float> buffer;
    buffer.reserve(nodes_.size() * 2);
    for (const auto& node : nodes_) {
        buffer.push_back(node.position.x);
        buffer.push_back(node.position.y);
    }
    return buffer;
}

std::vector<float> GraphData::edgePositionBuffer() const {
    std::vector<float> buffer(edges_.size() * 4, 0.0f);
    for (size_t i = 0; i < edges_.size(); ++i) {
        const Edge& edge = edges_[i];
        if (!isEdgeResolvable(edge)) {
            continue;
        }
        const Point& s = nodes_[edge.source].position;
        const Point& t = nodes_[edge.target].position;
        buffer[i * 4 + 0] = s.x;
        buffer[i * 4 + 1] = s.y;
        buffer[i * 4 + 2] = t.x;
        buffer[i * 4 + 3] = t.y;
    }
    return buffer;
}

void GraphData::computeMaxDegree(size_t suppliedMaxDegree) {
    if (suppliedMaxDegree > 0) {
        maxDegree_ = suppliedMaxDegree;
        return;
    }
    size_t maxDegree = 1;
    for (const auto& node : nodes_) {
        maxDegree = std::max(maxDegree, node.degree());
    }
    maxDegree_ = maxDegree;
}

}  // namespace graphlens
