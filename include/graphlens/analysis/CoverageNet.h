#pragma once

#include "graphlens/core/GraphData.h"

#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace graphlens {

/**
 * @brief Hop distances reachable from one node
 *
 * nodeDistances always holds the start node at 0 when it exists.
 * edgeDistances only holds edges that discovered a new node.
 */
struct CoverageNet {
    NodeId start = INVALID_NODE;
    std::unordered_map<NodeId, int> nodeDistances;
    std::unordered_map<EdgeId, int> edgeDistances;
    std::unordered_set<NodeId> immediateNeighbours;

    bool empty() const { return nodeDistances.empty() && immediateNeighbours.empty(); }
    bool containsNode(NodeId id) const { return nodeDistances.count(id) > 0; }
    bool containsEdge(EdgeId id) const { return edgeDistances.count(id) > 0; }
    bool isImmediateNeighbour(NodeId id) const { return immediateNeighbours.count(id) > 0; }

    std::optional<int> nodeDistance(NodeId id) const {
        auto it = nodeDistances.find(id);
        if (it == nodeDistances.end()) return std::nullopt;
        return it->second;
    }

    std::optional<int> edgeDistance(EdgeId id) const {
        auto it = edgeDistances.find(id);
        if (it == edgeDistances.end()) return std::nullopt;
        return it->second;
    }
};

/**
 * @brief Level-synchronous BFS over outgoing edges of visible types
 *
 * @param graph Dataset
 * @param start Start node; an unknown id yields an empty net
 * @param visibleTypes Edge types that may be traversed
 * @param maxDistance Hop budget; nodes further than this are not reported
 *
 * Immediate neighbours ignore edge direction and the hop budget: they are
 * the start node plus both endpoints of every visible edge touching it.
 */
CoverageNet computeCoverageNet(const GraphData& graph,
                               NodeId start,
                               const EdgeTypeMask& visibleTypes,
                               int maxDistance);

}  // namespace graphlens
