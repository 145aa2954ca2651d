#include "graphlens/analysis/CoverageNet.h"

#include <vector>

namespace graphlens {

CoverageNet computeCoverageNet(const GraphData& graph,
                               NodeId start,
                               const EdgeTypeMask& visibleTypes,
                               int maxDistance) {
    CoverageNet net;
    net.start = start;
    if (!graph.hasNode(start)) {
        return net;
    }

    const auto isVisible = [&](const Edge& edge) {
        return visibleTypes[edgeTypeIndex(edge.type)] && graph.isEdgeResolvable(edge);
    };

    net.immediateNeighbours.insert(start);
    for (EdgeId edgeId : graph.getNode(start).edges) {
        if (!graph.hasEdge(edgeId)) continue;
        const Edge& edge = graph.getEdge(edgeId);
        if (isVisible(edge)) {
            net.immediateNeighbours.insert(edge.source);
            net.immediateNeighbours.insert(edge.target);
        }
    }

    net.nodeDistances[start] = 0;

    std::vector<NodeId> frontier{start};
    int currentDistance = 0;

    while (!frontier.empty() && currentDistance < maxDistance) {
        std::vector<NodeId> nextFrontier;
        ++currentDistance;

        for (NodeId nodeId : frontier) {
            for (EdgeId edgeId : graph.getNode(nodeId).edges) {
                if (!graph.hasEdge(edgeId)) continue;
                const Edge& edge = graph.getEdge(edgeId);
                if (!isVisible(edge) || edge.source != nodeId) continue;

                if (net.nodeDistances.emplace(edge.target, currentDistance).second) {
                    net.edgeDistances[edgeId] = currentDistance;
                    nextFrontier.push_back(edge.target);
                }
            }
        }

        frontier = std::move(nextFrontier);
    }

    return net;
}

}  // namespace graphlens
