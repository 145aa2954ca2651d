#pragma once

#include "graphlens/analysis/CoverageNet.h"
#include "graphlens/core/GraphData.h"
#include "graphlens/render/IGraphRenderer.h"
#include "graphlens/view/ViewSettings.h"

#include <optional>
#include <unordered_map>
#include <vector>

namespace graphlens {

/// Selection, hover and path state that drives highlighting
struct HighlightState {
    std::optional<NodeId> selected;
    std::optional<NodeId> hovered;
    std::optional<NodeId> focused;
    CoverageNet selectionNet;
    CoverageNet hoverNet;
    /// Ordered node ids of an explicit path between two nodes
    std::optional<std::vector<NodeId>> path;
};

/// Dynamic renderer buffers for one highlight state
struct FrameStyle {
    std::vector<float> nodeColors;  ///< RGBA per node
    std::vector<float> nodeSizes;   ///< diameter per node, world units
    std::vector<float> edgeColors;  ///< RGBA per edge vertex
    ArrowInstances arrows;
};

/**
 * @brief Computes node/edge colours, node sizes and arrow instances
 *
 * Pure function of the dataset, settings and highlight state. Nothing here
 * touches the GPU, so the output can be compared directly in tests.
 */
class FrameStyler {
public:
    static constexpr float BASE_NODE_SIZE = 15.0f;
    static constexpr float DIMMED_SIZE_PENALTY = 1.5f;
    static constexpr float FOCUSED_SIZE_BONUS = 1.5f;
    static constexpr float HOVERED_SIZE_BONUS = 2.5f;
    static constexpr float MIN_NODE_SIZE = 1.0f;
    static constexpr float MIN_ARROW_ALPHA = 0.01f;

    FrameStyler(const GraphData& graph, const ViewSettings& settings, const HighlightState& state);

    FrameStyle compute() const;

    Color nodeColor(NodeId id) const;
    float nodeSize(NodeId id) const;
    Color edgeColor(EdgeId id) const;

    /// Selected node, its immediate neighbours and its net within budget;
    /// with a path, only path members
    bool isHighlightedBySelection(NodeId id) const;

    /// Arrow instances for edges whose colour is visible
    ArrowInstances buildArrows(const std::vector<float>& edgeColors,
                               const std::vector<float>& nodeSizes) const;

private:
    bool inHoverNet(NodeId id) const;
    Color netEdgeColor(const Edge& edge, int distance, float maxSaturation,
                       float minAlpha, float maxAlpha) const;
    std::optional<size_t> pathIndex(NodeId id) const;

    const GraphData& graph_;
    const ViewSettings& settings_;
    const HighlightState& state_;
    float nodeLightness_;
    std::unordered_map<NodeId, size_t> pathIndices_;
};

}  // namespace graphlens
