#include "graphlens/render/FrameStyler.h"
#include "graphlens/render/Palette.h"

#include <algorithm>

namespace graphlens {

namespace {

constexpr float SELECTED_EDGE_ALPHA = 0.8f;
constexpr float SELECTED_MIN_INFLUENCE_ALPHA = 0.4f;
constexpr float HOVER_MIN_ALPHA = 0.3f;
constexpr float HOVER_MAX_ALPHA = 0.7f;
constexpr float UNSELECTED_EDGE_ALPHA = 0.08f;

constexpr float OUTGOING_SATURATION = 90.0f;
constexpr float INCOMING_SATURATION = 40.0f;
constexpr float SELECTION_NET_SATURATION = 100.0f;
constexpr float HOVER_NET_SATURATION = 80.0f;
constexpr float UNSELECTED_SATURATION = 70.0f;

void appendColor(std::vector<float>& out, const Color& c) {
    out.push_back(c.r);
    out.push_back(c.g);
    out.push_back(c.b);
    out.push_back(c.a);
}

}  // namespace

FrameStyler::FrameStyler(const GraphData& graph, const ViewSettings& settings,
                         const HighlightState& state)
    : graph_(graph)
    , settings_(settings)
    , state_(state)
    , nodeLightness_(nodeLightness(settings.theme)) {
    if (state_.path) {
        const auto& path = *state_.path;
        for (size_t i = 0; i < path.size(); ++i) {
            pathIndices_.emplace(path[i], i);  // first occurrence wins
        }
    }
}

FrameStyle FrameStyler::compute() const {
    FrameStyle style;
    const size_t nodeCount = graph_.nodeCount();
    const size_t edgeCount = graph_.edgeCount();

    style.nodeColors.reserve(nodeCount * 4);
    style.nodeSizes.reserve(nodeCount);
    for (NodeId id = 0; id < nodeCount; ++id) {
        appendColor(style.nodeColors, nodeColor(id));
        style.nodeSizes.push_back(nodeSize(id));
    }

    style.edgeColors.reserve(edgeCount * 8);
    for (EdgeId id = 0; id < edgeCount; ++id) {
        Color c = edgeColor(id);
        appendColor(style.edgeColors, c);
        appendColor(style.edgeColors, c);
    }

    style.arrows = buildArrows(style.edgeColors, style.nodeSizes);
    return style;
}

bool FrameStyler::isHighlightedBySelection(NodeId id) const {
    if (!state_.selected) {
        return false;
    }
    if (state_.path) {
        return pathIndices_.count(id) > 0;
    }
    if (id == *state_.selected || state_.selectionNet.isImmediateNeighbour(id)) {
        return true;
    }
    auto distance = state_.selectionNet.nodeDistance(id);
    return distance && *distance < settings_.maxDistance();
}

bool FrameStyler::inHoverNet(NodeId id) const {
    return state_.hovered && state_.hoverNet.containsNode(id);
}

Color FrameStyler::nodeColor(NodeId id) const {
    const bool isHovered = state_.hovered == id;

    if (state_.selected && !isHovered) {
        if (isHighlightedBySelection(id)) {
            return nodeColour(graph_, id, nodeLightness_);
        }
        if (inHoverNet(id)) {
            return nodeColour(graph_, id, nodeLightness_, HOVER_SATURATION_BOOST);
        }
        return Colors::DIMMED_NODE;
    }

    if (!state_.selected && inHoverNet(id)) {
        return nodeColour(graph_, id, nodeLightness_, HOVER_SATURATION_BOOST);
    }
    return nodeColour(graph_, id, nodeLightness_);
}

float FrameStyler::nodeSize(NodeId id) const {
    float size = BASE_NODE_SIZE * (0.2f + graph_.normalizedDegree(id) * 0.8f);

    if (state_.selected && !isHighlightedBySelection(id) && !inHoverNet(id)) {
        size -= DIMMED_SIZE_PENALTY;
    }
    if (state_.focused == id) {
        size += FOCUSED_SIZE_BONUS;
    }
    if (state_.hovered == id) {
        size += HOVERED_SIZE_BONUS;
    }

    return std::max(size, MIN_NODE_SIZE);
}

Color FrameStyler::edgeColor(EdgeId id) const {
    const Edge& edge = graph_.getEdge(id);
    if (!settings_.isTypeVisible(edge.type) || !graph_.isEdgeResolvable(edge)) {
        return Colors::TRANSPARENT;
    }

    const auto hoverColor = [&]() -> std::optional<Color> {
        if (!state_.hovered) return std::nullopt;
        auto distance = state_.hoverNet.edgeDistance(id);
        if (!distance) return std::nullopt;
        return netEdgeColor(edge, *distance, HOVER_NET_SATURATION, HOVER_MIN_ALPHA, HOVER_MAX_ALPHA);
    };

    if (!state_.selected) {
        if (auto c = hoverColor()) return *c;
        return edgeTypeColour(edge.type, UNSELECTED_SATURATION, UNSELECTED_EDGE_ALPHA);
    }

    if (state_.path) {
        auto s = pathIndex(edge.source);
        auto t = pathIndex(edge.target);
        if (s && t && (*s + 1 == *t || *t + 1 == *s)) {
            return edgeTypeColour(edge.type, OUTGOING_SATURATION, SELECTED_EDGE_ALPHA);
        }
        return Colors::DIMMED_EDGE;
    }

    if (edge.source == *state_.selected) {
        return edgeTypeColour(edge.type, OUTGOING_SATURATION, SELECTED_EDGE_ALPHA);
    }
    if (edge.target == *state_.selected) {
        return edgeTypeColour(edge.type, INCOMING_SATURATION, SELECTED_EDGE_ALPHA);
    }

    if (auto distance = state_.selectionNet.edgeDistance(id)) {
        const float factor = 1.0f - static_cast<float>(*distance) / static_cast<float>(settings_.maxDistance());
        if (SELECTION_NET_SATURATION * factor <= 0.0f) {
            return Colors::DIMMED_EDGE;
        }
        return netEdgeColor(edge, *distance, SELECTION_NET_SATURATION,
                            SELECTED_MIN_INFLUENCE_ALPHA, SELECTED_EDGE_ALPHA);
    }

    if (auto c = hoverColor()) return *c;
    return Colors::DIMMED_EDGE;
}

Color FrameStyler::netEdgeColor(const Edge& edge, int distance, float maxSaturation,
                                float minAlpha, float maxAlpha) const {
    const float factor = 1.0f - static_cast<float>(distance) / static_cast<float>(settings_.maxDistance());
    const float saturation = std::max(0.0f, maxSaturation * factor);
    const float alpha = minAlpha + (maxAlpha - minAlpha) * factor;
    return edgeTypeColour(edge.type, saturation, alpha);
}

std::optional<size_t> FrameStyler::pathIndex(NodeId id) const {
    auto it = pathIndices_.find(id);
    if (it == pathIndices_.end()) return std::nullopt;
    return it->second;
}

ArrowInstances FrameStyler::buildArrows(const std::vector<float>& edgeColors,
                                        const std::vector<float>& nodeSizes) const {
    ArrowInstances arrows;
    const auto& edges = graph_.edges();

    for (EdgeId i = 0; i < edges.size(); ++i) {
        const Edge& edge = edges[i];
        if (!settings_.isTypeVisible(edge.type) || !graph_.isEdgeResolvable(edge)) continue;
        if (i * 8 + 3 >= edgeColors.size() || edgeColors[i * 8 + 3] <= MIN_ARROW_ALPHA) continue;

        const Point target = graph_.getNode(edge.target).position;
        const Point direction = target - graph_.getNode(edge.source).position;
        if (direction.lengthSquared() == 0.0f) continue;

        arrows.targets.push_back(target.x);
        arrows.targets.push_back(target.y);
        arrows.directions.push_back(direction.x);
        arrows.directions.push_back(direction.y);
        for (size_t c = 0; c < 4; ++c) {
            arrows.colors.push_back(edgeColors[i * 8 + c]);
        }
        arrows.targetSizes.push_back(edge.target < nodeSizes.size() ? nodeSizes[edge.target] : 0.0f);
    }

    return arrows;
}

}  // namespace graphlens
