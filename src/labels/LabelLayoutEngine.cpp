#include "graphlens/labels/LabelLayoutEngine.h"

#include <algorithm>
#include <array>

namespace graphlens {

LabelTier LabelCandidate::tier() const {
    if (inSelectedNet) return LabelTier::SelectedNet;
    if (inHoverNet) return LabelTier::HoverNet;
    if (inRecentHoverNet) return LabelTier::RecentHover;
    return LabelTier::Other;
}

LabelLayoutEngine::LabelLayoutEngine(const GraphData& graph, const ViewSettings& settings)
    : graph_(graph)
    , settings_(settings) {}

float LabelLayoutEngine::fontSize(NodeId id) const {
    return 10.0f + graph_.normalizedDegree(id) * 6.0f;
}

std::vector<LabelCandidate> LabelLayoutEngine::collectCandidates(
    const Camera& camera,
    const HighlightState& state,
    const std::unordered_set<NodeId>& recentHover) const {
    const Bounds visible = camera.getVisibleBounds();
    const int maxDistance = settings_.maxDistance();

    std::vector<LabelCandidate> candidates;
    for (const Node& node : graph_.nodes()) {
        if (!visible.contains(node.position)) continue;

        LabelCandidate c;
        c.node = node.id;
        c.screen = camera.worldToScreen(node.position);
        c.fontSize = fontSize(node.id);
        c.priority = static_cast<int>(node.degree());
        c.selectedPriority = c.priority;
        c.inRecentHoverNet = recentHover.count(node.id) > 0;

        if (state.selected) {
            if (node.id == *state.selected) {
                c.priority += SELECTED_BONUS;
                c.selectedPriority += SELECTED_BONUS;
                c.inSelectedNet = true;
            } else {
                auto distance = state.selectionNet.nodeDistance(node.id);
                if (distance && *distance < maxDistance) {
                    const int bonus = SELECTION_NET_BONUS - *distance * PER_HOP_PENALTY;
                    c.priority += bonus;
                    c.selectedPriority += bonus;
                    c.inSelectedNet = true;
                }
                if (state.selectionNet.isImmediateNeighbour(node.id)) {
                    c.priority += IMMEDIATE_NEIGHBOUR_BONUS;
                    c.selectedPriority += IMMEDIATE_NEIGHBOUR_BONUS;
                    c.inSelectedNet = true;
                }
            }
        }

        if (state.hovered) {
            if (node.id == *state.hovered) {
                c.priority += HOVERED_BONUS;
                c.inHoverNet = true;
            } else {
                auto distance = state.hoverNet.nodeDistance(node.id);
                if (distance && *distance < maxDistance) {
                    c.priority += HOVER_NET_BONUS - *distance * PER_HOP_PENALTY;
                    c.inHoverNet = true;
                }
            }
        }

        if (c.inRecentHoverNet && !c.inHoverNet && !c.inSelectedNet) {
            c.priority += RECENT_HOVER_BONUS;
        }

        candidates.push_back(c);
    }
    return candidates;
}

std::vector<PlacedLabel> LabelLayoutEngine::layout(const Camera& camera,
                                                   const HighlightState& state,
                                                   const std::unordered_set<NodeId>& recentHover,
                                                   float pixelRatio) const {
    std::vector<PlacedLabel> placed;
    if (!settings_.showLabels) {
        return placed;
    }

    std::array<std::vector<LabelCandidate>, 4> tiers;
    for (const auto& c : collectCandidates(camera, state, recentHover)) {
        tiers[static_cast<size_t>(c.tier())].push_back(c);
    }

    // Candidates arrive in node order, so stable sorting breaks ties by id
    auto& selectedTier = tiers[static_cast<size_t>(LabelTier::SelectedNet)];
    std::stable_sort(selectedTier.begin(), selectedTier.end(),
                     [](const LabelCandidate& a, const LabelCandidate& b) {
                         return a.selectedPriority > b.selectedPriority;
                     });
    for (size_t t = 1; t < tiers.size(); ++t) {
        std::stable_sort(tiers[t].begin(), tiers[t].end(),
                         [](const LabelCandidate& a, const LabelCandidate& b) {
                             return a.priority > b.priority;
                         });
    }

    for (const auto& tier : tiers) {
        for (const auto& c : tier) {
            if (placed.size() >= MAX_VISIBLE_LABELS) {
                return placed;
            }
            const Rect rect = labelRect(characterCount(graph_.getNode(c.node).label), c.fontSize,
                                        c.screen, pixelRatio);
            const bool overlaps = std::any_of(placed.begin(), placed.end(),
                                              [&](const PlacedLabel& p) { return p.rect.intersects(rect); });
            if (!overlaps) {
                placed.push_back({c, rect, appearance(c, state)});
            }
        }
    }
    return placed;
}

size_t LabelLayoutEngine::characterCount(std::string_view label) {
    // Continuation bytes look like 10xxxxxx
    return static_cast<size_t>(std::count_if(label.begin(), label.end(), [](char ch) {
        return (static_cast<unsigned char>(ch) & 0xC0) != 0x80;
    }));
}

Rect LabelLayoutEngine::labelRect(size_t labelLength, float fontSize, const Point& screen,
                                  float pixelRatio) {
    const float charWidth = fontSize * 0.6f;
    const float width = static_cast<float>(labelLength) * charWidth * pixelRatio + 16.0f * pixelRatio;
    const float height = (fontSize + 4.0f) * pixelRatio;
    return {screen.x - width / 2.0f, screen.y - height, width, height};
}

LabelAppearance LabelLayoutEngine::appearance(const LabelCandidate& c, const HighlightState& state) {
    const bool hasActiveNet = state.selected || state.hovered;
    const bool inAnyNet = c.inHoverNet || c.inSelectedNet || c.inRecentHoverNet;

    if (state.hovered == c.node) return {1.6f, 1.0f};
    if (hasActiveNet && !inAnyNet) return {0.4f, 0.5f};
    if (c.inSelectedNet) return {1.3f, 1.0f};
    if (c.inHoverNet) return {0.9f, 1.0f};
    if (c.inRecentHoverNet) return {0.7f, 0.7f};
    return {};
}

}  // namespace graphlens
