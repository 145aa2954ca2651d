#pragma once

#include "graphlens/core/GraphData.h"
#include "graphlens/render/FrameStyler.h"
#include "graphlens/view/Camera.h"
#include "graphlens/view/ViewSettings.h"

#include <string_view>
#include <unordered_set>
#include <vector>

namespace graphlens {

/// Placement class; earlier tiers are packed first and never displaced
enum class LabelTier {
    SelectedNet,
    HoverNet,
    RecentHover,
    Other
};

/// How the overlay should draw a placed label
struct LabelAppearance {
    float brightness = 1.0f;
    float opacity = 1.0f;
};

struct LabelCandidate {
    NodeId node = INVALID_NODE;
    Point screen;             ///< Projected node centre, drawable pixels
    float fontSize = 10.0f;   ///< Logical pixels
    int priority = 0;
    int selectedPriority = 0; ///< Hover-independent key for the selected tier
    bool inSelectedNet = false;
    bool inHoverNet = false;
    bool inRecentHoverNet = false;

    LabelTier tier() const;
};

struct PlacedLabel {
    LabelCandidate candidate;
    Rect rect;  ///< Drawable pixels, bottom-centre anchored at the node
    LabelAppearance appearance;
};

/**
 * @brief Chooses which node labels to show this frame
 *
 * Candidates are the nodes inside the visible bounds. They are split into
 * four tiers, each sorted by descending priority, and packed greedily:
 * a label is accepted when its rectangle overlaps no accepted one, up to
 * MAX_VISIBLE_LABELS.
 */
class LabelLayoutEngine {
public:
    static constexpr size_t MAX_VISIBLE_LABELS = 60;

    static constexpr int SELECTED_BONUS = 100000;
    static constexpr int SELECTION_NET_BONUS = 10000;
    static constexpr int IMMEDIATE_NEIGHBOUR_BONUS = 10000;
    static constexpr int HOVERED_BONUS = 200000;
    static constexpr int HOVER_NET_BONUS = 20000;
    static constexpr int RECENT_HOVER_BONUS = 5000;
    static constexpr int PER_HOP_PENALTY = 1000;

    LabelLayoutEngine(const GraphData& graph, const ViewSettings& settings);

    std::vector<PlacedLabel> layout(const Camera& camera,
                                    const HighlightState& state,
                                    const std::unordered_set<NodeId>& recentHover,
                                    float pixelRatio) const;

    /// Candidates for every node in view, in node order
    std::vector<LabelCandidate> collectCandidates(const Camera& camera,
                                                  const HighlightState& state,
                                                  const std::unordered_set<NodeId>& recentHover) const;

    float fontSize(NodeId id) const;

    /// Number of UTF-8 code points in a label
    static size_t characterCount(std::string_view label);

    static Rect labelRect(size_t labelLength, float fontSize, const Point& screen, float pixelRatio);

    static LabelAppearance appearance(const LabelCandidate& candidate, const HighlightState& state);

private:
    const GraphData& graph_;
    const ViewSettings& settings_;
};

}  // namespace graphlens
