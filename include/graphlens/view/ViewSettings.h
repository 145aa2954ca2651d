#pragma once

#include "graphlens/core/GraphData.h"
#include "graphlens/render/Palette.h"

#include <algorithm>

namespace graphlens {

/// User-facing view options supplied by the host's settings panel
struct ViewSettings {
    static constexpr int MIN_INFLUENCE_DISTANCE = 1;
    static constexpr int MAX_INFLUENCE_DISTANCE = 5;
    static constexpr float MIN_ARROW_SIZE_SCALE = 0.5f;
    static constexpr float MAX_ARROW_SIZE_SCALE = 3.0f;

    EdgeTypeMask visibleTypes = ALL_EDGE_TYPES;
    int maxInfluenceDistance = 2;
    bool zoomOnSelect = true;
    bool showLabels = true;
    float arrowSizeScale = 1.5f;
    Theme theme = Theme::Dark;

    /// Hop budget handed to the coverage-net BFS
    int maxDistance() const { return maxInfluenceDistance + 1; }

    bool isTypeVisible(EdgeType type) const { return visibleTypes[edgeTypeIndex(type)]; }

    ViewSettings clamped() const {
        ViewSettings result = *this;
        result.maxInfluenceDistance = std::clamp(maxInfluenceDistance,
                                                 MIN_INFLUENCE_DISTANCE, MAX_INFLUENCE_DISTANCE);
        result.arrowSizeScale = std::clamp(arrowSizeScale,
                                           MIN_ARROW_SIZE_SCALE, MAX_ARROW_SIZE_SCALE);
        return result;
    }

    bool operator==(const ViewSettings&) const = default;
};

}  // namespace graphlens
