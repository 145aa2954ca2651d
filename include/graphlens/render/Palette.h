#pragma once

#include "graphlens/core/GraphData.h"
#include "graphlens/core/Types.h"

#include <cstdint>

namespace graphlens {

enum class Theme {
    Dark,
    Light
};

/// Lightness values (percent) used when colouring nodes and their labels
namespace Lightness {
    constexpr float NODE_DARK = 60.0f;
    constexpr float NODE_LIGHT = 72.0f;
    constexpr float LABEL_BACKGROUND = 35.0f;
    constexpr float LABEL_BORDER = 25.0f;
    constexpr float LABEL_TEXT = 60.0f;
    constexpr float EDGE = 60.0f;
}

/// Saturation added to nodes previewed by the hover net
constexpr float HOVER_SATURATION_BOOST = 10.0f;

/**
 * @brief Convert HSL(A) to linear RGBA
 * @param hueDeg Hue in degrees, wrapped into [0, 360)
 * @param saturationPct Saturation in percent, clamped to [0, 100]
 * @param lightnessPct Lightness in percent, clamped to [0, 100]
 */
Color hsla(float hueDeg, float saturationPct, float lightnessPct, float alpha = 1.0f);

/// 31-multiplier hash over the decimal digits of @p id
uint32_t nodeIdHash(NodeId id);

/// Stable per-node hue in [0, 360)
float nodeHue(NodeId id);

/**
 * @brief Base colour of a node
 *
 * Hue comes from the id hash, saturation grows with degree
 * (20% for isolated nodes, 100% at maxDegree) plus @p saturationBoost.
 */
Color nodeColour(const GraphData& graph, NodeId id, float lightnessPct,
                 float saturationBoost = 0.0f);

/// Hue assigned to each edge type
float edgeTypeHue(EdgeType type);

Color edgeTypeColour(EdgeType type, float saturationPct, float alpha);

float nodeLightness(Theme theme);
Color backgroundColour(Theme theme);

namespace Colors {
    constexpr Color TRANSPARENT{0.0f, 0.0f, 0.0f, 0.0f};
    // hsla(0, 0%, 70%, 0.1)
    constexpr Color DIMMED_NODE{0.7f, 0.7f, 0.7f, 0.1f};
    // hsla(0, 0%, 20%, 0.1)
    constexpr Color DIMMED_EDGE{0.2f, 0.2f, 0.2f, 0.1f};
    constexpr Color BACKGROUND_DARK{0.0f, 0.0f, 0.0f, 1.0f};
    constexpr Color BACKGROUND_LIGHT{0.12f, 0.12f, 0.14f, 1.0f};
}

}  // namespace graphlens
