#include "graphlens/render/Palette.h"

#include <algorithm>
#include <cmath>
#include <string>

namespace graphlens {

Color hsla(float hueDeg, float saturationPct, float lightnessPct, float alpha) {
    float h = std::fmod(hueDeg, 360.0f);
    if (h < 0.0f) h += 360.0f;
    const float s = std::clamp(saturationPct, 0.0f, 100.0f) / 100.0f;
    const float l = std::clamp(lightnessPct, 0.0f, 100.0f) / 100.0f;

    const float c = (1.0f - std::abs(2.0f * l - 1.0f)) * s;
    const float x = c * (1.0f - std::abs(std::fmod(h / 60.0f, 2.0f) - 1.0f));
    const float m = l - c / 2.0f;

    float r = 0.0f, g = 0.0f, b = 0.0f;
    if (h < 60.0f) {
        r = c; g = x;
    } else if (h < 120.0f) {
        r = x; g = c;
    } else if (h < 180.0f) {
        g = c; b = x;
    } else if (h < 240.0f) {
        g = x; b = c;
    } else if (h < 300.0f) {
        r = x; b = c;
    } else {
        r = c; b = x;
    }

    return {r + m, g + m, b + m, alpha};
}

uint32_t nodeIdHash(NodeId id) {
    uint32_t hash = 0;
    for (char c : std::to_string(id)) {
        hash = hash * 31u + static_cast<uint32_t>(static_cast<unsigned char>(c));
    }
    return hash;
}

float nodeHue(NodeId id) {
    return static_cast<float>(nodeIdHash(id) % 360u);
}

Color nodeColour(const GraphData& graph, NodeId id, float lightnessPct, float saturationBoost) {
    const float saturation = (graph.normalizedDegree(id) * 0.8f + 0.2f) * 100.0f + saturationBoost;
    return hsla(nodeHue(id), saturation, lightnessPct);
}

float edgeTypeHue(EdgeType type) {
    switch (type) {
        case EdgeType::Derivative: return 0.0f;
        case EdgeType::Subgenre: return 120.0f;
        case EdgeType::FusionGenre: return 240.0f;
    }
    return 0.0f;
}

Color edgeTypeColour(EdgeType type, float saturationPct, float alpha) {
    return hsla(edgeTypeHue(type), saturationPct, Lightness::EDGE, alpha);
}

float nodeLightness(Theme theme) {
    return theme == Theme::Light ? Lightness::NODE_LIGHT : Lightness::NODE_DARK;
}

Color backgroundColour(Theme theme) {
    return theme == Theme::Light ? Colors::BACKGROUND_LIGHT : Colors::BACKGROUND_DARK;
}

}  // namespace graphlens
