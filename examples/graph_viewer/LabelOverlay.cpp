#include "LabelOverlay.h"

#include <graphlens/render/Palette.h>

#include <algorithm>

namespace graphlens {

namespace {

ImU32 toImColor(const Color& c, float brightness, float opacity) {
    return ImGui::ColorConvertFloat4ToU32(ImVec4(
        std::min(c.r * brightness, 1.0f),
        std::min(c.g * brightness, 1.0f),
        std::min(c.b * brightness, 1.0f),
        c.a * opacity));
}

Rect toLogical(const Rect& r, float pixelRatio) {
    return {r.x / pixelRatio, r.y / pixelRatio, r.width / pixelRatio, r.height / pixelRatio};
}

}  // namespace

std::optional<NodeId> LabelOverlay::labelAt(const GraphView& view, float x, float y) const {
    const auto& labels = view.labels();
    for (auto it = labels.rbegin(); it != labels.rend(); ++it) {
        if (toLogical(it->rect, view.pixelRatio()).contains({x, y})) {
            return it->candidate.node;
        }
    }
    return std::nullopt;
}

void LabelOverlay::updateHover(GraphView& view, float x, float y) {
    std::optional<NodeId> current = labelAt(view, x, y);
    if (current == hoveredLabel_) {
        return;
    }
    if (hoveredLabel_) {
        view.onLabelLeave();
    }
    hoveredLabel_ = current;
    if (current) {
        view.onLabelEnter(*current, x, y);
    }
}

void LabelOverlay::clearHover(GraphView& view) {
    if (hoveredLabel_) {
        hoveredLabel_.reset();
        view.onLabelLeave();
    }
}

void LabelOverlay::draw(const GraphView& view, ImDrawList* drawList) const {
    const GraphData& graph = view.graph();
    const float ratio = view.pixelRatio();
    ImFont* font = ImGui::GetFont();

    for (const auto& label : view.labels()) {
        const NodeId id = label.candidate.node;
        const Rect r = toLogical(label.rect, ratio);
        const float brightness = label.appearance.brightness;
        const float opacity = label.appearance.opacity;

        const ImU32 background = toImColor(nodeColour(graph, id, Lightness::LABEL_BACKGROUND), brightness, opacity);
        const ImU32 border = toImColor(nodeColour(graph, id, Lightness::LABEL_BORDER), brightness, opacity);
        const ImU32 text = toImColor(nodeColour(graph, id, Lightness::LABEL_TEXT), brightness, opacity);

        drawList->AddRectFilled(ImVec2(r.left(), r.top()), ImVec2(r.right(), r.bottom()), background);
        drawList->AddRectFilled(ImVec2(r.left(), r.bottom() - BORDER_THICKNESS),
                                ImVec2(r.right(), r.bottom()), border);

        const std::string& name = graph.getNode(id).label;
        const float fontSize = label.candidate.fontSize;
        const ImVec2 textSize = font->CalcTextSizeA(fontSize, r.width, 0.0f, name.c_str());
        const ImVec2 textPos(r.center().x - textSize.x / 2.0f,
                             r.top() + (r.height - BORDER_THICKNESS - textSize.y) / 2.0f);
        drawList->AddText(font, fontSize, textPos, text, name.c_str());
    }
}

}  // namespace graphlens
