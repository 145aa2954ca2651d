#pragma once

#include <graphlens/view/GraphView.h>

#include <imgui.h>
#include <optional>

namespace graphlens {

/// Draws GraphView labels with ImGui and turns cursor motion over them
/// into label enter/leave events
class LabelOverlay {
public:
    /// Label under a logical-pixel cursor position, topmost first
    std::optional<NodeId> labelAt(const GraphView& view, float x, float y) const;

    /// Emit enter/leave when the label under the cursor changes
    void updateHover(GraphView& view, float x, float y);

    /// Cursor left the window
    void clearHover(GraphView& view);

    void draw(const GraphView& view, ImDrawList* drawList) const;

private:
    std::optional<NodeId> hoveredLabel_;

    static constexpr float BORDER_THICKNESS = 4.0f;
};

}  // namespace graphlens
