#pragma once

#include "graphlens/core/GraphData.h"
#include "graphlens/labels/LabelHover.h"
#include "graphlens/labels/LabelLayoutEngine.h"
#include "graphlens/render/FrameStyler.h"
#include "graphlens/render/IGraphRenderer.h"
#include "graphlens/util/DebounceTimer.h"
#include "graphlens/view/Camera.h"
#include "graphlens/view/InteractionHandler.h"
#include "graphlens/view/ViewSettings.h"

#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace graphlens {

/**
 * @brief Wires camera, input, highlighting, labels and the renderer
 *
 * All methods run on the UI thread. The host forwards window events,
 * calls frame() once per displayed frame and draws labels() on top of the
 * rendered graph.
 *
 * Selection and hover changes made by the user are reported through
 * Callbacks; the setters used by the host do not call back.
 */
class GraphView {
public:
    static constexpr double HOVER_DEBOUNCE_MS = 80.0;
    static constexpr double LABEL_HOVER_DEBOUNCE_MS = 80.0;
    static constexpr float SELECT_MIN_ZOOM = 2.0f;
    static constexpr double SELECT_ANIMATION_MS = 300.0;
    static constexpr float LABEL_DRAG_THRESHOLD = 5.0f;

    struct Callbacks {
        std::function<void(std::optional<NodeId>)> onSelectionChange;
        std::function<void(std::optional<NodeId>)> onHoverChange;
        std::function<void()> onViewChange;
        std::function<void(bool)> onPointerCapture;
    };

    /**
     * @param graph Dataset shared with the host
     * @param renderer Drawing backend; static buffers are uploaded here
     * @param clock Monotonic millisecond clock for animation and debouncing
     * @throws std::invalid_argument if graph or renderer is null
     */
    GraphView(std::shared_ptr<const GraphData> graph,
              std::unique_ptr<IGraphRenderer> renderer,
              Camera::TimeSource clock = {});

    void setCallbacks(Callbacks callbacks) { callbacks_ = std::move(callbacks); }

    // ===== Host state =====

    void setSelected(std::optional<NodeId> id);
    void setHovered(std::optional<NodeId> id);
    void setFocused(std::optional<NodeId> id);
    void setPath(std::optional<std::vector<NodeId>> path);
    void setSettings(const ViewSettings& settings);

    /// Docked panel size in logical pixels
    void setViewportOffset(float x, float y);

    /// Drawable size in pixels and the drawable/logical pixel ratio.
    /// The first call also fits the camera to the dataset.
    void resize(int drawableWidth, int drawableHeight, float pixelRatio);

    void fitToContent();

    // ===== Input (logical pixels relative to the canvas) =====

    void onMouseDown(float x, float y);
    /// @param overLabel The cursor is over a label, which owns hover
    void onMouseMove(float x, float y, bool overLabel = false);
    void onMouseUp(float x, float y);
    void onWheel(float x, float y, float deltaY);
    void onTouchStart(const std::vector<TouchPoint>& touches);
    void onTouchMove(const std::vector<TouchPoint>& touches);
    void onTouchEnd(const std::vector<TouchPoint>& touches,
                    const std::vector<TouchPoint>& changedTouches);

    // Label overlay events
    void onLabelEnter(NodeId id, float x, float y);
    void onLabelLeave();
    void onLabelPointerDown(NodeId id, float x, float y);

    // ===== Frame =====

    /// Run timers and animation, restyle if needed, render, lay out labels
    void frame();

    const std::vector<PlacedLabel>& labels() const { return labels_; }

    // ===== Accessors =====

    const GraphData& graph() const { return *graph_; }
    const Camera& camera() const { return camera_; }
    Camera& camera() { return camera_; }
    const ViewSettings& settings() const { return settings_; }
    const HighlightState& highlight() const { return highlight_; }
    const FrameStyle& style() const { return style_; }
    std::optional<NodeId> selected() const { return highlight_.selected; }
    std::optional<NodeId> hovered() const { return highlight_.hovered; }
    std::optional<NodeId> focused() const { return highlight_.focused; }
    float pixelRatio() const { return pixelRatio_; }
    const InteractionHandler& interaction() const { return interaction_; }
    const RecentHoverTracker& recentHover() const { return recentHover_; }
    bool isHoverLocked() const { return hoverLock_.isLocked(); }
    bool isHoverPending() const { return hoverTimer_.isPending() || labelHoverTimer_.isPending(); }

private:
    struct LabelDrag {
        NodeId node = INVALID_NODE;
        float lastX = 0.0f;
        float lastY = 0.0f;
        float totalDist = 0.0f;
    };

    InteractionCallbacks makeInteractionCallbacks();
    bool isKnownNode(std::optional<NodeId> id, const char* what) const;

    void handleCanvasClick(std::optional<NodeId> hit);
    void handleCanvasHover(std::optional<NodeId> hit);
    void toggleSelection(NodeId id);

    void applySelection(std::optional<NodeId> id, bool notify);
    void applyHover(std::optional<NodeId> id, bool notify);
    void recomputeSelectionNet();
    void recomputeHoverNet();
    void restyle();
    void applyViewportOffset();
    void notifyViewChange();

    std::shared_ptr<const GraphData> graph_;
    std::unique_ptr<IGraphRenderer> renderer_;
    Camera::TimeSource clock_;

    ViewSettings settings_;
    Camera camera_;
    InteractionHandler interaction_;
    LabelLayoutEngine labelEngine_;
    Callbacks callbacks_;

    HighlightState highlight_;
    FrameStyle style_;
    std::vector<float> nodePositions_;
    bool styleDirty_ = true;

    DebounceTimer hoverTimer_{HOVER_DEBOUNCE_MS};
    DebounceTimer labelHoverTimer_{LABEL_HOVER_DEBOUNCE_MS};
    HoverLock hoverLock_;
    RecentHoverTracker recentHover_;
    std::optional<LabelDrag> labelDrag_;
    std::vector<PlacedLabel> labels_;

    float pixelRatio_ = 1.0f;
    float offsetX_ = 0.0f;
    float offsetY_ = 0.0f;
    bool fitted_ = false;
};

}  // namespace graphlens
