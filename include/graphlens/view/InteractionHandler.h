#pragma once

#include "graphlens/core/Types.h"
#include "graphlens/view/Camera.h"

#include <cstdint>
#include <functional>
#include <optional>
#include <vector>

namespace graphlens {

/// One active finger, in logical pixels relative to the canvas
struct TouchPoint {
    int64_t id = 0;
    float x = 0.0f;
    float y = 0.0f;
};

/// Host hooks driven by InteractionHandler
struct InteractionCallbacks {
    std::function<void(std::optional<NodeId>)> onNodeClick;
    std::function<void(std::optional<NodeId>)> onNodeHover;
    std::function<void()> onViewChange;
    std::function<std::optional<NodeId>(const Point& world)> hitTest;
    /// true while a mouse drag needs events from outside the canvas
    std::function<void(bool)> onPointerCapture;
};

/**
 * @brief Turns raw pointer, wheel and touch events into camera motion,
 * clicks and hover reports
 *
 * Event coordinates are logical pixels. They are multiplied by the pixel
 * ratio before reaching the camera, whose canvas is in drawable pixels.
 * Hover reports are raw; debouncing is up to the receiver.
 */
class InteractionHandler {
public:
    enum class State {
        Idle,
        Dragging,
        Pinching
    };

    /// Accumulated movement (logical px) below which a release is a click
    static constexpr float CLICK_DISTANCE_THRESHOLD = 5.0f;
    static constexpr float WHEEL_ZOOM_STEP = 1.1f;

    InteractionHandler(Camera& camera, InteractionCallbacks callbacks);

    void setCallbacks(InteractionCallbacks callbacks) { callbacks_ = std::move(callbacks); }
    void setPixelRatio(float ratio) { pixelRatio_ = ratio > 0.0f ? ratio : 1.0f; }
    float pixelRatio() const { return pixelRatio_; }

    // Mouse
    void onMouseDown(float x, float y);
    void onMouseMove(float x, float y);
    void onMouseUp(float x, float y);
    void onWheel(float x, float y, float deltaY);

    // Touch: @p touches lists every finger still down after the event
    void onTouchStart(const std::vector<TouchPoint>& touches);
    void onTouchMove(const std::vector<TouchPoint>& touches);
    void onTouchEnd(const std::vector<TouchPoint>& touches,
                    const std::vector<TouchPoint>& changedTouches);

    State state() const { return state_; }
    float dragDistance() const { return totalDragDist_; }

private:
    void beginDrag(float x, float y, float initialDistance);
    void dragTo(float x, float y);
    void beginPinch(const TouchPoint& a, const TouchPoint& b);
    void reportClick(float x, float y);
    std::optional<NodeId> hitTestAt(float x, float y) const;
    void notifyViewChange();

    Camera& camera_;
    InteractionCallbacks callbacks_;
    float pixelRatio_ = 1.0f;
    State state_ = State::Idle;

    float dragLastX_ = 0.0f;
    float dragLastY_ = 0.0f;
    float totalDragDist_ = 0.0f;

    float lastPinchDist_ = 0.0f;
    float lastPinchCenterX_ = 0.0f;
    float lastPinchCenterY_ = 0.0f;
};

}  // namespace graphlens
