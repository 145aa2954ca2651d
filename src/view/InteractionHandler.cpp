#include "graphlens/view/InteractionHandler.h"

#include <cmath>

namespace graphlens {

InteractionHandler::InteractionHandler(Camera& camera, InteractionCallbacks callbacks)
    : camera_(camera)
    , callbacks_(std::move(callbacks)) {}

void InteractionHandler::onMouseDown(float x, float y) {
    beginDrag(x, y, 0.0f);
    if (callbacks_.onPointerCapture) {
        callbacks_.onPointerCapture(true);
    }
}

void InteractionHandler::onMouseMove(float x, float y) {
    if (state_ == State::Dragging) {
        dragTo(x, y);
        return;
    }

    if (state_ == State::Idle && callbacks_.onNodeHover) {
        callbacks_.onNodeHover(hitTestAt(x, y));
    }
}

void InteractionHandler::onMouseUp(float x, float y) {
    if (callbacks_.onPointerCapture) {
        callbacks_.onPointerCapture(false);
    }

    if (state_ == State::Dragging && totalDragDist_ < CLICK_DISTANCE_THRESHOLD) {
        reportClick(x, y);
    }
    state_ = State::Idle;
}

void InteractionHandler::onWheel(float x, float y, float deltaY) {
    const float factor = deltaY < 0.0f ? WHEEL_ZOOM_STEP : 1.0f / WHEEL_ZOOM_STEP;
    camera_.zoomAt(x * pixelRatio_, y * pixelRatio_, factor);
    notifyViewChange();
}

void InteractionHandler::onTouchStart(const std::vector<TouchPoint>& touches) {
    if (touches.size() == 1) {
        beginDrag(touches[0].x, touches[0].y, 0.0f);
    } else if (touches.size() == 2) {
        beginPinch(touches[0], touches[1]);
    }
}

void InteractionHandler::onTouchMove(const std::vector<TouchPoint>& touches) {
    if (state_ == State::Dragging && touches.size() == 1) {
        dragTo(touches[0].x, touches[0].y);
        return;
    }

    if (state_ != State::Pinching || touches.size() != 2) {
        return;
    }

    const float dx = touches[1].x - touches[0].x;
    const float dy = touches[1].y - touches[0].y;
    const float dist = std::sqrt(dx * dx + dy * dy);
    const float centerX = (touches[0].x + touches[1].x) / 2.0f;
    const float centerY = (touches[0].y + touches[1].y) / 2.0f;

    if (lastPinchDist_ > 0.0f && dist > 0.0f) {
        camera_.zoomAt(centerX * pixelRatio_, centerY * pixelRatio_, dist / lastPinchDist_);
    }
    camera_.pan((centerX - lastPinchCenterX_) * pixelRatio_,
                (centerY - lastPinchCenterY_) * pixelRatio_);

    lastPinchDist_ = dist;
    lastPinchCenterX_ = centerX;
    lastPinchCenterY_ = centerY;
    notifyViewChange();
}

void InteractionHandler::onTouchEnd(const std::vector<TouchPoint>& touches,
                                    const std::vector<TouchPoint>& changedTouches) {
    if (state_ == State::Dragging && totalDragDist_ < CLICK_DISTANCE_THRESHOLD &&
        changedTouches.size() == 1) {
        reportClick(changedTouches[0].x, changedTouches[0].y);
    }

    if (touches.empty()) {
        state_ = State::Idle;
    } else if (touches.size() == 1) {
        // Back from a pinch: keep panning, but the release must not click
        beginDrag(touches[0].x, touches[0].y, CLICK_DISTANCE_THRESHOLD + 1.0f);
    }
}

void InteractionHandler::beginDrag(float x, float y, float initialDistance) {
    camera_.cancelAnimation();
    state_ = State::Dragging;
    dragLastX_ = x;
    dragLastY_ = y;
    totalDragDist_ = initialDistance;
}

void InteractionHandler::dragTo(float x, float y) {
    const float dx = x - dragLastX_;
    const float dy = y - dragLastY_;
    totalDragDist_ += std::sqrt(dx * dx + dy * dy);
    camera_.pan(dx * pixelRatio_, dy * pixelRatio_);
    dragLastX_ = x;
    dragLastY_ = y;
    notifyViewChange();
}

void InteractionHandler::beginPinch(const TouchPoint& a, const TouchPoint& b) {
    camera_.cancelAnimation();
    state_ = State::Pinching;
    const float dx = b.x - a.x;
    const float dy = b.y - a.y;
    lastPinchDist_ = std::sqrt(dx * dx + dy * dy);
    lastPinchCenterX_ = (a.x + b.x) / 2.0f;
    lastPinchCenterY_ = (a.y + b.y) / 2.0f;
}

void InteractionHandler::reportClick(float x, float y) {
    if (callbacks_.onNodeClick) {
        callbacks_.onNodeClick(hitTestAt(x, y));
    }
}

std::optional<NodeId> InteractionHandler::hitTestAt(float x, float y) const {
    if (!callbacks_.hitTest) {
        return std::nullopt;
    }
    return callbacks_.hitTest(camera_.screenToWorld(x * pixelRatio_, y * pixelRatio_));
}

void InteractionHandler::notifyViewChange() {
    if (callbacks_.onViewChange) {
        callbacks_.onViewChange();
    }
}

}  // namespace graphlens
