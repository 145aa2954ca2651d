#include "graphlens/view/Camera.h"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <limits>

namespace graphlens {

Camera::Camera(TimeSource timeSource)
    : timeSource_(timeSource ? std::move(timeSource) : TimeSource(&Camera::monotonicNowMs)) {}

double Camera::monotonicNowMs() {
    using namespace std::chrono;
    return duration<double, std::milli>(steady_clock::now().time_since_epoch()).count();
}

void Camera::setCanvasSize(float width, float height) {
    canvasWidth_ = std::max(width, 1.0f);
    canvasHeight_ = std::max(height, 1.0f);
}

void Camera::setViewportOffset(float x, float y) {
    offsetX_ = std::max(x, 0.0f);
    offsetY_ = std::max(y, 0.0f);
}

void Camera::pan(float dx, float dy) {
    animation_.reset();
    x_ -= dx / zoom_;
    y_ -= dy / zoom_;
}

void Camera::zoomAt(float sx, float sy, float factor) {
    animation_.reset();
    Point before = screenToWorld(sx, sy);
    zoom_ = clampZoom(zoom_ * factor);
    Point after = screenToWorld(sx, sy);
    x_ -= after.x - before.x;
    y_ -= after.y - before.y;
}

void Camera::fitToContent(const std::vector<float>& positions, float padding) {
    if (positions.size() < 2) {
        return;
    }

    float minX = std::numeric_limits<float>::infinity();
    float minY = std::numeric_limits<float>::infinity();
    float maxX = -std::numeric_limits<float>::infinity();
    float maxY = -std::numeric_limits<float>::infinity();
    for (size_t i = 0; i + 1 < positions.size(); i += 2) {
        minX = std::min(minX, positions[i]);
        maxX = std::max(maxX, positions[i]);
        minY = std::min(minY, positions[i + 1]);
        maxY = std::max(maxY, positions[i + 1]);
    }

    x_ = (minX + maxX) / 2.0f;
    y_ = (minY + maxY) / 2.0f;

    const float contentWidth = maxX - minX;
    const float contentHeight = maxY - minY;
    const float availableWidth = canvasWidth_ - std::abs(offsetX_) - padding * 2.0f;
    const float availableHeight = canvasHeight_ - std::abs(offsetY_) - padding * 2.0f;

    std::optional<float> fitted;
    if (contentWidth > 0.0f) {
        fitted = availableWidth / contentWidth;
    }
    if (contentHeight > 0.0f) {
        float ratio = availableHeight / contentHeight;
        fitted = fitted ? std::min(*fitted, ratio) : ratio;
    }

    // Padding larger than the canvas leaves no usable area
    if (fitted && *fitted > 0.0f) {
        zoom_ = clampZoom(*fitted);
    }
}

void Camera::lookAt(float worldX, float worldY, std::optional<float> zoom) {
    animation_.reset();
    x_ = worldX;
    y_ = worldY;
    if (zoom) {
        zoom_ = clampZoom(*zoom);
    }
}

void Camera::animateTo(float worldX, float worldY, float zoom, double durationMs) {
    Animation anim;
    anim.startX = x_;
    anim.startY = y_;
    anim.startZoom = zoom_;
    anim.targetX = worldX;
    anim.targetY = worldY;
    anim.targetZoom = clampZoom(zoom);
    anim.startTime = timeSource_();
    anim.duration = durationMs;
    animation_ = anim;
}

bool Camera::tick() {
    if (!animation_) {
        return false;
    }

    const Animation& anim = *animation_;
    double t = 1.0;
    if (anim.duration > 0.0) {
        double elapsed = std::max(timeSource_() - anim.startTime, 0.0);
        t = std::min(elapsed / anim.duration, 1.0);
    }

    const float ease = static_cast<float>(1.0 - std::pow(1.0 - t, 3.0));
    x_ = anim.startX + (anim.targetX - anim.startX) * ease;
    y_ = anim.startY + (anim.targetY - anim.startY) * ease;
    zoom_ = anim.startZoom + (anim.targetZoom - anim.startZoom) * ease;

    if (t >= 1.0) {
        animation_.reset();
    }
    return animation_.has_value();
}

Point Camera::screenToWorld(float sx, float sy) const {
    Point c = projectionCenter();
    return {(sx - c.x) / zoom_ + x_, (sy - c.y) / zoom_ + y_};
}

Point Camera::worldToScreen(float wx, float wy) const {
    Point c = projectionCenter();
    return {(wx - x_) * zoom_ + c.x, (wy - y_) * zoom_ + c.y};
}

std::array<float, 9> Camera::getViewMatrix() const {
    const float sx = 2.0f * zoom_ / canvasWidth_;
    const float sy = 2.0f * zoom_ / canvasHeight_;
    const float tx = -x_ * 2.0f * zoom_ / canvasWidth_ + offsetX_ / canvasWidth_;
    const float ty = y_ * 2.0f * zoom_ / canvasHeight_ - offsetY_ / canvasHeight_;

    return {sx, 0.0f, 0.0f,
            0.0f, -sy, 0.0f,
            tx, ty, 1.0f};
}

Bounds Camera::getVisibleBounds() const {
    Point a = screenToWorld(0.0f, 0.0f);
    Point b = screenToWorld(canvasWidth_, canvasHeight_);
    return {std::min(a.x, b.x), std::min(a.y, b.y),
            std::max(a.x, b.x), std::max(a.y, b.y)};
}

float Camera::clampZoom(float zoom) {
    return std::clamp(zoom, MIN_ZOOM, MAX_ZOOM);
}

Point Camera::projectionCenter() const {
    return {canvasWidth_ / 2.0f + offsetX_ / 2.0f, canvasHeight_ / 2.0f + offsetY_ / 2.0f};
}

}  // namespace graphlens
