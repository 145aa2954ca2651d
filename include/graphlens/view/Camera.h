#pragma once

#include "graphlens/core/Types.h"

#include <array>
#include <functional>
#include <optional>
#include <vector>

namespace graphlens {

/**
 * @brief 2D orthographic camera with pan, zoom and viewport offset
 *
 * Zoom is measured in screen pixels per world unit. The viewport offset
 * shifts the projection centre by half its value on each axis, so content
 * stays centred in the part of the canvas not covered by a docked panel.
 *
 * Animation time comes from an injectable monotonic clock (milliseconds),
 * which defaults to std::chrono::steady_clock.
 */
class Camera {
public:
    /// Monotonic clock returning milliseconds
    using TimeSource = std::function<double()>;

    static constexpr float MIN_ZOOM = 0.01f;
    static constexpr float MAX_ZOOM = 200.0f;
    static constexpr float DEFAULT_FIT_PADDING = 50.0f;
    static constexpr double DEFAULT_ANIMATION_MS = 300.0;

    explicit Camera(TimeSource timeSource = {});

    /// Default time source: std::chrono::steady_clock in milliseconds
    static double monotonicNowMs();

    // ===== Viewport =====

    /// Canvas size in drawable pixels; values below 1 are clamped to 1
    void setCanvasSize(float width, float height);
    Size canvasSize() const { return {canvasWidth_, canvasHeight_}; }

    /// Docked panel compensation in drawable pixels; negative values become 0
    void setViewportOffset(float x, float y);
    Point viewportOffset() const { return {offsetX_, offsetY_}; }

    // ===== Navigation =====

    /// Pan by a screen-space delta. Cancels animation.
    void pan(float dx, float dy);

    /// Zoom by @p factor keeping the world point under (sx, sy) fixed. Cancels animation.
    void zoomAt(float sx, float sy, float factor);

    /**
     * @brief Centre on the bounding box of @p positions and zoom to fit it
     * @param positions Interleaved x,y pairs
     * @param padding Screen-space margin on every side
     *
     * Fewer than one complete pair is a no-op. An axis with zero extent
     * does not constrain zoom; when both do, zoom is left unchanged.
     */
    void fitToContent(const std::vector<float>& positions, float padding = DEFAULT_FIT_PADDING);

    /// Jump to a world position. Cancels animation.
    void lookAt(float worldX, float worldY, std::optional<float> zoom = std::nullopt);

    /// Ease-out cubic transition to the given centre and zoom
    void animateTo(float worldX, float worldY, float zoom, double durationMs = DEFAULT_ANIMATION_MS);

    /// Advance the running animation. Returns true while still animating.
    bool tick();

    void cancelAnimation() { animation_.reset(); }
    bool isAnimating() const { return animation_.has_value(); }

    // ===== Projection =====

    float zoom() const { return zoom_; }
    Point center() const { return {x_, y_}; }

    Point screenToWorld(float sx, float sy) const;
    Point screenToWorld(const Point& screen) const { return screenToWorld(screen.x, screen.y); }
    Point worldToScreen(float wx, float wy) const;
    Point worldToScreen(const Point& world) const { return worldToScreen(world.x, world.y); }

    /// Column-major 3x3 matrix mapping world space to clip space
    std::array<float, 9> getViewMatrix() const;

    /// World-space box covered by the canvas
    Bounds getVisibleBounds() const;

private:
    struct Animation {
        float startX = 0.0f;
        float startY = 0.0f;
        float startZoom = 1.0f;
        float targetX = 0.0f;
        float targetY = 0.0f;
        float targetZoom = 1.0f;
        double startTime = 0.0;
        double duration = DEFAULT_ANIMATION_MS;
    };

    static float clampZoom(float zoom);
    Point projectionCenter() const;

    TimeSource timeSource_;

    float x_ = 0.0f;
    float y_ = 0.0f;
    float zoom_ = 1.0f;
    float canvasWidth_ = 1.0f;
    float canvasHeight_ = 1.0f;
    float offsetX_ = 0.0f;
    float offsetY_ = 0.0f;

    std::optional<Animation> animation_;
};

}  // namespace graphlens
