#include "graphlens/view/GraphView.h"
#include "graphlens/common/Logger.h"
#include "graphlens/render/Palette.h"
#include "graphlens/view/HitTester.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace graphlens {

GraphView::GraphView(std::shared_ptr<const GraphData> graph,
                     std::unique_ptr<IGraphRenderer> renderer,
                     Camera::TimeSource clock)
    : graph_(graph ? std::move(graph) : throw std::invalid_argument("GraphView requires a graph"))
    , renderer_(renderer ? std::move(renderer) : throw std::invalid_argument("GraphView requires a renderer"))
    , clock_(clock ? std::move(clock) : Camera::TimeSource(&Camera::monotonicNowMs))
    , camera_(clock_)
    , interaction_(camera_, {})
    , labelEngine_(*graph_, settings_) {
    interaction_.setCallbacks(makeInteractionCallbacks());

    nodePositions_ = graph_->positionBuffer();
    renderer_->setNodePositions(nodePositions_);
    renderer_->setEdgePositions(graph_->edgePositionBuffer());
    restyle();

    LOG_INFO("uploaded {} nodes, {} edges (max degree {})",
             graph_->nodeCount(), graph_->edgeCount(), graph_->maxDegree());
}

InteractionCallbacks GraphView::makeInteractionCallbacks() {
    InteractionCallbacks callbacks;
    callbacks.onNodeClick = [this](std::optional<NodeId> hit) { handleCanvasClick(hit); };
    callbacks.onNodeHover = [this](std::optional<NodeId> hit) { handleCanvasHover(hit); };
    callbacks.onViewChange = [this]() { notifyViewChange(); };
    callbacks.hitTest = [this](const Point& world) {
        return hitTestNode(world, nodePositions_, style_.nodeSizes, HOVER_HIT_BUFFER);
    };
    callbacks.onPointerCapture = [this](bool capture) {
        if (callbacks_.onPointerCapture) {
            callbacks_.onPointerCapture(capture);
        }
    };
    return callbacks;
}

// ===== Host state =====

bool GraphView::isKnownNode(std::optional<NodeId> id, const char* what) const {
    if (id && !graph_->hasNode(*id)) {
        LOG_WARN("ignoring unknown {} node {}", what, *id);
        return false;
    }
    return true;
}

void GraphView::setSelected(std::optional<NodeId> id) {
    if (isKnownNode(id, "selected")) {
        applySelection(id, false);
    }
}

void GraphView::setHovered(std::optional<NodeId> id) {
    if (isKnownNode(id, "hovered")) {
        hoverTimer_.cancel();
        applyHover(id, false);
    }
}

void GraphView::setFocused(std::optional<NodeId> id) {
    if (!isKnownNode(id, "focused") || highlight_.focused == id) {
        return;
    }
    highlight_.focused = id;
    styleDirty_ = true;
}

void GraphView::setPath(std::optional<std::vector<NodeId>> path) {
    if (path) {
        for (NodeId id : *path) {
            if (!graph_->hasNode(id)) {
                LOG_WARN("ignoring path with unknown node {}", id);
                return;
            }
        }
    }
    highlight_.path = std::move(path);
    styleDirty_ = true;
}

void GraphView::setSettings(const ViewSettings& settings) {
    const ViewSettings next = settings.clamped();
    if (next == settings_) {
        return;
    }

    const bool netsChanged = next.visibleTypes != settings_.visibleTypes ||
                             next.maxInfluenceDistance != settings_.maxInfluenceDistance;
    settings_ = next;
    if (netsChanged) {
        recomputeSelectionNet();
        recomputeHoverNet();
    }
    styleDirty_ = true;
}

void GraphView::setViewportOffset(float x, float y) {
    offsetX_ = x;
    offsetY_ = y;
    applyViewportOffset();
    notifyViewChange();
}

void GraphView::resize(int drawableWidth, int drawableHeight, float pixelRatio) {
    pixelRatio_ = pixelRatio > 0.0f ? pixelRatio : 1.0f;
    interaction_.setPixelRatio(pixelRatio_);
    camera_.setCanvasSize(static_cast<float>(drawableWidth), static_cast<float>(drawableHeight));
    applyViewportOffset();
    renderer_->setViewport(drawableWidth, drawableHeight);

    if (!fitted_) {
        fitToContent();
        fitted_ = true;
    }
    notifyViewChange();
}

void GraphView::fitToContent() {
    camera_.fitToContent(nodePositions_);
}

void GraphView::applyViewportOffset() {
    camera_.setViewportOffset(offsetX_ * pixelRatio_, offsetY_ * pixelRatio_);
}

// ===== Input =====

void GraphView::onMouseDown(float x, float y) {
    interaction_.onMouseDown(x, y);
}

void GraphView::onMouseMove(float x, float y, bool overLabel) {
    hoverLock_.onPointerMove({x, y});

    if (labelDrag_) {
        const float dx = x - labelDrag_->lastX;
        const float dy = y - labelDrag_->lastY;
        labelDrag_->totalDist += std::sqrt(dx * dx + dy * dy);
        labelDrag_->lastX = x;
        labelDrag_->lastY = y;
        camera_.pan(dx * pixelRatio_, dy * pixelRatio_);
        notifyViewChange();
        return;
    }

    if (overLabel && interaction_.state() == InteractionHandler::State::Idle) {
        return;
    }
    interaction_.onMouseMove(x, y);
}

void GraphView::onMouseUp(float x, float y) {
    if (labelDrag_) {
        const LabelDrag drag = *labelDrag_;
        labelDrag_.reset();
        if (callbacks_.onPointerCapture) {
            callbacks_.onPointerCapture(false);
        }
        if (drag.totalDist < LABEL_DRAG_THRESHOLD) {
            toggleSelection(drag.node);
        }
        return;
    }

    interaction_.onMouseUp(x, y);
}

void GraphView::onWheel(float x, float y, float deltaY) {
    interaction_.onWheel(x, y, deltaY);
}

void GraphView::onTouchStart(const std::vector<TouchPoint>& touches) {
    interaction_.onTouchStart(touches);
}

void GraphView::onTouchMove(const std::vector<TouchPoint>& touches) {
    interaction_.onTouchMove(touches);
}

void GraphView::onTouchEnd(const std::vector<TouchPoint>& touches,
                           const std::vector<TouchPoint>& changedTouches) {
    interaction_.onTouchEnd(touches, changedTouches);
}

void GraphView::onLabelEnter(NodeId id, float x, float y) {
    if (hoverLock_.isLocked() || !graph_->hasNode(id)) {
        return;
    }
    labelHoverTimer_.schedule(clock_(), [this, id, x, y]() {
        hoverLock_.engage({x, y});
        applyHover(id, true);
    });
}

void GraphView::onLabelLeave() {
    labelHoverTimer_.cancel();
    hoverLock_.release();
    applyHover(std::nullopt, true);
}

void GraphView::onLabelPointerDown(NodeId id, float x, float y) {
    if (!graph_->hasNode(id)) {
        return;
    }
    labelDrag_ = LabelDrag{id, x, y, 0.0f};
    if (callbacks_.onPointerCapture) {
        callbacks_.onPointerCapture(true);
    }
}

void GraphView::handleCanvasClick(std::optional<NodeId> hit) {
    hoverTimer_.cancel();
    if (hit) {
        toggleSelection(*hit);
    } else {
        applySelection(std::nullopt, true);
    }
}

void GraphView::handleCanvasHover(std::optional<NodeId> hit) {
    hoverTimer_.cancel();
    if (hit == highlight_.hovered) {
        return;
    }
    hoverTimer_.schedule(clock_(), [this, hit]() { applyHover(hit, true); });
}

void GraphView::toggleSelection(NodeId id) {
    applySelection(highlight_.selected == id ? std::nullopt : std::optional<NodeId>(id), true);
}

// ===== State changes =====

void GraphView::applySelection(std::optional<NodeId> id, bool notify) {
    if (highlight_.selected == id) {
        return;
    }
    highlight_.selected = id;
    recomputeSelectionNet();
    styleDirty_ = true;

    if (id) {
        LOG_DEBUG("selected node {} ({} nodes in net)", *id, highlight_.selectionNet.nodeDistances.size());
        if (settings_.zoomOnSelect) {
            const Point target = graph_->getNode(*id).position;
            camera_.animateTo(target.x, target.y, std::max(camera_.zoom(), SELECT_MIN_ZOOM),
                              SELECT_ANIMATION_MS);
        }
    } else {
        LOG_DEBUG("selection cleared");
    }

    if (notify && callbacks_.onSelectionChange) {
        callbacks_.onSelectionChange(id);
    }
}

void GraphView::applyHover(std::optional<NodeId> id, bool notify) {
    if (highlight_.hovered == id) {
        return;
    }
    highlight_.hovered = id;
    recomputeHoverNet();
    styleDirty_ = true;

    if (notify && callbacks_.onHoverChange) {
        callbacks_.onHoverChange(id);
    }
}

void GraphView::recomputeSelectionNet() {
    highlight_.selectionNet = highlight_.selected
        ? computeCoverageNet(*graph_, *highlight_.selected, settings_.visibleTypes, settings_.maxDistance())
        : CoverageNet{};
}

void GraphView::recomputeHoverNet() {
    highlight_.hoverNet = highlight_.hovered
        ? computeCoverageNet(*graph_, *highlight_.hovered, settings_.visibleTypes, settings_.maxDistance())
        : CoverageNet{};
}

void GraphView::restyle() {
    style_ = FrameStyler(*graph_, settings_, highlight_).compute();
    renderer_->setNodeColors(style_.nodeColors);
    renderer_->setNodeSizes(style_.nodeSizes);
    renderer_->setEdgeColors(style_.edgeColors);
    renderer_->setArrows(style_.arrows);
    styleDirty_ = false;
}

// ===== Frame =====

void GraphView::frame() {
    const double now = clock_();
    hoverTimer_.poll(now);
    labelHoverTimer_.poll(now);

    if (camera_.isAnimating()) {
        camera_.tick();
        notifyViewChange();
    }

    if (styleDirty_) {
        restyle();
    }

    recentHover_.update(now, highlight_.hovered, highlight_.hoverNet);
    labels_ = labelEngine_.layout(camera_, highlight_, recentHover_.snapshot(), pixelRatio_);

    renderer_->render(camera_.getViewMatrix(), backgroundColour(settings_.theme),
                      settings_.arrowSizeScale, camera_.zoom() * pixelRatio_);
}

void GraphView::notifyViewChange() {
    if (callbacks_.onViewChange) {
        callbacks_.onViewChange();
    }
}

}  // namespace graphlens
