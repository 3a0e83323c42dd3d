#include "canvascore/interaction/CanvasViewport.h"

#include <algorithm>

namespace canvascore {

CanvasViewport::CanvasViewport(ViewportConfig config)
    : config_(config)
    , zoom_(std::clamp(config.defaultZoom, config.minZoom, config.maxZoom)) {
}

Point CanvasViewport::worldToScreen(const Point& world) const {
    return {
        (world.x + panOffset_.x) * zoom_ + screenOffset_.x,
        (world.y + panOffset_.y) * zoom_ + screenOffset_.y
    };
}

Point CanvasViewport::screenToWorld(const Point& screen) const {
    return {
        (screen.x - screenOffset_.x) / zoom_ - panOffset_.x,
        (screen.y - screenOffset_.y) / zoom_ - panOffset_.y
    };
}

void CanvasViewport::pan(const Point& screenDelta) {
    panOffset_ = panOffset_ + screenDelta / zoom_;
}

void CanvasViewport::zoomAt(const Point& anchor, float zoom) {
    Point worldBefore = screenToWorld(anchor);

    float oldZoom = zoom_;
    zoom_ = std::clamp(zoom, config_.minZoom, config_.maxZoom);

    // Keep the anchor's world position under the pointer
    if (zoom_ != oldZoom) {
        Point worldAfter = screenToWorld(anchor);
        panOffset_.x += worldAfter.x - worldBefore.x;
        panOffset_.y += worldAfter.y - worldBefore.y;
    }
}

void CanvasViewport::reset() {
    panOffset_ = {0, 0};
    zoom_ = std::clamp(config_.defaultZoom, config_.minZoom, config_.maxZoom);
}

}  // namespace canvascore
