#pragma once

#include "canvascore/core/Types.h"

namespace canvascore {

struct ViewportConfig {
    float minZoom = 0.1f;
    float maxZoom = 3.0f;
    float defaultZoom = 1.0f;
    float wheelZoomStep = 0.1f;  ///< Zoom change per wheel notch
};

/// Canvas pan/zoom transform.
///   screen = (world + panOffset) * zoom + screenOffset
class CanvasViewport {
public:
    explicit CanvasViewport(ViewportConfig config = {});

    Point worldToScreen(const Point& world) const;
    Point screenToWorld(const Point& screen) const;

    /// Move the canvas content by a screen-space delta
    void pan(const Point& screenDelta);

    /// Set zoom (clamped) keeping the world point under `anchor` fixed on screen
    void zoomAt(const Point& anchor, float zoom);

    /// Additive zoom step, e.g. wheelZoomStep per notch
    void zoomBy(const Point& anchor, float delta) { zoomAt(anchor, zoom_ + delta); }

    /// Mouse wheel zoom: positive notches zoom in
    void wheelZoom(const Point& anchor, float notches) {
        zoomBy(anchor, notches * config_.wheelZoomStep);
    }

    /// Pinch gesture: relative magnification (0.1 = 10% larger)
    void magnify(const Point& anchor, float magnification) {
        zoomAt(anchor, zoom_ * (1.0f + magnification));
    }

    void reset();

    float zoom() const { return zoom_; }
    Point panOffset() const { return panOffset_; }
    void setPanOffset(const Point& offset) { panOffset_ = offset; }

    /// Canvas origin inside the window
    void setScreenOffset(const Point& offset) { screenOffset_ = offset; }
    Point screenOffset() const { return screenOffset_; }

    const ViewportConfig& config() const { return config_; }

private:
    ViewportConfig config_;
    Point panOffset_{0, 0};
    Point screenOffset_{0, 0};
    float zoom_ = 1.0f;
};

}  // namespace canvascore
