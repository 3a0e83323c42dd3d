#pragma once

#include "canvascore/core/Types.h"
#include "canvascore/graph/GraphStore.h"

#include <algorithm>
#include <optional>
#include <unordered_map>

namespace canvascore {

/// Scroll state of one embedded region.
/// Offsets grow downward/rightward: positive delta scrolls toward the content's end.
struct ScrollExtent {
    Size contentSize;
    Size viewportSize;
    Point offset;

    Point maxOffset() const {
        return {std::max(0.0f, contentSize.width - viewportSize.width),
                std::max(0.0f, contentSize.height - viewportSize.height)};
    }

    bool hasOverflow() const {
        Point max = maxOffset();
        return max.x > 0.0f || max.y > 0.0f;
    }

    /// True if there is room to scroll in the direction of `delta`
    bool canScroll(const Point& delta) const;

    Point clampOffset(const Point& candidate) const;
};

enum class HitKind {
    Canvas,
    NodeBody,
    ScrollRegion
};

struct HitTestResult {
    HitKind kind = HitKind::Canvas;
    NodeId node = INVALID_NODE;

    static HitTestResult canvas() { return {}; }
};

/// Hit-test provider consulted by the EventRouter
class ISurfaceHitTester {
public:
    virtual ~ISurfaceHitTester() = default;

    /// Topmost surface under a world-space point
    virtual HitTestResult hitTest(const Point& world) const = 0;

    /// Scroll state of a node's region, if it has one
    virtual std::optional<ScrollExtent> scrollExtent(NodeId node) const = 0;
};

/**
 * @brief Node surfaces and their embedded scroll regions
 *
 * Regions are stored relative to their node's origin and resolved against
 * the node's current position in the GraphStore, so moving a node never
 * leaves a stale region behind. Stacking follows raise() order; nodes never
 * raised stack by id (newer above older).
 */
class SurfaceTree : public ISurfaceHitTester {
public:
    explicit SurfaceTree(const GraphStore& graph);

    /// Register or replace a node's scroll region (frame relative to the node origin)
    void setScrollRegion(NodeId node, const Rect& frame, const Size& contentSize);
    void setContentSize(NodeId node, const Size& contentSize);
    void removeScrollRegion(NodeId node);
    bool hasScrollRegion(NodeId node) const { return regions_.count(node) > 0; }

    /// Region bounds in world space
    std::optional<Rect> scrollRegionBounds(NodeId node) const;

    /// Scroll a region, clamped to its overflow. Returns the applied delta.
    Point scrollBy(NodeId node, const Point& delta);

    /// Bring a node to the front
    void raise(NodeId node);

    void onNodeRemoved(NodeId node);
    void clear();

    HitTestResult hitTest(const Point& world) const override;
    std::optional<ScrollExtent> scrollExtent(NodeId node) const override;

private:
    struct Region {
        Rect frame;
        ScrollExtent extent;
    };

    bool isAbove(const Node& a, const Node& b) const;

    const GraphStore& graph_;
    std::unordered_map<NodeId, Region> regions_;
    std::unordered_map<NodeId, uint64_t> raiseOrder_;
    uint64_t raiseCounter_ = 0;
};

}  // namespace canvascore
