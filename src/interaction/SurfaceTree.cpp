#include "canvascore/interaction/SurfaceTree.h"

#include <algorithm>

namespace canvascore {

namespace {
constexpr float SCROLL_EPSILON = 0.5f;
}

// =============================================================================
// ScrollExtent
// =============================================================================

bool ScrollExtent::canScroll(const Point& delta) const {
    Point max = maxOffset();
    if (delta.y > 0.0f && offset.y < max.y - SCROLL_EPSILON) return true;
    if (delta.y < 0.0f && offset.y > SCROLL_EPSILON) return true;
    if (delta.x > 0.0f && offset.x < max.x - SCROLL_EPSILON) return true;
    if (delta.x < 0.0f && offset.x > SCROLL_EPSILON) return true;
    return false;
}

Point ScrollExtent::clampOffset(const Point& candidate) const {
    Point max = maxOffset();
    return {std::clamp(candidate.x, 0.0f, max.x), std::clamp(candidate.y, 0.0f, max.y)};
}

// =============================================================================
// SurfaceTree
// =============================================================================

SurfaceTree::SurfaceTree(const GraphStore& graph)
    : graph_(graph) {
}

void SurfaceTree::setScrollRegion(NodeId node, const Rect& frame, const Size& contentSize) {
    Region& region = regions_[node];
    region.frame = frame;
    region.extent.viewportSize = frame.size();
    region.extent.contentSize = contentSize;
    region.extent.offset = region.extent.clampOffset(region.extent.offset);
}

void SurfaceTree::setContentSize(NodeId node, const Size& contentSize) {
    auto it = regions_.find(node);
    if (it == regions_.end()) {
        return;
    }
    it->second.extent.contentSize = contentSize;
    it->second.extent.offset = it->second.extent.clampOffset(it->second.extent.offset);
}

void SurfaceTree::removeScrollRegion(NodeId node) {
    regions_.erase(node);
}

std::optional<Rect> SurfaceTree::scrollRegionBounds(NodeId node) const {
    auto it = regions_.find(node);
    const Node* owner = graph_.findNode(node);
    if (it == regions_.end() || !owner) {
        return std::nullopt;
    }
    return it->second.frame.translated(owner->position);
}

Point SurfaceTree::scrollBy(NodeId node, const Point& delta) {
    auto it = regions_.find(node);
    if (it == regions_.end()) {
        return {0, 0};
    }
    ScrollExtent& extent = it->second.extent;
    Point before = extent.offset;
    extent.offset = extent.clampOffset(extent.offset + delta);
    return extent.offset - before;
}

void SurfaceTree::raise(NodeId node) {
    raiseOrder_[node] = ++raiseCounter_;
}

void SurfaceTree::onNodeRemoved(NodeId node) {
    regions_.erase(node);
    raiseOrder_.erase(node);
}

void SurfaceTree::clear() {
    regions_.clear();
    raiseOrder_.clear();
    raiseCounter_ = 0;
}

bool SurfaceTree::isAbove(const Node& a, const Node& b) const {
    auto ia = raiseOrder_.find(a.id);
    auto ib = raiseOrder_.find(b.id);
    uint64_t za = ia != raiseOrder_.end() ? ia->second : 0;
    uint64_t zb = ib != raiseOrder_.end() ? ib->second : 0;
    if (za != zb) {
        return za > zb;
    }
    return a.id > b.id;
}

HitTestResult SurfaceTree::hitTest(const Point& world) const {
    auto snapshot = graph_.snapshot();

    const Node* top = nullptr;
    for (const auto& node : snapshot->nodes) {
        if (node.bounds().contains(world) && (!top || isAbove(node, *top))) {
            top = &node;
        }
    }
    if (!top) {
        return HitTestResult::canvas();
    }

    // Only the topmost node can claim the point; a region below it is occluded
    auto it = regions_.find(top->id);
    if (it != regions_.end() && it->second.frame.translated(top->position).contains(world)) {
        return {HitKind::ScrollRegion, top->id};
    }
    return {HitKind::NodeBody, top->id};
}

std::optional<ScrollExtent> SurfaceTree::scrollExtent(NodeId node) const {
    auto it = regions_.find(node);
    if (it == regions_.end() || !graph_.hasNode(node)) {
        return std::nullopt;
    }
    return it->second.extent;
}

}  // namespace canvascore
