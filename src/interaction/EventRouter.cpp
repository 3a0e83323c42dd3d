#include "canvascore/interaction/EventRouter.h"
#include "canvascore/common/Logger.h"

namespace canvascore {

const char* routeTargetToString(RouteTarget target) {
    switch (target) {
        case RouteTarget::Canvas: return "canvas";
        case RouteTarget::NodeScroll: return "node-scroll";
        case RouteTarget::Modal: return "modal";
    }
    return "unknown";
}

EventRouter::EventRouter(const SelectionState& selection,
                         const ISurfaceHitTester& surfaces,
                         const CanvasViewport& viewport,
                         RoutingConfig config)
    : selection_(selection)
    , surfaces_(surfaces)
    , viewport_(viewport)
    , config_(config) {
}

void EventRouter::reset() {
    mode_ = RouterMode::Idle;
    lockedNode_ = INVALID_NODE;
}

RouteDecision EventRouter::route(const InputEvent& event) {
    if (selection_.isModalActive()) {
        reset();
        lastEventMs_ = event.timestampMs;
        return {RouteTarget::Modal, INVALID_NODE, false};
    }

    switch (event.type) {
        case InputType::Magnify:
            return {RouteTarget::Canvas, INVALID_NODE, false};
        case InputType::Pointer:
            // A press starts a new interaction; no scroll gesture survives it
            reset();
            return {RouteTarget::Canvas, INVALID_NODE, false};
        case InputType::Scroll:
            break;
    }

    if (mode_ != RouterMode::Idle) {
        if (lockStillValid(event)) {
            lastEventMs_ = event.timestampMs;
            if (mode_ == RouterMode::NodeLocked) {
                return {RouteTarget::NodeScroll, lockedNode_, true};
            }
            return {RouteTarget::Canvas, INVALID_NODE, true};
        }
        LOG_TRACE("gesture lock released");
        reset();
    }

    RouteDecision decision = resolve(event);
    if (decision.target == RouteTarget::NodeScroll) {
        mode_ = RouterMode::NodeLocked;
        lockedNode_ = decision.node;
    } else {
        mode_ = RouterMode::CanvasLocked;
        lockedNode_ = INVALID_NODE;
    }
    lastEventMs_ = event.timestampMs;
    return decision;
}

bool EventRouter::lockStillValid(const InputEvent& event) const {
    uint64_t gap = event.timestampMs > lastEventMs_ ? event.timestampMs - lastEventMs_ : 0;
    if (gap >= config_.gestureReleaseMs) {
        return false;
    }
    if (gap > config_.gestureHoldMs && event.phase == GesturePhase::Began) {
        return false;
    }

    if (mode_ == RouterMode::NodeLocked) {
        // The locked region must still exist and belong to the selected node
        auto selected = selection_.effectiveSelection();
        if (!selected || *selected != lockedNode_ || !surfaces_.scrollExtent(lockedNode_)) {
            return false;
        }
    }
    return true;
}

RouteDecision EventRouter::resolve(const InputEvent& event) const {
    Point world = viewport_.screenToWorld(event.screenPosition);
    HitTestResult hit = surfaces_.hitTest(world);

    if (hit.kind != HitKind::ScrollRegion) {
        return {RouteTarget::Canvas, INVALID_NODE, false};
    }
    if (hit.node == INVALID_NODE) {
        LOG_DEBUG("scroll region hit without a node, routing to canvas");
        return {RouteTarget::Canvas, INVALID_NODE, false};
    }

    auto selected = selection_.effectiveSelection();
    if (!selected || *selected != hit.node) {
        return {RouteTarget::Canvas, INVALID_NODE, false};
    }

    auto extent = surfaces_.scrollExtent(hit.node);
    if (!extent) {
        LOG_DEBUG("node {} reported a scroll region but has none, routing to canvas", hit.node);
        return {RouteTarget::Canvas, INVALID_NODE, false};
    }
    if (!extent->canScroll(event.delta)) {
        return {RouteTarget::Canvas, INVALID_NODE, false};
    }
    return {RouteTarget::NodeScroll, hit.node, false};
}

}  // namespace canvascore
