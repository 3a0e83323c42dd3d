#pragma once

#include "CanvasViewport.h"
#include "InputEvent.h"
#include "SelectionState.h"
#include "SurfaceTree.h"

#include <cstdint>

namespace canvascore {

struct RoutingConfig {
    uint32_t gestureHoldMs = 200;     ///< Gap that always continues a locked gesture
    uint32_t gestureReleaseMs = 500;  ///< Gap that always releases the lock
};

enum class RouteTarget {
    Canvas,      ///< Canvas pan/zoom
    NodeScroll,  ///< A node's embedded scroll region
    Modal        ///< Swallowed by the open modal
};

const char* routeTargetToString(RouteTarget target);

enum class RouterMode {
    Idle,
    CanvasLocked,
    NodeLocked
};

struct RouteDecision {
    RouteTarget target = RouteTarget::Canvas;
    NodeId node = INVALID_NODE;  ///< Set for NodeScroll
    bool fromLock = false;       ///< Decided by the gesture lock, not a fresh hit-test
};

/**
 * @brief Decides which consumer receives an input event
 *
 * Order of evaluation:
 * 1. An open modal takes every event; hit-testing is skipped.
 * 2. A scroll event inside the selected node's scroll region goes to that
 *    region when it can scroll in the event's direction.
 * 3. Everything else goes to the canvas.
 *
 * Scroll gestures lock onto the target of their first event:
 *
 *   gap <= hold             continue the lock
 *   hold < gap < release    continue, unless the event starts a new gesture (Began)
 *   gap >= release          release, re-resolve from Idle
 *
 * Mode changes only happen through Idle: Idle -> CanvasLocked/NodeLocked -> Idle.
 */
class EventRouter {
public:
    EventRouter(const SelectionState& selection,
                const ISurfaceHitTester& surfaces,
                const CanvasViewport& viewport,
                RoutingConfig config = {});

    RouteDecision route(const InputEvent& event);

    RouterMode mode() const { return mode_; }
    NodeId lockedNode() const { return lockedNode_; }

    /// Drop any gesture lock
    void reset();

    const RoutingConfig& config() const { return config_; }

private:
    RouteDecision resolve(const InputEvent& event) const;
    bool lockStillValid(const InputEvent& event) const;

    const SelectionState& selection_;
    const ISurfaceHitTester& surfaces_;
    const CanvasViewport& viewport_;
    RoutingConfig config_;

    RouterMode mode_ = RouterMode::Idle;
    NodeId lockedNode_ = INVALID_NODE;
    uint64_t lastEventMs_ = 0;
};

}  // namespace canvascore
