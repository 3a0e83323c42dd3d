#pragma once

#include "canvascore/core/Types.h"

#include <cstdint>

namespace canvascore {

enum class InputType : uint8_t {
    Scroll,    ///< Wheel / trackpad scroll
    Magnify,   ///< Pinch zoom
    Pointer    ///< Press, drag or release
};

/// Platform gesture phase. Wheels without phase information report None.
enum class GesturePhase : uint8_t {
    None,
    Began,
    Changed,
    Ended,
    Momentum
};

/// One input event in screen coordinates
struct InputEvent {
    InputType type = InputType::Scroll;
    GesturePhase phase = GesturePhase::None;
    Point screenPosition;
    Point delta;               ///< Scroll delta; positive y scrolls content down
    float magnification = 0.0f;
    uint64_t timestampMs = 0;

    static InputEvent scroll(Point pos, Point delta, uint64_t timeMs,
                             GesturePhase phase = GesturePhase::None) {
        InputEvent e;
        e.type = InputType::Scroll;
        e.phase = phase;
        e.screenPosition = pos;
        e.delta = delta;
        e.timestampMs = timeMs;
        return e;
    }

    static InputEvent magnify(Point pos, float amount, uint64_t timeMs) {
        InputEvent e;
        e.type = InputType::Magnify;
        e.screenPosition = pos;
        e.magnification = amount;
        e.timestampMs = timeMs;
        return e;
    }

    static InputEvent pointer(Point pos, uint64_t timeMs) {
        InputEvent e;
        e.type = InputType::Pointer;
        e.screenPosition = pos;
        e.timestampMs = timeMs;
        return e;
    }
};

}  // namespace canvascore
