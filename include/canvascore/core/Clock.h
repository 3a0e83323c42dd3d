#pragma once

#include "Types.h"

#include <chrono>
#include <cstdint>

namespace canvascore {

/// Time source for the interaction context.
/// wallTimeMs() stamps createdAt/updatedAt; steadyTimeMs() drives debounce
/// and coalescing windows and never goes backwards.
class IClock {
public:
    virtual ~IClock() = default;

    virtual Timestamp wallTimeMs() const = 0;
    virtual uint64_t steadyTimeMs() const = 0;
};

class SystemClock : public IClock {
public:
    Timestamp wallTimeMs() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
    }

    uint64_t steadyTimeMs() const override {
        return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now().time_since_epoch()).count());
    }
};

}  // namespace canvascore
