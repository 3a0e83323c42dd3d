#pragma once

#include <canvascore/core/Clock.h>

namespace canvascore::test {

/// Clock advanced explicitly by the test
class ManualClock : public IClock {
public:
    explicit ManualClock(Timestamp wallStartMs = 1'700'000'000'000, uint64_t steadyStartMs = 1'000)
        : wallMs_(wallStartMs), steadyMs_(steadyStartMs) {}

    Timestamp wallTimeMs() const override { return wallMs_; }
    uint64_t steadyTimeMs() const override { return steadyMs_; }

    void advance(uint64_t ms) {
        wallMs_ += static_cast<Timestamp>(ms);
        steadyMs_ += ms;
    }

private:
    Timestamp wallMs_;
    uint64_t steadyMs_;
};

}  // namespace canvascore::test
