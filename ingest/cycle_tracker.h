#pragma once

#include <cstdint>

#include "../storage/cycle.h"
#include "reading.h"

// Detects cycle start/stop transitions for one device and emits each completed cycle exactly once.
class CycleTracker {
public:
    enum class Transition : uint8_t {
        NONE = 0,       // idle -> idle
        STARTED = 1,    // idle -> running
        CONTINUED = 2,  // running -> running
        COMPLETED = 3,  // running -> idle, cycle emitted
        RESTARTED = 4,  // idle -> running while a cycle was already open; stale one discarded
        IGNORED = 5,    // unavailable or out-of-order reading
    };

    Transition observe(const Reading& reading, Cycle& outCycle);

    bool cycleOpen() const;
    uint64_t openCycleStartMs() const;
    float openCycleDurationSec(uint64_t nowMs) const;

    void reset();

private:
    void openCycle(const Reading& reading);

    bool seenAny_ = false;
    bool hasPrevious_ = false;
    bool previousRunning_ = false;
    uint64_t previousTimestampMs_ = 0;

    bool open_ = false;
    uint64_t openStartMs_ = 0;
    float openStartTemperatureF_ = 0.0F;
};

const char* transitionToString(CycleTracker::Transition transition);
