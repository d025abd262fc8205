#include "cycle_tracker.h"

CycleTracker::Transition CycleTracker::observe(const Reading& reading, Cycle& outCycle) {
    if (seenAny_ && reading.timestampMs <= previousTimestampMs_) {
        return Transition::IGNORED;
    }

    if (!reading.available) {
        // Running state and the open slot carry across the gap; only ordering advances.
        seenAny_ = true;
        previousTimestampMs_ = reading.timestampMs;
        return Transition::IGNORED;
    }

    const bool wasRunning = hasPrevious_ && previousRunning_;
    seenAny_ = true;
    hasPrevious_ = true;
    previousRunning_ = reading.running;
    previousTimestampMs_ = reading.timestampMs;

    if (reading.running) {
        if (wasRunning && open_) {
            return Transition::CONTINUED;
        }
        const bool duplicateStart = open_;
        openCycle(reading);
        return duplicateStart ? Transition::RESTARTED : Transition::STARTED;
    }

    if (!open_ || !wasRunning) {
        return Transition::NONE;
    }

    outCycle = Cycle{};
    outCycle.startMs = openStartMs_;
    outCycle.endMs = reading.timestampMs;
    outCycle.startTemperatureF = openStartTemperatureF_;
    outCycle.endTemperatureF = reading.currentTemperatureF;

    open_ = false;
    openStartMs_ = 0;
    openStartTemperatureF_ = 0.0F;
    return Transition::COMPLETED;
}

bool CycleTracker::cycleOpen() const {
    return open_;
}

uint64_t CycleTracker::openCycleStartMs() const {
    return openStartMs_;
}

float CycleTracker::openCycleDurationSec(uint64_t nowMs) const {
    if (!open_ || nowMs <= openStartMs_) {
        return 0.0F;
    }
    return static_cast<float>(nowMs - openStartMs_) / 1000.0F;
}

void CycleTracker::reset() {
    seenAny_ = false;
    hasPrevious_ = false;
    previousRunning_ = false;
    previousTimestampMs_ = 0;
    open_ = false;
    openStartMs_ = 0;
    openStartTemperatureF_ = 0.0F;
}

void CycleTracker::openCycle(const Reading& reading) {
    open_ = true;
    openStartMs_ = reading.timestampMs;
    openStartTemperatureF_ = reading.currentTemperatureF;
}

const char* transitionToString(CycleTracker::Transition transition) {
    switch (transition) {
        case CycleTracker::Transition::NONE:
            return "NONE";
        case CycleTracker::Transition::STARTED:
            return "STARTED";
        case CycleTracker::Transition::CONTINUED:
            return "CONTINUED";
        case CycleTracker::Transition::COMPLETED:
            return "COMPLETED";
        case CycleTracker::Transition::RESTARTED:
            return "RESTARTED";
        case CycleTracker::Transition::IGNORED:
            return "IGNORED";
        default:
            return "UNKNOWN";
    }
}
