#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

#include "../storage/cycle.h"
#include "../storage/cycle_store.h"

// Recomputed on every query; never persisted.
struct RollingStats {
    size_t sampleCount = 0;
    bool hasAverageRuntime = false;
    float averageRuntimeSec = 0.0F;

    // Only cycles with a nonzero temperature delta contribute.
    size_t velocitySampleCount = 0;
    bool hasAverageTimePerDegree = false;
    float averageSecondsPerDegree = 0.0F;

    float totalRuntimeSec = 0.0F;
    uint16_t windowDays = 0;
};

RollingStats computeRollingStats(const std::vector<Cycle>& cycles, uint16_t windowDays);

// Strict greater-than: current == threshold x average does not alert.
bool evaluateRuntimeAlert(float currentDurationSec, const RollingStats& stats, float threshold);

class StatisticsEngine {
public:
    StatisticsEngine(const CycleStore& store, uint16_t lookbackDays);

    StoreStatus compute(uint64_t nowMs, RollingStats& outStats) const;

private:
    const CycleStore& store_;
    uint16_t lookbackDays_;
};
