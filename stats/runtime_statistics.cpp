#include "runtime_statistics.h"

#include "../time/wall_clock.h"

RollingStats computeRollingStats(const std::vector<Cycle>& cycles, uint16_t windowDays) {
    RollingStats out{};
    out.windowDays = windowDays;

    double runtimeSum = 0.0;
    double secondsPerDegreeSum = 0.0;
    for (const Cycle& cycle : cycles) {
        const double duration = static_cast<double>(cycle.durationSec());
        runtimeSum += duration;
        ++out.sampleCount;

        const float delta = cycle.temperatureDeltaF();
        if (delta != 0.0F) {
            const double magnitude = (delta < 0.0F) ? -static_cast<double>(delta) : static_cast<double>(delta);
            secondsPerDegreeSum += duration / magnitude;
            ++out.velocitySampleCount;
        }
    }

    out.totalRuntimeSec = static_cast<float>(runtimeSum);
    if (out.sampleCount > 0U) {
        out.hasAverageRuntime = true;
        out.averageRuntimeSec = static_cast<float>(runtimeSum / static_cast<double>(out.sampleCount));
    }
    if (out.velocitySampleCount > 0U) {
        out.hasAverageTimePerDegree = true;
        out.averageSecondsPerDegree =
            static_cast<float>(secondsPerDegreeSum / static_cast<double>(out.velocitySampleCount));
    }
    return out;
}

bool evaluateRuntimeAlert(float currentDurationSec, const RollingStats& stats, float threshold) {
    if (!stats.hasAverageRuntime || currentDurationSec <= 0.0F) {
        return false;
    }
    return currentDurationSec > (stats.averageRuntimeSec * threshold);
}

StatisticsEngine::StatisticsEngine(const CycleStore& store, uint16_t lookbackDays)
    : store_(store), lookbackDays_(lookbackDays) {}

StoreStatus StatisticsEngine::compute(uint64_t nowMs, RollingStats& outStats) const {
    const uint64_t spanMs = static_cast<uint64_t>(lookbackDays_) * kMsPerDay;
    const uint64_t cutoffMs = (nowMs > spanMs) ? (nowMs - spanMs) : 0U;

    std::vector<Cycle> window;
    const StoreStatus status = store_.querySince(cutoffMs, window);
    if (status != StoreStatus::OK) {
        outStats = RollingStats{};
        outStats.windowDays = lookbackDays_;
        return status;
    }

    outStats = computeRollingStats(window, lookbackDays_);
    return StoreStatus::OK;
}
