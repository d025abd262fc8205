#pragma once

#include "../config/monitor_config.h"
#include "../stats/runtime_statistics.h"

struct EfficiencyParams {
    float baselineSecondsPerDegree = kBaselineSecondsPerDegree;
    float runtimeWeight = kRuntimePenaltyWeight;
    float velocityWeight = kVelocityPenaltyWeight;
};

struct CostParams {
    bool hasEnergyRate = false;
    float energyRatePerKwh = 0.0F;
    float assumedDrawKw = kAssumedDrawKw;
    // 0 derives cycles/day from the window's sample count.
    float cyclesPerDayEstimate = kDefaultCyclesPerDayEstimate;
};

namespace efficiency {

EfficiencyParams efficiencyParamsFromConfig(const MonitorConfig& config);
CostParams costParamsFromConfig(const MonitorConfig& config);

// score = clamp(100 - w1*max(0, r1-1)*100 - w2*max(0, r2-1)*100, 0, 100)
//   r1 = current / average runtime, r2 = average s/degree / baseline s/degree.
// Returns false (score absent) while average runtime is unknown.
bool computeScore(float currentDurationSec, const RollingStats& stats, const EfficiencyParams& params, float& outScore);

// daily cost = (avg runtime min x cycles/day / 60) x rate x kW.
// Returns false (cost absent) without a configured rate or average runtime.
bool estimateDailyCost(const RollingStats& stats, const CostParams& params, float& outCost);

}  // namespace efficiency
