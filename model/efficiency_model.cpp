#include "efficiency_model.h"

namespace {
constexpr float kMaxScore = 100.0F;

float clampFloat(float value, float minValue, float maxValue) {
    if (value < minValue) {
        return minValue;
    }
    if (value > maxValue) {
        return maxValue;
    }
    return value;
}

float excessOverOne(float ratio) {
    return (ratio > 1.0F) ? (ratio - 1.0F) : 0.0F;
}
}  // namespace

namespace efficiency {

EfficiencyParams efficiencyParamsFromConfig(const MonitorConfig& config) {
    EfficiencyParams out{};
    out.baselineSecondsPerDegree = config.baselineSecondsPerDegree;
    out.runtimeWeight = config.runtimeWeight;
    out.velocityWeight = config.velocityWeight;
    return out;
}

CostParams costParamsFromConfig(const MonitorConfig& config) {
    CostParams out{};
    out.hasEnergyRate = config.hasEnergyRate;
    out.energyRatePerKwh = config.energyRatePerKwh;
    out.assumedDrawKw = config.assumedDrawKw;
    out.cyclesPerDayEstimate = config.cyclesPerDayEstimate;
    return out;
}

bool computeScore(float currentDurationSec, const RollingStats& stats, const EfficiencyParams& params, float& outScore) {
    if (!stats.hasAverageRuntime) {
        return false;
    }

    const float current = (currentDurationSec > 0.0F) ? currentDurationSec : 0.0F;
    float runtimePenalty = 0.0F;
    if (stats.averageRuntimeSec > 0.0F) {
        runtimePenalty = excessOverOne(current / stats.averageRuntimeSec);
    } else if (current > 0.0F) {
        // Any runtime against a zero-length history is maximally inefficient.
        runtimePenalty = kMaxScore;
    }

    float velocityPenalty = 0.0F;
    if (stats.hasAverageTimePerDegree && params.baselineSecondsPerDegree > 0.0F) {
        velocityPenalty = excessOverOne(stats.averageSecondsPerDegree / params.baselineSecondsPerDegree);
    }

    const float score = kMaxScore - (params.runtimeWeight * runtimePenalty * kMaxScore) -
                        (params.velocityWeight * velocityPenalty * kMaxScore);
    outScore = clampFloat(score, 0.0F, kMaxScore);
    return true;
}

bool estimateDailyCost(const RollingStats& stats, const CostParams& params, float& outCost) {
    if (!params.hasEnergyRate || params.energyRatePerKwh <= 0.0F || !stats.hasAverageRuntime) {
        return false;
    }

    float cyclesPerDay = params.cyclesPerDayEstimate;
    if (cyclesPerDay <= 0.0F) {
        if (stats.windowDays == 0U) {
            return false;
        }
        cyclesPerDay = static_cast<float>(stats.sampleCount) / static_cast<float>(stats.windowDays);
    }

    const float averageRuntimeMinutes = stats.averageRuntimeSec / 60.0F;
    const float dailyRuntimeHours = (averageRuntimeMinutes * cyclesPerDay) / 60.0F;
    const float cost = dailyRuntimeHours * params.energyRatePerKwh * params.assumedDrawKw;
    outCost = (cost > 0.0F) ? cost : 0.0F;
    return true;
}

}  // namespace efficiency
