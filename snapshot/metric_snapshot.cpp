#include "metric_snapshot.h"

MetricSnapshot assembleSnapshot(const Reading& reading,
                                float openCycleDurationSec,
                                const DerivedMetrics& metrics,
                                const WeatherCache::Value& outdoor) {
    MetricSnapshot out{};
    out.timestampMs = reading.timestampMs;
    out.stateRuntimeSec = (reading.running && openCycleDurationSec > 0.0F) ? openCycleDurationSec : 0.0F;
    out.currentRuntimeSec = metrics.currentRuntimeSec;

    out.currentTemperatureF = reading.currentTemperatureF;
    out.targetTemperatureF = reading.targetTemperatureF;
    out.hvacAction = reading.hvacAction;
    out.equipmentRunning = reading.equipmentRunning;

    if (!metrics.statsAvailable) {
        out.faults |= kSnapshotFaultStorage;
    } else {
        out.sampleCount = metrics.stats.sampleCount;
        if (metrics.stats.hasAverageRuntime) {
            out.hasAverageRuntime = true;
            out.averageRuntimeSec = metrics.stats.averageRuntimeSec;
            out.alert = metrics.alert;
        } else {
            out.faults |= kSnapshotFaultHistory;
        }
        if (metrics.stats.hasAverageTimePerDegree) {
            out.hasAverageTimePerDegree = true;
            out.averageSecondsPerDegree = metrics.stats.averageSecondsPerDegree;
        }
        if (metrics.hasEfficiencyScore) {
            out.hasEfficiencyScore = true;
            out.efficiencyScore = metrics.efficiencyScore;
        }
    }

    if (!metrics.costConfigured) {
        out.faults |= kSnapshotFaultCostConfig;
    } else if (metrics.statsAvailable && metrics.hasEstimatedDailyCost) {
        out.hasEstimatedDailyCost = true;
        out.estimatedDailyCost = metrics.estimatedDailyCost;
    }

    if (outdoor.present) {
        out.hasOutdoorTemperature = true;
        out.outdoorTemperatureStale = outdoor.stale;
        out.outdoorTemperatureF = outdoor.temperatureF;
    } else {
        out.faults |= kSnapshotFaultWeather;
    }

    return out;
}
