#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "../ingest/reading.h"
#include "../stats/runtime_statistics.h"
#include "../weather/weather_cache.h"

// Which upstream component left snapshot fields absent.
constexpr uint8_t kSnapshotFaultNone = 0;
constexpr uint8_t kSnapshotFaultStorage = 1U << 0;     // history could not be queried
constexpr uint8_t kSnapshotFaultHistory = 1U << 1;     // no cycles in the lookback window yet
constexpr uint8_t kSnapshotFaultWeather = 1U << 2;     // outdoor temperature unavailable
constexpr uint8_t kSnapshotFaultCostConfig = 1U << 3;  // no energy rate configured

struct DerivedMetrics {
    bool statsAvailable = false;
    RollingStats stats{};
    // In-progress cycle, or the cycle completed by this poll.
    float currentRuntimeSec = 0.0F;
    bool alert = false;
    bool hasEfficiencyScore = false;
    float efficiencyScore = 0.0F;
    bool costConfigured = false;
    bool hasEstimatedDailyCost = false;
    float estimatedDailyCost = 0.0F;
};

// One immutable reading exposed to the host per poll. Every has* field is either fully set or absent.
struct MetricSnapshot {
    uint64_t timestampMs = 0;
    // Primary value: open-cycle duration while running, else 0.
    float stateRuntimeSec = 0.0F;
    float currentRuntimeSec = 0.0F;

    bool hasAverageRuntime = false;
    float averageRuntimeSec = 0.0F;
    size_t sampleCount = 0;

    float currentTemperatureF = 0.0F;
    float targetTemperatureF = 0.0F;
    std::string hvacAction;
    std::string equipmentRunning;

    bool alert = false;

    bool hasAverageTimePerDegree = false;
    float averageSecondsPerDegree = 0.0F;

    bool hasEfficiencyScore = false;
    float efficiencyScore = 0.0F;

    bool hasEstimatedDailyCost = false;
    float estimatedDailyCost = 0.0F;

    bool hasOutdoorTemperature = false;
    bool outdoorTemperatureStale = false;
    float outdoorTemperatureF = 0.0F;

    uint8_t faults = kSnapshotFaultNone;
};

MetricSnapshot assembleSnapshot(const Reading& reading,
                                float openCycleDurationSec,
                                const DerivedMetrics& metrics,
                                const WeatherCache::Value& outdoor);

// The only contract the core has with its host platform.
class ISnapshotPublisher {
public:
    virtual ~ISnapshotPublisher() = default;
    virtual void publish(const std::string& metricName, const MetricSnapshot& snapshot) = 0;
};
