#pragma once

#include <cstdint>
#include <string>

#include "../prefferences.h"

// Every option a tracked device recognizes. Built by the host, validated once before registration.
struct MonitorConfig {
    std::string deviceId = kDefaultDeviceId;
    std::string name = kDefaultDeviceName;
    std::string historyPath = kDefaultHistoryPath;

    bool hasEnergyRate = false;
    float energyRatePerKwh = kDefaultEnergyRatePerKwh;

    float alertThreshold = kDefaultAlertThreshold;
    uint16_t lookbackDays = kDefaultLookbackDays;
    uint16_t retentionDays = kDefaultRetentionDays;
    uint32_t purgeIntervalSeconds = kDefaultPurgeIntervalSeconds;

    uint32_t weatherCacheSeconds = kDefaultWeatherCacheSeconds;
    uint32_t weatherTimeoutMs = kWeatherTimeoutMs;
    std::string weatherApiKey;
    std::string zipCode;

    float assumedDrawKw = kAssumedDrawKw;
    // 0 derives cycles/day from the lookback window instead.
    float cyclesPerDayEstimate = kDefaultCyclesPerDayEstimate;
    float baselineSecondsPerDegree = kBaselineSecondsPerDegree;
    float runtimeWeight = kRuntimePenaltyWeight;
    float velocityWeight = kVelocityPenaltyWeight;

    std::string runningEquipmentToken = kRunningEquipmentToken;

    uint32_t pendingRetryBaseMs = kPendingRetryBaseMs;
    uint32_t pendingRetryMaxMs = kPendingRetryMaxMs;
};

enum class ConfigIssue : uint8_t {
    NONE = 0,
    EMPTY_DEVICE_ID = 1,
    EMPTY_HISTORY_PATH = 2,
    INVALID_ENERGY_RATE = 3,
    INVALID_ALERT_THRESHOLD = 4,
    INVALID_LOOKBACK = 5,
    INVALID_RETENTION = 6,
    INVALID_PURGE_INTERVAL = 7,
    INVALID_WEATHER_CACHE = 8,
    WEATHER_KEY_WITHOUT_ZIP = 9,
    ZIP_WITHOUT_WEATHER_KEY = 10,
    INVALID_COST_MODEL = 11,
    INVALID_EFFICIENCY_MODEL = 12,
    INVALID_RETRY_BACKOFF = 13,
    DUPLICATE_DEVICE_ID = 14,
};

const char* configIssueToString(ConfigIssue issue);

ConfigIssue validateConfig(const MonitorConfig& config);

// Purge keeps whichever horizon is longer so the lookback window is never cut short.
uint64_t retentionCutoffMs(const MonitorConfig& config, uint64_t nowMs);
uint64_t lookbackCutoffMs(const MonitorConfig& config, uint64_t nowMs);
