#include "monitor_config.h"

#include "../time/wall_clock.h"

namespace {
constexpr uint16_t kMaxLookbackDays = 365;
constexpr uint16_t kMaxRetentionDays = 3650;

uint64_t cutoffForDays(uint64_t nowMs, uint16_t days) {
    const uint64_t spanMs = static_cast<uint64_t>(days) * kMsPerDay;
    return (nowMs > spanMs) ? (nowMs - spanMs) : 0U;
}
}  // namespace

const char* configIssueToString(ConfigIssue issue) {
    switch (issue) {
        case ConfigIssue::NONE:
            return "NONE";
        case ConfigIssue::EMPTY_DEVICE_ID:
            return "EMPTY_DEVICE_ID";
        case ConfigIssue::EMPTY_HISTORY_PATH:
            return "EMPTY_HISTORY_PATH";
        case ConfigIssue::INVALID_ENERGY_RATE:
            return "INVALID_ENERGY_RATE";
        case ConfigIssue::INVALID_ALERT_THRESHOLD:
            return "INVALID_ALERT_THRESHOLD";
        case ConfigIssue::INVALID_LOOKBACK:
            return "INVALID_LOOKBACK";
        case ConfigIssue::INVALID_RETENTION:
            return "INVALID_RETENTION";
        case ConfigIssue::INVALID_PURGE_INTERVAL:
            return "INVALID_PURGE_INTERVAL";
        case ConfigIssue::INVALID_WEATHER_CACHE:
            return "INVALID_WEATHER_CACHE";
        case ConfigIssue::WEATHER_KEY_WITHOUT_ZIP:
            return "WEATHER_KEY_WITHOUT_ZIP";
        case ConfigIssue::ZIP_WITHOUT_WEATHER_KEY:
            return "ZIP_WITHOUT_WEATHER_KEY";
        case ConfigIssue::INVALID_COST_MODEL:
            return "INVALID_COST_MODEL";
        case ConfigIssue::INVALID_EFFICIENCY_MODEL:
            return "INVALID_EFFICIENCY_MODEL";
        case ConfigIssue::INVALID_RETRY_BACKOFF:
            return "INVALID_RETRY_BACKOFF";
        case ConfigIssue::DUPLICATE_DEVICE_ID:
            return "DUPLICATE_DEVICE_ID";
        default:
            return "UNKNOWN";
    }
}

ConfigIssue validateConfig(const MonitorConfig& config) {
    if (config.deviceId.empty()) {
        return ConfigIssue::EMPTY_DEVICE_ID;
    }
    if (config.historyPath.empty()) {
        return ConfigIssue::EMPTY_HISTORY_PATH;
    }
    if (config.hasEnergyRate && !(config.energyRatePerKwh > 0.0F)) {
        return ConfigIssue::INVALID_ENERGY_RATE;
    }
    if (!(config.alertThreshold > 1.0F)) {
        return ConfigIssue::INVALID_ALERT_THRESHOLD;
    }
    if (config.lookbackDays == 0U || config.lookbackDays > kMaxLookbackDays) {
        return ConfigIssue::INVALID_LOOKBACK;
    }
    if (config.retentionDays == 0U || config.retentionDays > kMaxRetentionDays) {
        return ConfigIssue::INVALID_RETENTION;
    }
    if (config.purgeIntervalSeconds == 0U) {
        return ConfigIssue::INVALID_PURGE_INTERVAL;
    }
    if (config.weatherCacheSeconds == 0U || config.weatherTimeoutMs == 0U) {
        return ConfigIssue::INVALID_WEATHER_CACHE;
    }
    if (!config.weatherApiKey.empty() && config.zipCode.empty()) {
        return ConfigIssue::WEATHER_KEY_WITHOUT_ZIP;
    }
    if (config.weatherApiKey.empty() && !config.zipCode.empty()) {
        return ConfigIssue::ZIP_WITHOUT_WEATHER_KEY;
    }
    if (!(config.assumedDrawKw > 0.0F) || config.cyclesPerDayEstimate < 0.0F) {
        return ConfigIssue::INVALID_COST_MODEL;
    }
    if (!(config.baselineSecondsPerDegree > 0.0F) || config.runtimeWeight < 0.0F ||
        config.velocityWeight < 0.0F) {
        return ConfigIssue::INVALID_EFFICIENCY_MODEL;
    }
    if (config.pendingRetryBaseMs == 0U || config.pendingRetryMaxMs < config.pendingRetryBaseMs) {
        return ConfigIssue::INVALID_RETRY_BACKOFF;
    }
    return ConfigIssue::NONE;
}

uint64_t retentionCutoffMs(const MonitorConfig& config, uint64_t nowMs) {
    const uint16_t days = (config.retentionDays > config.lookbackDays) ? config.retentionDays : config.lookbackDays;
    return cutoffForDays(nowMs, days);
}

uint64_t lookbackCutoffMs(const MonitorConfig& config, uint64_t nowMs) {
    return cutoffForDays(nowMs, config.lookbackDays);
}
