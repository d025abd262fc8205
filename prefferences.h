#pragma once

#include <cstdint>

// Runtime-cycle analytics defaults. MonitorConfig copies these; hosts override per device.
constexpr const char* kDefaultDeviceId = "climate.ecobee";
constexpr const char* kDefaultDeviceName = "Ecobee AC Runtime";
constexpr const char* kDefaultHistoryPath = "ecobee_learning.db";
constexpr const char* kRunningEquipmentToken = "compCool";

// Alert when current runtime exceeds threshold x average (strict greater-than).
constexpr float kDefaultAlertThreshold = 1.5F;
constexpr uint16_t kDefaultLookbackDays = 30;
constexpr uint16_t kDefaultRetentionDays = 30;
constexpr uint32_t kDefaultPurgeIntervalSeconds = 3600;

// Cost model. Rate is unset by default so cost stays absent until configured.
constexpr float kDefaultEnergyRatePerKwh = 0.12F;
constexpr float kAssumedDrawKw = 3.5F;
constexpr float kDefaultCyclesPerDayEstimate = 24.0F;

// Efficiency model: 10 min per degree is treated as a healthy baseline.
constexpr float kBaselineSecondsPerDegree = 600.0F;
constexpr float kRuntimePenaltyWeight = 0.5F;
constexpr float kVelocityPenaltyWeight = 0.25F;

// Outdoor temperature lookup (weatherapi.com current conditions).
constexpr uint32_t kDefaultWeatherCacheSeconds = 300;
constexpr uint32_t kWeatherTimeoutMs = 2500;
constexpr const char* kWeatherApiHost = "api.weatherapi.com";
constexpr const char* kWeatherApiPath = "/v1/current.json";

// Failed appends are retried on later polls with doubling backoff.
constexpr uint32_t kPendingRetryBaseMs = 30000;
constexpr uint32_t kPendingRetryMaxMs = 600000;

// Diagnostics level: 0=ERROR, 1=WARN, 2=INFO, 3=DEBUG.
constexpr uint8_t kDiagnosticsLogLevel = 2;
