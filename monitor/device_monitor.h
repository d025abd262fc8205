#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>

#include "../config/monitor_config.h"
#include "../ingest/cycle_tracker.h"
#include "../ingest/reading.h"
#include "../logger.h"
#include "../model/efficiency_model.h"
#include "../snapshot/metric_snapshot.h"
#include "../stats/runtime_statistics.h"
#include "../storage/cycle_store.h"
#include "../weather/weather_cache.h"

// Per-device context: open-cycle slot, history handle and derived metrics for one thermostat.
// poll() runs the whole pipeline synchronously; calls for one device are serialized.
class DeviceMonitor {
public:
    enum class PollStatus : uint8_t {
        OK = 0,
        DEGRADED = 1,        // snapshot published with storage-backed fields absent or cycles pending
        STORAGE_FAILED = 2,  // history corrupt or exhausted; this device no longer persists
        REJECTED = 3,        // unavailable or out-of-order reading, nothing published
        NOT_STARTED = 4,
        UNKNOWN_DEVICE = 5,
    };

    DeviceMonitor(const MonitorConfig& config,
                  uint8_t deviceSlot,
                  WeatherCache& weather,
                  ISnapshotPublisher& publisher,
                  Logger& logger);

    DeviceMonitor(const DeviceMonitor&) = delete;
    DeviceMonitor& operator=(const DeviceMonitor&) = delete;

    // Opens the history file and runs the startup purge.
    StoreStatus begin(uint64_t nowMs);
    PollStatus poll(const Reading& reading);

    const MonitorConfig& config() const;
    uint8_t deviceSlot() const;
    bool started() const;
    bool storageFaulted() const;
    bool cycleOpen() const;
    size_t pendingCycleCount() const;
    bool hasSnapshot() const;
    MetricSnapshot lastSnapshot() const;

private:
    static constexpr size_t kPendingCapacity = 8;

    PollStatus pollLocked(const Reading& reading, MetricSnapshot& outSnapshot);
    bool ensureStoreOpenLocked(uint64_t nowMs);
    void persistCompletedLocked(const Cycle& cycle, uint64_t nowMs);
    void flushPendingLocked(uint64_t nowMs);
    void enqueuePendingLocked(const Cycle& cycle, uint64_t nowMs);
    void scheduleRetryLocked(uint64_t nowMs);
    void maybePurgeLocked(uint64_t nowMs);
    void noteStoreFailureLocked(StoreStatus status, uint64_t nowMs);
    void logWeatherLocked(const WeatherCache::Value& outdoor, uint64_t nowMs);
    DerivedMetrics deriveMetricsLocked(uint64_t nowMs, float currentRuntimeSec);

    const MonitorConfig config_;
    const uint8_t deviceSlot_;
    const EfficiencyParams efficiencyParams_;
    const CostParams costParams_;

    WeatherCache& weather_;
    ISnapshotPublisher& publisher_;
    Logger& logger_;

    mutable std::mutex mutex_;
    CycleStore store_;
    StatisticsEngine statistics_;
    CycleTracker tracker_;

    bool started_ = false;
    bool storageFaulted_ = false;

    std::array<Cycle, kPendingCapacity> pending_{};
    size_t pendingHead_ = 0;
    size_t pendingCount_ = 0;
    uint64_t nextRetryMs_ = 0;
    uint32_t retryBackoffMs_ = 0;

    bool hasPurged_ = false;
    uint64_t lastPurgeMs_ = 0;

    bool alertActive_ = false;
    bool historyNoticeLogged_ = false;

    bool hasSnapshot_ = false;
    MetricSnapshot lastSnapshot_{};
};

const char* pollStatusToString(DeviceMonitor::PollStatus status);
