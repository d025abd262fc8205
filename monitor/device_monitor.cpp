#include "device_monitor.h"

#include "../diagnostics/diag.h"

namespace {
constexpr uint8_t kDetailPendingOverflow = 0xFE;
}  // namespace

DeviceMonitor::DeviceMonitor(const MonitorConfig& config,
                             uint8_t deviceSlot,
                             WeatherCache& weather,
                             ISnapshotPublisher& publisher,
                             Logger& logger)
    : config_(config),
      deviceSlot_(deviceSlot),
      efficiencyParams_(efficiency::efficiencyParamsFromConfig(config)),
      costParams_(efficiency::costParamsFromConfig(config)),
      weather_(weather),
      publisher_(publisher),
      logger_(logger),
      statistics_(store_, config.lookbackDays),
      retryBackoffMs_(config.pendingRetryBaseMs) {}

StoreStatus DeviceMonitor::begin(uint64_t nowMs) {
    std::lock_guard<std::mutex> lock(mutex_);
    started_ = true;

    const StoreStatus status = store_.open(config_.historyPath);
    if (status != StoreStatus::OK) {
        noteStoreFailureLocked(status, nowMs);
        if (!storageFaulted_) {
            scheduleRetryLocked(nowMs);
        }
        return status;
    }

    maybePurgeLocked(nowMs);
    diag::logf(DiagLevel::INFO, "MONITOR", "%s tracking %s", config_.name.c_str(), config_.deviceId.c_str());
    return StoreStatus::OK;
}

DeviceMonitor::PollStatus DeviceMonitor::poll(const Reading& reading) {
    MetricSnapshot snapshot{};
    const PollStatus status = pollLocked(reading, snapshot);
    if (status == PollStatus::OK || status == PollStatus::DEGRADED || status == PollStatus::STORAGE_FAILED) {
        // Published unlocked so a publisher may read back through this monitor.
        publisher_.publish(config_.name, snapshot);
    }
    return status;
}

DeviceMonitor::PollStatus DeviceMonitor::pollLocked(const Reading& reading, MetricSnapshot& outSnapshot) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!started_) {
        return PollStatus::NOT_STARTED;
    }

    const uint64_t nowMs = reading.timestampMs;

    Cycle completed{};
    const CycleTracker::Transition transition = tracker_.observe(reading, completed);
    if (transition == CycleTracker::Transition::IGNORED) {
        logger_.log(nowMs, deviceSlot_, LogEventType::READING_REJECTED, false, 0.0F, reading.available ? 1U : 0U);
        return PollStatus::REJECTED;
    }

    const WeatherCache::Value outdoor = weather_.getOutdoorTemperature(nowMs);
    logWeatherLocked(outdoor, nowMs);

    float currentRuntimeSec = 0.0F;
    switch (transition) {
        case CycleTracker::Transition::STARTED:
            logger_.log(nowMs, deviceSlot_, LogEventType::CYCLE_STARTED, true, reading.currentTemperatureF);
            break;
        case CycleTracker::Transition::RESTARTED:
            diag::logf(DiagLevel::WARN, "INGEST", "%s: duplicate cycle start, stale cycle discarded",
                       config_.deviceId.c_str());
            logger_.log(nowMs, deviceSlot_, LogEventType::DUPLICATE_CYCLE_START, false, reading.currentTemperatureF);
            break;
        case CycleTracker::Transition::COMPLETED:
            completed.hasOutdoorTemperature = outdoor.present;
            completed.outdoorTemperatureF = outdoor.temperatureF;
            currentRuntimeSec = completed.durationSec();
            logger_.log(nowMs, deviceSlot_, LogEventType::CYCLE_COMPLETED, true, currentRuntimeSec);
            persistCompletedLocked(completed, nowMs);
            break;
        default:
            break;
    }

    if (reading.running) {
        currentRuntimeSec = tracker_.openCycleDurationSec(nowMs);
    }

    if (transition != CycleTracker::Transition::COMPLETED) {
        flushPendingLocked(nowMs);
    }
    maybePurgeLocked(nowMs);

    const DerivedMetrics metrics = deriveMetricsLocked(nowMs, currentRuntimeSec);
    outSnapshot = assembleSnapshot(reading, tracker_.openCycleDurationSec(nowMs), metrics, outdoor);
    lastSnapshot_ = outSnapshot;
    hasSnapshot_ = true;

    if (storageFaulted_) {
        return PollStatus::STORAGE_FAILED;
    }
    if ((outSnapshot.faults & kSnapshotFaultStorage) != 0U || pendingCount_ > 0U) {
        return PollStatus::DEGRADED;
    }
    return PollStatus::OK;
}

const MonitorConfig& DeviceMonitor::config() const {
    return config_;
}

uint8_t DeviceMonitor::deviceSlot() const {
    return deviceSlot_;
}

bool DeviceMonitor::started() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return started_;
}

bool DeviceMonitor::storageFaulted() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return storageFaulted_;
}

bool DeviceMonitor::cycleOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return tracker_.cycleOpen();
}

size_t DeviceMonitor::pendingCycleCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return pendingCount_;
}

bool DeviceMonitor::hasSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return hasSnapshot_;
}

MetricSnapshot DeviceMonitor::lastSnapshot() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return lastSnapshot_;
}

bool DeviceMonitor::ensureStoreOpenLocked(uint64_t nowMs) {
    if (storageFaulted_) {
        return false;
    }
    if (store_.isOpen()) {
        return true;
    }
    if (nowMs < nextRetryMs_) {
        return false;
    }

    const StoreStatus status = store_.open(config_.historyPath);
    if (status != StoreStatus::OK) {
        noteStoreFailureLocked(status, nowMs);
        if (!storageFaulted_) {
            scheduleRetryLocked(nowMs);
        }
        return false;
    }

    retryBackoffMs_ = config_.pendingRetryBaseMs;
    return true;
}

void DeviceMonitor::persistCompletedLocked(const Cycle& cycle, uint64_t nowMs) {
    if (storageFaulted_) {
        logger_.log(nowMs, deviceSlot_, LogEventType::STORE_APPEND_FAILED, false, cycle.durationSec(),
                    static_cast<uint8_t>(StoreStatus::CORRUPT));
        return;
    }

    // Older queued cycles go first so history stays in completion order.
    flushPendingLocked(nowMs);
    if (pendingCount_ > 0U || !ensureStoreOpenLocked(nowMs)) {
        enqueuePendingLocked(cycle, nowMs);
        return;
    }

    const StoreStatus status = store_.append(cycle);
    if (status == StoreStatus::OK) {
        return;
    }

    logger_.log(nowMs, deviceSlot_, LogEventType::STORE_APPEND_FAILED, false, cycle.durationSec(),
                static_cast<uint8_t>(status));
    noteStoreFailureLocked(status, nowMs);
    if (!storageFaulted_ && status != StoreStatus::INVALID_CYCLE) {
        enqueuePendingLocked(cycle, nowMs);
    }
}

void DeviceMonitor::flushPendingLocked(uint64_t nowMs) {
    if (pendingCount_ == 0U || nowMs < nextRetryMs_ || !ensureStoreOpenLocked(nowMs)) {
        return;
    }

    while (pendingCount_ > 0U) {
        const Cycle& next = pending_[pendingHead_];
        const StoreStatus status = store_.append(next);
        if (status != StoreStatus::OK) {
            noteStoreFailureLocked(status, nowMs);
            if (!storageFaulted_) {
                scheduleRetryLocked(nowMs);
            }
            return;
        }

        logger_.log(nowMs, deviceSlot_, LogEventType::STORE_APPEND_RETRIED, true, next.durationSec());
        pendingHead_ = (pendingHead_ + 1U) % pending_.size();
        --pendingCount_;
    }

    retryBackoffMs_ = config_.pendingRetryBaseMs;
}

void DeviceMonitor::enqueuePendingLocked(const Cycle& cycle, uint64_t nowMs) {
    if (pendingCount_ == pending_.size()) {
        const Cycle& dropped = pending_[pendingHead_];
        logger_.log(nowMs, deviceSlot_, LogEventType::STORE_APPEND_FAILED, false, dropped.durationSec(),
                    kDetailPendingOverflow);
        diag::logf(DiagLevel::ERROR, "STORE", "%s: retry queue full, oldest cycle dropped", config_.deviceId.c_str());
        pendingHead_ = (pendingHead_ + 1U) % pending_.size();
        --pendingCount_;
    }

    const size_t tail = (pendingHead_ + pendingCount_) % pending_.size();
    pending_[tail] = cycle;
    ++pendingCount_;

    if (nextRetryMs_ <= nowMs) {
        scheduleRetryLocked(nowMs);
    }
}

void DeviceMonitor::scheduleRetryLocked(uint64_t nowMs) {
    nextRetryMs_ = nowMs + retryBackoffMs_;
    const uint32_t doubled = retryBackoffMs_ * 2U;
    retryBackoffMs_ = (doubled > config_.pendingRetryMaxMs || doubled < retryBackoffMs_) ? config_.pendingRetryMaxMs
                                                                                        : doubled;
}

void DeviceMonitor::maybePurgeLocked(uint64_t nowMs) {
    const uint64_t intervalMs = static_cast<uint64_t>(config_.purgeIntervalSeconds) * 1000ULL;
    if (hasPurged_ && nowMs >= lastPurgeMs_ && (nowMs - lastPurgeMs_) < intervalMs) {
        return;
    }
    if (storageFaulted_ || !store_.isOpen()) {
        return;
    }

    // A failed attempt also waits out the interval.
    hasPurged_ = true;
    lastPurgeMs_ = nowMs;

    size_t deleted = 0;
    const StoreStatus status = store_.purgeOlderThan(retentionCutoffMs(config_, nowMs), deleted);
    if (status != StoreStatus::OK) {
        logger_.log(nowMs, deviceSlot_, LogEventType::STORE_PURGED, false, 0.0F, static_cast<uint8_t>(status));
        noteStoreFailureLocked(status, nowMs);
        return;
    }

    logger_.log(nowMs, deviceSlot_, LogEventType::STORE_PURGED, true, static_cast<float>(deleted));
}

void DeviceMonitor::noteStoreFailureLocked(StoreStatus status, uint64_t nowMs) {
    if (!isHardStoreFailure(status) || storageFaulted_) {
        if (status != StoreStatus::OK) {
            diag::logf(DiagLevel::WARN, "STORE", "%s: %s, retrying later", config_.deviceId.c_str(),
                       storeStatusToString(status));
        }
        return;
    }

    storageFaulted_ = true;
    store_.close();
    logger_.log(nowMs, deviceSlot_, LogEventType::STORE_FAULT, false, 0.0F, static_cast<uint8_t>(status));
    diag::logf(DiagLevel::ERROR, "STORE", "%s: history %s (%s); persistence stopped",
               config_.deviceId.c_str(), config_.historyPath.c_str(), storeStatusToString(status));
}

void DeviceMonitor::logWeatherLocked(const WeatherCache::Value& outdoor, uint64_t nowMs) {
    if (!outdoor.fetchAttempted || outdoor.fetchResult == FetchResult::NOT_CONFIGURED) {
        return;
    }
    if (outdoor.fetchResult == FetchResult::OK) {
        logger_.log(nowMs, deviceSlot_, LogEventType::WEATHER_FETCHED, true, outdoor.temperatureF);
        return;
    }

    logger_.log(nowMs, deviceSlot_, LogEventType::WEATHER_FETCH_FAILED, false, outdoor.temperatureF,
                static_cast<uint8_t>(outdoor.fetchResult));
    diag::logf(DiagLevel::WARN, "WEATHER", "fetch failed (%s); %s",
               fetchResultToString(outdoor.fetchResult),
               outdoor.present ? "serving last known value" : "outdoor temperature unavailable");
}

DerivedMetrics DeviceMonitor::deriveMetricsLocked(uint64_t nowMs, float currentRuntimeSec) {
    DerivedMetrics out{};
    out.currentRuntimeSec = currentRuntimeSec;
    out.costConfigured = costParams_.hasEnergyRate;

    if (!ensureStoreOpenLocked(nowMs)) {
        return out;
    }

    const StoreStatus status = statistics_.compute(nowMs, out.stats);
    if (status != StoreStatus::OK) {
        noteStoreFailureLocked(status, nowMs);
        return out;
    }
    out.statsAvailable = true;

    if (!out.stats.hasAverageRuntime) {
        if (!historyNoticeLogged_) {
            diag::logf(DiagLevel::INFO, "STATS", "%s: not enough historical data yet", config_.deviceId.c_str());
            historyNoticeLogged_ = true;
        }
        alertActive_ = false;
        return out;
    }

    out.alert = evaluateRuntimeAlert(currentRuntimeSec, out.stats, config_.alertThreshold);
    if (out.alert && !alertActive_) {
        diag::logf(DiagLevel::WARN, "STATS", "Anomalous runtime detected! Current: %.1fs, Average: %.1fs",
                   static_cast<double>(currentRuntimeSec), static_cast<double>(out.stats.averageRuntimeSec));
        logger_.log(nowMs, deviceSlot_, LogEventType::RUNTIME_ALERT, true, currentRuntimeSec);
    }
    alertActive_ = out.alert;

    out.hasEfficiencyScore =
        efficiency::computeScore(currentRuntimeSec, out.stats, efficiencyParams_, out.efficiencyScore);
    out.hasEstimatedDailyCost = efficiency::estimateDailyCost(out.stats, costParams_, out.estimatedDailyCost);
    return out;
}

const char* pollStatusToString(DeviceMonitor::PollStatus status) {
    switch (status) {
        case DeviceMonitor::PollStatus::OK:
            return "OK";
        case DeviceMonitor::PollStatus::DEGRADED:
            return "DEGRADED";
        case DeviceMonitor::PollStatus::STORAGE_FAILED:
            return "STORAGE_FAILED";
        case DeviceMonitor::PollStatus::REJECTED:
            return "REJECTED";
        case DeviceMonitor::PollStatus::NOT_STARTED:
            return "NOT_STARTED";
        case DeviceMonitor::PollStatus::UNKNOWN_DEVICE:
            return "UNKNOWN_DEVICE";
        default:
            return "UNKNOWN";
    }
}
