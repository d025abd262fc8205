#include <unity.h>

#include <cstdio>
#include <string>
#include <vector>

#include <sqlite3.h>
#include <sys/stat.h>
#include <unistd.h>

#include "config/monitor_config.h"
#include "logger.h"
#include "monitor/device_monitor.h"
#include "monitor/device_registry.h"
#include "storage/cycle_store.h"
#include "weather/weather_cache.h"

namespace {

constexpr uint64_t kT0 = 1700000000000ULL;
constexpr uint64_t kMinuteMs = 60000ULL;

class FakeWeatherSource : public IOutdoorTemperatureSource {
public:
    FetchResult fetchTemperatureF(float& outTemperatureF) override {
        ++calls;
        if (result == FetchResult::OK) {
            outTemperatureF = temperatureF;
        }
        return result;
    }

    FetchResult result = FetchResult::OK;
    float temperatureF = 91.0F;
    uint32_t calls = 0;
};

class RecordingPublisher : public ISnapshotPublisher {
public:
    void publish(const std::string& metricName, const MetricSnapshot& snapshot) override {
        names.push_back(metricName);
        last = snapshot;
    }

    std::vector<std::string> names;
    MetricSnapshot last{};
};

// Reads state back through the monitor from inside publish().
class ReadBackPublisher : public ISnapshotPublisher {
public:
    void publish(const std::string&, const MetricSnapshot& snapshot) override {
        published = snapshot;
        if (monitor != nullptr) {
            readBack = monitor->lastSnapshot();
            readBackOpen = monitor->cycleOpen();
        }
    }

    const DeviceMonitor* monitor = nullptr;
    MetricSnapshot published{};
    MetricSnapshot readBack{};
    bool readBackOpen = false;
};

size_t countEvents(const Logger& logger, LogEventType type, bool success) {
    size_t count = 0;
    LogEntry entry{};
    for (size_t i = 0; i < logger.size(); ++i) {
        if (logger.entryAt(i, entry) && entry.type == type && entry.success == success) {
            ++count;
        }
    }
    return count;
}

std::vector<std::string> gTempFiles;
std::vector<std::string> gTempDirs;

std::string tempPath(const char* name) {
    const std::string path =
        "/tmp/climate_learning_it_" + std::to_string(static_cast<long>(getpid())) + "_" + name;
    gTempFiles.push_back(path);
    gTempFiles.push_back(path + "-wal");
    gTempFiles.push_back(path + "-shm");
    return path;
}

std::string tempDir(const char* name) {
    const std::string path =
        "/tmp/climate_learning_it_" + std::to_string(static_cast<long>(getpid())) + "_" + name + "_dir";
    gTempDirs.push_back(path);
    return path;
}

void writeGarbageFile(const std::string& path) {
    FILE* file = std::fopen(path.c_str(), "wb");
    TEST_ASSERT_NOT_NULL(file);
    const std::string junk(2048, 'x');
    TEST_ASSERT_EQUAL_UINT32(junk.size(), std::fwrite(junk.data(), 1, junk.size(), file));
    std::fclose(file);
}

Cycle makeCycle(uint64_t startMs, uint64_t durationMs, float startF, float endF) {
    Cycle cycle{};
    cycle.startMs = startMs;
    cycle.endMs = startMs + durationMs;
    cycle.startTemperatureF = startF;
    cycle.endTemperatureF = endF;
    return cycle;
}

Reading makeReading(uint64_t timestampMs, bool running, float currentF) {
    Reading reading{};
    reading.timestampMs = timestampMs;
    reading.running = running;
    reading.currentTemperatureF = currentF;
    reading.targetTemperatureF = 72.0F;
    reading.hvacAction = running ? "cooling" : "idle";
    reading.equipmentRunning = running ? "compCool1" : "";
    return reading;
}

MonitorConfig makeConfig(const std::string& deviceId, const std::string& historyPath) {
    MonitorConfig config{};
    config.deviceId = deviceId;
    config.name = deviceId + " runtime";
    config.historyPath = historyPath;
    return config;
}

size_t storedCount(const std::string& path) {
    CycleStore reader;
    TEST_ASSERT_EQUAL(StoreStatus::OK, reader.open(path));
    size_t count = 0;
    TEST_ASSERT_EQUAL(StoreStatus::OK, reader.count(count));
    return count;
}

}  // namespace

void test_store_returns_cycles_ordered_by_start() {
    const std::string path = tempPath("ordered.db");
    CycleStore store;
    TEST_ASSERT_EQUAL(StoreStatus::OK, store.open(path));

    Cycle later = makeCycle(kT0 + 2 * kMinuteMs, 5 * kMinuteMs, 76.0F, 73.0F);
    later.hasOutdoorTemperature = true;
    later.outdoorTemperatureF = 95.5F;
    TEST_ASSERT_EQUAL(StoreStatus::OK, store.append(later));
    TEST_ASSERT_EQUAL(StoreStatus::OK, store.append(makeCycle(kT0, kMinuteMs, 75.0F, 74.0F)));

    std::vector<Cycle> cycles;
    TEST_ASSERT_EQUAL(StoreStatus::OK, store.querySince(0, cycles));
    TEST_ASSERT_EQUAL_UINT32(2, cycles.size());
    TEST_ASSERT_TRUE(cycles[0].startMs == kT0);
    TEST_ASSERT_FALSE(cycles[0].hasOutdoorTemperature);
    TEST_ASSERT_TRUE(cycles[1].startMs == kT0 + 2 * kMinuteMs);
    TEST_ASSERT_TRUE(cycles[1].hasOutdoorTemperature);
    TEST_ASSERT_FLOAT_WITHIN(0.01F, 95.5F, cycles[1].outdoorTemperatureF);

    TEST_ASSERT_EQUAL(StoreStatus::OK, store.querySince(kT0 + 1, cycles));
    TEST_ASSERT_EQUAL_UINT32(1, cycles.size());
}

void test_store_rejects_cycle_ending_before_start() {
    const std::string path = tempPath("invalid.db");
    CycleStore store;
    TEST_ASSERT_EQUAL(StoreStatus::OK, store.open(path));

    Cycle backwards = makeCycle(kT0, 0, 75.0F, 74.0F);
    backwards.endMs = kT0 - 1;
    TEST_ASSERT_EQUAL(StoreStatus::INVALID_CYCLE, store.append(backwards));

    size_t count = 99;
    TEST_ASSERT_EQUAL(StoreStatus::OK, store.count(count));
    TEST_ASSERT_EQUAL_UINT32(0, count);
}

void test_store_purge_keeps_cycles_at_or_after_cutoff() {
    const std::string path = tempPath("purge.db");
    CycleStore store;
    TEST_ASSERT_EQUAL(StoreStatus::OK, store.open(path));
    TEST_ASSERT_EQUAL(StoreStatus::OK, store.append(makeCycle(kT0 + 1000, 500, 75.0F, 74.0F)));
    TEST_ASSERT_EQUAL(StoreStatus::OK, store.append(makeCycle(kT0 + 2000, 500, 75.0F, 74.0F)));
    TEST_ASSERT_EQUAL(StoreStatus::OK, store.append(makeCycle(kT0 + 3000, 500, 75.0F, 74.0F)));

    size_t deleted = 0;
    TEST_ASSERT_EQUAL(StoreStatus::OK, store.purgeOlderThan(kT0 + 2000, deleted));
    TEST_ASSERT_EQUAL_UINT32(1, deleted);

    std::vector<Cycle> cycles;
    TEST_ASSERT_EQUAL(StoreStatus::OK, store.querySince(0, cycles));
    TEST_ASSERT_EQUAL_UINT32(2, cycles.size());
    TEST_ASSERT_TRUE(cycles[0].startMs == kT0 + 2000);

    TEST_ASSERT_EQUAL(StoreStatus::OK, store.purgeOlderThan(kT0 + 2000, deleted));
    TEST_ASSERT_EQUAL_UINT32(0, deleted);
}

void test_store_history_survives_reopen() {
    const std::string path = tempPath("reopen.db");
    {
        CycleStore store;
        TEST_ASSERT_EQUAL(StoreStatus::OK, store.open(path));
        TEST_ASSERT_EQUAL(StoreStatus::OK, store.append(makeCycle(kT0, 10 * kMinuteMs, 75.0F, 72.0F)));
        TEST_ASSERT_EQUAL_STRING(path.c_str(), store.path().c_str());
    }
    TEST_ASSERT_EQUAL_UINT32(1, storedCount(path));
}

void test_store_reports_corrupt_file() {
    const std::string path = tempPath("garbage.db");
    writeGarbageFile(path);

    CycleStore store;
    TEST_ASSERT_EQUAL(StoreStatus::CORRUPT, store.open(path));
    TEST_ASSERT_FALSE(store.isOpen());
    TEST_ASSERT_TRUE(isHardStoreFailure(StoreStatus::CORRUPT));
}

void test_store_missing_directory_is_transient() {
    CycleStore store;
    const std::string path = tempDir("missing") + "/history.db";
    TEST_ASSERT_EQUAL(StoreStatus::TRANSIENT_IO, store.open(path));
    TEST_ASSERT_FALSE(isHardStoreFailure(StoreStatus::TRANSIENT_IO));

    std::vector<Cycle> cycles;
    TEST_ASSERT_EQUAL(StoreStatus::NOT_OPEN, store.querySince(0, cycles));
}

void test_monitor_learns_from_completed_cycle() {
    FakeWeatherSource source;
    WeatherCache weather(source, 3600);
    RecordingPublisher publisher;
    Logger logger;
    DeviceMonitor monitor(makeConfig("climate.ecobee", tempPath("e2e.db")), 0, weather, publisher, logger);
    TEST_ASSERT_EQUAL(StoreStatus::OK, monitor.begin(kT0));

    TEST_ASSERT_EQUAL(DeviceMonitor::PollStatus::OK, monitor.poll(makeReading(kT0, true, 75.0F)));
    TEST_ASSERT_FALSE(publisher.last.hasAverageRuntime);
    TEST_ASSERT_FALSE(publisher.last.hasEfficiencyScore);
    TEST_ASSERT_TRUE((publisher.last.faults & kSnapshotFaultHistory) != 0U);
    TEST_ASSERT_TRUE(publisher.last.hasOutdoorTemperature);

    TEST_ASSERT_EQUAL(DeviceMonitor::PollStatus::OK, monitor.poll(makeReading(kT0 + 5 * kMinuteMs, true, 74.0F)));
    TEST_ASSERT_FLOAT_WITHIN(0.01F, 300.0F, publisher.last.stateRuntimeSec);

    TEST_ASSERT_EQUAL(DeviceMonitor::PollStatus::OK, monitor.poll(makeReading(kT0 + 10 * kMinuteMs, false, 72.0F)));
    const MetricSnapshot snapshot = publisher.last;
    TEST_ASSERT_EQUAL_FLOAT(0.0F, snapshot.stateRuntimeSec);
    TEST_ASSERT_FLOAT_WITHIN(0.01F, 600.0F, snapshot.currentRuntimeSec);
    TEST_ASSERT_TRUE(snapshot.hasAverageRuntime);
    TEST_ASSERT_FLOAT_WITHIN(0.01F, 600.0F, snapshot.averageRuntimeSec);
    TEST_ASSERT_EQUAL_UINT32(1, snapshot.sampleCount);
    TEST_ASSERT_TRUE(snapshot.hasAverageTimePerDegree);
    TEST_ASSERT_FLOAT_WITHIN(0.01F, 200.0F, snapshot.averageSecondsPerDegree);
    TEST_ASSERT_TRUE(snapshot.hasEfficiencyScore);
    TEST_ASSERT_FLOAT_WITHIN(0.01F, 100.0F, snapshot.efficiencyScore);
    TEST_ASSERT_FALSE(snapshot.hasEstimatedDailyCost);
    TEST_ASSERT_FALSE(snapshot.alert);
    TEST_ASSERT_EQUAL_STRING("climate.ecobee runtime", publisher.names.back().c_str());

    TEST_ASSERT_EQUAL_UINT32(1, logger.countOf(LogEventType::CYCLE_COMPLETED));
    TEST_ASSERT_EQUAL_UINT32(1, source.calls);
    TEST_ASSERT_EQUAL_UINT32(3, publisher.names.size());
}

void test_monitor_persists_outdoor_temperature_with_cycle() {
    FakeWeatherSource source;
    source.temperatureF = 97.0F;
    WeatherCache weather(source, 300);
    RecordingPublisher publisher;
    Logger logger;
    const std::string path = tempPath("outdoor.db");
    {
        DeviceMonitor monitor(makeConfig("climate.den", path), 0, weather, publisher, logger);
        monitor.begin(kT0);
        monitor.poll(makeReading(kT0, true, 75.0F));
        monitor.poll(makeReading(kT0 + 10 * kMinuteMs, false, 72.0F));
    }

    CycleStore reader;
    TEST_ASSERT_EQUAL(StoreStatus::OK, reader.open(path));
    std::vector<Cycle> cycles;
    TEST_ASSERT_EQUAL(StoreStatus::OK, reader.querySince(0, cycles));
    TEST_ASSERT_EQUAL_UINT32(1, cycles.size());
    TEST_ASSERT_TRUE(cycles[0].hasOutdoorTemperature);
    TEST_ASSERT_FLOAT_WITHIN(0.01F, 97.0F, cycles[0].outdoorTemperatureF);
}

void test_monitor_alerts_once_on_long_runtime() {
    FakeWeatherSource source;
    WeatherCache weather(source, 300);
    RecordingPublisher publisher;
    Logger logger;
    MonitorConfig config = makeConfig("climate.ecobee", tempPath("alert.db"));
    config.hasEnergyRate = true;
    config.energyRatePerKwh = 0.12F;
    DeviceMonitor monitor(config, 0, weather, publisher, logger);
    monitor.begin(kT0);

    monitor.poll(makeReading(kT0, true, 75.0F));
    monitor.poll(makeReading(kT0 + 10 * kMinuteMs, false, 72.0F));
    TEST_ASSERT_TRUE(publisher.last.hasEstimatedDailyCost);
    TEST_ASSERT_FLOAT_WITHIN(0.001F, 1.68F, publisher.last.estimatedDailyCost);

    const uint64_t t1 = kT0 + 60 * kMinuteMs;
    monitor.poll(makeReading(t1, true, 76.0F));
    monitor.poll(makeReading(t1 + 15 * kMinuteMs, true, 75.0F));
    TEST_ASSERT_FALSE(publisher.last.alert);

    monitor.poll(makeReading(t1 + 16 * kMinuteMs, true, 75.0F));
    TEST_ASSERT_TRUE(publisher.last.alert);
    TEST_ASSERT_TRUE(publisher.last.efficiencyScore < 100.0F);
    monitor.poll(makeReading(t1 + 17 * kMinuteMs, true, 75.0F));
    TEST_ASSERT_TRUE(publisher.last.alert);
    TEST_ASSERT_EQUAL_UINT32(1, logger.countOf(LogEventType::RUNTIME_ALERT));
}

void test_monitor_rejects_stale_and_unavailable_readings() {
    FakeWeatherSource source;
    WeatherCache weather(source, 300);
    RecordingPublisher publisher;
    Logger logger;
    DeviceMonitor monitor(makeConfig("climate.ecobee", tempPath("reject.db")), 0, weather, publisher, logger);

    TEST_ASSERT_EQUAL(DeviceMonitor::PollStatus::NOT_STARTED, monitor.poll(makeReading(kT0, true, 75.0F)));
    monitor.begin(kT0);

    monitor.poll(makeReading(kT0 + 1000, true, 75.0F));
    TEST_ASSERT_EQUAL(DeviceMonitor::PollStatus::REJECTED, monitor.poll(makeReading(kT0 + 500, false, 74.0F)));

    Reading missing{};
    missing.timestampMs = kT0 + 2000;
    missing.available = false;
    TEST_ASSERT_EQUAL(DeviceMonitor::PollStatus::REJECTED, monitor.poll(missing));
    TEST_ASSERT_TRUE(monitor.cycleOpen());

    TEST_ASSERT_EQUAL(DeviceMonitor::PollStatus::OK,
                      monitor.poll(makeReading(kT0 + 1000 + 10 * kMinuteMs, false, 72.0F)));
    TEST_ASSERT_FALSE(monitor.cycleOpen());
    TEST_ASSERT_EQUAL_UINT32(0, logger.countOf(LogEventType::DUPLICATE_CYCLE_START));
    TEST_ASSERT_EQUAL_UINT32(1, logger.countOf(LogEventType::CYCLE_COMPLETED));
    TEST_ASSERT_EQUAL_UINT32(2, logger.countOf(LogEventType::READING_REJECTED));
    TEST_ASSERT_EQUAL_UINT32(2, publisher.names.size());
    TEST_ASSERT_TRUE(publisher.last.hasAverageRuntime);
    TEST_ASSERT_FLOAT_WITHIN(0.01F, 600.0F, publisher.last.averageRuntimeSec);
}

void test_monitor_purges_on_start_and_interval() {
    const std::string path = tempPath("retention.db");
    {
        CycleStore seed;
        TEST_ASSERT_EQUAL(StoreStatus::OK, seed.open(path));
        TEST_ASSERT_EQUAL(StoreStatus::OK, seed.append(makeCycle(kT0 - 3 * kMsPerDay, kMinuteMs, 75.0F, 74.0F)));
        TEST_ASSERT_EQUAL(StoreStatus::OK, seed.append(makeCycle(kT0 - kMsPerDay / 2, kMinuteMs, 75.0F, 74.0F)));
    }

    FakeWeatherSource source;
    WeatherCache weather(source, 300);
    RecordingPublisher publisher;
    Logger logger;
    MonitorConfig config = makeConfig("climate.ecobee", path);
    config.retentionDays = 1;
    config.lookbackDays = 1;
    DeviceMonitor monitor(config, 0, weather, publisher, logger);

    TEST_ASSERT_EQUAL(StoreStatus::OK, monitor.begin(kT0));
    TEST_ASSERT_EQUAL_UINT32(1, logger.countOf(LogEventType::STORE_PURGED));
    TEST_ASSERT_EQUAL_UINT32(1, storedCount(path));

    monitor.poll(makeReading(kT0 + 1000, false, 74.0F));
    TEST_ASSERT_EQUAL_UINT32(1, logger.countOf(LogEventType::STORE_PURGED));
    TEST_ASSERT_EQUAL_UINT32(1, publisher.last.sampleCount);

    monitor.poll(makeReading(kT0 + kMsPerDay / 2 + 3600000, false, 74.0F));
    TEST_ASSERT_EQUAL_UINT32(2, logger.countOf(LogEventType::STORE_PURGED));
    TEST_ASSERT_EQUAL_UINT32(0, storedCount(path));
    TEST_ASSERT_FALSE(publisher.last.hasAverageRuntime);
}

void test_monitor_failed_purge_waits_for_next_interval() {
    const std::string path = tempPath("busy_purge.db");
    FakeWeatherSource source;
    WeatherCache weather(source, 300);
    RecordingPublisher publisher;
    Logger logger;
    DeviceMonitor monitor(makeConfig("climate.ecobee", path), 0, weather, publisher, logger);
    TEST_ASSERT_EQUAL(StoreStatus::OK, monitor.begin(kT0));
    TEST_ASSERT_EQUAL_UINT32(1, countEvents(logger, LogEventType::STORE_PURGED, true));

    // Another connection holds the write lock, so the scheduled purge times out busy.
    sqlite3* locker = nullptr;
    TEST_ASSERT_EQUAL_INT(SQLITE_OK, sqlite3_open(path.c_str(), &locker));
    TEST_ASSERT_EQUAL_INT(SQLITE_OK, sqlite3_exec(locker, "BEGIN IMMEDIATE;", nullptr, nullptr, nullptr));

    const uint64_t intervalMs = static_cast<uint64_t>(kDefaultPurgeIntervalSeconds) * 1000ULL;
    monitor.poll(makeReading(kT0 + intervalMs, false, 74.0F));
    TEST_ASSERT_EQUAL_UINT32(1, countEvents(logger, LogEventType::STORE_PURGED, false));
    TEST_ASSERT_FALSE(monitor.storageFaulted());

    monitor.poll(makeReading(kT0 + intervalMs + kMinuteMs, false, 74.0F));
    monitor.poll(makeReading(kT0 + intervalMs + 2 * kMinuteMs, false, 74.0F));
    TEST_ASSERT_EQUAL_UINT32(1, countEvents(logger, LogEventType::STORE_PURGED, false));

    TEST_ASSERT_EQUAL_INT(SQLITE_OK, sqlite3_exec(locker, "ROLLBACK;", nullptr, nullptr, nullptr));
    sqlite3_close(locker);

    monitor.poll(makeReading(kT0 + 2 * intervalMs, false, 74.0F));
    TEST_ASSERT_EQUAL_UINT32(2, countEvents(logger, LogEventType::STORE_PURGED, true));
    TEST_ASSERT_EQUAL_UINT32(1, countEvents(logger, LogEventType::STORE_PURGED, false));
}

void test_monitor_publisher_can_read_back_monitor() {
    FakeWeatherSource source;
    WeatherCache weather(source, 300);
    ReadBackPublisher publisher;
    Logger logger;
    DeviceMonitor monitor(makeConfig("climate.ecobee", tempPath("readback.db")), 0, weather, publisher, logger);
    publisher.monitor = &monitor;
    monitor.begin(kT0);

    TEST_ASSERT_EQUAL(DeviceMonitor::PollStatus::OK, monitor.poll(makeReading(kT0 + 1000, true, 75.0F)));
    TEST_ASSERT_TRUE(publisher.readBack.timestampMs == kT0 + 1000);
    TEST_ASSERT_TRUE(publisher.published.timestampMs == kT0 + 1000);
    TEST_ASSERT_TRUE(publisher.readBackOpen);
}

void test_monitor_retries_append_after_storage_recovers() {
    const std::string dir = tempDir("pending");
    const std::string path = dir + "/history.db";
    gTempFiles.push_back(path);
    gTempFiles.push_back(path + "-wal");
    gTempFiles.push_back(path + "-shm");

    FakeWeatherSource source;
    source.result = FetchResult::NOT_CONFIGURED;
    WeatherCache weather(source, 300);
    RecordingPublisher publisher;
    Logger logger;
    DeviceMonitor monitor(makeConfig("climate.ecobee", path), 0, weather, publisher, logger);

    TEST_ASSERT_EQUAL(StoreStatus::TRANSIENT_IO, monitor.begin(kT0));
    TEST_ASSERT_TRUE(monitor.started());
    TEST_ASSERT_FALSE(monitor.storageFaulted());

    TEST_ASSERT_EQUAL(DeviceMonitor::PollStatus::DEGRADED, monitor.poll(makeReading(kT0 + 1000, true, 75.0F)));
    TEST_ASSERT_TRUE((publisher.last.faults & kSnapshotFaultStorage) != 0U);

    TEST_ASSERT_EQUAL(DeviceMonitor::PollStatus::DEGRADED,
                      monitor.poll(makeReading(kT0 + 1000 + 10 * kMinuteMs, false, 72.0F)));
    TEST_ASSERT_EQUAL_UINT32(1, monitor.pendingCycleCount());
    TEST_ASSERT_FALSE(publisher.last.hasAverageRuntime);
    TEST_ASSERT_FLOAT_WITHIN(0.01F, 72.0F, publisher.last.currentTemperatureF);

    TEST_ASSERT_EQUAL_INT(0, mkdir(dir.c_str(), 0700));

    TEST_ASSERT_EQUAL(DeviceMonitor::PollStatus::OK,
                      monitor.poll(makeReading(kT0 + 1000 + 30 * kMinuteMs, false, 72.0F)));
    TEST_ASSERT_EQUAL_UINT32(0, monitor.pendingCycleCount());
    TEST_ASSERT_EQUAL_UINT32(1, logger.countOf(LogEventType::STORE_APPEND_RETRIED));
    TEST_ASSERT_TRUE(publisher.last.hasAverageRuntime);
    TEST_ASSERT_FLOAT_WITHIN(0.01F, 600.0F, publisher.last.averageRuntimeSec);
}

void test_registry_isolates_devices() {
    FakeWeatherSource source;
    WeatherCache weather(source, 3600);
    RecordingPublisher publisher;
    Logger logger;
    DeviceRegistry registry(weather, publisher, logger);

    TEST_ASSERT_EQUAL(ConfigIssue::NONE, registry.addDevice(makeConfig("climate.upstairs", tempPath("up.db")), kT0));
    TEST_ASSERT_EQUAL(ConfigIssue::NONE,
                      registry.addDevice(makeConfig("climate.downstairs", tempPath("down.db")), kT0));
    TEST_ASSERT_EQUAL(ConfigIssue::DUPLICATE_DEVICE_ID,
                      registry.addDevice(makeConfig("climate.upstairs", tempPath("dup.db")), kT0));

    MonitorConfig invalid = makeConfig("climate.attic", tempPath("attic.db"));
    invalid.lookbackDays = 0;
    TEST_ASSERT_EQUAL(ConfigIssue::INVALID_LOOKBACK, registry.addDevice(invalid, kT0));
    TEST_ASSERT_EQUAL_UINT32(2, registry.size());

    registry.poll("climate.upstairs", makeReading(kT0, true, 75.0F));
    registry.poll("climate.downstairs", makeReading(kT0, false, 71.0F));
    registry.poll("climate.upstairs", makeReading(kT0 + 10 * kMinuteMs, false, 72.0F));
    registry.poll("climate.downstairs", makeReading(kT0 + 10 * kMinuteMs, false, 71.0F));

    const DeviceMonitor* upstairs = registry.find("climate.upstairs");
    const DeviceMonitor* downstairs = registry.find("climate.downstairs");
    TEST_ASSERT_NOT_NULL(upstairs);
    TEST_ASSERT_NOT_NULL(downstairs);
    TEST_ASSERT_TRUE(upstairs->lastSnapshot().hasAverageRuntime);
    TEST_ASSERT_FALSE(downstairs->lastSnapshot().hasAverageRuntime);
    TEST_ASSERT_TRUE(upstairs->deviceSlot() != downstairs->deviceSlot());

    // Both devices share one location, so one upstream fetch covers them.
    TEST_ASSERT_EQUAL_UINT32(1, source.calls);

    TEST_ASSERT_EQUAL(DeviceMonitor::PollStatus::UNKNOWN_DEVICE,
                      registry.poll("climate.garage", makeReading(kT0 + 20 * kMinuteMs, true, 75.0F)));
}

void test_registry_hard_storage_failure_stays_local() {
    const std::string brokenPath = tempPath("broken.db");
    writeGarbageFile(brokenPath);

    FakeWeatherSource source;
    WeatherCache weather(source, 300);
    RecordingPublisher publisher;
    Logger logger;
    DeviceRegistry registry(weather, publisher, logger);

    TEST_ASSERT_EQUAL(ConfigIssue::NONE, registry.addDevice(makeConfig("climate.broken", brokenPath), kT0));
    TEST_ASSERT_EQUAL(ConfigIssue::NONE, registry.addDevice(makeConfig("climate.ok", tempPath("healthy.db")), kT0));
    TEST_ASSERT_TRUE(registry.find("climate.broken")->storageFaulted());
    TEST_ASSERT_EQUAL_UINT32(1, logger.countOf(LogEventType::STORE_FAULT));

    TEST_ASSERT_EQUAL(DeviceMonitor::PollStatus::STORAGE_FAILED,
                      registry.poll("climate.broken", makeReading(kT0 + 1000, true, 75.0F)));
    TEST_ASSERT_TRUE(publisher.last.hasOutdoorTemperature);
    TEST_ASSERT_FALSE(publisher.last.hasAverageRuntime);

    TEST_ASSERT_EQUAL(DeviceMonitor::PollStatus::OK,
                      registry.poll("climate.ok", makeReading(kT0 + 1000, true, 75.0F)));
    TEST_ASSERT_EQUAL(DeviceMonitor::PollStatus::OK,
                      registry.poll("climate.ok", makeReading(kT0 + 1000 + 10 * kMinuteMs, false, 72.0F)));
    TEST_ASSERT_TRUE(publisher.last.hasAverageRuntime);
}

void setUp() {}

void tearDown() {
    for (const std::string& path : gTempFiles) {
        std::remove(path.c_str());
    }
    gTempFiles.clear();
    for (const std::string& dir : gTempDirs) {
        rmdir(dir.c_str());
    }
    gTempDirs.clear();
}

int main(int, char**) {
    UNITY_BEGIN();

    RUN_TEST(test_store_returns_cycles_ordered_by_start);
    RUN_TEST(test_store_rejects_cycle_ending_before_start);
    RUN_TEST(test_store_purge_keeps_cycles_at_or_after_cutoff);
    RUN_TEST(test_store_history_survives_reopen);
    RUN_TEST(test_store_reports_corrupt_file);
    RUN_TEST(test_store_missing_directory_is_transient);
    RUN_TEST(test_monitor_learns_from_completed_cycle);
    RUN_TEST(test_monitor_persists_outdoor_temperature_with_cycle);
    RUN_TEST(test_monitor_alerts_once_on_long_runtime);
    RUN_TEST(test_monitor_rejects_stale_and_unavailable_readings);
    RUN_TEST(test_monitor_purges_on_start_and_interval);
    RUN_TEST(test_monitor_failed_purge_waits_for_next_interval);
    RUN_TEST(test_monitor_publisher_can_read_back_monitor);
    RUN_TEST(test_monitor_retries_append_after_storage_recovers);
    RUN_TEST(test_registry_isolates_devices);
    RUN_TEST(test_registry_hard_storage_failure_stays_local);

    return UNITY_END();
}
