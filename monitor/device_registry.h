#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "device_monitor.h"

// Owns one DeviceMonitor per configured thermostat. Devices share the weather cache,
// publisher and event log but never history or open-cycle state.
class DeviceRegistry {
public:
    DeviceRegistry(WeatherCache& weather, ISnapshotPublisher& publisher, Logger& logger);

    DeviceRegistry(const DeviceRegistry&) = delete;
    DeviceRegistry& operator=(const DeviceRegistry&) = delete;

    // Validates, registers and starts the device. A storage failure at startup does not
    // reject the device; it keeps publishing with history-backed fields absent.
    ConfigIssue addDevice(const MonitorConfig& config, uint64_t nowMs);

    DeviceMonitor::PollStatus poll(const std::string& deviceId, const Reading& reading);

    DeviceMonitor* find(const std::string& deviceId);
    size_t size() const;
    std::vector<std::string> deviceIds() const;

private:
    WeatherCache& weather_;
    ISnapshotPublisher& publisher_;
    Logger& logger_;

    mutable std::mutex mutex_;
    std::map<std::string, std::unique_ptr<DeviceMonitor>> devices_;
    uint8_t nextSlot_ = 0;
};
