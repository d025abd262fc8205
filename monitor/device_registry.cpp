#include "device_registry.h"

#include <memory>
#include <utility>

#include "../diagnostics/diag.h"

DeviceRegistry::DeviceRegistry(WeatherCache& weather, ISnapshotPublisher& publisher, Logger& logger)
    : weather_(weather), publisher_(publisher), logger_(logger) {}

ConfigIssue DeviceRegistry::addDevice(const MonitorConfig& config, uint64_t nowMs) {
    const ConfigIssue issue = validateConfig(config);
    if (issue != ConfigIssue::NONE) {
        diag::logf(DiagLevel::ERROR, "CONFIG", "%s rejected: %s", config.deviceId.c_str(), configIssueToString(issue));
        return issue;
    }

    DeviceMonitor* monitor = nullptr;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (devices_.find(config.deviceId) != devices_.end()) {
            diag::logf(DiagLevel::ERROR, "CONFIG", "%s already registered", config.deviceId.c_str());
            return ConfigIssue::DUPLICATE_DEVICE_ID;
        }

        auto created = std::make_unique<DeviceMonitor>(config, nextSlot_, weather_, publisher_, logger_);
        monitor = created.get();
        devices_[config.deviceId] = std::move(created);
        ++nextSlot_;
    }

    const StoreStatus status = monitor->begin(nowMs);
    if (status != StoreStatus::OK) {
        diag::logf(DiagLevel::WARN, "CONFIG", "%s started without history: %s", config.deviceId.c_str(),
                   storeStatusToString(status));
    }
    return ConfigIssue::NONE;
}

DeviceMonitor::PollStatus DeviceRegistry::poll(const std::string& deviceId, const Reading& reading) {
    DeviceMonitor* monitor = find(deviceId);
    if (monitor == nullptr) {
        return DeviceMonitor::PollStatus::UNKNOWN_DEVICE;
    }
    return monitor->poll(reading);
}

DeviceMonitor* DeviceRegistry::find(const std::string& deviceId) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto it = devices_.find(deviceId);
    return (it != devices_.end()) ? it->second.get() : nullptr;
}

size_t DeviceRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return devices_.size();
}

std::vector<std::string> DeviceRegistry::deviceIds() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<std::string> ids;
    ids.reserve(devices_.size());
    for (const auto& entry : devices_) {
        ids.push_back(entry.first);
    }
    return ids;
}
