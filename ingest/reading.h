#pragma once

#include <cstdint>
#include <string>

// Latest raw snapshot polled from the climate device.
struct Reading {
    uint64_t timestampMs = 0;
    // False when the host could not read the climate entity at all.
    bool available = true;
    bool running = false;
    float currentTemperatureF = 0.0F;
    float targetTemperatureF = 0.0F;
    std::string hvacAction;
    std::string equipmentRunning;
};

inline bool equipmentIndicatesRunning(const std::string& equipmentRunning, const std::string& runningToken) {
    if (runningToken.empty()) {
        return false;
    }
    return equipmentRunning.find(runningToken) != std::string::npos;
}

// Builds a reading from climate-entity attributes; running is derived from the equipment label.
inline Reading readingFromClimateState(uint64_t timestampMs,
                                       float currentTemperatureF,
                                       float targetTemperatureF,
                                       const std::string& hvacAction,
                                       const std::string& equipmentRunning,
                                       const std::string& runningToken) {
    Reading out{};
    out.timestampMs = timestampMs;
    out.currentTemperatureF = currentTemperatureF;
    out.targetTemperatureF = targetTemperatureF;
    out.hvacAction = hvacAction;
    out.equipmentRunning = equipmentRunning;
    out.running = equipmentIndicatesRunning(equipmentRunning, runningToken);
    return out;
}
