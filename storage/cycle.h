#pragma once

#include <cstdint>

// One completed active-runtime interval. Immutable once persisted.
struct Cycle {
    uint64_t startMs = 0;
    uint64_t endMs = 0;
    float startTemperatureF = 0.0F;
    float endTemperatureF = 0.0F;
    bool hasOutdoorTemperature = false;
    float outdoorTemperatureF = 0.0F;

    float durationSec() const {
        return (endMs > startMs) ? static_cast<float>(endMs - startMs) / 1000.0F : 0.0F;
    }

    float temperatureDeltaF() const {
        return startTemperatureF - endTemperatureF;
    }
};
