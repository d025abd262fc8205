#pragma once

#include <cstdint>
#include <mutex>

#include "outdoor_temperature_source.h"

// Time-bound cache over a rate-limited outdoor temperature lookup.
// At most one upstream fetch is issued per ttl window, counted from the last attempt
// whether or not it succeeded. One instance may be shared by every device at a location;
// the upstream call runs unlocked, so a slow fetch never blocks other callers.
class WeatherCache {
public:
    enum class State : uint8_t {
        EMPTY = 0,
        FRESH = 1,
        STALE = 2,
    };

    struct Value {
        bool present = false;
        bool stale = false;
        float temperatureF = 0.0F;
        uint64_t fetchedAtMs = 0;
        // Set only on the call that contacted the source.
        bool fetchAttempted = false;
        FetchResult fetchResult = FetchResult::OK;
    };

    WeatherCache(IOutdoorTemperatureSource& source, uint32_t ttlSeconds);

    Value getOutdoorTemperature(uint64_t nowMs);

    State state(uint64_t nowMs) const;
    uint32_t fetchAttempts() const;
    uint64_t ttlMs() const;

private:
    bool isFreshLocked(uint64_t nowMs) const;
    bool fetchAllowedLocked(uint64_t nowMs);

    IOutdoorTemperatureSource& source_;
    const uint64_t ttlMs_;

    mutable std::mutex mutex_;
    bool hasValue_ = false;
    float temperatureF_ = 0.0F;
    uint64_t fetchedAtMs_ = 0;

    bool hasAttempt_ = false;
    uint64_t lastAttemptMs_ = 0;
    uint32_t fetchAttempts_ = 0;
};

const char* weatherStateToString(WeatherCache::State state);
