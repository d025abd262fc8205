#include "weather_cache.h"

WeatherCache::WeatherCache(IOutdoorTemperatureSource& source, uint32_t ttlSeconds)
    : source_(source), ttlMs_(static_cast<uint64_t>(ttlSeconds) * 1000ULL) {}

WeatherCache::Value WeatherCache::getOutdoorTemperature(uint64_t nowMs) {
    Value out{};
    bool fetchNow = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!isFreshLocked(nowMs) && fetchAllowedLocked(nowMs)) {
            // Claim the window before unlocking so concurrent callers cannot fetch again.
            hasAttempt_ = true;
            lastAttemptMs_ = nowMs;
            ++fetchAttempts_;
            fetchNow = true;
        }
    }

    if (fetchNow) {
        float fetched = 0.0F;
        const FetchResult result = source_.fetchTemperatureF(fetched);
        out.fetchAttempted = true;
        out.fetchResult = result;

        std::lock_guard<std::mutex> lock(mutex_);
        if (result == FetchResult::OK && (!hasValue_ || nowMs >= fetchedAtMs_)) {
            hasValue_ = true;
            temperatureF_ = fetched;
            fetchedAtMs_ = nowMs;
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (!hasValue_) {
        return out;
    }

    out.present = true;
    out.stale = !isFreshLocked(nowMs);
    out.temperatureF = temperatureF_;
    out.fetchedAtMs = fetchedAtMs_;
    return out;
}

WeatherCache::State WeatherCache::state(uint64_t nowMs) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!hasValue_) {
        return State::EMPTY;
    }
    return isFreshLocked(nowMs) ? State::FRESH : State::STALE;
}

uint32_t WeatherCache::fetchAttempts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return fetchAttempts_;
}

uint64_t WeatherCache::ttlMs() const {
    return ttlMs_;
}

bool WeatherCache::isFreshLocked(uint64_t nowMs) const {
    if (!hasValue_) {
        return false;
    }
    const uint64_t ageMs = (nowMs >= fetchedAtMs_) ? (nowMs - fetchedAtMs_) : 0U;
    return ageMs < ttlMs_;
}

bool WeatherCache::fetchAllowedLocked(uint64_t nowMs) {
    if (!hasAttempt_) {
        return true;
    }
    if (nowMs < lastAttemptMs_) {
        // Clock stepped backwards; restart the window instead of fetching early.
        lastAttemptMs_ = nowMs;
        return false;
    }
    return (nowMs - lastAttemptMs_) >= ttlMs_;
}

const char* weatherStateToString(WeatherCache::State state) {
    switch (state) {
        case WeatherCache::State::EMPTY:
            return "EMPTY";
        case WeatherCache::State::FRESH:
            return "FRESH";
        case WeatherCache::State::STALE:
            return "STALE";
        default:
            return "UNKNOWN";
    }
}
