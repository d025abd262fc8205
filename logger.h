#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <mutex>

#include "time/wall_clock.h"

enum class LogEventType : uint8_t {
    CYCLE_STARTED = 0,
    CYCLE_COMPLETED = 1,
    DUPLICATE_CYCLE_START = 2,
    STORE_APPEND_FAILED = 3,
    STORE_APPEND_RETRIED = 4,
    STORE_PURGED = 5,
    STORE_FAULT = 6,
    WEATHER_FETCHED = 7,
    WEATHER_FETCH_FAILED = 8,
    RUNTIME_ALERT = 9,
    READING_REJECTED = 10,
};

const char* logEventToString(LogEventType type);

struct LogEntry {
    uint64_t unixMs;  // Unix epoch timestamp in milliseconds
    uint32_t dateKey;  // calendar date as YYYYMMDD
    uint8_t hour;
    uint8_t minute;
    uint8_t second;
    bool wallTimeValid;
    uint8_t deviceSlot;
    LogEventType type;
    bool success;
    float value;  // event specific: duration, temperature, deleted rows
    uint8_t detailCode;  // extra status/error code
};

// Shared by every device monitor; entries are kept oldest-first in a ring.
class Logger {
public:
    static constexpr size_t kCapacity = 128;

    void log(uint64_t unixMs,
             uint8_t deviceSlot,
             LogEventType type,
             bool success,
             float value = 0.0F,
             uint8_t detailCode = 0);

    size_t size() const;
    // index 0 is the oldest retained entry.
    bool entryAt(size_t index, LogEntry& outEntry) const;
    size_t countOf(LogEventType type) const;

private:
    mutable std::mutex mutex_;
    std::array<LogEntry, kCapacity> entries_{};
    size_t nextIndex_ = 0;
    size_t size_ = 0;
};
