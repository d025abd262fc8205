#pragma once

#include <cstdint>

struct WallClockSnapshot {
    bool valid = false;

    uint64_t unixMs = 0;
    uint16_t year = 0;
    uint8_t month = 0;
    uint8_t day = 0;
    uint8_t hour = 0;
    uint8_t minute = 0;
    uint8_t second = 0;
    uint8_t weekday = 0;  // 0=Sunday, 6=Saturday
    uint32_t secondsOfDay = 0;
    uint32_t dateKey = 0;  // YYYYMMDD in UTC
};

constexpr uint64_t kMsPerSecond = 1000ULL;
constexpr uint64_t kMsPerDay = 24ULL * 60ULL * 60ULL * 1000ULL;

// Breaks a Unix epoch timestamp into calendar fields (UTC).
WallClockSnapshot snapshotFromUnixMs(uint64_t unixMs);

class IClock {
public:
    virtual ~IClock() = default;
    virtual bool isValid() const = 0;
    virtual uint64_t nowUnixMs() = 0;
};

class SystemClock : public IClock {
public:
    bool isValid() const override;
    uint64_t nowUnixMs() override;
};
