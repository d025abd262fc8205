#include "wall_clock.h"

#include <ctime>

#if __has_include(<sys/time.h>)
#include <sys/time.h>
#define WALL_CLOCK_HAS_GETTIMEOFDAY 1
#else
#define WALL_CLOCK_HAS_GETTIMEOFDAY 0
#endif

namespace {
constexpr uint32_t kUnixSanityFloor = 1700000000UL;

uint32_t makeDateKey(const tm& t) {
    const uint32_t year = static_cast<uint32_t>(t.tm_year + 1900);
    const uint32_t month = static_cast<uint32_t>(t.tm_mon + 1);
    const uint32_t day = static_cast<uint32_t>(t.tm_mday);
    return (year * 10000UL) + (month * 100UL) + day;
}
}  // namespace

WallClockSnapshot snapshotFromUnixMs(uint64_t unixMs) {
    WallClockSnapshot out{};
    out.unixMs = unixMs;

    const time_t unixSeconds = static_cast<time_t>(unixMs / kMsPerSecond);
    tm utcTime{};
    if (gmtime_r(&unixSeconds, &utcTime) == nullptr) {
        return out;
    }

    out.valid = true;
    out.year = static_cast<uint16_t>(utcTime.tm_year + 1900);
    out.month = static_cast<uint8_t>(utcTime.tm_mon + 1);
    out.day = static_cast<uint8_t>(utcTime.tm_mday);
    out.hour = static_cast<uint8_t>(utcTime.tm_hour);
    out.minute = static_cast<uint8_t>(utcTime.tm_min);
    out.second = static_cast<uint8_t>(utcTime.tm_sec);
    out.weekday = static_cast<uint8_t>(utcTime.tm_wday);
    out.secondsOfDay =
        (static_cast<uint32_t>(out.hour) * 3600UL) + (static_cast<uint32_t>(out.minute) * 60UL) + out.second;
    out.dateKey = makeDateKey(utcTime);
    return out;
}

bool SystemClock::isValid() const {
    return std::time(nullptr) > static_cast<time_t>(kUnixSanityFloor);
}

uint64_t SystemClock::nowUnixMs() {
#if WALL_CLOCK_HAS_GETTIMEOFDAY
    timeval tv{};
    if (gettimeofday(&tv, nullptr) == 0) {
        return (static_cast<uint64_t>(tv.tv_sec) * kMsPerSecond) + static_cast<uint64_t>(tv.tv_usec / 1000);
    }
#endif
    return static_cast<uint64_t>(std::time(nullptr)) * kMsPerSecond;
}
