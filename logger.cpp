#include "logger.h"

#include "diagnostics/diag.h"

namespace {

void printLogEntry(const LogEntry& entry) {
    if (!diag::enabled(DiagLevel::INFO)) {
        return;
    }

    if (entry.wallTimeValid) {
        diag::logf(DiagLevel::INFO,
                   "LOG",
                   "%u %02u:%02u:%02u dev=%u evt=%s success=%u value=%.2f code=%u",
                   static_cast<unsigned>(entry.dateKey),
                   static_cast<unsigned>(entry.hour),
                   static_cast<unsigned>(entry.minute),
                   static_cast<unsigned>(entry.second),
                   static_cast<unsigned>(entry.deviceSlot),
                   logEventToString(entry.type),
                   static_cast<unsigned>(entry.success ? 1U : 0U),
                   static_cast<double>(entry.value),
                   static_cast<unsigned>(entry.detailCode));
    } else {
        diag::logf(DiagLevel::INFO,
                   "LOG",
                   "unixMs=%llu dev=%u evt=%s success=%u value=%.2f code=%u",
                   static_cast<unsigned long long>(entry.unixMs),
                   static_cast<unsigned>(entry.deviceSlot),
                   logEventToString(entry.type),
                   static_cast<unsigned>(entry.success ? 1U : 0U),
                   static_cast<double>(entry.value),
                   static_cast<unsigned>(entry.detailCode));
    }
}

}  // namespace

const char* logEventToString(LogEventType type) {
    switch (type) {
        case LogEventType::CYCLE_STARTED:
            return "CYCLE_STARTED";
        case LogEventType::CYCLE_COMPLETED:
            return "CYCLE_COMPLETED";
        case LogEventType::DUPLICATE_CYCLE_START:
            return "DUPLICATE_CYCLE_START";
        case LogEventType::STORE_APPEND_FAILED:
            return "STORE_APPEND_FAILED";
        case LogEventType::STORE_APPEND_RETRIED:
            return "STORE_APPEND_RETRIED";
        case LogEventType::STORE_PURGED:
            return "STORE_PURGED";
        case LogEventType::STORE_FAULT:
            return "STORE_FAULT";
        case LogEventType::WEATHER_FETCHED:
            return "WEATHER_FETCHED";
        case LogEventType::WEATHER_FETCH_FAILED:
            return "WEATHER_FETCH_FAILED";
        case LogEventType::RUNTIME_ALERT:
            return "RUNTIME_ALERT";
        case LogEventType::READING_REJECTED:
            return "READING_REJECTED";
        default:
            return "UNKNOWN";
    }
}

void Logger::log(uint64_t unixMs,
                 uint8_t deviceSlot,
                 LogEventType type,
                 bool success,
                 float value,
                 uint8_t detailCode) {
    const WallClockSnapshot wall = snapshotFromUnixMs(unixMs);
    const LogEntry entry{
        unixMs,
        wall.dateKey,
        wall.hour,
        wall.minute,
        wall.second,
        wall.valid,
        deviceSlot,
        type,
        success,
        value,
        detailCode,
    };

    {
        std::lock_guard<std::mutex> lock(mutex_);
        entries_[nextIndex_] = entry;
        nextIndex_ = (nextIndex_ + 1U) % entries_.size();
        if (size_ < entries_.size()) {
            ++size_;
        }
    }

    printLogEntry(entry);
}

size_t Logger::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return size_;
}

bool Logger::entryAt(size_t index, LogEntry& outEntry) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (index >= size_) {
        return false;
    }
    const size_t oldest = (nextIndex_ + entries_.size() - size_) % entries_.size();
    outEntry = entries_[(oldest + index) % entries_.size()];
    return true;
}

size_t Logger::countOf(LogEventType type) const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t count = 0;
    for (size_t i = 0; i < size_; ++i) {
        if (entries_[i].type == type) {
            ++count;
        }
    }
    return count;
}
