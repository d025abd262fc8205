#pragma once

#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <vector>

#include "cycle.h"

struct sqlite3;

enum class StoreStatus : uint8_t {
    OK = 0,
    NOT_OPEN = 1,
    TRANSIENT_IO = 2,   // busy, locked, I/O or open failure; retry on a later poll
    CORRUPT = 3,        // file is not a usable database
    EXHAUSTED = 4,      // disk or memory full
    INVALID_CYCLE = 5,  // end before start; never written
};

const char* storeStatusToString(StoreStatus status);

// Corruption and exhaustion stop persistence for the device; everything else is retried.
bool isHardStoreFailure(StoreStatus status);

// Append-only history of completed cycles for one device, backed by one SQLite file.
// All operations share one connection and are serialized; purge and append each run
// in their own IMMEDIATE transaction so neither can observe a torn state.
class CycleStore {
public:
    CycleStore() = default;
    ~CycleStore();

    CycleStore(const CycleStore&) = delete;
    CycleStore& operator=(const CycleStore&) = delete;

    StoreStatus open(const std::string& path);
    void close();
    bool isOpen() const;
    std::string path() const;

    StoreStatus append(const Cycle& cycle);
    // Cycles with start >= cutoffMs, ordered by start ascending.
    StoreStatus querySince(uint64_t cutoffMs, std::vector<Cycle>& outCycles) const;
    // Deletes cycles with start < cutoffMs. Idempotent.
    StoreStatus purgeOlderThan(uint64_t cutoffMs, size_t& outDeleted);
    StoreStatus count(size_t& outCount) const;

private:
    static constexpr int kSchemaVersion = 1;
    static constexpr int kBusyTimeoutMs = 2000;

    StoreStatus exec(const char* sql) const;
    StoreStatus migrate();
    void rollback() const;
    void closeLocked();

    mutable std::mutex mutex_;
    sqlite3* db_ = nullptr;
    std::string path_;
};
