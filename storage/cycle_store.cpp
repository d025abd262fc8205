#include "cycle_store.h"

#include <sqlite3.h>

#include <cstdio>

#include "../diagnostics/diag.h"

namespace {

StoreStatus statusFromSqlite(int rc) {
    switch (rc & 0xFF) {
        case SQLITE_OK:
        case SQLITE_DONE:
        case SQLITE_ROW:
            return StoreStatus::OK;
        case SQLITE_CORRUPT:
        case SQLITE_NOTADB:
            return StoreStatus::CORRUPT;
        case SQLITE_FULL:
        case SQLITE_NOMEM:
            return StoreStatus::EXHAUSTED;
        default:
            return StoreStatus::TRANSIENT_IO;
    }
}

// Finalizes on every path.
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        rc_ = sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr);
    }
    ~Statement() {
        if (stmt_ != nullptr) {
            sqlite3_finalize(stmt_);
        }
    }

    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    bool ready() const {
        return rc_ == SQLITE_OK && stmt_ != nullptr;
    }
    int prepareResult() const {
        return rc_;
    }
    sqlite3_stmt* get() const {
        return stmt_;
    }

private:
    sqlite3_stmt* stmt_ = nullptr;
    int rc_ = SQLITE_ERROR;
};

constexpr const char* kCreateTableSql =
    "CREATE TABLE IF NOT EXISTS cycles ("
    " id INTEGER PRIMARY KEY,"
    " start_ms INTEGER NOT NULL,"
    " end_ms INTEGER NOT NULL,"
    " start_temp REAL NOT NULL,"
    " end_temp REAL NOT NULL,"
    " outdoor_temp REAL,"
    " CHECK (end_ms >= start_ms));";

constexpr const char* kCreateIndexSql = "CREATE INDEX IF NOT EXISTS idx_cycles_start ON cycles(start_ms);";

}  // namespace

const char* storeStatusToString(StoreStatus status) {
    switch (status) {
        case StoreStatus::OK:
            return "OK";
        case StoreStatus::NOT_OPEN:
            return "NOT_OPEN";
        case StoreStatus::TRANSIENT_IO:
            return "TRANSIENT_IO";
        case StoreStatus::CORRUPT:
            return "CORRUPT";
        case StoreStatus::EXHAUSTED:
            return "EXHAUSTED";
        case StoreStatus::INVALID_CYCLE:
            return "INVALID_CYCLE";
        default:
            return "UNKNOWN";
    }
}

bool isHardStoreFailure(StoreStatus status) {
    return status == StoreStatus::CORRUPT || status == StoreStatus::EXHAUSTED;
}

CycleStore::~CycleStore() {
    close();
}

StoreStatus CycleStore::open(const std::string& path) {
    std::lock_guard<std::mutex> lock(mutex_);
    closeLocked();

    sqlite3* handle = nullptr;
    const int rc = sqlite3_open_v2(path.c_str(), &handle, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
    if (rc != SQLITE_OK) {
        diag::logf(DiagLevel::ERROR,
                   "STORE",
                   "open %s failed: %s",
                   path.c_str(),
                   (handle != nullptr) ? sqlite3_errmsg(handle) : sqlite3_errstr(rc));
        if (handle != nullptr) {
            sqlite3_close(handle);
        }
        return statusFromSqlite(rc);
    }

    db_ = handle;
    path_ = path;
    sqlite3_busy_timeout(db_, kBusyTimeoutMs);

    const StoreStatus migrated = migrate();
    if (migrated != StoreStatus::OK) {
        diag::logf(DiagLevel::ERROR, "STORE", "schema setup failed: %s", storeStatusToString(migrated));
        closeLocked();
        return migrated;
    }

    diag::logf(DiagLevel::INFO, "STORE", "history open: %s", path_.c_str());
    return StoreStatus::OK;
}

void CycleStore::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closeLocked();
}

bool CycleStore::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return db_ != nullptr;
}

std::string CycleStore::path() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return path_;
}

StoreStatus CycleStore::append(const Cycle& cycle) {
    if (cycle.endMs < cycle.startMs) {
        return StoreStatus::INVALID_CYCLE;
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return StoreStatus::NOT_OPEN;
    }

    StoreStatus status = exec("BEGIN IMMEDIATE;");
    if (status != StoreStatus::OK) {
        return status;
    }

    {
        Statement insert(db_,
                         "INSERT INTO cycles (start_ms, end_ms, start_temp, end_temp, outdoor_temp)"
                         " VALUES (?, ?, ?, ?, ?);");
        if (!insert.ready()) {
            rollback();
            return statusFromSqlite(insert.prepareResult());
        }

        sqlite3_bind_int64(insert.get(), 1, static_cast<sqlite3_int64>(cycle.startMs));
        sqlite3_bind_int64(insert.get(), 2, static_cast<sqlite3_int64>(cycle.endMs));
        sqlite3_bind_double(insert.get(), 3, static_cast<double>(cycle.startTemperatureF));
        sqlite3_bind_double(insert.get(), 4, static_cast<double>(cycle.endTemperatureF));
        if (cycle.hasOutdoorTemperature) {
            sqlite3_bind_double(insert.get(), 5, static_cast<double>(cycle.outdoorTemperatureF));
        } else {
            sqlite3_bind_null(insert.get(), 5);
        }

        const int rc = sqlite3_step(insert.get());
        if (rc != SQLITE_DONE) {
            diag::logf(DiagLevel::WARN, "STORE", "append failed: %s", sqlite3_errmsg(db_));
            rollback();
            return statusFromSqlite(rc);
        }
    }

    status = exec("COMMIT;");
    if (status != StoreStatus::OK) {
        rollback();
    }
    return status;
}

StoreStatus CycleStore::querySince(uint64_t cutoffMs, std::vector<Cycle>& outCycles) const {
    outCycles.clear();

    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return StoreStatus::NOT_OPEN;
    }

    Statement select(db_,
                     "SELECT start_ms, end_ms, start_temp, end_temp, outdoor_temp FROM cycles"
                     " WHERE start_ms >= ? ORDER BY start_ms ASC, id ASC;");
    if (!select.ready()) {
        return statusFromSqlite(select.prepareResult());
    }
    sqlite3_bind_int64(select.get(), 1, static_cast<sqlite3_int64>(cutoffMs));

    int rc = SQLITE_ROW;
    while ((rc = sqlite3_step(select.get())) == SQLITE_ROW) {
        Cycle cycle{};
        cycle.startMs = static_cast<uint64_t>(sqlite3_column_int64(select.get(), 0));
        cycle.endMs = static_cast<uint64_t>(sqlite3_column_int64(select.get(), 1));
        cycle.startTemperatureF = static_cast<float>(sqlite3_column_double(select.get(), 2));
        cycle.endTemperatureF = static_cast<float>(sqlite3_column_double(select.get(), 3));
        if (sqlite3_column_type(select.get(), 4) != SQLITE_NULL) {
            cycle.hasOutdoorTemperature = true;
            cycle.outdoorTemperatureF = static_cast<float>(sqlite3_column_double(select.get(), 4));
        }
        outCycles.push_back(cycle);
    }

    if (rc != SQLITE_DONE) {
        outCycles.clear();
        return statusFromSqlite(rc);
    }
    return StoreStatus::OK;
}

StoreStatus CycleStore::purgeOlderThan(uint64_t cutoffMs, size_t& outDeleted) {
    outDeleted = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return StoreStatus::NOT_OPEN;
    }

    StoreStatus status = exec("BEGIN IMMEDIATE;");
    if (status != StoreStatus::OK) {
        return status;
    }

    size_t deleted = 0;
    {
        Statement purge(db_, "DELETE FROM cycles WHERE start_ms < ?;");
        if (!purge.ready()) {
            rollback();
            return statusFromSqlite(purge.prepareResult());
        }
        sqlite3_bind_int64(purge.get(), 1, static_cast<sqlite3_int64>(cutoffMs));

        const int rc = sqlite3_step(purge.get());
        if (rc != SQLITE_DONE) {
            diag::logf(DiagLevel::WARN, "STORE", "purge failed: %s", sqlite3_errmsg(db_));
            rollback();
            return statusFromSqlite(rc);
        }
        deleted = static_cast<size_t>(sqlite3_changes(db_));
    }

    status = exec("COMMIT;");
    if (status != StoreStatus::OK) {
        rollback();
        return status;
    }

    outDeleted = deleted;
    return StoreStatus::OK;
}

StoreStatus CycleStore::count(size_t& outCount) const {
    outCount = 0;

    std::lock_guard<std::mutex> lock(mutex_);
    if (db_ == nullptr) {
        return StoreStatus::NOT_OPEN;
    }

    Statement select(db_, "SELECT COUNT(*) FROM cycles;");
    if (!select.ready()) {
        return statusFromSqlite(select.prepareResult());
    }
    const int rc = sqlite3_step(select.get());
    if (rc != SQLITE_ROW) {
        return statusFromSqlite(rc);
    }
    outCount = static_cast<size_t>(sqlite3_column_int64(select.get(), 0));
    return StoreStatus::OK;
}

StoreStatus CycleStore::exec(const char* sql) const {
    char* error = nullptr;
    const int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &error);
    if (rc != SQLITE_OK) {
        diag::logf(DiagLevel::DEBUG, "STORE", "%s -> %s", sql, (error != nullptr) ? error : sqlite3_errstr(rc));
        sqlite3_free(error);
        return statusFromSqlite(rc);
    }
    return StoreStatus::OK;
}

StoreStatus CycleStore::migrate() {
    StoreStatus status = exec("PRAGMA journal_mode=WAL;");
    if (status != StoreStatus::OK) {
        return status;
    }
    status = exec("PRAGMA synchronous=FULL;");
    if (status != StoreStatus::OK) {
        return status;
    }

    int version = 0;
    {
        Statement pragma(db_, "PRAGMA user_version;");
        if (!pragma.ready()) {
            return statusFromSqlite(pragma.prepareResult());
        }
        const int rc = sqlite3_step(pragma.get());
        if (rc != SQLITE_ROW) {
            return statusFromSqlite(rc);
        }
        version = sqlite3_column_int(pragma.get(), 0);
    }

    if (version > kSchemaVersion) {
        diag::logf(DiagLevel::ERROR, "STORE", "history schema v%d is newer than supported v%d", version, kSchemaVersion);
        return StoreStatus::CORRUPT;
    }

    status = exec(kCreateTableSql);
    if (status != StoreStatus::OK) {
        return status;
    }
    status = exec(kCreateIndexSql);
    if (status != StoreStatus::OK) {
        return status;
    }
    char setVersion[40];
    std::snprintf(setVersion, sizeof(setVersion), "PRAGMA user_version = %d;", kSchemaVersion);
    return exec(setVersion);
}

void CycleStore::rollback() const {
    if (sqlite3_get_autocommit(db_) != 0) {
        return;
    }
    const int rc = sqlite3_exec(db_, "ROLLBACK;", nullptr, nullptr, nullptr);
    if (rc != SQLITE_OK) {
        diag::logf(DiagLevel::WARN, "STORE", "rollback failed: %s", sqlite3_errstr(rc));
    }
}

void CycleStore::closeLocked() {
    if (db_ == nullptr) {
        return;
    }
    const int rc = sqlite3_close(db_);
    if (rc != SQLITE_OK) {
        diag::logf(DiagLevel::WARN, "STORE", "close %s: %s", path_.c_str(), sqlite3_errstr(rc));
        sqlite3_close_v2(db_);
    }
    db_ = nullptr;
}
