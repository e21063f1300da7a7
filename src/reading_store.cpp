#include "../include/reading_store.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"

extern "C" {
#include <sqlite3.h>
}

namespace {

const char* const SCHEMA_SQL =
    "CREATE TABLE IF NOT EXISTS sensor_readings ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  device_id TEXT NOT NULL,"
    "  sensor_type TEXT NOT NULL,"
    "  recorded_at INTEGER NOT NULL,"
    "  value INTEGER NOT NULL,"
    "  UNIQUE (device_id, sensor_type, recorded_at));"
    "CREATE INDEX IF NOT EXISTS idx_readings_device_type_time"
    "  ON sensor_readings (device_id, sensor_type, recorded_at DESC);";

// Owns a prepared statement for the duration of one query
class Statement {
public:
    Statement(sqlite3* db, const char* sql) {
        if (sqlite3_prepare_v2(db, sql, -1, &stmt_, nullptr) != SQLITE_OK) stmt_ = nullptr;
    }
    ~Statement() { sqlite3_finalize(stmt_); }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;
    sqlite3_stmt* get() const { return stmt_; }
    bool ok() const { return stmt_ != nullptr; }
private:
    sqlite3_stmt* stmt_ = nullptr;
};

// Column order: device_id, sensor_type, recorded_at, value
bool readRow(sqlite3_stmt* stmt, EncodedReading& out) {
    const unsigned char* device = sqlite3_column_text(stmt, 0);
    const unsigned char* type = sqlite3_column_text(stmt, 1);
    out.device_id = device ? reinterpret_cast<const char*>(device) : "";
    std::string type_name = type ? reinterpret_cast<const char*>(type) : "";
    out.recorded_at = sqlite3_column_int64(stmt, 2);
    out.value = sqlite3_column_int64(stmt, 3);
    if (!parseSensorKind(type_name, out.sensor_kind)) {
        Logger::warn("[Store] Skipping row with unknown sensor_type '%s'", type_name.c_str());
        return false;
    }
    return true;
}

} // namespace

ReadingStore::ReadingStore(const std::string& path) {
    if (sqlite3_open(path.c_str(), &db_) != SQLITE_OK) {
        std::string msg = "cannot open database " + path + ": " + (db_ ? sqlite3_errmsg(db_) : "out of memory");
        sqlite3_close(db_);
        db_ = nullptr;
        throw StorageException(msg);
    }
    sqlite3_busy_timeout(db_, 5000);
    migrate();
    Logger::info("[Store] Opened %s", path.c_str());
}

ReadingStore::~ReadingStore() {
    sqlite3_close(db_);
}

void ReadingStore::migrate() {
    char* err = nullptr;
    if (sqlite3_exec(db_, SCHEMA_SQL, nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = std::string("schema migration failed: ") + (err ? err : "unknown error");
        sqlite3_free(err);
        throw StorageException(msg);
    }
}

bool ReadingStore::fail(const char* what) {
    last_error_ = std::string(what) + ": " + sqlite3_errmsg(db_);
    Logger::error("[Store] %s", last_error_.c_str());
    return false;
}

std::string ReadingStore::lastError() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_error_;
}

bool ReadingStore::insert(const EncodedReading& reading, bool& inserted) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt(db_,
        "INSERT OR IGNORE INTO sensor_readings (device_id, sensor_type, recorded_at, value) "
        "VALUES (?1, ?2, ?3, ?4)");
    if (!stmt.ok()) return fail("prepare insert");

    sqlite3_bind_text(stmt.get(), 1, reading.device_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, sensorKindToString(reading.sensor_kind), -1, SQLITE_STATIC);
    sqlite3_bind_int64(stmt.get(), 3, (sqlite3_int64)reading.recorded_at);
    sqlite3_bind_int64(stmt.get(), 4, (sqlite3_int64)reading.value);

    if (sqlite3_step(stmt.get()) != SQLITE_DONE) return fail("insert");
    inserted = sqlite3_changes(db_) > 0;
    if (!inserted) {
        Logger::debug("[Store] Duplicate %s/%s @%lld ignored", reading.device_id.c_str(),
                      sensorKindToString(reading.sensor_kind), (long long)reading.recorded_at);
    }
    return true;
}

bool ReadingStore::latest(std::vector<EncodedReading>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out.clear();
    // SQLite takes the bare columns from the row holding MAX(recorded_at)
    Statement stmt(db_,
        "SELECT device_id, sensor_type, MAX(recorded_at), value FROM sensor_readings "
        "GROUP BY device_id, sensor_type ORDER BY device_id, sensor_type");
    if (!stmt.ok()) return fail("prepare latest");

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        EncodedReading r;
        if (readRow(stmt.get(), r)) out.push_back(r);
    }
    if (rc != SQLITE_DONE) return fail("latest");
    return true;
}

bool ReadingStore::range(const std::string& device_id, SensorKind kind, std::optional<int64_t> from,
                         std::optional<int64_t> to, std::vector<EncodedReading>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    out.clear();
    Statement stmt(db_,
        "SELECT device_id, sensor_type, recorded_at, value FROM sensor_readings "
        "WHERE device_id = ?1 AND sensor_type = ?2 "
        "AND (?3 IS NULL OR recorded_at >= ?3) AND (?4 IS NULL OR recorded_at <= ?4) "
        "ORDER BY recorded_at ASC");
    if (!stmt.ok()) return fail("prepare range");

    sqlite3_bind_text(stmt.get(), 1, device_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, sensorKindToString(kind), -1, SQLITE_STATIC);
    if (from) sqlite3_bind_int64(stmt.get(), 3, (sqlite3_int64)*from);
    else sqlite3_bind_null(stmt.get(), 3);
    if (to) sqlite3_bind_int64(stmt.get(), 4, (sqlite3_int64)*to);
    else sqlite3_bind_null(stmt.get(), 4);

    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        EncodedReading r;
        if (readRow(stmt.get(), r)) out.push_back(r);
    }
    if (rc != SQLITE_DONE) return fail("range");
    return true;
}

bool ReadingStore::latestFor(const std::string& device_id, SensorKind kind, EncodedReading& out, bool& found) {
    std::lock_guard<std::mutex> lock(mutex_);
    found = false;
    Statement stmt(db_,
        "SELECT device_id, sensor_type, recorded_at, value FROM sensor_readings "
        "WHERE device_id = ?1 AND sensor_type = ?2 ORDER BY recorded_at DESC LIMIT 1");
    if (!stmt.ok()) return fail("prepare latestFor");

    sqlite3_bind_text(stmt.get(), 1, device_id.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(stmt.get(), 2, sensorKindToString(kind), -1, SQLITE_STATIC);

    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_ROW) {
        found = readRow(stmt.get(), out);
        return true;
    }
    if (rc != SQLITE_DONE) return fail("latestFor");
    return true;
}
