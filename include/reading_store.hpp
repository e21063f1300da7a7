#pragma once
#include <stdint.h>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "types.hpp"

struct sqlite3;

/**
 * @class ReadingStore
 * @brief SQLite persistence of encoded readings
 *
 * Rows are unique on (device_id, sensor_type, recorded_at); inserting the
 * same key again is silently ignored. One connection, serialized by a mutex.
 */
class ReadingStore {
public:
    /**
     * @brief Open (or create) the database and apply the schema
     * @param path File path or ":memory:"
     * @throws StorageException if the database cannot be opened or migrated
     */
    explicit ReadingStore(const std::string& path);
    ~ReadingStore();

    /**
     * @brief Insert one reading
     * @param reading Reading to store
     * @param inserted false when the key already existed
     * @return false on database error (see lastError)
     */
    bool insert(const EncodedReading& reading, bool& inserted);

    // Latest row per (device_id, sensor_type), ordered by device then type
    bool latest(std::vector<EncodedReading>& out);

    /**
     * @brief Readings of one series, ascending by recorded_at
     * @param from Inclusive lower bound (ms), optional
     * @param to Inclusive upper bound (ms), optional
     */
    bool range(const std::string& device_id, SensorKind kind, std::optional<int64_t> from,
               std::optional<int64_t> to, std::vector<EncodedReading>& out);

    bool latestFor(const std::string& device_id, SensorKind kind, EncodedReading& out, bool& found);

    std::string lastError() const;

private:
    sqlite3* db_ = nullptr;
    mutable std::mutex mutex_;
    std::string last_error_;

    void migrate();
    bool fail(const char* what);
};
