#pragma once
#include <map>
#include <optional>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>
#include "types.hpp"

// Latest reading per (device_id, sensor_kind), shared between the poller,
// the control loop and the REST handlers. Writers take the lock exclusively,
// readers share it. The last update to arrive wins, regardless of recorded_at.
class ReadingCache {
public:
    ReadingCache();
    ~ReadingCache();

    void update(const EncodedReading& reading);
    std::vector<EncodedReading> all() const;
    std::optional<EncodedReading> get(const std::string& device_id, SensorKind kind) const;
    std::vector<EncodedReading> getDevice(const std::string& device_id) const;
    size_t size() const;

private:
    using Key = std::pair<std::string, SensorKind>;
    mutable std::shared_mutex mutex_;
    std::map<Key, EncodedReading> entries_;
};
