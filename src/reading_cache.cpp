#include "../include/reading_cache.hpp"
#include <mutex>

ReadingCache::ReadingCache() {}
ReadingCache::~ReadingCache() {}

void ReadingCache::update(const EncodedReading& reading) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    entries_[Key(reading.device_id, reading.sensor_kind)] = reading;
}

std::vector<EncodedReading> ReadingCache::all() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<EncodedReading> out;
    out.reserve(entries_.size());
    for (const auto& kv : entries_) out.push_back(kv.second);
    return out;
}

std::optional<EncodedReading> ReadingCache::get(const std::string& device_id, SensorKind kind) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = entries_.find(Key(device_id, kind));
    if (it == entries_.end()) return std::nullopt;
    return it->second;
}

std::vector<EncodedReading> ReadingCache::getDevice(const std::string& device_id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<EncodedReading> out;
    // Keys sort by device first, so one device's entries are contiguous
    for (auto it = entries_.lower_bound(Key(device_id, SensorKind::TEMPERATURE));
         it != entries_.end() && it->first.first == device_id; ++it) {
        out.push_back(it->second);
    }
    return out;
}

size_t ReadingCache::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return entries_.size();
}
