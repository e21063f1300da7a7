#include "../include/sensor_service.hpp"
#include "../include/logger.hpp"
#include "../include/reading_cache.hpp"
#include "../include/reading_store.hpp"
#include "../include/tuya_client.hpp"
#include <chrono>

SensorService::SensorService(TuyaClient* client, ReadingStore* store, ReadingCache* cache, MillisClock clock)
    : client_(client), store_(store), cache_(cache),
      clock_(clock ? clock : MillisClock(&SensorService::systemNowMs)) {}

SensorService::~SensorService() {}

int64_t SensorService::systemNowMs() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

TuyaResult SensorService::fetchDataPoints(const DeviceEntry& device, std::vector<DataPoint>& dps) {
    // Weather stations only report through the shadow feed
    if (device.device_type == DeviceType::WEATHER_STATION) {
        std::vector<ShadowProperty> props;
        TuyaResult result = client_->fetchShadowProperties(device.device_id, props);
        if (result.is_success()) dps = toDataPoints(props);
        return result;
    }
    return client_->fetchStatus(device.device_id, dps);
}

TuyaResult SensorService::fetchAndPersist(const DeviceEntry& device) {
    DeviceStatus status;
    std::vector<EncodedReading> readings;
    return fetchAndPersist(device, status, readings);
}

TuyaResult SensorService::fetchAndPersist(const DeviceEntry& device, DeviceStatus& status,
                                          std::vector<EncodedReading>& readings) {
    std::vector<DataPoint> dps;
    TuyaResult result = fetchDataPoints(device, dps);
    if (!result.is_success()) return result;

    result = buildDeviceStatus(device.device_type, dps, status);
    if (!result.is_success()) {
        Logger::warn("[Sensors] %s (%s): %s", device.device_id.c_str(),
                     deviceTypeToString(device.device_type), result.error_message.c_str());
        return result;
    }

    int64_t recorded_at = clock_();
    readings = toEncodedReadings(status, device.device_id, recorded_at);

    size_t stored = 0;
    size_t failed = 0;
    for (const auto& reading : readings) {
        bool inserted = false;
        if (store_ && !store_->insert(reading, inserted)) {
            failed++;
        } else if (inserted) {
            stored++;
        }
        if (cache_) cache_->update(reading);
    }

    Logger::info("[Sensors] %s (%s): %u readings, %u stored", device.device_id.c_str(),
                 deviceTypeToString(device.device_type), (unsigned)readings.size(), (unsigned)stored);
    if (failed > 0) {
        return tuyaError(TuyaStatus::STORAGE_ERROR,
                         std::to_string(failed) + " reading(s) not stored for " + device.device_id);
    }
    return tuyaOk();
}
