#pragma once
#include <stdint.h>
#include <functional>
#include <string>
#include <vector>
#include "device_status.hpp"
#include "tuya_response.hpp"
#include "types.hpp"

class TuyaClient;
class ReadingStore;
class ReadingCache;

using MillisClock = std::function<int64_t()>;

// One poll of one device: fetch, build the typed status, encode, persist, cache.
class SensorService {
public:
    SensorService(TuyaClient* client, ReadingStore* store, ReadingCache* cache,
                  MillisClock clock = MillisClock());
    ~SensorService();

    TuyaResult fetchAndPersist(const DeviceEntry& device);

    // Same pipeline, also returning the typed status and the readings produced
    TuyaResult fetchAndPersist(const DeviceEntry& device, DeviceStatus& status,
                               std::vector<EncodedReading>& readings);

    static int64_t systemNowMs();

private:
    TuyaClient* client_;
    ReadingStore* store_;
    ReadingCache* cache_;
    MillisClock clock_;

    TuyaResult fetchDataPoints(const DeviceEntry& device, std::vector<DataPoint>& dps);
};
