#pragma once
#include <stdint.h>
#include <condition_variable>
#include <mutex>
#include <thread>
#include <vector>
#include "types.hpp"

class SensorService;

// Polls every configured device on a background thread.
class AcquisitionScheduler {
public:
    AcquisitionScheduler(SensorService* sensors, const std::vector<DeviceEntry>& devices);
    ~AcquisitionScheduler();

    void begin(uint32_t interval_ms = 60000);
    void end();
    void updateConfig(const std::vector<DeviceEntry>& devices, uint32_t interval_ms);

    // One pass over all devices; errors are logged, never thrown
    void pollTask();

    void getStatistics(char* outBuf, size_t outBufSize) const;
    uint32_t cycles() const;
    uint32_t failures() const;

private:
    SensorService* sensors_ = nullptr;
    std::vector<DeviceEntry> devices_;
    uint32_t pollInterval_ = 60000;
    bool running_ = false;
    uint32_t cycles_ = 0;
    uint32_t successes_ = 0;
    uint32_t failures_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable wake_;
    std::thread worker_;

    void run();
};
