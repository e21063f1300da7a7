#include "../include/acquisition_scheduler.hpp"
#include "../include/logger.hpp"
#include "../include/sensor_service.hpp"
#include <chrono>
#include <cstdio>

AcquisitionScheduler::AcquisitionScheduler(SensorService* sensors, const std::vector<DeviceEntry>& devices)
    : sensors_(sensors), devices_(devices) {}

AcquisitionScheduler::~AcquisitionScheduler() { end(); }

void AcquisitionScheduler::begin(uint32_t interval_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_) return;
    pollInterval_ = interval_ms;
    if (pollInterval_ == 0) {
        Logger::warn("[Acquisition] Interval is 0, polling disabled");
        return;
    }
    running_ = true;
    worker_ = std::thread(&AcquisitionScheduler::run, this);
    Logger::info("[Acquisition] Polling %u device(s) every %u ms", (unsigned)devices_.size(), pollInterval_);
}

void AcquisitionScheduler::end() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    wake_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void AcquisitionScheduler::updateConfig(const std::vector<DeviceEntry>& devices, uint32_t interval_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    devices_ = devices;
    if (interval_ms > 0) pollInterval_ = interval_ms;
}

void AcquisitionScheduler::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        lock.unlock();
        pollTask();
        lock.lock();
        wake_.wait_for(lock, std::chrono::milliseconds(pollInterval_), [this] { return !running_; });
    }
}

void AcquisitionScheduler::pollTask() {
    std::vector<DeviceEntry> devices;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        devices = devices_;
        cycles_++;
    }
    if (devices.empty()) {
        Logger::debug("[Acquisition] No devices configured");
        return;
    }

    for (const auto& device : devices) {
        TuyaResult result = sensors_->fetchAndPersist(device);
        std::lock_guard<std::mutex> lock(mutex_);
        if (result.is_success()) {
            successes_++;
        } else {
            failures_++;
            Logger::error("[Acquisition] %s: %s %s", device.device_id.c_str(),
                          tuyaStatusToString(result.status), result.error_message.c_str());
        }
    }
}

void AcquisitionScheduler::getStatistics(char* outBuf, size_t outBufSize) const {
    std::lock_guard<std::mutex> lock(mutex_);
    snprintf(outBuf, outBufSize, "interval=%lu, devices=%u, running=%d, cycles=%u, ok=%u, failed=%u",
             (unsigned long)pollInterval_, (unsigned int)devices_.size(), running_ ? 1 : 0,
             cycles_, successes_, failures_);
}

uint32_t AcquisitionScheduler::cycles() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cycles_;
}

uint32_t AcquisitionScheduler::failures() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return failures_;
}
