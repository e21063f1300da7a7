#include "../include/control_service.hpp"
#include "../include/logger.hpp"
#include "../include/reading_cache.hpp"
#include "../include/tuya_client.hpp"
#include <chrono>
#include <cstdio>
#include <map>

ControlService::ControlService(ReadingCache* cache, TuyaClient* client)
    : cache_(cache), client_(client) {}

ControlService::~ControlService() { end(); }

void ControlService::begin(uint32_t interval_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (running_ || interval_ms == 0) return;
    interval_ = interval_ms;
    running_ = true;
    worker_ = std::thread(&ControlService::run, this);
    Logger::info("[Control] Control loop every %u ms", interval_);
}

void ControlService::end() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        running_ = false;
    }
    wake_.notify_all();
    if (worker_.joinable()) worker_.join();
}

void ControlService::run() {
    std::unique_lock<std::mutex> lock(mutex_);
    while (running_) {
        wake_.wait_for(lock, std::chrono::milliseconds(interval_), [this] { return !running_; });
        if (!running_) break;
        lock.unlock();
        evaluate();
        lock.lock();
    }
}

std::vector<ControlSnapshot> ControlService::snapshot() const {
    std::map<std::string, ControlSnapshot> by_device;
    for (const auto& reading : cache_->all()) {
        ControlSnapshot& snap = by_device[reading.device_id];
        snap.device_id = reading.device_id;
        if (reading.sensor_kind == SensorKind::TEMPERATURE) {
            snap.temperature_c = reading.value / (double)sensorKindDivisor(SensorKind::TEMPERATURE);
        } else if (reading.sensor_kind == SensorKind::RELAY_STATE) {
            snap.relay_on = reading.value != 0;
        }
    }
    std::vector<ControlSnapshot> out;
    out.reserve(by_device.size());
    for (const auto& kv : by_device) out.push_back(kv.second);
    return out;
}

void ControlService::evaluate() {
    std::vector<ControlSnapshot> devices = snapshot();
    if (devices.empty()) {
        Logger::debug("[Control] Cache empty, nothing to evaluate");
        return;
    }
    for (const auto& d : devices) {
        char temp[32] = "n/a";
        if (d.temperature_c) snprintf(temp, sizeof(temp), "%.2f C", *d.temperature_c);
        const char* relay = d.relay_on ? (*d.relay_on ? "on" : "off") : "n/a";
        Logger::info("[Control] %s: temperature=%s relay=%s", d.device_id.c_str(), temp, relay);
    }
    // TODO: drive relays through client_->sendCommands once setpoint rules are defined
    (void)client_;
}
