#include "../include/bridge_app.hpp"
#include "../include/logger.hpp"
#include <chrono>
#include <cstdio>
#include <thread>

BridgeApp::BridgeApp() {}

BridgeApp::~BridgeApp() {
    stop();
    delete server_;
    delete router_;
    delete control_;
    delete scheduler_;
    delete sensors_;
    delete cache_;
    delete store_;
    delete tuya_client_;
    delete archive_;
    delete http_client_;
}

void BridgeApp::setup(const ConfigManager& config) {
    Logger::info("tuya_bridge initializing: %s", config.describe().c_str());

    TuyaConfig tuya = config.getTuyaConfig();
    StorageConfig storage = config.getStorageConfig();
    ServerConfig server = config.getServerConfig();
    polling_ = config.getPollingConfig();

    if (!store_) {
        store_ = new ReadingStore(storage.database_path);
    }
    if (!cache_) {
        cache_ = new ReadingCache();
    }
    if (!http_client_) {
        http_client_ = new HttpClient(tuya.base_url, tuya.timeout_ms);
        Logger::info("HTTP client initialized with base URL: %s", tuya.base_url.c_str());
    }
    if (!archive_) {
        archive_ = new ResponseArchive(storage.response_dir);
    }
    if (!tuya_client_) {
        tuya_client_ = new TuyaClient(tuya, http_client_, archive_);
    }
    if (!sensors_) {
        sensors_ = new SensorService(tuya_client_, store_, cache_);
    }
    if (!scheduler_) {
        scheduler_ = new AcquisitionScheduler(sensors_, config.getDevices());
    }
    if (!control_) {
        control_ = new ControlService(cache_, tuya_client_);
    }
    if (!router_) {
        router_ = new ApiRouter(store_, cache_);
    }
    if (!server_) {
        server_ = new ApiServer(router_, server.host, server.port);
    }

    for (const auto& device : config.getDevices()) {
        Logger::info("Device %s (%s)", device.device_id.c_str(), deviceTypeToString(device.device_type));
    }
    if (config.getDevices().empty()) {
        Logger::warn("No devices configured, set TUYA_DEVICE_IDS");
    }
}

bool BridgeApp::start() {
    if (started_) return true;
    if (!server_->begin()) return false;
    scheduler_->begin(polling_.poll_interval_ms);
    control_->begin(polling_.control_interval_ms);
    started_ = true;
    Logger::info("tuya_bridge started");
    return true;
}

void BridgeApp::stop() {
    if (!started_) return;
    Logger::info("tuya_bridge stopping...");
    if (server_) server_->end();
    if (control_) control_->end();
    if (scheduler_) scheduler_->end();
    started_ = false;
    Logger::info("tuya_bridge stopped");
}

void BridgeApp::loop() {
    std::this_thread::sleep_for(std::chrono::milliseconds(200));
}

void BridgeApp::getStatistics(char* outBuf, size_t outBufSize) const {
    char sched[160] = "";
    if (scheduler_) scheduler_->getStatistics(sched, sizeof(sched));
    snprintf(outBuf, outBufSize, "%s, cache=%u, token=%s", sched,
             cache_ ? (unsigned)cache_->size() : 0u,
             (tuya_client_ && tuya_client_->tokens().hasValidToken()) ? "valid" : "none");
}
