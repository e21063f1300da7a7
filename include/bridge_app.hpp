#pragma once
#include <stdint.h>
#include <cstddef>
#include "acquisition_scheduler.hpp"
#include "api_router.hpp"
#include "api_server.hpp"
#include "config_manager.hpp"
#include "control_service.hpp"
#include "http_client.hpp"
#include "reading_cache.hpp"
#include "reading_store.hpp"
#include "response_archive.hpp"
#include "sensor_service.hpp"
#include "tuya_client.hpp"

// Owns every component and wires them together. The client and the cache are
// shared by the poller, the control loop and the REST handlers.
class BridgeApp {
public:
    BridgeApp();
    ~BridgeApp();

    /**
     * @brief Build all components from a loaded configuration
     * @throws StorageException if the database cannot be opened
     */
    void setup(const ConfigManager& config);

    // Start polling, control and REST; false if the server cannot listen
    bool start();
    void stop();
    void loop();

    void getStatistics(char* outBuf, size_t outBufSize) const;

    ReadingCache* cache() const { return cache_; }

private:
    HttpClient* http_client_ = nullptr;
    ResponseArchive* archive_ = nullptr;
    TuyaClient* tuya_client_ = nullptr;
    ReadingStore* store_ = nullptr;
    ReadingCache* cache_ = nullptr;
    SensorService* sensors_ = nullptr;
    AcquisitionScheduler* scheduler_ = nullptr;
    ControlService* control_ = nullptr;
    ApiRouter* router_ = nullptr;
    ApiServer* server_ = nullptr;
    PollingConfig polling_{};
    bool started_ = false;
};
