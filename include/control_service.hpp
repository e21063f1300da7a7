#pragma once
#include <stdint.h>
#include <condition_variable>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

class ReadingCache;
class TuyaClient;

// Per-device view of the cache used by the control loop
struct ControlSnapshot {
    std::string device_id;
    std::optional<double> temperature_c;
    std::optional<bool> relay_on;
};

// Control loop. Currently only observes the cache and logs what it sees;
// the client is held for issuing commands.
class ControlService {
public:
    ControlService(ReadingCache* cache, TuyaClient* client);
    ~ControlService();

    void begin(uint32_t interval_ms = 60000);
    void end();

    // Group cache entries by device, ordered by device id
    std::vector<ControlSnapshot> snapshot() const;

    // One evaluation pass
    void evaluate();

private:
    ReadingCache* cache_ = nullptr;
    TuyaClient* client_ = nullptr;
    uint32_t interval_ = 60000;
    bool running_ = false;
    std::mutex mutex_;
    std::condition_variable wake_;
    std::thread worker_;

    void run();
};
