#pragma once
#include <stdint.h>
#include <functional>
#include <vector>
#include <string>
#include "types.hpp"

struct LoggingConfig {
    std::string log_level;
    std::string log_file;
    bool flush_on_write;
};

struct TuyaConfig {
    std::string base_url;
    std::string client_id;
    std::string client_secret;
    uint32_t timeout_ms;
};

struct ServerConfig {
    std::string host;
    uint16_t port;
};

struct PollingConfig {
    uint32_t poll_interval_ms;
    uint32_t control_interval_ms;
};

struct StorageConfig {
    std::string database_path;
    std::string response_dir;
};

struct ConfigValidationRules {
    uint32_t min_interval_ms;
    uint32_t max_interval_ms;
    uint32_t min_timeout_ms;
    uint32_t max_timeout_ms;
};

// Returns the value of an environment variable or nullptr.
using EnvLookup = std::function<const char*(const char*)>;

class ConfigManager {
public:
    ConfigManager();
    ~ConfigManager();

    /**
     * @brief Load configuration: defaults, then the JSON file (if present),
     *        then environment overrides, then validation.
     * @param config_file Path of the optional JSON file
     * @param env Environment lookup, defaults to ::getenv
     * @throws ConfigException on malformed input or a missing required key
     */
    void load(const std::string& config_file, const EnvLookup& env = EnvLookup());

    bool loadFromJson(const std::string& json, std::string& reason);
    bool applyEnvironment(const EnvLookup& env, std::string& reason);
    bool validate(std::string& reason) const;

    TuyaConfig getTuyaConfig() const;
    ServerConfig getServerConfig() const;
    PollingConfig getPollingConfig() const;
    StorageConfig getStorageConfig() const;
    LoggingConfig getLoggingConfig() const;
    std::vector<DeviceEntry> getDevices() const;

    bool validateInterval(uint32_t interval_ms, std::string& reason) const;
    bool validateTimeout(uint32_t timeout_ms, std::string& reason) const;

    /**
     * @brief Parse "id1:thermostat,id2:energy_meter"
     * @param list Comma separated device list; blank entries are skipped
     * @param out Parsed entries in input order
     * @param reason Failure description
     * @return true if every entry parsed
     */
    static bool parseDeviceList(const std::string& list, std::vector<DeviceEntry>& out,
                                std::string& reason);

    // One-line summary for the startup log, secret masked
    std::string describe() const;

private:
    TuyaConfig tuya_config_;
    ServerConfig server_config_;
    PollingConfig polling_config_;
    StorageConfig storage_config_;
    LoggingConfig logging_config_;
    ConfigValidationRules validation_rules_;
    std::vector<DeviceEntry> devices_;

    void initializeDefaults();
};
