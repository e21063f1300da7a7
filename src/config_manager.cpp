#include "../include/config_manager.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <ArduinoJson.h>
#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace {

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t\r\n");
    return s.substr(start, end - start + 1);
}

bool parseUnsigned(const char* text, uint64_t max_value, uint64_t& out) {
    if (!text || !*text) return false;
    char* end = nullptr;
    errno = 0;
    unsigned long long v = std::strtoull(text, &end, 10);
    if (errno != 0 || *end != '\0' || text[0] == '-' || v > max_value) return false;
    out = v;
    return true;
}

} // namespace

ConfigManager::ConfigManager() {
    initializeDefaults();
}

ConfigManager::~ConfigManager() {}

void ConfigManager::initializeDefaults() {
    // Vendor credentials have no default
    tuya_config_.base_url = "";
    tuya_config_.client_id = "";
    tuya_config_.client_secret = "";
    tuya_config_.timeout_ms = 10000;

    server_config_.host = "0.0.0.0";
    server_config_.port = 8080;

    polling_config_.poll_interval_ms = 60000;
    polling_config_.control_interval_ms = 60000;

    storage_config_.database_path = "tuya_bridge.sqlite3";
    storage_config_.response_dir = "responses";

    logging_config_.log_level = "INFO";
    logging_config_.log_file = "";
    logging_config_.flush_on_write = true;

    validation_rules_.min_interval_ms = 1000;        // 1 second
    validation_rules_.max_interval_ms = 86400000;    // 24 hours
    validation_rules_.min_timeout_ms = 100;
    validation_rules_.max_timeout_ms = 120000;

    devices_.clear();
}

void ConfigManager::load(const std::string& config_file, const EnvLookup& env) {
    std::string reason;

    std::ifstream in(config_file);
    if (in) {
        std::stringstream buf;
        buf << in.rdbuf();
        if (!loadFromJson(buf.str(), reason)) {
            throw ConfigException(config_file + ": " + reason);
        }
        Logger::info("[ConfigMgr] Loaded %s", config_file.c_str());
    } else {
        Logger::debug("[ConfigMgr] No config file at %s, using defaults and environment", config_file.c_str());
    }

    EnvLookup lookup = env ? env : EnvLookup([](const char* name) { return std::getenv(name); });
    if (!applyEnvironment(lookup, reason)) {
        throw ConfigException(reason);
    }
    if (!validate(reason)) {
        throw ConfigException(reason);
    }
}

bool ConfigManager::loadFromJson(const std::string& json, std::string& reason) {
    DynamicJsonDocument doc(8192);
    DeserializationError error = deserializeJson(doc, json);
    if (error) {
        reason = std::string("invalid JSON: ") + error.c_str();
        return false;
    }

    JsonObject tuya = doc["tuya"];
    if (!tuya.isNull()) {
        if (tuya.containsKey("base_url")) tuya_config_.base_url = tuya["base_url"].as<std::string>();
        if (tuya.containsKey("client_id")) tuya_config_.client_id = tuya["client_id"].as<std::string>();
        if (tuya.containsKey("client_secret")) tuya_config_.client_secret = tuya["client_secret"].as<std::string>();
        if (tuya.containsKey("timeout_ms")) tuya_config_.timeout_ms = tuya["timeout_ms"].as<uint32_t>();
    }

    JsonObject server = doc["server"];
    if (!server.isNull()) {
        if (server.containsKey("host")) server_config_.host = server["host"].as<std::string>();
        if (server.containsKey("port")) {
            uint32_t port = server["port"].as<uint32_t>();
            if (port == 0 || port > 65535) {
                reason = "server.port out of range";
                return false;
            }
            server_config_.port = (uint16_t)port;
        }
    }

    JsonObject polling = doc["polling"];
    if (!polling.isNull()) {
        if (polling.containsKey("poll_interval_ms")) polling_config_.poll_interval_ms = polling["poll_interval_ms"].as<uint32_t>();
        if (polling.containsKey("control_interval_ms")) polling_config_.control_interval_ms = polling["control_interval_ms"].as<uint32_t>();
    }

    JsonObject storage = doc["storage"];
    if (!storage.isNull()) {
        if (storage.containsKey("database_path")) storage_config_.database_path = storage["database_path"].as<std::string>();
        if (storage.containsKey("response_dir")) storage_config_.response_dir = storage["response_dir"].as<std::string>();
    }

    JsonObject logging = doc["logging"];
    if (!logging.isNull()) {
        if (logging.containsKey("log_level")) logging_config_.log_level = logging["log_level"].as<std::string>();
        if (logging.containsKey("log_file")) logging_config_.log_file = logging["log_file"].as<std::string>();
        if (logging.containsKey("flush_on_write")) logging_config_.flush_on_write = logging["flush_on_write"].as<bool>();
    }

    if (doc.containsKey("devices")) {
        if (!doc["devices"].is<const char*>()) {
            reason = "devices must be a string of device_id:device_type entries";
            return false;
        }
        std::vector<DeviceEntry> parsed;
        if (!parseDeviceList(doc["devices"].as<std::string>(), parsed, reason)) {
            return false;
        }
        devices_ = parsed;
    }
    return true;
}

bool ConfigManager::applyEnvironment(const EnvLookup& env, std::string& reason) {
    const char* v = nullptr;
    uint64_t n = 0;

    if ((v = env("TUYA_BASE_URL"))) tuya_config_.base_url = v;
    if ((v = env("TUYA_CLIENT_ID"))) tuya_config_.client_id = v;
    if ((v = env("TUYA_CLIENT_SECRET"))) tuya_config_.client_secret = v;
    if ((v = env("TUYA_TIMEOUT_MS"))) {
        if (!parseUnsigned(v, UINT32_MAX, n)) {
            reason = "TUYA_TIMEOUT_MS must be a non-negative integer";
            return false;
        }
        tuya_config_.timeout_ms = (uint32_t)n;
    }
    if ((v = env("TUYA_DEVICE_IDS"))) {
        std::vector<DeviceEntry> parsed;
        if (!parseDeviceList(v, parsed, reason)) {
            reason = "TUYA_DEVICE_IDS: " + reason;
            return false;
        }
        devices_ = parsed;
    }
    if ((v = env("SERVER_HOST"))) server_config_.host = v;
    if ((v = env("SERVER_PORT"))) {
        if (!parseUnsigned(v, 65535, n) || n == 0) {
            reason = "SERVER_PORT must be between 1 and 65535";
            return false;
        }
        server_config_.port = (uint16_t)n;
    }
    if ((v = env("POLL_INTERVAL_SECS"))) {
        if (!parseUnsigned(v, UINT32_MAX / 1000, n)) {
            reason = "POLL_INTERVAL_SECS must be a non-negative integer";
            return false;
        }
        polling_config_.poll_interval_ms = (uint32_t)(n * 1000);
    }
    if ((v = env("CONTROL_INTERVAL_SECS"))) {
        if (!parseUnsigned(v, UINT32_MAX / 1000, n)) {
            reason = "CONTROL_INTERVAL_SECS must be a non-negative integer";
            return false;
        }
        polling_config_.control_interval_ms = (uint32_t)(n * 1000);
    }
    if ((v = env("DATABASE_PATH"))) storage_config_.database_path = v;
    if ((v = env("RESPONSE_DIR"))) storage_config_.response_dir = v;
    if ((v = env("LOG_LEVEL"))) logging_config_.log_level = v;
    if ((v = env("LOG_FILE"))) logging_config_.log_file = v;
    return true;
}

bool ConfigManager::validate(std::string& reason) const {
    if (tuya_config_.base_url.empty()) {
        reason = "TUYA_BASE_URL must be set";
        return false;
    }
    if (tuya_config_.client_id.empty()) {
        reason = "TUYA_CLIENT_ID must be set";
        return false;
    }
    if (tuya_config_.client_secret.empty()) {
        reason = "TUYA_CLIENT_SECRET must be set";
        return false;
    }
    if (storage_config_.database_path.empty()) {
        reason = "storage.database_path must be set";
        return false;
    }
    if (!validateTimeout(tuya_config_.timeout_ms, reason)) return false;
    if (!validateInterval(polling_config_.poll_interval_ms, reason)) {
        reason = "poll interval: " + reason;
        return false;
    }
    if (!validateInterval(polling_config_.control_interval_ms, reason)) {
        reason = "control interval: " + reason;
        return false;
    }
    Logger::Level level;
    if (!Logger::parseLevel(logging_config_.log_level, level)) {
        reason = "Unknown log level: " + logging_config_.log_level;
        return false;
    }
    return true;
}

TuyaConfig ConfigManager::getTuyaConfig() const { return tuya_config_; }
ServerConfig ConfigManager::getServerConfig() const { return server_config_; }
PollingConfig ConfigManager::getPollingConfig() const { return polling_config_; }
StorageConfig ConfigManager::getStorageConfig() const { return storage_config_; }
LoggingConfig ConfigManager::getLoggingConfig() const { return logging_config_; }
std::vector<DeviceEntry> ConfigManager::getDevices() const { return devices_; }

bool ConfigManager::validateInterval(uint32_t interval_ms, std::string& reason) const {
    if (interval_ms < validation_rules_.min_interval_ms) {
        reason = "Interval too low (min: " +
                 std::to_string(validation_rules_.min_interval_ms) + " ms)";
        return false;
    }
    if (interval_ms > validation_rules_.max_interval_ms) {
        reason = "Interval too high (max: " +
                 std::to_string(validation_rules_.max_interval_ms) + " ms)";
        return false;
    }
    return true;
}

bool ConfigManager::validateTimeout(uint32_t timeout_ms, std::string& reason) const {
    if (timeout_ms < validation_rules_.min_timeout_ms || timeout_ms > validation_rules_.max_timeout_ms) {
        reason = "Request timeout must be between " +
                 std::to_string(validation_rules_.min_timeout_ms) + " and " +
                 std::to_string(validation_rules_.max_timeout_ms) + " ms";
        return false;
    }
    return true;
}

bool ConfigManager::parseDeviceList(const std::string& list, std::vector<DeviceEntry>& out,
                                    std::string& reason) {
    out.clear();
    std::stringstream ss(list);
    std::string item;
    while (std::getline(ss, item, ',')) {
        std::string entry = trim(item);
        if (entry.empty()) continue;

        size_t colon = entry.find(':');
        if (colon == std::string::npos) {
            reason = "Invalid device entry '" + entry + "', expected device_id:device_type";
            return false;
        }
        DeviceEntry device;
        device.device_id = trim(entry.substr(0, colon));
        std::string type_name = trim(entry.substr(colon + 1));
        if (device.device_id.empty()) {
            reason = "Invalid device entry '" + entry + "', expected device_id:device_type";
            return false;
        }
        if (!parseDeviceType(type_name, device.device_type)) {
            reason = "unknown device type '" + type_name + "' for device " + device.device_id;
            return false;
        }
        out.push_back(device);
    }
    return true;
}

std::string ConfigManager::describe() const {
    std::string s = "base_url=" + tuya_config_.base_url +
                    " client_id=" + tuya_config_.client_id +
                    " client_secret=***" +
                    " devices=" + std::to_string(devices_.size()) +
                    " server=" + server_config_.host + ":" + std::to_string(server_config_.port) +
                    " poll=" + std::to_string(polling_config_.poll_interval_ms) + "ms" +
                    " control=" + std::to_string(polling_config_.control_interval_ms) + "ms" +
                    " db=" + storage_config_.database_path;
    return s;
}
