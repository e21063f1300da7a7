#pragma once
#include <cstdint>
#include <limits>
#include <string>

// Normalized sensor dimension. String forms are the REST path segment and the
// stored sensor_type column.
enum class SensorKind {
    TEMPERATURE,
    HUMIDITY,
    DOOR_OPEN,
    POWER_CONSUMPTION,
    RELAY_STATE,
    TEMPERATURE_SETPOINT
};

// Device families the bridge knows how to decode.
enum class DeviceType {
    THERMOSTAT,
    ENERGY_METER,
    WEATHER_STATION
};

struct EncodedReading {
    std::string device_id;
    SensorKind sensor_kind = SensorKind::TEMPERATURE;
    int64_t recorded_at = 0;   // Unix ms
    int64_t value = 0;
};

struct DeviceEntry {
    std::string device_id;
    DeviceType device_type = DeviceType::THERMOSTAT;
};

inline const char* sensorKindToString(SensorKind kind) {
    switch (kind) {
        case SensorKind::TEMPERATURE: return "temperature";
        case SensorKind::HUMIDITY: return "humidity";
        case SensorKind::DOOR_OPEN: return "door_open";
        case SensorKind::POWER_CONSUMPTION: return "power_consumption";
        case SensorKind::RELAY_STATE: return "relay_state";
        case SensorKind::TEMPERATURE_SETPOINT: return "temperature_setpoint";
        default: return "unknown";
    }
}

inline bool parseSensorKind(const std::string& name, SensorKind& out) {
    if (name == "temperature") out = SensorKind::TEMPERATURE;
    else if (name == "humidity") out = SensorKind::HUMIDITY;
    else if (name == "door_open") out = SensorKind::DOOR_OPEN;
    else if (name == "power_consumption") out = SensorKind::POWER_CONSUMPTION;
    else if (name == "relay_state") out = SensorKind::RELAY_STATE;
    else if (name == "temperature_setpoint") out = SensorKind::TEMPERATURE_SETPOINT;
    else return false;
    return true;
}

inline const char* deviceTypeToString(DeviceType type) {
    switch (type) {
        case DeviceType::THERMOSTAT: return "thermostat";
        case DeviceType::ENERGY_METER: return "energy_meter";
        case DeviceType::WEATHER_STATION: return "weather_station";
        default: return "unknown";
    }
}

inline bool parseDeviceType(const std::string& name, DeviceType& out) {
    if (name == "thermostat") out = DeviceType::THERMOSTAT;
    else if (name == "energy_meter") out = DeviceType::ENERGY_METER;
    else if (name == "weather_station") out = DeviceType::WEATHER_STATION;
    else return false;
    return true;
}

// Numeric kinds are stored as hundredths: raw tenths scale by 10, whole
// units by 100. Fails instead of overflowing.
inline bool encodeScaled(int64_t raw, int64_t factor, int64_t& out) {
    if (factor <= 0) return false;
    if (raw > std::numeric_limits<int64_t>::max() / factor ||
        raw < std::numeric_limits<int64_t>::min() / factor) {
        return false;
    }
    out = raw * factor;
    return true;
}

inline int64_t encodeBool(bool value) {
    return value ? 1 : 0;
}

// Divisor that turns a stored value back into its physical unit.
inline int64_t sensorKindDivisor(SensorKind kind) {
    switch (kind) {
        case SensorKind::RELAY_STATE:
        case SensorKind::DOOR_OPEN:
            return 1;
        default:
            return 100;
    }
}
