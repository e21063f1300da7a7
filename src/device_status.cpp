#include "../include/device_status.hpp"
#include "../include/logger.hpp"
#include <mbedtls/base64.h>
#include <algorithm>

namespace {

const char* const THERMOSTAT_CODES[] = {
    "switch", "temp_current", "temp_set", "mode", "child_lock",
    "fault", "upper_temp", "temp_correction", "frost", "sound"
};

const char* const ENERGY_METER_CODES[] = {
    "switch", "total_forward_energy", "phase_a", "phase_b", "phase_c", "fault",
    "switch_prepayment", "balance_energy", "charge_energy", "leakage_current",
    "reverse_energy_total", "temp_current", "countdown_1", "alarm_set_1",
    "alarm_set_2", "cycle_time", "random_time", "energy_reset"
};

const char* const WEATHER_STATION_CODES[] = {
    "local_temp", "local_hum", "sub1_temp", "sub1_hum", "sub2_temp",
    "sub2_hum", "sub3_temp", "sub3_hum", "temp_unit_convert"
};

template <size_t N>
void logUnknownCodes(const char* family, const std::vector<DataPoint>& dps, const char* const (&known)[N]) {
    for (const auto& dp : dps) {
        bool found = std::any_of(std::begin(known), std::end(known),
                                 [&dp](const char* code) { return dp.code == code; });
        if (!found) {
            Logger::debug("[Status] %s: ignoring unknown code '%s' = %s", family, dp.code.c_str(),
                          dpValueToString(dp.value).c_str());
        }
    }
}

// A value of the wrong type reads as absent.
template <typename T>
std::optional<T> lookup(const std::vector<DataPoint>& dps, const char* code) {
    const DataPoint* dp = findDataPoint(dps, code);
    if (!dp) return std::nullopt;
    if (const T* v = std::get_if<T>(&dp->value)) return *v;
    return std::nullopt;
}

TuyaResult missing(const char* family, const char* what, const char* code) {
    return tuyaError(TuyaStatus::DECODE_ERROR,
                     std::string(family) + ": missing required " + what + " '" + code + "'");
}

uint32_t readBigEndian(const unsigned char* p, size_t n) {
    uint32_t v = 0;
    for (size_t i = 0; i < n; i++) v = (v << 8) | p[i];
    return v;
}

EncodedReading makeReading(const std::string& device_id, SensorKind kind, int64_t recorded_at, int64_t value) {
    EncodedReading r;
    r.device_id = device_id;
    r.sensor_kind = kind;
    r.recorded_at = recorded_at;
    r.value = value;
    return r;
}

} // namespace

// ============================================================================
// Builders
// ============================================================================

TuyaResult buildThermostatStatus(const std::vector<DataPoint>& dps, ThermostatStatus& out) {
    ThermostatStatus s;
    auto sw = lookup<bool>(dps, "switch");
    if (!sw) return missing("thermostat", "DP", "switch");
    auto temp_current = lookup<int64_t>(dps, "temp_current");
    if (!temp_current) return missing("thermostat", "DP", "temp_current");
    auto temp_set = lookup<int64_t>(dps, "temp_set");
    if (!temp_set) return missing("thermostat", "DP", "temp_set");
    auto mode = lookup<std::string>(dps, "mode");
    if (!mode) return missing("thermostat", "DP", "mode");

    s.switch_on = *sw;
    s.temp_current = *temp_current;
    s.temp_set = *temp_set;
    s.mode = *mode;
    s.child_lock = lookup<bool>(dps, "child_lock");
    s.fault = lookup<int64_t>(dps, "fault");
    s.upper_temp = lookup<int64_t>(dps, "upper_temp");
    s.temp_correction = lookup<int64_t>(dps, "temp_correction");
    s.frost = lookup<bool>(dps, "frost");
    s.sound = lookup<bool>(dps, "sound");

    logUnknownCodes("thermostat", dps, THERMOSTAT_CODES);
    out = s;
    return tuyaOk();
}

TuyaResult buildEnergyMeterStatus(const std::vector<DataPoint>& dps, EnergyMeterStatus& out) {
    EnergyMeterStatus s;
    auto sw = lookup<bool>(dps, "switch");
    if (!sw) return missing("energy_meter", "DP", "switch");
    auto total = lookup<int64_t>(dps, "total_forward_energy");
    if (!total) return missing("energy_meter", "DP", "total_forward_energy");
    auto phase_a = lookup<std::string>(dps, "phase_a");
    if (!phase_a) return missing("energy_meter", "DP", "phase_a");
    auto phase_b = lookup<std::string>(dps, "phase_b");
    if (!phase_b) return missing("energy_meter", "DP", "phase_b");
    auto phase_c = lookup<std::string>(dps, "phase_c");
    if (!phase_c) return missing("energy_meter", "DP", "phase_c");

    s.switch_on = *sw;
    s.total_forward_energy = *total;
    s.phase_a = *phase_a;
    s.phase_b = *phase_b;
    s.phase_c = *phase_c;
    s.fault = lookup<int64_t>(dps, "fault");
    s.switch_prepayment = lookup<bool>(dps, "switch_prepayment");
    s.balance_energy = lookup<int64_t>(dps, "balance_energy");
    s.charge_energy = lookup<int64_t>(dps, "charge_energy");
    s.leakage_current = lookup<int64_t>(dps, "leakage_current");
    s.reverse_energy_total = lookup<int64_t>(dps, "reverse_energy_total");
    s.temp_current = lookup<int64_t>(dps, "temp_current");
    s.countdown_1 = lookup<int64_t>(dps, "countdown_1");
    s.alarm_set_1 = lookup<std::string>(dps, "alarm_set_1");
    s.alarm_set_2 = lookup<std::string>(dps, "alarm_set_2");
    s.cycle_time = lookup<std::string>(dps, "cycle_time");
    s.random_time = lookup<std::string>(dps, "random_time");
    s.energy_reset = lookup<std::string>(dps, "energy_reset");

    logUnknownCodes("energy_meter", dps, ENERGY_METER_CODES);
    out = s;
    return tuyaOk();
}

TuyaResult buildWeatherStationStatus(const std::vector<DataPoint>& dps, WeatherStationStatus& out) {
    WeatherStationStatus s;
    auto local_temp = lookup<int64_t>(dps, "local_temp");
    if (!local_temp) return missing("weather_station", "property", "local_temp");
    auto local_hum = lookup<int64_t>(dps, "local_hum");
    if (!local_hum) return missing("weather_station", "property", "local_hum");

    s.local_temp = *local_temp;
    s.local_hum = *local_hum;
    s.sub1_temp = lookup<int64_t>(dps, "sub1_temp");
    s.sub1_hum = lookup<int64_t>(dps, "sub1_hum");
    s.sub2_temp = lookup<int64_t>(dps, "sub2_temp");
    s.sub2_hum = lookup<int64_t>(dps, "sub2_hum");
    s.sub3_temp = lookup<int64_t>(dps, "sub3_temp");
    s.sub3_hum = lookup<int64_t>(dps, "sub3_hum");
    s.temp_unit = lookup<std::string>(dps, "temp_unit_convert");

    logUnknownCodes("weather_station", dps, WEATHER_STATION_CODES);
    out = s;
    return tuyaOk();
}

TuyaResult buildDeviceStatus(DeviceType type, const std::vector<DataPoint>& dps, DeviceStatus& out) {
    TuyaResult result;
    switch (type) {
        case DeviceType::THERMOSTAT: {
            ThermostatStatus s;
            result = buildThermostatStatus(dps, s);
            if (result.is_success()) out = s;
            break;
        }
        case DeviceType::ENERGY_METER: {
            EnergyMeterStatus s;
            result = buildEnergyMeterStatus(dps, s);
            if (result.is_success()) out = s;
            break;
        }
        case DeviceType::WEATHER_STATION: {
            WeatherStationStatus s;
            result = buildWeatherStationStatus(dps, s);
            if (result.is_success()) out = s;
            break;
        }
        default:
            result = tuyaError(TuyaStatus::INVALID_ARGUMENT, "unknown device type");
            break;
    }
    return result;
}

// ============================================================================
// Phase blobs
// ============================================================================

bool decodePhase(const std::string& blob, PhaseReading& out) {
    unsigned char raw[16];
    size_t olen = 0;
    int ret = mbedtls_base64_decode(raw, sizeof(raw), &olen,
                                    (const unsigned char*)blob.data(), blob.size());
    if (ret != 0 || olen < 8) {
        return false;
    }
    out.voltage_dv = readBigEndian(raw, 2);
    out.current_ma = readBigEndian(raw + 2, 3);
    out.power_w = readBigEndian(raw + 5, 3);
    return true;
}

std::optional<uint32_t> EnergyMeterStatus::totalPowerWatts() const {
    PhaseReading a, b, c;
    if (!decodePhase(phase_a, a) || !decodePhase(phase_b, b) || !decodePhase(phase_c, c)) {
        return std::nullopt;
    }
    return a.power_w + b.power_w + c.power_w;
}

// ============================================================================
// Reading encoding
// ============================================================================

std::vector<EncodedReading> toEncodedReadings(const DeviceStatus& status, const std::string& device_id,
                                              int64_t recorded_at) {
    std::vector<EncodedReading> readings;
    // Appends kind unless raw * factor leaves the int64 range
    auto pushScaled = [&](SensorKind kind, int64_t raw, int64_t factor) {
        int64_t value = 0;
        if (!encodeScaled(raw, factor, value)) {
            Logger::warn("[Status] %s: %s value %lld out of range, not reported", device_id.c_str(),
                         sensorKindToString(kind), (long long)raw);
            return;
        }
        readings.push_back(makeReading(device_id, kind, recorded_at, value));
    };

    if (const ThermostatStatus* t = std::get_if<ThermostatStatus>(&status)) {
        readings.push_back(makeReading(device_id, SensorKind::RELAY_STATE, recorded_at, encodeBool(t->switch_on)));
        pushScaled(SensorKind::TEMPERATURE, t->temp_current, 10);
        pushScaled(SensorKind::TEMPERATURE_SETPOINT, t->temp_set, 10);
    } else if (const EnergyMeterStatus* e = std::get_if<EnergyMeterStatus>(&status)) {
        readings.push_back(makeReading(device_id, SensorKind::RELAY_STATE, recorded_at, encodeBool(e->switch_on)));
        if (e->temp_current) {
            pushScaled(SensorKind::TEMPERATURE, *e->temp_current, 100);
        }
        std::optional<uint32_t> watts = e->totalPowerWatts();
        if (watts) {
            pushScaled(SensorKind::POWER_CONSUMPTION, (int64_t)*watts, 100);
        } else {
            Logger::warn("[Status] %s: phase data undecodable, power not reported", device_id.c_str());
        }
    } else if (const WeatherStationStatus* w = std::get_if<WeatherStationStatus>(&status)) {
        pushScaled(SensorKind::TEMPERATURE, w->local_temp, 10);
        pushScaled(SensorKind::HUMIDITY, w->local_hum, 100);
    }
    return readings;
}
