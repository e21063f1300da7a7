#pragma once

#include <stdint.h>
#include <optional>
#include <string>
#include <variant>
#include <vector>
#include "data_point.hpp"
#include "tuya_response.hpp"
#include "types.hpp"

// Thermostat, v1 status feed. Temperatures are in 0.1 °C.
struct ThermostatStatus {
    bool switch_on = false;
    int64_t temp_current = 0;
    int64_t temp_set = 0;
    std::string mode;
    std::optional<bool> child_lock;
    std::optional<int64_t> fault;
    std::optional<int64_t> upper_temp;
    std::optional<int64_t> temp_correction;
    std::optional<bool> frost;
    std::optional<bool> sound;

    double tempCurrentCelsius() const { return temp_current / 10.0; }
    double tempSetCelsius() const { return temp_set / 10.0; }
};

// One electrical phase from an energy meter blob
struct PhaseReading {
    uint32_t voltage_dv = 0;   // 0.1 V
    uint32_t current_ma = 0;
    uint32_t power_w = 0;

    double voltageVolts() const { return voltage_dv / 10.0; }
    double currentAmps() const { return current_ma / 1000.0; }
};

// Three-phase energy meter, v1 status feed. phase_a/b/c are base64 blobs.
struct EnergyMeterStatus {
    bool switch_on = false;
    int64_t total_forward_energy = 0;
    std::string phase_a;
    std::string phase_b;
    std::string phase_c;
    std::optional<int64_t> fault;
    std::optional<bool> switch_prepayment;
    std::optional<int64_t> balance_energy;
    std::optional<int64_t> charge_energy;
    std::optional<int64_t> leakage_current;      // mA
    std::optional<int64_t> reverse_energy_total;
    std::optional<int64_t> temp_current;         // whole °C
    std::optional<int64_t> countdown_1;
    std::optional<std::string> alarm_set_1;
    std::optional<std::string> alarm_set_2;
    std::optional<std::string> cycle_time;
    std::optional<std::string> random_time;
    std::optional<std::string> energy_reset;

    // Sum of the three phase powers in W, absent if any blob is undecodable
    std::optional<uint32_t> totalPowerWatts() const;
};

// Weather station with up to three sub-sensors, v2 shadow feed.
// Temperatures are in 0.1 °C, humidity in whole percent.
struct WeatherStationStatus {
    int64_t local_temp = 0;
    int64_t local_hum = 0;
    std::optional<int64_t> sub1_temp;
    std::optional<int64_t> sub1_hum;
    std::optional<int64_t> sub2_temp;
    std::optional<int64_t> sub2_hum;
    std::optional<int64_t> sub3_temp;
    std::optional<int64_t> sub3_hum;
    std::optional<std::string> temp_unit;         // "c" or "f"

    double localTempCelsius() const { return local_temp / 10.0; }
    double localHumPct() const { return (double)local_hum; }
};

using DeviceStatus = std::variant<ThermostatStatus, EnergyMeterStatus, WeatherStationStatus>;

TuyaResult buildThermostatStatus(const std::vector<DataPoint>& dps, ThermostatStatus& out);
TuyaResult buildEnergyMeterStatus(const std::vector<DataPoint>& dps, EnergyMeterStatus& out);
TuyaResult buildWeatherStationStatus(const std::vector<DataPoint>& dps, WeatherStationStatus& out);

/**
 * @brief Build the typed status selected by the configured device type
 * @param type Family of the device
 * @param dps Data points as returned by the vendor
 * @param out Typed status
 * @return DECODE_ERROR naming the first missing required code
 */
TuyaResult buildDeviceStatus(DeviceType type, const std::vector<DataPoint>& dps, DeviceStatus& out);

/**
 * @brief Decode a base64 phase blob
 *
 * Layout, big endian: voltage (2 bytes, 0.1 V), current (3 bytes, mA),
 * power (3 bytes, W).
 */
bool decodePhase(const std::string& blob, PhaseReading& out);

/**
 * @brief Normalize a typed status into readings stamped with recorded_at
 *
 * Thermostat: relay_state, temperature, temperature_setpoint.
 * Energy meter: relay_state, temperature (if reported), power_consumption (if decodable).
 * Weather station: temperature, humidity.
 */
std::vector<EncodedReading> toEncodedReadings(const DeviceStatus& status, const std::string& device_id,
                                              int64_t recorded_at);
