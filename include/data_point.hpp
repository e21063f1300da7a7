#pragma once

#include <stdint.h>
#include <string>
#include <variant>
#include <vector>
#include <ArduinoJson.h>
#include "tuya_response.hpp"

// A data point value is a boolean, an integer or text. Tried in that order,
// so JSON true/false never becomes 1/0.
using DpValue = std::variant<bool, int64_t, std::string>;

struct DataPoint {
    std::string code;
    DpValue value;
};

// One entry of the v2 shadow properties feed
struct ShadowProperty {
    std::string code;
    int64_t dp_id = 0;
    int64_t time = 0;          // ms since epoch, as reported by the device
    std::string type;
    DpValue value;
    std::string custom_name;
};

/**
 * @brief Convert one JSON value into a DpValue
 * @return false for floats, null, arrays and objects
 */
bool parseDpValue(JsonVariantConst json, DpValue& out);

/**
 * @brief Parse the v1 status result: [{code, value}, ...]
 *
 * Entries with an unsupported value type are dropped with a warning.
 */
TuyaResult parseDataPoints(JsonVariantConst result, std::vector<DataPoint>& out);

/**
 * @brief Parse the v2 shadow result: {properties: [{code, dp_id, time, type, value, custom_name}, ...]}
 */
TuyaResult parseShadowProperties(JsonVariantConst result, std::vector<ShadowProperty>& out);

// {code, value} projection used by the status builders
std::vector<DataPoint> toDataPoints(const std::vector<ShadowProperty>& properties);

// Linear find by code, nullptr when absent
const DataPoint* findDataPoint(const std::vector<DataPoint>& dps, const std::string& code);

// Store a value under obj[key] (commands body)
void writeDpValue(JsonObject obj, const char* key, const DpValue& value);

std::string dpValueToString(const DpValue& value);
