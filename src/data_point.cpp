#include "../include/data_point.hpp"
#include "../include/logger.hpp"

bool parseDpValue(JsonVariantConst json, DpValue& out) {
    if (json.is<bool>()) {
        out = json.as<bool>();
        return true;
    }
    if (json.is<int64_t>()) {
        out = json.as<int64_t>();
        return true;
    }
    if (json.is<const char*>()) {
        out = std::string(json.as<const char*>());
        return true;
    }
    return false;
}

TuyaResult parseDataPoints(JsonVariantConst result, std::vector<DataPoint>& out) {
    out.clear();
    if (!result.is<JsonArrayConst>()) {
        return tuyaError(TuyaStatus::PROTOCOL_ERROR, "status result is not an array");
    }
    for (JsonVariantConst item : result.as<JsonArrayConst>()) {
        if (!item.is<JsonObjectConst>() || !item["code"].is<const char*>()) {
            return tuyaError(TuyaStatus::PROTOCOL_ERROR, "status entry without a string 'code'");
        }
        DataPoint dp;
        dp.code = item["code"].as<const char*>();
        if (!parseDpValue(item["value"], dp.value)) {
            Logger::warn("[DataPoint] Dropping '%s': unsupported value type", dp.code.c_str());
            continue;
        }
        out.push_back(dp);
    }
    return tuyaOk();
}

TuyaResult parseShadowProperties(JsonVariantConst result, std::vector<ShadowProperty>& out) {
    out.clear();
    if (!result.is<JsonObjectConst>() || !result["properties"].is<JsonArrayConst>()) {
        return tuyaError(TuyaStatus::PROTOCOL_ERROR, "shadow result has no 'properties' array");
    }
    for (JsonVariantConst item : result["properties"].as<JsonArrayConst>()) {
        if (!item.is<JsonObjectConst>() || !item["code"].is<const char*>()) {
            return tuyaError(TuyaStatus::PROTOCOL_ERROR, "shadow property without a string 'code'");
        }
        ShadowProperty prop;
        prop.code = item["code"].as<const char*>();
        prop.dp_id = item["dp_id"].as<int64_t>();
        prop.time = item["time"].as<int64_t>();
        prop.type = item["type"].is<const char*>() ? item["type"].as<const char*>() : "";
        prop.custom_name = item["custom_name"].is<const char*>() ? item["custom_name"].as<const char*>() : "";
        if (!parseDpValue(item["value"], prop.value)) {
            Logger::warn("[DataPoint] Dropping shadow property '%s': unsupported value type", prop.code.c_str());
            continue;
        }
        out.push_back(prop);
    }
    return tuyaOk();
}

std::vector<DataPoint> toDataPoints(const std::vector<ShadowProperty>& properties) {
    std::vector<DataPoint> dps;
    dps.reserve(properties.size());
    for (const auto& prop : properties) {
        dps.push_back(DataPoint{prop.code, prop.value});
    }
    return dps;
}

const DataPoint* findDataPoint(const std::vector<DataPoint>& dps, const std::string& code) {
    for (const auto& dp : dps) {
        if (dp.code == code) return &dp;
    }
    return nullptr;
}

void writeDpValue(JsonObject obj, const char* key, const DpValue& value) {
    if (const bool* b = std::get_if<bool>(&value)) {
        obj[key] = *b;
    } else if (const int64_t* i = std::get_if<int64_t>(&value)) {
        obj[key] = *i;
    } else {
        obj[key] = std::get<std::string>(value);
    }
}

std::string dpValueToString(const DpValue& value) {
    if (const bool* b = std::get_if<bool>(&value)) return *b ? "true" : "false";
    if (const int64_t* i = std::get_if<int64_t>(&value)) return std::to_string(*i);
    return "\"" + std::get<std::string>(value) + "\"";
}
