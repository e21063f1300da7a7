#include "../include/api_router.hpp"
#include "../include/logger.hpp"
#include "../include/reading_cache.hpp"
#include "../include/reading_store.hpp"
#include <ArduinoJson.h>
#include <cerrno>
#include <cstdlib>
#include <optional>

namespace {

void fillReading(JsonObject obj, const EncodedReading& r) {
    obj["device_id"] = r.device_id;
    obj["sensor_type"] = sensorKindToString(r.sensor_kind);
    obj["recorded_at"] = r.recorded_at;
    obj["value"] = r.value;
}

// Missing parameter leaves out unset; a present but malformed one fails
bool parseTimeParam(const QueryParams& query, const char* name, std::optional<int64_t>& out) {
    auto it = query.find(name);
    if (it == query.end()) return true;
    const char* text = it->second.c_str();
    if (!*text) return false;
    char* end = nullptr;
    errno = 0;
    long long v = std::strtoll(text, &end, 10);
    if (errno != 0 || *end != '\0') return false;
    out = (int64_t)v;
    return true;
}

} // namespace

ApiRouter::ApiRouter(ReadingStore* store, ReadingCache* cache) : store_(store), cache_(cache) {}

ApiRouter::~ApiRouter() {}

std::vector<std::string> ApiRouter::splitPath(const std::string& path) {
    std::vector<std::string> parts;
    size_t start = 0;
    while (start <= path.size()) {
        size_t slash = path.find('/', start);
        if (slash == std::string::npos) slash = path.size();
        if (slash > start) parts.push_back(path.substr(start, slash - start));
        start = slash + 1;
    }
    return parts;
}

ApiResponse ApiRouter::handle(const std::string& method, const std::string& path, const QueryParams& query) const {
    std::vector<std::string> parts = splitPath(path);
    bool known = (parts.size() == 1 && parts[0] == "health") ||
                 (parts.size() >= 2 && parts.size() <= 4 && parts[0] == "sensors");
    if (!known) return error(404, "not found");
    if (method != "GET") return error(405, "method not allowed");

    if (parts.size() == 1) return health();
    if (parts.size() == 2) {
        if (parts[1] == "latest") return latest();
        if (parts[1] == "cache") return cacheSnapshot();
        return error(404, "not found");
    }
    if (parts.size() == 3) return series(parts[1], parts[2], query);
    if (parts[3] == "latest") return seriesLatest(parts[1], parts[2]);
    return error(404, "not found");
}

ApiResponse ApiRouter::health() const {
    ApiResponse response;
    response.body = "{\"status\":\"ok\"}";
    return response;
}

ApiResponse ApiRouter::latest() const {
    std::vector<EncodedReading> readings;
    if (!store_->latest(readings)) return error(500, "storage error");
    ApiResponse response;
    response.body = readingsToJson(readings);
    return response;
}

ApiResponse ApiRouter::cacheSnapshot() const {
    ApiResponse response;
    response.body = readingsToJson(cache_->all());
    return response;
}

ApiResponse ApiRouter::series(const std::string& device_id, const std::string& sensor_type,
                              const QueryParams& query) const {
    SensorKind kind;
    if (!parseSensorKind(sensor_type, kind)) return error(400, "unknown sensor type '" + sensor_type + "'");

    std::optional<int64_t> from;
    std::optional<int64_t> to;
    if (!parseTimeParam(query, "from", from)) return error(400, "'from' must be an integer (Unix ms)");
    if (!parseTimeParam(query, "to", to)) return error(400, "'to' must be an integer (Unix ms)");

    std::vector<EncodedReading> readings;
    if (!store_->range(device_id, kind, from, to, readings)) return error(500, "storage error");
    ApiResponse response;
    response.body = readingsToJson(readings);
    return response;
}

ApiResponse ApiRouter::seriesLatest(const std::string& device_id, const std::string& sensor_type) const {
    SensorKind kind;
    if (!parseSensorKind(sensor_type, kind)) return error(400, "unknown sensor type '" + sensor_type + "'");

    EncodedReading reading;
    bool found = false;
    if (!store_->latestFor(device_id, kind, reading, found)) return error(500, "storage error");
    ApiResponse response;
    response.body = found ? readingToJson(reading) : "null";
    return response;
}

ApiResponse ApiRouter::error(int status_code, const std::string& message) {
    if (status_code >= 500) Logger::error("[Api] %d %s", status_code, message.c_str());
    DynamicJsonDocument doc(256 + message.size());
    doc["error"] = message;
    ApiResponse response;
    response.status_code = status_code;
    serializeJson(doc, response.body);
    return response;
}

std::string ApiRouter::readingToJson(const EncodedReading& reading) {
    DynamicJsonDocument doc(512 + reading.device_id.size());
    fillReading(doc.to<JsonObject>(), reading);
    std::string out;
    serializeJson(doc, out);
    return out;
}

std::string ApiRouter::readingsToJson(const std::vector<EncodedReading>& readings) {
    DynamicJsonDocument doc(1024 + readings.size() * 256);
    JsonArray arr = doc.to<JsonArray>();
    for (const auto& r : readings) {
        fillReading(arr.createNestedObject(), r);
    }
    std::string out;
    serializeJson(doc, out);
    return out;
}
