#pragma once
#include <map>
#include <string>
#include <vector>
#include "types.hpp"

class ReadingStore;
class ReadingCache;

struct ApiResponse {
    int status_code = 200;
    std::string body;           // JSON
};

using QueryParams = std::map<std::string, std::string>;

/**
 * @class ApiRouter
 * @brief REST route table over the reading store and cache
 *
 * GET /health
 * GET /sensors/latest
 * GET /sensors/cache
 * GET /sensors/{device_id}/{sensor_type}?from=&to=
 * GET /sensors/{device_id}/{sensor_type}/latest
 *
 * Independent of the HTTP server so it can be exercised directly.
 */
class ApiRouter {
public:
    ApiRouter(ReadingStore* store, ReadingCache* cache);
    ~ApiRouter();

    ApiResponse handle(const std::string& method, const std::string& path, const QueryParams& query) const;

    static std::string readingToJson(const EncodedReading& reading);
    static std::string readingsToJson(const std::vector<EncodedReading>& readings);

private:
    ReadingStore* store_;
    ReadingCache* cache_;

    ApiResponse health() const;
    ApiResponse latest() const;
    ApiResponse cacheSnapshot() const;
    ApiResponse series(const std::string& device_id, const std::string& sensor_type, const QueryParams& query) const;
    ApiResponse seriesLatest(const std::string& device_id, const std::string& sensor_type) const;

    static ApiResponse error(int status_code, const std::string& message);
    static std::vector<std::string> splitPath(const std::string& path);
};
