#include "../include/response_archive.hpp"
#include "../include/logger.hpp"
#include <ArduinoJson.h>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

ResponseArchive::ResponseArchive(const std::string& base_dir, bool enabled)
    : base_dir_(base_dir), enabled_(enabled && !base_dir.empty()) {}

ResponseArchive::~ResponseArchive() {}

std::string ResponseArchive::buildPath(const std::string& endpoint, const std::string& suffix,
                                       long long now_ms) const {
    std::time_t secs = (std::time_t)(now_ms / 1000);
    std::tm tm_buf;
    gmtime_r(&secs, &tm_buf);
    char stamp[40];
    size_t n = std::strftime(stamp, sizeof(stamp), "%Y%m%dT%H%M%S", &tm_buf);
    snprintf(stamp + n, sizeof(stamp) - n, ".%03lldZ", now_ms % 1000);

    std::string file = stamp;
    if (!suffix.empty()) file += "_" + suffix;
    file += ".json";
    return (fs::path(base_dir_) / endpoint / file).string();
}

void ResponseArchive::save(const std::string& endpoint, const std::string& suffix, const std::string& body) {
    if (!enabled_) return;

    long long now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
    fs::path path(buildPath(endpoint, suffix, now_ms));

    // Pretty-print when the body is JSON, keep it verbatim otherwise
    std::string content = body;
    DynamicJsonDocument doc(body.size() * 2 + 1024);
    if (!deserializeJson(doc, body)) {
        content.clear();
        serializeJsonPretty(doc, content);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    std::error_code ec;
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
        Logger::warn("[Archive] Cannot create %s: %s", path.parent_path().string().c_str(), ec.message().c_str());
        return;
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        Logger::warn("[Archive] Cannot open %s for writing", path.string().c_str());
        return;
    }
    out << content;
    if (!out) {
        Logger::warn("[Archive] Write to %s failed", path.string().c_str());
        return;
    }
    Logger::debug("[Archive] Saved %s (%u bytes)", path.string().c_str(), (unsigned)content.size());
}
