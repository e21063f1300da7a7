#pragma once
#include <mutex>
#include <string>

// Best-effort on-disk copy of raw vendor responses:
// <base_dir>/<endpoint>/<UTC timestamp>[_<suffix>].json
class ResponseArchive {
public:
    explicit ResponseArchive(const std::string& base_dir, bool enabled = true);
    ~ResponseArchive();

    // Failures are logged, never reported to the caller
    void save(const std::string& endpoint, const std::string& suffix, const std::string& body);

    // Path save() would write to at the given time (ms since epoch)
    std::string buildPath(const std::string& endpoint, const std::string& suffix, long long now_ms) const;

    bool isEnabled() const { return enabled_; }
    const std::string& baseDir() const { return base_dir_; }

private:
    std::string base_dir_;
    bool enabled_;
    std::mutex mutex_;
};
