#include "../include/logger.hpp"
#include <chrono>
#include <cstdio>
#include <ctime>

namespace {

const char* const LEVEL_NAMES[] = {"DEBUG", "INFO", "WARN", "ERROR"};

} // namespace

std::atomic<Logger::Level> Logger::min_level_{Logger::INFO};
bool Logger::flush_on_write_ = true;
std::FILE* Logger::file_ = nullptr;
std::mutex Logger::mutex_;

void Logger::begin(const LoggingConfig& cfg) {
    Level level = INFO;
    if (!cfg.log_level.empty() && !parseLevel(cfg.log_level, level)) {
        std::fprintf(stderr, "Logger: unknown level %s, using INFO\n", cfg.log_level.c_str());
    }

    std::lock_guard<std::mutex> lock(mutex_);
    min_level_.store(level);
    flush_on_write_ = cfg.flush_on_write;
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
    if (!cfg.log_file.empty()) {
        file_ = std::fopen(cfg.log_file.c_str(), "a");
        if (!file_) {
            std::fprintf(stderr, "Logger: cannot open %s, logging to stdout only\n", cfg.log_file.c_str());
        }
    }
}

void Logger::setLevel(Level level) {
    min_level_.store(level);
}

bool Logger::parseLevel(const std::string& name, Level& out) {
    for (int i = DEBUG; i <= ERROR; ++i) {
        if (name == LEVEL_NAMES[i]) {
            out = static_cast<Level>(i);
            return true;
        }
    }
    return false;
}

const char* Logger::levelName(Level level) {
    return (level >= DEBUG && level <= ERROR) ? LEVEL_NAMES[level] : "INFO";
}

// YYYY-MM-DD HH:MM:SS.mmm, local time
void Logger::formatTimestamp(char* out, size_t out_size) {
    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    long ms = (long)(std::chrono::duration_cast<std::chrono::milliseconds>(
                  now.time_since_epoch()).count() % 1000);
    std::tm tm_buf;
    localtime_r(&secs, &tm_buf);
    size_t n = std::strftime(out, out_size, "%Y-%m-%d %H:%M:%S", &tm_buf);
    std::snprintf(out + n, out_size - n, ".%03ld", ms);
}

void Logger::write_log(Level level, const char* fmt, va_list args) {
    if (level < min_level_.load()) return;
    char message[1024];
    (void)std::vsnprintf(message, sizeof(message), fmt, args);
    char stamp[32];
    formatTimestamp(stamp, sizeof(stamp));

    std::lock_guard<std::mutex> lock(mutex_);
    std::printf("[%s] [%s] %s\n", stamp, levelName(level), message);
    if (file_) {
        std::fprintf(file_, "[%s] [%s] %s\n", stamp, levelName(level), message);
        if (flush_on_write_) std::fflush(file_);
    }
    if (flush_on_write_) std::fflush(stdout);
}

void Logger::log(Level level, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(level, fmt, args);
    va_end(args);
}

void Logger::debug(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(DEBUG, fmt, args);
    va_end(args);
}

void Logger::info(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(INFO, fmt, args);
    va_end(args);
}

void Logger::warn(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(WARN, fmt, args);
    va_end(args);
}

void Logger::error(const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    write_log(ERROR, fmt, args);
    va_end(args);
}

void Logger::flush() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::fflush(stdout);
    if (file_) std::fflush(file_);
}

void Logger::shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (file_) {
        std::fclose(file_);
        file_ = nullptr;
    }
}
