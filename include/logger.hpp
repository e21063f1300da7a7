#pragma once

#include <atomic>
#include <string>
#include <cstdarg>
#include <cstdio>
#include <mutex>
#include "config_manager.hpp"

// Process-wide printf-style logger; lines go to stdout and, if configured, a file
class Logger {
public:
    enum Level { DEBUG, INFO, WARN, ERROR };

    static void begin(const LoggingConfig& cfg);
    static void setLevel(Level level);
    static bool parseLevel(const std::string& name, Level& out);
    static const char* levelName(Level level);

    static void log(Level level, const char* fmt, ...);
    static void debug(const char* fmt, ...);
    static void info(const char* fmt, ...);
    static void warn(const char* fmt, ...);
    static void error(const char* fmt, ...);
    static void flush();
    static void shutdown();
private:
    static std::atomic<Level> min_level_;
    static bool flush_on_write_;
    static std::FILE* file_;
    static std::mutex mutex_;
    static void write_log(Level level, const char* fmt, va_list args);
    static void formatTimestamp(char* out, size_t out_size);
};
