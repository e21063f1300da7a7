#pragma once

#include <string>
#include <stdexcept>

enum ErrorCode {
    ERR_NONE = 0,
    ERR_CONFIG,
    ERR_STORAGE,
    ERR_HTTP,
    ERR_UNKNOWN
};

// Base for the failures that abort startup; runtime errors travel as TuyaResult
class BridgeException : public std::runtime_error {
public:
    BridgeException(const std::string& msg, ErrorCode code) : std::runtime_error(msg), code_(code) {}
    ErrorCode code() const { return code_; }
private:
    ErrorCode code_;
};

class ConfigException : public BridgeException {
public:
    explicit ConfigException(const std::string& msg) : BridgeException(msg, ERR_CONFIG) {}
};

class StorageException : public BridgeException {
public:
    explicit StorageException(const std::string& msg) : BridgeException(msg, ERR_STORAGE) {}
};

class HttpException : public BridgeException {
public:
    explicit HttpException(const std::string& msg) : BridgeException(msg, ERR_HTTP) {}
};
