#pragma once

#include <stdint.h>
#include <memory>
#include <string>
#include <ArduinoJson.h>

// Outcome of a vendor operation
enum class TuyaStatus {
    SUCCESS,
    TRANSPORT_ERROR,                   // Connection failure or non-2xx HTTP status
    API_ERROR,                         // success:false with vendor code/msg
    PROTOCOL_ERROR,                    // success:true without result, or wrong result shape
    DECODE_ERROR,                      // Malformed JSON or missing required data point
    INVALID_ARGUMENT,                  // Rejected before any network traffic
    STORAGE_ERROR                      // Reading could not be persisted
};

struct TuyaResult {
    TuyaStatus status = TuyaStatus::SUCCESS;
    int64_t code = 0;                  // vendor error code for API_ERROR
    std::string error_message;
    bool is_success() const {
        return status == TuyaStatus::SUCCESS;
    }
};

inline TuyaResult tuyaOk() {
    return TuyaResult();
}

inline TuyaResult tuyaError(TuyaStatus status, const std::string& message, int64_t code = 0) {
    TuyaResult result;
    result.status = status;
    result.code = code;
    result.error_message = message;
    return result;
}

inline const char* tuyaStatusToString(TuyaStatus status) {
    switch (status) {
        case TuyaStatus::SUCCESS: return "SUCCESS";
        case TuyaStatus::TRANSPORT_ERROR: return "TRANSPORT_ERROR";
        case TuyaStatus::API_ERROR: return "API_ERROR";
        case TuyaStatus::PROTOCOL_ERROR: return "PROTOCOL_ERROR";
        case TuyaStatus::DECODE_ERROR: return "DECODE_ERROR";
        case TuyaStatus::INVALID_ARGUMENT: return "INVALID_ARGUMENT";
        case TuyaStatus::STORAGE_ERROR: return "STORAGE_ERROR";
        default: return "UNKNOWN";
    }
}

// Vendor code meaning the access token was rejected
static const int64_t TUYA_CODE_TOKEN_INVALID = 1010;

// Decoded {success, result?, code?, msg?, t, tid?}. result points into the
// document passed to decodeEnvelope and is valid while that document lives.
struct TuyaEnvelope {
    bool success = false;
    int64_t t = 0;
    std::string tid;
    JsonVariant result;
};

/**
 * @brief Unwrap the common response envelope
 * @param body Raw response bytes
 * @param doc Caller-owned document the result is parsed into
 * @param envelope Output envelope; envelope.result is set on success
 * @return SUCCESS, API_ERROR (code/msg), PROTOCOL_ERROR or DECODE_ERROR
 */
TuyaResult decodeEnvelope(const std::string& body, DynamicJsonDocument& doc, TuyaEnvelope& envelope);

// Bounds for documents sized from the response body
static const size_t MIN_RESPONSE_DOC_SIZE = 4096;
static const size_t MAX_RESPONSE_DOC_SIZE = 8 * 1024 * 1024;

// Initial pool size for a body of body_size bytes, clamped to the bounds above
size_t responseDocCapacity(size_t body_size);

/**
 * @brief Unwrap a response of any size
 *
 * Allocates doc from the body length and doubles it while the parse runs
 * out of memory, up to MAX_RESPONSE_DOC_SIZE.
 */
TuyaResult decodeEnvelope(const std::string& body, std::unique_ptr<DynamicJsonDocument>& doc,
                          TuyaEnvelope& envelope);
