#include "../include/tuya_response.hpp"
#include "../include/logger.hpp"

namespace {

TuyaResult parseError(DeserializationError error) {
    return tuyaError(TuyaStatus::DECODE_ERROR, std::string("malformed response JSON: ") + error.c_str());
}

// Envelope checks on an already parsed document
TuyaResult unwrapEnvelope(JsonDocument& doc, TuyaEnvelope& envelope) {
    if (!doc.is<JsonObject>()) {
        return tuyaError(TuyaStatus::DECODE_ERROR, "response is not a JSON object");
    }
    if (!doc["success"].is<bool>()) {
        return tuyaError(TuyaStatus::DECODE_ERROR, "response has no boolean 'success' field");
    }

    envelope.success = doc["success"].as<bool>();
    envelope.t = doc["t"].is<int64_t>() ? doc["t"].as<int64_t>() : 0;
    envelope.tid = doc["tid"].is<const char*>() ? doc["tid"].as<std::string>() : "";

    if (!envelope.success) {
        int64_t code = doc["code"].is<int64_t>() ? doc["code"].as<int64_t>() : -1;
        std::string msg = doc["msg"].is<const char*>() ? doc["msg"].as<std::string>() : "(no message)";
        Logger::debug("[Envelope] API error code=%lld msg=%s tid=%s", (long long)code, msg.c_str(),
                      envelope.tid.c_str());
        return tuyaError(TuyaStatus::API_ERROR, msg, code);
    }

    if (!doc.containsKey("result") || doc["result"].isNull()) {
        return tuyaError(TuyaStatus::PROTOCOL_ERROR, "success response without result");
    }
    envelope.result = doc["result"];
    Logger::debug("[Envelope] ok t=%lld tid=%s", (long long)envelope.t, envelope.tid.c_str());
    return tuyaOk();
}

} // namespace

TuyaResult decodeEnvelope(const std::string& body, DynamicJsonDocument& doc, TuyaEnvelope& envelope) {
    DeserializationError error = deserializeJson(doc, body);
    if (error) return parseError(error);
    return unwrapEnvelope(doc, envelope);
}

size_t responseDocCapacity(size_t body_size) {
    // Slots and copied strings take a few times the text they come from
    size_t capacity = body_size * 4 + 1024;
    if (capacity < MIN_RESPONSE_DOC_SIZE) capacity = MIN_RESPONSE_DOC_SIZE;
    if (capacity > MAX_RESPONSE_DOC_SIZE) capacity = MAX_RESPONSE_DOC_SIZE;
    return capacity;
}

TuyaResult decodeEnvelope(const std::string& body, std::unique_ptr<DynamicJsonDocument>& doc,
                          TuyaEnvelope& envelope) {
    size_t capacity = responseDocCapacity(body.size());
    DeserializationError error = DeserializationError::NoMemory;
    while (true) {
        doc.reset(new DynamicJsonDocument(capacity));
        // A failed allocation leaves capacity() at 0 and reads as NoMemory
        if (doc->capacity() > 0) error = deserializeJson(*doc, body);
        if (error != DeserializationError::NoMemory) break;
        if (capacity >= MAX_RESPONSE_DOC_SIZE) {
            return tuyaError(TuyaStatus::DECODE_ERROR,
                             "response too large (" + std::to_string(body.size()) + " bytes)");
        }
        Logger::debug("[Envelope] %u byte pool too small for %u byte body, growing",
                      (unsigned)capacity, (unsigned)body.size());
        capacity = capacity * 2 > MAX_RESPONSE_DOC_SIZE ? MAX_RESPONSE_DOC_SIZE : capacity * 2;
    }
    if (error) return parseError(error);
    return unwrapEnvelope(*doc, envelope);
}
