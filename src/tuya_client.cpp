#include "../include/tuya_client.hpp"
#include "../include/logger.hpp"

TuyaClient::TuyaClient(const TuyaConfig& config, HttpClient* http, ResponseArchive* archive)
    : config_(config),
      http_(http),
      archive_(archive),
      signer_(config.client_id, config.client_secret),
      tokens_([this](TokenGrant& grant) { return fetchToken(grant); }) {}

TuyaClient::~TuyaClient() {}

bool TuyaClient::isValidDeviceId(const std::string& device_id) {
    if (device_id.empty()) return false;
    for (char c : device_id) {
        bool ok = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
                  c == '_' || c == '-';
        if (!ok) return false;
    }
    return true;
}

// ============================================================================
// Request pipeline
// ============================================================================

TuyaResult TuyaClient::execute(const char* method, const std::string& path, const std::string& body,
                               bool with_token, const char* archive_endpoint, const std::string& archive_suffix,
                               std::unique_ptr<DynamicJsonDocument>& doc, TuyaEnvelope& envelope) {
    SigningContext ctx;
    ctx.method = method;
    ctx.path_and_query = path;
    ctx.body = body;

    // getToken may wait on another caller's refresh, so stamp afterwards
    if (with_token) {
        std::string token;
        TuyaResult token_result = tokens_.getToken(token);
        if (!token_result.is_success()) return token_result;
        ctx.access_token = token;
    }
    ctx.timestamp = RequestSigner::currentTimestampMs();
    ctx.nonce = RequestSigner::generateNonce();

    HttpHeaders headers;
    if (!signer_.sign(ctx, headers)) {
        return tuyaError(TuyaStatus::INVALID_ARGUMENT,
                         method + std::string(" ") + path + ": request could not be signed");
    }
    HttpResponse response = ctx.method == "POST"
        ? http_->post(path, body, "application/json", headers)
        : http_->get(path, headers);

    if (archive_) {
        archive_->save(archive_endpoint, archive_suffix, response.body);
    }

    if (response.status_code < 0) {
        return tuyaError(TuyaStatus::TRANSPORT_ERROR, method + std::string(" ") + path + ": " + response.error);
    }
    if (!response.isSuccess()) {
        return tuyaError(TuyaStatus::TRANSPORT_ERROR,
                         method + std::string(" ") + path + ": HTTP " + std::to_string(response.status_code));
    }

    TuyaResult result = decodeEnvelope(response.body, doc, envelope);
    if (result.status == TuyaStatus::API_ERROR && result.code == TUYA_CODE_TOKEN_INVALID && ctx.access_token) {
        tokens_.invalidateIfCurrent(*ctx.access_token);
    }
    if (!result.is_success()) {
        Logger::warn("[Tuya] %s %s: %s %s", method, path.c_str(), tuyaStatusToString(result.status),
                     result.error_message.c_str());
    }
    return result;
}

// ============================================================================
// Endpoints
// ============================================================================

TuyaResult TuyaClient::fetchToken(TokenGrant& grant) {
    std::unique_ptr<DynamicJsonDocument> doc;
    TuyaEnvelope envelope;
    TuyaResult result = execute("GET", "/v1.0/token?grant_type=1", "", false, "token", "", doc, envelope);
    if (!result.is_success()) return result;

    JsonVariant r = envelope.result;
    if (!r["access_token"].is<const char*>() || !r["expire_time"].is<int64_t>()) {
        return tuyaError(TuyaStatus::PROTOCOL_ERROR, "token result lacks access_token/expire_time");
    }
    grant.access_token = r["access_token"].as<std::string>();
    grant.expire_time = r["expire_time"].as<int64_t>();
    grant.refresh_token = r["refresh_token"].is<const char*>() ? r["refresh_token"].as<std::string>() : "";
    grant.uid = r["uid"].is<const char*>() ? r["uid"].as<std::string>() : "";
    return tuyaOk();
}

TuyaResult TuyaClient::fetchStatus(const std::string& device_id, std::vector<DataPoint>& out) {
    if (!isValidDeviceId(device_id)) {
        return tuyaError(TuyaStatus::INVALID_ARGUMENT, "invalid device id '" + device_id + "'");
    }
    std::unique_ptr<DynamicJsonDocument> doc;
    TuyaEnvelope envelope;
    TuyaResult result = execute("GET", "/v1.0/devices/" + device_id + "/status", "", true,
                                "device_status", device_id, doc, envelope);
    if (!result.is_success()) return result;

    result = parseDataPoints(envelope.result, out);
    if (result.is_success()) {
        Logger::debug("[Tuya] %s: %u data points", device_id.c_str(), (unsigned)out.size());
    }
    return result;
}

TuyaResult TuyaClient::fetchShadowProperties(const std::string& device_id, std::vector<ShadowProperty>& out) {
    if (!isValidDeviceId(device_id)) {
        return tuyaError(TuyaStatus::INVALID_ARGUMENT, "invalid device id '" + device_id + "'");
    }
    std::unique_ptr<DynamicJsonDocument> doc;
    TuyaEnvelope envelope;
    TuyaResult result = execute("GET", "/v2.0/cloud/thing/" + device_id + "/shadow/properties", "", true,
                                "shadow_properties", device_id, doc, envelope);
    if (!result.is_success()) return result;

    result = parseShadowProperties(envelope.result, out);
    if (result.is_success()) {
        Logger::debug("[Tuya] %s: %u shadow properties", device_id.c_str(), (unsigned)out.size());
    }
    return result;
}

TuyaResult TuyaClient::sendCommands(const std::string& device_id, const std::vector<DataPoint>& commands,
                                    bool& acknowledged) {
    if (!isValidDeviceId(device_id)) {
        return tuyaError(TuyaStatus::INVALID_ARGUMENT, "invalid device id '" + device_id + "'");
    }
    if (commands.empty()) {
        return tuyaError(TuyaStatus::INVALID_ARGUMENT, "empty command list");
    }

    DynamicJsonDocument request(1024 + commands.size() * 256);
    JsonArray list = request.createNestedArray("commands");
    for (const auto& cmd : commands) {
        JsonObject item = list.createNestedObject();
        item["code"] = cmd.code;
        writeDpValue(item, "value", cmd.value);
    }
    std::string body;
    serializeJson(request, body);

    std::unique_ptr<DynamicJsonDocument> doc;
    TuyaEnvelope envelope;
    TuyaResult result = execute("POST", "/v1.0/devices/" + device_id + "/commands", body, true,
                                "send_commands", device_id, doc, envelope);
    if (!result.is_success()) return result;

    if (!envelope.result.is<bool>()) {
        return tuyaError(TuyaStatus::PROTOCOL_ERROR, "command result is not a boolean");
    }
    acknowledged = envelope.result.as<bool>();
    Logger::info("[Tuya] %s: %u command(s) sent, acknowledged=%d", device_id.c_str(),
                 (unsigned)commands.size(), acknowledged ? 1 : 0);
    return tuyaOk();
}
