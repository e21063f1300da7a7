#pragma once

#include <memory>
#include <string>
#include <vector>
#include <ArduinoJson.h>
#include "config_manager.hpp"
#include "data_point.hpp"
#include "http_client.hpp"
#include "request_signer.hpp"
#include "response_archive.hpp"
#include "token_manager.hpp"
#include "tuya_response.hpp"

/**
 * @file tuya_client.hpp
 * @brief Signed client for the Tuya cloud API
 *
 * Every request is signed, every raw body is archived, every response is
 * unwrapped through the common envelope. One TuyaClient is shared by the
 * poller and the control loop; the embedded TokenManager serializes token
 * refresh between them.
 */
class TuyaClient {
public:
    /**
     * @brief Constructor
     * @param config Vendor endpoint and credentials
     * @param http Transport, not owned
     * @param archive Raw response sink, not owned, may be nullptr
     */
    TuyaClient(const TuyaConfig& config, HttpClient* http, ResponseArchive* archive);
    ~TuyaClient();

    // tokens_ calls back into this instance
    TuyaClient(const TuyaClient&) = delete;
    TuyaClient& operator=(const TuyaClient&) = delete;

    /**
     * @brief GET /v1.0/token?grant_type=1, signed without access_token
     * @param grant Output token grant
     */
    TuyaResult fetchToken(TokenGrant& grant);

    /**
     * @brief GET /v1.0/devices/{device_id}/status
     * @param device_id Vendor device id
     * @param out Data points in vendor order
     */
    TuyaResult fetchStatus(const std::string& device_id, std::vector<DataPoint>& out);

    /**
     * @brief GET /v2.0/cloud/thing/{device_id}/shadow/properties
     * @param device_id Vendor device id
     * @param out Shadow properties in vendor order
     */
    TuyaResult fetchShadowProperties(const std::string& device_id, std::vector<ShadowProperty>& out);

    /**
     * @brief POST /v1.0/devices/{device_id}/commands
     * @param device_id Vendor device id
     * @param commands Non-empty list of {code, value}
     * @param acknowledged Vendor's boolean result
     */
    TuyaResult sendCommands(const std::string& device_id, const std::vector<DataPoint>& commands,
                            bool& acknowledged);

    TokenManager& tokens() { return tokens_; }

    // Non-empty and limited to [A-Za-z0-9_-]
    static bool isValidDeviceId(const std::string& device_id);

private:
    TuyaConfig config_;
    HttpClient* http_;
    ResponseArchive* archive_;
    RequestSigner signer_;
    TokenManager tokens_;

    /**
     * @brief Sign, send, archive and unwrap one request
     * @param method "GET" or "POST"
     * @param path Path and query
     * @param body Request body, empty for GET
     * @param with_token Attach access_token (all calls except the token call)
     * @param archive_endpoint Archive directory name
     * @param archive_suffix Archive file suffix
     * @param doc Receives the document the envelope is parsed into, sized from the body
     * @param envelope Output envelope
     */
    TuyaResult execute(const char* method, const std::string& path, const std::string& body,
                       bool with_token, const char* archive_endpoint, const std::string& archive_suffix,
                       std::unique_ptr<DynamicJsonDocument>& doc, TuyaEnvelope& envelope);
};
