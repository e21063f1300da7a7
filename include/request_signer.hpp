#pragma once

#include <stdint.h>
#include <optional>
#include <string>
#include "http_client.hpp"

/**
 * @file request_signer.hpp
 * @brief HMAC-SHA256 request signing for the Tuya cloud API
 *
 * Every request carries client_id, t, nonce, sign_method and sign headers.
 * Business calls add access_token; the token call itself does not.
 */

// Inputs of one signature. timestamp and nonce are produced by the caller.
struct SigningContext {
    std::string method;                         // "GET", "POST"
    std::string path_and_query;                 // "/v1.0/token?grant_type=1"
    std::string body;                           // empty for GET
    std::optional<std::string> access_token;    // absent for the token call
    std::string timestamp;                      // ms since epoch, decimal
    std::string nonce;
};

/**
 * @class RequestSigner
 * @brief Pure signature builder bound to one set of client credentials
 *
 * Deterministic for a given SigningContext. The client secret is only ever
 * used as the HMAC key and never leaves this object.
 */
class RequestSigner {
public:
    RequestSigner(const std::string& client_id, const std::string& client_secret);
    ~RequestSigner();

    /**
     * @brief Build the authentication headers for one request
     * @param ctx Request description
     * @return client_id, t, nonce, sign_method, sign and, when present, access_token;
     *         empty when no signature could be computed
     */
    HttpHeaders sign(const SigningContext& ctx) const;

    /**
     * @brief Same as sign(ctx), reporting failure
     * @param ctx Request description
     * @param headers Output headers, left empty on failure
     * @return false if no signature could be computed
     */
    bool sign(const SigningContext& ctx, HttpHeaders& headers) const;

    /**
     * @brief Compute only the sign value (uppercase hex)
     * @param ctx Request description
     * @return Uppercase hex HMAC-SHA256, empty when the secret is empty or on crypto failure
     */
    std::string computeSign(const SigningContext& ctx) const;

    const std::string& clientId() const { return client_id_; }

    // ========== Helpers ==========

    /**
     * @brief "{METHOD}\n{sha256(body)}\n\n{path_and_query}"
     */
    static std::string stringToSign(const std::string& method, const std::string& body,
                                    const std::string& path_and_query);

    /**
     * @brief Lowercase hex SHA-256 of data
     */
    static std::string sha256Hex(const std::string& data);

    /**
     * @brief Uppercase hex HMAC-SHA256 of data keyed with key
     */
    static std::string hmacSha256Hex(const std::string& key, const std::string& data);

    /**
     * @brief Random 32 character lowercase hex nonce
     */
    static std::string generateNonce();

    /**
     * @brief Milliseconds since epoch as a decimal string
     */
    static std::string currentTimestampMs();

private:
    std::string client_id_;
    std::string client_secret_;

    static std::string bytesToHex(const uint8_t* bytes, size_t len, bool upper);
};
