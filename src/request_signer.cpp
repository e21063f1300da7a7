#include "../include/request_signer.hpp"
#include "../include/logger.hpp"
#include <mbedtls/md.h>
#include <chrono>
#include <random>

static const size_t SHA256_SIZE = 32;

RequestSigner::RequestSigner(const std::string& client_id, const std::string& client_secret)
    : client_id_(client_id), client_secret_(client_secret) {}

RequestSigner::~RequestSigner() {}

// ============================================================================
// Signing
// ============================================================================

std::string RequestSigner::computeSign(const SigningContext& ctx) const {
    if (client_secret_.empty()) return "";
    std::string material = client_id_;
    if (ctx.access_token) material += *ctx.access_token;
    material += ctx.timestamp;
    material += ctx.nonce;
    material += stringToSign(ctx.method, ctx.body, ctx.path_and_query);
    return hmacSha256Hex(client_secret_, material);
}

bool RequestSigner::sign(const SigningContext& ctx, HttpHeaders& headers) const {
    headers.clear();
    std::string signature = computeSign(ctx);
    if (signature.empty()) {
        Logger::error("[Signer] Cannot sign %s %s: %s", ctx.method.c_str(), ctx.path_and_query.c_str(),
                      client_secret_.empty() ? "empty client secret" : "HMAC computation failed");
        return false;
    }

    headers.emplace_back("client_id", client_id_);
    headers.emplace_back("t", ctx.timestamp);
    headers.emplace_back("nonce", ctx.nonce);
    headers.emplace_back("sign_method", "HMAC-SHA256");
    headers.emplace_back("sign", signature);
    if (ctx.access_token) {
        headers.emplace_back("access_token", *ctx.access_token);
    }

    Logger::debug("[Signer] Signed %s %s (sign: %.8s...)", ctx.method.c_str(),
                  ctx.path_and_query.c_str(), signature.c_str());
    return true;
}

HttpHeaders RequestSigner::sign(const SigningContext& ctx) const {
    HttpHeaders headers;
    if (!sign(ctx, headers)) return HttpHeaders();
    return headers;
}

std::string RequestSigner::stringToSign(const std::string& method, const std::string& body,
                                        const std::string& path_and_query) {
    return method + "\n" + sha256Hex(body) + "\n\n" + path_and_query;
}

// ============================================================================
// Crypto helpers
// ============================================================================

std::string RequestSigner::sha256Hex(const std::string& data) {
    uint8_t digest[SHA256_SIZE];
    const mbedtls_md_info_t* info = mbedtls_md_info_from_type(MBEDTLS_MD_SHA256);
    if (!info || mbedtls_md(info, (const unsigned char*)data.data(), data.size(), digest) != 0) {
        return "";
    }
    return bytesToHex(digest, SHA256_SIZE, false);
}

std::string RequestSigner::hmacSha256Hex(const std::string& key, const std::string& data) {
    uint8_t hmac_result[SHA256_SIZE];

    mbedtls_md_context_t ctx;
    mbedtls_md_init(&ctx);
    int ret = mbedtls_md_setup(&ctx, mbedtls_md_info_from_type(MBEDTLS_MD_SHA256), 1);
    if (ret == 0) ret = mbedtls_md_hmac_starts(&ctx, (const unsigned char*)key.data(), key.size());
    if (ret == 0) ret = mbedtls_md_hmac_update(&ctx, (const unsigned char*)data.data(), data.size());
    if (ret == 0) ret = mbedtls_md_hmac_finish(&ctx, hmac_result);
    mbedtls_md_free(&ctx);

    if (ret != 0) {
        return "";
    }
    return bytesToHex(hmac_result, SHA256_SIZE, true);
}

std::string RequestSigner::bytesToHex(const uint8_t* bytes, size_t len, bool upper) {
    static const char lower_chars[] = "0123456789abcdef";
    static const char upper_chars[] = "0123456789ABCDEF";
    const char* hex_chars = upper ? upper_chars : lower_chars;
    std::string result;
    result.reserve(len * 2);
    for (size_t i = 0; i < len; i++) {
        result.push_back(hex_chars[(bytes[i] >> 4) & 0x0F]);
        result.push_back(hex_chars[bytes[i] & 0x0F]);
    }
    return result;
}

std::string RequestSigner::generateNonce() {
    thread_local std::mt19937_64 rng(std::random_device{}());
    uint8_t bytes[16];
    for (size_t i = 0; i < sizeof(bytes); i += 8) {
        uint64_t r = rng();
        for (size_t j = 0; j < 8; j++) bytes[i + j] = (uint8_t)(r >> (j * 8));
    }
    return bytesToHex(bytes, sizeof(bytes), false);
}

std::string RequestSigner::currentTimestampMs() {
    auto now = std::chrono::system_clock::now();
    long long ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count();
    return std::to_string(ms);
}
