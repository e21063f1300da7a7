#pragma once

#include <stdint.h>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include "tuya_response.hpp"

// Result of GET /v1.0/token
struct TokenGrant {
    std::string access_token;
    int64_t expire_time = 0;       // seconds
    std::string refresh_token;
    std::string uid;
};

struct CachedToken {
    std::string access_token;
    int64_t expires_at = 0;        // Unix seconds
};

using TokenFetcher = std::function<TuyaResult(TokenGrant&)>;
using SecondsClock = std::function<int64_t()>;

/**
 * @class TokenManager
 * @brief Holds the single bearer token shared by every caller
 *
 * The check-then-refresh sequence runs under one mutex, so concurrent
 * callers that find the token stale trigger exactly one fetch and all
 * observe its outcome.
 */
class TokenManager {
public:
    // A token is reused only while it has more than this many seconds left
    static constexpr int64_t REFRESH_MARGIN_SECS = 60;

    explicit TokenManager(TokenFetcher fetcher, SecondsClock clock = SecondsClock());
    ~TokenManager();

    /**
     * @brief Return a valid token, fetching one if absent or near expiry
     * @param access_token Output token
     * @return Fetch failure is returned unchanged and nothing is cached
     */
    TuyaResult getToken(std::string& access_token);

    // Drop the cached token, the next getToken fetches
    void invalidate();

    // Drop the cached token only if it is still access_token; a token
    // refreshed meanwhile by another caller is kept
    bool invalidateIfCurrent(const std::string& access_token);

    bool hasValidToken() const;
    std::optional<CachedToken> current() const;

    static int64_t systemNowSecs();

private:
    TokenFetcher fetcher_;
    SecondsClock clock_;
    mutable std::mutex mutex_;
    std::optional<CachedToken> token_;

    bool isFresh(int64_t now) const;
};
