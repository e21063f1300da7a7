#include "../include/token_manager.hpp"
#include "../include/logger.hpp"
#include <chrono>

TokenManager::TokenManager(TokenFetcher fetcher, SecondsClock clock)
    : fetcher_(fetcher), clock_(clock ? clock : SecondsClock(&TokenManager::systemNowSecs)) {}

TokenManager::~TokenManager() {}

int64_t TokenManager::systemNowSecs() {
    return std::chrono::duration_cast<std::chrono::seconds>(
        std::chrono::system_clock::now().time_since_epoch()).count();
}

bool TokenManager::isFresh(int64_t now) const {
    return token_ && token_->expires_at > now + REFRESH_MARGIN_SECS;
}

TuyaResult TokenManager::getToken(std::string& access_token) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (isFresh(clock_())) {
        access_token = token_->access_token;
        return tuyaOk();
    }

    Logger::info("[Token] %s, requesting a new access token", token_ ? "Token expiring" : "No token");
    TokenGrant grant;
    TuyaResult result = fetcher_(grant);
    if (!result.is_success()) {
        Logger::error("[Token] Token fetch failed: %s %s", tuyaStatusToString(result.status),
                      result.error_message.c_str());
        return result;
    }

    CachedToken fresh;
    fresh.access_token = grant.access_token;
    fresh.expires_at = clock_() + grant.expire_time;
    token_ = fresh;
    access_token = fresh.access_token;
    Logger::info("[Token] Token %.6s... valid for %lld s", fresh.access_token.c_str(),
                 (long long)grant.expire_time);
    return tuyaOk();
}

void TokenManager::invalidate() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (token_) {
        Logger::info("[Token] Cached token invalidated");
    }
    token_.reset();
}

bool TokenManager::invalidateIfCurrent(const std::string& access_token) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!token_ || token_->access_token != access_token) {
        Logger::debug("[Token] Rejected token already replaced, keeping the cached one");
        return false;
    }
    Logger::info("[Token] Cached token invalidated");
    token_.reset();
    return true;
}

bool TokenManager::hasValidToken() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return isFresh(clock_());
}

std::optional<CachedToken> TokenManager::current() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return token_;
}
