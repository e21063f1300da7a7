#include "../include/http_client.hpp"
#include "../include/exceptions.hpp"
#include "../include/logger.hpp"
#include <curl/curl.h>
#include <cstdlib>
#include <mutex>

namespace {

std::once_flag curl_init_flag;
CURLcode curl_init_result = CURLE_FAILED_INIT;

void initCurlOnce() {
    curl_init_result = curl_global_init(CURL_GLOBAL_DEFAULT);
    if (curl_init_result == CURLE_OK && std::atexit(curl_global_cleanup) != 0) {
        Logger::warn("[Http] Could not register curl_global_cleanup");
    }
}

size_t writeBody(char* ptr, size_t size, size_t nmemb, void* userdata) {
    std::string* body = static_cast<std::string*>(userdata);
    body->append(ptr, size * nmemb);
    return size * nmemb;
}

} // namespace

HttpClient::HttpClient(const std::string& base_url, uint32_t timeout_ms)
    : base_url_(base_url), timeout_ms_(timeout_ms) {
    // Every instance sees the outcome of the one global init
    std::call_once(curl_init_flag, initCurlOnce);
    if (curl_init_result != CURLE_OK) {
        throw HttpException(std::string("curl_global_init failed: ") + curl_easy_strerror(curl_init_result));
    }
    // Strip trailing slash so endpoints can always start with '/'
    while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

HttpClient::~HttpClient() {}

std::string HttpClient::buildUrl(const std::string& endpoint) const {
    // If endpoint starts with "http", treat it as a full URL
    if (endpoint.compare(0, 4, "http") == 0) return endpoint;
    return base_url_ + endpoint;
}

HttpResponse HttpClient::get(const std::string& endpoint, const HttpHeaders& headers) {
    return perform("GET", endpoint, nullptr, "", headers);
}

HttpResponse HttpClient::post(const std::string& endpoint, const std::string& data,
                              const std::string& content_type, const HttpHeaders& headers) {
    return perform("POST", endpoint, &data, content_type, headers);
}

HttpResponse HttpClient::perform(const char* method, const std::string& endpoint, const std::string* data,
                                 const std::string& content_type, const HttpHeaders& headers) {
    HttpResponse response;
    std::string url = buildUrl(endpoint);

    CURL* curl = curl_easy_init();
    if (!curl) {
        response.status_code = -1;
        response.error = "curl_easy_init failed";
        return response;
    }

    struct curl_slist* header_list = nullptr;
    if (data) {
        std::string ct = "Content-Type: " + (content_type.empty() ? std::string("application/json") : content_type);
        header_list = curl_slist_append(header_list, ct.c_str());
    }
    for (const auto& h : headers) {
        std::string line = h.first + ": " + h.second;
        header_list = curl_slist_append(header_list, line.c_str());
    }

    curl_easy_setopt(curl, CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, (long)timeout_ms_);
    curl_easy_setopt(curl, CURLOPT_NOSIGNAL, 1L);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, writeBody);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
    if (header_list) curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    if (data) {
        curl_easy_setopt(curl, CURLOPT_POST, 1L);
        curl_easy_setopt(curl, CURLOPT_POSTFIELDS, data->c_str());
        curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, (long)data->size());
    }

    CURLcode rc = curl_easy_perform(curl);
    if (rc != CURLE_OK) {
        response.status_code = -1;
        response.error = curl_easy_strerror(rc);
        Logger::warn("[Http] %s %s failed: %s", method, endpoint.c_str(), response.error.c_str());
    } else {
        curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &response.status_code);
        Logger::debug("[Http] %s %s -> %ld (%u bytes)", method, endpoint.c_str(),
                      response.status_code, (unsigned)response.body.size());
    }

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);
    return response;
}
