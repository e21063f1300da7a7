#pragma once
#include <stdint.h>
#include <string>
#include <utility>
#include <vector>

using HttpHeaders = std::vector<std::pair<std::string, std::string>>;

struct HttpResponse {
    long status_code = 0;       // -1 when the request never completed
    std::string body;
    std::string error;          // transport error text
    bool isSuccess() const { return status_code >= 200 && status_code < 300; }
};

// Blocking libcurl client. get/post are virtual so tests can script responses.
class HttpClient {
public:
    HttpClient(const std::string& base_url, uint32_t timeout_ms = 10000);
    virtual ~HttpClient();

    virtual HttpResponse get(const std::string& endpoint, const HttpHeaders& headers = HttpHeaders());
    virtual HttpResponse post(const std::string& endpoint, const std::string& data,
                              const std::string& content_type = "application/json",
                              const HttpHeaders& headers = HttpHeaders());

    const std::string& baseUrl() const { return base_url_; }

protected:
    std::string buildUrl(const std::string& endpoint) const;

private:
    std::string base_url_;
    uint32_t timeout_ms_;

    HttpResponse perform(const char* method, const std::string& endpoint, const std::string* data,
                         const std::string& content_type, const HttpHeaders& headers);
};
