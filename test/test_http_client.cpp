#include "test_support.hpp"
#include "../include/exceptions.hpp"
#include "../include/http_client.hpp"

// Exposes URL building
class UrlBuildingClient : public HttpClient {
public:
    using HttpClient::HttpClient;
    std::string url(const std::string& endpoint) const { return buildUrl(endpoint); }
};

bool test_every_instance_initializes() {
    bool thrown = false;
    try {
        UrlBuildingClient first("https://openapi.example.test/");
        UrlBuildingClient second("https://openapi.example.test//", 500);
        CHECK_EQ(first.baseUrl(), std::string("https://openapi.example.test"));
        CHECK_EQ(second.baseUrl(), std::string("https://openapi.example.test"));
    } catch (const HttpException&) {
        thrown = true;
    }
    CHECK(!thrown);
    return true;
}

bool test_build_url() {
    UrlBuildingClient client("https://openapi.example.test/");
    CHECK_EQ(client.url("/v1.0/token?grant_type=1"),
             std::string("https://openapi.example.test/v1.0/token?grant_type=1"));
    CHECK_EQ(client.url("http://other.test/x"), std::string("http://other.test/x"));
    return true;
}

bool test_refused_connection_is_transport_failure() {
    // Nothing listens on port 1
    HttpClient client("http://127.0.0.1:1", 2000);
    HttpResponse r = client.get("/v1.0/token");
    CHECK_EQ(r.status_code, -1L);
    CHECK(!r.error.empty());
    CHECK(!r.isSuccess());

    r = client.post("/v1.0/devices/d/commands", "{}");
    CHECK_EQ(r.status_code, -1L);
    return true;
}

int main() {
    quietLogs();
    runTest("Every instance initializes", test_every_instance_initializes);
    runTest("URL building", test_build_url);
    runTest("Refused connection is a transport failure", test_refused_connection_is_transport_failure);
    return testSummary("http_client");
}
