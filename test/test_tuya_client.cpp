#include "test_support.hpp"
#include "fake_http_client.hpp"
#include "../include/acquisition_scheduler.hpp"
#include "../include/reading_cache.hpp"
#include "../include/reading_store.hpp"
#include "../include/request_signer.hpp"
#include "../include/sensor_service.hpp"
#include "../include/tuya_client.hpp"
#include <chrono>
#include <filesystem>
#include <fstream>
#include <thread>
#include <type_traits>

static const char* TOKEN_OK =
    "{\"success\":true,\"result\":{\"access_token\":\"tok-abc\",\"expire_time\":7200,"
    "\"refresh_token\":\"ref\",\"uid\":\"u1\"},\"t\":1700000000000,\"tid\":\"x\"}";

static const char* THERMOSTAT_OK =
    "{\"success\":true,\"result\":["
    "{\"code\":\"switch\",\"value\":true},"
    "{\"code\":\"temp_current\",\"value\":189},"
    "{\"code\":\"temp_set\",\"value\":220},"
    "{\"code\":\"mode\",\"value\":\"auto\"}],\"t\":1700000000000}";

static const char* WEATHER_OK =
    "{\"success\":true,\"result\":{\"properties\":["
    "{\"code\":\"local_temp\",\"dp_id\":131,\"time\":1,\"type\":\"value\",\"value\":208,\"custom_name\":\"\"},"
    "{\"code\":\"local_hum\",\"dp_id\":132,\"time\":1,\"type\":\"value\",\"value\":51,\"custom_name\":\"\"}]},"
    "\"t\":1700000000000}";

static const char* TOKEN_REFRESHED =
    "{\"success\":true,\"result\":{\"access_token\":\"tok-new\",\"expire_time\":7200},\"t\":1}";

static_assert(!std::is_copy_constructible<TuyaClient>::value, "TuyaClient must not be copyable");
static_assert(!std::is_copy_assignable<TuyaClient>::value, "TuyaClient must not be copy-assignable");

static TuyaConfig testConfig() {
    TuyaConfig cfg;
    cfg.base_url = "https://openapi.example.test";
    cfg.client_id = "client-1";
    cfg.client_secret = "s3cr3t";
    cfg.timeout_ms = 1000;
    return cfg;
}

// Recompute the signature from the sent headers
static bool signatureMatches(const RecordedRequest& req, bool expect_token) {
    bool has_token = false;
    std::string token = req.header("access_token", &has_token);
    if (has_token != expect_token) return false;

    SigningContext ctx;
    ctx.method = req.method;
    ctx.path_and_query = req.endpoint;
    ctx.body = req.body;
    if (has_token) ctx.access_token = token;
    ctx.timestamp = req.header("t");
    ctx.nonce = req.header("nonce");
    RequestSigner signer("client-1", "s3cr3t");
    return req.header("sign") == signer.computeSign(ctx) && req.header("sign_method") == "HMAC-SHA256" &&
           req.header("client_id") == "client-1";
}

bool test_fetch_status_gets_token_first() {
    FakeHttpClient http;
    http.respond("/v1.0/token", 200, TOKEN_OK);
    http.respond("/v1.0/devices/dev1/status", 200, THERMOSTAT_OK);
    TuyaClient client(testConfig(), &http, nullptr);

    std::vector<DataPoint> dps;
    CHECK(client.fetchStatus("dev1", dps).is_success());
    CHECK_EQ(dps.size(), (size_t)4);

    std::vector<RecordedRequest> reqs = http.requests();
    CHECK_EQ(reqs.size(), (size_t)2);
    CHECK_EQ(reqs[0].endpoint, std::string("/v1.0/token?grant_type=1"));
    CHECK(signatureMatches(reqs[0], false));
    CHECK_EQ(reqs[1].endpoint, std::string("/v1.0/devices/dev1/status"));
    CHECK(signatureMatches(reqs[1], true));
    CHECK_EQ(reqs[1].header("access_token"), std::string("tok-abc"));
    return true;
}

bool test_token_reused_across_calls() {
    FakeHttpClient http;
    http.respond("/v1.0/token", 200, TOKEN_OK);
    http.respond("/v1.0/devices/dev1/status", 200, THERMOSTAT_OK);
    http.respond("/v1.0/devices/dev1/status", 200, THERMOSTAT_OK);
    TuyaClient client(testConfig(), &http, nullptr);

    std::vector<DataPoint> dps;
    CHECK(client.fetchStatus("dev1", dps).is_success());
    CHECK(client.fetchStatus("dev1", dps).is_success());
    CHECK_EQ(http.countRequests("/v1.0/token"), (size_t)1);
    return true;
}

bool test_token_failure_propagates() {
    FakeHttpClient http;
    http.respond("/v1.0/token", 200, "{\"success\":false,\"code\":1004,\"msg\":\"sign invalid\",\"t\":1}");
    TuyaClient client(testConfig(), &http, nullptr);

    std::vector<DataPoint> dps;
    TuyaResult r = client.fetchStatus("dev1", dps);
    CHECK(r.status == TuyaStatus::API_ERROR);
    CHECK_EQ(r.code, (int64_t)1004);
    CHECK_EQ(http.countRequests("/v1.0/devices"), (size_t)0);
    CHECK(!client.tokens().current().has_value());
    return true;
}

bool test_token_invalid_code_drops_token() {
    FakeHttpClient http;
    http.respond("/v1.0/token", 200, TOKEN_OK);
    http.respond("/v1.0/devices/dev1/status", 200, "{\"success\":false,\"code\":1010,\"msg\":\"token invalid\",\"t\":1}");
    TuyaClient client(testConfig(), &http, nullptr);

    std::vector<DataPoint> dps;
    TuyaResult r = client.fetchStatus("dev1", dps);
    CHECK(r.status == TuyaStatus::API_ERROR);
    CHECK_EQ(r.code, (int64_t)1010);
    CHECK(!client.tokens().current().has_value());
    return true;
}

bool test_transport_errors() {
    FakeHttpClient http;
    http.respond("/v1.0/token", 200, TOKEN_OK);
    http.failTransport("/v1.0/devices/dev1/status", "Connection refused");
    http.respond("/v1.0/devices/dev1/status", 502, "<html>bad gateway</html>");
    TuyaClient client(testConfig(), &http, nullptr);

    std::vector<DataPoint> dps;
    TuyaResult r = client.fetchStatus("dev1", dps);
    CHECK(r.status == TuyaStatus::TRANSPORT_ERROR);
    CHECK(r.error_message.find("Connection refused") != std::string::npos);
    r = client.fetchStatus("dev1", dps);
    CHECK(r.status == TuyaStatus::TRANSPORT_ERROR);
    CHECK(r.error_message.find("502") != std::string::npos);
    return true;
}

bool test_invalid_device_id_sends_nothing() {
    FakeHttpClient http;
    TuyaClient client(testConfig(), &http, nullptr);
    std::vector<DataPoint> dps;
    CHECK(client.fetchStatus("", dps).status == TuyaStatus::INVALID_ARGUMENT);
    CHECK(client.fetchStatus("../v1.0/token", dps).status == TuyaStatus::INVALID_ARGUMENT);
    std::vector<ShadowProperty> props;
    CHECK(client.fetchShadowProperties("a b", props).status == TuyaStatus::INVALID_ARGUMENT);
    CHECK(http.requests().empty());
    return true;
}

bool test_shadow_properties_endpoint() {
    FakeHttpClient http;
    http.respond("/v1.0/token", 200, TOKEN_OK);
    http.respond("/v2.0/cloud/thing/ws1/shadow/properties", 200, WEATHER_OK);
    TuyaClient client(testConfig(), &http, nullptr);

    std::vector<ShadowProperty> props;
    CHECK(client.fetchShadowProperties("ws1", props).is_success());
    CHECK_EQ(props.size(), (size_t)2);
    CHECK_EQ(props[0].dp_id, (int64_t)131);
    std::vector<RecordedRequest> reqs = http.requests();
    CHECK(signatureMatches(reqs.back(), true));
    return true;
}

bool test_send_commands() {
    FakeHttpClient http;
    http.respond("/v1.0/token", 200, TOKEN_OK);
    http.respond("/v1.0/devices/dev1/commands", 200, "{\"success\":true,\"result\":true,\"t\":1}");
    TuyaClient client(testConfig(), &http, nullptr);

    std::vector<DataPoint> commands;
    commands.push_back(DataPoint{"switch", DpValue(true)});
    commands.push_back(DataPoint{"temp_set", DpValue((int64_t)215)});
    bool ack = false;
    CHECK(client.sendCommands("dev1", commands, ack).is_success());
    CHECK(ack);

    RecordedRequest req = http.requests().back();
    CHECK_EQ(req.method, std::string("POST"));
    CHECK_EQ(req.body, std::string("{\"commands\":[{\"code\":\"switch\",\"value\":true},"
                                   "{\"code\":\"temp_set\",\"value\":215}]}"));
    CHECK(signatureMatches(req, true));

    std::vector<DataPoint> none;
    CHECK(client.sendCommands("dev1", none, ack).status == TuyaStatus::INVALID_ARGUMENT);
    return true;
}

bool test_send_commands_non_bool_result() {
    FakeHttpClient http;
    http.respond("/v1.0/token", 200, TOKEN_OK);
    http.respond("/v1.0/devices/dev1/commands", 200, "{\"success\":true,\"result\":\"ok\",\"t\":1}");
    TuyaClient client(testConfig(), &http, nullptr);

    std::vector<DataPoint> commands;
    commands.push_back(DataPoint{"switch", DpValue(false)});
    bool ack = false;
    CHECK(client.sendCommands("dev1", commands, ack).status == TuyaStatus::PROTOCOL_ERROR);
    return true;
}

bool test_responses_are_archived() {
    std::filesystem::path dir = std::filesystem::temp_directory_path() / "tuya_bridge_archive_test";
    std::filesystem::remove_all(dir);
    ResponseArchive archive(dir.string());

    FakeHttpClient http;
    http.respond("/v1.0/token", 200, TOKEN_OK);
    http.respond("/v1.0/devices/dev1/status", 200, THERMOSTAT_OK);
    TuyaClient client(testConfig(), &http, &archive);

    std::vector<DataPoint> dps;
    CHECK(client.fetchStatus("dev1", dps).is_success());

    CHECK(std::filesystem::is_directory(dir / "token"));
    CHECK(std::filesystem::is_directory(dir / "device_status"));
    size_t files = 0;
    for (const auto& entry : std::filesystem::directory_iterator(dir / "device_status")) {
        std::string name = entry.path().filename().string();
        CHECK(name.find("_dev1.json") != std::string::npos);
        files++;
    }
    CHECK_EQ(files, (size_t)1);
    std::filesystem::remove_all(dir);
    return true;
}

bool test_archive_failure_is_swallowed() {
    // A regular file where the archive directory should be
    std::filesystem::path blocker = std::filesystem::temp_directory_path() / "tuya_bridge_archive_blocker";
    std::filesystem::remove_all(blocker);
    { std::ofstream(blocker.string()) << "x"; }
    ResponseArchive archive(blocker.string());

    FakeHttpClient http;
    http.respond("/v1.0/token", 200, TOKEN_OK);
    http.respond("/v1.0/devices/dev1/status", 200, THERMOSTAT_OK);
    TuyaClient client(testConfig(), &http, &archive);

    std::vector<DataPoint> dps;
    CHECK(client.fetchStatus("dev1", dps).is_success());
    std::filesystem::remove_all(blocker);
    return true;
}

bool test_sensor_service_end_to_end() {
    FakeHttpClient http;
    http.respond("/v1.0/token", 200, TOKEN_OK);
    http.respond("/v1.0/devices/thermo-1/status", 200, THERMOSTAT_OK);
    http.respond("/v2.0/cloud/thing/ws-1/shadow/properties", 200, WEATHER_OK);
    TuyaClient client(testConfig(), &http, nullptr);
    ReadingStore store(":memory:");
    ReadingCache cache;
    SensorService sensors(&client, &store, &cache, []() { return (int64_t)1700000000000LL; });

    DeviceEntry thermo{"thermo-1", DeviceType::THERMOSTAT};
    DeviceStatus status;
    std::vector<EncodedReading> readings;
    CHECK(sensors.fetchAndPersist(thermo, status, readings).is_success());
    CHECK_EQ(readings.size(), (size_t)3);
    CHECK_EQ(cache.get("thermo-1", SensorKind::TEMPERATURE)->value, (int64_t)1890);
    CHECK_EQ(cache.get("thermo-1", SensorKind::RELAY_STATE)->value, (int64_t)1);
    CHECK_EQ(cache.get("thermo-1", SensorKind::TEMPERATURE_SETPOINT)->value, (int64_t)2200);

    DeviceEntry ws{"ws-1", DeviceType::WEATHER_STATION};
    CHECK(sensors.fetchAndPersist(ws).is_success());
    CHECK_EQ(cache.get("ws-1", SensorKind::HUMIDITY)->value, (int64_t)5100);

    std::vector<EncodedReading> latest;
    CHECK(store.latest(latest));
    CHECK_EQ(latest.size(), (size_t)5);
    CHECK_EQ(cache.size(), (size_t)5);
    return true;
}

bool test_sensor_service_decode_error_touches_nothing() {
    FakeHttpClient http;
    http.respond("/v1.0/token", 200, TOKEN_OK);
    http.respond("/v1.0/devices/m1/status", 200, THERMOSTAT_OK);
    TuyaClient client(testConfig(), &http, nullptr);
    ReadingStore store(":memory:");
    ReadingCache cache;
    SensorService sensors(&client, &store, &cache);

    // Thermostat data points reported for a device configured as energy meter
    TuyaResult r = sensors.fetchAndPersist(DeviceEntry{"m1", DeviceType::ENERGY_METER});
    CHECK(r.status == TuyaStatus::DECODE_ERROR);
    CHECK(r.error_message.find("total_forward_energy") != std::string::npos);
    CHECK_EQ(cache.size(), (size_t)0);
    return true;
}

bool test_rejected_token_keeps_newer_refresh() {
    HookedHttpClient http;
    http.respond("/v1.0/token", 200, TOKEN_OK);
    http.respond("/v1.0/token", 200, TOKEN_REFRESHED);
    http.respond("/v1.0/devices/dev1/status", 200, "{\"success\":false,\"code\":1010,\"msg\":\"token invalid\",\"t\":1}");
    TuyaClient client(testConfig(), &http, nullptr);

    // Another caller replaces the token while this request is in flight
    bool refreshed = false;
    http.before_get = [&](const std::string& endpoint) {
        if (refreshed || endpoint.compare(0, 16, "/v1.0/devices/de") != 0) return;
        refreshed = true;
        client.tokens().invalidate();
        std::string token;
        client.tokens().getToken(token);
    };

    std::vector<DataPoint> dps;
    TuyaResult r = client.fetchStatus("dev1", dps);
    CHECK(r.status == TuyaStatus::API_ERROR);
    CHECK_EQ(r.code, (int64_t)1010);
    CHECK(client.tokens().current().has_value());
    CHECK_EQ(client.tokens().current()->access_token, std::string("tok-new"));
    CHECK_EQ(http.countRequests("/v1.0/token"), (size_t)2);
    return true;
}

bool test_request_stamped_after_token_wait() {
    HookedHttpClient http;
    http.respond("/v1.0/token", 200, TOKEN_OK);
    http.respond("/v1.0/devices/dev1/status", 200, THERMOSTAT_OK);
    http.before_get = [](const std::string& endpoint) {
        if (endpoint.compare(0, 11, "/v1.0/token") == 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(50));
        }
    };
    TuyaClient client(testConfig(), &http, nullptr);

    std::vector<DataPoint> dps;
    CHECK(client.fetchStatus("dev1", dps).is_success());
    std::vector<RecordedRequest> reqs = http.requests();
    CHECK_EQ(reqs.size(), (size_t)2);
    long long token_t = std::stoll(reqs[0].header("t"));
    long long status_t = std::stoll(reqs[1].header("t"));
    CHECK(status_t >= token_t + 50);
    CHECK(signatureMatches(reqs[1], true));
    return true;
}

bool test_unsignable_request_sends_nothing() {
    FakeHttpClient http;
    http.respond("/v1.0/token", 200, TOKEN_OK);
    TuyaConfig cfg = testConfig();
    cfg.client_secret = "";
    TuyaClient client(cfg, &http, nullptr);

    std::vector<DataPoint> dps;
    TuyaResult r = client.fetchStatus("dev1", dps);
    CHECK(r.status == TuyaStatus::INVALID_ARGUMENT);
    CHECK(r.error_message.find("could not be signed") != std::string::npos);
    CHECK(http.requests().empty());
    return true;
}

bool test_large_shadow_response() {
    const int count = 400;
    std::string body = "{\"success\":true,\"result\":{\"properties\":[";
    for (int i = 0; i < count; i++) {
        if (i) body += ",";
        std::string code = i == 0 ? "local_temp" : i == 1 ? "local_hum" : "blob_" + std::to_string(i);
        std::string value = i < 2 ? std::to_string(200 + i)
                                  : "\"AQEDIAMBARMEAQCvAgAAFAUAAAAAQEDIAMBARMEAQCvAgAAFAUAAAA=\"";
        body += "{\"code\":\"" + code + "\",\"dp_id\":" + std::to_string(100 + i) +
                ",\"time\":1700000000000,\"type\":\"raw\",\"value\":" + value +
                ",\"custom_name\":\"sensor " + std::to_string(i) + "\"}";
    }
    body += "]},\"t\":1700000000000}";
    CHECK(body.size() > 16384);

    FakeHttpClient http;
    http.respond("/v1.0/token", 200, TOKEN_OK);
    http.respond("/v2.0/cloud/thing/ws-1/shadow/properties", 200, body);
    TuyaClient client(testConfig(), &http, nullptr);

    std::vector<ShadowProperty> props;
    TuyaResult r = client.fetchShadowProperties("ws-1", props);
    CHECK(r.is_success());
    CHECK_EQ(props.size(), (size_t)count);
    CHECK_EQ(props[0].code, std::string("local_temp"));
    CHECK_EQ(props[count - 1].dp_id, (int64_t)(100 + count - 1));
    return true;
}

bool test_scheduler_poll_counts_failures() {
    FakeHttpClient http;
    http.respond("/v1.0/token", 200, TOKEN_OK);
    http.respond("/v1.0/devices/thermo-1/status", 200, THERMOSTAT_OK);
    http.failTransport("/v1.0/devices/thermo-2/status", "Connection refused");
    TuyaClient client(testConfig(), &http, nullptr);
    ReadingStore store(":memory:");
    ReadingCache cache;
    SensorService sensors(&client, &store, &cache);

    std::vector<DeviceEntry> devices = {
        DeviceEntry{"thermo-1", DeviceType::THERMOSTAT},
        DeviceEntry{"thermo-2", DeviceType::THERMOSTAT},
    };
    AcquisitionScheduler scheduler(&sensors, devices);
    scheduler.pollTask();
    CHECK_EQ(scheduler.cycles(), (uint32_t)1);
    CHECK_EQ(scheduler.failures(), (uint32_t)1);
    CHECK_EQ(cache.getDevice("thermo-1").size(), (size_t)3);
    CHECK(cache.getDevice("thermo-2").empty());

    char stats[160];
    scheduler.getStatistics(stats, sizeof(stats));
    CHECK(std::string(stats).find("ok=1, failed=1") != std::string::npos);
    return true;
}

int main() {
    quietLogs();
    runTest("fetchStatus gets a token first", test_fetch_status_gets_token_first);
    runTest("Token reused across calls", test_token_reused_across_calls);
    runTest("Token failure propagates", test_token_failure_propagates);
    runTest("Token-invalid code drops the token", test_token_invalid_code_drops_token);
    runTest("Transport errors", test_transport_errors);
    runTest("Invalid device id sends nothing", test_invalid_device_id_sends_nothing);
    runTest("Shadow properties endpoint", test_shadow_properties_endpoint);
    runTest("sendCommands", test_send_commands);
    runTest("sendCommands non-boolean result", test_send_commands_non_bool_result);
    runTest("Responses are archived", test_responses_are_archived);
    runTest("Archive failure is swallowed", test_archive_failure_is_swallowed);
    runTest("Sensor service end to end", test_sensor_service_end_to_end);
    runTest("Sensor service decode error touches nothing", test_sensor_service_decode_error_touches_nothing);
    runTest("Scheduler poll counts failures", test_scheduler_poll_counts_failures);
    runTest("Rejected token keeps a newer refresh", test_rejected_token_keeps_newer_refresh);
    runTest("Request stamped after token wait", test_request_stamped_after_token_wait);
    runTest("Unsignable request sends nothing", test_unsignable_request_sends_nothing);
    runTest("Large shadow response", test_large_shadow_response);
    return testSummary("tuya_client");
}
