#include "test_support.hpp"
#include "../include/control_service.hpp"
#include "../include/reading_cache.hpp"
#include <atomic>
#include <thread>
#include <vector>

static EncodedReading reading(const std::string& device, SensorKind kind, int64_t value, int64_t at = 0) {
    EncodedReading r;
    r.device_id = device;
    r.sensor_kind = kind;
    r.value = value;
    r.recorded_at = at;
    return r;
}

bool test_empty_cache() {
    ReadingCache cache;
    CHECK(cache.all().empty());
    CHECK(!cache.get("dev", SensorKind::TEMPERATURE).has_value());
    CHECK(cache.getDevice("dev").empty());
    CHECK_EQ(cache.size(), (size_t)0);
    return true;
}

bool test_update_then_get() {
    ReadingCache cache;
    cache.update(reading("dev", SensorKind::TEMPERATURE, 1890, 10));
    std::optional<EncodedReading> r = cache.get("dev", SensorKind::TEMPERATURE);
    CHECK(r.has_value());
    CHECK_EQ(r->value, (int64_t)1890);
    CHECK_EQ(r->recorded_at, (int64_t)10);
    CHECK(!cache.get("dev", SensorKind::HUMIDITY).has_value());
    CHECK(!cache.get("other", SensorKind::TEMPERATURE).has_value());
    return true;
}

bool test_last_write_wins() {
    ReadingCache cache;
    cache.update(reading("dev", SensorKind::TEMPERATURE, 2000, 200));
    // An older reading that arrives later still replaces the entry
    cache.update(reading("dev", SensorKind::TEMPERATURE, 1500, 100));
    CHECK_EQ(cache.get("dev", SensorKind::TEMPERATURE)->value, (int64_t)1500);
    CHECK_EQ(cache.size(), (size_t)1);
    return true;
}

bool test_all_is_a_snapshot() {
    ReadingCache cache;
    cache.update(reading("a", SensorKind::TEMPERATURE, 1));
    cache.update(reading("b", SensorKind::HUMIDITY, 2));
    std::vector<EncodedReading> snap = cache.all();
    cache.update(reading("c", SensorKind::RELAY_STATE, 1));
    CHECK_EQ(snap.size(), (size_t)2);
    CHECK_EQ(cache.all().size(), (size_t)3);
    return true;
}

bool test_get_device() {
    ReadingCache cache;
    cache.update(reading("a", SensorKind::TEMPERATURE, 1));
    cache.update(reading("a", SensorKind::RELAY_STATE, 1));
    cache.update(reading("ab", SensorKind::TEMPERATURE, 5));
    cache.update(reading("b", SensorKind::HUMIDITY, 2));
    std::vector<EncodedReading> a = cache.getDevice("a");
    CHECK_EQ(a.size(), (size_t)2);
    for (const auto& r : a) CHECK_EQ(r.device_id, std::string("a"));
    CHECK_EQ(cache.getDevice("b").size(), (size_t)1);
    return true;
}

bool test_concurrent_readers_and_writers() {
    ReadingCache cache;
    std::atomic<bool> stop{false};
    std::atomic<int> bad{0};

    std::vector<std::thread> writers;
    for (int w = 0; w < 4; w++) {
        writers.emplace_back([&cache, w]() {
            for (int i = 0; i < 2000; i++) {
                cache.update(reading("dev" + std::to_string(w), SensorKind::TEMPERATURE, i, i));
            }
        });
    }
    std::vector<std::thread> readers;
    for (int r = 0; r < 4; r++) {
        readers.emplace_back([&]() {
            while (!stop) {
                for (const auto& e : cache.all()) {
                    // Every entry is whole: value and timestamp were written together
                    if (e.value != e.recorded_at) bad++;
                }
            }
        });
    }
    for (auto& t : writers) t.join();
    stop = true;
    for (auto& t : readers) t.join();

    CHECK_EQ(bad.load(), 0);
    CHECK_EQ(cache.size(), (size_t)4);
    for (int w = 0; w < 4; w++) {
        CHECK_EQ(cache.get("dev" + std::to_string(w), SensorKind::TEMPERATURE)->value, (int64_t)1999);
    }
    return true;
}

bool test_control_snapshot_groups_by_device() {
    ReadingCache cache;
    cache.update(reading("thermo", SensorKind::TEMPERATURE, 1890));
    cache.update(reading("thermo", SensorKind::RELAY_STATE, 1));
    cache.update(reading("thermo", SensorKind::TEMPERATURE_SETPOINT, 2200));
    cache.update(reading("ws", SensorKind::HUMIDITY, 5100));
    ControlService control(&cache, nullptr);

    std::vector<ControlSnapshot> snap = control.snapshot();
    CHECK_EQ(snap.size(), (size_t)2);
    CHECK_EQ(snap[0].device_id, std::string("thermo"));
    CHECK(snap[0].temperature_c.has_value());
    CHECK(*snap[0].temperature_c > 18.89 && *snap[0].temperature_c < 18.91);
    CHECK(snap[0].relay_on == std::optional<bool>(true));
    CHECK_EQ(snap[1].device_id, std::string("ws"));
    CHECK(!snap[1].temperature_c.has_value());
    CHECK(!snap[1].relay_on.has_value());

    control.evaluate();
    return true;
}

int main() {
    quietLogs();
    runTest("Empty cache", test_empty_cache);
    runTest("Update then get", test_update_then_get);
    runTest("Last write wins", test_last_write_wins);
    runTest("all() is a snapshot", test_all_is_a_snapshot);
    runTest("getDevice", test_get_device);
    runTest("Concurrent readers and writers", test_concurrent_readers_and_writers);
    runTest("Control snapshot groups by device", test_control_snapshot_groups_by_device);
    return testSummary("reading_cache");
}
