#include <catch2/catch.hpp>

#include <chrono>
#include <optional>
#include <string>
#include <vector>

#include "logging_test_fixture.hpp"
#include "drone_relay/drone_registry.hpp"

using namespace drone_relay;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    drone_relay::test::ensure_logger_initialized();
    return true;
}();

Observation serial_observation(const std::string& id, const std::string& mac = {}) {
    Observation observation{};
    observation.id = id;
    observation.mac = mac;
    observation.lat = 10.0;
    observation.lon = 20.0;
    return observation;
}

TimePoint after(TimePoint start, double seconds) {
    return start + std::chrono::duration_cast<SteadyClock::duration>(Duration{seconds});
}
}  // namespace

TEST_CASE("Registry rejects a zero capacity") {
    const RegistryConfig no_capacity{0, Duration{60.0}};
    const RegistryConfig no_timeout{3, Duration{0.0}};
    REQUIRE_THROWS_AS(DroneRegistry(no_capacity), std::invalid_argument);
    REQUIRE_THROWS_AS(DroneRegistry(no_timeout), std::invalid_argument);
}

TEST_CASE("Upsert creates then merges by id") {
    DroneRegistry registry{RegistryConfig{}};
    const TimePoint now = SteadyClock::now();

    REQUIRE(registry.upsert(serial_observation("drone-A"), now) == UpsertOutcome::Created);
    REQUIRE(registry.upsert(serial_observation("drone-A"), now) == UpsertOutcome::Updated);
    REQUIRE(registry.size() == 1);

    Observation anonymous{};
    REQUIRE(registry.upsert(anonymous, now) == UpsertOutcome::Dropped);
}

TEST_CASE("Inserting past capacity evicts the first-inserted record") {
    DroneRegistry registry{RegistryConfig{3, Duration{60.0}}};
    std::vector<std::string> list_evicted;
    registry.set_eviction_listener([&list_evicted](const std::string& id) { list_evicted.push_back(id); });
    const TimePoint now = SteadyClock::now();

    for (const char* id : {"drone-1", "drone-2", "drone-3"}) {
        registry.upsert(serial_observation(id), now);
    }
    // A fresher update to the oldest insert must not save it from eviction.
    REQUIRE(registry.upsert(serial_observation("drone-1"), after(now, 5.0)) == UpsertOutcome::Updated);
    registry.upsert(serial_observation("drone-4"), after(now, 6.0));

    REQUIRE(registry.size() == 3);
    REQUIRE(registry.find("drone-1") == nullptr);
    REQUIRE(list_evicted == std::vector<std::string>{"drone-1"});
    REQUIRE(registry.active_ids() == std::vector<std::string>{"drone-2", "drone-3", "drone-4"});
}

TEST_CASE("Updating an existing record never evicts") {
    DroneRegistry registry{RegistryConfig{2, Duration{60.0}}};
    const TimePoint now = SteadyClock::now();
    registry.upsert(serial_observation("drone-1"), now);
    registry.upsert(serial_observation("drone-2"), now);
    registry.upsert(serial_observation("drone-1"), now);
    REQUIRE(registry.size() == 2);
    REQUIRE(registry.find("drone-1") != nullptr);
}

TEST_CASE("Eviction order follows insertion after inactivity removals") {
    DroneRegistry registry{RegistryConfig{3, Duration{60.0}}};
    const TimePoint start = SteadyClock::now();
    registry.upsert(serial_observation("drone-1"), start);
    registry.upsert(serial_observation("drone-2"), after(start, 50.0));
    registry.upsert(serial_observation("drone-3"), after(start, 50.0));

    const std::vector<std::string> expired = registry.sweep(after(start, 61.0));
    REQUIRE(expired == std::vector<std::string>{"drone-1"});
    for (const std::string& id : expired) {
        REQUIRE(registry.remove(id));
    }

    registry.upsert(serial_observation("drone-4"), after(start, 62.0));
    registry.upsert(serial_observation("drone-5"), after(start, 62.0));
    REQUIRE(registry.active_ids() == std::vector<std::string>{"drone-3", "drone-4", "drone-5"});
}

TEST_CASE("CAA-only observation merges into the first record with its MAC") {
    DroneRegistry registry{RegistryConfig{}};
    const TimePoint now = SteadyClock::now();
    registry.upsert(serial_observation("drone-first", "aa:bb"), now);
    registry.upsert(serial_observation("drone-second", "aa:bb"), now);
    // The most recently updated record is not preferred over the first inserted one.
    registry.upsert(serial_observation("drone-second", "aa:bb"), after(now, 2.0));

    Observation caa_only{};
    caa_only.mac = "aa:bb";
    caa_only.caa = "CAA-77";
    const std::optional<std::string> matched = registry.correlate_by_mac(caa_only, after(now, 3.0));

    REQUIRE(matched == std::optional<std::string>{"drone-first"});
    REQUIRE(registry.find("drone-first")->caa == "CAA-77");
    REQUIRE(registry.find("drone-second")->caa.empty());
}

TEST_CASE("CAA-only observation without a matching MAC is ignored") {
    DroneRegistry registry{RegistryConfig{}};
    Observation caa_only{};
    caa_only.mac = "ff:ff";
    caa_only.caa = "CAA-1";
    REQUIRE_FALSE(registry.correlate_by_mac(caa_only, SteadyClock::now()).has_value());
    REQUIRE(registry.size() == 0);
}

TEST_CASE("Sweep marks each stale record once and removal notifies the listener") {
    DroneRegistry registry{RegistryConfig{5, Duration{60.0}}};
    std::vector<std::string> list_evicted;
    registry.set_eviction_listener([&list_evicted](const std::string& id) { list_evicted.push_back(id); });
    const TimePoint start = SteadyClock::now();
    registry.upsert(serial_observation("drone-old"), start);
    registry.upsert(serial_observation("drone-new"), after(start, 30.0));

    REQUIRE(registry.sweep(after(start, 60.0)).empty());
    const std::vector<std::string> expired = registry.sweep(after(start, 61.0));
    REQUIRE(expired == std::vector<std::string>{"drone-old"});
    REQUIRE(registry.sweep(after(start, 61.5)).empty());

    REQUIRE(registry.remove("drone-old"));
    REQUIRE_FALSE(registry.remove("drone-old"));
    REQUIRE(list_evicted == std::vector<std::string>{"drone-old"});
    REQUIRE(registry.size() == 1);
}
