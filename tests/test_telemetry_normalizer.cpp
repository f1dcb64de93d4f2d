#include <catch2/catch.hpp>

#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "logging_test_fixture.hpp"
#include "drone_relay/remote_id.hpp"
#include "drone_relay/telemetry_normalizer.hpp"

using namespace drone_relay;
using nlohmann::json;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    drone_relay::test::ensure_logger_initialized();
    return true;
}();

TelemetryNormalizer make_normalizer() {
    return TelemetryNormalizer{get_logger()};
}

json serial_message_with_ua_type(const json& raw_type) {
    json basic = json::object();
    basic["id_type"] = "Serial Number (ANSI/CTA-2063-A)";
    basic["id"] = "SN-UA";
    basic["ua_type"] = raw_type;
    json part = json::object();
    part["Basic ID"] = basic;
    json message = json::array();
    message.push_back(part);
    return message;
}
}  // namespace

TEST_CASE("List-shaped message yields a serial-identified observation") {
    const json message = json::parse(R"json([
        {"MAC": "aa:bb:cc:dd:ee:ff", "RSSI": -62},
        {"Basic ID": {"id_type": "Serial Number (ANSI/CTA-2063-A)", "id": "1581F5FJD229700A", "ua_type": 2}},
        {"Location/Vector Message": {"latitude": 37.5, "longitude": -122.25, "speed": "12.5 m/s",
                                     "vert_speed": 1.0, "geodetic_altitude": 120.0, "height_agl": 80.0,
                                     "direction": 45, "horizontal_accuracy": "<10 m"}},
        {"Self-ID Message": {"text": "Survey flight"}},
        {"System Message": {"latitude": 37.49, "longitude": -122.24, "home_lat": 37.48, "home_lon": -122.23}},
        {"Operator ID Message": {"operator_id_type": "Operator ID", "operator_id": "FIN87astrdge12k8"}}
    ])json");

    const std::optional<Observation> observation = make_normalizer().normalize(message);
    REQUIRE(observation.has_value());
    REQUIRE(observation->id == std::optional<std::string>{"1581F5FJD229700A"});
    REQUIRE(observation->mac == "aa:bb:cc:dd:ee:ff");
    REQUIRE(observation->rssi == -62);
    REQUIRE(observation->lat == Approx(37.5));
    REQUIRE(observation->lon == Approx(-122.25));
    REQUIRE(observation->speed == Approx(12.5));
    REQUIRE(observation->alt == Approx(120.0));
    REQUIRE(observation->height == Approx(80.0));
    REQUIRE(observation->direction.has_value());
    REQUIRE(*observation->direction == Approx(45.0));
    REQUIRE(observation->ua_type == std::optional<int>{2});
    REQUIRE(observation->ua_type_name == "Helicopter or Multirotor");
    REQUIRE(observation->description == "Survey flight");
    REQUIRE(observation->pilot_lat == Approx(37.49));
    REQUIRE(observation->home_lon == Approx(-122.23));
    REQUIRE(observation->operator_id == "FIN87astrdge12k8");
    REQUIRE(observation->horizontal_accuracy == "<10 m");
}

TEST_CASE("CAA-only message carries the registration but no id") {
    const json message = json::parse(R"json([
        {"MAC": "aa:bb:cc:dd:ee:ff"},
        {"Basic ID": {"id_type": "CAA Assigned Registration ID", "id": "CAA-REG-42"}}
    ])json");

    const std::optional<Observation> observation = make_normalizer().normalize(message);
    REQUIRE(observation.has_value());
    REQUIRE_FALSE(observation->id.has_value());
    REQUIRE(observation->caa == "CAA-REG-42");
    REQUIRE(observation->mac == "aa:bb:cc:dd:ee:ff");
}

TEST_CASE("Map-shaped message reads BLE link fields and operator position") {
    const json message = json::parse(R"json({
        "index": 7,
        "runtime": 42,
        "AUX_ADV_IND": {"rssi": -71},
        "aext": {"AdvA": "11:22:33:44:55:66 random"},
        "Basic ID": {"id_type": "Serial Number (ANSI/CTA-2063-A)", "id": "SN-MAP", "ua_type": "aeroplane/airplane (fixed wing)"},
        "Location/Vector Message": {"latitude": "10.5", "longitude": "20.25"},
        "System Message": {"operator_lat": 10.4, "operator_lon": 20.2}
    })json");

    const std::optional<Observation> observation = make_normalizer().normalize(message);
    REQUIRE(observation.has_value());
    REQUIRE(observation->id == std::optional<std::string>{"SN-MAP"});
    REQUIRE(observation->index == 7);
    REQUIRE(observation->runtime == 42);
    REQUIRE(observation->rssi == -71);
    REQUIRE(observation->mac == "11:22:33:44:55:66");
    REQUIRE(observation->lat == Approx(10.5));
    REQUIRE(observation->pilot_lat == Approx(10.4));
    REQUIRE(observation->pilot_lon == Approx(20.2));
    REQUIRE(observation->ua_type == std::optional<int>{1});
}

TEST_CASE("Unparseable numeric fields fall back without discarding the message") {
    const json message = json::parse(R"json([
        {"Basic ID": {"id_type": "Serial Number (ANSI/CTA-2063-A)", "id": "SN-1"}},
        {"Location/Vector Message": {"latitude": "north", "longitude": null, "speed": "fast"}}
    ])json");

    const std::optional<Observation> observation = make_normalizer().normalize(message);
    REQUIRE(observation.has_value());
    REQUIRE(observation->lat == 0.0);
    REQUIRE(observation->lon == 0.0);
    REQUIRE(observation->speed == 0.0);
    REQUIRE_FALSE(observation->direction.has_value());
}

TEST_CASE("Out-of-domain UA types normalize to the unknown sentinel") {
    const TelemetryNormalizer normalizer = make_normalizer();
    std::vector<json> list_raw_types;
    list_raw_types.push_back(json(99));
    list_raw_types.push_back(json(-3));
    list_raw_types.push_back(json("bogus"));
    list_raw_types.push_back(json("1e300"));
    list_raw_types.push_back(json("3e9"));
    list_raw_types.push_back(json(1e300));
    for (const json& raw_type : list_raw_types) {
        const std::optional<Observation> observation = normalizer.normalize(serial_message_with_ua_type(raw_type));
        INFO("ua_type " << raw_type.dump());
        REQUIRE(observation.has_value());
        REQUIRE_FALSE(observation->ua_type.has_value());
        REQUIRE(observation->ua_type_name == k_unknown_ua_type_name);
    }

    const std::optional<Observation> glider = normalizer.normalize(serial_message_with_ua_type(json("6")));
    REQUIRE(glider.has_value());
    REQUIRE(glider->ua_type == std::optional<int>{6});
}

TEST_CASE("Frequency message sets the carrier frequency") {
    const TelemetryNormalizer normalizer = make_normalizer();
    const std::optional<Observation> in_hertz = normalizer.normalize(json::parse(R"json([
        {"Basic ID": {"id_type": "Serial Number (ANSI/CTA-2063-A)", "id": "SN-F"}},
        {"Frequency Message": {"frequency": 2437000000}}
    ])json"));
    REQUIRE(in_hertz.has_value());
    REQUIRE(in_hertz->freq.has_value());
    REQUIRE(*in_hertz->freq == Approx(2437000000.0));

    const std::optional<Observation> with_unit = normalizer.normalize(json::parse(R"json({
        "Basic ID": {"id_type": "Serial Number (ANSI/CTA-2063-A)", "id": "SN-F"},
        "Frequency Message": {"frequency": "5745.0 MHz"}
    })json"));
    REQUIRE(with_unit.has_value());
    REQUIRE(with_unit->freq.has_value());
    REQUIRE(*with_unit->freq == Approx(5745.0));

    const std::optional<Observation> without = normalizer.normalize(json::parse(R"json([
        {"Basic ID": {"id_type": "Serial Number (ANSI/CTA-2063-A)", "id": "SN-F"}}
    ])json"));
    REQUIRE(without.has_value());
    REQUIRE_FALSE(without->freq.has_value());
}

TEST_CASE("Unsupported shapes and malformed text are rejected") {
    const TelemetryNormalizer normalizer = make_normalizer();
    REQUIRE_FALSE(normalizer.normalize(json(42)).has_value());
    REQUIRE_FALSE(normalizer.normalize(json::parse(R"json([{"Unrelated": {}}])json")).has_value());
    REQUIRE_FALSE(normalizer.normalize_text("{not json").has_value());
}

TEST_CASE("Lenient numeric coercion") {
    REQUIRE(coerce_double(json(3.5), 0.0) == Approx(3.5));
    REQUIRE(coerce_double(json("0.25 m/s"), 0.0) == Approx(0.25));
    REQUIRE(coerce_double(json("abc"), -1.0) == Approx(-1.0));
    REQUIRE(coerce_double(json(nullptr), 7.0) == Approx(7.0));
    REQUIRE_FALSE(coerce_optional_double(json("n/a")).has_value());
}

TEST_CASE("UA type vocabulary maps categories to tactical types") {
    REQUIRE(ua_type_name(2) == std::optional<std::string_view>{"Helicopter or Multirotor"});
    REQUIRE(ua_type_code_from_name("AEROPLANE/AIRPLANE (FIXED WING)") == std::optional<int>{1});
    REQUIRE(cot_type_for_ua(1) == "a-f-A-f");
    REQUIRE(cot_type_for_ua(2) == "a-u-A-M-H-R");
    REQUIRE(cot_type_for_ua(9) == "b-m-p-s-m");
    REQUIRE(cot_type_for_ua(std::nullopt) == "a-u-A-M-H-R");
}
