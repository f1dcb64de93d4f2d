#include <catch2/catch.hpp>

#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "logging_test_fixture.hpp"
#include "drone_relay/json_stream_sink.hpp"

using namespace drone_relay;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    drone_relay::test::ensure_logger_initialized();
    return true;
}();

std::vector<nlohmann::json> read_lines(const std::ostringstream& stream) {
    std::vector<nlohmann::json> list_documents;
    std::istringstream input{stream.str()};
    std::string line;
    while (std::getline(input, line)) {
        list_documents.push_back(nlohmann::json::parse(line));
    }
    return list_documents;
}

DroneRecord make_record() {
    DroneRecord record{};
    record.id = "drone-J1";
    record.lat = 12.5;
    record.lon = 45.25;
    record.alt = 100.0;
    record.freq = 2'437'000'000.0;
    record.horizontal_accuracy = "3 m";
    record.ua_type = 2;
    record.ua_type_name = "Helicopter or Multirotor";
    return record;
}
}  // namespace

TEST_CASE("Frequencies above 1e5 are treated as Hz") {
    REQUIRE(*frequency_mhz(2'437'000'000.0) == Approx(2437.0));
    REQUIRE(*frequency_mhz(5'745.1234) == Approx(5745.123));
    REQUIRE_FALSE(frequency_mhz(std::nullopt).has_value());
}

TEST_CASE("Drone state document carries aliases and derived fields") {
    const nlohmann::json state = drone_state_document(make_record());
    REQUIRE(state["id"] == "drone-J1");
    REQUIRE(state["latitude"].get<double>() == Approx(12.5));
    REQUIRE(state["longitude"].get<double>() == Approx(45.25));
    REQUIRE(state["gps_accuracy"].get<double>() == Approx(3.0));
    REQUIRE(state["freq_mhz"].get<double>() == Approx(2437.0));
    REQUIRE(state["ua_type"] == 2);
    REQUIRE(state["direction"].get<double>() == 0.0);
}

TEST_CASE("Pilot and home patches merge into the cached drone state") {
    std::ostringstream output;
    JsonStreamSink sink{output};

    sink.publish_drone(make_record());
    sink.publish_pilot("drone-J1", 12.4, 45.2, 0.0);
    sink.publish_home("drone-J1", 12.3, 45.1, 0.0);

    const std::vector<nlohmann::json> lines = read_lines(output);
    REQUIRE(lines.size() == 3);
    const nlohmann::json& merged = lines.back();
    REQUIRE(merged["id"] == "drone-J1");
    REQUIRE(merged["lat"].get<double>() == Approx(12.5));
    REQUIRE(merged["pilot_lat"].get<double>() == Approx(12.4));
    REQUIRE(merged["home_lon"].get<double>() == Approx(45.1));
    REQUIRE(merged["home_alt"].get<double>() == 0.0);
    REQUIRE(sink.cached_count() == 1);
}

TEST_CASE("Marking a drone inactive writes a tombstone and forgets its state") {
    std::ostringstream output;
    JsonStreamSink sink{output};
    sink.publish_drone(make_record());
    sink.mark_inactive("drone-J1");

    const std::vector<nlohmann::json> lines = read_lines(output);
    REQUIRE(lines.size() == 2);
    REQUIRE(lines.back() == nlohmann::json{{"id", "drone-J1"}, {"state", "inactive"}});
    REQUIRE(sink.cached_count() == 0);

    sink.publish_pilot("drone-J1", 1.0, 2.0, 0.0);
    const nlohmann::json fresh = read_lines(output).back();
    REQUIRE_FALSE(fresh.contains("lat"));
    REQUIRE(fresh["pilot_lat"].get<double>() == Approx(1.0));
}

TEST_CASE("Status reports are written as standalone system lines") {
    std::ostringstream output;
    JsonStreamSink sink{output};
    REQUIRE(sink.capabilities().publish_system);

    SystemStatus status{};
    status.serial_number = "wd-9";
    status.lat = 10.0;
    status.lon = 20.0;
    status.cpu_usage = 3.5;
    sink.publish_system(status);

    const std::vector<nlohmann::json> lines = read_lines(output);
    REQUIRE(lines.size() == 1);
    REQUIRE(lines[0]["type"] == "system");
    REQUIRE(lines[0]["serial_number"] == "wd-9");
    REQUIRE(lines[0]["cpu_usage"].get<double>() == Approx(3.5));
    REQUIRE(lines[0]["zynq_temp"] == "N/A");
    REQUIRE(sink.cached_count() == 0);
}

TEST_CASE("Unwritable output path is reported at construction") {
    REQUIRE_THROWS_AS(JsonStreamSink(std::filesystem::path{"/nonexistent-dir/state.jsonl"}), std::runtime_error);
}
