#include <catch2/catch.hpp>

#include <algorithm>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include <spdlog/sinks/ostream_sink.h>

#include "logging_test_fixture.hpp"
#include "recording_doubles.hpp"
#include "drone_relay/sink_router.hpp"

using namespace drone_relay;
using drone_relay::test::RecordingSink;
using drone_relay::test::ThrowingSink;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    drone_relay::test::ensure_logger_initialized();
    return true;
}();

DroneRecord make_record(double pilot_lat, double pilot_lon, double home_lat, double home_lon) {
    DroneRecord record{};
    record.id = "drone-R1";
    record.lat = 5.0;
    record.lon = 6.0;
    record.pilot_lat = pilot_lat;
    record.pilot_lon = pilot_lon;
    record.home_lat = home_lat;
    record.home_lon = home_lon;
    return record;
}

/** @brief Sink whose failures carry characters that need quoting in JSON. */
class QuotingFailureSink final : public Sink {
  public:
    [[nodiscard]] SinkCapabilities capabilities() const override { return SinkCapabilities{false, false, false, true, false}; }
    void mark_inactive(const std::string&) override { throw std::runtime_error("broker said \"no\"\nretry later"); }
};

/** @brief Copies the shared logger's output into a string while in scope. */
class LogCapture final {
  public:
    LogCapture() : capture_sink_(std::make_shared<spdlog::sinks::ostream_sink_mt>(stream_)) {
        capture_sink_->set_pattern("%v");
        get_logger()->sinks().push_back(capture_sink_);
    }

    ~LogCapture() {
        auto& sinks = get_logger()->sinks();
        sinks.erase(std::remove(sinks.begin(), sinks.end(), capture_sink_), sinks.end());
    }

    LogCapture(const LogCapture&) = delete;
    LogCapture& operator=(const LogCapture&) = delete;

    std::vector<std::string> lines_containing(const std::string& needle) const {
        std::vector<std::string> list_lines;
        std::istringstream input{stream_.str()};
        std::string line;
        while (std::getline(input, line)) {
            if (line.find(needle) != std::string::npos) {
                list_lines.push_back(line);
            }
        }
        return list_lines;
    }

  private:
    std::ostringstream stream_;
    spdlog::sink_ptr capture_sink_;
};
}  // namespace

TEST_CASE("Router rejects null sinks and empty names") {
    SinkRouter router{};
    REQUIRE_THROWS_AS(router.add_sink("none", nullptr), std::invalid_argument);
    REQUIRE_THROWS_AS(router.add_sink("", std::make_shared<RecordingSink>()), std::invalid_argument);
    REQUIRE(router.sink_count() == 0);
}

TEST_CASE("Publish forwards pilot and home positions with zero altitude") {
    SinkRouter router{};
    auto sink = std::make_shared<RecordingSink>();
    router.add_sink("recording", sink);

    const FanoutReport report = router.publish(make_record(1.0, 2.0, 3.0, 4.0));
    REQUIRE(report.calls == 3);
    REQUIRE(report.failures == 0);

    const auto calls = sink->calls();
    REQUIRE(calls.size() == 3);
    REQUIRE(calls[0].operation == "drone");
    REQUIRE(calls[1].operation == "pilot");
    REQUIRE(calls[1].lat == Approx(1.0));
    REQUIRE(calls[1].alt == 0.0);
    REQUIRE(calls[2].operation == "home");
    REQUIRE(calls[2].lon == Approx(4.0));
}

TEST_CASE("Zero pilot and home coordinates are not published") {
    SinkRouter router{};
    auto sink = std::make_shared<RecordingSink>();
    router.add_sink("recording", sink);

    router.publish(make_record(0.0, 0.0, 0.0, 0.0));
    REQUIRE(sink->count("drone") == 1);
    REQUIRE(sink->count("pilot") == 0);
    REQUIRE(sink->count("home") == 0);
}

TEST_CASE("Operations outside a sink's capabilities are never called") {
    SinkRouter router{};
    auto drone_only = std::make_shared<RecordingSink>(SinkCapabilities{true, false, false, false, false});
    router.add_sink("drone-only", drone_only);

    router.publish(make_record(1.0, 1.0, 1.0, 1.0));
    router.on_evict("drone-R1");
    router.close_all();

    const auto calls = drone_only->calls();
    REQUIRE(calls.size() == 1);
    REQUIRE(calls[0].operation == "drone");
}

TEST_CASE("A failing sink does not prevent later sinks from receiving calls") {
    SinkRouter router{};
    auto healthy = std::make_shared<RecordingSink>();
    router.add_sink("broken", std::make_shared<ThrowingSink>());
    router.add_sink("healthy", healthy);

    const FanoutReport publish_report = router.publish(make_record(1.0, 1.0, 0.0, 0.0));
    REQUIRE(publish_report.failures == 2);
    REQUIRE(healthy->count("drone") == 1);
    REQUIRE(healthy->count("pilot") == 1);

    const FanoutReport evict_report = router.on_evict("drone-R1");
    REQUIRE(evict_report.calls == 2);
    REQUIRE(evict_report.failures == 1);
    REQUIRE(healthy->count("inactive") == 1);

    const FanoutReport close_report = router.close_all();
    REQUIRE(close_report.failures == 1);
    REQUIRE(healthy->count("close") == 1);
}

TEST_CASE("Status reports only reach sinks that declare them") {
    SinkRouter router{};
    auto status_sink = std::make_shared<RecordingSink>();
    auto drone_only = std::make_shared<RecordingSink>(SinkCapabilities{true, true, true, true, true, false});
    router.add_sink("broken", std::make_shared<ThrowingSink>());
    router.add_sink("status", status_sink);
    router.add_sink("drone-only", drone_only);

    SystemStatus status{};
    status.serial_number = "wd-3";
    const FanoutReport report = router.publish_system(status);
    REQUIRE(report.calls == 2);
    REQUIRE(report.failures == 1);
    REQUIRE(status_sink->count("system") == 1);
    REQUIRE(status_sink->calls().front().drone_id == "wd-3");
    REQUIRE(drone_only->calls().empty());
}

TEST_CASE("Sink failure warnings stay valid JSON whatever the error text holds") {
    SinkRouter router{};
    router.add_sink("quoting \"sink\"", std::make_shared<QuotingFailureSink>());

    std::vector<std::string> list_lines;
    {
        LogCapture capture{};
        const FanoutReport report = router.on_evict("drone-\"Q\"");
        REQUIRE(report.failures == 1);
        list_lines = capture.lines_containing("sink_router");
    }

    REQUIRE(list_lines.size() == 1);
    const nlohmann::json line = nlohmann::json::parse(list_lines.front());
    REQUIRE(line["component"] == "sink_router");
    REQUIRE(line["sink"] == "quoting \"sink\"");
    REQUIRE(line["operation"] == "mark_inactive");
    REQUIRE(line["drone"] == "drone-\"Q\"");
    REQUIRE(line["error"] == "broker said \"no\"\nretry later");
}
