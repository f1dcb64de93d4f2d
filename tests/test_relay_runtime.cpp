#include <catch2/catch.hpp>

#include <chrono>
#include <memory>
#include <string>
#include <thread>

#include <unistd.h>

#include "logging_test_fixture.hpp"
#include "recording_doubles.hpp"
#include "drone_relay/relay_runtime.hpp"

using namespace drone_relay;
using drone_relay::test::RecordingSink;

namespace {
[[maybe_unused]] const bool logger_initialized = []() {
    drone_relay::test::ensure_logger_initialized();
    return true;
}();

Configuration make_configuration() {
    Configuration config{};
    config.log_directory = "unused";
    config.log_level = "info";
    config.poll_interval = Duration{0.05};
    config.id_prefix = "drone-";
    config.affiliations = AffiliationTable::Snapshot{{"drone-RT-1", Affiliation::Unauthorized}};
    return config;
}

/** @brief Pipe whose read end feeds the runtime. */
struct InputPipe final {
    int fds[2]{-1, -1};

    InputPipe() { REQUIRE(::pipe(fds) == 0); }
    ~InputPipe() {
        close_writer();
        if (fds[0] >= 0) {
            ::close(fds[0]);
        }
    }

    void write_line(const std::string& line) {
        const std::string framed = line + "\n";
        REQUIRE(::write(fds[1], framed.data(), framed.size()) == static_cast<ssize_t>(framed.size()));
    }

    void close_writer() {
        if (fds[1] >= 0) {
            ::close(fds[1]);
            fds[1] = -1;
        }
    }
};
}  // namespace

TEST_CASE("Runtime ingests input lines and publishes them to registered sinks") {
    InputPipe input{};
    auto sink = std::make_shared<RecordingSink>();

    RelayRuntime runtime{make_configuration(), input.fds[0]};
    REQUIRE(runtime.affiliations().size() == 1);
    runtime.add_sink("recording", sink);
    runtime.initialize();
    runtime.run();
    REQUIRE_THROWS_AS(runtime.add_sink("late", std::make_shared<RecordingSink>()), std::logic_error);

    input.write_line(R"json([{"MAC": "01:02:03:04:05:06"},)json"
                     R"json({"Basic ID": {"id_type": "Serial Number (ANSI/CTA-2063-A)", "id": "RT-1"}},)json"
                     R"json({"Location/Vector Message": {"latitude": 1.0, "longitude": 2.0}},)json"
                     R"json({"System Message": {"latitude": 1.1, "longitude": 2.1, "home_lat": 0, "home_lon": 0}}])json");
    input.close_writer();

    const auto deadline = SteadyClock::now() + std::chrono::seconds(5);
    while ((sink->count("drone") == 0 || !runtime.input_exhausted()) && SteadyClock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    REQUIRE(runtime.input_exhausted());
    runtime.shutdown();

    REQUIRE(sink->count("drone") >= 1);
    REQUIRE(sink->count("pilot") >= 1);
    REQUIRE(sink->count("home") == 0);
    REQUIRE(sink->count("close") == 1);
    const DroneRecord* record = runtime.registry().find("drone-RT-1");
    REQUIRE(record != nullptr);
    REQUIRE(record->affiliation == Affiliation::Unauthorized);
}

TEST_CASE("Runtime forwards sensor status lines to sinks without tracking them") {
    InputPipe input{};
    auto sink = std::make_shared<RecordingSink>();

    RelayRuntime runtime{make_configuration(), input.fds[0]};
    runtime.add_sink("recording", sink);
    runtime.initialize();
    runtime.run();

    input.write_line(R"json({"serial_number": "wd-42", "gps_data": {"latitude": 38.5, "longitude": -77.25, "altitude": 30},)json"
                     R"json( "system_stats": {"cpu_usage": 12.5, "memory": {"total": 2097152, "available": 1048576}}})json");
    input.write_line("not json at all");
    input.close_writer();

    const auto deadline = SteadyClock::now() + std::chrono::seconds(5);
    while ((sink->count("system") == 0 || !runtime.input_exhausted()) && SteadyClock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    runtime.shutdown();

    REQUIRE(sink->count("system") == 1);
    const auto calls = sink->calls();
    REQUIRE(calls.front().operation == "system");
    REQUIRE(calls.front().drone_id == "wd-42");
    REQUIRE(calls.front().lat == Approx(38.5));
    REQUIRE(calls.front().lon == Approx(-77.25));
    REQUIRE(runtime.registry().size() == 0);
}
