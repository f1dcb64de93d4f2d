#include "drone_relay/sink_router.hpp"

#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace drone_relay {

namespace {
// Sinks receive pilot/home positions without an altitude.
constexpr double k_marker_altitude_m{0.0};
}  // namespace

SinkRouter::SinkRouter()
    : logger_(get_logger()) {}

void SinkRouter::add_sink(std::string name, SinkPtr sink) {
    if (sink == nullptr) {
        throw std::invalid_argument("SinkRouter cannot register a null sink");
    }
    if (name.empty()) {
        throw std::invalid_argument("SinkRouter sink name cannot be empty");
    }
    const SinkCapabilities capabilities = sink->capabilities();
    logger_->info("Registered sink {} (drone={} pilot={} home={} inactive={} close={} system={})",
                  name,
                  capabilities.publish_drone,
                  capabilities.publish_pilot,
                  capabilities.publish_home,
                  capabilities.mark_inactive,
                  capabilities.close,
                  capabilities.publish_system);
    list_sinks_.push_back(RegisteredSink{std::move(name), std::move(sink), capabilities});
}

FanoutReport SinkRouter::publish(const DroneRecord& record) {
    FanoutReport report{};
    const bool has_pilot = record.has_pilot_location();
    const bool has_home = record.has_home_location();

    for (const RegisteredSink& entry : list_sinks_) {
        if (entry.capabilities.publish_drone) {
            record_outcome(report, guard_call([&] { entry.sink->publish_drone(record); }), entry, "publish_drone", record.id);
        }
        if (has_pilot && entry.capabilities.publish_pilot) {
            record_outcome(report,
                           guard_call([&] { entry.sink->publish_pilot(record.id, record.pilot_lat, record.pilot_lon, k_marker_altitude_m); }),
                           entry,
                           "publish_pilot",
                           record.id);
        }
        if (has_home && entry.capabilities.publish_home) {
            record_outcome(report,
                           guard_call([&] { entry.sink->publish_home(record.id, record.home_lat, record.home_lon, k_marker_altitude_m); }),
                           entry,
                           "publish_home",
                           record.id);
        }
    }
    return report;
}

FanoutReport SinkRouter::on_evict(const std::string& drone_id) {
    FanoutReport report{};
    for (const RegisteredSink& entry : list_sinks_) {
        if (!entry.capabilities.mark_inactive) {
            continue;
        }
        record_outcome(report, guard_call([&] { entry.sink->mark_inactive(drone_id); }), entry, "mark_inactive", drone_id);
    }
    return report;
}

FanoutReport SinkRouter::publish_system(const SystemStatus& status) {
    FanoutReport report{};
    for (const RegisteredSink& entry : list_sinks_) {
        if (!entry.capabilities.publish_system) {
            continue;
        }
        record_outcome(report, guard_call([&] { entry.sink->publish_system(status); }), entry, "publish_system", "");
    }
    return report;
}

FanoutReport SinkRouter::close_all() {
    FanoutReport report{};
    for (const RegisteredSink& entry : list_sinks_) {
        if (!entry.capabilities.close) {
            continue;
        }
        record_outcome(report, guard_call([&] { entry.sink->close(); }), entry, "close", "");
    }
    logger_->info("Closed {} sinks ({} failures)", report.calls, report.failures);
    return report;
}

std::size_t SinkRouter::sink_count() const noexcept {
    return list_sinks_.size();
}

void SinkRouter::record_outcome(FanoutReport& report,
                                const DeliveryResult& result,
                                const RegisteredSink& entry,
                                const char* operation,
                                const std::string& drone_id) {
    ++report.calls;
    if (result.ok) {
        return;
    }
    ++report.failures;
    // Names, ids and error text are escaped by the serializer.
    const nlohmann::json line{
        {"component", "sink_router"},
        {"sink", entry.name},
        {"operation", operation},
        {"drone", drone_id},
        {"error", result.error},
    };
    logger_->warn("{}", line.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

}  // namespace drone_relay
