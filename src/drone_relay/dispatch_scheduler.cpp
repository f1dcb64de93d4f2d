#include "drone_relay/dispatch_scheduler.hpp"

#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

#include "drone_relay/geodesy.hpp"

namespace drone_relay {

DispatchScheduler::DispatchScheduler(DroneRegistry& registry, SinkRouter& router, EventTransportPtr transport, DispatchConfig config)
    : registry_(registry),
      router_(router),
      transport_(std::move(transport)),
      config_(config),
      logger_(get_logger()) {
    if (config_.rate_limit.count() <= 0.0) {
        throw std::invalid_argument("DispatchScheduler rate limit must be positive");
    }
    if (config_.inactivity_timeout.count() <= 0.0) {
        throw std::invalid_argument("DispatchScheduler inactivity timeout must be positive");
    }
}

TickReport DispatchScheduler::tick(TimePoint now) {
    return tick(now, SystemClock::now());
}

TickReport DispatchScheduler::tick(TimePoint now, SystemTimePoint wall_now) {
    TickReport report{};

    for (const std::string& drone_id : registry_.active_ids()) {
        DroneRecord* record = registry_.find(drone_id);
        if (record == nullptr) {
            continue;
        }
        ++report.records_considered;

        const Duration age = elapsed_between(record->last_update_time, now);
        if (age > config_.inactivity_timeout) {
            // Left for the sweep below.
            continue;
        }
        if (record->last_sent_time.has_value() && elapsed_between(*record->last_sent_time, now) < config_.rate_limit) {
            continue;
        }

        const Duration stale_offset = config_.inactivity_timeout - age;
        const DroneRecord snapshot = *record;
        dispatch_record(snapshot, stale_offset, wall_now, report);

        const double moved_m = haversine_distance_m(record->last_sent_lat, record->last_sent_lon, record->lat, record->lon);
        record->mark_sent(now);
        ++report.records_dispatched;
        logger_->debug(R"({{"component":"dispatch","drone":"{}","moved_m":{:.2f},"stale_s":{:.2f}}})",
                       drone_id,
                       moved_m,
                       stale_offset.count());
    }

    for (const std::string& drone_id : registry_.sweep(now)) {
        // remove() notifies the eviction listener (the sink router) first.
        if (registry_.remove(drone_id)) {
            ++report.records_evicted;
        }
    }

    if (report.encode_failures > 0 || report.transport_failures > 0 || report.sinks.failures > 0) {
        logger_->warn("Tick finished with {} encode, {} transport and {} sink failures",
                      report.encode_failures,
                      report.transport_failures,
                      report.sinks.failures);
    }
    return report;
}

const DispatchConfig& DispatchScheduler::config() const noexcept {
    return config_;
}

template <typename EncodeOperation>
void DispatchScheduler::deliver_event(const char* variant, const std::string& drone_id, EncodeOperation&& encode, TickReport& report) {
    CotPayload payload;
    const DeliveryResult encoded = guard_call([&] { payload = encode(); });
    if (!encoded.ok) {
        ++report.encode_failures;
        logger_->warn("CoT {} encoding failed for {}: {}", variant, drone_id, encoded.error);
        return;
    }
    if (transport_ == nullptr) {
        return;
    }
    const DeliveryResult sent = guard_call([&] { transport_->send_event(payload); });
    if (!sent.ok) {
        ++report.transport_failures;
        logger_->warn("CoT {} send failed for {}: {}", variant, drone_id, sent.error);
        return;
    }
    ++report.events_sent;
}

void DispatchScheduler::dispatch_record(const DroneRecord& snapshot, Duration stale_offset, SystemTimePoint wall_now, TickReport& report) {
    deliver_event("main", snapshot.id, [&] { return encoder_.encode_main(snapshot, stale_offset, wall_now); }, report);
    if (snapshot.has_pilot_location()) {
        deliver_event("pilot", snapshot.id, [&] { return encoder_.encode_pilot(snapshot, stale_offset, wall_now); }, report);
    }
    if (snapshot.has_home_location()) {
        deliver_event("home", snapshot.id, [&] { return encoder_.encode_home(snapshot, stale_offset, wall_now); }, report);
    }
    report.sinks += router_.publish(snapshot);
}

TickReport DispatchScheduler::dispatch_status(const SystemStatus& status, SystemTimePoint wall_now) {
    TickReport report{};
    deliver_event("system", status.serial_number, [&] { return encoder_.encode_system_status(status, std::nullopt, wall_now); }, report);
    report.sinks += router_.publish_system(status);
    return report;
}

}  // namespace drone_relay
