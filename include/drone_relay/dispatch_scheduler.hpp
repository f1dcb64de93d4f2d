// === Dispatch Scheduler ======================================================
//
// Per-tick driver that turns registry state into outbound traffic. For every
// live record whose rate-limit window has elapsed it encodes and sends the
// main, pilot, and home events, fans the record out to the sinks, and counts
// the attempt as sent whatever the outcome. After the pass, records past the
// inactivity timeout are reported to the sinks and removed.
//
// Encoding and delivery operate on a copy of the record so collaborators never
// observe the registry mid-update.
//
// Sensor host status reports bypass the registry and the rate limit: each one
// is encoded, sent and fanned out as soon as it arrives.

#pragma once

#include <cstddef>
#include <memory>
#include <optional>

#include "drone_relay/cot_encoder.hpp"
#include "drone_relay/drone_registry.hpp"
#include "drone_relay/event_transport.hpp"
#include "drone_relay/logging.hpp"
#include "drone_relay/sink_router.hpp"

namespace drone_relay {

/** @brief Timing knobs for the dispatch loop. */
struct DispatchConfig final {
    Duration rate_limit{Duration{1.0}};          /**< Minimum spacing between sends per record. */
    Duration inactivity_timeout{Duration{60.0}}; /**< Must match the registry's timeout. */
};

/** @brief Counters describing one tick. */
struct TickReport final {
    std::size_t records_considered{};
    std::size_t records_dispatched{};
    std::size_t events_sent{};
    std::size_t encode_failures{};
    std::size_t transport_failures{};
    FanoutReport sinks{};
    std::size_t records_evicted{};
};

/** @brief Rate-limited encoder/dispatcher for the registry's live records. */
class DispatchScheduler final {
  public:
    /**
     * @param registry Store whose records are dispatched and swept.
     * @param router Fan-out to sinks.
     * @param transport Tactical transport; may be null when no transport is configured.
     * @param config Rate limit and inactivity timeout.
     */
    DispatchScheduler(DroneRegistry& registry, SinkRouter& router, EventTransportPtr transport, DispatchConfig config);

    /** @brief Run one dispatch pass and inactivity sweep at @p now. */
    TickReport tick(TimePoint now);
    /** @brief Variant with an explicit wall-clock instant for event timestamps. */
    TickReport tick(TimePoint now, SystemTimePoint wall_now);

    /** @brief Send one sensor host status event and forward it to the sinks. */
    TickReport dispatch_status(const SystemStatus& status, SystemTimePoint wall_now);

    [[nodiscard]] const DispatchConfig& config() const noexcept;

  private:
    /** @brief Encode and deliver everything for one due record. */
    void dispatch_record(const DroneRecord& snapshot, Duration stale_offset, SystemTimePoint wall_now, TickReport& report);
    /** @brief Encode one event variant and hand it to the transport. */
    template <typename EncodeOperation>
    void deliver_event(const char* variant, const std::string& drone_id, EncodeOperation&& encode, TickReport& report);

    DroneRegistry& registry_;
    SinkRouter& router_;
    EventTransportPtr transport_;
    DispatchConfig config_;
    CotEncoder encoder_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_relay
