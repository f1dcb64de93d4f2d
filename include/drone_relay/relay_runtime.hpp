// === Relay Runtime ===========================================================
//
// Coordinates start-up, the control loop, and shutdown for the relay. Wires
// configuration, the registry, ingest pipeline, dispatch scheduler, sink
// router, and the asynchronous delivery decorators together. Sensor host
// status reports arrive on the same input and are sent as soon as they are read.

#pragma once

#include <atomic>
#include <memory>
#include <string>
#include <thread>

#include "drone_relay/affiliation.hpp"
#include "drone_relay/async_delivery.hpp"
#include "drone_relay/configuration.hpp"
#include "drone_relay/dispatch_scheduler.hpp"
#include "drone_relay/drone_registry.hpp"
#include "drone_relay/fd_line_source.hpp"
#include "drone_relay/logging.hpp"
#include "drone_relay/sink_router.hpp"
#include "drone_relay/system_status.hpp"
#include "drone_relay/telemetry_pipeline.hpp"

namespace drone_relay {

/** @brief High-level owner of the relay's control thread. */
class RelayRuntime final {
  public:
    /**
     * @param configuration Hydrated settings.
     * @param input_fd Descriptor carrying newline-delimited telemetry messages.
     */
    RelayRuntime(Configuration configuration, int input_fd);
    ~RelayRuntime();

    RelayRuntime(const RelayRuntime&) = delete;
    RelayRuntime& operator=(const RelayRuntime&) = delete;

    /** @brief Register an extra sink; it is wrapped in its own delivery worker. Call before run(). */
    void add_sink(const std::string& name, SinkPtr sink);
    /** @brief Attach the configured outputs (state stream). */
    void initialize();
    /** @brief Start the control thread. */
    void run();
    /** @brief Stop the control thread, close sinks, and drain in-flight sends. */
    void shutdown();

    /** @brief True once the input reached end-of-file. */
    [[nodiscard]] bool input_exhausted() const noexcept;

    [[nodiscard]] const DroneRegistry& registry() const noexcept { return registry_; }
    [[nodiscard]] const AffiliationTable& affiliations() const noexcept { return *affiliations_; }

  private:
    /** @brief Alternates between reading input and ticking the scheduler. */
    void control_loop();
    /** @brief Route one input line to the status path or the telemetry pipeline. */
    void handle_line(const std::string& line);

    Configuration configuration_;
    std::shared_ptr<AffiliationTable> affiliations_;
    DroneRegistry registry_;
    SinkRouter router_;
    std::shared_ptr<AsyncEventTransport> transport_;
    DispatchScheduler scheduler_;
    TelemetryPipeline pipeline_;
    FdLineSource line_source_;
    SystemStatusParser status_parser_;
    std::atomic<bool> flag_running_{false};
    std::atomic<bool> flag_input_exhausted_{false};
    std::thread control_thread_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_relay
