#include "drone_relay/relay_runtime.hpp"

#include <algorithm>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

#include "drone_relay/json_stream_sink.hpp"
#include "drone_relay/udp_event_transport.hpp"

namespace drone_relay {

namespace {

constexpr char k_transport_worker_name[] = "cot-transport";       /**< Worker label for tactical events. */
constexpr char k_state_sink_name[] = "json-state";                /**< Router name of the state stream. */
constexpr std::chrono::milliseconds k_idle_sleep_duration{100};   /**< Sleep step once input is exhausted. */

/**
 * @brief Build the asynchronous tactical-event transport, or null when disabled.
 */
std::shared_ptr<AsyncEventTransport> make_transport(const Configuration& configuration) {
    if (configuration.cot_destination.empty()) {
        get_logger()->warn("Tactical event destination is empty; events will be encoded but not sent");
        return nullptr;
    }
    auto udp_transport = std::make_shared<UdpEventTransport>(configuration.cot_destination, configuration.cot_ttl);
    return std::make_shared<AsyncEventTransport>(k_transport_worker_name, std::move(udp_transport), configuration.delivery);
}

}  // namespace

RelayRuntime::RelayRuntime(Configuration configuration, int input_fd)
    : configuration_(std::move(configuration)),
      affiliations_(std::make_shared<AffiliationTable>(configuration_.affiliations)),
      registry_(configuration_.registry),
      router_(),
      transport_(make_transport(configuration_)),
      scheduler_(registry_, router_, transport_, configuration_.dispatch),
      pipeline_(registry_, affiliations_, configuration_.id_prefix),
      line_source_(input_fd),
      status_parser_(get_logger()),
      logger_(get_logger()) {
    registry_.set_eviction_listener([this](const std::string& drone_id) { router_.on_evict(drone_id); });
}

RelayRuntime::~RelayRuntime() {
    shutdown();
}

void RelayRuntime::add_sink(const std::string& name, SinkPtr sink) {
    if (flag_running_.load()) {
        throw std::logic_error("Sinks must be registered before the relay starts");
    }
    auto async_sink = std::make_shared<AsyncSink>(name, std::move(sink), configuration_.delivery);
    router_.add_sink(name, std::move(async_sink));
}

/**
 * @brief Attach outputs named by the configuration.
 */
void RelayRuntime::initialize() {
    logger_->info("Initializing relay runtime capacity={} affiliations={}",
                  registry_.capacity(),
                  affiliations_->size());
    if (!configuration_.state_output.empty()) {
        add_sink(k_state_sink_name, std::make_shared<JsonStreamSink>(configuration_.state_output));
    }
    if (router_.sink_count() == 0 && transport_ == nullptr) {
        logger_->warn("No sinks and no event destination configured; the relay will only track drones");
    }
}

/**
 * @brief Start the background control thread.
 */
void RelayRuntime::run() {
    if (flag_running_.exchange(true)) {
        return;
    }
    logger_->info("Starting relay control loop poll_interval_s={}", configuration_.poll_interval.count());
    control_thread_ = std::thread(&RelayRuntime::control_loop, this);
}

/**
 * @brief Stop the control thread, then close sinks and drain the transport.
 */
void RelayRuntime::shutdown() {
    if (!flag_running_.exchange(false)) {
        return;
    }
    logger_->info("Shutting down relay runtime");
    if (control_thread_.joinable()) {
        control_thread_.join();
    }

    const FanoutReport close_report = router_.close_all();
    if (close_report.failures > 0) {
        logger_->warn("{} of {} sinks failed to close cleanly", close_report.failures, close_report.calls);
    }

    if (transport_ != nullptr) {
        if (!transport_->flush(configuration_.delivery.shutdown_timeout)) {
            logger_->warn("Tactical events still pending after {}s; dropping", configuration_.delivery.shutdown_timeout.count());
        }
        transport_->shutdown();
    }
    logger_->info("Relay runtime stopped with {} tracked drones", registry_.size());
}

bool RelayRuntime::input_exhausted() const noexcept {
    return flag_input_exhausted_.load();
}

/**
 * @brief Read input until the poll interval elapses, then tick the scheduler.
 */
void RelayRuntime::control_loop() {
    const SteadyClock::duration tick_interval =
        std::chrono::duration_cast<SteadyClock::duration>(configuration_.poll_interval);
    auto next_tick = SteadyClock::now() + tick_interval;
    while (flag_running_.load()) {
        try {
            const TimePoint now = SteadyClock::now();
            if (now < next_tick) {
                const Duration remaining = std::chrono::duration_cast<Duration>(next_tick - now);
                if (line_source_.exhausted()) {
                    if (!flag_input_exhausted_.exchange(true)) {
                        logger_->info("Telemetry input reached end-of-file");
                    }
                    std::this_thread::sleep_for(std::min<SteadyClock::duration>(
                        next_tick - now, std::chrono::duration_cast<SteadyClock::duration>(k_idle_sleep_duration)));
                    continue;
                }
                if (std::optional<std::string> line = line_source_.next_line(remaining); line.has_value()) {
                    handle_line(*line);
                }
                continue;
            }

            const TickReport report = scheduler_.tick(now);
            logger_->debug("Tick considered={} dispatched={} events={} evicted={} sink_failures={}",
                           report.records_considered,
                           report.records_dispatched,
                           report.events_sent,
                           report.records_evicted,
                           report.sinks.failures);
            next_tick = now + tick_interval;
        } catch (const std::exception& exc) {
            logger_->error("Control loop error: {}", exc.what());
            next_tick = SteadyClock::now() + tick_interval;
        }
    }
}

void RelayRuntime::handle_line(const std::string& line) {
    const nlohmann::json message = nlohmann::json::parse(line, nullptr, false);
    if (message.is_discarded()) {
        // The pipeline logs and rejects malformed text.
        pipeline_.ingest_text(line, SteadyClock::now());
        return;
    }
    if (!is_system_status_message(message)) {
        pipeline_.ingest(message, SteadyClock::now());
        return;
    }
    const std::optional<SystemStatus> status = status_parser_.parse(message);
    if (!status.has_value()) {
        return;
    }
    const TickReport report = scheduler_.dispatch_status(*status, SystemClock::now());
    logger_->debug(R"({{"component":"status","serial":"{}","events":{},"sink_failures":{}}})",
                   status->serial_number,
                   report.events_sent,
                   report.sinks.failures);
}

}  // namespace drone_relay
