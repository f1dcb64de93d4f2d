// === Async Delivery ==========================================================
//
// Decorators that move a sink's or transport's calls onto a dedicated
// DeliveryWorker. Arguments are copied into the queued task, so the worker
// only ever sees snapshots and the registry stays owned by the control thread.

#pragma once

#include <memory>
#include <string>

#include "drone_relay/delivery_worker.hpp"
#include "drone_relay/event_transport.hpp"
#include "drone_relay/sink.hpp"

namespace drone_relay {

/** @brief Sink decorator that executes every call on its own worker. */
class AsyncSink final : public Sink {
  public:
    AsyncSink(std::string name, SinkPtr inner, DeliveryWorkerConfig config);

    [[nodiscard]] SinkCapabilities capabilities() const override;

    void publish_drone(const DroneRecord& record) override;
    void publish_pilot(const std::string& drone_id, double lat, double lon, double alt) override;
    void publish_home(const std::string& drone_id, double lat, double lon, double alt) override;
    void mark_inactive(const std::string& drone_id) override;
    void publish_system(const SystemStatus& status) override;
    /** @brief Queue the inner close, then drain and stop the worker. */
    void close() override;

    [[nodiscard]] const DeliveryWorker& worker() const noexcept;

  private:
    void enqueue(DeliveryWorker::Task task);

    SinkPtr inner_;
    SinkCapabilities capabilities_;
    DeliveryWorker worker_;
};

/** @brief Transport decorator that sends on its own worker. */
class AsyncEventTransport final : public EventTransport {
  public:
    AsyncEventTransport(std::string name, EventTransportPtr inner, DeliveryWorkerConfig config);

    void send_event(const CotPayload& payload) override;
    /** @brief Best-effort flush of in-flight sends before exit. */
    bool flush(Duration timeout);
    /** @brief Flush with the configured deadline and stop the worker. */
    void shutdown();

    [[nodiscard]] const DeliveryWorker& worker() const noexcept;

  private:
    EventTransportPtr inner_;
    DeliveryWorker worker_;
};

}  // namespace drone_relay
