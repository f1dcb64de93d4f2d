#include "drone_relay/async_delivery.hpp"

#include <stdexcept>
#include <utility>

namespace drone_relay {

namespace {

SinkPtr require_sink(SinkPtr sink) {
    if (sink == nullptr) {
        throw std::invalid_argument("AsyncSink requires an inner sink");
    }
    return sink;
}

EventTransportPtr require_transport(EventTransportPtr transport) {
    if (transport == nullptr) {
        throw std::invalid_argument("AsyncEventTransport requires an inner transport");
    }
    return transport;
}

}  // namespace

AsyncSink::AsyncSink(std::string name, SinkPtr inner, DeliveryWorkerConfig config)
    : inner_(require_sink(std::move(inner))),
      capabilities_(inner_->capabilities()),
      worker_(std::move(name), config) {}

SinkCapabilities AsyncSink::capabilities() const {
    // close() always stops the worker, whether or not the inner sink closes.
    SinkCapabilities declared = capabilities_;
    declared.close = true;
    return declared;
}

void AsyncSink::publish_drone(const DroneRecord& record) {
    enqueue([inner = inner_, snapshot = record]() { inner->publish_drone(snapshot); });
}

void AsyncSink::publish_pilot(const std::string& drone_id, double lat, double lon, double alt) {
    enqueue([inner = inner_, drone_id, lat, lon, alt]() { inner->publish_pilot(drone_id, lat, lon, alt); });
}

void AsyncSink::publish_home(const std::string& drone_id, double lat, double lon, double alt) {
    enqueue([inner = inner_, drone_id, lat, lon, alt]() { inner->publish_home(drone_id, lat, lon, alt); });
}

void AsyncSink::mark_inactive(const std::string& drone_id) {
    enqueue([inner = inner_, drone_id]() { inner->mark_inactive(drone_id); });
}

void AsyncSink::publish_system(const SystemStatus& status) {
    enqueue([inner = inner_, status]() { inner->publish_system(status); });
}

void AsyncSink::close() {
    if (capabilities_.close) {
        enqueue([inner = inner_]() { inner->close(); });
    }
    worker_.stop();
}

void AsyncSink::enqueue(DeliveryWorker::Task task) {
    if (!worker_.post(std::move(task))) {
        throw std::runtime_error("Sink worker " + worker_.name() + " has stopped");
    }
}

const DeliveryWorker& AsyncSink::worker() const noexcept {
    return worker_;
}

AsyncEventTransport::AsyncEventTransport(std::string name, EventTransportPtr inner, DeliveryWorkerConfig config)
    : inner_(require_transport(std::move(inner))),
      worker_(std::move(name), config) {}

void AsyncEventTransport::send_event(const CotPayload& payload) {
    if (!worker_.post([inner = inner_, payload]() { inner->send_event(payload); })) {
        throw std::runtime_error("Transport worker " + worker_.name() + " has stopped");
    }
}

bool AsyncEventTransport::flush(Duration timeout) {
    return worker_.drain(timeout);
}

void AsyncEventTransport::shutdown() {
    worker_.stop();
}

const DeliveryWorker& AsyncEventTransport::worker() const noexcept {
    return worker_;
}

}  // namespace drone_relay
