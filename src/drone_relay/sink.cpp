#include "drone_relay/sink.hpp"

namespace drone_relay {

// Defaults for operations a sink does not declare; the router never reaches them.

void Sink::publish_drone(const DroneRecord&) {}

void Sink::publish_pilot(const std::string&, double, double, double) {}

void Sink::publish_home(const std::string&, double, double, double) {}

void Sink::mark_inactive(const std::string&) {}

void Sink::close() {}

void Sink::publish_system(const SystemStatus&) {}

}  // namespace drone_relay
