// === Sink ====================================================================
//
// Interface for downstream consumers of drone state (message brokers, entity
// graphs, files). A sink implements any subset of the operations and declares
// which through capabilities(); SinkRouter reads the declaration once, at
// registration, and never calls an operation the sink did not declare.

#pragma once

#include <memory>
#include <string>

#include "drone_relay/drone_record.hpp"
#include "drone_relay/system_status.hpp"

namespace drone_relay {

/** @brief Operations a sink has opted into. */
struct SinkCapabilities final {
    bool publish_drone{};
    bool publish_pilot{};
    bool publish_home{};
    bool mark_inactive{};
    bool close{};
    bool publish_system{};  /**< Sensor host status reports. */
};

/** @brief Downstream consumer of drone state; every operation may throw. */
class Sink {
  public:
    virtual ~Sink() = default;

    [[nodiscard]] virtual SinkCapabilities capabilities() const = 0;

    virtual void publish_drone(const DroneRecord& record);
    virtual void publish_pilot(const std::string& drone_id, double lat, double lon, double alt);
    virtual void publish_home(const std::string& drone_id, double lat, double lon, double alt);
    virtual void mark_inactive(const std::string& drone_id);
    virtual void close();
    virtual void publish_system(const SystemStatus& status);
};

using SinkPtr = std::shared_ptr<Sink>;

}  // namespace drone_relay
