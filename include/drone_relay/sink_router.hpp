// === Sink Router =============================================================
//
// Fans drone state out to every registered sink. Each sink call runs through
// guard_call, so one sink failing (or throwing on every call) never prevents
// delivery to the others or to the tactical transport.

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "drone_relay/delivery_result.hpp"
#include "drone_relay/drone_record.hpp"
#include "drone_relay/logging.hpp"
#include "drone_relay/sink.hpp"

namespace drone_relay {

/** @brief Ordered, failure-isolated fan-out to pluggable sinks. */
class SinkRouter final {
  public:
    SinkRouter();

    /** @brief Register @p sink under @p name; capabilities are captured now. */
    void add_sink(std::string name, SinkPtr sink);

    /**
     * @brief Publish the drone, and its pilot/home positions when they are
     *        not the (0,0) sentinel, to every capable sink.
     */
    FanoutReport publish(const DroneRecord& record);
    /** @brief Tell every capable sink that @p drone_id went away. */
    FanoutReport on_evict(const std::string& drone_id);
    /** @brief Forward a sensor host status report to every capable sink. */
    FanoutReport publish_system(const SystemStatus& status);
    /** @brief Best-effort close of every capable sink. */
    FanoutReport close_all();

    [[nodiscard]] std::size_t sink_count() const noexcept;

  private:
    struct RegisteredSink final {
        std::string name{};
        SinkPtr sink{};
        SinkCapabilities capabilities{};
    };

    void record_outcome(FanoutReport& report,
                        const DeliveryResult& result,
                        const RegisteredSink& entry,
                        const char* operation,
                        const std::string& drone_id);

    std::vector<RegisteredSink> list_sinks_;
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_relay
