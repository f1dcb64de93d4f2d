#pragma once

#include <memory>

#include "drone_relay/types.hpp"

namespace drone_relay {

/**
 * @brief Outbound tactical-event transport (TCP/UDP/TLS/multicast delivery).
 *
 * Implementations may block and may throw; the dispatch loop records the
 * failure and never retries.
 */
class EventTransport {
  public:
    virtual ~EventTransport() = default;

    /** @brief Hand one serialized event to the transport. */
    virtual void send_event(const CotPayload& payload) = 0;
};

using EventTransportPtr = std::shared_ptr<EventTransport>;

}  // namespace drone_relay
