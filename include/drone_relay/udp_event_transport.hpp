// === UDP Event Transport =====================================================
//
// Sends each tactical event as a single datagram to an IPv4 unicast or
// multicast destination.

#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include <netinet/in.h>

#include "drone_relay/event_transport.hpp"
#include "drone_relay/logging.hpp"

namespace drone_relay {

/** @brief Host/port pair parsed from an `ipv4:port` string. */
struct UdpEndpoint final {
    std::string host{};
    std::uint16_t port{};
};

/** @brief Split @p address on its last colon; throws std::runtime_error when malformed. */
UdpEndpoint parse_udp_endpoint(const std::string& address);

/** @brief Datagram transport owning one UDP socket. */
class UdpEventTransport final : public EventTransport {
  public:
    /**
     * @param destination `ipv4:port` destination; multicast groups are detected.
     * @param multicast_ttl Hop limit applied when the destination is multicast.
     */
    UdpEventTransport(const std::string& destination, std::uint8_t multicast_ttl);
    ~UdpEventTransport() override;

    UdpEventTransport(const UdpEventTransport&) = delete;
    UdpEventTransport& operator=(const UdpEventTransport&) = delete;

    void send_event(const CotPayload& payload) override;

    [[nodiscard]] const UdpEndpoint& endpoint() const noexcept { return endpoint_; }

  private:
    int socket_fd_{-1};
    UdpEndpoint endpoint_{};
    sockaddr_in destination_{};
    std::shared_ptr<spdlog::logger> logger_;
};

}  // namespace drone_relay
