#include "drone_relay/udp_event_transport.hpp"

#include <arpa/inet.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cerrno>
#include <cstring>
#include <stdexcept>

namespace drone_relay {

UdpEndpoint parse_udp_endpoint(const std::string& address) {
    const auto colon_pos = address.find_last_of(':');
    if (colon_pos == std::string::npos || colon_pos == 0) {
        throw std::runtime_error("Invalid event destination '" + address + "'; expected 'IPv4:port'");
    }

    UdpEndpoint endpoint{};
    endpoint.host = address.substr(0, colon_pos);
    const std::string port_text = address.substr(colon_pos + 1);
    int port_value = 0;
    try {
        port_value = std::stoi(port_text);
    } catch (const std::invalid_argument&) {
        throw std::runtime_error("Invalid port number: " + port_text);
    } catch (const std::out_of_range&) {
        throw std::runtime_error("Port number out of range: " + port_text);
    }
    if (port_value <= 0 || port_value > 65535) {
        throw std::runtime_error("Port number out of range (1-65535): " + port_text);
    }
    endpoint.port = static_cast<std::uint16_t>(port_value);
    return endpoint;
}

UdpEventTransport::UdpEventTransport(const std::string& destination, std::uint8_t multicast_ttl)
    : endpoint_(parse_udp_endpoint(destination)), logger_(get_logger()) {
    destination_.sin_family = AF_INET;
    destination_.sin_port = htons(endpoint_.port);
    if (inet_pton(AF_INET, endpoint_.host.c_str(), &destination_.sin_addr) <= 0) {
        throw std::runtime_error("Invalid IPv4 address: " + endpoint_.host);
    }

    socket_fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
    if (socket_fd_ < 0) {
        throw std::runtime_error("Failed to create UDP socket: " + std::string(std::strerror(errno)));
    }

    if (IN_MULTICAST(ntohl(destination_.sin_addr.s_addr))) {
        const unsigned char ttl = multicast_ttl;
        if (::setsockopt(socket_fd_, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) {
            const std::string reason = std::strerror(errno);
            ::close(socket_fd_);
            socket_fd_ = -1;
            throw std::runtime_error("setsockopt IP_MULTICAST_TTL failed: " + reason);
        }
    }

    logger_->info("UDP event transport ready destination={}:{} ttl={}",
                  endpoint_.host,
                  endpoint_.port,
                  static_cast<int>(multicast_ttl));
}

UdpEventTransport::~UdpEventTransport() {
    if (socket_fd_ >= 0) {
        ::close(socket_fd_);
    }
}

void UdpEventTransport::send_event(const CotPayload& payload) {
    const ssize_t sent = ::sendto(socket_fd_,
                                  payload.data(),
                                  payload.size(),
                                  0,
                                  reinterpret_cast<const sockaddr*>(&destination_),
                                  sizeof(destination_));
    if (sent < 0) {
        throw std::runtime_error("sendto " + endpoint_.host + ":" + std::to_string(endpoint_.port) +
                                 " failed: " + std::strerror(errno));
    }
    if (static_cast<std::size_t>(sent) != payload.size()) {
        throw std::runtime_error("Short datagram write: " + std::to_string(sent) + " of " +
                                 std::to_string(payload.size()) + " bytes");
    }
}

}  // namespace drone_relay
