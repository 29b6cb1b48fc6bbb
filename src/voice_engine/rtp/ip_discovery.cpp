#include "ip_discovery.h"

#include <cstring>

#ifdef _WIN32
#include <winsock2.h>
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#endif

namespace voicelink {
namespace voice {

namespace {
constexpr uint16_t kDiscoveryLengthField = 70;

bool is_ip_literal(const std::string& text) {
    unsigned char scratch[16];
    return inet_pton(AF_INET, text.c_str(), scratch) == 1 ||
           inet_pton(AF_INET6, text.c_str(), scratch) == 1;
}
} // namespace

std::array<uint8_t, IP_DISCOVERY_PACKET_SIZE> build_ip_discovery_request(uint32_t ssrc) {
    std::array<uint8_t, IP_DISCOVERY_PACKET_SIZE> packet{};

    uint16_t type_net = htons(IP_DISCOVERY_REQUEST);
    std::memcpy(&packet[0], &type_net, 2);

    uint16_t length_net = htons(kDiscoveryLengthField);
    std::memcpy(&packet[2], &length_net, 2);

    uint32_t ssrc_net = htonl(ssrc);
    std::memcpy(&packet[4], &ssrc_net, 4);
    return packet;
}

IpDiscoveryStatus parse_ip_discovery_response(const uint8_t* data, std::size_t len, DiscoveredAddress& out) {
    if (len < IP_DISCOVERY_PACKET_SIZE) {
        return IpDiscoveryStatus::ILLEGAL_RESPONSE;
    }

    uint16_t type_net = 0;
    std::memcpy(&type_net, data, 2);
    if (ntohs(type_net) != IP_DISCOVERY_RESPONSE) {
        return IpDiscoveryStatus::ILLEGAL_RESPONSE;
    }

    const uint8_t* address_raw = data + 8;
    const void* nul = std::memchr(address_raw, 0, IP_DISCOVERY_ADDRESS_SIZE);
    if (nul == nullptr) {
        return IpDiscoveryStatus::ILLEGAL_RESPONSE;
    }
    const std::size_t address_len = static_cast<const uint8_t*>(nul) - address_raw;

    std::string address(reinterpret_cast<const char*>(address_raw), address_len);
    if (!is_ip_literal(address)) {
        return IpDiscoveryStatus::ILLEGAL_IP;
    }

    uint16_t port_net = 0;
    std::memcpy(&port_net, data + 8 + IP_DISCOVERY_ADDRESS_SIZE, 2);

    out.address = std::move(address);
    out.port = ntohs(port_net);
    return IpDiscoveryStatus::OK;
}

} // namespace voice
} // namespace voicelink
