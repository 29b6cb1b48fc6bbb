#ifndef VOICELINK_IP_DISCOVERY_H
#define VOICELINK_IP_DISCOVERY_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>

namespace voicelink {
namespace voice {

constexpr std::size_t IP_DISCOVERY_PACKET_SIZE = 74;
constexpr std::size_t IP_DISCOVERY_ADDRESS_SIZE = 64;
constexpr uint16_t IP_DISCOVERY_REQUEST = 1;
constexpr uint16_t IP_DISCOVERY_RESPONSE = 2;

/** @brief Result of parsing an IP discovery response. */
enum class IpDiscoveryStatus {
    OK,
    ILLEGAL_RESPONSE, ///< Wrong size, type or length field, or no NUL in the address.
    ILLEGAL_IP        ///< The address is not an IPv4 or IPv6 literal.
};

struct DiscoveredAddress {
    std::string address;
    uint16_t port = 0;
};

/**
 * @brief Builds the 74-byte request: type 1, length 70, SSRC, zeroed address and port.
 */
std::array<uint8_t, IP_DISCOVERY_PACKET_SIZE> build_ip_discovery_request(uint32_t ssrc);

/**
 * @brief Parses the server's reply carrying our externally visible address.
 */
IpDiscoveryStatus parse_ip_discovery_response(const uint8_t* data, std::size_t len, DiscoveredAddress& out);

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_IP_DISCOVERY_H
