/**
 * @file connection_error.h
 * @brief Failures of the voice handshake and of connection-scoped workers.
 */
#ifndef VOICELINK_CONNECTION_ERROR_H
#define VOICELINK_CONNECTION_ERROR_H

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

namespace voicelink {
namespace voice {

enum class ConnectionErrorKind {
    HANDSHAKE_EXPECTED_FRAME,   ///< The gateway sent something other than the next handshake step.
    HANDSHAKE_TIMEOUT,
    CRYPTO_MODE_UNAVAILABLE,    ///< Ready did not offer the configured mode.
    CRYPTO_MODE_INVALID,        ///< SessionDescription named a different mode than selected.
    CRYPTO_KEY_INVALID,
    ILLEGAL_DISCOVERY_RESPONSE,
    ILLEGAL_IP,
    ENDPOINT_URL,
    UDP_SOCKET,
    WEBSOCKET,                  ///< The websocket failed or closed; `close_code` may be set.
    CHANNEL_CLOSED,             ///< A worker channel closed mid-connection.
};

/** @brief Short name of an error kind, for logs. */
inline const char* connection_error_kind_name(ConnectionErrorKind kind) {
    switch (kind) {
        case ConnectionErrorKind::HANDSHAKE_EXPECTED_FRAME: return "HandshakeExpectedFrame";
        case ConnectionErrorKind::HANDSHAKE_TIMEOUT: return "HandshakeTimeout";
        case ConnectionErrorKind::CRYPTO_MODE_UNAVAILABLE: return "CryptoModeUnavailable";
        case ConnectionErrorKind::CRYPTO_MODE_INVALID: return "CryptoModeInvalid";
        case ConnectionErrorKind::CRYPTO_KEY_INVALID: return "CryptoKeyInvalid";
        case ConnectionErrorKind::ILLEGAL_DISCOVERY_RESPONSE: return "IllegalDiscoveryResponse";
        case ConnectionErrorKind::ILLEGAL_IP: return "IllegalIp";
        case ConnectionErrorKind::ENDPOINT_URL: return "EndpointUrl";
        case ConnectionErrorKind::UDP_SOCKET: return "UdpSocket";
        case ConnectionErrorKind::WEBSOCKET: return "WebSocket";
        case ConnectionErrorKind::CHANNEL_CLOSED: return "ChannelClosed";
    }
    return "Unknown";
}

/**
 * @class ConnectionError
 * @brief Thrown by the handshake and resume paths.
 */
class ConnectionError : public std::runtime_error {
public:
    ConnectionError(ConnectionErrorKind kind, const std::string& what,
                    std::optional<uint16_t> close_code = std::nullopt)
        : std::runtime_error(std::string(connection_error_kind_name(kind)) + ": " + what),
          kind_(kind),
          close_code_(close_code) {}

    ConnectionErrorKind kind() const { return kind_; }
    std::optional<uint16_t> close_code() const { return close_code_; }

private:
    ConnectionErrorKind kind_;
    std::optional<uint16_t> close_code_;
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_CONNECTION_ERROR_H
