/**
 * @file connection.h
 * @brief One live voice session: handshake, resume and the workers bound to it.
 */
#ifndef VOICELINK_CONNECTION_H
#define VOICELINK_CONNECTION_H

#include "connection_error.h"
#include "gateway_runner.h"
#include "../net/udp_socket.h"
#include "../receivers/udp_receiver.h"
#include "../senders/udp_sender.h"
#include "../voice_types.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <string>

namespace voicelink {
namespace voice {

/**
 * @brief Builds the gateway URL for a voice endpoint.
 * @details A trailing `:80` is stripped, since Discord hands out that port although the
 *          socket is TLS. Produces `wss://<endpoint>/?v=4`.
 * @throws ConnectionError `ENDPOINT_URL` if the endpoint is empty or not a host[:port].
 */
std::string generate_url(const std::string& endpoint);

/**
 * @class Connection
 * @brief Owns the UDP socket, the session cipher and the gateway, receive and send workers.
 * @details Created by `connect()`, which runs the full handshake and hands the mixer its
 *          packet channel. Destroying the connection stops its workers and closes the
 *          socket; the mixer must be told `DROP_CONN` separately.
 */
class Connection {
    // Only `connect` can name this, so only it can construct.
    struct HandshakeKey {
        explicit HandshakeKey() = default;
    };

public:
    /**
     * @brief Runs the voice handshake and starts the connection's workers.
     * @param info Session parameters from the main gateway.
     * @param interconnect Channels to the core, event scheduler and mixer.
     * @param config Driver settings; `crypto_mode` is the mode requested from the server.
     * @param socket_factory Opens the gateway websocket.
     * @param connection_id Identifies this connection in closure reports.
     * @throws ConnectionError on any handshake failure.
     */
    static std::unique_ptr<Connection> connect(const ConnectionInfo& info,
                                               const Interconnect& interconnect,
                                               const DriverConfig& config,
                                               const GatewaySocketFactory& socket_factory,
                                               uint64_t connection_id);

    Connection(ConnectionInfo info, const DriverConfig& config, uint64_t id, HandshakeKey);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    /**
     * @brief Reopens the gateway and resumes the session, keeping UDP state and cipher.
     * @throws ConnectionError if the resume handshake fails.
     */
    void resume(const GatewaySocketFactory& socket_factory);

    void replace_interconnect(const Interconnect& interconnect);
    void set_config(const DriverConfig& config);

    const ConnectionInfo& info() const { return info_; }
    uint32_t ssrc() const { return ssrc_; }
    CryptoMode crypto_mode() const { return crypto_mode_; }
    uint64_t id() const { return id_; }

private:
    ConnectionInfo info_;
    DriverConfig config_;
    uint64_t id_;
    uint32_t ssrc_ = 0;
    CryptoMode crypto_mode_ = CryptoMode::NORMAL;
    std::shared_ptr<const VoiceCipher> cipher_;
    std::shared_ptr<VoiceUdpSocket> udp_;
    std::shared_ptr<WsQueue> ws_rx_;
    std::shared_ptr<UdpRxQueue> udp_rx_;
    std::shared_ptr<UdpTxQueue> udp_tx_;
    std::unique_ptr<GatewayRunner> runner_;
    std::unique_ptr<UdpReceiver> receiver_;
    std::unique_ptr<UdpSender> sender_;
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_CONNECTION_H
