#include "connection.h"
#include "../rtp/ip_discovery.h"
#include "../utils/cpp_logger.h"

#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <utility>

namespace voicelink {
namespace voice {

namespace {

using Clock = std::chrono::steady_clock;

GatewayEvent next_handshake_event(IGatewaySocket& socket, Clock::time_point deadline, const char* awaiting) {
    while (true) {
        const auto now = Clock::now();
        if (now >= deadline) {
            throw ConnectionError(ConnectionErrorKind::HANDSHAKE_TIMEOUT, std::string("timed out awaiting ") + awaiting);
        }
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now) +
                               std::chrono::milliseconds(1);

        GatewayEvent event;
        GatewayFrame frame;
        switch (read_gateway_event(socket, remaining, event, frame)) {
            case GatewayReadResult::EVENT:
                return event;
            case GatewayReadResult::IGNORED:
            case GatewayReadResult::TIMEOUT:
                break;
            case GatewayReadResult::CLOSED:
                throw ConnectionError(ConnectionErrorKind::WEBSOCKET,
                                      frame.reason.empty() ? std::string("closed while awaiting ") + awaiting
                                                           : frame.reason,
                                      frame.close_code);
        }
    }
}

std::unique_ptr<IGatewaySocket> open_gateway(const GatewaySocketFactory& factory,
                                             const std::string& url,
                                             std::chrono::milliseconds timeout) {
    std::unique_ptr<IGatewaySocket> socket = factory ? factory(url, timeout) : nullptr;
    if (!socket) {
        throw ConnectionError(ConnectionErrorKind::WEBSOCKET, "could not open " + url);
    }
    return socket;
}

void send_or_throw(IGatewaySocket& socket, const GatewayEvent& event) {
    if (!send_gateway_event(socket, event)) {
        throw ConnectionError(ConnectionErrorKind::WEBSOCKET,
                              std::string("failed to send ") + opcode_name(event.op));
    }
}

} // namespace

std::string generate_url(const std::string& endpoint) {
    std::string host = endpoint;
    const std::string default_port = ":80";
    if (host.size() >= default_port.size() &&
        host.compare(host.size() - default_port.size(), default_port.size(), default_port) == 0) {
        host.erase(host.size() - default_port.size());
    }

    const bool valid_chars = std::all_of(host.begin(), host.end(), [](unsigned char c) {
        return std::isalnum(c) || c == '.' || c == '-' || c == ':' || c == '_';
    });
    if (host.empty() || !valid_chars || host.front() == ':' || host.front() == '.') {
        throw ConnectionError(ConnectionErrorKind::ENDPOINT_URL, "invalid voice endpoint '" + endpoint + "'");
    }
    return "wss://" + host + "/?v=" + std::to_string(VOICE_GATEWAY_VERSION);
}

Connection::Connection(ConnectionInfo info, const DriverConfig& config, uint64_t id, HandshakeKey)
    : info_(std::move(info)), config_(config), id_(id), crypto_mode_(config.crypto_mode) {}

std::unique_ptr<Connection> Connection::connect(const ConnectionInfo& info,
                                                const Interconnect& interconnect,
                                                const DriverConfig& config,
                                                const GatewaySocketFactory& socket_factory,
                                                uint64_t connection_id) {
    auto conn = std::make_unique<Connection>(info, config, connection_id, HandshakeKey{});
    const auto deadline = Clock::now() + config.handshake_timeout;
    const std::string url = generate_url(info.endpoint);
    const std::string mode_name = crypto_mode_name(config.crypto_mode);

    LOG_VL_INFO("[Connection:%llu] Connecting to %s", static_cast<unsigned long long>(connection_id), url.c_str());
    std::unique_ptr<IGatewaySocket> socket = open_gateway(socket_factory, url, config.handshake_timeout);

    Identify identify;
    identify.server_id = info.guild_id;
    identify.user_id = info.user_id;
    identify.session_id = info.session_id;
    identify.token = info.token;
    send_or_throw(*socket, GatewayEvent::make(identify));

    std::optional<Ready> ready;
    std::optional<Hello> hello;
    while (!ready || !hello) {
        GatewayEvent event = next_handshake_event(*socket, deadline, "Ready/Hello");
        if (event.op == VoiceOpcode::READY) {
            ready = event.ready;
        } else if (event.op == VoiceOpcode::HELLO) {
            hello = event.hello;
        } else {
            LOG_VL_DEBUG("[Connection] Expected Ready/Hello; got %s", opcode_name(event.op));
            throw ConnectionError(ConnectionErrorKind::HANDSHAKE_EXPECTED_FRAME,
                                  std::string("expected Ready/Hello, got ") + opcode_name(event.op));
        }
    }

    if (std::find(ready->modes.begin(), ready->modes.end(), mode_name) == ready->modes.end()) {
        throw ConnectionError(ConnectionErrorKind::CRYPTO_MODE_UNAVAILABLE, "server does not offer " + mode_name);
    }
    conn->ssrc_ = ready->ssrc;

    conn->udp_ = std::make_shared<VoiceUdpSocket>();
    if (!conn->udp_->open(ready->ip, ready->port)) {
        throw ConnectionError(ConnectionErrorKind::UDP_SOCKET,
                              "could not open UDP socket to " + ready->ip + ":" + std::to_string(ready->port));
    }

    const auto request = build_ip_discovery_request(ready->ssrc);
    if (!conn->udp_->send(request.data(), request.size())) {
        throw ConnectionError(ConnectionErrorKind::UDP_SOCKET, "IP discovery request could not be sent");
    }
    std::array<uint8_t, VOICE_PACKET_MAX> response{};
    std::size_t response_len = 0;
    const auto wait = std::max(std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now()),
                               std::chrono::milliseconds(1));
    switch (conn->udp_->receive(response.data(), response.size(), response_len, wait)) {
        case VoiceUdpSocket::RecvStatus::DATA:
            break;
        case VoiceUdpSocket::RecvStatus::TIMEOUT:
            throw ConnectionError(ConnectionErrorKind::HANDSHAKE_TIMEOUT, "no IP discovery response");
        case VoiceUdpSocket::RecvStatus::FAILED:
            throw ConnectionError(ConnectionErrorKind::UDP_SOCKET, "IP discovery receive failed");
    }

    DiscoveredAddress discovered;
    switch (parse_ip_discovery_response(response.data(), response_len, discovered)) {
        case IpDiscoveryStatus::OK:
            break;
        case IpDiscoveryStatus::ILLEGAL_RESPONSE:
            throw ConnectionError(ConnectionErrorKind::ILLEGAL_DISCOVERY_RESPONSE, "malformed IP discovery response");
        case IpDiscoveryStatus::ILLEGAL_IP:
            throw ConnectionError(ConnectionErrorKind::ILLEGAL_IP, "IP discovery returned an invalid address");
    }
    LOG_VL_INFO("[Connection:%llu] External address %s:%u", static_cast<unsigned long long>(connection_id),
                discovered.address.c_str(), static_cast<unsigned>(discovered.port));

    SelectProtocol select;
    select.data.address = discovered.address;
    select.data.port = discovered.port;
    select.data.mode = mode_name;
    send_or_throw(*socket, GatewayEvent::make(select));

    SessionDescription description;
    while (true) {
        GatewayEvent event = next_handshake_event(*socket, deadline, "SessionDescription");
        if (event.op == VoiceOpcode::SESSION_DESCRIPTION) {
            description = event.session_description;
            break;
        }
        LOG_VL_DEBUG("[Connection] Expected SessionDescription; got %s", opcode_name(event.op));
    }

    if (description.mode != mode_name) {
        throw ConnectionError(ConnectionErrorKind::CRYPTO_MODE_INVALID,
                              "server selected " + description.mode + " instead of " + mode_name);
    }
    try {
        conn->cipher_ = std::make_shared<const VoiceCipher>(description.secret_key);
    } catch (const std::runtime_error& e) {
        throw ConnectionError(ConnectionErrorKind::CRYPTO_KEY_INVALID, e.what());
    }

    conn->ws_rx_ = std::make_shared<WsQueue>();
    conn->udp_rx_ = std::make_shared<UdpRxQueue>();
    conn->udp_tx_ = std::make_shared<UdpTxQueue>();

    MixerMessage ws_msg;
    ws_msg.type = MixerMessage::Type::WS;
    ws_msg.ws = conn->ws_rx_;
    MixerMessage conn_msg;
    conn_msg.type = MixerMessage::Type::SET_CONN;
    conn_msg.connection.cipher = conn->cipher_;
    conn_msg.connection.crypto_mode = conn->crypto_mode_;
    conn_msg.connection.ssrc = conn->ssrc_;
    conn_msg.connection.udp_tx = conn->udp_tx_;
    if (!interconnect.mixer || !interconnect.mixer->push(std::move(ws_msg)) ||
        !interconnect.mixer->push(std::move(conn_msg))) {
        throw ConnectionError(ConnectionErrorKind::CHANNEL_CLOSED, "mixer channel closed");
    }

    conn->runner_ = std::make_unique<GatewayRunner>(std::move(socket), hello->heartbeat_interval, conn->ssrc_,
                                                    connection_id, interconnect, conn->ws_rx_);
    conn->receiver_ = std::make_unique<UdpReceiver>(conn->udp_, conn->cipher_, conn->crypto_mode_, config,
                                                    interconnect, conn->udp_rx_);
    conn->sender_ = std::make_unique<UdpSender>(conn->udp_, conn->ssrc_, config.udp_keepalive_gap, conn->udp_tx_);
    conn->runner_->start();
    conn->receiver_->start();
    conn->sender_->start();

    LOG_VL_INFO("[Connection:%llu] Connected with SSRC %u using %s",
                static_cast<unsigned long long>(connection_id), conn->ssrc_, mode_name.c_str());
    return conn;
}

Connection::~Connection() {
    if (runner_) {
        runner_->stop();
    }
    if (sender_) {
        sender_->stop();
    }
    if (receiver_) {
        receiver_->stop();
    }
    if (udp_) {
        udp_->close();
    }
    LOG_VL_DEBUG("[Connection:%llu] Torn down", static_cast<unsigned long long>(id_));
}

void Connection::resume(const GatewaySocketFactory& socket_factory) {
    const auto deadline = Clock::now() + config_.handshake_timeout;
    const std::string url = generate_url(info_.endpoint);
    LOG_VL_INFO("[Connection:%llu] Resuming via %s", static_cast<unsigned long long>(id_), url.c_str());
    std::unique_ptr<IGatewaySocket> socket = open_gateway(socket_factory, url, config_.handshake_timeout);

    Resume resume_payload;
    resume_payload.server_id = info_.guild_id;
    resume_payload.session_id = info_.session_id;
    resume_payload.token = info_.token;
    send_or_throw(*socket, GatewayEvent::make(resume_payload));

    bool resumed = false;
    std::optional<Hello> hello;
    while (!resumed || !hello) {
        GatewayEvent event = next_handshake_event(*socket, deadline, "Resumed/Hello");
        if (event.op == VoiceOpcode::RESUMED) {
            resumed = true;
        } else if (event.op == VoiceOpcode::HELLO) {
            hello = event.hello;
        } else {
            throw ConnectionError(ConnectionErrorKind::HANDSHAKE_EXPECTED_FRAME,
                                  std::string("expected Resumed/Hello, got ") + opcode_name(event.op));
        }
    }

    WsMessage keepalive;
    keepalive.type = WsMessage::Type::SET_KEEPALIVE;
    keepalive.heartbeat_interval_ms = hello->heartbeat_interval;
    WsMessage msg;
    msg.type = WsMessage::Type::REPLACE_SOCKET;
    msg.socket = std::move(socket);
    if (!ws_rx_ || !ws_rx_->push(std::move(keepalive)) || !ws_rx_->push(std::move(msg))) {
        throw ConnectionError(ConnectionErrorKind::CHANNEL_CLOSED, "websocket worker channel closed");
    }
    LOG_VL_INFO("[Connection:%llu] Resumed", static_cast<unsigned long long>(id_));
}

void Connection::replace_interconnect(const Interconnect& interconnect) {
    WsMessage ws_msg;
    ws_msg.type = WsMessage::Type::REPLACE_INTERCONNECT;
    ws_msg.interconnect = interconnect;
    UdpRxMessage rx_msg;
    rx_msg.type = UdpRxMessage::Type::REPLACE_INTERCONNECT;
    rx_msg.interconnect = interconnect;
    if (!ws_rx_->push(std::move(ws_msg)) || !udp_rx_->push(std::move(rx_msg))) {
        LOG_VL_WARNING("[Connection:%llu] Worker channel closed while replacing interconnect",
                       static_cast<unsigned long long>(id_));
    }
}

void Connection::set_config(const DriverConfig& config) {
    config_ = config;
    UdpRxMessage msg;
    msg.type = UdpRxMessage::Type::SET_CONFIG;
    msg.config = config;
    if (!udp_rx_->push(std::move(msg))) {
        LOG_VL_WARNING("[Connection:%llu] Receive worker closed, config not applied",
                       static_cast<unsigned long long>(id_));
    }
}

} // namespace voice
} // namespace voicelink
