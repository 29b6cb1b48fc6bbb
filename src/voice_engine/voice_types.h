/**
 * @file voice_types.h
 * @brief Defines the messages exchanged between the workers of a voice driver.
 * @details Every worker owns an inbox (`utils::ThreadSafeQueue`) and reacts to a small
 *          command enum, the same shape for the driver core, the mixer, the gateway
 *          runner and the UDP workers. The `Interconnect` bundles the inboxes that
 *          outlive a single connection.
 */
#ifndef VOICELINK_VOICE_TYPES_H
#define VOICELINK_VOICE_TYPES_H

#include "configuration/driver_config.h"
#include "crypto/crypto_mode.h"
#include "events/event_scheduler.h"
#include "gateway/gateway_payloads.h"
#include "gateway/gateway_socket.h"
#include "tracks/track.h"
#include "utils/thread_safe_queue.h"

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace voicelink {
namespace voice {

/**
 * @struct ConnectionInfo
 * @brief Everything needed to open a voice session.
 * @details Assembled from the main gateway's voice state and voice server updates.
 */
struct ConnectionInfo {
    std::string endpoint;
    GuildId guild_id = 0;
    std::string session_id;
    std::string token;
    UserId user_id = 0;

    bool operator==(const ConnectionInfo& o) const {
        return endpoint == o.endpoint && guild_id == o.guild_id && session_id == o.session_id &&
               token == o.token && user_id == o.user_id;
    }
};

struct CoreMessage;
struct MixerMessage;
struct WsMessage;
struct UdpRxMessage;
struct UdpTxMessage;

using CoreQueue = utils::ThreadSafeQueue<CoreMessage>;
using MixerQueue = utils::ThreadSafeQueue<MixerMessage>;
using WsQueue = utils::ThreadSafeQueue<WsMessage>;
using UdpRxQueue = utils::ThreadSafeQueue<UdpRxMessage>;
using UdpTxQueue = utils::ThreadSafeQueue<UdpTxMessage>;

/**
 * @struct Interconnect
 * @brief Channels to the long-lived workers: driver core, event scheduler and mixer.
 * @details Copied into each connection-scoped worker so they can report failures and
 *          deliver events. Replaced wholesale when the event scheduler is rebuilt.
 */
struct Interconnect {
    std::shared_ptr<CoreQueue> core;
    std::shared_ptr<EventQueue> events;
    std::shared_ptr<MixerQueue> mixer;
};

/**
 * @struct MixerConnection
 * @brief Per-connection state the mixer needs to emit packets.
 */
struct MixerConnection {
    std::shared_ptr<const VoiceCipher> cipher;
    CryptoMode crypto_mode = CryptoMode::NORMAL;
    uint32_t ssrc = 0;
    std::shared_ptr<UdpTxQueue> udp_tx;
};

/**
 * @struct UdpTxMessage
 * @brief Command for the UDP transmit worker.
 */
struct UdpTxMessage {
    enum class Type {
        PACKET, ///< Send `packet` as one datagram.
        POISON
    };
    Type type = Type::PACKET;
    std::vector<uint8_t> packet;
};

/**
 * @struct UdpRxMessage
 * @brief Command for the UDP receive worker.
 */
struct UdpRxMessage {
    enum class Type {
        SET_CONFIG,
        REPLACE_INTERCONNECT,
        POISON
    };
    Type type = Type::POISON;
    DriverConfig config;
    Interconnect interconnect;
};

/**
 * @struct WsMessage
 * @brief Command for the gateway runner.
 */
struct WsMessage {
    enum class Type {
        REPLACE_SOCKET,       ///< A resumed socket.
        SET_KEEPALIVE,        ///< New heartbeat interval from a Hello, in milliseconds.
        SPEAKING,             ///< Mixer speaking state; only changes reach the gateway.
        REPLACE_INTERCONNECT,
        POISON
    };
    Type type = Type::POISON;
    std::unique_ptr<IGatewaySocket> socket;
    double heartbeat_interval_ms = 0.0;
    bool speaking = false;
    Interconnect interconnect;
};

/**
 * @struct MixerMessage
 * @brief Command for the mixer.
 */
struct MixerMessage {
    enum class Type {
        ADD_TRACK,
        SET_TRACK,            ///< Replace all tracks with `track`, or clear them if null.
        SET_BITRATE,
        SET_CONFIG,
        SET_MUTE,
        SET_CONN,             ///< A new connection is ready; start sending to it.
        DROP_CONN,
        REPLACE_INTERCONNECT,
        REBUILD_ENCODER,
        WS,                   ///< Channel to the current gateway runner, or null.
        POISON
    };
    Type type = Type::POISON;
    std::unique_ptr<Track> track;
    int bitrate = DEFAULT_BITRATE;
    DriverConfig config;
    bool mute = false;
    MixerConnection connection;
    Interconnect interconnect;
    std::shared_ptr<WsQueue> ws;
};

/**
 * @struct CoreMessage
 * @brief Command for the driver core.
 * @details Sent by the public `Driver` API and by workers reporting failures.
 */
struct CoreMessage {
    enum class Type {
        CONNECT_WITH_RESULT,  ///< Start a connection; `result` completes when it is ready or failed.
        SIGNAL_WS_CLOSURE,    ///< The gateway runner of connection `connection_id` lost its socket.
        FULL_RECONNECT,       ///< A connection-scoped worker failed; redo the handshake.
        REBUILD_INTERCONNECT, ///< The event scheduler went away; rebuild it.
        DISCONNECT,
        SET_TRACK,
        ADD_TRACK,
        SET_BITRATE,
        SET_CONFIG,
        MUTE,
        ADD_EVENT,
        POISON
    };
    Type type = Type::POISON;
    ConnectionInfo info;
    std::shared_ptr<std::promise<void>> result;
    uint64_t connection_id = 0;
    std::optional<uint16_t> close_code;
    std::unique_ptr<Track> track;
    int bitrate = DEFAULT_BITRATE;
    DriverConfig config;
    bool mute = false;
    EventData event;
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_VOICE_TYPES_H
