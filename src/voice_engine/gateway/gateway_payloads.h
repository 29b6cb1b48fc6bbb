/**
 * @file gateway_payloads.h
 * @brief Voice gateway opcodes, payload structures and their JSON encoding.
 * @details Every frame on the voice websocket has the form `{"op": <u8>, "d": <payload>}`.
 *          Snowflake identifiers travel as decimal strings. Parsing failures are
 *          reported with `GatewayPayloadError`.
 */
#ifndef VOICELINK_GATEWAY_PAYLOADS_H
#define VOICELINK_GATEWAY_PAYLOADS_H

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace voicelink {
namespace voice {

using GuildId = uint64_t;
using UserId = uint64_t;
using ChannelId = uint64_t;

/**
 * @enum VoiceOpcode
 * @brief Voice gateway opcodes understood by the engine.
 */
enum class VoiceOpcode : uint8_t {
    IDENTIFY = 0,
    SELECT_PROTOCOL = 1,
    READY = 2,
    HEARTBEAT = 3,
    SESSION_DESCRIPTION = 4,
    SPEAKING = 5,
    HEARTBEAT_ACK = 6,
    RESUME = 7,
    HELLO = 8,
    RESUMED = 9,
    CLIENT_CONNECT = 12,
    CLIENT_DISCONNECT = 13
};

/** @brief Bit flags carried in the `speaking` field of a Speaking payload. */
namespace speaking_flags {
constexpr uint8_t NONE = 0;
constexpr uint8_t MICROPHONE = 1 << 0;
constexpr uint8_t SOUNDSHARE = 1 << 1;
constexpr uint8_t PRIORITY = 1 << 2;
} // namespace speaking_flags

class GatewayPayloadError : public std::runtime_error {
public:
    explicit GatewayPayloadError(const std::string& what) : std::runtime_error(what) {}
};

struct Identify {
    GuildId server_id = 0;
    UserId user_id = 0;
    std::string session_id;
    std::string token;

    bool operator==(const Identify& o) const {
        return server_id == o.server_id && user_id == o.user_id &&
               session_id == o.session_id && token == o.token;
    }
};

struct ProtocolData {
    std::string address;
    uint16_t port = 0;
    std::string mode;

    bool operator==(const ProtocolData& o) const {
        return address == o.address && port == o.port && mode == o.mode;
    }
};

struct SelectProtocol {
    std::string protocol = "udp";
    ProtocolData data;

    bool operator==(const SelectProtocol& o) const {
        return protocol == o.protocol && data == o.data;
    }
};

/** @note `heartbeat_interval` sent alongside Ready is deliberately not kept; Hello is authoritative. */
struct Ready {
    uint32_t ssrc = 0;
    std::string ip;
    uint16_t port = 0;
    std::vector<std::string> modes;

    bool operator==(const Ready& o) const {
        return ssrc == o.ssrc && ip == o.ip && port == o.port && modes == o.modes;
    }
};

struct Heartbeat {
    uint64_t nonce = 0;
    bool operator==(const Heartbeat& o) const { return nonce == o.nonce; }
};

struct SessionDescription {
    std::string mode;
    std::vector<uint8_t> secret_key;

    bool operator==(const SessionDescription& o) const {
        return mode == o.mode && secret_key == o.secret_key;
    }
};

struct Speaking {
    uint8_t speaking = speaking_flags::NONE;
    uint32_t ssrc = 0;
    std::optional<uint32_t> delay;
    std::optional<UserId> user_id;

    bool operator==(const Speaking& o) const {
        return speaking == o.speaking && ssrc == o.ssrc && delay == o.delay && user_id == o.user_id;
    }
};

struct HeartbeatAck {
    uint64_t nonce = 0;
    bool operator==(const HeartbeatAck& o) const { return nonce == o.nonce; }
};

struct Resume {
    GuildId server_id = 0;
    std::string session_id;
    std::string token;

    bool operator==(const Resume& o) const {
        return server_id == o.server_id && session_id == o.session_id && token == o.token;
    }
};

struct Hello {
    double heartbeat_interval = 0.0;
};

struct ClientConnect {
    uint32_t audio_ssrc = 0;
    UserId user_id = 0;
    uint32_t video_ssrc = 0;

    bool operator==(const ClientConnect& o) const {
        return audio_ssrc == o.audio_ssrc && user_id == o.user_id && video_ssrc == o.video_ssrc;
    }
};

struct ClientDisconnect {
    UserId user_id = 0;
    bool operator==(const ClientDisconnect& o) const { return user_id == o.user_id; }
};

/**
 * @struct GatewayEvent
 * @brief One voice gateway frame. Only the member matching `op` is meaningful.
 */
struct GatewayEvent {
    VoiceOpcode op = VoiceOpcode::HEARTBEAT;

    Identify identify;
    SelectProtocol select_protocol;
    Ready ready;
    Heartbeat heartbeat;
    SessionDescription session_description;
    Speaking speaking;
    HeartbeatAck heartbeat_ack;
    Resume resume;
    Hello hello;
    ClientConnect client_connect;
    ClientDisconnect client_disconnect;

    static GatewayEvent make(const Identify& p);
    static GatewayEvent make(const SelectProtocol& p);
    static GatewayEvent make(const Ready& p);
    static GatewayEvent make(const Heartbeat& p);
    static GatewayEvent make(const SessionDescription& p);
    static GatewayEvent make(const Speaking& p);
    static GatewayEvent make(const HeartbeatAck& p);
    static GatewayEvent make(const Resume& p);
    static GatewayEvent make(const Hello& p);
    static GatewayEvent make_resumed();
    static GatewayEvent make(const ClientConnect& p);
    static GatewayEvent make(const ClientDisconnect& p);
};

/** @brief Gateway-facing name of an opcode, for logging. */
const char* opcode_name(VoiceOpcode op);

/**
 * @brief Serializes a frame to its JSON text.
 */
std::string serialize_gateway_event(const GatewayEvent& event);

/**
 * @brief Parses a JSON text frame.
 * @throws GatewayPayloadError on malformed JSON, unknown opcodes or missing fields.
 */
GatewayEvent parse_gateway_event(const std::string& text);

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_GATEWAY_PAYLOADS_H
