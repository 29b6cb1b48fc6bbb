#include "gateway_payloads.h"

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdint>
#include <limits>
#include <string>

namespace voicelink {
namespace voice {

using json = nlohmann::json;

namespace {

// Snowflakes are sent as strings but some servers emit bare numbers.
uint64_t read_snowflake(const json& value) {
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        try {
            size_t consumed = 0;
            const unsigned long long parsed = std::stoull(text, &consumed, 10);
            if (consumed != text.size()) {
                throw GatewayPayloadError("snowflake has trailing characters: " + text);
            }
            return static_cast<uint64_t>(parsed);
        } catch (const std::logic_error&) {
            throw GatewayPayloadError("snowflake is not a decimal integer: " + text);
        }
    }
    if (value.is_number_unsigned()) {
        return value.get<uint64_t>();
    }
    throw GatewayPayloadError("snowflake must be a string or unsigned integer");
}

// Integer field of type T. Floats are accepted only when they hold an exact in-range integer.
template <typename T>
T read_unsigned(const json& value, const char* field) {
    const auto max = std::numeric_limits<T>::max();
    if (value.is_number_unsigned()) {
        const uint64_t raw = value.get<uint64_t>();
        if (raw > max) {
            throw GatewayPayloadError(std::string(field) + " out of range: " + value.dump());
        }
        return static_cast<T>(raw);
    }
    if (value.is_number_integer()) {
        // Signed storage only happens for negative values.
        throw GatewayPayloadError(std::string(field) + " is negative: " + value.dump());
    }
    if (value.is_number_float()) {
        const double raw = value.get<double>();
        // 2^64 is exactly representable; anything at or above it does not fit.
        if (!std::isfinite(raw) || raw < 0.0 || raw >= 18446744073709551616.0 || std::floor(raw) != raw ||
            static_cast<uint64_t>(raw) > max) {
            throw GatewayPayloadError(std::string(field) + " is not a valid integer: " + value.dump());
        }
        return static_cast<T>(raw);
    }
    throw GatewayPayloadError(std::string(field) + " must be numeric");
}

uint64_t read_nonce(const json& value) {
    if (value.is_string()) {
        return read_snowflake(value);
    }
    return read_unsigned<uint64_t>(value, "heartbeat nonce");
}

json encode_payload(const GatewayEvent& event) {
    json d;
    switch (event.op) {
        case VoiceOpcode::IDENTIFY:
            d["server_id"] = std::to_string(event.identify.server_id);
            d["user_id"] = std::to_string(event.identify.user_id);
            d["session_id"] = event.identify.session_id;
            d["token"] = event.identify.token;
            break;
        case VoiceOpcode::SELECT_PROTOCOL: {
            json data;
            data["address"] = event.select_protocol.data.address;
            data["port"] = event.select_protocol.data.port;
            data["mode"] = event.select_protocol.data.mode;
            d["protocol"] = event.select_protocol.protocol;
            d["data"] = data;
            break;
        }
        case VoiceOpcode::READY:
            d["ssrc"] = event.ready.ssrc;
            d["ip"] = event.ready.ip;
            d["port"] = event.ready.port;
            d["modes"] = event.ready.modes;
            break;
        case VoiceOpcode::HEARTBEAT:
            d = event.heartbeat.nonce;
            break;
        case VoiceOpcode::SESSION_DESCRIPTION:
            d["mode"] = event.session_description.mode;
            d["secret_key"] = event.session_description.secret_key;
            break;
        case VoiceOpcode::SPEAKING:
            d["speaking"] = event.speaking.speaking;
            d["ssrc"] = event.speaking.ssrc;
            if (event.speaking.delay) {
                d["delay"] = *event.speaking.delay;
            }
            if (event.speaking.user_id) {
                d["user_id"] = std::to_string(*event.speaking.user_id);
            }
            break;
        case VoiceOpcode::HEARTBEAT_ACK:
            d = event.heartbeat_ack.nonce;
            break;
        case VoiceOpcode::RESUME:
            d["server_id"] = std::to_string(event.resume.server_id);
            d["session_id"] = event.resume.session_id;
            d["token"] = event.resume.token;
            break;
        case VoiceOpcode::HELLO:
            d["heartbeat_interval"] = event.hello.heartbeat_interval;
            break;
        case VoiceOpcode::RESUMED:
            d = nullptr;
            break;
        case VoiceOpcode::CLIENT_CONNECT:
            d["audio_ssrc"] = event.client_connect.audio_ssrc;
            d["user_id"] = std::to_string(event.client_connect.user_id);
            d["video_ssrc"] = event.client_connect.video_ssrc;
            break;
        case VoiceOpcode::CLIENT_DISCONNECT:
            d["user_id"] = std::to_string(event.client_disconnect.user_id);
            break;
    }
    return d;
}

void decode_payload(VoiceOpcode op, const json& d, GatewayEvent& event) {
    switch (op) {
        case VoiceOpcode::IDENTIFY:
            event.identify.server_id = read_snowflake(d.at("server_id"));
            event.identify.user_id = read_snowflake(d.at("user_id"));
            event.identify.session_id = d.at("session_id").get<std::string>();
            event.identify.token = d.at("token").get<std::string>();
            break;
        case VoiceOpcode::SELECT_PROTOCOL: {
            event.select_protocol.protocol = d.at("protocol").get<std::string>();
            if (event.select_protocol.protocol != "udp") {
                throw GatewayPayloadError("unsupported protocol: " + event.select_protocol.protocol);
            }
            const json& data = d.at("data");
            event.select_protocol.data.address = data.at("address").get<std::string>();
            event.select_protocol.data.port = read_unsigned<uint16_t>(data.at("port"), "port");
            event.select_protocol.data.mode = data.at("mode").get<std::string>();
            break;
        }
        case VoiceOpcode::READY:
            event.ready.ssrc = read_unsigned<uint32_t>(d.at("ssrc"), "ssrc");
            event.ready.ip = d.at("ip").get<std::string>();
            event.ready.port = read_unsigned<uint16_t>(d.at("port"), "port");
            event.ready.modes = d.at("modes").get<std::vector<std::string>>();
            break;
        case VoiceOpcode::HEARTBEAT:
            event.heartbeat.nonce = read_nonce(d);
            break;
        case VoiceOpcode::SESSION_DESCRIPTION:
            event.session_description.mode = d.at("mode").get<std::string>();
            event.session_description.secret_key = d.at("secret_key").get<std::vector<uint8_t>>();
            break;
        case VoiceOpcode::SPEAKING:
            event.speaking.speaking = read_unsigned<uint8_t>(d.at("speaking"), "speaking");
            event.speaking.ssrc = read_unsigned<uint32_t>(d.at("ssrc"), "ssrc");
            if (d.contains("delay") && !d.at("delay").is_null()) {
                event.speaking.delay = read_unsigned<uint32_t>(d.at("delay"), "delay");
            }
            if (d.contains("user_id") && !d.at("user_id").is_null()) {
                event.speaking.user_id = read_snowflake(d.at("user_id"));
            }
            break;
        case VoiceOpcode::HEARTBEAT_ACK:
            event.heartbeat_ack.nonce = read_nonce(d);
            break;
        case VoiceOpcode::RESUME:
            event.resume.server_id = read_snowflake(d.at("server_id"));
            event.resume.session_id = d.at("session_id").get<std::string>();
            event.resume.token = d.at("token").get<std::string>();
            break;
        case VoiceOpcode::HELLO:
            event.hello.heartbeat_interval = d.at("heartbeat_interval").get<double>();
            break;
        case VoiceOpcode::RESUMED:
            break;
        case VoiceOpcode::CLIENT_CONNECT:
            event.client_connect.audio_ssrc = read_unsigned<uint32_t>(d.at("audio_ssrc"), "audio_ssrc");
            event.client_connect.user_id = read_snowflake(d.at("user_id"));
            event.client_connect.video_ssrc = d.value("video_ssrc", 0u);
            break;
        case VoiceOpcode::CLIENT_DISCONNECT:
            event.client_disconnect.user_id = read_snowflake(d.at("user_id"));
            break;
    }
}

bool opcode_from_int(int value, VoiceOpcode& op) {
    switch (value) {
        case 0: case 1: case 2: case 3: case 4: case 5: case 6:
        case 7: case 8: case 9: case 12: case 13:
            op = static_cast<VoiceOpcode>(value);
            return true;
        default:
            return false;
    }
}

} // namespace

GatewayEvent GatewayEvent::make(const Identify& p) {
    GatewayEvent e; e.op = VoiceOpcode::IDENTIFY; e.identify = p; return e;
}
GatewayEvent GatewayEvent::make(const SelectProtocol& p) {
    GatewayEvent e; e.op = VoiceOpcode::SELECT_PROTOCOL; e.select_protocol = p; return e;
}
GatewayEvent GatewayEvent::make(const Ready& p) {
    GatewayEvent e; e.op = VoiceOpcode::READY; e.ready = p; return e;
}
GatewayEvent GatewayEvent::make(const Heartbeat& p) {
    GatewayEvent e; e.op = VoiceOpcode::HEARTBEAT; e.heartbeat = p; return e;
}
GatewayEvent GatewayEvent::make(const SessionDescription& p) {
    GatewayEvent e; e.op = VoiceOpcode::SESSION_DESCRIPTION; e.session_description = p; return e;
}
GatewayEvent GatewayEvent::make(const Speaking& p) {
    GatewayEvent e; e.op = VoiceOpcode::SPEAKING; e.speaking = p; return e;
}
GatewayEvent GatewayEvent::make(const HeartbeatAck& p) {
    GatewayEvent e; e.op = VoiceOpcode::HEARTBEAT_ACK; e.heartbeat_ack = p; return e;
}
GatewayEvent GatewayEvent::make(const Resume& p) {
    GatewayEvent e; e.op = VoiceOpcode::RESUME; e.resume = p; return e;
}
GatewayEvent GatewayEvent::make(const Hello& p) {
    GatewayEvent e; e.op = VoiceOpcode::HELLO; e.hello = p; return e;
}
GatewayEvent GatewayEvent::make_resumed() {
    GatewayEvent e; e.op = VoiceOpcode::RESUMED; return e;
}
GatewayEvent GatewayEvent::make(const ClientConnect& p) {
    GatewayEvent e; e.op = VoiceOpcode::CLIENT_CONNECT; e.client_connect = p; return e;
}
GatewayEvent GatewayEvent::make(const ClientDisconnect& p) {
    GatewayEvent e; e.op = VoiceOpcode::CLIENT_DISCONNECT; e.client_disconnect = p; return e;
}

const char* opcode_name(VoiceOpcode op) {
    switch (op) {
        case VoiceOpcode::IDENTIFY: return "Identify";
        case VoiceOpcode::SELECT_PROTOCOL: return "SelectProtocol";
        case VoiceOpcode::READY: return "Ready";
        case VoiceOpcode::HEARTBEAT: return "Heartbeat";
        case VoiceOpcode::SESSION_DESCRIPTION: return "SessionDescription";
        case VoiceOpcode::SPEAKING: return "Speaking";
        case VoiceOpcode::HEARTBEAT_ACK: return "HeartbeatAck";
        case VoiceOpcode::RESUME: return "Resume";
        case VoiceOpcode::HELLO: return "Hello";
        case VoiceOpcode::RESUMED: return "Resumed";
        case VoiceOpcode::CLIENT_CONNECT: return "ClientConnect";
        case VoiceOpcode::CLIENT_DISCONNECT: return "ClientDisconnect";
    }
    return "Unknown";
}

std::string serialize_gateway_event(const GatewayEvent& event) {
    json j;
    j["op"] = static_cast<int>(event.op);
    j["d"] = encode_payload(event);
    return j.dump();
}

GatewayEvent parse_gateway_event(const std::string& text) {
    if (!json::accept(text)) {
        throw GatewayPayloadError("gateway frame is not valid JSON");
    }
    const json j = json::parse(text);
    if (!j.is_object() || !j.contains("op")) {
        throw GatewayPayloadError("gateway frame has no opcode");
    }

    GatewayEvent event;
    try {
        const int raw_op = j.at("op").get<int>();
        if (!opcode_from_int(raw_op, event.op)) {
            throw GatewayPayloadError("unknown voice opcode " + std::to_string(raw_op));
        }
        const json d = j.contains("d") ? j.at("d") : json();
        decode_payload(event.op, d, event);
    } catch (const json::exception& e) {
        throw GatewayPayloadError(std::string("malformed gateway payload: ") + e.what());
    }
    return event;
}

} // namespace voice
} // namespace voicelink
