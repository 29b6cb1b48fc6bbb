/**
 * @file event_context.h
 * @brief Data passed to an event handler when it fires.
 */
#ifndef VOICELINK_EVENT_CONTEXT_H
#define VOICELINK_EVENT_CONTEXT_H

#include "event.h"
#include "../gateway/gateway_payloads.h"
#include "../tracks/track_handle.h"
#include "../tracks/track_state.h"

#include <cstddef>
#include <cstdint>
#include <vector>

namespace voicelink {
namespace voice {

struct TrackContextEntry {
    TrackState state;
    TrackHandle handle;
};

/** @brief A remote SSRC started or stopped producing audio. */
struct SpeakingUpdateData {
    uint32_t ssrc = 0;
    bool speaking = false;
};

/**
 * @struct VoicePacketData
 * @brief A received voice packet.
 * @details `packet` is the whole datagram, decrypted in place unless decryption is off.
 *          The Opus payload lies between `payload_offset` and `packet.size() - payload_end_pad`.
 *          `audio` holds 16-bit interleaved stereo PCM only when decoding is enabled.
 */
struct VoicePacketData {
    std::vector<int16_t> audio;
    bool has_audio = false;
    uint32_t ssrc = 0;
    uint16_t sequence = 0;
    uint32_t timestamp = 0;
    std::vector<uint8_t> packet;
    std::size_t payload_offset = 0;
    std::size_t payload_end_pad = 0;
};

struct RtcpPacketData {
    uint8_t packet_type = 0; ///< 200 sender report, 201 receiver report, ...
    uint32_t ssrc = 0;       ///< Sender of the report.
    std::vector<uint8_t> packet;
    std::size_t payload_offset = 0;
    std::size_t payload_end_pad = 0;
};

/**
 * @struct EventContext
 * @brief What a handler sees. Only the member matching `kind` is meaningful.
 * @details Track events and timed events carry the affected tracks: exactly one for a
 *          track's own handlers, all tracks that changed for global handlers, and none for
 *          global timers.
 */
struct EventContext {
    enum class Kind {
        TRACK,
        SPEAKING_STATE_UPDATE,
        SPEAKING_UPDATE,
        VOICE_PACKET,
        RTCP_PACKET,
        CLIENT_CONNECT,
        CLIENT_DISCONNECT
    };

    Kind kind = Kind::TRACK;
    std::vector<TrackContextEntry> tracks;
    Speaking speaking_state;
    SpeakingUpdateData speaking_update;
    VoicePacketData voice_packet;
    RtcpPacketData rtcp_packet;
    ClientConnect client_connect;
    ClientDisconnect client_disconnect;

    /** @brief Core event matching a non-track context. */
    CoreEvent core_event() const {
        switch (kind) {
            case Kind::SPEAKING_STATE_UPDATE: return CoreEvent::SPEAKING_STATE_UPDATE;
            case Kind::SPEAKING_UPDATE: return CoreEvent::SPEAKING_UPDATE;
            case Kind::VOICE_PACKET: return CoreEvent::VOICE_PACKET;
            case Kind::RTCP_PACKET: return CoreEvent::RTCP_PACKET;
            case Kind::CLIENT_CONNECT: return CoreEvent::CLIENT_CONNECT;
            case Kind::CLIENT_DISCONNECT: return CoreEvent::CLIENT_DISCONNECT;
            default: return CoreEvent::SPEAKING_UPDATE;
        }
    }

    bool is_track() const { return kind == Kind::TRACK; }
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_EVENT_CONTEXT_H
