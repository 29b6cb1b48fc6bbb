/**
 * @file voice_constants.h
 * @brief Defines constants used throughout the voice engine.
 * @details Audio framing, RTP and gateway constants shared by the mixer, the
 *          receive path and the connection code.
 */
#ifndef VOICELINK_VOICE_CONSTANTS_H
#define VOICELINK_VOICE_CONSTANTS_H

#include <array>
#include <chrono>
#include <cstddef>
#include <cstdint>

namespace voicelink {
/**
 * @namespace voice
 * @brief The main namespace for all components of the voice engine.
 */
namespace voice {

/** @brief Voice gateway protocol version requested in the websocket URL. */
constexpr int VOICE_GATEWAY_VERSION = 4;

/** @brief Sample rate of all audio handled by the engine. */
constexpr int SAMPLE_RATE = 48000;

/** @brief Number of 20 ms frames per second. */
constexpr int AUDIO_FRAME_RATE = 50;

/** @brief Length of one audio frame in milliseconds. */
constexpr int FRAME_LEN_MS = 1000 / AUDIO_FRAME_RATE;

/** @brief Duration of one mixer tick. */
constexpr std::chrono::milliseconds TIMESTEP_LENGTH{FRAME_LEN_MS};

/** @brief Samples per channel in a single 20 ms frame. */
constexpr std::size_t MONO_FRAME_SIZE = SAMPLE_RATE / AUDIO_FRAME_RATE;

/** @brief Interleaved samples in a single 20 ms stereo frame. */
constexpr std::size_t STEREO_FRAME_SIZE = 2 * MONO_FRAME_SIZE;

/** @brief Size in bytes of one 20 ms stereo f32 frame. */
constexpr std::size_t STEREO_FRAME_BYTE_SIZE = STEREO_FRAME_SIZE * sizeof(float);

/** @brief Default Opus encoder bitrate, in bits per second. */
constexpr int DEFAULT_BITRATE = 128000;

/** @brief Maximum size of an outbound voice packet (RTP header, tag, payload, nonce). */
constexpr std::size_t VOICE_PACKET_MAX = 1460;

/** @brief Default interval between UDP keepalive packets. */
constexpr std::chrono::milliseconds UDP_KEEPALIVE_GAP{5000};

/** @brief Number of explicit silent frames sent after speech ends. */
constexpr int SILENT_FRAME_BURST = 5;

/** @brief The Opus frame Discord recognises as silence. */
constexpr std::array<uint8_t, 3> SILENT_FRAME = {0xF8, 0xFF, 0xFE};

/** @brief RTP version written into and expected from every packet. */
constexpr uint8_t RTP_VERSION = 2;

/** @brief RTP payload type used by Discord for Opus voice. */
constexpr uint8_t RTP_PROFILE_TYPE = 0x78;

/** @brief Size of a fixed RTP header without CSRCs. */
constexpr std::size_t RTP_HEADER_SIZE = 12;

/** @brief Size of a fixed RTCP header including the sender SSRC. */
constexpr std::size_t RTCP_HEADER_SIZE = 8;

/** @brief Tolerance used when comparing volumes against unity gain. */
constexpr float VOLUME_EPSILON = 1e-6f;

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_VOICE_CONSTANTS_H
