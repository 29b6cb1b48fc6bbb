#ifndef VOICELINK_DRIVER_CONFIG_H
#define VOICELINK_DRIVER_CONFIG_H

#include "../crypto/crypto_mode.h"
#include "../voice_constants.h"

#include <chrono>
#include <cstddef>

namespace voicelink {
namespace voice {

/**
 * @enum DecodeMode
 * @brief How much work the receive path does on inbound voice packets.
 */
enum class DecodeMode {
    PASS,    ///< Forward packets untouched; no decryption or decoding.
    DECRYPT, ///< Decrypt packets but leave the Opus payload encoded.
    DECODE   ///< Decrypt and decode to 16-bit stereo PCM, tracking speaking edges.
};

/** @brief Whether packets must be decrypted under a decode mode. */
inline bool decode_mode_should_decrypt(DecodeMode mode) {
    return mode != DecodeMode::PASS;
}

struct ReconnectTuning {
    int attempts = 5;
    std::chrono::milliseconds base_delay{250};
    std::chrono::milliseconds max_delay{4000};
};

/**
 * @struct DriverConfig
 * @brief Settings shared by every worker of one voice driver.
 */
struct DriverConfig {
    CryptoMode crypto_mode = CryptoMode::NORMAL;
    DecodeMode decode_mode = DecodeMode::DECRYPT;
    int default_bitrate = DEFAULT_BITRATE;
    std::size_t preallocated_tracks = 1;
    std::chrono::milliseconds udp_keepalive_gap = UDP_KEEPALIVE_GAP;
    std::chrono::milliseconds udp_receive_timeout{10};
    std::chrono::milliseconds handshake_timeout{10000};
    ReconnectTuning reconnect;
    bool mixer_realtime_priority = true;
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_DRIVER_CONFIG_H
