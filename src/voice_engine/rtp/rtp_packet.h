/**
 * @file rtp_packet.h
 * @brief RTP/RTCP helpers for voice packets and the mixer's reusable send buffer.
 */
#ifndef VOICELINK_RTP_PACKET_H
#define VOICELINK_RTP_PACKET_H

#include "../crypto/crypto_mode.h"
#include "../voice_constants.h"

#include <array>
#include <cstddef>
#include <cstdint>

namespace voicelink {
namespace voice {

/**
 * @enum DemuxedKind
 * @brief Classification of a datagram received on the voice socket.
 */
enum class DemuxedKind {
    RTP,
    RTCP,
    FAILED
};

/**
 * @brief Splits RTP from RTCP by the second byte, as multiplexed on one port.
 * @details A second byte in 192..223 is an RTCP packet type; anything else is RTP.
 *          Packets too short for their fixed header are `FAILED`.
 */
DemuxedKind classify_packet(const uint8_t* data, std::size_t len);

/** @brief Fields of an RTP header the receive path cares about. */
struct RtpInfo {
    uint8_t version = 0;
    uint8_t payload_type = 0;
    bool has_extension = false;
    uint16_t sequence = 0;
    uint32_t timestamp = 0;
    uint32_t ssrc = 0;
    std::size_t header_len = 0; ///< Fixed header plus CSRCs.
};

/** @return false if the buffer cannot hold the header it describes. */
bool parse_rtp_header(const uint8_t* data, std::size_t len, RtpInfo& info);

/** @brief Reads the sender SSRC of an RTCP packet. */
bool parse_rtcp_header(const uint8_t* data, std::size_t len, uint8_t& packet_type, uint32_t& ssrc);

/**
 * @brief Length of the RTP header extension at the start of a decrypted body.
 * @details Discord encrypts the extension together with the payload, so it is skipped after
 *          decryption: 4 bytes of profile and word count, then `count * 4` bytes.
 * @return false if the body is shorter than the extension it announces.
 */
bool rtp_extension_len(const uint8_t* body, std::size_t body_len, std::size_t& ext_len);

/**
 * @class MixerPacketBuffer
 * @brief The single outbound RTP packet reused by the mixer every tick.
 * @details The header is always valid: version 2, payload type 0x78, a fixed SSRC, and a
 *          random initial sequence number and timestamp. The Opus payload is written after
 *          the header and the space reserved for the Poly1305 tag.
 */
class MixerPacketBuffer {
public:
    explicit MixerPacketBuffer(uint32_t ssrc = 0);

    /** @brief Rebinds to a new SSRC and re-randomises sequence and timestamp. */
    void reset(uint32_t ssrc);

    uint8_t* data() { return buffer_.data(); }
    const uint8_t* data() const { return buffer_.data(); }
    std::size_t capacity() const { return buffer_.size(); }

    /** @brief Where the plaintext payload is written. */
    uint8_t* payload() { return buffer_.data() + RTP_HEADER_SIZE + CRYPTO_TAG_SIZE; }

    /** @brief Largest payload that still leaves room for the mode's nonce suffix. */
    std::size_t payload_capacity(CryptoMode mode) const;

    uint16_t sequence() const { return sequence_; }
    uint32_t timestamp() const { return timestamp_; }
    uint32_t ssrc() const { return ssrc_; }

    /** @brief Moves to the next packet: sequence +1, timestamp +960. */
    void advance();

private:
    void write_header();

    std::array<uint8_t, VOICE_PACKET_MAX> buffer_{};
    uint32_t ssrc_;
    uint16_t sequence_;
    uint32_t timestamp_;
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_RTP_PACKET_H
