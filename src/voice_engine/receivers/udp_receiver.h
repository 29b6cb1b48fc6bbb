/**
 * @file udp_receiver.h
 * @brief Worker that reads the voice socket and turns datagrams into core events.
 */
#ifndef VOICELINK_UDP_RECEIVER_H
#define VOICELINK_UDP_RECEIVER_H

#include "../net/udp_socket.h"
#include "../rtp/rtp_packet.h"
#include "../utils/voice_component.h"
#include "../voice_types.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <vector>

struct OpusDecoder;

namespace voicelink {
namespace voice {

/**
 * @enum SpeakingDelta
 * @brief Speaking edge produced by one received packet.
 */
enum class SpeakingDelta {
    SAME,
    START,
    STOP
};

/**
 * @class SsrcState
 * @brief Per-sender receive state: last sequence number, silence run and Opus decoder.
 */
class SsrcState {
public:
    /**
     * @param first_sequence Sequence number of the packet that created the state.
     * @throws std::runtime_error if the decoder cannot be created.
     */
    explicit SsrcState(uint16_t first_sequence);
    ~SsrcState();

    SsrcState(const SsrcState&) = delete;
    SsrcState& operator=(const SsrcState&) = delete;

    /**
     * @brief Updates state for one packet.
     * @param sequence RTP sequence number.
     * @param body Decrypted body (extension then Opus), or the raw payload region when not decrypted.
     * @param body_len Length of `body`.
     * @param has_extension RTP X bit.
     * @param decrypted Whether `body` is plaintext.
     * @param decode Whether to decode audio into `audio`.
     * @param delta Speaking edge caused by this packet.
     * @param audio Decoded interleaved stereo PCM.
     * @param has_audio Set when `audio` carries a result (empty for a late packet).
     * @return false if the packet is malformed or decoding failed.
     */
    bool process(uint16_t sequence,
                 const uint8_t* body,
                 std::size_t body_len,
                 bool has_extension,
                 bool decrypted,
                 bool decode,
                 SpeakingDelta& delta,
                 std::vector<int16_t>& audio,
                 bool& has_audio);

    int silent_frame_count() const { return silent_frame_count_; }
    uint16_t last_sequence() const { return last_seq_; }

private:
    OpusDecoder* decoder_ = nullptr;
    uint16_t last_seq_;
    int silent_frame_count_ = SILENT_FRAME_BURST;
};

/**
 * @class UdpReceiver
 * @brief Receives RTP and RTCP on the shared voice socket.
 * @details Packets are decrypted according to the decode mode, tracked per SSRC, and
 *          forwarded to the event scheduler as `FIRE_CORE_EVENT` messages. Malformed or
 *          undecryptable packets are logged and never end the connection.
 */
class UdpReceiver : public VoiceComponent {
public:
    UdpReceiver(std::shared_ptr<VoiceUdpSocket> socket,
                std::shared_ptr<const VoiceCipher> cipher,
                CryptoMode crypto_mode,
                DriverConfig config,
                Interconnect interconnect,
                std::shared_ptr<UdpRxQueue> rx);
    ~UdpReceiver() override;

    void start() override;
    void stop() override;

    /** @brief Processes one datagram in place. Exposed for tests. */
    void handle_datagram(uint8_t* data, std::size_t len);

    /** @brief Applies one control message; false on `POISON`. */
    bool handle_message(UdpRxMessage& msg);

    std::size_t tracked_ssrc_count() const { return ssrcs_.size(); }

protected:
    void run() override;

private:
    void handle_rtp(uint8_t* data, std::size_t len);
    void handle_rtcp(uint8_t* data, std::size_t len);
    void fire(EventContext ctx);

    std::shared_ptr<VoiceUdpSocket> socket_;
    std::shared_ptr<const VoiceCipher> cipher_;
    CryptoMode crypto_mode_;
    DriverConfig config_;
    Interconnect interconnect_;
    std::shared_ptr<UdpRxQueue> rx_;
    std::map<uint32_t, std::unique_ptr<SsrcState>> ssrcs_;
    std::array<uint8_t, VOICE_PACKET_MAX> buffer_{};
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_UDP_RECEIVER_H
