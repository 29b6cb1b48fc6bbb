#include "rtp_packet.h"

#include <rtc/rtp.hpp>

#include <cstring>
#include <random>

#ifdef _WIN32
#include <winsock2.h>
#else
#include <arpa/inet.h>
#endif

namespace voicelink {
namespace voice {

DemuxedKind classify_packet(const uint8_t* data, std::size_t len) {
    if (len < 2) {
        return DemuxedKind::FAILED;
    }
    if (data[1] >= 192 && data[1] <= 223) {
        return len >= RTCP_HEADER_SIZE ? DemuxedKind::RTCP : DemuxedKind::FAILED;
    }
    return len >= RTP_HEADER_SIZE ? DemuxedKind::RTP : DemuxedKind::FAILED;
}

bool parse_rtp_header(const uint8_t* data, std::size_t len, RtpInfo& info) {
    if (len < sizeof(rtc::RtpHeader)) {
        return false;
    }
    const rtc::RtpHeader* rtp_header = reinterpret_cast<const rtc::RtpHeader*>(data);
    info.version = rtp_header->version();
    info.payload_type = rtp_header->payloadType();
    info.has_extension = rtp_header->extension();
    info.sequence = rtp_header->seqNumber();
    info.timestamp = rtp_header->timestamp();
    info.ssrc = rtp_header->ssrc();
    info.header_len = RTP_HEADER_SIZE + (rtp_header->csrcCount() * sizeof(uint32_t));
    return info.header_len <= len;
}

bool parse_rtcp_header(const uint8_t* data, std::size_t len, uint8_t& packet_type, uint32_t& ssrc) {
    if (len < RTCP_HEADER_SIZE) {
        return false;
    }
    const rtc::RtcpHeader* rtcp_header = reinterpret_cast<const rtc::RtcpHeader*>(data);
    packet_type = rtcp_header->payloadType();
    uint32_t ssrc_net = 0;
    std::memcpy(&ssrc_net, data + 4, sizeof(ssrc_net));
    ssrc = ntohl(ssrc_net);
    return true;
}

bool rtp_extension_len(const uint8_t* body, std::size_t body_len, std::size_t& ext_len) {
    if (body_len < 4) {
        return false;
    }
    const std::size_t words = (static_cast<std::size_t>(body[2]) << 8) | body[3];
    ext_len = 4 + words * 4;
    return ext_len <= body_len;
}

MixerPacketBuffer::MixerPacketBuffer(uint32_t ssrc) : ssrc_(0), sequence_(0), timestamp_(0) {
    reset(ssrc);
}

void MixerPacketBuffer::reset(uint32_t ssrc) {
    std::random_device rd;
    std::mt19937 gen(rd());
    std::uniform_int_distribution<uint16_t> dis16;
    std::uniform_int_distribution<uint32_t> dis32;

    ssrc_ = ssrc;
    sequence_ = dis16(gen);
    timestamp_ = dis32(gen);
    write_header();
}

std::size_t MixerPacketBuffer::payload_capacity(CryptoMode mode) const {
    return buffer_.size() - RTP_HEADER_SIZE - CRYPTO_TAG_SIZE - crypto_payload_suffix_len(mode);
}

void MixerPacketBuffer::advance() {
    sequence_ = static_cast<uint16_t>(sequence_ + 1);
    timestamp_ = timestamp_ + static_cast<uint32_t>(MONO_FRAME_SIZE);
    write_header();
}

void MixerPacketBuffer::write_header() {
    // Version (2 bits), Padding (1), Extension (1), CSRC Count (4)
    buffer_[0] = static_cast<uint8_t>(RTP_VERSION << 6);
    // Marker (1 bit), Payload Type (7)
    buffer_[1] = RTP_PROFILE_TYPE;

    uint16_t seq_num_net = htons(sequence_);
    std::memcpy(&buffer_[2], &seq_num_net, 2);

    uint32_t ts_net = htonl(timestamp_);
    std::memcpy(&buffer_[4], &ts_net, 4);

    uint32_t ssrc_net = htonl(ssrc_);
    std::memcpy(&buffer_[8], &ssrc_net, 4);
}

} // namespace voice
} // namespace voicelink
