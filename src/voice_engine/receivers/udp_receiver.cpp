#include "udp_receiver.h"
#include "../utils/cpp_logger.h"

#include <opus/opus.h>

#include <algorithm>
#include <stdexcept>
#include <string>
#include <utility>

namespace voicelink {
namespace voice {

SsrcState::SsrcState(uint16_t first_sequence) : last_seq_(first_sequence) {
    int error = OPUS_OK;
    decoder_ = opus_decoder_create(SAMPLE_RATE, 2, &error);
    if (error != OPUS_OK || !decoder_) {
        throw std::runtime_error(std::string("Failed to create receive decoder: ") + opus_strerror(error));
    }
}

SsrcState::~SsrcState() {
    if (decoder_) {
        opus_decoder_destroy(decoder_);
    }
}

bool SsrcState::process(uint16_t sequence,
                        const uint8_t* body,
                        std::size_t body_len,
                        bool has_extension,
                        bool decrypted,
                        bool decode,
                        SpeakingDelta& delta,
                        std::vector<int16_t>& audio,
                        bool& has_audio) {
    delta = SpeakingDelta::SAME;
    audio.clear();
    has_audio = false;

    const uint16_t seq_delta = static_cast<uint16_t>(sequence - last_seq_);
    if (seq_delta >= (1u << 15)) {
        // Arrived after a later packet; too late to decode in order.
        has_audio = true;
        return true;
    }
    last_seq_ = sequence;
    const uint16_t missed = seq_delta == 0 ? 0 : static_cast<uint16_t>(seq_delta - 1);

    std::size_t pkt_size = body_len;
    if (decrypted) {
        std::size_t start = 0;
        if (has_extension && !rtp_extension_len(body, body_len, start)) {
            LOG_VL_ERROR("[UdpReceiver] Extension packet indicated, but insufficient space");
            return false;
        }
        pkt_size = body_len - start;

        if (decode) {
            audio.assign(STEREO_FRAME_SIZE, 0);
            for (uint16_t i = 0; i < missed; ++i) {
                const int plc = opus_decode(decoder_, nullptr, 0, audio.data(),
                                            static_cast<int>(MONO_FRAME_SIZE), 0);
                if (plc < 0) {
                    LOG_VL_WARNING("[UdpReceiver] Issue while decoding for missed packet: %s", opus_strerror(plc));
                }
            }
            const int samples = opus_decode(decoder_, body + start, static_cast<opus_int32>(pkt_size),
                                            audio.data(), static_cast<int>(MONO_FRAME_SIZE), 0);
            if (samples < 0) {
                LOG_VL_ERROR("[UdpReceiver] Failed to decode received packet: %s", opus_strerror(samples));
                audio.clear();
                return false;
            }
            audio.resize(2 * static_cast<std::size_t>(samples));
            has_audio = true;
        }
    }

    if (pkt_size == SILENT_FRAME.size()) {
        const int old = silent_frame_count_;
        const int added = 1 + static_cast<int>(missed);
        silent_frame_count_ = std::min(silent_frame_count_ + added, 0xFFFF);
        if (silent_frame_count_ >= SILENT_FRAME_BURST && old < SILENT_FRAME_BURST) {
            delta = SpeakingDelta::STOP;
        }
    } else {
        if (silent_frame_count_ >= SILENT_FRAME_BURST) {
            delta = SpeakingDelta::START;
        }
        silent_frame_count_ = 0;
    }
    return true;
}

UdpReceiver::UdpReceiver(std::shared_ptr<VoiceUdpSocket> socket,
                         std::shared_ptr<const VoiceCipher> cipher,
                         CryptoMode crypto_mode,
                         DriverConfig config,
                         Interconnect interconnect,
                         std::shared_ptr<UdpRxQueue> rx)
    : socket_(std::move(socket)),
      cipher_(std::move(cipher)),
      crypto_mode_(crypto_mode),
      config_(std::move(config)),
      interconnect_(std::move(interconnect)),
      rx_(std::move(rx)) {}

UdpReceiver::~UdpReceiver() {
    stop();
}

void UdpReceiver::start() {
    if (component_thread_.joinable()) {
        return;
    }
    stop_flag_ = false;
    component_thread_ = std::thread(&UdpReceiver::run, this);
}

void UdpReceiver::stop() {
    stop_flag_ = true;
    if (rx_) {
        rx_->stop();
    }
    join_component_thread();
}

bool UdpReceiver::handle_message(UdpRxMessage& msg) {
    switch (msg.type) {
        case UdpRxMessage::Type::SET_CONFIG:
            // The negotiated crypto mode is fixed for the connection's lifetime.
            config_ = msg.config;
            return true;
        case UdpRxMessage::Type::REPLACE_INTERCONNECT:
            interconnect_ = msg.interconnect;
            return true;
        case UdpRxMessage::Type::POISON:
            return false;
    }
    return true;
}

void UdpReceiver::run() {
    LOG_VL_INFO("[UdpReceiver] UDP receive handle started");
    while (!stop_flag_) {
        UdpRxMessage msg;
        bool poisoned = false;
        while (rx_->try_pop(msg)) {
            if (!handle_message(msg)) {
                poisoned = true;
                break;
            }
        }
        if (poisoned || rx_->is_stopped()) {
            break;
        }

        std::size_t len = 0;
        const auto status = socket_->receive(buffer_.data(), buffer_.size(), len, config_.udp_receive_timeout);
        if (status == VoiceUdpSocket::RecvStatus::FAILED) {
            if (!stop_flag_) {
                LOG_VL_ERROR("[UdpReceiver] Voice socket failed, receive loop exiting");
            }
            break;
        }
        if (status == VoiceUdpSocket::RecvStatus::DATA) {
            handle_datagram(buffer_.data(), len);
        }
    }
    LOG_VL_INFO("[UdpReceiver] UDP receive handle stopped");
}

void UdpReceiver::handle_datagram(uint8_t* data, std::size_t len) {
    switch (classify_packet(data, len)) {
        case DemuxedKind::RTP:
            handle_rtp(data, len);
            break;
        case DemuxedKind::RTCP:
            handle_rtcp(data, len);
            break;
        case DemuxedKind::FAILED:
            LOG_VL_WARNING("[UdpReceiver] Failed to parse datagram of %zu bytes", len);
            break;
    }
}

void UdpReceiver::handle_rtp(uint8_t* data, std::size_t len) {
    RtpInfo info;
    if (!parse_rtp_header(data, len, info) || info.version != RTP_VERSION ||
        info.payload_type != RTP_PROFILE_TYPE) {
        LOG_VL_ERROR("[UdpReceiver] Illegal RTP message received");
        return;
    }

    const std::size_t prefix = crypto_payload_prefix_len(crypto_mode_);
    const std::size_t suffix = crypto_payload_suffix_len(crypto_mode_);
    std::size_t body_offset = info.header_len + prefix;
    bool decrypted = false;

    if (decode_mode_should_decrypt(config_.decode_mode) && cipher_) {
        std::size_t body_len = 0;
        if (cipher_->decrypt_in_place(crypto_mode_, data, info.header_len, len, body_offset, body_len)) {
            decrypted = true;
        } else {
            LOG_VL_WARNING("[UdpReceiver] RTP decryption failed for SSRC %u", info.ssrc);
            body_offset = info.header_len + prefix;
        }
    }

    if (len < body_offset + suffix) {
        LOG_VL_WARNING("[UdpReceiver] RTP packet from SSRC %u too short for its payload", info.ssrc);
        return;
    }
    const std::size_t body_len = len - body_offset - suffix;

    auto it = ssrcs_.find(info.ssrc);
    if (it == ssrcs_.end()) {
        try {
            it = ssrcs_.emplace(info.ssrc, std::make_unique<SsrcState>(info.sequence)).first;
        } catch (const std::runtime_error& e) {
            LOG_VL_ERROR("[UdpReceiver] Cannot track SSRC %u: %s", info.ssrc, e.what());
            return;
        }
    }

    SpeakingDelta delta = SpeakingDelta::SAME;
    EventContext packet_ctx;
    packet_ctx.kind = EventContext::Kind::VOICE_PACKET;
    VoicePacketData& voice = packet_ctx.voice_packet;
    if (!it->second->process(info.sequence, data + body_offset, body_len, info.has_extension, decrypted,
                             config_.decode_mode == DecodeMode::DECODE, delta, voice.audio, voice.has_audio)) {
        LOG_VL_WARNING("[UdpReceiver] RTP decoding/processing failed for SSRC %u", info.ssrc);
        return;
    }

    if (delta != SpeakingDelta::SAME) {
        EventContext speaking_ctx;
        speaking_ctx.kind = EventContext::Kind::SPEAKING_UPDATE;
        speaking_ctx.speaking_update.ssrc = info.ssrc;
        speaking_ctx.speaking_update.speaking = delta == SpeakingDelta::START;
        fire(std::move(speaking_ctx));
    }

    voice.ssrc = info.ssrc;
    voice.sequence = info.sequence;
    voice.timestamp = info.timestamp;
    voice.packet.assign(data, data + len);
    voice.payload_offset = body_offset;
    voice.payload_end_pad = suffix;
    fire(std::move(packet_ctx));
}

void UdpReceiver::handle_rtcp(uint8_t* data, std::size_t len) {
    uint8_t packet_type = 0;
    uint32_t sender = 0;
    if (!parse_rtcp_header(data, len, packet_type, sender)) {
        LOG_VL_WARNING("[UdpReceiver] Illegal RTCP packet of %zu bytes", len);
        return;
    }
    LOG_VL_DEBUG("[UdpReceiver] RTCP type %u from SSRC %u", static_cast<unsigned>(packet_type), sender);

    const std::size_t prefix = crypto_payload_prefix_len(crypto_mode_);
    const std::size_t suffix = crypto_payload_suffix_len(crypto_mode_);
    std::size_t body_offset = RTCP_HEADER_SIZE + prefix;

    if (decode_mode_should_decrypt(config_.decode_mode) && cipher_) {
        std::size_t body_len = 0;
        if (!cipher_->decrypt_in_place(crypto_mode_, data, RTCP_HEADER_SIZE, len, body_offset, body_len)) {
            LOG_VL_WARNING("[UdpReceiver] RTCP decryption failed");
            body_offset = RTCP_HEADER_SIZE + prefix;
        }
    }

    EventContext ctx;
    ctx.kind = EventContext::Kind::RTCP_PACKET;
    ctx.rtcp_packet.packet_type = packet_type;
    ctx.rtcp_packet.ssrc = sender;
    ctx.rtcp_packet.packet.assign(data, data + len);
    ctx.rtcp_packet.payload_offset = body_offset;
    ctx.rtcp_packet.payload_end_pad = suffix;
    fire(std::move(ctx));
}

void UdpReceiver::fire(EventContext ctx) {
    // A closed scheduler is noticed and rebuilt by the mixer; nothing to do here.
    if (!interconnect_.events) {
        return;
    }
    EventMessage msg = EventMessage::make(EventMessage::Type::FIRE_CORE_EVENT);
    msg.context = std::move(ctx);
    if (!interconnect_.events->push(std::move(msg))) {
        LOG_VL_DEBUG("[UdpReceiver] Event scheduler closed, packet event dropped");
    }
}

} // namespace voice
} // namespace voicelink
