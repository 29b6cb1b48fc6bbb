#include <gtest/gtest.h>
#include <cstring>
#include <memory>
#include <vector>
#include "receivers/udp_receiver.h"

using namespace voicelink::voice;

namespace {

const std::vector<uint8_t> kSilent(SILENT_FRAME.begin(), SILENT_FRAME.end());
const std::vector<uint8_t> kAudible = {0x78, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07};

} // namespace

class SsrcStateTest : public ::testing::Test {
protected:
    SpeakingDelta feed(SsrcState& state, uint16_t seq, const std::vector<uint8_t>& body) {
        SpeakingDelta delta = SpeakingDelta::SAME;
        EXPECT_TRUE(state.process(seq, body.data(), body.size(), false, true, false, delta, audio, has_audio));
        return delta;
    }

    std::vector<int16_t> audio;
    bool has_audio = false;
};

TEST_F(SsrcStateTest, StartsAsSilent) {
    SsrcState state(10);
    EXPECT_EQ(state.silent_frame_count(), SILENT_FRAME_BURST);
    EXPECT_EQ(feed(state, 11, kSilent), SpeakingDelta::SAME);
    EXPECT_EQ(feed(state, 12, kAudible), SpeakingDelta::START);
    EXPECT_EQ(state.silent_frame_count(), 0);
}

TEST_F(SsrcStateTest, StopsAfterFiveSilentFrames) {
    SsrcState state(0);
    EXPECT_EQ(feed(state, 1, kAudible), SpeakingDelta::START);
    for (uint16_t seq = 2; seq < 6; ++seq) {
        EXPECT_EQ(feed(state, seq, kSilent), SpeakingDelta::SAME) << "seq " << seq;
    }
    EXPECT_EQ(feed(state, 6, kSilent), SpeakingDelta::STOP);
    EXPECT_EQ(feed(state, 7, kSilent), SpeakingDelta::SAME);
}

TEST_F(SsrcStateTest, AudioBeforeFifthSilentFrameKeepsSpeaking) {
    SsrcState state(0);
    feed(state, 1, kAudible);
    for (uint16_t seq = 2; seq < 6; ++seq) {
        feed(state, seq, kSilent);
    }
    EXPECT_EQ(feed(state, 6, kAudible), SpeakingDelta::SAME);
}

TEST_F(SsrcStateTest, MissedPacketsCountTowardsSilence) {
    SsrcState state(0);
    feed(state, 1, kAudible);
    // Sequence 2..4 lost; the silent frame at 5 stands for four silent slots.
    EXPECT_EQ(feed(state, 5, kSilent), SpeakingDelta::SAME);
    EXPECT_EQ(feed(state, 6, kSilent), SpeakingDelta::STOP);
}

TEST_F(SsrcStateTest, LateReorderIsNotDecoded) {
    SsrcState state(100);
    feed(state, 101, kAudible);

    SpeakingDelta delta = SpeakingDelta::START;
    ASSERT_TRUE(state.process(100, kAudible.data(), kAudible.size(), false, true, true, delta, audio, has_audio));
    EXPECT_EQ(delta, SpeakingDelta::SAME);
    EXPECT_TRUE(has_audio);
    EXPECT_TRUE(audio.empty());
    EXPECT_EQ(state.last_sequence(), 101);
}

TEST_F(SsrcStateTest, HalfSequenceSpaceIsReorder) {
    SsrcState state(0);
    feed(state, 0x8000, kAudible);
    EXPECT_EQ(state.last_sequence(), 0);

    feed(state, 0x7FFF, kAudible);
    EXPECT_EQ(state.last_sequence(), 0x7FFF);
}

TEST_F(SsrcStateTest, SequenceWrapIsInOrder) {
    SsrcState state(0xFFFF);
    feed(state, 0, kAudible);
    EXPECT_EQ(state.last_sequence(), 0);
}

TEST_F(SsrcStateTest, DecodesSilentFrameToStereoPcm) {
    SsrcState state(0);
    SpeakingDelta delta = SpeakingDelta::SAME;
    ASSERT_TRUE(state.process(1, kSilent.data(), kSilent.size(), false, true, true, delta, audio, has_audio));
    EXPECT_TRUE(has_audio);
    EXPECT_EQ(audio.size(), STEREO_FRAME_SIZE);
}

TEST_F(SsrcStateTest, TruncatedExtensionFails) {
    SsrcState state(0);
    const std::vector<uint8_t> body = {0xBE, 0xDE, 0x00, 0x04, 0x01};
    SpeakingDelta delta = SpeakingDelta::SAME;
    EXPECT_FALSE(state.process(1, body.data(), body.size(), true, true, false, delta, audio, has_audio));
}

class UdpReceiverTest : public ::testing::Test {
protected:
    void SetUp() override {
        interconnect.core = std::make_shared<CoreQueue>();
        interconnect.events = std::make_shared<EventQueue>();
        interconnect.mixer = std::make_shared<MixerQueue>();
        cipher = std::make_shared<VoiceCipher>(std::vector<uint8_t>(CRYPTO_KEY_SIZE, 0x24));
    }

    std::unique_ptr<UdpReceiver> make_receiver(DecodeMode mode) {
        DriverConfig config;
        config.decode_mode = mode;
        return std::make_unique<UdpReceiver>(nullptr, cipher, CryptoMode::SUFFIX, config, interconnect,
                                             std::make_shared<UdpRxQueue>());
    }

    // Builds an encrypted voice packet the way a remote client would.
    std::vector<uint8_t> voice_packet(uint32_t ssrc, const std::vector<uint8_t>& payload) {
        MixerPacketBuffer buffer(ssrc);
        std::memcpy(buffer.payload(), payload.data(), payload.size());
        uint32_t nonce = 0;
        size_t len = 0;
        EXPECT_TRUE(cipher->encrypt_in_place(CryptoMode::SUFFIX, buffer.data(), RTP_HEADER_SIZE, payload.size(),
                                             buffer.capacity(), nonce, len));
        return std::vector<uint8_t>(buffer.data(), buffer.data() + len);
    }

    std::vector<EventContext> drain() {
        std::vector<EventContext> out;
        EventMessage msg;
        while (interconnect.events->try_pop(msg)) {
            EXPECT_EQ(msg.type, EventMessage::Type::FIRE_CORE_EVENT);
            out.push_back(std::move(msg.context));
        }
        return out;
    }

    Interconnect interconnect;
    std::shared_ptr<VoiceCipher> cipher;
};

TEST_F(UdpReceiverTest, DecryptedPacketFiresVoiceEvent) {
    auto receiver = make_receiver(DecodeMode::DECRYPT);
    auto packet = voice_packet(77, kAudible);
    receiver->handle_datagram(packet.data(), packet.size());

    auto events = drain();
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].kind, EventContext::Kind::SPEAKING_UPDATE);
    EXPECT_EQ(events[0].speaking_update.ssrc, 77u);
    EXPECT_TRUE(events[0].speaking_update.speaking);

    ASSERT_EQ(events[1].kind, EventContext::Kind::VOICE_PACKET);
    const VoicePacketData& voice = events[1].voice_packet;
    EXPECT_EQ(voice.ssrc, 77u);
    EXPECT_FALSE(voice.has_audio);
    EXPECT_EQ(voice.payload_offset, RTP_HEADER_SIZE + CRYPTO_TAG_SIZE);
    EXPECT_EQ(voice.payload_end_pad, CRYPTO_NONCE_SIZE);
    const std::vector<uint8_t> body(voice.packet.begin() + voice.payload_offset,
                                    voice.packet.end() - voice.payload_end_pad);
    EXPECT_EQ(body, kAudible);
    EXPECT_EQ(receiver->tracked_ssrc_count(), 1u);
}

TEST_F(UdpReceiverTest, DecodeModeProducesPcm) {
    auto receiver = make_receiver(DecodeMode::DECODE);
    auto packet = voice_packet(5, kSilent);
    receiver->handle_datagram(packet.data(), packet.size());

    auto events = drain();
    ASSERT_EQ(events.size(), 1u);
    ASSERT_EQ(events[0].kind, EventContext::Kind::VOICE_PACKET);
    EXPECT_TRUE(events[0].voice_packet.has_audio);
    EXPECT_EQ(events[0].voice_packet.audio.size(), STEREO_FRAME_SIZE);
}

TEST_F(UdpReceiverTest, RtcpPacketForwarded) {
    auto receiver = make_receiver(DecodeMode::PASS);
    std::vector<uint8_t> packet(RTCP_HEADER_SIZE + CRYPTO_TAG_SIZE + CRYPTO_NONCE_SIZE, 0);
    packet[0] = 0x80;
    packet[1] = 200;
    packet[4] = 0x00;
    packet[5] = 0x01;
    packet[6] = 0x02;
    packet[7] = 0x03;
    receiver->handle_datagram(packet.data(), packet.size());

    auto events = drain();
    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].kind, EventContext::Kind::RTCP_PACKET);
    EXPECT_EQ(events[0].rtcp_packet.packet_type, 200);
    EXPECT_EQ(events[0].rtcp_packet.ssrc, 0x00010203u);
    EXPECT_EQ(events[0].rtcp_packet.packet.size(), packet.size());
}

TEST_F(UdpReceiverTest, MalformedDatagramsAreDropped) {
    auto receiver = make_receiver(DecodeMode::DECRYPT);
    uint8_t junk[4] = {0x80, 0x00, 0x00, 0x00};
    receiver->handle_datagram(junk, sizeof(junk));

    std::vector<uint8_t> wrong_type(RTP_HEADER_SIZE + 32, 0);
    wrong_type[0] = 0x80;
    wrong_type[1] = 0x60;
    receiver->handle_datagram(wrong_type.data(), wrong_type.size());

    EXPECT_TRUE(drain().empty());
    EXPECT_EQ(receiver->tracked_ssrc_count(), 0u);
}
