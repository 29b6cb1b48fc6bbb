#include <gtest/gtest.h>
#include <chrono>
#include <cstring>
#include <memory>
#include <thread>
#include <vector>
#include "mixer/voice_mixer.h"
#include "rtp/rtp_packet.h"
#include "mocks/mock_network.h"

using namespace voicelink::voice;
using voicelink::voice::testing::TestPcmGenerator;
using namespace std::chrono_literals;

class VoiceMixerTest : public ::testing::Test {
protected:
    void SetUp() override {
        interconnect.core = std::make_shared<CoreQueue>();
        interconnect.events = std::make_shared<EventQueue>();
        interconnect.mixer = std::make_shared<MixerQueue>();
        config.mixer_realtime_priority = false;
        mixer = std::make_unique<VoiceMixer>(interconnect, config);

        cipher = std::make_shared<VoiceCipher>(std::vector<uint8_t>(CRYPTO_KEY_SIZE, 0x42));
        udp_tx = std::make_shared<UdpTxQueue>();
        ws = std::make_shared<WsQueue>();
    }

    void connect(CryptoMode mode = CryptoMode::NORMAL) {
        MixerMessage set_ws;
        set_ws.type = MixerMessage::Type::WS;
        set_ws.ws = ws;
        ASSERT_TRUE(mixer->handle_message(set_ws));

        MixerMessage set_conn;
        set_conn.type = MixerMessage::Type::SET_CONN;
        set_conn.connection.cipher = cipher;
        set_conn.connection.crypto_mode = mode;
        set_conn.connection.ssrc = 0xABCD;
        set_conn.connection.udp_tx = udp_tx;
        ASSERT_TRUE(mixer->handle_message(set_conn));
        mode_ = mode;
    }

    void add_track(std::unique_ptr<Track> track) {
        MixerMessage msg;
        msg.type = MixerMessage::Type::ADD_TRACK;
        msg.track = std::move(track);
        ASSERT_TRUE(mixer->handle_message(msg));
    }

    void run_ticks(int n) {
        for (int i = 0; i < n; ++i) {
            mixer->cycle();
        }
    }

    std::vector<std::vector<uint8_t>> sent_packets() {
        std::vector<std::vector<uint8_t>> out;
        UdpTxMessage msg;
        while (udp_tx->try_pop(msg)) {
            out.push_back(msg.packet);
        }
        return out;
    }

    std::vector<uint8_t> decrypt_payload(std::vector<uint8_t> packet) {
        size_t offset = 0;
        size_t len = 0;
        EXPECT_TRUE(cipher->decrypt_in_place(mode_, packet.data(), RTP_HEADER_SIZE, packet.size(), offset, len));
        return std::vector<uint8_t>(packet.begin() + offset, packet.begin() + offset + len);
    }

    std::vector<bool> speaking_updates() {
        std::vector<bool> out;
        WsMessage msg;
        while (ws->try_pop(msg)) {
            if (msg.type == WsMessage::Type::SPEAKING) {
                out.push_back(msg.speaking);
            }
        }
        return out;
    }

    std::vector<EventMessage> drain_events() {
        std::vector<EventMessage> out;
        EventMessage msg;
        while (interconnect.events->try_pop(msg)) {
            out.push_back(std::move(msg));
        }
        return out;
    }

    Interconnect interconnect;
    DriverConfig config;
    std::unique_ptr<VoiceMixer> mixer;
    std::shared_ptr<VoiceCipher> cipher;
    std::shared_ptr<UdpTxQueue> udp_tx;
    std::shared_ptr<WsQueue> ws;
    CryptoMode mode_ = CryptoMode::NORMAL;
};

TEST_F(VoiceMixerTest, TicksFollowTwentyMillisecondCadence) {
    const auto start = std::chrono::steady_clock::now();
    connect();
    // The first tick is due at connection time, each later one a timestep after it.
    run_ticks(10);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    EXPECT_GE(elapsed, 9 * TIMESTEP_LENGTH);
    EXPECT_LT(elapsed, 9 * TIMESTEP_LENGTH + 40ms);
}

TEST_F(VoiceMixerTest, LateTickDoesNotShiftLaterDeadlines) {
    const auto start = std::chrono::steady_clock::now();
    connect();
    run_ticks(3);
    std::this_thread::sleep_for(60ms);
    run_ticks(7);
    const auto elapsed = std::chrono::steady_clock::now() - start;
    // Catching up on the missed deadlines lands on the original schedule.
    EXPECT_GE(elapsed, 9 * TIMESTEP_LENGTH);
    EXPECT_LT(elapsed, 9 * TIMESTEP_LENGTH + 40ms);
}

TEST_F(VoiceMixerTest, IdleWithoutTracksSendsNothing) {
    connect();
    run_ticks(3);
    EXPECT_TRUE(sent_packets().empty());
    EXPECT_TRUE(speaking_updates().empty());
}

TEST_F(VoiceMixerTest, SilentFramesThenAudioGiveContiguousPackets) {
    auto bytes = TestPcmGenerator::silence(4);
    auto tone = TestPcmGenerator::sine(1, 440.0f);
    bytes.insert(bytes.end(), tone.begin(), tone.end());
    add_track(create_player(TestPcmGenerator::input(bytes)).first);
    connect();

    run_ticks(5);

    auto packets = sent_packets();
    ASSERT_EQ(packets.size(), 5u);
    RtpInfo first;
    ASSERT_TRUE(parse_rtp_header(packets[0].data(), packets[0].size(), first));
    EXPECT_EQ(first.ssrc, 0xABCDu);
    for (size_t i = 1; i < packets.size(); ++i) {
        RtpInfo info;
        ASSERT_TRUE(parse_rtp_header(packets[i].data(), packets[i].size(), info));
        EXPECT_EQ(info.sequence, static_cast<uint16_t>(first.sequence + i));
        EXPECT_EQ(info.timestamp, static_cast<uint32_t>(first.timestamp + i * MONO_FRAME_SIZE));
    }

    const auto speaking = speaking_updates();
    ASSERT_EQ(speaking.size(), 1u);
    EXPECT_TRUE(speaking[0]);
}

TEST_F(VoiceMixerTest, SilenceBurstAfterLastAudioFrame) {
    add_track(create_player(TestPcmGenerator::input(TestPcmGenerator::sine(1, 440.0f))).first);
    connect();

    run_ticks(8);

    auto packets = sent_packets();
    ASSERT_EQ(packets.size(), 1u + SILENT_FRAME_BURST);
    for (size_t i = 1; i < packets.size(); ++i) {
        const auto payload = decrypt_payload(packets[i]);
        EXPECT_EQ(payload, std::vector<uint8_t>(SILENT_FRAME.begin(), SILENT_FRAME.end())) << "packet " << i;
    }
    EXPECT_EQ(speaking_updates(), (std::vector<bool>{true, false}));
    EXPECT_EQ(mixer->track_count(), 0u);
}

TEST_F(VoiceMixerTest, FiniteLoopReplaysSource) {
    auto made = create_player(TestPcmGenerator::input(TestPcmGenerator::sine(3, 440.0f)));
    ASSERT_TRUE(made.first->set_loops(LoopState::finite(2)));
    add_track(std::move(made.first));
    connect();

    run_ticks(10);

    auto packets = sent_packets();
    ASSERT_EQ(packets.size(), 10u);
    const std::vector<uint8_t> silent(SILENT_FRAME.begin(), SILENT_FRAME.end());
    size_t audio = 0;
    for (auto& packet : packets) {
        if (decrypt_payload(packet) != silent) {
            ++audio;
        }
    }
    EXPECT_EQ(audio, 9u);
    EXPECT_EQ(mixer->track_count(), 0u);

    size_t loop_changes = 0;
    bool ended = false;
    bool removed = false;
    for (auto& msg : drain_events()) {
        if (msg.type == EventMessage::Type::CHANGE_STATE) {
            if (msg.change.type == TrackStateChange::Type::LOOPS) {
                EXPECT_FALSE(msg.change.user_set);
                ++loop_changes;
            } else if (msg.change.type == TrackStateChange::Type::MODE) {
                ended = msg.change.mode == PlayMode::END;
            }
        } else if (msg.type == EventMessage::Type::REMOVE_TRACK) {
            removed = true;
        }
    }
    EXPECT_EQ(loop_changes, 2u);
    EXPECT_TRUE(ended);
    EXPECT_TRUE(removed);
}

TEST_F(VoiceMixerTest, OpusSourcePassesThroughUnchanged) {
    const std::vector<std::vector<uint8_t>> frames = {{0xFC, 0x01, 0x02, 0x03}, {0xFC, 0x04, 0x05}};
    auto bytes = std::make_shared<const std::vector<uint8_t>>(TestPcmGenerator::dca_frames(frames));
    add_track(create_player(Input::from_bytes(bytes, true, CodecType::OPUS, Container::dca(0))).first);
    connect(CryptoMode::LITE);

    run_ticks(2);

    auto packets = sent_packets();
    ASSERT_EQ(packets.size(), 2u);
    EXPECT_EQ(decrypt_payload(packets[0]), frames[0]);
    EXPECT_EQ(decrypt_payload(packets[1]), frames[1]);
}

TEST_F(VoiceMixerTest, MuteSuppressesAudio) {
    MixerMessage mute;
    mute.type = MixerMessage::Type::SET_MUTE;
    mute.mute = true;
    ASSERT_TRUE(mixer->handle_message(mute));
    EXPECT_TRUE(mixer->is_muted());

    add_track(create_player(TestPcmGenerator::input(TestPcmGenerator::sine(3, 440.0f))).first);
    connect();
    run_ticks(2);

    EXPECT_TRUE(sent_packets().empty());
    EXPECT_TRUE(speaking_updates().empty());
}

TEST_F(VoiceMixerTest, ClosedSendChannelRequestsFullReconnect) {
    add_track(create_player(TestPcmGenerator::input(TestPcmGenerator::sine(3, 440.0f))).first);
    connect();
    udp_tx->stop();

    run_ticks(1);

    EXPECT_FALSE(mixer->has_connection());
    CoreMessage msg;
    ASSERT_TRUE(interconnect.core->try_pop(msg));
    EXPECT_EQ(msg.type, CoreMessage::Type::FULL_RECONNECT);
}

TEST_F(VoiceMixerTest, SetTrackReplacesPlayingTracks) {
    auto first = create_player(TestPcmGenerator::input(TestPcmGenerator::sine(50, 440.0f)));
    TrackHandle first_handle = first.second;
    add_track(std::move(first.first));
    add_track(create_player(TestPcmGenerator::input(TestPcmGenerator::sine(50, 220.0f))).first);
    EXPECT_EQ(mixer->track_count(), 2u);

    MixerMessage set;
    set.type = MixerMessage::Type::SET_TRACK;
    set.track = create_player(TestPcmGenerator::input(TestPcmGenerator::sine(50, 330.0f))).first;
    ASSERT_TRUE(mixer->handle_message(set));
    EXPECT_EQ(mixer->track_count(), 1u);
    EXPECT_EQ(first_handle.play(), TrackResult::FINISHED);

    MixerMessage clear;
    clear.type = MixerMessage::Type::SET_TRACK;
    ASSERT_TRUE(mixer->handle_message(clear));
    EXPECT_EQ(mixer->track_count(), 0u);
}

TEST_F(VoiceMixerTest, BitrateChangeRebuildsEncoder) {
    EXPECT_EQ(mixer->bitrate(), DEFAULT_BITRATE);
    MixerMessage msg;
    msg.type = MixerMessage::Type::SET_BITRATE;
    msg.bitrate = 64000;
    ASSERT_TRUE(mixer->handle_message(msg));
    EXPECT_EQ(mixer->bitrate(), 64000);
}

TEST_F(VoiceMixerTest, PoisonStopsMessageHandling) {
    MixerMessage msg;
    msg.type = MixerMessage::Type::POISON;
    EXPECT_FALSE(mixer->handle_message(msg));
}
