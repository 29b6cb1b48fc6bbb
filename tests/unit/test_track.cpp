#include <gtest/gtest.h>
#include <chrono>
#include <future>
#include <memory>
#include <vector>
#include "tracks/track.h"
#include "mocks/mock_network.h"

using namespace voicelink::voice;
using voicelink::voice::testing::TestPcmGenerator;
using namespace std::chrono_literals;

class TrackTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto made = create_player(TestPcmGenerator::input(TestPcmGenerator::sine(10, 440.0f)));
        track = std::move(made.first);
        handle = made.second;
    }

    std::unique_ptr<Input> stream_input() {
        auto reader = std::make_unique<StreamByteSource>([](uint8_t*, size_t) -> size_t { return 0; });
        return std::make_unique<Input>(true, std::move(reader), CodecType::FLOAT_PCM, Container::raw());
    }

    std::vector<TrackStateChange> changes() {
        std::vector<TrackStateChange> out;
        EventMessage msg;
        while (events.try_pop(msg)) {
            if (msg.type == EventMessage::Type::CHANGE_STATE) {
                out.push_back(msg.change);
            }
        }
        return out;
    }

    EventQueue events;
    std::unique_ptr<Track> track;
    TrackHandle handle;
};

TEST_F(TrackTest, PlayModeTransitions) {
    EXPECT_EQ(track->playing(), PlayMode::PLAY);
    track->pause();
    EXPECT_EQ(track->playing(), PlayMode::PAUSE);
    track->play();
    EXPECT_EQ(track->playing(), PlayMode::PLAY);
    track->stop();
    EXPECT_EQ(track->playing(), PlayMode::STOP);
    // Done tracks never come back.
    track->play();
    EXPECT_EQ(track->playing(), PlayMode::STOP);
    track->end();
    EXPECT_EQ(track->playing(), PlayMode::STOP);
}

TEST_F(TrackTest, HandleCommandsApplyOnProcess) {
    EXPECT_EQ(handle.pause(), TrackResult::OK);
    EXPECT_EQ(handle.set_volume(0.5f), TrackResult::OK);
    EXPECT_EQ(track->playing(), PlayMode::PLAY);

    ASSERT_TRUE(track->process_commands(0, events));
    EXPECT_EQ(track->playing(), PlayMode::PAUSE);
    EXPECT_FLOAT_EQ(track->volume(), 0.5f);

    auto seen = changes();
    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0].type, TrackStateChange::Type::MODE);
    EXPECT_EQ(seen[0].mode, PlayMode::PAUSE);
    EXPECT_EQ(seen[1].type, TrackStateChange::Type::VOLUME);
}

TEST_F(TrackTest, SeekMovesPosition) {
    EXPECT_EQ(handle.seek_time(100ms), TrackResult::OK);
    ASSERT_TRUE(track->process_commands(0, events));
    EXPECT_EQ(track->position(), 100ms);

    auto seen = changes();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].type, TrackStateChange::Type::POSITION);
    EXPECT_EQ(seen[0].position, 100ms);
}

TEST_F(TrackTest, SeekingToCurrentPositionKeepsSamples) {
    auto reference = create_player(TestPcmGenerator::input(TestPcmGenerator::sine(10, 440.0f)));
    std::vector<float> skipped(STEREO_FRAME_SIZE, 0.0f);
    track->source().mix(skipped, 1.0f);
    reference.first->source().mix(skipped, 1.0f);

    ASSERT_EQ(track->seek_time(20ms), std::optional<std::chrono::milliseconds>(20ms));

    std::vector<float> after_seek(STEREO_FRAME_SIZE, 0.0f);
    std::vector<float> untouched(STEREO_FRAME_SIZE, 0.0f);
    track->source().mix(after_seek, 1.0f);
    reference.first->source().mix(untouched, 1.0f);
    EXPECT_EQ(after_seek, untouched);
}

TEST_F(TrackTest, LoopCommandIsUserSet) {
    EXPECT_EQ(handle.loop_for(3), TrackResult::OK);
    ASSERT_TRUE(track->process_commands(0, events));
    EXPECT_EQ(track->loops(), LoopState::finite(3));

    auto seen = changes();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].type, TrackStateChange::Type::LOOPS);
    EXPECT_TRUE(seen[0].user_set);
}

TEST_F(TrackTest, DoLoopCountsDown) {
    ASSERT_TRUE(track->set_loops(LoopState::finite(2)));
    EXPECT_TRUE(track->do_loop());
    EXPECT_TRUE(track->do_loop());
    EXPECT_FALSE(track->do_loop());

    ASSERT_TRUE(track->set_loops(LoopState::infinite()));
    for (int i = 0; i < 10; ++i) {
        EXPECT_TRUE(track->do_loop());
    }
}

TEST_F(TrackTest, UnseekableSourceRejectsSeekAndLoop) {
    auto made = create_player(stream_input());
    EXPECT_FALSE(made.second.is_seekable());
    EXPECT_EQ(made.second.seek_time(1s), TrackResult::SEEK_UNSUPPORTED);
    EXPECT_EQ(made.second.enable_loop(), TrackResult::SEEK_UNSUPPORTED);
    EXPECT_EQ(made.second.loop_for(2), TrackResult::SEEK_UNSUPPORTED);
    EXPECT_FALSE(made.first->set_loops(LoopState::infinite()));
    EXPECT_FALSE(made.first->do_loop());
}

TEST_F(TrackTest, CoreEventRejectedOnTrack) {
    auto handler = [](EventContext&) -> std::optional<Event> { return std::nullopt; };
    EXPECT_EQ(handle.add_event(Event::core(CoreEvent::VOICE_PACKET), handler), TrackResult::INVALID_TRACK_EVENT);
    EXPECT_EQ(handle.add_event(Event::track(TrackEvent::END), handler), TrackResult::OK);

    ASSERT_TRUE(track->process_commands(4, events));
    EventMessage msg;
    ASSERT_TRUE(events.try_pop(msg));
    EXPECT_EQ(msg.type, EventMessage::Type::ADD_TRACK_EVENT);
    EXPECT_EQ(msg.track_index, 4u);
}

TEST_F(TrackTest, ActionRunsOnTrackAndReportsTotal) {
    EXPECT_EQ(handle.action([](Track& t) { t.set_volume(0.25f); }), TrackResult::OK);
    ASSERT_TRUE(track->process_commands(0, events));
    EXPECT_FLOAT_EQ(track->volume(), 0.25f);

    auto seen = changes();
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0].type, TrackStateChange::Type::TOTAL);
    EXPECT_FLOAT_EQ(seen[0].total.volume, 0.25f);
}

TEST_F(TrackTest, GetInfoReturnsSnapshot) {
    track->step_frame();
    track->step_frame();
    std::future<TrackState> reply;
    ASSERT_EQ(handle.get_info(reply), TrackResult::OK);
    ASSERT_TRUE(track->process_commands(0, events));

    ASSERT_EQ(reply.wait_for(1s), std::future_status::ready);
    const TrackState state = reply.get();
    EXPECT_EQ(state.playing, PlayMode::PLAY);
    EXPECT_EQ(state.position, 40ms);
    EXPECT_EQ(state.play_time, 40ms);
}

TEST_F(TrackTest, HandleReportsFinishedOnceTrackIsGone) {
    TrackHandle copy = handle;
    track.reset();
    EXPECT_EQ(handle.play(), TrackResult::FINISHED);
    EXPECT_EQ(copy.set_volume(1.0f), TrackResult::FINISHED);
    std::future<TrackState> reply;
    EXPECT_EQ(copy.get_info(reply), TrackResult::FINISHED);
}

TEST_F(TrackTest, HandlesCompareById) {
    TrackHandle copy = handle;
    EXPECT_EQ(copy, handle);

    auto other = create_player(TestPcmGenerator::input(TestPcmGenerator::silence(1)));
    EXPECT_NE(other.second, handle);
    EXPECT_NE(other.second.id(), handle.id());
}

TEST_F(TrackTest, LocalStoreDropsCoreEvents) {
    auto handler = [](EventContext&) -> std::optional<Event> { return std::nullopt; };
    track->events().add_event(EventData(Event::core(CoreEvent::SPEAKING_UPDATE), handler), 0ms);
    track->events().add_event(EventData(Event::track(TrackEvent::END), handler), 0ms);
    EventStore taken = track->take_events();
    EXPECT_EQ(taken.untimed_count(), 1u);
    EXPECT_EQ(track->events().untimed_count(), 0u);
}
