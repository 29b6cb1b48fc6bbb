#include <gtest/gtest.h>
#include <algorithm>
#include <chrono>
#include <cstring>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>
#include "input/restartable.h"
#include "tracks/track.h"
#include "mocks/mock_network.h"

using namespace voicelink::voice;
using voicelink::voice::testing::TestPcmGenerator;
using namespace std::chrono_literals;

namespace {

// Each call hands out a forward-only reader over the same bytes, like re-running a child process.
class PipeRecreator {
public:
    explicit PipeRecreator(std::vector<uint8_t> bytes)
        : bytes_(std::make_shared<const std::vector<uint8_t>>(std::move(bytes))),
          calls_(std::make_shared<int>(0)) {}

    ByteSourceRecreator recreator() {
        auto bytes = bytes_;
        auto calls = calls_;
        return [bytes, calls]() -> std::unique_ptr<ByteSource> {
            ++*calls;
            auto offset = std::make_shared<std::size_t>(0);
            return std::make_unique<StreamByteSource>([bytes, offset](uint8_t* out, std::size_t len) {
                const std::size_t n = std::min(len, bytes->size() - *offset);
                std::memcpy(out, bytes->data() + *offset, n);
                *offset += n;
                return n;
            });
        };
    }

    int calls() const { return *calls_; }

private:
    std::shared_ptr<const std::vector<uint8_t>> bytes_;
    std::shared_ptr<int> calls_;
};

std::vector<uint8_t> counting_bytes(std::size_t n) {
    std::vector<uint8_t> out(n);
    for (std::size_t i = 0; i < n; ++i) {
        out[i] = static_cast<uint8_t>(i & 0xFF);
    }
    return out;
}

} // namespace

TEST(RestartableByteSourceTest, ForwardSeekSkipsWithoutRestart) {
    PipeRecreator pipe(counting_bytes(100000));
    RestartableByteSource source(pipe.recreator());
    EXPECT_TRUE(source.is_seekable());
    EXPECT_EQ(pipe.calls(), 1);

    ASSERT_TRUE(source.seek(40000));
    EXPECT_EQ(source.position(), 40000u);
    uint8_t byte = 0;
    ASSERT_EQ(source.read(&byte, 1), 1u);
    EXPECT_EQ(byte, static_cast<uint8_t>(40000 & 0xFF));
    EXPECT_EQ(pipe.calls(), 1);
    EXPECT_EQ(source.restart_count(), 1u);
}

TEST(RestartableByteSourceTest, BackwardSeekRecreatesReader) {
    PipeRecreator pipe(counting_bytes(1000));
    RestartableByteSource source(pipe.recreator());
    std::vector<uint8_t> buffer(600);
    ASSERT_EQ(source.read_full(buffer.data(), buffer.size()), 600u);

    ASSERT_TRUE(source.seek(10));
    EXPECT_EQ(pipe.calls(), 2);
    EXPECT_EQ(source.position(), 10u);
    uint8_t byte = 0;
    ASSERT_EQ(source.read(&byte, 1), 1u);
    EXPECT_EQ(byte, 10);
}

TEST(RestartableByteSourceTest, SeekPastEndFails) {
    PipeRecreator pipe(counting_bytes(64));
    RestartableByteSource source(pipe.recreator());
    EXPECT_FALSE(source.seek(65));
    // Rewinding still works afterwards.
    EXPECT_TRUE(source.seek(0));
    EXPECT_EQ(source.position(), 0u);
}

TEST(RestartableByteSourceTest, LazySourceCreatesOnFirstRead) {
    PipeRecreator pipe(counting_bytes(8));
    RestartableByteSource source(pipe.recreator(), true);
    EXPECT_EQ(pipe.calls(), 0);
    uint8_t buffer[8] = {};
    EXPECT_EQ(source.read_full(buffer, sizeof(buffer)), 8u);
    EXPECT_EQ(pipe.calls(), 1);
    EXPECT_EQ(buffer[7], 7);
}

TEST(RestartableByteSourceTest, FailedCreationIsReported) {
    EXPECT_THROW(RestartableByteSource(ByteSourceRecreator()), std::runtime_error);
    EXPECT_THROW(RestartableByteSource([] { return std::unique_ptr<ByteSource>(); }), std::runtime_error);

    int attempts = 0;
    RestartableByteSource lazy(
        [&attempts] {
            ++attempts;
            return std::unique_ptr<ByteSource>();
        },
        true);
    uint8_t byte = 0;
    EXPECT_EQ(lazy.read(&byte, 1), 0u);
    EXPECT_EQ(lazy.read(&byte, 1), 0u);
    EXPECT_EQ(attempts, 1);
    EXPECT_FALSE(lazy.seek(0));
    EXPECT_EQ(attempts, 2);
}

TEST(RestartableInputTest, SeekRewindsToSameSamples) {
    PipeRecreator pipe(TestPcmGenerator::sine(10, 440.0f));
    auto input = restartable_input(pipe.recreator(), true, CodecType::FLOAT_PCM, Container::raw());
    ASSERT_TRUE(input->is_seekable());

    std::vector<float> first(STEREO_FRAME_SIZE, 0.0f);
    ASSERT_EQ(input->mix(first, 1.0f), STEREO_FRAME_SIZE);
    std::vector<float> second(STEREO_FRAME_SIZE, 0.0f);
    input->mix(second, 1.0f);

    ASSERT_TRUE(input->seek_to_start());
    std::vector<float> replay(STEREO_FRAME_SIZE, 0.0f);
    input->mix(replay, 1.0f);
    EXPECT_EQ(replay, first);
    EXPECT_EQ(pipe.calls(), 2);

    ASSERT_EQ(input->seek_time(20ms), std::optional<std::chrono::milliseconds>(20ms));
    std::vector<float> skipped(STEREO_FRAME_SIZE, 0.0f);
    input->mix(skipped, 1.0f);
    EXPECT_EQ(skipped, second);
}

TEST(RestartableInputTest, TrackCanSeekAndLoop) {
    PipeRecreator pipe(TestPcmGenerator::sine(5, 440.0f));
    auto made = create_player(restartable_input(pipe.recreator(), true, CodecType::FLOAT_PCM, Container::raw()));
    EXPECT_TRUE(made.second.is_seekable());
    EXPECT_EQ(made.second.seek_time(40ms), TrackResult::OK);
    EXPECT_EQ(made.second.loop_for(2), TrackResult::OK);
    EXPECT_TRUE(made.first->set_loops(LoopState::finite(1)));
    EXPECT_TRUE(made.first->do_loop());
    EXPECT_EQ(made.first->seek_time(0ms), std::optional<std::chrono::milliseconds>(0ms));
    EXPECT_EQ(pipe.calls(), 2);
}
