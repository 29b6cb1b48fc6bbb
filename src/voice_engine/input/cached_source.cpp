#include "cached_source.h"
#include "../utils/cpp_logger.h"
#include "../voice_constants.h"

#include <opus/opus.h>

#include <algorithm>
#include <stdexcept>

namespace voicelink {
namespace voice {

namespace {
constexpr std::size_t kReadChunk = 64 * 1024;
// Generous upper bound for one encoded 20 ms frame.
constexpr int kMaxPacketSize = 4000;
} // namespace

// --- MemorySource ---

MemorySource::MemorySource(Input& source)
    : metadata_(source.metadata()),
      stereo_(source.is_stereo()),
      codec_(source.codec()),
      container_(source.container()) {
    std::unique_ptr<ByteSource> reader = source.take_reader();
    auto bytes = std::make_shared<std::vector<uint8_t>>();
    if (reader) {
        std::vector<uint8_t> chunk(kReadChunk);
        std::size_t n = 0;
        while ((n = reader->read(chunk.data(), chunk.size())) > 0) {
            bytes->insert(bytes->end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(n));
        }
    }
    // Only the bytes after the reader's position were copied, so frames now start at 0.
    container_.first_frame = 0;
    data_ = std::move(bytes);
    LOG_VL_DEBUG("[MemorySource] Cached %zu bytes", data_->size());
}

std::unique_ptr<Input> MemorySource::to_input() const {
    auto reader = std::make_unique<MemoryByteSource>(data_, container_.first_frame);
    return std::make_unique<Input>(stereo_, std::move(reader), codec_, container_, metadata_);
}

// --- CompressedSource ---

CompressedSource::CompressedSource(Input& source, int bitrate)
    : metadata_(source.metadata()), stereo_(source.is_stereo()) {
    const int channels = source.is_stereo() ? 2 : 1;
    int error = 0;
    OpusEncoder* encoder = opus_encoder_create(SAMPLE_RATE, channels, OPUS_APPLICATION_AUDIO, &error);
    if (error != OPUS_OK || encoder == nullptr) {
        throw std::runtime_error(std::string("Failed to create Opus encoder: ") + opus_strerror(error));
    }
    if (opus_encoder_ctl(encoder, OPUS_SET_BITRATE(bitrate)) != OPUS_OK) {
        opus_encoder_destroy(encoder);
        throw std::runtime_error("Invalid Opus bitrate " + std::to_string(bitrate));
    }

    const std::size_t frame_samples = MONO_FRAME_SIZE * static_cast<std::size_t>(channels);
    std::vector<float> pcm(frame_samples);
    std::vector<uint8_t> packet(kMaxPacketSize);
    auto bytes = std::make_shared<std::vector<uint8_t>>();

    while (true) {
        std::size_t got = 0;
        while (got < frame_samples) {
            const std::size_t n = source.read_float_samples(pcm.data() + got, frame_samples - got);
            if (n == 0) {
                break;
            }
            got += n;
        }
        if (got == 0) {
            break;
        }
        std::fill(pcm.begin() + static_cast<std::ptrdiff_t>(got), pcm.end(), 0.0f);

        const opus_int32 encoded = opus_encode_float(encoder, pcm.data(), static_cast<int>(MONO_FRAME_SIZE),
                                                     packet.data(), kMaxPacketSize);
        if (encoded < 0) {
            LOG_VL_ERROR("[CompressedSource] Opus encoding failed: %s", opus_strerror(encoded));
            opus_encoder_destroy(encoder);
            throw std::runtime_error("Opus encoding failed while caching source");
        }
        bytes->push_back(static_cast<uint8_t>(encoded & 0xFF));
        bytes->push_back(static_cast<uint8_t>((encoded >> 8) & 0xFF));
        bytes->insert(bytes->end(), packet.begin(), packet.begin() + encoded);
        ++frame_count_;

        if (got < frame_samples) {
            break;
        }
    }
    opus_encoder_destroy(encoder);

    data_ = std::move(bytes);
    LOG_VL_DEBUG("[CompressedSource] Cached %zu frames in %zu bytes", frame_count_, data_->size());
}

std::unique_ptr<Input> CompressedSource::to_input() const {
    auto reader = std::make_unique<MemoryByteSource>(data_, 0);
    return std::make_unique<Input>(stereo_, std::move(reader), CodecType::OPUS, Container::dca(0), metadata_);
}

// --- CachedSource ---

std::unique_ptr<Input> cached_to_input(const CachedSource& source) {
    return std::visit([](const auto& cache) { return cache.to_input(); }, source);
}

const std::optional<Metadata>& cached_metadata(const CachedSource& source) {
    return std::visit([](const auto& cache) -> const std::optional<Metadata>& { return cache.metadata(); },
                      source);
}

std::size_t cached_size(const CachedSource& source) {
    return std::visit([](const auto& cache) { return cache.cached_size(); }, source);
}

} // namespace voice
} // namespace voicelink
