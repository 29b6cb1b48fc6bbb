#include "input.h"
#include "../utils/cpp_logger.h"
#include "../voice_constants.h"

#include <opus/opus.h>

#include <algorithm>
#include <cstring>
#include <stdexcept>

namespace voicelink {
namespace voice {

namespace {
// Longest Opus frame (120 ms) per channel.
constexpr int kMaxOpusFrameSamples = 5760;
constexpr int kSamplesPerMs = SAMPLE_RATE / 1000;
} // namespace

std::size_t codec_sample_len(CodecType codec) {
    switch (codec) {
        case CodecType::PCM: return sizeof(int16_t);
        case CodecType::FLOAT_PCM: return sizeof(float);
        case CodecType::OPUS: return sizeof(float);
    }
    return sizeof(float);
}

uint64_t timestamp_to_sample_count(std::chrono::milliseconds ms, bool stereo) {
    const uint64_t mono = static_cast<uint64_t>(std::max<int64_t>(ms.count(), 0)) * kSamplesPerMs;
    return mono << (stereo ? 1 : 0);
}

std::chrono::milliseconds sample_count_to_timestamp(uint64_t samples, bool stereo) {
    const uint64_t mono = samples >> (stereo ? 1 : 0);
    return std::chrono::milliseconds(static_cast<int64_t>(mono / kSamplesPerMs));
}

uint64_t timestamp_to_byte_count(std::chrono::milliseconds ms, bool stereo) {
    return timestamp_to_sample_count(ms, stereo) * sizeof(float);
}

std::chrono::milliseconds byte_count_to_timestamp(uint64_t bytes, bool stereo) {
    return sample_count_to_timestamp(bytes / sizeof(float), stereo);
}

// --- OpusDecoderState ---

OpusDecoderState::OpusDecoderState(bool stereo) : channels_(stereo ? 2 : 1) {
    int error = 0;
    decoder_ = opus_decoder_create(SAMPLE_RATE, channels_, &error);
    if (error != OPUS_OK || decoder_ == nullptr) {
        throw std::runtime_error(std::string("Failed to create Opus decoder: ") + opus_strerror(error));
    }
    current_frame_.reserve(static_cast<std::size_t>(kMaxOpusFrameSamples * channels_));
}

OpusDecoderState::~OpusDecoderState() {
    if (decoder_) {
        opus_decoder_destroy(decoder_);
    }
}

bool OpusDecoderState::decode(const uint8_t* packet, std::size_t len) {
    current_frame_.resize(static_cast<std::size_t>(kMaxOpusFrameSamples * channels_));
    const int decoded = opus_decode_float(decoder_, packet, static_cast<opus_int32>(len),
                                          current_frame_.data(), kMaxOpusFrameSamples, 0);
    if (decoded < 0) {
        LOG_VL_WARNING("[OpusDecoderState] Opus decoding failed: %s", opus_strerror(decoded));
        current_frame_.clear();
        frame_pos_ = 0;
        return false;
    }
    current_frame_.resize(static_cast<std::size_t>(decoded * channels_));
    frame_pos_ = 0;
    return true;
}

std::size_t OpusDecoderState::take(float* out, std::size_t max) {
    const std::size_t n = std::min(max, current_frame_.size() - frame_pos_);
    std::memcpy(out, current_frame_.data() + frame_pos_, n * sizeof(float));
    frame_pos_ += n;
    return n;
}

void OpusDecoderState::reset() {
    opus_decoder_ctl(decoder_, OPUS_RESET_STATE);
    current_frame_.clear();
    frame_pos_ = 0;
}

// --- Input ---

Input::Input(bool stereo,
             std::unique_ptr<ByteSource> reader,
             CodecType codec,
             Container container,
             std::optional<Metadata> metadata)
    : stereo_(stereo),
      reader_(std::move(reader)),
      codec_(codec),
      container_(container),
      metadata_(std::move(metadata)) {
    if (!reader_) {
        throw std::runtime_error("Input requires a byte reader");
    }
    if (codec_ == CodecType::OPUS) {
        if (container_.kind != Container::Kind::DCA) {
            throw std::runtime_error("Opus input requires a framed container");
        }
        decoder_ = std::make_unique<OpusDecoderState>(stereo_);
    }
}

Input::~Input() = default;

std::unique_ptr<Input> Input::from_bytes(std::shared_ptr<const std::vector<uint8_t>> bytes,
                                         bool stereo, CodecType codec, Container container) {
    auto reader = std::make_unique<MemoryByteSource>(std::move(bytes), container.first_frame);
    return std::make_unique<Input>(stereo, std::move(reader), codec, container);
}

std::unique_ptr<Input> Input::from_file(const std::string& path, bool stereo, CodecType codec) {
    auto reader = std::make_unique<FileByteSource>(path);
    return std::make_unique<Input>(stereo, std::move(reader), codec, Container::raw());
}

bool Input::is_seekable() const {
    return reader_ && reader_->is_seekable();
}

bool Input::supports_passthrough() const {
    return codec_ == CodecType::OPUS && container_.kind == Container::Kind::DCA &&
           decoder_ && decoder_->allow_passthrough;
}

std::size_t Input::mix(std::vector<float>& buffer, float volume) {
    const std::size_t want = stereo_ ? STEREO_FRAME_SIZE : MONO_FRAME_SIZE;
    if (buffer.size() < STEREO_FRAME_SIZE) {
        buffer.resize(STEREO_FRAME_SIZE, 0.0f);
    }
    frame_scratch_.resize(want);
    const std::size_t got = read_float_samples(frame_scratch_.data(), want);

    if (stereo_) {
        for (std::size_t i = 0; i < got; ++i) {
            buffer[i] += volume * frame_scratch_[i];
        }
        return got;
    }
    for (std::size_t i = 0; i < got; ++i) {
        const float sample = volume * frame_scratch_[i];
        buffer[2 * i] += sample;
        buffer[2 * i + 1] += sample;
    }
    return got * 2;
}

std::size_t Input::read_float_samples(float* out, std::size_t max_samples) {
    if (!reader_ || max_samples == 0) {
        return 0;
    }
    if (codec_ == CodecType::OPUS) {
        return read_opus_samples(out, max_samples);
    }
    return read_raw_samples(out, max_samples);
}

std::size_t Input::read_raw_samples(float* out, std::size_t max_samples) {
    const std::size_t sample_len = codec_sample_len(codec_);
    scratch_.resize(max_samples * sample_len);
    const std::size_t bytes = reader_->read_full(scratch_.data(), scratch_.size());
    // A trailing partial sample is dropped.
    const std::size_t samples = bytes / sample_len;

    if (codec_ == CodecType::PCM) {
        for (std::size_t i = 0; i < samples; ++i) {
            const uint16_t lo = scratch_[2 * i];
            const uint16_t hi = scratch_[2 * i + 1];
            const int16_t value = static_cast<int16_t>(lo | (hi << 8));
            out[i] = static_cast<float>(value) / 32768.0f;
        }
    } else {
        for (std::size_t i = 0; i < samples; ++i) {
            uint32_t bits = static_cast<uint32_t>(scratch_[4 * i]) |
                            (static_cast<uint32_t>(scratch_[4 * i + 1]) << 8) |
                            (static_cast<uint32_t>(scratch_[4 * i + 2]) << 16) |
                            (static_cast<uint32_t>(scratch_[4 * i + 3]) << 24);
            std::memcpy(&out[i], &bits, sizeof(float));
        }
    }
    return samples;
}

std::size_t Input::read_opus_samples(float* out, std::size_t max_samples) {
    std::size_t total = 0;
    while (total < max_samples) {
        if (!decoder_->has_pending()) {
            if (!read_dca_frame(scratch_)) {
                break;
            }
            if (!decoder_->decode(scratch_.data(), scratch_.size())) {
                continue;
            }
        }
        total += decoder_->take(out + total, max_samples - total);
    }
    return total;
}

bool Input::read_dca_frame(std::vector<uint8_t>& out) {
    uint8_t len_bytes[2];
    if (reader_->read_full(len_bytes, sizeof(len_bytes)) != sizeof(len_bytes)) {
        return false;
    }
    const int16_t frame_len = static_cast<int16_t>(len_bytes[0] | (len_bytes[1] << 8));
    if (frame_len <= 0) {
        LOG_VL_WARNING("[Input] Invalid DCA frame length %d", frame_len);
        return false;
    }
    out.resize(static_cast<std::size_t>(frame_len));
    return reader_->read_full(out.data(), out.size()) == out.size();
}

bool Input::read_opus_frame(std::vector<uint8_t>& out) {
    if (!supports_passthrough()) {
        return false;
    }
    if (decoder_->has_pending()) {
        decoder_->reset();
    }
    return read_dca_frame(out);
}

std::optional<std::chrono::milliseconds> Input::seek_time(std::chrono::milliseconds target) {
    if (!is_seekable()) {
        return std::nullopt;
    }
    if (target.count() < 0) {
        target = std::chrono::milliseconds(0);
    }

    if (container_.kind == Container::Kind::RAW) {
        const uint64_t offset = container_.first_frame +
                                timestamp_to_sample_count(target, stereo_) * codec_sample_len(codec_);
        if (!reader_->seek(offset)) {
            return std::nullopt;
        }
        return target;
    }

    if (!reader_->seek(container_.first_frame)) {
        return std::nullopt;
    }
    if (decoder_) {
        decoder_->reset();
    }
    const int64_t frames = target.count() / FRAME_LEN_MS;
    int64_t skipped = 0;
    while (skipped < frames && read_dca_frame(scratch_)) {
        ++skipped;
    }
    return std::chrono::milliseconds(skipped * FRAME_LEN_MS);
}

bool Input::seek_to_start() {
    return seek_time(std::chrono::milliseconds(0)).has_value();
}

std::unique_ptr<Input> dca_file(const std::string& path) {
    auto reader = std::make_unique<FileByteSource>(path);

    uint8_t header[8];
    if (reader->read_full(header, sizeof(header)) != sizeof(header) ||
        std::memcmp(header, "DCA1", 4) != 0) {
        throw std::runtime_error("Not a DCA1 file: " + path);
    }
    const int32_t meta_len = static_cast<int32_t>(
        static_cast<uint32_t>(header[4]) | (static_cast<uint32_t>(header[5]) << 8) |
        (static_cast<uint32_t>(header[6]) << 16) | (static_cast<uint32_t>(header[7]) << 24));
    if (meta_len < 0) {
        throw std::runtime_error("Negative DCA metadata length in " + path);
    }

    std::string meta_text(static_cast<std::size_t>(meta_len), '\0');
    if (reader->read_full(reinterpret_cast<uint8_t*>(&meta_text[0]), meta_text.size()) != meta_text.size()) {
        throw std::runtime_error("Truncated DCA metadata in " + path);
    }
    Metadata metadata = Metadata::from_dca_json(meta_text);
    const bool stereo = metadata.channels.value_or(2) == 2;

    LOG_VL_DEBUG("[Input] Opened DCA file %s (%s)", path.c_str(), stereo ? "stereo" : "mono");
    return std::make_unique<Input>(stereo, std::move(reader), CodecType::OPUS,
                                   Container::dca(sizeof(header) + static_cast<uint64_t>(meta_len)),
                                   std::move(metadata));
}

} // namespace voice
} // namespace voicelink
