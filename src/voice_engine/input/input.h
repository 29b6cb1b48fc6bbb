/**
 * @file input.h
 * @brief Audio sources consumed by tracks.
 * @details An `Input` couples a byte reader with a codec and a container format. All
 *          audio is 48 kHz, mono or stereo, consumed in 20 ms frames by the mixer.
 */
#ifndef VOICELINK_INPUT_H
#define VOICELINK_INPUT_H

#include "byte_source.h"
#include "metadata.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

struct OpusDecoder;

namespace voicelink {
namespace voice {

/**
 * @enum CodecType
 * @brief Encoding of the bytes an input yields.
 */
enum class CodecType {
    PCM,       ///< Signed 16-bit little-endian samples.
    FLOAT_PCM, ///< 32-bit little-endian float samples.
    OPUS       ///< Opus packets; requires a framing container.
};

/** @brief Bytes per sample for raw codecs; Opus inputs are measured in decoded f32. */
std::size_t codec_sample_len(CodecType codec);

/**
 * @struct Container
 * @brief How frames are delimited within the byte stream.
 */
struct Container {
    enum class Kind {
        RAW, ///< Back-to-back samples.
        DCA  ///< Opus frames each prefixed by a little-endian i16 length.
    };
    Kind kind = Kind::RAW;
    /** @brief Offset of the first frame after any DCA header. */
    uint64_t first_frame = 0;

    static Container raw() { return Container{}; }
    static Container dca(uint64_t first_frame) {
        Container c;
        c.kind = Kind::DCA;
        c.first_frame = first_frame;
        return c;
    }
};

/** @brief Samples covering `ms` milliseconds, interleaved if stereo. */
uint64_t timestamp_to_sample_count(std::chrono::milliseconds ms, bool stereo);

/** @brief Inverse of `timestamp_to_sample_count`. */
std::chrono::milliseconds sample_count_to_timestamp(uint64_t samples, bool stereo);

/** @brief Bytes of f32 audio covering `ms` milliseconds. */
uint64_t timestamp_to_byte_count(std::chrono::milliseconds ms, bool stereo);

/** @brief Duration of `bytes` bytes of f32 audio. */
std::chrono::milliseconds byte_count_to_timestamp(uint64_t bytes, bool stereo);

/**
 * @class OpusDecoderState
 * @brief Decoder and partially consumed frame for an Opus input.
 */
class OpusDecoderState {
public:
    /** @throws std::runtime_error if libopus cannot create the decoder. */
    explicit OpusDecoderState(bool stereo);
    ~OpusDecoderState();

    OpusDecoderState(const OpusDecoderState&) = delete;
    OpusDecoderState& operator=(const OpusDecoderState&) = delete;

    /** @brief Decodes one packet into the pending frame, replacing what was left. */
    bool decode(const uint8_t* packet, std::size_t len);

    /** @brief Copies up to `max` pending samples into `out`. */
    std::size_t take(float* out, std::size_t max);

    bool has_pending() const { return frame_pos_ < current_frame_.size(); }

    /** @brief Drops the pending frame and resets decoder history, e.g. after a seek. */
    void reset();

    bool allow_passthrough = true;

private:
    OpusDecoder* decoder_ = nullptr;
    int channels_;
    std::vector<float> current_frame_;
    std::size_t frame_pos_ = 0;
};

/**
 * @class Input
 * @brief A readable audio source owned by exactly one track.
 */
class Input {
public:
    /**
     * @brief Builds an input.
     * @throws std::runtime_error if the codec is Opus and the decoder cannot be created,
     *         or if Opus is paired with a raw container.
     */
    Input(bool stereo,
          std::unique_ptr<ByteSource> reader,
          CodecType codec,
          Container container,
          std::optional<Metadata> metadata = std::nullopt);
    ~Input();

    Input(const Input&) = delete;
    Input& operator=(const Input&) = delete;

    /** @brief Raw samples held in memory. */
    static std::unique_ptr<Input> from_bytes(std::shared_ptr<const std::vector<uint8_t>> bytes,
                                             bool stereo, CodecType codec, Container container);

    /** @throws std::runtime_error if the file cannot be opened. */
    static std::unique_ptr<Input> from_file(const std::string& path, bool stereo, CodecType codec);

    bool is_stereo() const { return stereo_; }
    CodecType codec() const { return codec_; }
    const Container& container() const { return container_; }
    const std::optional<Metadata>& metadata() const { return metadata_; }

    bool is_seekable() const;

    /** @brief Whether whole Opus frames can be sent without re-encoding. */
    bool supports_passthrough() const;

    /**
     * @brief Adds the next 20 ms of audio into a stereo accumulator.
     * @param buffer Interleaved stereo accumulator of `STEREO_FRAME_SIZE` samples.
     * @param volume Gain applied to each sample.
     * @return Stereo samples written; 0 when the source is exhausted.
     */
    std::size_t mix(std::vector<float>& buffer, float volume);

    /**
     * @brief Reads interleaved float samples in the source's own channel layout.
     * @return Samples read; 0 at end of stream.
     */
    std::size_t read_float_samples(float* out, std::size_t max_samples);

    /**
     * @brief Reads one whole Opus frame for passthrough.
     * @return false at end of stream or on a malformed frame.
     */
    bool read_opus_frame(std::vector<uint8_t>& out);

    /**
     * @brief Seeks to a point in time.
     * @return The position actually reached, or nullopt if unseekable or out of range.
     */
    std::optional<std::chrono::milliseconds> seek_time(std::chrono::milliseconds target);

    /** @brief Rewinds to the first frame. */
    bool seek_to_start();

    /** @brief Releases the underlying reader, e.g. for caching. */
    std::unique_ptr<ByteSource> take_reader() { return std::move(reader_); }

private:
    std::size_t read_raw_samples(float* out, std::size_t max_samples);
    std::size_t read_opus_samples(float* out, std::size_t max_samples);
    bool read_dca_frame(std::vector<uint8_t>& out);

    bool stereo_;
    std::unique_ptr<ByteSource> reader_;
    CodecType codec_;
    Container container_;
    std::optional<Metadata> metadata_;
    std::unique_ptr<OpusDecoderState> decoder_;
    std::vector<uint8_t> scratch_;
    std::vector<float> frame_scratch_;
};

/**
 * @brief Opens a DCA file: `DCA1` magic, i32 LE metadata length, JSON metadata, frames.
 * @throws std::runtime_error if the file is missing, the magic is wrong or the metadata
 *         is not valid JSON.
 */
std::unique_ptr<Input> dca_file(const std::string& path);

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_INPUT_H
