/**
 * @file cached_source.h
 * @brief Sources read once into memory and replayed through any number of handles.
 */
#ifndef VOICELINK_CACHED_SOURCE_H
#define VOICELINK_CACHED_SOURCE_H

#include "input.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <variant>
#include <vector>

namespace voicelink {
namespace voice {

/**
 * @class MemorySource
 * @brief Keeps the source's bytes as they are, with its codec and container.
 */
class MemorySource {
public:
    /** @brief Reads `source` to its end. */
    explicit MemorySource(Input& source);

    /** @brief A new, independent `Input` positioned at the first frame. */
    std::unique_ptr<Input> to_input() const;

    /** @brief Another handle onto the same cached bytes. */
    MemorySource new_handle() const { return *this; }

    const std::optional<Metadata>& metadata() const { return metadata_; }
    std::size_t cached_size() const { return data_ ? data_->size() : 0; }

private:
    std::shared_ptr<const std::vector<uint8_t>> data_;
    std::optional<Metadata> metadata_;
    bool stereo_;
    CodecType codec_;
    Container container_;
};

/**
 * @class CompressedSource
 * @brief Stores the source re-encoded as Opus DCA frames.
 * @details The source is decoded to float PCM in 20 ms frames (the last zero padded) and
 *          each frame is encoded at `bitrate`. Inputs produced from it support passthrough.
 */
class CompressedSource {
public:
    /**
     * @throws std::runtime_error if the Opus encoder cannot be created or configured.
     */
    CompressedSource(Input& source, int bitrate);

    std::unique_ptr<Input> to_input() const;
    CompressedSource new_handle() const { return *this; }

    const std::optional<Metadata>& metadata() const { return metadata_; }
    std::size_t cached_size() const { return data_ ? data_->size() : 0; }

    /** @brief Number of 20 ms frames stored. */
    std::size_t frame_count() const { return frame_count_; }

private:
    std::shared_ptr<const std::vector<uint8_t>> data_;
    std::optional<Metadata> metadata_;
    bool stereo_ = true;
    std::size_t frame_count_ = 0;
};

/**
 * @brief Either kind of cache. Copies share the cached bytes, so a copy is a new handle.
 */
using CachedSource = std::variant<MemorySource, CompressedSource>;

std::unique_ptr<Input> cached_to_input(const CachedSource& source);
const std::optional<Metadata>& cached_metadata(const CachedSource& source);
std::size_t cached_size(const CachedSource& source);

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_CACHED_SOURCE_H
