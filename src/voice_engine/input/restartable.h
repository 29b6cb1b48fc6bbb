/**
 * @file restartable.h
 * @brief Makes a forward-only source seekable by recreating it and skipping ahead.
 */
#ifndef VOICELINK_RESTARTABLE_H
#define VOICELINK_RESTARTABLE_H

#include "byte_source.h"
#include "input.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace voicelink {
namespace voice {

/** @brief Produces a fresh reader positioned at byte 0, or null on failure. */
using ByteSourceRecreator = std::function<std::unique_ptr<ByteSource>()>;

/**
 * @class RestartableByteSource
 * @brief Wraps a non-seekable source such as a child process pipe.
 * @details A backward seek recreates the inner reader and then reads forward to the
 *          target; a forward seek only reads forward. Recreation runs on the caller's
 *          thread, so a slow recreator stalls whoever seeks.
 */
class RestartableByteSource : public ByteSource {
public:
    /**
     * @param lazy Defer the first recreation until the first read or seek.
     * @throws std::runtime_error if `recreate` is empty, or if it fails when not lazy.
     */
    explicit RestartableByteSource(ByteSourceRecreator recreate, bool lazy = false);

    std::size_t read(uint8_t* buffer, std::size_t len) override;
    bool is_seekable() const override { return true; }
    bool seek(uint64_t offset) override;
    uint64_t position() const override { return position_; }

    /** @brief Times the inner reader has been created. Only a seek retries after a failure. */
    std::size_t restart_count() const { return restarts_; }

private:
    bool restart();
    bool skip(uint64_t count);

    ByteSourceRecreator recreate_;
    std::unique_ptr<ByteSource> inner_;
    uint64_t position_ = 0;
    std::size_t restarts_ = 0;
    bool failed_ = false;
    std::vector<uint8_t> scratch_;
};

/**
 * @brief Builds an input over a restartable reader, so seeking and looping work.
 * @throws std::runtime_error as `RestartableByteSource` and `Input` do.
 */
std::unique_ptr<Input> restartable_input(ByteSourceRecreator recreate,
                                         bool stereo,
                                         CodecType codec,
                                         Container container,
                                         std::optional<Metadata> metadata = std::nullopt,
                                         bool lazy = false);

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_RESTARTABLE_H
