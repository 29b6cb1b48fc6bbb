#include "restartable.h"
#include "../utils/cpp_logger.h"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace voicelink {
namespace voice {

namespace {
constexpr std::size_t SKIP_CHUNK = 16 * 1024;
}

RestartableByteSource::RestartableByteSource(ByteSourceRecreator recreate, bool lazy)
    : recreate_(std::move(recreate)) {
    if (!recreate_) {
        throw std::runtime_error("Restartable source needs a recreator");
    }
    if (!lazy && !restart()) {
        throw std::runtime_error("Restartable source could not create its reader");
    }
}

bool RestartableByteSource::restart() {
    inner_ = recreate_();
    position_ = 0;
    failed_ = !inner_;
    if (failed_) {
        LOG_VL_ERROR("[Restartable] Recreating reader failed");
        return false;
    }
    ++restarts_;
    LOG_VL_DEBUG("[Restartable] Reader created (%zu)", restarts_);
    return true;
}

std::size_t RestartableByteSource::read(uint8_t* buffer, std::size_t len) {
    if (!inner_ && (failed_ || !restart())) {
        return 0;
    }
    const std::size_t n = inner_->read(buffer, len);
    position_ += n;
    return n;
}

bool RestartableByteSource::skip(uint64_t count) {
    scratch_.resize(SKIP_CHUNK);
    while (count > 0) {
        const std::size_t want = static_cast<std::size_t>(std::min<uint64_t>(count, scratch_.size()));
        const std::size_t n = inner_->read(scratch_.data(), want);
        if (n == 0) {
            return false;
        }
        position_ += n;
        count -= n;
    }
    return true;
}

bool RestartableByteSource::seek(uint64_t offset) {
    if (!inner_ || offset < position_) {
        if (!restart()) {
            return false;
        }
    }
    if (!skip(offset - position_)) {
        LOG_VL_WARNING("[Restartable] Stream ended before offset %llu",
                       static_cast<unsigned long long>(offset));
        return false;
    }
    return true;
}

std::unique_ptr<Input> restartable_input(ByteSourceRecreator recreate,
                                         bool stereo,
                                         CodecType codec,
                                         Container container,
                                         std::optional<Metadata> metadata,
                                         bool lazy) {
    auto reader = std::make_unique<RestartableByteSource>(std::move(recreate), lazy);
    return std::make_unique<Input>(stereo, std::move(reader), codec, std::move(container), std::move(metadata));
}

} // namespace voice
} // namespace voicelink
