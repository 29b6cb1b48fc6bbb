/**
 * @file track_handle.h
 * @brief Commands sent to a track inside the mixer, and the handle that sends them.
 */
#ifndef VOICELINK_TRACK_HANDLE_H
#define VOICELINK_TRACK_HANDLE_H

#include "track_state.h"
#include "../events/event_data.h"
#include "../utils/thread_safe_queue.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>

namespace voicelink {
namespace voice {

class Track;

/**
 * @enum TrackResult
 * @brief Outcome of a handle operation.
 */
enum class TrackResult {
    OK,
    FINISHED,            ///< The track has been removed from the mixer.
    SEEK_UNSUPPORTED,    ///< Seek or loop on a source that cannot seek.
    INVALID_TRACK_EVENT  ///< A global-only event was attached to a track.
};

const char* track_result_name(TrackResult result);

/**
 * @struct TrackCommand
 * @brief One message on a track's command channel.
 */
struct TrackCommand {
    enum class Type {
        PLAY,
        PAUSE,
        STOP,
        VOLUME,
        SEEK,
        ADD_EVENT,
        DO,      ///< Run `action` against the track on the mixer thread.
        REQUEST, ///< Fulfil `reply` with a state snapshot.
        LOOP
    };
    Type type = Type::PLAY;
    float volume = 1.0f;
    std::chrono::milliseconds seek_to{0};
    EventData event;
    std::function<void(Track&)> action;
    std::shared_ptr<std::promise<TrackState>> reply;
    LoopState loops;
};

using TrackCommandQueue = utils::ThreadSafeQueue<TrackCommand>;

/**
 * @class TrackHandle
 * @brief Cheap, copyable controller for one track.
 * @details Every copy shares the track's command channel. Once the track has been removed
 *          from the mixer the channel is closed and operations return `FINISHED`.
 */
class TrackHandle {
public:
    TrackHandle() = default;
    TrackHandle(std::shared_ptr<TrackCommandQueue> commands, bool seekable, uint64_t id);

    TrackResult play();
    TrackResult pause();
    TrackResult stop();
    TrackResult set_volume(float volume);

    /** @brief Seeks the source; rejected locally if the source cannot seek. */
    TrackResult seek_time(std::chrono::milliseconds position);

    TrackResult enable_loop();
    TrackResult disable_loop();
    TrackResult loop_for(std::size_t count);

    /** @brief Attaches a handler to this track; core events are rejected. */
    TrackResult add_event(const Event& event, EventHandler handler);

    /** @brief Runs `action` on the mixer thread with exclusive access to the track. */
    TrackResult action(std::function<void(Track&)> action);

    /**
     * @brief Asks the mixer for a snapshot.
     * @param reply Receives the future; it is broken if the track ends before answering.
     */
    TrackResult get_info(std::future<TrackState>& reply);

    bool is_seekable() const { return seekable_; }
    uint64_t id() const { return id_; }

    bool operator==(const TrackHandle& o) const { return id_ == o.id_; }
    bool operator!=(const TrackHandle& o) const { return id_ != o.id_; }

private:
    TrackResult send(TrackCommand command);

    std::shared_ptr<TrackCommandQueue> commands_;
    bool seekable_ = false;
    uint64_t id_ = 0;
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_TRACK_HANDLE_H
