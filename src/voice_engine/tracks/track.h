/**
 * @file track.h
 * @brief A playing source, owned by the mixer.
 */
#ifndef VOICELINK_TRACK_H
#define VOICELINK_TRACK_H

#include "track_handle.h"
#include "track_state.h"
#include "../events/event_scheduler.h"
#include "../input/input.h"

#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <utility>

namespace voicelink {
namespace voice {

/**
 * @class Track
 * @brief An `Input` with playback state, local event handlers and a command inbox.
 * @details Lives on the mixer thread. State changes made here are mirrored to the event
 *          scheduler as `CHANGE_STATE` messages so handlers see a consistent view.
 */
class Track {
public:
    Track(std::unique_ptr<Input> source, std::shared_ptr<TrackCommandQueue> commands, TrackHandle handle);
    ~Track();

    Track(const Track&) = delete;
    Track& operator=(const Track&) = delete;

    void play() { set_mode(PlayMode::PLAY); }
    void pause() { set_mode(PlayMode::PAUSE); }
    void stop() { set_mode(PlayMode::STOP); }
    /** @brief Marks the source as exhausted. */
    void end() { set_mode(PlayMode::END); }

    PlayMode playing() const { return playing_; }
    float volume() const { return volume_; }
    void set_volume(float volume) { volume_ = volume; }
    std::chrono::milliseconds position() const { return position_; }
    std::chrono::milliseconds play_time() const { return play_time_; }
    LoopState loops() const { return loops_; }

    /** @return false if the source cannot seek, in which case loops are unchanged. */
    bool set_loops(LoopState loops);

    TrackState state() const;

    /** @brief Advances position and play time by one frame. */
    void step_frame();

    /**
     * @brief Consumes one loop if any remain and the source can seek.
     * @return true if the caller should rewind the source.
     */
    bool do_loop();

    /** @brief Seeks the source, updating `position` on success. */
    std::optional<std::chrono::milliseconds> seek_time(std::chrono::milliseconds position);

    Input& source() { return *source_; }
    const TrackHandle& handle() const { return handle_; }

    /** @brief Moves the track's local handlers out, for the event scheduler. */
    EventStore take_events();

    /** @brief Local store, for registering handlers before the track is played. */
    EventStore& events() { return events_; }

    /**
     * @brief Applies all pending handle commands.
     * @param index Position of this track in the mixer, used to address state changes.
     * @param events Scheduler queue.
     * @return false if the scheduler queue is closed.
     */
    bool process_commands(std::size_t index, EventQueue& events);

    /** @brief Closes the command channel so handles observe the track as finished. */
    void close_commands();

private:
    void set_mode(PlayMode mode) { playing_ = play_mode_change_to(playing_, mode); }

    std::unique_ptr<Input> source_;
    std::shared_ptr<TrackCommandQueue> commands_;
    TrackHandle handle_;
    EventStore events_;
    PlayMode playing_ = PlayMode::PLAY;
    float volume_ = 1.0f;
    std::chrono::milliseconds position_{0};
    std::chrono::milliseconds play_time_{0};
    LoopState loops_;
};

/**
 * @brief Wraps a source in a new track and the handle controlling it.
 * @details The track starts in `PLAY` at unit volume with no loops.
 */
std::pair<std::unique_ptr<Track>, TrackHandle> create_player(std::unique_ptr<Input> source);

/** @brief Sends a state change for track `index`; false if the queue is closed. */
bool send_state_change(EventQueue& events, std::size_t index, const TrackStateChange& change);

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_TRACK_H
