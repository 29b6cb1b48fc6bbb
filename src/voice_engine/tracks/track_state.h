/**
 * @file track_state.h
 * @brief Playback state shared between a track, its handles and event handlers.
 */
#ifndef VOICELINK_TRACK_STATE_H
#define VOICELINK_TRACK_STATE_H

#include "../events/event.h"
#include "../voice_constants.h"

#include <chrono>
#include <cstddef>
#include <optional>

namespace voicelink {
namespace voice {

/**
 * @enum PlayMode
 * @brief Playback mode of a track. `STOP` and `END` are terminal.
 */
enum class PlayMode {
    PLAY,
    PAUSE,
    STOP, ///< Stopped by a handle.
    END   ///< The source ran out.
};

/** @brief Applies a transition; terminal modes absorb every change. */
inline PlayMode play_mode_change_to(PlayMode current, PlayMode next) {
    if (current == PlayMode::PLAY || current == PlayMode::PAUSE) {
        return next;
    }
    return current;
}

inline bool play_mode_is_done(PlayMode mode) {
    return mode == PlayMode::STOP || mode == PlayMode::END;
}

/** @brief Event fired when a track enters `mode`. */
inline TrackEvent play_mode_track_event(PlayMode mode) {
    switch (mode) {
        case PlayMode::PLAY: return TrackEvent::PLAY;
        case PlayMode::PAUSE: return TrackEvent::PAUSE;
        default: return TrackEvent::END;
    }
}

/**
 * @struct LoopState
 * @brief How many more times a track restarts when its source runs out.
 */
struct LoopState {
    enum class Kind {
        INFINITE,
        FINITE
    };
    Kind kind = Kind::FINITE;
    std::size_t remaining = 0;

    static LoopState infinite() {
        LoopState l;
        l.kind = Kind::INFINITE;
        return l;
    }
    static LoopState finite(std::size_t n) {
        LoopState l;
        l.remaining = n;
        return l;
    }

    bool operator==(const LoopState& o) const {
        return kind == o.kind && (kind == Kind::INFINITE || remaining == o.remaining);
    }
    bool operator!=(const LoopState& o) const { return !(*this == o); }
};

/**
 * @struct TrackState
 * @brief Snapshot of a track's playback.
 * @details `position` is the point reached in the source; `play_time` is how long the
 *          track has spent playing, and keeps growing across loops.
 */
struct TrackState {
    PlayMode playing = PlayMode::PLAY;
    float volume = 1.0f;
    std::chrono::milliseconds position{0};
    std::chrono::milliseconds play_time{0};
    LoopState loops;

    /** @brief Advances both clocks by one mixer tick. */
    void step_frame() {
        position += TIMESTEP_LENGTH;
        play_time += TIMESTEP_LENGTH;
    }
};

/**
 * @struct TrackStateChange
 * @brief A mutation of a track reported by the mixer to the event scheduler.
 */
struct TrackStateChange {
    enum class Type {
        MODE,
        VOLUME,
        POSITION,
        LOOPS, ///< `user_set` is false when the change came from an automatic loop.
        TOTAL
    };
    Type type = Type::TOTAL;
    PlayMode mode = PlayMode::PLAY;
    float volume = 1.0f;
    std::chrono::milliseconds position{0};
    LoopState loops;
    bool user_set = true;
    TrackState total;

    static TrackStateChange make_mode(PlayMode m) {
        TrackStateChange c; c.type = Type::MODE; c.mode = m; return c;
    }
    static TrackStateChange make_volume(float v) {
        TrackStateChange c; c.type = Type::VOLUME; c.volume = v; return c;
    }
    static TrackStateChange make_position(std::chrono::milliseconds p) {
        TrackStateChange c; c.type = Type::POSITION; c.position = p; return c;
    }
    static TrackStateChange make_loops(LoopState l, bool user_set) {
        TrackStateChange c; c.type = Type::LOOPS; c.loops = l; c.user_set = user_set; return c;
    }
    static TrackStateChange make_total(const TrackState& s) {
        TrackStateChange c; c.type = Type::TOTAL; c.total = s; return c;
    }
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_TRACK_STATE_H
