/**
 * @file event.h
 * @brief Event kinds user handlers can be registered against.
 */
#ifndef VOICELINK_EVENT_H
#define VOICELINK_EVENT_H

#include <chrono>
#include <optional>

namespace voicelink {
namespace voice {

/**
 * @enum TrackEvent
 * @brief Track lifecycle changes, fired in the tick after the mixer observed them.
 */
enum class TrackEvent {
    PLAY,
    PAUSE,
    END,
    LOOP
};

/**
 * @enum CoreEvent
 * @brief Connection-wide events raised by the receive path and the websocket.
 */
enum class CoreEvent {
    SPEAKING_STATE_UPDATE, ///< A remote user's Speaking payload (SSRC to user mapping).
    SPEAKING_UPDATE,       ///< A remote SSRC started or stopped producing audio.
    VOICE_PACKET,          ///< A received voice packet, decoded if configured.
    RTCP_PACKET,           ///< A received RTCP packet.
    CLIENT_CONNECT,        ///< A user joined the channel.
    CLIENT_DISCONNECT      ///< A user left the channel.
};

/**
 * @struct Event
 * @brief When a handler should fire.
 */
struct Event {
    enum class Kind {
        PERIODIC, ///< Every `duration`, first after `phase` if given.
        DELAYED,  ///< Once, after `duration`.
        TRACK,    ///< On a `TrackEvent`.
        CORE,     ///< On a `CoreEvent`; only valid on the global store.
        CANCEL    ///< Returned by a handler to remove itself.
    };

    Kind kind = Kind::CANCEL;
    std::chrono::milliseconds duration{0};
    std::optional<std::chrono::milliseconds> phase;
    TrackEvent track_event = TrackEvent::PLAY;
    CoreEvent core_event = CoreEvent::SPEAKING_UPDATE;

    static Event periodic(std::chrono::milliseconds period,
                          std::optional<std::chrono::milliseconds> phase = std::nullopt) {
        Event e;
        e.kind = Kind::PERIODIC;
        e.duration = period;
        e.phase = phase;
        return e;
    }

    static Event delayed(std::chrono::milliseconds delay) {
        Event e;
        e.kind = Kind::DELAYED;
        e.duration = delay;
        return e;
    }

    static Event track(TrackEvent evt) {
        Event e;
        e.kind = Kind::TRACK;
        e.track_event = evt;
        return e;
    }

    static Event core(CoreEvent evt) {
        Event e;
        e.kind = Kind::CORE;
        e.core_event = evt;
        return e;
    }

    static Event cancel() { return Event{}; }

    bool is_timed() const { return kind == Kind::PERIODIC || kind == Kind::DELAYED; }

    /** @brief Core events cannot be attached to a single track. */
    bool is_global_only() const { return kind == Kind::CORE; }

    bool operator==(const Event& o) const {
        if (kind != o.kind) {
            return false;
        }
        switch (kind) {
            case Kind::PERIODIC: return duration == o.duration && phase == o.phase;
            case Kind::DELAYED: return duration == o.duration;
            case Kind::TRACK: return track_event == o.track_event;
            case Kind::CORE: return core_event == o.core_event;
            case Kind::CANCEL: return true;
        }
        return false;
    }
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_EVENT_H
