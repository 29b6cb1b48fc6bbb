/**
 * @file event_store.h
 * @brief Storage and dispatch of event handlers, per track and driver-wide.
 */
#ifndef VOICELINK_EVENT_STORE_H
#define VOICELINK_EVENT_STORE_H

#include "event_context.h"
#include "event_data.h"

#include <chrono>
#include <cstddef>
#include <map>
#include <queue>
#include <utility>
#include <vector>

namespace voicelink {
namespace voice {

/**
 * @class EventStore
 * @brief Timed handlers ordered by activation time, untimed handlers grouped by event.
 * @details A store owned by a track is `local_only` and silently ignores core events.
 */
class EventStore {
public:
    explicit EventStore(bool local_only = false) : local_only_(local_only) {}

    static EventStore new_local() { return EventStore(true); }

    /**
     * @brief Registers a handler; timed events are scheduled relative to `now`.
     * @details `Event::cancel()` and, on a local store, core events are dropped.
     */
    void add_event(EventData evt, std::chrono::milliseconds now);

    /** @brief Runs every timed handler due at or before `now`. */
    void process_timed(std::chrono::milliseconds now, EventContext& ctx);

    /** @brief Runs every handler registered for `untimed_event`. */
    void process_untimed(std::chrono::milliseconds now, const Event& untimed_event, EventContext& ctx);

    bool has_due(std::chrono::milliseconds now) const;
    bool has_untimed(const Event& untimed_event) const;

    std::size_t timed_count() const { return timed_.size(); }
    std::size_t untimed_count() const;
    bool is_local_only() const { return local_only_; }

private:
    using UntimedKey = std::pair<int, int>;

    struct LaterFirst {
        bool operator()(const EventData& a, const EventData& b) const {
            return a.fire_time > b.fire_time;
        }
    };

    static UntimedKey untimed_key(const Event& evt);

    std::priority_queue<EventData, std::vector<EventData>, LaterFirst> timed_;
    std::map<UntimedKey, std::vector<EventData>> untimed_;
    bool local_only_;
};

/**
 * @class GlobalEvents
 * @brief The driver-wide store plus track events waiting for the next tick.
 */
class GlobalEvents {
public:
    void add_event(EventData evt);

    /** @brief Runs global handlers for the core event carried by `ctx`. */
    void fire_core_event(EventContext& ctx);

    /** @brief Queues a track event for track `index`; delivered on the next `tick`. */
    void fire_track_event(TrackEvent evt, std::size_t index);

    /**
     * @brief Advances time by one mixer frame and fires everything due.
     * @details Global timers run first, then the timers of each playing track (whose clocks
     *          are stepped), then queued track events, locally and globally.
     */
    void tick(std::vector<EventStore>& stores,
              std::vector<TrackState>& states,
              std::vector<TrackHandle>& handles);

    /** @brief Drops queued events for a removed track and shifts later indices down. */
    void remove_track(std::size_t index);

    void remove_all_tracks();

    std::chrono::milliseconds time() const { return time_; }
    EventStore& store() { return store_; }

private:
    EventStore store_;
    std::chrono::milliseconds time_{0};
    std::map<TrackEvent, std::vector<std::size_t>> awaiting_tick_;
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_EVENT_STORE_H
