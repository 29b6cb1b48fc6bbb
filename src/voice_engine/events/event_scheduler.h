/**
 * @file event_scheduler.h
 * @brief Worker that owns all event stores and runs user handlers.
 * @details Handlers run on this thread only, so a slow handler delays other handlers but
 *          never the mixer.
 */
#ifndef VOICELINK_EVENT_SCHEDULER_H
#define VOICELINK_EVENT_SCHEDULER_H

#include "event_store.h"
#include "../utils/thread_safe_queue.h"
#include "../utils/voice_component.h"

#include <cstddef>
#include <memory>
#include <vector>

namespace voicelink {
namespace voice {

/**
 * @struct EventMessage
 * @brief One message to the event scheduler.
 */
struct EventMessage {
    enum class Type {
        ADD_GLOBAL_EVENT,
        ADD_TRACK,         ///< Sent by the mixer when a track is inserted; carries its store.
        ADD_TRACK_EVENT,
        FIRE_CORE_EVENT,
        CHANGE_STATE,
        REMOVE_TRACK,
        REMOVE_ALL_TRACKS,
        TICK,
        POISON
    };
    Type type = Type::TICK;
    std::size_t track_index = 0;
    EventData event;
    EventStore store{true};
    TrackState state;
    TrackHandle handle;
    TrackStateChange change;
    EventContext context;

    static EventMessage make(Type t) {
        EventMessage m;
        m.type = t;
        return m;
    }
};

using EventQueue = utils::ThreadSafeQueue<EventMessage>;

/**
 * @class EventScheduler
 * @brief Consumes `EventMessage`s until poisoned or its queue is closed.
 */
class EventScheduler : public VoiceComponent {
public:
    explicit EventScheduler(std::shared_ptr<EventQueue> queue);
    ~EventScheduler() override;

    void start() override;
    void stop() override;

    /** @brief Applies one message; returns false on `POISON`. Used directly by tests. */
    bool handle_message(EventMessage& msg);

    std::size_t track_count() const { return stores_.size(); }
    const std::vector<TrackState>& states() const { return states_; }
    GlobalEvents& global() { return global_; }

protected:
    void run() override;

private:
    void apply_change(std::size_t index, const TrackStateChange& change);

    std::shared_ptr<EventQueue> queue_;
    GlobalEvents global_;
    std::vector<EventStore> stores_;
    std::vector<TrackState> states_;
    std::vector<TrackHandle> handles_;
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_EVENT_SCHEDULER_H
