#include "event_scheduler.h"
#include "../utils/cpp_logger.h"

namespace voicelink {
namespace voice {

EventScheduler::EventScheduler(std::shared_ptr<EventQueue> queue) : queue_(std::move(queue)) {}

EventScheduler::~EventScheduler() {
    stop();
}

void EventScheduler::start() {
    if (component_thread_.joinable()) {
        return;
    }
    stop_flag_ = false;
    component_thread_ = std::thread(&EventScheduler::run, this);
}

void EventScheduler::stop() {
    stop_flag_ = true;
    if (queue_) {
        queue_->stop();
    }
    join_component_thread();
}

void EventScheduler::run() {
    LOG_VL_INFO("[EventScheduler] Thread started");
    EventMessage msg;
    while (!stop_flag_ && queue_->pop(msg)) {
        if (!handle_message(msg)) {
            break;
        }
    }
    LOG_VL_INFO("[EventScheduler] Thread exited");
}

bool EventScheduler::handle_message(EventMessage& msg) {
    switch (msg.type) {
        case EventMessage::Type::ADD_GLOBAL_EVENT:
            LOG_VL_DEBUG("[EventScheduler] Global event added");
            global_.add_event(std::move(msg.event));
            break;

        case EventMessage::Type::ADD_TRACK:
            stores_.push_back(std::move(msg.store));
            states_.push_back(msg.state);
            handles_.push_back(msg.handle);
            LOG_VL_DEBUG("[EventScheduler] Event state for track %zu added", stores_.size());
            break;

        case EventMessage::Type::ADD_TRACK_EVENT:
            if (msg.track_index >= stores_.size()) {
                LOG_VL_ERROR("[EventScheduler] AddTrackEvent for unknown track %zu", msg.track_index);
                break;
            }
            stores_[msg.track_index].add_event(std::move(msg.event), states_[msg.track_index].play_time);
            break;

        case EventMessage::Type::FIRE_CORE_EVENT:
            global_.fire_core_event(msg.context);
            break;

        case EventMessage::Type::CHANGE_STATE:
            if (msg.track_index >= states_.size()) {
                LOG_VL_ERROR("[EventScheduler] ChangeState for unknown track %zu", msg.track_index);
                break;
            }
            apply_change(msg.track_index, msg.change);
            break;

        case EventMessage::Type::REMOVE_TRACK:
            if (msg.track_index >= stores_.size()) {
                LOG_VL_ERROR("[EventScheduler] RemoveTrack for unknown track %zu", msg.track_index);
                break;
            }
            LOG_VL_DEBUG("[EventScheduler] Event state for track %zu of %zu removed",
                         msg.track_index, stores_.size());
            stores_.erase(stores_.begin() + static_cast<std::ptrdiff_t>(msg.track_index));
            states_.erase(states_.begin() + static_cast<std::ptrdiff_t>(msg.track_index));
            handles_.erase(handles_.begin() + static_cast<std::ptrdiff_t>(msg.track_index));
            global_.remove_track(msg.track_index);
            break;

        case EventMessage::Type::REMOVE_ALL_TRACKS:
            LOG_VL_DEBUG("[EventScheduler] Event state for all tracks removed");
            stores_.clear();
            states_.clear();
            handles_.clear();
            global_.remove_all_tracks();
            break;

        case EventMessage::Type::TICK:
            global_.tick(stores_, states_, handles_);
            break;

        case EventMessage::Type::POISON:
            return false;
    }
    return true;
}

void EventScheduler::apply_change(std::size_t index, const TrackStateChange& change) {
    TrackState& state = states_[index];
    switch (change.type) {
        case TrackStateChange::Type::MODE: {
            const PlayMode old = state.playing;
            state.playing = change.mode;
            if (old != change.mode) {
                global_.fire_track_event(play_mode_track_event(change.mode), index);
            }
            break;
        }
        case TrackStateChange::Type::VOLUME:
            state.volume = change.volume;
            break;
        case TrackStateChange::Type::POSITION:
            // Only ticks fire timed events.
            state.position = change.position;
            break;
        case TrackStateChange::Type::LOOPS:
            state.loops = change.loops;
            if (!change.user_set) {
                global_.fire_track_event(TrackEvent::LOOP, index);
            }
            break;
        case TrackStateChange::Type::TOTAL:
            state = change.total;
            break;
    }
}

} // namespace voice
} // namespace voicelink
