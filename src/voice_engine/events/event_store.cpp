#include "event_store.h"
#include "../utils/cpp_logger.h"

#include <algorithm>
#include <exception>

namespace voicelink {
namespace voice {

namespace {

// A handler that throws is logged and dropped; the scheduler thread carries on.
std::optional<Event> invoke_handler(EventData& evt, EventContext& ctx) {
    if (!evt.action) {
        return std::nullopt;
    }
    try {
        return evt.action(ctx);
    } catch (const std::exception& e) {
        LOG_VL_ERROR("[EventStore] Event handler threw, removing it: %s", e.what());
        return std::nullopt;
    }
}

} // namespace

EventStore::UntimedKey EventStore::untimed_key(const Event& evt) {
    if (evt.kind == Event::Kind::TRACK) {
        return {static_cast<int>(evt.kind), static_cast<int>(evt.track_event)};
    }
    return {static_cast<int>(evt.kind), static_cast<int>(evt.core_event)};
}

void EventStore::add_event(EventData evt, std::chrono::milliseconds now) {
    evt.compute_activation(now);

    if (local_only_ && evt.event.is_global_only()) {
        return;
    }

    switch (evt.event.kind) {
        case Event::Kind::PERIODIC:
        case Event::Kind::DELAYED:
            timed_.push(std::move(evt));
            break;
        case Event::Kind::TRACK:
        case Event::Kind::CORE: {
            const UntimedKey key = untimed_key(evt.event);
            untimed_[key].push_back(std::move(evt));
            break;
        }
        case Event::Kind::CANCEL:
            break;
    }
}

bool EventStore::has_due(std::chrono::milliseconds now) const {
    return !timed_.empty() && timed_.top().fire_time && *timed_.top().fire_time <= now;
}

bool EventStore::has_untimed(const Event& untimed_event) const {
    auto it = untimed_.find(untimed_key(untimed_event));
    return it != untimed_.end() && !it->second.empty();
}

std::size_t EventStore::untimed_count() const {
    std::size_t count = 0;
    for (const auto& entry : untimed_) {
        count += entry.second.size();
    }
    return count;
}

void EventStore::process_timed(std::chrono::milliseconds now, EventContext& ctx) {
    while (has_due(now)) {
        EventData evt = timed_.top();
        timed_.pop();

        const std::optional<Event> next = invoke_handler(evt, ctx);

        // A handler stays registered only by naming its next trigger.
        if (!next || next->kind == Event::Kind::CANCEL) {
            continue;
        }
        evt.event = *next;
        add_event(std::move(evt), now);
    }
}

void EventStore::process_untimed(std::chrono::milliseconds now, const Event& untimed_event, EventContext& ctx) {
    auto it = untimed_.find(untimed_key(untimed_event));
    if (it == untimed_.end()) {
        return;
    }

    std::vector<EventData> rescheduled;
    std::vector<EventData> handlers;
    handlers.swap(it->second);

    for (auto& evt : handlers) {
        const std::optional<Event> next = invoke_handler(evt, ctx);
        if (next && next->kind != Event::Kind::CANCEL) {
            evt.event = *next;
            rescheduled.push_back(std::move(evt));
        }
    }

    for (auto& evt : rescheduled) {
        add_event(std::move(evt), now);
    }
}

void GlobalEvents::add_event(EventData evt) {
    store_.add_event(std::move(evt), time_);
}

void GlobalEvents::fire_core_event(EventContext& ctx) {
    store_.process_untimed(time_, Event::core(ctx.core_event()), ctx);
}

void GlobalEvents::fire_track_event(TrackEvent evt, std::size_t index) {
    awaiting_tick_[evt].push_back(index);
}

void GlobalEvents::tick(std::vector<EventStore>& stores,
                        std::vector<TrackState>& states,
                        std::vector<TrackHandle>& handles) {
    time_ += TIMESTEP_LENGTH;
    if (store_.has_due(time_)) {
        EventContext ctx;
        store_.process_timed(time_, ctx);
    }

    for (std::size_t i = 0; i < states.size(); ++i) {
        TrackState& state = states[i];
        if (state.playing != PlayMode::PLAY) {
            continue;
        }
        state.step_frame();
        if (stores[i].has_due(state.play_time)) {
            EventContext ctx;
            ctx.tracks.push_back(TrackContextEntry{state, handles[i]});
            stores[i].process_timed(state.play_time, ctx);
        }
    }

    for (auto& entry : awaiting_tick_) {
        const std::vector<std::size_t>& indices = entry.second;
        if (indices.empty()) {
            continue;
        }
        const Event untimed = Event::track(entry.first);
        LOG_VL_DEBUG("[EventScheduler] Firing track event %d for %zu track(s)",
                     static_cast<int>(entry.first), indices.size());

        for (std::size_t i : indices) {
            if (i >= stores.size()) {
                continue;
            }
            if (stores[i].has_untimed(untimed)) {
                EventContext ctx;
                ctx.tracks.push_back(TrackContextEntry{states[i], handles[i]});
                stores[i].process_untimed(states[i].play_time, untimed, ctx);
            }
        }

        if (store_.has_untimed(untimed)) {
            EventContext ctx;
            for (std::size_t i : indices) {
                if (i < states.size()) {
                    ctx.tracks.push_back(TrackContextEntry{states[i], handles[i]});
                }
            }
            store_.process_untimed(time_, untimed, ctx);
        }
    }

    for (auto& entry : awaiting_tick_) {
        entry.second.clear();
    }
}

void GlobalEvents::remove_track(std::size_t index) {
    for (auto& entry : awaiting_tick_) {
        auto& indices = entry.second;
        indices.erase(std::remove(indices.begin(), indices.end(), index), indices.end());
        for (auto& i : indices) {
            if (i > index) {
                --i;
            }
        }
    }
}

void GlobalEvents::remove_all_tracks() {
    for (auto& entry : awaiting_tick_) {
        entry.second.clear();
    }
}

} // namespace voice
} // namespace voicelink
