#ifndef VOICELINK_EVENT_DATA_H
#define VOICELINK_EVENT_DATA_H

#include "event.h"

#include <algorithm>
#include <chrono>
#include <functional>
#include <optional>

namespace voicelink {
namespace voice {

struct EventContext;

/**
 * @brief A user handler.
 * @details The returned event is the handler's next trigger. Returning nothing or
 *          `Event::cancel()` deregisters it, so a periodic handler that wants to keep
 *          firing returns its own event again.
 */
using EventHandler = std::function<std::optional<Event>(EventContext&)>;

/**
 * @struct EventData
 * @brief A handler bound to its event, plus the next activation time once scheduled.
 */
struct EventData {
    // A zero delay would refire forever within one dispatch pass.
    static constexpr std::chrono::milliseconds kMinimumDelay{1};

    Event event;
    EventHandler action;
    std::optional<std::chrono::milliseconds> fire_time;

    EventData() = default;
    EventData(Event evt, EventHandler handler) : event(evt), action(std::move(handler)) {}

    /** @brief Sets `fire_time` for timed events relative to `now`; the phase is used once. */
    void compute_activation(std::chrono::milliseconds now) {
        switch (event.kind) {
            case Event::Kind::PERIODIC:
                fire_time = now + event.phase.value_or(std::max(event.duration, kMinimumDelay));
                event.phase.reset();
                break;
            case Event::Kind::DELAYED:
                fire_time = now + std::max(event.duration, kMinimumDelay);
                break;
            default:
                fire_time.reset();
                break;
        }
    }
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_EVENT_DATA_H
