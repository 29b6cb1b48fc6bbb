/**
 * @file voice_component.h
 * @brief Lifecycle base for the threads of a voice driver.
 * @details The mixer, event scheduler, gateway runner, UDP sender and receiver and the
 *          driver core each own one thread and one inbox. `stop()` raises `stop_flag_`,
 *          closes the inbox so a blocked `pop` returns, and joins.
 */
#ifndef VOICELINK_VOICE_COMPONENT_H
#define VOICELINK_VOICE_COMPONENT_H

#include <atomic>
#include <thread>

namespace voicelink {
namespace voice {

class VoiceComponent {
public:
    virtual ~VoiceComponent() = default;

    VoiceComponent(const VoiceComponent&) = delete;
    VoiceComponent& operator=(const VoiceComponent&) = delete;
    VoiceComponent(VoiceComponent&&) = delete;
    VoiceComponent& operator=(VoiceComponent&&) = delete;

    /** @brief Clears `stop_flag_` and launches `run()` on `component_thread_`. */
    virtual void start() = 0;

    /** @brief Raises `stop_flag_`, closes the inbox and joins. Safe to call twice. */
    virtual void stop() = 0;

    bool is_running() const {
        return component_thread_.joinable() && !stop_flag_;
    }

protected:
    VoiceComponent() = default;

    /**
     * @brief Worker loop. Returns when `stop_flag_` is set, the inbox closes, or a
     *        Poison message arrives.
     */
    virtual void run() = 0;

    /**
     * @brief Joins the worker, or detaches it when a worker stops itself from inside
     *        `run()` (for instance while handling Poison).
     */
    void join_component_thread() {
        if (!component_thread_.joinable()) {
            return;
        }
        if (component_thread_.get_id() == std::this_thread::get_id()) {
            component_thread_.detach();
            return;
        }
        component_thread_.join();
    }

    std::thread component_thread_;
    std::atomic<bool> stop_flag_{false};
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_VOICE_COMPONENT_H
