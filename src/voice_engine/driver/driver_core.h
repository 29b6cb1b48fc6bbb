/**
 * @file driver_core.h
 * @brief The orchestrating worker behind a Driver: connections, reconnects and worker wiring.
 */
#ifndef VOICELINK_DRIVER_CORE_H
#define VOICELINK_DRIVER_CORE_H

#include "../connection/connection.h"
#include "../events/event_scheduler.h"
#include "../mixer/voice_mixer.h"
#include "../utils/voice_component.h"
#include "../voice_types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>

namespace voicelink {
namespace voice {

/** @brief Called once when the driver gives up on a session. */
using DisconnectHandler = std::function<void(const ConnectionError&)>;

/**
 * @class DriverCore
 * @brief Owns the mixer, the event scheduler and the current `Connection`.
 * @details All connection work happens on this thread. After a websocket closure it tries
 *          a Resume, and failing that a full handshake with exponential backoff, up to
 *          `reconnect.attempts` times. Close code 4014 ends the session immediately.
 */
class DriverCore : public VoiceComponent {
public:
    /**
     * @throws std::runtime_error if the mixer cannot be created.
     */
    DriverCore(DriverConfig config,
               GatewaySocketFactory socket_factory,
               std::shared_ptr<CoreQueue> rx,
               DisconnectHandler on_disconnect = nullptr);
    ~DriverCore() override;

    void start() override;
    void stop() override;

    /** @brief Applies one message; false on `POISON`. */
    bool handle_message(CoreMessage& msg);

protected:
    void run() override;

private:
    void connect_once(const ConnectionInfo& info);
    void drop_connection();
    void schedule_reconnect();
    void attempt_reconnect();
    void give_up(const ConnectionError& error);
    void rebuild_interconnect();
    void forward_to_mixer(MixerMessage msg);

    DriverConfig config_;
    GatewaySocketFactory socket_factory_;
    std::shared_ptr<CoreQueue> rx_;
    DisconnectHandler on_disconnect_;

    Interconnect interconnect_;
    std::unique_ptr<EventScheduler> scheduler_;
    std::unique_ptr<VoiceMixer> mixer_;
    std::unique_ptr<Connection> connection_;

    std::optional<ConnectionInfo> last_info_;
    uint64_t next_connection_id_ = 1;
    int reconnect_attempt_ = 0;
    std::optional<std::chrono::steady_clock::time_point> reconnect_at_;
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_DRIVER_CORE_H
