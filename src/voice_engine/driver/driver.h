/**
 * @file driver.h
 * @brief Public entry point for one voice session: connect, play, mute, leave.
 */
#ifndef VOICELINK_DRIVER_H
#define VOICELINK_DRIVER_H

#include "driver_core.h"
#include "../voice_types.h"

#include <future>
#include <memory>
#include <mutex>

namespace voicelink {
namespace voice {

/**
 * @brief Host-facing controller of a voice session.
 * Every operation is a message to the driver core; none of them block on the network.
 * If the core thread has exited, the next operation starts a fresh one.
 */
class Driver {
public:
    /**
     * @param config Initial settings.
     * @param socket_factory Opens gateway websockets; replaced by a scripted socket in tests.
     * @param on_disconnect Called once if the session ends for good (4014 or retries exhausted).
     * @throws std::runtime_error if the mixer cannot be created.
     */
    explicit Driver(DriverConfig config = DriverConfig(),
                    GatewaySocketFactory socket_factory = open_rtc_gateway_socket,
                    DisconnectHandler on_disconnect = nullptr);
    ~Driver();

    Driver(const Driver&) = delete;
    Driver& operator=(const Driver&) = delete;
    Driver(Driver&&) = delete;
    Driver& operator=(Driver&&) = delete;

    /**
     * @brief Opens a voice session, replacing any current one.
     * @return Becomes ready when the session is up, or holds the `ConnectionError`.
     */
    std::future<void> connect(const ConnectionInfo& info);

    /** @brief As `connect`, completing a caller-owned promise. */
    void connect_with_result(const ConnectionInfo& info, std::shared_ptr<std::promise<void>> result);

    /** @brief Ends the session. Tracks keep their place in the mixer. */
    void leave();

    void mute(bool mute);
    bool is_mute() const;

    /** @brief Wraps `source` in a track, adds it to the mix and returns its handle. */
    TrackHandle play_source(std::unique_ptr<Input> source);

    /** @brief As `play_source`, but stops every other track first. */
    TrackHandle play_only_source(std::unique_ptr<Input> source);

    void play(std::unique_ptr<Track> track);
    void play_only(std::unique_ptr<Track> track);

    /** @brief Opus bitrate in bits per second; `OPUS_AUTO` and `OPUS_BITRATE_MAX` are accepted. */
    void set_bitrate(int bitrate);

    /** @brief Stops and removes every track. */
    void stop();

    void set_config(const DriverConfig& config);
    DriverConfig config() const;

    /** @brief Registers a handler on the driver-wide event store. Core events go here. */
    void add_global_event(const Event& event, EventHandler handler);

private:
    void send(CoreMessage msg);
    void start_core();

    mutable std::mutex driver_mutex_;
    DriverConfig config_;
    GatewaySocketFactory socket_factory_;
    DisconnectHandler on_disconnect_;
    bool self_mute_ = false;
    int bitrate_;
    std::shared_ptr<CoreQueue> core_rx_;
    std::unique_ptr<DriverCore> core_;
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_DRIVER_H
