/**
 * @file gateway_runner.h
 * @brief Worker that keeps the voice gateway websocket alive once the handshake is done.
 */
#ifndef VOICELINK_GATEWAY_RUNNER_H
#define VOICELINK_GATEWAY_RUNNER_H

#include "../gateway/gateway_socket.h"
#include "../utils/voice_component.h"
#include "../voice_types.h"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <random>

namespace voicelink {
namespace voice {

/**
 * @class GatewayRunner
 * @brief Heartbeats, relays speaking state and dispatches inbound control frames.
 * @details When the socket closes or fails the runner reports `SIGNAL_WS_CLOSURE` to the
 *          driver core and idles until a resumed socket arrives via `REPLACE_SOCKET`.
 *          Late heartbeat acks are only logged.
 */
class GatewayRunner : public VoiceComponent {
public:
    GatewayRunner(std::unique_ptr<IGatewaySocket> socket,
                  double heartbeat_interval_ms,
                  uint32_t ssrc,
                  uint64_t connection_id,
                  Interconnect interconnect,
                  std::shared_ptr<WsQueue> rx);
    ~GatewayRunner() override;

    void start() override;
    void stop() override;

    /** @brief Applies one control message; false on `POISON`. */
    bool handle_message(WsMessage& msg);

    /**
     * @brief Sends a heartbeat if one is due, then reads frames until none arrive for `wait`.
     * @return false if the socket closed or failed; the closure has been reported.
     */
    bool service_socket(std::chrono::milliseconds wait);

    bool has_socket() const { return socket_ != nullptr; }
    bool speaking() const { return speaking_; }
    std::optional<uint64_t> pending_heartbeat() const { return last_nonce_; }

protected:
    void run() override;

private:
    void set_heartbeat_interval(double interval_ms);
    bool send_heartbeat();
    void dispatch(const GatewayEvent& event);
    void fire(EventContext ctx);
    void report_closure(std::optional<uint16_t> code);

    std::unique_ptr<IGatewaySocket> socket_;
    std::chrono::steady_clock::duration heartbeat_interval_{};
    std::chrono::steady_clock::time_point next_heartbeat_;
    std::optional<uint64_t> last_nonce_;
    bool speaking_ = false;
    uint32_t ssrc_;
    uint64_t connection_id_;
    Interconnect interconnect_;
    std::shared_ptr<WsQueue> rx_;
    std::mt19937_64 nonce_rng_;
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_GATEWAY_RUNNER_H
