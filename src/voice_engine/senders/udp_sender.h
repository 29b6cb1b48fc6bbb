/**
 * @file udp_sender.h
 * @brief Worker that writes mixer packets and keepalives to the voice socket.
 */
#ifndef VOICELINK_UDP_SENDER_H
#define VOICELINK_UDP_SENDER_H

#include "../net/udp_socket.h"
#include "../utils/voice_component.h"
#include "../voice_types.h"

#include <array>
#include <chrono>
#include <cstdint>
#include <memory>

namespace voicelink {
namespace voice {

/** @brief Builds the 8-byte keepalive: the SSRC big-endian, then four zero bytes. */
std::array<uint8_t, 8> build_udp_keepalive(uint32_t ssrc);

/**
 * @class UdpSender
 * @brief Sends whatever the mixer queues, and a keepalive every `udp_keepalive_gap`.
 * @details A send failure ends the worker and closes its queue, so the mixer's next push
 *          fails and it asks the core for a full reconnect.
 */
class UdpSender : public VoiceComponent {
public:
    UdpSender(std::shared_ptr<VoiceUdpSocket> socket,
              uint32_t ssrc,
              std::chrono::milliseconds keepalive_gap,
              std::shared_ptr<UdpTxQueue> rx);
    ~UdpSender() override;

    void start() override;
    void stop() override;

protected:
    void run() override;

private:
    std::shared_ptr<VoiceUdpSocket> socket_;
    uint32_t ssrc_;
    std::chrono::milliseconds keepalive_gap_;
    std::shared_ptr<UdpTxQueue> rx_;
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_UDP_SENDER_H
