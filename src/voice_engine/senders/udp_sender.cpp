#include "udp_sender.h"
#include "../utils/cpp_logger.h"

#include <cstring>
#include <utility>

namespace voicelink {
namespace voice {

std::array<uint8_t, 8> build_udp_keepalive(uint32_t ssrc) {
    std::array<uint8_t, 8> packet{};
    const uint32_t net_ssrc = htonl(ssrc);
    std::memcpy(packet.data(), &net_ssrc, sizeof(net_ssrc));
    return packet;
}

UdpSender::UdpSender(std::shared_ptr<VoiceUdpSocket> socket,
                     uint32_t ssrc,
                     std::chrono::milliseconds keepalive_gap,
                     std::shared_ptr<UdpTxQueue> rx)
    : socket_(std::move(socket)), ssrc_(ssrc), keepalive_gap_(keepalive_gap), rx_(std::move(rx)) {}

UdpSender::~UdpSender() {
    stop();
}

void UdpSender::start() {
    if (component_thread_.joinable()) {
        return;
    }
    stop_flag_ = false;
    component_thread_ = std::thread(&UdpSender::run, this);
}

void UdpSender::stop() {
    stop_flag_ = true;
    if (rx_) {
        rx_->stop();
    }
    join_component_thread();
}

void UdpSender::run() {
    LOG_VL_INFO("[UdpSender] UDP transmit handle started (keepalive every %lld ms)",
                static_cast<long long>(keepalive_gap_.count()));
    const auto keepalive = build_udp_keepalive(ssrc_);
    auto keepalive_at = std::chrono::steady_clock::now() + keepalive_gap_;

    while (!stop_flag_) {
        UdpTxMessage msg;
        const auto wait = keepalive_at - std::chrono::steady_clock::now();
        const auto result = rx_->pop_for(msg, wait > wait.zero() ? wait : wait.zero());
        if (result == UdpTxQueue::PopResult::Closed) {
            break;
        }
        if (result == UdpTxQueue::PopResult::TimedOut) {
            if (!socket_->send(keepalive.data(), keepalive.size())) {
                LOG_VL_ERROR("[UdpSender] Keepalive send failed, transmit loop exiting");
                break;
            }
            keepalive_at += keepalive_gap_;
            continue;
        }
        if (msg.type == UdpTxMessage::Type::POISON) {
            break;
        }
        if (!socket_->send(msg.packet.data(), msg.packet.size())) {
            LOG_VL_ERROR("[UdpSender] Voice packet send failed (%zu bytes), transmit loop exiting",
                         msg.packet.size());
            break;
        }
    }
    rx_->stop_and_clear();
    LOG_VL_INFO("[UdpSender] UDP transmit handle stopped");
}

} // namespace voice
} // namespace voicelink
