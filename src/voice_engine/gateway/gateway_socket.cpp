#include "gateway_socket.h"
#include "close_code.h"
#include "../utils/cpp_logger.h"

#include <rtc/rtc.hpp>

#include <variant>

namespace voicelink {
namespace voice {

bool send_gateway_event(IGatewaySocket& socket, const GatewayEvent& event) {
    const std::string text = serialize_gateway_event(event);
    if (!socket.send_text(text)) {
        LOG_VL_WARNING("[Gateway] Failed to send %s", opcode_name(event.op));
        return false;
    }
    LOG_VL_DEBUG("[Gateway] Sent %s", opcode_name(event.op));
    return true;
}

GatewayReadResult read_gateway_event(IGatewaySocket& socket,
                                     std::chrono::milliseconds timeout,
                                     GatewayEvent& event,
                                     GatewayFrame& frame) {
    if (!socket.receive(frame, timeout)) {
        return GatewayReadResult::TIMEOUT;
    }
    if (frame.kind != GatewayFrame::Kind::TEXT) {
        return GatewayReadResult::CLOSED;
    }
    try {
        event = parse_gateway_event(frame.text);
    } catch (const GatewayPayloadError& e) {
        LOG_VL_WARNING("[Gateway] Dropping unreadable frame: %s", e.what());
        return GatewayReadResult::IGNORED;
    }
    return GatewayReadResult::EVENT;
}

void GatewayFrameSink::on_open() {
    open_signal_.push(true);
}

void GatewayFrameSink::on_closed() {
    GatewayFrame frame;
    frame.kind = GatewayFrame::Kind::CLOSED;
    if (local_close_.load()) {
        frame.close_code = WS_CLOSE_NORMAL;
        frame.reason = "websocket closed locally";
    } else {
        frame.reason = "websocket closed by peer";
    }
    frames_.push(std::move(frame));
    open_signal_.push(false);
}

void GatewayFrameSink::on_error(std::string error) {
    LOG_VL_ERROR("[RtcGatewaySocket] Websocket error: %s", error.c_str());
    GatewayFrame frame;
    frame.kind = GatewayFrame::Kind::FAILED;
    frame.reason = std::move(error);
    frames_.push(std::move(frame));
    open_signal_.push(false);
}

void GatewayFrameSink::on_text(std::string text) {
    GatewayFrame frame;
    frame.kind = GatewayFrame::Kind::TEXT;
    frame.text = std::move(text);
    frames_.push(std::move(frame));
}

void GatewayFrameSink::closing_locally() {
    local_close_.store(true);
}

bool GatewayFrameSink::wait_open(std::chrono::milliseconds timeout) {
    bool opened = false;
    const auto result = open_signal_.pop_for(opened, timeout);
    return result == utils::ThreadSafeQueue<bool>::PopResult::Popped && opened;
}

bool GatewayFrameSink::next_frame(GatewayFrame& frame, std::chrono::milliseconds timeout) {
    return frames_.pop_for(frame, timeout) == utils::ThreadSafeQueue<GatewayFrame>::PopResult::Popped;
}

RtcGatewaySocket::RtcGatewaySocket()
    : ws_(std::make_shared<rtc::WebSocket>()),
      sink_(std::make_shared<GatewayFrameSink>()) {
    auto sink = sink_;
    ws_->onOpen([sink]() { sink->on_open(); });
    ws_->onClosed([sink]() { sink->on_closed(); });
    ws_->onError([sink](std::string error) { sink->on_error(std::move(error)); });
    ws_->onMessage([sink](std::variant<rtc::binary, rtc::string> message) {
        if (std::holds_alternative<rtc::string>(message)) {
            sink->on_text(std::get<rtc::string>(std::move(message)));
        } else {
            LOG_VL_DEBUG("[RtcGatewaySocket] Ignoring %zu byte binary frame",
                         std::get<rtc::binary>(message).size());
        }
    });
}

RtcGatewaySocket::~RtcGatewaySocket() {
    close();
    ws_->resetCallbacks();
}

bool RtcGatewaySocket::open(const std::string& url, std::chrono::milliseconds timeout) {
    try {
        ws_->open(url);
    } catch (const std::exception& e) {
        LOG_VL_ERROR("[RtcGatewaySocket] Failed to open %s: %s", url.c_str(), e.what());
        return false;
    }

    if (!sink_->wait_open(timeout)) {
        LOG_VL_ERROR("[RtcGatewaySocket] Websocket to %s did not open", url.c_str());
        return false;
    }
    LOG_VL_INFO("[RtcGatewaySocket] Connected to %s", url.c_str());
    return true;
}

bool RtcGatewaySocket::send_text(const std::string& text) {
    if (!ws_->isOpen()) {
        return false;
    }
    try {
        return ws_->send(text);
    } catch (const std::exception& e) {
        LOG_VL_ERROR("[RtcGatewaySocket] Send failed: %s", e.what());
        return false;
    }
}

bool RtcGatewaySocket::receive(GatewayFrame& frame, std::chrono::milliseconds timeout) {
    return sink_->next_frame(frame, timeout);
}

void RtcGatewaySocket::close() {
    if (!ws_->isClosed()) {
        sink_->closing_locally();
        try {
            ws_->close();
        } catch (const std::exception& e) {
            LOG_VL_WARNING("[RtcGatewaySocket] Close failed: %s", e.what());
        }
    }
}

std::unique_ptr<IGatewaySocket> open_rtc_gateway_socket(const std::string& url,
                                                        std::chrono::milliseconds timeout) {
    auto socket = std::make_unique<RtcGatewaySocket>();
    if (!socket->open(url, timeout)) {
        return nullptr;
    }
    return socket;
}

} // namespace voice
} // namespace voicelink
