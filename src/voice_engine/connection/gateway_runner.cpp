#include "gateway_runner.h"
#include "../utils/cpp_logger.h"

#include <random>
#include <utility>

namespace voicelink {
namespace voice {

GatewayRunner::GatewayRunner(std::unique_ptr<IGatewaySocket> socket,
                             double heartbeat_interval_ms,
                             uint32_t ssrc,
                             uint64_t connection_id,
                             Interconnect interconnect,
                             std::shared_ptr<WsQueue> rx)
    : socket_(std::move(socket)),
      ssrc_(ssrc),
      connection_id_(connection_id),
      interconnect_(std::move(interconnect)),
      rx_(std::move(rx)),
      nonce_rng_(std::random_device{}()) {
    set_heartbeat_interval(heartbeat_interval_ms);
}

GatewayRunner::~GatewayRunner() {
    stop();
    if (socket_) {
        socket_->close();
    }
}

void GatewayRunner::start() {
    if (component_thread_.joinable()) {
        return;
    }
    stop_flag_ = false;
    component_thread_ = std::thread(&GatewayRunner::run, this);
}

void GatewayRunner::stop() {
    stop_flag_ = true;
    if (rx_) {
        rx_->stop();
    }
    join_component_thread();
}

void GatewayRunner::set_heartbeat_interval(double interval_ms) {
    heartbeat_interval_ = std::chrono::duration_cast<std::chrono::steady_clock::duration>(
        std::chrono::duration<double, std::milli>(interval_ms));
    if (heartbeat_interval_ <= std::chrono::steady_clock::duration::zero()) {
        LOG_VL_WARNING("[GatewayRunner] Non-positive heartbeat interval %.1f ms, using one tick", interval_ms);
        heartbeat_interval_ = TIMESTEP_LENGTH;
    }
    next_heartbeat_ = std::chrono::steady_clock::now() + heartbeat_interval_;
}

bool GatewayRunner::handle_message(WsMessage& msg) {
    switch (msg.type) {
        case WsMessage::Type::REPLACE_SOCKET:
            if (socket_) {
                socket_->close();
            }
            socket_ = std::move(msg.socket);
            last_nonce_.reset();
            next_heartbeat_ = std::chrono::steady_clock::now() + heartbeat_interval_;
            LOG_VL_INFO("[GatewayRunner] Websocket replaced");
            break;

        case WsMessage::Type::SET_KEEPALIVE:
            set_heartbeat_interval(msg.heartbeat_interval_ms);
            LOG_VL_INFO("[GatewayRunner] Heartbeat every %.1f ms", msg.heartbeat_interval_ms);
            break;

        case WsMessage::Type::SPEAKING: {
            if (msg.speaking == speaking_) {
                break;
            }
            speaking_ = msg.speaking;
            if (!socket_) {
                break;
            }
            Speaking payload;
            payload.speaking = speaking_ ? speaking_flags::MICROPHONE : speaking_flags::NONE;
            payload.ssrc = ssrc_;
            payload.delay = 0;
            LOG_VL_INFO("[GatewayRunner] Changing speaking state to %d", static_cast<int>(payload.speaking));
            if (!send_gateway_event(*socket_, GatewayEvent::make(payload))) {
                LOG_VL_ERROR("[GatewayRunner] Issue sending speaking update");
                report_closure(std::nullopt);
            }
            break;
        }

        case WsMessage::Type::REPLACE_INTERCONNECT:
            interconnect_ = msg.interconnect;
            break;

        case WsMessage::Type::POISON:
            return false;
    }
    return true;
}

bool GatewayRunner::send_heartbeat() {
    const uint64_t nonce = nonce_rng_();
    last_nonce_ = nonce;
    LOG_VL_DEBUG("[GatewayRunner] Sending heartbeat %llu", static_cast<unsigned long long>(nonce));
    return send_gateway_event(*socket_, GatewayEvent::make(Heartbeat{nonce}));
}

bool GatewayRunner::service_socket(std::chrono::milliseconds wait) {
    if (!socket_) {
        return false;
    }

    const auto now = std::chrono::steady_clock::now();
    if (now >= next_heartbeat_) {
        if (!send_heartbeat()) {
            LOG_VL_ERROR("[GatewayRunner] Heartbeat send failed");
            report_closure(std::nullopt);
            return false;
        }
        next_heartbeat_ += heartbeat_interval_;
        if (next_heartbeat_ < now) {
            next_heartbeat_ = now + heartbeat_interval_;
        }
    }

    while (true) {
        GatewayEvent event;
        GatewayFrame frame;
        switch (read_gateway_event(*socket_, wait, event, frame)) {
            case GatewayReadResult::EVENT:
                dispatch(event);
                break;
            case GatewayReadResult::IGNORED:
                break;
            case GatewayReadResult::TIMEOUT:
                return true;
            case GatewayReadResult::CLOSED:
                if (frame.kind == GatewayFrame::Kind::FAILED) {
                    LOG_VL_ERROR("[GatewayRunner] Websocket error: %s", frame.reason.c_str());
                }
                report_closure(frame.close_code);
                return false;
        }
    }
}

void GatewayRunner::dispatch(const GatewayEvent& event) {
    switch (event.op) {
        case VoiceOpcode::SPEAKING: {
            EventContext ctx;
            ctx.kind = EventContext::Kind::SPEAKING_STATE_UPDATE;
            ctx.speaking_state = event.speaking;
            fire(std::move(ctx));
            break;
        }
        case VoiceOpcode::CLIENT_CONNECT: {
            EventContext ctx;
            ctx.kind = EventContext::Kind::CLIENT_CONNECT;
            ctx.client_connect = event.client_connect;
            fire(std::move(ctx));
            break;
        }
        case VoiceOpcode::CLIENT_DISCONNECT: {
            EventContext ctx;
            ctx.kind = EventContext::Kind::CLIENT_DISCONNECT;
            ctx.client_disconnect = event.client_disconnect;
            fire(std::move(ctx));
            break;
        }
        case VoiceOpcode::HEARTBEAT_ACK:
            if (last_nonce_) {
                if (*last_nonce_ == event.heartbeat_ack.nonce) {
                    LOG_VL_DEBUG("[GatewayRunner] Heartbeat ACK received");
                } else {
                    LOG_VL_WARNING("[GatewayRunner] Heartbeat nonce mismatch! Expected %llu, saw %llu",
                                   static_cast<unsigned long long>(*last_nonce_),
                                   static_cast<unsigned long long>(event.heartbeat_ack.nonce));
                }
                last_nonce_.reset();
            }
            break;
        default:
            LOG_VL_DEBUG("[GatewayRunner] Received other websocket data: %s", opcode_name(event.op));
            break;
    }
}

void GatewayRunner::fire(EventContext ctx) {
    if (!interconnect_.events) {
        return;
    }
    EventMessage msg = EventMessage::make(EventMessage::Type::FIRE_CORE_EVENT);
    msg.context = std::move(ctx);
    if (!interconnect_.events->push(std::move(msg))) {
        LOG_VL_DEBUG("[GatewayRunner] Event scheduler closed, gateway event dropped");
    }
}

void GatewayRunner::report_closure(std::optional<uint16_t> code) {
    if (socket_) {
        socket_->close();
        socket_.reset();
    }
    if (code) {
        LOG_VL_WARNING("[GatewayRunner] Websocket closed with code %u", static_cast<unsigned>(*code));
    } else {
        LOG_VL_WARNING("[GatewayRunner] Websocket lost without a close code");
    }
    if (!interconnect_.core) {
        return;
    }
    CoreMessage msg;
    msg.type = CoreMessage::Type::SIGNAL_WS_CLOSURE;
    msg.connection_id = connection_id_;
    msg.close_code = code;
    if (!interconnect_.core->push(std::move(msg))) {
        LOG_VL_DEBUG("[GatewayRunner] Driver core closed, closure not reported");
    }
}

void GatewayRunner::run() {
    LOG_VL_INFO("[GatewayRunner] Websocket runner started for SSRC %u", ssrc_);
    const std::chrono::milliseconds half_tick = TIMESTEP_LENGTH / 2;

    while (!stop_flag_) {
        if (socket_) {
            service_socket(half_tick);
        }

        WsMessage msg;
        if (!socket_) {
            // Nothing to service until a resumed socket arrives.
            const auto result = rx_->pop_for(msg, TIMESTEP_LENGTH);
            if (result == WsQueue::PopResult::Closed) {
                break;
            }
            if (result == WsQueue::PopResult::Popped && !handle_message(msg)) {
                break;
            }
        }

        bool poisoned = false;
        while (rx_->try_pop(msg)) {
            if (!handle_message(msg)) {
                poisoned = true;
                break;
            }
        }
        if (poisoned || rx_->is_stopped()) {
            break;
        }
    }
    LOG_VL_INFO("[GatewayRunner] Websocket runner exited");
}

} // namespace voice
} // namespace voicelink
