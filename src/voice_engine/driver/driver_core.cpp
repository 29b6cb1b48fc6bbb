#include "driver_core.h"
#include "../gateway/close_code.h"
#include "../utils/cpp_logger.h"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

namespace voicelink {
namespace voice {

DriverCore::DriverCore(DriverConfig config,
                       GatewaySocketFactory socket_factory,
                       std::shared_ptr<CoreQueue> rx,
                       DisconnectHandler on_disconnect)
    : config_(std::move(config)),
      socket_factory_(std::move(socket_factory)),
      rx_(std::move(rx)),
      on_disconnect_(std::move(on_disconnect)) {
    interconnect_.core = rx_;
    interconnect_.events = std::make_shared<EventQueue>();
    interconnect_.mixer = std::make_shared<MixerQueue>();
    scheduler_ = std::make_unique<EventScheduler>(interconnect_.events);
    mixer_ = std::make_unique<VoiceMixer>(interconnect_, config_);
}

DriverCore::~DriverCore() {
    stop();
    drop_connection();
    if (mixer_) {
        mixer_->stop();
    }
    if (scheduler_) {
        scheduler_->stop();
    }
}

void DriverCore::start() {
    if (component_thread_.joinable()) {
        return;
    }
    scheduler_->start();
    mixer_->start();
    stop_flag_ = false;
    component_thread_ = std::thread(&DriverCore::run, this);
}

void DriverCore::stop() {
    stop_flag_ = true;
    if (rx_) {
        rx_->stop();
    }
    join_component_thread();
}

void DriverCore::run() {
    LOG_VL_INFO("[DriverCore] Core thread started");
    while (!stop_flag_) {
        CoreMessage msg;
        bool reconnect_due = false;
        if (reconnect_at_) {
            const auto wait = std::max(*reconnect_at_ - std::chrono::steady_clock::now(),
                                       std::chrono::steady_clock::duration::zero());
            const auto result = rx_->pop_for(msg, wait);
            if (result == CoreQueue::PopResult::Closed) {
                break;
            }
            reconnect_due = result == CoreQueue::PopResult::TimedOut;
        } else if (!rx_->pop(msg)) {
            break;
        }

        try {
            if (reconnect_due) {
                attempt_reconnect();
            } else if (!handle_message(msg)) {
                break;
            }
        } catch (const std::exception& e) {
            // Closing the channel makes the owning Driver start a fresh core on its next call.
            LOG_VL_ERROR("[DriverCore] Core thread failed: %s", e.what());
            rx_->stop();
            if (!reconnect_due && msg.type == CoreMessage::Type::CONNECT_WITH_RESULT && msg.result) {
                msg.result->set_exception(std::current_exception());
            }
            break;
        }
    }

    rx_->stop();
    drop_connection();
    MixerMessage poison;
    poison.type = MixerMessage::Type::POISON;
    interconnect_.mixer->push(std::move(poison));
    EventMessage events_poison = EventMessage::make(EventMessage::Type::POISON);
    interconnect_.events->push(std::move(events_poison));
    LOG_VL_INFO("[DriverCore] Core thread exited");
}

void DriverCore::forward_to_mixer(MixerMessage msg) {
    if (!interconnect_.mixer->push(std::move(msg))) {
        LOG_VL_ERROR("[DriverCore] Mixer channel closed, message dropped");
    }
}

bool DriverCore::handle_message(CoreMessage& msg) {
    switch (msg.type) {
        case CoreMessage::Type::CONNECT_WITH_RESULT:
            last_info_ = msg.info;
            reconnect_at_.reset();
            reconnect_attempt_ = 0;
            try {
                connect_once(msg.info);
                if (msg.result) {
                    msg.result->set_value();
                }
            } catch (const ConnectionError& e) {
                LOG_VL_ERROR("[DriverCore] Connection failed: %s", e.what());
                drop_connection();
                last_info_.reset();
                if (msg.result) {
                    msg.result->set_exception(std::current_exception());
                }
            }
            break;

        case CoreMessage::Type::SIGNAL_WS_CLOSURE: {
            if (!connection_ || connection_->id() != msg.connection_id) {
                LOG_VL_DEBUG("[DriverCore] Ignoring closure of stale connection %llu",
                             static_cast<unsigned long long>(msg.connection_id));
                break;
            }
            const ClosureAction action = closure_action(msg.close_code);
            LOG_VL_INFO("[DriverCore] Websocket closed (%s), will %s",
                        msg.close_code ? std::to_string(*msg.close_code).c_str() : "no code",
                        closure_action_name(action));
            if (action == ClosureAction::GIVE_UP) {
                LOG_VL_WARNING("[DriverCore] Removed from voice channel (4014); not reconnecting");
                give_up(ConnectionError(ConnectionErrorKind::WEBSOCKET, "disconnected from voice channel",
                                        msg.close_code));
                break;
            }
            if (action == ClosureAction::RESUME) {
                try {
                    connection_->resume(socket_factory_);
                    break;
                } catch (const ConnectionError& e) {
                    LOG_VL_WARNING("[DriverCore] Resume failed (%s), reconnecting", e.what());
                }
            }
            drop_connection();
            schedule_reconnect();
            break;
        }

        case CoreMessage::Type::FULL_RECONNECT:
            if (!last_info_ || reconnect_at_) {
                break;
            }
            LOG_VL_WARNING("[DriverCore] Full reconnect requested");
            drop_connection();
            schedule_reconnect();
            break;

        case CoreMessage::Type::REBUILD_INTERCONNECT:
            rebuild_interconnect();
            break;

        case CoreMessage::Type::DISCONNECT:
            LOG_VL_INFO("[DriverCore] Disconnecting");
            drop_connection();
            last_info_.reset();
            reconnect_at_.reset();
            reconnect_attempt_ = 0;
            break;

        case CoreMessage::Type::SET_TRACK: {
            MixerMessage out;
            out.type = MixerMessage::Type::SET_TRACK;
            out.track = std::move(msg.track);
            forward_to_mixer(std::move(out));
            break;
        }

        case CoreMessage::Type::ADD_TRACK: {
            MixerMessage out;
            out.type = MixerMessage::Type::ADD_TRACK;
            out.track = std::move(msg.track);
            forward_to_mixer(std::move(out));
            break;
        }

        case CoreMessage::Type::SET_BITRATE: {
            MixerMessage out;
            out.type = MixerMessage::Type::SET_BITRATE;
            out.bitrate = msg.bitrate;
            forward_to_mixer(std::move(out));
            break;
        }

        case CoreMessage::Type::SET_CONFIG: {
            config_ = msg.config;
            MixerMessage out;
            out.type = MixerMessage::Type::SET_CONFIG;
            out.config = config_;
            forward_to_mixer(std::move(out));
            if (connection_) {
                connection_->set_config(config_);
            }
            break;
        }

        case CoreMessage::Type::MUTE: {
            MixerMessage out;
            out.type = MixerMessage::Type::SET_MUTE;
            out.mute = msg.mute;
            forward_to_mixer(std::move(out));
            break;
        }

        case CoreMessage::Type::ADD_EVENT: {
            EventMessage out = EventMessage::make(EventMessage::Type::ADD_GLOBAL_EVENT);
            out.event = std::move(msg.event);
            if (!interconnect_.events->push(std::move(out))) {
                LOG_VL_WARNING("[DriverCore] Event scheduler closed, global event dropped");
            }
            break;
        }

        case CoreMessage::Type::POISON:
            return false;
    }
    return true;
}

void DriverCore::connect_once(const ConnectionInfo& info) {
    drop_connection();
    const uint64_t id = next_connection_id_++;
    connection_ = Connection::connect(info, interconnect_, config_, socket_factory_, id);
}

void DriverCore::drop_connection() {
    if (!connection_) {
        return;
    }
    MixerMessage drop;
    drop.type = MixerMessage::Type::DROP_CONN;
    forward_to_mixer(std::move(drop));
    MixerMessage ws;
    ws.type = MixerMessage::Type::WS;
    forward_to_mixer(std::move(ws));
    connection_.reset();
}

void DriverCore::schedule_reconnect() {
    if (!last_info_) {
        return;
    }
    const int shift = std::min(reconnect_attempt_, 16);
    const auto delay = std::min(config_.reconnect.base_delay * (1 << shift), config_.reconnect.max_delay);
    reconnect_at_ = std::chrono::steady_clock::now() + delay;
    LOG_VL_INFO("[DriverCore] Reconnect attempt %d in %lld ms", reconnect_attempt_ + 1,
                static_cast<long long>(delay.count()));
}

void DriverCore::attempt_reconnect() {
    reconnect_at_.reset();
    if (!last_info_) {
        return;
    }
    try {
        connect_once(*last_info_);
        LOG_VL_INFO("[DriverCore] Reconnected after %d attempt(s)", reconnect_attempt_ + 1);
        reconnect_attempt_ = 0;
    } catch (const ConnectionError& e) {
        LOG_VL_WARNING("[DriverCore] Reconnect attempt %d failed: %s", reconnect_attempt_ + 1, e.what());
        drop_connection();
        ++reconnect_attempt_;
        if (reconnect_attempt_ >= config_.reconnect.attempts) {
            give_up(e);
            return;
        }
        schedule_reconnect();
    }
}

void DriverCore::give_up(const ConnectionError& error) {
    LOG_VL_ERROR("[DriverCore] Voice session ended: %s", error.what());
    drop_connection();
    last_info_.reset();
    reconnect_at_.reset();
    reconnect_attempt_ = 0;
    if (on_disconnect_) {
        on_disconnect_(error);
    }
}

void DriverCore::rebuild_interconnect() {
    LOG_VL_WARNING("[DriverCore] Rebuilding event scheduler");
    if (scheduler_) {
        scheduler_->stop();
    }
    interconnect_.events = std::make_shared<EventQueue>();
    scheduler_ = std::make_unique<EventScheduler>(interconnect_.events);
    scheduler_->start();

    MixerMessage msg;
    msg.type = MixerMessage::Type::REPLACE_INTERCONNECT;
    msg.interconnect = interconnect_;
    forward_to_mixer(std::move(msg));
    if (connection_) {
        connection_->replace_interconnect(interconnect_);
    }
}

} // namespace voice
} // namespace voicelink
