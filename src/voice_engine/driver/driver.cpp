#include "driver.h"
#include "../utils/cpp_logger.h"

#include <utility>

namespace voicelink {
namespace voice {

Driver::Driver(DriverConfig config, GatewaySocketFactory socket_factory, DisconnectHandler on_disconnect)
    : config_(std::move(config)),
      socket_factory_(std::move(socket_factory)),
      on_disconnect_(std::move(on_disconnect)),
      bitrate_(config_.default_bitrate) {
    std::lock_guard<std::mutex> lock(driver_mutex_);
    start_core();
}

Driver::~Driver() {
    std::lock_guard<std::mutex> lock(driver_mutex_);
    if (!core_rx_) {
        return;
    }
    CoreMessage leave;
    leave.type = CoreMessage::Type::DISCONNECT;
    core_rx_->push(std::move(leave));
    CoreMessage poison;
    poison.type = CoreMessage::Type::POISON;
    core_rx_->push(std::move(poison));
    core_.reset();
    LOG_VL_DEBUG("[Driver] Destroyed");
}

void Driver::start_core() {
    core_.reset();
    core_rx_ = std::make_shared<CoreQueue>();
    core_ = std::make_unique<DriverCore>(config_, socket_factory_, core_rx_, on_disconnect_);
    core_->start();
}

void Driver::send(CoreMessage msg) {
    std::lock_guard<std::mutex> lock(driver_mutex_);
    if (!core_rx_ || core_rx_->is_stopped()) {
        LOG_VL_WARNING("[Driver] Core channel closed, restarting core");
        start_core();
        if (self_mute_) {
            CoreMessage mute;
            mute.type = CoreMessage::Type::MUTE;
            mute.mute = true;
            core_rx_->push(std::move(mute));
        }
        if (bitrate_ != config_.default_bitrate) {
            CoreMessage bitrate;
            bitrate.type = CoreMessage::Type::SET_BITRATE;
            bitrate.bitrate = bitrate_;
            core_rx_->push(std::move(bitrate));
        }
    }
    if (!core_rx_->push(std::move(msg))) {
        LOG_VL_ERROR("[Driver] Failed to deliver message to core");
    }
}

std::future<void> Driver::connect(const ConnectionInfo& info) {
    auto result = std::make_shared<std::promise<void>>();
    std::future<void> future = result->get_future();
    connect_with_result(info, std::move(result));
    return future;
}

void Driver::connect_with_result(const ConnectionInfo& info, std::shared_ptr<std::promise<void>> result) {
    CoreMessage msg;
    msg.type = CoreMessage::Type::CONNECT_WITH_RESULT;
    msg.info = info;
    msg.result = std::move(result);
    send(std::move(msg));
}

void Driver::leave() {
    CoreMessage msg;
    msg.type = CoreMessage::Type::DISCONNECT;
    send(std::move(msg));
}

void Driver::mute(bool mute) {
    {
        std::lock_guard<std::mutex> lock(driver_mutex_);
        self_mute_ = mute;
    }
    CoreMessage msg;
    msg.type = CoreMessage::Type::MUTE;
    msg.mute = mute;
    send(std::move(msg));
}

bool Driver::is_mute() const {
    std::lock_guard<std::mutex> lock(driver_mutex_);
    return self_mute_;
}

TrackHandle Driver::play_source(std::unique_ptr<Input> source) {
    auto player = create_player(std::move(source));
    play(std::move(player.first));
    return player.second;
}

TrackHandle Driver::play_only_source(std::unique_ptr<Input> source) {
    auto player = create_player(std::move(source));
    play_only(std::move(player.first));
    return player.second;
}

void Driver::play(std::unique_ptr<Track> track) {
    CoreMessage msg;
    msg.type = CoreMessage::Type::ADD_TRACK;
    msg.track = std::move(track);
    send(std::move(msg));
}

void Driver::play_only(std::unique_ptr<Track> track) {
    CoreMessage msg;
    msg.type = CoreMessage::Type::SET_TRACK;
    msg.track = std::move(track);
    send(std::move(msg));
}

void Driver::set_bitrate(int bitrate) {
    {
        std::lock_guard<std::mutex> lock(driver_mutex_);
        bitrate_ = bitrate;
    }
    CoreMessage msg;
    msg.type = CoreMessage::Type::SET_BITRATE;
    msg.bitrate = bitrate;
    send(std::move(msg));
}

void Driver::stop() {
    CoreMessage msg;
    msg.type = CoreMessage::Type::SET_TRACK;
    send(std::move(msg));
}

void Driver::set_config(const DriverConfig& config) {
    {
        std::lock_guard<std::mutex> lock(driver_mutex_);
        config_ = config;
    }
    CoreMessage msg;
    msg.type = CoreMessage::Type::SET_CONFIG;
    msg.config = config;
    send(std::move(msg));
}

DriverConfig Driver::config() const {
    std::lock_guard<std::mutex> lock(driver_mutex_);
    return config_;
}

void Driver::add_global_event(const Event& event, EventHandler handler) {
    CoreMessage msg;
    msg.type = CoreMessage::Type::ADD_EVENT;
    msg.event = EventData(event, std::move(handler));
    send(std::move(msg));
}

} // namespace voice
} // namespace voicelink
