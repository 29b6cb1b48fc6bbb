#include "call.h"
#include "../utils/cpp_logger.h"

#include <nlohmann/json.hpp>

#include <utility>

namespace voicelink {
namespace voice {

using json = nlohmann::json;

const char* join_result_name(JoinResult result) {
    switch (result) {
        case JoinResult::OK: return "Ok";
        case JoinResult::NO_SENDER: return "NoSender";
        case JoinResult::NO_CALL: return "NoCall";
        case JoinResult::SHARD_SEND_FAILED: return "ShardSendFailed";
    }
    return "Unknown";
}

std::string build_voice_state_update(GuildId guild_id,
                                     std::optional<ChannelId> channel_id,
                                     bool self_deaf,
                                     bool self_mute) {
    json d;
    d["channel_id"] = channel_id ? json(*channel_id) : json(nullptr);
    d["guild_id"] = guild_id;
    d["self_deaf"] = self_deaf;
    d["self_mute"] = self_mute;
    json payload;
    payload["op"] = 4;
    payload["d"] = d;
    return payload.dump();
}

ConnectionProgress::ConnectionProgress(GuildId guild_id, UserId user_id) {
    info_.guild_id = guild_id;
    info_.user_id = user_id;
}

bool ConnectionProgress::finalise() {
    if (!complete_ && has_session_ && has_server_) {
        complete_ = true;
        return true;
    }
    return false;
}

bool ConnectionProgress::apply_state_update(const std::string& session_id) {
    if (complete_) {
        const bool changed = info_.session_id != session_id;
        info_.session_id = session_id;
        return changed;
    }
    info_.session_id = session_id;
    has_session_ = true;
    return finalise();
}

bool ConnectionProgress::apply_server_update(const std::string& endpoint, const std::string& token) {
    if (complete_) {
        const bool changed = info_.endpoint != endpoint || info_.token != token;
        info_.endpoint = endpoint;
        info_.token = token;
        return changed;
    }
    info_.endpoint = endpoint;
    info_.token = token;
    has_server_ = true;
    return finalise();
}

Call::Call(GuildId guild_id,
           UserId user_id,
           std::shared_ptr<GatewayShard> shard,
           DriverConfig config,
           GatewaySocketFactory socket_factory)
    : guild_id_(guild_id),
      user_id_(user_id),
      shard_(std::move(shard)),
      driver_(std::move(config), std::move(socket_factory)) {}

JoinResult Call::join(ChannelId channel_id, std::future<void>& connected) {
    channel_ = channel_id;
    progress_.emplace(guild_id_, user_id_);
    result_ = std::make_shared<std::promise<void>>();
    connected = result_->get_future();
    LOG_VL_INFO("[Call:%llu] Joining channel %llu", static_cast<unsigned long long>(guild_id_),
                static_cast<unsigned long long>(channel_id));
    return update();
}

JoinResult Call::join(ChannelId channel_id) {
    std::future<void> ignored;
    return join(channel_id, ignored);
}

JoinResult Call::leave() {
    channel_.reset();
    progress_.reset();
    result_.reset();
    driver_.leave();
    return update();
}

JoinResult Call::mute(bool mute) {
    self_mute_ = mute;
    driver_.mute(mute);
    return update();
}

JoinResult Call::deafen(bool deaf) {
    self_deaf_ = deaf;
    return update();
}

void Call::update_server(const std::string& endpoint, const std::string& token) {
    if (progress_ && progress_->apply_server_update(endpoint, token)) {
        do_connect();
    }
}

void Call::update_state(const std::string& session_id) {
    if (progress_ && progress_->apply_state_update(session_id)) {
        do_connect();
    }
}

std::optional<ConnectionInfo> Call::current_connection() const {
    if (progress_ && progress_->is_complete()) {
        return progress_->info();
    }
    return std::nullopt;
}

void Call::do_connect() {
    auto result = result_ ? result_ : std::make_shared<std::promise<void>>();
    // A promise can only be completed once; later reconnects get a fresh one.
    result_.reset();
    driver_.connect_with_result(progress_->info(), std::move(result));
}

JoinResult Call::update() {
    if (!shard_) {
        return JoinResult::NO_SENDER;
    }
    const std::string payload = build_voice_state_update(guild_id_, channel_, self_deaf_, self_mute_);
    if (!shard_->send(payload)) {
        LOG_VL_WARNING("[Call:%llu] Failed to send voice state update", static_cast<unsigned long long>(guild_id_));
        return JoinResult::SHARD_SEND_FAILED;
    }
    return JoinResult::OK;
}

} // namespace voice
} // namespace voicelink
