#include "manager.h"
#include "../utils/cpp_logger.h"

namespace voicelink {
namespace voice {

uint64_t shard_for_guild(GuildId guild_id, uint64_t shard_count) {
    if (shard_count == 0) {
        return 0;
    }
    return (guild_id >> 22) % shard_count;
}

Manager::Manager(UserId user_id, ShardProvider shards, DriverConfig config, GatewaySocketFactory socket_factory)
    : user_id_(user_id),
      shards_(std::move(shards)),
      config_(std::move(config)),
      socket_factory_(std::move(socket_factory)) {}

std::shared_ptr<Call> Manager::find_locked(GuildId guild_id) const {
    auto it = calls_.find(guild_id);
    return it == calls_.end() ? nullptr : it->second;
}

std::shared_ptr<Call> Manager::get_or_insert_locked(GuildId guild_id) {
    auto call = find_locked(guild_id);
    if (call) {
        return call;
    }
    std::shared_ptr<GatewayShard> shard = shards_ ? shards_(guild_id) : nullptr;
    if (!shard) {
        LOG_VL_WARNING("[Manager] No shard for guild %llu, call will be standalone",
                       static_cast<unsigned long long>(guild_id));
    }
    call = std::make_shared<Call>(guild_id, user_id_, std::move(shard), config_, socket_factory_);
    calls_.emplace(guild_id, call);
    LOG_VL_DEBUG("[Manager] Created call for guild %llu", static_cast<unsigned long long>(guild_id));
    return call;
}

std::shared_ptr<Call> Manager::get(GuildId guild_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return find_locked(guild_id);
}

std::shared_ptr<Call> Manager::get_or_insert(GuildId guild_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return get_or_insert_locked(guild_id);
}

std::pair<std::shared_ptr<Call>, JoinResult> Manager::join(GuildId guild_id,
                                                           ChannelId channel_id,
                                                           std::future<void>& connected) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto call = get_or_insert_locked(guild_id);
    const JoinResult result = call->join(channel_id, connected);
    return {call, result};
}

JoinResult Manager::leave(GuildId guild_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto call = find_locked(guild_id);
    if (!call) {
        return JoinResult::NO_CALL;
    }
    return call->leave();
}

JoinResult Manager::remove(GuildId guild_id) {
    std::shared_ptr<Call> removed;
    JoinResult result;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = calls_.find(guild_id);
        if (it == calls_.end()) {
            return JoinResult::NO_CALL;
        }
        result = it->second->leave();
        if (result == JoinResult::SHARD_SEND_FAILED) {
            LOG_VL_WARNING("[Manager] Could not leave guild %llu, keeping its call",
                           static_cast<unsigned long long>(guild_id));
            return result;
        }
        removed = std::move(it->second);
        calls_.erase(it);
    }
    // The driver shuts down when the last reference goes, outside the lock.
    removed.reset();
    LOG_VL_INFO("[Manager] Removed call for guild %llu", static_cast<unsigned long long>(guild_id));
    return result;
}

void Manager::process_voice_state_update(GuildId guild_id, UserId user_id, const std::string& session_id) {
    if (user_id != user_id_) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto call = find_locked(guild_id)) {
        call->update_state(session_id);
    }
}

void Manager::process_voice_server_update(GuildId guild_id, const std::string& endpoint, const std::string& token) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (auto call = find_locked(guild_id)) {
        call->update_server(endpoint, token);
    }
}

std::size_t Manager::call_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return calls_.size();
}

} // namespace voice
} // namespace voicelink
