/**
 * @file manager.h
 * @brief Registry of per-guild calls for a bot that may be in many guilds at once.
 */
#ifndef VOICELINK_MANAGER_H
#define VOICELINK_MANAGER_H

#include "call.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace voicelink {
namespace voice {

/** @brief Main gateway shard responsible for a guild: `(guild_id >> 22) % shard_count`. */
uint64_t shard_for_guild(GuildId guild_id, uint64_t shard_count);

/**
 * @class Manager
 * @brief Owns one `Call` per guild and routes the main gateway's voice events to them.
 * @details Calls are created on first use with the shard the provider returns for their
 *          guild. Every operation made through the manager holds its lock, so manager calls
 *          are safe from any thread; a `Call` used directly needs the host's own locking.
 */
class Manager {
public:
    /** @brief Returns the shard that carries a guild's voice state updates; may return null. */
    using ShardProvider = std::function<std::shared_ptr<GatewayShard>(GuildId)>;

    Manager(UserId user_id,
            ShardProvider shards,
            DriverConfig config = DriverConfig(),
            GatewaySocketFactory socket_factory = open_rtc_gateway_socket);

    Manager(const Manager&) = delete;
    Manager& operator=(const Manager&) = delete;

    /** @brief The guild's call, if one exists. */
    std::shared_ptr<Call> get(GuildId guild_id) const;

    /**
     * @brief The guild's call, created if needed. Creating a call does not join anything.
     * @throws std::runtime_error if a new call's driver cannot be created.
     */
    std::shared_ptr<Call> get_or_insert(GuildId guild_id);

    /**
     * @brief Joins or switches the guild's call to `channel_id`.
     * @param connected Receives a future that completes when the driver is connected.
     */
    std::pair<std::shared_ptr<Call>, JoinResult> join(GuildId guild_id,
                                                      ChannelId channel_id,
                                                      std::future<void>& connected);

    /** @brief Leaves voice but keeps the call and its settings. `NO_CALL` if there is none. */
    JoinResult leave(GuildId guild_id);

    /**
     * @brief Leaves voice and drops the call.
     * @details The call is kept if the leave could not be sent, so it can be retried.
     */
    JoinResult remove(GuildId guild_id);

    /** @brief Forwards a voice state update; updates for other users are ignored. */
    void process_voice_state_update(GuildId guild_id, UserId user_id, const std::string& session_id);

    /** @brief Forwards a voice server update to the guild's call, if any. */
    void process_voice_server_update(GuildId guild_id, const std::string& endpoint, const std::string& token);

    std::size_t call_count() const;
    UserId user_id() const { return user_id_; }

private:
    std::shared_ptr<Call> find_locked(GuildId guild_id) const;
    std::shared_ptr<Call> get_or_insert_locked(GuildId guild_id);

    UserId user_id_;
    ShardProvider shards_;
    DriverConfig config_;
    GatewaySocketFactory socket_factory_;

    mutable std::mutex mutex_;
    std::map<GuildId, std::shared_ptr<Call>> calls_;
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_MANAGER_H
