/**
 * @file call.h
 * @brief Per-guild voice handler tying the main gateway's voice updates to a Driver.
 */
#ifndef VOICELINK_CALL_H
#define VOICELINK_CALL_H

#include "driver.h"
#include "../gateway/gateway_payloads.h"

#include <future>
#include <memory>
#include <optional>
#include <string>

namespace voicelink {
namespace voice {

/**
 * @class GatewayShard
 * @brief The host's main gateway connection, as far as voice is concerned.
 */
class GatewayShard {
public:
    virtual ~GatewayShard() = default;

    /**
     * @brief Sends one JSON payload on the main gateway.
     * @return false if the shard is gone or the send failed.
     */
    virtual bool send(const std::string& payload) = 0;
};

enum class JoinResult {
    OK,
    NO_SENDER,        ///< Standalone call; local state was updated but nothing was sent.
    NO_CALL,          ///< No call exists for the guild.
    SHARD_SEND_FAILED
};

const char* join_result_name(JoinResult result);

/** @brief Op 4 voice state update; a null channel leaves voice. */
std::string build_voice_state_update(GuildId guild_id,
                                     std::optional<ChannelId> channel_id,
                                     bool self_deaf,
                                     bool self_mute);

/**
 * @class ConnectionProgress
 * @brief Collects the session id and server details that arrive separately after a join.
 */
class ConnectionProgress {
public:
    ConnectionProgress(GuildId guild_id, UserId user_id);

    /** @return true if the caller should (re)connect. */
    bool apply_state_update(const std::string& session_id);

    /** @return true if the caller should (re)connect. */
    bool apply_server_update(const std::string& endpoint, const std::string& token);

    bool is_complete() const { return complete_; }

    /** @brief Only meaningful once complete. */
    const ConnectionInfo& info() const { return info_; }

private:
    bool finalise();

    ConnectionInfo info_;
    bool has_session_ = false;
    bool has_server_ = false;
    bool complete_ = false;
};

/**
 * @class Call
 * @brief One guild's voice connection: channel membership, self mute/deaf, and the Driver.
 * @details `join` asks the main gateway to move the bot; the host then forwards the
 *          resulting voice state and voice server updates through `update_state` and
 *          `update_server`. Once both have arrived the driver connects. A later change of
 *          session, endpoint or token reconnects it.
 */
class Call {
public:
    /**
     * @param shard Main gateway sender; null for a standalone call driven by the host.
     * @throws std::runtime_error if the driver cannot be created.
     */
    Call(GuildId guild_id,
         UserId user_id,
         std::shared_ptr<GatewayShard> shard,
         DriverConfig config = DriverConfig(),
         GatewaySocketFactory socket_factory = open_rtc_gateway_socket);

    Call(const Call&) = delete;
    Call& operator=(const Call&) = delete;

    /**
     * @brief Joins or switches to a voice channel.
     * @param connected Receives a future that completes when the driver is connected.
     */
    JoinResult join(ChannelId channel_id, std::future<void>& connected);
    JoinResult join(ChannelId channel_id);

    /** @brief Leaves voice. Mute and deaf settings are kept. */
    JoinResult leave();

    JoinResult mute(bool mute);
    JoinResult deafen(bool deaf);

    void update_server(const std::string& endpoint, const std::string& token);
    void update_state(const std::string& session_id);

    bool is_mute() const { return self_mute_; }
    bool is_deaf() const { return self_deaf_; }
    std::optional<ChannelId> current_channel() const { return channel_; }

    /** @brief Connection details once both updates have arrived. */
    std::optional<ConnectionInfo> current_connection() const;

    GuildId guild_id() const { return guild_id_; }
    Driver& driver() { return driver_; }

private:
    JoinResult update();
    void do_connect();

    GuildId guild_id_;
    UserId user_id_;
    std::shared_ptr<GatewayShard> shard_;
    Driver driver_;
    bool self_deaf_ = false;
    bool self_mute_ = false;

    std::optional<ChannelId> channel_;
    std::optional<ConnectionProgress> progress_;
    std::shared_ptr<std::promise<void>> result_;
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_CALL_H
