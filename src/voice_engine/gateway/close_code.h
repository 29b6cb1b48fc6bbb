#ifndef VOICELINK_CLOSE_CODE_H
#define VOICELINK_CLOSE_CODE_H

#include <cstdint>
#include <optional>

namespace voicelink {
namespace voice {

/**
 * @enum CloseCode
 * @brief Websocket close codes sent by the voice gateway.
 */
enum class CloseCode : uint16_t {
    UNKNOWN_OPCODE = 4001,
    INVALID_PAYLOAD = 4002,
    NOT_AUTHENTICATED = 4003,
    AUTHENTICATION_FAILED = 4004,
    ALREADY_AUTHENTICATED = 4005,
    SESSION_INVALID = 4006,
    SESSION_TIMEOUT = 4009,
    SERVER_NOT_FOUND = 4011,
    UNKNOWN_PROTOCOL = 4012,
    DISCONNECTED = 4014,
    VOICE_SERVER_CRASH = 4015,
    UNKNOWN_ENCRYPTION_MODE = 4016
};

/** @brief Normal websocket closure. */
constexpr uint16_t WS_CLOSE_NORMAL = 1000;

/** @brief Maps a raw code onto the gateway catalogue. */
inline std::optional<CloseCode> close_code_from_u16(uint16_t code) {
    switch (code) {
        case 4001: case 4002: case 4003: case 4004: case 4005: case 4006:
        case 4009: case 4011: case 4012: case 4014: case 4015: case 4016:
            return static_cast<CloseCode>(code);
        default:
            return std::nullopt;
    }
}

/**
 * @enum ClosureAction
 * @brief What the driver does once its websocket has gone away.
 */
enum class ClosureAction {
    RESUME,    ///< Try a Resume; a refused Resume falls back to RECONNECT.
    RECONNECT, ///< Tear down and run the full handshake again.
    GIVE_UP    ///< Removed from the channel; end the session.
};

const char* closure_action_name(ClosureAction action);

/**
 * @brief Reconnect decision for a closed websocket.
 * @details `code` is absent when the transport could not report one; libdatachannel never
 *          reports the peer's code. An absent code is treated like any non-normal closure and
 *          tries a Resume. A session the server has already dropped refuses it, and the full
 *          handshakes that follow are bounded by the reconnect attempt limit.
 *          1000 reconnects, 4014 gives up, and every other code resumes.
 */
inline ClosureAction closure_action(std::optional<uint16_t> code) {
    if (!code) {
        return ClosureAction::RESUME;
    }
    if (*code == WS_CLOSE_NORMAL) {
        return ClosureAction::RECONNECT;
    }
    const std::optional<CloseCode> known = close_code_from_u16(*code);
    if (known && *known == CloseCode::DISCONNECTED) {
        return ClosureAction::GIVE_UP;
    }
    return ClosureAction::RESUME;
}

inline const char* closure_action_name(ClosureAction action) {
    switch (action) {
        case ClosureAction::RESUME: return "resume";
        case ClosureAction::RECONNECT: return "reconnect";
        case ClosureAction::GIVE_UP: return "give up";
    }
    return "unknown";
}

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_CLOSE_CODE_H
