/**
 * @file gateway_socket.h
 * @brief Text websocket abstraction used for the voice gateway.
 * @details `IGatewaySocket` hides the transport so the connection code can be driven by
 *          a scripted socket in tests. `RtcGatewaySocket` is the production implementation
 *          on top of libdatachannel's `rtc::WebSocket`, which delivers frames on its own
 *          threads; they are queued and consumed with `receive()`.
 */
#ifndef VOICELINK_GATEWAY_SOCKET_H
#define VOICELINK_GATEWAY_SOCKET_H

#include "gateway_payloads.h"
#include "../utils/thread_safe_queue.h"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace rtc {
class WebSocket;
}

namespace voicelink {
namespace voice {

/**
 * @struct GatewayFrame
 * @brief One inbound event from the websocket.
 */
struct GatewayFrame {
    enum class Kind {
        TEXT,   ///< A text message; `text` holds it.
        CLOSED, ///< The socket closed; `close_code` holds the code if the transport knows it.
        FAILED  ///< A transport error; `reason` describes it.
    };
    Kind kind = Kind::TEXT;
    std::string text;
    std::optional<uint16_t> close_code;
    std::string reason;
};

/**
 * @class IGatewaySocket
 * @brief A connected text websocket.
 */
class IGatewaySocket {
public:
    virtual ~IGatewaySocket() = default;

    /** @return false if the socket is closed or the send failed. */
    virtual bool send_text(const std::string& text) = 0;

    /**
     * @brief Waits up to `timeout` for the next frame.
     * @return false on timeout.
     */
    virtual bool receive(GatewayFrame& frame, std::chrono::milliseconds timeout) = 0;

    virtual void close() = 0;
};

/** @brief Opens a socket to a URL, or returns nullptr if it could not be opened in time. */
using GatewaySocketFactory =
    std::function<std::unique_ptr<IGatewaySocket>(const std::string& url, std::chrono::milliseconds timeout)>;

/** @brief Serializes and sends one gateway event. */
bool send_gateway_event(IGatewaySocket& socket, const GatewayEvent& event);

/**
 * @enum GatewayReadResult
 * @brief Outcome of reading one decoded event from a socket.
 */
enum class GatewayReadResult {
    EVENT,     ///< `event` was filled.
    TIMEOUT,   ///< Nothing arrived in time.
    IGNORED,   ///< A frame arrived but could not be decoded; it was logged and dropped.
    CLOSED     ///< The socket closed or failed; `frame` holds the details.
};

/**
 * @brief Reads and decodes the next frame.
 * @param socket Socket to read.
 * @param timeout Maximum wait.
 * @param event Receives the decoded event on `EVENT`.
 * @param frame Receives the raw frame; meaningful on `CLOSED`.
 */
GatewayReadResult read_gateway_event(IGatewaySocket& socket,
                                     std::chrono::milliseconds timeout,
                                     GatewayEvent& event,
                                     GatewayFrame& frame);

/**
 * @class GatewayFrameSink
 * @brief Turns websocket transport callbacks into queued `GatewayFrame`s.
 * @details libdatachannel calls back on its own threads and reports a closure without the
 *          peer's close code. A closure this side asked for is stamped `WS_CLOSE_NORMAL`;
 *          one the peer started carries no code, and the reconnect policy treats it as such.
 */
class GatewayFrameSink {
public:
    void on_open();
    void on_closed();
    void on_error(std::string error);
    void on_text(std::string text);

    /** @brief Marks the next closure as locally requested. */
    void closing_locally();

    /** @return true once the socket opened; false if it failed or `timeout` passed first. */
    bool wait_open(std::chrono::milliseconds timeout);

    bool next_frame(GatewayFrame& frame, std::chrono::milliseconds timeout);

private:
    utils::ThreadSafeQueue<GatewayFrame> frames_;
    utils::ThreadSafeQueue<bool> open_signal_;
    std::atomic<bool> local_close_{false};
};

/**
 * @class RtcGatewaySocket
 * @brief `IGatewaySocket` over libdatachannel's TLS websocket.
 */
class RtcGatewaySocket : public IGatewaySocket {
public:
    RtcGatewaySocket();
    ~RtcGatewaySocket() override;

    /**
     * @brief Connects and waits for the open handshake.
     * @return false if the socket failed or did not open within `timeout`.
     */
    bool open(const std::string& url, std::chrono::milliseconds timeout);

    bool send_text(const std::string& text) override;
    bool receive(GatewayFrame& frame, std::chrono::milliseconds timeout) override;
    void close() override;

private:
    std::shared_ptr<rtc::WebSocket> ws_;
    // Shared with the callbacks so a late callback after destruction is harmless.
    std::shared_ptr<GatewayFrameSink> sink_;
};

/** @brief Factory producing connected `RtcGatewaySocket`s. */
std::unique_ptr<IGatewaySocket> open_rtc_gateway_socket(const std::string& url,
                                                        std::chrono::milliseconds timeout);

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_GATEWAY_SOCKET_H
