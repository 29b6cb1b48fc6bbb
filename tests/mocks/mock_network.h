#pragma once
/**
 * Test doubles for the network edges of the voice engine.
 * These let the handshake, the gateway runner and the call facade run without a real
 * voice server: a scripted gateway socket, a recording main-gateway shard, a loopback
 * IP discovery responder, and a generator for raw float PCM sources.
 */

#include "crypto/crypto_mode.h"
#include "gateway/gateway_payloads.h"
#include "gateway/gateway_socket.h"
#include "driver/call.h"
#include "input/input.h"
#include "rtp/ip_discovery.h"
#include "net/udp_socket.h"
#include "utils/thread_safe_queue.h"
#include "voice_constants.h"

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstring>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace voicelink {
namespace voice {
namespace testing {

using FrameQueue = utils::ThreadSafeQueue<GatewayFrame>;

/**
 * Shared state behind every socket a scripted factory opens.
 * A responder maps each event the client sends to the frames the "server" answers with.
 */
class ScriptedGatewayServer {
public:
    using Responder = std::function<std::vector<GatewayEvent>(const GatewayEvent&)>;

    void set_responder(Responder responder) {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(responder);
    }

    void set_fail_open(bool fail) { fail_open_ = fail; }
    void set_fail_send(bool fail) { fail_send_ = fail; }

    // Called by the socket on open; later frames go to the newest socket.
    std::shared_ptr<FrameQueue> on_open(const std::string& url) {
        std::lock_guard<std::mutex> lock(mutex_);
        opened_urls_.push_back(url);
        current_ = std::make_shared<FrameQueue>();
        return current_;
    }

    bool on_send(const std::string& text, FrameQueue& inbound) {
        if (fail_send_) {
            return false;
        }
        Responder responder;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            sent_.push_back(text);
            responder = responder_;
        }
        if (responder) {
            for (const auto& reply : responder(parse_gateway_event(text))) {
                GatewayFrame frame;
                frame.text = serialize_gateway_event(reply);
                inbound.push(std::move(frame));
            }
        }
        return true;
    }

    void push_event(const GatewayEvent& event) {
        GatewayFrame frame;
        frame.text = serialize_gateway_event(event);
        push_frame(std::move(frame));
    }

    void push_text(const std::string& text) {
        GatewayFrame frame;
        frame.text = text;
        push_frame(std::move(frame));
    }

    void push_close(std::optional<uint16_t> code) {
        GatewayFrame frame;
        frame.kind = GatewayFrame::Kind::CLOSED;
        frame.close_code = code;
        push_frame(std::move(frame));
    }

    std::vector<GatewayEvent> sent_events() const {
        std::lock_guard<std::mutex> lock(mutex_);
        std::vector<GatewayEvent> out;
        for (const auto& text : sent_) {
            out.push_back(parse_gateway_event(text));
        }
        return out;
    }

    std::vector<GatewayEvent> sent_events(VoiceOpcode op) const {
        std::vector<GatewayEvent> out;
        for (auto& event : sent_events()) {
            if (event.op == op) {
                out.push_back(event);
            }
        }
        return out;
    }

    std::vector<std::string> opened_urls() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return opened_urls_;
    }

    bool fail_open() const { return fail_open_; }
    size_t close_count() const { return close_count_.load(); }
    void on_close() { ++close_count_; }

private:
    void push_frame(GatewayFrame frame) {
        std::shared_ptr<FrameQueue> target;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            target = current_;
        }
        if (target) {
            target->push(std::move(frame));
        }
    }

    mutable std::mutex mutex_;
    Responder responder_;
    std::shared_ptr<FrameQueue> current_;
    std::vector<std::string> sent_;
    std::vector<std::string> opened_urls_;
    std::atomic<bool> fail_open_{false};
    std::atomic<bool> fail_send_{false};
    std::atomic<size_t> close_count_{0};
};

class ScriptedGatewaySocket : public IGatewaySocket {
public:
    ScriptedGatewaySocket(std::shared_ptr<ScriptedGatewayServer> server, const std::string& url)
        : server_(std::move(server)), inbound_(server_->on_open(url)) {}

    bool send_text(const std::string& text) override {
        if (closed_) {
            return false;
        }
        return server_->on_send(text, *inbound_);
    }

    bool receive(GatewayFrame& frame, std::chrono::milliseconds timeout) override {
        return inbound_->pop_for(frame, timeout) == FrameQueue::PopResult::Popped;
    }

    void close() override {
        if (!closed_.exchange(true)) {
            server_->on_close();
            inbound_->stop();
        }
    }

private:
    std::shared_ptr<ScriptedGatewayServer> server_;
    std::shared_ptr<FrameQueue> inbound_;
    std::atomic<bool> closed_{false};
};

inline GatewaySocketFactory make_scripted_factory(std::shared_ptr<ScriptedGatewayServer> server) {
    return [server](const std::string& url, std::chrono::milliseconds) -> std::unique_ptr<IGatewaySocket> {
        if (server->fail_open()) {
            return nullptr;
        }
        return std::make_unique<ScriptedGatewaySocket>(server, url);
    };
}

/**
 * Responder for a cooperative voice gateway: Hello and Ready after Identify, the session
 * key after SelectProtocol, Resumed and Hello after Resume.
 * Ready points the client at `udp_port` on localhost.
 */
inline ScriptedGatewayServer::Responder cooperative_gateway(uint16_t udp_port,
                                                             CryptoMode mode = CryptoMode::NORMAL,
                                                             uint32_t ssrc = 321) {
    return [udp_port, mode, ssrc](const GatewayEvent& sent) {
        std::vector<GatewayEvent> replies;
        switch (sent.op) {
            case VoiceOpcode::IDENTIFY: {
                Ready ready;
                ready.ssrc = ssrc;
                ready.ip = "127.0.0.1";
                ready.port = udp_port;
                ready.modes = {"xsalsa20_poly1305", "xsalsa20_poly1305_suffix", "xsalsa20_poly1305_lite"};
                replies.push_back(GatewayEvent::make(Hello{41250.0}));
                replies.push_back(GatewayEvent::make(ready));
                break;
            }
            case VoiceOpcode::SELECT_PROTOCOL: {
                SessionDescription description;
                description.mode = crypto_mode_name(mode);
                description.secret_key.assign(CRYPTO_KEY_SIZE, 7);
                replies.push_back(GatewayEvent::make(description));
                break;
            }
            case VoiceOpcode::RESUME:
                replies.push_back(GatewayEvent::make_resumed());
                replies.push_back(GatewayEvent::make(Hello{41250.0}));
                break;
            default:
                break;
        }
        return replies;
    };
}

/**
 * Polls `condition` until it holds or `timeout` passes.
 */
inline bool wait_until(const std::function<bool()>& condition,
                       std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (condition()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return condition();
}

/**
 * Main gateway shard that records every voice state update.
 */
class RecordingShard : public GatewayShard {
public:
    bool send(const std::string& payload) override {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_) {
            return false;
        }
        payloads_.push_back(payload);
        return true;
    }

    std::vector<std::string> payloads() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return payloads_;
    }

    void set_fail(bool fail) {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_ = fail;
    }

private:
    mutable std::mutex mutex_;
    std::vector<std::string> payloads_;
    bool fail_ = false;
};

/**
 * Loopback UDP peer standing in for a voice server's RTP port.
 * Answers IP discovery requests with a fixed address and records every other datagram.
 */
class LoopbackVoiceServer {
public:
    LoopbackVoiceServer(std::string reported_address, uint16_t reported_port)
        : reported_address_(std::move(reported_address)), reported_port_(reported_port) {
        fd_ = ::socket(AF_INET, SOCK_DGRAM, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = 0;
        inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr);
        ::bind(fd_, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
        socklen_t len = sizeof(addr);
        ::getsockname(fd_, reinterpret_cast<sockaddr*>(&addr), &len);
        port_ = ntohs(addr.sin_port);
        running_ = true;
        thread_ = std::thread(&LoopbackVoiceServer::run, this);
    }

    ~LoopbackVoiceServer() {
        running_ = false;
        if (thread_.joinable()) {
            thread_.join();
        }
        vl_close_socket(fd_);
    }

    uint16_t port() const { return port_; }
    size_t discovery_requests() const { return discovery_requests_.load(); }

    std::vector<std::vector<uint8_t>> datagrams() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return datagrams_;
    }

    void set_answer_discovery(bool answer) { answer_discovery_ = answer; }

private:
    void run() {
        std::vector<uint8_t> buffer(2048);
        while (running_) {
            pollfd pfd{fd_, POLLIN, 0};
            if (VL_POLL(&pfd, 1, 10) <= 0) {
                continue;
            }
            sockaddr_in from{};
            socklen_t from_len = sizeof(from);
            const ssize_t got = ::recvfrom(fd_, buffer.data(), buffer.size(), 0,
                                           reinterpret_cast<sockaddr*>(&from), &from_len);
            if (got <= 0) {
                continue;
            }
            if (static_cast<size_t>(got) == IP_DISCOVERY_PACKET_SIZE && buffer[1] == IP_DISCOVERY_REQUEST) {
                ++discovery_requests_;
                if (answer_discovery_) {
                    auto response = build_response(buffer.data());
                    ::sendto(fd_, response.data(), response.size(), 0,
                             reinterpret_cast<sockaddr*>(&from), from_len);
                }
                continue;
            }
            std::lock_guard<std::mutex> lock(mutex_);
            datagrams_.emplace_back(buffer.begin(), buffer.begin() + got);
        }
    }

    std::vector<uint8_t> build_response(const uint8_t* request) const {
        std::vector<uint8_t> response(IP_DISCOVERY_PACKET_SIZE, 0);
        response[1] = static_cast<uint8_t>(IP_DISCOVERY_RESPONSE);
        response[3] = 70;
        std::memcpy(&response[4], request + 4, 4);
        std::memcpy(&response[8], reported_address_.data(), reported_address_.size());
        response[72] = static_cast<uint8_t>(reported_port_ >> 8);
        response[73] = static_cast<uint8_t>(reported_port_ & 0xFF);
        return response;
    }

    std::string reported_address_;
    uint16_t reported_port_;
    socket_t fd_ = VL_INVALID_SOCKET_VALUE;
    uint16_t port_ = 0;
    std::atomic<bool> running_{false};
    std::atomic<bool> answer_discovery_{true};
    std::atomic<size_t> discovery_requests_{0};
    mutable std::mutex mutex_;
    std::vector<std::vector<uint8_t>> datagrams_;
    std::thread thread_;
};

/**
 * Generator for raw stereo float PCM, the format `CodecType::FLOAT_PCM` sources read.
 */
class TestPcmGenerator {
public:
    // Interleaved stereo silence for `frames` 20 ms frames.
    static std::vector<uint8_t> silence(size_t frames) {
        return std::vector<uint8_t>(frames * STEREO_FRAME_BYTE_SIZE, 0);
    }

    static std::vector<uint8_t> sine(size_t frames, float frequency, float amplitude = 0.5f) {
        std::vector<float> samples(frames * STEREO_FRAME_SIZE);
        for (size_t i = 0; i < frames * MONO_FRAME_SIZE; ++i) {
            const double t = static_cast<double>(i) / SAMPLE_RATE;
            const float value = amplitude * static_cast<float>(std::sin(2.0 * 3.14159265358979 * frequency * t));
            samples[2 * i] = value;
            samples[2 * i + 1] = value;
        }
        std::vector<uint8_t> bytes(samples.size() * sizeof(float));
        std::memcpy(bytes.data(), samples.data(), bytes.size());
        return bytes;
    }

    static std::unique_ptr<Input> input(std::vector<uint8_t> bytes) {
        auto shared = std::make_shared<const std::vector<uint8_t>>(std::move(bytes));
        return Input::from_bytes(shared, true, CodecType::FLOAT_PCM, Container::raw());
    }

    // DCA-framed Opus: each frame prefixed by its little-endian i16 length.
    static std::vector<uint8_t> dca_frames(const std::vector<std::vector<uint8_t>>& frames) {
        std::vector<uint8_t> out;
        for (const auto& frame : frames) {
            const uint16_t len = static_cast<uint16_t>(frame.size());
            out.push_back(static_cast<uint8_t>(len & 0xFF));
            out.push_back(static_cast<uint8_t>(len >> 8));
            out.insert(out.end(), frame.begin(), frame.end());
        }
        return out;
    }
};

} // namespace testing
} // namespace voice
} // namespace voicelink
