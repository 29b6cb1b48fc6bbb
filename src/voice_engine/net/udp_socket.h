/**
 * @file udp_socket.h
 * @brief Connected UDP socket shared by the voice send and receive workers.
 */
#ifndef VOICELINK_UDP_SOCKET_H
#define VOICELINK_UDP_SOCKET_H

#include <atomic>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

// Platform-specific socket includes and type definitions
#ifdef _WIN32
    #include <winsock2.h>
    #include <ws2tcpip.h>
    #pragma comment(lib, "Ws2_32.lib")
    using socket_t = SOCKET;
    #define VL_INVALID_SOCKET_VALUE INVALID_SOCKET
    #define VL_GET_LAST_SOCK_ERROR WSAGetLastError()
    #define VL_POLL WSAPoll
    #define vl_close_socket ::closesocket
#else // POSIX
    #include <sys/types.h>
    #include <sys/socket.h>
    #include <netinet/in.h>
    #include <arpa/inet.h>
    #include <unistd.h>
    #include <poll.h>
    #include <errno.h>
    using socket_t = int;
    #define VL_INVALID_SOCKET_VALUE -1
    #define VL_GET_LAST_SOCK_ERROR errno
    #define VL_POLL poll
    #define vl_close_socket ::close
#endif

namespace voicelink {
namespace voice {

/**
 * @class VoiceUdpSocket
 * @brief IPv4 UDP socket bound to an ephemeral port and connected to the voice server.
 * @details One thread sends while another receives; `close()` unblocks a pending receive.
 */
class VoiceUdpSocket {
public:
    enum class RecvStatus {
        DATA,
        TIMEOUT,
        FAILED
    };

    VoiceUdpSocket();
    ~VoiceUdpSocket();

    VoiceUdpSocket(const VoiceUdpSocket&) = delete;
    VoiceUdpSocket& operator=(const VoiceUdpSocket&) = delete;

    /**
     * @brief Binds `0.0.0.0:0` and connects to the server.
     * @param ip Server address literal from Ready.
     * @param port Server port from Ready.
     * @return false on any socket error, or if `ip` is not an IPv4 literal.
     */
    bool open(const std::string& ip, uint16_t port);

    /** @return false unless the whole datagram was sent. */
    bool send(const uint8_t* data, std::size_t len);

    /**
     * @brief Waits up to `timeout` for one datagram.
     * @param buffer Destination.
     * @param capacity Size of `buffer`.
     * @param out_len Bytes received on `DATA`.
     */
    RecvStatus receive(uint8_t* buffer, std::size_t capacity, std::size_t& out_len,
                       std::chrono::milliseconds timeout);

    void close();

    bool is_open() const { return socket_fd_ != VL_INVALID_SOCKET_VALUE; }

private:
    std::atomic<socket_t> socket_fd_;
};

} // namespace voice
} // namespace voicelink

#endif // VOICELINK_UDP_SOCKET_H
