#include "udp_socket.h"
#include "../utils/cpp_logger.h"

#include <cstring>

namespace voicelink {
namespace voice {

VoiceUdpSocket::VoiceUdpSocket() : socket_fd_(VL_INVALID_SOCKET_VALUE) {
#ifdef _WIN32
    WSADATA wsaData;
    if (WSAStartup(MAKEWORD(2, 2), &wsaData) != 0) {
        LOG_VL_ERROR("[VoiceUdpSocket] WSAStartup failed");
    }
#endif
}

VoiceUdpSocket::~VoiceUdpSocket() {
    close();
#ifdef _WIN32
    WSACleanup();
#endif
}

bool VoiceUdpSocket::open(const std::string& ip, uint16_t port) {
    close();

    struct sockaddr_in server_addr;
    std::memset(&server_addr, 0, sizeof(server_addr));
    server_addr.sin_family = AF_INET;
    server_addr.sin_port = htons(port);
    if (inet_pton(AF_INET, ip.c_str(), &server_addr.sin_addr) != 1) {
        LOG_VL_ERROR("[VoiceUdpSocket] Invalid server address %s", ip.c_str());
        return false;
    }

    socket_t fd = socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP);
    if (fd == VL_INVALID_SOCKET_VALUE) {
        LOG_VL_ERROR("[VoiceUdpSocket] Failed to create socket (err=%d)", VL_GET_LAST_SOCK_ERROR);
        return false;
    }

    struct sockaddr_in local_addr;
    std::memset(&local_addr, 0, sizeof(local_addr));
    local_addr.sin_family = AF_INET;
    local_addr.sin_addr.s_addr = htonl(INADDR_ANY);
    local_addr.sin_port = 0;

    if (bind(fd, (struct sockaddr*)&local_addr, sizeof(local_addr)) < 0) {
        LOG_VL_ERROR("[VoiceUdpSocket] Failed to bind 0.0.0.0:0 (err=%d)", VL_GET_LAST_SOCK_ERROR);
        vl_close_socket(fd);
        return false;
    }

    if (connect(fd, (struct sockaddr*)&server_addr, sizeof(server_addr)) < 0) {
        LOG_VL_ERROR("[VoiceUdpSocket] Failed to connect to %s:%u (err=%d)",
                     ip.c_str(), port, VL_GET_LAST_SOCK_ERROR);
        vl_close_socket(fd);
        return false;
    }

    socket_fd_ = fd;
    LOG_VL_INFO("[VoiceUdpSocket] Connected to %s:%u", ip.c_str(), port);
    return true;
}

bool VoiceUdpSocket::send(const uint8_t* data, std::size_t len) {
    socket_t fd = socket_fd_;
    if (fd == VL_INVALID_SOCKET_VALUE) {
        return false;
    }
#ifdef _WIN32
    int sent_bytes = ::send(fd, reinterpret_cast<const char*>(data), static_cast<int>(len), 0);
#else
    ssize_t sent_bytes = ::send(fd, data, len, 0);
#endif
    if (sent_bytes < 0) {
        LOG_VL_ERROR("[VoiceUdpSocket] send failed (err=%d)", VL_GET_LAST_SOCK_ERROR);
        return false;
    }
    if (static_cast<std::size_t>(sent_bytes) != len) {
        LOG_VL_ERROR("[VoiceUdpSocket] send sent partial data: %d/%zu", static_cast<int>(sent_bytes), len);
        return false;
    }
    return true;
}

VoiceUdpSocket::RecvStatus VoiceUdpSocket::receive(uint8_t* buffer,
                                                   std::size_t capacity,
                                                   std::size_t& out_len,
                                                   std::chrono::milliseconds timeout) {
    socket_t fd = socket_fd_;
    if (fd == VL_INVALID_SOCKET_VALUE) {
        return RecvStatus::FAILED;
    }

    struct pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN;
    pfd.revents = 0;
    int ready = VL_POLL(&pfd, 1, static_cast<int>(timeout.count()));
    if (ready == 0) {
        return RecvStatus::TIMEOUT;
    }
    if (ready < 0) {
#ifndef _WIN32
        if (errno == EINTR) {
            return RecvStatus::TIMEOUT;
        }
#endif
        LOG_VL_ERROR("[VoiceUdpSocket] poll failed (err=%d)", VL_GET_LAST_SOCK_ERROR);
        return RecvStatus::FAILED;
    }
    if (pfd.revents & (POLLERR | POLLNVAL)) {
        return RecvStatus::FAILED;
    }

#ifdef _WIN32
    int n_received = recv(fd, reinterpret_cast<char*>(buffer), static_cast<int>(capacity), 0);
#else
    ssize_t n_received = recv(fd, buffer, capacity, 0);
#endif
    if (n_received < 0) {
        // ICMP port unreachable surfaces here on a connected socket; not fatal.
        LOG_VL_WARNING("[VoiceUdpSocket] recv failed (err=%d)", VL_GET_LAST_SOCK_ERROR);
        return RecvStatus::TIMEOUT;
    }
    out_len = static_cast<std::size_t>(n_received);
    return RecvStatus::DATA;
}

void VoiceUdpSocket::close() {
    socket_t fd = socket_fd_.exchange(VL_INVALID_SOCKET_VALUE);
    if (fd != VL_INVALID_SOCKET_VALUE) {
#ifndef _WIN32
        shutdown(fd, SHUT_RDWR);
#endif
        vl_close_socket(fd);
    }
}

} // namespace voice
} // namespace voicelink
