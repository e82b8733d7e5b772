#include "lantern/network/Socket.hpp"

#include <cerrno>
#include <cstring>
#include <stdexcept>

#ifdef _WIN32
#include <ws2tcpip.h>
#pragma comment(lib, "Ws2_32.lib")
#else
#include <arpa/inet.h>
#include <fcntl.h>
#include <netdb.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <sys/time.h>
#include <sys/types.h>
#include <unistd.h>
#endif

namespace lantern::network {

namespace {

#ifdef _WIN32
class WinsockRuntime {
public:
    WinsockRuntime() {
        WSADATA data{};
        if (WSAStartup(MAKEWORD(2, 2), &data) != 0) {
            throw std::runtime_error("WSAStartup failed");
        }
    }

    ~WinsockRuntime() {
        WSACleanup();
    }
};

constexpr int kSendFlags = 0;
#elif defined(MSG_NOSIGNAL)
constexpr int kSendFlags = MSG_NOSIGNAL;
#else
constexpr int kSendFlags = 0;
#endif

void set_non_blocking(NativeSocket socket, bool enable) {
#ifdef _WIN32
    u_long mode = enable ? 1 : 0;
    ioctlsocket(socket, FIONBIO, &mode);
#else
    int flags = fcntl(socket, F_GETFL, 0);
    if (flags < 0) {
        return;
    }
    if (enable) {
        flags |= O_NONBLOCK;
    } else {
        flags &= ~O_NONBLOCK;
    }
    fcntl(socket, F_SETFL, flags);
#endif
}

int poll_one(NativeSocket socket, short events, std::chrono::milliseconds timeout) {
#ifdef _WIN32
    WSAPOLLFD descriptor{};
    descriptor.fd = socket;
    descriptor.events = events;
    return WSAPoll(&descriptor, 1, static_cast<INT>(timeout.count()));
#else
    pollfd descriptor{};
    descriptor.fd = socket;
    descriptor.events = events;
    return ::poll(&descriptor, 1, static_cast<int>(timeout.count()));
#endif
}

}  // namespace

void ensure_socket_runtime() {
#ifdef _WIN32
    static WinsockRuntime runtime;
#endif
}

void ScopedSocket::reset(NativeSocket handle) noexcept {
    if (handle_ != kInvalidSocket) {
        close_socket(handle_);
    }
    handle_ = handle;
}

NativeSocket ScopedSocket::release() noexcept {
    const auto handle = handle_;
    handle_ = kInvalidSocket;
    return handle;
}

void close_socket(NativeSocket socket) noexcept {
    if (socket == kInvalidSocket) {
        return;
    }
#ifdef _WIN32
    ::shutdown(socket, SD_BOTH);
    ::closesocket(socket);
#else
    ::shutdown(socket, SHUT_RDWR);
    ::close(socket);
#endif
}

bool send_all(NativeSocket socket, const std::uint8_t* data, std::size_t length) {
    std::size_t sent_total = 0;
    while (sent_total < length) {
#ifdef _WIN32
        const auto sent = ::send(socket, reinterpret_cast<const char*>(data + sent_total),
                                 static_cast<int>(length - sent_total), kSendFlags);
#else
        const auto sent = ::send(socket, reinterpret_cast<const char*>(data + sent_total),
                                 length - sent_total, kSendFlags);
#endif
        if (sent < 0 && last_socket_error() == EINTR) {
            continue;
        }
        if (sent <= 0) {
            return false;
        }
        sent_total += static_cast<std::size_t>(sent);
    }
    return true;
}

bool recv_exact(NativeSocket socket, std::uint8_t* buffer, std::size_t length) {
    std::size_t received_total = 0;
    while (received_total < length) {
#ifdef _WIN32
        const auto received = ::recv(socket, reinterpret_cast<char*>(buffer + received_total),
                                     static_cast<int>(length - received_total), 0);
#else
        const auto received = ::recv(socket, reinterpret_cast<char*>(buffer + received_total),
                                     length - received_total, 0);
#endif
        if (received < 0 && last_socket_error() == EINTR) {
            continue;
        }
        if (received <= 0) {
            return false;
        }
        received_total += static_cast<std::size_t>(received);
    }
    return true;
}

bool set_recv_timeout(NativeSocket socket, std::chrono::milliseconds timeout) {
#ifdef _WIN32
    const DWORD value = static_cast<DWORD>(timeout.count());
    return ::setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO,
                        reinterpret_cast<const char*>(&value), sizeof(value)) == 0;
#else
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return ::setsockopt(socket, SOL_SOCKET, SO_RCVTIMEO,
                        reinterpret_cast<const char*>(&tv), sizeof(tv)) == 0;
#endif
}

bool set_send_timeout(NativeSocket socket, std::chrono::milliseconds timeout) {
#ifdef _WIN32
    const DWORD value = static_cast<DWORD>(timeout.count());
    return ::setsockopt(socket, SOL_SOCKET, SO_SNDTIMEO,
                        reinterpret_cast<const char*>(&value), sizeof(value)) == 0;
#else
    timeval tv{};
    tv.tv_sec = static_cast<time_t>(timeout.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((timeout.count() % 1000) * 1000);
    return ::setsockopt(socket, SOL_SOCKET, SO_SNDTIMEO,
                        reinterpret_cast<const char*>(&tv), sizeof(tv)) == 0;
#endif
}

int wait_readable(NativeSocket socket, std::chrono::milliseconds timeout) {
    return poll_one(socket, POLLIN, timeout);
}

std::optional<ScopedSocket> open_tcp_connection(const std::string& host,
                                                std::uint16_t port,
                                                std::chrono::milliseconds timeout) {
    ensure_socket_runtime();

    addrinfo hints{};
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;
    hints.ai_protocol = IPPROTO_TCP;

    addrinfo* result = nullptr;
    if (const auto err = ::getaddrinfo(host.c_str(), nullptr, &hints, &result); err != 0 || result == nullptr) {
        if (result) {
            ::freeaddrinfo(result);
        }
        return std::nullopt;
    }

    sockaddr_in address = *reinterpret_cast<sockaddr_in*>(result->ai_addr);
    address.sin_port = htons(port);
    ::freeaddrinfo(result);

    ScopedSocket socket{::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP)};
    if (!socket) {
        return std::nullopt;
    }

    set_non_blocking(socket.get(), true);
    if (::connect(socket.get(), reinterpret_cast<const sockaddr*>(&address), sizeof(address)) < 0) {
        const auto error = last_socket_error();
#ifdef _WIN32
        const bool in_progress = error == WSAEWOULDBLOCK;
#else
        const bool in_progress = error == EINPROGRESS;
#endif
        if (!in_progress) {
            return std::nullopt;
        }
        if (poll_one(socket.get(), POLLOUT, timeout) <= 0) {
            return std::nullopt;
        }
        int so_error = 0;
        socklen_t length = sizeof(so_error);
        if (::getsockopt(socket.get(), SOL_SOCKET, SO_ERROR, reinterpret_cast<char*>(&so_error), &length) != 0 ||
            so_error != 0) {
            return std::nullopt;
        }
    }
    set_non_blocking(socket.get(), false);
    return socket;
}

std::string peer_address(NativeSocket socket) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getpeername(socket, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
        char buffer[INET_ADDRSTRLEN]{};
        if (::inet_ntop(AF_INET, &addr.sin_addr, buffer, sizeof(buffer))) {
            return std::string(buffer);
        }
    }
    return std::string{"unknown"};
}

std::uint16_t local_port(NativeSocket socket) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (::getsockname(socket, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

int last_socket_error() noexcept {
#ifdef _WIN32
    return WSAGetLastError();
#else
    return errno;
#endif
}

std::string format_socket_error(const std::string& prefix) {
    const auto code = last_socket_error();
#ifdef _WIN32
    return prefix + " (WSA" + std::to_string(code) + ")";
#else
    return prefix + " (errno " + std::to_string(code) + ": " + std::strerror(code) + ")";
#endif
}

}  // namespace lantern::network
