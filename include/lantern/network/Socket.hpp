#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <winsock2.h>
#endif

namespace lantern::network {

#ifdef _WIN32
using NativeSocket = SOCKET;
inline constexpr NativeSocket kInvalidSocket = INVALID_SOCKET;
#else
using NativeSocket = int;
inline constexpr NativeSocket kInvalidSocket = -1;
#endif

// Performs WSAStartup once on Windows; no-op elsewhere.
void ensure_socket_runtime();

class ScopedSocket {
public:
    ScopedSocket() = default;
    explicit ScopedSocket(NativeSocket handle) : handle_(handle) {}
    ScopedSocket(const ScopedSocket&) = delete;
    ScopedSocket& operator=(const ScopedSocket&) = delete;
    ScopedSocket(ScopedSocket&& other) noexcept : handle_(other.handle_) {
        other.handle_ = kInvalidSocket;
    }
    ScopedSocket& operator=(ScopedSocket&& other) noexcept {
        if (this != &other) {
            reset();
            handle_ = other.handle_;
            other.handle_ = kInvalidSocket;
        }
        return *this;
    }
    ~ScopedSocket() { reset(); }

    NativeSocket get() const noexcept { return handle_; }
    bool valid() const noexcept { return handle_ != kInvalidSocket; }
    explicit operator bool() const noexcept { return valid(); }

    void reset(NativeSocket handle = kInvalidSocket) noexcept;
    NativeSocket release() noexcept;

private:
    NativeSocket handle_{kInvalidSocket};
};

void close_socket(NativeSocket socket) noexcept;

bool send_all(NativeSocket socket, const std::uint8_t* data, std::size_t length);
// False when the peer closed, timed out or failed before `length` bytes arrived.
bool recv_exact(NativeSocket socket, std::uint8_t* buffer, std::size_t length);

bool set_recv_timeout(NativeSocket socket, std::chrono::milliseconds timeout);
bool set_send_timeout(NativeSocket socket, std::chrono::milliseconds timeout);

// Returns >0 when readable, 0 on timeout, <0 on error.
int wait_readable(NativeSocket socket, std::chrono::milliseconds timeout);

// Resolves `host` (IPv4) and connects within `timeout`.
std::optional<ScopedSocket> open_tcp_connection(const std::string& host,
                                                std::uint16_t port,
                                                std::chrono::milliseconds timeout);

std::string peer_address(NativeSocket socket);
std::uint16_t local_port(NativeSocket socket);

int last_socket_error() noexcept;
std::string format_socket_error(const std::string& prefix);

}  // namespace lantern::network
