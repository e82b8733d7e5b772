#pragma once

#include "lantern/network/Socket.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace lantern::protocol {

inline constexpr std::size_t kFrameHeaderBytes = 4;
inline constexpr std::size_t kDefaultMaxFrameBytes = 64 * 1024;
inline constexpr std::size_t kDefaultChunkSize = 4096;

// The remote side sent something the codec refuses to accept.
class ProtocolViolation : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// The local side could not write to the connection or the destination file.
class TransportError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

using ProgressCallback = std::function<void(std::uint64_t current, std::uint64_t total)>;

struct TransferOptions {
    std::size_t chunk_size{kDefaultChunkSize};
    ProgressCallback on_progress{};
    // Checked between chunks, never mid-chunk.
    const std::atomic<bool>* cancel{nullptr};
};

// Writes [u32 big-endian length][UTF-8 text] with a single send.
void send_frame(network::NativeSocket socket, std::string_view text);

// std::nullopt when the stream ends before a complete frame arrived.
// Throws ProtocolViolation for a length above `max_bytes` (nothing is allocated)
// or for a payload that is not valid UTF-8.
std::optional<std::string> recv_frame(network::NativeSocket socket,
                                      std::size_t max_bytes = kDefaultMaxFrameBytes);

// Size frame followed by the raw file content.
void send_file(network::NativeSocket socket,
               const std::filesystem::path& path,
               const TransferOptions& options = {});

// Streams at most `size` bytes of the file without any framing and returns the
// number of bytes written to the socket. Stops early when cancelled.
std::uint64_t send_raw_file(network::NativeSocket socket,
                            const std::filesystem::path& path,
                            std::uint64_t size,
                            const TransferOptions& options = {});

// Receives `expected_size` raw bytes into `destination`. Returns the bytes
// written; anything short of `expected_size` means the destination was removed.
std::uint64_t recv_file(network::NativeSocket socket,
                        const std::filesystem::path& destination,
                        std::uint64_t expected_size,
                        const TransferOptions& options = {});

bool is_valid_utf8(std::string_view text) noexcept;

}  // namespace lantern::protocol
