#include "lantern/protocol/Frame.hpp"

#include "lantern/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <array>
#include <fstream>
#include <limits>
#include <system_error>
#include <vector>

namespace lantern::protocol {

namespace {

using daemon::StructuredLogger;

void write_u32(std::vector<std::uint8_t>& out, std::uint32_t value) {
    out.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFFu));
    out.push_back(static_cast<std::uint8_t>(value & 0xFFu));
}

std::uint32_t read_u32(const std::uint8_t* data) {
    return (static_cast<std::uint32_t>(data[0]) << 24) |
           (static_cast<std::uint32_t>(data[1]) << 16) |
           (static_cast<std::uint32_t>(data[2]) << 8) |
           static_cast<std::uint32_t>(data[3]);
}

bool cancelled(const TransferOptions& options) {
    return options.cancel != nullptr && options.cancel->load();
}

void discard_partial_file(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::remove(path, ec);
    if (ec) {
        daemon::log_event(StructuredLogger::Level::Warning,
                          "transfer.partial_cleanup_failed",
                          {{"path", path.string()}, {"reason", ec.message()}});
    }
}

}  // namespace

bool is_valid_utf8(std::string_view text) noexcept {
    std::size_t i = 0;
    while (i < text.size()) {
        const auto lead = static_cast<unsigned char>(text[i]);
        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t continuation = 0;
        std::uint32_t code_point = 0;
        std::uint32_t minimum = 0;
        if ((lead & 0xE0u) == 0xC0u) {
            continuation = 1;
            code_point = lead & 0x1Fu;
            minimum = 0x80;
        } else if ((lead & 0xF0u) == 0xE0u) {
            continuation = 2;
            code_point = lead & 0x0Fu;
            minimum = 0x800;
        } else if ((lead & 0xF8u) == 0xF0u) {
            continuation = 3;
            code_point = lead & 0x07u;
            minimum = 0x10000;
        } else {
            return false;
        }

        if (i + continuation >= text.size()) {
            return false;
        }
        for (std::size_t k = 1; k <= continuation; ++k) {
            const auto byte = static_cast<unsigned char>(text[i + k]);
            if ((byte & 0xC0u) != 0x80u) {
                return false;
            }
            code_point = (code_point << 6) | (byte & 0x3Fu);
        }

        // Overlong forms, UTF-16 surrogates and values past U+10FFFF.
        if (code_point < minimum || code_point > 0x10FFFFu ||
            (code_point >= 0xD800u && code_point <= 0xDFFFu)) {
            return false;
        }
        i += continuation + 1;
    }
    return true;
}

void send_frame(network::NativeSocket socket, std::string_view text) {
    if (text.size() > std::numeric_limits<std::uint32_t>::max()) {
        throw ProtocolViolation("Frame payload too large to encode");
    }

    std::vector<std::uint8_t> buffer;
    buffer.reserve(kFrameHeaderBytes + text.size());
    write_u32(buffer, static_cast<std::uint32_t>(text.size()));
    buffer.insert(buffer.end(), text.begin(), text.end());

    if (!network::send_all(socket, buffer.data(), buffer.size())) {
        throw TransportError(network::format_socket_error("Failed to send frame"));
    }
}

std::optional<std::string> recv_frame(network::NativeSocket socket, std::size_t max_bytes) {
    std::array<std::uint8_t, kFrameHeaderBytes> header{};
    if (!network::recv_exact(socket, header.data(), header.size())) {
        return std::nullopt;
    }

    const auto length = read_u32(header.data());
    if (length > max_bytes) {
        throw ProtocolViolation("Frame length " + std::to_string(length) +
                                " exceeds limit of " + std::to_string(max_bytes) + " bytes");
    }

    std::string payload(length, '\0');
    if (length > 0 &&
        !network::recv_exact(socket, reinterpret_cast<std::uint8_t*>(payload.data()), payload.size())) {
        return std::nullopt;
    }

    if (!is_valid_utf8(payload)) {
        throw ProtocolViolation("Frame payload is not valid UTF-8");
    }
    return payload;
}

std::uint64_t send_raw_file(network::NativeSocket socket,
                            const std::filesystem::path& path,
                            std::uint64_t size,
                            const TransferOptions& options) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        throw TransportError("Unable to open file for reading: " + path.string());
    }

    std::vector<std::uint8_t> buffer(std::max<std::size_t>(options.chunk_size, 1));
    std::uint64_t sent = 0;
    while (sent < size) {
        if (cancelled(options)) {
            break;
        }
        const auto want = static_cast<std::size_t>(
            std::min<std::uint64_t>(buffer.size(), size - sent));
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(want));
        const auto got = static_cast<std::size_t>(input.gcount());
        if (got == 0) {
            // File shrank underneath us; the receiver sees a short transfer.
            break;
        }
        if (!network::send_all(socket, buffer.data(), got)) {
            throw TransportError(network::format_socket_error("Connection lost while sending file"));
        }
        sent += got;
        if (options.on_progress) {
            options.on_progress(sent, size);
        }
        if (got < want) {
            break;
        }
    }
    return sent;
}

void send_file(network::NativeSocket socket,
               const std::filesystem::path& path,
               const TransferOptions& options) {
    const auto size = static_cast<std::uint64_t>(std::filesystem::file_size(path));
    send_frame(socket, std::to_string(size));
    send_raw_file(socket, path, size, options);
}

std::uint64_t recv_file(network::NativeSocket socket,
                        const std::filesystem::path& destination,
                        std::uint64_t expected_size,
                        const TransferOptions& options) {
    std::ofstream output(destination, std::ios::binary | std::ios::trunc);
    if (!output) {
        throw TransportError("Unable to open destination file: " + destination.string());
    }

    std::vector<std::uint8_t> buffer(std::max<std::size_t>(options.chunk_size, 1));
    std::uint64_t received = 0;
    try {
        while (received < expected_size) {
            if (cancelled(options)) {
                break;
            }
            const auto want = static_cast<std::size_t>(
                std::min<std::uint64_t>(buffer.size(), expected_size - received));
            if (!network::recv_exact(socket, buffer.data(), want)) {
                break;
            }
            output.write(reinterpret_cast<const char*>(buffer.data()), static_cast<std::streamsize>(want));
            if (!output) {
                throw TransportError("Failed writing to " + destination.string());
            }
            received += want;
            if (options.on_progress) {
                options.on_progress(received, expected_size);
            }
        }
        output.close();
        if (output.fail()) {
            throw TransportError("Failed to flush " + destination.string());
        }
    } catch (const std::exception&) {
        if (output.is_open()) {
            output.close();
        }
        discard_partial_file(destination);
        throw;
    }

    if (received < expected_size) {
        discard_partial_file(destination);
    }
    return received;
}

}  // namespace lantern::protocol
