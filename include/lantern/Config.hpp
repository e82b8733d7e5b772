#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>

namespace lantern {

struct Config {
    // Networking
    std::string bind_host{"0.0.0.0"};
    std::uint16_t control_port{5000};
    std::uint16_t discovery_port{5001};
    std::size_t chunk_size{4096};

    // Discovery
    std::chrono::seconds beacon_interval{std::chrono::seconds(5)};
    std::chrono::seconds peer_timeout{std::chrono::seconds(15)};
    std::chrono::milliseconds discovery_receive_timeout{std::chrono::milliseconds(2000)};

    // Connection handling
    std::size_t max_connections{50};
    std::size_t max_frame_bytes{64 * 1024};
    std::chrono::milliseconds accept_poll_interval{std::chrono::milliseconds(2000)};
    std::chrono::seconds connection_io_timeout{std::chrono::seconds(30)};
    std::chrono::seconds upload_confirm_timeout{std::chrono::seconds(60)};
    std::chrono::milliseconds file_lock_wait{std::chrono::milliseconds(5000)};

    // Client side
    std::chrono::seconds client_connect_timeout{std::chrono::seconds(10)};
    std::chrono::seconds client_transfer_timeout{std::chrono::seconds(30)};

    // Storage
    std::string shared_directory{"shared_files"};
    std::optional<std::string> download_directory{};

    // Identity; empty values are filled in at startup.
    std::string peer_id{};
    std::string hostname{};

    std::string log_level{"info"};
};

// Fills peer_id and hostname when the caller left them empty.
void resolve_identity(Config& config);

}  // namespace lantern
