#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace lantern {

struct PeerRecord {
    std::string peer_id;
    std::string ip;
    std::string hostname;
    std::uint16_t tcp_port{0};
    std::chrono::steady_clock::time_point last_seen{};
};

struct RemoteFile {
    std::string name;
    std::uint64_t size{0};
};

// Random 8 character hex id, unique per process start.
std::string generate_peer_id();
std::string local_hostname();

}  // namespace lantern
