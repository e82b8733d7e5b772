#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace lantern::network {

inline constexpr std::string_view kBeaconTag = "LANTERN_DISCOVER";
inline constexpr char kBeaconDelimiter = ':';
inline constexpr std::size_t kMaxBeaconBytes = 1024;

struct Beacon {
    std::string peer_id;
    std::string hostname;
    std::uint16_t tcp_port{0};
};

// LANTERN_DISCOVER:<peer_id>:<hostname>:<tcp_port>
std::string encode_beacon(const Beacon& beacon);

// std::nullopt unless the message has exactly four fields, the expected tag
// and a decimal port in range.
std::optional<Beacon> parse_beacon(std::string_view message);

}  // namespace lantern::network
