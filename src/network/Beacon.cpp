#include "lantern/network/Beacon.hpp"

#include "lantern/protocol/Command.hpp"

#include <limits>
#include <vector>

namespace lantern::network {

std::string encode_beacon(const Beacon& beacon) {
    std::string message(kBeaconTag);
    message.push_back(kBeaconDelimiter);
    message.append(beacon.peer_id);
    message.push_back(kBeaconDelimiter);
    message.append(beacon.hostname);
    message.push_back(kBeaconDelimiter);
    message.append(std::to_string(beacon.tcp_port));
    return message;
}

std::optional<Beacon> parse_beacon(std::string_view message) {
    const auto fields = protocol::split(message, std::string_view(&kBeaconDelimiter, 1));
    if (fields.size() != 4 || fields[0] != kBeaconTag) {
        return std::nullopt;
    }

    const auto port = protocol::parse_integer(fields[3]);
    if (!port || *port < 0 || *port > std::numeric_limits<std::uint16_t>::max()) {
        return std::nullopt;
    }

    return Beacon{fields[1], fields[2], static_cast<std::uint16_t>(*port)};
}

}  // namespace lantern::network
