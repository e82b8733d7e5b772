#include "lantern/Types.hpp"
#include "lantern/Config.hpp"

#include <algorithm>
#include <array>
#include <iomanip>
#include <random>
#include <sstream>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <winsock2.h>
#else
#include <unistd.h>
#endif

namespace lantern {

namespace {

std::string to_hex(const std::uint8_t value) {
    std::ostringstream oss;
    oss << std::hex << std::nouppercase << std::setw(2) << std::setfill('0') << static_cast<int>(value);
    return oss.str();
}

}  // namespace

std::string generate_peer_id() {
    std::random_device device;
    std::mt19937 generator(device());
    std::uniform_int_distribution<int> distribution(0, 0xFF);
    std::string id;
    for (int i = 0; i < 4; ++i) {
        id.append(to_hex(static_cast<std::uint8_t>(distribution(generator))));
    }
    return id;
}

std::string local_hostname() {
    std::array<char, 256> buffer{};
    if (::gethostname(buffer.data(), static_cast<int>(buffer.size() - 1)) != 0 || buffer[0] == '\0') {
        return "unknown";
    }
    std::string name(buffer.data());
    // ':' is the beacon field delimiter.
    std::replace(name.begin(), name.end(), ':', '-');
    return name;
}

void resolve_identity(Config& config) {
    if (config.peer_id.empty()) {
        config.peer_id = generate_peer_id();
    }
    if (config.hostname.empty()) {
        config.hostname = local_hostname();
    }
}

}  // namespace lantern
