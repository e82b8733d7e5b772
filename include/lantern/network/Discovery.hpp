#pragma once

#include "lantern/Config.hpp"
#include "lantern/network/PeerRegistry.hpp"
#include "lantern/network/Socket.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace lantern::network {

// Broadcast addresses of the up, non-loopback IPv4 interfaces; falls back to
// 255.255.255.255 when none can be enumerated.
std::vector<std::string> local_broadcast_addresses();

// Beacon emitter plus listener. Beacons advertise config.control_port and are
// sent to config.discovery_port on every target address.
class Discovery {
public:
    Discovery(Config config, PeerRegistry& registry);
    ~Discovery();

    Discovery(const Discovery&) = delete;
    Discovery& operator=(const Discovery&) = delete;

    // Binds the listener; throws std::runtime_error when the port is unavailable.
    void start();
    void stop();
    bool running() const noexcept { return running_.load(); }

    // Replaces interface enumeration. Must be called before start().
    void set_broadcast_targets(std::vector<std::string> addresses);
    // Listen-only discovery records peers without advertising itself.
    // Must be called before start().
    void set_announce(bool enabled) { announce_enabled_ = enabled; }

    // Sends one beacon to every target; returns how many sends succeeded.
    std::size_t announce();

private:
    void emitter_loop();
    void listener_loop();

    Config config_;
    PeerRegistry& registry_;
    std::vector<std::string> targets_;
    std::string payload_;
    bool announce_enabled_{true};

    ScopedSocket listen_socket_;
    ScopedSocket send_socket_;

    std::atomic<bool> running_{false};
    std::mutex wake_mutex_;
    std::condition_variable wake_;
    std::thread emitter_thread_;
    std::thread listener_thread_;
};

}  // namespace lantern::network
