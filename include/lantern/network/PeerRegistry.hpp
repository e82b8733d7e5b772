#pragma once

#include "lantern/Types.hpp"

#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace lantern::network {

// Peers heard from recently, keyed by peer id. Entries expire lazily: a read
// through active_peers() drops every record older than the timeout.
class PeerRegistry {
public:
    using Clock = std::chrono::steady_clock;

    PeerRegistry(std::string self_id, std::chrono::seconds peer_timeout);

    PeerRegistry(const PeerRegistry&) = delete;
    PeerRegistry& operator=(const PeerRegistry&) = delete;

    // Returns true when the beacon created or refreshed a record.
    bool handle_beacon(std::string_view message,
                       const std::string& sender_ip,
                       Clock::time_point now = Clock::now());

    // Fresh records sorted by hostname then id; stale ones are purged.
    std::vector<PeerRecord> active_peers(Clock::time_point now = Clock::now());

    // Matches an active peer by id or hostname.
    std::optional<PeerRecord> lookup(std::string_view key, Clock::time_point now = Clock::now());

    const std::string& self_id() const noexcept { return self_id_; }
    std::chrono::seconds peer_timeout() const noexcept { return peer_timeout_; }

private:
    std::string self_id_;
    std::chrono::seconds peer_timeout_;
    std::mutex mutex_;
    std::unordered_map<std::string, PeerRecord> peers_;
};

struct PeerChanges {
    std::vector<PeerRecord> joined;
    std::vector<PeerRecord> lost;
};

// Compares two successive active_peers() snapshots by peer id.
PeerChanges diff_peers(const std::vector<PeerRecord>& previous, const std::vector<PeerRecord>& current);

}  // namespace lantern::network
