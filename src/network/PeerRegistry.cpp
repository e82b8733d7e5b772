#include "lantern/network/PeerRegistry.hpp"

#include "lantern/daemon/StructuredLogger.hpp"
#include "lantern/network/Beacon.hpp"

#include <algorithm>
#include <unordered_set>

namespace lantern::network {

namespace {

using daemon::StructuredLogger;

}  // namespace

PeerRegistry::PeerRegistry(std::string self_id, std::chrono::seconds peer_timeout)
    : self_id_(std::move(self_id)), peer_timeout_(peer_timeout) {}

bool PeerRegistry::handle_beacon(std::string_view message,
                                 const std::string& sender_ip,
                                 Clock::time_point now) {
    auto beacon = parse_beacon(message);
    if (!beacon) {
        daemon::log_event(StructuredLogger::Level::Debug,
                          "discovery.beacon.dropped",
                          {{"from", sender_ip}, {"reason", "malformed"}});
        return false;
    }
    if (beacon->peer_id == self_id_) {
        return false;
    }

    bool inserted = false;
    {
        std::scoped_lock lock(mutex_);
        auto [it, created] = peers_.try_emplace(beacon->peer_id);
        auto& record = it->second;
        record.peer_id = beacon->peer_id;
        record.ip = sender_ip;
        record.hostname = std::move(beacon->hostname);
        record.tcp_port = beacon->tcp_port;
        record.last_seen = now;
        inserted = created;
    }

    if (inserted) {
        daemon::log_event(StructuredLogger::Level::Info,
                          "discovery.peer.seen",
                          {{"peer_id", beacon->peer_id},
                           {"ip", sender_ip},
                           {"tcp_port", std::to_string(beacon->tcp_port)}});
    }
    return true;
}

std::vector<PeerRecord> PeerRegistry::active_peers(Clock::time_point now) {
    std::vector<PeerRecord> fresh;
    std::vector<std::string> expired;
    {
        std::scoped_lock lock(mutex_);
        for (auto it = peers_.begin(); it != peers_.end();) {
            if (now - it->second.last_seen > peer_timeout_) {
                expired.push_back(it->first);
                it = peers_.erase(it);
            } else {
                fresh.push_back(it->second);
                ++it;
            }
        }
    }

    for (const auto& peer_id : expired) {
        daemon::log_event(StructuredLogger::Level::Info, "discovery.peer.expired", {{"peer_id", peer_id}});
    }

    std::sort(fresh.begin(), fresh.end(), [](const PeerRecord& lhs, const PeerRecord& rhs) {
        if (lhs.hostname != rhs.hostname) {
            return lhs.hostname < rhs.hostname;
        }
        return lhs.peer_id < rhs.peer_id;
    });
    return fresh;
}

std::optional<PeerRecord> PeerRegistry::lookup(std::string_view key, Clock::time_point now) {
    for (auto& peer : active_peers(now)) {
        if (peer.peer_id == key || peer.hostname == key) {
            return std::move(peer);
        }
    }
    return std::nullopt;
}

PeerChanges diff_peers(const std::vector<PeerRecord>& previous, const std::vector<PeerRecord>& current) {
    std::unordered_set<std::string> before;
    std::unordered_set<std::string> after;
    for (const auto& peer : previous) {
        before.insert(peer.peer_id);
    }
    for (const auto& peer : current) {
        after.insert(peer.peer_id);
    }

    PeerChanges changes;
    for (const auto& peer : current) {
        if (!before.contains(peer.peer_id)) {
            changes.joined.push_back(peer);
        }
    }
    for (const auto& peer : previous) {
        if (!after.contains(peer.peer_id)) {
            changes.lost.push_back(peer);
        }
    }
    return changes;
}

}  // namespace lantern::network
