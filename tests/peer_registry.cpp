#include "lantern/daemon/StructuredLogger.hpp"
#include "lantern/network/Beacon.hpp"
#include "lantern/network/PeerRegistry.hpp"

#include <cassert>
#include <chrono>
#include <sstream>
#include <string>

using namespace lantern;
using namespace std::chrono_literals;

namespace {

using Clock = network::PeerRegistry::Clock;

void test_beacon_format() {
    const auto message = network::encode_beacon(network::Beacon{"a1b2c3d4", "kitchen-pc", 5000});
    assert(message == "LANTERN_DISCOVER:a1b2c3d4:kitchen-pc:5000");

    const auto parsed = network::parse_beacon(message);
    assert(parsed);
    assert(parsed->peer_id == "a1b2c3d4");
    assert(parsed->hostname == "kitchen-pc");
    assert(parsed->tcp_port == 5000);

    assert(!network::parse_beacon("LANTERN_DISCOVER:a1b2c3d4:kitchen-pc"));
    assert(!network::parse_beacon("LANTERN_DISCOVER:a1b2c3d4:kitchen:pc:5000"));
    assert(!network::parse_beacon("OTHER_TAG:a1b2c3d4:kitchen-pc:5000"));
    assert(!network::parse_beacon("LANTERN_DISCOVER:a1b2c3d4:kitchen-pc:port"));
    assert(!network::parse_beacon("LANTERN_DISCOVER:a1b2c3d4:kitchen-pc:70000"));
    assert(!network::parse_beacon("LANTERN_DISCOVER:a1b2c3d4:kitchen-pc:-1"));
    assert(!network::parse_beacon(""));
}

void test_upsert_and_self_filter() {
    network::PeerRegistry registry("self0001", 15s);
    const auto start = Clock::now();

    assert(!registry.handle_beacon("LANTERN_DISCOVER:self0001:me:5000", "10.0.0.1", start));
    assert(registry.active_peers(start).empty());

    assert(registry.handle_beacon("LANTERN_DISCOVER:peer0002:zeta:5000", "10.0.0.2", start));
    assert(registry.handle_beacon("LANTERN_DISCOVER:peer0003:alpha:6000", "10.0.0.3", start));
    auto peers = registry.active_peers(start);
    assert(peers.size() == 2);
    assert(peers[0].hostname == "alpha" && peers[0].tcp_port == 6000 && peers[0].ip == "10.0.0.3");
    assert(peers[1].hostname == "zeta");

    // A refresh replaces address, hostname and port.
    assert(registry.handle_beacon("LANTERN_DISCOVER:peer0002:zeta-renamed:5050", "10.0.0.9", start + 1s));
    peers = registry.active_peers(start + 1s);
    assert(peers.size() == 2);
    assert(peers[1].peer_id == "peer0002");
    assert(peers[1].hostname == "zeta-renamed" && peers[1].ip == "10.0.0.9" && peers[1].tcp_port == 5050);
    assert(peers[1].last_seen == start + 1s);
}

void test_malformed_beacons_are_ignored() {
    network::PeerRegistry registry("self0001", 15s);
    const auto now = Clock::now();
    assert(!registry.handle_beacon("LANTERN_DISCOVER:peer0002:host", "10.0.0.2", now));
    assert(!registry.handle_beacon("HELLO:peer0002:host:5000", "10.0.0.2", now));
    assert(!registry.handle_beacon("LANTERN_DISCOVER:peer0002:host:abc", "10.0.0.2", now));
    assert(registry.active_peers(now).empty());

    // A malformed beacon from a known peer leaves its record untouched.
    assert(registry.handle_beacon("LANTERN_DISCOVER:peer0002:host:5000", "10.0.0.2", now));
    assert(!registry.handle_beacon("LANTERN_DISCOVER:peer0002:host:99999", "10.0.0.7", now + 1s));
    const auto peers = registry.active_peers(now + 1s);
    assert(peers.size() == 1 && peers[0].tcp_port == 5000 && peers[0].last_seen == now);
}

void test_expiry() {
    network::PeerRegistry registry("self0001", 15s);
    const auto start = Clock::now();
    assert(registry.handle_beacon("LANTERN_DISCOVER:peer0002:old:5000", "10.0.0.2", start));
    assert(registry.handle_beacon("LANTERN_DISCOVER:peer0003:new:5000", "10.0.0.3", start + 10s));

    assert(registry.active_peers(start + 15s).size() == 2);
    const auto peers = registry.active_peers(start + 16s);
    assert(peers.size() == 1 && peers[0].peer_id == "peer0003");

    // Purged records do not come back when the clock is read earlier.
    assert(registry.active_peers(start + 1s).size() == 1);
    assert(!registry.lookup("old", start + 16s));
    assert(registry.lookup("new", start + 16s));
    assert(registry.lookup("peer0003", start + 16s));
    assert(!registry.lookup("peer0003", start + 26s));
}

void test_diff() {
    PeerRecord a{"a", "10.0.0.1", "alpha", 5000, {}};
    PeerRecord b{"b", "10.0.0.2", "beta", 5000, {}};
    PeerRecord c{"c", "10.0.0.3", "gamma", 5000, {}};

    const auto first = network::diff_peers({}, {a, b});
    assert(first.joined.size() == 2 && first.lost.empty());

    const auto second = network::diff_peers({a, b}, {b, c});
    assert(second.joined.size() == 1 && second.joined[0].peer_id == "c");
    assert(second.lost.size() == 1 && second.lost[0].peer_id == "a");

    const auto same = network::diff_peers({a}, {a});
    assert(same.joined.empty() && same.lost.empty());
}

void test_discovery_events_are_logged() {
    std::ostringstream sink;
    auto& logger = daemon::StructuredLogger::instance();
    logger.set_sink(&sink);
    logger.set_min_level(daemon::StructuredLogger::Level::Debug);

    network::PeerRegistry registry("self0001", 15s);
    const auto now = Clock::now();
    registry.handle_beacon("garbage", "10.0.0.5", now);
    registry.handle_beacon("LANTERN_DISCOVER:peer0002:host:5000", "10.0.0.2", now);
    registry.active_peers(now + 20s);

    logger.set_sink(nullptr);
    logger.set_min_level(daemon::StructuredLogger::Level::Info);

    const auto output = sink.str();
    assert(output.find("\"event\":\"discovery.beacon.dropped\"") != std::string::npos);
    assert(output.find("\"event\":\"discovery.peer.seen\"") != std::string::npos);
    assert(output.find("\"event\":\"discovery.peer.expired\"") != std::string::npos);
}

}  // namespace

int main() {
    test_beacon_format();
    test_upsert_and_self_filter();
    test_malformed_beacons_are_ignored();
    test_expiry();
    test_diff();
    test_discovery_events_are_logged();
    return 0;
}
