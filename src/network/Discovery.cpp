#include "lantern/network/Discovery.hpp"

#include "lantern/daemon/StructuredLogger.hpp"
#include "lantern/network/Beacon.hpp"
#include "lantern/protocol/Frame.hpp"

#include <array>
#include <stdexcept>

#ifdef _WIN32
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#endif

namespace lantern::network {

namespace {

using daemon::StructuredLogger;

constexpr const char* kGenericBroadcast = "255.255.255.255";

void enable_option(NativeSocket socket, int option) {
    int enable = 1;
    ::setsockopt(socket, SOL_SOCKET, option, reinterpret_cast<const char*>(&enable), sizeof(enable));
}

}  // namespace

std::vector<std::string> local_broadcast_addresses() {
    std::vector<std::string> addresses;
#ifndef _WIN32
    ifaddrs* interfaces = nullptr;
    if (::getifaddrs(&interfaces) == 0) {
        for (auto* ifa = interfaces; ifa != nullptr; ifa = ifa->ifa_next) {
            if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET) {
                continue;
            }
            if ((ifa->ifa_flags & IFF_UP) == 0 || (ifa->ifa_flags & IFF_LOOPBACK) != 0 ||
                (ifa->ifa_flags & IFF_BROADCAST) == 0 || ifa->ifa_netmask == nullptr) {
                continue;
            }
            const auto address = reinterpret_cast<const sockaddr_in*>(ifa->ifa_addr)->sin_addr.s_addr;
            const auto mask = reinterpret_cast<const sockaddr_in*>(ifa->ifa_netmask)->sin_addr.s_addr;
            in_addr broadcast{};
            broadcast.s_addr = address | ~mask;

            std::array<char, INET_ADDRSTRLEN> buffer{};
            if (::inet_ntop(AF_INET, &broadcast, buffer.data(), buffer.size()) != nullptr) {
                std::string text(buffer.data());
                bool duplicate = false;
                for (const auto& existing : addresses) {
                    duplicate = duplicate || existing == text;
                }
                if (!duplicate) {
                    addresses.push_back(std::move(text));
                }
            }
        }
        ::freeifaddrs(interfaces);
    }
#endif
    if (addresses.empty()) {
        addresses.emplace_back(kGenericBroadcast);
    }
    return addresses;
}

Discovery::Discovery(Config config, PeerRegistry& registry)
    : config_(std::move(config)), registry_(registry) {
    payload_ = encode_beacon(Beacon{config_.peer_id, config_.hostname, config_.control_port});
}

Discovery::~Discovery() {
    stop();
}

void Discovery::set_broadcast_targets(std::vector<std::string> addresses) {
    targets_ = std::move(addresses);
}

void Discovery::start() {
    if (running_.load()) {
        return;
    }
    ensure_socket_runtime();

    ScopedSocket listener{::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP)};
    if (!listener) {
        throw std::runtime_error(format_socket_error("Failed to create discovery socket"));
    }
    enable_option(listener.get(), SO_REUSEADDR);
#ifdef SO_REUSEPORT
    enable_option(listener.get(), SO_REUSEPORT);
#endif

    sockaddr_in address{};
    address.sin_family = AF_INET;
    address.sin_addr.s_addr = htonl(INADDR_ANY);
    address.sin_port = htons(config_.discovery_port);
    if (::bind(listener.get(), reinterpret_cast<sockaddr*>(&address), sizeof(address)) < 0) {
        throw std::runtime_error(format_socket_error(
            "Failed to bind discovery port " + std::to_string(config_.discovery_port)));
    }

    ScopedSocket sender{::socket(AF_INET, SOCK_DGRAM, IPPROTO_UDP)};
    if (!sender) {
        throw std::runtime_error(format_socket_error("Failed to create beacon socket"));
    }
    enable_option(sender.get(), SO_BROADCAST);

    if (targets_.empty()) {
        targets_ = local_broadcast_addresses();
    }

    listen_socket_ = std::move(listener);
    send_socket_ = std::move(sender);
    running_ = true;
    listener_thread_ = std::thread([this]() { listener_loop(); });
    if (announce_enabled_) {
        emitter_thread_ = std::thread([this]() { emitter_loop(); });
    }

    daemon::log_event(StructuredLogger::Level::Info,
                      "discovery.started",
                      {{"peer_id", config_.peer_id},
                       {"udp_port", std::to_string(config_.discovery_port)},
                       {"targets", announce_enabled_ ? std::to_string(targets_.size()) : "0"}});
}

void Discovery::stop() {
    if (!running_.exchange(false)) {
        return;
    }
    {
        std::scoped_lock lock(wake_mutex_);
    }
    wake_.notify_all();

    if (emitter_thread_.joinable()) {
        emitter_thread_.join();
    }
    if (listener_thread_.joinable()) {
        listener_thread_.join();
    }
    send_socket_.reset();
    listen_socket_.reset();

    daemon::log_event(StructuredLogger::Level::Info, "discovery.stopped", {{"peer_id", config_.peer_id}});
}

std::size_t Discovery::announce() {
    if (!send_socket_) {
        return 0;
    }

    std::size_t delivered = 0;
    for (const auto& target : targets_) {
        sockaddr_in destination{};
        destination.sin_family = AF_INET;
        destination.sin_port = htons(config_.discovery_port);
        if (::inet_pton(AF_INET, target.c_str(), &destination.sin_addr) != 1) {
            daemon::log_event(StructuredLogger::Level::Debug,
                              "discovery.beacon.bad_target",
                              {{"target", target}});
            continue;
        }
        const auto sent = ::sendto(send_socket_.get(), payload_.data(), static_cast<int>(payload_.size()), 0,
                                   reinterpret_cast<const sockaddr*>(&destination), sizeof(destination));
        if (sent < 0) {
            daemon::log_event(StructuredLogger::Level::Debug,
                              "discovery.beacon.send_failed",
                              {{"target", target}, {"error", format_socket_error("sendto")}});
            continue;
        }
        ++delivered;
    }
    return delivered;
}

void Discovery::emitter_loop() {
    while (running_.load()) {
        announce();
        std::unique_lock lock(wake_mutex_);
        wake_.wait_for(lock, config_.beacon_interval, [this]() { return !running_.load(); });
    }
}

void Discovery::listener_loop() {
    std::array<char, kMaxBeaconBytes> buffer{};
    while (running_.load()) {
        const auto ready = wait_readable(listen_socket_.get(), config_.discovery_receive_timeout);
        if (ready <= 0) {
            continue;
        }

        sockaddr_in sender{};
        socklen_t sender_length = sizeof(sender);
        const auto received = ::recvfrom(listen_socket_.get(), buffer.data(), static_cast<int>(buffer.size()), 0,
                                         reinterpret_cast<sockaddr*>(&sender), &sender_length);
        if (received <= 0) {
            continue;
        }

        const std::string_view message(buffer.data(), static_cast<std::size_t>(received));
        if (!protocol::is_valid_utf8(message)) {
            continue;
        }

        std::array<char, INET_ADDRSTRLEN> ip{};
        if (::inet_ntop(AF_INET, &sender.sin_addr, ip.data(), ip.size()) == nullptr) {
            continue;
        }
        registry_.handle_beacon(message, std::string(ip.data()));
    }
}

}  // namespace lantern::network
