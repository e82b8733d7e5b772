#include "lantern/core/Peer.hpp"

#include "lantern/daemon/StructuredLogger.hpp"
#include "lantern/network/Discovery.hpp"
#include "lantern/network/PeerRegistry.hpp"

#include <utility>

namespace lantern {

class Peer::Impl {
public:
    explicit Impl(Config config)
        : config_(prepare(std::move(config))),
          registry_(config_.peer_id, config_.peer_timeout),
          gate_(config_.upload_confirm_timeout),
          server_(config_, gate_) {}

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            return;
        }
        server_.start();

        auto advertised = config_;
        advertised.control_port = server_.port();
        auto discovery = std::make_unique<network::Discovery>(std::move(advertised), registry_);
        try {
            discovery->start();
        } catch (const std::exception&) {
            server_.stop();
            throw;
        }
        discovery_ = std::move(discovery);
        running_ = true;

        daemon::log_event(daemon::StructuredLogger::Level::Info,
                          "peer.started",
                          {{"peer_id", config_.peer_id},
                           {"hostname", config_.hostname},
                           {"tcp_port", std::to_string(server_.port())}});
    }

    void stop() {
        if (!running_) {
            return;
        }
        running_ = false;
        gate_.shutdown();
        if (discovery_) {
            discovery_->stop();
            discovery_.reset();
        }
        server_.stop();
        daemon::log_event(daemon::StructuredLogger::Level::Info, "peer.stopped", {{"peer_id", config_.peer_id}});
    }

    static Config prepare(Config config) {
        resolve_identity(config);
        return config;
    }

    Config config_;
    network::PeerRegistry registry_;
    server::UploadGate gate_;
    server::FileServer server_;
    std::unique_ptr<network::Discovery> discovery_;
    bool running_{false};
};

Peer::Peer(Config config)
    : impl_(std::make_unique<Impl>(std::move(config))) {}

Peer::~Peer() = default;
Peer::Peer(Peer&&) noexcept = default;
Peer& Peer::operator=(Peer&&) noexcept = default;

void Peer::start() {
    impl_->start();
}

void Peer::stop() {
    impl_->stop();
}

bool Peer::running() const noexcept {
    return impl_->running_;
}

std::vector<PeerRecord> Peer::active_peers() {
    return impl_->registry_.active_peers();
}

std::optional<PeerRecord> Peer::find_peer(std::string_view id_or_hostname) {
    return impl_->registry_.lookup(id_or_hostname);
}

server::UploadGate& Peer::uploads() noexcept {
    return impl_->gate_;
}

server::ServerStats Peer::stats() const {
    return impl_->server_.stats();
}

std::uint16_t Peer::control_port() const noexcept {
    return impl_->server_.port();
}

client::PeerClient Peer::make_client() const {
    return client::PeerClient(client::ClientOptions::from_config(impl_->config_));
}

const Config& Peer::config() const noexcept {
    return impl_->config_;
}

}  // namespace lantern
