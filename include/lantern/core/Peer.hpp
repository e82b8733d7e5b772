#pragma once

#include "lantern/Config.hpp"
#include "lantern/Export.hpp"
#include "lantern/Types.hpp"
#include "lantern/client/PeerClient.hpp"
#include "lantern/server/FileServer.hpp"
#include "lantern/server/UploadGate.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace lantern {

// One running Lantern peer: file server, upload gate, discovery and the
// registry they feed. Identity fields left empty in the config are generated.
class LANTERN_API Peer {
public:
    explicit Peer(Config config = {});
    ~Peer();

    Peer(Peer&&) noexcept;
    Peer& operator=(Peer&&) noexcept;
    Peer(const Peer&) = delete;
    Peer& operator=(const Peer&) = delete;

    // Starts the file server, then discovery advertising the bound port.
    // Throws std::runtime_error when either socket cannot be bound.
    void start();
    // Rejects pending uploads and joins every thread.
    void stop();
    [[nodiscard]] bool running() const noexcept;

    std::vector<PeerRecord> active_peers();
    std::optional<PeerRecord> find_peer(std::string_view id_or_hostname);

    server::UploadGate& uploads() noexcept;
    [[nodiscard]] server::ServerStats stats() const;
    [[nodiscard]] std::uint16_t control_port() const noexcept;
    [[nodiscard]] client::PeerClient make_client() const;

    const Config& config() const noexcept;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lantern
