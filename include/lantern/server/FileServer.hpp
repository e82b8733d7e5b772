#pragma once

#include "lantern/Config.hpp"
#include "lantern/server/UploadGate.hpp"

#include <cstdint>
#include <memory>

namespace lantern::server {

struct ServerStats {
    std::uint64_t connections_accepted{0};
    std::uint64_t connections_shed{0};
    std::uint64_t accept_failures{0};
    // Well-formed commands dispatched to a handler.
    std::uint64_t commands_handled{0};
    std::uint64_t commands_failed{0};
    std::uint64_t bytes_sent{0};
    std::uint64_t bytes_received{0};
};

// Accepts control connections, one framed command per connection, and serves
// the shared directory. At most config.max_connections handlers run at once;
// connections past that are closed unanswered.
class FileServer {
public:
    FileServer(const Config& config, UploadGate& gate);
    ~FileServer();

    FileServer(const FileServer&) = delete;
    FileServer& operator=(const FileServer&) = delete;

    // Throws std::runtime_error when the socket cannot be bound or listened on.
    void start();
    // Joins the accept thread and every connection handler.
    void stop();
    [[nodiscard]] bool running() const noexcept;

    // Bound port, useful when the configured port was 0.
    [[nodiscard]] std::uint16_t port() const noexcept;
    [[nodiscard]] ServerStats stats() const;
    [[nodiscard]] std::size_t active_handlers() const;

private:
    class Impl;
    std::unique_ptr<Impl> impl_;
};

}  // namespace lantern::server
