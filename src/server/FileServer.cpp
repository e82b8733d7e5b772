#include "lantern/server/FileServer.hpp"

#include "lantern/daemon/StructuredLogger.hpp"
#include "lantern/network/Socket.hpp"
#include "lantern/protocol/Command.hpp"
#include "lantern/protocol/Frame.hpp"
#include "lantern/storage/FileLocks.hpp"
#include "lantern/storage/SharedDirectory.hpp"

#include <atomic>
#include <list>
#include <mutex>
#include <semaphore>
#include <stdexcept>
#include <string>
#include <system_error>
#include <thread>
#include <unordered_set>
#include <utility>
#include <vector>

#ifdef _WIN32
#include <ws2tcpip.h>
#else
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <sys/types.h>
#endif

namespace lantern::server {

namespace {

using daemon::StructuredLogger;
using daemon::log_event;
using network::NativeSocket;
using network::ScopedSocket;
using protocol::CommandKind;

struct Metrics {
    std::atomic<std::uint64_t> connections_accepted{0};
    std::atomic<std::uint64_t> connections_shed{0};
    std::atomic<std::uint64_t> accept_failures{0};
    std::atomic<std::uint64_t> commands_handled{0};
    std::atomic<std::uint64_t> commands_failed{0};
    std::atomic<std::uint64_t> bytes_sent{0};
    std::atomic<std::uint64_t> bytes_received{0};
};

std::string busy_message(const std::string& name) {
    return "File busy: " + name;
}

}  // namespace

class FileServer::Impl {
public:
    Impl(const Config& config, UploadGate& gate)
        : config_(config),
          gate_(gate),
          shared_(config.shared_directory),
          slots_(static_cast<std::ptrdiff_t>(config.max_connections)) {
        network::ensure_socket_runtime();
    }

    ~Impl() {
        stop();
    }

    void start() {
        if (running_) {
            return;
        }

        ScopedSocket server{::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP)};
        if (!server) {
            throw std::runtime_error(network::format_socket_error("Failed to create server socket"));
        }

        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_port = htons(config_.control_port);
        if (config_.bind_host.empty() || config_.bind_host == "0.0.0.0") {
            addr.sin_addr.s_addr = htonl(INADDR_ANY);
        } else if (::inet_pton(AF_INET, config_.bind_host.c_str(), &addr.sin_addr) != 1) {
            throw std::runtime_error("Invalid bind host: " + config_.bind_host);
        }

        const int opt = 1;
        ::setsockopt(server.get(), SOL_SOCKET, SO_REUSEADDR, reinterpret_cast<const char*>(&opt), sizeof(opt));

        if (::bind(server.get(), reinterpret_cast<const sockaddr*>(&addr), sizeof(addr)) < 0) {
            throw std::runtime_error(network::format_socket_error(
                "Failed to bind port " + std::to_string(config_.control_port)));
        }
        if (::listen(server.get(), SOMAXCONN) < 0) {
            throw std::runtime_error(network::format_socket_error("Failed to listen on server socket"));
        }

        shared_.ensure_exists();
        gate_.reopen();
        port_ = network::local_port(server.get());
        listen_socket_ = std::move(server);
        running_.store(true, std::memory_order_release);
        accept_thread_ = std::thread(&Impl::accept_loop, this);

        log_event(StructuredLogger::Level::Info,
                  "server.started",
                  {{"host", config_.bind_host},
                   {"port", std::to_string(port_)},
                   {"shared_dir", shared_.root().string()},
                   {"max_connections", std::to_string(config_.max_connections)}});
    }

    void stop() {
        if (!running_.exchange(false, std::memory_order_acq_rel)) {
            return;
        }

#ifdef _WIN32
        ::shutdown(listen_socket_.get(), SD_BOTH);
#else
        ::shutdown(listen_socket_.get(), SHUT_RDWR);
#endif
        if (accept_thread_.joinable()) {
            accept_thread_.join();
        }
        listen_socket_.reset();

        // Closed before the join so a worker that has read UPLOAD_REQUEST but not
        // yet submitted it is turned away instead of waiting out the timeout.
        gate_.shutdown();
        std::list<Worker> workers;
        {
            std::scoped_lock lock(workers_mutex_);
            for (const auto socket : active_sockets_) {
#ifdef _WIN32
                ::shutdown(socket, SD_BOTH);
#else
                ::shutdown(socket, SHUT_RDWR);
#endif
            }
            workers.swap(workers_);
        }
        for (auto& worker : workers) {
            if (worker.thread.joinable()) {
                worker.thread.join();
            }
        }

        log_event(StructuredLogger::Level::Info, "server.stopped", {{"port", std::to_string(port_)}});
    }

    bool running() const noexcept {
        return running_.load(std::memory_order_acquire);
    }

    std::uint16_t port() const noexcept {
        return port_;
    }

    ServerStats stats() const {
        ServerStats snapshot;
        snapshot.connections_accepted = metrics_.connections_accepted.load(std::memory_order_relaxed);
        snapshot.connections_shed = metrics_.connections_shed.load(std::memory_order_relaxed);
        snapshot.accept_failures = metrics_.accept_failures.load(std::memory_order_relaxed);
        snapshot.commands_handled = metrics_.commands_handled.load(std::memory_order_relaxed);
        snapshot.commands_failed = metrics_.commands_failed.load(std::memory_order_relaxed);
        snapshot.bytes_sent = metrics_.bytes_sent.load(std::memory_order_relaxed);
        snapshot.bytes_received = metrics_.bytes_received.load(std::memory_order_relaxed);
        return snapshot;
    }

    std::size_t active_handlers() const {
        std::scoped_lock lock(workers_mutex_);
        return active_sockets_.size();
    }

private:
    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> finished;
    };

    // Releases the connection slot and unregisters the socket on every exit path.
    class SlotGuard {
    public:
        SlotGuard(Impl& owner, NativeSocket socket) : owner_(owner), socket_(socket) {}
        ~SlotGuard() {
            {
                std::scoped_lock lock(owner_.workers_mutex_);
                owner_.active_sockets_.erase(socket_);
            }
            owner_.slots_.release();
        }

        SlotGuard(const SlotGuard&) = delete;
        SlotGuard& operator=(const SlotGuard&) = delete;

    private:
        Impl& owner_;
        NativeSocket socket_;
    };

    Config config_;
    UploadGate& gate_;
    storage::SharedDirectory shared_;
    storage::FileLockTable locks_;
    std::counting_semaphore<> slots_;
    Metrics metrics_{};

    std::atomic<bool> running_{false};
    std::uint16_t port_{0};
    ScopedSocket listen_socket_;
    std::thread accept_thread_;

    mutable std::mutex workers_mutex_;
    std::list<Worker> workers_;
    std::unordered_set<NativeSocket> active_sockets_;

    void accept_loop() {
        while (running_.load(std::memory_order_acquire)) {
            reap_workers();

            const auto ready = network::wait_readable(listen_socket_.get(), config_.accept_poll_interval);
            if (ready <= 0 || !running_.load(std::memory_order_acquire)) {
                continue;
            }

            sockaddr_in client_addr{};
            socklen_t addr_len = sizeof(client_addr);
            ScopedSocket client{::accept(listen_socket_.get(), reinterpret_cast<sockaddr*>(&client_addr), &addr_len)};
            if (!client) {
                if (!running_.load(std::memory_order_acquire)) {
                    continue;
                }
                // The pending connection stays queued (EMFILE, ENOBUFS), so the
                // listener would report readable again at once.
                metrics_.accept_failures.fetch_add(1, std::memory_order_relaxed);
                log_event(StructuredLogger::Level::Warning,
                          "server.accept.failed",
                          {{"reason", network::format_socket_error("accept")}});
                std::this_thread::sleep_for(config_.accept_poll_interval);
                continue;
            }

            const auto remote = network::peer_address(client.get());
            if (!slots_.try_acquire()) {
                metrics_.connections_shed.fetch_add(1, std::memory_order_relaxed);
                log_event(StructuredLogger::Level::Warning,
                          "server.connection.shed",
                          {{"remote", remote}, {"max_connections", std::to_string(config_.max_connections)}});
                continue;
            }

            metrics_.connections_accepted.fetch_add(1, std::memory_order_relaxed);
            log_event(StructuredLogger::Level::Debug, "server.connection.accepted", {{"remote", remote}});
            spawn_worker(std::move(client), remote);
        }
    }

    void spawn_worker(ScopedSocket client, const std::string& remote) {
        auto finished = std::make_shared<std::atomic<bool>>(false);
        std::scoped_lock lock(workers_mutex_);
        active_sockets_.insert(client.get());
        workers_.push_back(Worker{
            std::thread([this, finished, remote, socket = std::move(client)]() mutable {
                {
                    SlotGuard guard(*this, socket.get());
                    handle_client(socket.get(), remote);
                }
                socket.reset();
                finished->store(true, std::memory_order_release);
            }),
            finished});
    }

    void reap_workers() {
        std::list<Worker> done;
        {
            std::scoped_lock lock(workers_mutex_);
            for (auto it = workers_.begin(); it != workers_.end();) {
                if (it->finished->load(std::memory_order_acquire)) {
                    done.splice(done.end(), workers_, it++);
                } else {
                    ++it;
                }
            }
        }
        for (auto& worker : done) {
            worker.thread.join();
        }
    }

    protocol::TransferOptions transfer_options() const {
        protocol::TransferOptions options;
        options.chunk_size = config_.chunk_size;
        return options;
    }

    static void reply(NativeSocket client, const std::string& message) {
        protocol::send_frame(client, message);
    }

    static void reply_best_effort(NativeSocket client, const std::string& message) noexcept {
        try {
            protocol::send_frame(client, message);
        } catch (const std::exception& ex) {
            log_event(StructuredLogger::Level::Debug, "server.reply.failed", {{"reason", ex.what()}});
        }
    }

    void handle_client(NativeSocket client, const std::string& remote) {
        network::set_recv_timeout(client, config_.connection_io_timeout);
        network::set_send_timeout(client, config_.connection_io_timeout);

        std::string verb{"?"};
        try {
            const auto line = protocol::recv_frame(client, config_.max_frame_bytes);
            if (!line) {
                return;
            }

            auto command = protocol::parse_command(*line);
            verb = command.verb;
            if (command.kind == CommandKind::Unknown) {
                log_event(StructuredLogger::Level::Warning,
                          "server.command.unknown",
                          {{"remote", remote}, {"command", command.verb}});
                reply(client, protocol::make_error("Unknown command"));
                return;
            }

            metrics_.commands_handled.fetch_add(1, std::memory_order_relaxed);
            switch (command.kind) {
                case CommandKind::List:
                    handle_list(client, remote);
                    return;
                case CommandKind::Download:
                    handle_download(client, remote, command.args[0]);
                    return;
                case CommandKind::Upload:
                    handle_upload(client, remote, command.args[0], command.args[1], false);
                    return;
                case CommandKind::UploadRequest:
                    handle_upload(client, remote, command.args[0], command.args[1], true);
                    return;
                case CommandKind::Delete:
                    handle_delete(client, remote, command.args[0]);
                    return;
                case CommandKind::Unknown:
                    return;
            }
        } catch (const protocol::ProtocolViolation& ex) {
            metrics_.commands_failed.fetch_add(1, std::memory_order_relaxed);
            log_event(StructuredLogger::Level::Warning,
                      "server.request.malformed",
                      {{"remote", remote}, {"reason", ex.what()}});
            reply_best_effort(client, protocol::make_error(ex.what()));
        } catch (const std::exception& ex) {
            metrics_.commands_failed.fetch_add(1, std::memory_order_relaxed);
            log_event(StructuredLogger::Level::Error,
                      "server.command.failed",
                      {{"remote", remote}, {"command", verb}, {"reason", ex.what()}});
            reply_best_effort(client, protocol::make_error("Internal server error"));
        }
    }

    void handle_list(NativeSocket client, const std::string& remote) {
        const auto files = shared_.list();
        reply(client, protocol::make_ok(protocol::encode_listing(files)));
        log_event(StructuredLogger::Level::Info,
                  "server.command.list",
                  {{"remote", remote}, {"files", std::to_string(files.size())}});
    }

    void handle_download(NativeSocket client, const std::string& remote, const std::string& requested) {
        const auto name = storage::sanitize_filename(requested);
        auto lease = locks_.acquire(name, storage::LockMode::Shared, config_.file_lock_wait);
        if (!lease) {
            reply(client, protocol::make_error(busy_message(name)));
            return;
        }

        const auto size = shared_.file_size(name);
        if (!size) {
            log_event(StructuredLogger::Level::Info,
                      "server.command.download",
                      {{"remote", remote}, {"file", name}, {"result", "not_found"}});
            reply(client, protocol::make_error("File not found: " + name));
            return;
        }

        reply(client, protocol::make_ok(std::to_string(*size)));
        const auto sent = protocol::send_raw_file(client, shared_.resolve(name), *size, transfer_options());
        metrics_.bytes_sent.fetch_add(sent, std::memory_order_relaxed);

        log_event(sent == *size ? StructuredLogger::Level::Info : StructuredLogger::Level::Warning,
                  "server.command.download",
                  {{"remote", remote},
                   {"file", name},
                   {"bytes", std::to_string(sent)},
                   {"size", std::to_string(*size)}});
    }

    void handle_upload(NativeSocket client,
                       const std::string& remote,
                       const std::string& requested,
                       const std::string& size_text,
                       bool confirmed) {
        const auto name = storage::sanitize_filename(requested);
        const auto parsed = protocol::parse_integer(size_text);
        if (!parsed) {
            reply(client, protocol::make_error("Invalid file size"));
            return;
        }
        if (*parsed < 0) {
            reply(client, protocol::make_error("File size must not be negative"));
            return;
        }
        const auto size = static_cast<std::uint64_t>(*parsed);

        if (confirmed) {
            const auto decision = gate_.submit(UploadRequest{0, remote, name, size});
            if (decision != UploadDecision::Accepted) {
                reply(client, protocol::make_error("Upload declined"));
                return;
            }
        }

        auto lease = locks_.acquire(name, storage::LockMode::Exclusive, config_.file_lock_wait);
        if (!lease) {
            reply(client, protocol::make_error(busy_message(name)));
            return;
        }

        shared_.ensure_exists();
        const auto target = shared_.resolve(name);
        const auto staged = storage::staging_path_for(target);
        reply(client, protocol::make_ok());
        const auto received = protocol::recv_file(client, staged, size, transfer_options());
        metrics_.bytes_received.fetch_add(received, std::memory_order_relaxed);

        const bool complete = received == size;
        log_event(complete ? StructuredLogger::Level::Info : StructuredLogger::Level::Warning,
                  confirmed ? "server.command.upload_request" : "server.command.upload",
                  {{"remote", remote},
                   {"file", name},
                   {"bytes", std::to_string(received)},
                   {"size", std::to_string(size)}});

        if (!complete) {
            reply_best_effort(client, protocol::make_error("Incomplete transfer: got " + std::to_string(received) + "/" +
                                                           std::to_string(size) + " bytes"));
            return;
        }

        std::error_code ec;
        if (!storage::commit_staged(staged, target, ec)) {
            log_event(StructuredLogger::Level::Error,
                      "server.upload.commit_failed",
                      {{"file", name}, {"reason", ec.message()}});
            reply_best_effort(client, protocol::make_error("Could not store " + name + ": " + ec.message()));
            return;
        }
        reply_best_effort(client, protocol::make_ok("Received " + name + " (" + std::to_string(size) + " bytes)"));
    }

    void handle_delete(NativeSocket client, const std::string& remote, const std::string& requested) {
        const auto name = storage::sanitize_filename(requested);
        auto lease = locks_.acquire(name, storage::LockMode::Exclusive, config_.file_lock_wait);
        if (!lease) {
            reply(client, protocol::make_error(busy_message(name)));
            return;
        }

        const auto outcome = shared_.remove(name);
        log_event(StructuredLogger::Level::Info,
                  "server.command.delete",
                  {{"remote", remote}, {"file", name}, {"reason", outcome.reason}});
        switch (outcome.status) {
            case storage::RemoveStatus::Removed:
                reply(client, protocol::make_ok("Deleted " + name));
                return;
            case storage::RemoveStatus::NotFound:
                reply(client, protocol::make_error("File not found: " + name));
                return;
            case storage::RemoveStatus::Failed:
                reply(client, protocol::make_error("Could not delete " + name + ": " + outcome.reason));
                return;
        }
    }
};

FileServer::FileServer(const Config& config, UploadGate& gate)
    : impl_(std::make_unique<Impl>(config, gate)) {}

FileServer::~FileServer() = default;

void FileServer::start() {
    impl_->start();
}

void FileServer::stop() {
    impl_->stop();
}

bool FileServer::running() const noexcept {
    return impl_->running();
}

std::uint16_t FileServer::port() const noexcept {
    return impl_->port();
}

ServerStats FileServer::stats() const {
    return impl_->stats();
}

std::size_t FileServer::active_handlers() const {
    return impl_->active_handlers();
}

}  // namespace lantern::server
