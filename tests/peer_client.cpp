#include "lantern/Config.hpp"
#include "lantern/client/PeerClient.hpp"
#include "lantern/protocol/Frame.hpp"
#include "lantern/server/FileServer.hpp"
#include "lantern/server/UploadGate.hpp"
#include "test_support.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <functional>
#include <future>
#include <string>
#include <thread>

using namespace lantern;
using namespace std::chrono_literals;
using client::PeerError;

namespace {

// Accepts one connection, reads the request frame and hands the socket to `behaviour`.
class ScriptedPeer {
public:
    explicit ScriptedPeer(std::function<void(network::NativeSocket)> behaviour) {
        listener_.reset(::socket(AF_INET, SOCK_STREAM, IPPROTO_TCP));
        assert(listener_);
        sockaddr_in address{};
        address.sin_family = AF_INET;
        address.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        const int bound = ::bind(listener_.get(), reinterpret_cast<sockaddr*>(&address), sizeof(address));
        assert(bound == 0);
        const int listening = ::listen(listener_.get(), 1);
        assert(listening == 0);
        port_ = network::local_port(listener_.get());
        thread_ = std::thread([this, behaviour = std::move(behaviour)]() {
            network::ScopedSocket connection{::accept(listener_.get(), nullptr, nullptr)};
            if (!connection) {
                return;
            }
            (void)protocol::recv_frame(connection.get());
            behaviour(connection.get());
        });
    }
    ~ScriptedPeer() {
        thread_.join();
    }

    std::uint16_t port() const noexcept { return port_; }

private:
    network::ScopedSocket listener_;
    std::uint16_t port_{0};
    std::thread thread_;
};

template <typename Operation>
std::string expect_peer_error(Operation operation) {
    try {
        operation();
    } catch (const PeerError& ex) {
        return ex.what();
    }
    assert(false && "expected PeerError");
    return {};
}

client::ClientOptions client_options(const std::filesystem::path& downloads) {
    client::ClientOptions options;
    options.connect_timeout = 2s;
    options.transfer_timeout = 5s;
    options.confirm_timeout = 5s;
    options.chunk_size = 1024;
    options.download_directory = downloads;
    return options;
}

void test_against_file_server() {
    test::TempDir dir("peer_client");
    const auto shared = dir / "remote";
    std::filesystem::create_directories(shared);
    test::write_file(shared / "notes.txt", "Lantern shared note");
    test::write_file(shared / "big.bin", std::string(10000, 'q'));

    Config config;
    config.bind_host = "127.0.0.1";
    config.control_port = 0;
    config.shared_directory = shared.string();
    config.accept_poll_interval = 100ms;
    server::UploadGate gate(2s);
    server::FileServer server(config, gate);
    server.start();
    const auto port = server.port();

    const client::PeerClient peer(client_options(dir / "downloads"));

    const auto files = peer.list_files("127.0.0.1", port);
    assert(files.size() == 2);
    assert(files[0].name == "big.bin" && files[0].size == 10000);
    assert(files[1].name == "notes.txt" && files[1].size == 19);

    std::uint64_t last_progress = 0;
    const auto result = peer.download("127.0.0.1", port, "notes.txt",
                                      [&](std::uint64_t current, std::uint64_t total) {
                                          assert(total == 19);
                                          last_progress = current;
                                      });
    assert(result.bytes == 19 && last_progress == 19);
    assert(result.path == dir / "downloads" / "notes.txt");
    assert(test::read_file(result.path) == "Lantern shared note");

    assert(expect_peer_error([&]() { peer.download("127.0.0.1", port, "absent.txt"); }) ==
           "File not found: absent.txt");
    assert(!std::filesystem::exists(dir / "downloads" / "absent.txt"));

    std::atomic<bool> cancel{false};
    const auto cancelled = expect_peer_error([&]() {
        peer.download("127.0.0.1", port, "big.bin",
                      [&](std::uint64_t, std::uint64_t) { cancel.store(true); }, &cancel);
    });
    assert(cancelled == "Transfer cancelled");
    assert(!std::filesystem::exists(dir / "downloads" / "big.bin"));

    const auto local = dir / "outgoing.txt";
    test::write_file(local, "outgoing data");
    assert(peer.upload("127.0.0.1", port, local) == "Received outgoing.txt (13 bytes)");
    assert(test::read_file(shared / "outgoing.txt") == "outgoing data");

    std::thread approver([&]() {
        auto pending = gate.wait_pop(3s);
        assert(pending);
        assert(pending->request().filename == "outgoing.txt");
        pending->reject();
    });
    const auto rejected = expect_peer_error([&]() {
        peer.upload("127.0.0.1", port, local, client::UploadMode::Confirmed);
    });
    approver.join();
    assert(rejected == "Peer rejected upload: Upload declined");

    std::thread accepter([&]() {
        auto pending = gate.wait_pop(3s);
        assert(pending);
        pending->accept();
    });
    assert(peer.upload("127.0.0.1", port, local, client::UploadMode::Confirmed) ==
           "Received outgoing.txt (13 bytes)");
    accepter.join();

    assert(expect_peer_error([&]() { peer.upload("127.0.0.1", port, dir / "nope.txt"); })
               .starts_with("Local file not found: "));

    assert(peer.remove("127.0.0.1", port, "outgoing.txt") == "Deleted outgoing.txt");
    assert(expect_peer_error([&]() { peer.remove("127.0.0.1", port, "outgoing.txt"); }) ==
           "File not found: outgoing.txt");

    server.stop();
    assert(expect_peer_error([&]() { peer.list_files("127.0.0.1", port); }) ==
           "Could not connect to 127.0.0.1:" + std::to_string(port));
}

void test_misbehaving_peers() {
    test::TempDir dir("misbehaving");
    const client::PeerClient peer(client_options(dir / "downloads"));

    {
        ScriptedPeer silent([](network::NativeSocket) {});
        assert(expect_peer_error([&]() { peer.list_files("127.0.0.1", silent.port()); }) == "No response from peer");
    }
    {
        ScriptedPeer garbled([](network::NativeSocket socket) { protocol::send_frame(socket, "HELLO THERE"); });
        assert(expect_peer_error([&]() { peer.list_files("127.0.0.1", garbled.port()); }) ==
               "Invalid response from peer");
    }
    {
        ScriptedPeer bad_size([](network::NativeSocket socket) { protocol::send_frame(socket, "OK<SEP>lots"); });
        assert(expect_peer_error([&]() { peer.download("127.0.0.1", bad_size.port(), "x.bin"); }) ==
               "Invalid file size in response: lots");
    }
    {
        ScriptedPeer bare_error([](network::NativeSocket socket) { protocol::send_frame(socket, "ERROR"); });
        assert(expect_peer_error([&]() { peer.remove("127.0.0.1", bare_error.port(), "x"); }) == "Unknown error");
    }
    {
        // Promises 100 bytes, delivers 10 and hangs up.
        ScriptedPeer short_sender([](network::NativeSocket socket) {
            protocol::send_frame(socket, "OK<SEP>100");
            const std::string partial(10, 'p');
            (void)network::send_all(socket, reinterpret_cast<const std::uint8_t*>(partial.data()), partial.size());
        });
        const auto message = expect_peer_error([&]() { peer.download("127.0.0.1", short_sender.port(), "../short.bin"); });
        assert(message.starts_with("Incomplete transfer: got "));
        assert(!std::filesystem::exists(dir / "downloads" / "short.bin"));
        assert(test::staging_files(dir / "downloads") == 0);
    }
}

// Downloading into the folder this peer shares: the existing copy stays intact
// and servable until the new one is complete.
void test_download_into_shared_directory() {
    test::TempDir dir("download_shared");
    const auto shared = dir / "shared";
    std::filesystem::create_directories(shared);
    const std::string original(100, 'o');
    test::write_file(shared / "x.bin", original);

    Config config;
    config.bind_host = "127.0.0.1";
    config.control_port = 0;
    config.shared_directory = shared.string();
    config.accept_poll_interval = 100ms;
    config.file_lock_wait = 200ms;
    server::UploadGate gate(1s);
    server::FileServer server(config, gate);
    server.start();
    const auto port = server.port();

    const client::PeerClient peer(client_options(shared));
    {
        std::promise<void> release;
        auto released = release.get_future();
        ScriptedPeer stalling([&released](network::NativeSocket socket) {
            protocol::send_frame(socket, "OK<SEP>100");
            const std::string half(50, 'n');
            (void)network::send_all(socket, reinterpret_cast<const std::uint8_t*>(half.data()), half.size());
            released.wait();
        });

        auto outcome = std::async(std::launch::async, [&]() {
            return expect_peer_error([&]() { peer.download("127.0.0.1", stalling.port(), "x.bin"); });
        });
        assert(test::wait_until([&]() { return test::staging_files(shared) == 1; }));

        assert(test::exchange(port, "LIST") == std::optional<std::string>("OK<SEP>x.bin<SEP>100"));
        auto reader = test::connect_local(port);
        protocol::send_frame(reader.get(), "DOWNLOAD<SEP>x.bin");
        assert(protocol::recv_frame(reader.get()) == std::optional<std::string>("OK<SEP>100"));
        std::string served(100, '\0');
        const bool got = network::recv_exact(reader.get(), reinterpret_cast<std::uint8_t*>(served.data()), served.size());
        assert(got && served == original);

        release.set_value();
        assert(outcome.get().starts_with("Incomplete transfer: got "));
    }
    assert(test::read_file(shared / "x.bin") == original);
    assert(test::staging_files(shared) == 0);

    {
        ScriptedPeer fresh([](network::NativeSocket socket) {
            protocol::send_frame(socket, "OK<SEP>5");
            const std::string body{"fresh"};
            (void)network::send_all(socket, reinterpret_cast<const std::uint8_t*>(body.data()), body.size());
        });
        const auto result = peer.download("127.0.0.1", fresh.port(), "x.bin");
        assert(result.bytes == 5);
        assert(result.path == shared / "x.bin");
    }
    assert(test::read_file(shared / "x.bin") == "fresh");
    assert(test::staging_files(shared) == 0);
    server.stop();
}

void test_options_from_config() {
    Config config;
    config.upload_confirm_timeout = 60s;
    config.chunk_size = 8192;
    config.shared_directory = "shared_here";
    auto options = client::ClientOptions::from_config(config);
    assert(options.confirm_timeout == 70s);
    assert(options.chunk_size == 8192);
    assert(options.download_directory == std::filesystem::path("shared_here"));

    config.download_directory = "downloads_here";
    options = client::ClientOptions::from_config(config);
    assert(options.download_directory == std::filesystem::path("downloads_here"));
}

}  // namespace

int main() {
    test_against_file_server();
    test_misbehaving_peers();
    test_download_into_shared_directory();
    test_options_from_config();
    return 0;
}
