#include "lantern/Config.hpp"
#include "lantern/Types.hpp"
#include "lantern/client/PeerClient.hpp"
#include "lantern/config/ConfigLoader.hpp"
#include "lantern/core/Peer.hpp"
#include "lantern/daemon/StructuredLogger.hpp"
#include "lantern/network/Discovery.hpp"
#include "lantern/network/PeerRegistry.hpp"
#include "lantern/storage/SharedDirectory.hpp"

#include <algorithm>
#include <array>
#include <atomic>
#include <cctype>
#include <charconv>
#include <chrono>
#include <cmath>
#include <csignal>
#include <cstdint>
#include <cstdlib>
#include <exception>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <limits>
#include <mutex>
#include <optional>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#else
#include <signal.h>
#endif

#ifndef LANTERN_VERSION
#define LANTERN_VERSION "1.1.0"
#endif

namespace {

using namespace std::chrono_literals;

constexpr std::string_view kLanternVersion = LANTERN_VERSION;

class CliException : public std::exception {
public:
    CliException(std::string code, std::string message, std::string hint = {})
        : code_(std::move(code)), message_(std::move(message)), hint_(std::move(hint)) {
        formatted_ = code_.empty() ? message_ : ("[" + code_ + "] " + message_);
    }

    const char* what() const noexcept override {
        return formatted_.c_str();
    }

    const std::string& code() const& {
        return code_;
    }

    const std::string& hint() const& {
        return hint_;
    }

private:
    std::string code_;
    std::string message_;
    std::string hint_;
    std::string formatted_;
};

[[noreturn]] void throw_cli_error(std::string code, std::string message, std::string hint = {}) {
    throw CliException(std::move(code), std::move(message), std::move(hint));
}

void print_cli_error(std::string_view what, std::string_view hint) {
    std::cerr << what << std::endl;
    if (!hint.empty()) {
        std::cerr << "Hint: " << hint << std::endl;
    }
}

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return value;
}

bool parse_uint64(std::string_view text, std::uint64_t& value) {
    if (text.empty()) {
        return false;
    }
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

bool parse_uint16(std::string_view text, std::uint16_t& value) {
    std::uint64_t temp{};
    if (!parse_uint64(text, temp) || temp > std::numeric_limits<std::uint16_t>::max()) {
        return false;
    }
    value = static_cast<std::uint16_t>(temp);
    return true;
}

std::string format_bytes(std::uint64_t bytes) {
    constexpr std::array<const char*, 5> kUnits{"B", "KiB", "MiB", "GiB", "TiB"};
    double value = static_cast<double>(bytes);
    std::size_t unit_index = 0;
    while (value >= 1024.0 && unit_index + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit_index;
    }

    std::ostringstream oss;
    oss << std::fixed;
    if (unit_index == 0 || value >= 100.0) {
        oss << std::setprecision(0);
    } else {
        oss << std::setprecision(1);
    }
    oss << value << ' ' << kUnits[unit_index];
    return oss.str();
}

// Serializes console output between the prompt and the serve watcher thread.
std::mutex g_console_mutex;

class ProgressPrinter {
public:
    explicit ProgressPrinter(std::string label) : label_(std::move(label)) {}

    void update(std::uint64_t current, std::uint64_t total) {
        if (finished_) {
            return;
        }
        started_ = true;
        const double ratio = total == 0
                                  ? 1.0
                                  : std::clamp(static_cast<double>(current) / static_cast<double>(total), 0.0, 1.0);
        const int percent = static_cast<int>(std::round(ratio * 100.0));
        if (percent == last_percent_ && current < total) {
            return;
        }
        last_percent_ = percent;
        std::scoped_lock lock(g_console_mutex);
        std::cout << '\r' << label_ << ": "
                  << std::setw(3) << percent << "% ("
                  << format_bytes(current) << " / "
                  << format_bytes(total) << ')'
                  << std::flush;
        if (current >= total) {
            std::cout << std::endl;
            finished_ = true;
        }
    }

    void cancel() {
        if (started_ && !finished_) {
            std::scoped_lock lock(g_console_mutex);
            std::cout << std::endl;
            finished_ = true;
        }
    }

private:
    std::string label_;
    int last_percent_{-1};
    bool started_{false};
    bool finished_{false};
};

std::atomic<bool> g_run_loop{false};
std::atomic<bool> g_interrupted{false};
// While a transfer runs, Ctrl+C cancels it instead of stopping the process.
std::atomic<bool> g_transfer_active{false};
std::atomic<bool> g_cancel_transfer{false};

extern "C" void signal_handler(int signal_code) {
    switch (signal_code) {
    case SIGINT:
    case SIGTERM:
#ifdef SIGQUIT
    case SIGQUIT:
#endif
#ifdef SIGBREAK
    case SIGBREAK:
#endif
        if (g_transfer_active.load() && signal_code == SIGINT) {
            g_cancel_transfer.store(true);
            break;
        }
        g_interrupted.store(true);
        g_run_loop.store(false);
        g_cancel_transfer.store(true);
        break;
    default:
        break;
    }
}

#ifdef _WIN32
BOOL WINAPI windows_console_ctrl_handler(DWORD control_type) {
    switch (control_type) {
    case CTRL_C_EVENT:
        signal_handler(SIGINT);
        return TRUE;
    case CTRL_BREAK_EVENT:
    case CTRL_CLOSE_EVENT:
    case CTRL_LOGOFF_EVENT:
    case CTRL_SHUTDOWN_EVENT:
        signal_handler(SIGTERM);
        return TRUE;
    default:
        return FALSE;
    }
}
#endif

void install_termination_handlers() {
#ifdef _WIN32
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);
    SetConsoleCtrlHandler(windows_console_ctrl_handler, TRUE);
#else
    // No SA_RESTART: a blocked console read returns so the loop can exit.
    auto install = [](int sig) {
        struct sigaction action{};
        action.sa_handler = signal_handler;
        sigemptyset(&action.sa_mask);
        action.sa_flags = 0;
        sigaction(sig, &action, nullptr);
    };
    install(SIGINT);
    install(SIGTERM);
#ifdef SIGQUIT
    install(SIGQUIT);
#endif
#endif
}

void uninstall_termination_handlers() {
#ifdef _WIN32
    SetConsoleCtrlHandler(windows_console_ctrl_handler, FALSE);
#endif
    std::signal(SIGINT, SIG_DFL);
    std::signal(SIGTERM, SIG_DFL);
#ifdef SIGQUIT
    std::signal(SIGQUIT, SIG_DFL);
#endif
}

class TransferScope {
public:
    TransferScope() {
        g_cancel_transfer.store(false);
        g_transfer_active.store(true);
    }
    ~TransferScope() {
        g_transfer_active.store(false);
    }

    TransferScope(const TransferScope&) = delete;
    TransferScope& operator=(const TransferScope&) = delete;

    const std::atomic<bool>* flag() const noexcept { return &g_cancel_transfer; }
};

void print_usage() {
    std::cout << "Lantern - LAN peer discovery and file sharing" << std::endl;
    std::cout << "Usage: lantern [options] <command> [args]\n\n";
    std::cout << "Global options:\n"
              << "  --config <path>           YAML or JSON configuration file\n"
              << "  --port <port>             TCP control port (default 5000, 0 picks a free port)\n"
              << "  --discovery-port <port>   UDP beacon port (default 5001)\n"
              << "  --shared-dir <path>       Folder offered to other peers (default ./shared_files)\n"
              << "  --max-connections <n>     Concurrent connections served (default 50)\n"
              << "  --log-level <level>       debug, info, warning or error\n"
              << "  --auto-accept             serve: accept every upload request\n"
              << "  --auto-reject             serve: reject every upload request\n"
              << "  --version                 Print the CLI version and exit\n"
              << "  --help, -h                Show this help\n\n";
    std::cout << "Commands:\n"
              << "  serve                     Run a peer with an interactive console\n"
              << "  peers [--wait <sec>]      Listen for beacons and print the peers heard\n"
              << "  list <host[:port]>        List the files a peer shares\n"
              << "  download <host[:port]> <file>\n"
              << "                            Fetch a file into the download folder\n"
              << "  upload <host[:port]> <path> [--confirm]\n"
              << "                            Send a file; --confirm asks the remote user first\n"
              << "  delete <host[:port]> <file>\n"
              << "                            Delete a file from a peer\n"
              << "  myfiles                   List the local shared folder\n\n";
    std::cout << "Environment:\n"
              << "  LANTERN_CONTROL_PORT, LANTERN_DISCOVERY_PORT, LANTERN_SHARED_DIR, LANTERN_LOG_LEVEL\n"
              << "  and the other LANTERN_* settings override the config file.\n";
}

void print_console_help() {
    std::cout << "Console commands:\n"
              << "  peers                         Peers currently visible\n"
              << "  list <peer>                   Files shared by a peer\n"
              << "  download <peer> <file>        Fetch a file\n"
              << "  upload <peer> <path>          Send a file after the remote user accepts\n"
              << "  send <peer> <path>            Send a file without asking\n"
              << "  delete <peer> <file>          Delete a remote file\n"
              << "  myfiles                       Local shared folder\n"
              << "  pending                       Upload requests waiting for a decision\n"
              << "  accept <id> | reject <id>     Decide an upload request\n"
              << "  help | quit\n"
              << "<peer> is host[:port], a discovered hostname or a peer id." << std::endl;
}

enum class ApprovalPolicy {
    Interactive,
    AutoAccept,
    AutoReject
};

struct GlobalOptions {
    std::optional<std::string> config_path;
    std::optional<std::uint16_t> control_port;
    std::optional<std::uint16_t> discovery_port;
    std::optional<std::string> shared_dir;
    std::optional<std::size_t> max_connections;
    std::optional<std::string> log_level;
    ApprovalPolicy approval{ApprovalPolicy::Interactive};
    bool approval_set{false};
};

lantern::Config build_config(const GlobalOptions& options) {
    std::optional<std::filesystem::path> file;
    if (options.config_path) {
        file = *options.config_path;
    }
    auto config = lantern::config::load(file);

    if (options.control_port) {
        config.control_port = *options.control_port;
    }
    if (options.discovery_port) {
        config.discovery_port = *options.discovery_port;
    }
    if (options.shared_dir) {
        config.shared_directory = *options.shared_dir;
    }
    if (options.max_connections) {
        config.max_connections = *options.max_connections;
    }
    if (options.log_level) {
        config.log_level = *options.log_level;
    }
    lantern::config::validate(config);

    auto& logger = lantern::daemon::StructuredLogger::instance();
    if (const auto level = lantern::daemon::StructuredLogger::parse_level(config.log_level)) {
        logger.set_min_level(*level);
    }
    return config;
}

struct Endpoint {
    std::string host;
    std::uint16_t port{0};
};

// host[:port]; inside serve a discovered hostname or peer id resolves to its address.
Endpoint resolve_target(std::string_view text, const lantern::Config& config, lantern::Peer* peer) {
    Endpoint endpoint{std::string(text), config.control_port};
    bool explicit_port = false;
    const auto colon = text.rfind(':');
    if (colon != std::string_view::npos && text.find(':') == colon) {
        endpoint.host = std::string(text.substr(0, colon));
        if (!parse_uint16(text.substr(colon + 1), endpoint.port) || endpoint.port == 0) {
            throw_cli_error("E_INVALID_TARGET",
                            "Invalid port in target: " + std::string(text),
                            "Use host or host:port, e.g. 192.168.1.20:5000");
        }
        explicit_port = true;
    }
    if (endpoint.host.empty()) {
        throw_cli_error("E_INVALID_TARGET", "Missing host in target: " + std::string(text));
    }
    if (peer != nullptr) {
        if (const auto record = peer->find_peer(endpoint.host)) {
            endpoint.host = record->ip;
            if (!explicit_port) {
                endpoint.port = record->tcp_port;
            }
        }
    }
    return endpoint;
}

void print_peers(const std::vector<lantern::PeerRecord>& peers) {
    if (peers.empty()) {
        std::cout << "No peers discovered yet." << std::endl;
        return;
    }
    for (const auto& record : peers) {
        std::cout << "  " << record.hostname << "  " << record.ip << ':' << record.tcp_port
                  << "  [" << record.peer_id << ']' << std::endl;
    }
}

void print_files(const std::vector<lantern::RemoteFile>& files, std::string_view empty_message) {
    if (files.empty()) {
        std::cout << empty_message << std::endl;
        return;
    }
    for (const auto& file : files) {
        std::cout << "  " << file.name << "  " << format_bytes(file.size) << std::endl;
    }
}

void run_list(const lantern::client::PeerClient& client, const Endpoint& target) {
    print_files(client.list_files(target.host, target.port),
                "No files on " + target.host + ":" + std::to_string(target.port));
}

void run_download(const lantern::client::PeerClient& client, const Endpoint& target, const std::string& name) {
    ProgressPrinter progress("Downloading " + name);
    TransferScope scope;
    try {
        const auto result = client.download(
            target.host,
            target.port,
            name,
            [&](std::uint64_t current, std::uint64_t total) { progress.update(current, total); },
            scope.flag());
        progress.update(result.bytes, result.bytes);
        std::cout << "Saved " << result.path.string() << " (" << format_bytes(result.bytes) << ')' << std::endl;
    } catch (...) {
        progress.cancel();
        throw;
    }
}

void run_upload(const lantern::client::PeerClient& client,
                const Endpoint& target,
                const std::filesystem::path& path,
                lantern::client::UploadMode mode) {
    if (mode == lantern::client::UploadMode::Confirmed) {
        std::cout << "Waiting for " << target.host << " to accept " << path.filename().string() << "..." << std::endl;
    }
    ProgressPrinter progress("Uploading " + path.filename().string());
    TransferScope scope;
    try {
        const auto message = client.upload(
            target.host,
            target.port,
            path,
            mode,
            [&](std::uint64_t current, std::uint64_t total) { progress.update(current, total); },
            scope.flag());
        progress.cancel();
        std::cout << message << std::endl;
    } catch (...) {
        progress.cancel();
        throw;
    }
}

void run_delete(const lantern::client::PeerClient& client, const Endpoint& target, const std::string& name) {
    std::cout << client.remove(target.host, target.port, name) << std::endl;
}

void run_myfiles(const lantern::Config& config) {
    const lantern::storage::SharedDirectory directory(config.shared_directory);
    print_files(directory.list(), "Shared folder " + config.shared_directory + " is empty.");
}

void print_request(const lantern::server::UploadRequest& request) {
    std::cout << "  #" << request.id << "  " << request.filename << "  " << format_bytes(request.filesize)
              << "  from " << request.sender_ip << std::endl;
}

void decide_request(lantern::server::UploadGate& gate, std::string_view id_text, bool accept) {
    std::uint64_t id{};
    if (!parse_uint64(id_text, id)) {
        std::cout << "Request ids are numbers; see 'pending'." << std::endl;
        return;
    }
    auto pending = gate.take(id);
    if (!pending) {
        std::cout << "No pending request #" << id << '.' << std::endl;
        return;
    }
    const bool applied = accept ? pending->accept() : pending->reject();
    if (!applied) {
        std::cout << "Request #" << id << " was already decided or withdrawn." << std::endl;
        return;
    }
    std::cout << (accept ? "Accepted " : "Rejected ") << pending->request().filename << std::endl;
}

// Prints peers joining or leaving and new upload requests; applies the
// non-interactive approval policy.
void watch_peer(lantern::Peer& peer, ApprovalPolicy policy, const std::atomic<bool>& running) {
    std::vector<lantern::PeerRecord> previous;
    std::set<std::uint64_t> announced;
    while (running.load()) {
        auto current = peer.active_peers();
        const auto changes = lantern::network::diff_peers(previous, current);
        previous = std::move(current);

        std::vector<lantern::server::UploadRequest> fresh;
        if (policy == ApprovalPolicy::Interactive) {
            std::set<std::uint64_t> still_queued;
            for (auto& request : peer.uploads().queued()) {
                still_queued.insert(request.id);
                if (!announced.contains(request.id)) {
                    fresh.push_back(std::move(request));
                }
            }
            std::erase_if(announced, [&](std::uint64_t id) { return !still_queued.contains(id); });
        } else {
            while (auto pending = peer.uploads().pop()) {
                const bool accept = policy == ApprovalPolicy::AutoAccept;
                const bool applied = accept ? pending->accept() : pending->reject();
                if (applied) {
                    std::scoped_lock lock(g_console_mutex);
                    std::cout << "\n[upload] " << (accept ? "accepted " : "rejected ")
                              << pending->request().filename << " from " << pending->request().sender_ip
                              << std::endl;
                }
            }
        }

        if (!changes.joined.empty() || !changes.lost.empty() || !fresh.empty()) {
            std::scoped_lock lock(g_console_mutex);
            for (const auto& record : changes.joined) {
                std::cout << "\n[peer] " << record.hostname << " joined (" << record.ip << ':' << record.tcp_port
                          << ')' << std::endl;
            }
            for (const auto& record : changes.lost) {
                std::cout << "\n[peer] " << record.hostname << " left" << std::endl;
            }
            for (const auto& request : fresh) {
                announced.insert(request.id);
                std::cout << "\n[upload] request #" << request.id << ": " << request.sender_ip << " wants to send "
                          << request.filename << " (" << format_bytes(request.filesize) << "). Type 'accept "
                          << request.id << "' or 'reject " << request.id << "'." << std::endl;
            }
        }
        std::this_thread::sleep_for(250ms);
    }
}

std::vector<std::string> split_words(const std::string& line) {
    std::istringstream stream(line);
    std::vector<std::string> words;
    std::string word;
    while (stream >> word) {
        words.push_back(std::move(word));
    }
    return words;
}

// Returns false when the console asked to quit.
bool run_console_command(const std::vector<std::string>& words, lantern::Peer& peer) {
    const auto command = to_lower(words.front());
    const auto& config = peer.config();
    const auto client = peer.make_client();
    const auto require = [&](std::size_t count, std::string_view usage) {
        if (words.size() < count) {
            throw_cli_error("E_USAGE", "Usage: " + std::string(usage));
        }
    };

    if (command == "quit" || command == "exit") {
        return false;
    }
    if (command == "help") {
        print_console_help();
    } else if (command == "peers") {
        print_peers(peer.active_peers());
    } else if (command == "myfiles") {
        run_myfiles(config);
    } else if (command == "pending") {
        const auto requests = peer.uploads().queued();
        if (requests.empty()) {
            std::cout << "No pending upload requests." << std::endl;
        }
        for (const auto& request : requests) {
            print_request(request);
        }
    } else if (command == "accept" || command == "reject") {
        require(2, command + " <id>");
        decide_request(peer.uploads(), words[1], command == "accept");
    } else if (command == "list") {
        require(2, "list <peer>");
        run_list(client, resolve_target(words[1], config, &peer));
    } else if (command == "download") {
        require(3, "download <peer> <file>");
        run_download(client, resolve_target(words[1], config, &peer), words[2]);
    } else if (command == "upload" || command == "send") {
        require(3, command + " <peer> <path>");
        run_upload(client,
                   resolve_target(words[1], config, &peer),
                   words[2],
                   command == "upload" ? lantern::client::UploadMode::Confirmed : lantern::client::UploadMode::Direct);
    } else if (command == "delete") {
        require(3, "delete <peer> <file>");
        run_delete(client, resolve_target(words[1], config, &peer), words[2]);
    } else {
        std::cout << "Unknown command: " << words.front() << " (type 'help')" << std::endl;
    }
    return true;
}

int run_serve(const lantern::Config& config, ApprovalPolicy policy) {
    lantern::Peer peer(config);
    peer.start();

    g_interrupted.store(false);
    g_run_loop.store(true);
    install_termination_handlers();

    std::cout << "Lantern peer " << peer.config().hostname << " [" << peer.config().peer_id << "] listening on "
              << peer.config().bind_host << ':' << peer.control_port() << ", discovery on UDP "
              << peer.config().discovery_port << std::endl;
    std::cout << "Sharing " << std::filesystem::absolute(peer.config().shared_directory).string()
              << ". Type 'help' for commands, Ctrl+C to stop." << std::endl;

    std::thread watcher([&]() { watch_peer(peer, policy, g_run_loop); });

    bool console_open = true;
    while (g_run_loop.load()) {
        if (!console_open) {
            std::this_thread::sleep_for(200ms);
            continue;
        }
        {
            std::scoped_lock lock(g_console_mutex);
            std::cout << "lantern> " << std::flush;
        }
        std::string line;
        if (!std::getline(std::cin, line)) {
            if (!g_run_loop.load()) {
                break;
            }
            if (std::cin.eof()) {
                // Detached from a terminal: keep serving until signalled.
                console_open = false;
            }
            std::cin.clear();
            continue;
        }
        const auto words = split_words(line);
        if (words.empty()) {
            continue;
        }
        try {
            if (!run_console_command(words, peer)) {
                g_run_loop.store(false);
            }
        } catch (const CliException& ex) {
            print_cli_error(ex.what(), ex.hint());
        } catch (const lantern::client::PeerError& ex) {
            std::cout << "Error: " << ex.what() << std::endl;
        } catch (const std::exception& ex) {
            std::cout << "Error: " << ex.what() << std::endl;
        }
    }

    if (g_interrupted.load()) {
        std::cout << "\nInterrupt received, shutting down..." << std::endl;
    }
    g_run_loop.store(false);
    watcher.join();
    peer.stop();
    uninstall_termination_handlers();
    std::cout << "Peer stopped." << std::endl;
    return 0;
}

int run_peers(const lantern::Config& base, std::chrono::seconds wait) {
    auto config = base;
    lantern::resolve_identity(config);
    lantern::network::PeerRegistry registry(config.peer_id, config.peer_timeout);
    lantern::network::Discovery discovery(config, registry);
    discovery.set_announce(false);
    discovery.start();

    g_interrupted.store(false);
    g_run_loop.store(true);
    install_termination_handlers();
    std::cout << "Listening for beacons on UDP " << config.discovery_port << " for " << wait.count() << "s..."
              << std::endl;
    const auto deadline = std::chrono::steady_clock::now() + wait;
    while (g_run_loop.load() && std::chrono::steady_clock::now() < deadline) {
        std::this_thread::sleep_for(100ms);
    }
    discovery.stop();
    uninstall_termination_handlers();
    print_peers(registry.active_peers());
    return 0;
}

}  // namespace

int main(int argc, char** argv) {
    try {
        std::vector<std::string_view> args;
        args.reserve(static_cast<std::size_t>(argc));
        for (int i = 1; i < argc; ++i) {
            args.emplace_back(argv[i]);
        }

        GlobalOptions options{};
        std::size_t index = 0;

        auto require_value = [&](std::string_view option) -> std::string {
            if (index >= args.size()) {
                throw_cli_error("E_MISSING_VALUE",
                                std::string(option) + " requires a value",
                                "Provide an argument immediately after " + std::string(option));
            }
            return std::string(args[index++]);
        };
        auto require_port = [&](std::string_view option) -> std::uint16_t {
            const auto value = require_value(option);
            std::uint16_t port{};
            if (!parse_uint16(value, port)) {
                throw_cli_error("E_INVALID_PORT",
                                std::string(option) + " must be between 0 and 65535",
                                "For example: " + std::string(option) + " 5000");
            }
            return port;
        };

        std::optional<std::string> command;
        std::vector<std::string> positional;
        std::optional<std::uint64_t> wait_seconds;
        bool confirm_upload = false;

        while (index < args.size()) {
            const auto opt = args[index++];
            if (!opt.starts_with("-")) {
                if (!command) {
                    command = to_lower(std::string(opt));
                } else {
                    positional.emplace_back(opt);
                }
                continue;
            }
            if (opt == "--help" || opt == "-h") {
                print_usage();
                return 0;
            }
            if (opt == "--version") {
                std::cout << "Lantern " << kLanternVersion << std::endl;
                return 0;
            }
            if (opt == "--config") {
                if (options.config_path) {
                    throw_cli_error("E_DUPLICATE_OPTION",
                                    "Option --config specified multiple times",
                                    "Provide the configuration file only once");
                }
                options.config_path = require_value(opt);
                continue;
            }
            if (opt == "--port") {
                options.control_port = require_port(opt);
                continue;
            }
            if (opt == "--discovery-port") {
                options.discovery_port = require_port(opt);
                continue;
            }
            if (opt == "--shared-dir") {
                options.shared_dir = require_value(opt);
                continue;
            }
            if (opt == "--max-connections") {
                const auto value = require_value(opt);
                std::uint64_t parsed{};
                if (!parse_uint64(value, parsed) || parsed == 0 || parsed > 100000) {
                    throw_cli_error("E_INVALID_MAX_CONNECTIONS",
                                    "--max-connections must be between 1 and 100000",
                                    "For example: --max-connections 50");
                }
                options.max_connections = static_cast<std::size_t>(parsed);
                continue;
            }
            if (opt == "--log-level") {
                options.log_level = to_lower(require_value(opt));
                continue;
            }
            if (opt == "--auto-accept" || opt == "--auto-reject") {
                if (options.approval_set) {
                    throw_cli_error("E_DUPLICATE_OPTION",
                                    "Approval policy specified multiple times",
                                    "Use either --auto-accept or --auto-reject once");
                }
                options.approval = opt == "--auto-accept" ? ApprovalPolicy::AutoAccept : ApprovalPolicy::AutoReject;
                options.approval_set = true;
                continue;
            }
            if (opt == "--wait") {
                const auto value = require_value(opt);
                std::uint64_t parsed{};
                if (!parse_uint64(value, parsed) || parsed == 0 || parsed > 3600) {
                    throw_cli_error("E_INVALID_WAIT", "--wait must be between 1 and 3600 seconds");
                }
                wait_seconds = parsed;
                continue;
            }
            if (opt == "--confirm") {
                confirm_upload = true;
                continue;
            }
            throw_cli_error("E_UNKNOWN_OPTION",
                            "Unknown option: " + std::string(opt),
                            "Run 'lantern --help' to see the available options");
        }

        if (!command) {
            print_usage();
            return 1;
        }

        auto expect_args = [&](std::size_t count, std::string_view usage) {
            if (positional.size() != count) {
                throw_cli_error("E_USAGE", "Usage: lantern " + std::string(usage));
            }
        };

        if (*command == "help") {
            print_usage();
            return 0;
        }

        const auto config = build_config(options);
        const lantern::client::PeerClient client(lantern::client::ClientOptions::from_config(config));

        if (*command == "serve") {
            expect_args(0, "serve");
            return run_serve(config, options.approval);
        }
        if (*command == "peers") {
            expect_args(0, "peers [--wait <sec>]");
            const auto wait = wait_seconds ? std::chrono::seconds(static_cast<std::int64_t>(*wait_seconds))
                                           : config.beacon_interval + std::chrono::seconds(1);
            return run_peers(config, wait);
        }
        if (*command == "myfiles") {
            expect_args(0, "myfiles");
            run_myfiles(config);
            return 0;
        }
        if (*command == "list") {
            expect_args(1, "list <host[:port]>");
            run_list(client, resolve_target(positional[0], config, nullptr));
            return 0;
        }

        install_termination_handlers();
        if (*command == "download") {
            expect_args(2, "download <host[:port]> <file>");
            run_download(client, resolve_target(positional[0], config, nullptr), positional[1]);
            return 0;
        }
        if (*command == "upload") {
            expect_args(2, "upload <host[:port]> <path> [--confirm]");
            run_upload(client,
                       resolve_target(positional[0], config, nullptr),
                       positional[1],
                       confirm_upload ? lantern::client::UploadMode::Confirmed : lantern::client::UploadMode::Direct);
            return 0;
        }
        if (*command == "delete") {
            expect_args(2, "delete <host[:port]> <file>");
            run_delete(client, resolve_target(positional[0], config, nullptr), positional[1]);
            return 0;
        }

        throw_cli_error("E_UNKNOWN_COMMAND",
                        "Unknown command: " + *command,
                        "Run 'lantern --help' to see the list of available commands");

    } catch (const CliException& ex) {
        print_cli_error(ex.what(), ex.hint());
        return 1;
    } catch (const lantern::config::ConfigError& ex) {
        print_cli_error(ex.what(), ex.hint);
        return 1;
    } catch (const lantern::client::PeerError& ex) {
        std::cerr << "Error [E_PEER]: " << ex.what() << std::endl;
        return 1;
    } catch (const std::exception& ex) {
        std::cerr << "Error [E_UNEXPECTED]: " << ex.what() << std::endl;
        return 1;
    }
}
