#include "lantern/client/PeerClient.hpp"

#include "lantern/daemon/StructuredLogger.hpp"
#include "lantern/network/Socket.hpp"
#include "lantern/protocol/Command.hpp"
#include "lantern/storage/SharedDirectory.hpp"

#include <system_error>

namespace lantern::client {

namespace {

using daemon::StructuredLogger;
using network::NativeSocket;
using network::ScopedSocket;

constexpr std::chrono::seconds kConfirmMargin{10};

std::string endpoint(const std::string& host, std::uint16_t port) {
    return host + ":" + std::to_string(port);
}

ScopedSocket connect(const std::string& host, std::uint16_t port, std::chrono::milliseconds timeout) {
    auto socket = network::open_tcp_connection(host, port, timeout);
    if (!socket) {
        throw PeerError("Could not connect to " + endpoint(host, port));
    }
    network::set_recv_timeout(socket->get(), timeout);
    network::set_send_timeout(socket->get(), timeout);
    return std::move(*socket);
}

void send_command(NativeSocket socket, const std::string& line) {
    try {
        protocol::send_frame(socket, line);
    } catch (const std::exception& ex) {
        throw PeerError(std::string("Failed to send request: ") + ex.what());
    }
}

// std::nullopt when the peer closed without answering.
std::optional<protocol::Response> read_response(NativeSocket socket, std::size_t max_frame_bytes) {
    std::optional<std::string> frame;
    try {
        frame = protocol::recv_frame(socket, max_frame_bytes);
    } catch (const protocol::ProtocolViolation& ex) {
        throw PeerError(std::string("Invalid response from peer: ") + ex.what());
    }
    if (!frame) {
        return std::nullopt;
    }
    auto response = protocol::parse_response(*frame);
    if (!response) {
        throw PeerError("Invalid response from peer");
    }
    return response;
}

protocol::Response expect_response(NativeSocket socket, std::size_t max_frame_bytes) {
    auto response = read_response(socket, max_frame_bytes);
    if (!response) {
        throw PeerError("No response from peer");
    }
    return std::move(*response);
}

std::string reason_or_unknown(const protocol::Response& response) {
    return response.payload.empty() ? std::string{"Unknown error"} : response.payload;
}

}  // namespace

ClientOptions ClientOptions::from_config(const Config& config) {
    ClientOptions options;
    options.connect_timeout = config.client_connect_timeout;
    options.transfer_timeout = config.client_transfer_timeout;
    options.confirm_timeout = config.upload_confirm_timeout + kConfirmMargin;
    options.chunk_size = config.chunk_size;
    options.max_frame_bytes = config.max_frame_bytes;
    options.download_directory = config.download_directory.value_or(config.shared_directory);
    return options;
}

PeerClient::PeerClient(ClientOptions options)
    : options_(std::move(options)) {}

std::vector<RemoteFile> PeerClient::list_files(const std::string& host, std::uint16_t port) const {
    auto socket = connect(host, port, options_.connect_timeout);
    send_command(socket.get(), protocol::format_command("LIST"));

    const auto response = expect_response(socket.get(), options_.max_frame_bytes);
    if (!response.ok) {
        throw PeerError(reason_or_unknown(response));
    }
    return protocol::decode_listing(response.payload);
}

DownloadResult PeerClient::download(const std::string& host,
                                    std::uint16_t port,
                                    const std::string& name,
                                    const protocol::ProgressCallback& progress,
                                    const std::atomic<bool>* cancel) const {
    auto socket = connect(host, port, options_.transfer_timeout);
    send_command(socket.get(), protocol::format_command("DOWNLOAD", {name}));

    const auto response = expect_response(socket.get(), options_.max_frame_bytes);
    if (!response.ok) {
        throw PeerError(reason_or_unknown(response));
    }
    const auto size = protocol::parse_integer(response.payload);
    if (!size || *size < 0) {
        throw PeerError("Invalid file size in response: " + response.payload);
    }

    // A hostile listing could name "../../.bashrc"; only the leaf is used locally.
    const auto local_name = storage::sanitize_filename(name);
    std::error_code ec;
    std::filesystem::create_directories(options_.download_directory, ec);
    if (ec) {
        throw PeerError("Cannot create " + options_.download_directory.string() + ": " + ec.message());
    }

    DownloadResult result;
    result.path = options_.download_directory / local_name;

    // The download directory is usually the shared one: an existing file of the
    // same name keeps being served until the new copy is complete.
    const auto staged = storage::staging_path_for(result.path);

    protocol::TransferOptions transfer;
    transfer.chunk_size = options_.chunk_size;
    transfer.on_progress = progress;
    transfer.cancel = cancel;
    try {
        result.bytes = protocol::recv_file(socket.get(), staged, static_cast<std::uint64_t>(*size), transfer);
    } catch (const protocol::TransportError& ex) {
        throw PeerError(ex.what());
    }

    if (result.bytes != static_cast<std::uint64_t>(*size)) {
        if (cancel != nullptr && cancel->load()) {
            throw PeerError("Transfer cancelled");
        }
        throw PeerError("Incomplete transfer: got " + std::to_string(result.bytes) + "/" +
                        std::to_string(*size) + " bytes");
    }

    if (!storage::commit_staged(staged, result.path, ec)) {
        throw PeerError("Cannot write " + result.path.string() + ": " + ec.message());
    }

    daemon::log_event(StructuredLogger::Level::Info,
                      "client.download.completed",
                      {{"peer", endpoint(host, port)},
                       {"file", local_name},
                       {"bytes", std::to_string(result.bytes)}});
    return result;
}

std::string PeerClient::upload(const std::string& host,
                               std::uint16_t port,
                               const std::filesystem::path& local_path,
                               UploadMode mode,
                               const protocol::ProgressCallback& progress,
                               const std::atomic<bool>* cancel) const {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(local_path, ec)) {
        throw PeerError("Local file not found: " + local_path.string());
    }
    const auto size = static_cast<std::uint64_t>(std::filesystem::file_size(local_path, ec));
    if (ec) {
        throw PeerError("Cannot read " + local_path.string() + ": " + ec.message());
    }
    const auto filename = local_path.filename().string();

    auto socket = connect(host, port, options_.connect_timeout);
    const auto verb = mode == UploadMode::Confirmed ? "UPLOAD_REQUEST" : "UPLOAD";
    send_command(socket.get(), protocol::format_command(verb, {filename, std::to_string(size)}));

    if (mode == UploadMode::Confirmed) {
        network::set_recv_timeout(socket.get(), options_.confirm_timeout);
    }
    const auto ready = read_response(socket.get(), options_.max_frame_bytes);
    if (!ready || !ready->ok) {
        const auto reason = ready ? reason_or_unknown(*ready) : std::string{"unknown"};
        throw PeerError("Peer rejected upload: " + reason);
    }

    network::set_recv_timeout(socket.get(), options_.transfer_timeout);
    protocol::TransferOptions transfer;
    transfer.chunk_size = options_.chunk_size;
    transfer.on_progress = progress;
    transfer.cancel = cancel;
    std::uint64_t sent = 0;
    try {
        sent = protocol::send_raw_file(socket.get(), local_path, size, transfer);
    } catch (const protocol::TransportError& ex) {
        throw PeerError(ex.what());
    }
    if (sent != size) {
        if (cancel != nullptr && cancel->load()) {
            throw PeerError("Transfer cancelled");
        }
        throw PeerError("Local file changed during upload: sent " + std::to_string(sent) + "/" +
                        std::to_string(size) + " bytes");
    }

    const auto confirm = read_response(socket.get(), options_.max_frame_bytes);
    if (!confirm || !confirm->ok) {
        const auto reason = confirm ? reason_or_unknown(*confirm) : std::string{"unknown"};
        throw PeerError("Upload issue: " + reason);
    }

    daemon::log_event(StructuredLogger::Level::Info,
                      "client.upload.completed",
                      {{"peer", endpoint(host, port)}, {"file", filename}, {"bytes", std::to_string(sent)}});
    return confirm->payload.empty() ? std::string{"Upload complete"} : confirm->payload;
}

std::string PeerClient::remove(const std::string& host, std::uint16_t port, const std::string& name) const {
    auto socket = connect(host, port, options_.connect_timeout);
    send_command(socket.get(), protocol::format_command("DELETE", {name}));

    const auto response = expect_response(socket.get(), options_.max_frame_bytes);
    if (!response.ok) {
        throw PeerError(reason_or_unknown(response));
    }
    return response.payload.empty() ? std::string{"Deleted " + name} : response.payload;
}

}  // namespace lantern::client
