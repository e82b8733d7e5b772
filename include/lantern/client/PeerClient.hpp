#pragma once

#include "lantern/Config.hpp"
#include "lantern/Types.hpp"
#include "lantern/protocol/Frame.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace lantern::client {

// Readable, user-facing description of why a remote operation failed.
class PeerError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class UploadMode {
    Direct,     // UPLOAD, stored without asking
    Confirmed   // UPLOAD_REQUEST, held until the remote user decides
};

struct DownloadResult {
    std::filesystem::path path;
    std::uint64_t bytes{0};
};

struct ClientOptions {
    std::chrono::milliseconds connect_timeout{std::chrono::seconds(10)};
    std::chrono::milliseconds transfer_timeout{std::chrono::seconds(30)};
    // How long a confirmed upload waits for the remote verdict.
    std::chrono::milliseconds confirm_timeout{std::chrono::seconds(70)};
    std::size_t chunk_size{protocol::kDefaultChunkSize};
    std::size_t max_frame_bytes{protocol::kDefaultMaxFrameBytes};
    std::filesystem::path download_directory{"shared_files"};

    static ClientOptions from_config(const Config& config);
};

// One fresh connection per operation. Every failure throws PeerError.
class PeerClient {
public:
    explicit PeerClient(ClientOptions options = {});

    std::vector<RemoteFile> list_files(const std::string& host, std::uint16_t port) const;

    // Incomplete or cancelled downloads leave no file behind.
    DownloadResult download(const std::string& host,
                            std::uint16_t port,
                            const std::string& name,
                            const protocol::ProgressCallback& progress = {},
                            const std::atomic<bool>* cancel = nullptr) const;

    // Returns the remote confirmation message.
    std::string upload(const std::string& host,
                       std::uint16_t port,
                       const std::filesystem::path& local_path,
                       UploadMode mode = UploadMode::Direct,
                       const protocol::ProgressCallback& progress = {},
                       const std::atomic<bool>* cancel = nullptr) const;

    std::string remove(const std::string& host, std::uint16_t port, const std::string& name) const;

    const ClientOptions& options() const noexcept { return options_; }

private:
    ClientOptions options_;
};

}  // namespace lantern::client
