#include "lantern/storage/SharedDirectory.hpp"

#include "lantern/daemon/StructuredLogger.hpp"
#include "lantern/protocol/Command.hpp"
#include "lantern/protocol/Frame.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <system_error>

namespace lantern::storage {

namespace {

bool is_reserved_device_name(std::string_view name) {
    static constexpr std::array<std::string_view, 4> kFixed{"CON", "PRN", "AUX", "NUL"};

    const auto stem = name.substr(0, name.find('.'));
    std::string upper(stem);
    std::transform(upper.begin(), upper.end(), upper.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });

    if (std::find(kFixed.begin(), kFixed.end(), upper) != kFixed.end()) {
        return true;
    }
    if (upper.size() == 4 && (upper.starts_with("COM") || upper.starts_with("LPT"))) {
        return upper[3] >= '1' && upper[3] <= '9';
    }
    return false;
}

}  // namespace

bool is_staging_name(std::string_view name) {
    return name.size() > kStagingSuffix.size() + 1 && name.front() == '.' && name.ends_with(kStagingSuffix);
}

std::filesystem::path staging_path_for(const std::filesystem::path& target) {
    return target.parent_path() /
           ("." + target.filename().string() + "." + generate_peer_id() + std::string(kStagingSuffix));
}

bool commit_staged(const std::filesystem::path& staged,
                   const std::filesystem::path& target,
                   std::error_code& ec) noexcept {
    std::filesystem::rename(staged, target, ec);
    if (!ec) {
        return true;
    }
    std::error_code cleanup;
    std::filesystem::remove(staged, cleanup);
    return false;
}

std::string sanitize_filename(std::string_view name) {
    const auto slash = name.find_last_of("/\\");
    if (slash != std::string_view::npos) {
        name.remove_prefix(slash + 1);
    }

    std::string cleaned;
    cleaned.reserve(name.size());
    for (const char ch : name) {
        if (ch != '\0') {
            cleaned.push_back(ch);
        }
    }

    if (cleaned.empty() || cleaned == "." || cleaned == ".." || is_reserved_device_name(cleaned) ||
        is_staging_name(cleaned)) {
        return std::string(kPlaceholderName);
    }
    return cleaned;
}

SharedDirectory::SharedDirectory(std::filesystem::path root)
    : root_(std::move(root)) {}

void SharedDirectory::ensure_exists() const {
    std::filesystem::create_directories(root_);
}

std::vector<RemoteFile> SharedDirectory::list() const {
    ensure_exists();

    std::vector<RemoteFile> files;
    for (const auto& entry : std::filesystem::directory_iterator(root_)) {
        std::error_code ec;
        if (!entry.is_regular_file(ec) || ec) {
            continue;
        }
        const auto size = entry.file_size(ec);
        if (ec) {
            continue;
        }
        auto name = entry.path().filename().string();
        if (is_staging_name(name)) {
            continue;
        }
        // Names that cannot travel in a listing line are left out.
        if (!protocol::is_valid_utf8(name) || name.find('\n') != std::string::npos ||
            name.find(protocol::kSeparator) != std::string::npos) {
            daemon::log_event(daemon::StructuredLogger::Level::Debug,
                              "storage.listing.skipped",
                              {{"name", name}});
            continue;
        }
        files.push_back(RemoteFile{std::move(name), static_cast<std::uint64_t>(size)});
    }

    std::sort(files.begin(), files.end(), [](const RemoteFile& lhs, const RemoteFile& rhs) {
        return lhs.name < rhs.name;
    });
    return files;
}

std::filesystem::path SharedDirectory::resolve(std::string_view name) const {
    return root_ / std::filesystem::path(std::string(name));
}

std::optional<std::uint64_t> SharedDirectory::file_size(std::string_view name) const {
    if (is_staging_name(name)) {
        return std::nullopt;
    }
    const auto path = resolve(name);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return std::nullopt;
    }
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(size);
}

RemoveOutcome SharedDirectory::remove(std::string_view name) const {
    if (is_staging_name(name)) {
        return RemoveOutcome{RemoveStatus::NotFound, {}};
    }
    const auto path = resolve(name);
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec) || ec) {
        return RemoveOutcome{RemoveStatus::NotFound, {}};
    }
    if (!std::filesystem::remove(path, ec) || ec) {
        return RemoveOutcome{RemoveStatus::Failed, ec ? ec.message() : std::string{"file vanished"}};
    }
    return RemoveOutcome{RemoveStatus::Removed, {}};
}

}  // namespace lantern::storage
