#pragma once

#include "lantern/Types.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

namespace lantern::storage {

inline constexpr std::string_view kPlaceholderName = "upload";

// Reduces an untrusted name to a single safe path segment: directory parts and
// NUL bytes are dropped; "", ".", ".." and reserved device names (CON, PRN,
// AUX, NUL, COM1-9, LPT1-9, any case, optional extension) become "upload".
// A staging name (see below) is reduced to "upload" as well.
std::string sanitize_filename(std::string_view name);

// Incoming files are written to a hidden sibling ".<name>.<token>.lantern-part"
// and renamed over the real name only once complete. Staging files are never
// listed, served or deleted through SharedDirectory.
inline constexpr std::string_view kStagingSuffix = ".lantern-part";

bool is_staging_name(std::string_view name);
std::filesystem::path staging_path_for(const std::filesystem::path& target);

// Moves a finished staging file over `target`. On failure the staging file is
// removed, `ec` is set and false is returned.
bool commit_staged(const std::filesystem::path& staged,
                   const std::filesystem::path& target,
                   std::error_code& ec) noexcept;

enum class RemoveStatus {
    Removed,
    NotFound,
    Failed
};

struct RemoveOutcome {
    RemoveStatus status{RemoveStatus::NotFound};
    std::string reason;
};

// The flat folder a peer offers. Names passed in must already be sanitized.
class SharedDirectory {
public:
    explicit SharedDirectory(std::filesystem::path root);

    const std::filesystem::path& root() const noexcept { return root_; }

    // Throws std::filesystem::filesystem_error when the folder cannot be created.
    void ensure_exists() const;

    // Regular files directly under the root, sorted by name. Staging files are skipped.
    std::vector<RemoteFile> list() const;

    std::filesystem::path resolve(std::string_view name) const;
    std::optional<std::uint64_t> file_size(std::string_view name) const;
    RemoveOutcome remove(std::string_view name) const;

private:
    std::filesystem::path root_;
};

}  // namespace lantern::storage
