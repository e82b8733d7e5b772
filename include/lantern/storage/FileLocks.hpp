#pragma once

#include <chrono>
#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace lantern::storage {

enum class LockMode {
    Shared,
    Exclusive
};

// Advisory per-filename locks for the file server: readers share a name,
// writers and deleters own it.
class FileLockTable {
    struct Entry {
        std::shared_timed_mutex mutex;
        std::size_t users{0};
    };

public:
    class Lease {
    public:
        Lease(const Lease&) = delete;
        Lease& operator=(const Lease&) = delete;
        Lease(Lease&& other) noexcept;
        Lease& operator=(Lease&& other) noexcept;
        ~Lease();

        LockMode mode() const noexcept { return mode_; }
        void release() noexcept;

    private:
        friend class FileLockTable;
        Lease(FileLockTable* table, std::string name, Entry* entry, LockMode mode);

        FileLockTable* table_{nullptr};
        std::string name_;
        Entry* entry_{nullptr};
        LockMode mode_{LockMode::Shared};
    };

    FileLockTable() = default;
    FileLockTable(const FileLockTable&) = delete;
    FileLockTable& operator=(const FileLockTable&) = delete;

    // std::nullopt when the lock was not obtained within `wait`.
    std::optional<Lease> acquire(const std::string& name, LockMode mode, std::chrono::milliseconds wait);

    // Names with at least one holder or waiter.
    std::size_t tracked() const;

private:
    void unregister(const std::string& name);

    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries_;
};

}  // namespace lantern::storage
