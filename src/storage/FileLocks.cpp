#include "lantern/storage/FileLocks.hpp"

#include <utility>

namespace lantern::storage {

FileLockTable::Lease::Lease(FileLockTable* table, std::string name, Entry* entry, LockMode mode)
    : table_(table), name_(std::move(name)), entry_(entry), mode_(mode) {}

FileLockTable::Lease::Lease(Lease&& other) noexcept
    : table_(std::exchange(other.table_, nullptr)),
      name_(std::move(other.name_)),
      entry_(std::exchange(other.entry_, nullptr)),
      mode_(other.mode_) {}

FileLockTable::Lease& FileLockTable::Lease::operator=(Lease&& other) noexcept {
    if (this != &other) {
        release();
        table_ = std::exchange(other.table_, nullptr);
        name_ = std::move(other.name_);
        entry_ = std::exchange(other.entry_, nullptr);
        mode_ = other.mode_;
    }
    return *this;
}

FileLockTable::Lease::~Lease() {
    release();
}

void FileLockTable::Lease::release() noexcept {
    if (entry_ == nullptr) {
        return;
    }
    if (mode_ == LockMode::Shared) {
        entry_->mutex.unlock_shared();
    } else {
        entry_->mutex.unlock();
    }
    entry_ = nullptr;
    table_->unregister(name_);
    table_ = nullptr;
}

std::optional<FileLockTable::Lease> FileLockTable::acquire(const std::string& name,
                                                           LockMode mode,
                                                           std::chrono::milliseconds wait) {
    Entry* entry = nullptr;
    {
        std::scoped_lock lock(mutex_);
        auto& slot = entries_[name];
        if (!slot) {
            slot = std::make_unique<Entry>();
        }
        ++slot->users;
        entry = slot.get();
    }

    const bool locked = mode == LockMode::Shared ? entry->mutex.try_lock_shared_for(wait)
                                                 : entry->mutex.try_lock_for(wait);
    if (!locked) {
        unregister(name);
        return std::nullopt;
    }
    return Lease(this, name, entry, mode);
}

std::size_t FileLockTable::tracked() const {
    std::scoped_lock lock(mutex_);
    return entries_.size();
}

void FileLockTable::unregister(const std::string& name) {
    std::scoped_lock lock(mutex_);
    const auto it = entries_.find(name);
    if (it == entries_.end()) {
        return;
    }
    if (--it->second->users == 0) {
        entries_.erase(it);
    }
}

}  // namespace lantern::storage
