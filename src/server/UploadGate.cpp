#include "lantern/server/UploadGate.hpp"

#include "lantern/daemon/StructuredLogger.hpp"

#include <algorithm>

namespace lantern::server {

namespace {

using daemon::StructuredLogger;

}  // namespace

struct PendingUpload::Slot {
    UploadRequest request;
    std::promise<UploadDecision> promise;
    std::atomic<bool> decided{false};

    bool decide(UploadDecision decision) {
        if (decided.exchange(true)) {
            return false;
        }
        promise.set_value(decision);
        return true;
    }
};

std::string_view decision_to_string(UploadDecision decision) {
    switch (decision) {
        case UploadDecision::Accepted:
            return "accepted";
        case UploadDecision::Rejected:
            return "rejected";
        case UploadDecision::TimedOut:
            return "timed_out";
    }
    return "rejected";
}

PendingUpload::PendingUpload(std::shared_ptr<Slot> slot)
    : slot_(std::move(slot)) {}

const UploadRequest& PendingUpload::request() const noexcept {
    return slot_->request;
}

bool PendingUpload::accept() {
    return slot_->decide(UploadDecision::Accepted);
}

bool PendingUpload::reject() {
    return slot_->decide(UploadDecision::Rejected);
}

UploadGate::UploadGate(std::chrono::milliseconds decision_timeout)
    : decision_timeout_(decision_timeout) {}

UploadGate::~UploadGate() {
    shutdown();
}

UploadDecision UploadGate::submit(UploadRequest request) {
    auto slot = std::make_shared<PendingUpload::Slot>();
    auto verdict = slot->promise.get_future();
    {
        std::scoped_lock lock(mutex_);
        if (closed_) {
            return UploadDecision::Rejected;
        }
        request.id = next_id_++;
        slot->request = std::move(request);
        queue_.push_back(slot);
        outstanding_.push_back(slot);
    }
    queued_cv_.notify_all();

    const auto& queued_request = slot->request;
    daemon::log_event(StructuredLogger::Level::Info,
                      "upload.request.queued",
                      {{"id", std::to_string(queued_request.id)},
                       {"from", queued_request.sender_ip},
                       {"file", queued_request.filename},
                       {"size", std::to_string(queued_request.filesize)}});

    if (verdict.wait_for(decision_timeout_) != std::future_status::ready) {
        // Loses against a verdict that lands between the timeout and this claim.
        slot->decide(UploadDecision::TimedOut);
    }
    const auto decision = verdict.get();

    {
        std::scoped_lock lock(mutex_);
        std::erase(queue_, slot);
        std::erase(outstanding_, slot);
    }

    daemon::log_event(decision == UploadDecision::Accepted ? StructuredLogger::Level::Info
                                                           : StructuredLogger::Level::Warning,
                      decision == UploadDecision::Accepted ? "upload.request.accepted"
                                                           : "upload.request.declined",
                      {{"id", std::to_string(queued_request.id)},
                       {"file", queued_request.filename},
                       {"decision", std::string(decision_to_string(decision))}});
    return decision;
}

std::optional<PendingUpload> UploadGate::pop() {
    std::scoped_lock lock(mutex_);
    if (queue_.empty()) {
        return std::nullopt;
    }
    auto slot = std::move(queue_.front());
    queue_.pop_front();
    return PendingUpload(std::move(slot));
}

std::optional<PendingUpload> UploadGate::wait_pop(std::chrono::milliseconds timeout) {
    std::unique_lock lock(mutex_);
    if (!queued_cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; }) || queue_.empty()) {
        return std::nullopt;
    }
    auto slot = std::move(queue_.front());
    queue_.pop_front();
    return PendingUpload(std::move(slot));
}

std::optional<PendingUpload> UploadGate::take(std::uint64_t id) {
    std::scoped_lock lock(mutex_);
    const auto it = std::find_if(queue_.begin(), queue_.end(), [id](const auto& slot) {
        return slot->request.id == id;
    });
    if (it == queue_.end()) {
        return std::nullopt;
    }
    auto slot = std::move(*it);
    queue_.erase(it);
    return PendingUpload(std::move(slot));
}

std::vector<UploadRequest> UploadGate::queued() const {
    std::scoped_lock lock(mutex_);
    std::vector<UploadRequest> requests;
    requests.reserve(queue_.size());
    for (const auto& slot : queue_) {
        requests.push_back(slot->request);
    }
    return requests;
}

std::size_t UploadGate::waiting() const {
    std::scoped_lock lock(mutex_);
    return outstanding_.size();
}

void UploadGate::reject_all() {
    std::vector<std::shared_ptr<PendingUpload::Slot>> slots;
    {
        std::scoped_lock lock(mutex_);
        slots = outstanding_;
        queue_.clear();
    }
    for (const auto& slot : slots) {
        slot->decide(UploadDecision::Rejected);
    }
}

void UploadGate::shutdown() {
    {
        std::scoped_lock lock(mutex_);
        closed_ = true;
    }
    queued_cv_.notify_all();
    reject_all();
}

void UploadGate::reopen() {
    std::scoped_lock lock(mutex_);
    closed_ = false;
}

}  // namespace lantern::server
