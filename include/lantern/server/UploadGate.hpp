#pragma once

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lantern::server {

enum class UploadDecision {
    Accepted,
    Rejected,
    TimedOut
};

std::string_view decision_to_string(UploadDecision decision);

struct UploadRequest {
    std::uint64_t id{0};
    std::string sender_ip;
    std::string filename;
    std::uint64_t filesize{0};
};

class UploadGate;

// Approver-side handle for one queued request. The first accept()/reject()
// wins; later calls, or calls after the uploader stopped waiting, return false.
class PendingUpload {
public:
    const UploadRequest& request() const noexcept;
    bool accept();
    bool reject();

private:
    friend class UploadGate;
    struct Slot;
    explicit PendingUpload(std::shared_ptr<Slot> slot);

    std::shared_ptr<Slot> slot_;
};

// Hands upload requests from connection threads to whoever approves them and
// carries the verdict back. Connection threads block in submit().
class UploadGate {
public:
    explicit UploadGate(std::chrono::milliseconds decision_timeout);
    ~UploadGate();

    UploadGate(const UploadGate&) = delete;
    UploadGate& operator=(const UploadGate&) = delete;

    // Queues the request (its id is assigned here) and waits for a verdict.
    // Returns TimedOut when nobody decides in time; the request is withdrawn.
    UploadDecision submit(UploadRequest request);

    std::optional<PendingUpload> pop();
    std::optional<PendingUpload> wait_pop(std::chrono::milliseconds timeout);
    // Removes a specific queued request.
    std::optional<PendingUpload> take(std::uint64_t id);

    std::vector<UploadRequest> queued() const;
    std::size_t waiting() const;

    // Rejects every request still waiting for a verdict, queued or popped.
    void reject_all();
    // reject_all() plus immediate rejection of every later submit().
    void shutdown();
    // Lets submit() queue requests again after shutdown().
    void reopen();

    std::chrono::milliseconds decision_timeout() const noexcept { return decision_timeout_; }

private:
    std::chrono::milliseconds decision_timeout_;
    mutable std::mutex mutex_;
    std::condition_variable queued_cv_;
    std::deque<std::shared_ptr<PendingUpload::Slot>> queue_;
    std::vector<std::shared_ptr<PendingUpload::Slot>> outstanding_;
    std::uint64_t next_id_{1};
    bool closed_{false};
};

}  // namespace lantern::server
