#include "lantern/server/UploadGate.hpp"
#include "test_support.hpp"

#include <cassert>
#include <chrono>
#include <future>
#include <string>
#include <thread>

using namespace lantern;
using namespace std::chrono_literals;
using server::UploadDecision;
using server::UploadGate;
using server::UploadRequest;

namespace {

std::future<UploadDecision> submit_async(UploadGate& gate, std::string name, std::uint64_t size = 10) {
    return std::async(std::launch::async, [&gate, name = std::move(name), size]() {
        return gate.submit(UploadRequest{0, "10.0.0.5", name, size});
    });
}

void test_accept_and_reject() {
    UploadGate gate(5s);
    auto first = submit_async(gate, "a.txt", 11);
    auto pending = gate.wait_pop(2s);
    assert(pending);
    assert(pending->request().filename == "a.txt");
    assert(pending->request().filesize == 11);
    assert(pending->request().sender_ip == "10.0.0.5");
    assert(pending->request().id > 0);
    assert(pending->accept());
    assert(!pending->reject());
    assert(first.get() == UploadDecision::Accepted);

    auto second = submit_async(gate, "b.txt");
    pending = gate.wait_pop(2s);
    assert(pending);
    assert(pending->reject());
    assert(second.get() == UploadDecision::Rejected);
    assert(gate.waiting() == 0);
}

void test_timeout_withdraws_request() {
    UploadGate gate(150ms);
    const auto started = std::chrono::steady_clock::now();
    assert(gate.submit(UploadRequest{0, "10.0.0.5", "slow.bin", 1}) == UploadDecision::TimedOut);
    assert(std::chrono::steady_clock::now() - started >= 150ms);
    assert(gate.queued().empty());
    assert(gate.waiting() == 0);
    assert(!gate.pop());
}

void test_late_decision_is_refused() {
    UploadGate gate(200ms);
    auto verdict = submit_async(gate, "late.bin");
    auto pending = gate.wait_pop(2s);
    assert(pending);
    assert(verdict.get() == UploadDecision::TimedOut);
    assert(!pending->accept());
}

void test_take_by_id_and_listing() {
    UploadGate gate(5s);
    auto one = submit_async(gate, "one.txt");
    auto two = submit_async(gate, "two.txt");
    assert(test::wait_until([&]() { return gate.queued().size() == 2; }));

    const auto requests = gate.queued();
    assert(requests[0].id != requests[1].id);
    const auto target = requests[0].filename == "two.txt" ? requests[0].id : requests[1].id;
    auto pending = gate.take(target);
    assert(pending && pending->request().filename == "two.txt");
    assert(!gate.take(target));
    assert(gate.queued().size() == 1);
    assert(gate.waiting() == 2);
    assert(pending->accept());
    assert(two.get() == UploadDecision::Accepted);

    gate.reject_all();
    assert(one.get() == UploadDecision::Rejected);
}

void test_reject_all_covers_popped_requests() {
    UploadGate gate(5s);
    auto verdict = submit_async(gate, "held.txt");
    auto pending = gate.wait_pop(2s);
    assert(pending);
    gate.reject_all();
    assert(verdict.get() == UploadDecision::Rejected);
    assert(!pending->accept());
}

void test_shutdown_closes_gate() {
    UploadGate gate(5s);
    gate.shutdown();
    const auto started = std::chrono::steady_clock::now();
    assert(gate.submit(UploadRequest{0, "10.0.0.5", "after.txt", 1}) == UploadDecision::Rejected);
    assert(std::chrono::steady_clock::now() - started < 1s);
    assert(!gate.wait_pop(50ms));
    assert(gate.waiting() == 0);

    gate.reopen();
    auto verdict = submit_async(gate, "again.txt");
    auto pending = gate.wait_pop(2s);
    assert(pending);
    assert(pending->request().filename == "again.txt");
    assert(pending->accept());
    assert(verdict.get() == UploadDecision::Accepted);
}

void test_concurrent_requests_are_independent() {
    UploadGate gate(5s);
    std::vector<std::future<UploadDecision>> verdicts;
    for (int i = 0; i < 8; ++i) {
        verdicts.push_back(submit_async(gate, "file" + std::to_string(i)));
    }
    int decided = 0;
    while (decided < 8) {
        auto pending = gate.wait_pop(2s);
        assert(pending);
        const auto& name = pending->request().filename;
        const bool even = (name.back() - '0') % 2 == 0;
        assert(even ? pending->accept() : pending->reject());
        ++decided;
    }
    for (int i = 0; i < 8; ++i) {
        assert(verdicts[i].get() == (i % 2 == 0 ? UploadDecision::Accepted : UploadDecision::Rejected));
    }
}

}  // namespace

int main() {
    assert(server::decision_to_string(UploadDecision::TimedOut) == "timed_out");
    test_accept_and_reject();
    test_timeout_withdraws_request();
    test_late_decision_is_refused();
    test_take_by_id_and_listing();
    test_reject_all_covers_popped_requests();
    test_shutdown_closes_gate();
    test_concurrent_requests_are_independent();
    return 0;
}
