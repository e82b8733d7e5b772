#include "lantern/protocol/Frame.hpp"
#include "test_support.hpp"

#include <atomic>
#include <cassert>
#include <filesystem>
#include <string>
#include <thread>
#include <vector>

using namespace lantern;

namespace {

std::string pattern(std::size_t size) {
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 31 + 7) & 0xFF);
    }
    return data;
}

void test_raw_transfer_with_progress() {
    test::TempDir dir("transfer");
    const auto source = dir / "source.bin";
    const auto destination = dir / "destination.bin";
    const auto content = pattern(10000);
    test::write_file(source, content);

    auto pair = test::make_socket_pair();
    std::vector<std::uint64_t> sender_progress;
    std::thread sender([&]() {
        protocol::TransferOptions options;
        options.chunk_size = 4096;
        options.on_progress = [&](std::uint64_t current, std::uint64_t total) {
            assert(total == 10000);
            sender_progress.push_back(current);
        };
        const auto sent = protocol::send_raw_file(pair.left.get(), source, content.size(), options);
        assert(sent == content.size());
    });

    std::vector<std::uint64_t> receiver_progress;
    protocol::TransferOptions options;
    options.chunk_size = 4096;
    options.on_progress = [&](std::uint64_t current, std::uint64_t) { receiver_progress.push_back(current); };
    const auto received = protocol::recv_file(pair.right.get(), destination, content.size(), options);
    sender.join();

    assert(received == content.size());
    assert(test::read_file(destination) == content);
    assert((sender_progress == std::vector<std::uint64_t>{4096, 8192, 10000}));
    assert((receiver_progress == std::vector<std::uint64_t>{4096, 8192, 10000}));
}

void test_send_file_prefixes_size_frame() {
    test::TempDir dir("send_file");
    const auto source = dir / "hello.txt";
    test::write_file(source, "hello lantern");

    auto pair = test::make_socket_pair();
    protocol::send_file(pair.left.get(), source);
    const auto size_frame = protocol::recv_frame(pair.right.get());
    assert(size_frame == std::optional<std::string>("13"));
    const auto destination = dir / "copy.txt";
    assert(protocol::recv_file(pair.right.get(), destination, 13) == 13);
    assert(test::read_file(destination) == "hello lantern");
}

void test_empty_file() {
    test::TempDir dir("empty");
    const auto destination = dir / "empty.bin";
    auto pair = test::make_socket_pair();
    assert(protocol::recv_file(pair.right.get(), destination, 0) == 0);
    assert(std::filesystem::exists(destination));
    assert(std::filesystem::file_size(destination) == 0);
}

void test_short_stream_removes_partial_file() {
    test::TempDir dir("short");
    const auto destination = dir / "partial.bin";
    auto pair = test::make_socket_pair();
    const auto content = pattern(5000);
    const bool sent = network::send_all(pair.left.get(), reinterpret_cast<const std::uint8_t*>(content.data()),
                                        content.size());
    assert(sent);
    pair.left.reset();

    const auto received = protocol::recv_file(pair.right.get(), destination, 20000);
    assert(received < 20000);
    assert(!std::filesystem::exists(destination));
}

void test_cancel_removes_partial_file() {
    test::TempDir dir("cancel");
    const auto destination = dir / "cancelled.bin";
    auto pair = test::make_socket_pair();
    const auto content = pattern(8192);
    const bool sent = network::send_all(pair.left.get(), reinterpret_cast<const std::uint8_t*>(content.data()),
                                        content.size());
    assert(sent);

    std::atomic<bool> cancel{false};
    protocol::TransferOptions options;
    options.chunk_size = 4096;
    options.cancel = &cancel;
    options.on_progress = [&](std::uint64_t, std::uint64_t) { cancel.store(true); };
    const auto received = protocol::recv_file(pair.right.get(), destination, 100000, options);
    assert(received == 4096);
    assert(!std::filesystem::exists(destination));
}

void test_cancelled_sender_stops_between_chunks() {
    test::TempDir dir("cancel_send");
    const auto source = dir / "big.bin";
    test::write_file(source, pattern(20000));
    auto pair = test::make_socket_pair();

    std::atomic<bool> cancel{false};
    protocol::TransferOptions options;
    options.chunk_size = 1000;
    options.cancel = &cancel;
    options.on_progress = [&](std::uint64_t current, std::uint64_t) {
        if (current >= 3000) {
            cancel.store(true);
        }
    };
    assert(protocol::send_raw_file(pair.left.get(), source, 20000, options) == 3000);
}

void test_missing_source_throws() {
    test::TempDir dir("missing");
    auto pair = test::make_socket_pair();
    bool threw = false;
    try {
        (void)protocol::send_raw_file(pair.left.get(), dir / "absent.bin", 10);
    } catch (const protocol::TransportError&) {
        threw = true;
    }
    assert(threw);
}

void test_unwritable_destination_throws() {
    test::TempDir dir("unwritable");
    auto pair = test::make_socket_pair();
    bool threw = false;
    try {
        (void)protocol::recv_file(pair.right.get(), dir / "no_such_dir" / "file.bin", 10);
    } catch (const protocol::TransportError&) {
        threw = true;
    }
    assert(threw);
}

}  // namespace

int main() {
    test_raw_transfer_with_progress();
    test_send_file_prefixes_size_frame();
    test_empty_file();
    test_short_stream_removes_partial_file();
    test_cancel_removes_partial_file();
    test_cancelled_sender_stops_between_chunks();
    test_missing_source_throws();
    test_unwritable_destination_throws();
    return 0;
}
