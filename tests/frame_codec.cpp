#include "lantern/protocol/Command.hpp"
#include "lantern/protocol/Frame.hpp"
#include "test_support.hpp"

#include <cassert>
#include <cstdint>
#include <string>

using namespace lantern;

namespace {

void send_bytes(network::NativeSocket socket, const std::string& bytes) {
    const bool sent = network::send_all(socket, reinterpret_cast<const std::uint8_t*>(bytes.data()), bytes.size());
    assert(sent);
}

std::string header(std::uint32_t length) {
    std::string out(4, '\0');
    out[0] = static_cast<char>((length >> 24) & 0xFF);
    out[1] = static_cast<char>((length >> 16) & 0xFF);
    out[2] = static_cast<char>((length >> 8) & 0xFF);
    out[3] = static_cast<char>(length & 0xFF);
    return out;
}

void test_frames_preserve_boundaries() {
    auto pair = test::make_socket_pair();
    protocol::send_frame(pair.left.get(), "LIST");
    protocol::send_frame(pair.left.get(), "");
    protocol::send_frame(pair.left.get(), "caf\xC3\xA9 \xE2\x9C\x93");

    assert(protocol::recv_frame(pair.right.get()) == std::optional<std::string>("LIST"));
    assert(protocol::recv_frame(pair.right.get()) == std::optional<std::string>(""));
    assert(protocol::recv_frame(pair.right.get()) == std::optional<std::string>("caf\xC3\xA9 \xE2\x9C\x93"));
}

void test_header_is_big_endian() {
    auto pair = test::make_socket_pair();
    protocol::send_frame(pair.left.get(), std::string(258, 'a'));
    std::uint8_t raw[4]{};
    const bool got = network::recv_exact(pair.right.get(), raw, sizeof(raw));
    assert(got);
    assert(raw[0] == 0 && raw[1] == 0 && raw[2] == 1 && raw[3] == 2);
}

void test_end_of_stream_is_not_an_error() {
    {
        auto pair = test::make_socket_pair();
        pair.left.reset();
        assert(!protocol::recv_frame(pair.right.get()));
    }
    {
        // Header promises more than the peer sends before closing.
        auto pair = test::make_socket_pair();
        send_bytes(pair.left.get(), header(10) + "abc");
        pair.left.reset();
        assert(!protocol::recv_frame(pair.right.get()));
    }
    {
        auto pair = test::make_socket_pair();
        send_bytes(pair.left.get(), std::string("\x00\x00", 2));
        pair.left.reset();
        assert(!protocol::recv_frame(pair.right.get()));
    }
}

void test_oversized_frame_is_rejected() {
    auto pair = test::make_socket_pair();
    send_bytes(pair.left.get(), header(0xFFFFFFFFu));
    bool threw = false;
    try {
        (void)protocol::recv_frame(pair.right.get());
    } catch (const protocol::ProtocolViolation&) {
        threw = true;
    }
    assert(threw);

    auto second = test::make_socket_pair();
    protocol::send_frame(second.left.get(), std::string(65, 'x'));
    threw = false;
    try {
        (void)protocol::recv_frame(second.right.get(), 64);
    } catch (const protocol::ProtocolViolation&) {
        threw = true;
    }
    assert(threw);

    auto exact = test::make_socket_pair();
    protocol::send_frame(exact.left.get(), std::string(64, 'x'));
    assert(protocol::recv_frame(exact.right.get(), 64)->size() == 64);
}

void test_invalid_utf8_is_rejected() {
    auto pair = test::make_socket_pair();
    send_bytes(pair.left.get(), header(2) + "\xC3\x28");
    bool threw = false;
    try {
        (void)protocol::recv_frame(pair.right.get());
    } catch (const protocol::ProtocolViolation&) {
        threw = true;
    }
    assert(threw);
}

void test_utf8_validation() {
    assert(protocol::is_valid_utf8(""));
    assert(protocol::is_valid_utf8("plain ascii"));
    assert(protocol::is_valid_utf8("\xC3\xA9"));
    assert(protocol::is_valid_utf8("\xF0\x9F\x98\x80"));
    assert(!protocol::is_valid_utf8("\xC3"));
    assert(!protocol::is_valid_utf8("\xE2\x9C"));
    assert(!protocol::is_valid_utf8("\x80"));
    assert(!protocol::is_valid_utf8("\xC0\xAF"));          // overlong '/'
    assert(!protocol::is_valid_utf8("\xED\xA0\x80"));      // surrogate
    assert(!protocol::is_valid_utf8("\xF4\x90\x80\x80"));  // past U+10FFFF
    assert(!protocol::is_valid_utf8("\xFF"));
}

void test_command_parsing() {
    const auto list = protocol::parse_command("list");
    assert(list.kind == protocol::CommandKind::List);
    assert(list.verb == "LIST");

    const auto download = protocol::parse_command("DOWNLOAD<SEP>notes.txt");
    assert(download.kind == protocol::CommandKind::Download);
    assert(download.args.size() == 1 && download.args[0] == "notes.txt");

    const auto upload = protocol::parse_command(protocol::format_command("UPLOAD_REQUEST", {"a.bin", "12"}));
    assert(upload.kind == protocol::CommandKind::UploadRequest);
    assert(upload.args.size() == 2 && upload.args[1] == "12");

    assert(protocol::parse_command("UPLOAD<SEP>only-name").kind == protocol::CommandKind::Unknown);
    assert(protocol::parse_command("DELETE").kind == protocol::CommandKind::Unknown);
    assert(protocol::parse_command("DOWNLOAD<SEP>a<SEP>b.txt").kind == protocol::CommandKind::Unknown);
    assert(protocol::parse_command("UPLOAD<SEP>a<SEP>b<SEP>5").kind == protocol::CommandKind::Unknown);
    assert(protocol::parse_command("FROB<SEP>x").kind == protocol::CommandKind::Unknown);
    assert(protocol::parse_command("").kind == protocol::CommandKind::Unknown);
}

void test_responses() {
    assert(protocol::make_ok() == "OK");
    assert(protocol::make_ok("5") == "OK<SEP>5");
    assert(protocol::make_error("File not found: x") == "ERROR<SEP>File not found: x");

    const auto ok = protocol::parse_response("OK<SEP>Deleted a<SEP>b");
    assert(ok && ok->ok && ok->payload == "Deleted a<SEP>b");
    const auto bare = protocol::parse_response("OK");
    assert(bare && bare->ok && bare->payload.empty());
    const auto error = protocol::parse_response("ERROR<SEP>Upload declined");
    assert(error && !error->ok && error->payload == "Upload declined");
    assert(!protocol::parse_response("MAYBE<SEP>x"));
}

void test_listing() {
    const std::vector<RemoteFile> files{{"a.txt", 3}, {"b.bin", 1024}};
    const auto encoded = protocol::encode_listing(files);
    assert(encoded == "a.txt<SEP>3\nb.bin<SEP>1024");

    const auto decoded = protocol::decode_listing("a.txt<SEP>3\nno separator\nbad<SEP>size\n\nb.bin<SEP>1024\n");
    assert(decoded.size() == 2);
    assert(decoded[0].name == "a.txt" && decoded[0].size == 3);
    assert(decoded[1].name == "b.bin" && decoded[1].size == 1024);
    assert(protocol::decode_listing("").empty());
}

void test_integers() {
    assert(protocol::parse_integer("42") == std::optional<std::int64_t>(42));
    assert(protocol::parse_integer(" 7 ") == std::optional<std::int64_t>(7));
    assert(protocol::parse_integer("+9") == std::optional<std::int64_t>(9));
    assert(protocol::parse_integer("-1") == std::optional<std::int64_t>(-1));
    assert(!protocol::parse_integer(""));
    assert(!protocol::parse_integer("12abc"));
    assert(!protocol::parse_integer("+-5"));
}

}  // namespace

int main() {
    test_frames_preserve_boundaries();
    test_header_is_big_endian();
    test_end_of_stream_is_not_an_error();
    test_oversized_frame_is_rejected();
    test_invalid_utf8_is_rejected();
    test_utf8_validation();
    test_command_parsing();
    test_responses();
    test_listing();
    test_integers();
    return 0;
}
