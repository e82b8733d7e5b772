#pragma once

#include "lantern/Types.hpp"

#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace lantern::protocol {

// Field delimiter on the control channel. Not escaped: a filename that
// contains it cannot be transferred.
inline constexpr std::string_view kSeparator = "<SEP>";

enum class CommandKind {
    List,
    Download,
    Upload,
    UploadRequest,
    Delete,
    Unknown
};

struct Command {
    CommandKind kind{CommandKind::Unknown};
    std::string verb;                // upper-cased first field
    std::vector<std::string> args;   // remaining fields, untouched
};

struct Response {
    bool ok{false};
    std::string payload;             // empty for a bare "OK"
};

std::vector<std::string> split(std::string_view text, std::string_view separator);

// Resolves the command kind; a known verb with too few fields is Unknown.
Command parse_command(std::string_view line);
std::string format_command(std::string_view verb, std::initializer_list<std::string_view> args = {});

std::optional<Response> parse_response(std::string_view frame);
std::string make_ok();
std::string make_ok(std::string_view payload);
std::string make_error(std::string_view reason);

// "name<SEP>size" lines joined by '\n'.
std::string encode_listing(const std::vector<RemoteFile>& files);
// Lines without a separator or with a non-numeric size are skipped.
std::vector<RemoteFile> decode_listing(std::string_view payload);

// Decimal integer, surrounding whitespace allowed.
std::optional<std::int64_t> parse_integer(std::string_view text);

std::string_view command_name(CommandKind kind);

}  // namespace lantern::protocol
