#include "lantern/protocol/Command.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace lantern::protocol {

namespace {

std::string to_upper(std::string_view value) {
    std::string result(value);
    std::transform(result.begin(), result.end(), result.begin(), [](unsigned char ch) {
        return static_cast<char>(std::toupper(ch));
    });
    return result;
}

std::string_view trim(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

std::size_t required_args(CommandKind kind) {
    switch (kind) {
        case CommandKind::List:
            return 0;
        case CommandKind::Download:
        case CommandKind::Delete:
            return 1;
        case CommandKind::Upload:
        case CommandKind::UploadRequest:
            return 2;
        case CommandKind::Unknown:
            break;
    }
    return 0;
}

}  // namespace

std::vector<std::string> split(std::string_view text, std::string_view separator) {
    std::vector<std::string> parts;
    if (separator.empty()) {
        parts.emplace_back(text);
        return parts;
    }
    std::size_t start = 0;
    while (true) {
        const auto pos = text.find(separator, start);
        if (pos == std::string_view::npos) {
            parts.emplace_back(text.substr(start));
            break;
        }
        parts.emplace_back(text.substr(start, pos - start));
        start = pos + separator.size();
    }
    return parts;
}

Command parse_command(std::string_view line) {
    auto parts = split(line, kSeparator);
    Command command;
    command.verb = to_upper(parts.front());
    command.args.assign(std::make_move_iterator(parts.begin() + 1), std::make_move_iterator(parts.end()));

    if (command.verb == "LIST") {
        command.kind = CommandKind::List;
    } else if (command.verb == "DOWNLOAD") {
        command.kind = CommandKind::Download;
    } else if (command.verb == "UPLOAD") {
        command.kind = CommandKind::Upload;
    } else if (command.verb == "UPLOAD_REQUEST") {
        command.kind = CommandKind::UploadRequest;
    } else if (command.verb == "DELETE") {
        command.kind = CommandKind::Delete;
    }

    // A filename carrying the separator would shift every later field.
    const auto expected = required_args(command.kind);
    if (command.args.size() < expected || (expected > 0 && command.args.size() > expected)) {
        command.kind = CommandKind::Unknown;
    }
    return command;
}

std::string format_command(std::string_view verb, std::initializer_list<std::string_view> args) {
    std::string line(verb);
    for (const auto arg : args) {
        line.append(kSeparator);
        line.append(arg);
    }
    return line;
}

std::optional<Response> parse_response(std::string_view frame) {
    const auto pos = frame.find(kSeparator);
    const auto status = frame.substr(0, pos);
    Response response;
    if (status == "OK") {
        response.ok = true;
    } else if (status != "ERROR") {
        return std::nullopt;
    }
    if (pos != std::string_view::npos) {
        response.payload = std::string(frame.substr(pos + kSeparator.size()));
    }
    return response;
}

std::string make_ok() {
    return "OK";
}

std::string make_ok(std::string_view payload) {
    std::string text{"OK"};
    text.append(kSeparator);
    text.append(payload);
    return text;
}

std::string make_error(std::string_view reason) {
    std::string text{"ERROR"};
    text.append(kSeparator);
    text.append(reason);
    return text;
}

std::string encode_listing(const std::vector<RemoteFile>& files) {
    std::string listing;
    for (std::size_t i = 0; i < files.size(); ++i) {
        if (i > 0) {
            listing.push_back('\n');
        }
        listing.append(files[i].name);
        listing.append(kSeparator);
        listing.append(std::to_string(files[i].size));
    }
    return listing;
}

std::vector<RemoteFile> decode_listing(std::string_view payload) {
    std::vector<RemoteFile> files;
    for (const auto& line : split(payload, "\n")) {
        const auto pos = line.find(kSeparator);
        if (pos == std::string::npos) {
            continue;
        }
        const auto size = parse_integer(std::string_view(line).substr(pos + kSeparator.size()));
        if (!size || *size < 0) {
            continue;
        }
        files.push_back(RemoteFile{line.substr(0, pos), static_cast<std::uint64_t>(*size)});
    }
    return files;
}

std::optional<std::int64_t> parse_integer(std::string_view text) {
    text = trim(text);
    if (!text.empty() && text.front() == '+') {
        text.remove_prefix(1);
        if (!text.empty() && text.front() == '-') {
            return std::nullopt;
        }
    }
    if (text.empty()) {
        return std::nullopt;
    }
    std::int64_t value = 0;
    const auto* begin = text.data();
    const auto* end = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return std::nullopt;
    }
    return value;
}

std::string_view command_name(CommandKind kind) {
    switch (kind) {
        case CommandKind::List:
            return "LIST";
        case CommandKind::Download:
            return "DOWNLOAD";
        case CommandKind::Upload:
            return "UPLOAD";
        case CommandKind::UploadRequest:
            return "UPLOAD_REQUEST";
        case CommandKind::Delete:
            return "DELETE";
        case CommandKind::Unknown:
            break;
    }
    return "UNKNOWN";
}

}  // namespace lantern::protocol
