#include "lantern/config/ConfigLoader.hpp"

#include "lantern/daemon/StructuredLogger.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>
#include <string_view>
#include <type_traits>

namespace lantern::config {

namespace {

bool parse_floating_token(std::string_view token, double& value) {
    // libc++ still lacks floating point std::from_chars on some targets.
    std::string buffer(token);
    if (buffer.empty()) {
        return false;
    }
    char* parsed_end = nullptr;
    errno = 0;
    value = std::strtod(buffer.c_str(), &parsed_end);
    return parsed_end == buffer.c_str() + buffer.size() && errno != ERANGE;
}

void append_utf8(std::string& out, std::uint32_t code_point) {
    if (code_point <= 0x7F) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code_point >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((code_point >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((code_point >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
}

class JsonParser {
public:
    explicit JsonParser(const std::string& text) : text_(text) {}

    Value parse() {
        skip_whitespace();
        Value value = parse_value();
        skip_whitespace();
        if (!at_end()) {
            fail("Unexpected trailing content in JSON document");
        }
        return value;
    }

private:
    const std::string& text_;
    std::size_t position_{0};

    [[noreturn]] static void fail(const std::string& message) {
        throw ConfigError("E_CONFIG_PARSE", message);
    }

    bool at_end() const { return position_ >= text_.size(); }
    char peek() const { return at_end() ? '\0' : text_[position_]; }
    char get() { return at_end() ? '\0' : text_[position_++]; }

    void skip_whitespace() {
        while (!at_end() && (peek() == ' ' || peek() == '\n' || peek() == '\r' || peek() == '\t')) {
            ++position_;
        }
    }

    bool consume_literal(std::string_view literal) {
        if (text_.compare(position_, literal.size(), literal) == 0) {
            position_ += literal.size();
            return true;
        }
        return false;
    }

    Value parse_value() {
        skip_whitespace();
        if (at_end()) {
            fail("Unexpected end of JSON while parsing value");
        }

        const char ch = peek();
        if (ch == '{') {
            return parse_object();
        }
        if (ch == '[') {
            return parse_array();
        }
        if (ch == '"') {
            return Value(parse_string());
        }
        if (consume_literal("true")) {
            return Value(true);
        }
        if (consume_literal("false")) {
            return Value(false);
        }
        if (consume_literal("null")) {
            return Value();
        }
        if (ch == '-' || std::isdigit(static_cast<unsigned char>(ch))) {
            return parse_number();
        }
        fail("Unexpected token in JSON value");
    }

    Value parse_object() {
        Value object = Value::make_object();
        get();
        skip_whitespace();
        if (peek() == '}') {
            get();
            return object;
        }

        auto& fields = object.ensure_object();
        while (true) {
            skip_whitespace();
            if (peek() != '"') {
                fail("Expected string key in JSON object");
            }
            std::string key = parse_string();
            skip_whitespace();
            if (get() != ':') {
                fail("Expected ':' after key in JSON object");
            }
            fields[std::move(key)] = parse_value();

            skip_whitespace();
            const char ch = get();
            if (ch == '}') {
                return object;
            }
            if (ch != ',') {
                fail("Expected ',' or '}' in JSON object");
            }
        }
    }

    Value parse_array() {
        Value array = Value::make_array();
        get();
        skip_whitespace();
        if (peek() == ']') {
            get();
            return array;
        }

        while (true) {
            array.array_value.push_back(parse_value());
            skip_whitespace();
            const char ch = get();
            if (ch == ']') {
                return array;
            }
            if (ch != ',') {
                fail("Expected ',' or ']' in JSON array");
            }
        }
    }

    std::uint32_t parse_hex4() {
        if (position_ + 4 > text_.size()) {
            fail("Incomplete unicode escape in JSON string");
        }
        std::uint32_t value = 0;
        const auto* begin = text_.data() + position_;
        const auto [ptr, ec] = std::from_chars(begin, begin + 4, value, 16);
        if (ec != std::errc{} || ptr != begin + 4) {
            fail("Invalid hex digit in unicode escape");
        }
        position_ += 4;
        return value;
    }

    std::string parse_string() {
        get();
        std::string result;
        while (!at_end()) {
            const char ch = get();
            if (ch == '"') {
                return result;
            }
            if (static_cast<unsigned char>(ch) < 0x20) {
                fail("Control characters must be escaped in JSON strings");
            }
            if (ch != '\\') {
                result.push_back(ch);
                continue;
            }

            switch (get()) {
                case '"':
                    result.push_back('"');
                    break;
                case '\\':
                    result.push_back('\\');
                    break;
                case '/':
                    result.push_back('/');
                    break;
                case 'b':
                    result.push_back('\b');
                    break;
                case 'f':
                    result.push_back('\f');
                    break;
                case 'n':
                    result.push_back('\n');
                    break;
                case 'r':
                    result.push_back('\r');
                    break;
                case 't':
                    result.push_back('\t');
                    break;
                case 'u': {
                    auto code_point = parse_hex4();
                    if (code_point >= 0xD800 && code_point <= 0xDBFF && consume_literal("\\u")) {
                        const auto low = parse_hex4();
                        if (low < 0xDC00 || low > 0xDFFF) {
                            fail("Invalid surrogate pair in JSON string");
                        }
                        code_point = 0x10000 + ((code_point - 0xD800) << 10) + (low - 0xDC00);
                    }
                    append_utf8(result, code_point);
                    break;
                }
                default:
                    fail("Unsupported escape sequence in JSON string");
            }
        }
        fail("Unterminated JSON string literal");
    }

    Value parse_number() {
        const std::size_t start = position_;
        bool fractional = false;
        if (peek() == '-') {
            ++position_;
        }
        while (std::isdigit(static_cast<unsigned char>(peek()))) {
            ++position_;
        }
        if (peek() == '.') {
            fractional = true;
            ++position_;
            while (std::isdigit(static_cast<unsigned char>(peek()))) {
                ++position_;
            }
        }
        if (peek() == 'e' || peek() == 'E') {
            fractional = true;
            ++position_;
            if (peek() == '+' || peek() == '-') {
                ++position_;
            }
            while (std::isdigit(static_cast<unsigned char>(peek()))) {
                ++position_;
            }
        }

        const std::string_view token(text_.data() + start, position_ - start);
        if (fractional) {
            double value{};
            if (!parse_floating_token(token, value)) {
                fail("Invalid floating point number in JSON");
            }
            return Value(value);
        }
        std::int64_t value{};
        const auto [ptr, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
        if (ec != std::errc{} || ptr != token.data() + token.size()) {
            fail("Invalid integer number in JSON");
        }
        return Value(value);
    }
};

std::string_view trim(std::string_view value) {
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) {
        value.remove_prefix(1);
    }
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) {
        value.remove_suffix(1);
    }
    return value;
}

Value parse_yaml_scalar(std::string_view text) {
    const auto trimmed = trim(text);
    if (trimmed.empty() || trimmed == "null" || trimmed == "~") {
        return Value();
    }
    if (trimmed.size() >= 2 && trimmed.front() == '\'' && trimmed.back() == '\'') {
        return Value(std::string(trimmed.substr(1, trimmed.size() - 2)));
    }
    if (trimmed.size() >= 2 && trimmed.front() == '"' && trimmed.back() == '"') {
        const std::string literal(trimmed);
        return JsonParser(literal).parse();
    }
    if (trimmed == "true" || trimmed == "True" || trimmed == "yes") {
        return Value(true);
    }
    if (trimmed == "false" || trimmed == "False" || trimmed == "no") {
        return Value(false);
    }

    std::int64_t integer{};
    const auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), integer);
    if (ec == std::errc{} && ptr == trimmed.data() + trimmed.size()) {
        return Value(integer);
    }
    double floating{};
    if (trimmed.find_first_not_of("0123456789.-+eE") == std::string_view::npos &&
        parse_floating_token(trimmed, floating)) {
        return Value(floating);
    }
    return Value(std::string(trimmed));
}

std::string strip_comment(const std::string& line) {
    bool in_single = false;
    bool in_double = false;
    for (std::size_t i = 0; i < line.size(); ++i) {
        const char ch = line[i];
        if (ch == '"' && !in_single) {
            in_double = !in_double;
        } else if (ch == '\'' && !in_double) {
            in_single = !in_single;
        } else if (ch == '#' && !in_single && !in_double) {
            return line.substr(0, i);
        }
    }
    return line;
}

std::string join_path(const std::vector<std::string>& path) {
    std::string combined;
    for (const auto& segment : path) {
        if (!combined.empty()) {
            combined.push_back('.');
        }
        combined += segment;
    }
    return combined.empty() ? std::string{"<root>"} : combined;
}

template <typename T>
T checked_integer(std::int64_t value, std::int64_t minimum, std::int64_t maximum, const std::string& name) {
    if (value < minimum || value > maximum) {
        throw ConfigError("E_CONFIG_VALUE",
                          name + " must be between " + std::to_string(minimum) + " and " + std::to_string(maximum),
                          "Got " + std::to_string(value));
    }
    return static_cast<T>(value);
}

std::int64_t parse_environment_integer(const std::string& name, const std::string& text) {
    const auto trimmed = trim(text);
    std::int64_t value{};
    const auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
    if (trimmed.empty() || ec != std::errc{} || ptr != trimmed.data() + trimmed.size()) {
        throw ConfigError("E_CONFIG_VALUE", name + " must be an integer", "Got '" + text + "'");
    }
    return value;
}

constexpr std::int64_t kMaxPort = std::numeric_limits<std::uint16_t>::max();
constexpr std::int64_t kMaxSeconds = 24 * 60 * 60;
constexpr std::int64_t kMaxMilliseconds = kMaxSeconds * 1000;

}  // namespace

Value Value::make_object() {
    Value value;
    value.type = ValueType::Object;
    return value;
}

Value Value::make_array() {
    Value value;
    value.type = ValueType::Array;
    return value;
}

std::map<std::string, Value>& Value::ensure_object() {
    if (type != ValueType::Object) {
        type = ValueType::Object;
        object_value.clear();
        array_value.clear();
        string_value.clear();
    }
    return object_value;
}

const std::map<std::string, Value>& Value::as_object() const {
    static const std::map<std::string, Value> empty{};
    return type == ValueType::Object ? object_value : empty;
}

const std::vector<Value>& Value::as_array() const {
    static const std::vector<Value> empty{};
    return type == ValueType::Array ? array_value : empty;
}

ConfigError::ConfigError(std::string c, std::string m, std::string h)
    : code(std::move(c)), message(std::move(m)), hint(std::move(h)) {
    formatted = code.empty() ? message : "[" + code + "] " + message;
}

Value parse_json(const std::string& text) {
    return JsonParser(text).parse();
}

Value parse_yaml(const std::string& text) {
    Value root = Value::make_object();
    struct Context {
        std::size_t indent;
        Value* node;
    };
    std::vector<Context> stack{{0, &root}};

    std::istringstream input(text);
    std::string raw;
    std::size_t line_number = 0;
    while (std::getline(input, raw)) {
        ++line_number;
        const auto line = strip_comment(raw);
        if (trim(line).empty()) {
            continue;
        }

        std::size_t indent = 0;
        while (indent < line.size() && line[indent] == ' ') {
            ++indent;
        }
        if (indent % 2 != 0) {
            throw ConfigError("E_CONFIG_PARSE",
                              "YAML indentation must be multiples of two spaces (line " +
                                  std::to_string(line_number) + ")");
        }
        while (indent < stack.back().indent) {
            stack.pop_back();
        }
        if (indent != stack.back().indent) {
            throw ConfigError("E_CONFIG_PARSE", "Unexpected indentation on line " + std::to_string(line_number));
        }

        const auto content = trim(std::string_view(line).substr(indent));
        const auto colon = content.find(':');
        if (colon == std::string_view::npos) {
            throw ConfigError("E_CONFIG_PARSE", "Expected 'key: value' on line " + std::to_string(line_number));
        }
        const std::string key(trim(content.substr(0, colon)));
        const auto value_part = trim(content.substr(colon + 1));

        auto& object = stack.back().node->ensure_object();
        if (value_part.empty()) {
            Value& child = object[key];
            child.ensure_object();
            stack.push_back({indent + 2, &child});
        } else {
            object[key] = parse_yaml_scalar(value_part);
        }
    }
    return root;
}

Value load_document(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        throw ConfigError("E_CONFIG_NOT_FOUND",
                          "Configuration file not found: " + path.string(),
                          "Verify the path or provide an absolute path");
    }
    std::stringstream buffer;
    buffer << input.rdbuf();
    const std::string contents = buffer.str();

    const auto first = trim(contents);
    const bool looks_like_json = path.extension() == ".json" || (!first.empty() && first.front() == '{');
    Value document = looks_like_json ? parse_json(contents) : parse_yaml(contents);
    if (!document.is_object()) {
        throw ConfigError("E_CONFIG_PARSE", "Configuration root must be an object");
    }
    return document;
}

const Value* find_path(const Value& root, const std::vector<std::string>& path) {
    const Value* node = &root;
    for (const auto& segment : path) {
        const auto& object = node->as_object();
        const auto it = object.find(segment);
        if (it == object.end()) {
            return nullptr;
        }
        node = &it->second;
    }
    return node;
}

std::optional<std::string> get_string(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node || node->is_null()) {
        return std::nullopt;
    }
    if (node->is_string()) {
        return node->string_value;
    }
    if (node->is_integer()) {
        return std::to_string(node->integer_value);
    }
    throw ConfigError("E_CONFIG_VALUE", "Expected string at config path " + join_path(path));
}

std::optional<bool> get_bool(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node || node->is_null()) {
        return std::nullopt;
    }
    if (node->is_boolean()) {
        return node->boolean_value;
    }
    if (node->is_string()) {
        std::string lowered = node->string_value;
        std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char ch) {
            return static_cast<char>(std::tolower(ch));
        });
        if (lowered == "true" || lowered == "yes" || lowered == "on") {
            return true;
        }
        if (lowered == "false" || lowered == "no" || lowered == "off") {
            return false;
        }
    }
    throw ConfigError("E_CONFIG_VALUE", "Expected boolean at config path " + join_path(path));
}

std::optional<std::int64_t> get_int64(const Value& root, const std::vector<std::string>& path) {
    const Value* node = find_path(root, path);
    if (!node || node->is_null()) {
        return std::nullopt;
    }
    if (node->is_integer()) {
        return node->integer_value;
    }
    if (node->is_double() && std::floor(node->double_value) == node->double_value) {
        return static_cast<std::int64_t>(node->double_value);
    }
    throw ConfigError("E_CONFIG_VALUE", "Expected integer at config path " + join_path(path));
}

std::optional<std::string> process_environment(const std::string& name) {
    const char* value = std::getenv(name.c_str());
    if (value == nullptr) {
        return std::nullopt;
    }
    return std::string(value);
}

void apply_document(const Value& document, Config& config) {
    const auto integer = [&](const std::vector<std::string>& path, auto& target, std::int64_t minimum,
                             std::int64_t maximum) {
        if (const auto value = get_int64(document, path)) {
            using Target = std::remove_reference_t<decltype(target)>;
            target = checked_integer<Target>(*value, minimum, maximum, join_path(path));
        }
    };
    const auto seconds = [&](const std::vector<std::string>& path, std::chrono::seconds& target) {
        if (const auto value = get_int64(document, path)) {
            target = std::chrono::seconds(checked_integer<std::int64_t>(*value, 0, kMaxSeconds, join_path(path)));
        }
    };
    const auto millis = [&](const std::vector<std::string>& path, std::chrono::milliseconds& target) {
        if (const auto value = get_int64(document, path)) {
            target = std::chrono::milliseconds(
                checked_integer<std::int64_t>(*value, 0, kMaxMilliseconds, join_path(path)));
        }
    };

    if (auto host = get_string(document, {"network", "bind_host"})) {
        config.bind_host = std::move(*host);
    }
    integer({"network", "control_port"}, config.control_port, 0, kMaxPort);
    integer({"network", "discovery_port"}, config.discovery_port, 0, kMaxPort);
    integer({"network", "chunk_size"}, config.chunk_size, 1, 16 * 1024 * 1024);

    seconds({"discovery", "beacon_interval_seconds"}, config.beacon_interval);
    seconds({"discovery", "peer_timeout_seconds"}, config.peer_timeout);
    millis({"discovery", "receive_timeout_ms"}, config.discovery_receive_timeout);

    integer({"server", "max_connections"}, config.max_connections, 1, 4096);
    integer({"server", "max_frame_bytes"}, config.max_frame_bytes, 64, 16 * 1024 * 1024);
    millis({"server", "accept_poll_ms"}, config.accept_poll_interval);
    seconds({"server", "io_timeout_seconds"}, config.connection_io_timeout);
    seconds({"server", "upload_confirm_timeout_seconds"}, config.upload_confirm_timeout);
    millis({"server", "file_lock_wait_ms"}, config.file_lock_wait);

    seconds({"client", "connect_timeout_seconds"}, config.client_connect_timeout);
    seconds({"client", "transfer_timeout_seconds"}, config.client_transfer_timeout);

    if (auto dir = get_string(document, {"storage", "shared_dir"})) {
        config.shared_directory = std::move(*dir);
    }
    if (auto dir = get_string(document, {"storage", "download_dir"})) {
        config.download_directory = std::move(*dir);
    }

    if (auto peer_id = get_string(document, {"identity", "peer_id"})) {
        config.peer_id = std::move(*peer_id);
    }
    if (auto hostname = get_string(document, {"identity", "hostname"})) {
        config.hostname = std::move(*hostname);
    }

    if (auto level = get_string(document, {"logging", "level"})) {
        config.log_level = std::move(*level);
    }
}

void apply_environment(Config& config, const EnvironmentLookup& lookup) {
    const auto integer = [&](const std::string& name, auto& target, std::int64_t minimum, std::int64_t maximum) {
        if (const auto text = lookup(name)) {
            using Target = std::remove_reference_t<decltype(target)>;
            target = checked_integer<Target>(parse_environment_integer(name, *text), minimum, maximum, name);
        }
    };
    const auto seconds = [&](const std::string& name, std::chrono::seconds& target) {
        if (const auto text = lookup(name)) {
            target = std::chrono::seconds(
                checked_integer<std::int64_t>(parse_environment_integer(name, *text), 0, kMaxSeconds, name));
        }
    };

    if (auto host = lookup("LANTERN_BIND_HOST")) {
        config.bind_host = std::move(*host);
    }
    integer("LANTERN_CONTROL_PORT", config.control_port, 0, kMaxPort);
    integer("LANTERN_DISCOVERY_PORT", config.discovery_port, 0, kMaxPort);
    integer("LANTERN_CHUNK_SIZE", config.chunk_size, 1, 16 * 1024 * 1024);
    integer("LANTERN_MAX_CONNECTIONS", config.max_connections, 1, 4096);
    seconds("LANTERN_BEACON_INTERVAL", config.beacon_interval);
    seconds("LANTERN_PEER_TIMEOUT", config.peer_timeout);
    seconds("LANTERN_UPLOAD_CONFIRM_TIMEOUT", config.upload_confirm_timeout);

    if (auto dir = lookup("LANTERN_SHARED_DIR")) {
        config.shared_directory = std::move(*dir);
    }
    if (auto dir = lookup("LANTERN_DOWNLOAD_DIR")) {
        config.download_directory = std::move(*dir);
    }
    if (auto hostname = lookup("LANTERN_HOSTNAME")) {
        config.hostname = std::move(*hostname);
    }
    if (auto level = lookup("LANTERN_LOG_LEVEL")) {
        config.log_level = std::move(*level);
    }
}

void validate(const Config& config) {
    if (config.max_connections == 0) {
        throw ConfigError("E_CONFIG_VALUE", "max_connections must be at least 1");
    }
    if (config.chunk_size == 0) {
        throw ConfigError("E_CONFIG_VALUE", "chunk_size must be at least 1");
    }
    if (config.beacon_interval.count() <= 0) {
        throw ConfigError("E_CONFIG_VALUE", "beacon interval must be positive");
    }
    if (config.peer_timeout < config.beacon_interval) {
        throw ConfigError("E_CONFIG_VALUE",
                          "peer timeout must not be shorter than the beacon interval",
                          "Peers would expire between two beacons");
    }
    if (config.shared_directory.empty()) {
        throw ConfigError("E_CONFIG_VALUE", "shared directory must not be empty");
    }
    if (config.peer_id.find(':') != std::string::npos || config.hostname.find(':') != std::string::npos) {
        throw ConfigError("E_CONFIG_VALUE", "peer id and hostname must not contain ':'",
                          "':' separates beacon fields");
    }
    if (!daemon::StructuredLogger::parse_level(config.log_level)) {
        throw ConfigError("E_CONFIG_VALUE", "Unknown log level: " + config.log_level,
                          "Use debug, info, warning or error");
    }
}

Config load(const std::optional<std::filesystem::path>& file, const EnvironmentLookup& lookup) {
    Config config;
    if (file) {
        apply_document(load_document(*file), config);
    }
    apply_environment(config, lookup);
    validate(config);
    return config;
}

}  // namespace lantern::config
