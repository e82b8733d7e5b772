#pragma once

#include "lantern/Config.hpp"

#include <cstdint>
#include <exception>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace lantern::config {

enum class ValueType {
    Null,
    Boolean,
    Integer,
    Double,
    String,
    Object,
    Array
};

// Parsed configuration / metadata document node.
struct Value {
    ValueType type{ValueType::Null};
    bool boolean_value{false};
    std::int64_t integer_value{0};
    double double_value{0.0};
    std::string string_value;
    std::map<std::string, Value> object_value;
    std::vector<Value> array_value;

    Value() = default;
    explicit Value(bool value) : type(ValueType::Boolean), boolean_value(value) {}
    explicit Value(std::int64_t value) : type(ValueType::Integer), integer_value(value) {}
    explicit Value(double value) : type(ValueType::Double), double_value(value) {}
    explicit Value(std::string value) : type(ValueType::String), string_value(std::move(value)) {}

    static Value make_object();
    static Value make_array();

    bool is_null() const { return type == ValueType::Null; }
    bool is_boolean() const { return type == ValueType::Boolean; }
    bool is_integer() const { return type == ValueType::Integer; }
    bool is_double() const { return type == ValueType::Double; }
    bool is_string() const { return type == ValueType::String; }
    bool is_object() const { return type == ValueType::Object; }
    bool is_array() const { return type == ValueType::Array; }

    std::map<std::string, Value>& ensure_object();
    const std::map<std::string, Value>& as_object() const;
    const std::vector<Value>& as_array() const;
};

struct ConfigError : public std::exception {
    std::string code;
    std::string message;
    std::string hint;
    std::string formatted;

    ConfigError(std::string c, std::string m, std::string h = {});

    const char* what() const noexcept override { return formatted.c_str(); }
};

Value parse_json(const std::string& text);
// Block mappings indented by two spaces, scalars, '#' comments.
Value parse_yaml(const std::string& text);
// JSON when the file ends in .json or starts with '{', YAML otherwise.
Value load_document(const std::filesystem::path& path);

const Value* find_path(const Value& root, const std::vector<std::string>& path);
std::optional<std::string> get_string(const Value& root, const std::vector<std::string>& path);
std::optional<bool> get_bool(const Value& root, const std::vector<std::string>& path);
std::optional<std::int64_t> get_int64(const Value& root, const std::vector<std::string>& path);

using EnvironmentLookup = std::function<std::optional<std::string>(const std::string& name)>;

std::optional<std::string> process_environment(const std::string& name);

void apply_document(const Value& document, Config& config);
void apply_environment(Config& config, const EnvironmentLookup& lookup = process_environment);

// Throws ConfigError{E_CONFIG_VALUE} for values the peer cannot run with.
void validate(const Config& config);

// Defaults, then the optional file, then the environment. Validated.
Config load(const std::optional<std::filesystem::path>& file,
            const EnvironmentLookup& lookup = process_environment);

}  // namespace lantern::config
