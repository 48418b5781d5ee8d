#pragma once

/**
 * Minimal JSON value, parser and writer for the worker channel.
 *
 * Object members keep their insertion order so frames written by the host
 * are stable and readable in logs.
 */

#include <string>
#include <utility>
#include <vector>

namespace scadhost {
namespace protocol {

struct JsonValue {
    enum class Type {
        Null,
        Bool,
        Number,
        String,
        Object,
        Array
    };
    Type type = Type::Null;
    bool boolVal = false;
    double numberVal = 0.0;
    std::string stringVal;
    std::vector<std::pair<std::string, JsonValue>> objectVal;
    std::vector<JsonValue> arrayVal;

    static JsonValue null() { return JsonValue(); }
    static JsonValue boolean(bool value);
    static JsonValue number(double value);
    static JsonValue string(std::string value);
    static JsonValue object();
    static JsonValue array();

    bool isNull() const { return type == Type::Null; }
    bool isBool() const { return type == Type::Bool; }
    bool isNumber() const { return type == Type::Number; }
    bool isString() const { return type == Type::String; }
    bool isObject() const { return type == Type::Object; }
    bool isArray() const { return type == Type::Array; }

    /**
     * Look up an object member. Returns nullptr if this is not an object
     * or the key is absent.
     */
    const JsonValue* find(const std::string& key) const;
    bool has(const std::string& key) const { return find(key) != nullptr; }

    /**
     * Set an object member, replacing an existing one with the same key.
     */
    JsonValue& set(const std::string& key, JsonValue value);

    /**
     * Append to an array.
     */
    JsonValue& push(JsonValue value);
};

/**
 * Parse a complete JSON document.
 * @return false with a message in error on malformed input
 */
bool parseJson(const std::string& input, JsonValue& out, std::string& error);

/**
 * Serialize to compact JSON (no whitespace, no trailing newline).
 */
std::string writeJson(const JsonValue& value);

/**
 * Escape a string for embedding between JSON double quotes.
 */
std::string escapeJson(const std::string& str);

} // namespace protocol
} // namespace scadhost
