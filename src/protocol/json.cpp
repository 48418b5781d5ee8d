#include "scadhost/protocol/json.h"
#include <cctype>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <cstdlib>

namespace scadhost {
namespace protocol {

namespace {

// Nesting limit for untrusted input
constexpr int kMaxDepth = 256;

constexpr uint32_t kReplacementChar = 0xFFFD;

bool startsWithAt(const std::string& input, size_t pos, const char* literal) {
    return input.compare(pos, std::char_traits<char>::length(literal), literal) == 0;
}

void skipWhitespace(const std::string& input, size_t& pos) {
    while (pos < input.size() && std::isspace(static_cast<unsigned char>(input[pos]))) {
        pos++;
    }
}

void appendUtf8(std::string& out, uint32_t codePoint) {
    if (codePoint <= 0x7F) {
        out += static_cast<char>(codePoint);
    } else if (codePoint <= 0x7FF) {
        out += static_cast<char>(0xC0 | (codePoint >> 6));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else if (codePoint <= 0xFFFF) {
        out += static_cast<char>(0xE0 | (codePoint >> 12));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (codePoint >> 18));
        out += static_cast<char>(0x80 | ((codePoint >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((codePoint >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (codePoint & 0x3F));
    }
}

bool parseHex4(const std::string& input, size_t& pos, uint32_t& out) {
    if (pos + 4 > input.size()) {
        return false;
    }
    out = 0;
    for (int i = 0; i < 4; i++) {
        char hex = input[pos++];
        out <<= 4;
        if (hex >= '0' && hex <= '9') {
            out += hex - '0';
        } else if (hex >= 'a' && hex <= 'f') {
            out += hex - 'a' + 10;
        } else if (hex >= 'A' && hex <= 'F') {
            out += hex - 'A' + 10;
        } else {
            return false;
        }
    }
    return true;
}

bool parseString(const std::string& input, size_t& pos, std::string& out, std::string& error) {
    if (pos >= input.size() || input[pos] != '"') {
        error = "Expected string";
        return false;
    }
    pos++;
    std::string result;
    while (pos < input.size()) {
        char c = input[pos++];
        if (c == '"') {
            out = std::move(result);
            return true;
        }
        if (static_cast<unsigned char>(c) < 0x20) {
            error = "Control character in string";
            return false;
        }
        if (c != '\\') {
            result += c;
            continue;
        }
        if (pos >= input.size()) {
            error = "Invalid escape in string";
            return false;
        }
        char esc = input[pos++];
        switch (esc) {
            case '"': result += '"'; break;
            case '\\': result += '\\'; break;
            case '/': result += '/'; break;
            case 'b': result += '\b'; break;
            case 'f': result += '\f'; break;
            case 'n': result += '\n'; break;
            case 'r': result += '\r'; break;
            case 't': result += '\t'; break;
            case 'u': {
                uint32_t codePoint = 0;
                if (!parseHex4(input, pos, codePoint)) {
                    error = "Invalid unicode escape";
                    return false;
                }
                // Lone surrogates (JSON.stringify escapes them) become U+FFFD
                if (codePoint >= 0xD800 && codePoint <= 0xDBFF) {
                    uint32_t low = 0;
                    size_t next = pos + 2;
                    if (pos + 2 <= input.size() && input[pos] == '\\' && input[pos + 1] == 'u' &&
                        parseHex4(input, next, low) && low >= 0xDC00 && low <= 0xDFFF) {
                        pos = next;
                        codePoint = 0x10000 + ((codePoint - 0xD800) << 10) + (low - 0xDC00);
                    } else {
                        codePoint = kReplacementChar;
                    }
                } else if (codePoint >= 0xDC00 && codePoint <= 0xDFFF) {
                    codePoint = kReplacementChar;
                }
                appendUtf8(result, codePoint);
                break;
            }
            default:
                error = "Invalid escape in string";
                return false;
        }
    }
    error = "Unterminated string";
    return false;
}

bool parseValue(const std::string& input, size_t& pos, JsonValue& out, std::string& error, int depth);

bool parseObject(const std::string& input, size_t& pos, JsonValue& out, std::string& error, int depth) {
    pos++;  // '{'
    out = JsonValue::object();
    skipWhitespace(input, pos);
    if (pos < input.size() && input[pos] == '}') {
        pos++;
        return true;
    }
    while (pos < input.size()) {
        skipWhitespace(input, pos);
        std::string key;
        if (!parseString(input, pos, key, error)) {
            return false;
        }
        skipWhitespace(input, pos);
        if (pos >= input.size() || input[pos] != ':') {
            error = "Expected ':' in object";
            return false;
        }
        pos++;
        JsonValue value;
        if (!parseValue(input, pos, value, error, depth + 1)) {
            return false;
        }
        out.set(key, std::move(value));
        skipWhitespace(input, pos);
        if (pos >= input.size()) {
            error = "Unterminated object";
            return false;
        }
        if (input[pos] == '}') {
            pos++;
            return true;
        }
        if (input[pos] != ',') {
            error = "Expected ',' in object";
            return false;
        }
        pos++;
    }
    error = "Unterminated object";
    return false;
}

bool parseArray(const std::string& input, size_t& pos, JsonValue& out, std::string& error, int depth) {
    pos++;  // '['
    out = JsonValue::array();
    skipWhitespace(input, pos);
    if (pos < input.size() && input[pos] == ']') {
        pos++;
        return true;
    }
    while (pos < input.size()) {
        JsonValue value;
        if (!parseValue(input, pos, value, error, depth + 1)) {
            return false;
        }
        out.arrayVal.push_back(std::move(value));
        skipWhitespace(input, pos);
        if (pos >= input.size()) {
            error = "Unterminated array";
            return false;
        }
        if (input[pos] == ']') {
            pos++;
            return true;
        }
        if (input[pos] != ',') {
            error = "Expected ',' in array";
            return false;
        }
        pos++;
    }
    error = "Unterminated array";
    return false;
}

bool parseNumber(const std::string& input, size_t& pos, JsonValue& out, std::string& error) {
    size_t start = pos;
    if (input[pos] == '-') pos++;
    while (pos < input.size() && (std::isdigit(static_cast<unsigned char>(input[pos])) || input[pos] == '.' ||
                                  input[pos] == 'e' || input[pos] == 'E' || input[pos] == '+' || input[pos] == '-')) {
        pos++;
    }
    std::string numStr = input.substr(start, pos - start);
    char* end = nullptr;
    double value = std::strtod(numStr.c_str(), &end);
    if (numStr.empty() || end != numStr.c_str() + numStr.size()) {
        error = "Invalid number in JSON";
        return false;
    }
    out = JsonValue::number(value);
    return true;
}

bool parseValue(const std::string& input, size_t& pos, JsonValue& out, std::string& error, int depth) {
    if (depth > kMaxDepth) {
        error = "JSON nested too deeply";
        return false;
    }
    skipWhitespace(input, pos);
    if (pos >= input.size()) {
        error = "Unexpected end of JSON";
        return false;
    }

    char c = input[pos];
    if (c == '"') {
        out = JsonValue::string("");
        return parseString(input, pos, out.stringVal, error);
    }
    if (c == '{') {
        return parseObject(input, pos, out, error, depth);
    }
    if (c == '[') {
        return parseArray(input, pos, out, error, depth);
    }
    if (startsWithAt(input, pos, "true")) {
        out = JsonValue::boolean(true);
        pos += 4;
        return true;
    }
    if (startsWithAt(input, pos, "false")) {
        out = JsonValue::boolean(false);
        pos += 5;
        return true;
    }
    if (startsWithAt(input, pos, "null")) {
        out = JsonValue::null();
        pos += 4;
        return true;
    }
    if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) {
        return parseNumber(input, pos, out, error);
    }

    error = "Invalid JSON value";
    return false;
}

void writeValue(const JsonValue& value, std::string& out) {
    switch (value.type) {
        case JsonValue::Type::Null:
            out += "null";
            break;
        case JsonValue::Type::Bool:
            out += value.boolVal ? "true" : "false";
            break;
        case JsonValue::Type::Number: {
            if (!std::isfinite(value.numberVal)) {
                out += "null";
                break;
            }
            char buf[32];
            double integral = 0;
            if (std::modf(value.numberVal, &integral) == 0.0 && std::fabs(value.numberVal) < 1e15) {
                std::snprintf(buf, sizeof(buf), "%.0f", value.numberVal);
            } else {
                std::snprintf(buf, sizeof(buf), "%.17g", value.numberVal);
            }
            out += buf;
            break;
        }
        case JsonValue::Type::String:
            out += '"';
            out += escapeJson(value.stringVal);
            out += '"';
            break;
        case JsonValue::Type::Object: {
            out += '{';
            bool first = true;
            for (const auto& member : value.objectVal) {
                if (!first) out += ',';
                first = false;
                out += '"';
                out += escapeJson(member.first);
                out += "\":";
                writeValue(member.second, out);
            }
            out += '}';
            break;
        }
        case JsonValue::Type::Array: {
            out += '[';
            bool first = true;
            for (const auto& item : value.arrayVal) {
                if (!first) out += ',';
                first = false;
                writeValue(item, out);
            }
            out += ']';
            break;
        }
    }
}

} // anonymous namespace

JsonValue JsonValue::boolean(bool value) {
    JsonValue v;
    v.type = Type::Bool;
    v.boolVal = value;
    return v;
}

JsonValue JsonValue::number(double value) {
    JsonValue v;
    v.type = Type::Number;
    v.numberVal = value;
    return v;
}

JsonValue JsonValue::string(std::string value) {
    JsonValue v;
    v.type = Type::String;
    v.stringVal = std::move(value);
    return v;
}

JsonValue JsonValue::object() {
    JsonValue v;
    v.type = Type::Object;
    return v;
}

JsonValue JsonValue::array() {
    JsonValue v;
    v.type = Type::Array;
    return v;
}

const JsonValue* JsonValue::find(const std::string& key) const {
    if (type != Type::Object) {
        return nullptr;
    }
    for (const auto& member : objectVal) {
        if (member.first == key) {
            return &member.second;
        }
    }
    return nullptr;
}

JsonValue& JsonValue::set(const std::string& key, JsonValue value) {
    type = Type::Object;
    for (auto& member : objectVal) {
        if (member.first == key) {
            member.second = std::move(value);
            return member.second;
        }
    }
    objectVal.emplace_back(key, std::move(value));
    return objectVal.back().second;
}

JsonValue& JsonValue::push(JsonValue value) {
    type = Type::Array;
    arrayVal.push_back(std::move(value));
    return arrayVal.back();
}

bool parseJson(const std::string& input, JsonValue& out, std::string& error) {
    size_t pos = 0;
    if (!parseValue(input, pos, out, error, 0)) {
        return false;
    }
    skipWhitespace(input, pos);
    if (pos != input.size()) {
        error = "Trailing characters in JSON";
        return false;
    }
    return true;
}

std::string writeJson(const JsonValue& value) {
    std::string out;
    writeValue(value, out);
    return out;
}

std::string escapeJson(const std::string& str) {
    std::string result;
    result.reserve(str.size());
    for (char c : str) {
        switch (c) {
            case '"': result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b"; break;
            case '\f': result += "\\f"; break;
            case '\n': result += "\\n"; break;
            case '\r': result += "\\r"; break;
            case '\t': result += "\\t"; break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    result += buf;
                } else {
                    result += c;
                }
                break;
        }
    }
    return result;
}

} // namespace protocol
} // namespace scadhost
