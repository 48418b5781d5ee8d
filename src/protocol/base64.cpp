#include "scadhost/protocol/base64.h"

namespace scadhost {
namespace protocol {

namespace {

const char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";

int decodeChar(char c) {
    if (c >= 'A' && c <= 'Z') return c - 'A';
    if (c >= 'a' && c <= 'z') return c - 'a' + 26;
    if (c >= '0' && c <= '9') return c - '0' + 52;
    if (c == '+') return 62;
    if (c == '/') return 63;
    return -1;
}

} // anonymous namespace

std::string base64Encode(const uint8_t* data, size_t len) {
    std::string result;
    result.reserve((len + 2) / 3 * 4);

    for (size_t i = 0; i < len; i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < len) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < len) n |= data[i + 2];

        result += kAlphabet[(n >> 18) & 0x3F];
        result += kAlphabet[(n >> 12) & 0x3F];
        result += (i + 1 < len) ? kAlphabet[(n >> 6) & 0x3F] : '=';
        result += (i + 2 < len) ? kAlphabet[n & 0x3F] : '=';
    }
    return result;
}

bool base64Decode(const std::string& text, std::vector<uint8_t>& out, std::string& error) {
    size_t len = text.size();
    size_t padding = 0;
    while (len > 0 && text[len - 1] == '=' && padding < 2) {
        len--;
        padding++;
    }
    if (padding > 0 && text.size() % 4 != 0) {
        error = "Invalid base64 padding";
        return false;
    }
    if (len % 4 == 1) {
        error = "Invalid base64 length";
        return false;
    }

    std::vector<uint8_t> result;
    result.reserve(len / 4 * 3 + 2);

    uint32_t buffer = 0;
    int bits = 0;
    for (size_t i = 0; i < len; i++) {
        int value = decodeChar(text[i]);
        if (value < 0) {
            error = "Invalid base64 character at offset " + std::to_string(i);
            return false;
        }
        buffer = (buffer << 6) | static_cast<uint32_t>(value);
        bits += 6;
        if (bits >= 8) {
            bits -= 8;
            result.push_back(static_cast<uint8_t>((buffer >> bits) & 0xFF));
        }
    }

    out = std::move(result);
    return true;
}

} // namespace protocol
} // namespace scadhost
