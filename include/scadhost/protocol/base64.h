#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace scadhost {
namespace protocol {

std::string base64Encode(const uint8_t* data, size_t len);

inline std::string base64Encode(const std::vector<uint8_t>& data) {
    return base64Encode(data.data(), data.size());
}

/**
 * Decode standard (RFC 4648) base64. Padding is optional; whitespace and
 * characters outside the alphabet are rejected.
 */
bool base64Decode(const std::string& text, std::vector<uint8_t>& out, std::string& error);

} // namespace protocol
} // namespace scadhost
