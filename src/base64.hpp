#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace b64 {

// Standard (RFC 4648, padded) base64 via OpenSSL.
std::string encode(const std::vector<uint8_t>& data);
std::string encode(const std::string& data);

// Throws std::runtime_error on malformed input (bad length or alphabet).
std::vector<uint8_t> decode(const std::string& s);

} // namespace b64
