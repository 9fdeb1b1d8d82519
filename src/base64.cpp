#include "base64.hpp"

#include <openssl/evp.h>

#include <limits>
#include <stdexcept>

namespace b64 {

namespace {

std::string encode_raw(const unsigned char* data, size_t len) {
    if (len == 0) return {};
    if (len > static_cast<size_t>(std::numeric_limits<int>::max() / 4 * 3)) {
        throw std::runtime_error("base64: input too large");
    }
    std::string out;
    out.resize(4 * ((len + 2) / 3));
    int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(len));
    if (n < 0) throw std::runtime_error("EVP_EncodeBlock failed");
    out.resize(static_cast<size_t>(n));
    return out;
}

} // namespace

std::string encode(const std::vector<uint8_t>& data) {
    return encode_raw(data.data(), data.size());
}

std::string encode(const std::string& data) {
    return encode_raw(reinterpret_cast<const unsigned char*>(data.data()), data.size());
}

std::vector<uint8_t> decode(const std::string& s) {
    if (s.empty()) return {};
    if (s.size() % 4 != 0) throw std::runtime_error("base64: length not a multiple of 4");
    if (s.size() > static_cast<size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error("base64: input too large");
    }

    std::vector<uint8_t> out(3 * (s.size() / 4));
    int n = EVP_DecodeBlock(out.data(),
                            reinterpret_cast<const unsigned char*>(s.data()),
                            static_cast<int>(s.size()));
    if (n < 0) throw std::runtime_error("base64: invalid character");

    // EVP_DecodeBlock counts '=' padding as zero bytes.
    size_t pad = 0;
    if (s.back() == '=') pad++;
    if (s[s.size()-2] == '=') pad++;
    out.resize(static_cast<size_t>(n) - pad);
    return out;
}

} // namespace b64
