#pragma once
#include <cstdint>
#include <random>
#include <chrono>
#include <string>
#include <cctype>

inline uint64_t now_ms() {
    using namespace std::chrono;
    return duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count();
}

inline uint64_t rand_u64() {
    static thread_local std::mt19937_64 rng{std::random_device{}()};
    return rng();
}

inline std::string trim(const std::string& s) {
    size_t a = 0, b = s.size();
    while (a < b && std::isspace(static_cast<unsigned char>(s[a]))) a++;
    while (b > a && std::isspace(static_cast<unsigned char>(s[b-1]))) b--;
    return s.substr(a, b-a);
}

inline std::string to_hex(const uint8_t* data, size_t len) {
    static const char kDigits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out.push_back(kDigits[data[i] >> 4]);
        out.push_back(kDigits[data[i] & 0x0F]);
    }
    return out;
}

// 16 hex chars of randomness, e.g. for relay-assigned peer ids.
inline std::string random_hex_id() {
    uint64_t v = rand_u64();
    uint8_t b[8];
    for (int i = 7; i >= 0; --i) {
        b[i] = static_cast<uint8_t>(v & 0xFF);
        v >>= 8;
    }
    return to_hex(b, sizeof(b));
}

// Last path component; strips both '/' and '\\' separators.
inline std::string base_name(const std::string& path) {
    auto pos = path.find_last_of("/\\");
    std::string out = (pos == std::string::npos) ? path : path.substr(pos + 1);
    if (out == "." || out == "..") return {};
    return out;
}

inline bool parse_bool(const std::string& s, bool& out) {
    if (s == "1" || s == "true" || s == "yes" || s == "on") { out = true; return true; }
    if (s == "0" || s == "false" || s == "no" || s == "off") { out = false; return true; }
    return false;
}
