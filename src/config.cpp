#include "config.hpp"

#include "util.hpp"

#include <fstream>
#include <stdexcept>

namespace {

size_t parse_size(const std::string& v) {
    if (!v.empty() && v[0] == '-') throw std::invalid_argument("negative value");
    return static_cast<size_t>(std::stoull(v, nullptr, 0));
}

uint32_t parse_u32(const std::string& v) {
    size_t n = parse_size(v);
    if (n > 0xFFFFFFFFull) throw std::out_of_range("value exceeds 32 bits");
    return static_cast<uint32_t>(n);
}

} // namespace

bool load_config(const std::string& path, Config& out, std::string& err) {
    std::ifstream in(path);
    if (!in.is_open()) {
        err = "failed to open config: " + path;
        return false;
    }

    std::string line;
    size_t lineno = 0;
    while (std::getline(in, line)) {
        ++lineno;
        line = trim(line);
        if (line.empty()) continue;
        if (line[0] == '#') continue;

        auto pos = line.find('=');
        if (pos == std::string::npos) {
            err = "bad config line " + std::to_string(lineno) + ": missing '='";
            return false;
        }
        std::string key = trim(line.substr(0, pos));
        std::string val = trim(line.substr(pos + 1));
        if (key.empty()) continue;

        auto bad_bool = [&]() {
            err = "bad config value at line " + std::to_string(lineno) + ": invalid bool";
            return false;
        };

        try {
            if (key == "bind_ip") out.bind_ip = val;
            else if (key == "port") {
                size_t p = parse_size(val);
                if (p == 0 || p > 65535) throw std::out_of_range("port out of range");
                out.port = static_cast<uint16_t>(p);
            }
            else if (key == "threads") out.threads = parse_size(val);

            else if (key == "max_rooms") out.max_rooms = parse_size(val);
            else if (key == "max_rooms_per_source") out.max_rooms_per_source = parse_size(val);
            else if (key == "max_peers_per_room") out.max_peers_per_room = parse_size(val);

            else if (key == "max_frame_bytes") out.max_frame_bytes = parse_size(val);
            else if (key == "max_outbound_frames") out.max_outbound_frames = parse_size(val);
            else if (key == "trust_proxy_headers") {
                if (!parse_bool(val, out.trust_proxy_headers)) return bad_bool();
            }
            else if (key == "default_encoding") {
                if (val != "binary" && val != "text") {
                    err = "bad config value at line " + std::to_string(lineno) +
                          ": default_encoding must be 'binary' or 'text'";
                    return false;
                }
                out.default_encoding = val;
            }
            else if (key == "session_log_file") out.session_log_file = val;

            else if (key == "log_file") out.log_file = val;
            else if (key == "log_level") out.log_level = val;
            else if (key == "log_stderr") {
                if (!parse_bool(val, out.log_stderr)) return bad_bool();
            }

            else if (key == "server_url") out.server_url = val;

            else if (key == "chunk_size") {
                size_t n = parse_size(val);
                if (n == 0) throw std::out_of_range("chunk_size must be positive");
                out.transfer.chunk_size = n;
            }
            else if (key == "ack_timeout_ms") out.transfer.ack_timeout_ms = parse_u32(val);
            else if (key == "max_retries") out.transfer.max_retries = parse_u32(val);
            else if (key == "idle_timeout_ms") out.transfer.idle_timeout_ms = parse_u32(val);
            else if (key == "sweep_interval_ms") {
                uint32_t n = parse_u32(val);
                if (n == 0) throw std::out_of_range("sweep_interval_ms must be positive");
                out.transfer.sweep_interval_ms = n;
            }
            else if (key == "chunk_pace_ms") out.transfer.chunk_pace_ms = parse_u32(val);
            else if (key == "max_in_flight") {
                uint32_t n = parse_u32(val);
                if (n == 0) throw std::out_of_range("max_in_flight must be positive");
                out.transfer.max_in_flight = n;
            }
            else if (key == "key_derivation") {
                if (val == "raw") out.transfer.key_derivation = relaycp::KeyDerivation::RAW;
                else if (val == "hkdf") out.transfer.key_derivation = relaycp::KeyDerivation::HKDF_SHA256;
                else {
                    err = "bad config value at line " + std::to_string(lineno) +
                          ": key_derivation must be 'raw' or 'hkdf'";
                    return false;
                }
            }
            else {
                err = "unknown config key at line " + std::to_string(lineno) + ": " + key;
                return false;
            }
        } catch (const std::exception& e) {
            err = "bad config value at line " + std::to_string(lineno) + ": " + e.what();
            return false;
        }
    }

    return true;
}
