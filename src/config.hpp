#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include "transfer_params.hpp"

struct Config {
    // Listener
    std::string bind_ip = "0.0.0.0";
    uint16_t port = 3001;
    size_t threads = 0; // 0 = hardware concurrency

    // Capacity (0 disables the corresponding limit)
    size_t max_rooms = 10;
    size_t max_rooms_per_source = 2;
    size_t max_peers_per_room = 2;

    // Per-connection limits
    size_t max_frame_bytes = 8 * 1024 * 1024;
    size_t max_outbound_frames = 1024;
    bool trust_proxy_headers = false;

    // "binary" or "text"; used for a peer until its first decoded frame
    std::string default_encoding = "binary";

    // Session journal (empty disables)
    std::string session_log_file;

    // Logging
    std::string log_file = "relaycp.log";
    std::string log_level = "info";
    bool log_stderr = false;

    // Client
    std::string server_url = "ws://127.0.0.1:3001/ws";

    // Reliable chunk transport
    relaycp::TransferParams transfer;
};

bool load_config(const std::string& path, Config& out, std::string& err);
