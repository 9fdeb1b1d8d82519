#pragma once

#include <boost/asio.hpp>

#include <cstddef>
#include <cstdint>
#include <string>

#include "logger.hpp"
#include "protocol.hpp"
#include "room_registry.hpp"
#include "session_journal.hpp"

// Relay listener: plain HTTP for /health, WebSocket upgrade on /ws. Every
// accepted connection runs on its own strand.
class IoLayer {
public:
    using tcp = boost::asio::ip::tcp;

    struct Options {
        size_t max_frame_bytes = 8 * 1024 * 1024;
        size_t max_outbound_frames = 1024;
        bool trust_proxy_headers = false;
        proto::Encoding default_encoding = proto::Encoding::BINARY;
    };

    // Shared by all sessions; owned by the IoLayer.
    struct Context {
        relaycp::RoomRegistry& registry;
        relaycp::SessionJournal* journal;
        Logger& logger;
        Options opts;
    };

    IoLayer(boost::asio::io_context& io,
            relaycp::RoomRegistry& registry,
            relaycp::SessionJournal* journal,
            Logger& logger,
            Options opts);

    bool start(const std::string& bind_ip, uint16_t port);
    void stop();

    tcp::endpoint local_endpoint() const;

private:
    void do_accept();

    boost::asio::io_context& io_;
    Context ctx_;
    tcp::acceptor acceptor_;
};

// Address used for per-source accounting. With trust_proxy_headers the
// first X-Forwarded-For entry wins, then X-Real-IP, then the TCP peer.
// A ":port" suffix on an IPv4 form (and brackets around IPv6) is removed.
std::string resolve_source_address(const std::string& remote,
                                   const std::string& forwarded_for,
                                   const std::string& real_ip,
                                   bool trust_proxy_headers);
