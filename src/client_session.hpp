#pragma once

#include <boost/asio.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <deque>
#include <functional>
#include <memory>
#include <string>

#include "console.hpp"
#include "logger.hpp"
#include "protocol.hpp"
#include "transfer_client.hpp"

namespace relaycp {

struct WsUrl {
    std::string host;
    std::string port = "80";
    std::string target = "/";
};

// Accepts ws://host[:port][/path]. IPv6 hosts go in brackets.
bool parse_ws_url(const std::string& url, WsUrl& out, std::string& err);

// WebSocket transport for one TransferClient. Runs on a single-threaded
// io_context; every frame it sends is binary.
class ClientSession : public std::enable_shared_from_this<ClientSession> {
public:
    using tcp = boost::asio::ip::tcp;

    ClientSession(boost::asio::io_context& io,
                  WsUrl url,
                  ClientOptions opts,
                  Console& console,
                  Logger& logger);

    void start();
    // SIGINT/SIGTERM: lets the transfer clean up and exit with 130, or
    // abandons a connection that is not up yet.
    void interrupt();
    // Runs once the connection is gone for good.
    void set_on_closed(std::function<void()> fn) { on_closed_ = std::move(fn); }

    // 1 until the transfer reports otherwise, 130 once interrupted.
    int exit_code() const { return exit_code_; }

private:
    void on_resolve(boost::beast::error_code ec, tcp::resolver::results_type results);
    void on_connect(boost::beast::error_code ec, tcp::resolver::results_type::endpoint_type ep);
    void on_handshake(boost::beast::error_code ec);
    void do_read();
    void on_read(boost::beast::error_code ec, std::size_t);

    void send(const proto::Message& m, WrittenFn written);
    void do_write();
    void on_write(boost::beast::error_code ec, std::size_t);
    void on_client_exit(int code);
    void do_close();
    void fail(const std::string& what, boost::beast::error_code ec);
    void closed();

    boost::asio::io_context& io_;
    WsUrl url_;
    ClientOptions opts_;
    Console& console_;
    Logger& logger_;

    tcp::resolver resolver_;
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    boost::beast::flat_buffer buffer_;

    std::function<void()> on_closed_;
    std::shared_ptr<TransferClient> client_;
    struct Outgoing {
        tlv::Bytes frame;
        WrittenFn written;
    };
    std::deque<Outgoing> queue_;
    bool open_ = false;
    bool interrupted_ = false;
    bool writing_ = false;
    bool closing_ = false;
    int exit_code_ = 1;
};

} // namespace relaycp
