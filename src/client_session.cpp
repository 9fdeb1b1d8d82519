#include "client_session.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>

namespace net = boost::asio;
namespace beast = boost::beast;
namespace websocket = beast::websocket;

namespace relaycp {

bool parse_ws_url(const std::string& url, WsUrl& out, std::string& err) {
    std::string lower = url;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower.rfind("wss://", 0) == 0) {
        err = "wss:// is not supported, use ws:// (terminate TLS in front of the relay)";
        return false;
    }
    if (lower.rfind("ws://", 0) != 0) {
        err = "server url must start with ws://";
        return false;
    }

    std::string rest = url.substr(5);
    auto slash = rest.find('/');
    std::string authority = slash == std::string::npos ? rest : rest.substr(0, slash);
    WsUrl u;
    u.target = slash == std::string::npos ? "/" : rest.substr(slash);

    std::string port;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string::npos) {
            err = "unterminated IPv6 host in " + url;
            return false;
        }
        u.host = authority.substr(1, close - 1);
        std::string tail = authority.substr(close + 1);
        if (!tail.empty()) {
            if (tail.front() != ':') {
                err = "bad authority in " + url;
                return false;
            }
            port = tail.substr(1);
        }
    } else {
        auto colon = authority.find(':');
        u.host = authority.substr(0, colon);
        if (colon != std::string::npos) port = authority.substr(colon + 1);
    }

    if (u.host.empty()) {
        err = "missing host in " + url;
        return false;
    }
    if (!port.empty()) {
        if (port.size() > 5 || !std::all_of(port.begin(), port.end(),
                                            [](unsigned char c) { return std::isdigit(c) != 0; })) {
            err = "bad port in " + url;
            return false;
        }
        unsigned long v = std::stoul(port);
        if (v == 0 || v > 65535) {
            err = "port out of range in " + url;
            return false;
        }
        u.port = port;
    }

    out = u;
    return true;
}

ClientSession::ClientSession(net::io_context& io,
                             WsUrl url,
                             ClientOptions opts,
                             Console& console,
                             Logger& logger)
    : io_(io),
      url_(std::move(url)),
      opts_(std::move(opts)),
      console_(console),
      logger_(logger),
      resolver_(io),
      ws_(io) {}

void ClientSession::start() {
    logger_.info("connecting to ws://" + url_.host + ":" + url_.port + url_.target);
    resolver_.async_resolve(url_.host, url_.port,
                            beast::bind_front_handler(&ClientSession::on_resolve, shared_from_this()));
}

void ClientSession::on_resolve(beast::error_code ec, tcp::resolver::results_type results) {
    if (ec) return fail("resolve " + url_.host, ec);

    beast::get_lowest_layer(ws_).expires_after(std::chrono::seconds(30));
    beast::get_lowest_layer(ws_).async_connect(
        results, beast::bind_front_handler(&ClientSession::on_connect, shared_from_this()));
}

void ClientSession::on_connect(beast::error_code ec, tcp::resolver::results_type::endpoint_type ep) {
    if (ec) return fail("connect", ec);

    beast::get_lowest_layer(ws_).expires_never();
    ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
    ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "relaycp");
    }));

    const std::string host = url_.host.find(':') != std::string::npos
        ? "[" + url_.host + "]:" + std::to_string(ep.port())
        : url_.host + ":" + std::to_string(ep.port());
    ws_.async_handshake(host, url_.target,
                        beast::bind_front_handler(&ClientSession::on_handshake, shared_from_this()));
}

void ClientSession::on_handshake(beast::error_code ec) {
    if (ec) return fail("websocket handshake", ec);
    open_ = true;
    ws_.binary(true);
    logger_.info("connected to relay");

    std::weak_ptr<ClientSession> weak = shared_from_this();
    client_ = std::make_shared<TransferClient>(
        io_.get_executor(), opts_, console_, logger_,
        [weak](const proto::Message& m, WrittenFn written) {
            if (auto self = weak.lock()) self->send(m, std::move(written));
        },
        [weak](int code) {
            if (auto self = weak.lock()) self->on_client_exit(code);
        });
    client_->start();

    do_read();
}

void ClientSession::do_read() {
    ws_.async_read(buffer_, beast::bind_front_handler(&ClientSession::on_read, shared_from_this()));
}

void ClientSession::on_read(beast::error_code ec, std::size_t) {
    if (ec) {
        open_ = false;
        queue_.clear();
        if (ec == websocket::error::closed || closing_) {
            logger_.debug("relay connection closed");
        } else {
            logger_.warn("relay read failed: " + ec.message());
        }
        if (client_) client_->on_disconnected(ec.message());
        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);
        closed();
        return;
    }

    const auto data = buffer_.data();
    const auto* p = static_cast<const uint8_t*>(data.data());
    tlv::Bytes frame(p, p + data.size());
    buffer_.consume(buffer_.size());

    auto decoded = proto::decode_frame(frame);
    if (!decoded) {
        logger_.warn("undecodable frame from relay (" + std::to_string(frame.size()) + " bytes)");
    } else {
        try {
            client_->on_message(decoded->msg);
        } catch (const std::exception& e) {
            logger_.error("handling " + decoded->msg.type_name() + " failed: " + e.what());
        }
    }
    do_read();
}

void ClientSession::send(const proto::Message& m, WrittenFn written) {
    if (!open_ || closing_) return;
    try {
        queue_.push_back(Outgoing{proto::encode(m), std::move(written)});
    } catch (const std::exception& e) {
        logger_.warn("cannot encode " + m.type_name() + ": " + e.what());
        return;
    }
    if (!writing_) do_write();
}

void ClientSession::do_write() {
    writing_ = true;
    ws_.async_write(net::buffer(queue_.front().frame),
                    beast::bind_front_handler(&ClientSession::on_write, shared_from_this()));
}

void ClientSession::on_write(beast::error_code ec, std::size_t) {
    writing_ = false;
    if (ec) {
        logger_.warn("relay write failed: " + ec.message());
        open_ = false;
        queue_.clear();
        beast::error_code ignored;
        beast::get_lowest_layer(ws_).socket().close(ignored);
        return;
    }
    WrittenFn written;
    if (!queue_.empty()) {
        written = std::move(queue_.front().written);
        queue_.pop_front();
    }
    if (!queue_.empty()) {
        do_write();
    } else if (closing_) {
        do_close();
    }
    if (written) written();
}

void ClientSession::interrupt() {
    if (interrupted_) return;
    interrupted_ = true;
    exit_code_ = 130;
    if (client_ && !client_->done()) {
        client_->interrupt();
        return;
    }
    if (!client_) console_.warn("interrupted");
    // Still resolving or connecting, or already closing: drop the socket.
    resolver_.cancel();
    beast::error_code ignored;
    beast::get_lowest_layer(ws_).socket().close(ignored);
}

void ClientSession::on_client_exit(int code) {
    exit_code_ = code;
    if (closing_) return;
    closing_ = true;
    if (!writing_) do_close();
}

void ClientSession::do_close() {
    if (!open_) return;
    open_ = false;
    ws_.async_close(websocket::close_code::normal, [self = shared_from_this()](beast::error_code ec) {
        if (!ec) return;
        self->logger_.debug("close handshake failed: " + ec.message());
        beast::error_code ignored;
        beast::get_lowest_layer(self->ws_).socket().close(ignored);
    });
}

void ClientSession::fail(const std::string& what, beast::error_code ec) {
    if (interrupted_) {
        logger_.debug(what + " abandoned: " + ec.message());
        closed();
        return;
    }
    console_.warn(what + " failed: " + ec.message());
    logger_.error(what + " failed: " + ec.message());
    exit_code_ = 1;
    closed();
}

void ClientSession::closed() {
    if (!on_closed_) return;
    auto fn = std::move(on_closed_);
    on_closed_ = nullptr;
    fn();
}

} // namespace relaycp
