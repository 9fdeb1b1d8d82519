#include "io_layer.hpp"

#include "connection_handler.hpp"
#include "util.hpp"

#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/websocket.hpp>

#include <algorithm>
#include <chrono>
#include <deque>
#include <memory>
#include <utility>

namespace net = boost::asio;
namespace beast = boost::beast;
namespace http = beast::http;
namespace websocket = beast::websocket;
using tcp = net::ip::tcp;

namespace {

std::string sv_str(beast::string_view sv) {
    return std::string(sv.data(), sv.size());
}

std::string strip_port(std::string s) {
    if (s.empty()) return s;
    if (s.front() == '[') {
        auto close = s.find(']');
        if (close != std::string::npos) return s.substr(1, close - 1);
        return s;
    }
    if (std::count(s.begin(), s.end(), ':') == 1) {
        auto pos = s.find(':');
        if (pos > 0) s.erase(pos);
    }
    return s;
}

class WsSession : public relaycp::PeerLink,
                  public std::enable_shared_from_this<WsSession> {
public:
    WsSession(tcp::socket&& socket, IoLayer::Context& ctx, std::string source)
        : ws_(std::move(socket)), ctx_(ctx), source_(std::move(source)) {}

    void run(http::request<http::string_body> req) {
        handler_ = std::make_unique<relaycp::ConnectionHandler>(
            ctx_.registry, ctx_.journal, ctx_.logger, source_,
            shared_from_this(), ctx_.opts.default_encoding);

        ws_.set_option(websocket::stream_base::timeout::suggested(beast::role_type::server));
        ws_.read_message_max(ctx_.opts.max_frame_bytes);
        ws_.async_accept(req, beast::bind_front_handler(&WsSession::on_accept, shared_from_this()));
    }

    // Called from any thread, possibly under a room lock.
    void deliver(const std::shared_ptr<const proto::Message>& msg) override {
        net::post(ws_.get_executor(), [self = shared_from_this(), msg]() { self->enqueue(*msg); });
    }

    void close() override {
        net::post(ws_.get_executor(), [self = shared_from_this()]() {
            if (self->finished_ || self->closing_) return;
            self->closing_ = true;
            if (!self->writing_) self->do_close();
        });
    }

private:
    struct OutFrame {
        tlv::Bytes bytes;
        bool text = false;
    };

    void on_accept(beast::error_code ec) {
        if (ec) {
            ctx_.logger.debug("websocket accept failed from " + source_ + ": " + ec.message());
            finish();
            return;
        }
        accepted_ = true;
        if (!queue_.empty() && !writing_) do_write();
        do_read();
    }

    void do_read() {
        ws_.async_read(buffer_, beast::bind_front_handler(&WsSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec != websocket::error::closed && ec != net::error::operation_aborted) {
                ctx_.logger.debug("read ended for " + source_ + ": " + ec.message());
            }
            finish();
            return;
        }

        const auto data = buffer_.data();
        const auto* p = static_cast<const uint8_t*>(data.data());
        tlv::Bytes frame(p, p + data.size());
        buffer_.consume(buffer_.size());

        try {
            handler_->on_frame(frame);
        } catch (const std::exception& e) {
            ctx_.logger.warn("frame handling failed for " + handler_->peer_id() + ": " + e.what());
        }
        do_read();
    }

    void enqueue(const proto::Message& msg) {
        if (finished_ || closing_ || !handler_) return;
        if (queue_.size() >= ctx_.opts.max_outbound_frames) {
            ctx_.logger.warn("outbound queue full for " + handler_->peer_id() + ", closing slow session");
            abort();
            return;
        }

        OutFrame f;
        try {
            f.text = handler_->encoding() == proto::Encoding::TEXT;
            f.bytes = proto::encode_frame(msg, handler_->encoding());
        } catch (const std::exception& e) {
            ctx_.logger.warn("dropping " + msg.type_name() + " for " + handler_->peer_id() + ": " + e.what());
            return;
        }
        queue_.push_back(std::move(f));
        if (accepted_ && !writing_) do_write();
    }

    void do_write() {
        writing_ = true;
        ws_.text(queue_.front().text);
        ws_.async_write(net::buffer(queue_.front().bytes),
                        beast::bind_front_handler(&WsSession::on_write, shared_from_this()));
    }

    void on_write(beast::error_code ec, std::size_t) {
        writing_ = false;
        if (ec) {
            ctx_.logger.debug("write failed for " + source_ + ": " + ec.message());
            abort();
            return;
        }
        if (!queue_.empty()) queue_.pop_front();
        if (!queue_.empty()) {
            do_write();
        } else if (closing_) {
            do_close();
        }
    }

    void do_close() {
        ws_.async_close(websocket::close_code::normal,
                        [self = shared_from_this()](beast::error_code ec) {
            if (ec) self->abort();
        });
    }

    // Hard stop; the pending read fails and runs finish().
    void abort() {
        queue_.clear();
        beast::error_code ec;
        beast::get_lowest_layer(ws_).socket().close(ec);
    }

    void finish() {
        if (finished_) return;
        finished_ = true;
        queue_.clear();
        if (handler_) {
            handler_->on_close();
            handler_.reset();
        }
        beast::error_code ec;
        beast::get_lowest_layer(ws_).socket().close(ec);
    }

    websocket::stream<beast::tcp_stream> ws_;
    IoLayer::Context& ctx_;
    const std::string source_;
    beast::flat_buffer buffer_;

    std::unique_ptr<relaycp::ConnectionHandler> handler_;
    std::deque<OutFrame> queue_;
    bool accepted_ = false;
    bool writing_ = false;
    bool closing_ = false;
    bool finished_ = false;
};

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket&& socket, IoLayer::Context& ctx)
        : stream_(std::move(socket)), ctx_(ctx) {}

    void run() {
        net::dispatch(stream_.get_executor(),
                      beast::bind_front_handler(&HttpSession::do_read, shared_from_this()));
    }

private:
    void do_read() {
        stream_.expires_after(std::chrono::seconds(30));
        http::async_read(stream_, buffer_, req_,
                         beast::bind_front_handler(&HttpSession::on_read, shared_from_this()));
    }

    void on_read(beast::error_code ec, std::size_t) {
        if (ec) {
            if (ec != http::error::end_of_stream) {
                ctx_.logger.debug(std::string("http read failed: ") + ec.message());
            }
            beast::error_code ignored;
            stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
            return;
        }

        std::string target = sv_str(req_.target());
        auto q = target.find('?');
        if (q != std::string::npos) target.erase(q);

        if (websocket::is_upgrade(req_) && target == "/ws") {
            std::string remote;
            beast::error_code rec;
            auto ep = stream_.socket().remote_endpoint(rec);
            if (!rec) remote = ep.address().to_string();

            std::string source = resolve_source_address(
                remote,
                sv_str(req_["X-Forwarded-For"]),
                sv_str(req_["X-Real-IP"]),
                ctx_.opts.trust_proxy_headers);

            stream_.expires_never();
            std::make_shared<WsSession>(stream_.release_socket(), ctx_, std::move(source))
                ->run(std::move(req_));
            return;
        }

        if (req_.method() == http::verb::get && target == "/health") {
            respond(http::status::ok, "application/json", "{\"status\":\"ok\"}");
        } else {
            respond(http::status::not_found, "text/plain", "not found\n");
        }
    }

    void respond(http::status status, const char* content_type, std::string body) {
        auto res = std::make_shared<http::response<http::string_body>>(status, req_.version());
        res->set(http::field::server, "relaycp");
        res->set(http::field::content_type, content_type);
        res->keep_alive(false);
        res->body() = std::move(body);
        res->prepare_payload();

        http::async_write(stream_, *res,
                          [self = shared_from_this(), res](beast::error_code ec, std::size_t) {
            beast::error_code ignored;
            self->stream_.socket().shutdown(tcp::socket::shutdown_send, ignored);
            if (ec) self->ctx_.logger.debug(std::string("http write failed: ") + ec.message());
        });
    }

    beast::tcp_stream stream_;
    IoLayer::Context& ctx_;
    beast::flat_buffer buffer_;
    http::request<http::string_body> req_;
};

} // namespace

std::string resolve_source_address(const std::string& remote,
                                   const std::string& forwarded_for,
                                   const std::string& real_ip,
                                   bool trust_proxy_headers) {
    std::string addr = remote;
    if (trust_proxy_headers) {
        std::string xff = trim(forwarded_for);
        std::string xri = trim(real_ip);
        if (!xff.empty()) {
            auto comma = xff.find(',');
            addr = trim(comma == std::string::npos ? xff : xff.substr(0, comma));
        } else if (!xri.empty()) {
            addr = xri;
        }
    }
    return strip_port(addr);
}

IoLayer::IoLayer(boost::asio::io_context& io,
                 relaycp::RoomRegistry& registry,
                 relaycp::SessionJournal* journal,
                 Logger& logger,
                 Options opts)
    : io_(io),
      ctx_{registry, journal, logger, opts},
      acceptor_(net::make_strand(io_)) {}

bool IoLayer::start(const std::string& bind_ip, uint16_t port) {
    boost::system::error_code ec;

    auto addr = net::ip::make_address(bind_ip, ec);
    if (ec) {
        ctx_.logger.error("invalid bind address: " + bind_ip);
        return false;
    }
    tcp::endpoint ep(addr, port);

    acceptor_.open(ep.protocol(), ec);
    if (ec) {
        ctx_.logger.error("failed to open listener: " + ec.message());
        return false;
    }
    acceptor_.set_option(net::socket_base::reuse_address(true), ec);
    if (ec) {
        ctx_.logger.error("failed to set reuse_address: " + ec.message());
        return false;
    }
    acceptor_.bind(ep, ec);
    if (ec) {
        ctx_.logger.error("failed to bind listener: " + ec.message() +
                          " (addr=" + bind_ip + ":" + std::to_string(port) + ")");
        return false;
    }
    acceptor_.listen(net::socket_base::max_listen_connections, ec);
    if (ec) {
        ctx_.logger.error("failed to listen: " + ec.message());
        return false;
    }

    do_accept();
    return true;
}

void IoLayer::stop() {
    net::post(acceptor_.get_executor(), [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
    });
}

IoLayer::tcp::endpoint IoLayer::local_endpoint() const {
    boost::system::error_code ec;
    auto ep = acceptor_.local_endpoint(ec);
    return ec ? tcp::endpoint{} : ep;
}

void IoLayer::do_accept() {
    acceptor_.async_accept(net::make_strand(io_), [this](boost::system::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec != net::error::operation_aborted) {
                ctx_.logger.warn(std::string("accept failed: ") + ec.message());
                do_accept();
            }
            return;
        }
        std::make_shared<HttpSession>(std::move(socket), ctx_)->run();
        do_accept();
    });
}
