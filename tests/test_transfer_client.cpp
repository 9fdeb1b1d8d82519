#include <gtest/gtest.h>

#include "client_session.hpp"
#include "connection_handler.hpp"
#include "console.hpp"
#include "logger.hpp"
#include "room_registry.hpp"
#include "transfer_client.hpp"
#include "util.hpp"

#include <boost/asio.hpp>

#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <random>
#include <vector>

namespace fs = std::filesystem;
using namespace relaycp;

namespace {

// Relay side of one client, running on the test's io_context. Everything
// crosses the binary codec so the path matches a real connection.
class LoopbackLink : public PeerLink {
public:
    explicit LoopbackLink(boost::asio::io_context& io) : io_(io) {}

    void attach(std::weak_ptr<TransferClient> c) { client_ = std::move(c); }

    void deliver(const std::shared_ptr<const proto::Message>& msg) override {
        tlv::Bytes frame = proto::encode(*msg);
        std::weak_ptr<TransferClient> weak = client_;
        boost::asio::post(io_, [weak, frame]() {
            auto c = weak.lock();
            if (!c) return;
            auto d = proto::decode_frame(frame);
            if (d) c->on_message(d->msg);
        });
    }

    void close() override { closed_ = true; }
    bool closed() const { return closed_; }

private:
    boost::asio::io_context& io_;
    std::weak_ptr<TransferClient> client_;
    bool closed_ = false;
};

TransferParams quick_params() {
    TransferParams p;
    p.chunk_size = 1000;
    p.ack_timeout_ms = 500;
    p.max_retries = 3;
    p.idle_timeout_ms = 2000;
    p.sweep_interval_ms = 5;
    p.chunk_pace_ms = 0;
    return p;
}

} // namespace

class TransferClientTest : public ::testing::Test {
protected:
    struct Endpoint {
        std::shared_ptr<LoopbackLink> link;
        std::unique_ptr<ConnectionHandler> handler;
        std::shared_ptr<TransferClient> client;
        std::optional<int> exit_code;
        bool handler_closed = false;
        std::vector<proto::Message> sent;
        std::function<void(const proto::Message&)> on_send;
    };

    void SetUp() override {
        dir_ = fs::temp_directory_path() / ("relaycp-client-" + random_hex_id());
        fs::create_directories(dir_ / "out");
    }

    void TearDown() override {
        for (auto& e : endpoints_) {
            if (!e->handler_closed) e->handler->on_close();
        }
        endpoints_.clear();
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    Endpoint& add_client(ClientOptions opts) {
        opts.transfer = quick_params();
        auto e = std::make_unique<Endpoint>();
        Endpoint* ep = e.get();
        ep->link = std::make_shared<LoopbackLink>(io_);
        ep->handler = std::make_unique<ConnectionHandler>(registry_, nullptr, logger_, "127.0.0.1",
                                                          ep->link, proto::Encoding::BINARY);
        ep->client = std::make_shared<TransferClient>(
            io_.get_executor(), std::move(opts), console_, logger_,
            [this, ep](const proto::Message& m, WrittenFn written) {
                ep->sent.push_back(m);
                if (ep->on_send) ep->on_send(m);
                tlv::Bytes frame = proto::encode(m);
                boost::asio::post(io_, [ep, frame, written]() {
                    if (!ep->handler_closed) ep->handler->on_frame(frame);
                    if (written) written();
                });
            },
            [this, ep](int code) {
                ep->exit_code = code;
                boost::asio::post(io_, [ep]() {
                    if (ep->handler_closed) return;
                    ep->handler_closed = true;
                    ep->handler->on_close();
                });
            });
        ep->link->attach(ep->client);
        endpoints_.push_back(std::move(e));
        return *ep;
    }

    void run() {
        for (auto& e : endpoints_) e->client->start();
        io_.run_for(std::chrono::seconds(20));
    }

    std::string write_file(const std::string& name, size_t n) {
        std::mt19937 rng(static_cast<unsigned>(n));
        std::string data(n, '\0');
        for (auto& c : data) c = static_cast<char>(rng());
        fs::path p = dir_ / name;
        std::ofstream(p, std::ios::binary) << data;
        return p.string();
    }

    static std::string slurp(const fs::path& p) {
        std::ifstream in(p, std::ios::binary);
        return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
    }

    ClientOptions sender_opts(const std::string& room, std::vector<std::string> paths) {
        ClientOptions o;
        o.mode = ClientMode::SEND_FILE;
        o.room = room;
        o.paths = std::move(paths);
        return o;
    }

    // Connection of ep drops: the relay sees the close, the client sees the
    // transport go away.
    static void drop_connection(Endpoint& ep) {
        if (ep.handler_closed) return;
        ep.handler_closed = true;
        ep.handler->on_close();
        ep.client->on_disconnected("connection reset");
    }

    static size_t count_kind(const Endpoint& ep, proto::Kind k) {
        size_t n = 0;
        for (const auto& m : ep.sent) {
            if (m.kind == k) ++n;
        }
        return n;
    }

    ClientOptions receiver_opts(const std::string& room) {
        ClientOptions o;
        o.mode = ClientMode::RECEIVE;
        o.room = room;
        o.out_dir = (dir_ / "out").string();
        return o;
    }

    boost::asio::io_context io_;
    Logger logger_;
    Console console_;
    RoomRegistry registry_{RegistryLimits{}, logger_};
    fs::path dir_;
    std::vector<std::unique_ptr<Endpoint>> endpoints_;
};

TEST_F(TransferClientTest, FileArrivesIntact) {
    const std::string src = write_file("report.bin", 10500);

    ClientOptions so;
    so.mode = ClientMode::SEND_FILE;
    so.room = "abc1";
    so.paths = {src};
    Endpoint& sender = add_client(so);
    Endpoint& receiver = add_client(receiver_opts("abc1"));
    run();

    ASSERT_TRUE(sender.exit_code);
    ASSERT_TRUE(receiver.exit_code);
    EXPECT_EQ(*sender.exit_code, 0);
    EXPECT_EQ(*receiver.exit_code, 0);
    EXPECT_TRUE(sender.client->done());
    EXPECT_FALSE(sender.client->mnemonic().empty());

    const fs::path out = dir_ / "out" / "report.bin";
    EXPECT_EQ(receiver.client->saved_path(), out.string());
    EXPECT_EQ(slurp(out), slurp(src));
}

TEST_F(TransferClientTest, ReceiverMayJoinFirst) {
    const std::string src = write_file("a.dat", 2500);
    Endpoint& receiver = add_client(receiver_opts("room-2"));
    ClientOptions so;
    so.mode = ClientMode::SEND_FILE;
    so.room = "room-2";
    so.paths = {src};
    Endpoint& sender = add_client(so);
    run();

    ASSERT_TRUE(receiver.exit_code);
    ASSERT_TRUE(sender.exit_code);
    EXPECT_EQ(*receiver.exit_code, 0);
    EXPECT_EQ(*sender.exit_code, 0);
    EXPECT_EQ(slurp(dir_ / "out" / "a.dat"), slurp(src));
}

TEST_F(TransferClientTest, EmptyFile) {
    const std::string src = write_file("empty.txt", 0);
    ClientOptions so;
    so.mode = ClientMode::SEND_FILE;
    so.room = "e";
    so.paths = {src};
    Endpoint& sender = add_client(so);
    Endpoint& receiver = add_client(receiver_opts("e"));
    run();

    ASSERT_TRUE(sender.exit_code);
    ASSERT_TRUE(receiver.exit_code);
    EXPECT_EQ(*sender.exit_code, 0);
    EXPECT_EQ(*receiver.exit_code, 0);
    EXPECT_TRUE(fs::exists(dir_ / "out" / "empty.txt"));
    EXPECT_EQ(fs::file_size(dir_ / "out" / "empty.txt"), 0u);
}

TEST_F(TransferClientTest, TextMessage) {
    ClientOptions so;
    so.mode = ClientMode::SEND_TEXT;
    so.room = "t";
    so.text = "hello relay";
    Endpoint& sender = add_client(so);
    Endpoint& receiver = add_client(receiver_opts("t"));

    testing::internal::CaptureStdout();
    run();
    const std::string out = testing::internal::GetCapturedStdout();

    ASSERT_TRUE(sender.exit_code);
    ASSERT_TRUE(receiver.exit_code);
    EXPECT_EQ(*sender.exit_code, 0);
    EXPECT_EQ(*receiver.exit_code, 0);
    EXPECT_NE(out.find("hello relay"), std::string::npos);
    EXPECT_TRUE(fs::is_empty(dir_ / "out"));

    // The sealed text travels in the metadata fields; data/iv stay empty.
    const proto::Message* text = nullptr;
    for (const auto& m : sender.sent) {
        if (m.kind == proto::Kind::TEXT_MESSAGE) text = &m;
    }
    ASSERT_NE(text, nullptr);
    EXPECT_FALSE(text->encrypted_metadata.empty());
    EXPECT_FALSE(text->metadata_iv.empty());
    EXPECT_TRUE(text->data_b64.empty());
    EXPECT_TRUE(text->iv_b64.empty());
}

TEST_F(TransferClientTest, TextInMetadataFieldsFromAnotherPeerIsRead) {
    // A peer that is not a TransferClient: it seals the text by hand.
    Endpoint& receiver = add_client(receiver_opts("hand"));
    auto link = std::make_shared<LoopbackLink>(io_);
    ConnectionHandler other(registry_, nullptr, logger_, "127.0.0.2", link, proto::Encoding::TEXT);

    receiver.client->start();
    io_.run_for(std::chrono::milliseconds(50));
    io_.restart();

    KeyExchange kx;
    proto::Message join;
    join.kind = proto::Kind::JOIN;
    join.room_id = "hand";
    other.on_frame(proto::encode_frame(join, proto::Encoding::TEXT));
    io_.run_for(std::chrono::milliseconds(50));
    io_.restart();

    const proto::Message* pubkey = nullptr;
    for (const auto& m : receiver.sent) {
        if (m.kind == proto::Kind::PUBKEY) pubkey = &m;
    }
    ASSERT_NE(pubkey, nullptr);
    kx.on_peer_key(pubkey->pub);
    proto::Message mine;
    mine.kind = proto::Kind::PUBKEY;
    mine.pub = kx.public_key_b64();
    other.on_frame(proto::encode_frame(mine, proto::Encoding::TEXT));

    SealedField sealed = seal_text("from elsewhere", kx.key());
    proto::Message text;
    text.kind = proto::Kind::TEXT_MESSAGE;
    text.encrypted_metadata = sealed.data_b64;
    text.metadata_iv = sealed.iv_b64;
    other.on_frame(proto::encode_frame(text, proto::Encoding::TEXT));

    testing::internal::CaptureStdout();
    io_.run_for(std::chrono::seconds(2));
    const std::string out = testing::internal::GetCapturedStdout();
    other.on_close();

    ASSERT_TRUE(receiver.exit_code);
    EXPECT_EQ(*receiver.exit_code, 0);
    EXPECT_NE(out.find("from elsewhere"), std::string::npos);
}

TEST_F(TransferClientTest, ExistingFileIsNotOverwritten) {
    const std::string src = write_file("dup.bin", 3000);
    {
        std::ofstream(dir_ / "out" / "dup.bin") << "keep me";
    }
    ClientOptions so;
    so.mode = ClientMode::SEND_FILE;
    so.room = "d";
    so.paths = {src};
    Endpoint& sender = add_client(so);
    Endpoint& receiver = add_client(receiver_opts("d"));
    run();

    ASSERT_TRUE(sender.exit_code);
    ASSERT_TRUE(receiver.exit_code);
    EXPECT_EQ(*receiver.exit_code, 1);
    EXPECT_EQ(*sender.exit_code, 1);
    EXPECT_EQ(slurp(dir_ / "out" / "dup.bin"), "keep me");
}

TEST_F(TransferClientTest, ForceOverwrites) {
    const std::string src = write_file("dup.bin", 3000);
    {
        std::ofstream(dir_ / "out" / "dup.bin") << "old";
    }
    ClientOptions so;
    so.mode = ClientMode::SEND_FILE;
    so.room = "f";
    so.paths = {src};
    Endpoint& sender = add_client(so);
    ClientOptions ro = receiver_opts("f");
    ro.force = true;
    Endpoint& receiver = add_client(ro);
    run();

    ASSERT_TRUE(sender.exit_code);
    ASSERT_TRUE(receiver.exit_code);
    EXPECT_EQ(*sender.exit_code, 0);
    EXPECT_EQ(*receiver.exit_code, 0);
    EXPECT_EQ(slurp(dir_ / "out" / "dup.bin"), slurp(src));
}

TEST_F(TransferClientTest, MissingSourceFileFailsBeforeJoining) {
    ClientOptions so;
    so.mode = ClientMode::SEND_FILE;
    so.room = "m";
    so.paths = {(dir_ / "nope.bin").string()};
    Endpoint& sender = add_client(so);
    run();

    ASSERT_TRUE(sender.exit_code);
    EXPECT_EQ(*sender.exit_code, 1);
    EXPECT_TRUE(sender.client->mnemonic().empty());
    EXPECT_FALSE(registry_.find("m"));
}

TEST_F(TransferClientTest, ThirdMemberIsTurnedAway) {
    add_client(receiver_opts("full"));
    add_client(receiver_opts("full"));
    ClientOptions so;
    so.mode = ClientMode::SEND_TEXT;
    so.room = "full";
    so.text = "x";
    Endpoint& late = add_client(so);

    for (auto& e : endpoints_) e->client->start();
    io_.run_for(std::chrono::milliseconds(200));

    ASSERT_TRUE(late.exit_code);
    EXPECT_EQ(*late.exit_code, 1);
    EXPECT_TRUE(late.link->closed());
}

TEST_F(TransferClientTest, ReceiverWaitsOutASenderDropAndTakesTheRetry) {
    const std::string src = write_file("big.bin", 40000);
    Endpoint& receiver = add_client(receiver_opts("retry"));
    Endpoint& first = add_client(sender_opts("retry", {src}));

    Endpoint* second = nullptr;
    int chunks = 0;
    first.on_send = [&](const proto::Message& m) {
        if (m.kind != proto::Kind::FILE_CHUNK || ++chunks != 5) return;
        boost::asio::post(io_, [&]() {
            drop_connection(first);
            second = &add_client(sender_opts("retry", {src}));
            second->client->start();
        });
    };

    testing::internal::CaptureStderr();
    run();
    const std::string err = testing::internal::GetCapturedStderr();

    ASSERT_TRUE(first.exit_code);
    EXPECT_EQ(*first.exit_code, 1);
    ASSERT_NE(second, nullptr);
    ASSERT_TRUE(second->exit_code);
    EXPECT_EQ(*second->exit_code, 0);
    ASSERT_TRUE(receiver.exit_code);
    EXPECT_EQ(*receiver.exit_code, 0);

    EXPECT_NE(err.find("transfer interrupted"), std::string::npos) << err;
    EXPECT_EQ(count_kind(receiver, proto::Kind::PUBKEY), 2u);
    EXPECT_EQ(slurp(dir_ / "out" / "big.bin"), slurp(src));
}

TEST_F(TransferClientTest, InterruptedReceiveLeavesNoPartialFile) {
    const std::string src = write_file("big.bin", 40000);
    Endpoint& sender = add_client(sender_opts("int", {src}));
    Endpoint& receiver = add_client(receiver_opts("int"));
    int chunks = 0;
    sender.on_send = [&](const proto::Message& m) {
        if (m.kind != proto::Kind::FILE_CHUNK || ++chunks != 5) return;
        boost::asio::post(io_, [&]() { receiver.client->interrupt(); });
    };
    run();

    ASSERT_TRUE(receiver.exit_code);
    EXPECT_EQ(*receiver.exit_code, 130);
    ASSERT_TRUE(sender.exit_code);
    EXPECT_EQ(*sender.exit_code, 1);
    EXPECT_EQ(count_kind(receiver, proto::Kind::TRANSFER_CANCELLED), 1u);
    EXPECT_FALSE(fs::exists(dir_ / "out" / "big.bin"));
    EXPECT_TRUE(fs::is_empty(dir_ / "out"));
}

TEST_F(TransferClientTest, InterruptBeforeTheTransferJustExits) {
    Endpoint& receiver = add_client(receiver_opts("idle"));
    receiver.client->start();
    io_.run_for(std::chrono::milliseconds(30));
    receiver.client->interrupt();
    receiver.client->interrupt();

    ASSERT_TRUE(receiver.exit_code);
    EXPECT_EQ(*receiver.exit_code, 130);
    EXPECT_EQ(count_kind(receiver, proto::Kind::TRANSFER_CANCELLED), 0u);
}

TEST_F(TransferClientTest, FolderArrivesAsAFolder) {
    fs::create_directories(dir_ / "photos" / "2024" / "empty");
    const std::string a = write_file("photos/a.jpg", 3000);
    const std::string b = write_file("photos/2024/b.jpg", 1500);

    Endpoint& sender = add_client(sender_opts("dir", {(dir_ / "photos").string()}));
    Endpoint& receiver = add_client(receiver_opts("dir"));
    run();

    ASSERT_TRUE(sender.exit_code);
    ASSERT_TRUE(receiver.exit_code);
    EXPECT_EQ(*sender.exit_code, 0);
    EXPECT_EQ(*receiver.exit_code, 0);

    const fs::path got = dir_ / "out" / "photos";
    EXPECT_EQ(receiver.client->saved_path(), got.string());
    EXPECT_EQ(slurp(got / "a.jpg"), slurp(a));
    EXPECT_EQ(slurp(got / "2024" / "b.jpg"), slurp(b));
    EXPECT_TRUE(fs::is_directory(got / "2024" / "empty"));
    EXPECT_FALSE(fs::exists(dir_ / "out" / "photos.zip"));
}

TEST_F(TransferClientTest, ExistingFolderIsNotOverwritten) {
    fs::create_directories(dir_ / "photos");
    write_file("photos/a.jpg", 100);
    fs::create_directories(dir_ / "out" / "photos");
    {
        std::ofstream(dir_ / "out" / "photos" / "keep.txt") << "mine";
    }
    Endpoint& sender = add_client(sender_opts("dir2", {(dir_ / "photos").string()}));
    Endpoint& receiver = add_client(receiver_opts("dir2"));
    run();

    ASSERT_TRUE(sender.exit_code);
    ASSERT_TRUE(receiver.exit_code);
    EXPECT_EQ(*receiver.exit_code, 1);
    EXPECT_EQ(*sender.exit_code, 1);
    EXPECT_EQ(slurp(dir_ / "out" / "photos" / "keep.txt"), "mine");
    EXPECT_FALSE(fs::exists(dir_ / "out" / "photos" / "a.jpg"));
    EXPECT_FALSE(fs::exists(dir_ / "out" / "photos.zip"));
}

TEST_F(TransferClientTest, SeveralPathsLandSideBySide) {
    const std::string one = write_file("one.txt", 100);
    const std::string two = write_file("two.bin", 2000);
    fs::create_directories(dir_ / "docs");
    const std::string three = write_file("docs/three.md", 50);

    Endpoint& sender = add_client(sender_opts("multi", {one, two, (dir_ / "docs").string()}));
    Endpoint& receiver = add_client(receiver_opts("multi"));
    run();

    ASSERT_TRUE(sender.exit_code);
    ASSERT_TRUE(receiver.exit_code);
    EXPECT_EQ(*sender.exit_code, 0);
    EXPECT_EQ(*receiver.exit_code, 0);

    const fs::path out = dir_ / "out";
    EXPECT_EQ(slurp(out / "one.txt"), slurp(one));
    EXPECT_EQ(slurp(out / "two.bin"), slurp(two));
    EXPECT_EQ(slurp(out / "docs" / "three.md"), slurp(three));
    EXPECT_FALSE(fs::exists(out / "files.zip"));
    EXPECT_FALSE(fs::exists(out / "files"));
}

TEST(WsUrl, Parses) {
    WsUrl u;
    std::string err;
    ASSERT_TRUE(parse_ws_url("ws://relay.example:3001/ws", u, err)) << err;
    EXPECT_EQ(u.host, "relay.example");
    EXPECT_EQ(u.port, "3001");
    EXPECT_EQ(u.target, "/ws");

    ASSERT_TRUE(parse_ws_url("WS://h", u, err)) << err;
    EXPECT_EQ(u.host, "h");
    EXPECT_EQ(u.port, "80");
    EXPECT_EQ(u.target, "/");

    ASSERT_TRUE(parse_ws_url("ws://[::1]:9000/x?y=1", u, err)) << err;
    EXPECT_EQ(u.host, "::1");
    EXPECT_EQ(u.port, "9000");
    EXPECT_EQ(u.target, "/x?y=1");
}

TEST(WsUrl, Rejects) {
    WsUrl u;
    std::string err;
    EXPECT_FALSE(parse_ws_url("wss://h/ws", u, err));
    EXPECT_NE(err.find("wss://"), std::string::npos);
    EXPECT_FALSE(parse_ws_url("http://h/ws", u, err));
    EXPECT_FALSE(parse_ws_url("ws://", u, err));
    EXPECT_FALSE(parse_ws_url("ws://:80/", u, err));
    EXPECT_FALSE(parse_ws_url("ws://h:0/", u, err));
    EXPECT_FALSE(parse_ws_url("ws://h:65536/", u, err));
    EXPECT_FALSE(parse_ws_url("ws://h:12a/", u, err));
    EXPECT_FALSE(parse_ws_url("ws://[::1/", u, err));
}
