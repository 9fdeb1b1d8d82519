#pragma once

#include <boost/asio.hpp>

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <vector>

#include "chunk_receiver.hpp"
#include "chunk_sender.hpp"
#include "console.hpp"
#include "key_exchange.hpp"
#include "logger.hpp"
#include "protocol.hpp"
#include "transfer_params.hpp"

namespace relaycp {

enum class ClientMode { SEND_FILE, SEND_TEXT, RECEIVE };

struct ClientOptions {
    ClientMode mode = ClientMode::RECEIVE;
    std::string room;
    // SEND_FILE: one file, one directory (sent as a zip of the folder) or
    // several paths (sent as one zip, unpacked flat on the other side).
    std::vector<std::string> paths;
    std::string text;        // SEND_TEXT
    std::string out_dir = "."; // RECEIVE
    bool force = false;      // overwrite existing output files
    TransferParams transfer;
};

// Client half of a session: joins the room, agrees on a key with the other
// member and then either sends one file or text, or receives one. Transport
// agnostic; messages come in through on_message() and leave through SendFn,
// all on the one executor passed in.
//
// The exit code (0 ok, 1 failure, 130 interrupted) is reported once through
// ExitFn.
class TransferClient : public std::enable_shared_from_this<TransferClient> {
public:
    // The WrittenFn, when set, must run once the frame has been written.
    using SendFn = std::function<void(const proto::Message&, WrittenFn)>;
    using ExitFn = std::function<void(int)>;

    TransferClient(boost::asio::any_io_executor ex,
                   ClientOptions opts,
                   Console& console,
                   Logger& logger,
                   SendFn send,
                   ExitFn on_exit);
    ~TransferClient();

    TransferClient(const TransferClient&) = delete;
    TransferClient& operator=(const TransferClient&) = delete;

    // Sends join and starts the stall watchdog. For SEND_FILE the file is
    // opened, or the folder or path list zipped, here; failing that exits
    // with code 1 right away.
    void start();
    void on_message(const proto::Message& m);
    // Transport went away.
    void on_disconnected(const std::string& reason);
    // Ctrl-C: tells the peer, drops partial output, exits with 130.
    void interrupt();

    bool done() const { return done_; }
    int exit_code() const { return exit_code_; }
    const std::string& mnemonic() const { return mnemonic_; }
    const std::string& saved_path() const { return saved_path_; }
    bool key_ready() const { return kx_.ready(); }

private:
    bool sending() const { return opts_.mode != ClientMode::RECEIVE; }
    void send(const proto::Message& m) { send_(m, nullptr); }
    void prepare_source();
    void remove_staging();
    bool unpack_archive(const TransferMetadata& meta);

    void handle_peers(const proto::Message& m);
    void handle_pubkey(const proto::Message& m);
    void handle_peer_disconnected(const proto::Message& m);
    void handle_transfer_received(const proto::Message& m);
    void handle_transfer_cancelled();
    void handle_file_start(const proto::Message& m);
    void handle_file_chunk(const proto::Message& m);
    void handle_file_end();
    void handle_text_message(const proto::Message& m);

    void send_pubkey();
    void begin_transfer();
    void on_sent(const TransferOutcome& outcome);
    void send_cancel();
    void send_receipt(TransferKind kind);
    void drop_partial_output();

    void schedule_watchdog();
    void watchdog();
    void finish(int code);

    boost::asio::any_io_executor ex_;
    ClientOptions opts_;
    Console& console_;
    Logger& logger_;
    SendFn send_;
    ExitFn on_exit_;

    KeyExchange kx_;
    std::unique_ptr<PayloadSource> source_;
    TransferMetadata outgoing_;
    std::filesystem::path staging_dir_;
    std::string extract_dir_;
    std::shared_ptr<ChunkSender> sender_;
    ChunkReceiver receiver_;
    std::ofstream out_;
    std::string out_path_;
    std::string saved_path_;

    std::string mnemonic_;
    bool transfer_started_ = false;
    bool awaiting_receipt_ = false;
    uint64_t receipt_wait_since_ms_ = 0;

    boost::asio::steady_timer watchdog_timer_;
    bool done_ = false;
    int exit_code_ = 0;
};

} // namespace relaycp
