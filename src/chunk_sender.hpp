#pragma once

#include <boost/asio.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "crypto/Crypto.h"
#include "logger.hpp"
#include "metadata.hpp"
#include "payload_source.hpp"
#include "protocol.hpp"
#include "transfer_params.hpp"

namespace relaycp {

struct TransferOutcome {
    bool ok = false;
    std::string reason;
};

// Invoked once a frame has been handed to the socket. May be empty.
using WrittenFn = std::function<void()>;

// Sending half of the reliable chunk transport. Everything runs on the
// executor passed in; on_ack() and abort() must be called from it too.
//
// file_start -> file_chunk 0..N-1 (each with a fresh IV) -> file_end once
// every chunk is acknowledged. At most max_in_flight chunks are unacknowledged
// at a time and a new chunk waits until the previous frame has been written.
// The ack timer of a chunk starts when its frame is written, so time spent in
// the local write queue never counts as loss. Unacknowledged chunks are
// resent after ack_timeout_ms, at most max_retries times; idle_timeout_ms
// without a completed write or an ack fails the transfer.
class ChunkSender : public std::enable_shared_from_this<ChunkSender> {
public:
    using SendFn = std::function<void(const proto::Message&, WrittenFn)>;
    using DoneFn = std::function<void(const TransferOutcome&)>;

    ChunkSender(boost::asio::any_io_executor ex,
                TransferParams params,
                const crypto::Key& key,
                std::unique_ptr<PayloadSource> source,
                SendFn send,
                Logger& logger);

    // meta.total_size is taken from the source.
    void start(TransferMetadata meta, DoneFn done);
    void on_ack(int32_t chunk_num);
    void abort(const std::string& reason);

    bool finished() const { return finished_; }
    size_t in_flight() const { return in_flight_.size(); }
    size_t acked() const { return acked_.size(); }
    int32_t chunks_sent() const { return next_chunk_; }
    uint64_t retransmissions() const { return retransmissions_; }
    // Frames handed to SendFn whose write has not completed yet.
    size_t unwritten() const { return unwritten_; }

private:
    struct InFlight {
        std::string data_b64;
        std::string iv_b64;
        uint64_t sent_ms = 0; // write completion of the latest copy
        uint32_t retries = 0;
        bool written = false;
    };

    void send_next();
    void pump();
    void on_written(int32_t num);
    void schedule_next();
    void schedule_sweep();
    void sweep();
    void maybe_finish();
    void complete(bool ok, const std::string& reason);
    void send_chunk(int32_t num, const InFlight& c);

    boost::asio::any_io_executor ex_;
    const TransferParams params_;
    const crypto::Key key_;
    std::unique_ptr<PayloadSource> source_;
    SendFn send_;
    Logger& logger_;
    DoneFn done_;

    boost::asio::steady_timer pace_timer_;
    boost::asio::steady_timer sweep_timer_;

    std::vector<uint8_t> buf_;
    int32_t next_chunk_ = 0;
    std::map<int32_t, InFlight> in_flight_;
    std::set<int32_t> acked_;
    uint64_t last_activity_ms_ = 0;
    uint64_t retransmissions_ = 0;
    size_t unwritten_ = 0;
    bool next_pending_ = false;
    bool all_sent_ = false;
    bool started_ = false;
    bool finished_ = false;
};

} // namespace relaycp
