#include "chunk_sender.hpp"

#include "util.hpp"

#include <chrono>
#include <limits>
#include <stdexcept>

namespace relaycp {

ChunkSender::ChunkSender(boost::asio::any_io_executor ex,
                         TransferParams params,
                         const crypto::Key& key,
                         std::unique_ptr<PayloadSource> source,
                         SendFn send,
                         Logger& logger)
    : ex_(ex),
      params_(params),
      key_(key),
      source_(std::move(source)),
      send_(std::move(send)),
      logger_(logger),
      pace_timer_(ex),
      sweep_timer_(ex) {}

void ChunkSender::start(TransferMetadata meta, DoneFn done) {
    if (started_) throw std::logic_error("transfer already started");
    started_ = true;
    done_ = std::move(done);
    buf_.resize(params_.chunk_size);

    meta.total_size = source_->size();
    SealedField sealed = seal_metadata(meta, key_);

    proto::Message m;
    m.kind = proto::Kind::FILE_START;
    m.encrypted_metadata = sealed.data_b64;
    m.metadata_iv = sealed.iv_b64;
    send_(m, nullptr);

    logger_.debug("transfer started: " + std::to_string(meta.total_size) + " bytes, chunk size " +
                  std::to_string(params_.chunk_size) + ", window " + std::to_string(params_.max_in_flight));

    last_activity_ms_ = now_ms();
    schedule_sweep();
    next_pending_ = true;
    boost::asio::post(ex_, [self = shared_from_this()]() { self->send_next(); });
}

void ChunkSender::send_next() {
    next_pending_ = false;
    if (finished_ || all_sent_) return;

    size_t n = 0;
    try {
        n = source_->read(buf_.data(), buf_.size());
    } catch (const std::exception& e) {
        complete(false, std::string("read error: ") + e.what());
        return;
    }

    if (n == 0) {
        all_sent_ = true;
        maybe_finish();
        return;
    }
    if (next_chunk_ == std::numeric_limits<int32_t>::max()) {
        complete(false, "too many chunks");
        return;
    }

    SealedField sealed = seal_bytes(buf_.data(), n, key_);
    InFlight c;
    c.data_b64 = std::move(sealed.data_b64);
    c.iv_b64 = std::move(sealed.iv_b64);

    const int32_t num = next_chunk_++;
    auto it = in_flight_.emplace(num, std::move(c)).first;
    send_chunk(num, it->second);

    pump();
}

// Schedules the next chunk when the window and the write queue allow it.
void ChunkSender::pump() {
    if (finished_ || all_sent_ || next_pending_) return;
    if (unwritten_ > 0 || in_flight_.size() >= params_.max_in_flight) return;
    next_pending_ = true;
    schedule_next();
}

void ChunkSender::on_written(int32_t num) {
    if (finished_) return;
    if (unwritten_ > 0) --unwritten_;
    const uint64_t now = now_ms();
    last_activity_ms_ = now;
    auto it = in_flight_.find(num);
    if (it != in_flight_.end()) {
        it->second.written = true;
        it->second.sent_ms = now;
    }
    pump();
}

void ChunkSender::schedule_next() {
    pace_timer_.expires_after(std::chrono::milliseconds(params_.chunk_pace_ms));
    pace_timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec) return;
        self->send_next();
    });
}

void ChunkSender::send_chunk(int32_t num, const InFlight& c) {
    proto::Message m;
    m.kind = proto::Kind::FILE_CHUNK;
    m.chunk_num = num;
    m.chunk_data = c.data_b64;
    m.iv_b64 = c.iv_b64;
    ++unwritten_;
    std::weak_ptr<ChunkSender> weak = weak_from_this();
    send_(m, [weak, num]() {
        if (auto self = weak.lock()) self->on_written(num);
    });
}

void ChunkSender::on_ack(int32_t chunk_num) {
    if (finished_) return;
    auto it = in_flight_.find(chunk_num);
    if (it == in_flight_.end()) return; // late duplicate
    in_flight_.erase(it);
    acked_.insert(chunk_num);
    last_activity_ms_ = now_ms();
    maybe_finish();
    pump();
}

void ChunkSender::schedule_sweep() {
    sweep_timer_.expires_after(std::chrono::milliseconds(params_.sweep_interval_ms));
    sweep_timer_.async_wait([self = shared_from_this()](const boost::system::error_code& ec) {
        if (ec) return;
        self->sweep();
    });
}

void ChunkSender::sweep() {
    if (finished_) return;
    const uint64_t now = now_ms();

    if (now - last_activity_ms_ > params_.idle_timeout_ms) {
        complete(false, "idle timeout: no chunk activity for " +
                        std::to_string(params_.idle_timeout_ms) + " ms");
        return;
    }

    std::vector<int32_t> due;
    for (auto& kv : in_flight_) {
        InFlight& c = kv.second;
        // Still queued locally; its ack timer has not started.
        if (!c.written) continue;
        if (now - c.sent_ms <= params_.ack_timeout_ms) continue;
        if (c.retries >= params_.max_retries) {
            complete(false, "chunk " + std::to_string(kv.first) + " unacknowledged after " +
                            std::to_string(c.retries) + " retries");
            return;
        }
        ++c.retries;
        c.written = false;
        due.push_back(kv.first);
    }

    // send_ may feed acks straight back; look each chunk up again.
    for (int32_t num : due) {
        if (finished_) return;
        auto it = in_flight_.find(num);
        if (it == in_flight_.end()) continue;
        ++retransmissions_;
        logger_.debug("resending chunk " + std::to_string(num) + " (retry " +
                      std::to_string(it->second.retries) + ")");
        send_chunk(num, it->second);
    }

    if (!finished_) schedule_sweep();
}

void ChunkSender::maybe_finish() {
    if (finished_ || !all_sent_ || !in_flight_.empty()) return;

    proto::Message m;
    m.kind = proto::Kind::FILE_END;
    send_(m, nullptr);
    complete(true, "");
}

void ChunkSender::abort(const std::string& reason) {
    complete(false, reason);
}

void ChunkSender::complete(bool ok, const std::string& reason) {
    if (finished_) return;
    finished_ = true;
    pace_timer_.cancel();
    sweep_timer_.cancel();
    in_flight_.clear();

    if (ok) {
        logger_.info("transfer sent: " + std::to_string(next_chunk_) + " chunks, " +
                     std::to_string(retransmissions_) + " retransmissions");
    } else {
        logger_.warn("transfer aborted: " + reason);
    }

    if (done_) {
        DoneFn done = std::move(done_);
        done_ = nullptr;
        done(TransferOutcome{ok, reason});
    }
}

} // namespace relaycp
