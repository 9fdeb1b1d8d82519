#include "chunk_receiver.hpp"

#include <stdexcept>

namespace relaycp {

ChunkReceiver::ChunkReceiver(TransferParams params, AckFn ack)
    : params_(params), ack_(std::move(ack)) {}

void ChunkReceiver::begin(const TransferMetadata& meta, const crypto::Key& key, SinkFn sink, uint64_t now_ms) {
    meta_ = meta;
    key_ = key;
    sink_ = std::move(sink);
    hash_ = std::make_unique<crypto::Sha256>();
    accepted_.clear();
    reorder_.clear();
    next_expected_ = 0;
    bytes_ = 0;
    last_activity_ms_ = now_ms;
    active_ = true;
}

ChunkReceiver::ChunkResult ChunkReceiver::on_chunk(int32_t num,
                                                   const std::string& data_b64,
                                                   const std::string& iv_b64,
                                                   uint64_t now_ms) {
    if (!active_) return ChunkResult::NOT_ACTIVE;
    if (num < 0) return ChunkResult::INVALID;
    last_activity_ms_ = now_ms;

    if (accepted_.count(num) != 0) {
        ack_(num);
        return ChunkResult::DUPLICATE;
    }

    std::vector<uint8_t> plain;
    try {
        plain = open_bytes(data_b64, iv_b64, key_);
    } catch (const std::exception&) {
        return ChunkResult::DECRYPT_FAILED;
    }
    accepted_.insert(num);

    ChunkResult result;
    if (num == next_expected_) {
        deliver(plain);
        ++next_expected_;
        for (auto it = reorder_.find(next_expected_); it != reorder_.end();
             it = reorder_.find(next_expected_)) {
            deliver(it->second);
            reorder_.erase(it);
            ++next_expected_;
        }
        result = ChunkResult::APPLIED;
    } else {
        reorder_.emplace(num, std::move(plain));
        result = ChunkResult::BUFFERED;
    }

    ack_(num);
    return result;
}

void ChunkReceiver::deliver(const std::vector<uint8_t>& plain) {
    hash_->Update(plain.data(), plain.size());
    bytes_ += plain.size();
    if (sink_) sink_(plain.data(), plain.size());
}

ChunkReceiver::Completion ChunkReceiver::finish() {
    if (!active_) throw std::logic_error("no transfer in progress");

    Completion c;
    c.bytes = bytes_;
    c.expected_bytes = meta_.total_size;
    c.expected_hash = meta_.hash;
    c.actual_hash = crypto::HexDigest(hash_->Final());
    c.complete = reorder_.empty() && bytes_ == meta_.total_size;
    c.hash_ok = meta_.hash.empty() || meta_.hash == c.actual_hash;

    abort();
    return c;
}

void ChunkReceiver::abort() {
    active_ = false;
    sink_ = nullptr;
    hash_.reset();
    accepted_.clear();
    reorder_.clear();
}

bool ChunkReceiver::expired(uint64_t now_ms) const {
    return active_ && now_ms > last_activity_ms_ &&
           now_ms - last_activity_ms_ > params_.idle_timeout_ms;
}

} // namespace relaycp
