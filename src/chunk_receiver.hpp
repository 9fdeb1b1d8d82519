#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include "crypto/Crypto.h"
#include "metadata.hpp"
#include "transfer_params.hpp"

namespace relaycp {

// Receiving half of the reliable chunk transport. Pure state machine: the
// caller supplies the clock, feeds messages in arrival order and forwards
// acknowledgments through AckFn. Plaintext leaves through SinkFn strictly
// in sequence order.
class ChunkReceiver {
public:
    using AckFn = std::function<void(int32_t)>;
    using SinkFn = std::function<void(const uint8_t*, size_t)>;

    enum class ChunkResult {
        APPLIED,        // in order; delivered together with any unblocked successors
        BUFFERED,       // ahead of the next expected number
        DUPLICATE,      // already accepted; acknowledged again, state untouched
        NOT_ACTIVE,     // no transfer in progress
        INVALID,        // negative sequence number
        DECRYPT_FAILED  // bad base64, IV or tag; not acknowledged
    };

    struct Completion {
        uint64_t bytes = 0;
        uint64_t expected_bytes = 0;
        std::string expected_hash;
        std::string actual_hash;
        bool complete = false; // no gaps left and byte count matches
        bool hash_ok = false;  // true also when the sender sent no hash
    };

    ChunkReceiver(TransferParams params, AckFn ack);

    // Resets every piece of per-transfer state.
    void begin(const TransferMetadata& meta, const crypto::Key& key, SinkFn sink, uint64_t now_ms);
    ChunkResult on_chunk(int32_t num, const std::string& data_b64, const std::string& iv_b64, uint64_t now_ms);
    // Ends the transfer and reports integrity.
    Completion finish();
    void abort();

    bool active() const { return active_; }
    bool expired(uint64_t now_ms) const;

    const TransferMetadata& metadata() const { return meta_; }
    int32_t next_expected() const { return next_expected_; }
    uint64_t bytes_delivered() const { return bytes_; }
    size_t buffered() const { return reorder_.size(); }
    size_t accepted() const { return accepted_.size(); }

private:
    void deliver(const std::vector<uint8_t>& plain);

    const TransferParams params_;
    AckFn ack_;

    bool active_ = false;
    TransferMetadata meta_;
    crypto::Key key_{};
    SinkFn sink_;
    std::unique_ptr<crypto::Sha256> hash_;

    std::set<int32_t> accepted_;
    std::map<int32_t, std::vector<uint8_t>> reorder_;
    int32_t next_expected_ = 0;
    uint64_t bytes_ = 0;
    uint64_t last_activity_ms_ = 0;
};

} // namespace relaycp
