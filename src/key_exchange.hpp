#pragma once

#include <cstdint>
#include <memory>
#include <string>

#include "crypto/Crypto.h"
#include "transfer_params.hpp"

namespace relaycp {

// Two-party key agreement state of one client. There is no fixed
// initiator: a side announces when it sees two members, or as soon as it
// learns the peer's key before having announced its own.
//
// Exactly two participants are assumed. With a third member in the room
// each side keeps agreeing with whichever key it saw last.
class KeyExchange {
public:
    struct PeerKeyOutcome {
        bool duplicate = false; // same key as before, nothing changed
        bool announce = false;  // caller must send our pubkey now
    };

    explicit KeyExchange(KeyDerivation derivation = KeyDerivation::RAW);

    // base64 of the uncompressed P-256 point.
    std::string public_key_b64() const;

    // Returns true when the caller must announce now.
    bool on_peers(int32_t count);

    // Throws std::runtime_error on a malformed or off-curve key; the state
    // is unchanged in that case.
    PeerKeyOutcome on_peer_key(const std::string& pub_b64);

    // Fresh key pair, no shared key, not announced.
    void reset();

    bool ready() const { return ready_; }
    bool announced() const { return announced_; }
    // Throws std::logic_error before ready().
    const crypto::Key& key() const;

private:
    KeyDerivation derivation_;
    std::unique_ptr<crypto::EcdhKeyPair> pair_;
    std::string peer_pub_b64_;
    crypto::Key key_{};
    bool ready_ = false;
    bool announced_ = false;
};

} // namespace relaycp
