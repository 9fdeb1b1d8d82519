#include "key_exchange.hpp"

#include "base64.hpp"

#include <algorithm>
#include <stdexcept>

namespace relaycp {

KeyExchange::KeyExchange(KeyDerivation derivation)
    : derivation_(derivation), pair_(std::make_unique<crypto::EcdhKeyPair>()) {}

std::string KeyExchange::public_key_b64() const {
    auto raw = pair_->public_key_raw();
    return b64::encode(std::vector<uint8_t>(raw.begin(), raw.end()));
}

bool KeyExchange::on_peers(int32_t count) {
    if (count != 2 || announced_) return false;
    announced_ = true;
    return true;
}

KeyExchange::PeerKeyOutcome KeyExchange::on_peer_key(const std::string& pub_b64) {
    PeerKeyOutcome out;
    if (ready_ && pub_b64 == peer_pub_b64_) {
        out.duplicate = true;
        return out;
    }

    auto bytes = b64::decode(pub_b64);
    if (bytes.size() != crypto::kP256PointSize) {
        throw std::runtime_error("peer public key has wrong length: " + std::to_string(bytes.size()));
    }
    crypto::PubKey peer{};
    std::copy(bytes.begin(), bytes.end(), peer.begin());

    auto secret = pair_->DeriveSharedSecret(peer);
    key_ = derivation_ == KeyDerivation::HKDF_SHA256 ? crypto::EcdhKeyPair::DeriveSessionKey(secret)
                                                     : crypto::EcdhKeyPair::SessionKeyFromSecret(secret);
    std::fill(secret.begin(), secret.end(), 0);

    // A changed key means the peer started over and has not seen ours.
    const bool rekey = ready_;
    peer_pub_b64_ = pub_b64;
    ready_ = true;

    if (!announced_ || rekey) {
        announced_ = true;
        out.announce = true;
    }
    return out;
}

void KeyExchange::reset() {
    pair_ = std::make_unique<crypto::EcdhKeyPair>();
    peer_pub_b64_.clear();
    std::fill(key_.begin(), key_.end(), 0);
    ready_ = false;
    announced_ = false;
}

const crypto::Key& KeyExchange::key() const {
    if (!ready_) throw std::logic_error("session key not established");
    return key_;
}

} // namespace relaycp
