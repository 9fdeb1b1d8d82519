#pragma once

#include <cstddef>
#include <cstdint>

namespace relaycp {

// How the AES-256-GCM session key is taken from the ECDH shared secret.
// RAW uses the 32-byte X coordinate as is, which is what deployed peers do.
enum class KeyDerivation { RAW, HKDF_SHA256 };

// Protocol constants of the reliable chunk transport. The defaults are the
// values unmodified peers use; change them only in lockstep on both ends.
struct TransferParams {
    size_t chunk_size = 256 * 1024;
    uint32_t ack_timeout_ms = 5000;
    uint32_t max_retries = 3;
    uint32_t idle_timeout_ms = 30000;
    uint32_t sweep_interval_ms = 500;
    uint32_t chunk_pace_ms = 10;
    // Chunks sent but not yet acknowledged. A new chunk also waits until the
    // previous frame has left the local write queue.
    uint32_t max_in_flight = 8;
    KeyDerivation key_derivation = KeyDerivation::RAW;
};

} // namespace relaycp
