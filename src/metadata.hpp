#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "crypto/Crypto.h"

namespace relaycp {

// Describes one transfer; travels only sealed under the session key.
struct TransferMetadata {
    std::string name;
    uint64_t total_size = 0;
    bool is_folder = false;
    std::string original_folder_name;
    bool is_multiple_files = false;
    std::string hash; // lowercase hex SHA-256 of the whole plaintext

    bool operator==(const TransferMetadata& o) const;
};

enum class TransferKind { FILE, TEXT };

// base64 ciphertext (tag appended) and base64 IV, as carried in
// encrypted_metadata / metadata_iv or chunk_data / iv_b64.
struct SealedField {
    std::string data_b64;
    std::string iv_b64;
};

std::string metadata_to_json(const TransferMetadata& m);
// Throws std::runtime_error on malformed JSON or wrongly typed fields.
TransferMetadata metadata_from_json(const std::string& json_text);

SealedField seal_bytes(const uint8_t* data, size_t len, const crypto::Key& key);
// Throws on bad base64, a wrong IV size or a failed tag check.
std::vector<uint8_t> open_bytes(const std::string& data_b64, const std::string& iv_b64, const crypto::Key& key);

SealedField seal_metadata(const TransferMetadata& m, const crypto::Key& key);
TransferMetadata open_metadata(const SealedField& f, const crypto::Key& key);

SealedField seal_text(const std::string& text, const crypto::Key& key);
std::string open_text(const SealedField& f, const crypto::Key& key);

// Sealed {"kind":"file"|"text"} carried by transfer_received.
SealedField seal_transfer_kind(TransferKind kind, const crypto::Key& key);
TransferKind open_transfer_kind(const SealedField& f, const crypto::Key& key);

} // namespace relaycp
