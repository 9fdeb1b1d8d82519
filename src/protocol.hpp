#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include "tlv.hpp"

namespace proto {

static constexpr uint8_t kVersion = 1;
// version(u8) kind(u8) payload_len(u32)
static constexpr size_t kHeaderSize = 6;

// Closed set of message kinds. UNKNOWN is decoded, logged and dropped.
enum class Kind : uint8_t {
    JOIN = 1,
    JOINED = 2,
    PEERS = 3,
    PUBKEY = 4,
    ERROR = 5,
    CHUNK_ACK = 6,
    FILE_START = 7,
    TEXT_MESSAGE = 8,
    FILE_CHUNK = 9,
    FILE_END = 10,
    TRANSFER_RECEIVED = 11,
    TRANSFER_CANCELLED = 12,
    PEER_DISCONNECTED = 13,

    UNKNOWN = 255
};

enum class Encoding : uint8_t {
    BINARY,
    TEXT
};

const char* kind_name(Kind k);
// Returns Kind::UNKNOWN for names outside the set.
Kind kind_from_name(const std::string& name);

bool parse_encoding(const std::string& s, Encoding& out);
const char* encoding_name(Encoding e);

// Canonical in-memory message. Requests and responses share one shape;
// unused fields stay empty/zero and are omitted on the wire.
struct Message {
    Kind kind = Kind::UNKNOWN;
    std::string type; // wire type name, only meaningful for UNKNOWN

    std::string room_id;
    std::string client_id;
    std::string pub;
    std::string iv_b64;
    std::string data_b64;
    std::string chunk_data;
    int32_t chunk_num = 0;
    std::string encrypted_metadata;
    std::string metadata_iv;

    std::string from;
    std::string mnemonic;
    std::string self_id;
    std::vector<std::string> peers;
    int32_t count = 0;
    std::string error;
    std::string peer_id;

    std::string type_name() const;

    bool operator==(const Message& o) const;
    bool operator!=(const Message& o) const { return !(*this == o); }
};

// Tags for message payload TLVs
enum MsgTag : uint16_t {
    ROOM_ID = 1,
    CLIENT_ID = 2,
    PUB = 3,
    IV_B64 = 4,
    DATA_B64 = 5,
    CHUNK_DATA = 6,
    CHUNK_NUM = 7,
    ENCRYPTED_METADATA = 8,
    METADATA_IV = 9,
    FROM = 10,
    MNEMONIC = 11,
    SELF_ID = 12,
    PEER = 13,        // repeated, one per peer id
    COUNT = 14,
    ERROR_TEXT = 15,
    PEER_ID = 16,
    TYPE_NAME = 17    // only written for UNKNOWN
};

// Binary envelope. decode throws std::runtime_error on truncated or
// inconsistent input; unknown TLV tags are skipped.
tlv::Bytes encode(const Message& m);
Message decode(const tlv::Bytes& frame);

// Either encoding.
tlv::Bytes encode_frame(const Message& m, Encoding enc);

// Binary if byte 0 is the version byte and the frame holds a full header;
// text if the first non-whitespace byte is '{'.
std::optional<Encoding> detect(const tlv::Bytes& frame);

struct Decoded {
    Message msg;
    Encoding encoding = Encoding::BINARY;
};

// Never throws; nullopt for anything undecodable.
std::optional<Decoded> decode_frame(const tlv::Bytes& frame);

// Constructors for the relay's own replies
Message make_joined(const std::string& self_id, const std::string& mnemonic, const std::string& room_id);
Message make_peers(const std::vector<std::string>& peers, const std::string& room_id);
Message make_error(const std::string& text);
Message make_peer_disconnected(const std::string& peer_id, const std::string& mnemonic,
                               const std::string& room_id);

} // namespace proto
