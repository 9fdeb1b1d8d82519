#include "protocol.hpp"

#include "text_codec.hpp"

#include <cctype>
#include <limits>
#include <stdexcept>

namespace proto {

namespace {

struct KindEntry {
    Kind kind;
    const char* name;
};

const KindEntry kKinds[] = {
    {Kind::JOIN, "join"},
    {Kind::JOINED, "joined"},
    {Kind::PEERS, "peers"},
    {Kind::PUBKEY, "pubkey"},
    {Kind::ERROR, "error"},
    {Kind::CHUNK_ACK, "chunk_ack"},
    {Kind::FILE_START, "file_start"},
    {Kind::TEXT_MESSAGE, "text_message"},
    {Kind::FILE_CHUNK, "file_chunk"},
    {Kind::FILE_END, "file_end"},
    {Kind::TRANSFER_RECEIVED, "transfer_received"},
    {Kind::TRANSFER_CANCELLED, "transfer_cancelled"},
    {Kind::PEER_DISCONNECTED, "peer_disconnected"},
};

bool known_kind_byte(uint8_t b) {
    for (const auto& e : kKinds) {
        if (static_cast<uint8_t>(e.kind) == b) return true;
    }
    return false;
}

void put_str(tlv::Bytes& out, uint16_t tag, const std::string& s) {
    if (!s.empty()) tlv::write_tlv_str(out, tag, s);
}

void put_i32(tlv::Bytes& out, uint16_t tag, int32_t v) {
    if (v != 0) tlv::write_tlv_u32(out, tag, static_cast<uint32_t>(v));
}

int32_t item_i32(const tlv::Item& it) {
    return static_cast<int32_t>(tlv::item_u32(it));
}

} // namespace

const char* kind_name(Kind k) {
    for (const auto& e : kKinds) {
        if (e.kind == k) return e.name;
    }
    return "unknown";
}

Kind kind_from_name(const std::string& name) {
    for (const auto& e : kKinds) {
        if (name == e.name) return e.kind;
    }
    return Kind::UNKNOWN;
}

bool parse_encoding(const std::string& s, Encoding& out) {
    if (s == "binary") { out = Encoding::BINARY; return true; }
    if (s == "text") { out = Encoding::TEXT; return true; }
    return false;
}

const char* encoding_name(Encoding e) {
    return e == Encoding::TEXT ? "text" : "binary";
}

std::string Message::type_name() const {
    if (kind == Kind::UNKNOWN) return type.empty() ? std::string("unknown") : type;
    return kind_name(kind);
}

bool Message::operator==(const Message& o) const {
    if (kind != o.kind) return false;
    if (kind == Kind::UNKNOWN && type_name() != o.type_name()) return false;
    return room_id == o.room_id &&
           client_id == o.client_id &&
           pub == o.pub &&
           iv_b64 == o.iv_b64 &&
           data_b64 == o.data_b64 &&
           chunk_data == o.chunk_data &&
           chunk_num == o.chunk_num &&
           encrypted_metadata == o.encrypted_metadata &&
           metadata_iv == o.metadata_iv &&
           from == o.from &&
           mnemonic == o.mnemonic &&
           self_id == o.self_id &&
           peers == o.peers &&
           count == o.count &&
           error == o.error &&
           peer_id == o.peer_id;
}

tlv::Bytes encode(const Message& m) {
    tlv::Bytes payload;
    put_str(payload, MsgTag::ROOM_ID, m.room_id);
    put_str(payload, MsgTag::CLIENT_ID, m.client_id);
    put_str(payload, MsgTag::PUB, m.pub);
    put_str(payload, MsgTag::IV_B64, m.iv_b64);
    put_str(payload, MsgTag::DATA_B64, m.data_b64);
    put_str(payload, MsgTag::CHUNK_DATA, m.chunk_data);
    put_i32(payload, MsgTag::CHUNK_NUM, m.chunk_num);
    put_str(payload, MsgTag::ENCRYPTED_METADATA, m.encrypted_metadata);
    put_str(payload, MsgTag::METADATA_IV, m.metadata_iv);
    put_str(payload, MsgTag::FROM, m.from);
    put_str(payload, MsgTag::MNEMONIC, m.mnemonic);
    put_str(payload, MsgTag::SELF_ID, m.self_id);
    for (const auto& p : m.peers) tlv::write_tlv_str(payload, MsgTag::PEER, p);
    put_i32(payload, MsgTag::COUNT, m.count);
    put_str(payload, MsgTag::ERROR_TEXT, m.error);
    put_str(payload, MsgTag::PEER_ID, m.peer_id);
    if (m.kind == Kind::UNKNOWN) put_str(payload, MsgTag::TYPE_NAME, m.type);

    if (payload.size() > 0xFFFFFFFFu) throw std::runtime_error("payload too large");

    tlv::Bytes out;
    out.reserve(kHeaderSize + payload.size());
    out.push_back(kVersion);
    out.push_back(static_cast<uint8_t>(m.kind));
    tlv::write_u32(out, static_cast<uint32_t>(payload.size()));
    out.insert(out.end(), payload.begin(), payload.end());
    return out;
}

Message decode(const tlv::Bytes& frame) {
    if (frame.size() < kHeaderSize) throw std::runtime_error("frame too short");
    size_t off = 0;
    uint8_t ver = frame[off++];
    if (ver != kVersion) throw std::runtime_error("unsupported version");
    uint8_t kind = frame[off++];
    uint32_t len = tlv::read_u32(frame, off);
    if (static_cast<size_t>(len) != frame.size() - off) {
        throw std::runtime_error("payload length mismatch");
    }

    Message m;
    m.kind = known_kind_byte(kind) ? static_cast<Kind>(kind) : Kind::UNKNOWN;

    auto items = tlv::parse_all(frame, off);
    for (auto& it : items) {
        switch (it.tag) {
            case MsgTag::ROOM_ID: m.room_id = tlv::bytes_str(it.value); break;
            case MsgTag::CLIENT_ID: m.client_id = tlv::bytes_str(it.value); break;
            case MsgTag::PUB: m.pub = tlv::bytes_str(it.value); break;
            case MsgTag::IV_B64: m.iv_b64 = tlv::bytes_str(it.value); break;
            case MsgTag::DATA_B64: m.data_b64 = tlv::bytes_str(it.value); break;
            case MsgTag::CHUNK_DATA: m.chunk_data = tlv::bytes_str(it.value); break;
            case MsgTag::CHUNK_NUM: m.chunk_num = item_i32(it); break;
            case MsgTag::ENCRYPTED_METADATA: m.encrypted_metadata = tlv::bytes_str(it.value); break;
            case MsgTag::METADATA_IV: m.metadata_iv = tlv::bytes_str(it.value); break;
            case MsgTag::FROM: m.from = tlv::bytes_str(it.value); break;
            case MsgTag::MNEMONIC: m.mnemonic = tlv::bytes_str(it.value); break;
            case MsgTag::SELF_ID: m.self_id = tlv::bytes_str(it.value); break;
            case MsgTag::PEER: m.peers.push_back(tlv::bytes_str(it.value)); break;
            case MsgTag::COUNT: m.count = item_i32(it); break;
            case MsgTag::ERROR_TEXT: m.error = tlv::bytes_str(it.value); break;
            case MsgTag::PEER_ID: m.peer_id = tlv::bytes_str(it.value); break;
            case MsgTag::TYPE_NAME: m.type = tlv::bytes_str(it.value); break;
            default: break;
        }
    }

    if (m.kind != Kind::UNKNOWN) {
        m.type = kind_name(m.kind);
    } else if (m.type.empty()) {
        m.type = "kind_" + std::to_string(kind);
    }
    return m;
}

tlv::Bytes encode_frame(const Message& m, Encoding enc) {
    if (enc == Encoding::TEXT) return tlv::str_bytes(encode_text(m));
    return encode(m);
}

std::optional<Encoding> detect(const tlv::Bytes& frame) {
    if (frame.size() >= kHeaderSize && frame[0] == kVersion) return Encoding::BINARY;
    for (uint8_t c : frame) {
        if (std::isspace(c)) continue;
        if (c == '{') return Encoding::TEXT;
        break;
    }
    return std::nullopt;
}

std::optional<Decoded> decode_frame(const tlv::Bytes& frame) {
    auto enc = detect(frame);
    if (!enc) return std::nullopt;
    try {
        Decoded d;
        d.encoding = *enc;
        if (*enc == Encoding::TEXT) {
            d.msg = decode_text(tlv::bytes_str(frame));
        } else {
            d.msg = decode(frame);
        }
        return d;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

Message make_joined(const std::string& self_id, const std::string& mnemonic, const std::string& room_id) {
    Message m;
    m.kind = Kind::JOINED;
    m.self_id = self_id;
    m.mnemonic = mnemonic;
    m.room_id = room_id;
    return m;
}

Message make_peers(const std::vector<std::string>& peers, const std::string& room_id) {
    if (peers.size() > static_cast<size_t>(std::numeric_limits<int32_t>::max())) {
        throw std::runtime_error("peer list too large");
    }
    Message m;
    m.kind = Kind::PEERS;
    m.peers = peers;
    m.count = static_cast<int32_t>(peers.size());
    m.room_id = room_id;
    return m;
}

Message make_error(const std::string& text) {
    Message m;
    m.kind = Kind::ERROR;
    m.error = text;
    return m;
}

Message make_peer_disconnected(const std::string& peer_id, const std::string& mnemonic,
                               const std::string& room_id) {
    Message m;
    m.kind = Kind::PEER_DISCONNECTED;
    m.peer_id = peer_id;
    m.mnemonic = mnemonic;
    m.room_id = room_id;
    return m;
}

} // namespace proto
