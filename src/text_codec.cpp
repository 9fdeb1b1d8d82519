#include "text_codec.hpp"

#include <limits>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace proto {

namespace {

void put_str(json& j, const char* key, const std::string& v) {
    if (!v.empty()) j[key] = v;
}

void put_int(json& j, const char* key, int32_t v) {
    if (v != 0) j[key] = v;
}

void get_str(const json& j, const char* key, std::string& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if (!it->is_string()) throw std::runtime_error(std::string("field '") + key + "' is not a string");
    out = it->get<std::string>();
}

void get_int(const json& j, const char* key, int32_t& out) {
    auto it = j.find(key);
    if (it == j.end() || it->is_null()) return;
    if (!it->is_number_integer()) throw std::runtime_error(std::string("field '") + key + "' is not an integer");
    int64_t v = it->get<int64_t>();
    if (v < std::numeric_limits<int32_t>::min() || v > std::numeric_limits<int32_t>::max()) {
        throw std::runtime_error(std::string("field '") + key + "' out of range");
    }
    out = static_cast<int32_t>(v);
}

} // namespace

std::string encode_text(const Message& m) {
    json j = json::object();
    j["type"] = m.type_name();
    put_str(j, "from", m.from);
    put_str(j, "mnemonic", m.mnemonic);
    put_str(j, "roomId", m.room_id);
    put_str(j, "clientId", m.client_id);
    put_str(j, "pub", m.pub);
    put_str(j, "iv_b64", m.iv_b64);
    put_str(j, "data_b64", m.data_b64);
    put_str(j, "chunk_data", m.chunk_data);
    put_int(j, "chunk_num", m.chunk_num);
    put_str(j, "selfId", m.self_id);
    if (!m.peers.empty()) j["peers"] = m.peers;
    put_int(j, "count", m.count);
    put_str(j, "error", m.error);
    put_str(j, "encrypted_metadata", m.encrypted_metadata);
    put_str(j, "metadata_iv", m.metadata_iv);
    put_str(j, "peerId", m.peer_id);
    return j.dump();
}

Message decode_text(const std::string& text) {
    json j;
    try {
        j = json::parse(text);
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("json: ") + e.what());
    }
    if (!j.is_object()) throw std::runtime_error("json: not an object");

    Message m;
    std::string type;
    get_str(j, "type", type);
    if (type.empty()) throw std::runtime_error("json: missing type");
    m.kind = kind_from_name(type);
    m.type = type;

    get_str(j, "roomId", m.room_id);
    get_str(j, "clientId", m.client_id);
    get_str(j, "pub", m.pub);
    get_str(j, "iv_b64", m.iv_b64);
    get_str(j, "data_b64", m.data_b64);
    get_str(j, "chunk_data", m.chunk_data);
    get_int(j, "chunk_num", m.chunk_num);
    get_str(j, "encrypted_metadata", m.encrypted_metadata);
    get_str(j, "metadata_iv", m.metadata_iv);
    get_str(j, "from", m.from);
    get_str(j, "mnemonic", m.mnemonic);
    get_str(j, "selfId", m.self_id);
    get_int(j, "count", m.count);
    get_str(j, "error", m.error);
    get_str(j, "peerId", m.peer_id);

    auto peers = j.find("peers");
    if (peers != j.end() && !peers->is_null()) {
        if (!peers->is_array()) throw std::runtime_error("json: peers is not an array");
        for (const auto& p : *peers) {
            if (!p.is_string()) throw std::runtime_error("json: peer id is not a string");
            m.peers.push_back(p.get<std::string>());
        }
    }
    return m;
}

} // namespace proto
