#include "metadata.hpp"

#include "base64.hpp"

#include <algorithm>
#include <stdexcept>

#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace relaycp {

bool TransferMetadata::operator==(const TransferMetadata& o) const {
    return name == o.name &&
           total_size == o.total_size &&
           is_folder == o.is_folder &&
           original_folder_name == o.original_folder_name &&
           is_multiple_files == o.is_multiple_files &&
           hash == o.hash;
}

std::string metadata_to_json(const TransferMetadata& m) {
    json j;
    j["name"] = m.name;
    j["total_size"] = m.total_size;
    if (m.is_folder) j["is_folder"] = true;
    if (!m.original_folder_name.empty()) j["original_folder_name"] = m.original_folder_name;
    if (m.is_multiple_files) j["is_multiple_files"] = true;
    if (!m.hash.empty()) j["hash"] = m.hash;
    return j.dump();
}

TransferMetadata metadata_from_json(const std::string& json_text) {
    TransferMetadata m;
    try {
        json j = json::parse(json_text);
        if (!j.is_object()) throw std::runtime_error("metadata is not an object");
        m.name = j.value("name", std::string());
        auto size = j.find("total_size");
        if (size != j.end()) {
            if (!size->is_number_integer() || size->get<int64_t>() < 0) {
                throw std::runtime_error("metadata total_size is not a non-negative integer");
            }
            m.total_size = size->get<uint64_t>();
        }
        m.is_folder = j.value("is_folder", false);
        m.original_folder_name = j.value("original_folder_name", std::string());
        m.is_multiple_files = j.value("is_multiple_files", false);
        m.hash = j.value("hash", std::string());
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("metadata: ") + e.what());
    }
    return m;
}

SealedField seal_bytes(const uint8_t* data, size_t len, const crypto::Key& key) {
    crypto::Iv iv = crypto::AesGcm::RandomIv();
    auto sealed = crypto::AesGcm::Seal(data, len, key, iv);
    SealedField f;
    f.data_b64 = b64::encode(sealed);
    f.iv_b64 = b64::encode(std::vector<uint8_t>(iv.begin(), iv.end()));
    return f;
}

std::vector<uint8_t> open_bytes(const std::string& data_b64, const std::string& iv_b64, const crypto::Key& key) {
    auto iv_bytes = b64::decode(iv_b64);
    if (iv_bytes.size() != crypto::kGcmIvSize) {
        throw std::runtime_error("bad IV length: " + std::to_string(iv_bytes.size()));
    }
    crypto::Iv iv{};
    std::copy(iv_bytes.begin(), iv_bytes.end(), iv.begin());
    return crypto::AesGcm::Open(b64::decode(data_b64), key, iv);
}

SealedField seal_metadata(const TransferMetadata& m, const crypto::Key& key) {
    std::string plain = metadata_to_json(m);
    return seal_bytes(reinterpret_cast<const uint8_t*>(plain.data()), plain.size(), key);
}

TransferMetadata open_metadata(const SealedField& f, const crypto::Key& key) {
    auto plain = open_bytes(f.data_b64, f.iv_b64, key);
    return metadata_from_json(std::string(plain.begin(), plain.end()));
}

SealedField seal_text(const std::string& text, const crypto::Key& key) {
    return seal_bytes(reinterpret_cast<const uint8_t*>(text.data()), text.size(), key);
}

std::string open_text(const SealedField& f, const crypto::Key& key) {
    auto plain = open_bytes(f.data_b64, f.iv_b64, key);
    return std::string(plain.begin(), plain.end());
}

SealedField seal_transfer_kind(TransferKind kind, const crypto::Key& key) {
    json j;
    j["kind"] = kind == TransferKind::TEXT ? "text" : "file";
    return seal_text(j.dump(), key);
}

TransferKind open_transfer_kind(const SealedField& f, const crypto::Key& key) {
    std::string plain = open_text(f, key);
    std::string kind;
    try {
        json j = json::parse(plain);
        kind = j.at("kind").get<std::string>();
    } catch (const json::exception& e) {
        throw std::runtime_error(std::string("transfer tag: ") + e.what());
    }
    if (kind == "file") return TransferKind::FILE;
    if (kind == "text") return TransferKind::TEXT;
    throw std::runtime_error("transfer tag: unknown kind '" + kind + "'");
}

} // namespace relaycp
