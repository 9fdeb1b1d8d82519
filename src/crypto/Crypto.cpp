#include "Crypto.h"

#include <algorithm>
#include <limits>
#include <stdexcept>

#include <openssl/core_names.h>
#include <openssl/ec.h>
#include <openssl/err.h>
#include <openssl/kdf.h>
#include <openssl/obj_mac.h>
#include <openssl/params.h>
#include <openssl/rand.h>

#include "util.hpp"

namespace relaycp {
namespace crypto {
namespace {

inline void EnsureOpenSslInitialized() {
    static const int kInitOnce = []() -> int {
        OPENSSL_init_crypto(0, nullptr);
        return 1;
    }();
    (void)kInitOnce;
}

std::string GetOpenSslErrorString() {
    std::string out;
    for (;;) {
        unsigned long err = ERR_get_error();
        if (err == 0) break;
        char buf[256];
        ERR_error_string_n(err, buf, sizeof(buf));
        if (!out.empty()) out += " | ";
        out += buf;
    }
    return out.empty() ? std::string("unknown OpenSSL error") : out;
}

[[noreturn]] void ThrowOpenSslError(const char* where) {
    throw std::runtime_error(std::string(where) + ": " + GetOpenSslErrorString());
}

inline void CheckSizeFitsInt(std::size_t n, const char* what) {
    if (n > static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        throw std::runtime_error(std::string(what) + " too large for OpenSSL int length");
    }
}

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, decltype(&EVP_CIPHER_CTX_free)>;

CipherCtxPtr new_gcm_ctx(bool encrypt, const Key& key, const Iv& iv) {
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    if (!ctx) ThrowOpenSslError("EVP_CIPHER_CTX_new");
    CipherCtxPtr guard(ctx, EVP_CIPHER_CTX_free);

    const int enc = encrypt ? 1 : 0;
    if (EVP_CipherInit_ex(ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr, enc) != 1) {
        ThrowOpenSslError("EVP_CipherInit_ex(aes_256_gcm)");
    }
    if (EVP_CIPHER_CTX_ctrl(ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kGcmIvSize), nullptr) != 1) {
        ThrowOpenSslError("EVP_CTRL_GCM_SET_IVLEN");
    }
    if (EVP_CipherInit_ex(ctx, nullptr, nullptr, key.data(), iv.data(), enc) != 1) {
        ThrowOpenSslError("EVP_CipherInit_ex(key, iv)");
    }
    return guard;
}

EVP_PKEY* p256_keypair_new() {
    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_EC, nullptr);
    if (!pctx) ThrowOpenSslError("EVP_PKEY_CTX_new_id");
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> guard(pctx, EVP_PKEY_CTX_free);

    if (EVP_PKEY_keygen_init(pctx) != 1) ThrowOpenSslError("EVP_PKEY_keygen_init");
    if (EVP_PKEY_CTX_set_ec_paramgen_curve_nid(pctx, NID_X9_62_prime256v1) != 1) {
        ThrowOpenSslError("EVP_PKEY_CTX_set_ec_paramgen_curve_nid(P-256)");
    }

    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_keygen(pctx, &pkey) != 1 || !pkey) {
        ThrowOpenSslError("EVP_PKEY_keygen");
    }
    return pkey;
}

EVP_PKEY* p256_from_raw_pubkey(const PubKey& raw) {
    if (raw[0] != 0x04) throw std::runtime_error("public key is not an uncompressed point");

    char group[] = "prime256v1";
    OSSL_PARAM params[] = {
        OSSL_PARAM_construct_utf8_string(OSSL_PKEY_PARAM_GROUP_NAME, group, 0),
        OSSL_PARAM_construct_octet_string(OSSL_PKEY_PARAM_PUB_KEY,
                                          const_cast<Byte*>(raw.data()), raw.size()),
        OSSL_PARAM_construct_end()
    };

    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new_from_name(nullptr, "EC", nullptr);
    if (!ctx) ThrowOpenSslError("EVP_PKEY_CTX_new_from_name(EC)");
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> guard(ctx, EVP_PKEY_CTX_free);

    if (EVP_PKEY_fromdata_init(ctx) != 1) ThrowOpenSslError("EVP_PKEY_fromdata_init");
    EVP_PKEY* pkey = nullptr;
    if (EVP_PKEY_fromdata(ctx, &pkey, EVP_PKEY_PUBLIC_KEY, params) != 1 || !pkey) {
        ThrowOpenSslError("EVP_PKEY_fromdata(P-256 public key)");
    }
    return pkey;
}

} // namespace

void RandomBytes(Byte* out, std::size_t len) {
    EnsureOpenSslInitialized();
    CheckSizeFitsInt(len, "RAND_bytes size");
    if (len == 0) return;
    if (RAND_bytes(out, static_cast<int>(len)) != 1) ThrowOpenSslError("RAND_bytes");
}

// ---------------- AesGcm ----------------

Iv AesGcm::RandomIv() {
    Iv iv{};
    RandomBytes(iv.data(), iv.size());
    return iv;
}

std::vector<Byte> AesGcm::Seal(const Byte* data, std::size_t len, const Key& key, const Iv& iv) {
    EnsureOpenSslInitialized();
    CheckSizeFitsInt(len, "AES-GCM input size");

    CipherCtxPtr ctx = new_gcm_ctx(true, key, iv);

    std::vector<Byte> out(len + kGcmTagSize);
    int n = 0;
    if (len > 0) {
        if (EVP_EncryptUpdate(ctx.get(), out.data(), &n, data, static_cast<int>(len)) != 1) {
            ThrowOpenSslError("EVP_EncryptUpdate(gcm)");
        }
    }
    int fin = 0;
    if (EVP_EncryptFinal_ex(ctx.get(), out.data() + n, &fin) != 1) {
        ThrowOpenSslError("EVP_EncryptFinal_ex(gcm)");
    }
    std::size_t body = static_cast<std::size_t>(n + fin);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kGcmTagSize),
                            out.data() + body) != 1) {
        ThrowOpenSslError("EVP_CTRL_GCM_GET_TAG");
    }
    out.resize(body + kGcmTagSize);
    return out;
}

std::vector<Byte> AesGcm::Seal(const std::vector<Byte>& plain, const Key& key, const Iv& iv) {
    return Seal(plain.data(), plain.size(), key, iv);
}

std::vector<Byte> AesGcm::Open(const std::vector<Byte>& sealed, const Key& key, const Iv& iv) {
    EnsureOpenSslInitialized();
    if (sealed.size() < kGcmTagSize) throw std::runtime_error("AES-GCM input shorter than tag");
    CheckSizeFitsInt(sealed.size(), "AES-GCM input size");

    const std::size_t body = sealed.size() - kGcmTagSize;
    CipherCtxPtr ctx = new_gcm_ctx(false, key, iv);

    std::vector<Byte> out(body);
    int n = 0;
    if (body > 0) {
        if (EVP_DecryptUpdate(ctx.get(), out.data(), &n, sealed.data(), static_cast<int>(body)) != 1) {
            ThrowOpenSslError("EVP_DecryptUpdate(gcm)");
        }
    }
    Byte tag[kGcmTagSize];
    std::copy(sealed.begin() + static_cast<std::ptrdiff_t>(body), sealed.end(), tag);
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kGcmTagSize), tag) != 1) {
        ThrowOpenSslError("EVP_CTRL_GCM_SET_TAG");
    }
    int fin = 0;
    if (EVP_DecryptFinal_ex(ctx.get(), out.data() + n, &fin) != 1) {
        ERR_clear_error();
        throw std::runtime_error("AES-GCM authentication failed");
    }
    out.resize(static_cast<std::size_t>(n + fin));
    return out;
}

// ---------------- EcdhKeyPair ----------------

void EcdhKeyPair::PkeyDeleter::operator()(EVP_PKEY* p) const noexcept { EVP_PKEY_free(p); }

EcdhKeyPair::EcdhKeyPair() : key_pair_(nullptr) {
    EnsureOpenSslInitialized();
    key_pair_.reset(p256_keypair_new());
}

EcdhKeyPair::~EcdhKeyPair() = default;

EcdhKeyPair::EcdhKeyPair(EcdhKeyPair&& other) noexcept : key_pair_(std::move(other.key_pair_)) {}

EcdhKeyPair& EcdhKeyPair::operator=(EcdhKeyPair&& other) noexcept {
    if (this != &other) key_pair_ = std::move(other.key_pair_);
    return *this;
}

PubKey EcdhKeyPair::public_key_raw() const {
    if (!key_pair_) throw std::runtime_error("P-256 keypair not initialized");

    unsigned char* enc = nullptr;
    std::size_t len = EVP_PKEY_get1_encoded_public_key(key_pair_.get(), &enc);
    if (len == 0 || !enc) ThrowOpenSslError("EVP_PKEY_get1_encoded_public_key");
    std::unique_ptr<unsigned char, void (*)(unsigned char*)> guard(
        enc, [](unsigned char* p) { OPENSSL_free(p); });

    if (len != kP256PointSize || enc[0] != 0x04) {
        throw std::runtime_error("unexpected P-256 public key encoding");
    }
    PubKey out{};
    std::copy(enc, enc + len, out.begin());
    return out;
}

std::vector<Byte> EcdhKeyPair::DeriveSharedSecret(const PubKey& peer_public_key_raw) const {
    if (!key_pair_) throw std::runtime_error("P-256 keypair not initialized");

    EVP_PKEY* peer = p256_from_raw_pubkey(peer_public_key_raw);
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> peer_guard(peer, EVP_PKEY_free);

    EVP_PKEY_CTX* ctx = EVP_PKEY_CTX_new(key_pair_.get(), nullptr);
    if (!ctx) ThrowOpenSslError("EVP_PKEY_CTX_new");
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx_guard(ctx, EVP_PKEY_CTX_free);

    if (EVP_PKEY_derive_init(ctx) != 1) ThrowOpenSslError("EVP_PKEY_derive_init");
    if (EVP_PKEY_derive_set_peer(ctx, peer) != 1) ThrowOpenSslError("EVP_PKEY_derive_set_peer");

    std::size_t secret_len = 0;
    if (EVP_PKEY_derive(ctx, nullptr, &secret_len) != 1 || secret_len == 0) {
        ThrowOpenSslError("EVP_PKEY_derive(size)");
    }

    std::vector<Byte> secret(secret_len);
    if (EVP_PKEY_derive(ctx, secret.data(), &secret_len) != 1) {
        ThrowOpenSslError("EVP_PKEY_derive(data)");
    }
    secret.resize(secret_len);
    return secret;
}

Key EcdhKeyPair::SessionKeyFromSecret(const std::vector<Byte>& shared_secret) {
    Key key{};
    if (shared_secret.size() != key.size()) {
        throw std::runtime_error("shared secret has wrong length: " + std::to_string(shared_secret.size()));
    }
    std::copy(shared_secret.begin(), shared_secret.end(), key.begin());
    return key;
}

Key EcdhKeyPair::DeriveSessionKey(const std::vector<Byte>& shared_secret) {
    EnsureOpenSslInitialized();
    if (shared_secret.empty()) throw std::runtime_error("shared secret is empty");
    CheckSizeFitsInt(shared_secret.size(), "HKDF input size");

    static const char kInfo[] = "relaycp-ecdh-aes-256-gcm";
    Key key{};

    EVP_PKEY_CTX* pctx = EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr);
    if (!pctx) ThrowOpenSslError("EVP_PKEY_CTX_new_id(HKDF)");
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> pctx_guard(pctx, EVP_PKEY_CTX_free);

    if (EVP_PKEY_derive_init(pctx) != 1) ThrowOpenSslError("EVP_PKEY_derive_init(HKDF)");
    if (EVP_PKEY_CTX_set_hkdf_md(pctx, EVP_sha256()) != 1) ThrowOpenSslError("EVP_PKEY_CTX_set_hkdf_md");
    if (EVP_PKEY_CTX_set1_hkdf_salt(pctx, nullptr, 0) != 1) ThrowOpenSslError("EVP_PKEY_CTX_set1_hkdf_salt");
    if (EVP_PKEY_CTX_set1_hkdf_key(pctx, shared_secret.data(), static_cast<int>(shared_secret.size())) != 1) {
        ThrowOpenSslError("EVP_PKEY_CTX_set1_hkdf_key");
    }
    if (EVP_PKEY_CTX_add1_hkdf_info(pctx, reinterpret_cast<const unsigned char*>(kInfo),
                                    static_cast<int>(sizeof(kInfo) - 1)) != 1) {
        ThrowOpenSslError("EVP_PKEY_CTX_add1_hkdf_info");
    }

    std::size_t out_len = key.size();
    if (EVP_PKEY_derive(pctx, key.data(), &out_len) != 1) {
        ThrowOpenSslError("EVP_PKEY_derive(HKDF)");
    }
    if (out_len != key.size()) throw std::runtime_error("HKDF output length mismatch");
    return key;
}

// ---------------- Sha256 ----------------

void Sha256::MdCtxDeleter::operator()(EVP_MD_CTX* p) const noexcept { EVP_MD_CTX_free(p); }

Sha256::Sha256() : ctx_(EVP_MD_CTX_new()) {
    EnsureOpenSslInitialized();
    if (!ctx_) ThrowOpenSslError("EVP_MD_CTX_new");
    if (EVP_DigestInit_ex(ctx_.get(), EVP_sha256(), nullptr) != 1) {
        ThrowOpenSslError("EVP_DigestInit_ex(sha256)");
    }
}

Sha256::~Sha256() = default;

void Sha256::Update(const Byte* data, std::size_t len) {
    if (finished_) throw std::runtime_error("SHA-256 already finalized");
    if (len == 0) return;
    if (EVP_DigestUpdate(ctx_.get(), data, len) != 1) ThrowOpenSslError("EVP_DigestUpdate");
}

Digest Sha256::Final() {
    if (finished_) throw std::runtime_error("SHA-256 already finalized");
    Digest d{};
    unsigned int n = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), d.data(), &n) != 1 || n != d.size()) {
        ThrowOpenSslError("EVP_DigestFinal_ex");
    }
    finished_ = true;
    return d;
}

std::string Sha256::HexDigest(const Byte* data, std::size_t len) {
    Sha256 h;
    h.Update(data, len);
    return crypto::HexDigest(h.Final());
}

std::string HexDigest(const Digest& d) {
    return to_hex(d.data(), d.size());
}

} // namespace crypto
} // namespace relaycp
