#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <openssl/evp.h>

namespace relaycp {
namespace crypto {

using Byte = unsigned char;
static constexpr std::size_t kAesKeySize = 32;
static constexpr std::size_t kGcmIvSize = 12;
static constexpr std::size_t kGcmTagSize = 16;
static constexpr std::size_t kP256PointSize = 65; // 0x04 || X || Y
static constexpr std::size_t kSha256Size = 32;

using Key = std::array<Byte, kAesKeySize>;
using Iv = std::array<Byte, kGcmIvSize>;
using PubKey = std::array<Byte, kP256PointSize>;
using Digest = std::array<Byte, kSha256Size>;

void RandomBytes(Byte* out, std::size_t len);

// AES-256-GCM. Ciphertext output is body || 16-byte tag.
class AesGcm final {
public:
    static Iv RandomIv();
    static std::vector<Byte> Seal(const Byte* data, std::size_t len, const Key& key, const Iv& iv);
    static std::vector<Byte> Seal(const std::vector<Byte>& plain, const Key& key, const Iv& iv);
    // Throws std::runtime_error when the tag does not verify.
    static std::vector<Byte> Open(const std::vector<Byte>& sealed, const Key& key, const Iv& iv);
};

// Ephemeral P-256 key pair for ECDH.
class EcdhKeyPair final {
public:
    EcdhKeyPair();
    ~EcdhKeyPair();

    EcdhKeyPair(const EcdhKeyPair&) = delete;
    EcdhKeyPair& operator=(const EcdhKeyPair&) = delete;

    EcdhKeyPair(EcdhKeyPair&&) noexcept;
    EcdhKeyPair& operator=(EcdhKeyPair&&) noexcept;

    PubKey public_key_raw() const;
    // Throws on a point that is malformed or not on the curve.
    std::vector<Byte> DeriveSharedSecret(const PubKey& peer_public_key_raw) const;

    // HKDF-SHA256, empty salt, fixed info label.
    static Key DeriveSessionKey(const std::vector<Byte>& shared_secret);
    // The 32-byte shared secret used directly as the AES key.
    static Key SessionKeyFromSecret(const std::vector<Byte>& shared_secret);

private:
    struct PkeyDeleter {
        void operator()(EVP_PKEY* p) const noexcept;
    };
    using PkeyPtr = std::unique_ptr<EVP_PKEY, PkeyDeleter>;

    PkeyPtr key_pair_;
};

// Incremental SHA-256.
class Sha256 final {
public:
    Sha256();
    ~Sha256();

    Sha256(const Sha256&) = delete;
    Sha256& operator=(const Sha256&) = delete;

    void Update(const Byte* data, std::size_t len);
    Digest Final();

    static std::string HexDigest(const Byte* data, std::size_t len);

private:
    struct MdCtxDeleter {
        void operator()(EVP_MD_CTX* p) const noexcept;
    };
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx_;
    bool finished_ = false;
};

std::string HexDigest(const Digest& d);

} // namespace crypto
} // namespace relaycp
