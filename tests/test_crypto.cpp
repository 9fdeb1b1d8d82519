#include <gtest/gtest.h>

#include "crypto/Crypto.h"

#include <algorithm>
#include <string>

using namespace relaycp::crypto;

namespace {

Key test_key(Byte fill) {
    Key k{};
    k.fill(fill);
    return k;
}

} // namespace

TEST(Crypto, Sha256KnownDigest) {
    const std::string abc = "abc";
    EXPECT_EQ(Sha256::HexDigest(reinterpret_cast<const Byte*>(abc.data()), abc.size()),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
    EXPECT_EQ(Sha256::HexDigest(nullptr, 0),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
}

TEST(Crypto, Sha256IncrementalMatchesOneShot) {
    const std::string text = "the quick brown fox jumps over the lazy dog";
    Sha256 h;
    h.Update(reinterpret_cast<const Byte*>(text.data()), 10);
    h.Update(reinterpret_cast<const Byte*>(text.data()) + 10, text.size() - 10);
    EXPECT_EQ(HexDigest(h.Final()),
              Sha256::HexDigest(reinterpret_cast<const Byte*>(text.data()), text.size()));
}

TEST(Crypto, GcmSealAppendsTagAndOpens) {
    Key key = test_key(0x11);
    Iv iv = AesGcm::RandomIv();
    std::vector<Byte> plain{'h', 'e', 'l', 'l', 'o'};

    auto sealed = AesGcm::Seal(plain, key, iv);
    EXPECT_EQ(sealed.size(), plain.size() + kGcmTagSize);
    EXPECT_EQ(AesGcm::Open(sealed, key, iv), plain);
}

TEST(Crypto, GcmEmptyPlaintext) {
    Key key = test_key(0x22);
    Iv iv = AesGcm::RandomIv();
    auto sealed = AesGcm::Seal(std::vector<Byte>{}, key, iv);
    EXPECT_EQ(sealed.size(), kGcmTagSize);
    EXPECT_TRUE(AesGcm::Open(sealed, key, iv).empty());
}

TEST(Crypto, GcmRejectsTamperingAndWrongKey) {
    Key key = test_key(0x33);
    Iv iv = AesGcm::RandomIv();
    std::vector<Byte> plain(100, 0x5A);
    auto sealed = AesGcm::Seal(plain, key, iv);

    auto flipped = sealed;
    flipped[3] ^= 0x01;
    EXPECT_THROW(AesGcm::Open(flipped, key, iv), std::runtime_error);
    EXPECT_THROW(AesGcm::Open(sealed, test_key(0x34), iv), std::runtime_error);

    Iv other = iv;
    other[0] ^= 0xFF;
    EXPECT_THROW(AesGcm::Open(sealed, key, other), std::runtime_error);

    std::vector<Byte> short_input(kGcmTagSize - 1, 0);
    EXPECT_THROW(AesGcm::Open(short_input, key, iv), std::runtime_error);
}

TEST(Crypto, RandomIvsDiffer) {
    EXPECT_NE(AesGcm::RandomIv(), AesGcm::RandomIv());
}

TEST(Crypto, EcdhBothSidesDeriveTheSameKey) {
    EcdhKeyPair a;
    EcdhKeyPair b;
    PubKey pa = a.public_key_raw();
    PubKey pb = b.public_key_raw();
    EXPECT_EQ(pa[0], 0x04);
    EXPECT_NE(pa, pb);

    auto sa = a.DeriveSharedSecret(pb);
    auto sb = b.DeriveSharedSecret(pa);
    EXPECT_EQ(sa, sb);
    EXPECT_EQ(EcdhKeyPair::DeriveSessionKey(sa), EcdhKeyPair::DeriveSessionKey(sb));
    EXPECT_NE(EcdhKeyPair::DeriveSessionKey(sa), EcdhKeyPair::DeriveSessionKey(a.DeriveSharedSecret(EcdhKeyPair().public_key_raw())));
}

TEST(Crypto, RawSessionKeyIsTheSharedSecret) {
    EcdhKeyPair a;
    EcdhKeyPair b;
    auto secret = a.DeriveSharedSecret(b.public_key_raw());
    ASSERT_EQ(secret.size(), kAesKeySize);
    Key key = EcdhKeyPair::SessionKeyFromSecret(secret);
    EXPECT_TRUE(std::equal(key.begin(), key.end(), secret.begin()));
    EXPECT_NE(key, EcdhKeyPair::DeriveSessionKey(secret));

    secret.pop_back();
    EXPECT_THROW(EcdhKeyPair::SessionKeyFromSecret(secret), std::runtime_error);
}

TEST(Crypto, EcdhRejectsPointOffCurve) {
    EcdhKeyPair a;
    PubKey bogus{};
    bogus[0] = 0x04;
    bogus[1] = 0x01;
    EXPECT_THROW(a.DeriveSharedSecret(bogus), std::runtime_error);
}

TEST(Crypto, KeyPairMoves) {
    EcdhKeyPair a;
    PubKey before = a.public_key_raw();
    EcdhKeyPair moved(std::move(a));
    EXPECT_EQ(moved.public_key_raw(), before);
}
