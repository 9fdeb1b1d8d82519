#include <gtest/gtest.h>

#include "base64.hpp"

TEST(Base64, KnownVectors) {
    EXPECT_EQ(b64::encode(std::string("")), "");
    EXPECT_EQ(b64::encode(std::string("f")), "Zg==");
    EXPECT_EQ(b64::encode(std::string("fo")), "Zm8=");
    EXPECT_EQ(b64::encode(std::string("foo")), "Zm9v");
    EXPECT_EQ(b64::encode(std::string("foobar")), "Zm9vYmFy");
}

TEST(Base64, DecodeStripsPadding) {
    auto one = b64::decode("Zg==");
    ASSERT_EQ(one.size(), 1u);
    EXPECT_EQ(one[0], 'f');
    auto two = b64::decode("Zm8=");
    EXPECT_EQ(two.size(), 2u);
    EXPECT_TRUE(b64::decode("").empty());
}

TEST(Base64, BinaryRoundTrip) {
    std::vector<uint8_t> data;
    for (int i = 0; i < 256; ++i) data.push_back(static_cast<uint8_t>(i));
    EXPECT_EQ(b64::decode(b64::encode(data)), data);
}

TEST(Base64, RejectsMalformedInput) {
    EXPECT_THROW(b64::decode("abc"), std::runtime_error);
    EXPECT_THROW(b64::decode("ab!d"), std::runtime_error);
}
