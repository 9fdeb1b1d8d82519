#include <gtest/gtest.h>

#include "metadata.hpp"

#include <nlohmann/json.hpp>

using namespace relaycp;

namespace {

crypto::Key key_of(uint8_t b) {
    crypto::Key k{};
    k.fill(b);
    return k;
}

} // namespace

TEST(Metadata, JsonUsesEnvelopeFieldNames) {
    TransferMetadata m;
    m.name = "report.pdf";
    m.total_size = 24;
    m.hash = "abcd";
    auto j = nlohmann::json::parse(metadata_to_json(m));
    EXPECT_EQ(j["name"], "report.pdf");
    EXPECT_EQ(j["total_size"], 24);
    EXPECT_EQ(j["hash"], "abcd");
    EXPECT_FALSE(j.contains("is_folder"));
    EXPECT_FALSE(j.contains("original_folder_name"));
}

TEST(Metadata, ParsesFieldsFromOtherImplementations) {
    auto m = metadata_from_json(
        R"({"name":"photos.zip","total_size":1048576,"is_folder":true,)"
        R"("original_folder_name":"photos","is_multiple_files":false,"extra":1})");
    EXPECT_EQ(m.name, "photos.zip");
    EXPECT_EQ(m.total_size, 1048576u);
    EXPECT_TRUE(m.is_folder);
    EXPECT_EQ(m.original_folder_name, "photos");
    EXPECT_FALSE(m.is_multiple_files);
    EXPECT_TRUE(m.hash.empty());
}

TEST(Metadata, RejectsMalformedJson) {
    EXPECT_THROW(metadata_from_json("{"), std::runtime_error);
    EXPECT_THROW(metadata_from_json("[1,2]"), std::runtime_error);
    EXPECT_THROW(metadata_from_json(R"({"name":"a","total_size":-1})"), std::runtime_error);
    EXPECT_THROW(metadata_from_json(R"({"name":"a","total_size":"big"})"), std::runtime_error);
    EXPECT_THROW(metadata_from_json(R"({"name":7})"), std::runtime_error);
}

TEST(Metadata, SealedMetadataOpensOnlyWithTheSameKey) {
    TransferMetadata m;
    m.name = "a.txt";
    m.total_size = 3;
    m.is_multiple_files = true;
    m.hash = std::string(64, 'f');

    SealedField f = seal_metadata(m, key_of(1));
    EXPECT_EQ(open_metadata(f, key_of(1)), m);
    EXPECT_THROW(open_metadata(f, key_of(2)), std::runtime_error);
}

TEST(Metadata, EverySealUsesAFreshIv) {
    SealedField a = seal_text("same", key_of(3));
    SealedField b = seal_text("same", key_of(3));
    EXPECT_NE(a.iv_b64, b.iv_b64);
    EXPECT_NE(a.data_b64, b.data_b64);
    EXPECT_EQ(open_text(a, key_of(3)), "same");
}

TEST(Metadata, TransferKindTag) {
    EXPECT_EQ(open_transfer_kind(seal_transfer_kind(TransferKind::FILE, key_of(4)), key_of(4)),
              TransferKind::FILE);
    EXPECT_EQ(open_transfer_kind(seal_transfer_kind(TransferKind::TEXT, key_of(4)), key_of(4)),
              TransferKind::TEXT);
}

TEST(Metadata, OpenBytesRejectsBadIv) {
    SealedField f = seal_text("x", key_of(5));
    EXPECT_THROW(open_bytes(f.data_b64, "AAAA", key_of(5)), std::runtime_error);
    EXPECT_THROW(open_bytes("%%%%", f.iv_b64, key_of(5)), std::runtime_error);
}
