#include "tus/protocol/base64.hpp"
#include "tus/protocol/metadata_codec.hpp"

#include <gtest/gtest.h>

using tus::ErrorKind;
using tus::protocol::Metadata;
using tus::protocol::decode_metadata;
using tus::protocol::encode_metadata;

TEST(Base64Test, EncodesWithPadding) {
    EXPECT_EQ(tus::protocol::base64_encode(std::string("")), "");
    EXPECT_EQ(tus::protocol::base64_encode(std::string("f")), "Zg==");
    EXPECT_EQ(tus::protocol::base64_encode(std::string("fo")), "Zm8=");
    EXPECT_EQ(tus::protocol::base64_encode(std::string("foo")), "Zm9v");
    EXPECT_EQ(tus::protocol::base64_encode(std::string("world_domination_plan.pdf")),
              "d29ybGRfZG9taW5hdGlvbl9wbGFuLnBkZg==");
}

TEST(Base64Test, DecodeStripsPadding) {
    auto decoded = tus::protocol::base64_decode("Zm8=");
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(std::string(decoded.value().begin(), decoded.value().end()), "fo");
}

TEST(Base64Test, DecodeRejectsInvalidInput) {
    EXPECT_TRUE(tus::protocol::base64_decode("Zm8").is_error());     // missing padding
    EXPECT_TRUE(tus::protocol::base64_decode("Zm$v").is_error());    // stray character
    EXPECT_TRUE(tus::protocol::base64_decode("Zg=v").is_error());    // padding in the middle
    EXPECT_TRUE(tus::protocol::base64_decode("Zm 9v").is_error());   // whitespace
}

TEST(MetadataCodecTest, EncodesSortedPairs) {
    Metadata metadata{{"filename", "world_domination_plan.pdf"}, {"is_confidential", ""}};

    auto encoded = encode_metadata(metadata);
    ASSERT_TRUE(encoded.is_ok());
    EXPECT_EQ(encoded.value(), "filename d29ybGRfZG9taW5hdGlvbl9wbGFuLnBkZg==,is_confidential");
}

TEST(MetadataCodecTest, EmptyMetadataEncodesToEmptyString) {
    auto encoded = encode_metadata({});
    ASSERT_TRUE(encoded.is_ok());
    EXPECT_TRUE(encoded.value().empty());
}

TEST(MetadataCodecTest, RoundTripPreservesArbitraryValues) {
    Metadata metadata{
        {"filename", "r\xC3\xA9sum\xC3\xA9 final (2).pdf"},
        {"filetype", "application/pdf"},
        {"notes", std::string("line1\nline2,with comma\0nul", 26)},
        {"empty", ""},
    };

    auto encoded = encode_metadata(metadata);
    ASSERT_TRUE(encoded.is_ok());
    auto decoded = decode_metadata(encoded.value());
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value(), metadata);
}

TEST(MetadataCodecTest, RejectsInvalidKeys) {
    EXPECT_EQ(encode_metadata({{"", "x"}}).error().kind, ErrorKind::InvalidMetadataKey);
    EXPECT_EQ(encode_metadata({{"file name", "x"}}).error().kind, ErrorKind::InvalidMetadataKey);
    EXPECT_EQ(encode_metadata({{"a,b", "x"}}).error().kind, ErrorKind::InvalidMetadataKey);
    EXPECT_EQ(encode_metadata({{"tab\tkey", "x"}}).error().kind, ErrorKind::InvalidMetadataKey);
}

TEST(MetadataCodecTest, DecodeToleratesSpacesAroundPairs) {
    auto decoded = decode_metadata(" filename Zm9v , flag ");
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(decoded.value().at("filename"), "foo");
    EXPECT_EQ(decoded.value().at("flag"), "");
}

TEST(MetadataCodecTest, DecodeRejectsMalformedValues) {
    EXPECT_EQ(decode_metadata("filename Zm9").error().kind, ErrorKind::MalformedMetadata);
    EXPECT_EQ(decode_metadata("filename Zm9v extra").error().kind, ErrorKind::MalformedMetadata);
    EXPECT_EQ(decode_metadata("a Zm9v,,b Zm9v").error().kind, ErrorKind::MalformedMetadata);
    EXPECT_EQ(decode_metadata("a Zm9v,a Zm9v").error().kind, ErrorKind::MalformedMetadata);
}
