#include "tus/upload/metadata.hpp"

#include <gtest/gtest.h>

using tus::ErrorCode;
using tus::upload::decode_base64;
using tus::upload::encode_base64;
using tus::upload::format_metadata;
using tus::upload::Metadata;
using tus::upload::parse_metadata;

TEST(Base64Test, EncodesWithPadding) {
    EXPECT_EQ(encode_base64(""), "");
    EXPECT_EQ(encode_base64("f"), "Zg==");
    EXPECT_EQ(encode_base64("fo"), "Zm8=");
    EXPECT_EQ(encode_base64("foo"), "Zm9v");
    EXPECT_EQ(encode_base64("world_domination_plan.pdf"), "d29ybGRfZG9taW5hdGlvbl9wbGFuLnBkZg==");
}

TEST(Base64Test, DecodesValidInput) {
    EXPECT_EQ(decode_base64("Zm9vYmFy").value(), "foobar");
    EXPECT_EQ(decode_base64("Zm8=").value(), "fo");
    EXPECT_EQ(decode_base64("").value(), "");
}

TEST(Base64Test, RejectsMalformedInput) {
    EXPECT_TRUE(decode_base64("Zm8").is_error());     // missing padding
    EXPECT_TRUE(decode_base64("Zm8*").is_error());    // outside alphabet
    EXPECT_TRUE(decode_base64("Z=8=").is_error());    // padding in the middle
    EXPECT_TRUE(decode_base64("A===").is_error());
    EXPECT_TRUE(decode_base64("Zm 9").is_error());
    EXPECT_TRUE(decode_base64(" Zm9").is_error());   // leading whitespace
    EXPECT_TRUE(decode_base64("Zm9\n").is_error());
    EXPECT_TRUE(decode_base64("Zm=v").is_error());
}

TEST(Base64Test, DecodesBinaryAndStripsPadding) {
    EXPECT_EQ(decode_base64("AA==").value(), std::string(1, '\0'));
    EXPECT_EQ(decode_base64("AP8=").value(), std::string("\x00\xff", 2));
    EXPECT_EQ(decode_base64(encode_base64("world_domination_plan.pdf")).value(), "world_domination_plan.pdf");
}

TEST(MetadataParserTest, ParsesPairs) {
    auto parsed = parse_metadata("filename d29ybGRfZG9taW5hdGlvbl9wbGFuLnBkZg==,is_confidential");
    ASSERT_TRUE(parsed.is_ok());

    const auto& metadata = parsed.value();
    ASSERT_EQ(metadata.size(), 2u);
    EXPECT_EQ(metadata.at("filename"), "world_domination_plan.pdf");
    EXPECT_EQ(metadata.at("is_confidential"), "");
}

TEST(MetadataParserTest, ToleratesWhitespaceAroundPairs) {
    auto parsed = parse_metadata("  filename Zm9v ,  type YmFy");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value().at("filename"), "foo");
    EXPECT_EQ(parsed.value().at("type"), "bar");
}

TEST(MetadataParserTest, EmptyHeaderIsEmptyMap) {
    auto parsed = parse_metadata("   ");
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_TRUE(parsed.value().empty());
}

TEST(MetadataParserTest, RejectsMalformedHeaders) {
    const char* malformed[] = {
        "filename Zm9v,,type YmFy",    // empty pair
        "filename Zm9v,",              // trailing comma
        "filename Zm9v,filename YmFy", // duplicate key
        "filename Zm9",                // bad base64
        "filename Zm9v YmFy",          // extra token
        "fil\x01name Zm9v",            // control character in key
    };

    for (const auto* header : malformed) {
        auto parsed = parse_metadata(header);
        ASSERT_TRUE(parsed.is_error()) << header;
        EXPECT_EQ(parsed.error().code, ErrorCode::ProtocolViolation) << header;
    }
}

TEST(MetadataParserTest, FormatIsAcceptedByParser) {
    Metadata metadata{{"filename", "photo.jpg"}, {"flag", ""}, {"raw", std::string("\x00\x01\x02", 3)}};

    const auto header = format_metadata(metadata);
    EXPECT_NE(header.find(",flag,"), std::string::npos);

    auto parsed = parse_metadata(header);
    ASSERT_TRUE(parsed.is_ok());
    EXPECT_EQ(parsed.value(), metadata);
}
