/**
 * @file object_id_codec_test.cpp
 * @brief Unit tests for ObjectId string validation, decoding and encoding
 */

#include "oid/object_id_codec.h"

#include <gtest/gtest.h>

#include <string>

using namespace mongokit::oid;
using mongokit::utils::ErrorCode;

namespace {
constexpr const char* kValidId = "507f1f77bcf86cd799439011";
}  // namespace

// ===========================================================================
// Decoding
// ===========================================================================

TEST(ObjectIdCodecTest, DecodeValidId) {
  auto result = DecodeObjectId(kValidId);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->to_string(), kValidId);
}

TEST(ObjectIdCodecTest, DecodeEmptyStringIsBadLength) {
  auto result = DecodeObjectId("");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kIdBadLength);
}

TEST(ObjectIdCodecTest, DecodeWrongLengths) {
  for (const std::string& input : {std::string("507f1f77bcf86cd79943901"), std::string("507f1f77bcf86cd7994390111"),
                                   std::string(48, 'a'), std::string("abc")}) {
    auto result = DecodeObjectId(input);
    ASSERT_FALSE(result.has_value()) << input;
    EXPECT_EQ(result.error().code(), ErrorCode::kIdBadLength) << input;
  }
}

TEST(ObjectIdCodecTest, DecodeNonHexCharacter) {
  auto result = DecodeObjectId("507f1f77bcf86cd79943901z");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kIdNotHex);
  EXPECT_NE(result.error().message().find("position 23"), std::string::npos);
}

TEST(ObjectIdCodecTest, DecodeAllNonHex) {
  auto result = DecodeObjectId(std::string(24, 'g'));

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kIdNotHex);
}

/**
 * @brief Length is checked before content
 */
TEST(ObjectIdCodecTest, LengthCheckedBeforeHex) {
  auto result = DecodeObjectId("not-hex-and-too-short");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kIdBadLength);
}

TEST(ObjectIdCodecTest, DecodeRejectsEmbeddedSpace) {
  auto result = DecodeObjectId("507f1f77bcf86cd79943 011");

  ASSERT_FALSE(result.has_value());
  EXPECT_EQ(result.error().code(), ErrorCode::kIdNotHex);
}

TEST(ObjectIdCodecTest, DecodeAcceptsUppercaseAndEncodesLowercase) {
  auto result = DecodeObjectId("507F1F77BCF86CD799439011");

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(EncodeObjectId(*result), kValidId);
}

// ===========================================================================
// Validation helpers
// ===========================================================================

TEST(ObjectIdCodecTest, ValidateObjectIdString) {
  EXPECT_TRUE(ValidateObjectIdString(kValidId).has_value());

  auto too_short = ValidateObjectIdString("1234");
  ASSERT_FALSE(too_short.has_value());
  EXPECT_EQ(too_short.error().code(), ErrorCode::kIdBadLength);
  EXPECT_EQ(too_short.error().message(), "ID must be 24 characters long, got 4");
}

TEST(ObjectIdCodecTest, IsValidObjectIdString) {
  EXPECT_TRUE(IsValidObjectIdString(kValidId));
  EXPECT_TRUE(IsValidObjectIdString("000000000000000000000000"));
  EXPECT_FALSE(IsValidObjectIdString(""));
  EXPECT_FALSE(IsValidObjectIdString("xyz"));
  EXPECT_FALSE(IsValidObjectIdString("507f1f77bcf86cd79943901g"));
}

// ===========================================================================
// Encoding
// ===========================================================================

TEST(ObjectIdCodecTest, EncodeProducesCanonicalHex) {
  bsoncxx::oid generated;
  std::string encoded = EncodeObjectId(generated);

  EXPECT_EQ(encoded.size(), kObjectIdHexLength);
  EXPECT_TRUE(IsValidObjectIdString(encoded));
  for (char chr : encoded) {
    EXPECT_FALSE(chr >= 'A' && chr <= 'F') << encoded;
  }
}

TEST(ObjectIdCodecTest, EncodeThenDecodeIsIdentity) {
  bsoncxx::oid generated;

  auto decoded = DecodeObjectId(EncodeObjectId(generated));

  ASSERT_TRUE(decoded.has_value());
  EXPECT_EQ(*decoded, generated);
}
