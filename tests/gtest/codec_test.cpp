/**
 * @file codec_test.cpp
 * @brief Frame codec and address/length format encoding
 */

#include <gtest/gtest.h>
#include "ecudiag/codec.hpp"

using namespace ecudiag;

// ============================================================================
// Encode
// ============================================================================

TEST(CodecTest, EncodeIsSidFollowedByParams) {
  EXPECT_EQ(codec::encode(SID::ReadDataByIdentifier, {0xF1, 0x90}), (Bytes{0x22, 0xF1, 0x90}));
  EXPECT_EQ(codec::encode(0x3E, {}), (Bytes{0x3E}));
}

TEST(CodecTest, ServerSideFraming) {
  EXPECT_EQ(codec::encode_positive_response(0x22, {0xF1, 0x90, 0x41}),
            (Bytes{0x62, 0xF1, 0x90, 0x41}));
  EXPECT_EQ(codec::encode_negative_response(0x27, nrc::Code::InvalidKey),
            (Bytes{0x7F, 0x27, 0x35}));
  EXPECT_EQ(codec::encode_negative_response(0x31, 0x22, {0x01}),
            (Bytes{0x7F, 0x31, 0x22, 0x01}));
}

// ============================================================================
// Decode
// ============================================================================

TEST(CodecTest, DecodePositive) {
  auto r = codec::decode(0x22, {0x62, 0xF1, 0x90, 'W', 'V', 'W'});
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.service_id, 0x22);
  EXPECT_EQ(r.data, (Bytes{0xF1, 0x90, 'W', 'V', 'W'}));
}

TEST(CodecTest, DecodePositiveWithNoData) {
  auto r = codec::decode(0x37, {0x77});
  ASSERT_TRUE(r.ok());
  EXPECT_TRUE(r.data.empty());
}

TEST(CodecTest, DecodePositiveForHighServiceIds) {
  auto r = codec::decode(0x85, {0xC5, 0x02});
  ASSERT_TRUE(r.ok());
  EXPECT_EQ(r.data, (Bytes{0x02}));
}

TEST(CodecTest, DecodeNegativeKeepsTrailingBytes) {
  auto r = codec::decode(0x31, {0x7F, 0x31, 0x22, 0xAA, 0xBB});
  ASSERT_TRUE(r.is_negative());
  EXPECT_EQ(r.service_id, 0x31);
  EXPECT_EQ(r.nrc.service_id, 0x31);
  EXPECT_EQ(r.nrc.code, nrc::Code::ConditionsNotCorrect);
  EXPECT_EQ(r.nrc.raw, 0x22);
  EXPECT_TRUE(r.nrc.is_known());
  EXPECT_EQ(r.data, (Bytes{0xAA, 0xBB}));
}

TEST(CodecTest, DecodeUnknownNrcKeepsRawByte) {
  auto r = codec::decode(0x22, {0x7F, 0x22, 0xF4});
  ASSERT_TRUE(r.is_negative());
  EXPECT_EQ(r.nrc.code, nrc::Code::Unknown);
  EXPECT_EQ(r.nrc.raw, 0xF4);
  EXPECT_FALSE(r.nrc.is_known());
}

TEST(CodecTest, DecodeNegativeEchoesOtherService) {
  // Correlation is the transaction manager's job; the codec reports what it saw.
  auto r = codec::decode(0x22, {0x7F, 0x2E, 0x31});
  ASSERT_TRUE(r.is_negative());
  EXPECT_EQ(r.nrc.service_id, 0x2E);
}

TEST(CodecTest, DecodeEmptyIsMalformed) {
  auto r = codec::decode(0x22, {});
  EXPECT_TRUE(r.is_malformed());
}

TEST(CodecTest, DecodeTruncatedNegativeIsMalformed) {
  EXPECT_TRUE(codec::decode(0x22, {0x7F}).is_malformed());
  auto r = codec::decode(0x22, {0x7F, 0x22});
  EXPECT_TRUE(r.is_malformed());
  EXPECT_EQ(r.data, (Bytes{0x7F, 0x22}));
}

TEST(CodecTest, DecodeUnexpectedSidIsMalformed) {
  auto r = codec::decode(0x22, {0x50, 0x03});
  EXPECT_TRUE(r.is_malformed());
  EXPECT_EQ(r.data, (Bytes{0x50, 0x03}));
}

TEST(CodecTest, DecodeHandlesEveryShortBuffer) {
  for (int a = 0; a < 256; ++a) {
    auto one = codec::decode(0x10, {static_cast<uint8_t>(a)});
    if (a == 0x7F) {
      EXPECT_TRUE(one.is_malformed());
    }
    for (int b = 0; b < 256; ++b) {
      auto two = codec::decode(0x10, {static_cast<uint8_t>(a), static_cast<uint8_t>(b)});
      if (a == 0x7F) {
        EXPECT_TRUE(two.is_malformed());
      } else if (a == 0x50) {
        EXPECT_TRUE(two.ok());
      } else {
        EXPECT_TRUE(two.is_malformed());
      }
    }
  }
}

TEST(CodecTest, DescribeNegative) {
  auto r = codec::decode(0x27, {0x7F, 0x27, 0x35});
  auto text = describe(r);
  EXPECT_NE(text.find("negative"), std::string::npos);
  EXPECT_NE(text.find("0x35"), std::string::npos);
}

// ============================================================================
// Address and length format (Annex G)
// ============================================================================

TEST(CodecTest, AddressAndSizeLayout) {
  auto enc = codec::encode_address_and_size(0x00001000, 0x0100, 4, 2);
  ASSERT_TRUE(enc.has_value());
  EXPECT_EQ(*enc, (Bytes{0x42, 0x00, 0x00, 0x10, 0x00, 0x01, 0x00}));
}

TEST(CodecTest, AddressAndSizeMinimumWidths) {
  auto enc = codec::encode_address_and_size(0x12, 0x34, 1, 1);
  ASSERT_TRUE(enc.has_value());
  EXPECT_EQ(*enc, (Bytes{0x11, 0x12, 0x34}));
}

TEST(CodecTest, AddressAndSizeThreeByteFields) {
  auto enc = codec::encode_address_and_size(0x123456, 0xABCDEF, 3, 3);
  ASSERT_TRUE(enc.has_value());
  EXPECT_EQ(*enc, (Bytes{0x33, 0x12, 0x34, 0x56, 0xAB, 0xCD, 0xEF}));
}

TEST(CodecTest, AddressAndSizeRejectsInvalidWidths) {
  EXPECT_FALSE(codec::encode_address_and_size(0, 0, 0, 4).has_value());
  EXPECT_FALSE(codec::encode_address_and_size(0, 0, 4, 0).has_value());
  EXPECT_FALSE(codec::encode_address_and_size(0, 0, 5, 1).has_value());
  EXPECT_FALSE(codec::make_address_and_length_format(1, 15).has_value());
  auto format = codec::make_address_and_length_format(2, 3);
  ASSERT_TRUE(format.has_value());
  EXPECT_EQ(*format, 0x23);
}

TEST(CodecTest, AddressAndSizeRejectsValuesWiderThanField) {
  EXPECT_FALSE(codec::encode_address_and_size(0x100, 1, 1, 1).has_value());
  EXPECT_FALSE(codec::encode_address_and_size(1, 0x10000, 1, 2).has_value());
  EXPECT_TRUE(codec::encode_address_and_size(0xFFFFFFFF, 0xFFFFFFFF, 4, 4).has_value());
}

TEST(CodecTest, ReadBigEndian) {
  Bytes in{0x20, 0x0F, 0xFA, 0x01};
  EXPECT_EQ(codec::read_be(in, 1, 2).value_or(0), 0x0FFAu);
  EXPECT_EQ(codec::read_be(in, 0, 4).value_or(0), 0x200FFA01u);
  EXPECT_FALSE(codec::read_be(in, 2, 3).has_value());
  EXPECT_FALSE(codec::read_be(in, 0, 0).has_value());
}

TEST(CodecTest, SplitFormat) {
  auto f = codec::split_format(0x24);
  EXPECT_EQ(f.high, 2);
  EXPECT_EQ(f.low, 4);
}
