/**
 * @file TextCodecTests.cpp
 * @brief Unit tests for hex and base64 helpers
 */

#include <gtest/gtest.h>
#include "Utils/TextCodec.h"

#include <string>

using namespace utils;

// Test: Hex output is upper case and optionally separated
TEST(TextCodecTests, ToHex)
{
    const uint8_t data[] = {0xDE, 0xAD, 0x0B, 0xEF};

    EXPECT_EQ(toHex(data, sizeof(data)), "DEAD0BEF");
    EXPECT_EQ(toHex(data, sizeof(data), ' '), "DE AD 0B EF");
    EXPECT_EQ(toHex(data, 0), "");
}

// Test: Hex input accepts either case and ignores whitespace
TEST(TextCodecTests, FromHexAcceptsMixedCaseAndSpaces)
{
    etl::vector<uint8_t, 8> out;
    auto result = fromHex("de AD\n0b eF", out);

    ASSERT_TRUE(result.has_value());
    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(out[0], 0xDE);
    EXPECT_EQ(out[1], 0xAD);
    EXPECT_EQ(out[2], 0x0B);
    EXPECT_EQ(out[3], 0xEF);
}

TEST(TextCodecTests, FromHexRejectsBadInput)
{
    etl::vector<uint8_t, 8> out;

    auto oddLength = fromHex("ABC", out);
    ASSERT_FALSE(oddLength.has_value());
    EXPECT_TRUE(oddLength.error().isCode(error::CodecError::InvalidEncoding));

    auto badDigit = fromHex("ZZ", out);
    ASSERT_FALSE(badDigit.has_value());
    EXPECT_TRUE(badDigit.error().isCode(error::CodecError::InvalidEncoding));
}

// Test: Output larger than the target buffer is rejected
TEST(TextCodecTests, FromHexOverflow)
{
    etl::vector<uint8_t, 2> out;
    auto result = fromHex("010203", out);

    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().isCode(error::CodecError::MalformedImage));
}

TEST(TextCodecTests, ToBase64)
{
    const uint8_t data[] = {'f', 'o', 'o', 'b', 'a'};

    EXPECT_EQ(toBase64(data, 3), "Zm9v");
    EXPECT_EQ(toBase64(data, 4), "Zm9vYg==");
    EXPECT_EQ(toBase64(data, 5), "Zm9vYmE=");
    EXPECT_EQ(toBase64(data, 0), "");
}

// Test: Padding bytes are not reported as decoded data
TEST(TextCodecTests, FromBase64StripsPadding)
{
    etl::vector<uint8_t, 16> out;

    ASSERT_TRUE(fromBase64("Zm9vYg==", out).has_value());
    ASSERT_EQ(out.size(), 4u);
    EXPECT_EQ(std::string(out.begin(), out.end()), "foob");

    ASSERT_TRUE(fromBase64("  Zm9vYmE=\n", out).has_value());
    EXPECT_EQ(std::string(out.begin(), out.end()), "fooba");

    ASSERT_TRUE(fromBase64("", out).has_value());
    EXPECT_TRUE(out.empty());
}

TEST(TextCodecTests, FromBase64RejectsBadInput)
{
    etl::vector<uint8_t, 16> out;

    auto truncated = fromBase64("Zm9", out);
    ASSERT_FALSE(truncated.has_value());
    EXPECT_TRUE(truncated.error().isCode(error::CodecError::InvalidEncoding));

    auto badChars = fromBase64("Zm!v", out);
    EXPECT_FALSE(badChars.has_value());
}

// Test: Only the first key byte is shown in logs
TEST(TextCodecTests, RedactKey)
{
    const uint8_t key[] = {0xA0, 0xA1, 0xA2, 0xA3, 0xA4, 0xA5};

    auto redacted = redactKey(key, sizeof(key));
    EXPECT_EQ(std::string(redacted.c_str()), "A0**********");
    EXPECT_TRUE(redactKey(key, 0).empty());
}
