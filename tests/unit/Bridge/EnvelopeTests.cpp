/**
 * @file EnvelopeTests.cpp
 * @brief Unit tests for the JSON envelope codec
 */

#include <gtest/gtest.h>
#include "Bridge/Envelope.h"
#include "Spool/DumpFormat.h"

#include <string>

using namespace bridge;

namespace
{
    spool::TagImage patternImage()
    {
        spool::TagImage image;
        for (size_t b = 0; b < spool::geometry::BLOCK_COUNT; ++b) {
            image.block(b).fill(static_cast<uint8_t>(b));
        }
        return image;
    }

    std::string blocksJson(size_t count)
    {
        std::string json = "[";
        for (size_t i = 0; i < count; ++i) {
            json += (i == 0 ? "\"" : ",\"");
            json += "AAAAAAAAAAAAAAAAAAAAAA==\"";
        }
        return json + "]";
    }
}

// Test: READ_TAG without keys omits the field
TEST(EnvelopeTest, EncodeReadRequest) {
    ReadTagRequest request;
    request.requestId = "req-1";

    std::string json = EnvelopeCodec::encode(request);
    EXPECT_NE(json.find("\"action\":\"READ_TAG\""), std::string::npos);
    EXPECT_NE(json.find("\"request_id\":\"req-1\""), std::string::npos);
    EXPECT_EQ(json.find("keys"), std::string::npos);

    request.keys.push_back(spool::keyFromHex("FFFFFFFFFFFF").value());
    json = EnvelopeCodec::encode(request);
    EXPECT_NE(json.find("\"keys\":[\"FFFFFFFFFFFF\"]"), std::string::npos);
}

// Test: Every message decodes back to the same alternative
TEST(EnvelopeTest, WriteRequestRoundTrip) {
    WriteTagRequest request;
    request.requestId = "w-7";
    for (size_t sector = 0; sector < spool::geometry::SECTOR_COUNT; ++sector) {
        request.keys.push_back(spool::keyFromHex("A0A1A2A3A4A5").value());
    }
    request.keys.back() = spool::keyFromHex("D3F7D3F7D3F7").value();
    request.image = patternImage();
    request.targetUid = spool::uidFromHex("DEADBEEF").value();

    auto decoded = EnvelopeCodec::decode(EnvelopeCodec::encode(request));
    ASSERT_TRUE(decoded.has_value());
    ASSERT_TRUE(etl::holds_alternative<WriteTagRequest>(*decoded));

    const auto& back = etl::get<WriteTagRequest>(*decoded);
    EXPECT_EQ(back.requestId, "w-7");
    ASSERT_EQ(back.keys.size(), 16u);
    EXPECT_EQ(spool::keyToHex(back.keys[0]), "A0A1A2A3A4A5");
    EXPECT_EQ(spool::keyToHex(back.keys[15]), "D3F7D3F7D3F7");
    EXPECT_TRUE(back.image == request.image);
    ASSERT_TRUE(back.targetUid.has_value());
    EXPECT_EQ(spool::uidToHex(*back.targetUid), "DEADBEEF");
    EXPECT_STREQ(EnvelopeCodec::actionName(*decoded), "WRITE_TAG");
}

TEST(EnvelopeTest, TagDataCarriesSectorMask) {
    TagDataMessage message;
    message.requestId = "r";
    message.uid = spool::uidFromHex("01020304").value();
    message.image = patternImage();
    message.readable = spool::SectorMask(0xFFDB);

    std::string json = EnvelopeCodec::encode(message);
    EXPECT_NE(json.find("\"sectors_ok\":65499"), std::string::npos);

    auto decoded = EnvelopeCodec::decode(json);
    ASSERT_TRUE(decoded.has_value());
    const auto& back = etl::get<TagDataMessage>(*decoded);
    EXPECT_EQ(spool::uidToHex(back.uid), "01020304");
    ASSERT_TRUE(back.readable.has_value());
    EXPECT_EQ(back.readable->value(), 0xFFDB);
    EXPECT_EQ(back.image.block(63)[0], 63);
}

// Test: Older agents omit sectors_ok and request_id
TEST(EnvelopeTest, TagDataWithoutOptionalFields) {
    std::string json = "{\"action\":\"TAG_DATA\",\"uid\":\"DEADBEEF\",\"blocks\":" + blocksJson(64) + "}";

    auto decoded = EnvelopeCodec::decode(json);
    ASSERT_TRUE(decoded.has_value());
    const auto& back = etl::get<TagDataMessage>(*decoded);
    EXPECT_TRUE(back.requestId.empty());
    EXPECT_FALSE(back.readable.has_value());
}

// Test: Numeric request ids are accepted as text
TEST(EnvelopeTest, NumericRequestId) {
    auto decoded = EnvelopeCodec::decode("{\"action\":\"ERROR\",\"request_id\":42,\"message\":\"No tag\"}");
    ASSERT_TRUE(decoded.has_value());
    const auto& back = etl::get<ErrorMessage>(*decoded);
    EXPECT_EQ(back.requestId, "42");
    EXPECT_EQ(back.message, "No tag");

    EXPECT_EQ(EnvelopeCodec::peekRequestId("{\"action\":\"BOGUS\",\"request_id\":\"abc\"}"), "abc");
    EXPECT_EQ(EnvelopeCodec::peekRequestId("garbage"), "");
}

TEST(EnvelopeTest, WriteResultFields) {
    WriteResultMessage message;
    message.requestId = "x";
    message.success = false;
    message.blocksWritten = 17;
    message.error = "Link Error: Timeout";

    auto decoded = EnvelopeCodec::decode(EnvelopeCodec::encode(message));
    ASSERT_TRUE(decoded.has_value());
    const auto& back = etl::get<WriteResultMessage>(*decoded);
    EXPECT_FALSE(back.success);
    EXPECT_EQ(back.blocksWritten, 17u);
    EXPECT_EQ(back.error, "Link Error: Timeout");

    auto missingSuccess = EnvelopeCodec::decode("{\"action\":\"WRITE_RESULT\",\"request_id\":\"x\"}");
    EXPECT_FALSE(missingSuccess.has_value());
}

TEST(EnvelopeTest, StatusAndDetected) {
    StatusMessage status;
    status.connected = true;
    status.device = "reader-1";
    auto decodedStatus = EnvelopeCodec::decode(EnvelopeCodec::encode(Envelope(status)));
    ASSERT_TRUE(decodedStatus.has_value());
    EXPECT_EQ(etl::get<StatusMessage>(*decodedStatus).device, "reader-1");
    EXPECT_TRUE(etl::get<StatusMessage>(*decodedStatus).connected);

    TagDetectedMessage detected;
    detected.uid = spool::uidFromHex("CAFEBABE").value();
    auto decodedDetected = EnvelopeCodec::decode(EnvelopeCodec::encode(detected));
    ASSERT_TRUE(decodedDetected.has_value());
    EXPECT_EQ(spool::uidToHex(etl::get<TagDetectedMessage>(*decodedDetected).uid), "CAFEBABE");
}

// Test: Malformed envelopes are protocol violations
TEST(EnvelopeTest, RejectsMalformed) {
    const char* inputs[] = {
        "not json",
        "[1,2,3]",
        "{\"request_id\":\"a\"}",
        "{\"action\":\"FLY\"}",
        "{\"action\":\"READ_TAG\",\"keys\":[\"XYZ\"]}",
        "{\"action\":\"READ_TAG\",\"request_id\":[1]}",
        "{\"action\":\"TAG_DETECTED\",\"uid\":\"DEAD\"}",
        "{\"action\":\"TAG_DATA\",\"uid\":\"DEADBEEF\",\"blocks\":[]}",
    };

    for (const char* input : inputs) {
        auto result = EnvelopeCodec::decode(input);
        ASSERT_FALSE(result.has_value()) << input;
        EXPECT_TRUE(result.error().isCode(error::BridgeError::ProtocolViolation)) << input;
    }

    std::string shortBlocks = "{\"action\":\"WRITE_TAG\",\"blocks\":" + blocksJson(63) + "}";
    EXPECT_FALSE(EnvelopeCodec::decode(shortBlocks).has_value());

    std::string badMask = "{\"action\":\"TAG_DATA\",\"uid\":\"DEADBEEF\",\"blocks\":" + blocksJson(64)
                        + ",\"sectors_ok\":70000}";
    EXPECT_FALSE(EnvelopeCodec::decode(badMask).has_value());
}

// Test: WRITE_TAG carries exactly one key per sector, READ_TAG none or all of them
TEST(EnvelopeTest, RejectsIncompleteKeyLists) {
    auto keysJson = [](size_t count) {
        std::string json = "[";
        for (size_t i = 0; i < count; ++i) {
            json += (i == 0 ? "\"" : ",\"");
            json += "FFFFFFFFFFFF\"";
        }
        return json + "]";
    };

    std::string noKeys = "{\"action\":\"WRITE_TAG\",\"blocks\":" + blocksJson(64) + "}";
    std::string fewKeys = "{\"action\":\"WRITE_TAG\",\"keys\":" + keysJson(15)
                        + ",\"blocks\":" + blocksJson(64) + "}";
    std::string oneReadKey = "{\"action\":\"READ_TAG\",\"keys\":" + keysJson(1) + "}";

    for (const std::string& input : {noKeys, fewKeys, oneReadKey}) {
        auto result = EnvelopeCodec::decode(input);
        ASSERT_FALSE(result.has_value()) << input;
        EXPECT_TRUE(result.error().isCode(error::BridgeError::ProtocolViolation)) << input;
    }

    std::string fullWrite = "{\"action\":\"WRITE_TAG\",\"keys\":" + keysJson(16)
                          + ",\"blocks\":" + blocksJson(64) + "}";
    auto write = EnvelopeCodec::decode(fullWrite);
    ASSERT_TRUE(write.has_value());
    EXPECT_EQ(etl::get<WriteTagRequest>(*write).keys.size(), 16u);

    auto read = EnvelopeCodec::decode("{\"action\":\"READ_TAG\",\"keys\":" + keysJson(16) + "}");
    ASSERT_TRUE(read.has_value());
    EXPECT_EQ(etl::get<ReadTagRequest>(*read).keys.size(), 16u);
}
