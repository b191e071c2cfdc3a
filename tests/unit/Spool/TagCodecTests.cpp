/**
 * @file TagCodecTests.cpp
 * @brief Unit tests for filament tag image decoding and encoding
 */

#include <gtest/gtest.h>
#include "Spool/TagCodec.h"

#include <cstring>
#include <string>

using namespace spool;

namespace
{
    void putString(Block& block, size_t offset, const char* text)
    {
        std::memcpy(block.data() + offset, text, std::strlen(text));
    }

    uint32_t floatBits(float value)
    {
        uint32_t bits;
        std::memcpy(&bits, &value, sizeof(bits));
        return bits;
    }

    TagImage sampleImage()
    {
        TagImage image;
        Block& b0 = image.block(0);
        b0 = {{0xDE, 0xAD, 0xBE, 0xEF, 0x22, 0x08, 0x04, 0x00,
               0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08}};

        putString(image.block(1), 0, "A50-K0");
        putString(image.block(1), 8, "GFA00");
        putString(image.block(2), 0, "PLA");
        putString(image.block(4), 0, "PLA Basic");
        image.block(5) = {{0xAA, 0xBB, 0xCC, 0xFF, 0xE8, 0x03, 0x00, 0x00,
                           0x00, 0x00, 0x1C, 0x00, 0x00, 0x00, 0x00, 0x00}};
        image.block(6) = {{0x37, 0x00, 0x08, 0x00, 0x01, 0x00, 0x23, 0x00,
                           0xE6, 0x00, 0xBE, 0x00, 0x00, 0x00, 0x00, 0x00}};
        putString(image.block(9), 0, "TRAY123");
        image.block(10)[4] = 0xE8;   // 1000 -> 10.00 mm
        image.block(10)[5] = 0x03;
        putString(image.block(12), 0, "2024_03_15_10_30");
        image.block(14)[4] = 0x4A;   // 330 m
        image.block(14)[5] = 0x01;
        return image;
    }
}

// Test: A blank image decodes to empty defaults
TEST(TagCodecTest, DecodeZeroImage) {
    FilamentRecord record = TagCodec::decode(TagImage());

    EXPECT_EQ(uidToHex(record.uid), "00000000");
    EXPECT_TRUE(record.materialId.empty());
    EXPECT_TRUE(record.filamentType.empty());
    EXPECT_EQ(record.spoolWeightG, 0u);
    EXPECT_EQ(record.colorHex(), "#000000");
    EXPECT_FALSE(record.hasRsaSignature);
}

// Test: Colour, weight and diameter slots of block 5
TEST(TagCodecTest, DecodeColorBlock) {
    FilamentRecord record = TagCodec::decode(sampleImage());

    EXPECT_EQ(record.colorHex(), "#AABBCC");
    EXPECT_EQ(record.colorAlpha(), 255);
    EXPECT_EQ(record.spoolWeightG, 1000u);
    EXPECT_EQ(floatBits(record.filamentDiameterMm), 0x001C0000u);
}

TEST(TagCodecTest, DecodeFields) {
    FilamentRecord record = TagCodec::decode(sampleImage());

    EXPECT_EQ(uidToHex(record.uid), "DEADBEEF");
    EXPECT_EQ(record.manufacturerData[0], 0x22);
    EXPECT_EQ(record.materialVariantId, "A50-K0");
    EXPECT_EQ(record.materialId, "GFA00");
    EXPECT_EQ(record.filamentType, "PLA");
    EXPECT_EQ(record.detailedFilamentType, "PLA Basic");
    EXPECT_EQ(record.dryingTempC, 55u);
    EXPECT_EQ(record.dryingTimeH, 8u);
    EXPECT_EQ(record.bedTempType, 1u);
    EXPECT_EQ(record.bedTempC, 35u);
    EXPECT_EQ(record.maxHotendTempC, 230u);
    EXPECT_EQ(record.minHotendTempC, 190u);
    EXPECT_EQ(record.trayUid, "TRAY123");
    EXPECT_FLOAT_EQ(record.spoolWidthMm, 10.0f);
    EXPECT_EQ(record.productionDatetime, "2024_03_15_10_30");
    EXPECT_EQ(record.filamentLengthM, 330u);
}

// Test: Strings stop at NUL, are trimmed and hide non ASCII bytes
TEST(TagCodecTest, DecodeStringEdgeCases) {
    TagImage image;
    putString(image.block(2), 0, "  PETG  ");
    image.block(4)[0] = 'A';
    image.block(4)[1] = 0xC3;
    image.block(4)[2] = 'B';
    image.block(4)[3] = 0x00;
    image.block(4)[4] = 'Z';

    FilamentRecord record = TagCodec::decode(image);
    EXPECT_EQ(record.filamentType, "PETG");
    EXPECT_EQ(record.detailedFilamentType, "A?B");
}

// Test: Secondary colour only when the format says so
TEST(TagCodecTest, SecondaryColor) {
    TagImage image;
    image.block(16) = {{0x02, 0x00, 0x02, 0x00, 0x11, 0x22, 0x33, 0x44,
                        0, 0, 0, 0, 0, 0, 0, 0}};
    FilamentRecord record = TagCodec::decode(image);
    EXPECT_EQ(record.colorFormat, 2u);
    EXPECT_EQ(record.colorCount, 2u);
    EXPECT_EQ(record.secondaryColor[0], 0x11);
    EXPECT_EQ(record.secondaryColor[3], 0x44);

    image.block(16)[0] = 0x01;
    record = TagCodec::decode(image);
    EXPECT_EQ(record.secondaryColor[0], 0x00);
}

// Test: Signature spans 18 blocks, only 256 bytes are used
TEST(TagCodecTest, SignatureBlocks) {
    const auto& blocks = TagCodec::signatureBlocks();
    ASSERT_EQ(blocks.size(), 18u);
    EXPECT_EQ(blocks[0], 40);
    EXPECT_EQ(blocks[3], 44);
    EXPECT_EQ(blocks[17], 62);
    for (uint8_t b : blocks) {
        EXPECT_FALSE(geometry::isTrailer(b));
    }

    TagImage image;
    image.block(40)[0] = 0x5A;
    image.block(62)[15] = 0x77;   // beyond byte 256

    FilamentRecord record = TagCodec::decode(image);
    EXPECT_TRUE(record.hasRsaSignature);
    EXPECT_EQ(record.rsaSignature[0], 0x5A);
    EXPECT_EQ(record.rsaSignature[255], 0x00);
}

// Test: Encoding then decoding preserves every field
TEST(TagCodecTest, EncodeRoundTrip) {
    TagImage original = sampleImage();
    FilamentRecord record = TagCodec::decode(original);

    auto encoded = TagCodec::encodeOnto(record, original);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_TRUE(*encoded == original);
}

// Test: A record built from nothing survives encode, merge onto a tag and decode
TEST(TagCodecTest, EncodeFromScratchOntoTemplate) {
    FilamentRecord record;
    record.materialVariantId = "A00-W1";
    record.materialId = "GFA01";
    record.filamentType = "PETG";
    record.detailedFilamentType = "PETG HF";
    record.colorRgba = {{0x12, 0x34, 0x56, 0x80}};
    record.spoolWeightG = 750;
    record.filamentDiameterMm = 1.75f;
    record.dryingTempC = 65;
    record.dryingTimeH = 8;
    record.bedTempType = 2;
    record.bedTempC = 70;
    record.maxHotendTempC = 260;
    record.minHotendTempC = 230;
    record.xcamInfo = {{1, 2, 3, 4, 5, 6, 7, 8, 9, 10, 11, 12}};
    record.nozzleDiameter = 0.4f;
    record.trayUid = "0123456789ABCDEF";
    record.spoolWidthMm = 66.25f;
    record.productionDatetime = "2025_01_02_03_04";
    record.shortProductionDatetime = "250102";
    record.filamentLengthM = 240;
    record.colorFormat = 2;
    record.colorCount = 2;
    record.secondaryColor = {{0xAA, 0xBB, 0xCC, 0xDD}};
    for (size_t i = 0; i < record.rsaSignature.size(); ++i) {
        record.rsaSignature[i] = static_cast<uint8_t>(i ^ 0x5A);
    }

    auto encoded = TagCodec::encode(record);
    ASSERT_TRUE(encoded.has_value());

    TagImage tagTemplate;
    tagTemplate.block(0) = {{0xCA, 0xFE, 0xBA, 0xBE, 0x9C, 0x08, 0x04, 0x00,
                             0x62, 0x63, 0x64, 0x65, 0x66, 0x67, 0x68, 0x69}};
    for (size_t s = 0; s < geometry::SECTOR_COUNT; ++s) {
        Block& trailer = tagTemplate.block(geometry::trailerOf(s));
        trailer.fill(0xFF);
        trailer[6] = 0xFF;
        trailer[7] = 0x07;
        trailer[8] = 0x80;
        trailer[9] = 0x69;
    }

    TagImage merged = encoded->mergedOnto(tagTemplate);
    EXPECT_TRUE(merged.block(0) == tagTemplate.block(0));
    EXPECT_TRUE(merged.block(geometry::trailerOf(3)) == tagTemplate.block(geometry::trailerOf(3)));

    FilamentRecord decoded = TagCodec::decode(merged);
    EXPECT_EQ(uidToHex(decoded.uid), "CAFEBABE");
    EXPECT_EQ(decoded.manufacturerData[0], 0x9C);
    EXPECT_EQ(decoded.materialVariantId, record.materialVariantId);
    EXPECT_EQ(decoded.materialId, record.materialId);
    EXPECT_EQ(decoded.filamentType, record.filamentType);
    EXPECT_EQ(decoded.detailedFilamentType, record.detailedFilamentType);
    EXPECT_TRUE(decoded.colorRgba == record.colorRgba);
    EXPECT_EQ(decoded.spoolWeightG, record.spoolWeightG);
    EXPECT_EQ(floatBits(decoded.filamentDiameterMm), floatBits(record.filamentDiameterMm));
    EXPECT_EQ(decoded.dryingTempC, record.dryingTempC);
    EXPECT_EQ(decoded.dryingTimeH, record.dryingTimeH);
    EXPECT_EQ(decoded.bedTempType, record.bedTempType);
    EXPECT_EQ(decoded.bedTempC, record.bedTempC);
    EXPECT_EQ(decoded.maxHotendTempC, record.maxHotendTempC);
    EXPECT_EQ(decoded.minHotendTempC, record.minHotendTempC);
    EXPECT_TRUE(decoded.xcamInfo == record.xcamInfo);
    EXPECT_EQ(floatBits(decoded.nozzleDiameter), floatBits(record.nozzleDiameter));
    EXPECT_EQ(decoded.trayUid, record.trayUid);
    EXPECT_FLOAT_EQ(decoded.spoolWidthMm, record.spoolWidthMm);
    EXPECT_EQ(decoded.productionDatetime, record.productionDatetime);
    EXPECT_EQ(decoded.shortProductionDatetime, record.shortProductionDatetime);
    EXPECT_EQ(decoded.filamentLengthM, record.filamentLengthM);
    EXPECT_EQ(decoded.colorFormat, record.colorFormat);
    EXPECT_EQ(decoded.colorCount, record.colorCount);
    EXPECT_TRUE(decoded.secondaryColor == record.secondaryColor);
    EXPECT_TRUE(decoded.hasRsaSignature);
    EXPECT_TRUE(decoded.rsaSignature == record.rsaSignature);
}

// Test: Strings with surrounding whitespace would not read back and are refused
TEST(TagCodecTest, EncodeRejectsSurroundingWhitespace) {
    const char* values[] = {" PLA", "PLA ", "PLA\t", "\nPLA"};
    for (const char* value : values) {
        FilamentRecord record;
        record.filamentType = value;
        auto encoded = TagCodec::encode(record);
        ASSERT_FALSE(encoded.has_value()) << value;
        EXPECT_TRUE(encoded.error().isCode(error::CodecError::FieldOutOfRange));
    }

    FilamentRecord inner;
    inner.detailedFilamentType = "PLA Silk+";
    EXPECT_TRUE(TagCodec::encode(inner).has_value());
}

// Test: Re-encoding a decoded record onto its own image keeps bytes decode masked
TEST(TagCodecTest, EncodeOntoKeepsUnchangedRawStrings) {
    TagImage original = sampleImage();
    putString(original.block(2), 0, " PLA ");
    original.block(4)[0] = 'A';
    original.block(4)[1] = 0xC3;
    original.block(4)[2] = 0xA4;
    original.block(4)[3] = 0x00;
    original.block(4)[9] = 0x7E;    // padding after the NUL

    FilamentRecord record = TagCodec::decode(original);
    EXPECT_EQ(record.filamentType, "PLA");
    EXPECT_EQ(record.detailedFilamentType, "A??");

    auto same = TagCodec::encodeOnto(record, original);
    ASSERT_TRUE(same.has_value());
    EXPECT_TRUE(*same == original);

    record.detailedFilamentType = "ASA";
    auto changed = TagCodec::encodeOnto(record, original);
    ASSERT_TRUE(changed.has_value());
    EXPECT_EQ(changed->block(4)[1], 'S');
    EXPECT_EQ(changed->block(4)[9], 0x00);
    EXPECT_TRUE(changed->block(2) == original.block(2));
}

// Test: Encoding onto a template keeps its block 0 and trailers
TEST(TagCodecTest, EncodeOntoTemplateKeepsProtectedBlocks) {
    TagImage base;
    base.block(0).fill(0x99);
    base.block(7).fill(0xFF);

    FilamentRecord record;
    record.filamentType = "ABS";
    record.spoolWeightG = 250;

    auto encoded = TagCodec::encodeOnto(record, base);
    ASSERT_TRUE(encoded.has_value());
    EXPECT_EQ(encoded->block(0)[0], 0x99);
    EXPECT_EQ(encoded->block(7)[15], 0xFF);

    FilamentRecord decoded = TagCodec::decode(*encoded);
    EXPECT_EQ(decoded.filamentType, "ABS");
    EXPECT_EQ(decoded.spoolWeightG, 250u);
}

TEST(TagCodecTest, EncodeRejectsOutOfRange) {
    FilamentRecord heavy;
    heavy.spoolWeightG = 70000;
    auto weight = TagCodec::encode(heavy);
    ASSERT_FALSE(weight.has_value());
    EXPECT_TRUE(weight.error().isCode(error::CodecError::FieldOutOfRange));

    FilamentRecord longName;
    longName.materialId = "TOOLONGID";
    EXPECT_FALSE(TagCodec::encode(longName).has_value());

    FilamentRecord wide;
    wide.spoolWidthMm = 1000.0f;
    EXPECT_FALSE(TagCodec::encode(wide).has_value());

    FilamentRecord nonAscii;
    nonAscii.filamentType = "PL\xC3\xA4";
    EXPECT_FALSE(TagCodec::encode(nonAscii).has_value());
}

// Test: Block list entry point checks the block count
TEST(TagCodecTest, DecodeBlockList) {
    etl::vector<Block, geometry::BLOCK_COUNT> blocks;
    Block zero;
    zero.fill(0);
    blocks.assign(10, zero);

    auto result = TagCodec::decode(blocks);
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().isCode(error::CodecError::MalformedImage));
}

TEST(FilamentRecordTest, ToStringListsFields) {
    FilamentRecord record = TagCodec::decode(sampleImage());
    std::string text = record.toString();

    EXPECT_NE(text.find("DEADBEEF"), std::string::npos);
    EXPECT_NE(text.find("PLA Basic"), std::string::npos);
    EXPECT_NE(text.find("#AABBCC"), std::string::npos);
    EXPECT_NE(text.find("1000 g"), std::string::npos);
    EXPECT_NE(text.find("absent"), std::string::npos);
}
