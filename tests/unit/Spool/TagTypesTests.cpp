/**
 * @file TagTypesTests.cpp
 * @brief Unit tests for tag image, mask and identifier helpers
 */

#include <gtest/gtest.h>
#include "Spool/TagTypes.h"

#include <vector>

using namespace spool;

// Test: Block classification
TEST(TagGeometryTest, WritableBlocks)
{
    EXPECT_FALSE(geometry::isWritable(0));
    EXPECT_TRUE(geometry::isWritable(1));
    EXPECT_TRUE(geometry::isWritable(2));
    EXPECT_FALSE(geometry::isWritable(3));
    EXPECT_TRUE(geometry::isWritable(4));
    EXPECT_FALSE(geometry::isWritable(63));
    EXPECT_FALSE(geometry::isWritable(64));

    EXPECT_EQ(geometry::sectorOf(41), 10u);
    EXPECT_EQ(geometry::trailerOf(15), 63u);
}

TEST(SectorMaskTest, SetAndCount)
{
    SectorMask mask;
    EXPECT_EQ(mask.count(), 0u);

    mask.set(0);
    mask.set(15);
    mask.set(16);   // ignored

    EXPECT_TRUE(mask.test(0));
    EXPECT_TRUE(mask.test(15));
    EXPECT_FALSE(mask.test(16));
    EXPECT_EQ(mask.value(), 0x8001);
    EXPECT_EQ(mask.count(), 2u);

    mask.set(0, false);
    EXPECT_EQ(mask.value(), 0x8000);
    EXPECT_TRUE(SectorMask::all().allSet());
}

// Test: Image construction validates size
TEST(TagImageTest, FromBytesRejectsWrongSize)
{
    std::vector<uint8_t> data(geometry::IMAGE_SIZE - 1, 0);

    auto result = TagImage::fromBytes(data.data(), data.size());
    ASSERT_FALSE(result.has_value());
    EXPECT_TRUE(result.error().isCode(error::CodecError::MalformedImage));

    auto nullResult = TagImage::fromBytes(nullptr, geometry::IMAGE_SIZE);
    EXPECT_FALSE(nullResult.has_value());
}

TEST(TagImageTest, FromBytesAndUid)
{
    std::vector<uint8_t> data(geometry::IMAGE_SIZE, 0);
    data[0] = 0xDE;
    data[1] = 0xAD;
    data[2] = 0xBE;
    data[3] = 0xEF;
    data[16 * 5 + 2] = 0x42;

    auto result = TagImage::fromBytes(data.data(), data.size());
    ASSERT_TRUE(result.has_value());

    EXPECT_EQ(uidToHex(result->uid()), "DEADBEEF");
    EXPECT_EQ(result->block(5)[2], 0x42);
    EXPECT_EQ(result->size(), geometry::BLOCK_COUNT);
}

TEST(TagImageTest, FromBlocksRequiresFullImage)
{
    etl::vector<Block, geometry::BLOCK_COUNT> blocks;
    Block zero;
    zero.fill(0);
    blocks.assign(geometry::BLOCK_COUNT - 1, zero);

    EXPECT_FALSE(TagImage::fromBlocks(blocks).has_value());

    blocks.push_back(zero);
    EXPECT_TRUE(TagImage::fromBlocks(blocks).has_value());
}

// Test: Sector zero detection and clearing
TEST(TagImageTest, NonZeroSectors)
{
    TagImage image;
    EXPECT_EQ(image.nonZeroSectors().value(), 0);

    image.block(0)[0] = 1;
    image.block(9)[15] = 1;
    EXPECT_EQ(image.nonZeroSectors().value(), (1 << 0) | (1 << 2));

    image.clearSector(2);
    EXPECT_TRUE(image.isSectorZero(2));
    EXPECT_EQ(image.nonZeroSectors().value(), 1);
}

// Test: Merge keeps block 0 and trailers of the base
TEST(TagImageTest, MergedOntoKeepsProtectedBlocks)
{
    TagImage base;
    TagImage source;
    for (size_t b = 0; b < geometry::BLOCK_COUNT; ++b)
    {
        base.block(b).fill(0x11);
        source.block(b).fill(0x22);
    }

    TagImage merged = source.mergedOnto(base);

    for (size_t b = 0; b < geometry::BLOCK_COUNT; ++b)
    {
        uint8_t expected = geometry::isWritable(b) ? 0x22 : 0x11;
        EXPECT_EQ(merged.block(b)[0], expected) << "block " << b;
    }
}

TEST(SectorTrailerTest, FromBlock)
{
    Block block = {{0x01, 0x02, 0x03, 0x04, 0x05, 0x06,
                    0xFF, 0x07, 0x80, 0x69,
                    0x11, 0x12, 0x13, 0x14, 0x15, 0x16}};

    SectorTrailer trailer = SectorTrailer::fromBlock(block);

    EXPECT_EQ(keyToHex(trailer.keyA), "010203040506");
    EXPECT_EQ(trailer.accessBits[0], 0xFF);
    EXPECT_EQ(trailer.accessBits[3], 0x69);
    EXPECT_EQ(keyToHex(trailer.keyB), "111213141516");
}

TEST(TagTypesTest, UidAndKeyHex)
{
    auto uid = uidFromHex("deadbeef");
    ASSERT_TRUE(uid.has_value());
    EXPECT_EQ(uidToHex(*uid), "DEADBEEF");

    EXPECT_FALSE(uidFromHex("DEADBE").has_value());
    EXPECT_FALSE(uidFromHex("DEADBEEF00").has_value());

    auto key = keyFromHex("A0A1A2A3A4A5");
    ASSERT_TRUE(key.has_value());
    EXPECT_EQ((*key)[5], 0xA5);
    EXPECT_FALSE(keyFromHex("A0A1A2").has_value());
}
