/**
 * @file TagTypes.cpp
 * @brief Tag image and identifier helpers
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Spool/TagTypes.h"
#include "Utils/TextCodec.h"

#include <algorithm>

namespace spool
{
    SectorTrailer SectorTrailer::fromBlock(const Block& block)
    {
        SectorTrailer trailer;
        std::copy(block.begin() + geometry::TRAILER_KEY_A_OFFSET,
                  block.begin() + geometry::TRAILER_KEY_A_OFFSET + geometry::KEY_SIZE,
                  trailer.keyA.begin());
        std::copy(block.begin() + geometry::TRAILER_ACCESS_BITS_OFFSET,
                  block.begin() + geometry::TRAILER_ACCESS_BITS_OFFSET + geometry::TRAILER_ACCESS_BITS_SIZE,
                  trailer.accessBits.begin());
        std::copy(block.begin() + geometry::TRAILER_KEY_B_OFFSET,
                  block.begin() + geometry::TRAILER_KEY_B_OFFSET + geometry::KEY_SIZE,
                  trailer.keyB.begin());
        return trailer;
    }

    TagImage::TagImage()
    {
        for (auto& b : blocks)
        {
            b.fill(0);
        }
    }

    etl::expected<TagImage, error::Error> TagImage::fromBlocks(const etl::ivector<Block>& source)
    {
        if (source.size() != geometry::BLOCK_COUNT)
        {
            return etl::unexpected(error::Error::fromCodec(error::CodecError::MalformedImage));
        }

        TagImage image;
        std::copy(source.begin(), source.end(), image.blocks.begin());
        return image;
    }

    etl::expected<TagImage, error::Error> TagImage::fromBytes(const uint8_t* data, size_t length)
    {
        if (data == nullptr || length != geometry::IMAGE_SIZE)
        {
            return etl::unexpected(error::Error::fromCodec(error::CodecError::MalformedImage));
        }

        TagImage image;
        for (size_t i = 0; i < geometry::BLOCK_COUNT; ++i)
        {
            std::copy(data + i * geometry::BLOCK_SIZE,
                      data + (i + 1) * geometry::BLOCK_SIZE,
                      image.blocks[i].begin());
        }
        return image;
    }

    TagUid TagImage::uid() const
    {
        TagUid uid;
        std::copy(blocks[0].begin(), blocks[0].begin() + geometry::UID_SIZE, uid.begin());
        return uid;
    }

    bool TagImage::isSectorZero(size_t sector) const
    {
        const size_t first = geometry::firstBlockOf(sector);
        for (size_t b = first; b < first + geometry::BLOCKS_PER_SECTOR; ++b)
        {
            for (uint8_t byte : blocks[b])
            {
                if (byte != 0)
                {
                    return false;
                }
            }
        }
        return true;
    }

    void TagImage::clearSector(size_t sector)
    {
        const size_t first = geometry::firstBlockOf(sector);
        for (size_t b = first; b < first + geometry::BLOCKS_PER_SECTOR; ++b)
        {
            blocks[b].fill(0);
        }
    }

    SectorMask TagImage::nonZeroSectors() const
    {
        SectorMask mask;
        for (size_t s = 0; s < geometry::SECTOR_COUNT; ++s)
        {
            mask.set(s, !isSectorZero(s));
        }
        return mask;
    }

    TagImage TagImage::mergedOnto(const TagImage& base) const
    {
        TagImage merged = base;
        for (size_t b = 0; b < geometry::BLOCK_COUNT; ++b)
        {
            if (geometry::isWritable(b))
            {
                merged.blocks[b] = blocks[b];
            }
        }
        return merged;
    }

    bool TagImage::operator==(const TagImage& other) const
    {
        return std::equal(blocks.begin(), blocks.end(), other.blocks.begin());
    }

    std::string uidToHex(const TagUid& uid)
    {
        return utils::toHex(uid.data(), uid.size());
    }

    etl::expected<TagUid, error::Error> uidFromHex(etl::string_view text)
    {
        etl::vector<uint8_t, geometry::UID_SIZE> bytes;
        auto result = utils::fromHex(text, bytes);
        if (!result || bytes.size() != geometry::UID_SIZE)
        {
            return etl::unexpected(error::Error::fromCodec(error::CodecError::InvalidEncoding));
        }

        TagUid uid;
        std::copy(bytes.begin(), bytes.end(), uid.begin());
        return uid;
    }

    std::string keyToHex(const SectorKey& key)
    {
        return utils::toHex(key.data(), key.size());
    }

    etl::expected<SectorKey, error::Error> keyFromHex(etl::string_view text)
    {
        etl::vector<uint8_t, geometry::KEY_SIZE> bytes;
        auto result = utils::fromHex(text, bytes);
        if (!result || bytes.size() != geometry::KEY_SIZE)
        {
            return etl::unexpected(error::Error::fromCodec(error::CodecError::InvalidEncoding));
        }

        SectorKey key;
        std::copy(bytes.begin(), bytes.end(), key.begin());
        return key;
    }

} // namespace spool
