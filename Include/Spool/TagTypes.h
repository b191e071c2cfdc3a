/**
 * @file TagTypes.h
 * @brief Value types for tag identifiers, keys, blocks and tag images
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdint>
#include <string>

#include <etl/array.h>
#include <etl/expected.h>
#include <etl/string_view.h>
#include <etl/vector.h>

#include "Error/Error.h"
#include "TagGeometry.h"

namespace spool
{
    using TagUid = etl::array<uint8_t, geometry::UID_SIZE>;
    using SectorKey = etl::array<uint8_t, geometry::KEY_SIZE>;
    using Block = etl::array<uint8_t, geometry::BLOCK_SIZE>;

    /**
     * @brief One key per sector, index == sector number
     */
    using KeySet = etl::array<SectorKey, geometry::SECTOR_COUNT>;

    /**
     * @brief Keys for sectors 0..size()-1, sectors past the end have no key
     */
    using KeyList = etl::vector<SectorKey, geometry::SECTOR_COUNT>;

    /**
     * @brief Per-sector flag set, bit n == sector n
     *
     * Used as the readability mask of a read: a cleared bit means the sector
     * could not be authenticated and its blocks are zero-filled, which is
     * different from a sector that really holds zeroes.
     */
    class SectorMask
    {
    public:
        SectorMask() : bits(0) {}
        explicit SectorMask(uint16_t bits) : bits(bits) {}

        static SectorMask all()
        {
            return SectorMask(0xFFFF);
        }

        bool test(size_t sector) const
        {
            return sector < geometry::SECTOR_COUNT && (bits & (1U << sector)) != 0;
        }

        void set(size_t sector, bool value = true)
        {
            if (sector >= geometry::SECTOR_COUNT)
            {
                return;
            }
            if (value)
            {
                bits = static_cast<uint16_t>(bits | (1U << sector));
            }
            else
            {
                bits = static_cast<uint16_t>(bits & ~(1U << sector));
            }
        }

        size_t count() const
        {
            size_t n = 0;
            for (size_t s = 0; s < geometry::SECTOR_COUNT; ++s)
            {
                n += test(s) ? 1 : 0;
            }
            return n;
        }

        bool allSet() const
        {
            return bits == 0xFFFF;
        }

        uint16_t value() const
        {
            return bits;
        }

        bool operator==(const SectorMask& other) const
        {
            return bits == other.bits;
        }

        bool operator!=(const SectorMask& other) const
        {
            return bits != other.bits;
        }

    private:
        uint16_t bits;
    };

    /**
     * @brief Decoded sector trailer
     */
    struct SectorTrailer
    {
        SectorKey keyA;
        etl::array<uint8_t, geometry::TRAILER_ACCESS_BITS_SIZE> accessBits;
        SectorKey keyB;

        static SectorTrailer fromBlock(const Block& block);
    };

    /**
     * @brief Full 1 KB tag image, always exactly 64 blocks
     *
     * Construction from untrusted input goes through fromBlocks/fromBytes,
     * which enforce the block count.
     */
    class TagImage
    {
    public:
        /**
         * @brief Zero-filled image
         */
        TagImage();

        /**
         * @brief Build an image from a block list
         *
         * @param blocks Block list of any length
         * @return etl::expected<TagImage, error::Error> MalformedImage unless exactly 64 blocks
         */
        static etl::expected<TagImage, error::Error> fromBlocks(const etl::ivector<Block>& blocks);

        /**
         * @brief Build an image from a flat byte buffer
         *
         * @param data Raw image bytes
         * @param length Byte count
         * @return etl::expected<TagImage, error::Error> MalformedImage unless exactly 1024 bytes
         */
        static etl::expected<TagImage, error::Error> fromBytes(const uint8_t* data, size_t length);

        Block& block(size_t index)
        {
            return blocks[index];
        }

        const Block& block(size_t index) const
        {
            return blocks[index];
        }

        size_t size() const
        {
            return blocks.size();
        }

        /**
         * @brief UID stored in the first 4 bytes of block 0
         */
        TagUid uid() const;

        /**
         * @brief Check whether every byte of a sector (trailer included) is zero
         */
        bool isSectorZero(size_t sector) const;

        /**
         * @brief Zero all blocks of a sector
         */
        void clearSector(size_t sector);

        /**
         * @brief Mask of sectors holding at least one non-zero byte
         *
         * Used to reconstruct a readability mask from images that do not
         * carry one.
         */
        SectorMask nonZeroSectors() const;

        /**
         * @brief Copy the payload blocks of this image on top of a base image
         *
         * Block 0 and every sector trailer keep the base image's content.
         *
         * @param base Image supplying block 0 and trailers
         * @return TagImage Merged image
         */
        TagImage mergedOnto(const TagImage& base) const;

        bool operator==(const TagImage& other) const;
        bool operator!=(const TagImage& other) const
        {
            return !(*this == other);
        }

    private:
        etl::array<Block, geometry::BLOCK_COUNT> blocks;
    };

    /**
     * @brief Render a UID as 8 uppercase hex characters
     */
    std::string uidToHex(const TagUid& uid);

    /**
     * @brief Parse an 8-hex-character UID
     *
     * @return etl::expected<TagUid, error::Error> InvalidEncoding on bad text or length
     */
    etl::expected<TagUid, error::Error> uidFromHex(etl::string_view text);

    /**
     * @brief Render a key as 12 uppercase hex characters
     */
    std::string keyToHex(const SectorKey& key);

    /**
     * @brief Parse a 12-hex-character key
     *
     * @return etl::expected<SectorKey, error::Error> InvalidEncoding on bad text or length
     */
    etl::expected<SectorKey, error::Error> keyFromHex(etl::string_view text);

} // namespace spool
