/**
 * @file TagGeometry.h
 * @brief MIFARE Classic 1K geometry constants and block addressing helpers
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstddef>
#include <cstdint>

namespace spool
{
    namespace geometry
    {
        // ========================================================================
        // Tag layout
        // ========================================================================

        /**
         * @brief Number of sectors on a 1K tag
         */
        constexpr size_t SECTOR_COUNT = 16;

        /**
         * @brief Blocks per sector, the last one being the sector trailer
         */
        constexpr size_t BLOCKS_PER_SECTOR = 4;

        /**
         * @brief Bytes per block
         */
        constexpr size_t BLOCK_SIZE = 16;

        /**
         * @brief Total blocks: 16 sectors x 4 blocks = 64
         */
        constexpr size_t BLOCK_COUNT = SECTOR_COUNT * BLOCKS_PER_SECTOR;

        /**
         * @brief Total image size: 64 blocks x 16 bytes = 1024 bytes
         */
        constexpr size_t IMAGE_SIZE = BLOCK_COUNT * BLOCK_SIZE;

        /**
         * @brief Tag UID length (single-size NUID/UID of a 1K tag)
         */
        constexpr size_t UID_SIZE = 4;

        /**
         * @brief Sector key length (Key A and Key B)
         */
        constexpr size_t KEY_SIZE = 6;

        // ========================================================================
        // Sector trailer layout
        // ========================================================================

        constexpr size_t TRAILER_KEY_A_OFFSET = 0;
        constexpr size_t TRAILER_ACCESS_BITS_OFFSET = 6;
        constexpr size_t TRAILER_ACCESS_BITS_SIZE = 4;
        constexpr size_t TRAILER_KEY_B_OFFSET = 10;

        // ========================================================================
        // Signature area
        // ========================================================================

        /**
         * @brief First sector holding RSA signature data
         *
         * Sectors 10..15 hold 6 x 3 data blocks = 288 bytes, of which the
         * first 256 (RSA-2048) are used.
         */
        constexpr size_t SIGNATURE_FIRST_SECTOR = 10;
        constexpr size_t SIGNATURE_SIZE = 256;

        // ========================================================================
        // Addressing helpers
        // ========================================================================

        constexpr size_t sectorOf(size_t block)
        {
            return block / BLOCKS_PER_SECTOR;
        }

        constexpr size_t firstBlockOf(size_t sector)
        {
            return sector * BLOCKS_PER_SECTOR;
        }

        constexpr size_t trailerOf(size_t sector)
        {
            return firstBlockOf(sector) + BLOCKS_PER_SECTOR - 1;
        }

        constexpr bool isTrailer(size_t block)
        {
            return (block % BLOCKS_PER_SECTOR) == BLOCKS_PER_SECTOR - 1;
        }

        /**
         * @brief Whether a block may carry payload on write
         *
         * Block 0 holds manufacturer data and trailers hold keys, neither is
         * ever written as payload.
         */
        constexpr bool isWritable(size_t block)
        {
            return block != 0 && block < BLOCK_COUNT && !isTrailer(block);
        }

    } // namespace geometry

} // namespace spool
