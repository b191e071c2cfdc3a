/**
 * @file TagOperations.h
 * @brief Whole-tag read and write with per-sector authentication policy
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <atomic>
#include <cstdint>

#include <etl/expected.h>

#include "Error/Error.h"
#include "IMifareClassic.h"
#include "Spool/TagTypes.h"

namespace agent
{
    /**
     * @brief Image read from a tag plus the sectors that could be authenticated
     */
    struct ReadOutcome
    {
        spool::TagImage image;
        spool::SectorMask readable;
    };

    /**
     * @brief Sector-by-sector read and write of a filament tag
     *
     * A sector that cannot be authenticated or is rejected on the RF link
     * never aborts an operation: a read zero-fills it and clears its
     * readability bit, a write skips it. A lost tag, a link timeout or a
     * reader failure aborts.
     */
    class TagOperations
    {
    public:
        /**
         * @param card Card access
         * @param defaultKeys Keys tried in order, after the supplied key, for every sector on read
         */
        TagOperations(IMifareClassic& card, const spool::KeyList& defaultKeys);

        /**
         * @brief Read all 64 blocks
         *
         * Per sector: supplied key as A then B, then every default key as A then B.
         *
         * @param uid UID of the selected tag
         * @param keys Supplied keys, may be shorter than 16 or empty
         * @param cancel Checked between sectors, nullptr if the read cannot be cancelled
         * @return etl::expected<ReadOutcome, error::Error> Image and readability mask, or a card error
         */
        etl::expected<ReadOutcome, error::Error> readAll(const spool::TagUid& uid,
                                                         const spool::KeyList& keys,
                                                         const std::atomic<bool>* cancel = nullptr);

        /**
         * @brief Write the payload blocks of an image
         *
         * Block 0 and sector trailers are never written. Only sectors with a
         * supplied key that authenticates (as A, then B) are written.
         *
         * @param uid UID of the selected tag
         * @param image Source of the block contents
         * @param keys Supplied keys, sector n uses keys[n]
         * @return etl::expected<uint32_t, error::Error> Number of blocks written, or a card error
         */
        etl::expected<uint32_t, error::Error> writeAll(const spool::TagUid& uid,
                                                       const spool::TagImage& image,
                                                       const spool::KeyList& keys);

    private:
        etl::expected<bool, error::Error> tryKey(const spool::TagUid& uid, size_t sector, const spool::SectorKey& key);

        IMifareClassic& card;
        spool::KeyList defaultKeys;
    };

} // namespace agent
