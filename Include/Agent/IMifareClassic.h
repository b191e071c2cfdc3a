/**
 * @file IMifareClassic.h
 * @brief Sector-level access to a MIFARE Classic tag
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdint>

#include <etl/expected.h>

#include "Error/Error.h"
#include "Spool/TagTypes.h"

namespace agent
{
    enum class KeyType : uint8_t
    {
        A = 0x60,
        B = 0x61
    };

    class IMifareClassic
    {
    public:
        virtual ~IMifareClassic() = default;

        /**
         * @brief Authenticate a sector
         *
         * @param uid UID of the selected tag
         * @param sector Sector number 0..15
         * @param keyType Key slot to authenticate against
         * @param key Six byte key
         * @return etl::expected<void, error::Error> LinkError::AuthenticationError if the key is wrong
         */
        virtual etl::expected<void, error::Error> authenticate(const spool::TagUid& uid,
                                                               size_t sector,
                                                               KeyType keyType,
                                                               const spool::SectorKey& key) = 0;

        /**
         * @brief Read one block of the last authenticated sector
         */
        virtual etl::expected<spool::Block, error::Error> readBlock(size_t block) = 0;

        /**
         * @brief Write one block of the last authenticated sector
         */
        virtual etl::expected<void, error::Error> writeBlock(size_t block, const spool::Block& data) = 0;
    };

} // namespace agent
