/**
 * @file MifareClassicCard.h
 * @brief MIFARE Classic command set on top of a tag transceiver
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdint>

#include <etl/optional.h>

#include "IMifareClassic.h"
#include "ITagTransceiver.h"

namespace agent
{
    /**
     * @brief MIFARE Classic card class
     *
     * Builds the AUTH, READ and WRITE commands; the transceiver does the
     * framing. Block 0 and sector trailers are refused by writeBlock() so a
     * wrong image can never lock a tag.
     */
    class MifareClassicCard : public IMifareClassic
    {
    public:
        static constexpr uint8_t CMD_READ = 0x30;
        static constexpr uint8_t CMD_WRITE = 0xA0;

        explicit MifareClassicCard(ITagTransceiver& transceiver);

        etl::expected<void, error::Error> authenticate(const spool::TagUid& uid,
                                                       size_t sector,
                                                       KeyType keyType,
                                                       const spool::SectorKey& key) override;

        etl::expected<spool::Block, error::Error> readBlock(size_t block) override;

        etl::expected<void, error::Error> writeBlock(size_t block, const spool::Block& data) override;

        /**
         * @brief Forget the authenticated sector, e.g. after the tag left the field
         */
        void reset();

    private:
        bool isAuthenticatedFor(size_t block) const;

        ITagTransceiver& transceiver;
        etl::optional<size_t> authenticatedSector;
    };

} // namespace agent
