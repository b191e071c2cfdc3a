/**
 * @file MifareClassicCard.cpp
 * @brief MIFARE Classic command set on top of a tag transceiver
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Agent/MifareClassicCard.h"
#include "Utils/Logging.h"
#include "Utils/TextCodec.h"

#include <algorithm>

using namespace error;

namespace agent
{
    MifareClassicCard::MifareClassicCard(ITagTransceiver& transceiver)
        : transceiver(transceiver)
    {
    }

    void MifareClassicCard::reset()
    {
        authenticatedSector.reset();
    }

    bool MifareClassicCard::isAuthenticatedFor(size_t block) const
    {
        return authenticatedSector && authenticatedSector.value() == spool::geometry::sectorOf(block);
    }

    etl::expected<void, Error> MifareClassicCard::authenticate(const spool::TagUid& uid,
                                                               size_t sector,
                                                               KeyType keyType,
                                                               const spool::SectorKey& key)
    {
        authenticatedSector.reset();
        if (sector >= spool::geometry::SECTOR_COUNT)
        {
            return etl::unexpected(Error::fromHardware(HardwareError::NotSupported));
        }

        // AUTH: [cmd][block][key 6][uid 4]
        etl::vector<uint8_t, 12> command;
        command.push_back(static_cast<uint8_t>(keyType));
        command.push_back(static_cast<uint8_t>(spool::geometry::firstBlockOf(sector)));
        command.insert(command.end(), key.begin(), key.end());
        command.insert(command.end(), uid.begin(), uid.end());

        auto response = transceiver.transceive(command);
        if (!response)
        {
            LOG_DEBUG("Sector %u key %c %s rejected",
                      static_cast<unsigned>(sector),
                      keyType == KeyType::A ? 'A' : 'B',
                      utils::redactKey(key.data(), key.size()).c_str());
            return etl::unexpected(response.error());
        }

        authenticatedSector = sector;
        return {};
    }

    etl::expected<spool::Block, Error> MifareClassicCard::readBlock(size_t block)
    {
        if (!isAuthenticatedFor(block))
        {
            return etl::unexpected(Error::fromLink(LinkError::AuthenticationError));
        }

        etl::vector<uint8_t, 2> command;
        command.push_back(CMD_READ);
        command.push_back(static_cast<uint8_t>(block));

        auto response = transceiver.transceive(command);
        if (!response)
        {
            return etl::unexpected(response.error());
        }
        if (response.value().size() != spool::geometry::BLOCK_SIZE)
        {
            LOG_ERROR("READ of block %u returned %u bytes",
                      static_cast<unsigned>(block),
                      static_cast<unsigned>(response.value().size()));
            return etl::unexpected(Error::fromHardware(HardwareError::ReadFailed));
        }

        spool::Block data;
        std::copy(response.value().begin(), response.value().end(), data.begin());
        return data;
    }

    etl::expected<void, Error> MifareClassicCard::writeBlock(size_t block, const spool::Block& data)
    {
        if (!spool::geometry::isWritable(block))
        {
            LOG_ERROR("Refusing to write block %u", static_cast<unsigned>(block));
            return etl::unexpected(Error::fromAgent(AgentError::UnsupportedOperation));
        }
        if (!isAuthenticatedFor(block))
        {
            return etl::unexpected(Error::fromLink(LinkError::AuthenticationError));
        }

        // WRITE: [cmd][block][data 16]
        etl::vector<uint8_t, 18> command;
        command.push_back(CMD_WRITE);
        command.push_back(static_cast<uint8_t>(block));
        command.insert(command.end(), data.begin(), data.end());

        auto response = transceiver.transceive(command);
        if (!response)
        {
            LOG_ERROR("WRITE of block %u failed: %s",
                      static_cast<unsigned>(block), response.error().toString().c_str());
            return etl::unexpected(response.error());
        }
        return {};
    }

} // namespace agent
