/**
 * @file TagOperations.cpp
 * @brief Whole-tag read and write with per-sector authentication policy
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Agent/TagOperations.h"
#include "Utils/Logging.h"

#include <initializer_list>

using namespace error;
namespace geometry = spool::geometry;

namespace agent
{
    namespace
    {
        // Tag gone or reader broken: nothing more can be done with this tag
        bool isFatal(const Error& error)
        {
            return error.getLayer() != ErrorLayer::Link
                || error.isCode(LinkError::CardDisappeared)
                || error.isCode(LinkError::Timeout);
        }
    }

    TagOperations::TagOperations(IMifareClassic& card, const spool::KeyList& defaultKeys)
        : card(card)
        , defaultKeys(defaultKeys)
    {
    }

    etl::expected<bool, Error> TagOperations::tryKey(const spool::TagUid& uid, size_t sector, const spool::SectorKey& key)
    {
        for (KeyType keyType : { KeyType::A, KeyType::B })
        {
            auto result = card.authenticate(uid, sector, keyType, key);
            if (result)
            {
                return true;
            }
            if (isFatal(result.error()))
            {
                return etl::unexpected(result.error());
            }
        }
        return false;
    }

    etl::expected<ReadOutcome, Error> TagOperations::readAll(const spool::TagUid& uid,
                                                             const spool::KeyList& keys,
                                                             const std::atomic<bool>* cancel)
    {
        ReadOutcome outcome;

        for (size_t sector = 0; sector < geometry::SECTOR_COUNT; ++sector)
        {
            if (cancel != nullptr && cancel->load())
            {
                return etl::unexpected(Error::fromAgent(AgentError::Cancelled));
            }

            spool::KeyList candidates;
            if (sector < keys.size())
            {
                candidates.push_back(keys[sector]);
            }
            for (const auto& key : defaultKeys)
            {
                if (!candidates.full())
                {
                    candidates.push_back(key);
                }
            }

            bool authenticated = false;
            for (const auto& key : candidates)
            {
                auto accepted = tryKey(uid, sector, key);
                if (!accepted)
                {
                    return etl::unexpected(accepted.error());
                }
                if (accepted.value())
                {
                    authenticated = true;
                    break;
                }
            }

            if (!authenticated)
            {
                LOG_WARN("Auth failed for sector %u, using zeros", static_cast<unsigned>(sector));
                outcome.image.clearSector(sector);
                continue;
            }

            bool complete = true;
            const size_t first = geometry::firstBlockOf(sector);
            for (size_t block = first; block < first + geometry::BLOCKS_PER_SECTOR; ++block)
            {
                auto data = card.readBlock(block);
                if (!data)
                {
                    LOG_ERROR("Read of block %u failed: %s",
                              static_cast<unsigned>(block), data.error().toString().c_str());
                    if (isFatal(data.error()))
                    {
                        return etl::unexpected(data.error());
                    }
                    complete = false;
                    break;
                }
                outcome.image.block(block) = data.value();
            }

            if (complete)
            {
                outcome.readable.set(sector);
            }
            else
            {
                outcome.image.clearSector(sector);
            }
        }

        LOG_INFO("Read complete: %u of 16 sectors readable", static_cast<unsigned>(outcome.readable.count()));
        return outcome;
    }

    etl::expected<uint32_t, Error> TagOperations::writeAll(const spool::TagUid& uid,
                                                           const spool::TagImage& image,
                                                           const spool::KeyList& keys)
    {
        uint32_t written = 0;

        for (size_t sector = 0; sector < geometry::SECTOR_COUNT && sector < keys.size(); ++sector)
        {
            auto accepted = tryKey(uid, sector, keys[sector]);
            if (!accepted)
            {
                return etl::unexpected(accepted.error());
            }
            if (!accepted.value())
            {
                LOG_WARN("Auth failed for sector %u during write", static_cast<unsigned>(sector));
                continue;
            }

            const size_t first = geometry::firstBlockOf(sector);
            for (size_t block = first; block < first + geometry::BLOCKS_PER_SECTOR; ++block)
            {
                if (!geometry::isWritable(block))
                {
                    continue;
                }

                auto result = card.writeBlock(block, image.block(block));
                if (!result)
                {
                    if (isFatal(result.error()))
                    {
                        return etl::unexpected(result.error());
                    }
                    LOG_WARN("Block %u rejected, skipping rest of sector %u",
                             static_cast<unsigned>(block), static_cast<unsigned>(sector));
                    break;
                }
                ++written;
            }
        }

        LOG_INFO("Write complete: %u blocks written", static_cast<unsigned>(written));
        return written;
    }

} // namespace agent
