/**
 * @file CardInfo.cpp
 * @brief Identification data of a tag in the reader field
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Agent/CardInfo.h"
#include "Spool/TagGeometry.h"

#include <cstdio>

namespace agent
{
    CardType CardInfo::detectType()
    {
        // ATQA is stored little-endian as delivered by the reader

        // MIFARE Classic 1K: ATQA = 0x0400 (LE), SAK = 0x08
        if (atqa == 0x0400 && sak == 0x08)
        {
            type = CardType::MifareClassic1K;
            return type;
        }

        // MIFARE Classic 4K: ATQA = 0x0200 (LE), SAK = 0x18
        if (atqa == 0x0200 && sak == 0x18)
        {
            type = CardType::MifareClassic4K;
            return type;
        }

        // DESFire: ATQA = 0x4403 (LE), SAK = 0x20
        if (atqa == 0x4403 && sak == 0x20)
        {
            type = CardType::MifareDesfire;
            return type;
        }

        if (atqa == 0x4400 && sak == 0x00)
        {
            type = CardType::MifareUltralight;
            return type;
        }

        if ((sak & 0x20) != 0)
        {
            type = CardType::ISO14443_4_Generic;
            return type;
        }

        type = CardType::Unknown;
        return type;
    }

    bool CardInfo::isFilamentTagCandidate() const
    {
        return type == CardType::MifareClassic1K && uid.size() == spool::geometry::UID_SIZE;
    }

    etl::string<128> CardInfo::toString() const
    {
        const char* typeStr = "Unknown";
        switch (type)
        {
            case CardType::MifareClassic1K:
                typeStr = "MIFARE Classic 1K";
                break;
            case CardType::MifareClassic4K:
                typeStr = "MIFARE Classic 4K";
                break;
            case CardType::MifareUltralight:
                typeStr = "MIFARE Ultralight";
                break;
            case CardType::MifareDesfire:
                typeStr = "MIFARE DESFire";
                break;
            case CardType::ISO14443_4_Generic:
                typeStr = "ISO14443-4 Generic";
                break;
            default:
                break;
        }

        char uidStr[32] = {0};
        size_t used = 0;
        for (size_t i = 0; i < uid.size() && used + 3 < sizeof(uidStr); ++i)
        {
            used += static_cast<size_t>(std::snprintf(uidStr + used, sizeof(uidStr) - used, "%02X", uid[i]));
        }

        // ATQA shown big-endian, the usual notation
        uint16_t atqaDisplay = static_cast<uint16_t>(((atqa & 0xFF) << 8) | ((atqa >> 8) & 0xFF));

        char buffer[128];
        std::snprintf(buffer, sizeof(buffer), "%s UID=%s ATQA=0x%04X SAK=0x%02X",
                      typeStr, uidStr, atqaDisplay, sak);
        return etl::string<128>(buffer);
    }

} // namespace agent
