/**
 * @file CardType.h
 * @brief Tag types the agent can recognise from ATQA/SAK
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdint>

namespace agent
{
    enum class CardType : uint8_t {
        Unknown = 0,
        MifareClassic1K,
        MifareClassic4K,
        MifareUltralight,
        MifareDesfire,
        ISO14443_4_Generic
    };

} // namespace agent
