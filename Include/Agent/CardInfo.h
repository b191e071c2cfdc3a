/**
 * @file CardInfo.h
 * @brief Identification data of a tag in the reader field
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/vector.h>
#include <etl/string.h>

#include <cstdint>

#include "CardType.h"

namespace agent
{

   struct CardInfo {
      etl::vector<uint8_t, 10> uid;    // Unique Identifier of the card
      uint16_t atqa = 0;               // ATQA value, little-endian as received
      uint8_t  sak = 0;                // SAK value
      CardType type = CardType::Unknown;

      /**
       * @brief Classify the card from ATQA and SAK, storing the result in type
       */
      CardType detectType();

      /**
       * @brief True for a MIFARE Classic 1K with a 4-byte UID, the only layout filament tags use
       */
      bool isFilamentTagCandidate() const;

      etl::string<128> toString() const;
   };

} // namespace agent
