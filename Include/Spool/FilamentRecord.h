/**
 * @file FilamentRecord.h
 * @brief Decoded attributes of a filament spool tag
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

#include "TagTypes.h"

namespace spool
{
    /**
     * @brief Structured view of a filament tag image
     *
     * Integer fields are wider than their on-tag slot so that the encoder can
     * reject values that do not fit instead of wrapping them.
     */
    struct FilamentRecord
    {
        // Sector 0
        TagUid uid = {};
        etl::array<uint8_t, 12> manufacturerData = {};
        std::string materialVariantId;          // e.g. "A50-K0"
        std::string materialId;                 // e.g. "GFA00"
        std::string filamentType;               // e.g. "PLA"

        // Sector 1
        std::string detailedFilamentType;       // e.g. "PLA Basic"
        etl::array<uint8_t, 4> colorRgba = {};
        uint32_t spoolWeightG = 0;
        float filamentDiameterMm = 0.0f;
        uint32_t dryingTempC = 0;
        uint32_t dryingTimeH = 0;
        uint32_t bedTempType = 0;
        uint32_t bedTempC = 0;
        uint32_t maxHotendTempC = 0;
        uint32_t minHotendTempC = 0;

        // Sector 2
        etl::array<uint8_t, 12> xcamInfo = {};
        float nozzleDiameter = 0.0f;
        std::string trayUid;
        float spoolWidthMm = 0.0f;              // stored on tag as mm x 100

        // Sector 3
        std::string productionDatetime;         // e.g. "2024_03_15_10_30"
        std::string shortProductionDatetime;
        uint32_t filamentLengthM = 0;

        // Sector 4
        uint32_t colorFormat = 0;               // 2 == secondary colour present
        uint32_t colorCount = 0;
        etl::array<uint8_t, 4> secondaryColor = {};

        // Sectors 10..15
        etl::array<uint8_t, geometry::SIGNATURE_SIZE> rsaSignature = {};
        bool hasRsaSignature = false;

        /**
         * @brief Primary colour as "#RRGGBB"
         */
        std::string colorHex() const;

        uint8_t colorAlpha() const
        {
            return colorRgba[3];
        }

        /**
         * @brief Multi-line "name: value" listing of the decoded fields
         */
        std::string toString() const;
    };

} // namespace spool
