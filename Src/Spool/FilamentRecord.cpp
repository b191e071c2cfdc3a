/**
 * @file FilamentRecord.cpp
 * @brief Decoded attributes of a filament spool tag
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Spool/FilamentRecord.h"
#include "Utils/TextCodec.h"

#include <cstdio>

namespace spool
{
    namespace
    {
        void appendLine(std::string& out, const char* name, const std::string& value)
        {
            char label[32];
            std::snprintf(label, sizeof(label), "%-26s", name);
            out.append(label);
            out.append(value);
            out.push_back('\n');
        }

        std::string number(uint32_t value, const char* unit)
        {
            char buffer[32];
            std::snprintf(buffer, sizeof(buffer), "%u%s", value, unit);
            return std::string(buffer);
        }

        std::string decimal(float value, const char* unit)
        {
            char buffer[32];
            std::snprintf(buffer, sizeof(buffer), "%.2f%s", static_cast<double>(value), unit);
            return std::string(buffer);
        }
    }

    std::string FilamentRecord::colorHex() const
    {
        char buffer[8];
        std::snprintf(buffer, sizeof(buffer), "#%02X%02X%02X", colorRgba[0], colorRgba[1], colorRgba[2]);
        return std::string(buffer);
    }

    std::string FilamentRecord::toString() const
    {
        std::string out;
        appendLine(out, "UID:", uidToHex(uid));
        appendLine(out, "Material variant:", materialVariantId);
        appendLine(out, "Material id:", materialId);
        appendLine(out, "Filament type:", filamentType);
        appendLine(out, "Detailed type:", detailedFilamentType);
        appendLine(out, "Color:", colorHex() + " alpha " + number(colorAlpha(), ""));
        appendLine(out, "Spool weight:", number(spoolWeightG, " g"));
        appendLine(out, "Filament diameter:", decimal(filamentDiameterMm, " mm"));
        appendLine(out, "Drying:", number(dryingTempC, " C for ") + number(dryingTimeH, " h"));
        appendLine(out, "Bed temperature:", number(bedTempC, " C (type ") + number(bedTempType, ")"));
        appendLine(out, "Hotend temperature:", number(minHotendTempC, " - ") + number(maxHotendTempC, " C"));
        appendLine(out, "X-Cam info:", utils::toHex(xcamInfo.data(), xcamInfo.size(), ' '));
        appendLine(out, "Nozzle diameter:", decimal(nozzleDiameter, " mm"));
        appendLine(out, "Tray UID:", trayUid);
        appendLine(out, "Spool width:", decimal(spoolWidthMm, " mm"));
        appendLine(out, "Production date:", productionDatetime);
        appendLine(out, "Short production date:", shortProductionDatetime);
        appendLine(out, "Filament length:", number(filamentLengthM, " m"));
        if (colorFormat == 2)
        {
            char buffer[8];
            std::snprintf(buffer, sizeof(buffer), "#%02X%02X%02X",
                          secondaryColor[0], secondaryColor[1], secondaryColor[2]);
            appendLine(out, "Secondary color:", std::string(buffer));
        }
        appendLine(out, "Color count:", number(colorCount, ""));
        appendLine(out, "RSA signature:", hasRsaSignature ? "present" : "absent");
        return out;
    }

} // namespace spool
