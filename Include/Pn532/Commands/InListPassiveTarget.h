/**
 * @file InListPassiveTarget.h
 * @brief InListPassiveTarget command for ISO14443A tag detection
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include "Pn532/IPn532Command.h"

#include <etl/vector.h>
#include <cstdint>

namespace pn532
{
    /**
     * @brief One ISO14443A target as reported by the PN532
     */
    struct TargetInfo
    {
        uint8_t targetNumber = 0;
        etl::vector<uint8_t, 10> uid;
        uint16_t atqa = 0;      // little-endian, as the PN532 sends SENS_RES
        uint8_t sak = 0;
    };

    struct InListPassiveTargetOptions
    {
        uint8_t maxTargets = 1;
        uint32_t responseTimeoutMs = 150;
    };

    /**
     * @brief Detects ISO14443A targets at 106 kbps
     *
     * Frames with no target (NbTg = 0) are valid and leave the target list empty.
     */
    class InListPassiveTarget : public IPn532Command
    {
    public:
        explicit InListPassiveTarget(const InListPassiveTargetOptions& opts = InListPassiveTargetOptions());

        etl::string_view name() const override;
        CommandRequest buildRequest() override;
        etl::expected<void, error::Error> parseResponse(const Pn532ResponseFrame& frame) override;

        const etl::ivector<TargetInfo>& getDetectedTargets() const;

    private:
        bool parseTypeATarget(const etl::ivector<uint8_t>& data, size_t& index, TargetInfo& target);

        InListPassiveTargetOptions options;
        etl::vector<TargetInfo, 2> detectedTargets;
    };

} // namespace pn532
