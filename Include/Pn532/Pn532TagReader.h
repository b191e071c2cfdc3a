/**
 * @file Pn532TagReader.h
 * @brief PN532 as tag detector and MIFARE transceiver for the agent
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdint>

#include <etl/expected.h>
#include <etl/vector.h>

#include "Agent/ICardDetector.h"
#include "Agent/ITagTransceiver.h"
#include "Error/Error.h"
#include "Pn532Driver.h"

namespace pn532
{
    /**
     * @brief Adapter that exposes a Pn532Driver through the agent interfaces
     *
     * detectCard() selects at most one ISO14443A target; transceive() relays
     * to that target with InDataExchange, so the PN532 handles CRC and the
     * MIFARE Crypto1 session. A tag halts after a rejected authentication,
     * so the next exchange first re-selects it and checks the UID.
     */
    class Pn532TagReader : public agent::ICardDetector, public agent::ITagTransceiver
    {
    public:
        explicit Pn532TagReader(Pn532Driver& driver);

        /**
         * @brief Probe the chip, put it in normal SAM mode and bound target polling
         *
         * @return etl::expected<FirmwareInfo, error::Error> Firmware of the reader
         */
        etl::expected<FirmwareInfo, error::Error> init();

        etl::expected<agent::CardInfo, error::Error> detectCard() override;

        etl::expected<agent::TagFrame, error::Error> transceive(const etl::ivector<uint8_t>& command) override;

    private:
        etl::expected<agent::CardInfo, error::Error> select();
        etl::expected<void, error::Error> reselect();

        Pn532Driver& driver;
        uint8_t targetNumber;
        bool needsReselect;
        etl::vector<uint8_t, 10> selectedUid;
    };

} // namespace pn532
