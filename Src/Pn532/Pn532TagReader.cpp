/**
 * @file Pn532TagReader.cpp
 * @brief PN532 as tag detector and MIFARE transceiver for the agent
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Pn532/Pn532TagReader.h"
#include "Pn532/Commands/InDataExchange.h"
#include "Pn532/Commands/InListPassiveTarget.h"
#include "Utils/Logging.h"

using namespace error;

namespace pn532
{
    namespace
    {
        // Keeps one InListPassiveTarget well inside its response timeout
        constexpr uint8_t PASSIVE_ACTIVATION_RETRIES = 0x02;
    }

    Pn532TagReader::Pn532TagReader(Pn532Driver& driver)
        : driver(driver)
        , targetNumber(0)
        , needsReselect(false)
    {
    }

    etl::expected<FirmwareInfo, Error> Pn532TagReader::init()
    {
        auto firmware = driver.getFirmwareVersion();
        if (!firmware)
        {
            LOG_ERROR("PN532 not responding");
            return firmware;
        }
        LOG_INFO("Found %s", firmware.value().toString().c_str());

        auto sam = driver.setSamConfiguration(SamMode::Normal);
        if (!sam)
        {
            return etl::unexpected<Error>(sam.error());
        }

        auto retries = driver.setPassiveActivationRetries(PASSIVE_ACTIVATION_RETRIES);
        if (!retries)
        {
            return etl::unexpected<Error>(retries.error());
        }
        return firmware;
    }

    etl::expected<agent::CardInfo, Error> Pn532TagReader::detectCard()
    {
        auto info = select();
        if (info)
        {
            LOG_DEBUG("Detected %s", info.value().toString().c_str());
        }
        return info;
    }

    etl::expected<agent::CardInfo, Error> Pn532TagReader::select()
    {
        targetNumber = 0;
        needsReselect = false;
        selectedUid.clear();

        InListPassiveTarget cmd;
        auto result = driver.executeCommand(cmd);
        if (!result)
        {
            // The PN532 stays silent until its own polling gives up
            if (result.error().isCode(HardwareError::Timeout))
            {
                return etl::unexpected<Error>(Error::fromAgent(AgentError::NoTagPresent));
            }
            return etl::unexpected<Error>(result.error());
        }

        const auto& targets = cmd.getDetectedTargets();
        if (targets.empty())
        {
            return etl::unexpected<Error>(Error::fromAgent(AgentError::NoTagPresent));
        }

        const TargetInfo& target = targets[0];
        targetNumber = target.targetNumber;

        agent::CardInfo info;
        info.uid.assign(target.uid.begin(), target.uid.end());
        info.atqa = target.atqa;
        info.sak = target.sak;
        info.detectType();
        selectedUid = info.uid;
        return info;
    }

    etl::expected<void, Error> Pn532TagReader::reselect()
    {
        const etl::vector<uint8_t, 10> expected = selectedUid;
        auto info = select();
        if (!info || info.value().uid != expected)
        {
            targetNumber = 0;
            return etl::unexpected<Error>(Error::fromLink(LinkError::CardDisappeared));
        }
        return {};
    }

    etl::expected<agent::TagFrame, Error> Pn532TagReader::transceive(const etl::ivector<uint8_t>& command)
    {
        if (targetNumber == 0)
        {
            return etl::unexpected<Error>(Error::fromLink(LinkError::CardDisappeared));
        }
        if (needsReselect)
        {
            auto reselected = reselect();
            if (!reselected)
            {
                return etl::unexpected<Error>(reselected.error());
            }
        }

        InDataExchangeOptions opts;
        opts.targetNumber = targetNumber;
        if (command.size() > opts.payload.max_size())
        {
            return etl::unexpected<Error>(Error::fromHardware(HardwareError::BufferOverflow));
        }
        opts.payload.assign(command.begin(), command.end());

        InDataExchange cmd(opts);
        auto result = driver.executeCommand(cmd);
        if (!result)
        {
            return etl::unexpected<Error>(result.error());
        }

        auto statusError = cmd.getStatusError();
        if (statusError)
        {
            LOG_DEBUG("InDataExchange status 0x%02X", static_cast<unsigned>(cmd.getStatus()));
            if (statusError->isCode(LinkError::CardDisappeared))
            {
                targetNumber = 0;
            }
            else if (statusError->isCode(LinkError::AuthenticationError))
            {
                needsReselect = true;
            }
            return etl::unexpected<Error>(*statusError);
        }

        const auto& data = cmd.getResponseData();
        agent::TagFrame frame;
        frame.assign(data.begin(), data.end());
        return frame;
    }

} // namespace pn532
