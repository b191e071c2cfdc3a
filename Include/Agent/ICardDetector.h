/**
 * @file ICardDetector.h
 * @brief Interface for tag detection
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/expected.h>

#include "Error/Error.h"
#include "CardInfo.h"

namespace agent
{

    /**
     * @brief Interface for tag detection
     *
     */
    class ICardDetector
    {
    public:
        virtual ~ICardDetector() = default;

        /**
         * @brief Look for a tag in the field and select it
         *
         * @return etl::expected<CardInfo, error::Error> tag information, AgentError::NoTagPresent
         *         if the field is empty, or a hardware error
         */
        virtual etl::expected<CardInfo, error::Error> detectCard() = 0;
    };

} // namespace agent
