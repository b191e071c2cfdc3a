/**
 * @file AgentError.h
 * @brief Defines remote agent error codes
 * @version 0.1
 * @date 2026-10-19
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    /**
     * @brief Remote agent (tag side) error codes
     * 
     */
    enum class AgentError : uint8_t {
        Ok = 0,
        NoTagPresent,
        UnsupportedTagType,
        Cancelled,
        Busy,
        UnsupportedOperation
    };

} // namespace error
