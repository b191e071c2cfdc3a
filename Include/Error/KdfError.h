/**
 * @file KdfError.h
 * @brief Defines sector key derivation error codes
 * @version 0.1
 * @date 2026-10-19
 * 
 * @copyright Copyright (c) 2026
 * 
 */

#pragma once

#include <stdint.h>

namespace error {

    enum class KdfError : uint8_t {
        Ok = 0,
        InvalidInput,
        BackendFailure
    };

} // namespace error
