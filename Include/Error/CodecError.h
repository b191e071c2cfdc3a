/**
 * @file CodecError.h
 * @brief Defines tag image codec error codes
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
     * @brief Tag image codec error codes
     * 
     */
    enum class CodecError : uint8_t {
        Ok = 0,
        MalformedImage,     // wrong block count or block size
        FieldOutOfRange,    // value does not fit its slot on encode
        InvalidEncoding     // bad hex/base64/dump text
    };

} // namespace error
