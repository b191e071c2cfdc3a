/**
 * @file PendingRequest.h
 * @brief The single in-flight tag operation of a bridge session
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdint>
#include <string>

#include <etl/optional.h>

#include "Spool/TagTypes.h"

namespace bridge
{
    enum class RequestKind : uint8_t
    {
        Read,
        Write
    };

    struct PendingRequest
    {
        RequestKind kind;
        std::string correlationId;
        spool::KeyList keys;
        etl::optional<spool::TagImage> payload;
        etl::optional<spool::TagUid> targetUid;
        uint32_t deadline;      // tick at which the request times out
    };

} // namespace bridge
