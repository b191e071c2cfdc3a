/**
 * @file Envelope.h
 * @brief JSON envelopes exchanged between the bridge session and the agent
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdint>
#include <string>

#include <etl/expected.h>
#include <etl/optional.h>
#include <etl/variant.h>

#include "Error/Error.h"
#include "Spool/TagTypes.h"

namespace bridge
{
    /**
     * @brief Session -> agent: read the next tag presented
     */
    struct ReadTagRequest
    {
        std::string requestId;
        spool::KeyList keys;            // empty: agent derives or uses defaults
    };

    /**
     * @brief Session -> agent: write payload blocks to the next tag presented
     */
    struct WriteTagRequest
    {
        std::string requestId;
        spool::KeyList keys;
        spool::TagImage image;
        etl::optional<spool::TagUid> targetUid;     // UID rewrite intent
    };

    struct StatusMessage
    {
        bool connected = false;
        std::string device;
    };

    struct TagDetectedMessage
    {
        spool::TagUid uid;
    };

    /**
     * @brief Agent -> session: result of a read, or an unsolicited scan if requestId is empty
     */
    struct TagDataMessage
    {
        std::string requestId;
        spool::TagUid uid;
        spool::TagImage image;
        etl::optional<spool::SectorMask> readable;  // "sectors_ok", absent from older agents
    };

    struct WriteResultMessage
    {
        std::string requestId;
        bool success = false;
        uint32_t blocksWritten = 0;
        std::string error;
    };

    struct ErrorMessage
    {
        std::string requestId;
        std::string message;
    };

    using Envelope = etl::variant<
        ReadTagRequest,
        WriteTagRequest,
        StatusMessage,
        TagDetectedMessage,
        TagDataMessage,
        WriteResultMessage,
        ErrorMessage
    >;

    /**
     * @brief Serialisation of envelopes to single-line JSON and back
     *
     * Blocks travel as base64 of 16 bytes, keys as 12 hex characters and
     * UIDs as 8 hex characters. Anything that does not fit the schema is
     * rejected with BridgeError::ProtocolViolation.
     */
    class EnvelopeCodec
    {
    public:
        static std::string encode(const Envelope& envelope);

        static std::string encode(const ReadTagRequest& message);
        static std::string encode(const WriteTagRequest& message);
        static std::string encode(const StatusMessage& message);
        static std::string encode(const TagDetectedMessage& message);
        static std::string encode(const TagDataMessage& message);
        static std::string encode(const WriteResultMessage& message);
        static std::string encode(const ErrorMessage& message);

        /**
         * @brief Parse one envelope
         *
         * @param text JSON text
         * @return etl::expected<Envelope, error::Error> Envelope or ProtocolViolation
         */
        static etl::expected<Envelope, error::Error> decode(const std::string& text);

        /**
         * @brief Extract "request_id" from text that failed to decode
         *
         * @return Request id, empty if the text is not a JSON object or has none
         */
        static std::string peekRequestId(const std::string& text);

        /**
         * @brief Wire name of an envelope's action, e.g. "TAG_DATA"
         */
        static const char* actionName(const Envelope& envelope);
    };

} // namespace bridge
