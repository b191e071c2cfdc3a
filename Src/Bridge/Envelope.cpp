/**
 * @file Envelope.cpp
 * @brief JSON envelopes exchanged between the bridge session and the agent
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Bridge/Envelope.h"
#include "Spool/DumpFormat.h"
#include "Utils/Logging.h"
#include "Utils/TextCodec.h"

#include <ArduinoJson.h>

using namespace error;

namespace bridge
{
    namespace
    {
        // Wire names, indexed like the Envelope alternatives
        constexpr const char* ACTION_NAMES[] = {
            "READ_TAG",
            "WRITE_TAG",
            "STATUS",
            "TAG_DETECTED",
            "TAG_DATA",
            "WRITE_RESULT",
            "ERROR"
        };

        etl::unexpected<Error> violation(const char* what)
        {
            LOG_WARN("Rejected envelope: %s", what);
            return etl::unexpected(Error::fromBridge(BridgeError::ProtocolViolation));
        }

        std::string serialize(const JsonDocument& doc)
        {
            std::string out;
            serializeJson(doc, out);
            return out;
        }

        void putRequestId(JsonDocument& doc, const std::string& requestId)
        {
            if (!requestId.empty())
            {
                doc["request_id"] = requestId;
            }
        }

        void putKeys(JsonDocument& doc, const spool::KeyList& keys)
        {
            JsonArray array = doc["keys"].to<JsonArray>();
            for (const auto& key : keys)
            {
                array.add(spool::keyToHex(key));
            }
        }

        void putBlocks(JsonDocument& doc, const spool::TagImage& image)
        {
            JsonArray array = doc["blocks"].to<JsonArray>();
            for (size_t i = 0; i < image.size(); ++i)
            {
                array.add(utils::toBase64(image.block(i).data(), image.block(i).size()));
            }
        }

        bool readRequestId(JsonVariantConst value, std::string& out)
        {
            out.clear();
            if (value.isNull())
            {
                return true;
            }
            if (value.is<const char*>())
            {
                out = value.as<const char*>();
                return true;
            }
            if (value.is<long>())
            {
                out = std::to_string(value.as<long>());
                return true;
            }
            return false;
        }

        bool readUid(JsonVariantConst value, spool::TagUid& out)
        {
            if (!value.is<const char*>())
            {
                return false;
            }
            auto uid = spool::uidFromHex(value.as<const char*>());
            if (!uid)
            {
                return false;
            }
            out = uid.value();
            return true;
        }

        // A key list is all sixteen sector keys or, where optional, absent
        bool readKeys(JsonVariantConst value, spool::KeyList& out, bool required)
        {
            out.clear();
            if (value.isNull())
            {
                return !required;
            }
            if (!value.is<JsonArrayConst>())
            {
                return false;
            }

            JsonArrayConst array = value.as<JsonArrayConst>();
            if (array.size() != out.capacity())
            {
                return false;
            }
            for (JsonVariantConst item : array)
            {
                if (!item.is<const char*>())
                {
                    return false;
                }
                auto key = spool::keyFromHex(item.as<const char*>());
                if (!key)
                {
                    return false;
                }
                out.push_back(key.value());
            }
            return true;
        }

        bool readBlocks(JsonVariantConst value, spool::TagImage& out)
        {
            if (!value.is<JsonArrayConst>())
            {
                return false;
            }

            JsonArrayConst array = value.as<JsonArrayConst>();
            if (array.size() != spool::geometry::BLOCK_COUNT)
            {
                LOG_WARN("Envelope carries %u blocks", static_cast<unsigned>(array.size()));
                return false;
            }

            size_t index = 0;
            for (JsonVariantConst item : array)
            {
                if (!item.is<const char*>())
                {
                    return false;
                }
                auto block = spool::DumpFormat::blockFromBase64(item.as<const char*>());
                if (!block)
                {
                    LOG_WARN("Envelope block %u is not 16 bytes of base64", static_cast<unsigned>(index));
                    return false;
                }
                out.block(index++) = block.value();
            }
            return true;
        }
    }

    // ==============================================================================
    // Encoding
    // ==============================================================================

    std::string EnvelopeCodec::encode(const Envelope& envelope)
    {
        return etl::visit([](const auto& message) {
                return EnvelopeCodec::encode(message);
            }, envelope);
    }

    std::string EnvelopeCodec::encode(const ReadTagRequest& message)
    {
        JsonDocument doc;
        doc["action"] = "READ_TAG";
        putRequestId(doc, message.requestId);
        if (!message.keys.empty())
        {
            putKeys(doc, message.keys);
        }
        return serialize(doc);
    }

    std::string EnvelopeCodec::encode(const WriteTagRequest& message)
    {
        JsonDocument doc;
        doc["action"] = "WRITE_TAG";
        putRequestId(doc, message.requestId);
        putKeys(doc, message.keys);
        putBlocks(doc, message.image);
        if (message.targetUid)
        {
            doc["uid"] = spool::uidToHex(message.targetUid.value());
        }
        return serialize(doc);
    }

    std::string EnvelopeCodec::encode(const StatusMessage& message)
    {
        JsonDocument doc;
        doc["action"] = "STATUS";
        doc["connected"] = message.connected;
        doc["device"] = message.device;
        return serialize(doc);
    }

    std::string EnvelopeCodec::encode(const TagDetectedMessage& message)
    {
        JsonDocument doc;
        doc["action"] = "TAG_DETECTED";
        doc["uid"] = spool::uidToHex(message.uid);
        return serialize(doc);
    }

    std::string EnvelopeCodec::encode(const TagDataMessage& message)
    {
        JsonDocument doc;
        doc["action"] = "TAG_DATA";
        doc["uid"] = spool::uidToHex(message.uid);
        putBlocks(doc, message.image);
        putRequestId(doc, message.requestId);
        if (message.readable)
        {
            doc["sectors_ok"] = message.readable.value().value();
        }
        return serialize(doc);
    }

    std::string EnvelopeCodec::encode(const WriteResultMessage& message)
    {
        JsonDocument doc;
        doc["action"] = "WRITE_RESULT";
        doc["success"] = message.success;
        doc["blocks_written"] = message.blocksWritten;
        if (!message.error.empty())
        {
            doc["error"] = message.error;
        }
        putRequestId(doc, message.requestId);
        return serialize(doc);
    }

    std::string EnvelopeCodec::encode(const ErrorMessage& message)
    {
        JsonDocument doc;
        doc["action"] = "ERROR";
        doc["message"] = message.message;
        putRequestId(doc, message.requestId);
        return serialize(doc);
    }

    // ==============================================================================
    // Decoding
    // ==============================================================================

    etl::expected<Envelope, Error> EnvelopeCodec::decode(const std::string& text)
    {
        JsonDocument doc;
        DeserializationError err = deserializeJson(doc, text);
        if (err)
        {
            LOG_WARN("Envelope is not JSON: %s", err.c_str());
            return etl::unexpected(Error::fromBridge(BridgeError::ProtocolViolation));
        }
        if (!doc.is<JsonObjectConst>() || !doc["action"].is<const char*>())
        {
            return violation("missing action");
        }

        const std::string action = doc["action"].as<const char*>();
        std::string requestId;
        if (!readRequestId(doc["request_id"], requestId))
        {
            return violation("request_id has the wrong type");
        }

        if (action == "READ_TAG")
        {
            ReadTagRequest message;
            message.requestId = requestId;
            if (!readKeys(doc["keys"], message.keys, false))
            {
                return violation("READ_TAG keys");
            }
            return Envelope(message);
        }

        if (action == "WRITE_TAG")
        {
            WriteTagRequest message;
            message.requestId = requestId;
            if (!readKeys(doc["keys"], message.keys, true))
            {
                return violation("WRITE_TAG keys");
            }
            if (!readBlocks(doc["blocks"], message.image))
            {
                return violation("WRITE_TAG blocks");
            }
            if (!doc["uid"].isNull())
            {
                spool::TagUid uid;
                if (!readUid(doc["uid"], uid))
                {
                    return violation("WRITE_TAG uid");
                }
                message.targetUid = uid;
            }
            return Envelope(message);
        }

        if (action == "STATUS")
        {
            StatusMessage message;
            message.connected = doc["connected"].is<bool>() ? doc["connected"].as<bool>() : true;
            if (doc["device"].is<const char*>())
            {
                message.device = doc["device"].as<const char*>();
            }
            return Envelope(message);
        }

        if (action == "TAG_DETECTED")
        {
            TagDetectedMessage message;
            if (!readUid(doc["uid"], message.uid))
            {
                return violation("TAG_DETECTED uid");
            }
            return Envelope(message);
        }

        if (action == "TAG_DATA")
        {
            TagDataMessage message;
            message.requestId = requestId;
            if (!readUid(doc["uid"], message.uid))
            {
                return violation("TAG_DATA uid");
            }
            if (!readBlocks(doc["blocks"], message.image))
            {
                return violation("TAG_DATA blocks");
            }
            JsonVariantConst sectorsOk = doc["sectors_ok"];
            if (!sectorsOk.isNull())
            {
                if (!sectorsOk.is<uint32_t>() || sectorsOk.as<uint32_t>() > 0xFFFF)
                {
                    return violation("TAG_DATA sectors_ok");
                }
                message.readable = spool::SectorMask(static_cast<uint16_t>(sectorsOk.as<uint32_t>()));
            }
            return Envelope(message);
        }

        if (action == "WRITE_RESULT")
        {
            WriteResultMessage message;
            message.requestId = requestId;
            if (!doc["success"].is<bool>())
            {
                return violation("WRITE_RESULT success");
            }
            message.success = doc["success"].as<bool>();
            JsonVariantConst written = doc["blocks_written"];
            if (!written.isNull())
            {
                if (!written.is<uint32_t>())
                {
                    return violation("WRITE_RESULT blocks_written");
                }
                message.blocksWritten = written.as<uint32_t>();
            }
            if (doc["error"].is<const char*>())
            {
                message.error = doc["error"].as<const char*>();
            }
            return Envelope(message);
        }

        if (action == "ERROR")
        {
            ErrorMessage message;
            message.requestId = requestId;
            if (doc["message"].is<const char*>())
            {
                message.message = doc["message"].as<const char*>();
            }
            return Envelope(message);
        }

        LOG_WARN("Unknown action %s", action.c_str());
        return etl::unexpected(Error::fromBridge(BridgeError::ProtocolViolation));
    }

    std::string EnvelopeCodec::peekRequestId(const std::string& text)
    {
        JsonDocument doc;
        if (deserializeJson(doc, text))
        {
            return std::string();
        }

        std::string requestId;
        if (!readRequestId(doc["request_id"], requestId))
        {
            return std::string();
        }
        return requestId;
    }

    const char* EnvelopeCodec::actionName(const Envelope& envelope)
    {
        const size_t index = envelope.index();
        return index < (sizeof(ACTION_NAMES) / sizeof(ACTION_NAMES[0])) ? ACTION_NAMES[index] : "UNKNOWN";
    }

} // namespace bridge
