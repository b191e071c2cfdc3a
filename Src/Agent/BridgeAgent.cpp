/**
 * @file BridgeAgent.cpp
 * @brief Agent side of the bridge: serves READ_TAG / WRITE_TAG with a tag reader
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Agent/BridgeAgent.h"
#include "Utils/Logging.h"

#include <algorithm>
#include <chrono>

using namespace error;

namespace agent
{
    namespace
    {
        constexpr const char* UNSUPPORTED_OPERATION_TEXT = "UnsupportedOperation";
        constexpr const char* UNSUPPORTED_TAG_TEXT = "UnsupportedTagType";

        spool::SectorKey keyOf(uint8_t a, uint8_t b, uint8_t c, uint8_t d, uint8_t e, uint8_t f)
        {
            spool::SectorKey key = {{a, b, c, d, e, f}};
            return key;
        }

        std::string errorText(const Error& err)
        {
            auto text = err.toString();
            return std::string(text.c_str(), text.size());
        }
    }

    spool::KeyList AgentOptions::wellKnownKeys()
    {
        spool::KeyList keys;
        keys.push_back(keyOf(0xFF, 0xFF, 0xFF, 0xFF, 0xFF, 0xFF));
        keys.push_back(keyOf(0xA0, 0xA1, 0xA2, 0xA3, 0xA4, 0xA5));
        keys.push_back(keyOf(0xD3, 0xF7, 0xD3, 0xF7, 0xD3, 0xF7));
        return keys;
    }

    BridgeAgent::BridgeAgent(comms::ITransport& transport,
                             ICardDetector& detector,
                             IMifareClassic& card,
                             const spool::KeyDerivation& keyDerivation,
                             const AgentOptions& options)
        : transport(transport)
        , detector(detector)
        , keyDerivation(keyDerivation)
        , options(options)
        , operations(card, options.defaultKeys)
        , jobGeneration(0)
        , stopping(false)
        , cancelCurrent(false)
    {
    }

    BridgeAgent::~BridgeAgent()
    {
        stop();
    }

    etl::expected<void, Error> BridgeAgent::start()
    {
        if (!worker.joinable())
        {
            {
                std::lock_guard<std::mutex> lock(jobMutex);
                stopping = false;
            }
            worker = std::thread([this]() { workerLoop(); });
        }

        bridge::StatusMessage status;
        status.connected = true;
        status.device = options.deviceName;

        std::lock_guard<std::mutex> lock(sendMutex);
        return transport.send(bridge::EnvelopeCodec::encode(status));
    }

    void BridgeAgent::stop()
    {
        {
            std::lock_guard<std::mutex> lock(jobMutex);
            stopping = true;
            job.reset();
            ++jobGeneration;
            cancelCurrent = true;
        }
        jobChanged.notify_all();

        if (worker.joinable())
        {
            worker.join();
            LOG_INFO("Agent worker stopped");
        }
    }

    bool BridgeAgent::hasJob() const
    {
        std::lock_guard<std::mutex> lock(jobMutex);
        return job.has_value();
    }

    etl::expected<void, Error> BridgeAgent::serviceOnce(uint32_t waitMs)
    {
        auto received = transport.receive(waitMs);
        if (!received)
        {
            if (received.error().isCode(TransportError::FrameTooLarge))
            {
                LOG_WARN("Dropped oversized frame from initiator");
                return {};
            }
            return etl::unexpected<Error>(received.error());
        }
        if (!received.value())
        {
            return {};
        }

        const std::string& text = *received.value();
        auto envelope = bridge::EnvelopeCodec::decode(text);
        if (!envelope)
        {
            bridge::ErrorMessage reply;
            reply.requestId = bridge::EnvelopeCodec::peekRequestId(text);
            reply.message = "Malformed request";
            LOG_WARN("Malformed request (request_id '%s')", reply.requestId.c_str());
            send(bridge::EnvelopeCodec::encode(reply));
            return {};
        }

        const bridge::Envelope& message = envelope.value();
        if (etl::holds_alternative<bridge::ReadTagRequest>(message))
        {
            const auto& request = etl::get<bridge::ReadTagRequest>(message);
            Job next;
            next.kind = bridge::RequestKind::Read;
            next.requestId = request.requestId;
            next.keys = request.keys;
            submit(next);
        }
        else if (etl::holds_alternative<bridge::WriteTagRequest>(message))
        {
            const auto& request = etl::get<bridge::WriteTagRequest>(message);
            Job next;
            next.kind = bridge::RequestKind::Write;
            next.requestId = request.requestId;
            next.keys = request.keys;
            next.image = request.image;
            next.targetUid = request.targetUid;
            submit(next);
        }
        else
        {
            LOG_WARN("Ignoring %s sent to the agent", bridge::EnvelopeCodec::actionName(message));
        }
        return {};
    }

    void BridgeAgent::submit(const Job& next)
    {
        {
            std::lock_guard<std::mutex> lock(jobMutex);
            if (job)
            {
                LOG_INFO("Request '%s' supersedes '%s'", next.requestId.c_str(), job->requestId.c_str());
            }
            job = next;
            ++jobGeneration;
            // The worker clears this when it takes a job, both under jobMutex
            cancelCurrent = true;
        }
        jobChanged.notify_all();
        LOG_INFO("%s request '%s' waiting for a tag",
                 next.kind == bridge::RequestKind::Read ? "Read" : "Write", next.requestId.c_str());
    }

    void BridgeAgent::workerLoop()
    {
        LOG_DEBUG("Agent worker running");
        for (;;)
        {
            etl::optional<Job> current;
            uint64_t generation = 0;
            {
                std::unique_lock<std::mutex> lock(jobMutex);
                if (!options.autoReadWithoutRequest)
                {
                    jobChanged.wait(lock, [this]() { return stopping || job.has_value(); });
                }
                if (stopping)
                {
                    break;
                }
                current = job;
                generation = jobGeneration;
                cancelCurrent = false;
            }

            auto detected = detector.detectCard();
            if (!detected)
            {
                if (!detected.error().isCode(AgentError::NoTagPresent))
                {
                    LOG_WARN("Tag detection failed: %s", detected.error().toString().c_str());
                }
                lastSeenUid.reset();
                idle();
                continue;
            }

            CardInfo info = detected.value();
            if (!info.isFilamentTagCandidate())
            {
                if (current)
                {
                    LOG_WARN("Unsupported tag: %s", info.toString().c_str());
                    bridge::ErrorMessage reply;
                    reply.requestId = current->requestId;
                    reply.message = UNSUPPORTED_TAG_TEXT;
                    send(bridge::EnvelopeCodec::encode(reply));
                    finishJob(generation);
                }
                idle();
                continue;
            }

            spool::TagUid uid;
            std::copy_n(info.uid.begin(), uid.size(), uid.begin());

            if (!current)
            {
                if (!lastSeenUid || *lastSeenUid != uid)
                {
                    lastSeenUid = uid;
                    autoRead(uid);
                }
                idle();
                continue;
            }

            lastSeenUid = uid;
            runJob(*current, uid);
            finishJob(generation);
        }
        LOG_DEBUG("Agent worker exiting");
    }

    void BridgeAgent::idle()
    {
        std::unique_lock<std::mutex> lock(jobMutex);
        uint64_t generation = jobGeneration;
        jobChanged.wait_for(lock, std::chrono::milliseconds(options.detectPollMs),
                            [this, generation]() { return stopping || jobGeneration != generation; });
    }

    void BridgeAgent::finishJob(uint64_t generation)
    {
        std::lock_guard<std::mutex> lock(jobMutex);
        if (jobGeneration == generation)
        {
            job.reset();
        }
    }

    void BridgeAgent::runJob(const Job& current, const spool::TagUid& uid)
    {
        bridge::TagDetectedMessage detectedMessage;
        detectedMessage.uid = uid;
        send(bridge::EnvelopeCodec::encode(detectedMessage));

        if (current.kind == bridge::RequestKind::Read)
        {
            runRead(current, uid);
        }
        else
        {
            runWrite(current, uid);
        }
    }

    void BridgeAgent::runRead(const Job& current, const spool::TagUid& uid)
    {
        auto outcome = operations.readAll(uid, keysFor(current.keys, uid), &cancelCurrent);
        if (!outcome)
        {
            if (outcome.error().isCode(AgentError::Cancelled))
            {
                LOG_INFO("Read '%s' cancelled", current.requestId.c_str());
                return;
            }
            LOG_ERROR("Read '%s' failed: %s", current.requestId.c_str(), outcome.error().toString().c_str());
            bridge::ErrorMessage reply;
            reply.requestId = current.requestId;
            reply.message = errorText(outcome.error());
            send(bridge::EnvelopeCodec::encode(reply));
            return;
        }

        bridge::TagDataMessage reply;
        reply.requestId = current.requestId;
        reply.uid = uid;
        reply.image = outcome.value().image;
        reply.readable = outcome.value().readable;
        send(bridge::EnvelopeCodec::encode(reply));
        LOG_INFO("Read '%s' done, %u/16 sectors readable",
                 current.requestId.c_str(), static_cast<unsigned>(outcome.value().readable.count()));
    }

    void BridgeAgent::runWrite(const Job& current, const spool::TagUid& uid)
    {
        bridge::WriteResultMessage reply;
        reply.requestId = current.requestId;

        if (current.targetUid)
        {
            // Block 0 is never written, so a UID rewrite cannot be honoured
            LOG_WARN("Write '%s' asks for a UID rewrite", current.requestId.c_str());
            reply.success = false;
            reply.error = UNSUPPORTED_OPERATION_TEXT;
            send(bridge::EnvelopeCodec::encode(reply));
            return;
        }

        auto written = operations.writeAll(uid, current.image, keysFor(current.keys, uid));
        if (!written)
        {
            LOG_ERROR("Write '%s' failed: %s", current.requestId.c_str(), written.error().toString().c_str());
            reply.success = false;
            reply.error = errorText(written.error());
        }
        else
        {
            reply.success = true;
            reply.blocksWritten = written.value();
            LOG_INFO("Write '%s' done, %u blocks written",
                     current.requestId.c_str(), static_cast<unsigned>(written.value()));
        }
        send(bridge::EnvelopeCodec::encode(reply));
    }

    void BridgeAgent::autoRead(const spool::TagUid& uid)
    {
        bridge::TagDetectedMessage detectedMessage;
        detectedMessage.uid = uid;
        send(bridge::EnvelopeCodec::encode(detectedMessage));

        auto outcome = operations.readAll(uid, keysFor(spool::KeyList(), uid), &cancelCurrent);
        if (!outcome)
        {
            LOG_WARN("Scan of %s failed: %s", spool::uidToHex(uid).c_str(), outcome.error().toString().c_str());
            return;
        }

        bridge::TagDataMessage unsolicited;
        unsolicited.uid = uid;
        unsolicited.image = outcome.value().image;
        unsolicited.readable = outcome.value().readable;
        send(bridge::EnvelopeCodec::encode(unsolicited));
    }

    spool::KeyList BridgeAgent::keysFor(const spool::KeyList& supplied, const spool::TagUid& uid) const
    {
        if (!supplied.empty() || !options.deriveKeysLocally)
        {
            return supplied;
        }

        auto derived = keyDerivation.derive(uid);
        if (!derived)
        {
            LOG_WARN("Key derivation for %s failed: %s",
                     spool::uidToHex(uid).c_str(), derived.error().toString().c_str());
            return supplied;
        }

        spool::KeyList keys;
        keys.assign(derived.value().begin(), derived.value().end());
        return keys;
    }

    void BridgeAgent::send(const std::string& frame)
    {
        std::lock_guard<std::mutex> lock(sendMutex);
        auto sent = transport.send(frame);
        if (!sent)
        {
            LOG_WARN("Reply not delivered: %s", sent.error().toString().c_str());
        }
    }

} // namespace agent
