/**
 * @file BridgeSession.cpp
 * @brief Correlated request/response coordinator between an initiator and the tag agent
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Bridge/BridgeSession.h"
#include "Spool/TagCodec.h"
#include "Utils/Logging.h"

using namespace error;

namespace bridge
{
    namespace
    {
        // Error text a WRITE_RESULT carries when the agent cannot rewrite UIDs
        constexpr const char* UNSUPPORTED_OPERATION_TEXT = "UnsupportedOperation";

        // Upper bound on messages handled per service() call
        constexpr size_t MAX_MESSAGES_PER_SERVICE = 16;

        spool::KeyList toKeyList(const spool::KeySet& keys)
        {
            spool::KeyList list;
            list.assign(keys.begin(), keys.end());
            return list;
        }
    }

    BridgeSession::BridgeSession(comms::ITransport& transport,
                                 const spool::KeyDerivation& keyDerivation,
                                 const BridgeSessionOptions& options)
        : transport(transport)
        , keyDerivation(keyDerivation)
        , options(options)
        , reconnectTimer(options.reconnectDelayMs)
        , requestCounter(0)
        , running(false)
    {
    }

    etl::expected<void, Error> BridgeSession::start()
    {
        running = true;
        auto opened = transport.open();
        if (!opened)
        {
            LOG_WARN("Agent transport not available: %s", opened.error().toString().c_str());
            reconnectTimer.schedule(options.clock());
            return opened;
        }

        LOG_INFO("Bridge session connected");
        return {};
    }

    void BridgeSession::stop()
    {
        running = false;
        reconnectTimer.cancel();
        transport.close();
        if (pending)
        {
            failPending(Error::fromBridge(BridgeError::NoBridgeConnected));
        }
        LOG_INFO("Bridge session stopped");
    }

    bool BridgeSession::isConnected() const
    {
        return transport.isOpen();
    }

    std::string BridgeSession::pendingRequestId() const
    {
        return pending ? pending->correlationId : std::string();
    }

    // ==============================================================================
    // Starting requests
    // ==============================================================================

    etl::expected<std::string, Error> BridgeSession::beginRead(uint32_t timeoutMs,
                                                               const etl::optional<spool::TagUid>& keyUid)
    {
        auto admitted = admit();
        if (!admitted)
        {
            return etl::unexpected(admitted.error());
        }

        PendingRequest request;
        request.kind = RequestKind::Read;
        if (keyUid)
        {
            auto keys = keyDerivation.derive(keyUid.value());
            if (!keys)
            {
                return etl::unexpected(keys.error());
            }
            request.keys = toKeyList(keys.value());
        }
        request.correlationId = std::to_string(++requestCounter);
        request.deadline = options.clock() + timeoutMs;

        ReadTagRequest message;
        message.requestId = request.correlationId;
        message.keys = request.keys;
        return dispatch(request, EnvelopeCodec::encode(message));
    }

    etl::expected<std::string, Error> BridgeSession::beginWrite(const spool::TagImage& image,
                                                                const spool::KeySet& keys,
                                                                uint32_t timeoutMs,
                                                                const etl::optional<spool::TagUid>& targetUid)
    {
        if (targetUid && !options.uidRewriteSupported)
        {
            LOG_WARN("UID rewrite requested but the agent hardware does not support it");
            return etl::unexpected(Error::fromBridge(BridgeError::UnsupportedOperation));
        }

        auto admitted = admit();
        if (!admitted)
        {
            return etl::unexpected(admitted.error());
        }

        PendingRequest request;
        request.kind = RequestKind::Write;
        request.correlationId = std::to_string(++requestCounter);
        request.keys = toKeyList(keys);
        request.payload = image;
        request.targetUid = targetUid;
        request.deadline = options.clock() + timeoutMs;

        WriteTagRequest message;
        message.requestId = request.correlationId;
        message.keys = toKeyList(keys);
        message.image = image;
        message.targetUid = targetUid;
        return dispatch(request, EnvelopeCodec::encode(message));
    }

    etl::expected<void, Error> BridgeSession::admit() const
    {
        if (pending)
        {
            LOG_WARN("Request %s still waiting for a tag, rejecting new request", pending->correlationId.c_str());
            return etl::unexpected(Error::fromBridge(BridgeError::RequestInProgress));
        }
        if (!transport.isOpen())
        {
            return etl::unexpected(Error::fromBridge(BridgeError::NoBridgeConnected));
        }
        return {};
    }

    etl::expected<std::string, Error> BridgeSession::dispatch(const PendingRequest& request, const std::string& frame)
    {
        auto sent = transport.send(frame);
        if (!sent)
        {
            LOG_ERROR("Failed to send request %s: %s", request.correlationId.c_str(), sent.error().toString().c_str());
            onConnectionLost();
            return etl::unexpected(Error::fromBridge(BridgeError::NoBridgeConnected));
        }

        LOG_INFO("Request %s (%s) sent, waiting for a tag",
                 request.correlationId.c_str(),
                 request.kind == RequestKind::Read ? "read" : "write");
        pending = request;
        return request.correlationId;
    }

    // ==============================================================================
    // Event pump
    // ==============================================================================

    void BridgeSession::service(uint32_t waitMs)
    {
        if (!transport.isOpen())
        {
            tryReconnect(options.clock());
            if (!transport.isOpen())
            {
                checkDeadline(options.clock());
                if (waitMs > 0)
                {
                    utils::delay_ms(waitMs);
                }
                return;
            }
        }

        uint32_t wait = waitMs;
        for (size_t handled = 0; handled < MAX_MESSAGES_PER_SERVICE; ++handled)
        {
            auto received = transport.receive(wait);
            wait = 0;
            if (!received)
            {
                if (received.error().isCode(TransportError::FrameTooLarge))
                {
                    LOG_WARN("Dropped oversized frame from agent");
                    continue;
                }
                LOG_WARN("Agent connection lost: %s", received.error().toString().c_str());
                onConnectionLost();
                break;
            }
            if (!received.value())
            {
                break;
            }
            handleMessage(received.value().value());
        }

        checkDeadline(options.clock());
    }

    etl::optional<Completion> BridgeSession::takeCompletion()
    {
        etl::optional<Completion> result = completion;
        completion.reset();
        return result;
    }

    void BridgeSession::checkDeadline(uint32_t now)
    {
        if (!pending || !utils::tick_reached(now, pending->deadline))
        {
            return;
        }

        LOG_WARN("Request %s timed out", pending->correlationId.c_str());
        lastExpiredId = pending->correlationId;
        failPending(Error::fromBridge(BridgeError::Timeout));
    }

    void BridgeSession::onConnectionLost()
    {
        transport.close();
        if (pending)
        {
            LOG_WARN("Failing request %s, agent disconnected", pending->correlationId.c_str());
            failPending(Error::fromBridge(BridgeError::NoBridgeConnected));
        }
        if (running)
        {
            reconnectTimer.schedule(options.clock());
        }
    }

    void BridgeSession::tryReconnect(uint32_t now)
    {
        if (!running || !reconnectTimer.fire(now))
        {
            return;
        }

        auto opened = transport.open();
        if (!opened)
        {
            LOG_WARN("Reconnect failed: %s", opened.error().toString().c_str());
            reconnectTimer.schedule(now);
            return;
        }
        LOG_INFO("Reconnected to agent");
    }

    void BridgeSession::complete(Completion done)
    {
        pending.reset();
        completion = done;
    }

    void BridgeSession::failPending(const Error& error)
    {
        Completion done;
        done.requestId = pending->correlationId;
        done.kind = pending->kind;
        done.error = error;
        complete(done);
    }

    // ==============================================================================
    // Incoming messages
    // ==============================================================================

    void BridgeSession::handleMessage(const std::string& text)
    {
        auto decoded = EnvelopeCodec::decode(text);
        if (!decoded)
        {
            const std::string requestId = EnvelopeCodec::peekRequestId(text);
            if (pending && !requestId.empty() && requestId == pending->correlationId)
            {
                LOG_ERROR("Malformed response to request %s", requestId.c_str());
                failPending(decoded.error());
            }
            return;
        }

        const Envelope& envelope = decoded.value();
        if (etl::holds_alternative<TagDetectedMessage>(envelope))
        {
            const auto& message = etl::get<TagDetectedMessage>(envelope);
            detectedUid = message.uid;
            LOG_INFO("Tag detected: UID=%s", spool::uidToHex(message.uid).c_str());
            if (tagDetectedListener)
            {
                tagDetectedListener(message.uid);
            }
        }
        else if (etl::holds_alternative<StatusMessage>(envelope))
        {
            const auto& message = etl::get<StatusMessage>(envelope);
            deviceName = message.device;
            LOG_INFO("Agent status: connected=%d device=%s", message.connected ? 1 : 0, message.device.c_str());
        }
        else if (etl::holds_alternative<TagDataMessage>(envelope))
        {
            handleTagData(etl::get<TagDataMessage>(envelope));
        }
        else if (etl::holds_alternative<WriteResultMessage>(envelope))
        {
            handleWriteResult(etl::get<WriteResultMessage>(envelope));
        }
        else if (etl::holds_alternative<ErrorMessage>(envelope))
        {
            handleAgentError(etl::get<ErrorMessage>(envelope));
        }
        else
        {
            LOG_WARN("Protocol violation: agent sent %s", EnvelopeCodec::actionName(envelope));
        }
    }

    bool BridgeSession::isForPending(const std::string& requestId, RequestKind kind, const char* action) const
    {
        if (pending && pending->correlationId == requestId && pending->kind == kind)
        {
            return true;
        }

        if (!requestId.empty() && requestId == lastExpiredId)
        {
            LOG_INFO("Dropping late %s for expired request %s", action, requestId.c_str());
        }
        else
        {
            LOG_WARN("Protocol violation: %s for request '%s' does not match pending request '%s'",
                     action, requestId.c_str(), pending ? pending->correlationId.c_str() : "");
        }
        return false;
    }

    ReadResult BridgeSession::toReadResult(const TagDataMessage& message) const
    {
        ReadResult result;
        result.uid = message.uid;
        result.image = message.image;
        result.readable = message.readable ? message.readable.value() : message.image.nonZeroSectors();
        result.record = spool::TagCodec::decode(message.image);
        return result;
    }

    void BridgeSession::handleTagData(const TagDataMessage& message)
    {
        if (message.requestId.empty())
        {
            LOG_INFO("Unsolicited tag data for UID=%s", spool::uidToHex(message.uid).c_str());
            if (tagDataListener)
            {
                tagDataListener(toReadResult(message));
            }
            return;
        }

        if (!isForPending(message.requestId, RequestKind::Read, "TAG_DATA"))
        {
            return;
        }

        Completion done;
        done.requestId = message.requestId;
        done.kind = RequestKind::Read;
        done.read = toReadResult(message);
        if (!done.read.readable.allSet())
        {
            LOG_WARN("Read %s: %u of 16 sectors readable",
                     message.requestId.c_str(), static_cast<unsigned>(done.read.readable.count()));
        }
        LOG_INFO("Request %s completed", message.requestId.c_str());
        complete(done);
    }

    void BridgeSession::handleWriteResult(const WriteResultMessage& message)
    {
        if (!isForPending(message.requestId, RequestKind::Write, "WRITE_RESULT"))
        {
            return;
        }

        Completion done;
        done.requestId = message.requestId;
        done.kind = RequestKind::Write;
        done.blocksWritten = message.blocksWritten;
        if (!message.success)
        {
            agentMessage = message.error;
            LOG_WARN("Write %s failed on the agent: %s", message.requestId.c_str(), message.error.c_str());
            done.error = (message.error == UNSUPPORTED_OPERATION_TEXT)
                ? Error::fromBridge(BridgeError::UnsupportedOperation)
                : Error::fromBridge(BridgeError::AgentReported);
        }
        else
        {
            LOG_INFO("Request %s completed, %u blocks written",
                     message.requestId.c_str(), static_cast<unsigned>(message.blocksWritten));
        }
        complete(done);
    }

    void BridgeSession::handleAgentError(const ErrorMessage& message)
    {
        LOG_ERROR("Agent error: %s", message.message.c_str());
        agentMessage = message.message;

        if (!pending)
        {
            return;
        }
        if (!message.requestId.empty() && message.requestId != pending->correlationId)
        {
            LOG_WARN("Ignoring agent error for request %s", message.requestId.c_str());
            return;
        }
        failPending(Error::fromBridge(BridgeError::AgentReported));
    }

    // ==============================================================================
    // Blocking interface
    // ==============================================================================

    Completion BridgeSession::waitFor(const std::string& requestId)
    {
        while (true)
        {
            service(options.pollIntervalMs);
            auto done = takeCompletion();
            if (done && done->requestId == requestId)
            {
                return done.value();
            }
        }
    }

    etl::expected<ReadResult, Error> BridgeSession::requestRead(uint32_t timeoutMs)
    {
        auto requestId = beginRead(timeoutMs);
        if (!requestId)
        {
            return etl::unexpected(requestId.error());
        }

        Completion done = waitFor(requestId.value());
        if (done.error)
        {
            return etl::unexpected(done.error.value());
        }
        return done.read;
    }

    etl::expected<ReadResult, Error> BridgeSession::requestRead(uint32_t timeoutMs, const spool::TagUid& keyUid)
    {
        auto requestId = beginRead(timeoutMs, keyUid);
        if (!requestId)
        {
            return etl::unexpected(requestId.error());
        }

        Completion done = waitFor(requestId.value());
        if (done.error)
        {
            return etl::unexpected(done.error.value());
        }
        return done.read;
    }

    etl::expected<uint32_t, Error> BridgeSession::requestWrite(const spool::TagImage& image, uint32_t timeoutMs)
    {
        auto keys = keyDerivation.derive(image.uid());
        if (!keys)
        {
            return etl::unexpected(keys.error());
        }
        return requestWrite(image, keys.value(), timeoutMs);
    }

    etl::expected<uint32_t, Error> BridgeSession::requestWrite(const spool::TagImage& image,
                                                               const spool::KeySet& keys,
                                                               uint32_t timeoutMs)
    {
        auto requestId = beginWrite(image, keys, timeoutMs);
        if (!requestId)
        {
            return etl::unexpected(requestId.error());
        }

        Completion done = waitFor(requestId.value());
        if (done.error)
        {
            return etl::unexpected(done.error.value());
        }
        return done.blocksWritten;
    }

    etl::expected<uint32_t, Error> BridgeSession::requestClone(const spool::TagUid& sourceUid,
                                                               const spool::TagImage& sourceImage,
                                                               const CloneOptions& cloneOptions,
                                                               uint32_t timeoutMs)
    {
        if (cloneOptions.rewriteUid && !options.uidRewriteSupported)
        {
            LOG_WARN("Clone with UID rewrite is not supported by the agent hardware");
            return etl::unexpected(Error::fromBridge(BridgeError::UnsupportedOperation));
        }

        auto keys = keyDerivation.derive(sourceUid);
        if (!keys)
        {
            return etl::unexpected(keys.error());
        }

        // Payload only: block 0 and trailers of the source stay behind
        const spool::TagImage payload = sourceImage.mergedOnto(spool::TagImage());
        etl::optional<spool::TagUid> targetUid;
        if (cloneOptions.rewriteUid)
        {
            targetUid = sourceUid;
        }

        auto requestId = beginWrite(payload, keys.value(), timeoutMs, targetUid);
        if (!requestId)
        {
            return etl::unexpected(requestId.error());
        }

        Completion done = waitFor(requestId.value());
        if (done.error)
        {
            return etl::unexpected(done.error.value());
        }
        return done.blocksWritten;
    }

} // namespace bridge
