/**
 * @file BridgeSession.h
 * @brief Correlated request/response coordinator between an initiator and the tag agent
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdint>
#include <functional>
#include <string>

#include <etl/expected.h>
#include <etl/optional.h>

#include "Bridge/Envelope.h"
#include "Bridge/PendingRequest.h"
#include "Bridge/ReconnectTimer.h"
#include "Comms/ITransport.hpp"
#include "Error/Error.h"
#include "Spool/FilamentRecord.h"
#include "Spool/KeyDerivation.h"
#include "Spool/TagTypes.h"
#include "Utils/Timing.h"

namespace bridge
{
    /**
     * @brief Options for BridgeSession
     */
    struct BridgeSessionOptions
    {
        static constexpr uint32_t DEFAULT_TIMEOUT_MS = 30000;
        static constexpr uint32_t DEFAULT_RECONNECT_DELAY_MS = 3000;
        static constexpr uint32_t DEFAULT_POLL_INTERVAL_MS = 50;

        uint32_t defaultTimeoutMs = DEFAULT_TIMEOUT_MS;
        uint32_t reconnectDelayMs = DEFAULT_RECONNECT_DELAY_MS;
        uint32_t pollIntervalMs = DEFAULT_POLL_INTERVAL_MS;
        bool uidRewriteSupported = false;       // agent hardware can rewrite block 0
        utils::TickSource clock = utils::get_tick_ms;
    };

    /**
     * @brief Outcome of a read
     */
    struct ReadResult
    {
        spool::TagUid uid;
        spool::TagImage image;
        spool::SectorMask readable;     // cleared bit: sector zero-filled by the agent
        spool::FilamentRecord record;
    };

    struct CloneOptions
    {
        bool rewriteUid = false;        // ask the agent to give the target tag the source UID
    };

    /**
     * @brief Finished request, handed out by takeCompletion()
     */
    struct Completion
    {
        std::string requestId;
        RequestKind kind = RequestKind::Read;
        etl::optional<error::Error> error;
        ReadResult read;                // valid for successful reads
        uint32_t blocksWritten = 0;     // valid for successful writes
    };

    /**
     * @brief Owns the agent transport and the single pending tag operation
     *
     * The session is driven from one thread: begin*() start a request,
     * service() moves messages, timers and reconnects forward and
     * takeCompletion() hands out finished requests. The request*() calls
     * wrap that cycle into a blocking call.
     *
     * Only one request may be outstanding. Responses are matched on their
     * correlation id; anything else, in particular responses to a request
     * that already timed out, is logged and dropped.
     */
    class BridgeSession
    {
    public:
        using TagDetectedListener = std::function<void(const spool::TagUid&)>;
        using TagDataListener = std::function<void(const ReadResult&)>;

        BridgeSession(comms::ITransport& transport,
                      const spool::KeyDerivation& keyDerivation,
                      const BridgeSessionOptions& options = BridgeSessionOptions());

        /**
         * @brief Open the transport, or schedule a reconnect if that fails
         *
         * @return etl::expected<void, error::Error> Result of the first open attempt
         */
        etl::expected<void, error::Error> start();

        /**
         * @brief Close the transport and fail any pending request with NoBridgeConnected
         */
        void stop();

        bool isConnected() const;

        // ==============================================================================
        // Non-blocking interface
        // ==============================================================================

        /**
         * @brief Send a READ_TAG request
         *
         * @param timeoutMs Time the agent has to answer
         * @param keyUid UID to derive keys for; without one the agent uses its own keys
         * @return etl::expected<std::string, error::Error> Correlation id, or NoBridgeConnected /
         *         RequestInProgress
         */
        etl::expected<std::string, error::Error> beginRead(uint32_t timeoutMs,
                                                           const etl::optional<spool::TagUid>& keyUid = etl::nullopt);

        /**
         * @brief Send a WRITE_TAG request
         *
         * @param image Image whose payload blocks are written; the agent skips block 0 and trailers
         * @param keys One key per sector
         * @param timeoutMs Time the agent has to answer
         * @param targetUid UID rewrite intent, only allowed with uidRewriteSupported
         * @return etl::expected<std::string, error::Error> Correlation id or error
         */
        etl::expected<std::string, error::Error> beginWrite(const spool::TagImage& image,
                                                            const spool::KeySet& keys,
                                                            uint32_t timeoutMs,
                                                            const etl::optional<spool::TagUid>& targetUid = etl::nullopt);

        /**
         * @brief Process incoming messages, the request deadline and the reconnect timer
         *
         * @param waitMs Longest time to wait for a message
         */
        void service(uint32_t waitMs);

        /**
         * @brief Take the most recent finished request, if any
         */
        etl::optional<Completion> takeCompletion();

        bool hasPendingRequest() const
        {
            return pending.has_value();
        }

        /**
         * @brief Correlation id of the pending request, empty when idle
         */
        std::string pendingRequestId() const;

        // ==============================================================================
        // Blocking interface
        // ==============================================================================

        /**
         * @brief Read the next tag presented to the agent
         *
         * @param timeoutMs Deadline for the agent's answer
         * @return etl::expected<ReadResult, error::Error> Decoded tag or error
         */
        etl::expected<ReadResult, error::Error> requestRead(uint32_t timeoutMs);

        /**
         * @brief Read a tag whose UID is known, sending the keys derived for it
         */
        etl::expected<ReadResult, error::Error> requestRead(uint32_t timeoutMs, const spool::TagUid& keyUid);

        /**
         * @brief Write an image, keys derived from the UID in its block 0
         *
         * @return etl::expected<uint32_t, error::Error> Number of blocks written
         */
        etl::expected<uint32_t, error::Error> requestWrite(const spool::TagImage& image, uint32_t timeoutMs);

        etl::expected<uint32_t, error::Error> requestWrite(const spool::TagImage& image,
                                                           const spool::KeySet& keys,
                                                           uint32_t timeoutMs);

        /**
         * @brief Copy the payload of another tag onto the next tag presented
         *
         * Block 0 and trailers of the source are never sent as payload.
         *
         * @param sourceUid UID of the source tag, used for key derivation
         * @param sourceImage Image read from the source tag
         * @param cloneOptions rewriteUid fails with UnsupportedOperation unless the
         *        session was configured with uidRewriteSupported
         * @param timeoutMs Deadline for the agent's answer
         * @return etl::expected<uint32_t, error::Error> Number of blocks written
         */
        etl::expected<uint32_t, error::Error> requestClone(const spool::TagUid& sourceUid,
                                                           const spool::TagImage& sourceImage,
                                                           const CloneOptions& cloneOptions,
                                                           uint32_t timeoutMs);

        // ==============================================================================
        // Agent events
        // ==============================================================================

        void setTagDetectedListener(TagDetectedListener listener)
        {
            tagDetectedListener = listener;
        }

        /**
         * @brief Receives TAG_DATA that does not answer a request (scans started on the agent)
         */
        void setTagDataListener(TagDataListener listener)
        {
            tagDataListener = listener;
        }

        const etl::optional<spool::TagUid>& lastDetectedUid() const
        {
            return detectedUid;
        }

        const std::string& agentDevice() const
        {
            return deviceName;
        }

        /**
         * @brief Text of the last ERROR or failed WRITE_RESULT from the agent
         */
        const std::string& lastAgentMessage() const
        {
            return agentMessage;
        }

        const BridgeSessionOptions& getOptions() const
        {
            return options;
        }

        const ReconnectTimer& getReconnectTimer() const
        {
            return reconnectTimer;
        }

    private:
        etl::expected<void, error::Error> admit() const;
        etl::expected<std::string, error::Error> dispatch(const PendingRequest& request, const std::string& frame);
        Completion waitFor(const std::string& requestId);

        void handleMessage(const std::string& text);
        void handleTagData(const TagDataMessage& message);
        void handleWriteResult(const WriteResultMessage& message);
        void handleAgentError(const ErrorMessage& message);
        bool isForPending(const std::string& requestId, RequestKind kind, const char* action) const;

        ReadResult toReadResult(const TagDataMessage& message) const;
        void complete(Completion completion);
        void failPending(const error::Error& error);
        void checkDeadline(uint32_t now);
        void onConnectionLost();
        void tryReconnect(uint32_t now);

        comms::ITransport& transport;
        const spool::KeyDerivation& keyDerivation;
        BridgeSessionOptions options;
        ReconnectTimer reconnectTimer;

        etl::optional<PendingRequest> pending;
        etl::optional<Completion> completion;
        uint32_t requestCounter;
        std::string lastExpiredId;
        bool running;

        etl::optional<spool::TagUid> detectedUid;
        std::string deviceName;
        std::string agentMessage;
        TagDetectedListener tagDetectedListener;
        TagDataListener tagDataListener;
    };

} // namespace bridge
