/**
 * @file BridgeAgent.h
 * @brief Agent side of the bridge: serves READ_TAG / WRITE_TAG with a tag reader
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <thread>

#include <etl/expected.h>
#include <etl/optional.h>

#include "Agent/ICardDetector.h"
#include "Agent/IMifareClassic.h"
#include "Agent/TagOperations.h"
#include "Bridge/Envelope.h"
#include "Bridge/PendingRequest.h"
#include "Comms/ITransport.hpp"
#include "Error/Error.h"
#include "Spool/KeyDerivation.h"

namespace agent
{
    /**
     * @brief Options for BridgeAgent
     */
    struct AgentOptions
    {
        static constexpr uint32_t DEFAULT_DETECT_POLL_MS = 100;

        /**
         * @brief FFFFFFFFFFFF, A0A1A2A3A4A5 (MAD) and D3F7D3F7D3F7 (NFC Forum)
         */
        static spool::KeyList wellKnownKeys();

        spool::KeyList defaultKeys = wellKnownKeys();   // read fallback, tried in order
        uint32_t detectPollMs = DEFAULT_DETECT_POLL_MS;
        std::string deviceName = "spoolbridge-agent";
        bool deriveKeysLocally = true;                  // derive keys from the UID when none were sent
        bool autoReadWithoutRequest = true;             // report tags scanned while idle as TAG_DATA
    };

    /**
     * @brief Executes bridge requests against the physical tag
     *
     * serviceOnce() runs the message loop on the caller's thread and never
     * touches the reader. Tag I/O runs on a worker thread that waits for a
     * tag, performs the current job and sends the reply. A request that
     * arrives while another one still waits for a tag replaces it; a job
     * already reading is cancelled between sectors.
     */
    class BridgeAgent
    {
    public:
        BridgeAgent(comms::ITransport& transport,
                    ICardDetector& detector,
                    IMifareClassic& card,
                    const spool::KeyDerivation& keyDerivation,
                    const AgentOptions& options = AgentOptions());

        ~BridgeAgent();

        BridgeAgent(const BridgeAgent&) = delete;
        BridgeAgent& operator=(const BridgeAgent&) = delete;

        /**
         * @brief Start the worker and announce the agent with a STATUS message
         *
         * @return etl::expected<void, error::Error> TransportError if STATUS cannot be sent
         */
        etl::expected<void, error::Error> start();

        /**
         * @brief Stop and join the worker, dropping any waiting job
         */
        void stop();

        /**
         * @brief Handle at most one incoming message
         *
         * @param waitMs Longest time to wait for a message
         * @return etl::expected<void, error::Error> TransportError once the connection is gone
         */
        etl::expected<void, error::Error> serviceOnce(uint32_t waitMs);

        /**
         * @brief True while a request waits for a tag or is being executed
         */
        bool hasJob() const;

    private:
        struct Job
        {
            bridge::RequestKind kind = bridge::RequestKind::Read;
            std::string requestId;
            spool::KeyList keys;
            spool::TagImage image;
            etl::optional<spool::TagUid> targetUid;
        };

        void submit(const Job& job);
        void workerLoop();
        void idle();
        void runJob(const Job& job, const spool::TagUid& uid);
        void runRead(const Job& job, const spool::TagUid& uid);
        void runWrite(const Job& job, const spool::TagUid& uid);
        void autoRead(const spool::TagUid& uid);
        void finishJob(uint64_t generation);
        spool::KeyList keysFor(const spool::KeyList& supplied, const spool::TagUid& uid) const;
        void send(const std::string& frame);

        comms::ITransport& transport;
        ICardDetector& detector;
        const spool::KeyDerivation& keyDerivation;
        AgentOptions options;
        TagOperations operations;

        std::thread worker;
        mutable std::mutex jobMutex;
        std::condition_variable jobChanged;
        etl::optional<Job> job;
        uint64_t jobGeneration;
        bool stopping;
        std::atomic<bool> cancelCurrent;

        std::mutex sendMutex;
        etl::optional<spool::TagUid> lastSeenUid;   // worker thread only
    };

} // namespace agent
