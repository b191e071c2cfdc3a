/**
 * @file ITransport.hpp
 * @brief Interface for message transports between the bridge session and the agent
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <stdint.h>

#include <atomic>
#include <string>

#include <etl/expected.h>
#include <etl/optional.h>

#include "Error/Error.h"


namespace comms {

/**
 * @brief Duplex channel carrying whole text messages
 *
 * A transport delivers messages, not bytes: framing is the implementation's
 * concern. An unexpected close is reported by receive() or send() returning
 * TransportError::ConnectionClosed, after which isOpen() is false.
 */
class ITransport {
public:

    // ==============================================================================
    // Initialization and Teardown
    // ==============================================================================

    virtual ~ITransport() = default;

    // ==============================================================================
    // Open and Close
    // ==============================================================================

    /**
     * @brief Opens the transport (connects for client transports)
     *
     * @return etl::expected<void, Error> void on success, Error of type TransportError on failure
     */
    virtual etl::expected<void, error::Error> open() = 0;

    /**
     * @brief Closes the transport
     *
     */
    virtual void close() = 0;

    // ==============================================================================
    // Send and Receive
    // ==============================================================================

    /**
     * @brief Sends one message
     *
     * @param message Message text, must not contain the frame delimiter
     * @return etl::expected<void, Error> void on success, Error of type TransportError on failure
     */
    virtual etl::expected<void, error::Error> send(const std::string& message) = 0;

    /**
     * @brief Waits for one message
     *
     * @param timeoutMs Maximum wait, 0 polls without blocking
     * @return etl::expected<etl::optional<std::string>, Error> A message, nothing if none arrived
     *         in time, or Error of type TransportError
     */
    virtual etl::expected<etl::optional<std::string>, error::Error> receive(uint32_t timeoutMs) = 0;

    // ==============================================================================
    // Non virtual helper functions
    // ==============================================================================

    /**
     * @brief Checks if the transport is open
     *
     * @return true Transport is open
     * @return false Transport is closed
     */
    bool isOpen() const
    {
        return openFlag;
    }

protected:

    /**
     * @brief Set the Open Flag object
     *
     * @param flag The flag to set
     */
    void setIsOpen(bool flag)
    {
        openFlag = flag;
    }

private:

    std::atomic<bool> openFlag{false};  // Indicates if the transport is open

};


} // namespace comms
