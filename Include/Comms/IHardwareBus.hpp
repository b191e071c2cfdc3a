/**
 * @file IHardwareBus.hpp
 * @brief Interface for the byte bus between host and reader chip
 * @version 0.2
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <stdint.h>
#include <stddef.h>

#include <etl/expected.h>
#include <etl/vector.h>

#include "Error/Error.h"

namespace comms {

/**
 * @brief Interface for hardware communication buses
 */
class IHardwareBus {
public:

    virtual ~IHardwareBus() = default;

    // ==============================================================================
    // Open and Close
    // ==============================================================================

    /**
     * @brief Opens the hardware bus
     *
     * @return etl::expected<void, Error> void on success, HardwareError on failure
     */
    virtual etl::expected<void, error::Error> open() = 0;

    virtual void close() = 0;

    // ==============================================================================
    // Read and Write
    // ==============================================================================

    /**
     * @brief Writes all bytes to the bus
     *
     * @param data Data to write
     * @return etl::expected<void, Error> void on success, HardwareError::WriteFailed on failure
     */
    virtual etl::expected<void, error::Error> write(const etl::ivector<uint8_t>& data) = 0;

    /**
     * @brief Reads the bytes that are already buffered, up to length
     *
     * The buffer is replaced with what was read; reading nothing is not an error.
     *
     * @param buffer Buffer to store read data
     * @param length Maximum number of bytes to read
     * @return etl::expected<size_t, Error> Number of bytes read, HardwareError on failure
     */
    virtual etl::expected<size_t, error::Error> read(etl::ivector<uint8_t>& buffer, size_t length) = 0;

    /**
     * @brief Discards unread input
     */
    virtual etl::expected<void, error::Error> flush() = 0;

    /**
     * @brief Number of bytes that can be read without blocking
     */
    virtual size_t available() const = 0;

    // ==============================================================================
    // Non virtual helper functions
    // ==============================================================================

    bool isOpen() const
    {
        return openFlag;
    }

protected:

    void setIsOpen(bool flag)
    {
        openFlag = flag;
    }

private:

    bool openFlag = false;

};

} // namespace comms
