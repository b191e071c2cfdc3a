/**
 * @file TextCodec.h
 * @brief Hex and base64 conversion for tag data
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

#include <etl/expected.h>
#include <etl/string.h>
#include <etl/string_view.h>
#include <etl/vector.h>

#include "Error/Error.h"

namespace utils
{
    /**
     * @brief Render bytes as uppercase hexadecimal
     *
     * @param data Bytes to render
     * @param length Number of bytes
     * @param separator Character placed between bytes, '\0' for none
     * @return std::string Hex text
     */
    std::string toHex(const uint8_t* data, size_t length, char separator = '\0');

    /**
     * @brief Parse hexadecimal text into bytes
     *
     * Whitespace anywhere in the input is ignored, digits are case-insensitive.
     *
     * @param text Hex text
     * @param out Receives the decoded bytes (cleared first)
     * @return etl::expected<void, error::Error> InvalidEncoding on a bad digit or odd
     *         digit count, MalformedImage if the result does not fit in out
     */
    etl::expected<void, error::Error> fromHex(etl::string_view text, etl::ivector<uint8_t>& out);

    /**
     * @brief Encode bytes as standard padded base64
     *
     * @param data Bytes to encode
     * @param length Number of bytes
     * @return std::string Base64 text
     */
    std::string toBase64(const uint8_t* data, size_t length);

    /**
     * @brief Decode standard padded base64
     *
     * @param text Base64 text, surrounding whitespace ignored
     * @param out Receives the decoded bytes (cleared first)
     * @return etl::expected<void, error::Error> InvalidEncoding on malformed input,
     *         MalformedImage if the result does not fit in out
     */
    etl::expected<void, error::Error> fromBase64(etl::string_view text, etl::ivector<uint8_t>& out);

    /**
     * @brief Render a key for log output without revealing it
     *
     * Only the first byte is shown, e.g. "04**********".
     */
    etl::string<16> redactKey(const uint8_t* key, size_t length);

} // namespace utils
