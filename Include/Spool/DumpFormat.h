/**
 * @file DumpFormat.h
 * @brief Import and export of tag images in common dump formats
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include <etl/expected.h>
#include <etl/string_view.h>

#include "Error/Error.h"
#include "TagTypes.h"

namespace spool
{
    /**
     * @brief Tag image dump conversions
     *
     * Wrong sizes fail with CodecError::MalformedImage, characters that are
     * not valid hex or base64 with CodecError::InvalidEncoding.
     */
    class DumpFormat
    {
    public:
        /**
         * @brief Raw 1024-byte binary dump
         */
        static etl::expected<TagImage, error::Error> fromBinary(const uint8_t* data, size_t length);

        /**
         * @brief 2048 hex characters, whitespace and case ignored
         */
        static etl::expected<TagImage, error::Error> fromHex(etl::string_view text);

        /**
         * @brief Base64 of the whole 1024-byte image
         */
        static etl::expected<TagImage, error::Error> fromBase64(etl::string_view text);

        /**
         * @brief 64 strings, each the base64 of one block
         */
        static etl::expected<TagImage, error::Error> fromBase64Blocks(const std::vector<std::string>& blocks);

        /**
         * @brief 64 strings, each the hex of one block
         */
        static etl::expected<TagImage, error::Error> fromHexBlocks(const std::vector<std::string>& blocks);

        /**
         * @brief Proxmark3 style text dump
         *
         * One block per line as "Block NN: AA BB ...". Blank lines, lines
         * starting with '#' and lines that do not carry exactly 16 bytes
         * are skipped; exactly 64 block lines must remain.
         */
        static etl::expected<TagImage, error::Error> fromProxmark3(etl::string_view text);

        /**
         * @brief Import a dump file of any supported whole-image format
         *
         * 1024 bytes are taken as a raw binary dump, text containing "Block"
         * as a Proxmark3 dump, text made of hex digits and whitespace as hex,
         * anything else as base64.
         */
        static etl::expected<TagImage, error::Error> fromFileContents(const std::string& contents);

        /**
         * @brief Decode one base64 block, exactly 16 bytes
         */
        static etl::expected<Block, error::Error> blockFromBase64(etl::string_view text);

        /**
         * @brief Decode one hex block, exactly 16 bytes
         */
        static etl::expected<Block, error::Error> blockFromHex(etl::string_view text);

        static std::vector<uint8_t> toBinary(const TagImage& image);

        /**
         * @brief Uppercase hex, 2048 characters, no separators
         */
        static std::string toHex(const TagImage& image);

        static std::string toBase64(const TagImage& image);
        static std::vector<std::string> toBase64Blocks(const TagImage& image);
        static std::vector<std::string> toHexBlocks(const TagImage& image);

        /**
         * @brief Proxmark3 style text, one "Block NN: AA BB ..." line per block
         */
        static std::string toProxmark3(const TagImage& image);
    };

} // namespace spool
