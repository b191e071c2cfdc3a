/**
 * @file TagCodec.h
 * @brief Conversion between a 1 KB filament tag image and a FilamentRecord
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#pragma once

#include <etl/expected.h>
#include <etl/vector.h>

#include "Error/Error.h"
#include "FilamentRecord.h"
#include "TagTypes.h"

namespace spool
{
    /**
     * @brief Positional codec for the Bambu Lab MIFARE Classic 1K layout
     *
     * Multi-byte numbers are little-endian. Strings occupy fixed slots, are
     * cut at the first NUL and stripped of surrounding whitespace on decode.
     */
    class TagCodec
    {
    public:
        /**
         * @brief Decode a complete image
         *
         * Never fails: every byte pattern maps to some record.
         *
         * @param image Tag image
         * @return FilamentRecord Decoded record
         */
        static FilamentRecord decode(const TagImage& image);

        /**
         * @brief Decode an untrusted block list
         *
         * @param blocks Block list
         * @return etl::expected<FilamentRecord, error::Error> MalformedImage unless exactly 64 blocks
         */
        static etl::expected<FilamentRecord, error::Error> decode(const etl::ivector<Block>& blocks);

        /**
         * @brief Encode the writer-controlled fields onto a zero image
         *
         * Block 0 and the sector trailers stay zero; merge the result onto a
         * real image before writing it to a tag.
         *
         * @param record Record to encode
         * @return etl::expected<TagImage, error::Error> FieldOutOfRange if a value does not fit its slot
         */
        static etl::expected<TagImage, error::Error> encode(const FilamentRecord& record);

        /**
         * @brief Encode the writer-controlled fields on top of an existing image
         *
         * Bytes not covered by a field (block 0, trailers, padding, empty
         * sectors) keep the base image's content. A string slot whose base
         * content already decodes to the record's value is left untouched,
         * non-ASCII bytes shown as '?' included. Strings must be ASCII
         * without leading or trailing whitespace. The signature blocks are
         * only overwritten when the record carries a non-zero signature.
         *
         * @param record Record to encode
         * @param base Starting image, typically a previous read of the tag
         * @return etl::expected<TagImage, error::Error> FieldOutOfRange if a value does not fit its slot
         */
        static etl::expected<TagImage, error::Error> encodeOnto(const FilamentRecord& record, const TagImage& base);

        /**
         * @brief Block numbers holding the signature, in signature byte order
         */
        static const etl::array<uint8_t, 18>& signatureBlocks();
    };

} // namespace spool
