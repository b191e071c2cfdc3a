/**
 * @file KeyDerivation.h
 * @brief Per-tag sector key derivation (HKDF-SHA256)
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

#include <etl/array.h>
#include <etl/expected.h>
#include <etl/string_view.h>

#include "Error/Error.h"
#include "TagTypes.h"

namespace spool
{
    /**
     * @brief Fixed inputs of the key derivation
     *
     * Built once at startup and handed to every KeyDerivation instance.
     */
    struct KdfParameters
    {
        static constexpr size_t MASTER_SECRET_SIZE = 16;
        static constexpr size_t CONTEXT_SIZE = 7;

        etl::array<uint8_t, MASTER_SECRET_SIZE> masterSecret;   // HKDF salt
        etl::array<uint8_t, CONTEXT_SIZE> context;              // HKDF info

        /**
         * @brief Parameters used by Bambu Lab filament tags
         *
         * Salt 9A759CF2C4F7CAFF222CB9769B41BC96, info "RFID-A\0".
         */
        static const KdfParameters& bambuDefaults();
    };

    /**
     * @brief Derives the 16 sector keys of a tag from its UID
     *
     * HKDF-SHA256 with the tag UID as input keying material, the master
     * secret as salt and the context as info. The 96 output bytes are cut
     * into 16 consecutive 6-byte keys, key n opening sector n.
     */
    class KeyDerivation
    {
    public:
        /**
         * @brief Total HKDF output length: 16 sectors x 6 bytes
         */
        static constexpr size_t OUTPUT_SIZE = geometry::SECTOR_COUNT * geometry::KEY_SIZE;

        explicit KeyDerivation(const KdfParameters& parameters);

        /**
         * @brief Derive the key set for a UID of any length
         *
         * @param uid UID bytes
         * @param length UID length, must be non-zero
         * @return etl::expected<KeySet, error::Error> Key set, or KdfError::InvalidInput
         *         for an empty UID, KdfError::BackendFailure if OpenSSL fails
         */
        etl::expected<KeySet, error::Error> derive(const uint8_t* uid, size_t length) const;

        /**
         * @brief Derive the key set for a 4-byte tag UID
         *
         * @param uid Tag UID
         * @return etl::expected<KeySet, error::Error> Key set or error
         */
        etl::expected<KeySet, error::Error> derive(const TagUid& uid) const;

        /**
         * @brief Derive from a hex UID string such as "7AD43F1C"
         *
         * @param uidHex UID in hex, case-insensitive
         * @return etl::expected<KeySet, error::Error> Key set, or KdfError::InvalidInput
         *         if the text is empty or not hex
         */
        etl::expected<KeySet, error::Error> deriveFromHex(etl::string_view uidHex) const;

        const KdfParameters& getParameters() const
        {
            return parameters;
        }

    private:
        const KdfParameters& parameters;
    };

    /**
     * @brief Render a key set as 16 uppercase 12-character hex strings
     */
    etl::array<std::string, geometry::SECTOR_COUNT> keySetToHex(const KeySet& keys);

} // namespace spool
