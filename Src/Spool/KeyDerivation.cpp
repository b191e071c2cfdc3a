/**
 * @file KeyDerivation.cpp
 * @brief Per-tag sector key derivation (HKDF-SHA256)
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Spool/KeyDerivation.h"
#include "Utils/Logging.h"
#include "Utils/TextCodec.h"

#include <memory>

#include <etl/vector.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>

namespace spool
{
    namespace
    {
        struct PkeyCtxDeleter
        {
            void operator()(EVP_PKEY_CTX* ctx) const
            {
                EVP_PKEY_CTX_free(ctx);
            }
        };

        using PkeyCtxPtr = std::unique_ptr<EVP_PKEY_CTX, PkeyCtxDeleter>;

        error::Error backendFailure(const char* step)
        {
            LOG_ERROR("HKDF %s failed", step);
            return error::Error::fromKdf(error::KdfError::BackendFailure);
        }
    }

    const KdfParameters& KdfParameters::bambuDefaults()
    {
        static const KdfParameters defaults = {
            {{ 0x9A, 0x75, 0x9C, 0xF2, 0xC4, 0xF7, 0xCA, 0xFF,
               0x22, 0x2C, 0xB9, 0x76, 0x9B, 0x41, 0xBC, 0x96 }},
            {{ 'R', 'F', 'I', 'D', '-', 'A', 0x00 }}
        };
        return defaults;
    }

    KeyDerivation::KeyDerivation(const KdfParameters& parameters)
        : parameters(parameters)
    {
    }

    etl::expected<KeySet, error::Error> KeyDerivation::derive(const uint8_t* uid, size_t length) const
    {
        if (uid == nullptr || length == 0)
        {
            return etl::unexpected(error::Error::fromKdf(error::KdfError::InvalidInput));
        }

        PkeyCtxPtr ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr));
        if (!ctx)
        {
            return etl::unexpected(backendFailure("context allocation"));
        }
        if (EVP_PKEY_derive_init(ctx.get()) <= 0)
        {
            return etl::unexpected(backendFailure("init"));
        }
        if (EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0)
        {
            return etl::unexpected(backendFailure("digest selection"));
        }
        if (EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(),
                                        parameters.masterSecret.data(),
                                        static_cast<int>(parameters.masterSecret.size())) <= 0)
        {
            return etl::unexpected(backendFailure("salt"));
        }
        if (EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), uid, static_cast<int>(length)) <= 0)
        {
            return etl::unexpected(backendFailure("key"));
        }
        if (EVP_PKEY_CTX_add1_hkdf_info(ctx.get(),
                                        parameters.context.data(),
                                        static_cast<int>(parameters.context.size())) <= 0)
        {
            return etl::unexpected(backendFailure("info"));
        }

        etl::array<uint8_t, OUTPUT_SIZE> output;
        size_t outputLength = output.size();
        if (EVP_PKEY_derive(ctx.get(), output.data(), &outputLength) <= 0 || outputLength != OUTPUT_SIZE)
        {
            return etl::unexpected(backendFailure("expand"));
        }

        KeySet keys;
        for (size_t sector = 0; sector < geometry::SECTOR_COUNT; ++sector)
        {
            for (size_t i = 0; i < geometry::KEY_SIZE; ++i)
            {
                keys[sector][i] = output[sector * geometry::KEY_SIZE + i];
            }
        }

        output.fill(0);
        return keys;
    }

    etl::expected<KeySet, error::Error> KeyDerivation::derive(const TagUid& uid) const
    {
        return derive(uid.data(), uid.size());
    }

    etl::expected<KeySet, error::Error> KeyDerivation::deriveFromHex(etl::string_view uidHex) const
    {
        // 10 bytes covers double-size UIDs as well
        etl::vector<uint8_t, 10> uid;
        auto parsed = utils::fromHex(uidHex, uid);
        if (!parsed || uid.empty())
        {
            return etl::unexpected(error::Error::fromKdf(error::KdfError::InvalidInput));
        }
        return derive(uid.data(), uid.size());
    }

    etl::array<std::string, geometry::SECTOR_COUNT> keySetToHex(const KeySet& keys)
    {
        etl::array<std::string, geometry::SECTOR_COUNT> result;
        for (size_t sector = 0; sector < geometry::SECTOR_COUNT; ++sector)
        {
            result[sector] = keyToHex(keys[sector]);
        }
        return result;
    }

} // namespace spool
