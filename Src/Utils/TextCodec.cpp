/**
 * @file TextCodec.cpp
 * @brief Hex and base64 conversion for tag data
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Utils/TextCodec.h"

#include <cctype>

#include <openssl/evp.h>

namespace utils
{
    namespace
    {
        constexpr char HEX_DIGITS[] = "0123456789ABCDEF";

        int hexValue(char c)
        {
            if (c >= '0' && c <= '9') return c - '0';
            if (c >= 'a' && c <= 'f') return c - 'a' + 10;
            if (c >= 'A' && c <= 'F') return c - 'A' + 10;
            return -1;
        }

        bool isSpace(char c)
        {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        }
    }

    std::string toHex(const uint8_t* data, size_t length, char separator)
    {
        std::string result;
        result.reserve(length * 3);
        for (size_t i = 0; i < length; ++i)
        {
            if (separator != '\0' && i > 0)
            {
                result.push_back(separator);
            }
            result.push_back(HEX_DIGITS[data[i] >> 4]);
            result.push_back(HEX_DIGITS[data[i] & 0x0F]);
        }
        return result;
    }

    etl::expected<void, error::Error> fromHex(etl::string_view text, etl::ivector<uint8_t>& out)
    {
        out.clear();

        int high = -1;
        for (char c : text)
        {
            if (isSpace(c))
            {
                continue;
            }

            int value = hexValue(c);
            if (value < 0)
            {
                return etl::unexpected(error::Error::fromCodec(error::CodecError::InvalidEncoding));
            }

            if (high < 0)
            {
                high = value;
                continue;
            }

            if (out.full())
            {
                return etl::unexpected(error::Error::fromCodec(error::CodecError::MalformedImage));
            }
            out.push_back(static_cast<uint8_t>((high << 4) | value));
            high = -1;
        }

        if (high >= 0)
        {
            return etl::unexpected(error::Error::fromCodec(error::CodecError::InvalidEncoding));
        }
        return {};
    }

    std::string toBase64(const uint8_t* data, size_t length)
    {
        std::string result(4 * ((length + 2) / 3), '\0');
        if (length == 0)
        {
            return result;
        }

        // EVP_EncodeBlock NUL-terminates, so give it one spare byte
        result.resize(result.size() + 1);
        int written = EVP_EncodeBlock(
            reinterpret_cast<unsigned char*>(&result[0]),
            data,
            static_cast<int>(length));
        result.resize(written > 0 ? static_cast<size_t>(written) : 0);
        return result;
    }

    etl::expected<void, error::Error> fromBase64(etl::string_view text, etl::ivector<uint8_t>& out)
    {
        out.clear();

        size_t begin = 0;
        size_t end = text.size();
        while (begin < end && isSpace(text[begin])) ++begin;
        while (end > begin && isSpace(text[end - 1])) --end;

        size_t length = end - begin;
        if (length == 0)
        {
            return {};
        }
        if (length % 4 != 0)
        {
            return etl::unexpected(error::Error::fromCodec(error::CodecError::InvalidEncoding));
        }

        size_t padding = 0;
        if (text[end - 1] == '=') ++padding;
        if (text[end - 2] == '=') ++padding;

        std::string decoded(3 * (length / 4), '\0');
        int written = EVP_DecodeBlock(
            reinterpret_cast<unsigned char*>(&decoded[0]),
            reinterpret_cast<const unsigned char*>(text.data() + begin),
            static_cast<int>(length));
        if (written < 0 || static_cast<size_t>(written) < padding)
        {
            return etl::unexpected(error::Error::fromCodec(error::CodecError::InvalidEncoding));
        }

        // EVP_DecodeBlock counts the padding as output bytes
        size_t actual = static_cast<size_t>(written) - padding;
        if (actual > out.capacity())
        {
            return etl::unexpected(error::Error::fromCodec(error::CodecError::MalformedImage));
        }
        out.assign(decoded.begin(), decoded.begin() + actual);
        return {};
    }

    etl::string<16> redactKey(const uint8_t* key, size_t length)
    {
        etl::string<16> result;
        if (length == 0)
        {
            return result;
        }
        result.push_back(HEX_DIGITS[key[0] >> 4]);
        result.push_back(HEX_DIGITS[key[0] & 0x0F]);
        for (size_t i = 1; i < length && !result.full(); ++i)
        {
            result.push_back('*');
            if (!result.full())
            {
                result.push_back('*');
            }
        }
        return result;
    }

} // namespace utils
