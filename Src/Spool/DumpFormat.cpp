/**
 * @file DumpFormat.cpp
 * @brief Import and export of tag images in common dump formats
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Spool/DumpFormat.h"
#include "Utils/Logging.h"
#include "Utils/TextCodec.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <iterator>

#include <etl/vector.h>

namespace spool
{
    namespace
    {
        using BlockList = etl::vector<Block, geometry::BLOCK_COUNT>;

        etl::expected<Block, error::Error> toBlock(const etl::ivector<uint8_t>& bytes)
        {
            if (bytes.size() != geometry::BLOCK_SIZE)
            {
                return etl::unexpected(error::Error::fromCodec(error::CodecError::MalformedImage));
            }
            Block block;
            std::copy(bytes.begin(), bytes.end(), block.begin());
            return block;
        }

        template<typename Decoder>
        etl::expected<TagImage, error::Error> fromBlockStrings(const std::vector<std::string>& blocks, Decoder decodeBlock)
        {
            if (blocks.size() != geometry::BLOCK_COUNT)
            {
                LOG_WARN("Dump has %u blocks, expected %u",
                         static_cast<unsigned>(blocks.size()),
                         static_cast<unsigned>(geometry::BLOCK_COUNT));
                return etl::unexpected(error::Error::fromCodec(error::CodecError::MalformedImage));
            }

            BlockList list;
            for (const auto& text : blocks)
            {
                auto block = decodeBlock(etl::string_view(text.data(), text.size()));
                if (!block)
                {
                    LOG_WARN("Dump block %u is invalid", static_cast<unsigned>(list.size()));
                    return etl::unexpected(block.error());
                }
                list.push_back(block.value());
            }
            return TagImage::fromBlocks(list);
        }

        etl::string_view trim(etl::string_view text)
        {
            size_t begin = 0;
            size_t end = text.size();
            while (begin < end && (text[begin] == ' ' || text[begin] == '\t' || text[begin] == '\r'))
            {
                ++begin;
            }
            while (end > begin && (text[end - 1] == ' ' || text[end - 1] == '\t' || text[end - 1] == '\r'))
            {
                --end;
            }
            return text.substr(begin, end - begin);
        }

        size_t hexDigitCount(etl::string_view text)
        {
            size_t count = 0;
            for (char c : text)
            {
                if (c != ' ' && c != '\t')
                {
                    ++count;
                }
            }
            return count;
        }
    }

    etl::expected<TagImage, error::Error> DumpFormat::fromBinary(const uint8_t* data, size_t length)
    {
        return TagImage::fromBytes(data, length);
    }

    etl::expected<TagImage, error::Error> DumpFormat::fromHex(etl::string_view text)
    {
        etl::vector<uint8_t, geometry::IMAGE_SIZE> bytes;
        auto parsed = utils::fromHex(text, bytes);
        if (!parsed)
        {
            return etl::unexpected(parsed.error());
        }
        return TagImage::fromBytes(bytes.data(), bytes.size());
    }

    etl::expected<TagImage, error::Error> DumpFormat::fromBase64(etl::string_view text)
    {
        etl::vector<uint8_t, geometry::IMAGE_SIZE> bytes;
        auto parsed = utils::fromBase64(text, bytes);
        if (!parsed)
        {
            return etl::unexpected(parsed.error());
        }
        return TagImage::fromBytes(bytes.data(), bytes.size());
    }

    etl::expected<Block, error::Error> DumpFormat::blockFromBase64(etl::string_view text)
    {
        etl::vector<uint8_t, geometry::BLOCK_SIZE> bytes;
        auto parsed = utils::fromBase64(text, bytes);
        if (!parsed)
        {
            return etl::unexpected(parsed.error());
        }
        return toBlock(bytes);
    }

    etl::expected<Block, error::Error> DumpFormat::blockFromHex(etl::string_view text)
    {
        etl::vector<uint8_t, geometry::BLOCK_SIZE> bytes;
        auto parsed = utils::fromHex(text, bytes);
        if (!parsed)
        {
            return etl::unexpected(parsed.error());
        }
        return toBlock(bytes);
    }

    etl::expected<TagImage, error::Error> DumpFormat::fromBase64Blocks(const std::vector<std::string>& blocks)
    {
        return fromBlockStrings(blocks, &DumpFormat::blockFromBase64);
    }

    etl::expected<TagImage, error::Error> DumpFormat::fromHexBlocks(const std::vector<std::string>& blocks)
    {
        return fromBlockStrings(blocks, &DumpFormat::blockFromHex);
    }

    etl::expected<TagImage, error::Error> DumpFormat::fromProxmark3(etl::string_view text)
    {
        BlockList list;

        size_t lineStart = 0;
        while (lineStart <= text.size())
        {
            size_t lineEnd = text.find('\n', lineStart);
            if (lineEnd == etl::string_view::npos)
            {
                lineEnd = text.size();
            }

            etl::string_view line = trim(text.substr(lineStart, lineEnd - lineStart));
            lineStart = lineEnd + 1;

            if (line.empty() || line[0] == '#')
            {
                continue;
            }

            size_t colon = line.find(':');
            etl::string_view payload = (colon == etl::string_view::npos) ? line : trim(line.substr(colon + 1));
            if (hexDigitCount(payload) != geometry::BLOCK_SIZE * 2)
            {
                continue;
            }

            auto block = blockFromHex(payload);
            if (!block)
            {
                return etl::unexpected(block.error());
            }
            if (list.full())
            {
                LOG_WARN("Proxmark3 dump has more than %u blocks", static_cast<unsigned>(geometry::BLOCK_COUNT));
                return etl::unexpected(error::Error::fromCodec(error::CodecError::MalformedImage));
            }
            list.push_back(block.value());
        }

        if (list.size() != geometry::BLOCK_COUNT)
        {
            LOG_WARN("Proxmark3 dump has %u blocks, expected %u",
                     static_cast<unsigned>(list.size()),
                     static_cast<unsigned>(geometry::BLOCK_COUNT));
        }
        return TagImage::fromBlocks(list);
    }

    etl::expected<TagImage, error::Error> DumpFormat::fromFileContents(const std::string& contents)
    {
        if (contents.size() == geometry::IMAGE_SIZE)
        {
            return fromBinary(reinterpret_cast<const uint8_t*>(contents.data()), contents.size());
        }

        const etl::string_view text(contents.data(), contents.size());
        if (contents.find("Block") != std::string::npos)
        {
            return fromProxmark3(text);
        }

        const bool hexOnly = std::all_of(contents.begin(), contents.end(), [](char c) {
            return std::isxdigit(static_cast<unsigned char>(c)) || std::isspace(static_cast<unsigned char>(c));
        });
        if (hexOnly)
        {
            return fromHex(text);
        }

        std::string compact;
        std::copy_if(contents.begin(), contents.end(), std::back_inserter(compact), [](char c) {
            return !std::isspace(static_cast<unsigned char>(c));
        });
        return fromBase64(etl::string_view(compact.data(), compact.size()));
    }

    std::vector<uint8_t> DumpFormat::toBinary(const TagImage& image)
    {
        std::vector<uint8_t> bytes;
        bytes.reserve(geometry::IMAGE_SIZE);
        for (size_t i = 0; i < image.size(); ++i)
        {
            bytes.insert(bytes.end(), image.block(i).begin(), image.block(i).end());
        }
        return bytes;
    }

    std::string DumpFormat::toHex(const TagImage& image)
    {
        const auto bytes = toBinary(image);
        return utils::toHex(bytes.data(), bytes.size());
    }

    std::string DumpFormat::toBase64(const TagImage& image)
    {
        const auto bytes = toBinary(image);
        return utils::toBase64(bytes.data(), bytes.size());
    }

    std::vector<std::string> DumpFormat::toBase64Blocks(const TagImage& image)
    {
        std::vector<std::string> blocks;
        blocks.reserve(image.size());
        for (size_t i = 0; i < image.size(); ++i)
        {
            blocks.push_back(utils::toBase64(image.block(i).data(), image.block(i).size()));
        }
        return blocks;
    }

    std::vector<std::string> DumpFormat::toHexBlocks(const TagImage& image)
    {
        std::vector<std::string> blocks;
        blocks.reserve(image.size());
        for (size_t i = 0; i < image.size(); ++i)
        {
            blocks.push_back(utils::toHex(image.block(i).data(), image.block(i).size()));
        }
        return blocks;
    }

    std::string DumpFormat::toProxmark3(const TagImage& image)
    {
        std::string text;
        for (size_t i = 0; i < image.size(); ++i)
        {
            char label[16];
            std::snprintf(label, sizeof(label), "Block %02u: ", static_cast<unsigned>(i));
            if (i > 0)
            {
                text.push_back('\n');
            }
            text.append(label);
            text.append(utils::toHex(image.block(i).data(), image.block(i).size(), ' '));
        }
        return text;
    }

} // namespace spool
