/**
 * @file TagCodec.cpp
 * @brief Conversion between a 1 KB filament tag image and a FilamentRecord
 * @version 0.1
 * @date 2026-10-19
 *
 * @copyright Copyright (c) 2026
 *
 */

#include "Spool/TagCodec.h"
#include "Utils/Logging.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <cstring>

namespace spool
{
    namespace
    {
        // Block numbers of the fields
        constexpr size_t BLOCK_UID = 0;
        constexpr size_t BLOCK_MATERIAL_IDS = 1;
        constexpr size_t BLOCK_FILAMENT_TYPE = 2;
        constexpr size_t BLOCK_DETAILED_TYPE = 4;
        constexpr size_t BLOCK_COLOR_WEIGHT = 5;
        constexpr size_t BLOCK_TEMPERATURES = 6;
        constexpr size_t BLOCK_XCAM_NOZZLE = 8;
        constexpr size_t BLOCK_TRAY_UID = 9;
        constexpr size_t BLOCK_SPOOL_WIDTH = 10;
        constexpr size_t BLOCK_PRODUCTION_DATE = 12;
        constexpr size_t BLOCK_SHORT_PRODUCTION_DATE = 13;
        constexpr size_t BLOCK_FILAMENT_LENGTH = 14;
        constexpr size_t BLOCK_MULTI_COLOR = 16;

        constexpr uint32_t COLOR_FORMAT_SECONDARY = 2;
        constexpr uint32_t UINT16_LIMIT = 0xFFFF;

        const etl::array<uint8_t, 18> SIGNATURE_BLOCKS = {{
            40, 41, 42, 44, 45, 46, 48, 49, 50,
            52, 53, 54, 56, 57, 58, 60, 61, 62
        }};

        uint16_t readUint16(const Block& block, size_t offset)
        {
            return static_cast<uint16_t>(block[offset] | (block[offset + 1] << 8));
        }

        float readFloat(const Block& block, size_t offset)
        {
            uint32_t bits = static_cast<uint32_t>(block[offset])
                          | (static_cast<uint32_t>(block[offset + 1]) << 8)
                          | (static_cast<uint32_t>(block[offset + 2]) << 16)
                          | (static_cast<uint32_t>(block[offset + 3]) << 24);
            float value;
            std::memcpy(&value, &bits, sizeof(value));
            return value;
        }

        bool isBlank(uint8_t byte)
        {
            return byte == ' ' || (byte >= '\t' && byte <= '\r');
        }

        std::string readString(const Block& block, size_t offset, size_t width)
        {
            size_t length = 0;
            while (length < width && block[offset + length] != 0x00)
            {
                ++length;
            }

            size_t begin = offset;
            size_t end = offset + length;
            while (begin < end && isBlank(block[begin]))
            {
                ++begin;
            }
            while (end > begin && isBlank(block[end - 1]))
            {
                --end;
            }

            std::string result;
            result.reserve(end - begin);
            for (size_t i = begin; i < end; ++i)
            {
                // Non-ASCII bytes have no meaning in these slots
                result.push_back(block[i] < 0x80 ? static_cast<char>(block[i]) : '?');
            }
            return result;
        }

        template<size_t N>
        void readBytes(const Block& block, size_t offset, etl::array<uint8_t, N>& out)
        {
            std::copy(block.begin() + offset, block.begin() + offset + N, out.begin());
        }

        etl::expected<void, error::Error> fieldOutOfRange(const char* field)
        {
            LOG_WARN("Field %s does not fit its tag slot", field);
            return etl::unexpected(error::Error::fromCodec(error::CodecError::FieldOutOfRange));
        }

        etl::expected<void, error::Error> writeUint16(Block& block, size_t offset, uint32_t value, const char* field)
        {
            if (value > UINT16_LIMIT)
            {
                return fieldOutOfRange(field);
            }
            block[offset] = static_cast<uint8_t>(value & 0xFF);
            block[offset + 1] = static_cast<uint8_t>((value >> 8) & 0xFF);
            return {};
        }

        void writeFloat(Block& block, size_t offset, float value)
        {
            uint32_t bits;
            std::memcpy(&bits, &value, sizeof(bits));
            block[offset] = static_cast<uint8_t>(bits & 0xFF);
            block[offset + 1] = static_cast<uint8_t>((bits >> 8) & 0xFF);
            block[offset + 2] = static_cast<uint8_t>((bits >> 16) & 0xFF);
            block[offset + 3] = static_cast<uint8_t>((bits >> 24) & 0xFF);
        }

        // Leaves the slot alone when it already decodes to value, so bytes
        // decode had to mask or trim survive a decode/encode cycle
        etl::expected<void, error::Error> writeString(Block& block, size_t offset, size_t width,
                                                      const std::string& value, const char* field)
        {
            if (readString(block, offset, width) == value)
            {
                return {};
            }
            if (value.size() > width)
            {
                return fieldOutOfRange(field);
            }
            for (char c : value)
            {
                const auto byte = static_cast<unsigned char>(c);
                if (byte == 0x00 || byte >= 0x80)
                {
                    return fieldOutOfRange(field);
                }
            }
            // Decode trims these, the value would not read back
            if (!value.empty() && (isBlank(static_cast<uint8_t>(value.front())) ||
                                   isBlank(static_cast<uint8_t>(value.back()))))
            {
                return fieldOutOfRange(field);
            }

            std::fill(block.begin() + offset, block.begin() + offset + width, 0x00);
            std::copy(value.begin(), value.end(), block.begin() + offset);
            return {};
        }

        template<size_t N>
        void writeBytes(Block& block, size_t offset, const etl::array<uint8_t, N>& in)
        {
            std::copy(in.begin(), in.end(), block.begin() + offset);
        }
    }

    const etl::array<uint8_t, 18>& TagCodec::signatureBlocks()
    {
        return SIGNATURE_BLOCKS;
    }

    FilamentRecord TagCodec::decode(const TagImage& image)
    {
        FilamentRecord record;

        const Block& b0 = image.block(BLOCK_UID);
        record.uid = image.uid();
        readBytes(b0, geometry::UID_SIZE, record.manufacturerData);

        const Block& b1 = image.block(BLOCK_MATERIAL_IDS);
        record.materialVariantId = readString(b1, 0, 8);
        record.materialId = readString(b1, 8, 8);
        record.filamentType = readString(image.block(BLOCK_FILAMENT_TYPE), 0, 16);
        record.detailedFilamentType = readString(image.block(BLOCK_DETAILED_TYPE), 0, 16);

        const Block& b5 = image.block(BLOCK_COLOR_WEIGHT);
        readBytes(b5, 0, record.colorRgba);
        record.spoolWeightG = readUint16(b5, 4);
        record.filamentDiameterMm = readFloat(b5, 8);

        const Block& b6 = image.block(BLOCK_TEMPERATURES);
        record.dryingTempC = readUint16(b6, 0);
        record.dryingTimeH = readUint16(b6, 2);
        record.bedTempType = readUint16(b6, 4);
        record.bedTempC = readUint16(b6, 6);
        record.maxHotendTempC = readUint16(b6, 8);
        record.minHotendTempC = readUint16(b6, 10);

        const Block& b8 = image.block(BLOCK_XCAM_NOZZLE);
        readBytes(b8, 0, record.xcamInfo);
        record.nozzleDiameter = readFloat(b8, 12);

        record.trayUid = readString(image.block(BLOCK_TRAY_UID), 0, 16);
        record.spoolWidthMm = static_cast<float>(readUint16(image.block(BLOCK_SPOOL_WIDTH), 4)) / 100.0f;

        record.productionDatetime = readString(image.block(BLOCK_PRODUCTION_DATE), 0, 16);
        record.shortProductionDatetime = readString(image.block(BLOCK_SHORT_PRODUCTION_DATE), 0, 16);
        record.filamentLengthM = readUint16(image.block(BLOCK_FILAMENT_LENGTH), 4);

        const Block& b16 = image.block(BLOCK_MULTI_COLOR);
        record.colorFormat = readUint16(b16, 0);
        record.colorCount = readUint16(b16, 2);
        if (record.colorFormat == COLOR_FORMAT_SECONDARY)
        {
            readBytes(b16, 4, record.secondaryColor);
        }

        // 18 blocks hold 288 bytes, only the first 256 belong to the signature
        size_t offset = 0;
        for (uint8_t blockNumber : SIGNATURE_BLOCKS)
        {
            const Block& block = image.block(blockNumber);
            for (size_t i = 0; i < geometry::BLOCK_SIZE && offset < geometry::SIGNATURE_SIZE; ++i, ++offset)
            {
                record.rsaSignature[offset] = block[i];
                if (block[i] != 0x00)
                {
                    record.hasRsaSignature = true;
                }
            }
        }

        return record;
    }

    etl::expected<FilamentRecord, error::Error> TagCodec::decode(const etl::ivector<Block>& blocks)
    {
        auto image = TagImage::fromBlocks(blocks);
        if (!image)
        {
            LOG_WARN("Cannot decode tag: expected %u blocks, got %u",
                     static_cast<unsigned>(geometry::BLOCK_COUNT),
                     static_cast<unsigned>(blocks.size()));
            return etl::unexpected(image.error());
        }
        return decode(image.value());
    }

    etl::expected<TagImage, error::Error> TagCodec::encode(const FilamentRecord& record)
    {
        return encodeOnto(record, TagImage());
    }

    etl::expected<TagImage, error::Error> TagCodec::encodeOnto(const FilamentRecord& record, const TagImage& base)
    {
        TagImage image = base;

        Block& b1 = image.block(BLOCK_MATERIAL_IDS);
        auto result = writeString(b1, 0, 8, record.materialVariantId, "material_variant_id");
        if (!result) return etl::unexpected(result.error());
        result = writeString(b1, 8, 8, record.materialId, "material_id");
        if (!result) return etl::unexpected(result.error());
        result = writeString(image.block(BLOCK_FILAMENT_TYPE), 0, 16, record.filamentType, "filament_type");
        if (!result) return etl::unexpected(result.error());
        result = writeString(image.block(BLOCK_DETAILED_TYPE), 0, 16, record.detailedFilamentType, "detailed_filament_type");
        if (!result) return etl::unexpected(result.error());

        Block& b5 = image.block(BLOCK_COLOR_WEIGHT);
        writeBytes(b5, 0, record.colorRgba);
        result = writeUint16(b5, 4, record.spoolWeightG, "spool_weight_g");
        if (!result) return etl::unexpected(result.error());
        writeFloat(b5, 8, record.filamentDiameterMm);

        Block& b6 = image.block(BLOCK_TEMPERATURES);
        const struct
        {
            size_t offset;
            uint32_t value;
            const char* name;
        } temperatures[] = {
            { 0, record.dryingTempC, "drying_temp_c" },
            { 2, record.dryingTimeH, "drying_time_h" },
            { 4, record.bedTempType, "bed_temp_type" },
            { 6, record.bedTempC, "bed_temp_c" },
            { 8, record.maxHotendTempC, "max_hotend_temp_c" },
            { 10, record.minHotendTempC, "min_hotend_temp_c" },
        };
        for (const auto& field : temperatures)
        {
            result = writeUint16(b6, field.offset, field.value, field.name);
            if (!result) return etl::unexpected(result.error());
        }

        Block& b8 = image.block(BLOCK_XCAM_NOZZLE);
        writeBytes(b8, 0, record.xcamInfo);
        writeFloat(b8, 12, record.nozzleDiameter);

        result = writeString(image.block(BLOCK_TRAY_UID), 0, 16, record.trayUid, "tray_uid");
        if (!result) return etl::unexpected(result.error());

        const float scaledWidth = record.spoolWidthMm * 100.0f;
        if (!(scaledWidth >= 0.0f && scaledWidth <= static_cast<float>(UINT16_LIMIT)))
        {
            return etl::unexpected(fieldOutOfRange("spool_width_mm").error());
        }
        result = writeUint16(image.block(BLOCK_SPOOL_WIDTH), 4,
                             static_cast<uint32_t>(std::lround(scaledWidth)), "spool_width_mm");
        if (!result) return etl::unexpected(result.error());

        result = writeString(image.block(BLOCK_PRODUCTION_DATE), 0, 16, record.productionDatetime, "production_datetime");
        if (!result) return etl::unexpected(result.error());
        result = writeString(image.block(BLOCK_SHORT_PRODUCTION_DATE), 0, 16, record.shortProductionDatetime,
                             "short_production_datetime");
        if (!result) return etl::unexpected(result.error());
        result = writeUint16(image.block(BLOCK_FILAMENT_LENGTH), 4, record.filamentLengthM, "filament_length_m");
        if (!result) return etl::unexpected(result.error());

        Block& b16 = image.block(BLOCK_MULTI_COLOR);
        result = writeUint16(b16, 0, record.colorFormat, "color_format");
        if (!result) return etl::unexpected(result.error());
        result = writeUint16(b16, 2, record.colorCount, "color_count");
        if (!result) return etl::unexpected(result.error());
        if (record.colorFormat == COLOR_FORMAT_SECONDARY)
        {
            writeBytes(b16, 4, record.secondaryColor);
        }

        bool signaturePresent = false;
        for (uint8_t byte : record.rsaSignature)
        {
            signaturePresent = signaturePresent || byte != 0x00;
        }
        if (signaturePresent)
        {
            size_t offset = 0;
            for (uint8_t blockNumber : SIGNATURE_BLOCKS)
            {
                Block& block = image.block(blockNumber);
                for (size_t i = 0; i < geometry::BLOCK_SIZE; ++i, ++offset)
                {
                    block[i] = offset < geometry::SIGNATURE_SIZE ? record.rsaSignature[offset] : 0x00;
                }
            }
        }

        return image;
    }

} // namespace spool
