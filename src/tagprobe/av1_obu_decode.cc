#include "tagprobe/av1_obu_decode.h"

#include "tagprobe/byte_reader.h"

namespace tagprobe {
namespace {

    static constexpr uint32_t kMaxLeb128Bytes = 8;

    static void decode_first_byte(uint8_t b0, Av1ObuHeader* h) noexcept
    {
        h->forbidden_bit  = (b0 & 0x80U) != 0;
        h->obu_type       = static_cast<uint8_t>((b0 >> 3) & 0x0FU);
        h->extension_flag = (b0 & 0x04U) != 0;
        h->has_size_field = (b0 & 0x02U) != 0;
        h->reserved_bit   = (b0 & 0x01U) != 0;
        h->type_name      = av1_obu_type_name(h->obu_type);
    }


    static void check_first_byte(Av1ObuDecodeResult* result)
    {
        if (result->record.forbidden_bit) {
            add_anomaly(result, AnomalyKind::MalformedStructure, 0,
                        "obu_forbidden_bit is set");
        }
        if (result->record.reserved_bit) {
            add_anomaly(result, AnomalyKind::MalformedStructure, 0,
                        "obu_reserved_1bit is set");
        }
    }

}  // namespace

bool
detect_av1_obu_header(std::span<const std::byte> bytes) noexcept
{
    if (bytes.empty()) {
        return false;
    }
    const uint8_t b0 = static_cast<uint8_t>(bytes[0]);
    return (b0 & 0x80U) == 0 && (b0 & 0x01U) == 0;
}


Av1ObuDecodeResult
decode_av1_obu_header(std::span<const std::byte> bytes)
{
    Av1ObuDecodeResult result;
    if (bytes.empty()) {
        result.status = DecodeStatus::NotThisFormat;
        return result;
    }
    decode_first_byte(static_cast<uint8_t>(bytes[0]), &result.record);
    check_first_byte(&result);
    return result;
}


Av1ObuDecodeResult
decode_av1_obu(std::span<const std::byte> bytes)
{
    Av1ObuDecodeResult result = decode_av1_obu_header(bytes);
    if (!result.recognized()) {
        return result;
    }
    Av1ObuHeader& h = result.record;

    if (h.extension_flag) {
        uint8_t ext = 0;
        if (!read_u8(bytes, 1, &ext)) {
            add_anomaly(&result, AnomalyKind::TruncatedInput, 1,
                        "extension byte is cut off");
            return result;
        }
        h.temporal_id = static_cast<uint8_t>((ext >> 5) & 0x07U);
        h.spatial_id  = static_cast<uint8_t>((ext >> 3) & 0x03U);
        h.header_size = 2;
    }

    if (h.has_size_field) {
        uint64_t size    = 0;
        uint32_t leb_len = 0;
        if (!read_leb128(bytes, h.header_size, &size, &leb_len)) {
            if (bytes.size() - h.header_size < kMaxLeb128Bytes) {
                add_anomaly(&result, AnomalyKind::TruncatedInput,
                            h.header_size, "obu_size is cut off");
            } else {
                add_anomaly(&result, AnomalyKind::MalformedStructure,
                            h.header_size, "obu_size is longer than 8 bytes");
            }
            return result;
        }
        if (size > kAv1MaxObuSize) {
            add_anomaly(&result, AnomalyKind::MalformedStructure,
                        h.header_size, "obu_size exceeds 2^32 - 1");
        }
        h.obu_size = size;
        h.header_size += leb_len;
    }
    return result;
}


bool
read_leb128(std::span<const std::byte> bytes, uint64_t offset, uint64_t* out,
            uint32_t* length) noexcept
{
    uint64_t value = 0;
    for (uint32_t i = 0; i < kMaxLeb128Bytes; ++i) {
        uint8_t b = 0;
        if (!read_u8(bytes, offset + i, &b)) {
            return false;
        }
        value |= static_cast<uint64_t>(b & 0x7FU) << (i * 7U);
        if ((b & 0x80U) == 0) {
            *out    = value;
            *length = i + 1;
            return true;
        }
    }
    return false;
}


std::string_view
av1_obu_type_name(uint8_t obu_type) noexcept
{
    switch (obu_type) {
    case 1: return "Sequence Header";
    case 2: return "Temporal Delimiter";
    case 3: return "Frame Header";
    case 4: return "Tile Group";
    case 5: return "Metadata";
    case 6: return "Frame";
    case 7: return "Redundant Frame Header";
    case 8: return "Tile List";
    case 15: return "Padding";
    default: return "Reserved";
    }
}

}  // namespace tagprobe
