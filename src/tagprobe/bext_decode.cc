#include "tagprobe/bext_decode.h"

#include "tagprobe/byte_reader.h"
#include "tagprobe/text_decode.h"

namespace tagprobe {
namespace {

    static constexpr uint32_t kBextId = fourcc('b', 'e', 'x', 't');
    static constexpr uint32_t kDataId = fourcc('d', 'a', 't', 'a');
    static constexpr uint32_t kDs64Id = fourcc('d', 's', '6', '4');

    static void read_text_field(std::span<const std::byte> body,
                                uint64_t offset, uint64_t size,
                                std::string* out)
    {
        std::string raw;
        if (!read_fixed_string(body, offset, size, &raw)) {
            return;
        }
        (void)decode_text_to_utf8(
            std::span<const std::byte>(
                reinterpret_cast<const std::byte*>(raw.data()), raw.size()),
            TextEncoding::Latin1, out);
    }


    static uint32_t read_chunk_id(std::span<const std::byte> bytes,
                                  uint64_t off) noexcept
    {
        uint32_t id = 0;
        (void)read_u32(bytes, off, Endian::Big, &id);
        return id;
    }


    static BextDecodeResult decode_bext_at(std::span<const std::byte> bytes,
                                           uint64_t base)
    {
        BextDecodeResult result;
        if (!detect_bext_chunk(bytes)) {
            result.status = DecodeStatus::NotThisFormat;
            return result;
        }

        BextChunk& chunk = result.record;
        chunk.offset     = base;
        (void)read_u32(bytes, 4, Endian::Little, &chunk.declared_size);

        uint64_t body_size = chunk.declared_size;
        const uint64_t available = bytes.size() - 8U;
        if (body_size > available) {
            add_anomaly(&result, AnomalyKind::OutOfBounds, base + 4,
                        "chunk size exceeds the buffer");
            body_size = available;
        }
        if (chunk.declared_size < kBextFixedSize) {
            add_anomaly(&result, AnomalyKind::TruncatedInput, base + 4,
                        "chunk is shorter than the 602-byte fixed part");
        } else if (body_size < kBextFixedSize) {
            add_anomaly(&result, AnomalyKind::TruncatedInput,
                        base + 8 + body_size,
                        "buffer ends inside the fixed part");
        }
        const std::span<const std::byte> body
            = bytes.subspan(8, static_cast<size_t>(body_size));

        read_text_field(body, 0, 256, &chunk.description);
        read_text_field(body, 256, 32, &chunk.originator);
        read_text_field(body, 288, 32, &chunk.originator_reference);
        read_text_field(body, 320, 10, &chunk.origination_date);
        read_text_field(body, 330, 8, &chunk.origination_time);

        uint32_t lo = 0;
        uint32_t hi = 0;
        if (read_u32(body, 338, Endian::Little, &lo)
            && read_u32(body, 342, Endian::Little, &hi)) {
            chunk.time_reference = (static_cast<uint64_t>(hi) << 32) | lo;
        }
        (void)read_u16(body, 346, Endian::Little, &chunk.version);

        if (chunk.version >= 1 && range_ok(body, 348, 64)) {
            chunk.has_umid = true;
            for (size_t i = 0; i < chunk.umid.size(); ++i) {
                chunk.umid[i] = static_cast<uint8_t>(body[348 + i]);
            }
        }
        if (chunk.version >= 2 && range_ok(body, 412, 10)) {
            chunk.has_loudness = true;
            (void)read_i16(body, 412, Endian::Little, &chunk.loudness_value);
            (void)read_i16(body, 414, Endian::Little, &chunk.loudness_range);
            (void)read_i16(body, 416, Endian::Little,
                           &chunk.max_true_peak_level);
            (void)read_i16(body, 418, Endian::Little,
                           &chunk.max_momentary_loudness);
            (void)read_i16(body, 420, Endian::Little,
                           &chunk.max_short_term_loudness);
        }

        if (body.size() > kBextFixedSize) {
            read_text_field(body, kBextFixedSize, body.size() - kBextFixedSize,
                            &chunk.coding_history);
        }
        return result;
    }

}  // namespace

bool
detect_bext_chunk(std::span<const std::byte> bytes) noexcept
{
    return bytes.size() >= 8 && match_bytes(bytes, 0, "bext");
}


BextDecodeResult
decode_bext_chunk(std::span<const std::byte> bytes)
{
    return decode_bext_at(bytes, 0);
}


bool
find_riff_chunk(std::span<const std::byte> bytes, uint32_t id,
                RiffChunkRef* out, const RiffWalkLimits& limits) noexcept
{
    if (!out || bytes.size() < 12 || !match_bytes(bytes, 8, "WAVE")) {
        return false;
    }
    const bool is_rf64 = match_bytes(bytes, 0, "RF64")
                         || match_bytes(bytes, 0, "BW64");
    if (!is_rf64 && !match_bytes(bytes, 0, "RIFF")) {
        return false;
    }

    uint64_t ds64_data_size = 0;
    uint64_t off            = 12;
    for (uint32_t n = 0; n < limits.max_chunks && off + 8 <= bytes.size();
         ++n) {
        const uint32_t chunk_id = read_chunk_id(bytes, off);
        uint32_t size32         = 0;
        (void)read_u32(bytes, off + 4, Endian::Little, &size32);
        uint64_t size = size32;

        // RF64 stores the real 64-bit `data` size in `ds64`.
        if (is_rf64 && chunk_id == kDs64Id) {
            (void)read_u64(bytes, off + 16, Endian::Little, &ds64_data_size);
        }
        if (is_rf64 && chunk_id == kDataId && size32 == 0xFFFFFFFFU) {
            size = ds64_data_size;
        }

        if (chunk_id == id) {
            out->id     = chunk_id;
            out->offset = off;
            out->size   = size;
            return true;
        }

        const uint64_t next = off + 8 + size + (size & 1U);
        if (next <= off || next > bytes.size()) {
            return false;
        }
        off = next;
    }
    return false;
}


BextDecodeResult
decode_bext_in_wave(std::span<const std::byte> bytes)
{
    RiffChunkRef ref;
    if (!find_riff_chunk(bytes, kBextId, &ref)) {
        BextDecodeResult result;
        result.status = DecodeStatus::NotThisFormat;
        return result;
    }
    return decode_bext_at(bytes.subspan(static_cast<size_t>(ref.offset)),
                          ref.offset);
}


double
bext_loudness_to_double(int16_t value) noexcept
{
    return static_cast<double>(value) / 100.0;
}

}  // namespace tagprobe
