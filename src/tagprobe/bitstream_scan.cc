#include "tagprobe/bitstream_scan.h"

#include "tagprobe/av1_obu_decode.h"
#include "tagprobe/byte_reader.h"

namespace tagprobe {
namespace {

    // Returns the offset of the next `00 00 01` at or after `from`, or
    // `bytes.size()` if there is none.
    static uint64_t find_start_code(std::span<const std::byte> bytes,
                                    uint64_t from) noexcept
    {
        const uint64_t n = bytes.size();
        uint64_t i       = from;
        while (i + 3 <= n) {
            const uint8_t b2 = static_cast<uint8_t>(bytes[i + 2]);
            if (b2 > 1U) {
                i += 3;
                continue;
            }
            if (b2 == 1U && bytes[i] == std::byte { 0 }
                && bytes[i + 1] == std::byte { 0 }) {
                return i;
            }
            i += 1;
        }
        return n;
    }


    template <typename Ref>
    static void emit(std::span<Ref> out, const Ref& ref,
                     BitstreamScanResult* res) noexcept
    {
        if (res->written < out.size()) {
            out[res->written] = ref;
            res->written += 1;
        }
        res->needed += 1;
    }


    static void finish(size_t out_size, BitstreamScanResult* res) noexcept
    {
        if (res->status == BitstreamScanStatus::Ok && res->needed > out_size) {
            res->status = BitstreamScanStatus::OutputTruncated;
        }
    }

}  // namespace

BitstreamScanResult
scan_annexb_units(std::span<const std::byte> bytes,
                  std::span<AnnexBUnitRef> out,
                  const BitstreamScanOptions& options) noexcept
{
    BitstreamScanResult res;
    uint64_t sc = 0;
    if (match_bytes(bytes, 0, std::string_view("\0\0\1", 3))) {
        sc = 0;
    } else if (match_bytes(bytes, 0, std::string_view("\0\0\0\1", 4))) {
        sc = 1;
    } else {
        res.status = BitstreamScanStatus::Unsupported;
        return res;
    }

    while (sc < bytes.size()) {
        const uint8_t sc_size = (sc > 0 && bytes[sc - 1] == std::byte { 0 })
                                    ? 4
                                    : 3;
        const uint64_t begin = sc + 3;
        const uint64_t next  = find_start_code(bytes, begin);

        uint64_t end = next;
        while (end > begin && bytes[end - 1] == std::byte { 0 }) {
            end -= 1;
        }
        if (end > begin) {
            if (res.needed >= options.limits.max_units) {
                res.status = BitstreamScanStatus::LimitExceeded;
                break;
            }
            AnnexBUnitRef ref;
            ref.offset          = begin;
            ref.size            = end - begin;
            ref.start_code_size = sc_size;
            emit(out, ref, &res);
        }
        sc = next;
    }

    finish(out.size(), &res);
    return res;
}


BitstreamScanResult
scan_av1_obus(std::span<const std::byte> bytes, std::span<Av1ObuRef> out,
              const BitstreamScanOptions& options) noexcept
{
    BitstreamScanResult res;
    if (!detect_av1_obu_header(bytes)
        || (static_cast<uint8_t>(bytes[0]) & 0x02U) == 0) {
        res.status = BitstreamScanStatus::Unsupported;
        return res;
    }

    uint64_t pos = 0;
    while (pos < bytes.size()) {
        const uint8_t b0 = static_cast<uint8_t>(bytes[pos]);
        if ((b0 & 0x80U) != 0) {
            res.status = BitstreamScanStatus::Malformed;
            break;
        }
        if (res.needed >= options.limits.max_units) {
            res.status = BitstreamScanStatus::LimitExceeded;
            break;
        }

        Av1ObuRef ref;
        ref.offset      = pos;
        ref.obu_type    = static_cast<uint8_t>((b0 >> 3) & 0x0FU);
        ref.header_size = (b0 & 0x04U) != 0 ? 2U : 1U;
        if (ref.header_size > bytes.size() - pos) {
            res.status = BitstreamScanStatus::Malformed;
            break;
        }

        uint64_t payload = 0;
        if ((b0 & 0x02U) != 0) {
            uint32_t leb_len = 0;
            if (!read_leb128(bytes, pos + ref.header_size, &payload,
                             &leb_len)
                || payload > kAv1MaxObuSize) {
                res.status = BitstreamScanStatus::Malformed;
                break;
            }
            ref.header_size += leb_len;
            if (payload > bytes.size() - pos - ref.header_size) {
                res.status = BitstreamScanStatus::Malformed;
                break;
            }
        } else {
            payload = bytes.size() - pos - ref.header_size;
        }

        ref.size = ref.header_size + payload;
        emit(out, ref, &res);
        pos += ref.size;
    }

    finish(out.size(), &res);
    return res;
}


const char*
bitstream_scan_status_name(BitstreamScanStatus status) noexcept
{
    switch (status) {
    case BitstreamScanStatus::Ok: return "ok";
    case BitstreamScanStatus::OutputTruncated: return "output_truncated";
    case BitstreamScanStatus::Unsupported: return "unsupported";
    case BitstreamScanStatus::Malformed: return "malformed";
    case BitstreamScanStatus::LimitExceeded: return "limit_exceeded";
    }
    return "unknown";
}

}  // namespace tagprobe
