#include "tagprobe/adts_decode.h"
#include "tagprobe/avc_nal_decode.h"
#include "tagprobe/bitstream_scan.h"
#include "tagprobe/hevc_nal_decode.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <span>

namespace tagprobe {

[[noreturn]] static void
fuzz_trap() noexcept
{
#if defined(__clang__) || defined(__GNUC__)
    __builtin_trap();
#else
    std::abort();
#endif
}

static void
check_annexb(std::span<const std::byte> bytes)
{
    std::array<AnnexBUnitRef, 64> units {};
    const BitstreamScanResult r = scan_annexb_units(bytes, units);
    if (r.written > units.size() || r.written > r.needed) {
        fuzz_trap();
    }
    uint64_t prev_end = 0;
    for (uint32_t i = 0; i < r.written; ++i) {
        const AnnexBUnitRef& u = units[i];
        if (u.size == 0 || u.offset < prev_end
            || u.offset + u.size > bytes.size()) {
            fuzz_trap();
        }
        prev_end = u.offset + u.size;
        const std::span<const std::byte> nal = bytes.subspan(
            static_cast<size_t>(u.offset), static_cast<size_t>(u.size));
        (void)decode_avc_nal_header(nal);
        (void)decode_hevc_nal_header(nal);
    }
}


static void
check_av1(std::span<const std::byte> bytes)
{
    std::array<Av1ObuRef, 64> obus {};
    const BitstreamScanResult r = scan_av1_obus(bytes, obus);
    if (r.written > obus.size() || r.written > r.needed) {
        fuzz_trap();
    }
    uint64_t pos = 0;
    for (uint32_t i = 0; i < r.written; ++i) {
        if (obus[i].offset != pos || obus[i].size < obus[i].header_size) {
            fuzz_trap();
        }
        pos += obus[i].size;
    }
    if (pos > bytes.size()) {
        fuzz_trap();
    }
}

}  // namespace tagprobe

extern "C" int
LLVMFuzzerTestOneInput(const uint8_t* data, size_t size)
{
    using namespace tagprobe;

    const std::span<const std::byte> bytes(reinterpret_cast<const std::byte*>(
                                               data),
                                           size);

    check_annexb(bytes);
    check_av1(bytes);

    AdtsScanOptions options;
    options.limits.max_frames = 4096;
    const AdtsScanResult adts = scan_adts_stream(bytes, options);
    if (adts.record.stream_bytes > bytes.size()) {
        fuzz_trap();
    }
    return 0;
}
