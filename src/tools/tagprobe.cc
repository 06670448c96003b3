#include "tagprobe/adts_decode.h"
#include "tagprobe/ape_tag_decode.h"
#include "tagprobe/av1_obu_decode.h"
#include "tagprobe/avc_nal_decode.h"
#include "tagprobe/bext_decode.h"
#include "tagprobe/bitstream_scan.h"
#include "tagprobe/build_info.h"
#include "tagprobe/byte_reader.h"
#include "tagprobe/console_format.h"
#include "tagprobe/hevc_nal_decode.h"
#include "tagprobe/icc_decode.h"
#include "tagprobe/id3v1_decode.h"
#include "tagprobe/id3v2_decode.h"
#include "tagprobe/resource_policy.h"

#include <array>
#include <cerrno>
#include <cstddef>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace tagprobe {
namespace {

    struct FileCloser final {
        void operator()(std::FILE* f) const noexcept
        {
            if (f) {
                (void)std::fclose(f);
            }
        }
    };

    using FileHandle = std::unique_ptr<std::FILE, FileCloser>;

    // Reads all of `path` in fixed-size chunks so pipes and character
    // devices work too. The cap is enforced while reading; errors are
    // reported on stderr with the `tagprobe:` prefix.
    static bool load_input(const char* path, uint64_t max_file_bytes,
                           std::vector<std::byte>* out)
    {
        out->clear();
        errno = 0;
        FileHandle f(std::fopen(path, "rb"));
        if (!f) {
            std::fprintf(stderr, "tagprobe: cannot open `%s`: %s\n", path,
                         std::strerror(errno));
            return false;
        }

        std::array<std::byte, 65536> chunk {};
        for (;;) {
            const size_t got = std::fread(chunk.data(), 1, chunk.size(),
                                          f.get());
            if (max_file_bytes != 0U
                && static_cast<uint64_t>(out->size()) + got > max_file_bytes) {
                std::fprintf(stderr,
                             "tagprobe: `%s` is larger than "
                             "--max-file-bytes=%llu, skipped\n",
                             path,
                             static_cast<unsigned long long>(max_file_bytes));
                out->clear();
                return false;
            }
            out->insert(out->end(), chunk.begin(),
                        chunk.begin() + static_cast<std::ptrdiff_t>(got));
            if (got < chunk.size()) {
                break;
            }
        }
        if (std::ferror(f.get())) {
            std::fprintf(stderr, "tagprobe: read error on `%s`\n", path);
            out->clear();
            return false;
        }
        return true;
    }

    // Decimal digits only; signs and leading blanks are rejected.
    static bool parse_u64_arg(const char* s, uint64_t* out)
    {
        if (!s || *s < '0' || *s > '9') {
            return false;
        }
        errno                = 0;
        char* end            = nullptr;
        unsigned long long v = std::strtoull(s, &end, 10);
        if (errno == ERANGE || !end || *end != '\0') {
            return false;
        }
        *out = static_cast<uint64_t>(v);
        return true;
    }

    static bool parse_u32_arg(const char* s, uint32_t* out)
    {
        uint64_t v = 0;
        if (!parse_u64_arg(s, &v) || v > 0xFFFFFFFFULL) {
            return false;
        }
        *out = static_cast<uint32_t>(v);
        return true;
    }

    // Escapes untrusted decoded text for the terminal.
    static std::string printable(std::string_view s, uint32_t max_bytes)
    {
        std::string out;
        if (append_console_escaped_utf8(s, max_bytes, &out)) {
            out.insert(0, "(DANGEROUS) ");
        }
        return out;
    }

    static std::string hex(std::span<const std::byte> bytes,
                           uint32_t max_bytes)
    {
        std::string out;
        append_hex_bytes(bytes, max_bytes, &out);
        return out;
    }

    static void print_anomalies(const std::vector<Anomaly>& anomalies)
    {
        for (size_t i = 0; i < anomalies.size(); ++i) {
            const Anomaly& a = anomalies[i];
            std::printf("  anomaly[%zu] kind=%s offset=%llu detail=%.*s\n", i,
                        anomaly_kind_name(a.kind),
                        static_cast<unsigned long long>(a.offset),
                        static_cast<int>(a.detail.size()), a.detail.data());
        }
    }

    static void print_values(const char* label,
                             const std::vector<std::string>& values,
                             uint32_t max_bytes)
    {
        for (size_t i = 0; i < values.size(); ++i) {
            std::printf("    %s[%zu]=\"%s\"\n", label, i,
                        printable(values[i], max_bytes).c_str());
        }
    }


    static void print_id3v2(const Id3v2DecodeResult& r, uint32_t max_bytes)
    {
        const Id3v2Tag& tag = r.record;
        std::printf(
            "-- id3v2 status=%s version=2.%u.%u flags=0x%02X size=%u frames=%zu padding=%llu\n",
            decode_status_name(r.status),
            static_cast<unsigned>(tag.header.major_version),
            static_cast<unsigned>(tag.header.revision),
            static_cast<unsigned>(tag.header.flags), tag.header.tag_size,
            tag.frames.size(),
            static_cast<unsigned long long>(tag.padding_size));
        for (size_t i = 0; i < tag.frames.size(); ++i) {
            const Id3v2Frame& f = tag.frames[i];
            std::printf("  frame[%zu] id=%s kind=%s offset=%llu size=%u", i,
                        printable(f.id, 8).c_str(),
                        id3v2_frame_kind_name(f.kind),
                        static_cast<unsigned long long>(f.offset),
                        f.declared_size);
            if (f.compressed) {
                std::printf(" compressed");
            }
            if (f.encrypted) {
                std::printf(" encrypted");
            }
            if (f.unsynchronised) {
                std::printf(" unsync");
            }
            std::printf("\n");

            switch (f.kind) {
            case Id3v2FrameKind::Text:
            case Id3v2FrameKind::Url:
                print_values("value", f.values, max_bytes);
                break;
            case Id3v2FrameKind::UserText:
            case Id3v2FrameKind::UserUrl:
                std::printf("    description=\"%s\"\n",
                            printable(f.description, max_bytes).c_str());
                print_values("value", f.values, max_bytes);
                break;
            case Id3v2FrameKind::Comment:
                std::printf("    language=%s description=\"%s\"\n",
                            printable(f.language, 8).c_str(),
                            printable(f.description, max_bytes).c_str());
                print_values("text", f.values, max_bytes);
                break;
            case Id3v2FrameKind::Picture: {
                const std::span<const std::byte> image = id3v2_picture_bytes(
                    f);
                std::printf(
                    "    mime=\"%s\" type=%u description=\"%s\" bytes=%zu\n",
                    printable(f.mime_type, max_bytes).c_str(),
                    static_cast<unsigned>(f.picture_type),
                    printable(f.description, max_bytes).c_str(),
                    image.size());
                break;
            }
            case Id3v2FrameKind::Binary:
                std::printf("    hex=%s\n", hex(f.payload, max_bytes).c_str());
                break;
            }
        }
        print_anomalies(r.anomalies);
    }


    static void print_id3v1(const Id3v1DecodeResult& r, uint32_t max_bytes)
    {
        const Id3v1Tag& tag = r.record;
        std::printf("-- id3v1 status=%s offset=%llu version=%s\n",
                    decode_status_name(r.status),
                    static_cast<unsigned long long>(tag.offset),
                    tag.is_v1_1 ? "1.1" : "1.0");
        std::printf("  title=\"%s\"\n", printable(tag.title, max_bytes).c_str());
        std::printf("  artist=\"%s\"\n",
                    printable(tag.artist, max_bytes).c_str());
        std::printf("  album=\"%s\"\n", printable(tag.album, max_bytes).c_str());
        std::printf("  year=\"%s\"\n", printable(tag.year, max_bytes).c_str());
        std::printf("  comment=\"%s\"\n",
                    printable(tag.comment, max_bytes).c_str());
        if (tag.is_v1_1) {
            std::printf("  track=%u\n", static_cast<unsigned>(tag.track));
        }
        std::printf("  genre=%u (%.*s)\n", static_cast<unsigned>(tag.genre),
                    static_cast<int>(tag.genre_name.size()),
                    tag.genre_name.data());
        print_anomalies(r.anomalies);
    }


    static void print_ape(const ApeTagDecodeResult& r, uint32_t max_bytes)
    {
        const ApeTag& tag = r.record;
        std::printf(
            "-- ape status=%s version=%u offset=%llu size=%u items=%zu%s\n",
            decode_status_name(r.status), tag.block.version,
            static_cast<unsigned long long>(tag.tag_offset),
            tag.block.tag_size, tag.items.size(),
            tag.block.read_only ? " read_only" : "");
        for (size_t i = 0; i < tag.items.size(); ++i) {
            const ApeItem& item = tag.items[i];
            std::printf("  item[%zu] key=\"%s\" kind=%s\n", i,
                        printable(item.key, 256).c_str(),
                        ape_item_kind_name(item.kind));
            if (item.kind == ApeItemKind::Binary
                || item.kind == ApeItemKind::Reserved) {
                std::printf("    hex=%s\n",
                            hex(item.value, max_bytes).c_str());
            } else {
                print_values("value", item.values, max_bytes);
            }
        }
        print_anomalies(r.anomalies);
    }


    static void print_bext(const BextDecodeResult& r, uint32_t max_bytes)
    {
        const BextChunk& b = r.record;
        std::printf("-- bext status=%s offset=%llu size=%u version=%u\n",
                    decode_status_name(r.status),
                    static_cast<unsigned long long>(b.offset), b.declared_size,
                    static_cast<unsigned>(b.version));
        std::printf("  description=\"%s\"\n",
                    printable(b.description, max_bytes).c_str());
        std::printf("  originator=\"%s\"\n",
                    printable(b.originator, max_bytes).c_str());
        std::printf("  originator_reference=\"%s\"\n",
                    printable(b.originator_reference, max_bytes).c_str());
        std::printf("  origination=\"%s %s\"\n",
                    printable(b.origination_date, 16).c_str(),
                    printable(b.origination_time, 16).c_str());
        std::printf("  time_reference=%llu\n",
                    static_cast<unsigned long long>(b.time_reference));
        if (b.has_umid) {
            std::printf("  umid=%s\n",
                        hex(std::as_bytes(std::span<const uint8_t>(b.umid)),
                            64)
                            .c_str());
        }
        if (b.has_loudness) {
            std::printf(
                "  loudness=%.2f range=%.2f true_peak=%.2f momentary=%.2f short_term=%.2f\n",
                bext_loudness_to_double(b.loudness_value),
                bext_loudness_to_double(b.loudness_range),
                bext_loudness_to_double(b.max_true_peak_level),
                bext_loudness_to_double(b.max_momentary_loudness),
                bext_loudness_to_double(b.max_short_term_loudness));
        }
        if (!b.coding_history.empty()) {
            std::printf("  coding_history=\"%s\"\n",
                        printable(b.coding_history, max_bytes).c_str());
        }
        print_anomalies(r.anomalies);
    }


    static void print_adts(const AdtsScanResult& r, uint64_t base)
    {
        const AdtsStreamInfo& s = r.record;
        const AdtsHeader& h     = s.first;
        std::printf(
            "-- adts status=%s offset=%llu mpeg=%d profile=%s rate=%u channels=%u crc=%s\n",
            decode_status_name(r.status),
            static_cast<unsigned long long>(base + h.offset),
            h.id ? 2 : 4, adts_profile_name(h.profile), h.sample_rate,
            static_cast<unsigned>(h.channel_count),
            h.has_crc ? "yes" : "no");
        std::printf(
            "  frames=%llu samples=%llu bytes=%llu duration=%.3fs bitrate=%.0f%s\n",
            static_cast<unsigned long long>(s.frame_count),
            static_cast<unsigned long long>(s.total_samples),
            static_cast<unsigned long long>(s.stream_bytes),
            s.duration_seconds, s.average_bitrate,
            s.constant_configuration ? "" : " variable_configuration");
        print_anomalies(r.anomalies);
    }


    static void print_icc(const IccDecodeResult& r, uint32_t max_bytes)
    {
        const IccHeader& h = r.record.header;
        std::printf(
            "-- icc status=%s size=%u version=%u.%u.%u class=%s (%s) space=%s (%s) pcs=%s\n",
            decode_status_name(r.status), h.declared_size,
            static_cast<unsigned>(h.version_major),
            static_cast<unsigned>(h.version_minor),
            static_cast<unsigned>(h.version_bugfix),
            printable(h.device_class_sig, 8).c_str(),
            icc_device_class_name(h.device_class),
            printable(h.color_space_sig, 8).c_str(),
            icc_color_space_name(h.color_space),
            printable(h.connection_space_sig, 8).c_str());
        std::printf(
            "  created=%04u-%02u-%02u %02u:%02u:%02u platform=%s intent=%s\n",
            static_cast<unsigned>(h.created.year),
            static_cast<unsigned>(h.created.month),
            static_cast<unsigned>(h.created.day),
            static_cast<unsigned>(h.created.hour),
            static_cast<unsigned>(h.created.minute),
            static_cast<unsigned>(h.created.second),
            icc_platform_name(h.platform),
            icc_rendering_intent_name(h.rendering_intent));
        std::printf("  tag_table=%zu tags=%zu\n", r.record.tag_table.size(),
                    r.record.tags.size());
        for (size_t i = 0; i < r.record.tags.size(); ++i) {
            const IccTag& t = r.record.tags[i];
            std::printf("  tag[%zu] sig=%s type=%s (%s) offset=%u size=%u", i,
                        printable(t.signature_sig, 8).c_str(),
                        printable(t.type_sig, 8).c_str(),
                        icc_tag_type_name(t.type), t.offset, t.size);
            if (!t.text.empty()) {
                std::printf(" text=\"%s\"",
                            printable(t.text, max_bytes).c_str());
            }
            if (!t.numbers.empty()) {
                std::printf(" numbers=%zu first=%.6f", t.numbers.size(),
                            t.numbers[0]);
            }
            if (!t.integers.empty()) {
                std::printf(" integers=%zu", t.integers.size());
            }
            std::printf("\n");
        }
        print_anomalies(r.anomalies);
    }


    static void print_annexb(std::span<const std::byte> bytes,
                             const BitstreamScanOptions& options)
    {
        std::vector<AnnexBUnitRef> units(256);
        BitstreamScanResult res;
        for (;;) {
            res = scan_annexb_units(bytes, units, options);
            if (res.status == BitstreamScanStatus::OutputTruncated
                && res.needed > units.size()) {
                units.resize(res.needed);
                continue;
            }
            break;
        }
        std::printf("-- annexb status=%s units=%u\n",
                    bitstream_scan_status_name(res.status), res.written);

        // H.264 and H.265 share the start-code layout; a unit decodes under
        // both and the reader picks the codec from the names.
        for (uint32_t i = 0; i < res.written; ++i) {
            const AnnexBUnitRef& u = units[i];
            const std::span<const std::byte> unit = bytes.subspan(
                static_cast<size_t>(u.offset), static_cast<size_t>(u.size));
            const AvcNalDecodeResult avc = decode_avc_nal_header(unit);
            std::printf("  unit[%u] offset=%llu size=%llu avc=%u (%.*s)", i,
                        static_cast<unsigned long long>(u.offset),
                        static_cast<unsigned long long>(u.size),
                        static_cast<unsigned>(avc.record.nal_unit_type),
                        static_cast<int>(avc.record.type_name.size()),
                        avc.record.type_name.data());
            if (avc.record.has_profile_level) {
                std::printf(" profile=%.*s level=%s",
                            static_cast<int>(avc.record.profile_name.size()),
                            avc.record.profile_name.data(),
                            avc.record.level_name.c_str());
            }
            const HevcNalDecodeResult hevc = decode_hevc_nal_header(unit);
            if (hevc.status != DecodeStatus::NotThisFormat) {
                std::printf(" hevc=%u (%.*s) layer=%u tid=%u",
                            static_cast<unsigned>(hevc.record.nal_unit_type),
                            static_cast<int>(hevc.record.type_name.size()),
                            hevc.record.type_name.data(),
                            static_cast<unsigned>(hevc.record.nuh_layer_id),
                            static_cast<unsigned>(hevc.record.temporal_id));
            }
            std::printf("\n");
        }
    }


    static bool print_av1(std::span<const std::byte> bytes,
                          const BitstreamScanOptions& options)
    {
        std::vector<Av1ObuRef> obus(256);
        BitstreamScanResult res;
        for (;;) {
            res = scan_av1_obus(bytes, obus, options);
            if (res.status == BitstreamScanStatus::OutputTruncated
                && res.needed > obus.size()) {
                obus.resize(res.needed);
                continue;
            }
            break;
        }
        // Most byte patterns pass the one-byte OBU check; only report
        // streams that open with a temporal delimiter or sequence header.
        if (res.written == 0
            || (obus[0].obu_type != 1U && obus[0].obu_type != 2U)) {
            return false;
        }
        std::printf("-- av1 status=%s obus=%u\n",
                    bitstream_scan_status_name(res.status), res.written);
        for (uint32_t i = 0; i < res.written; ++i) {
            const Av1ObuRef& o = obus[i];
            const Av1ObuDecodeResult h = decode_av1_obu(
                bytes.subspan(static_cast<size_t>(o.offset)));
            std::printf("  obu[%u] offset=%llu size=%llu type=%u (%.*s)", i,
                        static_cast<unsigned long long>(o.offset),
                        static_cast<unsigned long long>(o.size),
                        static_cast<unsigned>(o.obu_type),
                        static_cast<int>(h.record.type_name.size()),
                        h.record.type_name.data());
            if (h.record.extension_flag) {
                std::printf(" temporal_id=%u spatial_id=%u",
                            static_cast<unsigned>(h.record.temporal_id),
                            static_cast<unsigned>(h.record.spatial_id));
            }
            std::printf("\n");
        }
        return true;
    }


    static void probe_file(std::span<const std::byte> bytes,
                           const TagProbeResourcePolicy& policy,
                           uint32_t max_bytes)
    {
        Id3v2DecodeOptions id3v2_options;
        ApeTagDecodeOptions ape_options;
        IccDecodeOptions icc_options;
        AdtsScanOptions adts_options;
        BitstreamScanOptions bitstream_options;
        apply_resource_policy(policy, &id3v2_options, &ape_options);
        apply_resource_policy(policy, &icc_options);
        apply_resource_policy(policy, &adts_options, &bitstream_options);

        bool matched = false;

        // Audio elementary streams often follow a leading ID3v2 tag.
        uint64_t audio_start = 0;
        if (detect_id3v2(bytes)) {
            const Id3v2DecodeResult r = decode_id3v2(bytes, id3v2_options);
            print_id3v2(r, max_bytes);
            audio_start = r.record.tag_end;
            matched     = true;
        }
        if (detect_id3v1(bytes)) {
            print_id3v1(decode_id3v1(bytes), max_bytes);
            matched = true;
        }
        if (detect_ape_tag(bytes)) {
            print_ape(decode_ape_tag(bytes, ape_options), max_bytes);
            matched = true;
        }

        RiffChunkRef bext;
        if (find_riff_chunk(bytes, fourcc('b', 'e', 'x', 't'), &bext)) {
            print_bext(decode_bext_in_wave(bytes), max_bytes);
            matched = true;
        }

        if (audio_start < bytes.size()) {
            const std::span<const std::byte> audio = bytes.subspan(
                static_cast<size_t>(audio_start));
            if (detect_adts_header(audio)) {
                print_adts(scan_adts_stream(audio, adts_options), audio_start);
                matched = true;
            }
        }

        if (detect_icc_profile(bytes)) {
            print_icc(decode_icc_profile(bytes, icc_options), max_bytes);
            matched = true;
        }

        if (match_bytes(bytes, 0, std::string_view("\0\0\1", 3))
            || match_bytes(bytes, 0, std::string_view("\0\0\0\1", 4))) {
            print_annexb(bytes, bitstream_options);
            matched = true;
        } else if (!matched && detect_av1_obu_header(bytes)) {
            matched = print_av1(bytes, bitstream_options);
        }

        if (!matched) {
            std::printf("-- no known tag or header\n");
        }
    }

    static void usage(const char* argv0)
    {
        std::printf("usage: %s [options] <file> [file...]\n", argv0);
        std::printf("options:\n");
        std::printf("  --version            print build info and exit\n");
        std::printf("  --no-build-info      hide build info header\n");
        std::printf(
            "  --max-bytes N        max bytes to print for text/binary values (default: 128)\n");
        std::printf(
            "  --max-file-bytes N   refuse to read files larger than N bytes (default: 536870912; 0=unlimited)\n");
        std::printf(
            "  --max-frames N       max ID3v2 frames and ADTS frames to decode\n");
        std::printf(
            "  --max-units N        max Annex-B units and AV1 OBUs to scan\n");
    }

    static void print_build_info_header()
    {
        std::string line1;
        std::string line2;
        format_build_info_lines(&line1, &line2);
        std::printf("%s\n", line1.c_str());
        std::printf("%s\n", line2.c_str());
    }

}  // namespace
}  // namespace tagprobe

int
main(int argc, char** argv)
{
    using namespace tagprobe;

    bool show_build_info = true;
    uint32_t max_bytes   = 128;
    TagProbeResourcePolicy policy;

    int first_path = 1;
    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (!arg) {
            continue;
        }
        if (std::strcmp(arg, "--help") == 0) {
            usage(argv[0]);
            return 0;
        }
        if (std::strcmp(arg, "--version") == 0) {
            print_build_info_header();
            return 0;
        }
        if (std::strcmp(arg, "--no-build-info") == 0) {
            show_build_info = false;
            first_path += 1;
            continue;
        }
        if (std::strcmp(arg, "--max-bytes") == 0 && i + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "tagprobe: invalid --max-bytes value\n");
                return 2;
            }
            max_bytes = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-file-bytes") == 0 && i + 1 < argc) {
            uint64_t v = 0;
            if (!parse_u64_arg(argv[i + 1], &v)) {
                std::fprintf(stderr,
                             "tagprobe: invalid --max-file-bytes value\n");
                return 2;
            }
            policy.max_file_bytes = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-frames") == 0 && i + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "tagprobe: invalid --max-frames value\n");
                return 2;
            }
            policy.id3v2_limits.max_frames     = v;
            policy.adts_scan_limits.max_frames = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (std::strcmp(arg, "--max-units") == 0 && i + 1 < argc) {
            uint32_t v = 0;
            if (!parse_u32_arg(argv[i + 1], &v)) {
                std::fprintf(stderr, "tagprobe: invalid --max-units value\n");
                return 2;
            }
            policy.bitstream_limits.max_units = v;
            i += 1;
            first_path += 2;
            continue;
        }
        if (arg[0] == '-' && arg[1] == '-') {
            std::fprintf(stderr, "tagprobe: unknown option `%s`\n", arg);
            usage(argv[0]);
            return 2;
        }
        break;
    }

    if (argc <= first_path) {
        usage(argv[0]);
        return 2;
    }

    if (show_build_info) {
        print_build_info_header();
    }

    int exit_code = 0;
    for (int argi = first_path; argi < argc; ++argi) {
        const char* path = argv[argi];
        if (!path || !*path) {
            continue;
        }

        std::vector<std::byte> bytes;
        if (!load_input(path, policy.max_file_bytes, &bytes)) {
            exit_code = 1;
            continue;
        }

        std::printf("== %s\n", path);
        std::printf("size=%zu\n", bytes.size());
        probe_file(bytes, policy, max_bytes);
    }
    return exit_code;
}
