#include "tagprobe/icc_decode.h"

#include "tagprobe/byte_reader.h"
#include "tagprobe/text_decode.h"

#include <utility>

namespace tagprobe {
namespace {

    static constexpr uint64_t kTagTableOffset = 128;
    static constexpr uint64_t kTagEntrySize   = 12;
    // Tag type signature plus 4 reserved bytes.
    static constexpr uint64_t kTagTypeHeader = 8;

    static bool read_u16be(std::span<const std::byte> bytes, uint64_t offset,
                           uint16_t* out) noexcept
    {
        return read_u16(bytes, offset, Endian::Big, out);
    }

    static bool read_u32be(std::span<const std::byte> bytes, uint64_t offset,
                           uint32_t* out) noexcept
    {
        return read_u32(bytes, offset, Endian::Big, out);
    }

    static bool read_s15fixed16(std::span<const std::byte> bytes,
                                uint64_t offset, double* out) noexcept
    {
        int32_t v = 0;
        if (!read_i32(bytes, offset, Endian::Big, &v)) {
            return false;
        }
        *out = static_cast<double>(v) / 65536.0;
        return true;
    }

    static bool read_u16fixed16(std::span<const std::byte> bytes,
                                uint64_t offset, double* out) noexcept
    {
        uint32_t v = 0;
        if (!read_u32be(bytes, offset, &v)) {
            return false;
        }
        *out = static_cast<double>(v) / 65536.0;
        return true;
    }


    // Reads an ASCII run up to the first NUL.
    static void read_ascii(std::span<const std::byte> bytes,
                           std::string* out)
    {
        size_t term      = 0;
        const size_t len = find_text_terminator(bytes, TextEncoding::Ascii,
                                                &term);
        (void)decode_text_to_utf8(bytes.first(len), TextEncoding::Ascii, out);
    }


    static IccTagType tag_type_for(uint32_t type_sig) noexcept
    {
        switch (type_sig) {
        case fourcc('d', 'e', 's', 'c'): return IccTagType::Desc;
        case fourcc('t', 'e', 'x', 't'): return IccTagType::Text;
        case fourcc('m', 'l', 'u', 'c'): return IccTagType::Mluc;
        case fourcc('X', 'Y', 'Z', ' '): return IccTagType::Xyz;
        case fourcc('s', 'f', '3', '2'): return IccTagType::Sf32;
        case fourcc('u', 'f', '3', '2'): return IccTagType::Uf32;
        case fourcc('u', 'i', '0', '8'): return IccTagType::Ui08;
        case fourcc('u', 'i', '1', '6'): return IccTagType::Ui16;
        case fourcc('u', 'i', '3', '2'): return IccTagType::Ui32;
        case fourcc('u', 'i', '6', '4'): return IccTagType::Ui64;
        case fourcc('c', 'u', 'r', 'v'): return IccTagType::Curv;
        case fourcc('p', 'a', 'r', 'a'): return IccTagType::Para;
        case fourcc('s', 'i', 'g', ' '): return IccTagType::Sig;
        default: return IccTagType::Opaque;
        }
    }


    static bool decode_desc(std::span<const std::byte> tag, IccTag* out)
    {
        uint32_t count = 0;
        if (!read_u32be(tag, 8, &count) || !range_ok(tag, 12, count)) {
            return false;
        }
        read_ascii(tag.subspan(12, count), &out->text);
        return true;
    }


    static bool decode_mluc(std::span<const std::byte> tag, IccTag* out)
    {
        uint32_t count       = 0;
        uint32_t record_size = 0;
        if (!read_u32be(tag, 8, &count) || !read_u32be(tag, 12, &record_size)
            || record_size < 12U) {
            return false;
        }
        if (!range_ok(tag, 16, static_cast<uint64_t>(count) * record_size)) {
            return false;
        }
        for (uint32_t i = 0; i < count; ++i) {
            const uint64_t rec = 16U + static_cast<uint64_t>(i) * record_size;
            IccLocalizedString s;
            uint32_t len = 0;
            uint32_t off = 0;
            if (!read_fixed_string(tag, rec, 2, &s.language)
                || !read_fixed_string(tag, rec + 2, 2, &s.country)
                || !read_u32be(tag, rec + 4, &len)
                || !read_u32be(tag, rec + 8, &off) || !range_ok(tag, off, len)) {
                return false;
            }
            (void)decode_text_to_utf8(tag.subspan(off, len),
                                      TextEncoding::Utf16BE, &s.text);
            out->localized.push_back(std::move(s));
        }
        if (!out->localized.empty()) {
            out->text = out->localized.front().text;
        }
        return true;
    }


    static bool decode_fixed_array(std::span<const std::byte> tag,
                                   bool is_signed, uint32_t group,
                                   IccTag* out)
    {
        const uint64_t count = (tag.size() - kTagTypeHeader) / 4U;
        if (count % group != 0U) {
            return false;
        }
        out->numbers.reserve(static_cast<size_t>(count));
        for (uint64_t i = 0; i < count; ++i) {
            double v = 0.0;
            const uint64_t off = kTagTypeHeader + i * 4U;
            const bool ok = is_signed ? read_s15fixed16(tag, off, &v)
                                      : read_u16fixed16(tag, off, &v);
            if (!ok) {
                return false;
            }
            out->numbers.push_back(v);
        }
        return true;
    }


    static bool decode_uint_array(std::span<const std::byte> tag,
                                  uint32_t width, IccTag* out)
    {
        const uint64_t payload = tag.size() - kTagTypeHeader;
        if (payload % width != 0U) {
            return false;
        }
        const uint64_t count = payload / width;
        out->integers.reserve(static_cast<size_t>(count));
        for (uint64_t i = 0; i < count; ++i) {
            uint64_t v = 0;
            if (!read_uint_be(tag, kTagTypeHeader + i * width, width, &v)) {
                return false;
            }
            out->integers.push_back(v);
        }
        return true;
    }


    static bool decode_curv(std::span<const std::byte> tag, IccTag* out)
    {
        uint32_t count = 0;
        if (!read_u32be(tag, 8, &count)
            || !range_ok(tag, 12, static_cast<uint64_t>(count) * 2U)) {
            return false;
        }
        if (count == 1U) {
            // u8Fixed8Number gamma.
            uint16_t g = 0;
            (void)read_u16be(tag, 12, &g);
            out->numbers.push_back(static_cast<double>(g) / 256.0);
            return true;
        }
        out->integers.reserve(count);
        for (uint32_t i = 0; i < count; ++i) {
            uint16_t v = 0;
            (void)read_u16be(tag, 12U + static_cast<uint64_t>(i) * 2U, &v);
            out->integers.push_back(v);
        }
        return true;
    }


    static bool decode_para(std::span<const std::byte> tag, IccTag* out)
    {
        static constexpr uint32_t kParamCount[] = { 1, 3, 4, 5, 7 };
        if (!read_u16be(tag, 8, &out->function_type)
            || out->function_type > 4U) {
            return false;
        }
        const uint32_t n = kParamCount[out->function_type];
        for (uint32_t i = 0; i < n; ++i) {
            double v = 0.0;
            if (!read_s15fixed16(tag, 12U + i * 4U, &v)) {
                return false;
            }
            out->numbers.push_back(v);
        }
        return true;
    }


    static bool decode_tag_payload(std::span<const std::byte> tag,
                                   IccTag* out)
    {
        switch (out->type) {
        case IccTagType::Desc: return decode_desc(tag, out);
        case IccTagType::Text:
            read_ascii(tag.subspan(kTagTypeHeader), &out->text);
            return true;
        case IccTagType::Mluc: return decode_mluc(tag, out);
        case IccTagType::Xyz: return decode_fixed_array(tag, true, 3, out);
        case IccTagType::Sf32: return decode_fixed_array(tag, true, 1, out);
        case IccTagType::Uf32: return decode_fixed_array(tag, false, 1, out);
        case IccTagType::Ui08: return decode_uint_array(tag, 1, out);
        case IccTagType::Ui16: return decode_uint_array(tag, 2, out);
        case IccTagType::Ui32: return decode_uint_array(tag, 4, out);
        case IccTagType::Ui64: return decode_uint_array(tag, 8, out);
        case IccTagType::Curv: return decode_curv(tag, out);
        case IccTagType::Para: return decode_para(tag, out);
        case IccTagType::Sig: {
            uint32_t sig = 0;
            if (!read_u32be(tag, 8, &sig)) {
                return false;
            }
            out->integers.push_back(sig);
            out->text = fourcc_to_string(sig);
            return true;
        }
        case IccTagType::Opaque: return true;
        }
        return true;
    }


    static void decode_header(std::span<const std::byte> bytes, IccHeader* h)
    {
        (void)read_u32be(bytes, 0, &h->declared_size);
        (void)read_u32be(bytes, 4, &h->cmm);
        (void)read_u32be(bytes, 8, &h->version);
        h->version_major  = static_cast<uint8_t>(h->version >> 24);
        h->version_minor  = static_cast<uint8_t>((h->version >> 20) & 0x0FU);
        h->version_bugfix = static_cast<uint8_t>((h->version >> 16) & 0x0FU);
        (void)read_u32be(bytes, 12, &h->device_class);
        (void)read_u32be(bytes, 16, &h->color_space);
        (void)read_u32be(bytes, 20, &h->connection_space);

        uint16_t dt[6] = {};
        for (uint32_t i = 0; i < 6; ++i) {
            (void)read_u16be(bytes, 24 + i * 2, &dt[i]);
        }
        h->created = IccDateTime { dt[0], dt[1], dt[2], dt[3], dt[4], dt[5] };

        (void)read_u32be(bytes, 40, &h->platform);
        (void)read_u32be(bytes, 44, &h->flags);
        (void)read_u32be(bytes, 48, &h->manufacturer);
        (void)read_u32be(bytes, 52, &h->model);
        (void)read_u64(bytes, 56, Endian::Big, &h->attributes);
        (void)read_u32be(bytes, 64, &h->rendering_intent);
        (void)read_s15fixed16(bytes, 68, &h->illuminant.x);
        (void)read_s15fixed16(bytes, 72, &h->illuminant.y);
        (void)read_s15fixed16(bytes, 76, &h->illuminant.z);
        (void)read_u32be(bytes, 80, &h->creator);
        for (size_t i = 0; i < h->profile_id.size(); ++i) {
            h->profile_id[i] = static_cast<uint8_t>(bytes[84 + i]);
        }

        h->cmm_sig              = fourcc_to_string(h->cmm);
        h->device_class_sig     = fourcc_to_string(h->device_class);
        h->color_space_sig      = fourcc_to_string(h->color_space);
        h->connection_space_sig = fourcc_to_string(h->connection_space);
        h->platform_sig         = fourcc_to_string(h->platform);
        h->manufacturer_sig     = fourcc_to_string(h->manufacturer);
        h->creator_sig          = fourcc_to_string(h->creator);
    }

}  // namespace

bool
detect_icc_profile(std::span<const std::byte> bytes) noexcept
{
    return bytes.size() >= kIccHeaderSize && match_bytes(bytes, 36, "acsp");
}


IccDecodeResult
decode_icc_profile(std::span<const std::byte> icc_bytes,
                   const IccDecodeOptions& options)
{
    IccDecodeResult result;
    if (!detect_icc_profile(icc_bytes)) {
        result.status = DecodeStatus::NotThisFormat;
        return result;
    }

    IccProfile& profile = result.record;
    decode_header(icc_bytes, &profile.header);

    const uint32_t declared_size = profile.header.declared_size;
    if (declared_size > icc_bytes.size()) {
        add_anomaly(&result, AnomalyKind::OutOfBounds, 0,
                    "declared profile size exceeds the buffer");
    } else if (declared_size != icc_bytes.size()) {
        add_anomaly(&result, AnomalyKind::MalformedStructure, 0,
                    "declared profile size disagrees with the buffer");
    }

    uint32_t tag_count = 0;
    if (!read_u32be(icc_bytes, kTagTableOffset, &tag_count)) {
        add_anomaly(&result, AnomalyKind::TruncatedInput, kTagTableOffset,
                    "tag count is cut off");
        return result;
    }

    const IccDecodeLimits& limits = options.limits;
    if (tag_count > limits.max_tags) {
        add_anomaly(&result, AnomalyKind::LimitExceeded, kTagTableOffset,
                    "tag count exceeds max_tags");
        tag_count = limits.max_tags;
    }

    const uint64_t table_room = (icc_bytes.size() - kTagTableOffset - 4U)
                                / kTagEntrySize;
    if (tag_count > table_room) {
        add_anomaly(&result, AnomalyKind::TruncatedInput,
                    kTagTableOffset + 4U + table_room * kTagEntrySize,
                    "tag table is cut off");
        tag_count = static_cast<uint32_t>(table_room);
    }

    profile.tag_table.reserve(tag_count);
    uint64_t total_tag_bytes = 0;
    for (uint32_t i = 0; i < tag_count; ++i) {
        const uint64_t eoff = kTagTableOffset + 4U
                              + static_cast<uint64_t>(i) * kTagEntrySize;
        IccTagEntry entry;
        (void)read_u32be(icc_bytes, eoff + 0, &entry.signature);
        (void)read_u32be(icc_bytes, eoff + 4, &entry.offset);
        (void)read_u32be(icc_bytes, eoff + 8, &entry.size);
        entry.signature_sig = fourcc_to_string(entry.signature);
        entry.in_bounds     = range_ok(icc_bytes, entry.offset, entry.size);
        profile.tag_table.push_back(entry);

        if (!entry.in_bounds) {
            add_anomaly(&result, AnomalyKind::OutOfBounds, eoff,
                        "tag offset and size exceed the buffer");
            continue;
        }
        if (entry.size > limits.max_tag_bytes) {
            add_anomaly(&result, AnomalyKind::LimitExceeded, eoff,
                        "tag size exceeds max_tag_bytes");
            continue;
        }
        total_tag_bytes += entry.size;
        if (limits.max_total_tag_bytes != 0U
            && total_tag_bytes > limits.max_total_tag_bytes) {
            add_anomaly(&result, AnomalyKind::LimitExceeded, eoff,
                        "tag bytes exceed max_total_tag_bytes");
            continue;
        }

        IccTag tag;
        tag.signature     = entry.signature;
        tag.signature_sig = entry.signature_sig;
        tag.offset        = entry.offset;
        tag.size          = entry.size;

        const std::span<const std::byte> tag_bytes
            = icc_bytes.subspan(entry.offset, entry.size);
        if (tag_bytes.size() < kTagTypeHeader) {
            add_anomaly(&result, AnomalyKind::MalformedStructure, entry.offset,
                        "tag is shorter than its type header");
            profile.tags.push_back(std::move(tag));
            continue;
        }
        (void)read_u32be(tag_bytes, 0, &tag.type_signature);
        tag.type_sig = fourcc_to_string(tag.type_signature);
        tag.type     = tag_type_for(tag.type_signature);

        if (!decode_tag_payload(tag_bytes, &tag)) {
            add_anomaly(&result, AnomalyKind::MalformedStructure, entry.offset,
                        "tag payload does not match its type layout");
            tag.type = IccTagType::Opaque;
            tag.text.clear();
            tag.localized.clear();
            tag.numbers.clear();
            tag.integers.clear();
        }
        profile.tags.push_back(std::move(tag));
    }

    return result;
}


const IccTag*
find_icc_tag(const IccProfile& profile, uint32_t signature) noexcept
{
    for (size_t i = 0; i < profile.tags.size(); ++i) {
        if (profile.tags[i].signature == signature) {
            return &profile.tags[i];
        }
    }
    return nullptr;
}


const char*
icc_device_class_name(uint32_t device_class) noexcept
{
    switch (device_class) {
    case fourcc('s', 'c', 'n', 'r'): return "input device";
    case fourcc('m', 'n', 't', 'r'): return "display device";
    case fourcc('p', 'r', 't', 'r'): return "output device";
    case fourcc('l', 'i', 'n', 'k'): return "device link";
    case fourcc('s', 'p', 'a', 'c'): return "color space";
    case fourcc('a', 'b', 's', 't'): return "abstract";
    case fourcc('n', 'm', 'c', 'l'): return "named color";
    default: return "unknown";
    }
}


const char*
icc_color_space_name(uint32_t color_space) noexcept
{
    switch (color_space) {
    case fourcc('X', 'Y', 'Z', ' '): return "XYZ";
    case fourcc('L', 'a', 'b', ' '): return "CIELAB";
    case fourcc('L', 'u', 'v', ' '): return "CIELUV";
    case fourcc('Y', 'C', 'b', 'r'): return "YCbCr";
    case fourcc('Y', 'x', 'y', ' '): return "CIEYxy";
    case fourcc('R', 'G', 'B', ' '): return "RGB";
    case fourcc('G', 'R', 'A', 'Y'): return "gray";
    case fourcc('H', 'S', 'V', ' '): return "HSV";
    case fourcc('H', 'L', 'S', ' '): return "HLS";
    case fourcc('C', 'M', 'Y', 'K'): return "CMYK";
    case fourcc('C', 'M', 'Y', ' '): return "CMY";
    default: break;
    }
    // 2CLR..FCLR: N-component color spaces.
    if ((color_space & 0x00FFFFFFU) == fourcc('\0', 'C', 'L', 'R')) {
        const char n = static_cast<char>(color_space >> 24);
        if ((n >= '2' && n <= '9') || (n >= 'A' && n <= 'F')) {
            return "multi-component";
        }
    }
    return "unknown";
}


const char*
icc_platform_name(uint32_t platform) noexcept
{
    switch (platform) {
    case 0: return "unspecified";
    case fourcc('A', 'P', 'P', 'L'): return "Apple";
    case fourcc('M', 'S', 'F', 'T'): return "Microsoft";
    case fourcc('S', 'G', 'I', ' '): return "Silicon Graphics";
    case fourcc('S', 'U', 'N', 'W'): return "Sun Microsystems";
    case fourcc('T', 'G', 'N', 'T'): return "Taligent";
    default: return "unknown";
    }
}


const char*
icc_rendering_intent_name(uint32_t intent) noexcept
{
    switch (intent) {
    case 0: return "perceptual";
    case 1: return "media-relative colorimetric";
    case 2: return "saturation";
    case 3: return "ICC-absolute colorimetric";
    default: return "unknown";
    }
}


const char*
icc_tag_type_name(IccTagType type) noexcept
{
    switch (type) {
    case IccTagType::Desc: return "desc";
    case IccTagType::Text: return "text";
    case IccTagType::Mluc: return "mluc";
    case IccTagType::Xyz: return "XYZ";
    case IccTagType::Sf32: return "sf32";
    case IccTagType::Uf32: return "uf32";
    case IccTagType::Ui08: return "ui08";
    case IccTagType::Ui16: return "ui16";
    case IccTagType::Ui32: return "ui32";
    case IccTagType::Ui64: return "ui64";
    case IccTagType::Curv: return "curv";
    case IccTagType::Para: return "para";
    case IccTagType::Sig: return "sig";
    case IccTagType::Opaque: return "opaque";
    }
    return "unknown";
}

}  // namespace tagprobe
