#include "tagprobe/id3v2_decode.h"

#include "tagprobe/byte_reader.h"

#include <array>
#include <utility>

#if defined(TAGPROBE_HAS_ZLIB) && TAGPROBE_HAS_ZLIB
#    include <zlib.h>
#endif

namespace tagprobe {
namespace {

    enum class InflateStatus : uint8_t {
        Ok,
        Unsupported,
        Malformed,
        LimitExceeded,
    };

    // v2.3 frame flags (status byte, then format byte).
    static constexpr uint16_t kV3Compression = 0x0080;
    static constexpr uint16_t kV3Encryption  = 0x0040;
    static constexpr uint16_t kV3Grouping    = 0x0020;

    // v2.4 frame flags.
    static constexpr uint16_t kV4Grouping         = 0x0040;
    static constexpr uint16_t kV4Compression      = 0x0008;
    static constexpr uint16_t kV4Encryption       = 0x0004;
    static constexpr uint16_t kV4Unsync           = 0x0002;
    static constexpr uint16_t kV4DataLengthIndicator = 0x0001;

#if defined(TAGPROBE_HAS_ZLIB) && TAGPROBE_HAS_ZLIB
    static InflateStatus inflate_frame(std::span<const std::byte> in,
                                       uint64_t max_out,
                                       std::vector<std::byte>* out)
    {
        out->clear();
        if (in.size() > static_cast<size_t>(0xFFFFFFFFU)) {
            return InflateStatus::LimitExceeded;
        }

        z_stream strm {};
        strm.zalloc = Z_NULL;
        strm.zfree  = Z_NULL;
        strm.opaque = Z_NULL;

        int ret = inflateInit(&strm);
        if (ret != Z_OK) {
            return InflateStatus::Malformed;
        }

        strm.next_in  = reinterpret_cast<Bytef*>(
            const_cast<std::byte*>(in.data()));
        strm.avail_in = static_cast<uInt>(in.size());

        std::array<std::byte, 16384> chunk {};
        for (;;) {
            strm.next_out  = reinterpret_cast<Bytef*>(chunk.data());
            strm.avail_out = static_cast<uInt>(chunk.size());

            ret                   = inflate(&strm, Z_NO_FLUSH);
            const size_t produced = chunk.size() - strm.avail_out;

            if (static_cast<uint64_t>(out->size()) + produced > max_out) {
                (void)inflateEnd(&strm);
                return InflateStatus::LimitExceeded;
            }
            out->insert(out->end(), chunk.begin(),
                        chunk.begin() + static_cast<std::ptrdiff_t>(produced));

            if (ret == Z_STREAM_END) {
                break;
            }
            if (ret != Z_OK) {
                (void)inflateEnd(&strm);
                return InflateStatus::Malformed;
            }
        }

        (void)inflateEnd(&strm);
        return InflateStatus::Ok;
    }
#else
    static InflateStatus inflate_frame(std::span<const std::byte> /*in*/,
                                       uint64_t /*max_out*/,
                                       std::vector<std::byte>* out)
    {
        out->clear();
        return InflateStatus::Unsupported;
    }
#endif

    // Replaces every `FF 00` pair with `FF`.
    static void remove_unsynchronisation(std::span<const std::byte> in,
                                         std::vector<std::byte>* out)
    {
        out->clear();
        out->reserve(in.size());
        for (size_t i = 0; i < in.size(); ++i) {
            out->push_back(in[i]);
            if (in[i] == std::byte { 0xFF } && i + 1 < in.size()
                && in[i + 1] == std::byte { 0x00 }) {
                i += 1;
            }
        }
    }


    static bool valid_frame_id(std::string_view id) noexcept
    {
        if (id.empty()) {
            return false;
        }
        for (size_t i = 0; i < id.size(); ++i) {
            const char c = id[i];
            if (!((c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9'))) {
                return false;
            }
        }
        return true;
    }


    static bool encoding_from_byte(uint8_t b, TextEncoding* out) noexcept
    {
        switch (b) {
        case 0: *out = TextEncoding::Latin1; return true;
        case 1: *out = TextEncoding::Utf16Bom; return true;
        case 2: *out = TextEncoding::Utf16BE; return true;
        case 3: *out = TextEncoding::Utf8; return true;
        default: return false;
        }
    }


    // Decodes one terminated string from the front of `*rest` and advances
    // past its terminator. `terminated` reports whether one was found.
    static bool take_string(std::span<const std::byte>* rest,
                            TextEncoding encoding, std::string* out,
                            bool* terminated)
    {
        size_t term_size = 0;
        const size_t len = find_text_terminator(*rest, encoding, &term_size);
        const TextDecodeStatus st = decode_text_to_utf8(rest->first(len),
                                                        encoding, out);
        *rest = rest->subspan(len + term_size);
        if (terminated) {
            *terminated = term_size != 0;
        }
        return st != TextDecodeStatus::Invalid;
    }


    static bool take_values(std::span<const std::byte> rest,
                            TextEncoding encoding,
                            std::vector<std::string>* values)
    {
        bool clean = true;
        while (!rest.empty()) {
            std::string value;
            if (!take_string(&rest, encoding, &value, nullptr)) {
                clean = false;
            }
            values->push_back(std::move(value));
        }
        // Trailing terminators and padding leave empty values behind.
        while (values->size() > 1 && values->back().empty()) {
            values->pop_back();
        }
        return clean;
    }


    enum class PayloadDecode : uint8_t {
        Ok,
        InvalidText,
        Mismatch,
    };

    static bool is_id(std::string_view id, std::string_view v22,
                      std::string_view v23) noexcept
    {
        return id == v22 || id == v23;
    }


    static PayloadDecode decode_frame_payload(Id3v2Frame* frame)
    {
        const std::span<const std::byte> payload(frame->payload.data(),
                                                 frame->payload.size());
        const std::string_view id = frame->id;

        // Plain URL frames carry Latin-1 with no encoding byte.
        if (id[0] == 'W' && !is_id(id, "WXX", "WXXX")) {
            std::span<const std::byte> rest = payload;
            std::string url;
            (void)take_string(&rest, TextEncoding::Latin1, &url, nullptr);
            frame->kind = Id3v2FrameKind::Url;
            frame->values.push_back(std::move(url));
            return PayloadDecode::Ok;
        }

        const bool is_text    = id[0] == 'T';
        const bool is_comment = is_id(id, "COM", "COMM")
                                || is_id(id, "ULT", "USLT");
        const bool is_picture = is_id(id, "PIC", "APIC");
        const bool is_user_url = is_id(id, "WXX", "WXXX");
        if (!is_text && !is_comment && !is_picture && !is_user_url) {
            return PayloadDecode::Ok;
        }

        uint8_t enc_byte = 0;
        if (!read_u8(payload, 0, &enc_byte)
            || !encoding_from_byte(enc_byte, &frame->encoding)) {
            return PayloadDecode::Mismatch;
        }
        const TextEncoding enc = frame->encoding;
        std::span<const std::byte> rest = payload.subspan(1);
        bool clean                      = true;

        if (is_user_url) {
            clean = take_string(&rest, enc, &frame->description, nullptr);
            std::string url;
            (void)take_string(&rest, TextEncoding::Latin1, &url, nullptr);
            frame->kind = Id3v2FrameKind::UserUrl;
            frame->values.push_back(std::move(url));
        } else if (is_id(id, "TXX", "TXXX")) {
            clean = take_string(&rest, enc, &frame->description, nullptr);
            clean = take_values(rest, enc, &frame->values) && clean;
            frame->kind = Id3v2FrameKind::UserText;
        } else if (is_text) {
            clean       = take_values(rest, enc, &frame->values);
            frame->kind = Id3v2FrameKind::Text;
        } else if (is_comment) {
            if (!read_fixed_string(payload, 1, 3, &frame->language)) {
                return PayloadDecode::Mismatch;
            }
            rest  = payload.subspan(4);
            clean = take_string(&rest, enc, &frame->description, nullptr);
            std::string text;
            clean = take_string(&rest, enc, &text, nullptr) && clean;
            frame->kind = Id3v2FrameKind::Comment;
            frame->values.push_back(std::move(text));
        } else {
            bool terminated = false;
            if (id.size() == 3) {
                // v2.2 `PIC` carries a 3-character image format.
                std::string format;
                if (!read_fixed_string(payload, 1, 3, &format)) {
                    return PayloadDecode::Mismatch;
                }
                frame->mime_type = format;
                rest             = payload.subspan(4);
            } else {
                if (!take_string(&rest, TextEncoding::Latin1,
                                 &frame->mime_type, &terminated)
                    || !terminated) {
                    return PayloadDecode::Mismatch;
                }
            }
            if (rest.empty()) {
                return PayloadDecode::Mismatch;
            }
            frame->picture_type = static_cast<uint8_t>(rest[0]);
            rest                = rest.subspan(1);
            clean = take_string(&rest, enc, &frame->description, &terminated);
            if (!terminated) {
                return PayloadDecode::Mismatch;
            }
            frame->picture_data_offset = static_cast<uint32_t>(
                payload.size() - rest.size());
            frame->kind = Id3v2FrameKind::Picture;
        }
        return clean ? PayloadDecode::Ok : PayloadDecode::InvalidText;
    }


    static void reset_decoded_fields(Id3v2Frame* frame)
    {
        frame->kind = Id3v2FrameKind::Binary;
        frame->values.clear();
        frame->description.clear();
        frame->language.clear();
        frame->mime_type.clear();
        frame->picture_type        = 0;
        frame->picture_data_offset = 0;
    }


    // Records the flag bits on `frame` and stores in `*extra` the number of
    // bytes the flags add in front of the frame data.
    static bool parse_frame_flags(std::span<const std::byte> body,
                                  uint8_t major, bool tag_unsync,
                                  Id3v2Frame* frame, uint64_t* extra)
    {
        uint64_t off = 0;
        if (major == 3) {
            frame->compressed = (frame->flags & kV3Compression) != 0;
            frame->encrypted  = (frame->flags & kV3Encryption) != 0;
            frame->grouped    = (frame->flags & kV3Grouping) != 0;
            if (frame->compressed) {
                if (!read_u32(body, off, Endian::Big, &frame->data_length)) {
                    return false;
                }
                off += 4;
            }
            if (frame->encrypted) {
                if (!read_u8(body, off, &frame->encryption_id)) {
                    return false;
                }
                off += 1;
            }
            if (frame->grouped) {
                if (!read_u8(body, off, &frame->group_id)) {
                    return false;
                }
                off += 1;
            }
        } else if (major == 4) {
            frame->grouped        = (frame->flags & kV4Grouping) != 0;
            frame->compressed     = (frame->flags & kV4Compression) != 0;
            frame->encrypted      = (frame->flags & kV4Encryption) != 0;
            frame->unsynchronised = (frame->flags & kV4Unsync) != 0
                                    || tag_unsync;
            if (frame->grouped) {
                if (!read_u8(body, off, &frame->group_id)) {
                    return false;
                }
                off += 1;
            }
            if (frame->encrypted) {
                if (!read_u8(body, off, &frame->encryption_id)) {
                    return false;
                }
                off += 1;
            }
            if ((frame->flags & kV4DataLengthIndicator) != 0) {
                if (!read_syncsafe_u32(body, off, &frame->data_length)) {
                    return false;
                }
                off += 4;
            }
        }
        *extra = off;
        return true;
    }


    static void decode_frame_body(std::span<const std::byte> body,
                                  uint8_t major, bool tag_unsync,
                                  const Id3v2DecodeLimits& limits,
                                  Id3v2Frame* frame,
                                  Id3v2DecodeResult* result)
    {
        uint64_t extra = 0;
        if (!parse_frame_flags(body, major, tag_unsync, frame, &extra)) {
            add_anomaly(result, AnomalyKind::MalformedStructure,
                        frame->offset,
                        "frame flags announce more bytes than the frame holds");
            return;
        }

        std::span<const std::byte> data = body.subspan(
            static_cast<size_t>(extra));
        std::vector<std::byte> desync;
        if (frame->unsynchronised) {
            remove_unsynchronisation(data, &desync);
            data = std::span<const std::byte>(desync.data(), desync.size());
        }

        if (frame->encrypted) {
            frame->payload.assign(data.begin(), data.end());
            return;
        }

        if (frame->compressed) {
            std::vector<std::byte> inflated;
            const InflateStatus st = inflate_frame(data,
                                                   limits.max_inflated_bytes,
                                                   &inflated);
            switch (st) {
            case InflateStatus::Ok: break;
            case InflateStatus::Unsupported:
                frame->payload.assign(data.begin(), data.end());
                return;
            case InflateStatus::LimitExceeded:
                add_anomaly(result, AnomalyKind::LimitExceeded, frame->offset,
                            "inflated frame exceeds max_inflated_bytes");
                frame->payload.assign(data.begin(), data.end());
                return;
            case InflateStatus::Malformed:
                add_anomaly(result, AnomalyKind::MalformedStructure,
                            frame->offset, "compressed frame does not inflate");
                frame->payload.assign(data.begin(), data.end());
                return;
            }
            if (frame->data_length != 0U
                && inflated.size() != frame->data_length) {
                add_anomaly(result, AnomalyKind::MalformedStructure,
                            frame->offset,
                            "inflated size differs from the declared size");
            }
            frame->payload = std::move(inflated);
        } else {
            frame->payload.assign(data.begin(), data.end());
        }

        switch (decode_frame_payload(frame)) {
        case PayloadDecode::Ok: break;
        case PayloadDecode::InvalidText:
            add_anomaly(result, AnomalyKind::MalformedStructure, frame->offset,
                        "frame text is not valid in its declared encoding");
            break;
        case PayloadDecode::Mismatch:
            reset_decoded_fields(frame);
            add_anomaly(result, AnomalyKind::MalformedStructure, frame->offset,
                        "frame payload does not match its frame id layout");
            break;
        }
    }


    static bool skip_extended_header(std::span<const std::byte> area,
                                     uint8_t major, uint32_t* size) noexcept
    {
        if (major == 3) {
            // The v2.3 size excludes its own 4 bytes and is 6 or 10.
            uint32_t declared = 0;
            if (!read_u32(area, 0, Endian::Big, &declared)) {
                return false;
            }
            if (declared != 6U && declared != 10U) {
                return false;
            }
            *size = declared + 4U;
        } else {
            uint32_t declared = 0;
            if (!read_syncsafe_u32(area, 0, &declared) || declared < 6U) {
                return false;
            }
            *size = declared;
        }
        return *size <= area.size();
    }

}  // namespace

bool
detect_id3v2(std::span<const std::byte> bytes) noexcept
{
    if (bytes.size() < kId3v2HeaderSize || !match_bytes(bytes, 0, "ID3")) {
        return false;
    }
    const uint8_t major = static_cast<uint8_t>(bytes[3]);
    const uint8_t rev   = static_cast<uint8_t>(bytes[4]);
    if (major < 2 || major > 4 || rev == 0xFFU) {
        return false;
    }
    return is_syncsafe(bytes, 6);
}


Id3v2DecodeResult
decode_id3v2(std::span<const std::byte> bytes,
             const Id3v2DecodeOptions& options)
{
    Id3v2DecodeResult result;
    if (!detect_id3v2(bytes)) {
        result.status = DecodeStatus::NotThisFormat;
        return result;
    }

    Id3v2Tag& tag      = result.record;
    Id3v2Header& hdr   = tag.header;
    hdr.major_version  = static_cast<uint8_t>(bytes[3]);
    hdr.revision       = static_cast<uint8_t>(bytes[4]);
    hdr.flags          = static_cast<uint8_t>(bytes[5]);
    (void)read_syncsafe_u32(bytes, 6, &hdr.tag_size);
    hdr.unsynchronisation = (hdr.flags & kId3v2Unsynchronisation) != 0;
    hdr.extended_header   = hdr.major_version >= 3
                          && (hdr.flags & kId3v2ExtendedHeader) != 0;
    hdr.experimental      = (hdr.flags & kId3v2Experimental) != 0;
    hdr.footer = hdr.major_version == 4 && (hdr.flags & kId3v2Footer) != 0;

    tag.tag_end = static_cast<uint64_t>(kId3v2HeaderSize) + hdr.tag_size
                  + (hdr.footer ? kId3v2HeaderSize : 0U);

    const uint64_t after_header = bytes.size() - kId3v2HeaderSize;
    uint64_t area_size          = hdr.tag_size;
    if (area_size > after_header) {
        add_anomaly(&result, AnomalyKind::OutOfBounds, 6,
                    "tag size exceeds the buffer");
        area_size = after_header;
    } else if (hdr.footer) {
        const uint64_t footer_off = kId3v2HeaderSize + area_size;
        if (!range_ok(bytes, footer_off, kId3v2HeaderSize)) {
            add_anomaly(&result, AnomalyKind::TruncatedInput, footer_off,
                        "tag footer is cut off");
        } else if (!match_bytes(bytes, footer_off, "3DI")) {
            add_anomaly(&result, AnomalyKind::MalformedStructure, footer_off,
                        "tag footer marker is missing");
        }
    }

    if (hdr.major_version == 2 && (hdr.flags & kId3v2ExtendedHeader) != 0) {
        add_anomaly(&result, AnomalyKind::MalformedStructure, 5,
                    "compressed ID3v2.2 tags have no defined scheme");
        return result;
    }

    std::span<const std::byte> area = bytes.subspan(kId3v2HeaderSize,
                                                    static_cast<size_t>(
                                                        area_size));
    std::vector<std::byte> desync;
    if (hdr.unsynchronisation && hdr.major_version < 4) {
        remove_unsynchronisation(area, &desync);
        area = std::span<const std::byte>(desync.data(), desync.size());
    }

    uint64_t pos = 0;
    if (hdr.extended_header) {
        uint32_t ext_size = 0;
        if (!skip_extended_header(area, hdr.major_version, &ext_size)) {
            add_anomaly(&result, AnomalyKind::MalformedStructure,
                        kId3v2HeaderSize,
                        "extended header size is invalid");
            return result;
        }
        hdr.extended_header_size = ext_size;
        pos                      = ext_size;
    }

    const Id3v2DecodeLimits& limits = options.limits;
    const uint64_t frame_header_size = hdr.major_version == 2 ? 6U : 10U;
    const size_t id_size             = hdr.major_version == 2 ? 3U : 4U;
    const bool tag_unsync            = hdr.unsynchronisation;
    uint64_t total_bytes             = 0;

    while (pos < area.size()) {
        const uint64_t frame_off = kId3v2HeaderSize + pos;
        if (area[static_cast<size_t>(pos)] == std::byte { 0 }) {
            tag.padding_size = area.size() - pos;
            break;
        }
        if (area.size() - pos < frame_header_size) {
            add_anomaly(&result, AnomalyKind::TruncatedInput, frame_off,
                        "frame header is cut off");
            break;
        }
        if (tag.frames.size() >= limits.max_frames) {
            add_anomaly(&result, AnomalyKind::LimitExceeded, frame_off,
                        "frame count exceeds max_frames");
            break;
        }

        Id3v2Frame frame;
        frame.offset = frame_off;
        frame.id.assign(as_string_view(area.subspan(
                            static_cast<size_t>(pos), id_size)));
        if (!valid_frame_id(frame.id)) {
            add_anomaly(&result, AnomalyKind::MalformedStructure, frame_off,
                        "frame id is not alphanumeric");
            break;
        }

        if (hdr.major_version == 2) {
            uint64_t size = 0;
            (void)read_uint_be(area, pos + 3, 3, &size);
            frame.declared_size = static_cast<uint32_t>(size);
        } else if (hdr.major_version == 3) {
            (void)read_u32(area, pos + 4, Endian::Big, &frame.declared_size);
            (void)read_u16(area, pos + 8, Endian::Big, &frame.flags);
        } else {
            if (!is_syncsafe(area, pos + 4)) {
                add_anomaly(&result, AnomalyKind::MalformedStructure,
                            frame_off + 4, "frame size is not syncsafe");
                break;
            }
            (void)read_syncsafe_u32(area, pos + 4, &frame.declared_size);
            (void)read_u16(area, pos + 8, Endian::Big, &frame.flags);
        }

        const uint64_t body_off = pos + frame_header_size;
        if (frame.declared_size > area.size() - body_off) {
            add_anomaly(&result, AnomalyKind::OutOfBounds, frame_off,
                        "frame size exceeds the tag");
            break;
        }
        const uint64_t next = body_off + frame.declared_size;

        if (frame.declared_size > limits.max_frame_bytes
            || total_bytes + frame.declared_size
                   > limits.max_total_frame_bytes) {
            add_anomaly(&result, AnomalyKind::LimitExceeded, frame_off,
                        "frame size exceeds the frame byte limits");
            pos = next;
            continue;
        }
        total_bytes += frame.declared_size;

        if (frame.declared_size == 0U) {
            add_anomaly(&result, AnomalyKind::MalformedStructure, frame_off,
                        "frame has no payload");
        } else {
            decode_frame_body(area.subspan(static_cast<size_t>(body_off),
                                           frame.declared_size),
                              hdr.major_version, tag_unsync, limits, &frame,
                              &result);
        }
        tag.frames.push_back(std::move(frame));
        pos = next;
    }

    return result;
}


const Id3v2Frame*
find_id3v2_frame(const Id3v2Tag& tag, std::string_view id) noexcept
{
    for (size_t i = 0; i < tag.frames.size(); ++i) {
        if (tag.frames[i].id == id) {
            return &tag.frames[i];
        }
    }
    return nullptr;
}


std::span<const std::byte>
id3v2_picture_bytes(const Id3v2Frame& frame) noexcept
{
    if (frame.kind != Id3v2FrameKind::Picture
        || frame.picture_data_offset > frame.payload.size()) {
        return {};
    }
    return std::span<const std::byte>(frame.payload.data(),
                                      frame.payload.size())
        .subspan(frame.picture_data_offset);
}


const char*
id3v2_frame_kind_name(Id3v2FrameKind kind) noexcept
{
    switch (kind) {
    case Id3v2FrameKind::Text: return "text";
    case Id3v2FrameKind::UserText: return "user_text";
    case Id3v2FrameKind::Url: return "url";
    case Id3v2FrameKind::UserUrl: return "user_url";
    case Id3v2FrameKind::Comment: return "comment";
    case Id3v2FrameKind::Picture: return "picture";
    case Id3v2FrameKind::Binary: return "binary";
    }
    return "unknown";
}

}  // namespace tagprobe
