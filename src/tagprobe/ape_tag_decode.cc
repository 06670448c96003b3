#include "tagprobe/ape_tag_decode.h"

#include "tagprobe/byte_reader.h"
#include "tagprobe/id3v1_decode.h"
#include "tagprobe/text_decode.h"

#include <utility>

namespace tagprobe {
namespace {

    static constexpr uint32_t kMinKeySize = 2;
    static constexpr uint32_t kMaxKeySize = 255;

    static bool read_block(std::span<const std::byte> bytes, uint64_t off,
                           ApeTagBlock* out) noexcept
    {
        if (!match_bytes(bytes, off, "APETAGEX")) {
            return false;
        }
        ApeTagBlock b;
        if (!read_u32(bytes, off + 8, Endian::Little, &b.version)
            || !read_u32(bytes, off + 12, Endian::Little, &b.tag_size)
            || !read_u32(bytes, off + 16, Endian::Little, &b.item_count)
            || !read_u32(bytes, off + 20, Endian::Little, &b.flags)) {
            return false;
        }
        if (b.version != 1000U && b.version != 2000U) {
            return false;
        }
        // APEv1 has neither a header nor global flags.
        if (b.version == 2000U) {
            b.has_header = (b.flags & kApeHasHeader) != 0;
            b.has_footer = (b.flags & kApeNoFooter) == 0;
            b.is_header  = (b.flags & kApeIsHeader) != 0;
            b.read_only  = (b.flags & kApeReadOnly) != 0;
        } else {
            b.flags = 0;
        }
        *out = b;
        return true;
    }


    // Footer positions are tried before the start so that a whole tag with
    // header and footer is anchored on its footer.
    static bool locate_tag(std::span<const std::byte> bytes, uint64_t* off,
                           ApeTagBlock* block,
                           ApeTagPosition* position) noexcept
    {
        if (bytes.size() >= kApeTagBlockSize) {
            const uint64_t end_off = bytes.size() - kApeTagBlockSize;
            if (read_block(bytes, end_off, block)) {
                *off      = end_off;
                *position = ApeTagPosition::End;
                return true;
            }
        }
        if (bytes.size() >= kApeTagBlockSize + kId3v1TagSize
            && detect_id3v1(bytes)) {
            const uint64_t v1_off = bytes.size() - kId3v1TagSize
                                    - kApeTagBlockSize;
            if (read_block(bytes, v1_off, block)) {
                *off      = v1_off;
                *position = ApeTagPosition::BeforeId3v1;
                return true;
            }
        }
        if (read_block(bytes, 0, block)) {
            *off      = 0;
            *position = ApeTagPosition::Start;
            return true;
        }
        return false;
    }


    static bool valid_key_char(char c) noexcept
    {
        return c >= 0x20 && c <= 0x7E;
    }


    static bool ascii_iequal(std::string_view a, std::string_view b) noexcept
    {
        if (a.size() != b.size()) {
            return false;
        }
        for (size_t i = 0; i < a.size(); ++i) {
            char ca = a[i];
            char cb = b[i];
            if (ca >= 'a' && ca <= 'z') {
                ca = static_cast<char>(ca - 'a' + 'A');
            }
            if (cb >= 'a' && cb <= 'z') {
                cb = static_cast<char>(cb - 'a' + 'A');
            }
            if (ca != cb) {
                return false;
            }
        }
        return true;
    }


    static bool split_text_value(std::span<const std::byte> value,
                                 std::vector<std::string>* out)
    {
        bool clean = true;
        size_t start = 0;
        for (size_t i = 0; i <= value.size(); ++i) {
            if (i != value.size() && value[i] != std::byte { 0 }) {
                continue;
            }
            std::string s;
            if (decode_text_to_utf8(value.subspan(start, i - start),
                                    TextEncoding::Utf8, &s)
                == TextDecodeStatus::Invalid) {
                clean = false;
            }
            out->push_back(std::move(s));
            start = i + 1;
        }
        return clean;
    }

}  // namespace

bool
detect_ape_tag(std::span<const std::byte> bytes) noexcept
{
    uint64_t off = 0;
    ApeTagBlock block;
    ApeTagPosition position = ApeTagPosition::End;
    return locate_tag(bytes, &off, &block, &position);
}


ApeTagDecodeResult
decode_ape_tag(std::span<const std::byte> bytes,
               const ApeTagDecodeOptions& options)
{
    ApeTagDecodeResult result;
    ApeTag& tag = result.record;

    uint64_t block_off = 0;
    if (!locate_tag(bytes, &block_off, &tag.block, &tag.position)) {
        result.status = DecodeStatus::NotThisFormat;
        return result;
    }
    const ApeTagBlock& block = tag.block;

    if (block.tag_size < kApeTagBlockSize
        && tag.position != ApeTagPosition::Start) {
        add_anomaly(&result, AnomalyKind::MalformedStructure, block_off + 12,
                    "tag size is smaller than the footer");
        tag.tag_offset = block_off;
        tag.tag_end    = block_off + kApeTagBlockSize;
        return result;
    }

    uint64_t items_start = 0;
    uint64_t items_end   = 0;
    if (tag.position == ApeTagPosition::Start) {
        items_start = kApeTagBlockSize;
        uint64_t body = block.tag_size;
        if (block.has_footer && body >= kApeTagBlockSize) {
            body -= kApeTagBlockSize;
        }
        items_end      = items_start + body;
        tag.tag_offset = 0;
        tag.tag_end    = items_end + (block.has_footer ? kApeTagBlockSize : 0U);
        if (items_end > bytes.size()) {
            add_anomaly(&result, AnomalyKind::OutOfBounds, 12,
                        "tag size exceeds the buffer");
            items_end = bytes.size();
        }
    } else {
        items_end           = block_off;
        const uint64_t body = block.tag_size - kApeTagBlockSize;
        tag.tag_end         = block_off + kApeTagBlockSize;
        if (body > items_end) {
            add_anomaly(&result, AnomalyKind::OutOfBounds, block_off + 12,
                        "tag size reaches before the buffer start");
            items_start = 0;
        } else {
            items_start = items_end - body;
        }
        tag.tag_offset = items_start;
        if (block.has_header && items_start >= kApeTagBlockSize) {
            const uint64_t header_off = items_start - kApeTagBlockSize;
            if (match_bytes(bytes, header_off, "APETAGEX")) {
                tag.tag_offset = header_off;
            } else {
                add_anomaly(&result, AnomalyKind::MalformedStructure,
                            header_off, "tag header flagged but missing");
            }
        }
    }

    const ApeTagDecodeLimits& limits = options.limits;
    uint64_t pos                     = items_start;
    bool stopped                     = false;

    for (uint32_t i = 0; i < block.item_count && pos < items_end; ++i) {
        if (tag.items.size() >= limits.max_items) {
            add_anomaly(&result, AnomalyKind::LimitExceeded, pos,
                        "item count exceeds max_items");
            stopped = true;
            break;
        }

        ApeItem item;
        item.offset         = pos;
        uint32_t value_size = 0;
        if (items_end - pos < 8
            || !read_u32(bytes, pos, Endian::Little, &value_size)
            || !read_u32(bytes, pos + 4, Endian::Little, &item.flags)) {
            add_anomaly(&result, AnomalyKind::TruncatedInput, pos,
                        "item header is cut off");
            stopped = true;
            break;
        }

        const uint64_t key_off = pos + 8;
        uint64_t key_end       = key_off;
        while (key_end < items_end && bytes[static_cast<size_t>(key_end)] != std::byte { 0 }
               && key_end - key_off <= kMaxKeySize) {
            key_end += 1;
        }
        if (key_end >= items_end) {
            add_anomaly(&result, AnomalyKind::TruncatedInput, key_off,
                        "item key is not terminated");
            stopped = true;
            break;
        }
        const uint64_t key_size = key_end - key_off;
        if (key_size < kMinKeySize || key_size > kMaxKeySize) {
            add_anomaly(&result, AnomalyKind::MalformedStructure, key_off,
                        "item key length is outside 2..255");
            stopped = true;
            break;
        }
        item.key.assign(as_string_view(
            bytes.subspan(key_off, key_size)));
        bool key_ok = true;
        for (size_t k = 0; k < item.key.size(); ++k) {
            key_ok = key_ok && valid_key_char(item.key[k]);
        }
        if (!key_ok) {
            add_anomaly(&result, AnomalyKind::MalformedStructure, key_off,
                        "item key has characters outside 0x20..0x7E");
            stopped = true;
            break;
        }

        const uint64_t value_off = key_end + 1;
        if (value_size > items_end - value_off) {
            add_anomaly(&result, AnomalyKind::TruncatedInput, pos,
                        "item value is cut off");
            stopped = true;
            break;
        }
        pos = value_off + value_size;

        if (value_size > limits.max_item_bytes) {
            add_anomaly(&result, AnomalyKind::LimitExceeded, item.offset,
                        "item value exceeds max_item_bytes");
            continue;
        }

        if (block.version == 2000U) {
            item.kind = static_cast<ApeItemKind>((item.flags >> 1) & 0x3U);
        }
        item.read_only = (item.flags & kApeReadOnly) != 0;

        const std::span<const std::byte> value = bytes.subspan(value_off,
                                                               value_size);
        item.value.assign(value.begin(), value.end());
        if (item.kind == ApeItemKind::Text
            || item.kind == ApeItemKind::External) {
            if (!split_text_value(value, &item.values)) {
                add_anomaly(&result, AnomalyKind::MalformedStructure,
                            value_off, "text item is not valid UTF-8");
            }
        }
        tag.items.push_back(std::move(item));
    }

    if (!stopped && tag.items.size() != block.item_count
        && result.anomalies.empty()) {
        add_anomaly(&result, AnomalyKind::MalformedStructure, block_off + 16,
                    "item count disagrees with the items found");
    }
    return result;
}


const ApeItem*
find_ape_item(const ApeTag& tag, std::string_view key) noexcept
{
    for (size_t i = 0; i < tag.items.size(); ++i) {
        if (ascii_iequal(tag.items[i].key, key)) {
            return &tag.items[i];
        }
    }
    return nullptr;
}


const char*
ape_item_kind_name(ApeItemKind kind) noexcept
{
    switch (kind) {
    case ApeItemKind::Text: return "text";
    case ApeItemKind::Binary: return "binary";
    case ApeItemKind::External: return "external";
    case ApeItemKind::Reserved: return "reserved";
    }
    return "unknown";
}

}  // namespace tagprobe
