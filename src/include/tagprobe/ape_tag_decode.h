#pragma once

#include "tagprobe/decode_result.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file ape_tag_decode.h
 * \brief Decoder for APEv1 / APEv2 item-list tags.
 */

namespace tagprobe {

/// Size of the APE header and footer blocks.
inline constexpr uint32_t kApeTagBlockSize = 32;

/// Global tag flag bits (also used in the header/footer `flags` field).
enum ApeTagFlag : uint32_t {
    kApeHasHeader = 0x80000000U,
    kApeNoFooter  = 0x40000000U,
    kApeIsHeader  = 0x20000000U,
    kApeReadOnly  = 0x00000001U,
};

/// Item value kind (APEv2 item flag bits 1..2).
enum class ApeItemKind : uint8_t {
    Text,
    Binary,
    External,
    Reserved,
};

/// Where the tag was found in the buffer.
enum class ApeTagPosition : uint8_t {
    Start,
    End,
    /// Footer immediately followed by a 128-byte ID3v1 trailer.
    BeforeId3v1,
};

/// Fields of the 32-byte header or footer block.
struct ApeTagBlock final {
    uint32_t version = 0;
    /// Items plus footer, excluding the header.
    uint32_t tag_size   = 0;
    uint32_t item_count = 0;
    uint32_t flags      = 0;

    bool has_header = false;
    bool has_footer = true;
    bool is_header  = false;
    bool read_only  = false;
};

struct ApeItem final {
    std::string key;
    /// Offset of the item's size field within the buffer.
    uint64_t offset = 0;
    uint32_t flags  = 0;
    ApeItemKind kind = ApeItemKind::Text;
    bool read_only   = false;

    std::vector<std::byte> value;
    /// Text and external items: the value split on NUL into UTF-8 strings.
    std::vector<std::string> values;
};

struct ApeTag final {
    ApeTagBlock block;
    ApeTagPosition position = ApeTagPosition::End;
    /// Tag start (header if present, else first item) and one-past-end.
    uint64_t tag_offset = 0;
    uint64_t tag_end    = 0;
    std::vector<ApeItem> items;
};

using ApeTagDecodeResult = DecodeResult<ApeTag>;

struct ApeTagDecodeLimits final {
    uint32_t max_items      = 1024;
    uint32_t max_item_bytes = 16U * 1024U * 1024U;
};

struct ApeTagDecodeOptions final {
    ApeTagDecodeLimits limits;
};

/// Returns true if an APE header or footer with version 1000/2000 is found
/// at one of the three supported positions.
bool
detect_ape_tag(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Decodes an APE tag located at the start or end of \p bytes.
 *
 * Items are read in order until \ref ApeTag::block item_count items were
 * read or the item area ends. A truncated item stops decoding; items read
 * before it are kept.
 */
ApeTagDecodeResult
decode_ape_tag(std::span<const std::byte> bytes,
               const ApeTagDecodeOptions& options = ApeTagDecodeOptions {});

/// Returns the first item whose key matches \p key ignoring ASCII case.
const ApeItem*
find_ape_item(const ApeTag& tag, std::string_view key) noexcept;

const char*
ape_item_kind_name(ApeItemKind kind) noexcept;

}  // namespace tagprobe
