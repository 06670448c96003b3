#pragma once

#include "tagprobe/decode_result.h"
#include "tagprobe/text_decode.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

/**
 * \file id3v2_decode.h
 * \brief Decoder for ID3v2.2, ID3v2.3 and ID3v2.4 tags.
 */

namespace tagprobe {

/// Size of the ID3v2 header (and of the optional v2.4 footer).
inline constexpr uint32_t kId3v2HeaderSize = 10;

/// Header flag bits (byte 5 of the tag header).
enum Id3v2HeaderFlag : uint8_t {
    kId3v2Unsynchronisation = 0x80,
    /// Extended header (v2.3/v2.4); compression in v2.2.
    kId3v2ExtendedHeader = 0x40,
    kId3v2Experimental   = 0x20,
    kId3v2Footer         = 0x10,
};

struct Id3v2Header final {
    uint8_t major_version = 0;
    uint8_t revision      = 0;
    uint8_t flags         = 0;
    /// Syncsafe tag size: everything after the header, excluding the footer.
    uint32_t tag_size = 0;

    bool unsynchronisation = false;
    bool extended_header   = false;
    bool experimental      = false;
    bool footer            = false;

    /// Bytes skipped for the extended header (0 if absent).
    uint32_t extended_header_size = 0;
};

/// How a frame payload was interpreted.
enum class Id3v2FrameKind : uint8_t {
    /// `T***` text frame: \ref Id3v2Frame::values.
    Text,
    /// `TXXX`: \ref Id3v2Frame::description plus values.
    UserText,
    /// `W***` URL frame: values[0].
    Url,
    /// `WXXX`: description plus values[0].
    UserUrl,
    /// `COMM` / `USLT`: language, description, values[0].
    Comment,
    /// `APIC` / `PIC`: mime type, picture type, description, image bytes.
    Picture,
    /// Unknown id or undecodable payload: raw bytes only.
    Binary,
};

struct Id3v2Frame final {
    /// Frame id: 4 characters (3 for ID3v2.2).
    std::string id;
    /// Offset of the frame header. For tags unsynchronised as a whole (v2.3)
    /// this is an offset into the de-unsynchronised tag.
    uint64_t offset        = 0;
    uint32_t declared_size = 0;
    uint16_t flags         = 0;

    bool compressed       = false;
    bool encrypted        = false;
    bool unsynchronised   = false;
    bool grouped          = false;
    uint8_t group_id      = 0;
    uint8_t encryption_id = 0;
    /// Decompressed size (v2.3) or data length indicator (v2.4), 0 if absent.
    uint32_t data_length = 0;

    /// Frame payload after extra header bytes were skipped and
    /// unsynchronisation/compression were undone.
    std::vector<std::byte> payload;

    Id3v2FrameKind kind   = Id3v2FrameKind::Binary;
    TextEncoding encoding = TextEncoding::Latin1;
    std::vector<std::string> values;
    std::string description;
    std::string language;
    std::string mime_type;
    uint8_t picture_type = 0;
    /// Offset of the image bytes within \ref payload (Picture frames).
    uint32_t picture_data_offset = 0;
};

struct Id3v2Tag final {
    Id3v2Header header;
    std::vector<Id3v2Frame> frames;
    /// Bytes of zero padding found after the last frame.
    uint64_t padding_size = 0;
    /// Offset one past the end of the tag (header + size + footer).
    uint64_t tag_end = 0;
};

using Id3v2DecodeResult = DecodeResult<Id3v2Tag>;

/// Resource limits applied during ID3v2 decode to bound hostile inputs.
struct Id3v2DecodeLimits final {
    uint32_t max_frames      = 4096;
    uint32_t max_frame_bytes = 16U * 1024U * 1024U;
    /// Cap for a compressed frame's inflated size.
    uint32_t max_inflated_bytes = 16U * 1024U * 1024U;
    uint64_t max_total_frame_bytes = 64ULL * 1024ULL * 1024ULL;
};

/// Decoder options for \ref decode_id3v2.
struct Id3v2DecodeOptions final {
    Id3v2DecodeLimits limits;
};

/**
 * \brief Returns true if \p bytes start with a plausible ID3v2 header.
 *
 * Checks the `ID3` marker, a major version of 2..4, and a syncsafe size.
 */
bool
detect_id3v2(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Decodes the ID3v2 tag at the start of \p bytes.
 *
 * Frame sizes are plain big-endian in v2.3 and syncsafe in v2.4 (3 bytes in
 * v2.2). Unknown frame ids are kept as \ref Id3v2FrameKind::Binary frames.
 * A malformed or truncated frame stops iteration; frames decoded before it
 * are returned with an anomaly.
 */
Id3v2DecodeResult
decode_id3v2(std::span<const std::byte> bytes,
             const Id3v2DecodeOptions& options = Id3v2DecodeOptions {});

/// Returns the first frame with \p id, or null.
const Id3v2Frame*
find_id3v2_frame(const Id3v2Tag& tag, std::string_view id) noexcept;

/// Returns the image bytes of a Picture frame (empty for other kinds).
std::span<const std::byte>
id3v2_picture_bytes(const Id3v2Frame& frame) noexcept;

/// Stable lowercase name, e.g. "user_text".
const char*
id3v2_frame_kind_name(Id3v2FrameKind kind) noexcept;

}  // namespace tagprobe
