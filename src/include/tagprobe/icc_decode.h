#pragma once

#include "tagprobe/decode_result.h"

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <vector>

/**
 * \file icc_decode.h
 * \brief Decoder for ICC profile blobs (header + tag table + common tag types).
 */

namespace tagprobe {

/// Size of the fixed ICC profile header.
inline constexpr uint32_t kIccHeaderSize = 128;

struct IccXyz final {
    double x = 0.0;
    double y = 0.0;
    double z = 0.0;
};

struct IccDateTime final {
    uint16_t year   = 0;
    uint16_t month  = 0;
    uint16_t day    = 0;
    uint16_t hour   = 0;
    uint16_t minute = 0;
    uint16_t second = 0;
};

/**
 * \brief Decoded 128-byte ICC header.
 *
 * Signature fields keep the raw big-endian value and a trimmed 4-character
 * string (`"RGB "` becomes `"RGB"`).
 */
struct IccHeader final {
    uint32_t declared_size = 0;

    uint32_t cmm = 0;
    std::string cmm_sig;

    uint32_t version       = 0;
    uint8_t version_major  = 0;
    uint8_t version_minor  = 0;
    uint8_t version_bugfix = 0;

    uint32_t device_class = 0;
    std::string device_class_sig;
    uint32_t color_space = 0;
    std::string color_space_sig;
    uint32_t connection_space = 0;
    std::string connection_space_sig;

    IccDateTime created;

    uint32_t platform = 0;
    std::string platform_sig;
    uint32_t flags        = 0;
    uint32_t manufacturer = 0;
    std::string manufacturer_sig;
    uint32_t model       = 0;
    uint64_t attributes  = 0;
    uint32_t rendering_intent = 0;
    IccXyz illuminant;
    uint32_t creator = 0;
    std::string creator_sig;
    std::array<uint8_t, 16> profile_id {};
};

/// One tag table entry, listed whether or not it is in bounds.
struct IccTagEntry final {
    uint32_t signature = 0;
    std::string signature_sig;
    uint32_t offset = 0;
    uint32_t size   = 0;
    /// `offset + size` lies inside the profile buffer.
    bool in_bounds = false;
};

/// Interpretation of a tag payload, from its type signature.
enum class IccTagType : uint8_t {
    Desc,
    Text,
    Mluc,
    Xyz,
    Sf32,
    Uf32,
    Ui08,
    Ui16,
    Ui32,
    Ui64,
    Curv,
    Para,
    Sig,
    /// Unknown or undecodable type: only the byte range is kept.
    Opaque,
};

struct IccLocalizedString final {
    std::string language;
    std::string country;
    std::string text;
};

/**
 * \brief A decoded in-bounds tag.
 *
 * Which members are filled depends on \ref type:
 * - `Desc`, `Text`: \ref text
 * - `Mluc`: \ref localized, first record also in \ref text
 * - `Xyz`: \ref numbers as x,y,z triples
 * - `Sf32`, `Uf32`: \ref numbers
 * - `Ui08`..`Ui64`: \ref integers
 * - `Curv`: \ref integers (table), or \ref numbers with one gamma value
 * - `Para`: \ref function_type and \ref numbers (parameters)
 * - `Sig`: \ref text and \ref integers with the raw signature
 */
struct IccTag final {
    uint32_t signature = 0;
    std::string signature_sig;
    uint32_t type_signature = 0;
    std::string type_sig;
    IccTagType type = IccTagType::Opaque;

    uint32_t offset = 0;
    uint32_t size   = 0;

    std::string text;
    std::vector<IccLocalizedString> localized;
    std::vector<double> numbers;
    std::vector<uint64_t> integers;
    uint16_t function_type = 0;
};

struct IccProfile final {
    IccHeader header;
    /// Every entry of the tag table up to `max_tags`.
    std::vector<IccTagEntry> tag_table;
    /// Entries that passed the bounds and size checks.
    std::vector<IccTag> tags;
};

using IccDecodeResult = DecodeResult<IccProfile>;

/// Resource limits applied during ICC decode to bound hostile inputs.
struct IccDecodeLimits final {
    uint32_t max_tags      = 1U << 16;
    uint32_t max_tag_bytes = 32U * 1024U * 1024U;
    uint64_t max_total_tag_bytes = 64ULL * 1024ULL * 1024ULL;
};

/// Decoder options for \ref decode_icc_profile.
struct IccDecodeOptions final {
    IccDecodeLimits limits;
};

/// Returns true if \p bytes hold a 128-byte header with `acsp` at offset 36.
bool
detect_icc_profile(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Decodes an ICC profile header, tag table and tag payloads.
 *
 * Each tag table entry is bounds-checked before its payload is read. Entries
 * past the end of the buffer stay in \ref IccProfile::tag_table, are left out
 * of \ref IccProfile::tags and are recorded as `OutOfBounds` anomalies.
 */
IccDecodeResult
decode_icc_profile(std::span<const std::byte> icc_bytes,
                   const IccDecodeOptions& options = IccDecodeOptions {});

/// Returns the first decoded tag with \p signature, or null.
const IccTag*
find_icc_tag(const IccProfile& profile, uint32_t signature) noexcept;

/// Profile class name, e.g. "display device" for `mntr`.
const char*
icc_device_class_name(uint32_t device_class) noexcept;

/// Color space name, e.g. "RGB" or "CIELAB".
const char*
icc_color_space_name(uint32_t color_space) noexcept;

const char*
icc_platform_name(uint32_t platform) noexcept;

const char*
icc_rendering_intent_name(uint32_t intent) noexcept;

const char*
icc_tag_type_name(IccTagType type) noexcept;

}  // namespace tagprobe
