#pragma once

#include "tagprobe/decode_result.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

/**
 * \file avc_nal_decode.h
 * \brief Decoder for H.264/AVC NAL unit headers.
 */

namespace tagprobe {

inline constexpr uint8_t kAvcNalSps       = 7;
inline constexpr uint8_t kAvcNalSubsetSps = 15;

/**
 * \brief Fields of a 1-byte AVC NAL unit header.
 *
 * For sequence parameter set units (types 7 and 15) the first three payload
 * bytes are decoded as well: profile_idc, the constraint flags and level_idc.
 */
struct AvcNalHeader final {
    bool forbidden_zero_bit = false;
    uint8_t nal_ref_idc     = 0;
    uint8_t nal_unit_type   = 0;
    std::string_view type_name;

    bool has_profile_level = false;
    uint8_t profile_idc    = 0;
    /// constraint_set0_flag in bit 7 through constraint_set5_flag in bit 2.
    uint8_t constraint_flags = 0;
    uint8_t level_idc        = 0;
    std::string_view profile_name;
    /// "3.1", "1b", ...
    std::string level_name;

    /// Bytes the decoder consumed (1, or 4 with profile/level).
    uint32_t header_size = 1;
};

using AvcNalDecodeResult = DecodeResult<AvcNalHeader>;

/// Returns true if \p bytes hold at least one byte with the forbidden bit
/// clear.
bool
detect_avc_nal_header(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Decodes the NAL unit header at the start of \p bytes.
 *
 * \p bytes starts at the header byte (after any start code). Returns
 * `NotThisFormat` only for an empty buffer; a set forbidden bit is an
 * anomaly.
 */
AvcNalDecodeResult
decode_avc_nal_header(std::span<const std::byte> bytes);

/// Name for \p nal_unit_type, e.g. "sequence parameter set".
std::string_view
avc_nal_type_name(uint8_t nal_unit_type) noexcept;

/// Profile name for \p profile_idc. Baseline with constraint_set1 is
/// "Constrained Baseline".
std::string_view
avc_profile_name(uint8_t profile_idc, uint8_t constraint_flags) noexcept;

/// Level name for \p level_idc. Level 1b is signalled either as 9 or as 11
/// with constraint_set3 in Baseline/Main/Extended profiles.
std::string
avc_level_name(uint8_t profile_idc, uint8_t constraint_flags,
               uint8_t level_idc);

}  // namespace tagprobe
