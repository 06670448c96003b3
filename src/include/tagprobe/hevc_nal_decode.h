#pragma once

#include "tagprobe/decode_result.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

/**
 * \file hevc_nal_decode.h
 * \brief Decoder for H.265/HEVC NAL unit headers.
 */

namespace tagprobe {

inline constexpr uint32_t kHevcNalHeaderSize = 2;

/// Fields of the 2-byte HEVC NAL unit header.
struct HevcNalHeader final {
    bool forbidden_zero_bit       = false;
    uint8_t nal_unit_type         = 0;
    uint8_t nuh_layer_id          = 0;
    uint8_t nuh_temporal_id_plus1 = 0;
    /// TemporalId (`nuh_temporal_id_plus1 - 1`), 0 when the field is 0.
    uint8_t temporal_id = 0;
    /// Table 7-1 mnemonic, e.g. "IDR_W_RADL".
    std::string_view type_name;
    bool is_vcl  = false;
    bool is_irap = false;
};

using HevcNalDecodeResult = DecodeResult<HevcNalHeader>;

/// Returns true if \p bytes hold 2 bytes with the forbidden bit clear and a
/// non-zero `nuh_temporal_id_plus1`.
bool
detect_hevc_nal_header(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Decodes the 2-byte NAL unit header at the start of \p bytes.
 *
 * Returns `NotThisFormat` only when fewer than 2 bytes are given. A set
 * forbidden bit and a zero `nuh_temporal_id_plus1` are anomalies.
 */
HevcNalDecodeResult
decode_hevc_nal_header(std::span<const std::byte> bytes);

std::string_view
hevc_nal_type_name(uint8_t nal_unit_type) noexcept;

/// VCL units are types 0..31.
bool
hevc_is_vcl(uint8_t nal_unit_type) noexcept;

/// Intra random access point pictures are types 16..23.
bool
hevc_is_irap(uint8_t nal_unit_type) noexcept;

}  // namespace tagprobe
