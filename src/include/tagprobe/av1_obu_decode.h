#pragma once

#include "tagprobe/decode_result.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

/**
 * \file av1_obu_decode.h
 * \brief Decoder for AV1 OBU headers.
 */

namespace tagprobe {

/// Largest obu_size AV1 permits (2^32 - 1).
inline constexpr uint64_t kAv1MaxObuSize = 0xFFFFFFFFULL;

/**
 * \brief Fields of an AV1 OBU header.
 *
 * \ref decode_av1_obu_header fills only the first-byte fields.
 * \ref decode_av1_obu also fills the extension and size fields.
 */
struct Av1ObuHeader final {
    bool forbidden_bit = false;
    uint8_t obu_type   = 0;
    std::string_view type_name;
    bool extension_flag = false;
    bool has_size_field = false;
    bool reserved_bit   = false;

    /// Extension byte fields (valid when \ref extension_flag).
    uint8_t temporal_id = 0;
    uint8_t spatial_id  = 0;

    /// Valid when \ref has_size_field.
    uint64_t obu_size = 0;
    /// Header bytes: 1, plus the extension byte, plus the leb128 size.
    uint32_t header_size = 1;
};

using Av1ObuDecodeResult = DecodeResult<Av1ObuHeader>;

/// Returns true if \p bytes hold one byte with the forbidden and reserved
/// bits clear.
bool
detect_av1_obu_header(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Decodes the first OBU header byte.
 *
 * Returns `NotThisFormat` only for an empty buffer; a set forbidden or
 * reserved bit is an anomaly.
 */
Av1ObuDecodeResult
decode_av1_obu_header(std::span<const std::byte> bytes);

/**
 * \brief Decodes the OBU header byte, the optional extension byte and the
 * optional leb128 obu_size.
 *
 * A truncated extension byte or size field is `TruncatedInput`; a size field
 * longer than 8 bytes or above 2^32 - 1 is `MalformedStructure`.
 */
Av1ObuDecodeResult
decode_av1_obu(std::span<const std::byte> bytes);

/**
 * \brief Reads an unsigned LEB128 value of at most 8 bytes.
 *
 * Returns false if the buffer ends first or no terminating byte is found in
 * 8 bytes.
 */
bool
read_leb128(std::span<const std::byte> bytes, uint64_t offset, uint64_t* out,
            uint32_t* length) noexcept;

/// Name for \p obu_type, e.g. "Sequence Header".
std::string_view
av1_obu_type_name(uint8_t obu_type) noexcept;

}  // namespace tagprobe
