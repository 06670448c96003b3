#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>

/**
 * \file text_decode.h
 * \brief Conversion of tag text payloads to UTF-8.
 */

namespace tagprobe {

/// Source encoding of a text payload.
enum class TextEncoding : uint8_t {
    /// ISO-8859-1; every byte maps to the code point of the same value.
    Latin1,
    /// UTF-16 with a leading byte-order mark (big-endian if none).
    Utf16Bom,
    Utf16BE,
    Utf16LE,
    Utf8,
    /// 7-bit ASCII; bytes >= 0x80 are invalid.
    Ascii,
};

enum class TextDecodeStatus : uint8_t {
    Ok,
    Empty,
    /// Invalid sequences were replaced with U+FFFD.
    Invalid,
};

/**
 * \brief Decodes \p bytes from \p encoding into UTF-8 in \p out.
 *
 * \p out is cleared first. Invalid input never stops decoding: offending code
 * units become U+FFFD and the status is \ref TextDecodeStatus::Invalid.
 */
TextDecodeStatus
decode_text_to_utf8(std::span<const std::byte> bytes, TextEncoding encoding,
                    std::string* out);

/**
 * \brief Returns the length of the text at the start of \p bytes.
 *
 * The terminator is one zero byte for single-byte encodings and a zero code
 * unit (at an even offset) for UTF-16. If no terminator is found the whole
 * span is text and \p terminator_size is 0.
 */
size_t
find_text_terminator(std::span<const std::byte> bytes, TextEncoding encoding,
                     size_t* terminator_size) noexcept;

/// Stable lowercase name, e.g. "utf16_bom".
const char*
text_encoding_name(TextEncoding encoding) noexcept;

}  // namespace tagprobe
