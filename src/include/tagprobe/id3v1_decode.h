#pragma once

#include "tagprobe/decode_result.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

/**
 * \file id3v1_decode.h
 * \brief Decoder for the 128-byte ID3v1 / ID3v1.1 trailer.
 */

namespace tagprobe {

/// Size of the ID3v1 trailer at the end of a file.
inline constexpr uint32_t kId3v1TagSize = 128;

/// Genre index meaning "no genre".
inline constexpr uint8_t kId3v1NoGenre = 255;

/**
 * \brief Decoded ID3v1 trailer.
 *
 * Text fields are right-trimmed of NUL/space and converted from Latin-1 to
 * UTF-8.
 */
struct Id3v1Tag final {
    /// Offset of the `TAG` marker within the decoded buffer.
    uint64_t offset = 0;

    std::string title;
    std::string artist;
    std::string album;
    std::string year;
    std::string comment;

    /// ID3v1.1: the comment is 28 bytes and \ref track is valid.
    bool is_v1_1  = false;
    uint8_t track = 0;

    uint8_t genre = kId3v1NoGenre;
    /// Name from the standard genre table, empty when unknown or absent.
    std::string_view genre_name;
};

using Id3v1DecodeResult = DecodeResult<Id3v1Tag>;

/// Returns true if the last 128 bytes of \p bytes start with `TAG`.
bool
detect_id3v1(std::span<const std::byte> bytes) noexcept;

/**
 * \brief Decodes the ID3v1 trailer at the end of \p bytes.
 *
 * \p bytes may be a whole file or just the 128-byte trailer.
 *
 * The track number is taken from the comment field only when comment byte 28
 * is zero and byte 29 is nonzero. ID3v1 has no version flag; this byte
 * pattern is the only way ID3v1.1 tags are told apart.
 */
Id3v1DecodeResult
decode_id3v1(std::span<const std::byte> bytes);

/// Returns the name for \p genre, or an empty view if it is not in the table.
std::string_view
id3v1_genre_name(uint8_t genre) noexcept;

}  // namespace tagprobe
