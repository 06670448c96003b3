#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

/**
 * \file byte_reader.h
 * \brief Bounds-checked primitives for reading integers and strings from bytes.
 *
 * Every reader takes an explicit byte offset and returns false when the read
 * would cross the end of the buffer. Outputs are left untouched on failure.
 */

namespace tagprobe {

/// Byte order of a multi-byte field.
enum class Endian : uint8_t {
    Big,
    Little,
};

/// Packs four ASCII characters into a big-endian FourCC integer.
static constexpr uint32_t
fourcc(char a, char b, char c, char d) noexcept
{
    return (static_cast<uint32_t>(static_cast<uint8_t>(a)) << 24)
           | (static_cast<uint32_t>(static_cast<uint8_t>(b)) << 16)
           | (static_cast<uint32_t>(static_cast<uint8_t>(c)) << 8)
           | (static_cast<uint32_t>(static_cast<uint8_t>(d)) << 0);
}

/// Returns true if `[offset, offset + size)` lies inside \p bytes.
bool
range_ok(std::span<const std::byte> bytes, uint64_t offset,
         uint64_t size) noexcept;

bool
read_u8(std::span<const std::byte> bytes, uint64_t offset,
        uint8_t* out) noexcept;
bool
read_u16(std::span<const std::byte> bytes, uint64_t offset, Endian endian,
         uint16_t* out) noexcept;
bool
read_u32(std::span<const std::byte> bytes, uint64_t offset, Endian endian,
         uint32_t* out) noexcept;
bool
read_u64(std::span<const std::byte> bytes, uint64_t offset, Endian endian,
         uint64_t* out) noexcept;
bool
read_i16(std::span<const std::byte> bytes, uint64_t offset, Endian endian,
         int16_t* out) noexcept;
bool
read_i32(std::span<const std::byte> bytes, uint64_t offset, Endian endian,
         int32_t* out) noexcept;

/// Reads an unsigned big-endian integer of 1..8 bytes.
bool
read_uint_be(std::span<const std::byte> bytes, uint64_t offset,
             uint32_t width, uint64_t* out) noexcept;

/**
 * \brief Decodes a 4-byte syncsafe integer (7 significant bits per byte).
 *
 * The result is always in `[0, 2^28 - 1]`. The high bit of each byte is
 * masked off; use \ref is_syncsafe to check that the encoding is clean.
 */
bool
read_syncsafe_u32(std::span<const std::byte> bytes, uint64_t offset,
                  uint32_t* out) noexcept;

/// Returns true if the 4 bytes at \p offset exist and all have bit 7 clear.
bool
is_syncsafe(std::span<const std::byte> bytes, uint64_t offset) noexcept;

/// Returns true if \p literal occurs at \p offset.
bool
match_bytes(std::span<const std::byte> bytes, uint64_t offset,
            std::string_view literal) noexcept;

/**
 * \brief Copies a fixed-width text field into \p out.
 *
 * Trailing NUL and space padding is trimmed. Bytes are copied verbatim (no
 * transcoding), so the field's encoding is up to the caller.
 */
bool
read_fixed_string(std::span<const std::byte> bytes, uint64_t offset,
                  uint64_t size, std::string* out);

/**
 * \brief Reads a NUL-terminated string starting at \p offset.
 *
 * At most \p max_bytes bytes are scanned for the terminator. On success
 * \p consumed receives the string length plus the terminator.
 */
bool
read_cstring(std::span<const std::byte> bytes, uint64_t offset,
             uint64_t max_bytes, std::string* out,
             uint64_t* consumed);

/// Returns the 4 characters of \p sig with trailing spaces and NULs trimmed.
std::string
fourcc_to_string(uint32_t sig);

/// Returns a `std::string_view` over \p bytes (no copy).
inline std::string_view
as_string_view(std::span<const std::byte> bytes) noexcept
{
    return std::string_view(reinterpret_cast<const char*>(bytes.data()),
                            bytes.size());
}

}  // namespace tagprobe
