#pragma once

#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace tagprobe {

// Appends an ASCII-only, terminal-safe representation of `s` into `out`.
//
// Behavior:
// - Escapes control bytes and non-ASCII as `\xNN`
// - Escapes `\n`, `\r`, `\t`, `\\` and `"`
// - Truncates to `max_bytes` bytes (0 = unlimited) and appends "..."
//
// Returns true when any escaping or truncation occurred.
bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept;

// Same as `append_console_escaped_ascii`, but well-formed UTF-8 sequences for
// printable code points (U+00A0 and up) are copied through unchanged. Used for
// tag text that was already decoded to UTF-8. Truncation never splits a
// sequence.
bool
append_console_escaped_utf8(std::string_view s, uint32_t max_bytes,
                            std::string* out) noexcept;

// Appends uppercase hex bytes into `out` (no "0x" prefix).
// Truncates to `max_bytes` (0 = unlimited) and appends "..." when truncated.
void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept;

// Appends a FourCC as 4 escaped ASCII characters (trailing spaces kept).
void
append_fourcc(uint32_t sig, std::string* out) noexcept;

}  // namespace tagprobe
