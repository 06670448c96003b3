#include "tagprobe/console_format.h"

#include <cstdio>

namespace tagprobe {
namespace {

    // Escapes one ASCII byte. Returns true if escaping was needed.
    static bool append_escaped_byte(unsigned char c, std::string* out)
    {
        if (c == '\\' || c == '"') {
            out->push_back('\\');
            out->push_back(static_cast<char>(c));
            return false;
        }
        if (c == '\n') {
            out->append("\\n");
            return true;
        }
        if (c == '\r') {
            out->append("\\r");
            return true;
        }
        if (c == '\t') {
            out->append("\\t");
            return true;
        }
        if (c < 0x20U || c == 0x7FU || c >= 0x80U) {
            char buf[8];
            std::snprintf(buf, sizeof(buf), "\\x%02X",
                          static_cast<unsigned>(c));
            out->append(buf);
            return true;
        }
        out->push_back(static_cast<char>(c));
        return false;
    }


    // Length of the well-formed UTF-8 sequence at `s[i]` encoding a code
    // point >= U+00A0, or 0.
    static size_t printable_utf8_length(std::string_view s, size_t i) noexcept
    {
        const unsigned char b0 = static_cast<unsigned char>(s[i]);
        size_t len             = 0;
        uint32_t cp            = 0;
        if (b0 >= 0xC2U && b0 <= 0xDFU) {
            len = 2;
            cp  = b0 & 0x1FU;
        } else if (b0 >= 0xE0U && b0 <= 0xEFU) {
            len = 3;
            cp  = b0 & 0x0FU;
        } else if (b0 >= 0xF0U && b0 <= 0xF4U) {
            len = 4;
            cp  = b0 & 0x07U;
        } else {
            return 0;
        }
        if (i + len > s.size()) {
            return 0;
        }
        for (size_t j = 1; j < len; ++j) {
            const unsigned char bj = static_cast<unsigned char>(s[i + j]);
            if ((bj & 0xC0U) != 0x80U) {
                return 0;
            }
            cp = (cp << 6) | (bj & 0x3FU);
        }
        if (cp < 0xA0U || (len == 3 && cp < 0x800U)
            || (len == 4 && cp < 0x10000U) || cp > 0x10FFFFU
            || (cp >= 0xD800U && cp <= 0xDFFFU)) {
            return 0;
        }
        return len;
    }

}  // namespace

bool
append_console_escaped_ascii(std::string_view s, uint32_t max_bytes,
                             std::string* out) noexcept
{
    bool dangerous   = false;
    const uint32_t n = (max_bytes == 0U || s.size() < max_bytes)
                           ? static_cast<uint32_t>(s.size())
                           : max_bytes;

    out->reserve(out->size() + static_cast<size_t>(n));
    for (uint32_t i = 0; i < n; ++i) {
        if (append_escaped_byte(static_cast<unsigned char>(s[i]), out)) {
            dangerous = true;
        }
    }
    if (n < s.size()) {
        out->append("...");
        dangerous = true;
    }
    return dangerous;
}


bool
append_console_escaped_utf8(std::string_view s, uint32_t max_bytes,
                            std::string* out) noexcept
{
    bool dangerous  = false;
    const size_t n  = (max_bytes == 0U || s.size() < max_bytes)
                          ? s.size()
                          : static_cast<size_t>(max_bytes);

    out->reserve(out->size() + n);
    size_t i = 0;
    while (i < n) {
        const size_t len = printable_utf8_length(s, i);
        if (len != 0) {
            if (i + len > n) {
                break;
            }
            out->append(s.substr(i, len));
            i += len;
            continue;
        }
        if (append_escaped_byte(static_cast<unsigned char>(s[i]), out)) {
            dangerous = true;
        }
        i += 1;
    }
    if (i < s.size()) {
        out->append("...");
        dangerous = true;
    }
    return dangerous;
}


void
append_hex_bytes(std::span<const std::byte> bytes, uint32_t max_bytes,
                 std::string* out) noexcept
{
    const uint32_t n = (max_bytes == 0U || bytes.size() < max_bytes)
                           ? static_cast<uint32_t>(bytes.size())
                           : max_bytes;

    out->reserve(out->size() + static_cast<size_t>(n) * 2U);
    for (uint32_t i = 0; i < n; ++i) {
        const unsigned v = static_cast<unsigned>(
            static_cast<uint8_t>(bytes[i]));
        char buf[4];
        std::snprintf(buf, sizeof(buf), "%02X", v);
        out->append(buf);
    }
    if (n < bytes.size()) {
        out->append("...");
    }
}


void
append_fourcc(uint32_t sig, std::string* out) noexcept
{
    for (int shift = 24; shift >= 0; shift -= 8) {
        (void)append_escaped_byte(
            static_cast<unsigned char>((sig >> shift) & 0xFFU), out);
    }
}

}  // namespace tagprobe
