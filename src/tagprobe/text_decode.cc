#include "tagprobe/text_decode.h"

namespace tagprobe {
namespace {

    static constexpr uint32_t kReplacementChar = 0xFFFDU;

    static void append_utf8_codepoint(uint32_t cp, std::string* out)
    {
        if (cp <= 0x7FU) {
            out->push_back(static_cast<char>(cp));
            return;
        }
        if (cp <= 0x7FFU) {
            out->push_back(static_cast<char>(0xC0U | ((cp >> 6) & 0x1FU)));
            out->push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
            return;
        }
        if (cp <= 0xFFFFU) {
            out->push_back(static_cast<char>(0xE0U | ((cp >> 12) & 0x0FU)));
            out->push_back(static_cast<char>(0x80U | ((cp >> 6) & 0x3FU)));
            out->push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
            return;
        }
        out->push_back(static_cast<char>(0xF0U | ((cp >> 18) & 0x07U)));
        out->push_back(static_cast<char>(0x80U | ((cp >> 12) & 0x3FU)));
        out->push_back(static_cast<char>(0x80U | ((cp >> 6) & 0x3FU)));
        out->push_back(static_cast<char>(0x80U | (cp & 0x3FU)));
    }

    static bool decode_latin1(std::span<const std::byte> bytes,
                              std::string* out)
    {
        out->reserve(bytes.size());
        for (size_t i = 0; i < bytes.size(); ++i) {
            append_utf8_codepoint(static_cast<uint8_t>(bytes[i]), out);
        }
        return true;
    }

    static bool decode_ascii(std::span<const std::byte> bytes,
                             std::string* out)
    {
        bool clean = true;
        out->reserve(bytes.size());
        for (size_t i = 0; i < bytes.size(); ++i) {
            const uint8_t b = static_cast<uint8_t>(bytes[i]);
            if (b >= 0x80U) {
                append_utf8_codepoint(kReplacementChar, out);
                clean = false;
                continue;
            }
            out->push_back(static_cast<char>(b));
        }
        return clean;
    }

    static bool decode_utf8(std::span<const std::byte> bytes, std::string* out)
    {
        bool clean = true;
        out->reserve(bytes.size());
        size_t i = 0;
        while (i < bytes.size()) {
            const uint8_t b0 = static_cast<uint8_t>(bytes[i]);
            uint32_t cp      = 0;
            size_t len       = 0;

            if (b0 <= 0x7FU) {
                out->push_back(static_cast<char>(b0));
                i += 1;
                continue;
            }
            if (b0 >= 0xC2U && b0 <= 0xDFU) {
                cp  = static_cast<uint32_t>(b0 & 0x1FU);
                len = 2;
            } else if (b0 >= 0xE0U && b0 <= 0xEFU) {
                cp  = static_cast<uint32_t>(b0 & 0x0FU);
                len = 3;
            } else if (b0 >= 0xF0U && b0 <= 0xF4U) {
                cp  = static_cast<uint32_t>(b0 & 0x07U);
                len = 4;
            }

            bool valid = len != 0 && i + len <= bytes.size();
            for (size_t j = 1; valid && j < len; ++j) {
                const uint8_t bj = static_cast<uint8_t>(bytes[i + j]);
                if ((bj & 0xC0U) != 0x80U) {
                    valid = false;
                    break;
                }
                cp = (cp << 6) | static_cast<uint32_t>(bj & 0x3FU);
            }
            if (valid) {
                // Overlong forms, surrogates and values past U+10FFFF.
                if ((len == 3 && cp < 0x800U) || (len == 4 && cp < 0x10000U)
                    || cp > 0x10FFFFU || (cp >= 0xD800U && cp <= 0xDFFFU)) {
                    valid = false;
                }
            }
            if (!valid) {
                append_utf8_codepoint(kReplacementChar, out);
                clean = false;
                i += 1;
                continue;
            }
            out->append(reinterpret_cast<const char*>(bytes.data() + i), len);
            i += len;
        }
        return clean;
    }

    static uint16_t load_unit(std::span<const std::byte> bytes, size_t i,
                              bool little_endian) noexcept
    {
        const uint16_t b0 = static_cast<uint8_t>(bytes[i]);
        const uint16_t b1 = static_cast<uint8_t>(bytes[i + 1]);
        return little_endian ? static_cast<uint16_t>(b0 | (b1 << 8))
                             : static_cast<uint16_t>((b0 << 8) | b1);
    }

    static bool decode_utf16(std::span<const std::byte> bytes,
                             bool little_endian, std::string* out)
    {
        bool clean = (bytes.size() % 2U) == 0;
        out->reserve(bytes.size());
        size_t i = 0;
        while (i + 1 < bytes.size()) {
            const uint16_t u0 = load_unit(bytes, i, little_endian);
            i += 2;

            if (u0 >= 0xD800U && u0 <= 0xDBFFU) {
                if (i + 1 >= bytes.size()) {
                    append_utf8_codepoint(kReplacementChar, out);
                    clean = false;
                    continue;
                }
                const uint16_t u1 = load_unit(bytes, i, little_endian);
                if (u1 < 0xDC00U || u1 > 0xDFFFU) {
                    append_utf8_codepoint(kReplacementChar, out);
                    clean = false;
                    continue;
                }
                i += 2;
                append_utf8_codepoint(
                    0x10000U
                        + (((static_cast<uint32_t>(u0) - 0xD800U) << 10)
                           | (static_cast<uint32_t>(u1) - 0xDC00U)),
                    out);
                continue;
            }
            if (u0 >= 0xDC00U && u0 <= 0xDFFFU) {
                append_utf8_codepoint(kReplacementChar, out);
                clean = false;
                continue;
            }
            append_utf8_codepoint(u0, out);
        }
        return clean;
    }

}  // namespace

TextDecodeStatus
decode_text_to_utf8(std::span<const std::byte> bytes, TextEncoding encoding,
                    std::string* out)
{
    if (!out) {
        return TextDecodeStatus::Invalid;
    }
    out->clear();
    if (bytes.empty()) {
        return TextDecodeStatus::Empty;
    }

    bool clean = true;
    switch (encoding) {
    case TextEncoding::Latin1: clean = decode_latin1(bytes, out); break;
    case TextEncoding::Ascii: clean = decode_ascii(bytes, out); break;
    case TextEncoding::Utf8: clean = decode_utf8(bytes, out); break;
    case TextEncoding::Utf16BE: clean = decode_utf16(bytes, false, out); break;
    case TextEncoding::Utf16LE: clean = decode_utf16(bytes, true, out); break;
    case TextEncoding::Utf16Bom: {
        bool little_endian = false;
        if (bytes.size() >= 2) {
            const uint8_t b0 = static_cast<uint8_t>(bytes[0]);
            const uint8_t b1 = static_cast<uint8_t>(bytes[1]);
            if (b0 == 0xFFU && b1 == 0xFEU) {
                little_endian = true;
                bytes         = bytes.subspan(2);
            } else if (b0 == 0xFEU && b1 == 0xFFU) {
                bytes = bytes.subspan(2);
            }
        }
        clean = decode_utf16(bytes, little_endian, out);
        break;
    }
    }

    if (!clean) {
        return TextDecodeStatus::Invalid;
    }
    return out->empty() ? TextDecodeStatus::Empty : TextDecodeStatus::Ok;
}


size_t
find_text_terminator(std::span<const std::byte> bytes, TextEncoding encoding,
                     size_t* terminator_size) noexcept
{
    const bool wide = encoding == TextEncoding::Utf16Bom
                      || encoding == TextEncoding::Utf16BE
                      || encoding == TextEncoding::Utf16LE;
    if (!wide) {
        for (size_t i = 0; i < bytes.size(); ++i) {
            if (bytes[i] == std::byte { 0 }) {
                if (terminator_size) {
                    *terminator_size = 1;
                }
                return i;
            }
        }
    } else {
        for (size_t i = 0; i + 1 < bytes.size(); i += 2) {
            if (bytes[i] == std::byte { 0 } && bytes[i + 1] == std::byte { 0 }) {
                if (terminator_size) {
                    *terminator_size = 2;
                }
                return i;
            }
        }
    }
    if (terminator_size) {
        *terminator_size = 0;
    }
    return bytes.size();
}


const char*
text_encoding_name(TextEncoding encoding) noexcept
{
    switch (encoding) {
    case TextEncoding::Latin1: return "latin1";
    case TextEncoding::Utf16Bom: return "utf16_bom";
    case TextEncoding::Utf16BE: return "utf16be";
    case TextEncoding::Utf16LE: return "utf16le";
    case TextEncoding::Utf8: return "utf8";
    case TextEncoding::Ascii: return "ascii";
    }
    return "unknown";
}

}  // namespace tagprobe
