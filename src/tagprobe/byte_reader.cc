#include "tagprobe/byte_reader.h"

namespace tagprobe {
namespace {

    static uint8_t u8(std::byte b) noexcept
    {
        return static_cast<uint8_t>(b);
    }

    static uint64_t load(std::span<const std::byte> bytes, uint64_t offset,
                         uint32_t width, Endian endian) noexcept
    {
        uint64_t v = 0;
        if (endian == Endian::Big) {
            for (uint32_t i = 0; i < width; ++i) {
                v = (v << 8) | static_cast<uint64_t>(u8(bytes[offset + i]));
            }
        } else {
            for (uint32_t i = width; i > 0; --i) {
                v = (v << 8)
                    | static_cast<uint64_t>(u8(bytes[offset + i - 1]));
            }
        }
        return v;
    }

    static bool is_trim_byte(char c) noexcept
    {
        return c == '\0' || c == ' ';
    }

}  // namespace

bool
range_ok(std::span<const std::byte> bytes, uint64_t offset,
         uint64_t size) noexcept
{
    const uint64_t bytes_size = static_cast<uint64_t>(bytes.size());
    if (offset > bytes_size) {
        return false;
    }
    return size <= bytes_size - offset;
}


bool
read_u8(std::span<const std::byte> bytes, uint64_t offset,
        uint8_t* out) noexcept
{
    if (!out || !range_ok(bytes, offset, 1)) {
        return false;
    }
    *out = u8(bytes[offset]);
    return true;
}


bool
read_u16(std::span<const std::byte> bytes, uint64_t offset, Endian endian,
         uint16_t* out) noexcept
{
    if (!out || !range_ok(bytes, offset, 2)) {
        return false;
    }
    *out = static_cast<uint16_t>(load(bytes, offset, 2, endian));
    return true;
}


bool
read_u32(std::span<const std::byte> bytes, uint64_t offset, Endian endian,
         uint32_t* out) noexcept
{
    if (!out || !range_ok(bytes, offset, 4)) {
        return false;
    }
    *out = static_cast<uint32_t>(load(bytes, offset, 4, endian));
    return true;
}


bool
read_u64(std::span<const std::byte> bytes, uint64_t offset, Endian endian,
         uint64_t* out) noexcept
{
    if (!out || !range_ok(bytes, offset, 8)) {
        return false;
    }
    *out = load(bytes, offset, 8, endian);
    return true;
}


bool
read_i16(std::span<const std::byte> bytes, uint64_t offset, Endian endian,
         int16_t* out) noexcept
{
    uint16_t v = 0;
    if (!out || !read_u16(bytes, offset, endian, &v)) {
        return false;
    }
    *out = static_cast<int16_t>(v);
    return true;
}


bool
read_i32(std::span<const std::byte> bytes, uint64_t offset, Endian endian,
         int32_t* out) noexcept
{
    uint32_t v = 0;
    if (!out || !read_u32(bytes, offset, endian, &v)) {
        return false;
    }
    *out = static_cast<int32_t>(v);
    return true;
}


bool
read_uint_be(std::span<const std::byte> bytes, uint64_t offset,
             uint32_t width, uint64_t* out) noexcept
{
    if (!out || width == 0 || width > 8 || !range_ok(bytes, offset, width)) {
        return false;
    }
    *out = load(bytes, offset, width, Endian::Big);
    return true;
}


bool
read_syncsafe_u32(std::span<const std::byte> bytes, uint64_t offset,
                  uint32_t* out) noexcept
{
    if (!out || !range_ok(bytes, offset, 4)) {
        return false;
    }
    uint32_t v = 0;
    for (uint32_t i = 0; i < 4; ++i) {
        v = (v << 7) | static_cast<uint32_t>(u8(bytes[offset + i]) & 0x7FU);
    }
    *out = v;
    return true;
}


bool
is_syncsafe(std::span<const std::byte> bytes, uint64_t offset) noexcept
{
    if (!range_ok(bytes, offset, 4)) {
        return false;
    }
    for (uint32_t i = 0; i < 4; ++i) {
        if ((u8(bytes[offset + i]) & 0x80U) != 0) {
            return false;
        }
    }
    return true;
}


bool
match_bytes(std::span<const std::byte> bytes, uint64_t offset,
            std::string_view literal) noexcept
{
    if (!range_ok(bytes, offset, literal.size())) {
        return false;
    }
    for (size_t i = 0; i < literal.size(); ++i) {
        if (u8(bytes[offset + i]) != static_cast<uint8_t>(literal[i])) {
            return false;
        }
    }
    return true;
}


bool
read_fixed_string(std::span<const std::byte> bytes, uint64_t offset,
                  uint64_t size, std::string* out)
{
    if (!out || !range_ok(bytes, offset, size)) {
        return false;
    }
    const std::string_view field = as_string_view(
        bytes.subspan(static_cast<size_t>(offset), static_cast<size_t>(size)));
    size_t n = field.size();
    while (n > 0 && is_trim_byte(field[n - 1])) {
        n -= 1;
    }
    out->assign(field.data(), n);
    return true;
}


bool
read_cstring(std::span<const std::byte> bytes, uint64_t offset,
             uint64_t max_bytes, std::string* out, uint64_t* consumed)
{
    if (!out || offset > bytes.size()) {
        return false;
    }
    uint64_t limit = static_cast<uint64_t>(bytes.size()) - offset;
    if (max_bytes != 0U && max_bytes < limit) {
        limit = max_bytes;
    }
    for (uint64_t i = 0; i < limit; ++i) {
        if (u8(bytes[offset + i]) == 0) {
            out->assign(reinterpret_cast<const char*>(bytes.data() + offset),
                        static_cast<size_t>(i));
            if (consumed) {
                *consumed = i + 1;
            }
            return true;
        }
    }
    return false;
}


std::string
fourcc_to_string(uint32_t sig)
{
    char buf[4] = {
        static_cast<char>((sig >> 24) & 0xFFU),
        static_cast<char>((sig >> 16) & 0xFFU),
        static_cast<char>((sig >> 8) & 0xFFU),
        static_cast<char>((sig >> 0) & 0xFFU),
    };
    size_t n = 4;
    while (n > 0 && is_trim_byte(buf[n - 1])) {
        n -= 1;
    }
    return std::string(buf, n);
}

}  // namespace tagprobe
