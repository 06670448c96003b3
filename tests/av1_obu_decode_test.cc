#include "tagprobe/av1_obu_decode.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <vector>

namespace tagprobe {
namespace {

static std::vector<std::byte> bytes_of(std::initializer_list<uint8_t> list)
{
    std::vector<std::byte> out;
    for (uint8_t b : list) {
        out.push_back(std::byte { b });
    }
    return out;
}

}  // namespace

TEST(Av1ObuDecodeTest, DecodesSequenceHeaderWithSize)
{
    const std::vector<std::byte> b = bytes_of({ 0x0A, 0x0B, 0x00 });
    ASSERT_TRUE(detect_av1_obu_header(b));

    const Av1ObuDecodeResult r = decode_av1_obu(b);
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    EXPECT_EQ(r.record.obu_type, 1U);
    EXPECT_EQ(r.record.type_name, "Sequence Header");
    EXPECT_TRUE(r.record.has_size_field);
    EXPECT_FALSE(r.record.extension_flag);
    EXPECT_EQ(r.record.obu_size, 11U);
    EXPECT_EQ(r.record.header_size, 2U);

    const Av1ObuDecodeResult td = decode_av1_obu(bytes_of({ 0x12, 0x00 }));
    ASSERT_EQ(td.status, DecodeStatus::Ok);
    EXPECT_EQ(td.record.type_name, "Temporal Delimiter");
    EXPECT_EQ(td.record.obu_size, 0U);
}


TEST(Av1ObuDecodeTest, HeaderOnlyDecodeSkipsSize)
{
    const Av1ObuDecodeResult r = decode_av1_obu_header(bytes_of({ 0x0A }));
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    EXPECT_TRUE(r.record.has_size_field);
    EXPECT_EQ(r.record.obu_size, 0U);
    EXPECT_EQ(r.record.header_size, 1U);
}


TEST(Av1ObuDecodeTest, DecodesExtensionByte)
{
    // Frame OBU with extension: temporal_id 2, spatial_id 1, then size 3.
    const Av1ObuDecodeResult r = decode_av1_obu(
        bytes_of({ 0x36, 0x48, 0x03 }));
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    EXPECT_EQ(r.record.obu_type, 6U);
    EXPECT_TRUE(r.record.extension_flag);
    EXPECT_EQ(r.record.temporal_id, 2U);
    EXPECT_EQ(r.record.spatial_id, 1U);
    EXPECT_EQ(r.record.obu_size, 3U);
    EXPECT_EQ(r.record.header_size, 3U);

    const Av1ObuDecodeResult cut = decode_av1_obu(bytes_of({ 0x34 }));
    EXPECT_EQ(cut.status, DecodeStatus::Partial);
    ASSERT_EQ(cut.anomalies.size(), 1U);
    EXPECT_EQ(cut.anomalies[0].kind, AnomalyKind::TruncatedInput);
    EXPECT_EQ(cut.anomalies[0].offset, 1U);
}


TEST(Av1ObuDecodeTest, MultiByteSize)
{
    const Av1ObuDecodeResult r = decode_av1_obu(
        bytes_of({ 0x0A, 0x80, 0x01 }));
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    EXPECT_EQ(r.record.obu_size, 128U);
    EXPECT_EQ(r.record.header_size, 3U);
}


TEST(Av1ObuDecodeTest, SizeFieldErrors)
{
    const Av1ObuDecodeResult cut = decode_av1_obu(bytes_of({ 0x0A, 0x80 }));
    EXPECT_EQ(cut.status, DecodeStatus::Partial);
    ASSERT_EQ(cut.anomalies.size(), 1U);
    EXPECT_EQ(cut.anomalies[0].kind, AnomalyKind::TruncatedInput);
    EXPECT_EQ(cut.anomalies[0].offset, 1U);

    const Av1ObuDecodeResult longer = decode_av1_obu(bytes_of(
        { 0x0A, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x80, 0x01 }));
    ASSERT_EQ(longer.anomalies.size(), 1U);
    EXPECT_EQ(longer.anomalies[0].kind, AnomalyKind::MalformedStructure);
    EXPECT_EQ(longer.anomalies[0].offset, 1U);

    const Av1ObuDecodeResult huge = decode_av1_obu(
        bytes_of({ 0x0A, 0x80, 0x80, 0x80, 0x80, 0x10 }));
    EXPECT_EQ(huge.record.obu_size, uint64_t { 1 } << 32);
    ASSERT_EQ(huge.anomalies.size(), 1U);
    EXPECT_EQ(huge.anomalies[0].kind, AnomalyKind::MalformedStructure);
}


TEST(Av1ObuDecodeTest, ReservedAndForbiddenBits)
{
    const std::vector<std::byte> reserved = bytes_of({ 0x39 });
    EXPECT_FALSE(detect_av1_obu_header(reserved));
    const Av1ObuDecodeResult r = decode_av1_obu_header(reserved);
    EXPECT_EQ(r.status, DecodeStatus::Partial);
    EXPECT_EQ(r.record.obu_type, 7U);
    EXPECT_EQ(r.record.type_name, "Redundant Frame Header");
    ASSERT_EQ(r.anomalies.size(), 1U);

    const Av1ObuDecodeResult f = decode_av1_obu_header(bytes_of({ 0x80 }));
    EXPECT_TRUE(f.record.forbidden_bit);
    ASSERT_EQ(f.anomalies.size(), 1U);
    EXPECT_EQ(f.anomalies[0].offset, 0U);

    EXPECT_EQ(decode_av1_obu_header({}).status, DecodeStatus::NotThisFormat);
    EXPECT_FALSE(detect_av1_obu_header({}));
}


TEST(Av1ObuDecodeTest, Leb128AndTypeNames)
{
    const std::vector<std::byte> b = bytes_of({ 0x00, 0xE5, 0x8E, 0x26 });
    uint64_t value  = 0;
    uint32_t length = 0;
    ASSERT_TRUE(read_leb128(b, 1, &value, &length));
    EXPECT_EQ(value, 624485U);
    EXPECT_EQ(length, 3U);
    EXPECT_FALSE(read_leb128(b, 4, &value, &length));

    EXPECT_EQ(av1_obu_type_name(15), "Padding");
    EXPECT_EQ(av1_obu_type_name(9), "Reserved");
}

}  // namespace tagprobe
