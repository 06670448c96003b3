#include "tagprobe/adts_decode.h"
#include "tagprobe/ape_tag_decode.h"
#include "tagprobe/av1_obu_decode.h"
#include "tagprobe/avc_nal_decode.h"
#include "tagprobe/bext_decode.h"
#include "tagprobe/hevc_nal_decode.h"
#include "tagprobe/icc_decode.h"
#include "tagprobe/id3v1_decode.h"
#include "tagprobe/id3v2_decode.h"

#include "fuzztest/fuzztest.h"
#include "gtest/gtest.h"

#include <bit>
#include <cstddef>
#include <cstdint>
#include <span>
#include <vector>

namespace tagprobe {

template <typename Result>
static void
expect_consistent(const Result& r)
{
    if (r.status == DecodeStatus::Ok) {
        ASSERT_TRUE(r.anomalies.empty());
    }
    if (r.status == DecodeStatus::Partial) {
        ASSERT_FALSE(r.anomalies.empty());
    }
}


template <typename Result>
static void
expect_same(const Result& a, const Result& b)
{
    ASSERT_EQ(a.status, b.status);
    ASSERT_EQ(a.anomalies.size(), b.anomalies.size());
    for (size_t i = 0; i < a.anomalies.size(); ++i) {
        ASSERT_EQ(a.anomalies[i].kind, b.anomalies[i].kind);
        ASSERT_EQ(a.anomalies[i].offset, b.anomalies[i].offset);
        ASSERT_EQ(a.anomalies[i].detail, b.anomalies[i].detail);
    }
}


// NaN-safe double comparison.
static void
expect_same_bits(double a, double b)
{
    ASSERT_EQ(std::bit_cast<uint64_t>(a), std::bit_cast<uint64_t>(b));
}


static void
expect_same_records(const ApeTag& a, const ApeTag& b)
{
    ASSERT_EQ(a.position, b.position);
    ASSERT_EQ(a.tag_offset, b.tag_offset);
    ASSERT_EQ(a.tag_end, b.tag_end);
    ASSERT_EQ(a.block.version, b.block.version);
    ASSERT_EQ(a.block.item_count, b.block.item_count);
    ASSERT_EQ(a.items.size(), b.items.size());
    for (size_t i = 0; i < a.items.size(); ++i) {
        ASSERT_EQ(a.items[i].key, b.items[i].key);
        ASSERT_EQ(a.items[i].offset, b.items[i].offset);
        ASSERT_EQ(a.items[i].flags, b.items[i].flags);
        ASSERT_EQ(a.items[i].value, b.items[i].value);
        ASSERT_EQ(a.items[i].values, b.items[i].values);
    }
}


static void
expect_same_records(const BextChunk& a, const BextChunk& b)
{
    ASSERT_EQ(a.offset, b.offset);
    ASSERT_EQ(a.declared_size, b.declared_size);
    ASSERT_EQ(a.description, b.description);
    ASSERT_EQ(a.originator, b.originator);
    ASSERT_EQ(a.originator_reference, b.originator_reference);
    ASSERT_EQ(a.origination_date, b.origination_date);
    ASSERT_EQ(a.origination_time, b.origination_time);
    ASSERT_EQ(a.time_reference, b.time_reference);
    ASSERT_EQ(a.version, b.version);
    ASSERT_EQ(a.has_umid, b.has_umid);
    ASSERT_EQ(a.umid, b.umid);
    ASSERT_EQ(a.has_loudness, b.has_loudness);
    ASSERT_EQ(a.loudness_value, b.loudness_value);
    ASSERT_EQ(a.coding_history, b.coding_history);
}


static void
expect_same_records(const AdtsHeader& a, const AdtsHeader& b)
{
    ASSERT_EQ(a.offset, b.offset);
    ASSERT_EQ(a.profile, b.profile);
    ASSERT_EQ(a.sample_rate, b.sample_rate);
    ASSERT_EQ(a.channel_count, b.channel_count);
    ASSERT_EQ(a.frame_length, b.frame_length);
    ASSERT_EQ(a.buffer_fullness, b.buffer_fullness);
    ASSERT_EQ(a.crc, b.crc);
    ASSERT_EQ(a.header_size, b.header_size);
}


static void
expect_same_records(const AdtsStreamInfo& a, const AdtsStreamInfo& b)
{
    expect_same_records(a.first, b.first);
    ASSERT_EQ(a.frame_count, b.frame_count);
    ASSERT_EQ(a.total_samples, b.total_samples);
    ASSERT_EQ(a.stream_bytes, b.stream_bytes);
    expect_same_bits(a.duration_seconds, b.duration_seconds);
    expect_same_bits(a.average_bitrate, b.average_bitrate);
    ASSERT_EQ(a.constant_configuration, b.constant_configuration);
}


static void
expect_same_records(const IccProfile& a, const IccProfile& b)
{
    ASSERT_EQ(a.header.device_class_sig, b.header.device_class_sig);
    ASSERT_EQ(a.header.color_space_sig, b.header.color_space_sig);
    ASSERT_EQ(a.tag_table.size(), b.tag_table.size());
    for (size_t i = 0; i < a.tag_table.size(); ++i) {
        ASSERT_EQ(a.tag_table[i].signature, b.tag_table[i].signature);
        ASSERT_EQ(a.tag_table[i].offset, b.tag_table[i].offset);
        ASSERT_EQ(a.tag_table[i].size, b.tag_table[i].size);
        ASSERT_EQ(a.tag_table[i].in_bounds, b.tag_table[i].in_bounds);
    }
    ASSERT_EQ(a.tags.size(), b.tags.size());
    for (size_t i = 0; i < a.tags.size(); ++i) {
        const IccTag& x = a.tags[i];
        const IccTag& y = b.tags[i];
        ASSERT_EQ(x.type, y.type);
        ASSERT_EQ(x.text, y.text);
        ASSERT_EQ(x.integers, y.integers);
        ASSERT_EQ(x.function_type, y.function_type);
        ASSERT_EQ(x.localized.size(), y.localized.size());
        ASSERT_EQ(x.numbers.size(), y.numbers.size());
        for (size_t j = 0; j < x.numbers.size(); ++j) {
            expect_same_bits(x.numbers[j], y.numbers[j]);
        }
    }
}


// Decodes twice and checks that both runs agree and that the status
// matches the anomaly list.
template <typename Fn>
static void
check_decoder(Fn&& fn, std::span<const std::byte> bytes)
{
    const auto first  = fn(bytes);
    const auto second = fn(bytes);
    expect_consistent(first);
    expect_same(first, second);
}


// Same as check_decoder, and the decoded records must match field by field.
template <typename Fn>
static void
check_decoder_records(Fn&& fn, std::span<const std::byte> bytes)
{
    const auto first  = fn(bytes);
    const auto second = fn(bytes);
    expect_consistent(first);
    expect_same(first, second);
    expect_same_records(first.record, second.record);
}


static void
decoders_are_deterministic(const std::vector<uint8_t>& input)
{
    const std::span<const std::byte> bytes(
        reinterpret_cast<const std::byte*>(input.data()), input.size());

    check_decoder([](std::span<const std::byte> b) { return decode_id3v1(b); },
                  bytes);
    check_decoder([](std::span<const std::byte> b) { return decode_id3v2(b); },
                  bytes);
    check_decoder_records(
        [](std::span<const std::byte> b) { return decode_ape_tag(b); },
        bytes);
    check_decoder_records(
        [](std::span<const std::byte> b) { return decode_bext_chunk(b); },
        bytes);
    check_decoder_records(
        [](std::span<const std::byte> b) { return decode_bext_in_wave(b); },
        bytes);
    check_decoder_records(
        [](std::span<const std::byte> b) { return decode_adts_header(b); },
        bytes);
    check_decoder_records(
        [](std::span<const std::byte> b) { return scan_adts_stream(b); },
        bytes);
    check_decoder_records(
        [](std::span<const std::byte> b) { return decode_icc_profile(b); },
        bytes);
    check_decoder(
        [](std::span<const std::byte> b) { return decode_avc_nal_header(b); },
        bytes);
    check_decoder(
        [](std::span<const std::byte> b) { return decode_hevc_nal_header(b); },
        bytes);
    check_decoder([](std::span<const std::byte> b) { return decode_av1_obu(b); },
                  bytes);

    const Id3v2DecodeResult a = decode_id3v2(bytes);
    const Id3v2DecodeResult b = decode_id3v2(bytes);
    ASSERT_EQ(a.record.frames.size(), b.record.frames.size());
    for (size_t i = 0; i < a.record.frames.size(); ++i) {
        ASSERT_EQ(a.record.frames[i].id, b.record.frames[i].id);
        ASSERT_EQ(a.record.frames[i].payload, b.record.frames[i].payload);
        ASSERT_EQ(a.record.frames[i].values, b.record.frames[i].values);
    }
}


FUZZ_TEST(DecodeDeterminismFuzz, decoders_are_deterministic)
    .WithDomains(fuzztest::VectorOf(fuzztest::Arbitrary<uint8_t>())
                     .WithMaxSize(4096));

}  // namespace tagprobe
