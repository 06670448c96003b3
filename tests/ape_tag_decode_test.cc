#include "tagprobe/ape_tag_decode.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>
#include <vector>

namespace tagprobe {
namespace {

using Bytes = std::vector<std::byte>;

static void append(Bytes* out, std::string_view s)
{
    for (size_t i = 0; i < s.size(); ++i) {
        out->push_back(std::byte { static_cast<unsigned char>(s[i]) });
    }
}


static void append_u32le(Bytes* out, uint32_t v)
{
    out->push_back(std::byte { static_cast<unsigned char>(v) });
    out->push_back(std::byte { static_cast<unsigned char>(v >> 8) });
    out->push_back(std::byte { static_cast<unsigned char>(v >> 16) });
    out->push_back(std::byte { static_cast<unsigned char>(v >> 24) });
}


static void append_item(Bytes* items, std::string_view key,
                        std::string_view value, uint32_t flags)
{
    append_u32le(items, static_cast<uint32_t>(value.size()));
    append_u32le(items, flags);
    append(items, key);
    items->push_back(std::byte { 0 });
    append(items, value);
}


static void append_block(Bytes* out, uint32_t version, uint32_t tag_size,
                         uint32_t item_count, uint32_t flags)
{
    append(out, "APETAGEX");
    append_u32le(out, version);
    append_u32le(out, tag_size);
    append_u32le(out, item_count);
    append_u32le(out, flags);
    out->resize(out->size() + 8, std::byte { 0 });
}


// `lead` audio bytes, then an APEv2 header, items and footer.
static Bytes make_file(size_t lead, const Bytes& items, uint32_t count)
{
    Bytes f(lead, std::byte { 0x55 });
    const uint32_t tag_size = static_cast<uint32_t>(items.size())
                              + kApeTagBlockSize;
    append_block(&f, 2000, tag_size, count, kApeHasHeader | kApeIsHeader);
    f.insert(f.end(), items.begin(), items.end());
    append_block(&f, 2000, tag_size, count, kApeHasHeader);
    return f;
}

}  // namespace

TEST(ApeTagDecodeTest, DecodesReplayGainItem)
{
    Bytes items;
    append_item(&items, "REPLAYGAIN_TRACK_GAIN", "+1.23 dB", 0);
    const Bytes f = make_file(16, items, 1);

    ASSERT_TRUE(detect_ape_tag(f));
    const ApeTagDecodeResult r = decode_ape_tag(f);
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    EXPECT_TRUE(r.anomalies.empty());
    EXPECT_EQ(r.record.block.version, 2000U);
    EXPECT_TRUE(r.record.block.has_header);
    EXPECT_EQ(r.record.position, ApeTagPosition::End);
    EXPECT_EQ(r.record.tag_offset, 16U);
    EXPECT_EQ(r.record.tag_end, f.size());

    ASSERT_EQ(r.record.items.size(), 1U);
    const ApeItem& item = r.record.items[0];
    EXPECT_EQ(item.key, "REPLAYGAIN_TRACK_GAIN");
    EXPECT_EQ(item.kind, ApeItemKind::Text);
    EXPECT_EQ(item.offset, 16U + 32U);
    ASSERT_EQ(item.values.size(), 1U);
    EXPECT_EQ(item.values[0], "+1.23 dB");
}


TEST(ApeTagDecodeTest, ItemKindsAndFlags)
{
    Bytes items;
    append_item(&items, "Artist", std::string_view("A\0B", 3), kApeReadOnly);
    append_item(&items, "Cover Art (Front)", "\x01\x02\x03", 1U << 1);
    append_item(&items, "Lyrics", "http://lyrics", 2U << 1);
    const Bytes f = make_file(0, items, 3);

    const ApeTagDecodeResult r = decode_ape_tag(f);
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    ASSERT_EQ(r.record.items.size(), 3U);

    const ApeItem& artist = r.record.items[0];
    EXPECT_TRUE(artist.read_only);
    ASSERT_EQ(artist.values.size(), 2U);
    EXPECT_EQ(artist.values[0], "A");
    EXPECT_EQ(artist.values[1], "B");

    const ApeItem& cover = r.record.items[1];
    EXPECT_EQ(cover.kind, ApeItemKind::Binary);
    EXPECT_TRUE(cover.values.empty());
    EXPECT_EQ(cover.value.size(), 3U);

    const ApeItem& lyrics = r.record.items[2];
    EXPECT_EQ(lyrics.kind, ApeItemKind::External);
    ASSERT_EQ(lyrics.values.size(), 1U);
    EXPECT_EQ(lyrics.values[0], "http://lyrics");

    EXPECT_EQ(find_ape_item(r.record, "artist"), &r.record.items[0]);
    EXPECT_EQ(find_ape_item(r.record, "ALBUM"), nullptr);
    EXPECT_STREQ(ape_item_kind_name(ApeItemKind::External), "external");
}


TEST(ApeTagDecodeTest, FindsFooterBeforeId3v1)
{
    Bytes items;
    append_item(&items, "Title", "Song", 0);
    Bytes f = make_file(8, items, 1);
    const size_t tag_end = f.size();

    Bytes v1(128, std::byte { 0 });
    v1[0] = std::byte { 'T' };
    v1[1] = std::byte { 'A' };
    v1[2] = std::byte { 'G' };
    f.insert(f.end(), v1.begin(), v1.end());

    const ApeTagDecodeResult r = decode_ape_tag(f);
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    EXPECT_EQ(r.record.position, ApeTagPosition::BeforeId3v1);
    EXPECT_EQ(r.record.tag_offset, 8U);
    EXPECT_EQ(r.record.tag_end, tag_end);
    ASSERT_EQ(r.record.items.size(), 1U);
    EXPECT_EQ(r.record.items[0].values[0], "Song");
}


TEST(ApeTagDecodeTest, FindsHeaderAtStart)
{
    Bytes items;
    append_item(&items, "Title", "Start", 0);
    Bytes f = make_file(0, items, 1);
    f.resize(f.size() + 64, std::byte { 0x11 });

    const ApeTagDecodeResult r = decode_ape_tag(f);
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    EXPECT_EQ(r.record.position, ApeTagPosition::Start);
    EXPECT_EQ(r.record.tag_offset, 0U);
    EXPECT_EQ(r.record.tag_end, f.size() - 64U);
    ASSERT_EQ(r.record.items.size(), 1U);
    EXPECT_EQ(r.record.items[0].offset, 32U);
}


TEST(ApeTagDecodeTest, Version1IgnoresFlags)
{
    Bytes items;
    append_item(&items, "Title", "Old", 1U << 1);
    Bytes f(4, std::byte { 0 });
    f.insert(f.end(), items.begin(), items.end());
    append_block(&f, 1000,
                 static_cast<uint32_t>(items.size()) + kApeTagBlockSize, 1,
                 kApeHasHeader);

    const ApeTagDecodeResult r = decode_ape_tag(f);
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    EXPECT_FALSE(r.record.block.has_header);
    EXPECT_EQ(r.record.block.flags, 0U);
    ASSERT_EQ(r.record.items.size(), 1U);
    EXPECT_EQ(r.record.items[0].kind, ApeItemKind::Text);
    ASSERT_EQ(r.record.items[0].values.size(), 1U);
    EXPECT_EQ(r.record.items[0].values[0], "Old");
}


TEST(ApeTagDecodeTest, CutOffValueKeepsEarlierItems)
{
    Bytes items;
    append_item(&items, "Title", "Ok", 0);
    append_u32le(&items, 500);
    append_u32le(&items, 0);
    append(&items, std::string_view("Album\0abc", 9));
    const Bytes f = make_file(0, items, 2);

    const ApeTagDecodeResult r = decode_ape_tag(f);
    EXPECT_EQ(r.status, DecodeStatus::Partial);
    ASSERT_EQ(r.record.items.size(), 1U);
    EXPECT_EQ(r.record.items[0].key, "Title");
    ASSERT_EQ(r.anomalies.size(), 1U);
    EXPECT_EQ(r.anomalies[0].kind, AnomalyKind::TruncatedInput);
}


TEST(ApeTagDecodeTest, ItemCountMismatch)
{
    Bytes items;
    append_item(&items, "Title", "One", 0);
    const Bytes f = make_file(0, items, 3);

    const ApeTagDecodeResult r = decode_ape_tag(f);
    EXPECT_EQ(r.status, DecodeStatus::Partial);
    EXPECT_EQ(r.record.items.size(), 1U);
    ASSERT_EQ(r.anomalies.size(), 1U);
    EXPECT_EQ(r.anomalies[0].kind, AnomalyKind::MalformedStructure);
    EXPECT_EQ(r.anomalies[0].offset, f.size() - 32U + 16U);
}


TEST(ApeTagDecodeTest, ShortKeyIsMalformed)
{
    Bytes items;
    append_item(&items, "X", "value", 0);
    const Bytes f = make_file(0, items, 1);

    const ApeTagDecodeResult r = decode_ape_tag(f);
    EXPECT_TRUE(r.record.items.empty());
    ASSERT_EQ(r.anomalies.size(), 1U);
    EXPECT_EQ(r.anomalies[0].kind, AnomalyKind::MalformedStructure);
    EXPECT_EQ(r.anomalies[0].offset, 32U + 8U);
}


TEST(ApeTagDecodeTest, ItemLimit)
{
    Bytes items;
    append_item(&items, "A1", "x", 0);
    append_item(&items, "A2", "y", 0);
    const Bytes f = make_file(0, items, 2);

    ApeTagDecodeOptions options;
    options.limits.max_items = 1;
    const ApeTagDecodeResult r = decode_ape_tag(f, options);
    EXPECT_EQ(r.record.items.size(), 1U);
    ASSERT_EQ(r.anomalies.size(), 1U);
    EXPECT_EQ(r.anomalies[0].kind, AnomalyKind::LimitExceeded);
}


TEST(ApeTagDecodeTest, RejectsNonTags)
{
    Bytes items;
    append_item(&items, "Title", "x", 0);
    Bytes f = make_file(0, items, 1);

    EXPECT_FALSE(detect_ape_tag(std::span<const std::byte>(f.data(), 16)));
    EXPECT_FALSE(detect_ape_tag({}));

    // Unknown version in both header and footer.
    f[8]                 = std::byte { 0xB8 };
    f[9]                 = std::byte { 0x0B };
    f[f.size() - 32 + 8] = std::byte { 0xB8 };
    f[f.size() - 32 + 9] = std::byte { 0x0B };
    EXPECT_FALSE(detect_ape_tag(f));
    EXPECT_EQ(decode_ape_tag(f).status, DecodeStatus::NotThisFormat);
}



TEST(ApeTagDecodeTest, DecodeIsDeterministic)
{
    Bytes items;
    append_item(&items, "Artist", std::string_view("A\0B", 3), 0);
    append_item(&items, "Cover", "png", 1U << 1);
    append_u32le(&items, 500);
    append_u32le(&items, 0);
    append(&items, std::string_view("Album\0x", 7));
    const Bytes f = make_file(0, items, 3);

    const ApeTagDecodeResult a = decode_ape_tag(f);
    const ApeTagDecodeResult b = decode_ape_tag(f);
    EXPECT_EQ(a.status, DecodeStatus::Partial);
    EXPECT_EQ(a.status, b.status);
    EXPECT_EQ(a.record.position, b.record.position);
    EXPECT_EQ(a.record.tag_offset, b.record.tag_offset);
    EXPECT_EQ(a.record.tag_end, b.record.tag_end);
    EXPECT_EQ(a.record.block.item_count, b.record.block.item_count);
    ASSERT_EQ(a.record.items.size(), 2U);
    ASSERT_EQ(a.record.items.size(), b.record.items.size());
    for (size_t i = 0; i < a.record.items.size(); ++i) {
        EXPECT_EQ(a.record.items[i].key, b.record.items[i].key);
        EXPECT_EQ(a.record.items[i].offset, b.record.items[i].offset);
        EXPECT_EQ(a.record.items[i].kind, b.record.items[i].kind);
        EXPECT_EQ(a.record.items[i].value, b.record.items[i].value);
        EXPECT_EQ(a.record.items[i].values, b.record.items[i].values);
    }
    ASSERT_EQ(a.anomalies.size(), b.anomalies.size());
    for (size_t i = 0; i < a.anomalies.size(); ++i) {
        EXPECT_EQ(a.anomalies[i].kind, b.anomalies[i].kind);
        EXPECT_EQ(a.anomalies[i].offset, b.anomalies[i].offset);
    }
}

}  // namespace tagprobe
