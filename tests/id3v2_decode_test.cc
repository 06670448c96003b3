#include "tagprobe/id3v2_decode.h"

#include <gtest/gtest.h>

#include <cstddef>
#include <cstdint>
#include <string_view>
#include <vector>

#if defined(TAGPROBE_HAS_ZLIB) && TAGPROBE_HAS_ZLIB
#    include <zlib.h>
#endif

namespace tagprobe {
namespace {

using Bytes = std::vector<std::byte>;

static void append(Bytes* out, std::string_view s)
{
    for (size_t i = 0; i < s.size(); ++i) {
        out->push_back(std::byte { static_cast<unsigned char>(s[i]) });
    }
}


static void append_u8(Bytes* out, uint8_t v)
{
    out->push_back(std::byte { v });
}


static void append_u16be(Bytes* out, uint16_t v)
{
    append_u8(out, static_cast<uint8_t>(v >> 8));
    append_u8(out, static_cast<uint8_t>(v));
}


static void append_u32be(Bytes* out, uint32_t v)
{
    append_u8(out, static_cast<uint8_t>(v >> 24));
    append_u8(out, static_cast<uint8_t>(v >> 16));
    append_u8(out, static_cast<uint8_t>(v >> 8));
    append_u8(out, static_cast<uint8_t>(v));
}


static void append_syncsafe(Bytes* out, uint32_t v)
{
    append_u8(out, static_cast<uint8_t>((v >> 21) & 0x7F));
    append_u8(out, static_cast<uint8_t>((v >> 14) & 0x7F));
    append_u8(out, static_cast<uint8_t>((v >> 7) & 0x7F));
    append_u8(out, static_cast<uint8_t>(v & 0x7F));
}


static void append_bytes(Bytes* out, const Bytes& b)
{
    out->insert(out->end(), b.begin(), b.end());
}


static Bytes text_body(uint8_t encoding, std::string_view raw)
{
    Bytes b;
    append_u8(&b, encoding);
    append(&b, raw);
    return b;
}


static void append_frame_v3(Bytes* area, std::string_view id, uint16_t flags,
                            const Bytes& body)
{
    append(area, id);
    append_u32be(area, static_cast<uint32_t>(body.size()));
    append_u16be(area, flags);
    append_bytes(area, body);
}


static void append_frame_v4(Bytes* area, std::string_view id, uint16_t flags,
                            const Bytes& body)
{
    append(area, id);
    append_syncsafe(area, static_cast<uint32_t>(body.size()));
    append_u16be(area, flags);
    append_bytes(area, body);
}


static void append_frame_v2(Bytes* area, std::string_view id,
                            const Bytes& body)
{
    append(area, id);
    const uint32_t n = static_cast<uint32_t>(body.size());
    append_u8(area, static_cast<uint8_t>(n >> 16));
    append_u8(area, static_cast<uint8_t>(n >> 8));
    append_u8(area, static_cast<uint8_t>(n));
    append_bytes(area, body);
}


static Bytes make_tag(uint8_t major, uint8_t flags, const Bytes& area,
                      uint32_t declared_size)
{
    Bytes tag;
    append(&tag, "ID3");
    append_u8(&tag, major);
    append_u8(&tag, 0);
    append_u8(&tag, flags);
    append_syncsafe(&tag, declared_size);
    append_bytes(&tag, area);
    return tag;
}


static Bytes make_tag(uint8_t major, uint8_t flags, const Bytes& area)
{
    return make_tag(major, flags, area, static_cast<uint32_t>(area.size()));
}

}  // namespace

TEST(Id3v2DecodeTest, DecodesVersion23Frames)
{
    Bytes area;
    append_frame_v3(&area, "TIT2", 0, text_body(0, "Hello"));
    const Bytes utf16 = { std::byte { 0x01 }, std::byte { 0xFF },
                          std::byte { 0xFE }, std::byte { 'H' },
                          std::byte { 0x00 }, std::byte { 'i' },
                          std::byte { 0x00 } };
    append_frame_v3(&area, "TPE1", 0, utf16);
    append_frame_v3(&area, "COMM", 0,
                    text_body(0, std::string_view("eng\0Nice", 8)));
    area.resize(area.size() + 10, std::byte { 0 });

    const Bytes tag = make_tag(3, 0, area);
    ASSERT_TRUE(detect_id3v2(tag));

    const Id3v2DecodeResult r = decode_id3v2(tag);
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    EXPECT_TRUE(r.anomalies.empty());
    EXPECT_EQ(r.record.header.major_version, 3U);
    EXPECT_EQ(r.record.header.tag_size, area.size());
    EXPECT_EQ(r.record.padding_size, 10U);
    EXPECT_EQ(r.record.tag_end, tag.size());
    ASSERT_EQ(r.record.frames.size(), 3U);

    const Id3v2Frame& title = r.record.frames[0];
    EXPECT_EQ(title.id, "TIT2");
    EXPECT_EQ(title.offset, 10U);
    EXPECT_EQ(title.declared_size, 6U);
    EXPECT_EQ(title.kind, Id3v2FrameKind::Text);
    ASSERT_EQ(title.values.size(), 1U);
    EXPECT_EQ(title.values[0], "Hello");

    const Id3v2Frame& artist = r.record.frames[1];
    EXPECT_EQ(artist.offset, 26U);
    EXPECT_EQ(artist.encoding, TextEncoding::Utf16Bom);
    ASSERT_EQ(artist.values.size(), 1U);
    EXPECT_EQ(artist.values[0], "Hi");

    const Id3v2Frame& comment = r.record.frames[2];
    EXPECT_EQ(comment.kind, Id3v2FrameKind::Comment);
    EXPECT_EQ(comment.language, "eng");
    EXPECT_EQ(comment.description, "");
    ASSERT_EQ(comment.values.size(), 1U);
    EXPECT_EQ(comment.values[0], "Nice");
}


TEST(Id3v2DecodeTest, DecodesVersion24MultiValueAndUserFrames)
{
    Bytes area;
    append_frame_v4(&area, "TCON", 0,
                    text_body(3, std::string_view("Rock\0Pop\0", 9)));
    append_frame_v4(
        &area, "TXXX", 0,
        text_body(3, std::string_view("REPLAYGAIN_TRACK_GAIN\0-6.5 dB", 29)));
    append_frame_v4(&area, "TPE2", 0, Bytes {});
    const Bytes tag = make_tag(4, 0, area);

    const Id3v2DecodeResult r = decode_id3v2(tag);
    ASSERT_EQ(r.record.frames.size(), 3U);

    const Id3v2Frame& genre = r.record.frames[0];
    ASSERT_EQ(genre.values.size(), 2U);
    EXPECT_EQ(genre.values[0], "Rock");
    EXPECT_EQ(genre.values[1], "Pop");
    EXPECT_EQ(genre.encoding, TextEncoding::Utf8);

    const Id3v2Frame* gain = find_id3v2_frame(r.record, "TXXX");
    ASSERT_NE(gain, nullptr);
    EXPECT_EQ(gain->kind, Id3v2FrameKind::UserText);
    EXPECT_EQ(gain->description, "REPLAYGAIN_TRACK_GAIN");
    ASSERT_EQ(gain->values.size(), 1U);
    EXPECT_EQ(gain->values[0], "-6.5 dB");

    // A zero-size frame is kept but reported.
    EXPECT_EQ(r.status, DecodeStatus::Partial);
    ASSERT_EQ(r.anomalies.size(), 1U);
    EXPECT_EQ(r.anomalies[0].kind, AnomalyKind::MalformedStructure);
    EXPECT_EQ(find_id3v2_frame(r.record, "TALB"), nullptr);
}


TEST(Id3v2DecodeTest, DecodesUrlFrames)
{
    Bytes area;
    Bytes url;
    append(&url, "http://example.com");
    append_frame_v3(&area, "WOAR", 0, url);
    append_frame_v3(&area, "WXXX", 0,
                    text_body(0, std::string_view("home\0http://y", 13)));
    const Bytes tag = make_tag(3, 0, area);

    const Id3v2DecodeResult r = decode_id3v2(tag);
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    ASSERT_EQ(r.record.frames.size(), 2U);
    EXPECT_EQ(r.record.frames[0].kind, Id3v2FrameKind::Url);
    ASSERT_EQ(r.record.frames[0].values.size(), 1U);
    EXPECT_EQ(r.record.frames[0].values[0], "http://example.com");
    EXPECT_EQ(r.record.frames[1].kind, Id3v2FrameKind::UserUrl);
    EXPECT_EQ(r.record.frames[1].description, "home");
    ASSERT_EQ(r.record.frames[1].values.size(), 1U);
    EXPECT_EQ(r.record.frames[1].values[0], "http://y");
}


TEST(Id3v2DecodeTest, DecodesAttachedPicture)
{
    Bytes body = text_body(0, std::string_view("image/png\0", 10));
    append_u8(&body, 3);
    append(&body, std::string_view("cover\0", 6));
    append(&body, "\x89PNG");

    Bytes area;
    append_frame_v3(&area, "APIC", 0, body);
    const Id3v2DecodeResult r = decode_id3v2(make_tag(3, 0, area));
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    ASSERT_EQ(r.record.frames.size(), 1U);

    const Id3v2Frame& pic = r.record.frames[0];
    EXPECT_EQ(pic.kind, Id3v2FrameKind::Picture);
    EXPECT_EQ(pic.mime_type, "image/png");
    EXPECT_EQ(pic.picture_type, 3U);
    EXPECT_EQ(pic.description, "cover");
    EXPECT_EQ(pic.picture_data_offset, 18U);
    const std::span<const std::byte> image = id3v2_picture_bytes(pic);
    ASSERT_EQ(image.size(), 4U);
    EXPECT_EQ(image[1], std::byte { 'P' });
}


TEST(Id3v2DecodeTest, PictureWithoutTerminatedMimeFallsBackToBinary)
{
    Bytes area;
    append_frame_v3(&area, "APIC", 0, text_body(0, "image/png"));
    const Id3v2DecodeResult r = decode_id3v2(make_tag(3, 0, area));

    EXPECT_EQ(r.status, DecodeStatus::Partial);
    ASSERT_EQ(r.record.frames.size(), 1U);
    EXPECT_EQ(r.record.frames[0].kind, Id3v2FrameKind::Binary);
    EXPECT_EQ(r.record.frames[0].payload.size(), 10U);
    EXPECT_TRUE(r.record.frames[0].mime_type.empty());
    EXPECT_TRUE(id3v2_picture_bytes(r.record.frames[0]).empty());
    ASSERT_EQ(r.anomalies.size(), 1U);
    EXPECT_EQ(r.anomalies[0].offset, 10U);
}


TEST(Id3v2DecodeTest, DecodesVersion22Frames)
{
    Bytes area;
    append_frame_v2(&area, "TT2", text_body(0, "Abc"));
    Bytes pic = text_body(0, "JPG");
    append_u8(&pic, 3);
    append_u8(&pic, 0);
    append(&pic, "\xFF\xD8");
    append_frame_v2(&area, "PIC", pic);

    const Id3v2DecodeResult r = decode_id3v2(make_tag(2, 0, area));
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    ASSERT_EQ(r.record.frames.size(), 2U);
    EXPECT_EQ(r.record.frames[0].id, "TT2");
    ASSERT_EQ(r.record.frames[0].values.size(), 1U);
    EXPECT_EQ(r.record.frames[0].values[0], "Abc");
    EXPECT_EQ(r.record.frames[1].offset, 10U + 6U + 4U);
    EXPECT_EQ(r.record.frames[1].kind, Id3v2FrameKind::Picture);
    EXPECT_EQ(r.record.frames[1].mime_type, "JPG");
    EXPECT_EQ(id3v2_picture_bytes(r.record.frames[1]).size(), 2U);
}


TEST(Id3v2DecodeTest, RemovesTagUnsynchronisationBeforeVersion24)
{
    Bytes area;
    append(&area, "TIT2");
    append_u32be(&area, 4);
    append_u16be(&area, 0);
    append(&area, std::string_view("\0A\xFF\0B", 5));

    const Id3v2DecodeResult r = decode_id3v2(
        make_tag(3, kId3v2Unsynchronisation, area));
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    EXPECT_TRUE(r.record.header.unsynchronisation);
    ASSERT_EQ(r.record.frames.size(), 1U);
    ASSERT_EQ(r.record.frames[0].values.size(), 1U);
    EXPECT_EQ(r.record.frames[0].values[0], "A\xC3\xBF" "B");
}


TEST(Id3v2DecodeTest, RemovesFrameUnsynchronisationInVersion24)
{
    Bytes area;
    append_frame_v4(&area, "TIT2", 0x0002,
                    text_body(0, std::string_view("A\xFF\0B", 4)));

    const Id3v2DecodeResult r = decode_id3v2(make_tag(4, 0, area));
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    ASSERT_EQ(r.record.frames.size(), 1U);
    EXPECT_TRUE(r.record.frames[0].unsynchronised);
    EXPECT_EQ(r.record.frames[0].payload.size(), 4U);
    ASSERT_EQ(r.record.frames[0].values.size(), 1U);
    EXPECT_EQ(r.record.frames[0].values[0], "A\xC3\xBF" "B");
}


TEST(Id3v2DecodeTest, SkipsExtendedHeader)
{
    Bytes area;
    append_u32be(&area, 6);
    area.resize(area.size() + 6, std::byte { 0 });
    append_frame_v3(&area, "TIT2", 0, text_body(0, "X"));

    const Id3v2DecodeResult r = decode_id3v2(
        make_tag(3, kId3v2ExtendedHeader, area));
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    EXPECT_EQ(r.record.header.extended_header_size, 10U);
    ASSERT_EQ(r.record.frames.size(), 1U);
    EXPECT_EQ(r.record.frames[0].offset, 20U);
}


TEST(Id3v2DecodeTest, InvalidExtendedHeaderStopsDecoding)
{
    Bytes area;
    append_u32be(&area, 7);
    area.resize(area.size() + 7, std::byte { 0 });
    append_frame_v3(&area, "TIT2", 0, text_body(0, "X"));

    const Id3v2DecodeResult r = decode_id3v2(
        make_tag(3, kId3v2ExtendedHeader, area));
    EXPECT_EQ(r.status, DecodeStatus::Partial);
    EXPECT_TRUE(r.record.frames.empty());
    ASSERT_EQ(r.anomalies.size(), 1U);
    EXPECT_EQ(r.anomalies[0].kind, AnomalyKind::MalformedStructure);
}


TEST(Id3v2DecodeTest, OversizedFrameKeepsEarlierFrames)
{
    Bytes area;
    append_frame_v3(&area, "TIT2", 0, text_body(0, "Kept"));
    append(&area, "TALB");
    append_u32be(&area, 100);
    append_u16be(&area, 0);
    append(&area, "short");

    const Id3v2DecodeResult r = decode_id3v2(make_tag(3, 0, area));
    EXPECT_EQ(r.status, DecodeStatus::Partial);
    ASSERT_EQ(r.record.frames.size(), 1U);
    EXPECT_EQ(r.record.frames[0].values[0], "Kept");
    ASSERT_EQ(r.anomalies.size(), 1U);
    EXPECT_EQ(r.anomalies[0].kind, AnomalyKind::OutOfBounds);
    EXPECT_EQ(r.anomalies[0].offset, 10U + 10U + 5U);
}


TEST(Id3v2DecodeTest, TagSizePastBufferIsClamped)
{
    Bytes area;
    append_frame_v3(&area, "TIT2", 0, text_body(0, "Cut"));
    const Bytes tag = make_tag(3, 0, area, 1000);

    const Id3v2DecodeResult r = decode_id3v2(tag);
    EXPECT_EQ(r.status, DecodeStatus::Partial);
    ASSERT_EQ(r.record.frames.size(), 1U);
    ASSERT_FALSE(r.anomalies.empty());
    EXPECT_EQ(r.anomalies[0].kind, AnomalyKind::OutOfBounds);
    EXPECT_EQ(r.anomalies[0].offset, 6U);
}


TEST(Id3v2DecodeTest, CutOffFrameHeaderIsTruncation)
{
    Bytes area;
    append_frame_v3(&area, "TIT2", 0, text_body(0, "A"));
    append(&area, "TALB");

    const Id3v2DecodeResult r = decode_id3v2(make_tag(3, 0, area));
    ASSERT_EQ(r.record.frames.size(), 1U);
    ASSERT_EQ(r.anomalies.size(), 1U);
    EXPECT_EQ(r.anomalies[0].kind, AnomalyKind::TruncatedInput);
}


TEST(Id3v2DecodeTest, InvalidFrameIdStops)
{
    Bytes area;
    append_frame_v3(&area, "TIT2", 0, text_body(0, "A"));
    append_frame_v3(&area, "ti!2", 0, text_body(0, "B"));

    const Id3v2DecodeResult r = decode_id3v2(make_tag(3, 0, area));
    ASSERT_EQ(r.record.frames.size(), 1U);
    ASSERT_EQ(r.anomalies.size(), 1U);
    EXPECT_EQ(r.anomalies[0].kind, AnomalyKind::MalformedStructure);
}


TEST(Id3v2DecodeTest, NonSyncsafeFrameSizeInVersion24)
{
    Bytes area;
    append(&area, "TIT2");
    append_u32be(&area, 0x00000080U);
    append_u16be(&area, 0);
    area.resize(area.size() + 0x80, std::byte { 'x' });

    const Id3v2DecodeResult r = decode_id3v2(make_tag(4, 0, area));
    EXPECT_TRUE(r.record.frames.empty());
    ASSERT_EQ(r.anomalies.size(), 1U);
    EXPECT_EQ(r.anomalies[0].kind, AnomalyKind::MalformedStructure);
    EXPECT_EQ(r.anomalies[0].offset, 14U);
}


TEST(Id3v2DecodeTest, FrameLimits)
{
    Bytes area;
    append_frame_v3(&area, "TIT2", 0, text_body(0, "Long title"));
    append_frame_v3(&area, "TPE1", 0, text_body(0, "A"));
    const Bytes tag = make_tag(3, 0, area);

    Id3v2DecodeOptions one_frame;
    one_frame.limits.max_frames = 1;
    const Id3v2DecodeResult a   = decode_id3v2(tag, one_frame);
    EXPECT_EQ(a.record.frames.size(), 1U);
    ASSERT_EQ(a.anomalies.size(), 1U);
    EXPECT_EQ(a.anomalies[0].kind, AnomalyKind::LimitExceeded);

    Id3v2DecodeOptions small_frames;
    small_frames.limits.max_frame_bytes = 4;
    const Id3v2DecodeResult b = decode_id3v2(tag, small_frames);
    ASSERT_EQ(b.record.frames.size(), 1U);
    EXPECT_EQ(b.record.frames[0].id, "TPE1");
    ASSERT_EQ(b.anomalies.size(), 1U);
    EXPECT_EQ(b.anomalies[0].kind, AnomalyKind::LimitExceeded);
    EXPECT_EQ(b.anomalies[0].offset, 10U);
}


TEST(Id3v2DecodeTest, EncryptedFrameKeepsRawPayload)
{
    Bytes body;
    append_u8(&body, 0x80);
    append(&body, "data");
    Bytes area;
    append_frame_v3(&area, "TIT2", 0x0040, body);

    const Id3v2DecodeResult r = decode_id3v2(make_tag(3, 0, area));
    ASSERT_EQ(r.status, DecodeStatus::Ok);
    ASSERT_EQ(r.record.frames.size(), 1U);
    const Id3v2Frame& f = r.record.frames[0];
    EXPECT_TRUE(f.encrypted);
    EXPECT_EQ(f.encryption_id, 0x80U);
    EXPECT_EQ(f.kind, Id3v2FrameKind::Binary);
    EXPECT_EQ(f.payload.size(), 4U);
}


TEST(Id3v2DecodeTest, CompressedFrame)
{
    const Bytes plain = text_body(0, "Compressed title");
#if defined(TAGPROBE_HAS_ZLIB) && TAGPROBE_HAS_ZLIB
    uLongf packed_size = compressBound(static_cast<uLong>(plain.size()));
    Bytes packed(packed_size);
    ASSERT_EQ(compress2(reinterpret_cast<Bytef*>(packed.data()), &packed_size,
                        reinterpret_cast<const Bytef*>(plain.data()),
                        static_cast<uLong>(plain.size()), 9),
              Z_OK);
    packed.resize(packed_size);
#else
    Bytes packed = plain;
#endif

    Bytes body;
    append_u32be(&body, static_cast<uint32_t>(plain.size()));
    append_bytes(&body, packed);
    Bytes area;
    append_frame_v3(&area, "TIT2", 0x0080, body);

    const Id3v2DecodeResult r = decode_id3v2(make_tag(3, 0, area));
    ASSERT_EQ(r.record.frames.size(), 1U);
    const Id3v2Frame& f = r.record.frames[0];
    EXPECT_TRUE(f.compressed);
    EXPECT_EQ(f.data_length, plain.size());
#if defined(TAGPROBE_HAS_ZLIB) && TAGPROBE_HAS_ZLIB
    EXPECT_EQ(r.status, DecodeStatus::Ok);
    EXPECT_EQ(f.kind, Id3v2FrameKind::Text);
    ASSERT_EQ(f.values.size(), 1U);
    EXPECT_EQ(f.values[0], "Compressed title");
#else
    EXPECT_EQ(f.kind, Id3v2FrameKind::Binary);
    EXPECT_EQ(f.payload.size(), packed.size());
#endif
}


TEST(Id3v2DecodeTest, DetectRejectsNonTags)
{
    Bytes area;
    append_frame_v3(&area, "TIT2", 0, text_body(0, "A"));
    const Bytes good = make_tag(3, 0, area);

    EXPECT_FALSE(detect_id3v2(std::span<const std::byte>(good.data(), 9)));
    EXPECT_FALSE(detect_id3v2({}));

    Bytes bad_version = good;
    bad_version[3]    = std::byte { 5 };
    EXPECT_FALSE(detect_id3v2(bad_version));
    EXPECT_EQ(decode_id3v2(bad_version).status, DecodeStatus::NotThisFormat);

    Bytes bad_size = good;
    bad_size[8]    = std::byte { 0x80 };
    EXPECT_FALSE(detect_id3v2(bad_size));
}


TEST(Id3v2DecodeTest, DecodeIsDeterministic)
{
    Bytes area;
    append_frame_v4(&area, "TCON", 0,
                    text_body(3, std::string_view("A\0B", 3)));
    append(&area, "TALB");
    const Bytes tag = make_tag(4, 0, area);

    const Id3v2DecodeResult a = decode_id3v2(tag);
    const Id3v2DecodeResult b = decode_id3v2(tag);
    EXPECT_EQ(a.status, b.status);
    ASSERT_EQ(a.record.frames.size(), b.record.frames.size());
    for (size_t i = 0; i < a.record.frames.size(); ++i) {
        EXPECT_EQ(a.record.frames[i].values, b.record.frames[i].values);
        EXPECT_EQ(a.record.frames[i].payload, b.record.frames[i].payload);
    }
    ASSERT_EQ(a.anomalies.size(), b.anomalies.size());
    for (size_t i = 0; i < a.anomalies.size(); ++i) {
        EXPECT_EQ(a.anomalies[i].kind, b.anomalies[i].kind);
        EXPECT_EQ(a.anomalies[i].offset, b.anomalies[i].offset);
    }
}

}  // namespace tagprobe
