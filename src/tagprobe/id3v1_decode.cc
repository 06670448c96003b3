#include "tagprobe/id3v1_decode.h"

#include "tagprobe/byte_reader.h"
#include "tagprobe/text_decode.h"

#include <array>

namespace tagprobe {
namespace {

    // ID3v1 genres 0..79 plus the Winamp extensions 80..191.
    static constexpr std::array<std::string_view, 192> kGenres = {
        "Blues",
        "Classic Rock",
        "Country",
        "Dance",
        "Disco",
        "Funk",
        "Grunge",
        "Hip-Hop",
        "Jazz",
        "Metal",
        "New Age",
        "Oldies",
        "Other",
        "Pop",
        "R&B",
        "Rap",
        "Reggae",
        "Rock",
        "Techno",
        "Industrial",
        "Alternative",
        "Ska",
        "Death Metal",
        "Pranks",
        "Soundtrack",
        "Euro-Techno",
        "Ambient",
        "Trip-Hop",
        "Vocal",
        "Jazz+Funk",
        "Fusion",
        "Trance",
        "Classical",
        "Instrumental",
        "Acid",
        "House",
        "Game",
        "Sound Clip",
        "Gospel",
        "Noise",
        "AlternRock",
        "Bass",
        "Soul",
        "Punk",
        "Space",
        "Meditative",
        "Instrumental Pop",
        "Instrumental Rock",
        "Ethnic",
        "Gothic",
        "Darkwave",
        "Techno-Industrial",
        "Electronic",
        "Pop-Folk",
        "Eurodance",
        "Dream",
        "Southern Rock",
        "Comedy",
        "Cult",
        "Gangsta",
        "Top 40",
        "Christian Rap",
        "Pop/Funk",
        "Jungle",
        "Native American",
        "Cabaret",
        "New Wave",
        "Psychedelic",
        "Rave",
        "Showtunes",
        "Trailer",
        "Lo-Fi",
        "Tribal",
        "Acid Punk",
        "Acid Jazz",
        "Polka",
        "Retro",
        "Musical",
        "Rock & Roll",
        "Hard Rock",
        "Folk",
        "Folk-Rock",
        "National Folk",
        "Swing",
        "Fast Fusion",
        "Bebop",
        "Latin",
        "Revival",
        "Celtic",
        "Bluegrass",
        "Avantgarde",
        "Gothic Rock",
        "Progressive Rock",
        "Psychedelic Rock",
        "Symphonic Rock",
        "Slow Rock",
        "Big Band",
        "Chorus",
        "Easy Listening",
        "Acoustic",
        "Humour",
        "Speech",
        "Chanson",
        "Opera",
        "Chamber Music",
        "Sonata",
        "Symphony",
        "Booty Bass",
        "Primus",
        "Porn Groove",
        "Satire",
        "Slow Jam",
        "Club",
        "Tango",
        "Samba",
        "Folklore",
        "Ballad",
        "Power Ballad",
        "Rhythmic Soul",
        "Freestyle",
        "Duet",
        "Punk Rock",
        "Drum Solo",
        "A Cappella",
        "Euro-House",
        "Dance Hall",
        "Goa",
        "Drum & Bass",
        "Club-House",
        "Hardcore",
        "Terror",
        "Indie",
        "BritPop",
        "Afro-Punk",
        "Polsk Punk",
        "Beat",
        "Christian Gangsta Rap",
        "Heavy Metal",
        "Black Metal",
        "Crossover",
        "Contemporary Christian",
        "Christian Rock",
        "Merengue",
        "Salsa",
        "Thrash Metal",
        "Anime",
        "JPop",
        "Synthpop",
        "Abstract",
        "Art Rock",
        "Baroque",
        "Bhangra",
        "Big Beat",
        "Breakbeat",
        "Chillout",
        "Downtempo",
        "Dub",
        "EBM",
        "Eclectic",
        "Electro",
        "Electroclash",
        "Emo",
        "Experimental",
        "Garage",
        "Global",
        "IDM",
        "Illbient",
        "Industro-Goth",
        "Jam Band",
        "Krautrock",
        "Leftfield",
        "Lounge",
        "Math Rock",
        "New Romantic",
        "Nu-Breakz",
        "Post-Punk",
        "Post-Rock",
        "Psytrance",
        "Shoegaze",
        "Space Rock",
        "Trop Rock",
        "World Music",
        "Neoclassical",
        "Audiobook",
        "Audio Theatre",
        "Neue Deutsche Welle",
        "Podcast",
        "Indie Rock",
        "G-Funk",
        "Dubstep",
        "Garage Rock",
        "Psybient",
    };

    // Offsets within the 128-byte trailer.
    static constexpr uint64_t kTitleOff   = 3;
    static constexpr uint64_t kArtistOff  = 33;
    static constexpr uint64_t kAlbumOff   = 63;
    static constexpr uint64_t kYearOff    = 93;
    static constexpr uint64_t kCommentOff = 97;
    static constexpr uint64_t kGenreOff   = 127;

    static void read_latin1_field(std::span<const std::byte> trailer,
                                  uint64_t offset, uint64_t size,
                                  std::string* out)
    {
        std::string raw;
        if (!read_fixed_string(trailer, offset, size, &raw)) {
            return;
        }
        // The Latin-1 to UTF-8 conversion cannot fail.
        (void)decode_text_to_utf8(
            std::span<const std::byte>(
                reinterpret_cast<const std::byte*>(raw.data()), raw.size()),
            TextEncoding::Latin1, out);
    }

    static bool is_year(std::string_view s) noexcept
    {
        if (s.size() != 4) {
            return false;
        }
        for (size_t i = 0; i < s.size(); ++i) {
            if (s[i] < '0' || s[i] > '9') {
                return false;
            }
        }
        return true;
    }

}  // namespace

bool
detect_id3v1(std::span<const std::byte> bytes) noexcept
{
    if (bytes.size() < kId3v1TagSize) {
        return false;
    }
    return match_bytes(bytes, bytes.size() - kId3v1TagSize, "TAG");
}


Id3v1DecodeResult
decode_id3v1(std::span<const std::byte> bytes)
{
    Id3v1DecodeResult result;
    if (!detect_id3v1(bytes)) {
        result.status = DecodeStatus::NotThisFormat;
        return result;
    }

    const uint64_t base = bytes.size() - kId3v1TagSize;
    const std::span<const std::byte> trailer
        = bytes.subspan(static_cast<size_t>(base), kId3v1TagSize);

    Id3v1Tag& tag = result.record;
    tag.offset    = base;

    read_latin1_field(trailer, kTitleOff, 30, &tag.title);
    read_latin1_field(trailer, kArtistOff, 30, &tag.artist);
    read_latin1_field(trailer, kAlbumOff, 30, &tag.album);
    read_latin1_field(trailer, kYearOff, 4, &tag.year);

    // ID3v1.1: comment[28] == 0 and comment[29] != 0 carries a track number.
    uint8_t sentinel = 0;
    uint8_t track    = 0;
    (void)read_u8(trailer, kCommentOff + 28, &sentinel);
    (void)read_u8(trailer, kCommentOff + 29, &track);
    if (sentinel == 0 && track != 0) {
        tag.is_v1_1 = true;
        tag.track   = track;
        read_latin1_field(trailer, kCommentOff, 28, &tag.comment);
    } else {
        read_latin1_field(trailer, kCommentOff, 30, &tag.comment);
    }

    (void)read_u8(trailer, kGenreOff, &tag.genre);
    tag.genre_name = id3v1_genre_name(tag.genre);

    if (!tag.year.empty() && !is_year(tag.year)) {
        add_anomaly(&result, AnomalyKind::MalformedStructure,
                    base + kYearOff, "year is not 4 ASCII digits");
    }
    return result;
}


std::string_view
id3v1_genre_name(uint8_t genre) noexcept
{
    if (genre >= kGenres.size()) {
        return {};
    }
    return kGenres[genre];
}

}  // namespace tagprobe
