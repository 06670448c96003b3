#include "tagprobe/byte_reader.h"
#include "tagprobe/console_format.h"

#include <gtest/gtest.h>

#include <array>
#include <cstddef>
#include <string>

namespace tagprobe {

TEST(ConsoleFormatTest, EscapesControlBytes)
{
    std::string out;
    EXPECT_TRUE(append_console_escaped_ascii(std::string_view("a\nb\x1B", 4),
                                             0, &out));
    EXPECT_EQ(out, "a\\nb\\x1B");

    out.clear();
    EXPECT_FALSE(append_console_escaped_ascii("say \"hi\"", 0, &out));
    EXPECT_EQ(out, "say \\\"hi\\\"");
}


TEST(ConsoleFormatTest, AsciiTruncates)
{
    std::string out;
    EXPECT_TRUE(append_console_escaped_ascii("abcdef", 3, &out));
    EXPECT_EQ(out, "abc...");
}


TEST(ConsoleFormatTest, Utf8PassesPrintableSequences)
{
    std::string out;
    EXPECT_FALSE(append_console_escaped_utf8("Caf\xC3\xA9", 0, &out));
    EXPECT_EQ(out, "Caf\xC3\xA9");

    // C1 control U+0085 is escaped byte by byte.
    out.clear();
    EXPECT_TRUE(append_console_escaped_utf8("\xC2\x85", 0, &out));
    EXPECT_EQ(out, "\\xC2\\x85");
}


TEST(ConsoleFormatTest, Utf8TruncationKeepsSequencesWhole)
{
    std::string out;
    EXPECT_TRUE(append_console_escaped_utf8("a\xC3\xA9z", 2, &out));
    EXPECT_EQ(out, "a...");
}


TEST(ConsoleFormatTest, HexBytes)
{
    const std::array<std::byte, 3> b = { std::byte { 0x00 }, std::byte { 0xAB },
                                         std::byte { 0x7F } };
    std::string out;
    append_hex_bytes(b, 0, &out);
    EXPECT_EQ(out, "00AB7F");

    out.clear();
    append_hex_bytes(b, 2, &out);
    EXPECT_EQ(out, "00AB...");
}


TEST(ConsoleFormatTest, FourccKeepsPadding)
{
    std::string out;
    append_fourcc(fourcc('R', 'G', 'B', ' '), &out);
    EXPECT_EQ(out, "RGB ");

    out.clear();
    append_fourcc(0x00414243U, &out);
    EXPECT_EQ(out, "\\x00ABC");
}

}  // namespace tagprobe
