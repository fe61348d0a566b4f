//
// Unit tests for the terminal emulator.
//
// Copyright (c) 2025 Serge Vakulenko
//
// Permission is hereby granted, free of charge, to any person obtaining a copy
// of this software and associated documentation files (the "Software"), to deal
// in the Software without restriction, including without limitation the rights
// to use, copy, modify, merge, publish, distribute, sublicense, and/or sell
// copies of the Software, and to permit persons to whom the Software is
// furnished to do so, subject to the following conditions:
//
// The above copyright notice and this permission notice shall be included in all
// copies or substantial portions of the Software.
//
// THE SOFTWARE IS PROVIDED "AS IS", WITHOUT WARRANTY OF ANY KIND, EXPRESS OR
// IMPLIED, INCLUDING BUT NOT LIMITED TO THE WARRANTIES OF MERCHANTABILITY,
// FITNESS FOR A PARTICULAR PURPOSE AND NONINFRINGEMENT. IN NO EVENT SHALL THE
// AUTHORS OR COPYRIGHT HOLDERS BE LIABLE FOR ANY CLAIM, DAMAGES OR OTHER
// LIABILITY, WHETHER IN AN ACTION OF CONTRACT, TORT OR OTHERWISE, ARISING FROM,
// OUT OF OR IN CONNECTION WITH THE SOFTWARE OR THE USE OR OTHER DEALINGS IN THE
// SOFTWARE.
//
#include <gtest/gtest.h>

#include <memory>
#include <stdexcept>
#include <string>

#include "emulator.h"

// Test fixture for Emulator
class EmulatorTest : public ::testing::Test {
protected:
    void SetUp() override { emu = std::make_unique<Emulator>(24, 80); }

    const Screen &screen() const { return emu->screen(); }

    // Fill a whole row with the given character, leaving the cursor on that row.
    void fill_row(int row, char ch)
    {
        emu->feed("\033[" + std::to_string(row + 1) + ";1H" + std::string(80, ch));
    }

    std::unique_ptr<Emulator> emu;
};

// Test ESC c (reset and clear screen)
TEST_F(EmulatorTest, EscCResetsState)
{
    emu->feed("\033[31;1mhello\033[5;10H\033[?25l");
    EXPECT_TRUE(emu->current_attr.bold);

    emu->feed("\033c");

    EXPECT_EQ(emu->current_attr, CharAttr());
    EXPECT_EQ(screen().get_cursor(), Cursor());
    EXPECT_TRUE(screen().is_cursor_visible());
    for (int r = 0; r < screen().get_rows(); ++r) {
        for (int c = 0; c < screen().get_cols(); ++c) {
            EXPECT_TRUE(screen().cell(r, c).contents.empty());
        }
    }
}

// Test ESC [ K (erase in line)
TEST_F(EmulatorTest, EscKClearsLine)
{
    // Mode 0: clear from cursor to end
    fill_row(5, 'x');
    emu->feed("\033[6;11H\033[0K");
    EXPECT_EQ(screen().row_text(5), std::string(10, 'x'));

    // Mode 1: clear from start to cursor
    fill_row(5, 'x');
    emu->feed("\033[6;11H\033[1K");
    EXPECT_EQ(screen().row_text(5), std::string(11, ' ') + std::string(69, 'x'));

    // Mode 2: clear entire line
    fill_row(5, 'x');
    emu->feed("\033[6;11H\033[2K");
    EXPECT_EQ(screen().row_text(5), "");
    EXPECT_EQ(screen().get_cursor(), (Cursor{ 5, 10 }));
}

// Test ESC [ J (erase in display)
TEST_F(EmulatorTest, EscJErasesDisplay)
{
    fill_row(0, 'a');
    fill_row(1, 'b');
    fill_row(2, 'c');

    emu->feed("\033[2;41H\033[0J");
    EXPECT_EQ(screen().row_text(0), std::string(80, 'a'));
    EXPECT_EQ(screen().row_text(1), std::string(40, 'b'));
    EXPECT_EQ(screen().row_text(2), "");

    emu->feed("\033[1;11H\033[1J");
    EXPECT_EQ(screen().row_text(0), std::string(11, ' ') + std::string(69, 'a'));

    // Erasing everything leaves the cursor in place.
    emu->feed("\033[2J");
    EXPECT_EQ(screen().contents(), std::string(23, '\n'));
    EXPECT_EQ(screen().get_cursor(), (Cursor{ 0, 10 }));
}

// Test ESC [ m (SGR)
TEST_F(EmulatorTest, EscMSetsAttributes)
{
    emu->feed("\033[1;3;4;7m");
    EXPECT_TRUE(emu->current_attr.bold);
    EXPECT_TRUE(emu->current_attr.italic);
    EXPECT_TRUE(emu->current_attr.underline);
    EXPECT_TRUE(emu->current_attr.inverse);

    emu->feed("\033[22;23;24;27m");
    EXPECT_EQ(emu->current_attr, CharAttr());

    emu->feed("\033[31;42m");
    EXPECT_EQ(emu->current_attr.fg, TermColor::indexed(1));
    EXPECT_EQ(emu->current_attr.bg, TermColor::indexed(2));

    emu->feed("\033[m");
    EXPECT_EQ(emu->current_attr, CharAttr());
}

TEST_F(EmulatorTest, ExtendedColors)
{
    emu->feed("\033[38;5;196m");
    EXPECT_EQ(emu->current_attr.fg, TermColor::indexed(196));

    emu->feed("\033[48;2;10;20;30m");
    EXPECT_EQ(emu->current_attr.bg, TermColor::rgb(10, 20, 30));

    emu->feed("\033[39;49m");
    EXPECT_TRUE(emu->current_attr.fg.is_default());
    EXPECT_TRUE(emu->current_attr.bg.is_default());

    emu->feed("\033[95;103m");
    EXPECT_EQ(emu->current_attr.fg, TermColor::indexed(13));
    EXPECT_EQ(emu->current_attr.bg, TermColor::indexed(11));

    // Colon separated form
    emu->feed("\033[38:5:21m");
    EXPECT_EQ(emu->current_attr.fg, TermColor::indexed(21));
}

TEST_F(EmulatorTest, AttributesApplyToWrittenCells)
{
    emu->feed("\033[1;7mA\033[0mB");
    EXPECT_TRUE(screen().cell(0, 0).attr.bold);
    EXPECT_TRUE(screen().cell(0, 0).attr.inverse);
    EXPECT_EQ(screen().cell(0, 1).attr, CharAttr());
}

TEST_F(EmulatorTest, ErasedCellsKeepBackground)
{
    emu->feed("text\033[41m\033[2K");
    EXPECT_TRUE(screen().cell(0, 0).contents.empty());
    EXPECT_EQ(screen().cell(0, 0).attr.bg, TermColor::indexed(1));
}

TEST_F(EmulatorTest, CursorMotion)
{
    emu->feed("\033[10;20H");
    EXPECT_EQ(screen().get_cursor(), (Cursor{ 9, 19 }));
    emu->feed("\033[3A");
    EXPECT_EQ(screen().get_cursor(), (Cursor{ 6, 19 }));
    emu->feed("\033[2B");
    EXPECT_EQ(screen().get_cursor(), (Cursor{ 8, 19 }));
    emu->feed("\033[5C");
    EXPECT_EQ(screen().get_cursor(), (Cursor{ 8, 24 }));
    emu->feed("\033[4D");
    EXPECT_EQ(screen().get_cursor(), (Cursor{ 8, 20 }));
    emu->feed("\033[G");
    EXPECT_EQ(screen().get_cursor(), (Cursor{ 8, 0 }));
    emu->feed("\033[5d");
    EXPECT_EQ(screen().get_cursor(), (Cursor{ 4, 0 }));
    emu->feed("\033[2E");
    EXPECT_EQ(screen().get_cursor(), (Cursor{ 6, 0 }));

    // Out of range positions are clamped.
    emu->feed("\033[100;200H");
    EXPECT_EQ(screen().get_cursor(), (Cursor{ 23, 79 }));
    emu->feed("\033[99A");
    EXPECT_EQ(screen().get_cursor(), (Cursor{ 0, 79 }));
}

TEST_F(EmulatorTest, ControlCharacters)
{
    // Line feed keeps the column.
    emu->feed("ab\ncd");
    EXPECT_EQ(screen().row_text(0), "ab");
    EXPECT_EQ(screen().row_text(1), "  cd");

    // Backspace moves without erasing.
    emu->feed("\r\n\nxyz\b");
    EXPECT_EQ(screen().row_text(3), "xyz");
    EXPECT_EQ(screen().get_cursor(), (Cursor{ 3, 2 }));

    // Tab stops every 8 columns.
    emu->feed("\r\na\tb");
    EXPECT_EQ(screen().cell(4, 8).contents, "b");

    // Bell is ignored.
    emu->feed("\a");
    EXPECT_EQ(screen().get_cursor(), (Cursor{ 4, 9 }));
}

TEST(EmulatorWrapTest, AutowrapIsDeferred)
{
    Emulator emu(5, 10);
    emu.feed("0123456789");
    EXPECT_EQ(emu.screen().get_cursor(), (Cursor{ 0, 9 }));

    emu.feed("k");
    EXPECT_EQ(emu.screen().row_text(0), "0123456789");
    EXPECT_EQ(emu.screen().row_text(1), "k");
    EXPECT_EQ(emu.screen().get_cursor(), (Cursor{ 1, 1 }));
}

TEST(EmulatorWrapTest, AutowrapDisabled)
{
    Emulator emu(5, 10);
    emu.feed("\033[?7l0123456789XY");
    EXPECT_EQ(emu.screen().row_text(0), "012345678Y");
    EXPECT_EQ(emu.screen().row_text(1), "");
}

TEST(EmulatorScrollTest, HistoryIsBounded)
{
    Emulator emu(3, 10, 2);
    emu.feed("1\r\n2\r\n3\r\n4\r\n5\r\n6");

    EXPECT_EQ(emu.screen().contents(), "4\n5\n6");
    const auto &history = emu.screen().get_history();
    ASSERT_EQ(history.size(), 2u);
    EXPECT_EQ(history[0][0].contents, "2");
    EXPECT_EQ(history[1][0].contents, "3");
}

TEST_F(EmulatorTest, ScrollRegion)
{
    Emulator small(5, 10);
    small.feed("0\r\n1\r\n2\r\n3\r\n4");

    small.feed("\033[2;4r");
    EXPECT_EQ(small.scroll_top, 1);
    EXPECT_EQ(small.scroll_bottom, 3);
    EXPECT_EQ(small.screen().get_cursor(), Cursor());

    // Line feed at the bottom margin scrolls only the region.
    small.feed("\033[4;1H\n");
    EXPECT_EQ(small.screen().contents(), "0\n2\n3\n\n4");
    EXPECT_TRUE(small.screen().get_history().empty());

    // Reverse index at the top margin.
    small.feed("\033[2;1H\033M");
    EXPECT_EQ(small.screen().contents(), "0\n\n2\n3\n4");
}

TEST(EmulatorScrollTest, ScrollUpAndDown)
{
    Emulator emu(4, 10);
    emu.feed("a\r\nb\r\nc\r\nd");

    emu.feed("\033[S");
    EXPECT_EQ(emu.screen().contents(), "b\nc\nd\n");
    emu.feed("\033[2T");
    EXPECT_EQ(emu.screen().contents(), "\n\nb\nc");
}

TEST(EmulatorEditTest, InsertDeleteChars)
{
    Emulator emu(3, 10);
    emu.feed("abcdef\033[1;3H\033[2@");
    EXPECT_EQ(emu.screen().row_text(0), "ab  cdef");

    emu.feed("\033[2P");
    EXPECT_EQ(emu.screen().row_text(0), "abcdef");

    emu.feed("\033[3X");
    EXPECT_EQ(emu.screen().row_text(0), "ab   f");
}

TEST(EmulatorEditTest, InsertDeleteLines)
{
    Emulator emu(4, 10);
    emu.feed("a\r\nb\r\nc\r\nd");

    emu.feed("\033[2;1H\033[L");
    EXPECT_EQ(emu.screen().contents(), "a\n\nb\nc");

    emu.feed("\033[M");
    EXPECT_EQ(emu.screen().contents(), "a\nb\nc\n");
}

TEST_F(EmulatorTest, WideGlyphTakesTwoCells)
{
    emu->feed("\xe4\xb8\xad|"); // U+4E2D

    EXPECT_EQ(screen().cell(0, 0).contents, "\xe4\xb8\xad");
    EXPECT_TRUE(screen().cell(0, 0).wide);
    EXPECT_TRUE(screen().cell(0, 1).wide_continuation);
    EXPECT_EQ(screen().cell(0, 2).contents, "|");
    EXPECT_EQ(screen().row_text(0), "\xe4\xb8\xad|");
}

TEST_F(EmulatorTest, OverwritingHalfOfWideGlyph)
{
    emu->feed("\xe4\xb8\xad\033[1;2Hx");

    EXPECT_TRUE(screen().cell(0, 0).contents.empty());
    EXPECT_FALSE(screen().cell(0, 0).wide);
    EXPECT_EQ(screen().cell(0, 1).contents, "x");
    EXPECT_FALSE(screen().cell(0, 1).wide_continuation);
}

TEST(EmulatorWrapTest, WideGlyphAtRightMargin)
{
    Emulator emu(3, 5);
    emu.feed("abcd\xe4\xb8\xad");

    EXPECT_EQ(emu.screen().row_text(0), "abcd");
    EXPECT_TRUE(emu.screen().cell(1, 0).wide);
    EXPECT_TRUE(emu.screen().cell(1, 1).wide_continuation);
    EXPECT_EQ(emu.screen().get_cursor(), (Cursor{ 1, 2 }));
}

TEST_F(EmulatorTest, CombiningMarkJoinsPreviousCell)
{
    emu->feed("e\xcc\x81x"); // e + U+0301

    EXPECT_EQ(screen().cell(0, 0).contents, "e\xcc\x81");
    EXPECT_EQ(screen().cell(0, 1).contents, "x");
}

// Test UTF-8 decoding
TEST_F(EmulatorTest, Utf8SplitAcrossChunks)
{
    emu->feed("\xe2\x82");
    EXPECT_EQ(emu->utf8_pending, 1);
    EXPECT_TRUE(screen().cell(0, 0).contents.empty());

    emu->feed("\xac");
    EXPECT_EQ(emu->utf8_pending, 0);
    EXPECT_EQ(screen().cell(0, 0).contents, "\xe2\x82\xac"); // €

    // 4-byte sequence (emoji) split in the middle
    emu->feed("\xf0\x9f");
    emu->feed("\x98\x80");
    EXPECT_EQ(screen().cell(0, 1).contents, "\xf0\x9f\x98\x80");
}

TEST_F(EmulatorTest, InvalidUtf8BecomesReplacement)
{
    emu->feed("\xff");
    EXPECT_EQ(screen().cell(0, 0).contents, "\xef\xbf\xbd");

    // Truncated sequence: the interrupting byte is kept.
    emu->feed("\xe2" "A");
    EXPECT_EQ(screen().cell(0, 1).contents, "\xef\xbf\xbd");
    EXPECT_EQ(screen().cell(0, 2).contents, "A");
}

TEST_F(EmulatorTest, CursorVisibility)
{
    EXPECT_TRUE(screen().is_cursor_visible());
    emu->feed("\033[?25l");
    EXPECT_FALSE(screen().is_cursor_visible());
    emu->feed("\033[?25h");
    EXPECT_TRUE(screen().is_cursor_visible());
}

TEST_F(EmulatorTest, AlternateScreen)
{
    emu->feed("primary\033[?1049h");
    EXPECT_TRUE(screen().is_alternate());
    EXPECT_EQ(screen().row_text(0), "");

    emu->feed("alt");
    EXPECT_EQ(screen().row_text(0), "       alt");

    emu->feed("\033[?1049l");
    EXPECT_FALSE(screen().is_alternate());
    EXPECT_EQ(screen().row_text(0), "primary");
    EXPECT_EQ(screen().get_cursor(), (Cursor{ 0, 7 }));
}

TEST_F(EmulatorTest, SaveRestoreCursor)
{
    emu->feed("\033[5;5H\0337\033[1;1H\0338");
    EXPECT_EQ(screen().get_cursor(), (Cursor{ 4, 4 }));

    emu->feed("\033[10;10H\033[s\033[H\033[u");
    EXPECT_EQ(screen().get_cursor(), (Cursor{ 9, 9 }));
}

TEST_F(EmulatorTest, StringSequencesAreIgnored)
{
    emu->feed("\033]0;window title\aok");
    EXPECT_EQ(screen().row_text(0), "ok");

    emu->feed("\033]2;other\033\\!");
    EXPECT_EQ(screen().row_text(0), "ok!");

    // Charset designation and keypad modes
    emu->feed("\033(B\033=\033>?");
    EXPECT_EQ(screen().row_text(0), "ok!?");
}

TEST_F(EmulatorTest, UnknownSequencesAreConsumed)
{
    emu->feed("\033[>c\033[6n\033[2 qZ");
    EXPECT_EQ(screen().row_text(0), "Z");
}

TEST(EmulatorFeedTest, ChunkingDoesNotMatter)
{
    const std::string input = "\033[1;31mred\033[0m \xe4\xb8\xad\xe6\x96\x87 e\xcc\x81\r\n"
                              "\033[2;5Hmid\033[K\033]0;t\a\033[?25l\tend\r\n\033[3S";
    Emulator whole(6, 20);
    Emulator bytes(6, 20);

    whole.feed(input);
    for (char c : input) {
        bytes.feed(&c, 1);
    }

    EXPECT_EQ(whole.screen().contents(), bytes.screen().contents());
    EXPECT_EQ(whole.screen().get_cursor(), bytes.screen().get_cursor());
    EXPECT_EQ(whole.screen().is_cursor_visible(), bytes.screen().is_cursor_visible());
    for (int r = 0; r < 6; ++r) {
        for (int c = 0; c < 20; ++c) {
            EXPECT_EQ(whole.screen().cell(r, c), bytes.screen().cell(r, c));
        }
    }
}

TEST(EmulatorFeedTest, EmptyGridIsRejected)
{
    EXPECT_THROW(Emulator(0, 80), std::invalid_argument);
    EXPECT_THROW(Emulator(24, -1), std::invalid_argument);
}

int main(int argc, char **argv)
{
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
