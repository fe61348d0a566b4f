//
// ANSI/VT100 logic of the terminal emulator.
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
#ifndef EMULATOR_H
#define EMULATOR_H

#include <gtest/gtest_prod.h>

#include <cstdint>
#include <string>
#include <vector>

#include "screen.h"

// ANSI parsing states
enum class AnsiState { NORMAL, ESCAPE, CSI, OSC, OSC_ESCAPE, CHARSET };

class Emulator {
public:
    static constexpr size_t DEFAULT_HISTORY = 1000;

    // Throws std::invalid_argument for an empty grid.
    Emulator(int rows, int cols, size_t history_limit = DEFAULT_HISTORY);

    // Advance the state machine over a chunk of shell output.
    void feed(const char *buffer, size_t length);
    void feed(const std::string &data) { feed(data.data(), data.size()); }

    const Screen &screen() const { return display; }

private:
    // Declare test cases as friends
    FRIEND_TEST(EmulatorTest, EscMSetsAttributes);
    FRIEND_TEST(EmulatorTest, ExtendedColors);
    FRIEND_TEST(EmulatorTest, ScrollRegion);
    FRIEND_TEST(EmulatorTest, Utf8SplitAcrossChunks);
    FRIEND_TEST(EmulatorTest, EscCResetsState);

    Screen display;
    AnsiState state{ AnsiState::NORMAL };
    std::string ansi_seq;
    CharAttr current_attr;

    // Partially decoded UTF-8 sequence.
    uint32_t utf8_char{};
    int utf8_pending{};

    // Cursor sits past the right margin; the next glyph wraps first.
    bool wrap_pending{};
    bool autowrap{ true };

    // Scrolling region, inclusive.
    int scroll_top{};
    int scroll_bottom;

    Cursor saved_cursor;
    CharAttr saved_attr;
    std::vector<CellRow> saved_primary;

    // Where the last glyph went, for combining marks.
    bool have_last{};
    Cursor last_glyph;

    void process_byte(unsigned char c);
    void decode_utf8(unsigned char c);
    void execute_control(unsigned char c);
    void put_char(uint32_t ch);
    void append_combining(uint32_t ch);

    // ANSI parsing methods
    void parse_escape(unsigned char c);
    void parse_ansi_sequence(const std::string &seq);
    void handle_csi_sequence(char final_char, char prefix, const std::vector<int> &params);
    void handle_sgr(const std::vector<int> &params);
    void set_mode(char prefix, const std::vector<int> &params, bool enable);

    // Terminal management methods
    Cell blank_cell() const;
    void move_cursor(int row, int col);
    void line_feed();
    void reverse_index();
    void scroll_up(int count);
    void scroll_down(int count);
    void erase_cells(int row, int from_col, int to_col);
    void erase_rows(int from_row, int to_row);
    void insert_chars(int count);
    void delete_chars(int count);
    void insert_lines(int count);
    void delete_lines(int count);
    void clear_wide_overlap(int row, int col);
    void repair_wide_cells(int row);
    void switch_screen(bool to_alternate);
    void save_cursor();
    void restore_cursor();
    void reset_state();
};

#endif // EMULATOR_H
