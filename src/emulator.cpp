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
#include "emulator.h"

#include <unicode/uchar.h>
#include <unicode/utf8.h>

#include <algorithm>
#include <cctype>

static const uint32_t REPLACEMENT_CHAR = 0xFFFD;
static const int MAX_PARAM             = 65535;
static const size_t MAX_SEQUENCE       = 64;
static const size_t MAX_CELL_BYTES     = 32;

//
// Number of grid columns taken by a code point:
// 0 for combining marks, 2 for East Asian wide and fullwidth.
//
static int char_columns(uint32_t ch)
{
    UChar32 c   = static_cast<UChar32>(ch);
    int8_t type = u_charType(c);
    if (type == U_NON_SPACING_MARK || type == U_ENCLOSING_MARK ||
        u_hasBinaryProperty(c, UCHAR_DEFAULT_IGNORABLE_CODE_POINT)) {
        return 0;
    }
    int width = u_getIntPropertyValue(c, UCHAR_EAST_ASIAN_WIDTH);
    if (width == U_EA_WIDE || width == U_EA_FULLWIDTH) {
        return 2;
    }
    return 1;
}

static std::string to_utf8(uint32_t ch)
{
    char buf[U8_MAX_LENGTH];
    int32_t length = 0;
    U8_APPEND_UNSAFE(buf, length, static_cast<UChar32>(ch));
    return std::string(buf, length);
}

static int get_param(const std::vector<int> &params, size_t index, int default_value)
{
    if (params.size() > index && params[index] > 0) {
        return params[index];
    }
    return default_value;
}

Emulator::Emulator(int rows, int cols, size_t history_limit)
    : display(rows, cols, history_limit), scroll_bottom(rows - 1)
{
}

void Emulator::feed(const char *buffer, size_t length)
{
    for (size_t i = 0; i < length; ++i) {
        process_byte(static_cast<unsigned char>(buffer[i]));
    }
}

void Emulator::process_byte(unsigned char c)
{
    switch (state) {
    case AnsiState::NORMAL:
        if (utf8_pending > 0 || c >= 0x80) {
            decode_utf8(c);
        } else if (c == '\033') {
            state = AnsiState::ESCAPE;
            ansi_seq.clear();
        } else if (c < 0x20 || c == 0x7f) {
            execute_control(c);
        } else {
            put_char(c);
        }
        break;

    case AnsiState::ESCAPE:
        parse_escape(c);
        break;

    case AnsiState::CSI:
        if (c == '\033') {
            state = AnsiState::ESCAPE;
            ansi_seq.clear();
        } else if (c == 0x18 || c == 0x1a) {
            // CAN and SUB abort the sequence.
            state = AnsiState::NORMAL;
            ansi_seq.clear();
        } else if (c < 0x20) {
            execute_control(c);
        } else if (c >= 0x40 && c <= 0x7e) {
            ansi_seq += c;
            parse_ansi_sequence(ansi_seq);
            state = AnsiState::NORMAL;
            ansi_seq.clear();
        } else if (ansi_seq.size() < MAX_SEQUENCE) {
            ansi_seq += c;
        }
        break;

    case AnsiState::OSC:
        // Operating system commands and other strings are consumed and ignored.
        if (c == '\a') {
            state = AnsiState::NORMAL;
        } else if (c == '\033') {
            state = AnsiState::OSC_ESCAPE;
        }
        break;

    case AnsiState::OSC_ESCAPE:
        // ESC \ terminates the string; any other ESC starts a new sequence.
        if (c == '\\') {
            state = AnsiState::NORMAL;
        } else {
            parse_escape(c);
        }
        break;

    case AnsiState::CHARSET:
        // Character set designation: G0/G1 are always UTF-8 here.
        state = AnsiState::NORMAL;
        break;
    }
}

void Emulator::decode_utf8(unsigned char c)
{
    if (utf8_pending > 0) {
        if ((c & 0xC0) == 0x80) {
            utf8_char = (utf8_char << 6) | (c & 0x3F);
            if (--utf8_pending == 0) {
                uint32_t ch = utf8_char;
                if (ch > 0x10FFFF || (ch >= 0xD800 && ch <= 0xDFFF)) {
                    ch = REPLACEMENT_CHAR;
                }
                put_char(ch);
            }
            return;
        }
        // Truncated sequence: replace it and process this byte afresh.
        utf8_pending = 0;
        put_char(REPLACEMENT_CHAR);
        process_byte(c);
        return;
    }

    if ((c & 0xE0) == 0xC0) {
        utf8_char    = c & 0x1F;
        utf8_pending = 1;
    } else if ((c & 0xF0) == 0xE0) {
        utf8_char    = c & 0x0F;
        utf8_pending = 2;
    } else if ((c & 0xF8) == 0xF0) {
        utf8_char    = c & 0x07;
        utf8_pending = 3;
    } else {
        put_char(REPLACEMENT_CHAR);
    }
}

void Emulator::execute_control(unsigned char c)
{
    auto &cursor = display.cursor;

    switch (c) {
    case '\b':
        wrap_pending = false;
        if (cursor.col > 0) {
            cursor.col--;
        }
        break;
    case '\t':
        move_cursor(cursor.row, std::min((cursor.col + 8) / 8 * 8, display.term_cols - 1));
        break;
    case '\n':
    case '\v':
    case '\f':
        line_feed();
        break;
    case '\r':
        cursor.col   = 0;
        wrap_pending = false;
        break;
    default:
        // Bell, shift in/out and the rest have no visible effect.
        break;
    }
}

void Emulator::put_char(uint32_t ch)
{
    if (ch < 0x20 || (ch >= 0x7f && ch < 0xa0)) {
        ch = REPLACEMENT_CHAR;
    }
    int width = char_columns(ch);
    if (width == 0) {
        append_combining(ch);
        return;
    }

    auto &grid   = display.grid;
    auto &cursor = display.cursor;
    int cols     = display.term_cols;
    if (width == 2 && cols < 2) {
        width = 1;
    }

    if (wrap_pending) {
        wrap_pending = false;
        cursor.col   = 0;
        line_feed();
    }
    if (width == 2 && cursor.col == cols - 1) {
        // No room for the right half on this line.
        if (autowrap) {
            clear_wide_overlap(cursor.row, cursor.col);
            grid[cursor.row][cursor.col] = blank_cell();
            cursor.col                   = 0;
            line_feed();
        } else {
            cursor.col = cols - 2;
        }
    }

    clear_wide_overlap(cursor.row, cursor.col);
    if (width == 2) {
        clear_wide_overlap(cursor.row, cursor.col + 1);
    }

    Cell &cell             = grid[cursor.row][cursor.col];
    cell.contents          = to_utf8(ch);
    cell.attr              = current_attr;
    cell.wide              = (width == 2);
    cell.wide_continuation = false;
    if (width == 2) {
        Cell &next = grid[cursor.row][cursor.col + 1];
        next.contents.clear();
        next.attr              = current_attr;
        next.wide              = false;
        next.wide_continuation = true;
    }
    have_last  = true;
    last_glyph = cursor;

    cursor.col += width;
    if (cursor.col >= cols) {
        cursor.col   = cols - 1;
        wrap_pending = autowrap;
    }
}

void Emulator::append_combining(uint32_t ch)
{
    if (!have_last)
        return;

    Cell &cell = display.grid[last_glyph.row][last_glyph.col];
    if (!cell.contents.empty() && cell.contents.size() < MAX_CELL_BYTES) {
        cell.contents += to_utf8(ch);
    }
}

void Emulator::parse_escape(unsigned char c)
{
    state = AnsiState::NORMAL;
    switch (c) {
    case '[':
        state = AnsiState::CSI;
        ansi_seq.clear();
        break;
    case ']':
    case 'P':
    case 'X':
    case '^':
    case '_':
        state = AnsiState::OSC;
        break;
    case '(':
    case ')':
    case '*':
    case '+':
    case '#':
    case '%':
        state = AnsiState::CHARSET;
        break;
    case '\033':
        state = AnsiState::ESCAPE;
        break;
    case '7':
        save_cursor();
        break;
    case '8':
        restore_cursor();
        break;
    case 'D':
        line_feed();
        break;
    case 'E':
        display.cursor.col = 0;
        line_feed();
        break;
    case 'M':
        reverse_index();
        break;
    case 'c':
        reset_state();
        break;
    default:
        // Keypad modes and unknown sequences.
        break;
    }
}

void Emulator::parse_ansi_sequence(const std::string &seq)
{
    char final_char   = seq.back();
    char prefix       = 0;
    char intermediate = 0;
    size_t i          = 0;

    if (seq[0] == '?' || seq[0] == '>' || seq[0] == '<' || seq[0] == '=') {
        prefix = seq[0];
        i      = 1;
    }

    std::vector<int> params;
    int value = 0;
    for (; i + 1 < seq.size(); ++i) {
        char c = seq[i];
        if (std::isdigit(static_cast<unsigned char>(c))) {
            value = std::min(value * 10 + (c - '0'), MAX_PARAM);
        } else if (c == ';' || c == ':') {
            params.push_back(value);
            value = 0;
        } else if (c >= 0x20 && c <= 0x2f) {
            intermediate = c;
        }
    }
    params.push_back(value);

    if (intermediate) {
        // Cursor style and similar requests are not supported.
        return;
    }
    handle_csi_sequence(final_char, prefix, params);
}

void Emulator::handle_csi_sequence(char final_char, char prefix, const std::vector<int> &params)
{
    if (prefix == '?') {
        if (final_char == 'h' || final_char == 'l') {
            set_mode(prefix, params, final_char == 'h');
        }
        return;
    }
    if (prefix) {
        // Device attribute queries are not answered.
        return;
    }

    const auto &cursor = display.cursor;
    int rows           = display.term_rows;
    int cols           = display.term_cols;

    switch (final_char) {
    case 'A':
        move_cursor(cursor.row - get_param(params, 0, 1), cursor.col);
        break;
    case 'B':
    case 'e':
        move_cursor(cursor.row + get_param(params, 0, 1), cursor.col);
        break;
    case 'C':
    case 'a':
        move_cursor(cursor.row, cursor.col + get_param(params, 0, 1));
        break;
    case 'D':
        move_cursor(cursor.row, cursor.col - get_param(params, 0, 1));
        break;
    case 'E':
        move_cursor(cursor.row + get_param(params, 0, 1), 0);
        break;
    case 'F':
        move_cursor(cursor.row - get_param(params, 0, 1), 0);
        break;
    case 'G':
    case '`':
        move_cursor(cursor.row, get_param(params, 0, 1) - 1);
        break;
    case 'H':
    case 'f':
        move_cursor(get_param(params, 0, 1) - 1, get_param(params, 1, 1) - 1);
        break;
    case 'd':
        move_cursor(get_param(params, 0, 1) - 1, cursor.col);
        break;

    case 'J':
        switch (get_param(params, 0, 0)) {
        default:
        case 0:
            // Clear from cursor to end of screen
            erase_cells(cursor.row, cursor.col, cols);
            erase_rows(cursor.row + 1, rows);
            break;
        case 1:
            // Clear from start of screen to cursor
            erase_rows(0, cursor.row);
            erase_cells(cursor.row, 0, cursor.col + 1);
            break;
        case 2:
            erase_rows(0, rows);
            break;
        case 3:
            display.history.clear();
            break;
        }
        break;

    case 'K':
        switch (get_param(params, 0, 0)) {
        default:
        case 0:
            erase_cells(cursor.row, cursor.col, cols);
            break;
        case 1:
            erase_cells(cursor.row, 0, cursor.col + 1);
            break;
        case 2:
            erase_cells(cursor.row, 0, cols);
            break;
        }
        break;

    case 'X':
        erase_cells(cursor.row, cursor.col, cursor.col + get_param(params, 0, 1));
        break;
    case '@':
        insert_chars(get_param(params, 0, 1));
        break;
    case 'P':
        delete_chars(get_param(params, 0, 1));
        break;
    case 'L':
        insert_lines(get_param(params, 0, 1));
        break;
    case 'M':
        delete_lines(get_param(params, 0, 1));
        break;
    case 'S':
        scroll_up(get_param(params, 0, 1));
        break;
    case 'T':
        scroll_down(get_param(params, 0, 1));
        break;

    case 'r': {
        int top    = get_param(params, 0, 1) - 1;
        int bottom = std::min(get_param(params, 1, rows), rows) - 1;
        if (top < bottom) {
            scroll_top    = top;
            scroll_bottom = bottom;
            move_cursor(0, 0);
        }
        break;
    }
    case 's':
        save_cursor();
        break;
    case 'u':
        restore_cursor();
        break;
    case 'm':
        handle_sgr(params);
        break;
    default:
        // ANSI modes, device status and the rest are ignored.
        break;
    }
}

void Emulator::handle_sgr(const std::vector<int> &params)
{
    for (size_t i = 0; i < params.size(); ++i) {
        int p = params[i];
        if (p == 0) {
            current_attr = CharAttr();
        } else if (p == 1) {
            current_attr.bold = true;
        } else if (p == 3) {
            current_attr.italic = true;
        } else if (p == 4) {
            current_attr.underline = true;
        } else if (p == 7) {
            current_attr.inverse = true;
        } else if (p == 22) {
            current_attr.bold = false;
        } else if (p == 23) {
            current_attr.italic = false;
        } else if (p == 24) {
            current_attr.underline = false;
        } else if (p == 27) {
            current_attr.inverse = false;
        } else if (p >= 30 && p <= 37) {
            current_attr.fg = TermColor::indexed(p - 30);
        } else if (p == 38 || p == 48) {
            TermColor color;
            if (i + 2 < params.size() && params[i + 1] == 5) {
                color = TermColor::indexed(params[i + 2]);
                i += 2;
            } else if (i + 4 < params.size() && params[i + 1] == 2) {
                color = TermColor::rgb(params[i + 2], params[i + 3], params[i + 4]);
                i += 4;
            } else {
                // Malformed extended color: drop the rest.
                break;
            }
            if (p == 38) {
                current_attr.fg = color;
            } else {
                current_attr.bg = color;
            }
        } else if (p == 39) {
            current_attr.fg = TermColor();
        } else if (p >= 40 && p <= 47) {
            current_attr.bg = TermColor::indexed(p - 40);
        } else if (p == 49) {
            current_attr.bg = TermColor();
        } else if (p >= 90 && p <= 97) {
            current_attr.fg = TermColor::indexed(p - 90 + 8);
        } else if (p >= 100 && p <= 107) {
            current_attr.bg = TermColor::indexed(p - 100 + 8);
        }
    }
}

void Emulator::set_mode(char prefix, const std::vector<int> &params, bool enable)
{
    if (prefix != '?')
        return;

    for (int p : params) {
        switch (p) {
        case 7:
            autowrap = enable;
            if (!enable) {
                wrap_pending = false;
            }
            break;
        case 25:
            display.cursor_visible = enable;
            break;
        case 47:
        case 1047:
            switch_screen(enable);
            break;
        case 1048:
            if (enable) {
                save_cursor();
            } else {
                restore_cursor();
            }
            break;
        case 1049:
            if (enable) {
                save_cursor();
                switch_screen(true);
            } else {
                switch_screen(false);
                restore_cursor();
            }
            break;
        default:
            break;
        }
    }
}

Cell Emulator::blank_cell() const
{
    // Erased cells keep the current background color.
    Cell cell;
    cell.attr.bg = current_attr.bg;
    return cell;
}

void Emulator::move_cursor(int row, int col)
{
    display.cursor.row = std::max(0, std::min(row, display.term_rows - 1));
    display.cursor.col = std::max(0, std::min(col, display.term_cols - 1));
    wrap_pending       = false;
    have_last          = false;
}

void Emulator::line_feed()
{
    auto &cursor = display.cursor;

    wrap_pending = false;
    if (cursor.row == scroll_bottom) {
        scroll_up(1);
    } else if (cursor.row < display.term_rows - 1) {
        cursor.row++;
    }
}

void Emulator::reverse_index()
{
    auto &cursor = display.cursor;

    wrap_pending = false;
    if (cursor.row == scroll_top) {
        scroll_down(1);
    } else if (cursor.row > 0) {
        cursor.row--;
    }
}

void Emulator::scroll_up(int count)
{
    auto &grid = display.grid;

    count = std::min(count, scroll_bottom - scroll_top + 1);
    for (int i = 0; i < count; ++i) {
        CellRow row = std::move(grid[scroll_top]);
        grid.erase(grid.begin() + scroll_top);
        if (scroll_top == 0 && !display.alternate) {
            display.push_history(std::move(row));
        }
        grid.insert(grid.begin() + scroll_bottom, CellRow(display.term_cols, blank_cell()));
    }
    have_last = false;
}

void Emulator::scroll_down(int count)
{
    auto &grid = display.grid;

    count = std::min(count, scroll_bottom - scroll_top + 1);
    for (int i = 0; i < count; ++i) {
        grid.erase(grid.begin() + scroll_bottom);
        grid.insert(grid.begin() + scroll_top, CellRow(display.term_cols, blank_cell()));
    }
    have_last = false;
}

void Emulator::erase_cells(int row, int from_col, int to_col)
{
    from_col = std::max(from_col, 0);
    to_col   = std::min(to_col, display.term_cols);
    for (int c = from_col; c < to_col; ++c) {
        display.grid[row][c] = blank_cell();
    }
    repair_wide_cells(row);
    have_last = false;
}

void Emulator::erase_rows(int from_row, int to_row)
{
    for (int r = std::max(from_row, 0); r < std::min(to_row, display.term_rows); ++r) {
        display.grid[r].assign(display.term_cols, blank_cell());
    }
    have_last = false;
}

void Emulator::insert_chars(int count)
{
    const auto &cursor = display.cursor;
    auto &line         = display.grid[cursor.row];

    count = std::min(count, display.term_cols - cursor.col);
    line.insert(line.begin() + cursor.col, count, blank_cell());
    line.resize(display.term_cols);
    repair_wide_cells(cursor.row);
    wrap_pending = false;
}

void Emulator::delete_chars(int count)
{
    const auto &cursor = display.cursor;
    auto &line         = display.grid[cursor.row];

    count = std::min(count, display.term_cols - cursor.col);
    line.erase(line.begin() + cursor.col, line.begin() + cursor.col + count);
    line.insert(line.end(), count, blank_cell());
    repair_wide_cells(cursor.row);
    wrap_pending = false;
}

void Emulator::insert_lines(int count)
{
    auto &grid   = display.grid;
    auto &cursor = display.cursor;

    if (cursor.row < scroll_top || cursor.row > scroll_bottom)
        return;

    count = std::min(count, scroll_bottom - cursor.row + 1);
    for (int i = 0; i < count; ++i) {
        grid.erase(grid.begin() + scroll_bottom);
        grid.insert(grid.begin() + cursor.row, CellRow(display.term_cols, blank_cell()));
    }
    move_cursor(cursor.row, 0);
}

void Emulator::delete_lines(int count)
{
    auto &grid   = display.grid;
    auto &cursor = display.cursor;

    if (cursor.row < scroll_top || cursor.row > scroll_bottom)
        return;

    count = std::min(count, scroll_bottom - cursor.row + 1);
    for (int i = 0; i < count; ++i) {
        grid.erase(grid.begin() + cursor.row);
        grid.insert(grid.begin() + scroll_bottom, CellRow(display.term_cols, blank_cell()));
    }
    move_cursor(cursor.row, 0);
}

//
// Writing into either half of a wide glyph destroys the whole glyph.
//
void Emulator::clear_wide_overlap(int row, int col)
{
    auto &line = display.grid[row];

    if (line[col].wide_continuation && col > 0) {
        line[col - 1] = Cell();
    }
    if (line[col].wide && col + 1 < display.term_cols) {
        line[col + 1] = Cell();
    }
}

//
// After cells were shifted or erased, blank any half of
// a wide glyph that lost its other half.
//
void Emulator::repair_wide_cells(int row)
{
    auto &line = display.grid[row];
    int cols   = display.term_cols;

    for (int c = 0; c < cols; ++c) {
        if (line[c].wide && (c + 1 >= cols || !line[c + 1].wide_continuation)) {
            line[c] = blank_cell();
        } else if (line[c].wide_continuation && (c == 0 || !line[c - 1].wide)) {
            line[c] = blank_cell();
        }
    }
}

void Emulator::switch_screen(bool to_alternate)
{
    if (to_alternate == display.alternate)
        return;

    if (to_alternate) {
        saved_primary = std::move(display.grid);
        display.grid.assign(display.term_rows, CellRow(display.term_cols));
    } else {
        display.grid = std::move(saved_primary);
        saved_primary.clear();
    }
    display.alternate = to_alternate;
    wrap_pending      = false;
    have_last         = false;
}

void Emulator::save_cursor()
{
    saved_cursor = display.cursor;
    saved_attr   = current_attr;
}

void Emulator::restore_cursor()
{
    move_cursor(saved_cursor.row, saved_cursor.col);
    current_attr = saved_attr;
}

void Emulator::reset_state()
{
    switch_screen(false);
    current_attr = CharAttr();
    erase_rows(0, display.term_rows);
    move_cursor(0, 0);
    scroll_top             = 0;
    scroll_bottom          = display.term_rows - 1;
    autowrap               = true;
    display.cursor_visible = true;
    saved_cursor           = Cursor();
    saved_attr             = CharAttr();
}
