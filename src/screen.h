//
// Character grid of the terminal: cells, attributes and cursor.
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
#ifndef SCREEN_H
#define SCREEN_H

#include <cstddef>
#include <cstdint>
#include <deque>
#include <string>
#include <vector>

enum class ColorKind : uint8_t { DEFAULT, INDEXED, RGB };

// Color as requested by the application: default, palette index or direct RGB.
struct TermColor {
    ColorKind kind{ ColorKind::DEFAULT };
    uint8_t index{};
    uint8_t r{}, g{}, b{};

    static TermColor indexed(int index);
    static TermColor rgb(int r, int g, int b);

    bool is_default() const { return kind == ColorKind::DEFAULT; }

    bool operator==(const TermColor &other) const
    {
        return kind == other.kind && index == other.index && r == other.r && g == other.g &&
               b == other.b;
    }
    bool operator!=(const TermColor &other) const { return !(*this == other); }
};

// Structure for character attributes
struct CharAttr {
    TermColor fg;
    TermColor bg;
    bool bold{};
    bool italic{};
    bool underline{};
    bool inverse{};

    bool operator==(const CharAttr &other) const
    {
        return fg == other.fg && bg == other.bg && bold == other.bold && italic == other.italic &&
               underline == other.underline && inverse == other.inverse;
    }
    bool operator!=(const CharAttr &other) const { return !(*this == other); }
};

//
// A single grid position. Contents is one UTF-8 encoded grapheme,
// possibly with combining marks; empty for a blank cell.
// A double-width glyph lives in its left cell (wide) and the cell
// to the right is a placeholder (wide_continuation).
//
struct Cell {
    std::string contents;
    CharAttr attr;
    bool wide{};
    bool wide_continuation{};

    bool operator==(const Cell &other) const
    {
        return contents == other.contents && attr == other.attr && wide == other.wide &&
               wide_continuation == other.wide_continuation;
    }
    bool operator!=(const Cell &other) const { return !(*this == other); }
};

// Cursor position
struct Cursor {
    int row = 0;
    int col = 0;

    bool operator==(const Cursor &other) const { return row == other.row && col == other.col; }
    bool operator!=(const Cursor &other) const { return !(*this == other); }
};

using CellRow = std::vector<Cell>;

//
// Read-only view of the terminal state. Mutated by the Emulator only.
//
class Screen {
public:
    Screen(int rows, int cols, size_t history_limit);

    int get_rows() const { return term_rows; }
    int get_cols() const { return term_cols; }
    const Cell &cell(int row, int col) const { return grid[row][col]; }
    const Cursor &get_cursor() const { return cursor; }
    bool is_cursor_visible() const { return cursor_visible; }
    bool is_alternate() const { return alternate; }

    // Text of one row, blank cells as spaces, trailing blanks removed.
    std::string row_text(int row) const;

    // All rows joined with newlines.
    std::string contents() const;

    // Lines scrolled off the top of the primary screen, oldest first.
    const std::deque<CellRow> &get_history() const { return history; }

private:
    friend class Emulator;

    int term_rows;
    int term_cols;
    std::vector<CellRow> grid;
    Cursor cursor;
    bool cursor_visible{ true };
    bool alternate{};
    std::deque<CellRow> history;
    size_t history_limit;

    void push_history(CellRow row);
};

#endif // SCREEN_H
