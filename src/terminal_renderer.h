//
// Incremental rendering of the character grid into a pixel surface.
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
#ifndef TERMINAL_RENDERER_H
#define TERMINAL_RENDERER_H

#include <gtest/gtest_prod.h>

#include <optional>
#include <string>
#include <vector>

#include "font_service.h"
#include "screen.h"
#include "surface.h"

// Smallest grid the terminal will ever use.
static const int MIN_GRID_COLS = 20;
static const int MIN_GRID_ROWS = 10;

struct GridSize {
    int rows;
    int cols;
};

//
// What a cell looked like when it was last painted.
//
struct CellState {
    std::string contents;
    bool inverse{};
    bool bold{};
    bool is_wide{};
    bool is_wide_continuation{};
    bool has_bg{};

    bool operator==(const CellState &other) const
    {
        return contents == other.contents && inverse == other.inverse && bold == other.bold &&
               is_wide == other.is_wide && is_wide_continuation == other.is_wide_continuation &&
               has_bg == other.has_bg;
    }
    bool operator!=(const CellState &other) const { return !(*this == other); }
};

class TerminalRenderer {
public:
    // Grid that fits into the given area with this font size.
    static GridSize calculate_grid_for_font_size(int available_width, int available_height,
                                                 int font_size, FontService &fonts);

    TerminalRenderer(FontService &fonts, int rows, int cols, int font_size);

    //
    // Repaint the cells that changed since the previous call and draw the cursor.
    // Returns the region of the surface that was modified, if any.
    //
    std::optional<SDL_Rect> render_screen(const Screen &screen, SDL_Surface *surface,
                                          FontService &fonts);

    int get_char_width() const { return char_width; }
    int get_char_height() const { return char_height; }
    int get_baseline_offset() const { return baseline_offset; }

private:
    FRIEND_TEST(TerminalRendererTest, ContinuationSnapshotIsStored);

    int term_rows;
    int term_cols;
    int font_size;
    int char_width;
    int char_height;
    int baseline_offset;

    // Indexed by row * term_cols + col.
    std::vector<CellState> previous_screen;
    Cursor previous_cursor;
    bool previous_cursor_visible{ true };
    bool cursor_painted{};

    SDL_Rect cell_rect(int row, int col, int width_in_cells = 1) const;
    SDL_Rect cursor_rect(const Cursor &cursor) const;
    void render_cell(const Screen &screen, int row, int col, SDL_Surface *surface,
                     FontService &fonts) const;
    static CellState snapshot(const Cell &cell);
};

#endif // TERMINAL_RENDERER_H
