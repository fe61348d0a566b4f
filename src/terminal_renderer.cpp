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
#include "terminal_renderer.h"

#include <algorithm>

// Height of the underline cursor, and its distance from the cell bottom.
static const int CURSOR_THICKNESS = 2;
static const int CURSOR_MARGIN    = 1;

GridSize TerminalRenderer::calculate_grid_for_font_size(int available_width,
                                                        int available_height, int font_size,
                                                        FontService &fonts)
{
    int char_width        = std::max(fonts.measure("M", font_size), 1);
    FontMetrics metrics   = fonts.metrics(font_size);
    int line_height       = std::max(metrics.ascent - metrics.descent, 1);

    GridSize size;
    size.cols = std::max(MIN_GRID_COLS, available_width / char_width);
    size.rows = std::max(MIN_GRID_ROWS, available_height / line_height);
    return size;
}

TerminalRenderer::TerminalRenderer(FontService &fonts, int rows, int cols, int font_size)
    : term_rows(rows), term_cols(cols), font_size(font_size),
      previous_screen(static_cast<size_t>(rows) * cols)
{
    FontMetrics metrics = fonts.metrics(font_size);
    char_width          = std::max(fonts.measure("M", font_size), 1);
    char_height         = std::max(metrics.ascent - metrics.descent, 1);
    baseline_offset     = metrics.ascent;
}

CellState TerminalRenderer::snapshot(const Cell &cell)
{
    CellState state;
    state.contents             = cell.contents;
    state.inverse              = cell.attr.inverse;
    state.bold                 = cell.attr.bold;
    state.is_wide              = cell.wide;
    state.is_wide_continuation = cell.wide_continuation;
    state.has_bg               = !cell.attr.bg.is_default();
    return state;
}

SDL_Rect TerminalRenderer::cell_rect(int row, int col, int width_in_cells) const
{
    return { col * char_width, row * char_height, width_in_cells * char_width, char_height };
}

SDL_Rect TerminalRenderer::cursor_rect(const Cursor &cursor) const
{
    int x = cursor.col * char_width;
    int y = cursor.row * char_height;
    return { x, y + char_height - CURSOR_THICKNESS - CURSOR_MARGIN, char_width, CURSOR_THICKNESS };
}

std::optional<SDL_Rect> TerminalRenderer::render_screen(const Screen &screen, SDL_Surface *surface,
                                                        FontService &fonts)
{
    int rows              = std::min(term_rows, screen.get_rows());
    int cols              = std::min(term_cols, screen.get_cols());
    const Cursor &cursor  = screen.get_cursor();
    bool cursor_visible   = screen.is_cursor_visible();
    std::optional<SDL_Rect> dirty_rect;

    //
    // Wipe the cursor from its old place.
    //
    if (cursor != previous_cursor || cursor_visible != previous_cursor_visible) {
        int old_row = previous_cursor.row;
        int old_col = previous_cursor.col;
        if (old_row < rows && old_col < cols) {
            if (old_col > 0 && screen.cell(old_row, old_col).wide_continuation) {
                old_col--;
            }
            render_cell(screen, old_row, old_col, surface, fonts);
            absorb_rect(dirty_rect,
                        cell_rect(old_row, old_col, screen.cell(old_row, old_col).wide ? 2 : 1));
        }
        previous_cursor         = cursor;
        previous_cursor_visible = cursor_visible;
        cursor_painted          = false;
    }

    //
    // Repaint cells which differ from the previous frame.
    //
    for (int row = 0; row < rows; ++row) {
        for (int col = 0; col < cols; ++col) {
            const Cell &cell   = screen.cell(row, col);
            CellState current  = snapshot(cell);
            CellState &previous = previous_screen[row * term_cols + col];
            if (current == previous)
                continue;

            previous = std::move(current);

            // Right half of a wide glyph is painted together with its left half.
            if (cell.wide_continuation)
                continue;

            render_cell(screen, row, col, surface, fonts);
            absorb_rect(dirty_rect, cell_rect(row, col, cell.wide ? 2 : 1));
        }
    }

    //
    // Cursor on top.
    //
    if (cursor_visible && cursor.row < rows && cursor.col < cols) {
        SDL_Rect rect = cursor_rect(cursor);
        fill_rect(surface, rect, COLOR_BLACK);
        if (dirty_rect || !cursor_painted) {
            absorb_rect(dirty_rect, rect);
        }
        cursor_painted = true;
    }
    return dirty_rect;
}

void TerminalRenderer::render_cell(const Screen &screen, int row, int col, SDL_Surface *surface,
                                   FontService &fonts) const
{
    const Cell &cell = screen.cell(row, col);
    if (cell.wide_continuation)
        return;

    bool use_inverse = cell.attr.inverse || !cell.attr.bg.is_default();
    SDL_Color fg     = use_inverse ? COLOR_WHITE : COLOR_BLACK;
    SDL_Color bg     = use_inverse ? COLOR_BLACK : COLOR_WHITE;
    SDL_Rect rect    = cell_rect(row, col, cell.wide ? 2 : 1);

    fill_rect(surface, rect, bg);
    if (!cell.contents.empty()) {
        // Keep glyph overhang out of the neighbour cells.
        SDL_SetClipRect(surface, &rect);
        fonts.draw_text(surface, cell.contents, font_size, rect.x, rect.y + baseline_offset, fg,
                        cell.attr.bold);
        SDL_SetClipRect(surface, nullptr);
    }
}
