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
#include "screen.h"

#include <algorithm>
#include <stdexcept>

TermColor TermColor::indexed(int index)
{
    TermColor color;
    color.kind  = ColorKind::INDEXED;
    color.index = static_cast<uint8_t>(std::clamp(index, 0, 255));
    return color;
}

TermColor TermColor::rgb(int r, int g, int b)
{
    TermColor color;
    color.kind = ColorKind::RGB;
    color.r    = static_cast<uint8_t>(std::clamp(r, 0, 255));
    color.g    = static_cast<uint8_t>(std::clamp(g, 0, 255));
    color.b    = static_cast<uint8_t>(std::clamp(b, 0, 255));
    return color;
}

Screen::Screen(int rows, int cols, size_t history_limit)
    : term_rows(rows), term_cols(cols), history_limit(history_limit)
{
    if (rows < 1 || cols < 1) {
        throw std::invalid_argument("Screen: empty grid");
    }
    grid.assign(rows, CellRow(cols));
}

std::string Screen::row_text(int row) const
{
    std::string text;
    for (const auto &c : grid[row]) {
        if (c.wide_continuation)
            continue;
        text += c.contents.empty() ? std::string(" ") : c.contents;
    }
    text.erase(text.find_last_not_of(' ') + 1);
    return text;
}

std::string Screen::contents() const
{
    std::string text;
    for (int r = 0; r < term_rows; ++r) {
        if (r > 0)
            text += '\n';
        text += row_text(r);
    }
    return text;
}

void Screen::push_history(CellRow row)
{
    if (history_limit == 0)
        return;
    if (history.size() >= history_limit)
        history.pop_front();
    history.push_back(std::move(row));
}
