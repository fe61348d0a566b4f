//
// Glyph measurement and drawing used by the terminal renderer.
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
#ifndef FONT_SERVICE_H
#define FONT_SERVICE_H

#include <SDL2/SDL.h>

#include <functional>
#include <memory>
#include <string>

// Vertical metrics of a font at some size, in pixels.
struct FontMetrics {
    int ascent{};
    int descent{}; // negative below the baseline
};

//
// Font rasterization, supplied by the host application.
// An instance is not thread safe: every thread loads its own.
//
class FontService {
public:
    virtual ~FontService() = default;

    virtual FontMetrics metrics(int font_size) = 0;

    // Advance width of the text.
    virtual int measure(const std::string &text, int font_size) = 0;

    // Draw text with its baseline at (x, baseline).
    virtual void draw_text(SDL_Surface *surface, const std::string &text, int font_size, int x,
                           int baseline, SDL_Color fg, bool bold) = 0;
};

// Creates a font service; throws when fonts cannot be loaded.
using FontLoader = std::function<std::unique_ptr<FontService>()>;

#endif // FONT_SERVICE_H
