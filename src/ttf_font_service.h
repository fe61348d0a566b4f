//
// Font service backed by SDL_ttf.
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
#ifndef TTF_FONT_SERVICE_H
#define TTF_FONT_SERVICE_H

#include <SDL2/SDL_ttf.h>

#include <map>
#include <string>

#include "font_service.h"

extern const char *const DEFAULT_FONT_PATH;

class TtfFontService : public FontService {
public:
    // TTF_Init() must have been called.
    // Throws std::runtime_error when the font file cannot be opened.
    explicit TtfFontService(const std::string &font_path);
    ~TtfFontService() override;
    TtfFontService(const TtfFontService &)            = delete;
    TtfFontService &operator=(const TtfFontService &) = delete;

    FontMetrics metrics(int font_size) override;
    int measure(const std::string &text, int font_size) override;
    void draw_text(SDL_Surface *surface, const std::string &text, int font_size, int x,
                   int baseline, SDL_Color fg, bool bold) override;

private:
    std::string font_path;

    // One opened face per point size.
    std::map<int, TTF_Font *> fonts;

    TTF_Font *get_font(int font_size);
};

#endif // TTF_FONT_SERVICE_H
