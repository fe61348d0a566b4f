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
#include "ttf_font_service.h"

#include <iostream>
#include <stdexcept>

#ifdef __APPLE__
const char *const DEFAULT_FONT_PATH = "/System/Library/Fonts/Menlo.ttc";
#else
const char *const DEFAULT_FONT_PATH = "/usr/share/fonts/truetype/dejavu/DejaVuSansMono-Bold.ttf";
#endif

TtfFontService::TtfFontService(const std::string &font_path) : font_path(font_path)
{
    // Validate the path.
    get_font(16);
}

TtfFontService::~TtfFontService()
{
    for (auto &entry : fonts) {
        TTF_CloseFont(entry.second);
    }
}

TTF_Font *TtfFontService::get_font(int font_size)
{
    auto it = fonts.find(font_size);
    if (it != fonts.end()) {
        return it->second;
    }

    TTF_Font *font = TTF_OpenFont(font_path.c_str(), font_size);
    if (!font) {
        throw std::runtime_error("Failed to load font " + font_path + ": " + TTF_GetError());
    }
    fonts[font_size] = font;
    return font;
}

FontMetrics TtfFontService::metrics(int font_size)
{
    TTF_Font *font = get_font(font_size);
    return { TTF_FontAscent(font), TTF_FontDescent(font) };
}

int TtfFontService::measure(const std::string &text, int font_size)
{
    int width = 0, height = 0;
    if (TTF_SizeUTF8(get_font(font_size), text.c_str(), &width, &height) < 0) {
        std::cerr << "TTF_SizeUTF8 failed: " << TTF_GetError() << std::endl;
        return 0;
    }
    return width;
}

void TtfFontService::draw_text(SDL_Surface *surface, const std::string &text, int font_size, int x,
                               int baseline, SDL_Color fg, bool bold)
{
    TTF_Font *font = get_font(font_size);
    TTF_SetFontStyle(font, bold ? TTF_STYLE_BOLD : TTF_STYLE_NORMAL);

    SDL_Surface *glyphs = TTF_RenderUTF8_Blended(font, text.c_str(), fg);
    if (!glyphs) {
        std::cerr << "TTF_RenderUTF8_Blended failed: " << TTF_GetError() << std::endl;
        return;
    }

    // Rendered text starts at the top of the line, ascent above the baseline.
    SDL_Rect dst = { x, baseline - TTF_FontAscent(font), glyphs->w, glyphs->h };
    if (SDL_BlitSurface(glyphs, nullptr, surface, &dst) < 0) {
        std::cerr << "SDL_BlitSurface failed: " << SDL_GetError() << std::endl;
    }
    SDL_FreeSurface(glyphs);
}
