//
// Pixel surfaces for the terminal: ownership and drawing helpers.
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
#ifndef SURFACE_H
#define SURFACE_H

#include <SDL2/SDL.h>

#include <memory>
#include <optional>

// Owning handle for an SDL surface.
struct SurfaceDeleter {
    void operator()(SDL_Surface *surface) const { SDL_FreeSurface(surface); }
};
using SurfacePtr = std::unique_ptr<SDL_Surface, SurfaceDeleter>;

// E-ink palette: the terminal draws black on white.
extern const SDL_Color COLOR_BLACK;
extern const SDL_Color COLOR_WHITE;

// Allocate an ARGB8888 surface filled with the background color.
// Throws std::runtime_error when SDL cannot allocate it.
SurfacePtr create_surface(int width, int height);

// Fill a rectangle with the given color, clipped to the surface.
void fill_rect(SDL_Surface *surface, const SDL_Rect &rect, SDL_Color color);

// Copy all pixels of src into dst. Both must have the same size and format.
void copy_pixels(SDL_Surface *dst, const SDL_Surface *src);

// Grow rect to cover other.
void absorb_rect(SDL_Rect &rect, const SDL_Rect &other);

// Union other into an optional accumulator.
void absorb_rect(std::optional<SDL_Rect> &acc, const SDL_Rect &other);

bool operator==(const SDL_Rect &a, const SDL_Rect &b);
bool operator!=(const SDL_Rect &a, const SDL_Rect &b);

#endif // SURFACE_H
