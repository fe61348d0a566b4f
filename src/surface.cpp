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
#include "surface.h"

#include <algorithm>
#include <cstring>
#include <stdexcept>
#include <string>

const SDL_Color COLOR_BLACK = { 0, 0, 0, 255 };
const SDL_Color COLOR_WHITE = { 255, 255, 255, 255 };

SurfacePtr create_surface(int width, int height)
{
    SurfacePtr surface(SDL_CreateRGBSurfaceWithFormat(0, width, height, 32, SDL_PIXELFORMAT_ARGB8888));
    if (!surface) {
        throw std::runtime_error(std::string("SDL_CreateRGBSurfaceWithFormat failed: ") +
                                 SDL_GetError());
    }
    SDL_SetSurfaceBlendMode(surface.get(), SDL_BLENDMODE_NONE);
    fill_rect(surface.get(), { 0, 0, width, height }, COLOR_WHITE);
    return surface;
}

void fill_rect(SDL_Surface *surface, const SDL_Rect &rect, SDL_Color color)
{
    Uint32 pixel = SDL_MapRGBA(surface->format, color.r, color.g, color.b, color.a);
    SDL_FillRect(surface, &rect, pixel);
}

void copy_pixels(SDL_Surface *dst, const SDL_Surface *src)
{
    if (dst->w != src->w || dst->h != src->h || dst->pitch != src->pitch ||
        dst->format->format != src->format->format) {
        throw std::invalid_argument("copy_pixels: surfaces differ in size or format");
    }
    SDL_LockSurface(dst);
    SDL_LockSurface(const_cast<SDL_Surface *>(src));
    std::memcpy(dst->pixels, src->pixels, static_cast<size_t>(src->pitch) * src->h);
    SDL_UnlockSurface(const_cast<SDL_Surface *>(src));
    SDL_UnlockSurface(dst);
}

void absorb_rect(SDL_Rect &rect, const SDL_Rect &other)
{
    int x1 = std::min(rect.x, other.x);
    int y1 = std::min(rect.y, other.y);
    int x2 = std::max(rect.x + rect.w, other.x + other.w);
    int y2 = std::max(rect.y + rect.h, other.y + other.h);
    rect   = { x1, y1, x2 - x1, y2 - y1 };
}

void absorb_rect(std::optional<SDL_Rect> &acc, const SDL_Rect &other)
{
    if (acc) {
        absorb_rect(*acc, other);
    } else {
        acc = other;
    }
}

bool operator==(const SDL_Rect &a, const SDL_Rect &b)
{
    return a.x == b.x && a.y == b.y && a.w == b.w && a.h == b.h;
}

bool operator!=(const SDL_Rect &a, const SDL_Rect &b)
{
    return !(a == b);
}
