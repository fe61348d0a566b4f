//
// Test doubles for the host collaborators of a terminal session.
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
#ifndef TEST_FAKES_H
#define TEST_FAKES_H

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

#include "event_hub.h"
#include "font_service.h"
#include "surface.h"

//
// Monospace font without a font file: every character is font_size/2
// wide, line height is 5/4 of the font size. Glyphs are painted as
// a small square of the foreground color.
//
class FakeFontService : public FontService {
public:
    struct DrawCall {
        std::string text;
        int x;
        int baseline;
        SDL_Color fg;
        bool bold;
    };
    std::vector<DrawCall> draws;

    FontMetrics metrics(int font_size) override { return { font_size, -font_size / 4 }; }

    int measure(const std::string &text, int font_size) override
    {
        int count = 0;
        for (unsigned char c : text) {
            if ((c & 0xC0) != 0x80)
                count++;
        }
        return count * (font_size / 2);
    }

    void draw_text(SDL_Surface *surface, const std::string &text, int font_size, int x,
                   int baseline, SDL_Color fg, bool bold) override
    {
        draws.push_back({ text, x, baseline, fg, bold });
        fill_rect(surface, { x + 1, baseline - font_size / 2, 2, 2 }, fg);
    }
};

//
// Records notifications; tests wait for them with a timeout.
//
class FakeEventHub : public EventHub {
public:
    void post_wake(uint32_t session_id) override { record(wakes, session_id); }
    void post_closed(uint32_t session_id) override { record(closes, session_id); }
    void post_back(uint32_t session_id) override { record(backs, session_id); }

    // Wait until pred() holds. The hub is locked while pred() runs,
    // so it reads the lists directly. Returns the final value of pred().
    template <typename Pred>
    bool wait_for(Pred pred, std::chrono::milliseconds timeout = std::chrono::seconds(5))
    {
        std::unique_lock<std::mutex> lock(mutex);
        return cond.wait_for(lock, timeout, pred);
    }

    std::vector<uint32_t> wake_ids()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return wakes;
    }
    std::vector<uint32_t> closed_ids()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return closes;
    }
    std::vector<uint32_t> back_ids()
    {
        std::lock_guard<std::mutex> lock(mutex);
        return backs;
    }

    std::vector<uint32_t> wakes;
    std::vector<uint32_t> closes;
    std::vector<uint32_t> backs;

private:
    std::mutex mutex;
    std::condition_variable cond;

    void record(std::vector<uint32_t> &list, uint32_t session_id)
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            list.push_back(session_id);
        }
        cond.notify_all();
    }
};

class FakeRenderQueue : public RenderQueue {
public:
    std::vector<std::pair<SDL_Rect, UpdateMode>> items;

    void add(const SDL_Rect &rect, UpdateMode mode) override { items.emplace_back(rect, mode); }
};

// Red component of a pixel, enough to tell black from white.
inline int pixel_level(const SDL_Surface *surface, int x, int y)
{
    const Uint8 *row = static_cast<const Uint8 *>(surface->pixels) + y * surface->pitch;
    Uint32 pixel     = reinterpret_cast<const Uint32 *>(row)[x];
    Uint8 r, g, b;
    SDL_GetRGB(pixel, surface->format, &r, &g, &b);
    return r;
}

#endif // TEST_FAKES_H
