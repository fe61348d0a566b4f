//
// Frame exchange between the pty reader thread and the UI thread.
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
#include "double_buffer.h"

#include <iostream>

std::pair<std::shared_ptr<DoubleBuffer>, std::unique_ptr<BufferWriter>>
DoubleBuffer::create(int width, int height)
{
    return { std::make_shared<DoubleBuffer>(width, height),
             std::make_unique<BufferWriter>(width, height) };
}

void DoubleBuffer::swap(BufferWriter &writer)
{
    std::lock_guard<std::mutex> lock(mutex);

    std::swap(front, writer.back);

    if (writer.dirty_rect && !full_refresh) {
        if (dirty_rects.size() >= MAX_DIRTY_RECTS) {
            // The UI fell behind: one full repaint instead.
            dirty_rects.clear();
            full_refresh = true;
        } else {
            dirty_rects.push_back(*writer.dirty_rect);
        }
    }
    writer.dirty_rect.reset();

    // The next incremental render must start from what the UI shows now.
    copy_pixels(writer.back.get(), front.get());
}

std::vector<SDL_Rect> DoubleBuffer::drain_dirty_rects()
{
    std::lock_guard<std::mutex> lock(mutex);
    std::vector<SDL_Rect> rects(dirty_rects.begin(), dirty_rects.end());
    dirty_rects.clear();
    return rects;
}

bool DoubleBuffer::take_full_refresh()
{
    std::lock_guard<std::mutex> lock(mutex);
    bool result  = full_refresh;
    full_refresh = false;
    return result;
}

bool DoubleBuffer::is_dirty() const
{
    std::lock_guard<std::mutex> lock(mutex);
    return full_refresh || !dirty_rects.empty();
}

DirtyState DoubleBuffer::take_dirty()
{
    std::lock_guard<std::mutex> lock(mutex);
    DirtyState state;
    state.full_refresh = full_refresh;
    if (!full_refresh) {
        state.rects.assign(dirty_rects.begin(), dirty_rects.end());
    }
    dirty_rects.clear();
    full_refresh = false;
    return state;
}

void DoubleBuffer::blit_front(SDL_Surface *dst, const SDL_Rect &src_rect, int x, int y) const
{
    std::lock_guard<std::mutex> lock(mutex);
    SDL_Rect src = src_rect;
    SDL_Rect pos = { x, y, src_rect.w, src_rect.h };
    if (SDL_BlitSurface(front.get(), &src, dst, &pos) < 0) {
        std::cerr << "SDL_BlitSurface failed: " << SDL_GetError() << std::endl;
    }
}
