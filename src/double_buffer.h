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
#ifndef DOUBLE_BUFFER_H
#define DOUBLE_BUFFER_H

#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <utility>
#include <vector>

#include "surface.h"

//
// Writer side: owned by the reader thread, renders without locking.
//
class BufferWriter {
public:
    BufferWriter(int width, int height) : back(create_surface(width, height)) {}

    SDL_Surface *get_back() { return back.get(); }

    // Region changed since the last swap.
    std::optional<SDL_Rect> dirty_rect;

private:
    friend class DoubleBuffer;

    SurfacePtr back;
};

// What the UI thread has to repaint.
struct DirtyState {
    bool full_refresh{};
    std::vector<SDL_Rect> rects;
};

//
// Shared side: the surface the UI displays, plus pending dirty regions.
// All methods lock internally.
//
class DoubleBuffer {
public:
    static constexpr size_t MAX_DIRTY_RECTS = 16;

    // Create the shared buffer together with its only writer.
    static std::pair<std::shared_ptr<DoubleBuffer>, std::unique_ptr<BufferWriter>>
    create(int width, int height);

    DoubleBuffer(int width, int height) : front(create_surface(width, height)) {}
    DoubleBuffer(const DoubleBuffer &)            = delete;
    DoubleBuffer &operator=(const DoubleBuffer &) = delete;

    int get_width() const { return front->w; }
    int get_height() const { return front->h; }

    // Publish the writer's back surface and queue its dirty region.
    // Afterwards the writer's new back holds the same pixels as the front.
    void swap(BufferWriter &writer);

    // Consumer side, called from the UI thread.
    std::vector<SDL_Rect> drain_dirty_rects();
    bool take_full_refresh();
    bool is_dirty() const;
    DirtyState take_dirty();

    // Copy part of the front surface into dst at (x, y).
    void blit_front(SDL_Surface *dst, const SDL_Rect &src_rect, int x, int y) const;

    // Run fn on the front surface with the lock held.
    template <typename Func>
    void with_front(Func &&fn) const
    {
        std::lock_guard<std::mutex> lock(mutex);
        fn(static_cast<const SDL_Surface *>(front.get()));
    }

private:
    mutable std::mutex mutex;
    SurfacePtr front;
    std::deque<SDL_Rect> dirty_rects;
    bool full_refresh{};
};

#endif // DOUBLE_BUFFER_H
