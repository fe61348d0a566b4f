//
// Notification channel from terminal sessions to the host.
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
#ifndef EVENT_HUB_H
#define EVENT_HUB_H

#include <SDL2/SDL.h>

#include <cstdint>

//
// Notifications from a terminal session to the host UI loop.
// All methods may be called from any thread.
//
class EventHub {
public:
    virtual ~EventHub() = default;

    // New frame is available in the session's double buffer.
    virtual void post_wake(uint32_t session_id) = 0;

    // The shell has gone away.
    virtual void post_closed(uint32_t session_id) = 0;

    // The user asked to leave the terminal.
    virtual void post_back(uint32_t session_id) = 0;
};

// How the host should refresh a region of the display.
enum class UpdateMode {
    FULL, // complete repaint
    FAST, // quick partial update
};

//
// Repaint requests collected by the host, UI thread only.
//
class RenderQueue {
public:
    virtual ~RenderQueue() = default;

    virtual void add(const SDL_Rect &rect, UpdateMode mode) = 0;
};

#endif // EVENT_HUB_H
