//
// Event hub based on SDL user events.
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
#ifndef SDL_EVENT_HUB_H
#define SDL_EVENT_HUB_H

#include "event_hub.h"

// Codes carried in SDL_UserEvent::code.
enum class SessionEventCode : Sint32 { WAKE = 1, CLOSED, BACK };

//
// Event hub on top of the SDL event queue.
// Posts one registered user event type; data1 holds the session id.
//
class SdlEventHub : public EventHub {
public:
    // Throws std::runtime_error when no user event type is available.
    SdlEventHub();

    void post_wake(uint32_t session_id) override;
    void post_closed(uint32_t session_id) override;
    void post_back(uint32_t session_id) override;

    // Check whether an SDL event came from this hub.
    bool owns(const SDL_Event &event) const { return event.type == event_type; }

    static SessionEventCode get_code(const SDL_Event &event);
    static uint32_t get_session_id(const SDL_Event &event);

private:
    Uint32 event_type;

    void post(SessionEventCode code, uint32_t session_id);
};

#endif // SDL_EVENT_HUB_H
