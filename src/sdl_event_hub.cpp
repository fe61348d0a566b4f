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
#include "sdl_event_hub.h"

#include <cstdint>
#include <iostream>
#include <stdexcept>
#include <string>

SdlEventHub::SdlEventHub() : event_type(SDL_RegisterEvents(1))
{
    if (event_type == static_cast<Uint32>(-1)) {
        throw std::runtime_error(std::string("SDL_RegisterEvents failed: ") + SDL_GetError());
    }
}

void SdlEventHub::post_wake(uint32_t session_id)
{
    post(SessionEventCode::WAKE, session_id);
}

void SdlEventHub::post_closed(uint32_t session_id)
{
    post(SessionEventCode::CLOSED, session_id);
}

void SdlEventHub::post_back(uint32_t session_id)
{
    post(SessionEventCode::BACK, session_id);
}

void SdlEventHub::post(SessionEventCode code, uint32_t session_id)
{
    SDL_Event event;
    SDL_zero(event);
    event.type       = event_type;
    event.user.code  = static_cast<Sint32>(code);
    event.user.data1 = reinterpret_cast<void *>(static_cast<uintptr_t>(session_id));
    event.user.data2 = nullptr;

    // SDL_PushEvent is thread safe.
    if (SDL_PushEvent(&event) < 0) {
        std::cerr << "SDL_PushEvent failed: " << SDL_GetError() << std::endl;
    }
}

SessionEventCode SdlEventHub::get_code(const SDL_Event &event)
{
    return static_cast<SessionEventCode>(event.user.code);
}

uint32_t SdlEventHub::get_session_id(const SDL_Event &event)
{
    return static_cast<uint32_t>(reinterpret_cast<uintptr_t>(event.user.data1));
}
