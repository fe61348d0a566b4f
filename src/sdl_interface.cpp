//
// SDL host application for a terminal session.
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
#include "sdl_interface.h"

#include <SDL2/SDL_ttf.h>
#include <unicode/utf8.h>

#include <cstring>
#include <iostream>
#include <stdexcept>

#include "sdl_event_hub.h"
#include "terminal_session.h"
#include "ttf_font_service.h"

static bool point_in_rect(int x, int y, const SDL_Rect &rect)
{
    SDL_Point point = { x, y };
    return SDL_PointInRect(&point, &rect);
}

SdlInterface::SdlInterface(const HostOptions &options) : options(options)
{
    if (this->options.font_path.empty()) {
        this->options.font_path = DEFAULT_FONT_PATH;
    }
    initialize_sdl();
    start_session();
}

SdlInterface::~SdlInterface()
{
    // The session thread renders with its own fonts: stop it before TTF_Quit().
    session.reset();
    fonts.reset();
    hub.reset();
    if (window)
        SDL_DestroyWindow(window);
    if (ttf_initialized)
        TTF_Quit();
    SDL_Quit();
}

void SdlInterface::initialize_sdl()
{
    if (SDL_Init(SDL_INIT_VIDEO) < 0) {
        throw std::runtime_error(std::string("SDL_Init failed: ") + SDL_GetError());
    }
    if (TTF_Init() < 0) {
        throw std::runtime_error(std::string("TTF_Init failed: ") + TTF_GetError());
    }
    ttf_initialized = true;

    window = SDL_CreateWindow("Terminal", SDL_WINDOWPOS_CENTERED, SDL_WINDOWPOS_CENTERED,
                              options.width, options.height, SDL_WINDOW_SHOWN);
    if (!window) {
        throw std::runtime_error(std::string("SDL_CreateWindow failed: ") + SDL_GetError());
    }

    fonts = std::make_unique<TtfFontService>(options.font_path);
    hub   = std::make_unique<SdlEventHub>();
    SDL_StartTextInput();
}

void SdlInterface::start_session()
{
    SessionOptions session_options;
    session_options.shell         = options.shell;
    session_options.show_keyboard = options.show_keyboard;
    session_options.dpi           = options.dpi;

    std::string font_path   = options.font_path;
    FontLoader font_loader  = [font_path]() -> std::unique_ptr<FontService> {
        return std::make_unique<TtfFontService>(font_path);
    };

    SDL_Rect rect = { 0, 0, options.width, options.height };
    session = std::make_unique<TerminalSession>(rect, options.font_size, session_options, *fonts,
                                                font_loader, *hub, *this);
    if (options.verbose) {
        std::cerr << "Started " << options.shell << " (pid " << session->get_shell_pid()
                  << "), grid " << session->get_cols() << "x" << session->get_rows()
                  << std::endl;
    }
}

void SdlInterface::run()
{
    update_window();
    while (!quit) {
        SDL_Event event;
        if (!SDL_WaitEvent(&event)) {
            throw std::runtime_error(std::string("SDL_WaitEvent failed: ") + SDL_GetError());
        }
        handle_event(event);

        // Process whatever else is queued before repainting.
        while (!quit && SDL_PollEvent(&event)) {
            handle_event(event);
        }
        update_window();
    }
}

void SdlInterface::add(const SDL_Rect &rect, UpdateMode mode)
{
    if (mode == UpdateMode::FULL) {
        full_update = true;
    }
    update_rects.push_back(rect);
}

void SdlInterface::update_window()
{
    if (!full_update && update_rects.empty())
        return;

    SDL_Surface *framebuffer = SDL_GetWindowSurface(window);
    if (!framebuffer) {
        std::cerr << "SDL_GetWindowSurface failed: " << SDL_GetError() << std::endl;
        return;
    }

    if (full_update) {
        session->render(framebuffer, { 0, 0, framebuffer->w, framebuffer->h });
        if (SDL_UpdateWindowSurface(window) < 0) {
            std::cerr << "SDL_UpdateWindowSurface failed: " << SDL_GetError() << std::endl;
        }
    } else {
        for (const SDL_Rect &rect : update_rects) {
            session->render(framebuffer, rect);
        }
        if (SDL_UpdateWindowSurfaceRects(window, update_rects.data(),
                                         static_cast<int>(update_rects.size())) < 0) {
            std::cerr << "SDL_UpdateWindowSurfaceRects failed: " << SDL_GetError() << std::endl;
        }
    }
    update_rects.clear();
    full_update = false;
}

void SdlInterface::handle_event(const SDL_Event &event)
{
    if (hub->owns(event)) {
        handle_session_event(event);
        return;
    }

    switch (event.type) {
    case SDL_QUIT:
        quit = true;
        break;
    case SDL_KEYDOWN:
        handle_key_event(event.key);
        break;
    case SDL_TEXTINPUT:
        for (const KeyboardEvent &key : text_to_keyboard_events(event.text.text)) {
            session->handle_keyboard(key);
        }
        break;
    case SDL_MOUSEBUTTONDOWN:
        if (event.button.button == SDL_BUTTON_LEFT) {
            handle_mouse_click(event.button.x, event.button.y);
        }
        break;
    case SDL_WINDOWEVENT:
        if (event.window.event == SDL_WINDOWEVENT_EXPOSED) {
            add(session->get_rect(), UpdateMode::FULL);
        }
        break;
    }
}

void SdlInterface::handle_session_event(const SDL_Event &event)
{
    if (SdlEventHub::get_session_id(event) != session->get_id())
        return;

    switch (SdlEventHub::get_code(event)) {
    case SessionEventCode::WAKE:
        session->handle_wake(*this);
        break;
    case SessionEventCode::CLOSED:
        session->handle_closed();
        if (options.verbose) {
            std::cerr << "Shell exited" << std::endl;
        }
        quit = true;
        break;
    case SessionEventCode::BACK:
        quit = true;
        break;
    }
}

void SdlInterface::handle_mouse_click(int x, int y)
{
    const std::optional<SDL_Rect> &menu = session->get_menu_rect();
    const SDL_Rect &icon                = session->get_layout().icon_rect;

    if (menu && point_in_rect(x, y, *menu)) {
        session->select_quit();
    } else if (point_in_rect(x, y, icon)) {
        session->toggle_title_menu(icon, std::nullopt, *this);
    } else if (menu) {
        session->toggle_title_menu(icon, false, *this);
    }
}

void SdlInterface::handle_key_event(const SDL_KeyboardEvent &key)
{
    std::optional<KeyboardEvent> event = keysym_to_keyboard_event(key.keysym);
    if (event) {
        session->handle_keyboard(*event);
    }
}

std::optional<KeyboardEvent> SdlInterface::keysym_to_keyboard_event(const SDL_Keysym &keysym)
{
    // Ctrl chords: letters and @ [ \ ] ^ _
    if (keysym.mod & KMOD_CTRL) {
        SDL_Keycode sym = keysym.sym;
        if ((sym >= SDLK_a && sym <= SDLK_z) || sym == SDLK_AT || sym == SDLK_LEFTBRACKET ||
            sym == SDLK_BACKSLASH || sym == SDLK_RIGHTBRACKET || sym == SDLK_CARET ||
            sym == SDLK_UNDERSCORE) {
            return KeyboardEvent::control(static_cast<char32_t>(sym));
        }
    }

    // Map SDL2 keycodes to terminal input
    switch (keysym.sym) {
    case SDLK_RETURN:
    case SDLK_KP_ENTER:
        return KeyboardEvent::submit();
    case SDLK_BACKSPACE:
        return KeyboardEvent::erase();
    case SDLK_TAB:
        return KeyboardEvent::raw("\t");
    case SDLK_ESCAPE:
        return KeyboardEvent::raw("\033");
    case SDLK_UP:
        return KeyboardEvent::raw("\033[A");
    case SDLK_DOWN:
        return KeyboardEvent::raw("\033[B");
    case SDLK_RIGHT:
        return KeyboardEvent::raw("\033[C");
    case SDLK_LEFT:
        return KeyboardEvent::raw("\033[D");
    case SDLK_HOME:
        return KeyboardEvent::raw("\033[H");
    case SDLK_END:
        return KeyboardEvent::raw("\033[F");
    case SDLK_INSERT:
        return KeyboardEvent::raw("\033[2~");
    case SDLK_DELETE:
        return KeyboardEvent::raw("\033[3~");
    case SDLK_PAGEUP:
        return KeyboardEvent::raw("\033[5~");
    case SDLK_PAGEDOWN:
        return KeyboardEvent::raw("\033[6~");
    case SDLK_F1:
        return KeyboardEvent::raw("\033OP");
    case SDLK_F2:
        return KeyboardEvent::raw("\033OQ");
    case SDLK_F3:
        return KeyboardEvent::raw("\033OR");
    case SDLK_F4:
        return KeyboardEvent::raw("\033OS");
    case SDLK_F5:
        return KeyboardEvent::raw("\033[15~");
    case SDLK_F6:
        return KeyboardEvent::raw("\033[17~");
    case SDLK_F7:
        return KeyboardEvent::raw("\033[18~");
    case SDLK_F8:
        return KeyboardEvent::raw("\033[19~");
    case SDLK_F9:
        return KeyboardEvent::raw("\033[20~");
    case SDLK_F10:
        return KeyboardEvent::raw("\033[21~");
    case SDLK_F11:
        return KeyboardEvent::raw("\033[23~");
    case SDLK_F12:
        return KeyboardEvent::raw("\033[24~");
    default:
        return std::nullopt;
    }
}

std::vector<KeyboardEvent> SdlInterface::text_to_keyboard_events(const char *text)
{
    std::vector<KeyboardEvent> events;
    int32_t length = static_cast<int32_t>(std::strlen(text));
    int32_t offset = 0;
    while (offset < length) {
        UChar32 ch;
        U8_NEXT(text, offset, length, ch);
        if (ch < 0) {
            ch = 0xfffd;
        }
        events.push_back(KeyboardEvent::append(static_cast<char32_t>(ch)));
    }
    return events;
}
