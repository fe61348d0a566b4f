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
#ifndef SDL_INTERFACE_H
#define SDL_INTERFACE_H

#include <SDL2/SDL.h>

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "event_hub.h"
#include "keyboard_event.h"
#include "pty.h"

class SdlEventHub;
class TerminalSession;
class TtfFontService;

// Command line settings of the host program.
struct HostOptions {
    std::string shell{ DEFAULT_SHELL };
    std::string font_path;
    int font_size{ 16 };
    int width{ 800 };
    int height{ 600 };
    int dpi{ 300 };
    bool show_keyboard{};
    bool verbose{};
};

//
// Desktop host: a window whose surface is the framebuffer,
// with one terminal session filling it.
//
class SdlInterface : public RenderQueue {
public:
    // Throws std::runtime_error when SDL or the session cannot be set up.
    explicit SdlInterface(const HostOptions &options);
    ~SdlInterface() override;
    SdlInterface(const SdlInterface &)            = delete;
    SdlInterface &operator=(const SdlInterface &) = delete;

    // Process events until the shell exits or the user quits.
    void run();

    // Queue a repaint of the window region.
    void add(const SDL_Rect &rect, UpdateMode mode) override;

    // Map a key press to terminal input. Printable keys arrive as text input instead.
    static std::optional<KeyboardEvent> keysym_to_keyboard_event(const SDL_Keysym &keysym);

    // Split UTF-8 text input into one event per character.
    static std::vector<KeyboardEvent> text_to_keyboard_events(const char *text);

private:
    HostOptions options;

    // SDL resources
    SDL_Window *window{};
    bool ttf_initialized{};
    std::unique_ptr<TtfFontService> fonts;
    std::unique_ptr<SdlEventHub> hub;
    std::unique_ptr<TerminalSession> session;

    // Pending repaints
    std::vector<SDL_Rect> update_rects;
    bool full_update{};
    bool quit{};

    // Initialization methods
    void initialize_sdl();
    void start_session();

    // Event handling methods
    void handle_event(const SDL_Event &event);
    void handle_session_event(const SDL_Event &event);
    void handle_key_event(const SDL_KeyboardEvent &key);
    void handle_mouse_click(int x, int y);

    // Rendering
    void update_window();
};

#endif // SDL_INTERFACE_H
