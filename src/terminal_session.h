//
// Terminal session: shell, emulator, renderer and their threads.
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
#ifndef TERMINAL_SESSION_H
#define TERMINAL_SESSION_H

#include <gtest/gtest_prod.h>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>

#include "double_buffer.h"
#include "emulator.h"
#include "event_hub.h"
#include "font_service.h"
#include "keyboard_event.h"
#include "pty.h"

class TerminalRenderer;

// Layout dimensions at the reference resolution of 300 dpi.
static const int BASE_DPI         = 300;
static const int SMALL_BAR_HEIGHT = 121;
static const int BIG_BAR_HEIGHT   = 163;
static const int THICKNESS_MEDIUM = 2;

// How often the reader thread checks for shutdown.
static const int POLL_TIMEOUT_MS = 100;

struct SessionOptions {
    std::string shell{ DEFAULT_SHELL };
    bool show_keyboard{ true };
    int dpi{ BASE_DPI };
};

//
// Placement of the session parts inside the widget rectangle.
//
struct SessionLayout {
    SDL_Rect icon_rect;     // menu affordance, top right corner
    SDL_Rect keyboard_rect; // on-screen keyboard band, bottom; empty when hidden
    int small_height;
    int border_thickness;
    int available_width;    // pixels left for the character grid
    int available_height;

    static SessionLayout compute(const SDL_Rect &rect, const SessionOptions &options);
};

// Convert a length at BASE_DPI into pixels.
int scale_by_dpi(int length, int dpi);

//
// One shell running inside a rectangle of the host UI.
//
// The UI thread calls all public methods. A background thread reads
// the pty, feeds the emulator, renders into the double buffer and
// notifies the UI thread through the event hub.
//
class TerminalSession {
public:
    // Throws std::runtime_error naming the step that failed.
    TerminalSession(const SDL_Rect &rect, int font_size, const SessionOptions &options,
                    FontService &fonts, FontLoader font_loader, EventHub &hub, RenderQueue &rq);
    ~TerminalSession();
    TerminalSession(const TerminalSession &)            = delete;
    TerminalSession &operator=(const TerminalSession &) = delete;

    uint32_t get_id() const { return id; }
    const SDL_Rect &get_rect() const { return rect; }
    const SessionLayout &get_layout() const { return layout; }
    int get_rows() const { return term_rows; }
    int get_cols() const { return term_cols; }
    pid_t get_shell_pid() const { return pty->get_pid(); }

    // Route decoded input to the shell.
    void handle_keyboard(const KeyboardEvent &event);

    // A new frame was published: schedule repaints.
    void handle_wake(RenderQueue &rq);

    // Open or close the title menu near the given rectangle.
    // With enable set, only that transition is allowed.
    void toggle_title_menu(const SDL_Rect &anchor, std::optional<bool> enable, RenderQueue &rq);
    bool is_title_menu_open() const { return menu_rect.has_value(); }
    const std::optional<SDL_Rect> &get_menu_rect() const { return menu_rect; }

    // "Quit" entry of the title menu.
    void select_quit();

    // The shell has gone away.
    void handle_closed();
    bool is_exited() const { return exited; }

    // Paint the part of the session inside area into the host framebuffer.
    void render(SDL_Surface *framebuffer, const SDL_Rect &area);

    // Text of the character grid, rows separated by newlines.
    std::string screen_contents() const;

private:
    FRIEND_TEST(TerminalSessionTest, ReaderThreadStopsOnDestruction);

    static std::atomic<uint32_t> next_id;

    const uint32_t id;
    const SDL_Rect rect;
    const int font_size;
    FontService &fonts;
    EventHub &hub;
    SessionLayout layout;
    int term_rows{};
    int term_cols{};
    bool exited{};
    std::optional<SDL_Rect> menu_rect;

    std::unique_ptr<Pty> pty;
    mutable std::mutex emulator_mutex;
    std::unique_ptr<Emulator> emulator;
    std::shared_ptr<DoubleBuffer> double_buffer;
    std::atomic<bool> shutdown_flag{ false };
    std::thread reader_thread;

    void reader_loop(PtyReader reader, std::unique_ptr<BufferWriter> writer,
                     FontLoader font_loader);
    bool pump_output(PtyReader &reader, BufferWriter &writer, TerminalRenderer &renderer,
                     FontService &fonts);
    void render_decorations(SDL_Surface *framebuffer, const SDL_Rect &clip);
};

#endif // TERMINAL_SESSION_H
