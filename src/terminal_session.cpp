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
#include "terminal_session.h"

#include <errno.h>
#include <poll.h>
#include <string.h>

#include <algorithm>
#include <iostream>
#include <stdexcept>
#include <system_error>
#include <tuple>
#include <vector>

#include "terminal_renderer.h"

// Size of one read from the pty.
static const size_t READ_CHUNK_SIZE = 4096;

static const char *const QUIT_LABEL = "Quit";

std::atomic<uint32_t> TerminalSession::next_id{ 1 };

int scale_by_dpi(int length, int dpi)
{
    return static_cast<int>(static_cast<float>(length) * dpi / BASE_DPI);
}

SessionLayout SessionLayout::compute(const SDL_Rect &rect, const SessionOptions &options)
{
    SessionLayout layout;
    layout.small_height    = scale_by_dpi(SMALL_BAR_HEIGHT, options.dpi);
    int big_height         = scale_by_dpi(BIG_BAR_HEIGHT, options.dpi);
    int thickness          = scale_by_dpi(THICKNESS_MEDIUM, options.dpi);
    int big_thickness      = thickness - thickness / 2;
    layout.border_thickness = std::max(thickness, 1);

    //
    // Menu icon: a square glyph of half the bar height,
    // padded and centered within a bar-sized corner square.
    //
    int icon_size    = layout.small_height / 2;
    int icon_padding = (layout.small_height - icon_size) / 2;
    int side         = icon_size + icon_padding;
    int offset       = (layout.small_height - side) / 2;
    layout.icon_rect = { rect.x + rect.w - offset - side, rect.y + offset, side, side };

    //
    // Keyboard: one small bar plus three big rows at the bottom.
    //
    int bottom = rect.y + rect.h;
    if (options.show_keyboard) {
        int top = bottom - (layout.small_height + 3 * big_height) + big_thickness;
        top     = std::max(top, rect.y);
        layout.keyboard_rect = { rect.x, top, rect.w, bottom - top };
    } else {
        layout.keyboard_rect = { rect.x, bottom, rect.w, 0 };
    }

    layout.available_width  = rect.w;
    layout.available_height = layout.keyboard_rect.y - rect.y;
    return layout;
}

TerminalSession::TerminalSession(const SDL_Rect &rect, int font_size,
                                 const SessionOptions &options, FontService &fonts,
                                 FontLoader font_loader, EventHub &hub, RenderQueue &rq)
    : id(next_id.fetch_add(1)), rect(rect), font_size(font_size), fonts(fonts), hub(hub),
      layout(SessionLayout::compute(rect, options))
{
    try {
        GridSize grid = TerminalRenderer::calculate_grid_for_font_size(
            layout.available_width, layout.available_height, font_size, fonts);
        term_rows = grid.rows;
        term_cols = grid.cols;
    } catch (const std::exception &e) {
        throw std::runtime_error(std::string("Cannot measure font: ") + e.what());
    }

    std::unique_ptr<BufferWriter> writer;
    try {
        std::tie(double_buffer, writer) = DoubleBuffer::create(rect.w, rect.h);
    } catch (const std::exception &e) {
        throw std::runtime_error(std::string("Cannot allocate frame buffers: ") + e.what());
    }

    try {
        pty = std::make_unique<Pty>(options.shell, term_rows, term_cols);
    } catch (const std::exception &e) {
        throw std::runtime_error(std::string("Cannot spawn shell: ") + e.what());
    }

    PtyReader reader(-1);
    try {
        reader = pty->take_reader();
    } catch (const std::exception &e) {
        throw std::runtime_error(std::string("Cannot open pty reader: ") + e.what());
    }

    emulator = std::make_unique<Emulator>(term_rows, term_cols);

    try {
        reader_thread = std::thread(&TerminalSession::reader_loop, this, std::move(reader),
                                    std::move(writer), std::move(font_loader));
    } catch (const std::system_error &e) {
        throw std::runtime_error(std::string("Cannot start reader thread: ") + e.what());
    }

    rq.add(rect, UpdateMode::FULL);
}

TerminalSession::~TerminalSession()
{
    shutdown_flag.store(true, std::memory_order_release);
    if (reader_thread.joinable()) {
        reader_thread.join();
    }
}

//
// Background thread: pty output -> emulator -> renderer -> double buffer.
//
void TerminalSession::reader_loop(PtyReader reader, std::unique_ptr<BufferWriter> writer,
                                  FontLoader font_loader)
{
    // Font handles cannot be shared with the UI thread.
    std::unique_ptr<FontService> thread_fonts;
    std::optional<TerminalRenderer> renderer;
    try {
        thread_fonts = font_loader();
        renderer.emplace(*thread_fonts, term_rows, term_cols, font_size);
    } catch (const std::exception &e) {
        std::cerr << "Font loading failed: " << e.what() << std::endl;
        return;
    }

    bool hangup = false;
    try {
        hangup = pump_output(reader, *writer, *renderer, *thread_fonts);
    } catch (const std::exception &e) {
        std::cerr << "Terminal reader failed: " << e.what() << std::endl;
        return;
    }

    if (hangup && !shutdown_flag.load(std::memory_order_acquire)) {
        hub.post_closed(id);
    }
}

//
// Copy pty output to the screen until shutdown or hangup.
// Returns true when the shell side has hung up.
//
bool TerminalSession::pump_output(PtyReader &reader, BufferWriter &writer,
                                  TerminalRenderer &renderer, FontService &fonts)
{
    std::vector<char> buffer(READ_CHUNK_SIZE);
    bool hangup = false;

    while (!shutdown_flag.load(std::memory_order_acquire)) {
        struct pollfd pfd = { reader.get_fd(), POLLIN, 0 };
        int ret           = poll(&pfd, 1, POLL_TIMEOUT_MS);
        if (ret < 0) {
            if (errno == EINTR)
                continue;
            std::cerr << "poll failed: " << strerror(errno) << std::endl;
            break;
        }
        if (ret == 0)
            continue;

        if (pfd.revents & POLLIN) {
            ssize_t nread = reader.read(buffer.data(), buffer.size());
            if (nread < 0) {
                if (errno == EINTR || errno == EAGAIN)
                    continue;
                if (errno == EIO) {
                    // Linux reports a closed slave side this way.
                    hangup = true;
                } else {
                    std::cerr << "PTY read failed: " << strerror(errno) << std::endl;
                }
                break;
            }
            if (nread == 0) {
                hangup = true;
                break;
            }

            std::optional<SDL_Rect> dirty_rect;
            {
                std::lock_guard<std::mutex> lock(emulator_mutex);
                emulator->feed(buffer.data(), nread);
                dirty_rect = renderer.render_screen(emulator->screen(), writer.get_back(), fonts);
            }
            if (dirty_rect) {
                absorb_rect(writer.dirty_rect, *dirty_rect);
            }
            double_buffer->swap(writer);
            hub.post_wake(id);
            continue;
        }

        if (pfd.revents & (POLLHUP | POLLERR | POLLNVAL)) {
            hangup = true;
            break;
        }
    }
    return hangup;
}

void TerminalSession::handle_keyboard(const KeyboardEvent &event)
{
    std::string bytes = encode_keyboard_event(event);
    if (bytes.empty())
        return;

    try {
        pty->write(bytes);
    } catch (const std::system_error &) {
        // Shell is gone; the reader thread reports the hangup.
    }
}

void TerminalSession::handle_wake(RenderQueue &rq)
{
    DirtyState dirty = double_buffer->take_dirty();
    if (dirty.full_refresh) {
        rq.add(rect, UpdateMode::FULL);
        return;
    }
    for (const SDL_Rect &local : dirty.rects) {
        rq.add({ rect.x + local.x, rect.y + local.y, local.w, local.h }, UpdateMode::FAST);
    }
}

void TerminalSession::toggle_title_menu(const SDL_Rect &anchor, std::optional<bool> enable,
                                        RenderQueue &rq)
{
    if (menu_rect) {
        if (enable && *enable)
            return;

        rq.add(*menu_rect, UpdateMode::FAST);
        menu_rect.reset();
    } else {
        if (enable && !*enable)
            return;

        FontMetrics metrics = fonts.metrics(font_size);
        int padding         = std::max(layout.small_height / 4, 1);
        int width           = fonts.measure(QUIT_LABEL, font_size) + 2 * padding;
        int height = std::max(layout.small_height, metrics.ascent - metrics.descent + 2 * padding);
        int x      = std::max(rect.x, anchor.x + anchor.w - width);
        menu_rect  = SDL_Rect{ x, anchor.y + anchor.h, width, height };
        rq.add(*menu_rect, UpdateMode::FAST);
    }
}

void TerminalSession::select_quit()
{
    hub.post_back(id);
}

void TerminalSession::handle_closed()
{
    exited = true;
}

std::string TerminalSession::screen_contents() const
{
    std::lock_guard<std::mutex> lock(emulator_mutex);
    return emulator->screen().contents();
}

void TerminalSession::render(SDL_Surface *framebuffer, const SDL_Rect &area)
{
    SDL_Rect visible;
    if (!SDL_IntersectRect(&area, &rect, &visible))
        return;

    SDL_Rect local = { visible.x - rect.x, visible.y - rect.y, visible.w, visible.h };
    double_buffer->blit_front(framebuffer, local, visible.x, visible.y);
    render_decorations(framebuffer, visible);
}

//
// Menu icon, keyboard band border and the title menu, drawn over the grid.
//
void TerminalSession::render_decorations(SDL_Surface *framebuffer, const SDL_Rect &clip)
{
    SDL_SetClipRect(framebuffer, &clip);

    // Three bars of the menu icon.
    const SDL_Rect &icon = layout.icon_rect;
    int bar_height       = std::max(icon.h / 8, 1);
    for (int i = 1; i <= 3; ++i) {
        SDL_Rect bar = { icon.x + icon.w / 4, icon.y + i * icon.h / 4 - bar_height / 2,
                         icon.w / 2, bar_height };
        fill_rect(framebuffer, bar, COLOR_BLACK);
    }

    const SDL_Rect &kb = layout.keyboard_rect;
    if (kb.h > 0) {
        fill_rect(framebuffer, { kb.x, kb.y, kb.w, layout.border_thickness }, COLOR_BLACK);
    }

    if (menu_rect) {
        const SDL_Rect &menu = *menu_rect;
        int border           = layout.border_thickness;
        fill_rect(framebuffer, menu, COLOR_BLACK);
        fill_rect(framebuffer,
                  { menu.x + border, menu.y + border, menu.w - 2 * border, menu.h - 2 * border },
                  COLOR_WHITE);

        FontMetrics metrics = fonts.metrics(font_size);
        int text_width      = fonts.measure(QUIT_LABEL, font_size);
        int line_height     = metrics.ascent - metrics.descent;
        int x               = menu.x + (menu.w - text_width) / 2;
        int baseline        = menu.y + (menu.h - line_height) / 2 + metrics.ascent;
        fonts.draw_text(framebuffer, QUIT_LABEL, font_size, x, baseline, COLOR_BLACK, false);
    }

    SDL_SetClipRect(framebuffer, nullptr);
}
