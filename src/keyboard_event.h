//
// Keyboard input delivered to a terminal session.
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
#ifndef KEYBOARD_EVENT_H
#define KEYBOARD_EVENT_H

#include <string>

// Kinds of decoded input delivered by the host.
enum class KeyboardEventKind { APPEND, SUBMIT, DELETE, RAW, CONTROL };

struct KeyboardEvent {
    KeyboardEventKind kind{ KeyboardEventKind::RAW };
    char32_t character{}; // APPEND: code point, CONTROL: letter
    std::string bytes;    // RAW

    static KeyboardEvent append(char32_t ch);
    static KeyboardEvent submit();
    static KeyboardEvent erase();
    static KeyboardEvent raw(const std::string &bytes);
    static KeyboardEvent control(char32_t letter);
};

//
// Bytes to send to the shell for this event.
// Empty when the event has no terminal encoding.
//
std::string encode_keyboard_event(const KeyboardEvent &event);

#endif // KEYBOARD_EVENT_H
