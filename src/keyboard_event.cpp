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
#include "keyboard_event.h"

#include <unicode/utf.h>
#include <unicode/utf8.h>

KeyboardEvent KeyboardEvent::append(char32_t ch)
{
    KeyboardEvent event;
    event.kind      = KeyboardEventKind::APPEND;
    event.character = ch;
    return event;
}

KeyboardEvent KeyboardEvent::submit()
{
    KeyboardEvent event;
    event.kind = KeyboardEventKind::SUBMIT;
    return event;
}

KeyboardEvent KeyboardEvent::erase()
{
    KeyboardEvent event;
    event.kind = KeyboardEventKind::DELETE;
    return event;
}

KeyboardEvent KeyboardEvent::raw(const std::string &bytes)
{
    KeyboardEvent event;
    event.kind  = KeyboardEventKind::RAW;
    event.bytes = bytes;
    return event;
}

KeyboardEvent KeyboardEvent::control(char32_t letter)
{
    KeyboardEvent event;
    event.kind      = KeyboardEventKind::CONTROL;
    event.character = letter;
    return event;
}

//
// Encode code point as UTF-8.
//
static std::string utf8_encode(char32_t ch)
{
    if (ch > 0x10ffff || U_IS_SURROGATE(ch))
        return "";

    char buf[U8_MAX_LENGTH];
    int32_t length = 0;
    U8_APPEND_UNSAFE(buf, length, static_cast<UChar32>(ch));
    return std::string(buf, length);
}

//
// Control chord: Ctrl+A is 0x01, Ctrl+Z is 0x1a.
// Ctrl+@ and Ctrl+[ ... Ctrl+_ follow the same rule.
//
static std::string control_code(char32_t letter)
{
    if (letter >= 'a' && letter <= 'z') {
        letter -= 'a' - 'A';
    }
    if (letter < '@' || letter > '_')
        return "";

    return std::string(1, static_cast<char>(letter - 'A' + 1));
}

std::string encode_keyboard_event(const KeyboardEvent &event)
{
    switch (event.kind) {
    case KeyboardEventKind::APPEND:
        return utf8_encode(event.character);
    case KeyboardEventKind::SUBMIT:
        return "\r";
    case KeyboardEventKind::DELETE:
        return "\177";
    case KeyboardEventKind::RAW:
        return event.bytes;
    case KeyboardEventKind::CONTROL:
        return control_code(event.character);
    }
    return "";
}
