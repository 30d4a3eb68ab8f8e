// ftm_modal.cpp - Key handling shared by the overlays
#include "ftm_modal.h"

#include <algorithm>

#include <ncurses.h>

namespace {

constexpr int KEY_ESCAPE = 27;

bool is_enter(int key) {
    return key == '\n' || key == '\r' || key == KEY_ENTER;
}

bool is_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

} // namespace

ConfirmAnswer confirm_answer(int key) {
    if (is_enter(key) || key == 'y' || key == 'Y') {
        return ConfirmAnswer::Yes;
    }
    if (key == KEY_ESCAPE || key == 'n' || key == 'N' || key == 'q') {
        return ConfirmAnswer::No;
    }
    return ConfirmAnswer::Ignored;
}

size_t utf8_length(const std::string& text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) { return !is_continuation(c); }));
}

size_t utf8_offset(const std::string& text, size_t index) {
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); i++) {
        if (is_continuation(text[i])) continue;
        if (seen == index) return i;
        seen++;
    }
    return text.size();
}

LineEditor::LineEditor(const std::string& prefill) : buffer(prefill), cursor_pos(prefill.size()) {}

size_t LineEditor::previous_char() const {
    size_t pos = cursor_pos;
    while (pos > 0) {
        pos--;
        if (!is_continuation(buffer[pos])) break;
    }
    return pos;
}

size_t LineEditor::next_char() const {
    size_t pos = cursor_pos;
    if (pos < buffer.size()) pos++;
    while (pos < buffer.size() && is_continuation(buffer[pos])) pos++;
    return pos;
}

LineEditor::Result LineEditor::handle_key(int key) {
    if (is_enter(key)) {
        return Result::Accept;
    }

    switch (key) {
        case KEY_ESCAPE:
            buffer.clear();
            cursor_pos = 0;
            return Result::Cancel;

        case KEY_BACKSPACE:
        case 127:
        case 8:
            if (cursor_pos > 0) {
                size_t start = previous_char();
                buffer.erase(start, cursor_pos - start);
                cursor_pos = start;
            }
            break;

        case KEY_DC:
            if (cursor_pos < buffer.size()) {
                buffer.erase(cursor_pos, next_char() - cursor_pos);
            }
            break;

        case KEY_LEFT:
            cursor_pos = previous_char();
            break;

        case KEY_RIGHT:
            cursor_pos = next_char();
            break;

        case KEY_HOME:
            cursor_pos = 0;
            break;

        case KEY_END:
            cursor_pos = buffer.size();
            break;

        default:
            // getch hands over UTF-8 input one byte at a time
            if ((key >= 32 && key <= 126) || (key >= 128 && key <= 255)) {
                buffer.insert(cursor_pos, 1, static_cast<char>(key));
                cursor_pos++;
            }
            break;
    }
    return Result::Continue;
}
