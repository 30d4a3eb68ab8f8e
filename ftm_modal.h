// ftm_modal.h - Blocking confirmation and text input overlays
#ifndef FTM_MODAL_H
#define FTM_MODAL_H

#include "ftm_core.h"

// Border color and title of a confirmation box
enum class ModalKind {
    Default,
    Delete,
    Upload,
    Download
};

// Overlays provided by the front end. Every call blocks the input loop
// until the user answers.
class Modal {
public:
    virtual ~Modal() = default;

    // true only on an explicit yes
    virtual bool confirm(const std::string& prompt, ModalKind kind) = 0;
    // Empty result when cancelled
    virtual std::string prompt_text(const std::string& label, const std::string& prefill) = 0;
    virtual void view_text(const std::string& title, const std::vector<std::string>& lines) = 0;
    // Returns the editor's exit status
    virtual int run_editor(const fs::path& file) = 0;
    // Paint a status line before a slow synchronous call
    virtual void show_status(const StatusMessage& message) = 0;
};

enum class ConfirmAnswer {
    Yes,
    No,
    Ignored
};

ConfirmAnswer confirm_answer(int key);

// Characters in a UTF-8 string
size_t utf8_length(const std::string& text);
// Byte offset of the character at index, or the size when past the end
size_t utf8_offset(const std::string& text, size_t index);

// Single line editing of a prefilled value. Bytes of multi-byte UTF-8
// characters are typed one at a time; cursor movement and deletion step
// over whole characters.
class LineEditor {
private:
    std::string buffer;
    size_t cursor_pos;

    size_t previous_char() const;
    size_t next_char() const;

public:
    enum class Result {
        Continue,
        Accept,
        Cancel
    };

    explicit LineEditor(const std::string& prefill = "");

    Result handle_key(int key);

    const std::string& text() const { return buffer; }
    size_t cursor() const { return cursor_pos; }
    size_t cursor_column() const { return utf8_length(buffer.substr(0, cursor_pos)); }
    std::string result() const { return trim(buffer); }
};

#endif // FTM_MODAL_H
