// ftm_viewer.h - Text content and scrolling for the file viewer
#ifndef FTM_VIEWER_H
#define FTM_VIEWER_H

#include "ftm_core.h"

constexpr size_t MAX_VIEW_SIZE = 10 * 1024 * 1024; // 10MB
constexpr size_t MAX_LINE_LENGTH = 4096;
constexpr size_t BINARY_PROBE_SIZE = 8192;
constexpr size_t TAB_WIDTH = 8;

enum class PreviewType {
    Text,
    Binary,
    Empty,
    TooLarge
};

struct PreviewContent {
    PreviewType type = PreviewType::Empty;
    std::vector<std::string> lines;
    uintmax_t file_size = 0;
};

// NUL or a control character other than tab/newline/CR in the first 8 KiB
bool is_binary_data(const char* data, size_t size);
std::string expand_tabs(const std::string& line, size_t tab_width = TAB_WIDTH);

PreviewContent make_preview(const std::string& data);
// Throws LocalIOError when the file cannot be read
PreviewContent load_preview(const fs::path& path);

// Scroll position over a list of lines
class TextView {
private:
    std::vector<std::string> lines;
    size_t view_offset = 0;
    size_t window_height = 1;

    size_t max_offset() const;

public:
    explicit TextView(std::vector<std::string> content = {});

    const std::vector<std::string>& content() const { return lines; }
    size_t offset() const { return view_offset; }
    size_t height() const { return window_height; }

    void set_window_height(size_t height);

    void move_up();
    void move_down();
    void page_up();
    void page_down();
    void move_home();
    void move_end();

    // "Line a-b/n"
    std::string position_label() const;
};

#endif // FTM_VIEWER_H
