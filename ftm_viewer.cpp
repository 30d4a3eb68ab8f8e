// ftm_viewer.cpp - File viewer implementation
#include "ftm_viewer.h"

#include <algorithm>
#include <fstream>
#include <iterator>

namespace {

std::string truncate_line(const std::string& line, size_t max_length) {
    if (line.length() <= max_length) {
        return line;
    }
    return line.substr(0, max_length - 3) + "...";
}

} // namespace

bool is_binary_data(const char* data, size_t size) {
    size_t check_size = std::min(size, BINARY_PROBE_SIZE);
    for (size_t i = 0; i < check_size; i++) {
        unsigned char c = static_cast<unsigned char>(data[i]);
        if (c == 0 || (c < 32 && c != '\t' && c != '\n' && c != '\r')) {
            return true;
        }
    }
    return false;
}

std::string expand_tabs(const std::string& line, size_t tab_width) {
    std::string out;
    out.reserve(line.size());
    for (char c : line) {
        if (c == '\t') {
            out.append(tab_width - out.size() % tab_width, ' ');
        } else {
            out += c;
        }
    }
    return out;
}

PreviewContent make_preview(const std::string& data) {
    PreviewContent content;
    content.file_size = data.size();

    if (data.empty()) {
        content.type = PreviewType::Empty;
        return content;
    }
    if (data.size() > MAX_VIEW_SIZE) {
        content.type = PreviewType::TooLarge;
        return content;
    }
    if (is_binary_data(data.data(), data.size())) {
        content.type = PreviewType::Binary;
        return content;
    }

    content.type = PreviewType::Text;
    size_t start = 0;
    while (start < data.size()) {
        size_t end = data.find('\n', start);
        if (end == std::string::npos) end = data.size();

        std::string line = data.substr(start, end - start);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        content.lines.push_back(truncate_line(expand_tabs(line), MAX_LINE_LENGTH));
        start = end + 1;
    }
    return content;
}

PreviewContent load_preview(const fs::path& path) {
    std::error_code ec;
    uintmax_t size = fs::file_size(path, ec);
    if (ec) {
        throw LocalIOError("Cannot read " + path.string() + ": " + ec.message());
    }
    if (size > MAX_VIEW_SIZE) {
        PreviewContent content;
        content.type = PreviewType::TooLarge;
        content.file_size = size;
        return content;
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw LocalIOError("Cannot open " + path.string());
    }
    std::string data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return make_preview(data);
}

// TextView implementation
TextView::TextView(std::vector<std::string> content) : lines(std::move(content)) {}

size_t TextView::max_offset() const {
    return lines.size() > window_height ? lines.size() - window_height : 0;
}

void TextView::set_window_height(size_t height) {
    window_height = std::max<size_t>(1, height);
    view_offset = std::min(view_offset, max_offset());
}

void TextView::move_up() {
    if (view_offset > 0) view_offset--;
}

void TextView::move_down() {
    if (view_offset < max_offset()) view_offset++;
}

void TextView::page_up() {
    view_offset = view_offset >= window_height ? view_offset - window_height : 0;
}

void TextView::page_down() {
    view_offset = std::min(view_offset + window_height, max_offset());
}

void TextView::move_home() {
    view_offset = 0;
}

void TextView::move_end() {
    view_offset = max_offset();
}

std::string TextView::position_label() const {
    size_t first = lines.empty() ? 0 : view_offset + 1;
    size_t last = std::min(view_offset + window_height, lines.size());
    return "Line " + std::to_string(first) + "-" + std::to_string(last) + "/" + std::to_string(lines.size());
}
