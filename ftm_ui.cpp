// ftm_ui.cpp - ncurses front end implementation
#include "ftm_ui.h"

#include <algorithm>
#include <cstdlib>
#include <iomanip>
#include <sstream>
#include <sys/wait.h>

#include <spdlog/spdlog.h>

namespace {

constexpr int KEY_ESCAPE = 27;

std::string shell_quote(const std::string& text) {
    std::string quoted = "'";
    for (char c : text) {
        if (c == '\'') {
            quoted += "'\\''";
        } else {
            quoted += c;
        }
    }
    return quoted + "'";
}

std::string fit(const std::string& text, int width) {
    if (width <= 0) return "";
    if (static_cast<int>(text.length()) <= width) return text;
    if (width <= 2) return text.substr(0, width);
    return text.substr(0, width - 2) + "..";
}

std::string center(const std::string& text, int width) {
    if (static_cast<int>(text.length()) >= width) return fit(text, width);
    int left = (width - static_cast<int>(text.length())) / 2;
    return std::string(left, ' ') + text;
}

int message_pair(MessageType type) {
    switch (type) {
        case MessageType::Success: return PAIR_SUCCESS;
        case MessageType::Error: return PAIR_ERROR;
        case MessageType::Info: break;
    }
    return PAIR_INFO;
}

} // namespace

InteractiveUI::InteractiveUI(Config& cfg, Session& session, TransferEngine& engine)
    : controller(cfg, session, engine, *this) {
    screen = newterm(nullptr, stdout, stdin);
    if (!screen) {
        const char* term = std::getenv("TERM");
        throw FtmError(std::string("Cannot initialize terminal (TERM=") + (term ? term : "unset") + ")");
    }
    set_term(screen);

    try {
        cbreak();
        noecho();
        keypad(stdscr, TRUE);
        curs_set(0);
        set_escdelay(25);
        scrollok(stdscr, FALSE);

        init_colors();
        update_window_layout();
    } catch (const FtmError&) {
        // the destructor does not run for a half-built object
        if (local_win) delwin(local_win);
        if (remote_win) delwin(remote_win);
        endwin();
        delscreen(screen);
        throw;
    }
}

InteractiveUI::~InteractiveUI() {
    if (local_win) delwin(local_win);
    if (remote_win) delwin(remote_win);
    if (screen) {
        endwin();
        delscreen(screen);
    }
}

void InteractiveUI::init_colors() {
    if (!has_colors()) {
        return;
    }
    start_color();
    use_default_colors();
    init_pair(PAIR_INFO, COLOR_CYAN, -1);
    init_pair(PAIR_SUCCESS, COLOR_GREEN, -1);
    init_pair(PAIR_ERROR, COLOR_RED, -1);
    init_pair(PAIR_KEYS, COLOR_YELLOW, -1);
    init_pair(PAIR_HEADER, COLOR_BLACK, COLOR_CYAN);

    init_pair(PAIR_REMOTE_PATH, COLOR_BLUE, -1);
    init_pair(PAIR_REMOTE_SELECTED, COLOR_WHITE, COLOR_BLUE);
    init_pair(PAIR_REMOTE_DIR, COLOR_BLUE, -1);

    init_pair(PAIR_LOCAL_PATH, COLOR_CYAN, -1);
    init_pair(PAIR_LOCAL_SELECTED, COLOR_WHITE, COLOR_CYAN);
    init_pair(PAIR_LOCAL_DIR, COLOR_CYAN, -1);

    init_pair(PAIR_MODAL_DELETE, COLOR_RED, -1);
    init_pair(PAIR_MODAL_UPLOAD, COLOR_CYAN, -1);
    init_pair(PAIR_MODAL_DOWNLOAD, COLOR_GREEN, -1);
    init_pair(PAIR_UNFOCUSED, COLOR_BLACK, COLOR_WHITE);
}

// Header row, two panes, key bar and status line
void InteractiveUI::update_window_layout() {
    if (local_win) {
        delwin(local_win);
        local_win = nullptr;
    }
    if (remote_win) {
        delwin(remote_win);
        remote_win = nullptr;
    }

    int pane_height = std::max(1, LINES - 3);
    int split_pos = std::max(2, COLS / 2);

    local_win = newwin(pane_height, std::max(1, split_pos - 1), 1, 0);
    remote_win = newwin(pane_height, std::max(1, COLS - split_pos), 1, split_pos);
    if (!local_win || !remote_win) {
        throw FtmError("Cannot create windows for a " + std::to_string(COLS) + "x" +
                       std::to_string(LINES) + " terminal");
    }
    clearok(curscr, TRUE);
}

void InteractiveUI::handle_resize() {
    update_window_layout();
}

int InteractiveUI::list_height() const {
    return std::max(1, LINES - 4);
}

void InteractiveUI::run() {
    draw();
    controller.start();

    while (true) {
        controller.tick();
        draw();

        // The worker stores its outcome before it clears the active flag
        wtimeout(stdscr, controller.transfer_pending() ? static_cast<int>(TRANSFER_POLL.count()) : -1);
        int ch = getch();

        if (ch == ERR) {
            continue;
        }
        if (ch == KEY_RESIZE) {
            handle_resize();
            continue;
        }
        if (!controller.handle_key(ch)) {
            break;
        }
    }
}

// Drawing
void InteractiveUI::draw() {
    controller.set_visible_height(static_cast<size_t>(list_height()));

    werase(stdscr);
    draw_header();
    draw_key_bar();
    draw_status_line();
    mvwvline(stdscr, 1, std::max(2, COLS / 2) - 1, ACS_VLINE, std::max(1, LINES - 3));
    wnoutrefresh(stdscr);

    DualPane& panes = controller.dual_pane();
    draw_pane(local_win, panes.local(), panes.active_side() == PaneSide::Local);
    draw_pane(remote_win, panes.remote(), panes.active_side() == PaneSide::Remote);

    if (controller.help_visible()) {
        draw_help();
    }
    doupdate();
}

void InteractiveUI::draw_header() {
    const std::string title = "ftm " FTM_VERSION " - FTP File Manager";

    wattron(stdscr, COLOR_PAIR(PAIR_HEADER));
    mvwhline(stdscr, 0, 0, ' ', COLS);
    wattron(stdscr, A_BOLD);
    mvwaddnstr(stdscr, 0, 0, center(title, COLS).c_str(), COLS);
    wattroff(stdscr, A_BOLD);
    wattroff(stdscr, COLOR_PAIR(PAIR_HEADER));

    std::string state;
    int attr;
    if (controller.ui_session().is_connected()) {
        const auto& server = controller.ui_session().settings();
        state = " * " + server.host + ":" + std::to_string(server.port) + " ";
        attr = COLOR_PAIR(PAIR_SUCCESS) | A_BOLD;
    } else {
        state = " - Disconnected ";
        attr = COLOR_PAIR(PAIR_ERROR) | A_BOLD;
    }
    int x = COLS - static_cast<int>(state.length()) - 1;
    if (x > 0) {
        wattron(stdscr, attr);
        mvwaddstr(stdscr, 0, x, state.c_str());
        wattroff(stdscr, attr);
    }
}

void InteractiveUI::draw_pane(WINDOW* win, Pane& pane, bool focused) {
    werase(win);
    int height = getmaxy(win);
    int width = getmaxx(win);

    const bool remote = pane.side() == PaneSide::Remote;
    const bool connected = controller.ui_session().is_connected();

    std::string label = remote ? " REMOTE: " : " LOCAL: ";
    std::string location = remote && !connected ? "(not connected)" : pane.current_path();
    std::string bar = label + shorten_path(location, static_cast<size_t>(std::max(0, width - static_cast<int>(label.length()) - 1)));

    int path_attr = COLOR_PAIR(remote ? PAIR_REMOTE_PATH : PAIR_LOCAL_PATH) | (focused ? A_BOLD | A_REVERSE : A_BOLD);
    wattron(win, path_attr);
    mvwhline(win, 0, 0, ' ', width);
    mvwaddnstr(win, 0, 0, bar.c_str(), width);
    wattroff(win, path_attr);

    const auto& items = pane.items();
    if (items.empty()) {
        const char* hint = remote && !connected ? "Press 'c' to connect" : "(empty)";
        wattron(win, A_DIM);
        mvwaddnstr(win, 1, 2, hint, std::max(0, width - 2));
        wattroff(win, A_DIM);
    }

    size_t offset = pane.view_offset();
    for (int row = 1; row < height; row++) {
        size_t index = offset + static_cast<size_t>(row - 1);
        if (index >= items.size()) break;
        draw_entry_line(win, items[index], row, width, index == pane.cursor_index(), focused, pane.side());
    }

    wnoutrefresh(win);
}

void InteractiveUI::draw_entry_line(WINDOW* win, const Entry& entry, int y, int width, bool selected,
                                    bool focused, PaneSide side) {
    std::string name = entry.is_directory ? entry.name + "/" : entry.name;
    std::string size_str;
    if (!entry.is_parent()) {
        size_str = entry.is_directory ? "<DIR>" : format_size(static_cast<double>(entry.size));
    }

    int name_width = width - static_cast<int>(size_str.length()) - 3;
    std::string line = " " + fit(name, std::max(0, name_width));
    int padding = width - static_cast<int>(line.length()) - static_cast<int>(size_str.length()) - 1;
    if (padding > 0) {
        line += std::string(padding, ' ') + size_str + " ";
    }

    const bool remote = side == PaneSide::Remote;
    int attr = A_NORMAL;
    if (selected && focused) {
        attr = COLOR_PAIR(remote ? PAIR_REMOTE_SELECTED : PAIR_LOCAL_SELECTED) | A_BOLD;
    } else if (selected) {
        attr = COLOR_PAIR(PAIR_UNFOCUSED);
    } else if (entry.is_directory) {
        attr = COLOR_PAIR(remote ? PAIR_REMOTE_DIR : PAIR_LOCAL_DIR) | A_BOLD;
    }

    wattron(win, attr);
    if (selected) {
        mvwhline(win, y, 0, ' ', width);
    }
    mvwaddnstr(win, y, 0, line.c_str(), width);
    wattroff(win, attr);
}

void InteractiveUI::draw_key_bar() {
    std::string keys;
    if (!controller.ui_session().is_connected()) {
        keys = " c:Connect | s:Set Server | Tab:Switch | v:View | ?:Help | q:Quit ";
    } else if (controller.dual_pane().active_side() == PaneSide::Remote) {
        keys = " Enter:Open | d:Download | D:Del | r:Rename | m:Mkdir | /:Search | v:View | e:Edit | "
               "Tab:Local | c:Disc | ?:Help | q:Quit ";
    } else {
        keys = " Enter:Open | u:Upload | D:Del | r:Rename | m:Mkdir | /:Search | v:View | "
               "Tab:Remote | c:Disc | ?:Help | q:Quit ";
    }
    if (controller.transfer_active()) {
        keys = " x:Cancel transfer |" + keys;
    }

    wattron(stdscr, COLOR_PAIR(PAIR_KEYS));
    mvwaddnstr(stdscr, LINES - 2, 0, center(keys, COLS - 1).c_str(), COLS - 1);
    wattroff(stdscr, COLOR_PAIR(PAIR_KEYS));
}

void InteractiveUI::draw_status_line() {
    if (controller.transfer_active()) {
        draw_progress(controller.transfer_snapshot());
    } else {
        draw_message(controller.status_message());
    }
}

void InteractiveUI::draw_message(const StatusMessage& message) {
    int y = LINES - 1;
    int attr = COLOR_PAIR(message_pair(message.type));

    wmove(stdscr, y, 0);
    wclrtoeol(stdscr);
    if (message.text.empty()) {
        return;
    }
    wattron(stdscr, attr);
    mvwaddnstr(stdscr, y, 0, (" " + message.text).c_str(), COLS - 1);
    wattroff(stdscr, attr);
}

void InteractiveUI::draw_progress(const TransferSnapshot& snapshot) {
    std::string action;
    if (snapshot.cancel_requested) {
        action = "Cancelling";
    } else {
        action = snapshot.kind == TransferKind::Upload ? "Uploading" : "Downloading";
    }

    const double fraction = snapshot.fraction();
    const int bar_width = std::max(0, std::min(30, COLS - 70));
    const int filled = static_cast<int>(bar_width * fraction);

    std::string counts;
    if (snapshot.is_folder) {
        counts = std::to_string(snapshot.files_done) + "/" + std::to_string(snapshot.files_total) + " files";
    } else {
        counts = format_size(static_cast<double>(snapshot.bytes_transferred)) + "/" +
                 format_size(static_cast<double>(snapshot.bytes_total));
    }

    std::ostringstream text;
    text << " " << action << ": " << fit(snapshot.description, 18) << "  ";
    if (bar_width > 0) {
        text << "[" << std::string(filled, '#') << std::string(bar_width - filled, '-') << "] ";
    }
    text << std::fixed << std::setprecision(1) << std::setw(5) << fraction * 100.0 << "%  "
         << counts << "  " << format_size(snapshot.speed) << "/s  (x to cancel)";

    wmove(stdscr, LINES - 1, 0);
    wclrtoeol(stdscr);
    wattron(stdscr, COLOR_PAIR(PAIR_INFO) | A_BOLD);
    mvwaddnstr(stdscr, LINES - 1, 0, text.str().c_str(), COLS - 1);
    wattroff(stdscr, COLOR_PAIR(PAIR_INFO) | A_BOLD);
}

void InteractiveUI::draw_help() {
    const int help_height = std::min(22, LINES);
    const int help_width = std::min(72, COLS);
    WINDOW* win = newwin(help_height, help_width, (LINES - help_height) / 2, (COLS - help_width) / 2);
    if (!win) return;

    werase(win);
    wattron(win, COLOR_PAIR(PAIR_KEYS));
    box(win, 0, 0);
    wattron(win, A_BOLD);
    mvwaddstr(win, 0, std::max(1, help_width / 2 - 3), " HELP ");
    wattroff(win, A_BOLD);
    wattroff(win, COLOR_PAIR(PAIR_KEYS));

    int y = 2;
    int left_col = 2;
    int right_col = help_width / 2 + 1;

    mvwprintw(win, y++, left_col, "Navigation:");
    mvwprintw(win, y, left_col + 2, "Up/k Down/j");
    mvwprintw(win, y++, left_col + 16, "Move");
    mvwprintw(win, y, left_col + 2, "PgUp/PgDn");
    mvwprintw(win, y++, left_col + 16, "Page");
    mvwprintw(win, y, left_col + 2, "Home/g End/G");
    mvwprintw(win, y++, left_col + 16, "First/last");
    mvwprintw(win, y, left_col + 2, "Enter/Right/l");
    mvwprintw(win, y++, left_col + 16, "Open dir");
    mvwprintw(win, y, left_col + 2, "Left/h/Bksp");
    mvwprintw(win, y++, left_col + 16, "Parent dir");
    mvwprintw(win, y, left_col + 2, "Tab");
    mvwprintw(win, y++, left_col + 16, "Switch pane");
    mvwprintw(win, y, left_col + 2, "f or /");
    mvwprintw(win, y++, left_col + 16, "Search");
    mvwprintw(win, y, left_col + 2, "R");
    mvwprintw(win, y++, left_col + 16, "Refresh");

    y++;
    mvwprintw(win, y++, left_col, "Connection:");
    mvwprintw(win, y, left_col + 2, "c");
    mvwprintw(win, y++, left_col + 16, "(Dis)connect");
    mvwprintw(win, y, left_col + 2, "s");
    mvwprintw(win, y++, left_col + 16, "Set server");
    mvwprintw(win, y, left_col + 2, "q");
    mvwprintw(win, y++, left_col + 16, "Quit");

    y = 2;
    mvwprintw(win, y++, right_col, "Files:");
    mvwprintw(win, y, right_col + 2, "u");
    mvwprintw(win, y++, right_col + 8, "Upload file/folder");
    mvwprintw(win, y, right_col + 2, "d");
    mvwprintw(win, y++, right_col + 8, "Download file/folder");
    mvwprintw(win, y, right_col + 2, "x");
    mvwprintw(win, y++, right_col + 8, "Cancel transfer");
    mvwprintw(win, y, right_col + 2, "D");
    mvwprintw(win, y++, right_col + 8, "Delete");
    mvwprintw(win, y, right_col + 2, "r");
    mvwprintw(win, y++, right_col + 8, "Rename");
    mvwprintw(win, y, right_col + 2, "m");
    mvwprintw(win, y++, right_col + 8, "Make directory");
    mvwprintw(win, y, right_col + 2, "v");
    mvwprintw(win, y++, right_col + 8, "View file");
    mvwprintw(win, y, right_col + 2, "e");
    mvwprintw(win, y++, right_col + 8, "Edit remote file");

    mvwprintw(win, help_height - 2, left_col, "Press any key to close");

    wnoutrefresh(win);
    delwin(win);
}

// Modal overlays
bool InteractiveUI::confirm(const std::string& prompt, ModalKind kind) {
    int pair = PAIR_KEYS;
    std::string title = "CONFIRM";
    switch (kind) {
        case ModalKind::Delete:
            pair = PAIR_MODAL_DELETE;
            title = "DELETE";
            break;
        case ModalKind::Upload:
            pair = PAIR_MODAL_UPLOAD;
            title = "UPLOAD";
            break;
        case ModalKind::Download:
            pair = PAIR_MODAL_DOWNLOAD;
            title = "DOWNLOAD";
            break;
        case ModalKind::Default:
            break;
    }

    const int dialog_height = 7;
    const int dialog_width = std::min(std::max(static_cast<int>(prompt.length()) + 10, 36), std::max(COLS - 4, 10));
    WINDOW* dialog = newwin(dialog_height, dialog_width, (LINES - dialog_height) / 2, (COLS - dialog_width) / 2);
    if (!dialog) {
        throw FtmError("Cannot open confirmation dialog");
    }
    keypad(dialog, TRUE);

    wattron(dialog, COLOR_PAIR(pair) | A_BOLD);
    box(dialog, 0, 0);
    std::string heading = " " + title + " ";
    mvwaddstr(dialog, 0, std::max(1, (dialog_width - static_cast<int>(heading.length())) / 2), heading.c_str());
    wattroff(dialog, COLOR_PAIR(pair) | A_BOLD);

    mvwaddnstr(dialog, 2, 1, center(prompt, dialog_width - 2).c_str(), dialog_width - 2);

    wattron(dialog, COLOR_PAIR(PAIR_SUCCESS) | A_BOLD);
    mvwaddnstr(dialog, 4, 1, center("[Enter] Yes    [Esc] No", dialog_width - 2).c_str(), dialog_width - 2);
    wattroff(dialog, COLOR_PAIR(PAIR_SUCCESS) | A_BOLD);
    wrefresh(dialog);

    ConfirmAnswer answer = ConfirmAnswer::Ignored;
    while (answer == ConfirmAnswer::Ignored) {
        int ch = wgetch(dialog);
        if (ch == ERR) {
            answer = ConfirmAnswer::No;
        } else if (ch != KEY_RESIZE) {
            answer = confirm_answer(ch);
        }
    }

    delwin(dialog);
    touchwin(stdscr);
    return answer == ConfirmAnswer::Yes;
}

// Edits the value on the status line
std::string InteractiveUI::prompt_text(const std::string& label, const std::string& prefill) {
    LineEditor editor(prefill);
    const int y = LINES - 1;

    wtimeout(stdscr, -1);
    curs_set(1);

    while (true) {
        const int avail = std::max(1, COLS - 1);
        const std::string shown = label + editor.text();
        const int cursor_col = static_cast<int>(utf8_length(label) + editor.cursor_column());
        const int start = cursor_col >= avail ? cursor_col - avail + 1 : 0;
        const size_t start_byte = utf8_offset(shown, static_cast<size_t>(start));
        const size_t end_byte = utf8_offset(shown, static_cast<size_t>(start + avail));

        wattron(stdscr, COLOR_PAIR(PAIR_HEADER));
        mvwhline(stdscr, y, 0, ' ', COLS);
        mvwaddnstr(stdscr, y, 0, shown.c_str() + start_byte, static_cast<int>(end_byte - start_byte));
        wattroff(stdscr, COLOR_PAIR(PAIR_HEADER));
        wmove(stdscr, y, cursor_col - start);
        wrefresh(stdscr);

        int ch = getch();
        if (ch == KEY_RESIZE) {
            continue;
        }
        if (ch == ERR) {
            curs_set(0);
            return "";
        }

        auto result = editor.handle_key(ch);
        if (result == LineEditor::Result::Accept) {
            curs_set(0);
            return editor.result();
        }
        if (result == LineEditor::Result::Cancel) {
            curs_set(0);
            return "";
        }
    }
}

void InteractiveUI::view_text(const std::string& title, const std::vector<std::string>& lines) {
    TextView view(lines);
    wtimeout(stdscr, -1);

    while (true) {
        view.set_window_height(static_cast<size_t>(std::max(1, LINES - 2)));

        werase(stdscr);
        wattron(stdscr, COLOR_PAIR(PAIR_HEADER));
        mvwhline(stdscr, 0, 0, ' ', COLS);
        std::string header = " Viewing: " + title + " (q to close, arrows to scroll) ";
        mvwaddnstr(stdscr, 0, 0, center(header, COLS).c_str(), COLS);
        wattroff(stdscr, COLOR_PAIR(PAIR_HEADER));

        const auto& content = view.content();
        for (size_t i = 0; i < view.height(); i++) {
            size_t index = view.offset() + i;
            if (index >= content.size()) break;
            mvwaddnstr(stdscr, static_cast<int>(i) + 1, 0, content[index].c_str(), COLS - 1);
        }

        wattron(stdscr, COLOR_PAIR(PAIR_HEADER));
        mvwhline(stdscr, LINES - 1, 0, ' ', COLS);
        mvwaddnstr(stdscr, LINES - 1, 0, (" " + view.position_label() + " ").c_str(), COLS);
        wattroff(stdscr, COLOR_PAIR(PAIR_HEADER));
        wrefresh(stdscr);

        int ch = getch();
        switch (ch) {
            case 'q':
            case 'Q':
            case KEY_ESCAPE:
            case ERR:
                touchwin(stdscr);
                return;
            case KEY_UP:
            case 'k':
                view.move_up();
                break;
            case KEY_DOWN:
            case 'j':
                view.move_down();
                break;
            case KEY_PPAGE:
                view.page_up();
                break;
            case KEY_NPAGE:
            case ' ':
                view.page_down();
                break;
            case KEY_HOME:
            case 'g':
                view.move_home();
                break;
            case KEY_END:
            case 'G':
                view.move_end();
                break;
            default:
                break;
        }
    }
}

int InteractiveUI::run_editor(const fs::path& file) {
    const char* editor = std::getenv("EDITOR");
    std::string command = (editor && *editor) ? editor : "nano";
    command += " " + shell_quote(file.string());

    def_prog_mode();
    endwin();
    int rc = std::system(command.c_str());
    reset_prog_mode();
    clearok(curscr, TRUE);

    if (rc == -1) {
        throw LocalIOError("Cannot run editor: " + command);
    }
    spdlog::debug("Editor command '{}' returned {}", command, rc);
    return WIFEXITED(rc) ? WEXITSTATUS(rc) : rc;
}

void InteractiveUI::show_status(const StatusMessage& message) {
    draw_message(message);
    wrefresh(stdscr);
}
