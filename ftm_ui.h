// ftm_ui.h - ncurses front end for the FTP file manager
#ifndef FTM_UI_H
#define FTM_UI_H

#include "ftm_controller.h"
#include "ftm_viewer.h"
#include <ncurses.h>

// Color pairs
enum ColorPair {
    PAIR_INFO = 1,
    PAIR_SUCCESS,
    PAIR_ERROR,
    PAIR_KEYS,
    PAIR_HEADER,
    PAIR_REMOTE_PATH,
    PAIR_REMOTE_SELECTED,
    PAIR_REMOTE_DIR,
    PAIR_LOCAL_PATH,
    PAIR_LOCAL_SELECTED,
    PAIR_LOCAL_DIR,
    PAIR_MODAL_DELETE,
    PAIR_MODAL_UPLOAD,
    PAIR_MODAL_DOWNLOAD,
    PAIR_UNFOCUSED
};

// Interactive UI class. Owns the terminal and provides the modal
// overlays the controller asks for.
class InteractiveUI : public Modal {
private:
    SCREEN* screen = nullptr;
    WINDOW* local_win = nullptr;
    WINDOW* remote_win = nullptr;
    Controller controller;

    static constexpr auto TRANSFER_POLL = std::chrono::milliseconds(100);

    // Window management
    void init_colors();
    void update_window_layout();
    void handle_resize();
    int list_height() const;

    // Drawing
    void draw();
    void draw_header();
    void draw_pane(WINDOW* win, Pane& pane, bool focused);
    void draw_entry_line(WINDOW* win, const Entry& entry, int y, int width, bool selected, bool focused,
                         PaneSide side);
    void draw_key_bar();
    void draw_status_line();
    void draw_message(const StatusMessage& message);
    void draw_progress(const TransferSnapshot& snapshot);
    void draw_help();

public:
    InteractiveUI(Config& cfg, Session& session, TransferEngine& engine);
    ~InteractiveUI() override;

    InteractiveUI(const InteractiveUI&) = delete;
    InteractiveUI& operator=(const InteractiveUI&) = delete;

    void run();

    bool confirm(const std::string& prompt, ModalKind kind) override;
    std::string prompt_text(const std::string& label, const std::string& prefill) override;
    void view_text(const std::string& title, const std::vector<std::string>& lines) override;
    int run_editor(const fs::path& file) override;
    void show_status(const StatusMessage& message) override;
};

#endif // FTM_UI_H
