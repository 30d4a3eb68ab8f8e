// ftm_controller.h - Key dispatch and the file manager actions
#ifndef FTM_CONTROLLER_H
#define FTM_CONTROLLER_H

#include "ftm_pane.h"
#include "ftm_transfer.h"
#include "ftm_modal.h"

class Controller {
private:
    Config& config;
    Session& session;
    TransferEngine& engine;
    Modal& modal;
    DualPane panes;
    StatusMessage status;
    bool show_help = false;

    void set_status(const std::string& text, MessageType type = MessageType::Info);
    void report_failure(const std::string& prefix, const FtmError& error);
    bool refuse_if_busy();
    bool require_connection();
    void reload_pane(Pane& pane, bool keep_cursor);
    void select_by_name(Pane& pane, const std::string& name);
    fs::path local_directory();

    // Navigation
    void open_selected();
    void open_parent();

    // Transfers
    void upload_selected();
    void download_selected();
    void cancel_transfer();

    // Directory mutation
    void delete_selected();
    void rename_selected();
    void make_directory();

    // Viewing
    void view_selected();
    void edit_selected();
    void search();

    // Connection
    void toggle_connection();
    void set_server();
    void refresh_active();
    void shutdown();

public:
    Controller(Config& cfg, Session& ui_session, TransferEngine& transfer_engine, Modal& overlay);

    // Initial local listing and auto-connect
    void start();
    void connect();
    void disconnect();

    // Returns false when the program should exit
    bool handle_key(int ch);
    // Applies a finished transfer's outcome
    void tick();

    void set_visible_height(size_t height);

    DualPane& dual_pane() { return panes; }
    const StatusMessage& status_message() const { return status; }
    bool help_visible() const { return show_help; }
    bool transfer_active() const { return engine.is_active(); }
    // Running, or finished with an outcome tick() has not collected yet
    bool transfer_pending() const { return engine.is_active() || engine.has_outcome(); }
    TransferSnapshot transfer_snapshot() const { return engine.snapshot(); }
    const Session& ui_session() const { return session; }
    const ServerSettings& server() const { return config.server; }
};

#endif // FTM_CONTROLLER_H
