// ftm_controller.cpp - Key dispatch and the file manager actions
#include "ftm_controller.h"
#include "ftm_viewer.h"

#include <fstream>
#include <unistd.h>

#include <spdlog/spdlog.h>
#include <ncurses.h>

namespace {

// Scratch copy of a remote file, removed when it goes out of scope
struct TempFile {
    fs::path path;

    explicit TempFile(const std::string& name) {
        std::error_code ec;
        fs::path dir = fs::temp_directory_path(ec);
        if (ec) dir = "/tmp";
        path = dir / ("ftm_" + std::to_string(getpid()) + "_" + name);
    }

    ~TempFile() {
        std::error_code ec;
        fs::remove(path, ec);
    }

    TempFile(const TempFile&) = delete;
    TempFile& operator=(const TempFile&) = delete;
};

fs::file_time_type modified_time(const fs::path& path) {
    std::error_code ec;
    auto time = fs::last_write_time(path, ec);
    if (ec) {
        throw LocalIOError("Cannot stat " + path.string() + ": " + ec.message());
    }
    return time;
}

void remove_local(const Entry& entry) {
    std::error_code ec;
    if (entry.is_directory && !entry.is_symlink) {
        fs::remove_all(entry.local_path, ec);
    } else {
        fs::remove(entry.local_path, ec);
    }
    if (ec) {
        throw LocalIOError("Cannot delete " + entry.local_path.string() + ": " + ec.message());
    }
}

} // namespace

Controller::Controller(Config& cfg, Session& ui_session, TransferEngine& transfer_engine, Modal& overlay)
    : config(cfg), session(ui_session), engine(transfer_engine), modal(overlay),
      panes(cfg.local_start_dir, ui_session) {}

void Controller::set_status(const std::string& text, MessageType type) {
    status.text = text;
    status.type = type;
}

// A ConnectionError during a remote call means the control connection is
// gone; drop the session so the user can reconnect.
void Controller::report_failure(const std::string& prefix, const FtmError& error) {
    spdlog::error("{}{}", prefix, error.what());

    if (dynamic_cast<const ConnectionError*>(&error) && session.is_connected()) {
        session.disconnect();
        panes.remote().clear_listing();
        set_status(prefix + error.what() + " (disconnected, press 'c' to reconnect)", MessageType::Error);
        return;
    }
    set_status(prefix + error.what(), MessageType::Error);
}

bool Controller::refuse_if_busy() {
    if (engine.is_active()) {
        set_status(TransferBusy().what(), MessageType::Error);
        return true;
    }
    return false;
}

bool Controller::require_connection() {
    if (!session.is_connected()) {
        set_status("Not connected", MessageType::Error);
        return false;
    }
    return true;
}

void Controller::reload_pane(Pane& pane, bool keep_cursor) {
    try {
        pane.reload(keep_cursor);
    } catch (const FtmError& e) {
        report_failure("Refresh failed: ", e);
    }
}

void Controller::select_by_name(Pane& pane, const std::string& name) {
    const auto& items = pane.items();
    for (size_t i = 0; i < items.size(); i++) {
        if (items[i].name == name) {
            pane.jump_to(i);
            return;
        }
    }
}

fs::path Controller::local_directory() {
    return fs::path(panes.local().current_path());
}

void Controller::set_visible_height(size_t height) {
    panes.local().set_visible_height(height);
    panes.remote().set_visible_height(height);
}

void Controller::start() {
    try {
        panes.local().reload();
    } catch (const FtmError& e) {
        report_failure("Error: ", e);
    }
    connect();
}

bool Controller::handle_key(int ch) {
    // Any key closes the help; x still cancels a running transfer
    if (show_help) {
        show_help = false;
        if (ch != 'x') {
            return true;
        }
    }

    Pane& pane = panes.active_pane();
    switch (ch) {
        case 'q':
        case 'Q':
            shutdown();
            return false;

        case KEY_UP:
        case 'k':
            pane.move_cursor(-1);
            break;

        case KEY_DOWN:
        case 'j':
            pane.move_cursor(1);
            break;

        case KEY_PPAGE:
            pane.page_move(-1);
            break;

        case KEY_NPAGE:
            pane.page_move(1);
            break;

        case KEY_HOME:
        case 'g':
            pane.jump_home();
            break;

        case KEY_END:
        case 'G':
            pane.jump_end();
            break;

        case KEY_ENTER:
        case '\n':
        case '\r':
        case KEY_RIGHT:
        case 'l':
            open_selected();
            break;

        case KEY_LEFT:
        case 'h':
        case KEY_BACKSPACE:
        case 127:
        case 8:
            open_parent();
            break;

        case '\t':
            panes.switch_side();
            break;

        case 'c':
        case 'C':
            toggle_connection();
            break;

        case 's':
        case 'S':
            set_server();
            break;

        case 'u':
            upload_selected();
            break;

        case 'd':
            download_selected();
            break;

        case 'D':
            delete_selected();
            break;

        case 'r':
            rename_selected();
            break;

        case 'm':
            make_directory();
            break;

        case 'v':
            view_selected();
            break;

        case 'e':
            edit_selected();
            break;

        case 'f':
        case '/':
            search();
            break;

        case 'x':
            cancel_transfer();
            break;

        case 'R':
            refresh_active();
            break;

        case '?':
            show_help = true;
            break;

        default:
            break;
    }
    return true;
}

void Controller::tick() {
    auto outcome = engine.take_outcome();
    if (!outcome) {
        return;
    }

    status = outcome->message;
    if (outcome->refresh == PaneSide::Remote && !session.is_connected()) {
        return;
    }
    try {
        panes.pane(outcome->refresh).reload(true);
    } catch (const FtmError& e) {
        spdlog::warn("Refresh after transfer failed: {}", e.what());
    }
}

// Navigation
void Controller::open_selected() {
    try {
        panes.active_pane().enter();
    } catch (const FtmError& e) {
        report_failure("Error: ", e);
    }
}

void Controller::open_parent() {
    try {
        panes.active_pane().go_parent();
    } catch (const FtmError& e) {
        report_failure("Error: ", e);
    }
}

// Transfers
void Controller::upload_selected() {
    if (!require_connection()) return;
    if (panes.active_side() != PaneSide::Local) {
        set_status("Upload only works in the local pane. Press 'd' to download.");
        return;
    }
    if (refuse_if_busy()) return;

    const Entry* selected = panes.local().selected();
    if (!selected || selected->is_parent()) return;
    const Entry item = *selected;

    const std::string remote_dir = session.current_directory();
    const std::string prompt = item.is_directory
        ? "Upload folder '" + item.name + "/' to " + remote_dir + "?"
        : "Upload '" + item.name + "' to " + remote_dir + "?";
    if (!modal.confirm(prompt, ModalKind::Upload)) {
        set_status("Upload cancelled");
        return;
    }

    TransferRequest request;
    request.kind = TransferKind::Upload;
    request.local_path = item.local_path;
    request.remote_dir = remote_dir;
    request.remote_name = item.name;
    request.is_directory = item.is_directory;
    request.size = item.size;

    try {
        engine.start(request, session.settings());
        set_status("Uploading " + item.name + "...");
    } catch (const TransferBusy& e) {
        set_status(e.what(), MessageType::Error);
    } catch (const FtmError& e) {
        report_failure("Upload failed: ", e);
    }
}

void Controller::download_selected() {
    if (!require_connection()) return;
    if (panes.active_side() != PaneSide::Remote) {
        set_status("Download only works in the remote pane. Press 'u' to upload.");
        return;
    }
    if (refuse_if_busy()) return;

    const Entry* selected = panes.remote().selected();
    if (!selected || selected->is_parent()) return;
    const Entry item = *selected;

    const fs::path local_dir = local_directory();
    const std::string prompt = item.is_directory
        ? "Download folder '" + item.name + "/' to " + local_dir.string() + "?"
        : "Download '" + item.name + "' to " + local_dir.string() + "?";
    if (!modal.confirm(prompt, ModalKind::Download)) {
        set_status("Download cancelled");
        return;
    }

    TransferRequest request;
    request.kind = TransferKind::Download;
    request.local_path = local_dir;
    request.remote_dir = session.current_directory();
    request.remote_name = item.name;
    request.is_directory = item.is_directory;
    request.size = item.size;

    try {
        engine.start(request, session.settings());
        set_status("Downloading " + item.name + "...");
    } catch (const TransferBusy& e) {
        set_status(e.what(), MessageType::Error);
    } catch (const FtmError& e) {
        report_failure("Download failed: ", e);
    }
}

void Controller::cancel_transfer() {
    if (!engine.is_active()) {
        set_status("No transfer in progress");
        return;
    }
    engine.cancel();
    set_status("Cancelling transfer...");
}

// Directory mutation
void Controller::delete_selected() {
    Pane& pane = panes.active_pane();
    const Entry* selected = pane.selected();
    if (!selected || selected->is_parent()) return;
    if (refuse_if_busy()) return;

    const bool remote = pane.side() == PaneSide::Remote;
    if (remote && !require_connection()) return;
    const Entry item = *selected;

    const std::string prompt = item.is_directory
        ? "Delete folder '" + item.name + "/' and everything in it?"
        : "Delete '" + item.name + "'?";
    if (!modal.confirm(prompt, ModalKind::Delete)) {
        set_status("Delete cancelled");
        return;
    }

    try {
        if (remote && item.is_directory) {
            modal.show_status({"Deleting " + item.name + "...", MessageType::Info});
            session.delete_directory_recursive(item.name);
        } else if (remote) {
            session.delete_file(item.name);
        } else {
            remove_local(item);
        }
    } catch (const FtmError& e) {
        report_failure("Delete failed: ", e);
        return;
    }

    spdlog::info("Deleted {} {}", remote ? "remote" : "local", item.name);
    set_status("Deleted: " + item.name, MessageType::Success);
    reload_pane(pane, true);
}

void Controller::rename_selected() {
    Pane& pane = panes.active_pane();
    const Entry* selected = pane.selected();
    if (!selected || selected->is_parent()) return;
    if (refuse_if_busy()) return;

    const bool remote = pane.side() == PaneSide::Remote;
    if (remote && !require_connection()) return;
    const Entry item = *selected;

    const std::string new_name = modal.prompt_text("Rename to: ", item.name);
    if (new_name.empty()) {
        set_status("Rename cancelled");
        return;
    }
    if (new_name == item.name) {
        return;
    }
    if (!is_plain_name(new_name)) {
        set_status("Invalid name: " + new_name, MessageType::Error);
        return;
    }

    try {
        if (remote) {
            session.rename(item.name, new_name);
        } else {
            std::error_code ec;
            fs::rename(item.local_path, item.local_path.parent_path() / new_name, ec);
            if (ec) {
                throw LocalIOError("Cannot rename " + item.local_path.string() + ": " + ec.message());
            }
        }
    } catch (const FtmError& e) {
        report_failure("Rename failed: ", e);
        return;
    }

    spdlog::info("Renamed {} to {}", item.name, new_name);
    set_status("Renamed to: " + new_name, MessageType::Success);
    reload_pane(pane, true);
    select_by_name(pane, new_name);
}

void Controller::make_directory() {
    Pane& pane = panes.active_pane();
    if (refuse_if_busy()) return;

    const bool remote = pane.side() == PaneSide::Remote;
    if (remote && !require_connection()) return;

    const std::string name = modal.prompt_text("New directory name: ", "");
    if (name.empty()) {
        return;
    }
    if (!is_plain_name(name)) {
        set_status("Invalid name: " + name, MessageType::Error);
        return;
    }

    try {
        if (remote) {
            session.make_directory(name);
        } else {
            const fs::path target = local_directory() / name;
            std::error_code ec;
            if (!fs::create_directory(target, ec)) {
                throw LocalIOError("Cannot create " + target.string() + ": " +
                                   (ec ? ec.message() : std::string("already exists")));
            }
        }
    } catch (const FtmError& e) {
        report_failure("Mkdir failed: ", e);
        return;
    }

    spdlog::info("Created directory {}", name);
    set_status("Created: " + name + "/", MessageType::Success);
    reload_pane(pane, true);
    select_by_name(pane, name);
}

// Viewing
void Controller::view_selected() {
    Pane& pane = panes.active_pane();
    const Entry* selected = pane.selected();
    if (!selected || selected->is_directory) return;
    if (refuse_if_busy()) return;

    const bool remote = pane.side() == PaneSide::Remote;
    if (remote && !require_connection()) return;
    const Entry item = *selected;

    PreviewContent content;
    try {
        if (!remote) {
            content = load_preview(item.local_path);
        } else if (item.size > MAX_VIEW_SIZE) {
            content.type = PreviewType::TooLarge;
            content.file_size = item.size;
        } else {
            modal.show_status({"Loading " + item.name + "...", MessageType::Info});
            std::string data;
            session.retrieve_file(item.name, [&](const char* bytes, size_t count) {
                if (data.size() + count > MAX_VIEW_SIZE) {
                    throw LocalIOError(item.name + " is larger than " +
                                       format_size(static_cast<double>(MAX_VIEW_SIZE)));
                }
                data.append(bytes, count);
            });
            content = make_preview(data);
        }
    } catch (const FtmError& e) {
        report_failure("Cannot view: ", e);
        return;
    }

    switch (content.type) {
        case PreviewType::Binary:
            set_status("Cannot view binary file: " + item.name, MessageType::Error);
            return;
        case PreviewType::TooLarge:
            set_status("File too large to view: " + item.name + " (" +
                       format_size(static_cast<double>(content.file_size)) + ")", MessageType::Error);
            return;
        case PreviewType::Empty:
            set_status(item.name + " is empty");
            return;
        case PreviewType::Text:
            break;
    }
    modal.view_text(item.name, content.lines);
}

// Downloads to a scratch file, runs the editor and uploads the file back
// only when the editor changed it.
void Controller::edit_selected() {
    Pane& pane = panes.active_pane();
    if (pane.side() != PaneSide::Remote) {
        set_status("Edit only works in the remote pane");
        return;
    }
    const Entry* selected = pane.selected();
    if (!selected || selected->is_directory) return;
    if (refuse_if_busy()) return;
    if (!require_connection()) return;
    const Entry item = *selected;

    TempFile temp(item.name);
    try {
        {
            std::ofstream out(temp.path, std::ios::binary | std::ios::trunc);
            if (!out.is_open()) {
                throw LocalIOError("Cannot create " + temp.path.string());
            }
            modal.show_status({"Loading " + item.name + "...", MessageType::Info});
            session.retrieve_file(item.name, [&](const char* data, size_t count) {
                out.write(data, static_cast<std::streamsize>(count));
                if (!out) {
                    throw LocalIOError("Write failed: " + temp.path.string());
                }
            });
        }

        const auto before = modified_time(temp.path);
        int exit_status = modal.run_editor(temp.path);
        if (exit_status != 0) {
            spdlog::warn("Editor exited with status {} for {}", exit_status, item.name);
        }
        if (modified_time(temp.path) == before) {
            set_status("No changes made");
            return;
        }

        std::ifstream in(temp.path, std::ios::binary);
        if (!in.is_open()) {
            throw LocalIOError("Cannot open " + temp.path.string());
        }
        modal.show_status({"Saving " + item.name + "...", MessageType::Info});
        session.store_file(item.name, in, [](size_t) {});
    } catch (const FtmError& e) {
        report_failure("Edit failed: ", e);
        return;
    }

    spdlog::info("Saved edited {}", item.name);
    set_status("Changes saved to " + item.name, MessageType::Success);
    reload_pane(pane, true);
}

void Controller::search() {
    if (refuse_if_busy()) return;

    const std::string query = modal.prompt_text("Search: ", "");
    if (query.empty()) {
        return;
    }

    Pane& pane = panes.active_pane();
    auto matches = find_matches(pane.items(), query);
    if (matches.empty()) {
        set_status("No results for '" + query + "'");
        return;
    }

    pane.jump_to(matches.front());
    set_status("Found " + std::to_string(matches.size()) + " result(s) for '" + query + "'", MessageType::Success);
}

// Connection
void Controller::connect() {
    const std::string address = config.server.host + ":" + std::to_string(config.server.port);
    modal.show_status({"Connecting to " + address + "...", MessageType::Info});

    try {
        session.connect(config.server, config.connect_timeout);
    } catch (const FtmError& e) {
        spdlog::error("Connection to {} failed: {}", address, e.what());
        panes.remote().clear_listing();
        set_status("Connection failed: " + std::string(e.what()) +
                   ". Press 's' to change server, 'c' to retry or 'q' to quit.", MessageType::Error);
        return;
    }

    spdlog::info("Connected to {} as {}", address, config.server.user);
    if (!save_config(config)) {
        spdlog::warn("Connection settings were not saved");
    }
    set_status("Connected!", MessageType::Success);
    reload_pane(panes.remote(), false);
}

void Controller::disconnect() {
    session.disconnect();
    panes.remote().clear_listing();
    spdlog::info("Disconnected from {}", config.server.host);
    set_status("Disconnected");
}

void Controller::toggle_connection() {
    if (session.is_connected()) {
        disconnect();
    } else {
        connect();
    }
}

void Controller::set_server() {
    if (session.is_connected()) {
        set_status("Disconnect first to change the server");
        return;
    }
    if (refuse_if_busy()) return;

    const std::string host = modal.prompt_text("Server IP: ", config.server.host);
    if (!host.empty()) {
        ServerSettings updated = config.server;
        if (!apply_server_argument(host, updated)) {
            set_status("Invalid server address: " + host, MessageType::Error);
            return;
        }
        config.server = updated;
    }

    const std::string port = modal.prompt_text("Port: ", std::to_string(config.server.port));
    if (!port.empty()) {
        auto value = parse_port(port);
        if (!value) {
            set_status("Invalid port: " + port, MessageType::Error);
            return;
        }
        config.server.port = *value;
    }

    set_status("Server set to " + config.server.host + ":" + std::to_string(config.server.port));
}

void Controller::refresh_active() {
    try {
        panes.active_pane().reload(true);
    } catch (const FtmError& e) {
        report_failure("Refresh failed: ", e);
        return;
    }
    set_status("Refreshed");
}

// Quitting during a transfer cancels it and waits for the worker
void Controller::shutdown() {
    if (engine.is_active()) {
        engine.cancel();
    }
    engine.wait();
    if (auto outcome = engine.take_outcome()) {
        spdlog::info("Transfer ended at exit: {}", outcome->message.text);
    }
    session.disconnect();
    spdlog::info("Exiting");
}
