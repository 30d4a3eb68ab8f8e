// ftm_pane.cpp - Pane state implementation
#include "ftm_pane.h"

#include <algorithm>

// LocalSource implementation
LocalSource::LocalSource(const fs::path& start) {
    std::error_code ec;
    fs::path absolute = fs::absolute(start, ec);
    if (ec) absolute = start;
    current = fs::weakly_canonical(absolute, ec);
    if (ec || current.empty()) current = absolute;
}

std::string LocalSource::location() const {
    return current.string();
}

bool LocalSource::at_root() const {
    return current == current.root_path();
}

std::vector<Entry> LocalSource::read_entries() {
    return read_local_directory(current);
}

void LocalSource::change_directory(const Entry& entry) {
    fs::path target = entry.local_path.empty() ? current / entry.name : entry.local_path;

    std::error_code ec;
    fs::directory_iterator probe(target, ec);
    if (ec) {
        throw LocalIOError("Cannot open " + target.string() + ": " + ec.message());
    }
    current = target;
}

void LocalSource::go_parent() {
    if (!at_root()) {
        current = current.parent_path();
    }
}

// RemoteSource implementation
RemoteSource::RemoteSource(Session& ui_session) : session(ui_session) {}

std::string RemoteSource::location() const {
    return session.is_connected() ? session.current_directory() : std::string();
}

bool RemoteSource::at_root() const {
    return !session.is_connected() || session.at_root();
}

std::vector<Entry> RemoteSource::read_entries() {
    if (!session.is_connected()) {
        return {};
    }
    return session.list_entries();
}

void RemoteSource::change_directory(const Entry& entry) {
    session.change_directory(entry.name);
}

void RemoteSource::go_parent() {
    session.change_directory(PARENT_ENTRY);
}

// Pane implementation
Pane::Pane(PaneSide side, std::unique_ptr<DirectorySource> dir_source)
    : pane_side(side), source(std::move(dir_source)) {}

const Entry* Pane::selected() const {
    if (cursor < entries.size()) {
        return &entries[cursor];
    }
    return nullptr;
}

void Pane::adjust_view_offset() {
    if (entries.empty()) {
        cursor = 0;
        scroll_offset = 0;
        return;
    }
    if (cursor < scroll_offset) {
        scroll_offset = cursor;
    } else if (cursor >= scroll_offset + visible_height) {
        scroll_offset = cursor - visible_height + 1;
    }
}

void Pane::reload(bool keep_cursor) {
    std::vector<Entry> fresh;
    try {
        fresh = source->read_entries();
    } catch (const FtmError&) {
        clear_listing();
        throw;
    }

    sort_entries(fresh);
    if (!source->at_root()) {
        fresh.insert(fresh.begin(), make_parent_entry());
    }
    entries = std::move(fresh);

    if (keep_cursor && !entries.empty()) {
        cursor = std::min(cursor, entries.size() - 1);
        scroll_offset = std::min(scroll_offset, cursor);
    } else {
        cursor = 0;
        scroll_offset = 0;
    }
    adjust_view_offset();
}

void Pane::clear_listing() {
    entries.clear();
    cursor = 0;
    scroll_offset = 0;
}

void Pane::move_cursor(int delta) {
    if (entries.empty() || delta == 0) return;

    if (delta > 0) {
        cursor = std::min(cursor + static_cast<size_t>(delta), entries.size() - 1);
    } else {
        size_t abs_delta = static_cast<size_t>(-delta);
        cursor = (abs_delta > cursor) ? 0 : cursor - abs_delta;
    }
    adjust_view_offset();
}

void Pane::page_move(int pages) {
    move_cursor(pages * static_cast<int>(visible_height));
}

void Pane::jump_home() {
    cursor = 0;
    scroll_offset = 0;
}

void Pane::jump_end() {
    if (entries.empty()) return;
    cursor = entries.size() - 1;
    adjust_view_offset();
}

void Pane::jump_to(size_t index) {
    if (index >= entries.size()) return;
    cursor = index;
    adjust_view_offset();
}

bool Pane::enter() {
    const Entry* entry = selected();
    if (!entry || !entry->is_directory) {
        return false;
    }

    if (entry->is_parent()) {
        source->go_parent();
    } else {
        source->change_directory(*entry);
    }
    reload(false);
    return true;
}

bool Pane::go_parent() {
    if (source->at_root()) {
        return false;
    }
    source->go_parent();
    reload(false);
    return true;
}

void Pane::set_visible_height(size_t height) {
    visible_height = std::max<size_t>(1, height);
    adjust_view_offset();
}

// DualPane implementation
DualPane::DualPane(const fs::path& local_start, Session& ui_session)
    : local_pane(PaneSide::Local, std::make_unique<LocalSource>(local_start)),
      remote_pane(PaneSide::Remote, std::make_unique<RemoteSource>(ui_session)) {}

void DualPane::switch_side() {
    active = active == PaneSide::Local ? PaneSide::Remote : PaneSide::Local;
}
