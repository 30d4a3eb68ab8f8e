// ftm_pane.h - Cursor, scrolling and listing state of the two panes
#ifndef FTM_PANE_H
#define FTM_PANE_H

#include "ftm_session.h"

#include <memory>

// Where a pane reads its listing from
class DirectorySource {
public:
    virtual ~DirectorySource() = default;

    virtual std::string location() const = 0;
    virtual bool at_root() const = 0;
    virtual std::vector<Entry> read_entries() = 0;
    virtual void change_directory(const Entry& entry) = 0;
    virtual void go_parent() = 0;
};

// Local filesystem. Failures are reported as LocalIOError.
class LocalSource : public DirectorySource {
private:
    fs::path current;

public:
    explicit LocalSource(const fs::path& start);

    const fs::path& path() const { return current; }

    std::string location() const override;
    bool at_root() const override;
    std::vector<Entry> read_entries() override;
    void change_directory(const Entry& entry) override;
    void go_parent() override;
};

// Remote working directory of the UI session. Empty while disconnected.
class RemoteSource : public DirectorySource {
private:
    Session& session;

public:
    explicit RemoteSource(Session& ui_session);

    std::string location() const override;
    bool at_root() const override;
    std::vector<Entry> read_entries() override;
    void change_directory(const Entry& entry) override;
    void go_parent() override;
};

class Pane {
private:
    PaneSide pane_side;
    std::unique_ptr<DirectorySource> source;
    std::vector<Entry> entries;
    size_t cursor = 0;
    size_t scroll_offset = 0;
    size_t visible_height = 1;

    void adjust_view_offset();

public:
    Pane(PaneSide side, std::unique_ptr<DirectorySource> dir_source);

    PaneSide side() const { return pane_side; }
    std::string current_path() const { return source->location(); }
    const std::vector<Entry>& items() const { return entries; }
    size_t cursor_index() const { return cursor; }
    size_t view_offset() const { return scroll_offset; }
    size_t page_size() const { return visible_height; }
    const Entry* selected() const;

    // Re-reads the listing. On failure the listing is emptied and the
    // error is rethrown.
    void reload(bool keep_cursor = false);
    void clear_listing();

    void move_cursor(int delta);
    void page_move(int pages);
    void jump_home();
    void jump_end();
    void jump_to(size_t index);

    // Opens the selected directory; false when a file is selected
    bool enter();
    bool go_parent();

    void set_visible_height(size_t height);
};

class DualPane {
private:
    Pane local_pane;
    Pane remote_pane;
    PaneSide active = PaneSide::Remote;

public:
    DualPane(const fs::path& local_start, Session& ui_session);

    Pane& local() { return local_pane; }
    Pane& remote() { return remote_pane; }
    Pane& pane(PaneSide side) { return side == PaneSide::Local ? local_pane : remote_pane; }
    Pane& active_pane() { return pane(active); }
    PaneSide active_side() const { return active; }

    void switch_side();
};

#endif // FTM_PANE_H
