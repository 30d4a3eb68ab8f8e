// test_pane.cpp - Cursor, scrolling and navigation of a pane
#include <gtest/gtest.h>

#include "ftm_pane.h"
#include "mock_ftp_client.h"
#include "test_util.h"

namespace {

class LocalPaneTest : public ::testing::Test {
protected:
    TempDir dir;

    void SetUp() override {
        dir.make_dir("src");
        dir.make_dir("Docs");
        for (int i = 0; i < 10; i++) {
            dir.write_file("file" + std::to_string(i) + ".txt", std::string(i, 'x'));
        }
    }

    Pane make_pane() {
        return Pane(PaneSide::Local, std::make_unique<LocalSource>(dir.path()));
    }
};

} // namespace

TEST_F(LocalPaneTest, ListsParentThenDirectoriesThenFiles) {
    Pane pane = make_pane();
    pane.reload();

    const auto& items = pane.items();
    ASSERT_EQ(items.size(), 13u);
    EXPECT_TRUE(items[0].is_parent());
    EXPECT_EQ(items[1].name, "Docs");
    EXPECT_EQ(items[2].name, "src");
    EXPECT_EQ(items[3].name, "file0.txt");
    EXPECT_EQ(items[12].size, 9u);
}

TEST_F(LocalPaneTest, CursorClampsAtBothEnds) {
    Pane pane = make_pane();
    pane.reload();

    pane.move_cursor(-1);
    EXPECT_EQ(pane.cursor_index(), 0u);
    pane.move_cursor(100);
    EXPECT_EQ(pane.cursor_index(), 12u);
    pane.jump_home();
    EXPECT_EQ(pane.cursor_index(), 0u);
    pane.jump_end();
    EXPECT_EQ(pane.cursor_index(), 12u);
}

TEST_F(LocalPaneTest, ViewKeepsCursorVisible) {
    Pane pane = make_pane();
    pane.reload();
    pane.set_visible_height(4);

    for (int i = 0; i < 12; i++) {
        pane.move_cursor(1);
        EXPECT_GE(pane.cursor_index(), pane.view_offset());
        EXPECT_LT(pane.cursor_index(), pane.view_offset() + pane.page_size());
    }
    EXPECT_EQ(pane.view_offset(), 9u);

    pane.page_move(-1);
    EXPECT_EQ(pane.cursor_index(), 8u);
    EXPECT_EQ(pane.view_offset(), 8u);

    pane.jump_to(2);
    EXPECT_EQ(pane.view_offset(), 2u);
}

TEST_F(LocalPaneTest, EnterAndLeaveDirectory) {
    dir.write_file("src/main.cpp", "int main() {}\n");
    Pane pane = make_pane();
    pane.reload();

    pane.jump_to(2);
    ASSERT_EQ(pane.selected()->name, "src");
    EXPECT_TRUE(pane.enter());
    EXPECT_EQ(fs::path(pane.current_path()), fs::weakly_canonical(dir.path() / "src"));
    ASSERT_EQ(pane.items().size(), 2u);
    EXPECT_EQ(pane.items()[1].name, "main.cpp");
    EXPECT_EQ(pane.cursor_index(), 0u);

    EXPECT_TRUE(pane.go_parent());
    EXPECT_EQ(fs::path(pane.current_path()), fs::weakly_canonical(dir.path()));
}

TEST_F(LocalPaneTest, EnterOnFileDoesNothing) {
    Pane pane = make_pane();
    pane.reload();
    pane.jump_end();
    const std::string before = pane.current_path();
    EXPECT_FALSE(pane.enter());
    EXPECT_EQ(pane.current_path(), before);
}

TEST_F(LocalPaneTest, ReloadKeepsCursorWhenAsked) {
    Pane pane = make_pane();
    pane.reload();
    pane.jump_to(5);

    pane.reload(true);
    EXPECT_EQ(pane.cursor_index(), 5u);

    pane.jump_end();
    for (int i = 3; i < 10; i++) {
        fs::remove(dir.path() / ("file" + std::to_string(i) + ".txt"));
    }
    pane.reload(true);
    EXPECT_EQ(pane.cursor_index(), pane.items().size() - 1);

    pane.reload(false);
    EXPECT_EQ(pane.cursor_index(), 0u);
}

TEST_F(LocalPaneTest, UnreadableDirectoryEmptiesListing) {
    Pane pane = make_pane();
    pane.reload();
    fs::remove_all(dir.path());
    EXPECT_THROW(pane.reload(), LocalIOError);
    EXPECT_TRUE(pane.items().empty());
    EXPECT_EQ(pane.selected(), nullptr);
}

TEST(RemotePaneTest, EmptyWhileDisconnected) {
    MockFtpServer server;
    Session session(mock_client_factory(server));
    Pane pane(PaneSide::Remote, std::make_unique<RemoteSource>(session));

    pane.reload();
    EXPECT_TRUE(pane.items().empty());
    EXPECT_EQ(pane.current_path(), "");
    EXPECT_FALSE(pane.go_parent());
}

TEST(RemotePaneTest, NavigatesRemoteTree) {
    MockFtpServer server;
    server.add_file("/pub/readme.txt", "hello");
    server.add_dir("/pub/music");
    server.add_dir("/incoming");

    Session session(mock_client_factory(server));
    session.connect(ServerSettings(), CONNECT_TIMEOUT);
    Pane pane(PaneSide::Remote, std::make_unique<RemoteSource>(session));
    pane.reload();

    ASSERT_EQ(pane.items().size(), 2u);
    EXPECT_EQ(pane.items()[0].name, "incoming");
    EXPECT_EQ(pane.items()[1].name, "pub");

    pane.jump_to(1);
    ASSERT_TRUE(pane.enter());
    EXPECT_EQ(pane.current_path(), "/pub");
    ASSERT_EQ(pane.items().size(), 3u);
    EXPECT_TRUE(pane.items()[0].is_parent());
    EXPECT_EQ(pane.items()[1].name, "music");
    EXPECT_EQ(pane.items()[2].name, "readme.txt");
    EXPECT_EQ(pane.items()[2].size, 5u);

    ASSERT_TRUE(pane.enter());
    EXPECT_EQ(pane.current_path(), "/");
    EXPECT_FALSE(pane.go_parent());
}

TEST(DualPaneTest, StartsOnRemoteAndSwitches) {
    TempDir dir;
    MockFtpServer server;
    Session session(mock_client_factory(server));
    DualPane panes(dir.path(), session);

    EXPECT_EQ(panes.active_side(), PaneSide::Remote);
    panes.switch_side();
    EXPECT_EQ(panes.active_side(), PaneSide::Local);
    EXPECT_EQ(&panes.active_pane(), &panes.local());
    panes.switch_side();
    EXPECT_EQ(&panes.active_pane(), &panes.remote());
}
