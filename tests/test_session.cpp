// test_session.cpp - Connection session over the in-memory server
#include <gtest/gtest.h>

#include <sstream>

#include "ftm_session.h"
#include "mock_ftp_client.h"

namespace {

class SessionTest : public ::testing::Test {
protected:
    MockFtpServer server;
    Session session{mock_client_factory(server)};

    void SetUp() override {
        server.add_file("/work/tree/a.txt", "a");
        server.add_file("/work/tree/sub/b.txt", "bb");
        server.add_file("/work/tree/sub/deeper/c.txt", "ccc");
        server.add_dir("/work/tree/empty");
        server.add_file("/work/keep.txt", "keep");
        session.connect(ServerSettings(), CONNECT_TIMEOUT);
    }
};

} // namespace

TEST_F(SessionTest, ConnectStartsAtEntryDirectory) {
    EXPECT_TRUE(session.is_connected());
    EXPECT_EQ(session.current_directory(), "/");
    EXPECT_TRUE(session.at_root());
}

TEST_F(SessionTest, ChangeDirectoryTracksPath) {
    session.change_directory("work");
    EXPECT_EQ(session.current_directory(), "/work");
    session.change_directory("tree");
    EXPECT_EQ(session.current_directory(), "/work/tree");
    session.change_directory("..");
    EXPECT_EQ(session.current_directory(), "/work");
}

TEST_F(SessionTest, FailedChangeDirectoryKeepsPath) {
    session.change_directory("work");
    EXPECT_THROW(session.change_directory("missing"), RemoteOperationError);
    EXPECT_EQ(session.current_directory(), "/work");
}

TEST_F(SessionTest, ListsEntries) {
    session.change_directory("work");
    auto entries = session.list_entries();
    ASSERT_EQ(entries.size(), 2u);

    sort_entries(entries);
    EXPECT_EQ(entries[0].name, "tree");
    EXPECT_TRUE(entries[0].is_directory);
    EXPECT_EQ(entries[1].name, "keep.txt");
    EXPECT_EQ(entries[1].size, 4u);

    EXPECT_EQ(session.list_current_directory().size(), 2u);
}

TEST_F(SessionTest, RecursiveDeleteRemovesTreeAndRestoresDirectory) {
    session.change_directory("work");
    session.delete_directory_recursive("tree");

    EXPECT_EQ(session.current_directory(), "/work");
    EXPECT_FALSE(server.has_dir("/work/tree"));
    EXPECT_FALSE(server.has_dir("/work/tree/sub/deeper"));
    EXPECT_FALSE(server.has_file("/work/tree/sub/b.txt"));
    EXPECT_TRUE(server.has_file("/work/keep.txt"));
}

TEST_F(SessionTest, RecursiveDeleteRestoresDirectoryOnNestedFailure) {
    server.fail_delete("/work/tree/sub/deeper/c.txt");
    session.change_directory("work");

    try {
        session.delete_directory_recursive("tree");
        FAIL() << "expected the nested DELE to fail";
    } catch (const RemoteOperationError& e) {
        EXPECT_EQ(e.reason(), "550 Permission denied");
    }

    EXPECT_EQ(session.current_directory(), "/work");
    EXPECT_TRUE(server.has_dir("/work/tree"));
    EXPECT_TRUE(server.has_file("/work/tree/sub/deeper/c.txt"));

    // The session still works from where it was
    auto entries = session.list_entries();
    EXPECT_EQ(entries.size(), 2u);
}

TEST_F(SessionTest, MutationsAddressCurrentDirectory) {
    session.change_directory("work");
    session.make_directory("new");
    EXPECT_TRUE(server.has_dir("/work/new"));

    session.rename("keep.txt", "kept.txt");
    EXPECT_FALSE(server.has_file("/work/keep.txt"));
    EXPECT_EQ(server.file_data("/work/kept.txt"), "keep");

    session.delete_file("kept.txt");
    EXPECT_FALSE(server.has_file("/work/kept.txt"));

    session.remove_directory("new");
    EXPECT_FALSE(server.has_dir("/work/new"));

    EXPECT_THROW(session.remove_directory("tree"), RemoteOperationError);
}

TEST_F(SessionTest, StoreAndRetrieveInBlocks) {
    const std::string data(TRANSFER_BLOCK_SIZE * 2 + 100, 'z');
    std::istringstream in(data);
    std::vector<size_t> blocks;
    session.store_file("big.bin", in, [&](size_t bytes) { blocks.push_back(bytes); });

    ASSERT_EQ(blocks.size(), 3u);
    EXPECT_EQ(blocks[0], TRANSFER_BLOCK_SIZE);
    EXPECT_EQ(blocks[2], 100u);
    EXPECT_EQ(server.file_data("/big.bin"), data);

    std::string received;
    session.retrieve_file("big.bin", [&](const char* bytes, size_t count) { received.append(bytes, count); });
    EXPECT_EQ(received, data);
}

TEST_F(SessionTest, DisconnectClearsState) {
    session.disconnect();
    EXPECT_FALSE(session.is_connected());
    EXPECT_EQ(session.current_directory(), "");
    EXPECT_THROW(session.list_entries(), ConnectionError);
    EXPECT_THROW(session.change_directory("work"), ConnectionError);
}

TEST(SessionConnectTest, RefusedLoginLeavesSessionDisconnected) {
    MockFtpServer server;
    server.refuse_login(true);
    Session session(mock_client_factory(server));

    EXPECT_THROW(session.connect(ServerSettings(), CONNECT_TIMEOUT), ConnectionError);
    EXPECT_FALSE(session.is_connected());

    server.refuse_login(false);
    session.connect(ServerSettings(), CONNECT_TIMEOUT);
    EXPECT_TRUE(session.is_connected());
    EXPECT_EQ(server.login_count(), 1);
}
