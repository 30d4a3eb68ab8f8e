// test_transfer.cpp - Background transfers, progress and cancellation
#include <gtest/gtest.h>

#include "ftm_transfer.h"
#include "mock_ftp_client.h"
#include "test_util.h"

namespace {

// Lists an extra entry whose name climbs out of /pub
class ClimbingListingClient : public MockFtpClient {
public:
    using MockFtpClient::MockFtpClient;

    std::string list() override {
        std::string out = MockFtpClient::list();
        if (pwd() == "/pub") {
            out += "-rw-r--r--    1 ftp      ftp             5 Jan 01 00:00 ../escape.txt\r\n";
        }
        return out;
    }
};

class TransferTest : public ::testing::Test {
protected:
    TempDir dir;
    MockFtpServer server;
    Gate gate;
    TransferEngine engine{mock_client_factory(server), std::chrono::seconds(5)};

    void TearDown() override {
        gate.release();
        engine.cancel();
        engine.wait();
    }

    TransferRequest upload_request(const fs::path& source, bool is_directory = false) {
        TransferRequest request;
        request.kind = TransferKind::Upload;
        request.local_path = source;
        request.remote_dir = "/";
        request.remote_name = source.filename().string();
        request.is_directory = is_directory;
        request.size = is_directory ? 0 : fs::file_size(source);
        return request;
    }

    TransferRequest download_request(const std::string& remote_name, uintmax_t size, bool is_directory = false) {
        TransferRequest request;
        request.kind = TransferKind::Download;
        request.local_path = dir.path();
        request.remote_dir = "/";
        request.remote_name = remote_name;
        request.is_directory = is_directory;
        request.size = size;
        return request;
    }

    TransferOutcome finish() {
        engine.wait();
        auto outcome = engine.take_outcome();
        EXPECT_TRUE(outcome.has_value());
        return outcome.value_or(TransferOutcome());
    }
};

} // namespace

TEST_F(TransferTest, UploadsFile) {
    const std::string data(20000, 'u');
    auto source = dir.write_file("notes.txt", data);

    engine.start(upload_request(source), ServerSettings());
    auto outcome = finish();

    EXPECT_EQ(outcome.message.text, "Uploaded: notes.txt (19.5 KB)");
    EXPECT_EQ(outcome.message.type, MessageType::Success);
    EXPECT_EQ(outcome.refresh, PaneSide::Remote);
    EXPECT_EQ(server.file_data("/notes.txt"), data);
    EXPECT_FALSE(engine.is_active());

    auto snapshot = engine.snapshot();
    EXPECT_EQ(snapshot.bytes_transferred, data.size());
    EXPECT_DOUBLE_EQ(snapshot.fraction(), 1.0);
    EXPECT_FALSE(engine.take_outcome().has_value());
}

TEST_F(TransferTest, DownloadsFile) {
    const std::string data(TRANSFER_BLOCK_SIZE * 3, 'd');
    server.add_file("/pub/image.iso", data);

    TransferRequest request = download_request("image.iso", data.size());
    request.remote_dir = "/pub";
    engine.start(request, ServerSettings());
    auto outcome = finish();

    EXPECT_EQ(outcome.message.text, "Downloaded: image.iso to " + dir.path().string());
    EXPECT_EQ(outcome.refresh, PaneSide::Local);
    EXPECT_EQ(read_file(dir.path() / "image.iso"), data);
}

TEST_F(TransferTest, SecondStartIsRejectedWhileBusy) {
    auto first = dir.write_file("first.bin", std::string(TRANSFER_BLOCK_SIZE * 4, 'a'));
    auto second = dir.write_file("second.bin", "b");
    server.on_block = [this] { gate.arrive(); };

    engine.start(upload_request(first), ServerSettings());
    gate.wait_reached();

    EXPECT_TRUE(engine.is_active());
    EXPECT_THROW(engine.start(upload_request(second), ServerSettings()), TransferBusy);
    EXPECT_EQ(engine.snapshot().description, "first.bin");

    gate.release();
    auto outcome = finish();
    EXPECT_EQ(outcome.message.text, "Uploaded: first.bin (32.0 KB)");
    EXPECT_FALSE(server.has_file("/second.bin"));
}

TEST_F(TransferTest, CancelledUploadStopsWithinOneBlock) {
    auto source = dir.write_file("big.bin", std::string(TRANSFER_BLOCK_SIZE * 10, 'c'));
    server.on_block = [this] { gate.arrive(); };

    engine.start(upload_request(source), ServerSettings());
    gate.wait_reached();
    engine.cancel();
    EXPECT_TRUE(engine.snapshot().cancel_requested);
    gate.release();

    auto outcome = finish();
    EXPECT_EQ(outcome.message.text, "Upload cancelled");
    EXPECT_EQ(outcome.message.type, MessageType::Info);
    EXPECT_FALSE(engine.is_active());
    EXPECT_EQ(engine.snapshot().bytes_transferred, TRANSFER_BLOCK_SIZE);

    // The partial remote file is left as it is
    EXPECT_EQ(server.file_data("/big.bin").size(), TRANSFER_BLOCK_SIZE);
}

TEST_F(TransferTest, CancelledDownloadRemovesPartialFile) {
    server.add_file("/movie.mkv", std::string(TRANSFER_BLOCK_SIZE * 10, 'm'));
    server.on_block = [this] { gate.arrive(); };

    engine.start(download_request("movie.mkv", TRANSFER_BLOCK_SIZE * 10), ServerSettings());
    gate.wait_reached();
    EXPECT_TRUE(fs::exists(dir.path() / "movie.mkv"));
    engine.cancel();
    gate.release();

    auto outcome = finish();
    EXPECT_EQ(outcome.message.text, "Download cancelled");
    EXPECT_FALSE(fs::exists(dir.path() / "movie.mkv"));
    EXPECT_EQ(engine.snapshot().bytes_transferred, TRANSFER_BLOCK_SIZE);
}

TEST_F(TransferTest, CancelReachesStalledDownload) {
    server.add_file("/slow.bin", std::string(100, 's'));
    server.stall_transfers(true);
    server.on_stall = [this] { gate.arrive(); };

    engine.start(download_request("slow.bin", 100), ServerSettings());
    gate.wait_reached();
    engine.cancel();
    gate.release();

    auto outcome = finish();
    EXPECT_EQ(outcome.message.text, "Download cancelled");
    EXPECT_FALSE(engine.is_active());
    EXPECT_FALSE(fs::exists(dir.path() / "slow.bin"));
    EXPECT_EQ(engine.snapshot().bytes_transferred, 0u);
}

TEST_F(TransferTest, CancelReachesStalledUpload) {
    auto source = dir.write_file("slow.bin", std::string(100, 's'));
    server.stall_transfers(true);
    server.on_stall = [this] { gate.arrive(); };

    engine.start(upload_request(source), ServerSettings());
    gate.wait_reached();
    engine.cancel();
    gate.release();

    auto outcome = finish();
    EXPECT_EQ(outcome.message.text, "Upload cancelled");
    EXPECT_EQ(engine.snapshot().bytes_transferred, 0u);
}

TEST_F(TransferTest, CancelledFolderDownloadRemovesPartialFile) {
    server.add_file("/music/a.mp3", std::string(TRANSFER_BLOCK_SIZE * 3, 'a'));
    server.add_file("/music/b.mp3", "bbb");
    server.on_block = [this] { gate.arrive(); };

    engine.start(download_request("music", 0, true), ServerSettings());
    gate.wait_reached();
    EXPECT_TRUE(fs::exists(dir.path() / "music" / "a.mp3"));
    engine.cancel();
    gate.release();

    auto outcome = finish();
    EXPECT_EQ(outcome.message.text, "Download cancelled");
    EXPECT_FALSE(fs::exists(dir.path() / "music" / "a.mp3"));
    EXPECT_FALSE(fs::exists(dir.path() / "music" / "b.mp3"));
    EXPECT_EQ(engine.snapshot().files_done, 0u);
}

TEST_F(TransferTest, FolderDownloadSkipsNamesWithSlashes) {
    server.add_file("/pub/ok.txt", "fine");
    server.add_file("/escape.txt", "12345");
    TransferEngine climbing([this] { return std::make_unique<ClimbingListingClient>(server); },
                            std::chrono::seconds(5));

    auto downloads = dir.make_dir("downloads");
    TransferRequest request = download_request("pub", 0, true);
    request.local_path = downloads;
    climbing.start(request, ServerSettings());
    climbing.wait();
    auto outcome = climbing.take_outcome();

    ASSERT_TRUE(outcome.has_value());
    EXPECT_EQ(outcome->message.text, "Downloaded folder: pub/ (1 files) to " + downloads.string());
    EXPECT_EQ(read_file(downloads / "pub" / "ok.txt"), "fine");
    EXPECT_FALSE(fs::exists(downloads / "escape.txt"));
    EXPECT_EQ(climbing.snapshot().files_total, 1u);
}

TEST_F(TransferTest, DownloadRefusesNameWithSlash) {
    server.add_file("/escape.txt", "12345");
    auto downloads = dir.make_dir("downloads");
    TransferRequest request = download_request("../escape.txt", 5);
    request.local_path = downloads;
    request.remote_dir = "/pub";
    server.add_dir("/pub");

    engine.start(request, ServerSettings());
    auto outcome = finish();

    EXPECT_EQ(outcome.message.type, MessageType::Error);
    EXPECT_FALSE(fs::exists(dir.path() / "escape.txt"));
}

TEST_F(TransferTest, FolderUploadCountsFiles) {
    auto folder = dir.make_dir("photos");
    dir.write_file("photos/a.jpg", "aaa");
    dir.write_file("photos/b.jpg", "bbbb");
    dir.write_file("photos/trip/c.jpg", "cc");

    std::vector<std::pair<size_t, size_t>> seen;
    server.on_store_start = [&](const std::string&) {
        auto snapshot = engine.snapshot();
        seen.emplace_back(snapshot.files_done, snapshot.files_total);
    };

    engine.start(upload_request(folder, true), ServerSettings());
    auto outcome = finish();

    ASSERT_EQ(seen.size(), 3u);
    for (size_t i = 0; i < seen.size(); i++) {
        EXPECT_EQ(seen[i].first, i);
        EXPECT_EQ(seen[i].second, 3u);
    }
    auto snapshot = engine.snapshot();
    EXPECT_EQ(snapshot.files_done, 3u);
    EXPECT_EQ(snapshot.files_total, 3u);
    EXPECT_TRUE(snapshot.is_folder);

    EXPECT_EQ(outcome.message.text, "Uploaded folder: photos/ (3 files)");
    EXPECT_EQ(server.file_data("/photos/a.jpg"), "aaa");
    EXPECT_EQ(server.file_data("/photos/b.jpg"), "bbbb");
    EXPECT_EQ(server.file_data("/photos/trip/c.jpg"), "cc");
}

TEST_F(TransferTest, FolderUploadIntoExistingRemoteFolder) {
    server.add_file("/photos/old.jpg", "old");
    auto folder = dir.make_dir("photos");
    dir.write_file("photos/new.jpg", "new");

    engine.start(upload_request(folder, true), ServerSettings());
    auto outcome = finish();

    EXPECT_EQ(outcome.message.type, MessageType::Success);
    EXPECT_EQ(server.file_data("/photos/new.jpg"), "new");
    EXPECT_TRUE(server.has_file("/photos/old.jpg"));
}

TEST_F(TransferTest, FolderDownloadRecreatesTree) {
    server.add_file("/music/intro.mp3", "12345");
    server.add_file("/music/live/encore.mp3", "678");
    server.add_dir("/music/empty");

    engine.start(download_request("music", 0, true), ServerSettings());
    auto outcome = finish();

    EXPECT_EQ(outcome.message.text, "Downloaded folder: music/ (2 files) to " + dir.path().string());
    EXPECT_EQ(read_file(dir.path() / "music" / "intro.mp3"), "12345");
    EXPECT_EQ(read_file(dir.path() / "music" / "live" / "encore.mp3"), "678");
    EXPECT_TRUE(fs::is_directory(dir.path() / "music" / "empty"));
    EXPECT_EQ(engine.snapshot().files_total, 2u);
}

TEST_F(TransferTest, CancelledFolderUploadStopsWithinOneFile) {
    auto folder = dir.make_dir("docs");
    for (int i = 0; i < 5; i++) {
        dir.write_file("docs/page" + std::to_string(i) + ".txt", "text");
    }
    server.on_store_start = [this](const std::string&) { gate.arrive(); };

    engine.start(upload_request(folder, true), ServerSettings());
    gate.wait_reached();
    engine.cancel();
    gate.release();

    auto outcome = finish();
    EXPECT_EQ(outcome.message.text, "Upload cancelled");
    EXPECT_EQ(engine.snapshot().files_done, 0u);
    EXPECT_FALSE(server.has_file("/docs/page1.txt"));
}

TEST_F(TransferTest, MissingRemoteDirectoryFails) {
    auto source = dir.write_file("a.txt", "a");
    TransferRequest request = upload_request(source);
    request.remote_dir = "/gone";

    engine.start(request, ServerSettings());
    auto outcome = finish();

    EXPECT_EQ(outcome.message.type, MessageType::Error);
    EXPECT_EQ(outcome.message.text, "Upload failed: CWD /gone: 550 No such directory");
}

TEST_F(TransferTest, RefusedLoginFails) {
    server.refuse_login(true);
    auto source = dir.write_file("a.txt", "a");

    engine.start(upload_request(source), ServerSettings());
    auto outcome = finish();

    EXPECT_EQ(outcome.message.type, MessageType::Error);
    EXPECT_EQ(outcome.message.text.rfind("Upload failed: 530", 0), 0u);
}

TEST_F(TransferTest, EngineRunsJobsBackToBack) {
    auto first = dir.write_file("one.txt", "1");
    auto second = dir.write_file("two.txt", "22");

    engine.start(upload_request(first), ServerSettings());
    finish();
    engine.start(upload_request(second), ServerSettings());
    finish();

    EXPECT_EQ(server.file_data("/one.txt"), "1");
    EXPECT_EQ(server.file_data("/two.txt"), "22");
    EXPECT_EQ(server.login_count(), 2);
}

TEST(CountTest, CountsLocalFilesRecursively) {
    TempDir dir;
    dir.write_file("a", "");
    dir.write_file("x/b", "");
    dir.write_file("x/y/c", "");
    dir.make_dir("x/z");
    EXPECT_EQ(count_local_files(dir.path()), 3u);
}

TEST(CountTest, CountsRemoteFilesAndReturns) {
    MockFtpServer server;
    server.add_file("/root/a", "");
    server.add_file("/root/x/b", "");
    server.add_file("/root/x/y/c", "");
    Session session(mock_client_factory(server));
    session.connect(ServerSettings(), CONNECT_TIMEOUT);

    EXPECT_EQ(count_remote_files(session, "root"), 3u);
    EXPECT_EQ(session.current_directory(), "/");
}

TEST(SpeedMeterTest, KeepsEstimateBetweenSamples) {
    using std::chrono::milliseconds;
    SpeedMeter meter(milliseconds(500));
    auto start = std::chrono::steady_clock::now();
    meter.reset(start);

    EXPECT_DOUBLE_EQ(meter.sample(start + milliseconds(100), 1000), 0.0);
    EXPECT_DOUBLE_EQ(meter.sample(start + milliseconds(1000), 2000), 2000.0);
    EXPECT_DOUBLE_EQ(meter.sample(start + milliseconds(1200), 5000), 2000.0);
    EXPECT_DOUBLE_EQ(meter.sample(start + milliseconds(2000), 5000), 3000.0);
    EXPECT_DOUBLE_EQ(meter.speed(), 3000.0);
}

TEST(CancellationTest, TokenSeesSourceCancel) {
    CancellationSource source;
    CancellationToken token = source.token();
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_NO_THROW(token.throw_if_cancelled());

    source.cancel();
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_THROW(token.throw_if_cancelled(), TransferCancelled);
}
