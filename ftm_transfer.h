// ftm_transfer.h - Background upload/download engine
#ifndef FTM_TRANSFER_H
#define FTM_TRANSFER_H

#include "ftm_session.h"

#include <atomic>
#include <mutex>
#include <thread>

class CancellationToken;

// Writer side of a cancellation flag, held by the UI thread
class CancellationSource {
private:
    std::shared_ptr<std::atomic<bool>> flag;

public:
    CancellationSource();

    void cancel();
    bool is_cancelled() const;
    CancellationToken token() const;
};

// Reader side, handed to the worker
class CancellationToken {
private:
    std::shared_ptr<const std::atomic<bool>> flag;

public:
    explicit CancellationToken(std::shared_ptr<const std::atomic<bool>> shared_flag);

    bool is_cancelled() const;
    void throw_if_cancelled() const;
};

enum class TransferKind {
    Upload,
    Download
};

// Consistent copy of the active job, taken under the progress lock
struct TransferSnapshot {
    bool active = false;
    TransferKind kind = TransferKind::Upload;
    std::string description;
    bool is_folder = false;
    uintmax_t bytes_transferred = 0;
    uintmax_t bytes_total = 0;
    size_t files_done = 0;
    size_t files_total = 0;
    double speed = 0.0;
    bool cancel_requested = false;
    std::chrono::steady_clock::time_point start_time;

    // 0..1, by bytes for single files and by files for folders
    double fraction() const;
};

// Bytes per second, resampled at most once per interval
class SpeedMeter {
private:
    std::chrono::milliseconds interval;
    std::chrono::steady_clock::time_point last_time;
    uintmax_t last_bytes = 0;
    double estimate = 0.0;

public:
    explicit SpeedMeter(std::chrono::milliseconds sample_interval = std::chrono::milliseconds(500));

    void reset(std::chrono::steady_clock::time_point now, uintmax_t bytes = 0);
    double sample(std::chrono::steady_clock::time_point now, uintmax_t bytes);
    double speed() const { return estimate; }
};

// Result of a finished job and the pane whose listing it changed
struct TransferOutcome {
    StatusMessage message;
    PaneSide refresh = PaneSide::Remote;
};

// Shared between the worker (only writer) and the UI thread (reader)
class TransferProgress {
private:
    mutable std::mutex mutex;
    TransferSnapshot state;
    SpeedMeter meter;
    std::optional<TransferOutcome> outcome;

public:
    void begin(TransferKind kind, const std::string& description, bool is_folder, uintmax_t bytes_total);
    void set_files_total(size_t total, const std::string& description);
    void add_bytes(uintmax_t bytes);
    void file_done();
    void finish(const TransferOutcome& result);

    TransferSnapshot snapshot() const;
    bool has_outcome() const;
    std::optional<TransferOutcome> take_outcome();
};

// What to move. Uploads copy local_path into remote_dir/remote_name;
// downloads copy remote_dir/remote_name into the local_path directory.
struct TransferRequest {
    TransferKind kind = TransferKind::Upload;
    fs::path local_path;
    std::string remote_dir;
    std::string remote_name;
    bool is_directory = false;
    uintmax_t size = 0;
};

// Runs one job at a time on a worker thread with its own Session
class TransferEngine {
private:
    FtpClientFactory factory;
    std::chrono::seconds session_timeout;
    std::thread worker;
    std::atomic<bool> active{false};
    CancellationSource cancellation;
    TransferProgress progress;

    void run_job(TransferRequest request, ServerSettings server, CancellationToken token);

    StatusMessage upload_file(Session& session, const TransferRequest& request, const CancellationToken& token);
    StatusMessage download_file(Session& session, const TransferRequest& request, const CancellationToken& token);
    StatusMessage upload_folder(Session& session, const TransferRequest& request, const CancellationToken& token);
    StatusMessage download_folder(Session& session, const TransferRequest& request, const CancellationToken& token);

    void send_file(Session& session, const fs::path& source, const std::string& name, const CancellationToken& token);
    void receive_file(Session& session, const std::string& name, const fs::path& target, const CancellationToken& token);
    void upload_tree(Session& session, const fs::path& source, const std::string& name, const CancellationToken& token);
    void download_tree(Session& session, const std::string& name, const fs::path& parent, const CancellationToken& token);

public:
    explicit TransferEngine(FtpClientFactory client_factory, std::chrono::seconds timeout = TRANSFER_TIMEOUT);
    ~TransferEngine();

    TransferEngine(const TransferEngine&) = delete;
    TransferEngine& operator=(const TransferEngine&) = delete;

    // Throws TransferBusy while a job is running
    void start(const TransferRequest& request, const ServerSettings& server);
    void cancel();
    bool is_active() const { return active; }
    TransferSnapshot snapshot() const;
    bool has_outcome() const { return progress.has_outcome(); }
    std::optional<TransferOutcome> take_outcome();

    // Blocks until the current worker, if any, has exited
    void wait();
};

// Pre-walk file counts for folder jobs
size_t count_local_files(const fs::path& root);
size_t count_remote_files(Session& session, const std::string& name);

#endif // FTM_TRANSFER_H
