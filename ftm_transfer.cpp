// ftm_transfer.cpp - Background upload/download engine implementation
#include "ftm_transfer.h"

#include <algorithm>
#include <fstream>
#include <stack>
#include <system_error>

#include <spdlog/spdlog.h>

// Cancellation implementation
CancellationSource::CancellationSource() : flag(std::make_shared<std::atomic<bool>>(false)) {}

void CancellationSource::cancel() {
    flag->store(true);
}

bool CancellationSource::is_cancelled() const {
    return flag->load();
}

CancellationToken CancellationSource::token() const {
    return CancellationToken(flag);
}

CancellationToken::CancellationToken(std::shared_ptr<const std::atomic<bool>> shared_flag)
    : flag(std::move(shared_flag)) {}

bool CancellationToken::is_cancelled() const {
    return flag && flag->load();
}

void CancellationToken::throw_if_cancelled() const {
    if (is_cancelled()) {
        throw TransferCancelled();
    }
}

double TransferSnapshot::fraction() const {
    if (is_folder) {
        return files_total > 0 ? static_cast<double>(files_done) / files_total : 0.0;
    }
    if (bytes_total == 0) {
        return 0.0;
    }
    return std::min(1.0, static_cast<double>(bytes_transferred) / bytes_total);
}

// SpeedMeter implementation
SpeedMeter::SpeedMeter(std::chrono::milliseconds sample_interval)
    : interval(sample_interval), last_time(std::chrono::steady_clock::now()) {}

void SpeedMeter::reset(std::chrono::steady_clock::time_point now, uintmax_t bytes) {
    last_time = now;
    last_bytes = bytes;
    estimate = 0.0;
}

double SpeedMeter::sample(std::chrono::steady_clock::time_point now, uintmax_t bytes) {
    auto elapsed = now - last_time;
    if (elapsed < interval) {
        return estimate;
    }

    double seconds = std::chrono::duration<double>(elapsed).count();
    if (seconds > 0.0) {
        estimate = static_cast<double>(bytes - last_bytes) / seconds;
    }
    last_time = now;
    last_bytes = bytes;
    return estimate;
}

// TransferProgress implementation
void TransferProgress::begin(TransferKind kind, const std::string& description, bool is_folder,
                             uintmax_t bytes_total) {
    std::lock_guard<std::mutex> lock(mutex);
    auto now = std::chrono::steady_clock::now();
    state = TransferSnapshot();
    state.active = true;
    state.kind = kind;
    state.description = description;
    state.is_folder = is_folder;
    state.bytes_total = bytes_total;
    state.start_time = now;
    meter.reset(now);
    outcome.reset();
}

void TransferProgress::set_files_total(size_t total, const std::string& description) {
    std::lock_guard<std::mutex> lock(mutex);
    state.files_total = total;
    state.description = description;
}

void TransferProgress::add_bytes(uintmax_t bytes) {
    std::lock_guard<std::mutex> lock(mutex);
    state.bytes_transferred += bytes;
    state.speed = meter.sample(std::chrono::steady_clock::now(), state.bytes_transferred);
}

void TransferProgress::file_done() {
    std::lock_guard<std::mutex> lock(mutex);
    state.files_done++;
}

void TransferProgress::finish(const TransferOutcome& result) {
    std::lock_guard<std::mutex> lock(mutex);
    state.active = false;
    outcome = result;
}

TransferSnapshot TransferProgress::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return state;
}

bool TransferProgress::has_outcome() const {
    std::lock_guard<std::mutex> lock(mutex);
    return outcome.has_value();
}

std::optional<TransferOutcome> TransferProgress::take_outcome() {
    std::lock_guard<std::mutex> lock(mutex);
    std::optional<TransferOutcome> result;
    result.swap(outcome);
    return result;
}

namespace {

void require_plain_name(const std::string& name) {
    if (!is_plain_name(name)) {
        throw LocalIOError("Refusing to write '" + name + "' outside the target directory");
    }
}

} // namespace

// Pre-walk counters
size_t count_local_files(const fs::path& root) {
    size_t count = 0;
    std::error_code ec;
    fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
    if (ec) {
        throw LocalIOError("Cannot read " + root.string() + ": " + ec.message());
    }
    for (auto end = fs::recursive_directory_iterator(); it != end; it.increment(ec)) {
        if (ec) {
            throw LocalIOError("Cannot read " + root.string() + ": " + ec.message());
        }
        std::error_code type_ec;
        if (it->is_regular_file(type_ec)) {
            count++;
        }
    }
    return count;
}

// Walks the tree with an explicit stack and returns to the starting directory
size_t count_remote_files(Session& session, const std::string& name) {
    const std::string start = session.current_directory();
    size_t count = 0;

    std::stack<std::string> pending;
    pending.push(remote_resolve(start, name));
    while (!pending.empty()) {
        std::string dir = pending.top();
        pending.pop();

        session.change_directory(dir);
        for (const auto& entry : session.list_entries()) {
            if (!is_plain_name(entry.name)) {
                continue;
            }
            if (entry.is_directory) {
                pending.push(remote_join(dir, entry.name));
            } else {
                count++;
            }
        }
    }

    session.change_directory(start);
    return count;
}

// TransferEngine implementation
TransferEngine::TransferEngine(FtpClientFactory client_factory, std::chrono::seconds timeout)
    : factory(std::move(client_factory)), session_timeout(timeout) {}

TransferEngine::~TransferEngine() {
    cancel();
    wait();
}

void TransferEngine::start(const TransferRequest& request, const ServerSettings& server) {
    if (active) {
        throw TransferBusy();
    }
    wait();

    const std::string description = request.is_directory ? request.remote_name + "/" : request.remote_name;
    const uintmax_t bytes_total = request.is_directory ? 0 : request.size;

    cancellation = CancellationSource();
    progress.begin(request.kind, description, request.is_directory, bytes_total);
    active = true;

    spdlog::info("{} started: {} ({} <-> {})",
                 request.kind == TransferKind::Upload ? "Upload" : "Download",
                 description, request.local_path.string(), remote_join(request.remote_dir, request.remote_name));
    try {
        worker = std::thread(&TransferEngine::run_job, this, request, server, cancellation.token());
    } catch (const std::system_error& e) {
        active = false;
        throw FtmError(std::string("Cannot start transfer worker: ") + e.what());
    }
}

void TransferEngine::cancel() {
    if (active) {
        cancellation.cancel();
    }
}

TransferSnapshot TransferEngine::snapshot() const {
    TransferSnapshot snap = progress.snapshot();
    snap.cancel_requested = cancellation.is_cancelled();
    return snap;
}

std::optional<TransferOutcome> TransferEngine::take_outcome() {
    return progress.take_outcome();
}

void TransferEngine::wait() {
    if (worker.joinable()) {
        worker.join();
    }
}

void TransferEngine::run_job(TransferRequest request, ServerSettings server, CancellationToken token) {
    const bool upload = request.kind == TransferKind::Upload;
    const std::string verb = upload ? "Upload" : "Download";

    TransferOutcome outcome;
    outcome.refresh = upload ? PaneSide::Remote : PaneSide::Local;

    try {
        Session session(factory);
        session.connect(server, session_timeout);
        session.change_directory(request.remote_dir);

        if (upload) {
            outcome.message = request.is_directory ? upload_folder(session, request, token)
                                                   : upload_file(session, request, token);
        } else {
            outcome.message = request.is_directory ? download_folder(session, request, token)
                                                   : download_file(session, request, token);
        }
        session.disconnect();
        spdlog::info("{}", outcome.message.text);
    } catch (const TransferCancelled&) {
        outcome.message = {verb + " cancelled", MessageType::Info};
        spdlog::info("{} of {} cancelled", verb, request.remote_name);
    } catch (const FtmError& e) {
        outcome.message = {verb + " failed: " + e.what(), MessageType::Error};
        spdlog::error("{} of {} failed: {}", verb, request.remote_name, e.what());
    } catch (const std::exception& e) {
        outcome.message = {verb + " failed: " + e.what(), MessageType::Error};
        spdlog::error("{} of {} failed: {}", verb, request.remote_name, e.what());
    }

    progress.finish(outcome);
    active = false;
}

void TransferEngine::send_file(Session& session, const fs::path& source, const std::string& name,
                               const CancellationToken& token) {
    std::ifstream in(source, std::ios::binary);
    if (!in.is_open()) {
        throw LocalIOError("Cannot open " + source.string());
    }
    session.store_file(
        name, in,
        [&](size_t bytes) {
            token.throw_if_cancelled();
            progress.add_bytes(bytes);
        },
        [&] { token.throw_if_cancelled(); });
}

// A cancelled download never leaves a partial local file behind
void TransferEngine::receive_file(Session& session, const std::string& name, const fs::path& target,
                                  const CancellationToken& token) {
    std::ofstream out(target, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        throw LocalIOError("Cannot write " + target.string());
    }

    try {
        session.retrieve_file(
            name,
            [&](const char* data, size_t bytes) {
                token.throw_if_cancelled();
                out.write(data, static_cast<std::streamsize>(bytes));
                if (!out) {
                    throw LocalIOError("Write failed: " + target.string());
                }
                progress.add_bytes(bytes);
            },
            [&] { token.throw_if_cancelled(); });
    } catch (const TransferCancelled&) {
        out.close();
        std::error_code ec;
        fs::remove(target, ec);
        if (ec) {
            spdlog::warn("Cannot remove partial download {}: {}", target.string(), ec.message());
        }
        throw;
    }
}

StatusMessage TransferEngine::upload_file(Session& session, const TransferRequest& request,
                                          const CancellationToken& token) {
    send_file(session, request.local_path, request.remote_name, token);
    return {"Uploaded: " + request.remote_name + " (" + format_size(static_cast<double>(request.size)) + ")",
            MessageType::Success};
}

StatusMessage TransferEngine::download_file(Session& session, const TransferRequest& request,
                                            const CancellationToken& token) {
    require_plain_name(request.remote_name);
    receive_file(session, request.remote_name, request.local_path / request.remote_name, token);
    return {"Downloaded: " + request.remote_name + " to " + request.local_path.string(), MessageType::Success};
}

StatusMessage TransferEngine::upload_folder(Session& session, const TransferRequest& request,
                                            const CancellationToken& token) {
    const size_t total = count_local_files(request.local_path);
    const std::string folder = request.remote_name + "/";
    progress.set_files_total(total, folder + " (" + std::to_string(total) + " files)");

    upload_tree(session, request.local_path, request.remote_name, token);

    return {"Uploaded folder: " + folder + " (" + std::to_string(progress.snapshot().files_done) + " files)",
            MessageType::Success};
}

StatusMessage TransferEngine::download_folder(Session& session, const TransferRequest& request,
                                              const CancellationToken& token) {
    require_plain_name(request.remote_name);
    const size_t total = count_remote_files(session, request.remote_name);
    const std::string folder = request.remote_name + "/";
    progress.set_files_total(total, folder + " (" + std::to_string(total) + " files)");

    download_tree(session, request.remote_name, request.local_path, token);

    return {"Downloaded folder: " + folder + " (" + std::to_string(progress.snapshot().files_done) + " files) to " +
                request.local_path.string(),
            MessageType::Success};
}

// Depth-first: the remote directory exists before anything is stored in it
void TransferEngine::upload_tree(Session& session, const fs::path& source, const std::string& name,
                                 const CancellationToken& token) {
    token.throw_if_cancelled();

    try {
        session.make_directory(name);
    } catch (const RemoteOperationError& e) {
        // usually "already exists"; change_directory below fails if it is really missing
        spdlog::debug("MKD {} refused: {}", name, e.reason());
    }
    session.change_directory(name);

    auto children = read_local_directory(source);
    sort_entries(children);

    for (const auto& child : children) {
        token.throw_if_cancelled();

        if (child.is_directory) {
            if (child.is_symlink) {
                spdlog::debug("Skipping directory link {}", child.local_path.string());
                continue;
            }
            upload_tree(session, child.local_path, child.name, token);
            continue;
        }

        std::error_code ec;
        if (!fs::is_regular_file(child.local_path, ec)) {
            continue;
        }
        send_file(session, child.local_path, child.name, token);
        progress.file_done();
    }

    session.change_directory(PARENT_ENTRY);
}

void TransferEngine::download_tree(Session& session, const std::string& name, const fs::path& parent,
                                   const CancellationToken& token) {
    token.throw_if_cancelled();

    const fs::path target = parent / name;
    std::error_code ec;
    fs::create_directories(target, ec);
    if (ec) {
        throw LocalIOError("Cannot create " + target.string() + ": " + ec.message());
    }
    session.change_directory(name);

    auto children = session.list_entries();
    sort_entries(children);

    for (const auto& child : children) {
        token.throw_if_cancelled();

        // Listing names become local path components
        if (!is_plain_name(child.name)) {
            spdlog::warn("Skipping remote entry '{}' in {}: not a plain file name", child.name,
                         session.current_directory());
            continue;
        }
        if (child.is_directory) {
            download_tree(session, child.name, target, token);
        } else {
            receive_file(session, child.name, target / child.name, token);
            progress.file_done();
        }
    }

    session.change_directory(PARENT_ENTRY);
}
