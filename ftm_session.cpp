// ftm_session.cpp - FTP connection session and libcurl client implementation
#include "ftm_session.h"

#include <algorithm>
#include <cstring>
#include <exception>
#include <sstream>

#include <spdlog/spdlog.h>

namespace {

template <typename T>
void set_option(CURL* handle, CURLoption option, T value) {
    CURLcode rc = curl_easy_setopt(handle, option, value);
    if (rc != CURLE_OK) {
        throw RemoteOperationError("curl_easy_setopt(" + std::to_string(static_cast<int>(option)) + ")",
                                   curl_easy_strerror(rc));
    }
}

// Errors that mean the control connection itself is gone or never came up
bool is_connection_failure(CURLcode rc) {
    switch (rc) {
        case CURLE_COULDNT_RESOLVE_HOST:
        case CURLE_COULDNT_RESOLVE_PROXY:
        case CURLE_COULDNT_CONNECT:
        case CURLE_LOGIN_DENIED:
        case CURLE_OPERATION_TIMEDOUT:
        case CURLE_FTP_WEIRD_SERVER_REPLY:
        case CURLE_GOT_NOTHING:
        case CURLE_SEND_ERROR:
        case CURLE_RECV_ERROR:
            return true;
        default:
            return false;
    }
}

size_t on_header(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* responses = static_cast<std::string*>(userdata);
    responses->append(buffer, size * nitems);
    return size * nitems;
}

size_t on_list_data(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* out = static_cast<std::string*>(userdata);
    out->append(buffer, size * nitems);
    return size * nitems;
}

// Exceptions from the callbacks are parked here and rethrown after
// curl_easy_perform returns
struct CallbackContext {
    const FtpClient::IdleCallback* on_idle = nullptr;
    std::exception_ptr error;
};

struct StoreContext : CallbackContext {
    std::istream* in = nullptr;
    size_t block_size = TRANSFER_BLOCK_SIZE;
    const FtpClient::StoreCallback* on_block = nullptr;
};

// libcurl calls this about once a second even on a stalled data connection
int on_transfer_progress(void* userdata, curl_off_t, curl_off_t, curl_off_t, curl_off_t) {
    auto* ctx = static_cast<CallbackContext*>(userdata);
    if (!ctx->on_idle || !*ctx->on_idle) {
        return 0;
    }
    try {
        (*ctx->on_idle)();
        return 0;
    } catch (...) {
        ctx->error = std::current_exception();
        return 1;  // CURLE_ABORTED_BY_CALLBACK
    }
}

size_t on_store_data(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<StoreContext*>(userdata);
    try {
        size_t wanted = std::min(size * nitems, ctx->block_size);
        ctx->in->read(buffer, static_cast<std::streamsize>(wanted));
        size_t got = static_cast<size_t>(ctx->in->gcount());
        if (got == 0) {
            if (ctx->in->bad()) {
                throw LocalIOError("Read error on upload source");
            }
            return 0;
        }
        (*ctx->on_block)(got);
        return got;
    } catch (...) {
        ctx->error = std::current_exception();
        return CURL_READFUNC_ABORT;
    }
}

struct RetrieveContext : CallbackContext {
    size_t block_size = TRANSFER_BLOCK_SIZE;
    const FtpClient::RetrieveCallback* on_block = nullptr;
};

size_t on_retrieve_data(char* buffer, size_t size, size_t nitems, void* userdata) {
    auto* ctx = static_cast<RetrieveContext*>(userdata);
    const size_t total = size * nitems;
    try {
        for (size_t offset = 0; offset < total; offset += ctx->block_size) {
            (*ctx->on_block)(buffer + offset, std::min(ctx->block_size, total - offset));
        }
        return total;
    } catch (...) {
        ctx->error = std::current_exception();
        return total + 1;  // CURLE_WRITE_ERROR
    }
}

std::vector<std::string> split_remote_path(const std::string& path) {
    std::vector<std::string> parts;
    std::istringstream stream(path);
    std::string part;
    while (std::getline(stream, part, '/')) {
        if (!part.empty()) parts.push_back(part);
    }
    return parts;
}

std::string last_response_line(const std::string& responses) {
    auto lines = split_lines(responses);
    return lines.empty() ? std::string() : trim(lines.back());
}

} // namespace

std::string remote_join(const std::string& dir, const std::string& name) {
    if (dir.empty()) return "/" + name;
    if (dir.back() == '/') return dir + name;
    return dir + "/" + name;
}

std::string remote_resolve(const std::string& cwd, const std::string& target) {
    std::vector<std::string> parts;
    if (target.empty() || target[0] != '/') {
        parts = split_remote_path(cwd);
    }
    for (const auto& part : split_remote_path(target)) {
        if (part == ".") continue;
        if (part == PARENT_ENTRY) {
            if (!parts.empty()) parts.pop_back();
            continue;
        }
        parts.push_back(part);
    }

    std::string result;
    for (const auto& part : parts) {
        result += "/" + part;
    }
    return result.empty() ? "/" : result;
}

std::string remote_parent(const std::string& dir) {
    return remote_resolve(dir, PARENT_ENTRY);
}

// CurlFtpClient implementation
CurlFtpClient::CurlFtpClient() = default;

CurlFtpClient::~CurlFtpClient() {
    quit();
}

std::string CurlFtpClient::url_for(const std::string& path, bool is_dir) {
    std::string relative;
    for (const auto& part : split_remote_path(path)) {
        char* escaped = curl_easy_escape(handle, part.c_str(), static_cast<int>(part.size()));
        if (!escaped) {
            throw RemoteOperationError("curl_easy_escape", "cannot encode '" + part + "'");
        }
        if (!relative.empty()) relative += '/';
        relative += escaped;
        curl_free(escaped);
    }

    std::string host = server.host;
    if (host.find(':') != std::string::npos && host.front() != '[') {
        host = "[" + host + "]";
    }

    // "//" makes the path absolute instead of relative to the login directory
    std::string url = "ftp://" + host + "//" + relative;
    if (is_dir && url.back() != '/') {
        url += '/';
    }
    return url;
}

void CurlFtpClient::prepare(const std::string& url) {
    if (!handle) {
        throw ConnectionError("Not connected");
    }
    curl_easy_reset(handle);

    error_buffer[0] = '\0';
    responses.clear();

    set_option(handle, CURLOPT_ERRORBUFFER, error_buffer);
    set_option(handle, CURLOPT_HEADERFUNCTION, static_cast<curl_write_callback>(on_header));
    set_option(handle, CURLOPT_HEADERDATA, &responses);
    set_option(handle, CURLOPT_URL, url.c_str());
    set_option(handle, CURLOPT_PORT, static_cast<long>(server.port));
    set_option(handle, CURLOPT_USERNAME, server.user.c_str());
    set_option(handle, CURLOPT_PASSWORD, server.password.c_str());
    set_option(handle, CURLOPT_NOSIGNAL, 1L);
    set_option(handle, CURLOPT_CONNECTTIMEOUT, static_cast<long>(timeout.count()));
    set_option(handle, CURLOPT_SERVER_RESPONSE_TIMEOUT, static_cast<long>(timeout.count()));
    set_option(handle, CURLOPT_TCP_KEEPALIVE, 1L);
}

void CurlFtpClient::watch_idle(void* context) {
    set_option(handle, CURLOPT_NOPROGRESS, 0L);
    set_option(handle, CURLOPT_XFERINFOFUNCTION, static_cast<curl_xferinfo_callback>(on_transfer_progress));
    set_option(handle, CURLOPT_XFERINFODATA, context);
}

void CurlFtpClient::perform(const std::string& operation) {
    const CURLcode rc = curl_easy_perform(handle);
    if (rc == CURLE_OK) {
        return;
    }

    std::string message = trim(error_buffer);
    if (message.empty()) {
        message = curl_easy_strerror(rc);
    }
    std::string response = last_response_line(responses);
    if (!response.empty() && message.find(response) == std::string::npos) {
        message += " (" + response + ")";
    }

    spdlog::debug("{} failed: {} [curl {}]", operation, message, static_cast<int>(rc));
    if (is_connection_failure(rc)) {
        throw ConnectionError(operation + ": " + message);
    }
    throw RemoteOperationError(operation, message);
}

void CurlFtpClient::run_commands(const std::string& operation, const std::vector<std::string>& commands) {
    std::unique_ptr<curl_slist, decltype(&curl_slist_free_all)> quote(nullptr, curl_slist_free_all);
    for (const auto& command : commands) {
        curl_slist* appended = curl_slist_append(quote.get(), command.c_str());
        if (!appended) {
            throw RemoteOperationError(operation, "out of memory");
        }
        quote.release();
        quote.reset(appended);
    }

    prepare(url_for(cwd_path, true));
    set_option(handle, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_NOCWD));
    set_option(handle, CURLOPT_NOBODY, 1L);
    set_option(handle, CURLOPT_QUOTE, quote.get());
    perform(operation);
}

void CurlFtpClient::connect(const ServerSettings& settings, std::chrono::seconds connect_timeout) {
    quit();

    handle = curl_easy_init();
    if (!handle) {
        throw ConnectionError("curl_easy_init failed");
    }
    server = settings;
    timeout = connect_timeout;

    // Relative root URL: log in and stay in the entry directory
    std::string host = server.host;
    if (host.find(':') != std::string::npos && host.front() != '[') {
        host = "[" + host + "]";
    }
    try {
        prepare("ftp://" + host + "/");
        set_option(handle, CURLOPT_NOBODY, 1L);
        perform("Login to " + server.host);
    } catch (const FtmError& e) {
        quit();
        throw ConnectionError(e.what());
    }

    const char* entry_path = nullptr;
    if (curl_easy_getinfo(handle, CURLINFO_FTP_ENTRY_PATH, &entry_path) == CURLE_OK && entry_path) {
        cwd_path = remote_resolve("/", entry_path);
    } else {
        cwd_path = "/";
    }
    logged_in = true;
    spdlog::info("Logged in to {}:{} as {}, entry path {}", server.host, server.port, server.user, cwd_path);
}

void CurlFtpClient::quit() {
    if (handle) {
        // cleanup sends QUIT on the cached control connection
        curl_easy_cleanup(handle);
        handle = nullptr;
    }
    logged_in = false;
}

std::string CurlFtpClient::pwd() {
    return cwd_path;
}

void CurlFtpClient::cwd(const std::string& path) {
    const std::string target = remote_resolve(cwd_path, path);
    prepare(url_for(target, true));
    set_option(handle, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_SINGLECWD));
    set_option(handle, CURLOPT_NOBODY, 1L);
    perform("CWD " + target);
    cwd_path = target;
}

void CurlFtpClient::mkd(const std::string& name) {
    run_commands("MKD " + name, {"MKD " + remote_resolve(cwd_path, name)});
}

void CurlFtpClient::rmd(const std::string& name) {
    run_commands("RMD " + name, {"RMD " + remote_resolve(cwd_path, name)});
}

void CurlFtpClient::dele(const std::string& name) {
    run_commands("DELE " + name, {"DELE " + remote_resolve(cwd_path, name)});
}

void CurlFtpClient::rename(const std::string& from, const std::string& to) {
    run_commands("Rename " + from, {"RNFR " + remote_resolve(cwd_path, from),
                                    "RNTO " + remote_resolve(cwd_path, to)});
}

std::string CurlFtpClient::list() {
    std::string listing;
    prepare(url_for(cwd_path, true));
    set_option(handle, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_SINGLECWD));
    set_option(handle, CURLOPT_WRITEFUNCTION, static_cast<curl_write_callback>(on_list_data));
    set_option(handle, CURLOPT_WRITEDATA, &listing);
    perform("LIST " + cwd_path);
    return listing;
}

void CurlFtpClient::store(const std::string& name, std::istream& in, size_t block_size,
                          const StoreCallback& on_block, const IdleCallback& on_idle) {
    StoreContext ctx;
    ctx.in = &in;
    ctx.block_size = block_size;
    ctx.on_block = &on_block;
    ctx.on_idle = &on_idle;

    const std::string target = remote_resolve(cwd_path, name);
    prepare(url_for(target, false));
    set_option(handle, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_NOCWD));
    set_option(handle, CURLOPT_UPLOAD, 1L);
    set_option(handle, CURLOPT_READFUNCTION, static_cast<curl_read_callback>(on_store_data));
    set_option(handle, CURLOPT_READDATA, &ctx);
    watch_idle(static_cast<CallbackContext*>(&ctx));

    try {
        perform("STOR " + name);
    } catch (const FtmError&) {
        if (ctx.error) std::rethrow_exception(ctx.error);
        throw;
    }
    if (ctx.error) std::rethrow_exception(ctx.error);
}

void CurlFtpClient::retrieve(const std::string& name, size_t block_size,
                             const RetrieveCallback& on_block, const IdleCallback& on_idle) {
    RetrieveContext ctx;
    ctx.block_size = block_size;
    ctx.on_block = &on_block;
    ctx.on_idle = &on_idle;

    const std::string target = remote_resolve(cwd_path, name);
    prepare(url_for(target, false));
    set_option(handle, CURLOPT_FTP_FILEMETHOD, static_cast<long>(CURLFTPMETHOD_NOCWD));
    set_option(handle, CURLOPT_BUFFERSIZE, static_cast<long>(block_size));
    set_option(handle, CURLOPT_WRITEFUNCTION, static_cast<curl_write_callback>(on_retrieve_data));
    set_option(handle, CURLOPT_WRITEDATA, &ctx);
    watch_idle(static_cast<CallbackContext*>(&ctx));

    try {
        perform("RETR " + name);
    } catch (const FtmError&) {
        if (ctx.error) std::rethrow_exception(ctx.error);
        throw;
    }
    if (ctx.error) std::rethrow_exception(ctx.error);
}

FtpClientFactory curl_client_factory() {
    return [] { return std::make_unique<CurlFtpClient>(); };
}

// Session implementation
Session::Session(FtpClientFactory client_factory) : factory(std::move(client_factory)) {}

Session::~Session() {
    disconnect();
}

FtpClient& Session::require_client() {
    if (!connected || !client) {
        throw ConnectionError("Not connected");
    }
    return *client;
}

void Session::connect(const ServerSettings& settings, std::chrono::seconds timeout) {
    disconnect();
    server = settings;

    client = factory();
    try {
        client->connect(settings, timeout);
        remote_cwd = client->pwd();
    } catch (const ConnectionError&) {
        client.reset();
        throw;
    } catch (const FtmError& e) {
        client.reset();
        throw ConnectionError(e.what());
    }
    connected = true;
}

void Session::disconnect() {
    if (client) {
        try {
            client->quit();
        } catch (const std::exception& e) {
            spdlog::debug("Logout from {} failed: {}", server.host, e.what());
        }
        client.reset();
    }
    connected = false;
    remote_cwd.clear();
}

void Session::change_directory(const std::string& name) {
    FtpClient& c = require_client();
    c.cwd(name);
    remote_cwd = c.pwd();
}

void Session::make_directory(const std::string& name) {
    require_client().mkd(name);
}

void Session::remove_directory(const std::string& name) {
    require_client().rmd(name);
}

void Session::delete_file(const std::string& name) {
    require_client().dele(name);
}

void Session::rename(const std::string& old_name, const std::string& new_name) {
    require_client().rename(old_name, new_name);
}

std::vector<std::string> Session::list_current_directory() {
    return split_lines(require_client().list());
}

std::vector<Entry> Session::list_entries() {
    return parse_listing(require_client().list());
}

// Empties and removes a directory below the current one. The working
// directory is the same afterwards whether or not this throws.
void Session::delete_directory_recursive(const std::string& name) {
    FtpClient& c = require_client();
    const std::string original = c.pwd();

    try {
        c.cwd(name);
        for (const auto& entry : parse_listing(c.list())) {
            if (entry.is_directory) {
                delete_directory_recursive(entry.name);
            } else {
                c.dele(entry.name);
            }
        }
        c.cwd(original);
        c.rmd(name);
    } catch (const FtmError&) {
        try {
            c.cwd(original);
        } catch (const FtmError& restore_error) {
            spdlog::warn("Cannot return to {} after failed delete: {}", original, restore_error.what());
        }
        remote_cwd = c.pwd();
        throw;
    }
    remote_cwd = c.pwd();
}

void Session::store_file(const std::string& name, std::istream& in, const FtpClient::StoreCallback& on_block,
                         const FtpClient::IdleCallback& on_idle) {
    require_client().store(name, in, TRANSFER_BLOCK_SIZE, on_block, on_idle);
}

void Session::retrieve_file(const std::string& name, const FtpClient::RetrieveCallback& on_block,
                            const FtpClient::IdleCallback& on_idle) {
    require_client().retrieve(name, TRANSFER_BLOCK_SIZE, on_block, on_idle);
}
