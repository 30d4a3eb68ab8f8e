// ftm_session.h - FTP connection session and protocol client
#ifndef FTM_SESSION_H
#define FTM_SESSION_H

#include "ftm_core.h"

#include <functional>
#include <istream>
#include <memory>

#include <curl/curl.h>

constexpr size_t TRANSFER_BLOCK_SIZE = 8 * 1024;

// Remote path helpers. Paths are absolute and '/'-separated.
std::string remote_join(const std::string& dir, const std::string& name);
std::string remote_parent(const std::string& dir);
std::string remote_resolve(const std::string& cwd, const std::string& target);

// Protocol client seam. Implementations throw ConnectionError for
// connect/login failures and RemoteOperationError for rejected commands.
// Exceptions thrown by block and idle callbacks propagate unchanged.
class FtpClient {
public:
    using StoreCallback = std::function<void(size_t bytes)>;
    using RetrieveCallback = std::function<void(const char* data, size_t bytes)>;
    // Polled while a data transfer is open, also when no data moves.
    // Throwing from it aborts the transfer.
    using IdleCallback = std::function<void()>;

    virtual ~FtpClient() = default;

    virtual void connect(const ServerSettings& server, std::chrono::seconds timeout) = 0;
    virtual void quit() = 0;

    virtual std::string pwd() = 0;
    virtual void cwd(const std::string& path) = 0;
    virtual void mkd(const std::string& name) = 0;
    virtual void rmd(const std::string& name) = 0;
    virtual void dele(const std::string& name) = 0;
    virtual void rename(const std::string& from, const std::string& to) = 0;
    virtual std::string list() = 0;

    // on_block runs once per block before it is sent; on_idle may be empty
    virtual void store(const std::string& name, std::istream& in, size_t block_size,
                       const StoreCallback& on_block, const IdleCallback& on_idle) = 0;
    virtual void retrieve(const std::string& name, size_t block_size,
                          const RetrieveCallback& on_block, const IdleCallback& on_idle) = 0;
};

using FtpClientFactory = std::function<std::unique_ptr<FtpClient>()>;

// libcurl backed client. One easy handle keeps the control connection
// alive between requests; the working directory is tracked locally and
// every request addresses absolute paths.
class CurlFtpClient : public FtpClient {
private:
    CURL* handle = nullptr;
    ServerSettings server;
    std::chrono::seconds timeout{0};
    std::string cwd_path = "/";
    bool logged_in = false;
    char error_buffer[CURL_ERROR_SIZE] = {};
    std::string responses;   // server replies of the last request

    std::string url_for(const std::string& path, bool is_dir);
    void prepare(const std::string& url);
    void watch_idle(void* context);   // installs the xferinfo poll
    void perform(const std::string& operation);
    void run_commands(const std::string& operation, const std::vector<std::string>& commands);

public:
    CurlFtpClient();
    ~CurlFtpClient() override;

    CurlFtpClient(const CurlFtpClient&) = delete;
    CurlFtpClient& operator=(const CurlFtpClient&) = delete;

    void connect(const ServerSettings& settings, std::chrono::seconds connect_timeout) override;
    void quit() override;

    std::string pwd() override;
    void cwd(const std::string& path) override;
    void mkd(const std::string& name) override;
    void rmd(const std::string& name) override;
    void dele(const std::string& name) override;
    void rename(const std::string& from, const std::string& to) override;
    std::string list() override;

    void store(const std::string& name, std::istream& in, size_t block_size,
               const StoreCallback& on_block, const IdleCallback& on_idle) override;
    void retrieve(const std::string& name, size_t block_size,
                  const RetrieveCallback& on_block, const IdleCallback& on_idle) override;
};

FtpClientFactory curl_client_factory();

// One authenticated connection
class Session {
private:
    FtpClientFactory factory;
    std::unique_ptr<FtpClient> client;
    ServerSettings server;
    bool connected = false;
    std::string remote_cwd;

    FtpClient& require_client();

public:
    explicit Session(FtpClientFactory client_factory);
    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    void connect(const ServerSettings& settings, std::chrono::seconds timeout);
    void disconnect();

    bool is_connected() const { return connected; }
    const ServerSettings& settings() const { return server; }
    const std::string& current_directory() const { return remote_cwd; }
    bool at_root() const { return remote_cwd == "/"; }

    void change_directory(const std::string& name);
    void make_directory(const std::string& name);
    void remove_directory(const std::string& name);
    void delete_file(const std::string& name);
    void rename(const std::string& old_name, const std::string& new_name);
    std::vector<std::string> list_current_directory();
    std::vector<Entry> list_entries();

    void delete_directory_recursive(const std::string& name);

    void store_file(const std::string& name, std::istream& in, const FtpClient::StoreCallback& on_block,
                    const FtpClient::IdleCallback& on_idle = {});
    void retrieve_file(const std::string& name, const FtpClient::RetrieveCallback& on_block,
                       const FtpClient::IdleCallback& on_idle = {});
};

#endif // FTM_SESSION_H
