// ftm_core.h - Core types for the FTP file manager
#ifndef FTM_CORE_H
#define FTM_CORE_H

#include <string>
#include <vector>
#include <optional>
#include <stdexcept>
#include <filesystem>
#include <chrono>
#include <cstdint>

namespace fs = std::filesystem;

#ifndef FTM_VERSION
#define FTM_VERSION "dev"
#endif

// Built-in connection defaults
extern const char* const DEFAULT_HOST;
constexpr int DEFAULT_PORT = 9999;
extern const char* const DEFAULT_USER;
extern const char* const DEFAULT_PASSWORD;

constexpr auto CONNECT_TIMEOUT = std::chrono::seconds(10);
constexpr auto TRANSFER_TIMEOUT = std::chrono::seconds(30);

// Name of the synthetic parent entry
extern const char* const PARENT_ENTRY;

// Severity of a status line message
enum class MessageType {
    Info,
    Success,
    Error
};

struct StatusMessage {
    std::string text;
    MessageType type = MessageType::Info;
};

enum class PaneSide {
    Local,
    Remote
};

// One directory item, local or remote
struct Entry {
    std::string name;
    bool is_directory = false;
    bool is_symlink = false;
    uintmax_t size = 0;
    std::string permissions;   // remote only
    fs::path local_path;       // local only

    bool is_parent() const { return name == PARENT_ENTRY; }
};

Entry make_parent_entry(const fs::path& parent_path = fs::path());

// Error taxonomy. Everything is caught at the operation boundary and
// turned into a StatusMessage.
class FtmError : public std::runtime_error {
public:
    explicit FtmError(const std::string& message) : std::runtime_error(message) {}
};

class ConnectionError : public FtmError {
public:
    explicit ConnectionError(const std::string& message) : FtmError(message) {}
};

class RemoteOperationError : public FtmError {
private:
    std::string reason_text;

public:
    RemoteOperationError(const std::string& operation, const std::string& reason)
        : FtmError(operation + ": " + reason), reason_text(reason) {}
    const std::string& reason() const { return reason_text; }
};

class LocalIOError : public FtmError {
public:
    explicit LocalIOError(const std::string& message) : FtmError(message) {}
};

class TransferCancelled : public FtmError {
public:
    TransferCancelled() : FtmError("Cancelled by user") {}
};

class TransferBusy : public FtmError {
public:
    TransferBusy() : FtmError("Transfer already in progress") {}
};

// Server to connect to
struct ServerSettings {
    std::string host = DEFAULT_HOST;
    int port = DEFAULT_PORT;
    std::string user = DEFAULT_USER;
    std::string password = DEFAULT_PASSWORD;
};

// Configuration structure
struct Config {
    ServerSettings server;
    fs::path local_start_dir;
    fs::path config_file;
    fs::path log_file;
    std::chrono::seconds connect_timeout = CONNECT_TIMEOUT;
    std::chrono::seconds transfer_timeout = TRANSFER_TIMEOUT;
};

// Listing model
std::optional<Entry> parse_list_line(const std::string& line);
std::vector<Entry> parse_listing(const std::string& text);
std::vector<std::string> split_lines(const std::string& text);
bool entry_order(const Entry& a, const Entry& b);
void sort_entries(std::vector<Entry>& entries);
// One path component: not empty, not "." or "..", no '/'
bool is_plain_name(const std::string& name);

// Unsorted contents of a local directory. Throws LocalIOError.
std::vector<Entry> read_local_directory(const fs::path& dir);

// Search: indices of entries whose name contains query, ignoring case.
// The parent entry never matches.
std::vector<size_t> find_matches(const std::vector<Entry>& entries, const std::string& query);

// Configuration persistence
fs::path home_directory();
fs::path default_config_path();
fs::path default_log_path();
fs::path default_local_dir();
Config load_config(const fs::path& file);
bool save_config(const Config& config);
bool apply_server_argument(const std::string& arg, ServerSettings& server);
std::optional<int> parse_port(const std::string& text);

// Logging
void init_logging(const fs::path& log_file);

// Utility functions
std::string to_lower(std::string text);
std::string trim(const std::string& text);
std::string format_size(double bytes);
std::string shorten_path(const std::string& path, size_t max_length);

#endif // FTM_CORE_H
