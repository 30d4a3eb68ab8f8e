// ftm_core.cpp - Core functionality implementation
#include "ftm_core.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <fstream>
#include <iomanip>
#include <sstream>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

const char* const DEFAULT_HOST = "192.168.0.103";
const char* const DEFAULT_USER = "anonymous";
const char* const DEFAULT_PASSWORD = "";
const char* const PARENT_ENTRY = "..";

namespace {

constexpr size_t LIST_FIELDS = 9;

bool is_blank(char c) {
    return c == ' ' || c == '\t';
}

bool all_digits(const std::string& text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); });
}

} // namespace

Entry make_parent_entry(const fs::path& parent_path) {
    Entry entry;
    entry.name = PARENT_ENTRY;
    entry.is_directory = true;
    entry.local_path = parent_path;
    return entry;
}

// Long-format listing line: perms, links, owner, group, size, month, day,
// time/year, name. The name is the raw remainder of the line.
std::optional<Entry> parse_list_line(const std::string& line) {
    std::vector<std::string> fields;
    size_t pos = 0;
    const size_t len = line.size();

    while (fields.size() < LIST_FIELDS - 1) {
        while (pos < len && is_blank(line[pos])) pos++;
        if (pos >= len) return std::nullopt;
        size_t start = pos;
        while (pos < len && !is_blank(line[pos])) pos++;
        fields.push_back(line.substr(start, pos - start));
    }

    while (pos < len && is_blank(line[pos])) pos++;
    std::string name = line.substr(pos);
    while (!name.empty() && (name.back() == '\r' || name.back() == '\n')) {
        name.pop_back();
    }
    if (name.empty()) return std::nullopt;

    Entry entry;
    entry.name = name;
    entry.permissions = fields[0];
    entry.is_directory = !fields[0].empty() && fields[0][0] == 'd';
    if (all_digits(fields[4])) {
        try {
            entry.size = std::stoull(fields[4]);
        } catch (const std::out_of_range&) {
            entry.size = 0;
        }
    }
    return entry;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (!line.empty()) lines.push_back(line);
    }
    return lines;
}

std::vector<Entry> parse_listing(const std::string& text) {
    std::vector<Entry> entries;
    for (const auto& line : split_lines(text)) {
        auto entry = parse_list_line(line);
        if (!entry) continue;
        if (entry->name == "." || entry->name == PARENT_ENTRY) continue;
        entries.push_back(std::move(*entry));
    }
    return entries;
}

// Directories before files, then case-insensitive name
bool entry_order(const Entry& a, const Entry& b) {
    if (a.is_directory != b.is_directory) {
        return a.is_directory;
    }
    return to_lower(a.name) < to_lower(b.name);
}

void sort_entries(std::vector<Entry>& entries) {
    auto first = entries.begin();
    if (first != entries.end() && first->is_parent()) {
        ++first;
    }
    std::stable_sort(first, entries.end(), entry_order);
}

bool is_plain_name(const std::string& name) {
    return !name.empty() && name != "." && name != PARENT_ENTRY && name.find('/') == std::string::npos;
}

std::vector<Entry> read_local_directory(const fs::path& dir) {
    std::vector<Entry> entries;
    try {
        for (const auto& dir_entry : fs::directory_iterator(dir,
                fs::directory_options::skip_permission_denied)) {
            Entry entry;
            entry.name = dir_entry.path().filename().string();
            entry.local_path = dir_entry.path();

            std::error_code ec;
            entry.is_symlink = dir_entry.is_symlink(ec);
            entry.is_directory = dir_entry.is_directory(ec);
            if (!entry.is_directory && dir_entry.is_regular_file(ec)) {
                entry.size = dir_entry.file_size(ec);
                if (ec) entry.size = 0;
            }
            entries.push_back(std::move(entry));
        }
    } catch (const fs::filesystem_error& e) {
        throw LocalIOError("Cannot read " + dir.string() + ": " + e.code().message());
    }
    return entries;
}

std::vector<size_t> find_matches(const std::vector<Entry>& entries, const std::string& query) {
    std::vector<size_t> matches;
    if (query.empty()) return matches;

    const std::string needle = to_lower(query);
    for (size_t i = 0; i < entries.size(); i++) {
        if (entries[i].is_parent()) continue;
        if (to_lower(entries[i].name).find(needle) != std::string::npos) {
            matches.push_back(i);
        }
    }
    return matches;
}

fs::path home_directory() {
    if (const char* home = std::getenv("HOME")) {
        return fs::path(home);
    }
    std::error_code ec;
    auto cwd = fs::current_path(ec);
    return ec ? fs::path("/") : cwd;
}

fs::path default_config_path() {
    return home_directory() / ".ftm_config.json";
}

fs::path default_log_path() {
    return home_directory() / ".ftm.log";
}

// Start in ~/Downloads when it exists
fs::path default_local_dir() {
    std::error_code ec;
    fs::path downloads = home_directory() / "Downloads";
    if (fs::is_directory(downloads, ec)) {
        return downloads;
    }
    return home_directory();
}

Config load_config(const fs::path& file) {
    Config config;
    config.config_file = file;
    config.local_start_dir = default_local_dir();
    config.log_file = default_log_path();

    std::ifstream in(file);
    if (!in.is_open()) {
        return config;
    }

    try {
        nlohmann::json json;
        in >> json;
        if (!json.is_object()) {
            spdlog::warn("Config {} is not a JSON object, using defaults", file.string());
            return config;
        }

        ServerSettings server;
        server.host = json.value("host", std::string(DEFAULT_HOST));
        server.port = json.value("port", DEFAULT_PORT);
        server.user = json.value("user", std::string(DEFAULT_USER));
        server.password = json.value("password", std::string(DEFAULT_PASSWORD));

        if (server.host.empty() || server.port <= 0 || server.port > 65535) {
            spdlog::warn("Config {} has an invalid server, using defaults", file.string());
            return config;
        }
        config.server = server;
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("Ignoring malformed config {}: {}", file.string(), e.what());
    }
    return config;
}

// Only host and port are owned here; other keys in the file are kept.
bool save_config(const Config& config) {
    nlohmann::json json = nlohmann::json::object();

    {
        std::ifstream in(config.config_file);
        if (in.is_open()) {
            try {
                nlohmann::json existing;
                in >> existing;
                if (existing.is_object()) {
                    json = std::move(existing);
                }
            } catch (const nlohmann::json::exception& e) {
                spdlog::debug("Overwriting unreadable config: {}", e.what());
            }
        }
    }

    json["host"] = config.server.host;
    json["port"] = config.server.port;

    std::ofstream out(config.config_file, std::ios::trunc);
    if (!out.is_open()) {
        spdlog::warn("Cannot write config {}", config.config_file.string());
        return false;
    }
    out << json.dump(2);
    return static_cast<bool>(out);
}

// Accepts scheme://host[:port][/...] or a bare host[:port]
bool apply_server_argument(const std::string& arg, ServerSettings& server) {
    std::string rest = arg;
    auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        rest = rest.substr(scheme_end + 3);
    }
    auto slash = rest.find('/');
    if (slash != std::string::npos) {
        rest = rest.substr(0, slash);
    }
    if (rest.empty()) {
        return false;
    }

    auto colon = rest.rfind(':');
    if (colon == std::string::npos) {
        server.host = rest;
        return true;
    }

    std::string host = rest.substr(0, colon);
    std::string port = rest.substr(colon + 1);
    if (host.empty()) {
        return false;
    }
    server.host = host;
    if (auto value = parse_port(port)) {
        server.port = *value;
    }
    return true;
}

// 1..65535, digits only
std::optional<int> parse_port(const std::string& text) {
    if (!all_digits(text) || text.size() > 5) {
        return std::nullopt;
    }
    int value = std::stoi(text);
    if (value <= 0 || value > 65535) {
        return std::nullopt;
    }
    return value;
}

void init_logging(const fs::path& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    try {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file.string(), false));
    } catch (const spdlog::spdlog_ex&) {
        sinks.push_back(std::make_shared<spdlog::sinks::null_sink_mt>());
    }

    auto logger = std::make_shared<spdlog::logger>("ftm", sinks.begin(), sinks.end());
    logger->set_pattern("%Y-%m-%d %H:%M:%S [%l] %v");
    logger->set_level(spdlog::level::info);
    logger->flush_on(spdlog::level::warn);
    spdlog::set_default_logger(logger);
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

std::string trim(const std::string& text) {
    const char* blanks = " \t\r\n";
    auto start = text.find_first_not_of(blanks);
    if (start == std::string::npos) return "";
    auto end = text.find_last_not_of(blanks);
    return text.substr(start, end - start + 1);
}

std::string format_size(double bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    int unit_index = 0;

    while (bytes >= 1024.0 && unit_index < 4) {
        bytes /= 1024.0;
        unit_index++;
    }

    std::ostringstream oss;
    oss << std::fixed << std::setprecision(1) << bytes << " " << units[unit_index];
    return oss.str();
}

std::string shorten_path(const std::string& path, size_t max_length) {
    if (path.length() <= max_length) {
        return path;
    }

    const std::string ellipsis = "...";
    if (max_length <= ellipsis.length()) {
        return path.substr(path.length() - max_length);
    }
    return ellipsis + path.substr(path.length() - (max_length - ellipsis.length()));
}
