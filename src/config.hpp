#pragma once

#include <chrono>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tailf {

class ConfigError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

constexpr std::uint64_t kDefaultMaxFileSize = 100ull * 1024 * 1024;

// Engine tunables. Every field has a default so an empty "engine" block is valid.
struct EngineSettings {
    std::size_t max_connections = 10;
    std::chrono::seconds idle_timeout{300};
    std::chrono::seconds max_session_age{3600};
    std::chrono::milliseconds acquire_timeout{10000};
    std::chrono::milliseconds reconnect_base{500};
    std::chrono::milliseconds reconnect_cap{30000};
    double reconnect_jitter = 0.2;
    int max_reconnect_attempts = 8;
    std::size_t queue_capacity = 4096;
    std::size_t backlog_lines = 200;
    std::size_t backlog_bytes = 10240;
    std::size_t max_line_length = 65536;
    std::chrono::milliseconds rescan_interval{5000};
    std::chrono::milliseconds poll_interval{250};
    std::chrono::milliseconds sweep_interval{30000};

    static EngineSettings from_json(const nlohmann::json& j);
    nlohmann::json to_json() const;
};

enum class AuthMethod { Key, Password };
enum class HostKeyPolicy { Strict, AcceptNew };

std::string auth_method_to_string(AuthMethod method);
std::string host_key_policy_to_string(HostKeyPolicy policy);

struct RemoteHost {
    std::string name;
    std::string host;
    std::uint16_t port = 22;
    std::string user;
    AuthMethod auth_method = AuthMethod::Key;
    std::string key_path;
    std::string password;                 // never logged or serialized
    std::vector<std::string> allowed_paths;
    std::uint64_t max_file_size = kDefaultMaxFileSize;
    HostKeyPolicy host_key_policy = HostKeyPolicy::Strict;
    std::string known_hosts_path;         // empty = libssh default

    // Pool identity: user@host:port
    std::string pool_key() const;

    // Credentials are omitted
    nlohmann::json to_json() const;
    static RemoteHost from_json(const nlohmann::json& j);
};

enum class EntryType { File, Directory };

struct RemoteLogConfig {
    std::string name;
    std::string path;
    EntryType type = EntryType::File;
    std::string pattern = "*.log";
    bool recursive = false;
    std::string encoding = "utf-8";
    bool strip_ansi = true;
    bool always_on = false;

    static RemoteLogConfig from_json(const nlohmann::json& j);
};

struct RemoteServerConfig {
    std::shared_ptr<const RemoteHost> host;
    std::vector<RemoteLogConfig> logs;
};

struct LocalFileConfig {
    std::string name;
    std::string path;
    std::string encoding = "utf-8";
    bool strip_ansi = true;
    bool always_on = false;

    static LocalFileConfig from_json(const nlohmann::json& j);
};

struct LocalDirectoryConfig {
    std::string name = "Scanned";
    std::string scan_dir;
    std::string pattern = "*.log";
    bool recursive = false;
    std::string encoding = "utf-8";
    bool strip_ansi = true;
    bool always_on = false;

    static LocalDirectoryConfig from_json(const nlohmann::json& j);
};

struct ServerSettings {
    std::string host = "0.0.0.0";
    std::uint16_t port = 8000;
    std::size_t max_viewers = 64;     // concurrent SSE streams
};

struct AppConfig {
    ServerSettings server;
    EngineSettings engine;
    std::vector<std::string> allowed_paths;   // whitelist for local sources
    std::vector<LocalFileConfig> log_files;
    std::vector<LocalDirectoryConfig> log_directories;
    std::vector<RemoteServerConfig> remote_servers;

    // Local whitelist: explicit allowedPaths, or the parent directories of
    // configured files plus the scan roots when none is given.
    std::vector<std::string> effective_local_allowed_paths() const;

    static AppConfig from_json(const nlohmann::json& j);

    // Throws ConfigError when the file cannot be read or parsed
    static AppConfig load(const std::string& path);
};

} // namespace tailf
