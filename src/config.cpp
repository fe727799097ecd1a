#include "config.hpp"
#include <algorithm>
#include <filesystem>
#include <fstream>
#include <initializer_list>
#include <set>

namespace tailf {

namespace {

// Keys are accepted in camelCase and in the snake_case of older configs
const nlohmann::json* find_key(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    for (const char* key : keys) {
        auto it = j.find(key);
        if (it != j.end() && !it->is_null()) return &*it;
    }
    return nullptr;
}

template<typename T>
T get_or(const nlohmann::json& j, std::initializer_list<const char*> keys, T fallback) {
    const nlohmann::json* value = find_key(j, keys);
    return value ? value->get<T>() : fallback;
}

std::vector<std::string> string_list(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    const nlohmann::json* value = find_key(j, keys);
    if (!value) return {};
    if (!value->is_array()) {
        throw ConfigError(std::string(*keys.begin()) + " must be a list");
    }
    return value->get<std::vector<std::string>>();
}

const nlohmann::json& array_or_empty(const nlohmann::json& j, std::initializer_list<const char*> keys) {
    static const nlohmann::json empty = nlohmann::json::array();
    const nlohmann::json* value = find_key(j, keys);
    if (!value) return empty;
    if (!value->is_array()) {
        throw ConfigError(std::string(*keys.begin()) + " must be a list");
    }
    return *value;
}

std::string require_string(const nlohmann::json& j, std::initializer_list<const char*> keys,
                           const std::string& context) {
    std::string value = get_or<std::string>(j, keys, "");
    if (value.empty()) {
        throw ConfigError(context + ": missing '" + *keys.begin() + "'");
    }
    return value;
}

} // namespace

std::string auth_method_to_string(AuthMethod method) {
    return method == AuthMethod::Password ? "password" : "key";
}

std::string host_key_policy_to_string(HostKeyPolicy policy) {
    return policy == HostKeyPolicy::AcceptNew ? "accept-new" : "strict";
}

EngineSettings EngineSettings::from_json(const nlohmann::json& j) {
    EngineSettings s;
    if (!j.is_object()) return s;

    using std::chrono::milliseconds;
    using std::chrono::seconds;

    s.max_connections = get_or<std::size_t>(j, {"maxConnections", "max_connections"}, s.max_connections);
    s.idle_timeout = seconds(get_or<long>(j, {"idleTimeoutSec", "idle_timeout"}, s.idle_timeout.count()));
    s.max_session_age = seconds(get_or<long>(j, {"maxSessionAgeSec", "max_session_age"}, s.max_session_age.count()));
    s.acquire_timeout = milliseconds(get_or<long>(j, {"acquireTimeoutMs", "acquire_timeout_ms"}, s.acquire_timeout.count()));
    s.reconnect_base = milliseconds(get_or<long>(j, {"reconnectBaseMs", "reconnect_base_ms"}, s.reconnect_base.count()));
    s.reconnect_cap = milliseconds(get_or<long>(j, {"reconnectCapMs", "reconnect_cap_ms"}, s.reconnect_cap.count()));
    s.reconnect_jitter = get_or<double>(j, {"reconnectJitter", "reconnect_jitter"}, s.reconnect_jitter);
    s.max_reconnect_attempts = get_or<int>(j, {"maxReconnectAttempts", "max_reconnect_attempts"}, s.max_reconnect_attempts);
    s.queue_capacity = get_or<std::size_t>(j, {"queueCapacity", "queue_capacity"}, s.queue_capacity);
    s.backlog_lines = get_or<std::size_t>(j, {"backlogLines", "backlog_lines"}, s.backlog_lines);
    s.backlog_bytes = get_or<std::size_t>(j, {"backlogBytes", "backlog_bytes"}, s.backlog_bytes);
    s.max_line_length = get_or<std::size_t>(j, {"maxLineLength", "max_line_length"}, s.max_line_length);
    s.rescan_interval = milliseconds(get_or<long>(j, {"rescanIntervalMs", "rescan_interval_ms"}, s.rescan_interval.count()));
    s.poll_interval = milliseconds(get_or<long>(j, {"pollIntervalMs", "poll_interval_ms"}, s.poll_interval.count()));
    s.sweep_interval = milliseconds(get_or<long>(j, {"sweepIntervalMs", "sweep_interval_ms"}, s.sweep_interval.count()));

    if (s.max_connections == 0) throw ConfigError("engine.maxConnections must be at least 1");
    if (s.queue_capacity < 2) throw ConfigError("engine.queueCapacity must be at least 2");
    if (s.max_line_length == 0) throw ConfigError("engine.maxLineLength must be positive");
    if (s.reconnect_jitter < 0.0 || s.reconnect_jitter > 1.0) {
        throw ConfigError("engine.reconnectJitter must be within [0, 1]");
    }
    if (s.max_reconnect_attempts < 0) throw ConfigError("engine.maxReconnectAttempts must not be negative");
    return s;
}

nlohmann::json EngineSettings::to_json() const {
    return {
        {"maxConnections", max_connections},
        {"idleTimeoutSec", idle_timeout.count()},
        {"maxSessionAgeSec", max_session_age.count()},
        {"acquireTimeoutMs", acquire_timeout.count()},
        {"reconnectBaseMs", reconnect_base.count()},
        {"reconnectCapMs", reconnect_cap.count()},
        {"reconnectJitter", reconnect_jitter},
        {"maxReconnectAttempts", max_reconnect_attempts},
        {"queueCapacity", queue_capacity},
        {"backlogLines", backlog_lines},
        {"backlogBytes", backlog_bytes},
        {"maxLineLength", max_line_length},
        {"rescanIntervalMs", rescan_interval.count()},
        {"pollIntervalMs", poll_interval.count()},
        {"sweepIntervalMs", sweep_interval.count()}
    };
}

std::string RemoteHost::pool_key() const {
    return user + "@" + host + ":" + std::to_string(port);
}

nlohmann::json RemoteHost::to_json() const {
    return {
        {"name", name},
        {"host", host},
        {"port", port},
        {"user", user},
        {"authMethod", auth_method_to_string(auth_method)},
        {"allowedPaths", allowed_paths},
        {"maxFileSize", max_file_size},
        {"hostKeyPolicy", host_key_policy_to_string(host_key_policy)}
    };
}

RemoteHost RemoteHost::from_json(const nlohmann::json& j) {
    RemoteHost h;
    h.host = require_string(j, {"host"}, "remote server");
    h.name = get_or<std::string>(j, {"name"}, h.host);
    std::string context = "remote server '" + h.name + "'";

    h.port = get_or<std::uint16_t>(j, {"port"}, h.port);
    h.user = require_string(j, {"user", "username"}, context);

    std::string auth = get_or<std::string>(j, {"authMethod", "auth_method"}, "key");
    if (auth == "key") {
        h.auth_method = AuthMethod::Key;
        h.key_path = require_string(j, {"keyPath", "key_path"}, context);
    } else if (auth == "password") {
        h.auth_method = AuthMethod::Password;
        h.password = require_string(j, {"password"}, context);
    } else {
        throw ConfigError(context + ": unsupported authMethod '" + auth + "'");
    }

    h.allowed_paths = string_list(j, {"allowedPaths", "allowed_paths"});
    if (h.allowed_paths.empty()) {
        throw ConfigError(context + ": allowedPaths is required and must not be empty");
    }
    for (const auto& prefix : h.allowed_paths) {
        if (prefix.empty() || prefix.front() != '/') {
            throw ConfigError(context + ": allowedPaths entries must be absolute: '" + prefix + "'");
        }
    }

    h.max_file_size = get_or<std::uint64_t>(j, {"maxFileSize", "max_file_size"}, h.max_file_size);

    std::string policy = get_or<std::string>(j, {"hostKeyPolicy", "host_key_policy"}, "strict");
    if (policy == "strict") {
        h.host_key_policy = HostKeyPolicy::Strict;
    } else if (policy == "accept-new") {
        h.host_key_policy = HostKeyPolicy::AcceptNew;
    } else {
        throw ConfigError(context + ": unknown hostKeyPolicy '" + policy + "'");
    }
    h.known_hosts_path = get_or<std::string>(j, {"knownHostsPath", "known_hosts_path"}, "");
    return h;
}

RemoteLogConfig RemoteLogConfig::from_json(const nlohmann::json& j) {
    RemoteLogConfig c;
    c.path = require_string(j, {"path"}, "remote log");
    c.name = get_or<std::string>(j, {"name"}, std::filesystem::path(c.path).filename().string());

    std::string type = get_or<std::string>(j, {"type"}, "file");
    if (type == "file") {
        c.type = EntryType::File;
    } else if (type == "directory") {
        c.type = EntryType::Directory;
    } else {
        throw ConfigError("remote log '" + c.name + "': unknown type '" + type + "'");
    }

    c.pattern = get_or<std::string>(j, {"pattern"}, c.pattern);
    c.recursive = get_or<bool>(j, {"recursive"}, c.recursive);
    c.encoding = get_or<std::string>(j, {"encoding"}, c.encoding);
    c.strip_ansi = get_or<bool>(j, {"stripAnsi", "strip_ansi"}, c.strip_ansi);
    c.always_on = get_or<bool>(j, {"alwaysOn", "always_on"}, c.always_on);
    return c;
}

LocalFileConfig LocalFileConfig::from_json(const nlohmann::json& j) {
    LocalFileConfig c;
    c.path = require_string(j, {"path"}, "log file");
    c.name = get_or<std::string>(j, {"name"}, std::filesystem::path(c.path).filename().string());
    c.encoding = get_or<std::string>(j, {"encoding"}, c.encoding);
    c.strip_ansi = get_or<bool>(j, {"stripAnsi", "strip_ansi"}, c.strip_ansi);
    c.always_on = get_or<bool>(j, {"alwaysOn", "always_on"}, c.always_on);
    return c;
}

LocalDirectoryConfig LocalDirectoryConfig::from_json(const nlohmann::json& j) {
    LocalDirectoryConfig c;
    c.scan_dir = require_string(j, {"scanDir", "scan_dir", "path"}, "log directory");
    c.name = get_or<std::string>(j, {"name"}, c.name);
    c.pattern = get_or<std::string>(j, {"pattern"}, c.pattern);
    c.recursive = get_or<bool>(j, {"recursive"}, c.recursive);
    c.encoding = get_or<std::string>(j, {"encoding"}, c.encoding);
    c.strip_ansi = get_or<bool>(j, {"stripAnsi", "strip_ansi"}, c.strip_ansi);
    c.always_on = get_or<bool>(j, {"alwaysOn", "always_on"}, c.always_on);
    return c;
}

std::vector<std::string> AppConfig::effective_local_allowed_paths() const {
    if (!allowed_paths.empty()) return allowed_paths;

    std::set<std::string> derived;
    for (const auto& file : log_files) {
        auto parent = std::filesystem::path(file.path).parent_path();
        if (!parent.empty()) derived.insert(parent.string());
    }
    for (const auto& dir : log_directories) {
        derived.insert(dir.scan_dir);
    }
    return {derived.begin(), derived.end()};
}

AppConfig AppConfig::from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        throw ConfigError("configuration root must be an object");
    }

    AppConfig config;
    try {
        if (const auto* server = find_key(j, {"server"})) {
            config.server.host = get_or<std::string>(*server, {"host"}, config.server.host);
            config.server.port = get_or<std::uint16_t>(*server, {"port"}, config.server.port);
            config.server.max_viewers = get_or<std::size_t>(*server, {"maxViewers", "max_viewers"},
                                                            config.server.max_viewers);
            if (config.server.max_viewers == 0) {
                throw ConfigError("server.maxViewers must be at least 1");
            }
        }
        if (const auto* engine = find_key(j, {"engine"})) {
            config.engine = EngineSettings::from_json(*engine);
        }

        config.allowed_paths = string_list(j, {"allowedPaths", "allowed_paths"});

        for (const auto& item : array_or_empty(j, {"log_files", "logFiles"})) {
            config.log_files.push_back(LocalFileConfig::from_json(item));
        }
        for (const auto& item : array_or_empty(j, {"log_directories", "logDirectories"})) {
            config.log_directories.push_back(LocalDirectoryConfig::from_json(item));
        }
        for (const auto& item : array_or_empty(j, {"remote_servers", "remoteServers"})) {
            RemoteServerConfig server;
            server.host = std::make_shared<const RemoteHost>(RemoteHost::from_json(item));
            for (const auto& log : array_or_empty(item, {"logs"})) {
                server.logs.push_back(RemoteLogConfig::from_json(log));
            }
            config.remote_servers.push_back(std::move(server));
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(std::string("invalid configuration value: ") + e.what());
    }
    return config;
}

AppConfig AppConfig::load(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw ConfigError("cannot open configuration file: " + path);
    }

    nlohmann::json j;
    try {
        file >> j;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("cannot parse " + path + ": " + e.what());
    }
    return from_json(j);
}

} // namespace tailf
