#include "source_registry.hpp"
#include "local_tailer.hpp"
#include "remote_tailer.hpp"
#include "server_log.hpp"
#include <algorithm>
#include <filesystem>

namespace tailf {

namespace {

std::string relative_id(const std::string& root, const std::string& path) {
    return std::filesystem::path(path).lexically_relative(root).generic_string();
}

} // namespace

SourceRegistry::SourceRegistry(StreamHub& hub, SessionPool& pool, TailerSettings settings)
    : hub_(hub)
    , pool_(pool)
    , settings_(settings)
{
}

SourceRegistry::~SourceRegistry() {
    stop();
}

void SourceRegistry::reject_locked(const std::string& id, const std::string& path,
                                   const GuardResult& result) {
    if (rejected_.count(id) == 0) {
        ServerLog::warn("Registry", "Rejected source " + id + " (" + path + "): " +
                        reject_reason_name(result.reason) + ": " + result.detail);
    }

    RejectedSource entry;
    entry.id = id;
    entry.path = path;
    entry.reason = result.reason;
    entry.detail = result.detail;
    rejected_[id] = entry;
}

void SourceRegistry::register_locked(const std::shared_ptr<Source>& source) {
    if (entries_.count(source->id) > 0) {
        throw ConfigError("duplicate source id: " + source->id);
    }
    Entry entry;
    entry.source = source;
    entries_[source->id] = std::move(entry);
    rejected_.erase(source->id);
}

std::shared_ptr<Source> SourceRegistry::add_local_file(const LocalFileConfig& config,
                                                       const std::vector<std::string>& allowed_paths) {
    std::string id = config.name.empty()
        ? std::filesystem::path(config.path).filename().string()
        : config.name;

    std::lock_guard<std::mutex> lock(mutex_);

    auto result = AccessGuard::validate_path(config.path, allowed_paths, PathStyle::Local);
    if (!result) {
        reject_locked(id, config.path, result);
        throw GuardError(result);
    }

    auto source = std::make_shared<Source>();
    source->id = id;
    source->name = id;
    source->kind = SourceKind::LocalFile;
    source->path = AccessGuard::normalize(config.path, PathStyle::Local);
    source->encoding = config.encoding;
    source->strip_ansi = config.strip_ansi;
    source->always_on = config.always_on;

    register_locked(source);
    return source;
}

std::shared_ptr<Source> SourceRegistry::add_remote_file(const std::string& server,
                                                        const RemoteLogConfig& config,
                                                        std::shared_ptr<const RemoteHost> host) {
    std::string id = server + "/" + config.name;

    std::lock_guard<std::mutex> lock(mutex_);

    auto result = AccessGuard::validate_path(config.path, host->allowed_paths, PathStyle::Remote);
    if (!result) {
        reject_locked(id, config.path, result);
        throw GuardError(result);
    }

    auto source = std::make_shared<Source>();
    source->id = id;
    source->name = config.name;
    source->kind = SourceKind::RemoteFile;
    source->path = AccessGuard::normalize(config.path, PathStyle::Remote);
    source->host = std::move(host);
    source->encoding = config.encoding;
    source->strip_ansi = config.strip_ansi;
    source->always_on = config.always_on;

    register_locked(source);
    return source;
}

void SourceRegistry::add_directory(DirectorySource directory) {
    PathStyle style = directory.is_remote() ? PathStyle::Remote : PathStyle::Local;
    if (directory.is_remote()) {
        directory.allowed_paths = directory.host->allowed_paths;
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto result = AccessGuard::validate_path(directory.root, directory.allowed_paths, style);
    if (!result) {
        reject_locked(directory.id, directory.root, result);
        throw GuardError(result);
    }
    if (directories_.count(directory.id) > 0) {
        throw ConfigError("duplicate directory id: " + directory.id);
    }

    directory.root = AccessGuard::normalize(directory.root, style);
    ServerLog::log("Registry", "Watching directory " + directory.id + " (" + directory.root +
                   ", pattern " + directory.pattern + ")");
    directories_[directory.id] = std::move(directory);
}

void SourceRegistry::load(const AppConfig& config) {
    const auto local_allowed = config.effective_local_allowed_paths();

    for (const auto& file : config.log_files) {
        try {
            add_local_file(file, local_allowed);
        } catch (const GuardError&) {
            // Recorded and logged by add_local_file
        }
    }

    for (const auto& dir : config.log_directories) {
        DirectorySource directory;
        directory.id = dir.name;
        directory.root = dir.scan_dir;
        directory.pattern = dir.pattern;
        directory.recursive = dir.recursive;
        directory.encoding = dir.encoding;
        directory.strip_ansi = dir.strip_ansi;
        directory.always_on = dir.always_on;
        directory.allowed_paths = local_allowed;
        try {
            add_directory(std::move(directory));
        } catch (const GuardError&) {
            // Recorded and logged by add_directory
        }
    }

    for (const auto& server : config.remote_servers) {
        for (const auto& log : server.logs) {
            try {
                if (log.type == EntryType::Directory) {
                    DirectorySource directory;
                    directory.id = server.host->name + "/" + log.name;
                    directory.root = log.path;
                    directory.pattern = log.pattern;
                    directory.recursive = log.recursive;
                    directory.encoding = log.encoding;
                    directory.strip_ansi = log.strip_ansi;
                    directory.always_on = log.always_on;
                    directory.host = server.host;
                    add_directory(std::move(directory));
                } else {
                    add_remote_file(server.host->name, log, server.host);
                }
            } catch (const GuardError&) {
                // Recorded and logged by the add call
            }
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    ServerLog::log("Registry", "Loaded " + std::to_string(entries_.size()) + " source(s), " +
                   std::to_string(directories_.size()) + " directory source(s), " +
                   std::to_string(rejected_.size()) + " rejected");
}

std::shared_ptr<Tailer> SourceRegistry::make_tailer(const std::shared_ptr<Source>& source) {
    if (source->is_remote()) {
        return std::make_shared<RemoteFileTailer>(source, hub_, pool_, settings_);
    }
    return std::make_shared<LocalFileTailer>(source, hub_, settings_);
}

// Never waits for a previous run. A tailer still winding down (in a connect
// or a pool wait) is set aside and a fresh one takes over the source.
void SourceRegistry::ensure_running_locked(Entry& entry) {
    reap_retiring_locked();

    if (entry.tailer && entry.tailer->is_running()) return;
    if (entry.tailer && !entry.tailer->finished()) {
        ServerLog::debug("Registry", entry.source->id + ": previous tailer still stopping");
        retiring_.push_back(std::move(entry.tailer));
    }
    if (!entry.tailer) {
        entry.tailer = make_tailer(entry.source);
    }
    entry.tailer->start();
    ++entry.starts;
}

// Finished workers join at once, so dropping them here is safe under the lock
void SourceRegistry::reap_retiring_locked() {
    retiring_.erase(std::remove_if(retiring_.begin(), retiring_.end(),
                                   [](const std::shared_ptr<Tailer>& t) { return t->finished(); }),
                    retiring_.end());
}

std::shared_ptr<Subscriber> SourceRegistry::subscribe(const std::string& source_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = entries_.find(source_id);
    if (it == entries_.end()) {
        auto rejected = rejected_.find(source_id);
        if (rejected != rejected_.end()) {
            throw GuardError(GuardResult::reject(rejected->second.reason, rejected->second.detail));
        }
        throw SourceNotFound("unknown source: " + source_id);
    }

    auto subscriber = hub_.subscribe(source_id);
    it->second.subscribers.insert(subscriber->id());
    ensure_running_locked(it->second);
    return subscriber;
}

void SourceRegistry::unsubscribe(const std::shared_ptr<Subscriber>& subscriber) {
    hub_.unsubscribe(subscriber->id());

    std::shared_ptr<Tailer> idle;
    std::uint64_t generation = 0;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = entries_.find(subscriber->source_id());
        if (it == entries_.end()) return;

        Entry& entry = it->second;
        entry.subscribers.erase(subscriber->id());
        if (entry.subscribers.empty() && !entry.source->always_on &&
            entry.tailer && entry.tailer->is_running()) {
            idle = entry.tailer;
            generation = idle->request_stop();
        }
    }

    if (idle) {
        idle->join(generation);
        ServerLog::debug("Registry", "No subscribers left for " + subscriber->source_id());
    }
}

ReconcileResult SourceRegistry::reconcile_directory(const std::string& directory_id,
                                                    const std::vector<std::string>& paths) {
    ReconcileResult result;
    std::vector<std::shared_ptr<Tailer>> retired;

    {
        std::lock_guard<std::mutex> lock(mutex_);

        auto dir_it = directories_.find(directory_id);
        if (dir_it == directories_.end()) {
            throw SourceNotFound("unknown directory: " + directory_id);
        }
        const DirectorySource& dir = dir_it->second;
        const PathStyle style = dir.is_remote() ? PathStyle::Remote : PathStyle::Local;

        std::set<std::string> present;
        for (const auto& path : paths) {
            std::string normalized = AccessGuard::normalize(path, style);
            present.insert(normalized);

            std::string id = directory_id + "/" + relative_id(dir.root, normalized);
            if (entries_.count(id) > 0) continue;

            auto check = AccessGuard::validate_path(path, dir.allowed_paths, style);
            if (!check) {
                reject_locked(id, path, check);
                continue;
            }

            auto source = std::make_shared<Source>();
            source->id = id;
            source->name = std::filesystem::path(normalized).filename().string();
            source->kind = dir.is_remote() ? SourceKind::RemoteFile : SourceKind::LocalFile;
            source->path = normalized;
            source->host = dir.host;
            source->encoding = dir.encoding;
            source->strip_ansi = dir.strip_ansi;
            source->always_on = dir.always_on;
            source->origin = directory_id;

            register_locked(source);
            if (source->always_on) {
                ensure_running_locked(entries_[id]);
            }
            result.added.push_back(id);
        }

        for (auto it = entries_.begin(); it != entries_.end();) {
            const auto& source = it->second.source;
            if (source->origin == directory_id && present.count(source->path) == 0) {
                result.removed.push_back(it->first);
                if (it->second.tailer) {
                    it->second.tailer->request_stop();
                    retired.push_back(it->second.tailer);
                }
                it = entries_.erase(it);
            } else {
                ++it;
            }
        }
    }

    for (auto& tailer : retired) {
        tailer->stop();
    }

    for (const auto& id : result.removed) {
        ErrorEvent error;
        error.source_id = id;
        error.kind = ErrorKind::SourceUnavailable;
        error.message = "file no longer present in " + directory_id;
        hub_.publish_error(error);
        hub_.forget_source(id);
    }

    if (!result.added.empty() || !result.removed.empty()) {
        ServerLog::log("Registry", directory_id + ": " + std::to_string(result.added.size()) +
                       " new, " + std::to_string(result.removed.size()) + " removed");
    }
    return result;
}

std::vector<SourceInfo> SourceRegistry::list_sources() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<SourceInfo> result;
    for (const auto& [id, entry] : entries_) {
        const auto& source = *entry.source;
        SourceInfo info;
        info.id = id;
        info.name = source.name;
        info.kind = source_kind_to_string(source.kind);
        info.path = source.path;
        info.host = source.host ? source.host->name : "";
        info.origin = source.origin;
        info.state = entry.tailer ? tailer_state_name(entry.tailer->state()) : "idle";
        info.running = entry.tailer && entry.tailer->is_running();
        info.always_on = source.always_on;
        info.subscribers = entry.subscribers.size();
        info.seq = source.cursor.seq;
        info.offset = source.cursor.offset;
        info.starts = entry.starts;
        result.push_back(info);
    }
    return result;
}

std::vector<RejectedSource> SourceRegistry::rejected() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<RejectedSource> result;
    for (const auto& [id, entry] : rejected_) {
        result.push_back(entry);
    }
    return result;
}

std::vector<DirectorySource> SourceRegistry::directories() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<DirectorySource> result;
    for (const auto& [id, dir] : directories_) {
        result.push_back(dir);
    }
    return result;
}

std::shared_ptr<Source> SourceRegistry::find(const std::string& source_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = entries_.find(source_id);
    return it == entries_.end() ? nullptr : it->second.source;
}

void SourceRegistry::clear_source(const std::string& source_id) {
    std::shared_ptr<Source> source = find(source_id);
    if (!source) {
        throw SourceNotFound("unknown source: " + source_id);
    }
    if (source->is_remote()) {
        throw GuardError(GuardResult::reject(RejectReason::CommandVerbNotAllowed,
                                             "truncate is not an allowed remote command"));
    }

    std::filesystem::resize_file(source->path, 0);
    hub_.clear_backlog(source_id);
    ServerLog::log("Registry", "Cleared " + source_id + " (" + source->path + ")");
}

void SourceRegistry::start() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [id, entry] : entries_) {
        if (entry.source->always_on) {
            ensure_running_locked(entry);
        }
    }
}

void SourceRegistry::stop() {
    std::vector<std::shared_ptr<Tailer>> tailers;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [id, entry] : entries_) {
            if (entry.tailer) {
                entry.tailer->request_stop();
                tailers.push_back(entry.tailer);
            }
        }
        tailers.insert(tailers.end(), retiring_.begin(), retiring_.end());
        retiring_.clear();
    }

    for (auto& tailer : tailers) {
        tailer->stop();
    }
}

} // namespace tailf
