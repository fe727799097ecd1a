#pragma once

#include "access_guard.hpp"
#include "session_pool.hpp"
#include "source.hpp"
#include "stream_hub.hpp"
#include "tailer.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace tailf {

class SourceNotFound : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct SourceInfo {
    std::string id;
    std::string name;
    std::string kind;        // "local-file" / "remote-file"
    std::string path;
    std::string host;        // remote server name, empty for local
    std::string origin;      // directory id for scanned files
    std::string state;
    bool running = false;
    bool always_on = false;
    std::size_t subscribers = 0;
    std::uint64_t seq = 0;
    std::uint64_t offset = 0;    // bytes read so far
    std::uint64_t starts = 0;

    nlohmann::json to_json() const {
        return {
            {"id", id},
            {"name", name},
            {"kind", kind},
            {"path", path},
            {"host", host},
            {"origin", origin},
            {"state", state},
            {"running", running},
            {"alwaysOn", always_on},
            {"subscribers", subscribers},
            {"seq", seq},
            {"offset", offset},
            {"starts", starts}
        };
    }
};

struct RejectedSource {
    std::string id;
    std::string path;
    RejectReason reason = RejectReason::None;
    std::string detail;

    nlohmann::json to_json() const {
        return {
            {"id", id},
            {"path", path},
            {"reason", reject_reason_name(reason)},
            {"detail", detail}
        };
    }
};

// A directory whose matching files become sources of their own
struct DirectorySource {
    std::string id;
    std::string root;
    std::string pattern = "*.log";
    bool recursive = false;
    std::string encoding = "utf-8";
    bool strip_ansi = true;
    bool always_on = false;
    std::shared_ptr<const RemoteHost> host;       // null for local
    std::vector<std::string> allowed_paths;

    bool is_remote() const { return host != nullptr; }
};

struct ReconcileResult {
    std::vector<std::string> added;
    std::vector<std::string> removed;
};

// Process-wide table of sources and their tailers. Tailers start when the
// first subscriber arrives (or at start() for always-on sources) and stop
// when the last one leaves.
class SourceRegistry {
public:
    SourceRegistry(StreamHub& hub, SessionPool& pool, TailerSettings settings);
    ~SourceRegistry();

    SourceRegistry(const SourceRegistry&) = delete;
    SourceRegistry& operator=(const SourceRegistry&) = delete;

    // Each throws GuardError for a rejected path, after recording it
    std::shared_ptr<Source> add_local_file(const LocalFileConfig& config,
                                           const std::vector<std::string>& allowed_paths);
    std::shared_ptr<Source> add_remote_file(const std::string& server, const RemoteLogConfig& config,
                                            std::shared_ptr<const RemoteHost> host);
    void add_directory(DirectorySource directory);

    // Registers everything the configuration names; rejected entries are
    // logged and skipped.
    void load(const AppConfig& config);

    // Throws SourceNotFound, or GuardError for a source that was rejected
    std::shared_ptr<Subscriber> subscribe(const std::string& source_id);
    void unsubscribe(const std::shared_ptr<Subscriber>& subscriber);

    // Makes the directory's file sources match paths. Idempotent.
    ReconcileResult reconcile_directory(const std::string& directory_id,
                                        const std::vector<std::string>& paths);

    std::vector<SourceInfo> list_sources() const;
    std::vector<RejectedSource> rejected() const;
    std::vector<DirectorySource> directories() const;
    std::shared_ptr<Source> find(const std::string& source_id) const;

    // Truncates a local source's file to zero and drops its backlog
    void clear_source(const std::string& source_id);

    void start();
    void stop();

private:
    struct Entry {
        std::shared_ptr<Source> source;
        std::shared_ptr<Tailer> tailer;
        std::set<std::uint64_t> subscribers;
        std::uint64_t starts = 0;
    };

    std::shared_ptr<Tailer> make_tailer(const std::shared_ptr<Source>& source);
    void ensure_running_locked(Entry& entry);
    void reap_retiring_locked();
    void register_locked(const std::shared_ptr<Source>& source);
    void reject_locked(const std::string& id, const std::string& path, const GuardResult& result);

    StreamHub& hub_;
    SessionPool& pool_;
    TailerSettings settings_;

    mutable std::mutex mutex_;
    std::map<std::string, Entry> entries_;
    std::map<std::string, DirectorySource> directories_;
    std::map<std::string, RejectedSource> rejected_;

    // Replaced tailers whose worker has not returned yet; never joined
    // under mutex_
    std::vector<std::shared_ptr<Tailer>> retiring_;
};

} // namespace tailf
