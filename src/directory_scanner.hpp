#pragma once

#include "session_pool.hpp"
#include "source_registry.hpp"
#include <mutex>
#include <string>
#include <vector>

namespace tailf {

// Lists the files of each directory source and reconciles the registry
// with what it finds. A directory that cannot be listed keeps its current
// sources until a later scan succeeds.
class DirectoryScanner {
public:
    static constexpr std::size_t kMaxRemoteEntries = 1000;

    DirectoryScanner(SourceRegistry& registry, SessionPool& pool);

    // Scans every directory source; returns the number of sources added
    // plus removed.
    std::size_t scan_all();

    // Throws SourceNotFound for an unknown directory id
    ReconcileResult rescan_now(const std::string& directory_id);

    static std::vector<std::string> list_local(const DirectorySource& directory);
    std::vector<std::string> list_remote(const DirectorySource& directory);

    static std::string remote_find_command(const DirectorySource& directory);

private:
    ReconcileResult scan(const DirectorySource& directory);

    SourceRegistry& registry_;
    SessionPool& pool_;
    std::mutex scan_mutex_;
};

} // namespace tailf
