#include "directory_scanner.hpp"
#include "access_guard.hpp"
#include "server_log.hpp"
#include <algorithm>
#include <filesystem>
#include <sstream>
#include <fnmatch.h>

namespace fs = std::filesystem;

namespace tailf {

namespace {

constexpr std::size_t kMaxFindOutput = 1024 * 1024;

bool matches(const fs::directory_entry& entry, const std::string& pattern) {
    std::error_code ec;
    if (!entry.is_regular_file(ec)) return false;
    const std::string name = entry.path().filename().string();
    return ::fnmatch(pattern.c_str(), name.c_str(), 0) == 0;
}

} // namespace

DirectoryScanner::DirectoryScanner(SourceRegistry& registry, SessionPool& pool)
    : registry_(registry)
    , pool_(pool)
{
}

std::vector<std::string> DirectoryScanner::list_local(const DirectorySource& directory) {
    std::vector<std::string> files;
    const auto options = fs::directory_options::skip_permission_denied;

    if (directory.recursive) {
        for (const auto& entry : fs::recursive_directory_iterator(directory.root, options)) {
            if (matches(entry, directory.pattern)) files.push_back(entry.path().string());
        }
    } else {
        for (const auto& entry : fs::directory_iterator(directory.root, options)) {
            if (matches(entry, directory.pattern)) files.push_back(entry.path().string());
        }
    }

    std::sort(files.begin(), files.end());
    return files;
}

std::string DirectoryScanner::remote_find_command(const DirectorySource& directory) {
    std::string command = "find " + AccessGuard::quote_argument(directory.root);
    if (!directory.recursive) {
        command += " -maxdepth 1";
    }
    command += " -type f -name " + AccessGuard::quote_argument(directory.pattern);
    return command;
}

std::vector<std::string> DirectoryScanner::list_remote(const DirectorySource& directory) {
    const std::string command = remote_find_command(directory);
    auto check = AccessGuard::validate_command(command);
    if (!check) {
        throw GuardError(check);
    }

    SessionLease lease = pool_.acquire(*directory.host);
    std::string output;
    try {
        output = lease->run(command, kMaxFindOutput);
    } catch (const RemoteError&) {
        lease.mark_broken();
        throw;
    }

    std::vector<std::string> files;
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (line.empty() || line.front() != '/') continue;
        if (files.size() == kMaxRemoteEntries) {
            ServerLog::warn("Scanner", directory.id + ": more than " +
                            std::to_string(kMaxRemoteEntries) + " files, ignoring the rest");
            break;
        }
        files.push_back(line);
    }

    std::sort(files.begin(), files.end());
    return files;
}

ReconcileResult DirectoryScanner::scan(const DirectorySource& directory) {
    std::vector<std::string> files = directory.is_remote()
        ? list_remote(directory)
        : list_local(directory);
    return registry_.reconcile_directory(directory.id, files);
}

std::size_t DirectoryScanner::scan_all() {
    std::lock_guard<std::mutex> lock(scan_mutex_);

    std::size_t changes = 0;
    for (const auto& directory : registry_.directories()) {
        try {
            auto result = scan(directory);
            changes += result.added.size() + result.removed.size();
        } catch (const std::exception& e) {
            ServerLog::warn("Scanner", "Cannot list " + directory.id + " (" + directory.root +
                            "): " + e.what());
        }
    }
    return changes;
}

ReconcileResult DirectoryScanner::rescan_now(const std::string& directory_id) {
    std::lock_guard<std::mutex> lock(scan_mutex_);

    for (const auto& directory : registry_.directories()) {
        if (directory.id == directory_id) {
            return scan(directory);
        }
    }
    throw SourceNotFound("unknown directory: " + directory_id);
}

} // namespace tailf
