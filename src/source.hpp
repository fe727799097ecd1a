#pragma once

#include "config.hpp"
#include <atomic>
#include <cstdint>
#include <memory>
#include <string>

namespace tailf {

enum class SourceKind { LocalFile, RemoteFile };

inline std::string source_kind_to_string(SourceKind kind) {
    return kind == SourceKind::RemoteFile ? "remote-file" : "local-file";
}

// Tailing position, kept across tailer restarts. Written only by the
// tailer currently owning the source.
struct SourceCursor {
    std::atomic<std::uint64_t> seq{0};
    std::atomic<std::uint64_t> offset{0};
    std::atomic<std::uint64_t> device{0};
    std::atomic<std::uint64_t> inode{0};
};

// A validated, concrete log location. Everything but the cursor is fixed
// at construction.
struct Source {
    std::string id;
    std::string name;
    SourceKind kind = SourceKind::LocalFile;
    std::string path;                              // normalized, guard-approved
    std::shared_ptr<const RemoteHost> host;        // remote kind only
    std::string encoding = "utf-8";
    bool strip_ansi = true;
    bool always_on = false;
    std::string origin;                            // producing directory id, if scanned

    SourceCursor cursor;

    bool is_remote() const { return kind == SourceKind::RemoteFile; }
};

} // namespace tailf
