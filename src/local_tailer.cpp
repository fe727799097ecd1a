#include "local_tailer.hpp"
#include "server_log.hpp"
#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <stdexcept>
#include <fcntl.h>
#include <poll.h>
#include <sys/inotify.h>
#include <sys/stat.h>
#include <unistd.h>

namespace tailf {

namespace {

constexpr std::size_t kReadChunk = 64 * 1024;
constexpr std::size_t kHeadBytes = 64;

constexpr std::uint32_t kWatchMask =
    IN_MODIFY | IN_CREATE | IN_MOVED_TO | IN_DELETE | IN_MOVED_FROM | IN_CLOSE_WRITE | IN_ATTRIB;

std::string errno_text() {
    return std::strerror(errno);
}

} // namespace

void UniqueFd::reset(int fd) {
    if (fd_ >= 0) {
        ::close(fd_);
    }
    fd_ = fd;
}

LocalFileTailer::LocalFileTailer(std::shared_ptr<Source> source, StreamHub& hub,
                                 TailerSettings settings)
    : Tailer(std::move(source), hub, settings)
{
}

LocalFileTailer::~LocalFileTailer() {
    stop();
}

void LocalFileTailer::setup_watch() {
    inotify_.reset(::inotify_init1(IN_NONBLOCK | IN_CLOEXEC));
    if (!inotify_) {
        ServerLog::warn("Tailer", source_->id + ": inotify unavailable (" + errno_text() +
                        "), polling instead");
        return;
    }

    std::string dir = std::filesystem::path(source_->path).parent_path().string();
    if (::inotify_add_watch(inotify_.get(), dir.c_str(), kWatchMask) < 0) {
        ServerLog::warn("Tailer", source_->id + ": cannot watch " + dir + " (" + errno_text() +
                        "), polling instead");
        inotify_.reset();
    }
}

void LocalFileTailer::run() {
    setup_watch();
    file_.reset();
    warned_missing_ = false;

    while (!stopping()) {
        if (!file_) {
            open_initial();
        }

        if (file_) {
            set_state(TailerState::Streaming);
            check_truncation();
            read_available();
            check_rotation();
        }

        wait_for_change();
    }

    file_.reset();
    inotify_.reset();
}

// Positions a fresh open near the end so only the recent tail is replayed,
// or resumes where a previous run stopped when that is still close by.
void LocalFileTailer::open_initial() {
    UniqueFd fd(::open(source_->path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!fd) {
        if (errno == ENOENT) {
            if (!warned_missing_) {
                ServerLog::warn("Tailer", source_->id + ": waiting for " + source_->path);
                warned_missing_ = true;
            }
            set_state(TailerState::Rotated);
            return;
        }
        throw std::runtime_error("cannot open " + source_->path + ": " + errno_text());
    }

    struct stat st{};
    if (::fstat(fd.get(), &st) != 0) {
        throw std::runtime_error("cannot stat " + source_->path + ": " + errno_text());
    }

    auto& cursor = source_->cursor;
    const std::uint64_t size = static_cast<std::uint64_t>(st.st_size);
    const std::uint64_t previous = cursor.offset;

    bool same_file = cursor.inode == static_cast<std::uint64_t>(st.st_ino) &&
                     cursor.device == static_cast<std::uint64_t>(st.st_dev);
    bool resume = same_file && previous <= size && size - previous <= settings_.backlog_bytes &&
                  !head_changed(fd.get());

    std::uint64_t start = 0;
    if (resume) {
        start = previous;
    } else {
        head_.clear();
        if (cursor.inode != 0) {
            // Discontinuity with what subscribers already saw
            hub_.clear_backlog(source_->id);
        }
        start = size > settings_.backlog_bytes ? size - settings_.backlog_bytes : 0;
        if (start > 0) {
            char before = 0;
            if (::pread(fd.get(), &before, 1, static_cast<off_t>(start - 1)) != 1 || before != '\n') {
                skip_to_next_line();
            }
        }
    }

    if (::lseek(fd.get(), static_cast<off_t>(start), SEEK_SET) < 0) {
        throw std::runtime_error("cannot seek " + source_->path + ": " + errno_text());
    }

    cursor.inode = static_cast<std::uint64_t>(st.st_ino);
    cursor.device = static_cast<std::uint64_t>(st.st_dev);
    cursor.offset = start;
    file_ = std::move(fd);
    warned_missing_ = false;
    remember_head(file_.get());
}

void LocalFileTailer::read_available() {
    char buffer[kReadChunk];
    while (!stopping()) {
        ssize_t n = ::read(file_.get(), buffer, sizeof(buffer));
        if (n > 0) {
            if (stopping()) return;
            emit_bytes(buffer, static_cast<std::size_t>(n));
            source_->cursor.offset += static_cast<std::uint64_t>(n);
        } else if (n == 0) {
            remember_head(file_.get());
            return;
        } else if (errno != EINTR) {
            throw std::runtime_error("read failed on " + source_->path + ": " + errno_text());
        }
    }
}

// Copytruncate leaves the file smaller than what was read. A file truncated
// and rewritten past the old offset between two checks is caught by its
// head; one rewritten with the same first bytes is not.
void LocalFileTailer::check_truncation() {
    struct stat st{};
    if (::fstat(file_.get(), &st) != 0) return;

    bool shrunk = static_cast<std::uint64_t>(st.st_size) < source_->cursor.offset;
    if (!shrunk && !head_changed(file_.get())) return;

    ServerLog::log("Tailer", source_->id + (shrunk ? ": file truncated" : ": file rewritten in place") +
                   ", reading from start");
    discard_partial();
    if (::lseek(file_.get(), 0, SEEK_SET) < 0) {
        throw std::runtime_error("cannot seek " + source_->path + ": " + errno_text());
    }
    source_->cursor.offset = 0;
    head_.clear();
    emit_marker("file truncated");
}

bool LocalFileTailer::head_changed(int fd) const {
    if (head_.empty()) return false;
    std::string current(head_.size(), '\0');
    ssize_t n = ::pread(fd, &current[0], current.size(), 0);
    return n != static_cast<ssize_t>(current.size()) || current != head_;
}

void LocalFileTailer::remember_head(int fd) {
    std::size_t want = static_cast<std::size_t>(
        std::min<std::uint64_t>(kHeadBytes, source_->cursor.offset));
    if (want <= head_.size()) return;

    std::string head(want, '\0');
    ssize_t n = ::pread(fd, &head[0], want, 0);
    if (n > static_cast<ssize_t>(head_.size())) {
        head.resize(static_cast<std::size_t>(n));
        head_ = std::move(head);
    }
}

// The open descriptor keeps following a renamed file until a new file
// shows up under the same path.
void LocalFileTailer::check_rotation() {
    struct stat st{};
    if (::stat(source_->path.c_str(), &st) != 0) {
        if (errno == ENOENT) {
            set_state(TailerState::Rotated);
        }
        return;
    }

    if (static_cast<std::uint64_t>(st.st_ino) == source_->cursor.inode &&
        static_cast<std::uint64_t>(st.st_dev) == source_->cursor.device) {
        return;
    }

    read_available();
    flush_partial();

    UniqueFd next(::open(source_->path.c_str(), O_RDONLY | O_CLOEXEC));
    if (!next) {
        // Created but not yet readable; try again on the next change
        return;
    }

    ServerLog::log("Tailer", source_->id + ": file rotated, reading new file from start");
    source_->cursor.inode = static_cast<std::uint64_t>(st.st_ino);
    source_->cursor.device = static_cast<std::uint64_t>(st.st_dev);
    source_->cursor.offset = 0;
    file_ = std::move(next);
    head_.clear();
    emit_marker("file rotated");
    read_available();
}

void LocalFileTailer::wait_for_change() {
    if (!inotify_) {
        wait_for(settings_.poll_interval);
        return;
    }

    struct pollfd pfd{};
    pfd.fd = inotify_.get();
    pfd.events = POLLIN;

    int ready = ::poll(&pfd, 1, static_cast<int>(settings_.poll_interval.count()));
    if (ready > 0 && (pfd.revents & POLLIN)) {
        // Which file changed does not matter; the caller re-checks its own
        alignas(struct inotify_event) char events[4096];
        while (::read(inotify_.get(), events, sizeof(events)) > 0) {
        }
    }
}

} // namespace tailf
