#pragma once

#include "tailer.hpp"

namespace tailf {

// Owning POSIX file descriptor
class UniqueFd {
public:
    UniqueFd() = default;
    explicit UniqueFd(int fd) : fd_(fd) {}
    ~UniqueFd() { reset(); }

    UniqueFd(UniqueFd&& other) noexcept : fd_(other.release()) {}
    UniqueFd& operator=(UniqueFd&& other) noexcept {
        if (this != &other) reset(other.release());
        return *this;
    }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    int get() const { return fd_; }
    explicit operator bool() const { return fd_ >= 0; }

    int release() {
        int fd = fd_;
        fd_ = -1;
        return fd;
    }

    void reset(int fd = -1);

private:
    int fd_ = -1;
};

// Follows a file on the local filesystem. Change notification comes from
// inotify on the parent directory, with a poll-interval fallback, so a
// rename or delete of the file itself is seen as well as appends.
class LocalFileTailer : public Tailer {
public:
    LocalFileTailer(std::shared_ptr<Source> source, StreamHub& hub, TailerSettings settings);
    ~LocalFileTailer() override;

protected:
    void run() override;

private:
    void open_initial();
    void read_available();
    void check_truncation();
    void check_rotation();
    void wait_for_change();
    void setup_watch();

    bool head_changed(int fd) const;
    void remember_head(int fd);

    UniqueFd file_;
    UniqueFd inotify_;
    bool warned_missing_ = false;
    std::string head_;    // first bytes of the followed file, up to the read offset
};

} // namespace tailf
