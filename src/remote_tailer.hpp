#pragma once

#include "session_pool.hpp"
#include "tailer.hpp"
#include <optional>
#include <random>

namespace tailf {

// Follows a file on a remote host by running `tail -c +N -F` over a pooled
// session. The cursor offset counts the bytes read up to the last complete
// line, so a dropped stream is reopened with exponential backoff right
// where it left off: lines appended during the outage are read on resume.
class RemoteFileTailer : public Tailer {
public:
    RemoteFileTailer(std::shared_ptr<Source> source, StreamHub& hub, SessionPool& pool,
                     TailerSettings settings);
    ~RemoteFileTailer() override;

    // Command lines, exposed for tests. start is a zero-based byte offset.
    std::string follow_command(std::uint64_t start) const;
    std::string size_command() const;

protected:
    void run() override;

private:
    // One session: returns true if any data arrived before the stream ended
    bool stream_once(bool reconnect);
    bool pump(RemoteStream& stream, SessionLease& lease);

    // Size of the file, or nullopt while it does not exist
    std::optional<std::uint64_t> query_size(RemoteSession& session);
    std::uint64_t plan_start(RemoteSession& session, bool reconnect);
    std::uint64_t tail_start(std::uint64_t size);
    std::chrono::milliseconds backoff_delay(int attempt);

    SessionPool& pool_;
    std::mt19937 rng_;
    std::string last_failure_;
    std::uint64_t stream_pos_ = 0;     // file offset of the next byte the stream delivers
    bool mid_line_ = false;            // cursor offset may sit inside a line
};

} // namespace tailf
