#include "remote_tailer.hpp"
#include "access_guard.hpp"
#include "server_log.hpp"
#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstdlib>
#include <string_view>

namespace tailf {

namespace {

constexpr std::size_t kReadChunk = 32 * 1024;

// Validates before anything reaches the remote shell
std::string checked(const std::string& command) {
    auto result = AccessGuard::validate_command(command);
    if (!result) {
        throw GuardError(result);
    }
    return command;
}

} // namespace

RemoteFileTailer::RemoteFileTailer(std::shared_ptr<Source> source, StreamHub& hub,
                                   SessionPool& pool, TailerSettings settings)
    : Tailer(std::move(source), hub, settings)
    , pool_(pool)
    , rng_(std::random_device{}())
{
}

RemoteFileTailer::~RemoteFileTailer() {
    stop();
}

std::string RemoteFileTailer::follow_command(std::uint64_t start) const {
    return "tail -c +" + std::to_string(start + 1) + " -F " +
           AccessGuard::quote_argument(source_->path);
}

std::string RemoteFileTailer::size_command() const {
    return "find " + AccessGuard::quote_argument(source_->path) +
           " -maxdepth 0 -type f -printf '%s\\n'";
}

void RemoteFileTailer::run() {
    int failures = 0;
    bool reconnect = false;

    while (!stopping()) {
        set_state(failures > 0 ? TailerState::Reconnecting : TailerState::Starting);

        try {
            if (stream_once(reconnect)) {
                failures = 0;
            }
            last_failure_ = "stream closed by remote";
        } catch (const GuardError& e) {
            report_error(ErrorKind::SecurityViolation, e.what());
            return;
        } catch (const PoolError& e) {
            if (e.kind() == PoolErrorKind::Cancelled) break;
            last_failure_ = e.what();
            if (e.kind() == PoolErrorKind::PoolExhausted) {
                report_error(ErrorKind::PoolExhausted, e.what());
            } else {
                ServerLog::warn("Tailer", source_->id + ": " + e.what());
            }
        } catch (const RemoteError& e) {
            last_failure_ = e.what();
            ServerLog::warn("Tailer", source_->id + ": " + e.what());
        }

        if (stopping()) break;
        reconnect = true;

        ++failures;
        if (failures > settings_.max_reconnect_attempts) {
            report_error(ErrorKind::SourceUnavailable,
                         "giving up after " + std::to_string(failures - 1) +
                         " reconnect attempts: " + last_failure_);
            return;
        }

        set_state(TailerState::Reconnecting);
        auto delay = backoff_delay(failures);
        ServerLog::debug("Tailer", source_->id + ": reconnecting in " +
                         std::to_string(delay.count()) + "ms (attempt " +
                         std::to_string(failures) + ")");
        if (!wait_for(delay)) break;
    }
}

bool RemoteFileTailer::stream_once(bool reconnect) {
    SessionLease lease = pool_.acquire(*source_->host, [this]() { return stopping(); });
    if (stopping()) {
        // A replacement tailer may already own the cursor
        return false;
    }

    std::unique_ptr<RemoteStream> stream;
    try {
        std::uint64_t start = plan_start(*lease, reconnect);
        stream = lease->open_stream(checked(follow_command(start)));
        stream_pos_ = start;
        source_->cursor.offset = start;
    } catch (const RemoteError&) {
        lease.mark_broken();
        throw;
    }

    discard_partial();
    if (mid_line_) {
        skip_to_next_line();
    }

    set_state(TailerState::Streaming);
    bool received = pump(*stream, lease);
    stream->close();
    return received;
}

std::optional<std::uint64_t> RemoteFileTailer::query_size(RemoteSession& session) {
    std::string output = session.run(checked(size_command()), 64);
    if (output.find_first_of("0123456789") == std::string::npos) {
        return std::nullopt;
    }

    errno = 0;
    char* end = nullptr;
    std::uint64_t size = std::strtoull(output.c_str(), &end, 10);
    if (errno != 0 || end == output.c_str()) {
        throw RemoteError(source_->id + ": unexpected size output");
    }
    return size;
}

// Where the next stream starts. Within a run the stream picks up at the
// cursor; a fresh start does so only when the file moved on by no more than
// the backlog, as the local tailer does, and otherwise replays the tail.
std::uint64_t RemoteFileTailer::plan_start(RemoteSession& session, bool reconnect) {
    const std::uint64_t previous = source_->cursor.offset;
    const bool known = previous > 0;

    std::optional<std::uint64_t> size = query_size(session);
    if (!size) {
        // tail -F waits for the file; whatever shows up is new
        if (known) {
            emit_marker("file rotated");
        }
        mid_line_ = false;
        return 0;
    }

    if (known && *size < previous) {
        ServerLog::log("Tailer", source_->id + ": file truncated, reading from start");
        emit_marker("file truncated");
        mid_line_ = false;
        if (AccessGuard::check_file_size(*size, source_->host->max_file_size)) {
            return 0;
        }
        return tail_start(*size);
    }

    if (known) {
        const std::uint64_t missed = *size - previous;
        if (reconnect || missed <= settings_.backlog_bytes) {
            auto within = AccessGuard::check_file_size(missed, source_->host->max_file_size);
            if (within) {
                return previous;
            }
            ServerLog::warn("Tailer", source_->id + ": " + within.detail + " appended while away");
            emit_marker("skipped " + std::to_string(missed) + " bytes");
        } else {
            // Discontinuity with what subscribers already saw
            hub_.clear_backlog(source_->id);
        }
    }

    return tail_start(*size);
}

// How much of the existing file to replay. A file over the host's size
// limit is still followed, just without reading its tail.
std::uint64_t RemoteFileTailer::tail_start(std::uint64_t size) {
    mid_line_ = false;

    auto result = AccessGuard::check_file_size(size, source_->host->max_file_size);
    if (!result) {
        ServerLog::warn("Tailer", source_->id + ": " + result.detail + ", skipping backlog");
        return size;
    }

    const std::uint64_t backlog = settings_.backlog_bytes;
    if (size <= backlog) return 0;

    // Starting mid-file: the first line read is most likely partial
    mid_line_ = backlog > 0;
    return size - backlog;
}

bool RemoteFileTailer::pump(RemoteStream& stream, SessionLease& lease) {
    char buffer[kReadChunk];
    bool received = false;

    while (!stopping()) {
        ReadResult result = stream.read(buffer, sizeof(buffer), settings_.poll_interval);
        switch (result.status) {
            case ReadStatus::Data: {
                if (stopping()) return received;
                emit_bytes(buffer, result.bytes);

                // Only complete lines count as read; a partial one is read again
                auto nl = std::string_view(buffer, result.bytes).rfind('\n');
                if (nl != std::string_view::npos) {
                    source_->cursor.offset = stream_pos_ + nl + 1;
                    mid_line_ = false;
                }
                stream_pos_ += result.bytes;
                received = true;
                break;
            }
            case ReadStatus::Timeout:
                break;
            case ReadStatus::Eof:
                ServerLog::log("Tailer", source_->id + ": remote stream ended");
                discard_partial();
                lease.mark_broken();
                return received;
            case ReadStatus::Error:
                ServerLog::warn("Tailer", source_->id + ": remote read failed: " + result.error);
                discard_partial();
                lease.mark_broken();
                return received;
        }
    }
    return received;
}

std::chrono::milliseconds RemoteFileTailer::backoff_delay(int attempt) {
    double base = static_cast<double>(settings_.reconnect_base.count()) *
                  std::pow(2.0, std::max(0, attempt - 1));
    double capped = std::min(base, static_cast<double>(settings_.reconnect_cap.count()));

    double spread = std::max(0.0, settings_.reconnect_jitter);
    std::uniform_real_distribution<double> jitter(-spread, spread);
    double delay = capped * (1.0 + jitter(rng_));
    return std::chrono::milliseconds(static_cast<long long>(std::max(0.0, delay)));
}

} // namespace tailf
