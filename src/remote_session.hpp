#pragma once

#include "config.hpp"
#include <chrono>
#include <cstddef>
#include <memory>
#include <stdexcept>
#include <string>

namespace tailf {

enum class PoolErrorKind {
    PoolExhausted,
    AuthFailed,
    Unreachable,
    HostKeyRejected,
    Cancelled
};

std::string pool_error_kind_to_string(PoolErrorKind kind);

// Failure to obtain a session: from the pool itself (exhausted) or from
// the connector (auth, network, host key).
class PoolError : public std::runtime_error {
public:
    PoolError(PoolErrorKind kind, const std::string& message)
        : std::runtime_error(pool_error_kind_to_string(kind) + ": " + message)
        , kind_(kind)
    {
    }

    PoolErrorKind kind() const { return kind_; }

private:
    PoolErrorKind kind_;
};

// Failure while using an established session (channel open, exec, read)
class RemoteError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

enum class ReadStatus { Data, Timeout, Eof, Error };

struct ReadResult {
    ReadStatus status = ReadStatus::Timeout;
    std::size_t bytes = 0;
    std::string error;
};

// Output of one long-running remote command
class RemoteStream {
public:
    virtual ~RemoteStream() = default;

    virtual ReadResult read(char* buffer, std::size_t size, std::chrono::milliseconds timeout) = 0;
    virtual void close() = 0;
};

// An authenticated connection to one host. Used by one thread at a time;
// the pool's leasing guarantees that.
class RemoteSession {
public:
    virtual ~RemoteSession() = default;

    // Cheap liveness check
    virtual bool is_alive() = 0;

    // Starts a command and returns its stdout as a stream. Throws RemoteError.
    virtual std::unique_ptr<RemoteStream> open_stream(const std::string& command) = 0;

    // Runs a command to completion and returns up to max_output bytes of stdout.
    // Throws RemoteError.
    virtual std::string run(const std::string& command, std::size_t max_output) = 0;

    virtual void close() = 0;
};

class RemoteConnector {
public:
    virtual ~RemoteConnector() = default;

    // Throws PoolError (AuthFailed, Unreachable, HostKeyRejected)
    virtual std::unique_ptr<RemoteSession> connect(const RemoteHost& host) = 0;
};

} // namespace tailf
