#pragma once

#include "remote_session.hpp"
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tailf {

enum class SessionState { Idle, Leased, Closing, Closed };

struct PoolSettings {
    std::size_t max_connections = 10;
    std::chrono::seconds idle_timeout{300};
    std::chrono::seconds max_session_age{3600};
    std::chrono::milliseconds acquire_timeout{10000};

    static PoolSettings from(const EngineSettings& engine);
};

struct PooledSession {
    using Clock = std::chrono::steady_clock;

    std::uint64_t id = 0;
    std::string key;
    std::unique_ptr<RemoteSession> session;
    SessionState state = SessionState::Idle;
    Clock::time_point created_at;
    Clock::time_point last_used_at;
};

class SessionPool;

// Exclusive, move-only hold on one pooled session. Going out of scope
// returns the session to the pool, or retires it if marked broken.
class SessionLease {
public:
    SessionLease() = default;
    ~SessionLease();

    SessionLease(SessionLease&& other) noexcept;
    SessionLease& operator=(SessionLease&& other) noexcept;

    SessionLease(const SessionLease&) = delete;
    SessionLease& operator=(const SessionLease&) = delete;

    RemoteSession* operator->() const { return entry_->session.get(); }
    RemoteSession& operator*() const { return *entry_->session; }
    explicit operator bool() const { return entry_ != nullptr; }

    void mark_broken() { broken_ = true; }
    bool broken() const { return broken_; }

    // Hands the session back early
    void release();

    std::uint64_t session_id() const { return entry_ ? entry_->id : 0; }

private:
    friend class SessionPool;
    SessionLease(SessionPool* pool, std::unique_ptr<PooledSession> entry);

    SessionPool* pool_ = nullptr;
    std::unique_ptr<PooledSession> entry_;
    bool broken_ = false;
};

struct HostPoolStats {
    std::string key;
    std::size_t idle = 0;
    std::size_t leased = 0;
    std::size_t reserved = 0;    // connecting or being checked
    std::uint64_t opened = 0;
    std::uint64_t retired = 0;
};

// Bounded per-host set of reusable sessions. Per host, idle + leased +
// reserved never exceeds max_connections. Leases must not outlive the pool.
class SessionPool {
public:
    using Clock = std::chrono::steady_clock;

    SessionPool(RemoteConnector& connector, PoolSettings settings = {});
    ~SessionPool();

    SessionPool(const SessionPool&) = delete;
    SessionPool& operator=(const SessionPool&) = delete;

    // Throws PoolError
    SessionLease acquire(const RemoteHost& host);

    // As above, but gives up with PoolErrorKind::Cancelled once cancelled()
    // returns true. Checked while waiting for a free slot and before connecting.
    SessionLease acquire(const RemoteHost& host, const std::function<bool()>& cancelled);

    // Closes idle sessions past the idle timeout or max age, and those that
    // fail the health check. Returns how many were closed.
    std::size_t sweep();
    std::size_t sweep(Clock::time_point now);

    void close_all();

    std::vector<HostPoolStats> stats() const;
    std::size_t session_count(const RemoteHost& host) const;
    const PoolSettings& settings() const { return settings_; }

private:
    friend class SessionLease;

    struct HostSlot {
        std::deque<std::unique_ptr<PooledSession>> idle;
        std::size_t leased = 0;
        std::size_t reserved = 0;
        std::uint64_t opened = 0;
        std::uint64_t retired = 0;

        std::size_t total() const { return idle.size() + leased + reserved; }
    };

    void release(std::unique_ptr<PooledSession> entry, bool broken);
    void retire(std::unique_ptr<PooledSession> entry, const std::string& why);
    bool expired(const PooledSession& entry, Clock::time_point now) const;

    RemoteConnector& connector_;
    PoolSettings settings_;

    mutable std::mutex mutex_;
    std::condition_variable available_;
    std::map<std::string, HostSlot> slots_;
    std::uint64_t next_id_ = 1;
    bool closed_ = false;
};

} // namespace tailf
