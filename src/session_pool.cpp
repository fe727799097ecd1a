#include "session_pool.hpp"
#include "server_log.hpp"
#include <algorithm>

namespace tailf {

namespace {

constexpr auto kCancelCheckInterval = std::chrono::milliseconds(100);

} // namespace

std::string pool_error_kind_to_string(PoolErrorKind kind) {
    switch (kind) {
        case PoolErrorKind::PoolExhausted: return "PoolExhausted";
        case PoolErrorKind::AuthFailed: return "AuthFailed";
        case PoolErrorKind::Unreachable: return "Unreachable";
        case PoolErrorKind::HostKeyRejected: return "HostKeyRejected";
        case PoolErrorKind::Cancelled: return "Cancelled";
        default: return "Unknown";
    }
}

PoolSettings PoolSettings::from(const EngineSettings& engine) {
    PoolSettings s;
    s.max_connections = engine.max_connections;
    s.idle_timeout = engine.idle_timeout;
    s.max_session_age = engine.max_session_age;
    s.acquire_timeout = engine.acquire_timeout;
    return s;
}

// ---- SessionLease ----

SessionLease::SessionLease(SessionPool* pool, std::unique_ptr<PooledSession> entry)
    : pool_(pool)
    , entry_(std::move(entry))
{
}

SessionLease::~SessionLease() {
    release();
}

SessionLease::SessionLease(SessionLease&& other) noexcept
    : pool_(other.pool_)
    , entry_(std::move(other.entry_))
    , broken_(other.broken_)
{
    other.pool_ = nullptr;
    other.broken_ = false;
}

SessionLease& SessionLease::operator=(SessionLease&& other) noexcept {
    if (this != &other) {
        release();
        pool_ = other.pool_;
        entry_ = std::move(other.entry_);
        broken_ = other.broken_;
        other.pool_ = nullptr;
        other.broken_ = false;
    }
    return *this;
}

void SessionLease::release() {
    if (pool_ && entry_) {
        pool_->release(std::move(entry_), broken_);
    }
    pool_ = nullptr;
    entry_.reset();
    broken_ = false;
}

// ---- SessionPool ----

SessionPool::SessionPool(RemoteConnector& connector, PoolSettings settings)
    : connector_(connector)
    , settings_(settings)
{
    if (settings_.max_connections == 0) {
        settings_.max_connections = 1;
    }
}

SessionPool::~SessionPool() {
    close_all();
}

bool SessionPool::expired(const PooledSession& entry, Clock::time_point now) const {
    return now - entry.last_used_at > settings_.idle_timeout ||
           now - entry.created_at > settings_.max_session_age;
}

void SessionPool::retire(std::unique_ptr<PooledSession> entry, const std::string& why) {
    if (!entry) return;
    entry->state = SessionState::Closing;
    entry->session->close();
    entry->state = SessionState::Closed;
    ServerLog::debug("Pool", "Closed session #" + std::to_string(entry->id) + " to " +
                     entry->key + " (" + why + ")");
}

SessionLease SessionPool::acquire(const RemoteHost& host) {
    return acquire(host, []() { return false; });
}

SessionLease SessionPool::acquire(const RemoteHost& host, const std::function<bool()>& cancelled) {
    const std::string key = host.pool_key();
    const auto deadline = Clock::now() + settings_.acquire_timeout;

    std::unique_lock<std::mutex> lock(mutex_);
    for (;;) {
        if (closed_) {
            throw PoolError(PoolErrorKind::Unreachable, "session pool is shut down");
        }
        if (cancelled()) {
            throw PoolError(PoolErrorKind::Cancelled, key + ": acquire cancelled");
        }
        HostSlot& slot = slots_[key];

        // Reuse the most recently released session first
        while (!slot.idle.empty()) {
            auto entry = std::move(slot.idle.back());
            slot.idle.pop_back();
            ++slot.reserved;
            lock.unlock();

            auto now = Clock::now();
            bool usable = !expired(*entry, now) && entry->session->is_alive();
            if (!usable) {
                retire(std::move(entry), "stale at acquire");
            }

            lock.lock();
            --slot.reserved;
            if (usable) {
                ++slot.leased;
                entry->state = SessionState::Leased;
                entry->last_used_at = now;
                return SessionLease(this, std::move(entry));
            }
            ++slot.retired;
            available_.notify_all();
        }

        if (slot.total() < settings_.max_connections) {
            ++slot.reserved;
            lock.unlock();

            std::unique_ptr<RemoteSession> session;
            try {
                session = connector_.connect(host);
            } catch (...) {
                lock.lock();
                --slot.reserved;
                available_.notify_all();
                throw;
            }

            lock.lock();
            --slot.reserved;
            ++slot.leased;
            ++slot.opened;

            auto entry = std::make_unique<PooledSession>();
            entry->id = next_id_++;
            entry->key = key;
            entry->session = std::move(session);
            entry->state = SessionState::Leased;
            entry->created_at = Clock::now();
            entry->last_used_at = entry->created_at;

            ServerLog::log("Pool", "Opened session #" + std::to_string(entry->id) + " to " + key +
                           " (" + std::to_string(slot.total()) + "/" +
                           std::to_string(settings_.max_connections) + ")");
            return SessionLease(this, std::move(entry));
        }

        // Woken in slices so a cancelled waiter does not sit out the timeout
        auto wake = std::min(deadline, Clock::now() + kCancelCheckInterval);
        available_.wait_until(lock, wake);
        if (Clock::now() >= deadline) {
            throw PoolError(PoolErrorKind::PoolExhausted,
                            key + ": all " + std::to_string(settings_.max_connections) +
                            " sessions in use");
        }
    }
}

void SessionPool::release(std::unique_ptr<PooledSession> entry, bool broken) {
    auto now = Clock::now();
    entry->last_used_at = now;

    bool keep = !broken && !expired(*entry, now) && entry->session->is_alive();
    if (keep) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!closed_) {
            HostSlot& slot = slots_[entry->key];
            --slot.leased;
            entry->state = SessionState::Idle;
            slot.idle.push_back(std::move(entry));
            available_.notify_all();
            return;
        }
    }

    std::string key = entry->key;
    retire(std::move(entry), broken ? "broken" : "retired at release");

    std::lock_guard<std::mutex> lock(mutex_);
    HostSlot& slot = slots_[key];
    --slot.leased;
    ++slot.retired;
    available_.notify_all();
}

std::size_t SessionPool::sweep() {
    return sweep(Clock::now());
}

std::size_t SessionPool::sweep(Clock::time_point now) {
    std::vector<std::unique_ptr<PooledSession>> doomed;
    std::vector<std::unique_ptr<PooledSession>> probing;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (auto& [key, slot] : slots_) {
            for (auto& entry : slot.idle) {
                if (expired(*entry, now)) {
                    ++slot.retired;
                    doomed.push_back(std::move(entry));
                } else {
                    ++slot.reserved;
                    probing.push_back(std::move(entry));
                }
            }
            slot.idle.clear();
        }
    }

    std::size_t closed = doomed.size();
    for (auto& entry : doomed) {
        retire(std::move(entry), "idle timeout or max age");
    }

    // Health checks run without the lock; the sessions stay reserved meanwhile
    std::vector<bool> healthy;
    healthy.reserve(probing.size());
    for (auto& entry : probing) {
        healthy.push_back(entry->session->is_alive());
    }

    std::vector<std::unique_ptr<PooledSession>> dead;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (std::size_t i = 0; i < probing.size(); ++i) {
            HostSlot& slot = slots_[probing[i]->key];
            --slot.reserved;
            if (healthy[i] && !closed_) {
                slot.idle.push_back(std::move(probing[i]));
            } else {
                ++slot.retired;
                dead.push_back(std::move(probing[i]));
            }
        }
        available_.notify_all();
    }

    closed += dead.size();
    for (auto& entry : dead) {
        retire(std::move(entry), "failed health check");
    }

    if (closed > 0) {
        ServerLog::log("Pool", "Sweep closed " + std::to_string(closed) + " idle session(s)");
    }
    return closed;
}

void SessionPool::close_all() {
    std::vector<std::unique_ptr<PooledSession>> idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
        for (auto& [key, slot] : slots_) {
            for (auto& entry : slot.idle) {
                ++slot.retired;
                idle.push_back(std::move(entry));
            }
            slot.idle.clear();
        }
        available_.notify_all();
    }

    for (auto& entry : idle) {
        retire(std::move(entry), "shutdown");
    }
}

std::vector<HostPoolStats> SessionPool::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<HostPoolStats> result;
    for (const auto& [key, slot] : slots_) {
        HostPoolStats s;
        s.key = key;
        s.idle = slot.idle.size();
        s.leased = slot.leased;
        s.reserved = slot.reserved;
        s.opened = slot.opened;
        s.retired = slot.retired;
        result.push_back(s);
    }
    return result;
}

std::size_t SessionPool::session_count(const RemoteHost& host) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = slots_.find(host.pool_key());
    return it == slots_.end() ? 0 : it->second.total();
}

} // namespace tailf
