#pragma once

#include "line_event.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace tailf {

// One viewer's interest in one source. The hub owns the registration; the
// transport keeps a shared handle to drain the queue.
class Subscriber {
public:
    Subscriber(std::uint64_t id, std::string source_id, std::size_t capacity);

    Subscriber(const Subscriber&) = delete;
    Subscriber& operator=(const Subscriber&) = delete;

    std::uint64_t id() const { return id_; }
    const std::string& source_id() const { return source_id_; }

    // Waits up to timeout for the next event. Returns nullopt on timeout,
    // or once the subscriber is closed and its queue drained.
    std::optional<StreamEvent> next(std::chrono::milliseconds timeout);

    // Everything queued right now, without waiting
    std::vector<StreamEvent> drain();

    std::uint64_t dropped_count() const { return dropped_; }
    std::size_t queued() const;
    std::size_t capacity() const { return capacity_; }
    bool closed() const;

private:
    friend class StreamHub;

    void push(StreamEvent event);
    void close();
    void drop_oldest_locked();

    const std::uint64_t id_;
    const std::string source_id_;
    const std::size_t capacity_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<StreamEvent> queue_;
    std::atomic<std::uint64_t> dropped_{0};
    bool closed_ = false;
};

struct HubSettings {
    std::size_t queue_capacity = 4096;
    std::size_t backlog_lines = 200;
};

struct HubStats {
    std::size_t sources = 0;
    std::size_t subscribers = 0;
    std::uint64_t published = 0;
    std::uint64_t dropped = 0;
};

// Fan-out broker between tailers (one per source) and subscribers (many per
// source). publish() only ever takes short locks; a slow subscriber loses its
// oldest lines instead of holding anyone up.
class StreamHub {
public:
    explicit StreamHub(HubSettings settings = {});
    ~StreamHub();

    StreamHub(const StreamHub&) = delete;
    StreamHub& operator=(const StreamHub&) = delete;

    // The new subscriber starts with the source's recent backlog
    std::shared_ptr<Subscriber> subscribe(const std::string& source_id);
    std::shared_ptr<Subscriber> subscribe(const std::string& source_id, std::size_t queue_capacity);
    bool unsubscribe(std::uint64_t subscriber_id);

    void publish(const LineEvent& event);
    void publish_error(const ErrorEvent& error);

    std::size_t subscriber_count(const std::string& source_id) const;
    std::vector<LineEvent> backlog(const std::string& source_id) const;
    void clear_backlog(const std::string& source_id);

    // Closes every subscriber of the source and drops its backlog
    void forget_source(const std::string& source_id);

    void close_all();
    HubStats stats() const;

private:
    struct Channel {
        std::map<std::uint64_t, std::shared_ptr<Subscriber>> subscribers;
        std::deque<LineEvent> backlog;
    };

    HubSettings settings_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, Channel> channels_;
    std::unordered_map<std::uint64_t, std::string> subscriber_sources_;
    std::uint64_t next_id_ = 1;
    std::uint64_t published_ = 0;
    std::uint64_t dropped_by_departed_ = 0;
};

} // namespace tailf
