#include "stream_hub.hpp"
#include <algorithm>

namespace tailf {

Subscriber::Subscriber(std::uint64_t id, std::string source_id, std::size_t capacity)
    : id_(id)
    , source_id_(std::move(source_id))
    , capacity_(std::max<std::size_t>(2, capacity))
{
}

std::optional<StreamEvent> Subscriber::next(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait_for(lock, timeout, [this]() { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return std::nullopt;
    }
    StreamEvent event = std::move(queue_.front());
    queue_.pop_front();
    return event;
}

std::vector<StreamEvent> Subscriber::drain() {
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<StreamEvent> events(std::make_move_iterator(queue_.begin()),
                                    std::make_move_iterator(queue_.end()));
    queue_.clear();
    return events;
}

std::size_t Subscriber::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool Subscriber::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

void Subscriber::push(StreamEvent event) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) return;
        if (queue_.size() >= capacity_) {
            drop_oldest_locked();
        }
        queue_.push_back(std::move(event));
    }
    cv_.notify_one();
}

void Subscriber::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    cv_.notify_all();
}

// Drops the oldest line and records the loss in a single gap marker at the
// head of the queue, so the consumer sees one discontinuity per overflow run.
// Rotation markers and the head gap itself are never counted as lost lines.
void Subscriber::drop_oldest_locked() {
    auto droppable = [](const StreamEvent& e) { return e.is_line() && !e.line.is_marker(); };

    bool head_gap = !queue_.empty() && queue_.front().is_gap();
    auto first = queue_.begin() + (head_gap ? 1 : 0);
    auto victim = std::find_if(first, queue_.end(), droppable);
    if (victim == queue_.end()) {
        // Only markers and errors behind the head gap; the oldest of them
        // gives up its slot and the gap keeps its count
        if (first != queue_.end()) {
            queue_.erase(first);
        }
        return;
    }

    std::uint64_t lost_seq = victim->line.seq;
    queue_.erase(victim);
    ++dropped_;

    if (head_gap) {
        queue_.front().line.gap += 1;
        queue_.front().line.seq = lost_seq;
        return;
    }

    // The new marker needs a slot of its own
    std::uint64_t lost = 1;
    auto second = std::find_if(queue_.begin(), queue_.end(), droppable);
    if (second != queue_.end()) {
        lost_seq = second->line.seq;
        queue_.erase(second);
        ++dropped_;
        ++lost;
    } else if (!queue_.empty()) {
        queue_.pop_front();
    }

    LineEvent gap;
    gap.source_id = source_id_;
    gap.seq = lost_seq;
    gap.timestamp = now_seconds();
    gap.gap = lost;
    queue_.push_front(StreamEvent::of(std::move(gap)));
}

StreamHub::StreamHub(HubSettings settings)
    : settings_(settings)
{
}

StreamHub::~StreamHub() {
    close_all();
}

std::shared_ptr<Subscriber> StreamHub::subscribe(const std::string& source_id) {
    return subscribe(source_id, settings_.queue_capacity);
}

std::shared_ptr<Subscriber> StreamHub::subscribe(const std::string& source_id,
                                                 std::size_t queue_capacity) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto subscriber = std::make_shared<Subscriber>(next_id_++, source_id, queue_capacity);
    auto& channel = channels_[source_id];

    // Backlog goes in under the same lock as registration so no live event
    // can slip between the two.
    for (const auto& event : channel.backlog) {
        subscriber->push(StreamEvent::of(event));
    }

    channel.subscribers[subscriber->id()] = subscriber;
    subscriber_sources_[subscriber->id()] = source_id;
    return subscriber;
}

bool StreamHub::unsubscribe(std::uint64_t subscriber_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto idx = subscriber_sources_.find(subscriber_id);
    if (idx == subscriber_sources_.end()) {
        return false;
    }

    auto channel = channels_.find(idx->second);
    if (channel != channels_.end()) {
        auto it = channel->second.subscribers.find(subscriber_id);
        if (it != channel->second.subscribers.end()) {
            dropped_by_departed_ += it->second->dropped_count();
            it->second->close();
            channel->second.subscribers.erase(it);
        }
    }
    subscriber_sources_.erase(idx);
    return true;
}

void StreamHub::publish(const LineEvent& event) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& channel = channels_[event.source_id];
    ++published_;

    if (settings_.backlog_lines > 0) {
        channel.backlog.push_back(event);
        while (channel.backlog.size() > settings_.backlog_lines) {
            channel.backlog.pop_front();
        }
    }

    for (auto& [id, subscriber] : channel.subscribers) {
        subscriber->push(StreamEvent::of(event));
    }
}

void StreamHub::publish_error(const ErrorEvent& error) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto channel = channels_.find(error.source_id);
    if (channel == channels_.end()) return;

    for (auto& [id, subscriber] : channel->second.subscribers) {
        subscriber->push(StreamEvent::of(error));
    }
}

std::size_t StreamHub::subscriber_count(const std::string& source_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto channel = channels_.find(source_id);
    return channel == channels_.end() ? 0 : channel->second.subscribers.size();
}

std::vector<LineEvent> StreamHub::backlog(const std::string& source_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto channel = channels_.find(source_id);
    if (channel == channels_.end()) return {};
    return {channel->second.backlog.begin(), channel->second.backlog.end()};
}

void StreamHub::clear_backlog(const std::string& source_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto channel = channels_.find(source_id);
    if (channel != channels_.end()) {
        channel->second.backlog.clear();
    }
}

void StreamHub::forget_source(const std::string& source_id) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto channel = channels_.find(source_id);
    if (channel == channels_.end()) return;

    for (auto& [id, subscriber] : channel->second.subscribers) {
        dropped_by_departed_ += subscriber->dropped_count();
        subscriber->close();
        subscriber_sources_.erase(id);
    }
    channels_.erase(channel);
}

void StreamHub::close_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& [source_id, channel] : channels_) {
        for (auto& [id, subscriber] : channel.subscribers) {
            subscriber->close();
        }
        channel.subscribers.clear();
    }
    subscriber_sources_.clear();
}

HubStats StreamHub::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);

    HubStats stats;
    stats.sources = channels_.size();
    stats.published = published_;
    stats.dropped = dropped_by_departed_;
    for (const auto& [source_id, channel] : channels_) {
        stats.subscribers += channel.subscribers.size();
        for (const auto& [id, subscriber] : channel.subscribers) {
            stats.dropped += subscriber->dropped_count();
        }
    }
    return stats;
}

} // namespace tailf
