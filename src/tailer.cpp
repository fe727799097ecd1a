#include "tailer.hpp"
#include "server_log.hpp"

namespace tailf {

const char* tailer_state_name(TailerState state) {
    switch (state) {
        case TailerState::Starting: return "starting";
        case TailerState::Streaming: return "streaming";
        case TailerState::Reconnecting: return "reconnecting";
        case TailerState::Rotated: return "rotated";
        case TailerState::Stopped: return "stopped";
        default: return "unknown";
    }
}

TailerSettings TailerSettings::from(const EngineSettings& engine) {
    TailerSettings s;
    s.backlog_bytes = engine.backlog_bytes;
    s.max_line_length = engine.max_line_length;
    s.poll_interval = engine.poll_interval;
    s.reconnect_base = engine.reconnect_base;
    s.reconnect_cap = engine.reconnect_cap;
    s.reconnect_jitter = engine.reconnect_jitter;
    s.max_reconnect_attempts = engine.max_reconnect_attempts;
    return s;
}

Tailer::Tailer(std::shared_ptr<Source> source, StreamHub& hub, TailerSettings settings)
    : source_(std::move(source))
    , hub_(hub)
    , settings_(settings)
    , splitter_(settings.max_line_length)
    , decoder_(source_->encoding)
{
}

Tailer::~Tailer() {
    stop();
}

void Tailer::start() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (running_) return;

    // A previous run that ended on its own, or is still winding down
    join_locked();

    running_ = true;
    finished_ = false;
    ++generation_;
    state_ = TailerState::Starting;
    splitter_.reset();

    ServerLog::log("Tailer", "Started tailing: " + source_->id + " (" + source_->path + ")");

    thread_ = std::thread([this]() {
        try {
            run();
        } catch (const std::exception& e) {
            ServerLog::error("Tailer", source_->id + ": " + e.what());
            report_error(ErrorKind::SourceUnavailable, e.what());
        }
        running_ = false;
        state_ = TailerState::Stopped;
        finished_ = true;
    });
}

std::uint64_t Tailer::request_stop() {
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        running_ = false;
    }
    wait_cv_.notify_all();
    return generation_;
}

void Tailer::join(std::uint64_t generation) {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (generation_ == generation) {
        join_locked();
    }
}

void Tailer::stop() {
    join(request_stop());
}

void Tailer::join_locked() {
    if (thread_.joinable() && thread_.get_id() != std::this_thread::get_id()) {
        thread_.join();
        state_ = TailerState::Stopped;
        ServerLog::debug("Tailer", "Stopped tailing: " + source_->id);
    }
}

bool Tailer::wait_for(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, delay, [this]() { return !running_; });
    return running_;
}

void Tailer::emit_bytes(const char* data, std::size_t size) {
    std::vector<SplitLine> lines;
    splitter_.feed(data, size, lines);
    publish_lines(lines);
}

void Tailer::flush_partial() {
    std::vector<SplitLine> lines;
    if (splitter_.flush(lines)) {
        publish_lines(lines);
    }
}

void Tailer::discard_partial() {
    splitter_.reset();
}

void Tailer::skip_to_next_line() {
    splitter_.skip_to_next_line();
}

void Tailer::publish_lines(std::vector<SplitLine>& lines) {
    for (auto& split : lines) {
        if (!running_) return;

        std::string text = decoder_.decode(split.text);
        if (source_->strip_ansi) {
            text = strip_ansi_codes(text);
        }
        if (text.empty()) continue;

        LineEvent event;
        event.source_id = source_->id;
        event.seq = ++source_->cursor.seq;
        event.timestamp = now_seconds();
        event.content = std::move(text);
        event.truncated = split.truncated;

        hub_.publish(event);
    }
}

void Tailer::emit_marker(const std::string& text) {
    if (!running_) return;

    LineEvent event;
    event.source_id = source_->id;
    event.seq = source_->cursor.seq.load();
    event.timestamp = now_seconds();
    event.content = text;
    event.rotated = true;
    hub_.publish(event);
}

void Tailer::report_error(ErrorKind kind, const std::string& message) {
    ServerLog::warn("Tailer", source_->id + ": " + error_kind_to_string(kind) + ": " + message);
    if (!running_) return;

    ErrorEvent error;
    error.source_id = source_->id;
    error.kind = kind;
    error.message = message;
    hub_.publish_error(error);
}

} // namespace tailf
