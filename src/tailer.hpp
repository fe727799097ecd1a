#pragma once

#include "line_splitter.hpp"
#include "source.hpp"
#include "stream_hub.hpp"
#include "text_decoder.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tailf {

enum class TailerState { Starting, Streaming, Reconnecting, Rotated, Stopped };

const char* tailer_state_name(TailerState state);

struct TailerSettings {
    std::size_t backlog_bytes = 10240;
    std::size_t max_line_length = 65536;
    std::chrono::milliseconds poll_interval{250};
    std::chrono::milliseconds reconnect_base{500};
    std::chrono::milliseconds reconnect_cap{30000};
    double reconnect_jitter = 0.2;
    int max_reconnect_attempts = 8;

    static TailerSettings from(const EngineSettings& engine);
};

// Owns one worker thread that follows one source and publishes its lines
// to the hub. A tailer may be started again after it stopped; sequence
// numbers continue from the source cursor.
//
// Subclasses must call stop() from their destructor.
class Tailer {
public:
    Tailer(std::shared_ptr<Source> source, StreamHub& hub, TailerSettings settings);
    virtual ~Tailer();

    Tailer(const Tailer&) = delete;
    Tailer& operator=(const Tailer&) = delete;

    void start();

    // Signals the worker without waiting for it. Returns the run generation
    // to pass to join().
    std::uint64_t request_stop();

    // Joins the worker of that generation; a no-op if the tailer has been
    // restarted since.
    void join(std::uint64_t generation);

    // Signals and joins
    void stop();

    TailerState state() const { return state_; }
    bool is_running() const { return running_; }

    // True once the worker of the last run has returned
    bool finished() const { return finished_; }
    const std::shared_ptr<Source>& source() const { return source_; }

protected:
    virtual void run() = 0;

    // Sleeps up to delay; returns false as soon as a stop is requested
    bool wait_for(std::chrono::milliseconds delay);
    bool stopping() const { return !running_; }
    void set_state(TailerState state) { state_ = state; }

    void emit_bytes(const char* data, std::size_t size);

    // Rotation/truncation marker; carries the current seq without advancing it
    void emit_marker(const std::string& text);

    void flush_partial();
    void discard_partial();
    void skip_to_next_line();

    // Published only while running; a stopped tailer just logs
    void report_error(ErrorKind kind, const std::string& message);

    std::shared_ptr<Source> source_;
    StreamHub& hub_;
    TailerSettings settings_;

private:
    void publish_lines(std::vector<SplitLine>& lines);

    void join_locked();

    std::mutex lifecycle_mutex_;
    std::thread thread_;
    std::atomic<std::uint64_t> generation_{0};
    std::atomic<bool> running_{false};
    std::atomic<bool> finished_{true};
    std::atomic<TailerState> state_{TailerState::Stopped};
    std::mutex wait_mutex_;
    std::condition_variable wait_cv_;

    LineSplitter splitter_;
    TextDecoder decoder_;
};

} // namespace tailf
