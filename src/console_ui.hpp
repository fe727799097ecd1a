#pragma once

#include "server_log.hpp"
#include <ftxui/component/component.hpp>
#include <ftxui/component/screen_interactive.hpp>
#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace tailf {

class ConsoleUI;
class DirectoryScanner;
class MaintenanceLoop;
class SessionPool;
class SourceRegistry;
class StreamHub;
class Subscriber;

struct SlashCommand {
    std::string name;
    std::string description;
    std::function<void(ConsoleUI&, const std::vector<std::string>&)> handler;
    bool accepts_args = false;
};

// A line from the watched source
struct WatchLine {
    std::uint64_t seq = 0;
    std::string content;
    enum class Kind { Line, Truncated, Marker, Gap, Error } kind = Kind::Line;
};

struct ServerLogLine {
    LogLevel level = LogLevel::Info;
    std::string component;
    std::string message;
};

// Thread-safe bounded line buffer
template<typename T>
class LogBuffer {
public:
    explicit LogBuffer(size_t max_lines = 1000);
    void push(T line);
    std::vector<T> get_lines() const;
    size_t size() const;
    void clear();
private:
    mutable std::mutex mutex_;
    std::deque<T> lines_;
    size_t max_lines_;
};

struct DisplayStats {
    std::size_t sources = 0;
    std::size_t subscribers = 0;
    std::uint64_t published = 0;
    std::uint64_t dropped = 0;
    std::size_t sessions = 0;
    double lines_per_second = 0.0;
};

// Operator console: follows one source at a time and shows the engine log
class ConsoleUI {
public:
    ConsoleUI(SourceRegistry& registry, StreamHub& hub, SessionPool& pool,
              DirectoryScanner& scanner, MaintenanceLoop& maintenance, uint16_t http_port);
    ~ConsoleUI();

    // Blocks until the user quits
    void run(std::atomic<bool>& running);

    void log_server(LogLevel level, const std::string& component, const std::string& message);

    // ServerLog sink that feeds the server log pane
    ServerLog::Sink get_log_sink();

private:
    void update_stats();

    void watch(const std::string& source_id);
    void unwatch();
    void watch_loop(std::shared_ptr<Subscriber> subscriber);

    void init_commands(std::atomic<bool>& running, ftxui::ScreenInteractive& screen);
    void execute_command();
    void handle_tab_completion();
    std::string complete_command(const std::string& partial);
    void update_completion_hint();
    void show_help();
    void refresh();

    SourceRegistry& registry_;
    StreamHub& hub_;
    SessionPool& pool_;
    DirectoryScanner& scanner_;
    MaintenanceLoop& maintenance_;
    uint16_t http_port_;

    LogBuffer<WatchLine> watch_lines_;
    LogBuffer<ServerLogLine> server_logs_;
    DisplayStats stats_;
    std::mutex stats_mutex_;
    std::uint64_t last_published_ = 0;
    std::chrono::steady_clock::time_point rate_window_start_;

    std::atomic<bool> paused_{false};

    // Watched source
    std::mutex watch_mutex_;
    std::shared_ptr<Subscriber> watched_;
    std::thread watch_thread_;
    std::atomic<bool> watching_{false};

    std::string command_input_;
    std::string completion_hint_;
    std::vector<SlashCommand> commands_;

    std::atomic<ftxui::ScreenInteractive*> screen_{nullptr};
};

} // namespace tailf
