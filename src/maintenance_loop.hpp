#pragma once

#include <asio.hpp>
#include <atomic>
#include <chrono>
#include <functional>
#include <list>
#include <memory>
#include <string>
#include <thread>
#include <vector>

namespace tailf {

// Background timers for periodic housekeeping (pool sweeps, directory
// rescans). A job is rearmed only after it finishes, so it never overlaps
// with itself.
class MaintenanceLoop {
public:
    using Job = std::function<void()>;

    explicit MaintenanceLoop(std::size_t threads = 2);
    ~MaintenanceLoop();

    MaintenanceLoop(const MaintenanceLoop&) = delete;
    MaintenanceLoop& operator=(const MaintenanceLoop&) = delete;

    void schedule_every(const std::string& name, std::chrono::milliseconds interval, Job job);

    // Runs job once, as soon as a thread is free
    void post(const std::string& name, Job job);

    void start();
    void stop();
    bool is_running() const { return running_; }

private:
    struct Timer {
        std::string name;
        std::chrono::milliseconds interval;
        Job job;
        asio::steady_timer timer;

        Timer(asio::io_context& io, std::string n, std::chrono::milliseconds i, Job j)
            : name(std::move(n)), interval(i), job(std::move(j)), timer(io) {}
    };

    void arm(Timer& timer);
    static void run_job(const std::string& name, const Job& job);

    asio::io_context io_context_;
    asio::executor_work_guard<asio::io_context::executor_type> work_;
    std::list<Timer> timers_;
    std::vector<std::thread> threads_;
    std::size_t thread_count_;
    std::atomic<bool> running_{false};
};

} // namespace tailf
