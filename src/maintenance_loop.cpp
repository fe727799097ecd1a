#include "maintenance_loop.hpp"
#include "server_log.hpp"

namespace tailf {

MaintenanceLoop::MaintenanceLoop(std::size_t threads)
    : work_(asio::make_work_guard(io_context_))
    , thread_count_(threads == 0 ? 1 : threads)
{
}

MaintenanceLoop::~MaintenanceLoop() {
    stop();
}

void MaintenanceLoop::schedule_every(const std::string& name, std::chrono::milliseconds interval,
                                     Job job) {
    timers_.emplace_back(io_context_, name, interval, std::move(job));
    if (running_) {
        arm(timers_.back());
    }
}

void MaintenanceLoop::post(const std::string& name, Job job) {
    asio::post(io_context_, [name, job = std::move(job)]() {
        run_job(name, job);
    });
}

void MaintenanceLoop::start() {
    if (running_) return;
    running_ = true;

    for (auto& timer : timers_) {
        arm(timer);
    }

    for (std::size_t i = 0; i < thread_count_; ++i) {
        threads_.emplace_back([this]() {
            io_context_.run();
        });
    }
    ServerLog::log("Maintenance", "Started with " + std::to_string(timers_.size()) + " job(s)");
}

void MaintenanceLoop::stop() {
    if (!running_) return;
    running_ = false;

    work_.reset();
    io_context_.stop();
    for (auto& thread : threads_) {
        if (thread.joinable()) {
            thread.join();
        }
    }
    threads_.clear();
}

void MaintenanceLoop::arm(Timer& timer) {
    timer.timer.expires_after(timer.interval);
    timer.timer.async_wait([this, &timer](const asio::error_code& error) {
        if (error || !running_) return;
        run_job(timer.name, timer.job);
        if (running_) {
            arm(timer);
        }
    });
}

void MaintenanceLoop::run_job(const std::string& name, const Job& job) {
    try {
        job();
    } catch (const std::exception& e) {
        ServerLog::error("Maintenance", name + " failed: " + e.what());
    }
}

} // namespace tailf
