#include "server_log.hpp"
#include <iostream>
#include <chrono>
#include <ctime>
#include <iomanip>

namespace tailf {

ServerLog::Sink ServerLog::sink_ = ServerLog::console_sink;
std::mutex ServerLog::mutex_;
std::atomic<int> ServerLog::min_level_{static_cast<int>(LogLevel::Info)};

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info: return "INFO";
        case LogLevel::Warn: return "WARN";
        case LogLevel::Error: return "ERROR";
        default: return "?";
    }
}

void ServerLog::set_sink(Sink sink) {
    std::lock_guard<std::mutex> lock(mutex_);
    sink_ = sink ? std::move(sink) : console_sink;
}

void ServerLog::set_min_level(LogLevel level) {
    min_level_ = static_cast<int>(level);
}

LogLevel ServerLog::min_level() {
    return static_cast<LogLevel>(min_level_.load());
}

void ServerLog::debug(const std::string& component, const std::string& message) {
    write(LogLevel::Debug, component, message);
}

void ServerLog::log(const std::string& component, const std::string& message) {
    write(LogLevel::Info, component, message);
}

void ServerLog::warn(const std::string& component, const std::string& message) {
    write(LogLevel::Warn, component, message);
}

void ServerLog::error(const std::string& component, const std::string& message) {
    write(LogLevel::Error, component, message);
}

void ServerLog::write(LogLevel level, const std::string& component, const std::string& message) {
    if (static_cast<int>(level) < min_level_) return;

    std::lock_guard<std::mutex> lock(mutex_);
    if (sink_) {
        sink_(level, component, message);
    }
}

void ServerLog::console_sink(LogLevel level, const std::string& component,
                             const std::string& message) {
    auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm{};
    localtime_r(&now, &tm);

    std::ostream& out = level >= LogLevel::Warn ? std::cerr : std::cout;
    out << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << " "
        << std::left << std::setw(5) << log_level_name(level) << " "
        << "[" << component << "] " << message << std::endl;
}

} // namespace tailf
